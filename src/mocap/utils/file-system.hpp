#pragma once

#include <fstream>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace mocap
{
using std::error_code;

// ------------------------------------------------------- file-get/put-contents

error_code file_get_contents(const std::string_view fname,
                             std::string& out) noexcept;

// Throws std::runtime_error if the file cannot be read
std::string file_get_contents(const std::string_view fname) noexcept(false);

error_code file_put_contents(const std::string_view fname,
                             const std::string_view dat) noexcept;

// ----------------------------------------------------------- is-file/directory

bool is_regular_file(const std::string_view filename) noexcept;
bool is_directory(const std::string_view filename) noexcept;

// ---------------------------------------------------------- basename/file_ext

// "/a/b/cam0.mp4" => "cam0.mp4", or "cam0" when `strip_extension` is set
std::string basename(const std::string_view filename,
                     const bool strip_extension = false) noexcept;
std::string file_ext(const std::string_view filename) noexcept; // like ".mp4"

// ----------------------------------------------------------------------- mkdir

bool mkdir_p(const std::string_view dname) noexcept;

// --------------------------------------------------------- make-temp-directory
// make_temp_directory("/tmp/fooXXXXXX");
std::string make_temp_directory(const std::string_view p) noexcept(false);

// ------------------------------------------------------------------ remove-all

int remove_all(const std::string_view path) noexcept(false);

// -------------------------------------------------------------- list-directory
// Regular files in `dname` (not recursive) whose extension equals `ext`,
// compared case-insensitively. Returned as full paths sorted by filename.
// Throws std::runtime_error if `dname` cannot be listed.
std::vector<std::string>
list_directory_files(const std::string_view dname,
                     const std::string_view ext) noexcept(false);

} // namespace mocap
