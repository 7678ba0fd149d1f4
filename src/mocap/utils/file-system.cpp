#include "stdinc.hpp"

#include "file-system.hpp"

#include <cerrno>
#include <filesystem>

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace mocap
{
namespace fs = std::filesystem;

bool is_regular_file(const std::string_view filename) noexcept
{
   std::error_code ec;
   const bool ret = fs::is_regular_file(fs::path(filename), ec);
   return !ec && ret;
}

bool is_directory(const std::string_view filename) noexcept
{
   std::error_code ec;
   const bool ret = fs::is_directory(fs::path(filename), ec);
   return !ec && ret;
}

// ----------------------------------------------------------- file-get-contents

error_code file_get_contents(const std::string_view fname,
                             std::string& data) noexcept
{
   std::unique_ptr<FILE, std::function<void(FILE*)>> fp(
       fopen(string(fname).c_str(), "rb"), [](FILE* ptr) {
          if(ptr) fclose(ptr);
       });

   if(fp == nullptr) return std::make_error_code(std::errc(errno));

   if(fseek(fp.get(), 0, SEEK_END) == -1)
      return std::make_error_code(std::errc(errno));

   auto fpos = ftell(fp.get());
   if(fpos == -1) return std::make_error_code(std::errc(errno));

   auto sz = size_t(fpos < 0 ? 0 : fpos);

   try {
      data.resize(sz);
   } catch(std::length_error&) {
      return std::make_error_code(std::errc::invalid_argument);
   } catch(std::bad_alloc&) {
      return std::make_error_code(std::errc::not_enough_memory);
   }

   if(fseek(fp.get(), 0, SEEK_SET) == -1)
      return std::make_error_code(std::errc(errno));

   if(sz > 0 && data.size() != fread(&data[0], 1, data.size(), fp.get())) {
      if(ferror(fp.get())) return std::make_error_code(std::errc(errno));
      return std::make_error_code(std::errc::io_error);
   }

   if(FILE* ptr = fp.release(); fclose(ptr) != 0)
      return std::make_error_code(std::errc(errno));

   return {};
}

std::string file_get_contents(const std::string_view fname) noexcept(false)
{
   std::string out;
   const auto ec = file_get_contents(fname, out);
   if(ec)
      throw std::runtime_error(
          format("failed to read file '{}': {}", fname, ec.message()));
   return out;
}

// ----------------------------------------------------------- file-put-contents

error_code file_put_contents(const std::string_view filename,
                             const std::string_view dat) noexcept
{
   FILE* fp = fopen(string(filename).c_str(), "wb");
   if(fp == nullptr) return std::make_error_code(std::errc(errno));

   error_code ec = {};

   auto sz = fwrite(dat.data(), 1, dat.size(), fp);
   if(sz != dat.size()) {
      if(ferror(fp))
         ec = std::make_error_code(std::errc(errno));
      else
         ec = std::make_error_code(std::errc::io_error);
   }
   if(fclose(fp) != 0)
      if(!ec) ec = make_error_code(std::errc(errno));

   return ec;
}

// ---------------------------------------------------------- basename/file_ext

std::string basename(const std::string_view filename,
                     const bool strip_extension) noexcept
{
   const auto p = fs::path(filename);
   return strip_extension ? p.stem().string() : p.filename().string();
}

std::string file_ext(const std::string_view filename) noexcept
{
   return fs::path(filename).extension().string();
}

// ----------------------------------------------------------------------- mkdir

bool mkdir_p(const std::string_view dname) noexcept
{
   std::error_code ec;
   fs::create_directories(fs::path(dname), ec);
   return !ec && is_directory(dname);
}

// --------------------------------------------------------- make-temp-directory

std::string make_temp_directory(const std::string_view p) noexcept(false)
{
   string s(p);
   auto n_Xs = 0;
   for(auto ii = s.rbegin(); ii != s.rend() && *ii == 'X'; ++ii) ++n_Xs;
   for(auto i = n_Xs; i < 6; ++i) s.push_back('X');

   std::vector<char> buf(cbegin(s), cend(s));
   buf.push_back('\0');
   if(mkdtemp(&buf[0]) == nullptr)
      throw std::runtime_error(
          format("failed to create temporary directory '{}'", s));
   return string{&buf[0]};
}

// ------------------------------------------------------------------ remove-all

int remove_all(const std::string_view path) noexcept(false)
{
   std::error_code ec;
   int val = int(fs::remove_all(fs::path(path), ec));
   if(ec)
      throw std::runtime_error(format(
          "failed to remove directory '{}': {}", path, ec.message().c_str()));
   return val;
}

// -------------------------------------------------------------- list-directory

vector<string> list_directory_files(const std::string_view dname,
                                    const std::string_view ext) noexcept(false)
{
   vector<string> out;
   const auto want_ext = string_to_lowercase(ext);

   std::error_code ec;
   auto ii = fs::directory_iterator(fs::path(dname), ec);
   if(ec)
      throw std::runtime_error(format(
          "failed to list directory '{}': {}", dname, ec.message().c_str()));

   for(const auto& entry : ii) {
      std::error_code ec2;
      if(!entry.is_regular_file(ec2) || ec2) continue;
      auto fname = entry.path().string();
      if(string_to_lowercase(file_ext(fname)) == want_ext)
         out.push_back(std::move(fname));
   }

   std::sort(begin(out), end(out), [](const auto& a, const auto& b) {
      return fs::path(a).filename() < fs::path(b).filename();
   });

   return out;
}

} // namespace mocap
