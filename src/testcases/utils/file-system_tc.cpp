
#include <algorithm>
#include <filesystem>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"
#include "stdinc.hpp"

#include "mocap/utils/file-system.hpp"

namespace mocap
{
static std::string sentence = "The quick brown fox jumped over the lazy dog.";

CATCH_TEST_CASE("file-get/put-contents binary safe", "[file_getput_contents]")
{
   const auto tmpd  = make_temp_directory("/tmp/file-system-tc.XXXXXX");
   const auto fname = format("{}/data.bin", tmpd);

   CATCH_SECTION("string-round-trip")
   {
      string s = sentence;
      s.push_back('\0');
      s += "tail";
      CATCH_REQUIRE(!file_put_contents(fname, s));

      string out;
      CATCH_REQUIRE(!file_get_contents(fname, out));
      CATCH_REQUIRE(out == s);
      CATCH_REQUIRE(file_get_contents(fname) == s);

      string buf;
      CATCH_REQUIRE(!file_get_contents(fname, buf));
      CATCH_REQUIRE(buf.size() == s.size());
      CATCH_REQUIRE(std::equal(cbegin(buf), cend(buf), cbegin(s)));
   }

   CATCH_SECTION("missing-file")
   {
      string out;
      const auto missing = format("{}/does-not-exist", tmpd);
      CATCH_REQUIRE(file_get_contents(missing, out));
      CATCH_REQUIRE_THROWS_AS(file_get_contents(missing), std::runtime_error);
   }

   remove_all(tmpd);
   CATCH_REQUIRE(!is_directory(tmpd));
}

CATCH_TEST_CASE("filename-parts", "[filename_parts]")
{
   CATCH_SECTION("basename")
   {
      CATCH_REQUIRE(basename("/a/b/cam0.mp4") == "cam0.mp4");
      CATCH_REQUIRE(basename("/a/b/cam0.mp4", true) == "cam0");
      CATCH_REQUIRE(basename("cam0.tar.mp4", true) == "cam0.tar");
      CATCH_REQUIRE(file_ext("/a/b/cam0.mp4") == ".mp4");
      CATCH_REQUIRE(file_ext("/a/b/cam0") == "");
      CATCH_REQUIRE(file_ext("cam0.MP4") == ".MP4");
   }
}

CATCH_TEST_CASE("list-directory-files", "[list_directory_files]")
{
   const auto tmpd = make_temp_directory("/tmp/list-dir-tc.XXXXXX");

   CATCH_SECTION("sorted-by-filename")
   {
      for(const auto s : {"cam2.mp4", "cam0.mp4", "cam1.MP4", "notes.txt"})
         CATCH_REQUIRE(!file_put_contents(format("{}/{}", tmpd, s), "x"));
      CATCH_REQUIRE(mkdir_p(format("{}/subdir.mp4", tmpd)));

      const auto fnames = list_directory_files(tmpd, ".mp4");
      CATCH_REQUIRE(fnames.size() == 3);
      CATCH_REQUIRE(basename(fnames[0]) == "cam0.mp4");
      CATCH_REQUIRE(basename(fnames[1]) == "cam1.MP4");
      CATCH_REQUIRE(basename(fnames[2]) == "cam2.mp4");

      CATCH_REQUIRE(list_directory_files(tmpd, ".avi").empty());
   }

   CATCH_SECTION("missing-directory")
   {
      CATCH_REQUIRE_THROWS_AS(
          list_directory_files(format("{}/nope", tmpd), ".mp4"),
          std::runtime_error);
   }

   remove_all(tmpd);
}

} // namespace mocap
