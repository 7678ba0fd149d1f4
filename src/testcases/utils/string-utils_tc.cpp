
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"
#include "stdinc.hpp"

namespace mocap
{
CATCH_TEST_CASE("explode", "[explode]")
{
   CATCH_SECTION("explode-keeps-empty-fields")
   {
      const auto parts = explode("a,,b", ",");
      CATCH_REQUIRE(parts.size() == 3);
      CATCH_REQUIRE(parts[0] == "a");
      CATCH_REQUIRE(parts[1] == "");
      CATCH_REQUIRE(parts[2] == "b");
   }

   CATCH_SECTION("explode-collapse")
   {
      const auto parts = explode(" a  b ", " ", true);
      CATCH_REQUIRE(parts.size() == 2);
      CATCH_REQUIRE(parts[0] == "a");
      CATCH_REQUIRE(parts[1] == "b");
   }

   CATCH_SECTION("explode-empty")
   {
      CATCH_REQUIRE(explode("", ",").empty());
      CATCH_REQUIRE(explode("abc", ",").size() == 1);
   }
}

CATCH_TEST_CASE("string-utils", "[string_utils]")
{
   CATCH_SECTION("implode")
   {
      const vector<int> v{1, 2, 3};
      CATCH_REQUIRE(implode(cbegin(v), cend(v), ", ") == "1, 2, 3");

      const vector<string> w{"x", "y"};
      const auto s = implode(
          cbegin(w), cend(w), "|", [](const string& x) { return x + x; });
      CATCH_REQUIRE(s == "xx|yy");
   }

   CATCH_SECTION("str-replace")
   {
      CATCH_REQUIRE(str_replace("cat", "dog", "cat catalog") == "dog dogalog");
      CATCH_REQUIRE(str_replace("zzz", "y", "abc") == "abc");
      CATCH_REQUIRE(str_replace("", "y", "abc") == "abc");
      CATCH_REQUIRE(str_replace("abc", "", "abcabc") == "");
   }

   CATCH_SECTION("trim")
   {
      CATCH_REQUIRE(trim_copy("  \t hello \n") == "hello");
      CATCH_REQUIRE(trim_copy("   ") == "");
      string s = "  x y  ";
      trim(s);
      CATCH_REQUIRE(s == "x y");
   }

   CATCH_SECTION("begins-ends-with")
   {
      CATCH_REQUIRE(begins_with("right_hand_wrist"s, "right_hand"s));
      CATCH_REQUIRE(!begins_with("left_hand_wrist"s, "right_hand"s));
      CATCH_REQUIRE(ends_with("cam0.mp4"s, ".mp4"s));
      CATCH_REQUIRE(!ends_with("mp4"s, "cam0.mp4"s));
   }

   CATCH_SECTION("lowercase")
   {
      CATCH_REQUIRE(string_to_lowercase("MediaPipe") == "mediapipe");
      CATCH_REQUIRE(string_to_lowercase(".MP4") == ".mp4");
   }
}

} // namespace mocap
