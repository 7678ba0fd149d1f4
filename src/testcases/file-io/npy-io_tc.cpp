
#include <algorithm>
#include <iterator>

#define CATCH_CONFIG_PREFIX_ALL
#include "catch2/catch.hpp"
#include "stdinc.hpp"

#include "mocap/io/npy-io.hpp"
#include "mocap/utils/file-system.hpp"

namespace mocap
{
// An `.npy` byte stream with the passed header dict
static vector<char> make_npy_bytes(const string& dict, size_t n_reals)
{
   vector<char> buf;
   const char magic[] = "\x93NUMPY\x01\x00";
   buf.insert(end(buf), magic, magic + 8);
   buf.push_back(char(dict.size() & 0xff));
   buf.push_back(char((dict.size() >> 8) & 0xff));
   buf.insert(end(buf), cbegin(dict), cend(dict));
   buf.resize(buf.size() + n_reals * sizeof(real), '\0');
   return buf;
}

static void read_npy_buffer(vector<char>& buf,
                            vector<real>& data,
                            vector<size_t>& shape)
{
   std::unique_ptr<FILE, std::function<void(FILE*)>> fp(
       fmemopen(&buf[0], buf.size(), "r"), [](FILE* ptr) {
          if(ptr) fclose(ptr);
       });
   CATCH_REQUIRE(fp != nullptr);
   read_npy(fp.get(), data, shape);
}

static uint64_t bits_of(real x)
{
   uint64_t bits = 0;
   std::memcpy(&bits, &x, sizeof(bits));
   return bits;
}

CATCH_TEST_CASE("npy-header", "[npy_io]")
{
   CATCH_SECTION("header-is-aligned")
   {
      for(const auto& shape : vector<vector<size_t>>{
              {2, 3, 553, 2}, {5}, {}, {1, 1}, {100000, 553, 2}}) {
         const auto h = make_npy_header(shape);
         CATCH_REQUIRE((h.size() + 10) % 64 == 0);
         CATCH_REQUIRE(h.back() == '\n');
         CATCH_REQUIRE(begins_with(h, "{'descr': '<f8', "s));
      }
   }

   CATCH_SECTION("header-shape-tuple")
   {
      const auto h4 = make_npy_header({2, 3, 553, 2});
      CATCH_REQUIRE(h4.find("'shape': (2, 3, 553, 2), }") != string::npos);
      CATCH_REQUIRE(h4.find("'fortran_order': False") != string::npos);

      const auto h1 = make_npy_header({5});
      CATCH_REQUIRE(h1.find("'shape': (5,), }") != string::npos);
   }
}

CATCH_TEST_CASE("npy-round-trip", "[npy_io]")
{
   CATCH_SECTION("bit-identical-with-nan")
   {
      const auto tmpd  = make_temp_directory("/tmp/npy-io-tc.XXXXXX");
      const auto fname = format("{}/data.npy", tmpd);

      // A NaN with a non-default payload
      real payload_nan            = 0.0;
      const uint64_t payload_bits = 0x7ff8000000000abcull;
      std::memcpy(&payload_nan, &payload_bits, sizeof(real));

      DenseArray<4> A({2, 3, 553, 2});
      CATCH_REQUIRE(std::all_of(
          cbegin(A), cend(A), [](real x) { return std::isnan(x); }));
      A(0, 0, 0, 0)   = 1.0;
      A(0, 0, 0, 1)   = -0.0;
      A(1, 2, 552, 1) = 1920.5;
      A(1, 1, 40, 0)  = std::numeric_limits<real>::infinity();
      A(1, 1, 41, 0)  = std::numeric_limits<real>::denorm_min();
      A(0, 2, 100, 1) = payload_nan;

      save_npy(fname, A);
      const auto B = load_npy<4>(fname);

      CATCH_REQUIRE(B.shape() == A.shape());
      CATCH_REQUIRE(B.bit_equal(A));
      CATCH_REQUIRE(bits_of(B(0, 2, 100, 1)) == payload_bits);
      CATCH_REQUIRE(bits_of(B(0, 0, 0, 1)) == bits_of(-0.0));

      // On-disk: data starts on a 64 byte boundary
      string raw;
      CATCH_REQUIRE(!file_get_contents(fname, raw));
      CATCH_REQUIRE((raw.size() - A.size() * sizeof(real)) % 64 == 0);

      CATCH_REQUIRE_THROWS_AS(load_npy<3>(fname), std::runtime_error);

      remove_all(tmpd);
   }

   CATCH_SECTION("empty-array")
   {
      const auto tmpd  = make_temp_directory("/tmp/npy-io-tc.XXXXXX");
      const auto fname = format("{}/empty.npy", tmpd);

      DenseArray<2> A({0, 33});
      save_npy(fname, A);
      const auto B = load_npy<2>(fname);
      CATCH_REQUIRE(B.shape(0) == 0);
      CATCH_REQUIRE(B.shape(1) == 33);
      CATCH_REQUIRE(B.empty());

      remove_all(tmpd);
   }
}

CATCH_TEST_CASE("npy-rejects", "[npy_io]")
{
   vector<real> data;
   vector<size_t> shape;

   CATCH_SECTION("accepts-f8")
   {
      auto buf = make_npy_bytes(make_npy_header({3}), 3);
      read_npy_buffer(buf, data, shape);
      CATCH_REQUIRE(shape == vector<size_t>{3});
      CATCH_REQUIRE(data.size() == 3);
   }

   CATCH_SECTION("rejects-other-dtypes")
   {
      for(const auto dtype : {"'<f4'", "'>f8'", "'<i8'"}) {
         auto buf = make_npy_bytes(
             str_replace("'<f8'", dtype, make_npy_header({3})), 3);
         CATCH_REQUIRE_THROWS_AS(read_npy_buffer(buf, data, shape),
                                 std::runtime_error);
      }
   }

   CATCH_SECTION("rejects-fortran-order")
   {
      auto buf = make_npy_bytes(
          str_replace("False", "True ", make_npy_header({2, 2})), 4);
      CATCH_REQUIRE_THROWS_AS(read_npy_buffer(buf, data, shape),
                              std::runtime_error);
   }

   CATCH_SECTION("rejects-bad-magic")
   {
      auto buf = make_npy_bytes(make_npy_header({1}), 1);
      buf[1]   = 'X';
      CATCH_REQUIRE_THROWS_AS(read_npy_buffer(buf, data, shape),
                              std::runtime_error);
   }

   CATCH_SECTION("rejects-overflowing-shape")
   {
      // 2^61 * 8 wraps to zero in 64 bits
      auto buf = make_npy_bytes(
          str_replace("(8, 8)",
                      "(2305843009213693952, 8)",
                      make_npy_header({8, 8})),
          0);
      CATCH_REQUIRE_THROWS_AS(read_npy_buffer(buf, data, shape),
                              std::runtime_error);

      auto buf2 = make_npy_bytes(
          str_replace("(8,)",
                      "(99999999999999999999,)",
                      make_npy_header({8})),
          0);
      CATCH_REQUIRE_THROWS_AS(read_npy_buffer(buf2, data, shape),
                              std::runtime_error);
   }

   CATCH_SECTION("rejects-huge-truncated-shape")
   {
      auto buf = make_npy_bytes(
          str_replace("(8, 8)",
                      "(1000000000, 1000)",
                      make_npy_header({8, 8})),
          4);
      CATCH_REQUIRE_THROWS_AS(read_npy_buffer(buf, data, shape),
                              std::runtime_error);
   }

   CATCH_SECTION("zero-dimension-is-empty")
   {
      auto buf = make_npy_bytes(
          str_replace("(8, 8)",
                      "(2305843009213693952, 0)",
                      make_npy_header({8, 8})),
          0);
      read_npy_buffer(buf, data, shape);
      CATCH_REQUIRE(shape.size() == 2);
      CATCH_REQUIRE(data.empty());
   }

   CATCH_SECTION("rejects-truncated-data")
   {
      auto buf = make_npy_bytes(make_npy_header({8}), 4);
      CATCH_REQUIRE_THROWS_AS(read_npy_buffer(buf, data, shape),
                              std::runtime_error);
   }
}

} // namespace mocap
