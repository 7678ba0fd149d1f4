#include "npy-io.hpp"

#include <cerrno>
#include <stdio.h>

#include <boost/endian/conversion.hpp>

namespace mocap
{
static constexpr char k_npy_magic[]   = "\x93NUMPY";
static constexpr size_t k_magic_sz    = 6;
static constexpr size_t k_npy_align   = 64;
static constexpr size_t k_max_hdr_len = 1024 * 1024;

// ------------------------------------------------------------- make-npy-header

string make_npy_header(const vector<size_t>& shape) noexcept
{
   string shape_s = implode(cbegin(shape), cend(shape), ", ");
   if(shape.size() == 1) shape_s += ",";

   string dict = format(
       "{{'descr': '<f8', 'fortran_order': False, 'shape': ({}), }}", shape_s);

   // magic + version + uint16 length + dict + padding + '\n'
   const size_t preamble = k_magic_sz + 2 + 2;
   const size_t unpadded = preamble + dict.size() + 1;
   const size_t padded
       = ((unpadded + k_npy_align - 1) / k_npy_align) * k_npy_align;
   dict.append(padded - unpadded, ' ');
   dict.push_back('\n');
   return dict;
}

// ------------------------------------------------------------------- write-npy

void write_npy(FILE* fp,
               const real* data,
               const vector<size_t>& shape) noexcept(false)
{
   const string header = make_npy_header(shape);
   if(header.size() > std::numeric_limits<uint16_t>::max())
      throw std::runtime_error(
          format("npy header too long: {} bytes", header.size()));

   auto write_bytes = [fp](const void* ptr, size_t sz) {
      if(fwrite(ptr, 1, sz, fp) != sz)
         throw std::runtime_error("write error writing npy data to FILE*");
   };

   const uint8_t version[2] = {1, 0};
   const uint16_t hdr_len
       = boost::endian::native_to_little(uint16_t(header.size()));

   write_bytes(k_npy_magic, k_magic_sz);
   write_bytes(version, 2);
   write_bytes(&hdr_len, sizeof(hdr_len));
   write_bytes(header.data(), header.size());

   size_t n = 1;
   for(auto sz : shape) n *= sz;
   if(n == 0) return;

   vector<uint64_t> packed(n);
   for(size_t i = 0; i < n; ++i) {
      uint64_t bits = 0;
      std::memcpy(&bits, &data[i], sizeof(bits));
      packed[i] = boost::endian::native_to_little(bits);
   }
   write_bytes(packed.data(), packed.size() * sizeof(uint64_t));
}

// -------------------------------------------------------------------- read-npy

// Returns the text following `'key':` in the header dict
static string_view dict_value(const string_view dict, const string_view key)
{
   const auto quoted = format("'{}'", key);
   auto pos          = dict.find(quoted);
   if(pos == string_view::npos)
      throw std::runtime_error(format("npy header missing key {}", quoted));
   pos = dict.find(':', pos + quoted.size());
   if(pos == string_view::npos)
      throw std::runtime_error(format("npy header malformed at {}", quoted));
   ++pos;
   while(pos < dict.size()
         && std::isspace(static_cast<unsigned char>(dict[pos])))
      ++pos;
   return dict.substr(pos);
}

static vector<size_t> parse_shape(const string_view value)
{
   if(value.empty() || value[0] != '(')
      throw std::runtime_error("npy header: expected shape tuple");
   const auto end_pos = value.find(')');
   if(end_pos == string_view::npos)
      throw std::runtime_error("npy header: unterminated shape tuple");

   vector<size_t> shape;
   for(auto& token : explode(value.substr(1, end_pos - 1), ",", true)) {
      trim(token);
      if(token.empty()) continue;
      char* end = nullptr;
      errno          = 0;
      const auto dim = strtoull(token.c_str(), &end, 10);
      if(end == nullptr || *end != '\0' || errno == ERANGE
         || dim > std::numeric_limits<size_t>::max())
         throw std::runtime_error(
             format("npy header: bad shape dimension '{}'", token));
      shape.push_back(size_t(dim));
   }
   return shape;
}

void read_npy(FILE* fp,
              vector<real>& data,
              vector<size_t>& shape) noexcept(false)
{
   auto read_bytes = [fp](void* ptr, size_t sz) {
      if(fread(ptr, 1, sz, fp) != sz)
         throw std::runtime_error("read error reading npy data from FILE*");
   };

   char magic[k_magic_sz];
   read_bytes(magic, k_magic_sz);
   if(std::memcmp(magic, k_npy_magic, k_magic_sz) != 0)
      throw std::runtime_error("not an npy file: bad magic string");

   uint8_t version[2] = {0, 0};
   read_bytes(version, 2);

   size_t hdr_len = 0;
   if(version[0] == 1) {
      uint16_t len = 0;
      read_bytes(&len, sizeof(len));
      hdr_len = boost::endian::little_to_native(len);
   } else if(version[0] == 2 || version[0] == 3) {
      uint32_t len = 0;
      read_bytes(&len, sizeof(len));
      hdr_len = boost::endian::little_to_native(len);
   } else {
      throw std::runtime_error(format(
          "unsupported npy version {}.{}", int(version[0]), int(version[1])));
   }

   if(hdr_len > k_max_hdr_len)
      throw std::runtime_error(
          format("cowardly refusing to read npy header of {} bytes", hdr_len));

   string header(hdr_len, '\0');
   if(hdr_len > 0) read_bytes(&header[0], hdr_len);

   const auto descr = dict_value(header, "descr");
   if(!begins_with(descr, string_view("'<f8'")))
      throw std::runtime_error(
          format("unsupported npy dtype: expected '<f8', header was {}",
                 trim_copy(header)));

   const auto fortran = dict_value(header, "fortran_order");
   if(!begins_with(fortran, string_view("False")))
      throw std::runtime_error("fortran ordered npy arrays are not supported");

   shape = parse_shape(dict_value(header, "shape"));

   // The element count, and its size in bytes, must fit in a size_t
   constexpr size_t max_n = std::numeric_limits<size_t>::max() / sizeof(real);
   const bool is_empty
       = std::find(cbegin(shape), cend(shape), size_t(0)) != cend(shape);
   size_t n = is_empty ? 0 : 1;
   for(auto sz : shape) {
      if(is_empty) break;
      if(n > max_n / sz)
         throw std::runtime_error(
             format("npy shape ({}) is too large",
                    implode(cbegin(shape), cend(shape), ", ")));
      n *= sz;
   }

   // Read in chunks
   constexpr size_t k_chunk = 64 * 1024;
   vector<uint64_t> packed;
   data.clear();
   for(size_t i = 0; i < n; i += k_chunk) {
      packed.resize(std::min(k_chunk, n - i));
      read_bytes(packed.data(), packed.size() * sizeof(uint64_t));
      for(const auto x : packed) {
         const uint64_t bits = boost::endian::little_to_native(x);
         real value          = 0.0;
         std::memcpy(&value, &bits, sizeof(bits));
         data.push_back(value);
      }
   }
}

} // namespace mocap
