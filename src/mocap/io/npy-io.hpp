#pragma once

#include "mocap/foundation.hpp"
#include "mocap/utils/dense-array.hpp"

// NumPy `.npy` format version 1.0, dtype '<f8', C order.

namespace mocap
{
// ------------------------------------------------------------- write/read FILE

void write_npy(FILE* fp,
               const real* data,
               const vector<size_t>& shape) noexcept(false);

// Reads the header and all of the data. Throws std::runtime_error if the
// stream is not a little-endian float64 C-ordered `.npy` v1.0 array.
void read_npy(FILE* fp,
              vector<real>& data,
              vector<size_t>& shape) noexcept(false);

string make_npy_header(const vector<size_t>& shape) noexcept;

// ------------------------------------------------------------------- save/load

template<std::size_t N>
void save_npy(const string_view fname, const DenseArray<N>& A) noexcept(false)
{
   std::unique_ptr<FILE, std::function<void(FILE*)>> fp(
       fopen(string(fname).c_str(), "wb"), [](FILE* ptr) {
          if(ptr) fclose(ptr);
       });
   if(fp == nullptr)
      throw std::runtime_error(
          format("failed to open '{}' for writing", fname));

   const auto& s = A.shape();
   write_npy(fp.get(), A.data(), vector<size_t>(cbegin(s), cend(s)));

   if(FILE* ptr = fp.release(); fclose(ptr) != 0)
      throw std::runtime_error(format("failed to close '{}'", fname));
}

template<std::size_t N>
DenseArray<N> load_npy(const string_view fname) noexcept(false)
{
   std::unique_ptr<FILE, std::function<void(FILE*)>> fp(
       fopen(string(fname).c_str(), "rb"), [](FILE* ptr) {
          if(ptr) fclose(ptr);
       });
   if(fp == nullptr)
      throw std::runtime_error(
          format("failed to open '{}' for reading", fname));

   vector<real> data;
   vector<size_t> shape;
   read_npy(fp.get(), data, shape);

   if(shape.size() != N)
      throw std::runtime_error(
          format("'{}' has rank {}, but expected rank {}",
                 fname,
                 shape.size(),
                 N));

   typename DenseArray<N>::shape_type s;
   std::copy(cbegin(shape), cend(shape), begin(s));
   DenseArray<N> A(s);
   Expects(A.size() == data.size());
   std::copy(cbegin(data), cend(data), A.begin());
   return A;
}

} // namespace mocap
