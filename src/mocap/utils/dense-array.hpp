#pragma once

#include "mocap/foundation.hpp"

namespace mocap
{
// ------------------------------------------------------------------ DenseArray
//
// Row-major (C order) N-dimensional array of `real`. New storage is filled
// with NaN, which is the "missing" sentinel throughout.
//
template<std::size_t N> class DenseArray
{
 public:
   using shape_type = array<size_t, N>;

 private:
   shape_type shape_   = {};
   shape_type strides_ = {};
   vector<real> data_  = {};

   void init_strides_() noexcept
   {
      size_t stride = 1;
      for(auto i = N; i > 0; --i) {
         strides_[i - 1] = stride;
         stride *= shape_[i - 1];
      }
   }

 public:
   DenseArray() { init_strides_(); }
   explicit DenseArray(const shape_type& shape, real fill_value = dNAN)
       : shape_(shape)
   {
      init_strides_();
      data_.assign(product(shape_), fill_value);
   }
   DenseArray(const DenseArray&) = default;
   DenseArray(DenseArray&&)      = default;
   ~DenseArray()                 = default;
   DenseArray& operator=(const DenseArray&) = default;
   DenseArray& operator=(DenseArray&&) = default;

   static constexpr size_t rank() noexcept { return N; }

   static size_t product(const shape_type& shape) noexcept
   {
      return std::accumulate(
          cbegin(shape), cend(shape), size_t(1), std::multiplies<size_t>());
   }

   const shape_type& shape() const noexcept { return shape_; }
   size_t shape(size_t dim) const noexcept { return shape_[dim]; }
   size_t stride(size_t dim) const noexcept { return strides_[dim]; }
   size_t size() const noexcept { return data_.size(); }
   bool empty() const noexcept { return data_.empty(); }

   real* data() noexcept { return data_.data(); }
   const real* data() const noexcept { return data_.data(); }

   auto begin() noexcept { return data_.begin(); }
   auto end() noexcept { return data_.end(); }
   auto begin() const noexcept { return data_.cbegin(); }
   auto end() const noexcept { return data_.cend(); }

   void fill(real value) noexcept { std::fill(begin(), end(), value); }

   template<typename... Index> size_t offset(Index... idx) const noexcept
   {
      static_assert(sizeof...(Index) == N);
      const size_t ii[N] = {size_t(idx)...};
      size_t pos         = 0;
      for(size_t i = 0; i < N; ++i) {
         assert(ii[i] < shape_[i]);
         pos += ii[i] * strides_[i];
      }
      return pos;
   }

   template<typename... Index> real& operator()(Index... idx) noexcept
   {
      return data_[offset(idx...)];
   }

   template<typename... Index> real operator()(Index... idx) const noexcept
   {
      return data_[offset(idx...)];
   }

   // Bitwise equality, so that NaN == NaN
   bool bit_equal(const DenseArray& o) const noexcept
   {
      return shape_ == o.shape_ && data_.size() == o.data_.size()
             && (data_.empty()
                 || std::memcmp(data_.data(),
                                o.data_.data(),
                                data_.size() * sizeof(real))
                        == 0);
   }
};

template<std::size_t N> string str(const array<size_t, N>& shape) noexcept
{
   return format("[{}]", implode(cbegin(shape), cend(shape), ", "));
}

} // namespace mocap
