#pragma once
#include <cstddef>
#include <type_traits>
#include <usearch/index_plugins.hpp>

namespace parley::clustering {

  // Squared Euclidean distance over a fixed dimension. float goes through usearch's punned
  // (SIMD-dispatched) metric; double uses the typed kernel, since the punned metric returns
  // a float distance and would round away differences below a float ULP.
  template <typename Scalar> class SquaredL2 {
    static_assert(std::is_same_v<Scalar, float> || std::is_same_v<Scalar, double>,
                  "Only float and double are supported");

  public:
    SquaredL2() = default;

    explicit SquaredL2(size_t dim) : dim_(dim) {
      if constexpr (std::is_same_v<Scalar, float>) {
        metric_ = unum::usearch::metric_punned_t(dim, unum::usearch::metric_kind_t::l2sq_k,
                                                 unum::usearch::scalar_kind_t::f32_k);
      }
    }

    [[nodiscard]] Scalar operator()(const Scalar* a, const Scalar* b) const {
      if constexpr (std::is_same_v<Scalar, double>) {
        return unum::usearch::metric_l2sq_gt<double, double>{}(a, b, dim_);
      } else {
        const auto* a_bytes = reinterpret_cast<const unum::usearch::byte_t*>(a);
        const auto* b_bytes = reinterpret_cast<const unum::usearch::byte_t*>(b);
        return static_cast<Scalar>(metric_(a_bytes, b_bytes));
      }
    }

    [[nodiscard]] size_t dim() const noexcept { return dim_; }

  private:
    unum::usearch::metric_punned_t metric_;
    size_t dim_ = 0;
  };

}  // namespace parley::clustering
