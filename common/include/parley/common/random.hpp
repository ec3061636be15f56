#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace parley {

  // Stream of uniformly distributed indices. Passed explicitly to every computation that
  // needs randomness so results depend only on the seed, never on call order.
  class IRandomSource {
  public:
    virtual ~IRandomSource() = default;

    IRandomSource(const IRandomSource&) = delete;
    IRandomSource& operator=(const IRandomSource&) = delete;
    IRandomSource(IRandomSource&&) = delete;
    IRandomSource& operator=(IRandomSource&&) = delete;

    // Uniform integer in [0, n). n must be positive.
    [[nodiscard]] virtual size_t uniform_index(size_t n) = 0;

    // k distinct indices in [0, n), in draw order.
    [[nodiscard]] virtual std::vector<size_t> sample_without_replacement(size_t n, size_t k);

  protected:
    IRandomSource() = default;
  };

  class SeededRandomSource : public IRandomSource {
  public:
    explicit SeededRandomSource(std::uint64_t seed) : engine_(seed) {}

    [[nodiscard]] size_t uniform_index(size_t n) override;

  private:
    std::mt19937_64 engine_;
  };

}  // namespace parley
