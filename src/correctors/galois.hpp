#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace strata::correctors::detail {

// GF(2^8) with the primitive polynomial x^8 + x^4 + x^3 + x^2 + 1 (0x11d).
inline constexpr unsigned k_field_polynomial = 0x11d;
inline constexpr std::size_t k_field_size = 255;

struct gf_tables {
  std::array<std::uint8_t, 2 * k_field_size + 2> exp{};
  std::array<std::uint8_t, 256> log{};
};

inline constexpr gf_tables make_gf_tables() {
  gf_tables t{};
  unsigned element = 1;
  for (std::size_t i = 0; i < k_field_size; ++i) {
    t.exp[i] = static_cast<std::uint8_t>(element);
    t.log[element] = static_cast<std::uint8_t>(i);
    element <<= 1U;
    if ((element & 0x100U) != 0U) {
      element ^= k_field_polynomial;
    }
  }
  for (std::size_t i = k_field_size; i < t.exp.size(); ++i) {
    t.exp[i] = t.exp[i - k_field_size];
  }
  return t;
}

inline constexpr gf_tables k_gf = make_gf_tables();

inline constexpr std::uint8_t gf_mul(std::uint8_t a, std::uint8_t b) {
  if (a == 0 || b == 0) {
    return 0;
  }
  return k_gf.exp[static_cast<std::size_t>(k_gf.log[a]) + k_gf.log[b]];
}

// b must be nonzero.
inline constexpr std::uint8_t gf_div(std::uint8_t a, std::uint8_t b) {
  if (a == 0) {
    return 0;
  }
  return k_gf.exp[static_cast<std::size_t>(k_gf.log[a]) + k_field_size - k_gf.log[b]];
}

inline constexpr std::uint8_t gf_pow(std::uint8_t a, std::size_t n) {
  if (n == 0) {
    return 1;
  }
  if (a == 0) {
    return 0;
  }
  return k_gf.exp[(static_cast<std::size_t>(k_gf.log[a]) * n) % k_field_size];
}

// Row-major matrix over GF(2^8).
class matrix {
 public:
  matrix(std::size_t rows, std::size_t cols) : rows_(rows), cols_(cols), cells_(rows * cols, 0) {}

  static matrix identity(std::size_t n);

  // rows x cols with entry (r, c) = r^c; any `cols` rows are independent.
  static matrix vandermonde(std::size_t rows, std::size_t cols);

  [[nodiscard]] std::size_t rows() const { return rows_; }
  [[nodiscard]] std::size_t cols() const { return cols_; }

  std::uint8_t& at(std::size_t r, std::size_t c) { return cells_[r * cols_ + c]; }
  [[nodiscard]] std::uint8_t at(std::size_t r, std::size_t c) const { return cells_[r * cols_ + c]; }

  [[nodiscard]] const std::uint8_t* row(std::size_t r) const { return cells_.data() + r * cols_; }

  [[nodiscard]] matrix multiply(const matrix& rhs) const;

  [[nodiscard]] matrix sub_rows(std::size_t first, std::size_t count) const;

  // Gauss-Jordan elimination; nullopt when singular.
  [[nodiscard]] std::optional<matrix> inverse() const;

 private:
  std::size_t rows_;
  std::size_t cols_;
  std::vector<std::uint8_t> cells_;
};

// Systematic encoding matrix: identity on top, parity rows below.
matrix systematic_matrix(std::size_t data_shards, std::size_t total_shards);

// out ^= coefficient * in, bytewise.
void mul_add(std::uint8_t coefficient, const std::uint8_t* in, std::uint8_t* out, std::size_t len);

}  // namespace strata::correctors::detail
