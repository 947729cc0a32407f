#include "galois.hpp"

#include <utility>

namespace strata::correctors::detail {

matrix matrix::identity(std::size_t n) {
  matrix m(n, n);
  for (std::size_t i = 0; i < n; ++i) {
    m.at(i, i) = 1;
  }
  return m;
}

matrix matrix::vandermonde(std::size_t rows, std::size_t cols) {
  matrix m(rows, cols);
  for (std::size_t r = 0; r < rows; ++r) {
    for (std::size_t c = 0; c < cols; ++c) {
      m.at(r, c) = gf_pow(static_cast<std::uint8_t>(r), c);
    }
  }
  return m;
}

matrix matrix::multiply(const matrix& rhs) const {
  matrix out(rows_, rhs.cols_);
  for (std::size_t r = 0; r < rows_; ++r) {
    for (std::size_t c = 0; c < rhs.cols_; ++c) {
      std::uint8_t acc = 0;
      for (std::size_t k = 0; k < cols_; ++k) {
        acc ^= gf_mul(at(r, k), rhs.at(k, c));
      }
      out.at(r, c) = acc;
    }
  }
  return out;
}

matrix matrix::sub_rows(std::size_t first, std::size_t count) const {
  matrix out(count, cols_);
  for (std::size_t r = 0; r < count; ++r) {
    for (std::size_t c = 0; c < cols_; ++c) {
      out.at(r, c) = at(first + r, c);
    }
  }
  return out;
}

std::optional<matrix> matrix::inverse() const {
  if (rows_ != cols_) {
    return std::nullopt;
  }
  const std::size_t n = rows_;
  matrix work = *this;
  matrix inv = identity(n);

  for (std::size_t col = 0; col < n; ++col) {
    std::size_t pivot = col;
    while (pivot < n && work.at(pivot, col) == 0) {
      ++pivot;
    }
    if (pivot == n) {
      return std::nullopt;
    }
    if (pivot != col) {
      for (std::size_t c = 0; c < n; ++c) {
        std::swap(work.at(pivot, c), work.at(col, c));
        std::swap(inv.at(pivot, c), inv.at(col, c));
      }
    }

    const std::uint8_t scale = work.at(col, col);
    if (scale != 1) {
      for (std::size_t c = 0; c < n; ++c) {
        work.at(col, c) = gf_div(work.at(col, c), scale);
        inv.at(col, c) = gf_div(inv.at(col, c), scale);
      }
    }

    for (std::size_t r = 0; r < n; ++r) {
      const std::uint8_t factor = work.at(r, col);
      if (r == col || factor == 0) {
        continue;
      }
      for (std::size_t c = 0; c < n; ++c) {
        work.at(r, c) ^= gf_mul(factor, work.at(col, c));
        inv.at(r, c) ^= gf_mul(factor, inv.at(col, c));
      }
    }
  }
  return inv;
}

matrix systematic_matrix(std::size_t data_shards, std::size_t total_shards) {
  const matrix vm = matrix::vandermonde(total_shards, data_shards);
  // The top square of a Vandermonde matrix with distinct rows is invertible.
  const auto top_inverse = vm.sub_rows(0, data_shards).inverse();
  return vm.multiply(*top_inverse);
}

void mul_add(std::uint8_t coefficient, const std::uint8_t* in, std::uint8_t* out, std::size_t len) {
  if (coefficient == 0) {
    return;
  }
  if (coefficient == 1) {
    for (std::size_t i = 0; i < len; ++i) {
      out[i] ^= in[i];
    }
    return;
  }
  const std::size_t log_c = k_gf.log[coefficient];
  for (std::size_t i = 0; i < len; ++i) {
    if (in[i] != 0) {
      out[i] ^= k_gf.exp[log_c + k_gf.log[in[i]]];
    }
  }
}

}  // namespace strata::correctors::detail
