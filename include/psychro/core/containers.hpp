#pragma once
#include <Eigen/Dense>
#include <vector>

namespace psychro::core {

template <typename Scalar = double>
class Matrix {
private:
  Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> data_;

public:
  Matrix() = default;
  Matrix(std::size_t rows, std::size_t cols) : data_(rows, cols) {}

  Matrix(Matrix&&) = default;
  Matrix& operator=(Matrix&&) = default;

  Matrix(const Matrix&) = default;
  Matrix& operator=(const Matrix&) = default;

  [[nodiscard]] auto rows() const noexcept -> std::size_t { return data_.rows(); }
  [[nodiscard]] auto cols() const noexcept -> std::size_t { return data_.cols(); }

  auto operator()(std::size_t i, std::size_t j) -> Scalar& { return data_(i, j); }
  [[nodiscard]] auto operator()(std::size_t i, std::size_t j) const -> const Scalar& { return data_(i, j); }

  /// Row-major copy, the layout expected by HDF5 datasets
  [[nodiscard]] auto row_major() const -> std::vector<Scalar> {
    std::vector<Scalar> flat(rows() * cols());
    for (std::size_t i = 0; i < rows(); ++i) {
      for (std::size_t j = 0; j < cols(); ++j) {
        flat[i * cols() + j] = data_(i, j);
      }
    }
    return flat;
  }
};

} // namespace psychro::core
