#pragma once

#include <cassert>
#include <cstddef>
#include <vector>

#include "rref_core/error.hpp"
#include "rref_core/rational.hpp"

namespace rref_core {
struct MatrixView {
		std::size_t rows = 0;
		std::size_t cols = 0;
		std::size_t stride = 0;
		const Rational* data = nullptr;

		constexpr Dim dim() const noexcept { return {rows, cols}; }

		const Rational& at(std::size_t r, std::size_t c) const noexcept {
				assert(data);
				assert(r < rows);
				assert(c < cols);
				return data[r * stride + c];
		}
};

struct MatrixMutView {
		std::size_t rows = 0;
		std::size_t cols = 0;
		std::size_t stride = 0;
		Rational* data = nullptr;

		MatrixView view() const noexcept { return {rows, cols, stride, data}; }

		constexpr Dim dim() const noexcept { return {rows, cols}; }

		const Rational& at(std::size_t r, std::size_t c) const noexcept {
				assert(data);
				assert(r < rows);
				assert(c < cols);
				return data[r * stride + c];
		}

		Rational& at_mut(std::size_t r, std::size_t c) noexcept {
				assert(data);
				assert(r < rows);
				assert(c < cols);
				return data[r * stride + c];
		}
};

// row-major owning storage. copies are deep, which is what step snapshots rely on
class Matrix {
	  public:
		Matrix() = default;

		std::size_t rows() const noexcept { return rows_; }
		std::size_t cols() const noexcept { return cols_; }
		Dim dim() const noexcept { return {rows_, cols_}; }
		bool empty() const noexcept { return cells_.empty(); }

		MatrixView view() const noexcept { return {rows_, cols_, cols_, cells_.data()}; }
		MatrixMutView mut_view() noexcept { return {rows_, cols_, cols_, cells_.data()}; }

		const Rational& at(std::size_t r, std::size_t c) const noexcept { return view().at(r, c); }
		Rational& at_mut(std::size_t r, std::size_t c) noexcept { return mut_view().at_mut(r, c); }

	  private:
		friend ErrorCode matrix_alloc(In std::size_t rows, In std::size_t cols, Out Matrix* out);

		std::size_t rows_ = 0;
		std::size_t cols_ = 0;
		std::vector<Rational> cells_;
};

// zero filled rows x cols matrix, both at least 1
ErrorCode matrix_alloc(In std::size_t rows, In std::size_t cols, Out Matrix* out);
ErrorCode matrix_clone(In MatrixView src, Out Matrix* out);
ErrorCode matrix_copy(In MatrixView src, Out MatrixMutView dst);
void matrix_fill_zero(Out MatrixMutView m);

// exact, cell by cell
bool matrix_equal(In MatrixView a, In MatrixView b) noexcept;

// splits an augmented matrix [A | b] into views of A and of its last column
ErrorCode matrix_split_augmented(In MatrixView m, Out MatrixView* coeffs, Out MatrixView* constants) noexcept;

} // namespace rref_core
