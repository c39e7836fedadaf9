#include "rref_core/matrix.hpp"

#include <utility>

namespace rref_core {

ErrorCode matrix_alloc(std::size_t rows, std::size_t cols, Matrix* out) {
		if (!out)
				return ErrorCode::Internal;
		if (rows == 0 || cols == 0)
				return ErrorCode::InvalidDimension;

		out->rows_ = rows;
		out->cols_ = cols;
		out->cells_.assign(rows * cols, Rational::from_int(0));
		return ErrorCode::Ok;
}

ErrorCode matrix_clone(MatrixView src, Matrix* out) {
		if (!out)
				return ErrorCode::Internal;
		Matrix dst;
		ErrorCode ec = matrix_alloc(src.rows, src.cols, &dst);
		if (!is_ok(ec))
				return ec;
		ec = matrix_copy(src, dst.mut_view());
		if (!is_ok(ec))
				return ec;
		*out = std::move(dst);
		return ErrorCode::Ok;
}

ErrorCode matrix_copy(MatrixView src, MatrixMutView dst) {
		if (!src.data || !dst.data)
				return ErrorCode::Internal;
		if (src.rows != dst.rows || src.cols != dst.cols)
				return ErrorCode::DimensionMismatch;

		for (std::size_t row = 0; row < src.rows; row++) {
				for (std::size_t col = 0; col < src.cols; col++)
						dst.at_mut(row, col) = src.at(row, col);
		}
		return ErrorCode::Ok;
}

void matrix_fill_zero(MatrixMutView m) {
		if (!m.data)
				return;
		for (std::size_t row = 0; row < m.rows; row++) {
				for (std::size_t col = 0; col < m.cols; col++)
						m.at_mut(row, col) = Rational::from_int(0);
		}
}

bool matrix_equal(MatrixView a, MatrixView b) noexcept {
		if (a.rows != b.rows || a.cols != b.cols)
				return false;
		if (!a.data || !b.data)
				return a.data == b.data;

		for (std::size_t row = 0; row < a.rows; row++) {
				for (std::size_t col = 0; col < a.cols; col++) {
						if (a.at(row, col) != b.at(row, col))
								return false;
				}
		}
		return true;
}

ErrorCode matrix_split_augmented(MatrixView m, MatrixView* coeffs, MatrixView* constants) noexcept {
		if (!coeffs || !constants)
				return ErrorCode::Internal;
		if (!m.data)
				return ErrorCode::Internal;
		if (m.cols < 2)
				return ErrorCode::InvalidDimension;

		*coeffs = {m.rows, m.cols - 1, m.stride, m.data};
		*constants = {m.rows, 1, m.stride, m.data + (m.cols - 1)};
		return ErrorCode::Ok;
}

} // namespace rref_core
