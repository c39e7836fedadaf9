#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "rref_core/error.hpp"
#include "rref_core/matrix.hpp"
#include "rref_core/row_ops.hpp"
#include "rref_core/steps.hpp"

namespace rref_core {

// swap rows r1 and r2 of matrix m
inline void apply_swap(MatrixMutView m, std::size_t r1, std::size_t r2) {
		if (r1 == r2)
				return;
		for (std::size_t col = 0; col < m.cols; col++)
				std::swap(m.at_mut(r1, col), m.at_mut(r2, col));
}

// scale row r by k: R_r <- k * R_r
inline ErrorCode apply_scale(MatrixMutView m, std::size_t row, const Rational& k) {
		for (std::size_t col = 0; col < m.cols; col++) {
				Rational result;
				ErrorCode ec = rational_mul(m.at(row, col), k, &result);
				if (!is_ok(ec))
						return ec;
				m.at_mut(row, col) = std::move(result);
		}
		return ErrorCode::Ok;
}

// add a scaled row: R_dst <- R_dst + k * R_src
inline ErrorCode apply_addmul(MatrixMutView m, std::size_t dst, std::size_t src, const Rational& k) {
		for (std::size_t col = 0; col < m.cols; col++) {
				Rational scaled;
				ErrorCode ec = rational_mul(m.at(src, col), k, &scaled);
				if (!is_ok(ec))
						return ec;
				Rational result;
				ec = rational_add(m.at(dst, col), scaled, &result);
				if (!is_ok(ec))
						return ec;
				m.at_mut(dst, col) = std::move(result);
		}
		return ErrorCode::Ok;
}

// dispatches on op.kind, rejecting row indices outside m
ErrorCode apply_row_op(MatrixMutView m, const RowOp& op);

// observer for tracking row operations during elimination
struct OpObserver {
		std::size_t target = static_cast<std::size_t>(-1); // 1 based op index to stop after applying
		std::size_t count = 0;
		RowOp last_op{};
		bool has_last = false;

		// when set, every op appends a Step holding a snapshot of the matrix
		std::vector<Step>* steps = nullptr;
		ErrorCode status = ErrorCode::Ok;

		bool on_op(const RowOp& op, MatrixView after);
};

// Reduces `m` to reduced row echelon form in place, optionally reporting row
// operations via `obs`. Columns are scanned left to right (the augmented
// column included) and the first non-zero entry at or below the current pivot
// row is taken as pivot. Each pivot column is appended to `pivot_cols`.
//
// Note: `obs->target` is 1-based: stop after applying exactly `target` ops.
ErrorCode rref_apply(MatrixMutView m, OpObserver* obs, std::vector<std::size_t>* pivot_cols);

} // namespace rref_core
