#include "rref_core/row_reduction.hpp"

namespace rref_core {

ErrorCode apply_row_op(MatrixMutView m, const RowOp& op) {
		if (!m.data)
				return ErrorCode::Internal;
		if (op.target_row >= m.rows)
				return ErrorCode::IndexOutOfRange;

		switch (op.kind) {
		case RowOpKind::Swap:
				if (op.source_row >= m.rows)
						return ErrorCode::IndexOutOfRange;
				apply_swap(m, op.target_row, op.source_row);
				return ErrorCode::Ok;
		case RowOpKind::Scale:
				return apply_scale(m, op.target_row, op.scalar);
		case RowOpKind::Replace:
				if (op.source_row >= m.rows)
						return ErrorCode::IndexOutOfRange;
				return apply_addmul(m, op.target_row, op.source_row, op.scalar);
		}
		return ErrorCode::Internal;
}

bool OpObserver::on_op(const RowOp& op, MatrixView after) {
		count++;
		last_op = op;
		has_last = true;

		if (steps) {
				Step step;
				status = step_make_op(op, after, &step);
				if (!is_ok(status))
						return false;
				steps->push_back(std::move(step));
		}
		return count != target;
}

ErrorCode rref_apply(MatrixMutView m, OpObserver* obs, std::vector<std::size_t>* pivot_cols) {
		const std::size_t rows = m.rows;
		const std::size_t cols = m.cols;

		std::size_t pivot_row = 0;
		for (std::size_t pivot_col = 0; pivot_col < cols && pivot_row < rows; pivot_col++) {
				// Find pivot row.
				std::size_t best_row = pivot_row;
				bool found = false;
				for (std::size_t row = pivot_row; row < rows; row++) {
						if (!m.at(row, pivot_col).is_zero()) {
								best_row = row;
								found = true;
								break;
						}
				}
				if (!found)
						continue;

				if (best_row != pivot_row) {
						apply_swap(m, pivot_row, best_row);
						if (obs) {
								RowOp op;
								op.kind = RowOpKind::Swap;
								op.target_row = pivot_row;
								op.source_row = best_row;
								if (!obs->on_op(op, m.view()))
										return obs->status;
						}
				}

				// make pivot = 1, skipping the no op scale when it already is
				const Rational pivot = m.at(pivot_row, pivot_col);
				if (!pivot.is_one()) {
						Rational inv;
						ErrorCode ec = rational_div(Rational::from_int(1), pivot, &inv);
						if (!is_ok(ec))
								return ec;
						ec = apply_scale(m, pivot_row, inv);
						if (!is_ok(ec))
								return ec;
						if (obs) {
								RowOp op;
								op.kind = RowOpKind::Scale;
								op.target_row = pivot_row;
								op.scalar = inv;
								if (!obs->on_op(op, m.view()))
										return obs->status;
						}
				}

				// eliminate above and below
				for (std::size_t row = 0; row < rows; row++) {
						if (row == pivot_row)
								continue;

						const Rational& entry = m.at(row, pivot_col);
						if (entry.is_zero())
								continue;

						Rational factor;
						ErrorCode ec = rational_neg(entry, &factor);
						if (!is_ok(ec))
								return ec;

						ec = apply_addmul(m, row, pivot_row, factor);
						if (!is_ok(ec))
								return ec;

						if (obs) {
								RowOp op;
								op.kind = RowOpKind::Replace;
								op.target_row = row;
								op.source_row = pivot_row;
								op.scalar = factor;
								if (!obs->on_op(op, m.view()))
										return obs->status;
						}
				}

				if (pivot_cols)
						pivot_cols->push_back(pivot_col);
				pivot_row++;
		}

		return ErrorCode::Ok;
}

} // namespace rref_core
