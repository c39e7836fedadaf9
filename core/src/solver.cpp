#include "rref_core/solver.hpp"

#include "rref_core/config.hpp"
#include "rref_core/row_reduction.hpp"

#include <utility>

namespace rref_core {
namespace {
template <typename Rows> Error check_shape(const Rows& rows) noexcept {
		if (rows.empty())
				return err_invalid_dim({0, 0});

		const std::size_t cols = rows.front().size();
		const Dim dim{rows.size(), cols};
		for (std::size_t r = 1; r < rows.size(); r++) {
				if (rows[r].size() != cols)
						return err_ragged_row(dim, r, rows[r].size());
		}
		if (rows.size() < kMinRows || cols < kMinCols)
				return err_invalid_dim(dim);
		return {};
}

template <typename Rows, typename Parse> Error rows_to_matrix(const Rows& rows, Parse parse, Matrix* out) {
		if (!out)
				return {ErrorCode::Internal};

		Error err = check_shape(rows);
		if (!is_ok(err))
				return err;

		Matrix m;
		ErrorCode ec = matrix_alloc(rows.size(), rows.front().size(), &m);
		if (!is_ok(ec))
				return {ec, {rows.size(), rows.front().size()}};

		for (std::size_t r = 0; r < m.rows(); r++) {
				for (std::size_t c = 0; c < m.cols(); c++)
						m.at_mut(r, c) = parse(rows[r][c]);
		}

		*out = std::move(m);
		return {};
}
} // namespace

Error cells_to_matrix(const CellMatrix& cells, Matrix* out) {
		return rows_to_matrix(cells, [](const std::string& cell) { return rational_parse(cell); }, out);
}

Error values_to_matrix(const ValueMatrix& values, Matrix* out) {
		return rows_to_matrix(values, [](double v) { return rational_from_double(v); }, out);
}

Error solve_rref(MatrixView input, SolverResult* out) {
		if (!out || !input.data)
				return {ErrorCode::Internal};
		if (input.rows < kMinRows || input.cols < kMinCols)
				return err_invalid_dim(input.dim());

		SolverResult result;

		Step initial;
		ErrorCode ec = step_make_initial(input, &initial);
		if (!is_ok(ec))
				return {ec, input.dim()};
		result.steps.push_back(std::move(initial));

		// the working copy is private, the caller's cells are never touched
		Matrix work;
		ec = matrix_clone(input, &work);
		if (!is_ok(ec))
				return {ec, input.dim()};

		OpObserver obs;
		obs.steps = &result.steps;
		ec = rref_apply(work.mut_view(), &obs, &result.pivot_cols);
		if (!is_ok(ec)) {
				Error err;
				err.code = ec;
				err.a = input.dim();
				if (obs.has_last)
						err.i = obs.last_op.target_row;
				return err;
		}

		Classification info;
		ec = classify_solution(work.view(), result.pivot_cols, &info);
		if (!is_ok(ec))
				return {ec, input.dim()};

		result.rref = std::move(work);
		result.solution_type = info.type;
		result.solution = std::move(info.solution);
		result.free_variables = std::move(info.free_variables);
		result.rank = info.rank;

		*out = std::move(result);
		return {};
}

Error solve_rref(const CellMatrix& cells, SolverResult* out) {
		if (!out)
				return {ErrorCode::Internal};

		Matrix input;
		Error err = cells_to_matrix(cells, &input);
		if (!is_ok(err))
				return err;
		return solve_rref(input.view(), out);
}

} // namespace rref_core
