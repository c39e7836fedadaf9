#include "rref_core/classify.hpp"

#include "rref_core/config.hpp"

#include <utility>

namespace rref_core {
namespace {
constexpr std::size_t kNoPivot = static_cast<std::size_t>(-1);

bool coefficients_zero(MatrixView rref, std::size_t row, std::size_t var_cols) noexcept {
		for (std::size_t c = 0; c < var_cols; c++) {
				if (!rref.at(row, c).is_zero())
						return false;
		}
		return true;
}

// x_j = b_row - sum(a_row,f * t_f) over the free columns f
ErrorCode pivot_variable(MatrixView rref, std::size_t var, std::size_t row, const std::vector<std::size_t>& free_cols, VariableSolution* out) {
		const std::size_t constants_col = rref.cols - 1;

		VariableSolution v;
		v.variable = var;
		v.constant = rref.at(row, constants_col);
		for (std::size_t k = 0; k < free_cols.size(); k++) {
				const Rational& coef = rref.at(row, free_cols[k]);
				if (coef.is_zero())
						continue;

				Term term;
				term.parameter = k;
				ErrorCode ec = rational_neg(coef, &term.coefficient);
				if (!is_ok(ec))
						return ec;
				v.terms.push_back(std::move(term));
		}

		*out = std::move(v);
		return ErrorCode::Ok;
}
} // namespace

std::optional<std::size_t> find_inconsistent_row(MatrixView rref) {
		if (!rref.data || rref.cols < kMinCols)
				return std::nullopt;

		const std::size_t var_cols = rref.cols - 1;
		for (std::size_t r = 0; r < rref.rows; r++) {
				if (coefficients_zero(rref, r, var_cols) && !rref.at(r, var_cols).is_zero())
						return r;
		}
		return std::nullopt;
}

ErrorCode classify_solution(MatrixView rref, const std::vector<std::size_t>& pivot_cols, Classification* out) {
		if (!out)
				return ErrorCode::Internal;
		if (!rref.data)
				return ErrorCode::Internal;
		if (rref.rows < kMinRows || rref.cols < kMinCols)
				return ErrorCode::InvalidDimension;
		if (pivot_cols.size() > rref.rows)
				return ErrorCode::Internal;

		const std::size_t num_vars = rref.cols - 1;

		Classification info{};
		info.num_variables = num_vars;

		// pivot i lives in row i
		std::vector<std::size_t> pivot_row_for_col(num_vars, kNoPivot);
		for (std::size_t i = 0; i < pivot_cols.size(); i++) {
				const std::size_t pc = pivot_cols[i];
				if (pc >= rref.cols)
						return ErrorCode::IndexOutOfRange;
				if (i > 0 && pc <= pivot_cols[i - 1])
						return ErrorCode::Internal;
				if (pc < num_vars) {
						pivot_row_for_col[pc] = i;
						info.rank++;
				}
		}

		for (std::size_t c = 0; c < num_vars; c++) {
				if (pivot_row_for_col[c] == kNoPivot)
						info.free_variables.push_back(c);
		}

		const std::optional<std::size_t> bad_row = find_inconsistent_row(rref);
		if (bad_row) {
				info.type = SolutionType::Inconsistent;
				info.inconsistent_row = *bad_row;
				*out = std::move(info);
				return ErrorCode::Ok;
		}

		std::vector<VariableSolution> solution;
		solution.reserve(num_vars);

		if (info.rank < num_vars) {
				info.type = SolutionType::Infinite;

				std::size_t next_param = 0;
				for (std::size_t j = 0; j < num_vars; j++) {
						if (pivot_row_for_col[j] == kNoPivot) {
								VariableSolution v;
								v.variable = j;
								v.is_free = true;
								v.parameter = next_param++;
								solution.push_back(std::move(v));
								continue;
						}

						VariableSolution v;
						ErrorCode ec = pivot_variable(rref, j, pivot_row_for_col[j], info.free_variables, &v);
						if (!is_ok(ec))
								return ec;
						solution.push_back(std::move(v));
				}
		} else {
				// full rank: the pivots fill the leading diagonal, x_j sits in row j
				info.type = SolutionType::Unique;
				for (std::size_t j = 0; j < num_vars; j++) {
						VariableSolution v;
						v.variable = j;
						v.constant = rref.at(pivot_row_for_col[j], num_vars);
						solution.push_back(std::move(v));
				}
		}

		info.solution = std::move(solution);
		*out = std::move(info);
		return ErrorCode::Ok;
}

} // namespace rref_core
