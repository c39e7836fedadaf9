#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "rref_core/classify.hpp"
#include "rref_core/error.hpp"
#include "rref_core/matrix.hpp"
#include "rref_core/steps.hpp"

namespace rref_core {
using CellRow = std::vector<std::string>;
using CellMatrix = std::vector<CellRow>;
using ValueMatrix = std::vector<std::vector<double>>;

struct SolverResult {
		Matrix rref;
		std::vector<Step> steps; // steps.front() is the Initial input, steps.back() holds rref
		SolutionType solution_type = SolutionType::Unique;
		std::optional<std::vector<VariableSolution>> solution; // absent when Inconsistent
		std::vector<std::size_t> free_variables;
		std::size_t rank = 0;
		std::vector<std::size_t> pivot_cols;
};

// shape checks happen before any cell is parsed:
//   no rows or fewer than 2 columns -> InvalidDimension
//   a row of different length       -> DimensionMismatch, Error::i = row index
Error cells_to_matrix(In const CellMatrix& cells, Out Matrix* out);
Error values_to_matrix(In const ValueMatrix& values, Out Matrix* out);

// Gauss-Jordan elimination of the augmented matrix [A | b] with a full step
// log and classification of the system. `input` is never modified.
Error solve_rref(In MatrixView input, Out SolverResult* out);
Error solve_rref(In const CellMatrix& cells, Out SolverResult* out);

} // namespace rref_core
