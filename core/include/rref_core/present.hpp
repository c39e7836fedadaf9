#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "rref_core/classify.hpp"
#include "rref_core/matrix.hpp"
#include "rref_core/solver.hpp"
#include "rref_core/steps.hpp"

// text rendering of solver results. nothing here feeds back into the solver
namespace rref_core {
using StringMatrix = std::vector<std::vector<std::string>>;

struct StepDisplay {
		StepKind kind = StepKind::Initial;
		std::vector<std::size_t> rows; // operand rows, 0 based
		std::optional<std::string> scalar;
		StringMatrix matrix;
		std::vector<std::size_t> highlight_rows;
		std::string caption;
};

struct SolverDisplay {
		StringMatrix rref;
		std::vector<StepDisplay> steps;
		SolutionType solution_type = SolutionType::Unique;
		std::vector<std::string> solution; // empty when Inconsistent
		std::vector<std::size_t> free_variables;
		std::size_t rank = 0;
		std::string summary;
};

StringMatrix matrix_to_strings(In MatrixView m);

// "Initial augmented matrix" or the row_op_caption() of the operation
std::string step_caption(In const Step& step);

// "x1 = 2", "x2 = t1 (free)", "x1 = 4 - 2t1 - 1/2t2"
std::string variable_solution_to_string(In const VariableSolution& v);

// "unique", "infinite" or "inconsistent"
const char* solution_type_name(In SolutionType type) noexcept;

// one line description of the classification
std::string solution_summary(In const SolverResult& result);

SolverDisplay render_result(In const SolverResult& result);

} // namespace rref_core
