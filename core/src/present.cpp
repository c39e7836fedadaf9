#include "rref_core/present.hpp"

#include "rref_core/writer.hpp"

#include <utility>

namespace rref_core {
namespace {
void append_variable(Writer& w, std::size_t var) {
		w.put('x');
		w.append_index1(var);
}

void append_parameter(Writer& w, std::size_t param) {
		w.put('t');
		w.append_index1(param);
}

StepDisplay render_step(const Step& step) {
		StepDisplay d;
		d.kind = step.kind;
		switch (step.kind) {
		case StepKind::Initial:
				break;
		case StepKind::Scale:
				d.rows = {step.target_row};
				break;
		case StepKind::Swap:
		case StepKind::Replace:
				d.rows = {step.target_row, step.source_row};
				break;
		}
		if (step_has_scalar(step))
				d.scalar = rational_to_string(step.scalar);
		d.matrix = matrix_to_strings(step.matrix.view());
		d.highlight_rows = step_highlight_rows(step);
		d.caption = step_caption(step);
		return d;
}
} // namespace

StringMatrix matrix_to_strings(MatrixView m) {
		StringMatrix out;
		if (!m.data)
				return out;

		out.reserve(m.rows);
		for (std::size_t r = 0; r < m.rows; r++) {
				std::vector<std::string> row;
				row.reserve(m.cols);
				for (std::size_t c = 0; c < m.cols; c++)
						row.push_back(rational_to_string(m.at(r, c)));
				out.push_back(std::move(row));
		}
		return out;
}

std::string step_caption(const Step& step) {
		RowOp op;
		if (!is_ok(step_row_op(step, &op)))
				return "Initial augmented matrix";
		return row_op_caption(op);
}

std::string variable_solution_to_string(const VariableSolution& v) {
		std::string s;
		Writer w{&s};

		append_variable(w, v.variable);
		w.append(" = ");
		if (v.is_free) {
				append_parameter(w, v.parameter);
				w.append(" (free)");
				return s;
		}

		w.append_rational(v.constant);
		for (const Term& term : v.terms) {
				w.append(term.coefficient.sign() < 0 ? " - " : " + ");

				Rational mag;
				if (!is_ok(rational_abs(term.coefficient, &mag)))
						mag = term.coefficient;
				// a unit coefficient is implied: "+ t1", not "+ 1t1"
				if (!mag.is_one())
						w.append_rational(mag);
				append_parameter(w, term.parameter);
		}
		return s;
}

const char* solution_type_name(SolutionType type) noexcept {
		switch (type) {
		case SolutionType::Unique:
				return "unique";
		case SolutionType::Infinite:
				return "infinite";
		case SolutionType::Inconsistent:
				return "inconsistent";
		}
		return "unknown";
}

std::string solution_summary(const SolverResult& result) {
		switch (result.solution_type) {
		case SolutionType::Unique:
				return "Unique solution found";
		case SolutionType::Inconsistent:
				return "System is INCONSISTENT (0 = non-zero detected)";
		case SolutionType::Infinite:
				break;
		}

		std::string s = "Infinite solutions (Free variables: ";
		Writer w{&s};
		for (std::size_t i = 0; i < result.free_variables.size(); i++) {
				if (i != 0)
						w.append(", ");
				append_variable(w, result.free_variables[i]);
		}
		w.put(')');
		return s;
}

SolverDisplay render_result(const SolverResult& result) {
		SolverDisplay d;
		d.rref = matrix_to_strings(result.rref.view());

		d.steps.reserve(result.steps.size());
		for (const Step& step : result.steps)
				d.steps.push_back(render_step(step));

		d.solution_type = result.solution_type;
		if (result.solution) {
				for (const VariableSolution& v : *result.solution)
						d.solution.push_back(variable_solution_to_string(v));
		}
		d.free_variables = result.free_variables;
		d.rank = result.rank;
		d.summary = solution_summary(result);
		return d;
}

} // namespace rref_core
