#include "rref_core/rref_core.hpp"

#include "test_dbg.hpp"

#include <cassert>
#include <optional>
#include <string>
#include <vector>

using rref_core::SolutionType;
using rref_core::SolverDisplay;
using rref_core::SolverResult;
using rref_core::StepKind;

static SolverResult solve(const rref_core::CellMatrix& cells) {
		SolverResult result;
		assert(rref_core::is_ok(rref_core::solve_rref(cells, &result)));
		return result;
}

int main() {
#ifdef NDEBUG
		rref_test::print_str("[test_present] NDEBUG defined (asserts off)");
#else
		rref_test::print_str("[test_present] NDEBUG not defined (asserts on)");
#endif

		// unique system, full rendering
		{
				const SolverResult r = solve({{"2", "1", "-1", "8"}, {"-3", "-1", "2", "-11"}, {"-2", "1", "2", "-3"}});
				const SolverDisplay d = rref_core::render_result(r);

				assert(d.solution_type == SolutionType::Unique);
				assert(d.summary == "Unique solution found");
				assert(d.rank == 3);
				assert((d.solution == std::vector<std::string>{"x1 = 2", "x2 = 3", "x3 = -1"}));
				assert((d.rref[2] == std::vector<std::string>{"0", "0", "1", "-1"}));

				// one display entry per log entry, no trailing marker
				assert(d.steps.size() == r.steps.size());

				const rref_core::StepDisplay& first = d.steps[0];
				assert(first.kind == StepKind::Initial);
				assert(first.caption == "Initial augmented matrix");
				assert(first.rows.empty());
				assert(!first.scalar.has_value());
				assert(first.highlight_rows.empty());
				assert((first.matrix[1] == std::vector<std::string>{"-3", "-1", "2", "-11"}));

				const rref_core::StepDisplay& scale = d.steps[1];
				assert(scale.kind == StepKind::Scale);
				assert(scale.caption == "[Type II] E₁(1/2) : Multiply R1 by 1/2");
				assert((scale.rows == std::vector<std::size_t>{0}));
				assert(scale.scalar == std::optional<std::string>{"1/2"});
				assert((scale.matrix[0] == std::vector<std::string>{"1", "1/2", "-1/2", "4"}));

				const rref_core::StepDisplay& replace = d.steps[2];
				assert(replace.caption == "[Type III] E₂₁(3) : R2 + (3) × R1");
				assert((replace.rows == std::vector<std::size_t>{1, 0}));
				assert((replace.highlight_rows == std::vector<std::size_t>{1, 0}));
				assert(replace.scalar == std::optional<std::string>{"3"});

				for (const rref_core::StepDisplay& s : d.steps)
						rref_test::print_str(s.caption.c_str());
		}

		// infinite
		{
				const SolverResult r = solve({{"1", "2", "1", "0", "5"}, {"2", "4", "0", "1", "8"}, {"3", "6", "1", "1", "13"}});
				const SolverDisplay d = rref_core::render_result(r);
				assert(d.summary == "Infinite solutions (Free variables: x2, x4)");
				assert(d.solution.size() == 4);
				assert(d.solution[1] == "x2 = t1 (free)");
				assert((d.free_variables == std::vector<std::size_t>{1, 3}));
				assert(std::string(rref_core::solution_type_name(d.solution_type)) == "infinite");
		}

		// inconsistent, with a swap caption
		{
				const SolverResult r = solve({{"1", "1", "1", "6"}, {"1", "1", "1", "8"}, {"0", "0", "1", "3"}});
				const SolverDisplay d = rref_core::render_result(r);
				assert(d.summary == "System is INCONSISTENT (0 = non-zero detected)");
				assert(d.solution.empty());
				assert(std::string(rref_core::solution_type_name(d.solution_type)) == "inconsistent");

				const rref_core::StepDisplay& swap = d.steps[2];
				assert(swap.kind == StepKind::Swap);
				assert(swap.caption == "[Type I] E₂₃ : Swap R2 ↔ R3");
				assert(!swap.scalar.has_value());
				assert((swap.highlight_rows == std::vector<std::size_t>{1, 2}));
		}

		// variable strings
		{
				rref_core::VariableSolution v;
				v.variable = 2;
				v.constant = rref_core::rational_parse("-5/2");
				assert(rref_core::variable_solution_to_string(v) == "x3 = -5/2");

				rref_core::Term unit;
				unit.parameter = 0;
				unit.coefficient = rref_core::rational_parse("-1");
				rref_core::Term half;
				half.parameter = 2;
				half.coefficient = rref_core::rational_parse("1/2");
				v.terms = {unit, half};
				assert(rref_core::variable_solution_to_string(v) == "x3 = -5/2 - t1 + 1/2t3");

				rref_core::VariableSolution f;
				f.variable = 9;
				f.is_free = true;
				f.parameter = 10;
				assert(rref_core::variable_solution_to_string(f) == "x10 = t11 (free)");

				assert(std::string(rref_core::solution_type_name(SolutionType::Unique)) == "unique");
		}

		// matrix_to_strings
		{
				rref_core::Matrix m;
				assert(rref_core::is_ok(rref_core::cells_to_matrix({{"4/8", "-0.75"}, {"", "12"}}, &m)));
				const rref_core::StringMatrix s = rref_core::matrix_to_strings(m.view());
				assert((s == rref_core::StringMatrix{{"1/2", "-3/4"}, {"0", "12"}}));
				assert(rref_core::matrix_to_strings({1, 1, 1, nullptr}).empty());
		}

		return 0;
}
