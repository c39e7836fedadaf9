#include "rref_shell/app.hpp"

#include "rref_shell/detail/app_internal.hpp"
#include "rref_shell/input.hpp"

#include "rref_core/latex.hpp"
#include "rref_core/present.hpp"
#include "rref_core/row_ops.hpp"

#include <algorithm>
#include <charconv>
#include <string_view>

namespace rref_shell {
namespace {
using namespace text_literals;

bool parse_count(std::string_view text, std::size_t* out) noexcept {
		if (text.empty())
				return false;
		std::size_t value = 0;
		const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
		if (ec != std::errc() || end != text.data() + text.size())
				return false;
		*out = value;
		return true;
}

bool contains(const std::vector<std::size_t>& rows, std::size_t row) {
		return std::find(rows.begin(), rows.end(), row) != rows.end();
}

} // namespace

TextId parse_args(int argc, const char* const* argv, Options* out, std::string* bad_arg) {
		if (!out || !bad_arg)
				return "err.internal"_tid;

		Options opts;
		for (int i = 1; i < argc; i++) {
				const std::string_view arg = argv[i] ? argv[i] : "";
				if (arg == "--latex") {
						opts.latex = true;
				} else if (arg == "--no-steps") {
						opts.show_steps = false;
				} else if (arg == "--help" || arg == "-h") {
						opts.help = true;
				} else if (arg == "--step") {
						std::size_t count = 0;
						if (i + 1 >= argc || !argv[i + 1] || !parse_count(argv[i + 1], &count)) {
								*bad_arg = (i + 1 < argc && argv[i + 1]) ? argv[i + 1] : std::string(arg);
								return "err.step_value"_tid;
						}
						opts.replay_count = count;
						i++;
				} else {
						*bad_arg = std::string(arg);
						return "err.unknown_option"_tid;
				}
		}

		*out = opts;
		return TextId::None;
}

void print_usage(std::ostream& os) {
		os << "usage"_tx << '\n'
		   << "usage.input"_tx << '\n'
		   << "usage.latex"_tx << '\n'
		   << "usage.no_steps"_tx << '\n'
		   << "usage.step"_tx << '\n'
		   << "usage.help"_tx << '\n';
}

int App::run(std::istream& in, std::ostream& out, std::ostream& err) {
		rref_core::CellMatrix cells;
		rref_core::Error e = read_cells(in, &cells);
		if (e.code == rref_core::ErrorCode::Internal) {
				err << "common.error"_tx << ": " << "err.read"_tx << '\n';
				return kExitFailed;
		}
		if (!rref_core::is_ok(e)) {
				print_error(e, err);
				return kExitFailed;
		}
		RREF_SHELL_DBG("[run] read %zu rows\n", cells.size());

		rref_core::Matrix input;
		e = rref_core::cells_to_matrix(cells, &input);
		if (!rref_core::is_ok(e)) {
				print_error(e, err);
				return kExitFailed;
		}
		detail::dbg_print_matrix("input", input.view());

		rref_core::SolverResult result;
		e = rref_core::solve_rref(input.view(), &result);
		if (!rref_core::is_ok(e)) {
				print_error(e, err);
				return kExitFailed;
		}
		RREF_SHELL_DBG("[run] steps=%zu rank=%zu type=%s\n", result.steps.size(), result.rank, rref_core::solution_type_name(result.solution_type));

		if (opts_.replay_count)
				return print_replay(input, result, out, err);

		if (opts_.show_steps) {
				const int rc = print_steps(result, out, err);
				if (rc != kExitOk)
						return rc;
		}

		out << "label.rref"_tx << ":\n";
		const int rc = print_matrix(result.rref.view(), {}, out, err);
		if (rc != kExitOk)
				return rc;
		print_result(result, out);
		return kExitOk;
}

int App::print_replay(const rref_core::Matrix& input, const rref_core::SolverResult& result, std::ostream& out, std::ostream& err) const {
		const std::size_t count = *opts_.replay_count;

		rref_core::Matrix replayed;
		const rref_core::ErrorCode ec = rref_core::replay_steps(input.view(), result.steps, count, &replayed);
		if (!rref_core::is_ok(ec)) {
				print_error({ec, input.dim(), {}, count}, err);
				return kExitFailed;
		}

		// count 0 shows the input, like the Initial entry
		const rref_core::Step& last = result.steps[count == 0 ? 0 : count - 1];
		out << "label.step"_tx << ' ' << (count == 0 ? 1 : count) << ": " << rref_core::step_caption(last) << '\n';
		return print_matrix(replayed.view(), rref_core::step_highlight_rows(last), out, err);
}

int App::print_steps(const rref_core::SolverResult& result, std::ostream& out, std::ostream& err) const {
		for (std::size_t i = 0; i < result.steps.size(); i++) {
				const rref_core::Step& step = result.steps[i];
				out << "label.step"_tx << ' ' << i + 1 << ": ";

				rref_core::RowOp op;
				if (opts_.latex && rref_core::is_ok(rref_core::step_row_op(step, &op))) {
						std::string tex;
						const rref_core::ErrorCode ec = rref_core::row_op_caption_latex(op, &tex);
						if (!rref_core::is_ok(ec)) {
								out << '\n';
								print_error({ec}, err);
								return kExitFailed;
						}
						out << tex;
				} else {
						out << rref_core::step_caption(step);
				}
				out << '\n';

				const int rc = print_matrix(step.matrix.view(), rref_core::step_highlight_rows(step), out, err);
				if (rc != kExitOk)
						return rc;
				out << '\n';
		}
		return kExitOk;
}

// [ a  b | c ] rows with right aligned columns, touched rows marked with '>'
int App::print_matrix(rref_core::MatrixView m, const std::vector<std::size_t>& highlight, std::ostream& out, std::ostream& err) const {
		if (opts_.latex) {
				rref_core::MatrixView coeffs;
				rref_core::MatrixView constants;
				rref_core::ErrorCode ec = rref_core::matrix_split_augmented(m, &coeffs, &constants);
				std::string tex;
				if (rref_core::is_ok(ec))
						ec = rref_core::latex::write_augmented_matrix_display(coeffs, constants, &tex);
				if (!rref_core::is_ok(ec)) {
						print_error({ec, m.dim()}, err);
						return kExitFailed;
				}
				out << tex << '\n';
				return kExitOk;
		}

		const rref_core::StringMatrix cells = rref_core::matrix_to_strings(m);

		std::vector<std::size_t> widths(m.cols, 0);
		for (const std::vector<std::string>& row : cells) {
				for (std::size_t c = 0; c < row.size(); c++)
						widths[c] = std::max(widths[c], row[c].size());
		}

		for (std::size_t r = 0; r < cells.size(); r++) {
				out << (contains(highlight, r) ? "> [" : "  [");
				for (std::size_t c = 0; c < cells[r].size(); c++) {
						if (c + 1 == cells[r].size())
								out << " |";
						out << ' ' << std::string(widths[c] - cells[r][c].size(), ' ') << cells[r][c];
				}
				out << " ]\n";
		}
		return kExitOk;
}

void App::print_result(const rref_core::SolverResult& result, std::ostream& out) const {
		out << "label.type"_tx << ": " << rref_core::solution_type_name(result.solution_type) << '\n';
		out << rref_core::solution_summary(result) << '\n';
		out << "label.rank"_tx << ": " << result.rank << '\n';

		out << "label.free"_tx << ": ";
		if (result.free_variables.empty())
				out << "common.none"_tx;
		for (std::size_t i = 0; i < result.free_variables.size(); i++)
				out << (i == 0 ? "x" : ", x") << result.free_variables[i] + 1;
		out << '\n';

		if (!result.solution)
				return;
		out << "label.solution"_tx << ":\n";
		for (const rref_core::VariableSolution& v : *result.solution)
				out << "  " << rref_core::variable_solution_to_string(v) << '\n';
}

void App::print_error(const rref_core::Error& e, std::ostream& err) {
		err << "common.error"_tx << ": " << error_message(e.code);
		if (e.code == rref_core::ErrorCode::DimensionMismatch)
				err << " (" << "common.row"_tx << ' ' << e.i + 1 << ')';
		else if (e.code == rref_core::ErrorCode::InvalidDimension)
				err << " (" << e.a.rows << 'x' << e.a.cols << ')';
		err << '\n';
}

} // namespace rref_shell
