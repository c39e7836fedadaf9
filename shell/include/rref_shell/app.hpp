#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "rref_core/error.hpp"
#include "rref_core/matrix.hpp"
#include "rref_core/solver.hpp"
#include "rref_core/steps.hpp"

#include "rref_shell/config.hpp"
#include "rref_shell/text.hpp"

namespace rref_shell {

enum ExitCode : int {
		kExitOk = 0,
		kExitFailed = 1,
		kExitUsage = 2,
};

struct Options {
		bool latex = false;
		bool show_steps = true;
		bool help = false;

		// --step N: only print the matrix after the first N log entries
		std::optional<std::size_t> replay_count;
};

// parses argv[1..argc). returns TextId::None on success, otherwise the message
// to report and `bad_arg` names the offending argument
TextId parse_args(int argc, const char* const* argv, Out Options* out, Out std::string* bad_arg);

void print_usage(std::ostream& os);

class App {
	  public:
		explicit App(Options opts) noexcept : opts_(opts) {}

		// reads a matrix from `in`, solves it and prints the log and result to
		// `out`. errors go to `err`. returns an ExitCode
		int run(std::istream& in, std::ostream& out, std::ostream& err);

	  private:
		Options opts_;

		int print_replay(const rref_core::Matrix& input, const rref_core::SolverResult& result, std::ostream& out, std::ostream& err) const;
		int print_steps(const rref_core::SolverResult& result, std::ostream& out, std::ostream& err) const;
		int print_matrix(rref_core::MatrixView m, const std::vector<std::size_t>& highlight, std::ostream& out, std::ostream& err) const;
		void print_result(const rref_core::SolverResult& result, std::ostream& out) const;

		static void print_error(const rref_core::Error& e, std::ostream& err);
};

} // namespace rref_shell
