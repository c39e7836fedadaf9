#include "rref_shell/app.hpp"
#include "rref_shell/text.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
		rref_shell::Options opts;
		std::string bad_arg;
		const rref_shell::TextId problem = rref_shell::parse_args(argc, argv, &opts, &bad_arg);
		if (problem != rref_shell::TextId::None) {
				std::cerr << rref_shell::tr(problem) << ": " << bad_arg << '\n';
				rref_shell::print_usage(std::cerr);
				return rref_shell::kExitUsage;
		}
		if (opts.help) {
				rref_shell::print_usage(std::cout);
				return rref_shell::kExitOk;
		}

		rref_shell::App app(opts);
		return app.run(std::cin, std::cout, std::cerr);
}
