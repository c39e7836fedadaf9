#pragma once

#include "rref_shell/config.hpp"

#include "rref_core/matrix.hpp"
#include "rref_core/rational.hpp"

#include <cstdio>

#if RREF_SHELL_ENABLE_DEBUG
#define RREF_SHELL_DBG(...) std::fprintf(stderr, __VA_ARGS__)
#else
#define RREF_SHELL_DBG(...) \
		do {                    \
		} while (0)
#endif

namespace rref_shell::detail {

void dbg_print_rational(const rref_core::Rational& r);
void dbg_print_matrix(const char* tag, rref_core::MatrixView m);

} // namespace rref_shell::detail
