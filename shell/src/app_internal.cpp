#include "rref_shell/detail/app_internal.hpp"

namespace rref_shell::detail {

void dbg_print_rational(const rref_core::Rational& r) {
#if RREF_SHELL_ENABLE_DEBUG
		RREF_SHELL_DBG("%s", rref_core::rational_to_string(r).c_str());
#else
		(void)r;
#endif
}

void dbg_print_matrix(const char* tag, rref_core::MatrixView m) {
#if RREF_SHELL_ENABLE_DEBUG
		if (!tag)
				tag = "(null)";
		RREF_SHELL_DBG("[%s] %zux%zu stride=%zu data=%p\n", tag, m.rows, m.cols, m.stride, static_cast<const void*>(m.data));
		if (!m.data)
				return;

		for (std::size_t r = 0; r < m.rows; r++) {
				for (std::size_t c = 0; c < m.cols; c++) {
						RREF_SHELL_DBG("  (%zu,%zu)=", r, c);
						dbg_print_rational(m.at(r, c));
						RREF_SHELL_DBG("\n");
				}
		}
#else
		(void)tag;
		(void)m;
#endif
}

} // namespace rref_shell::detail
