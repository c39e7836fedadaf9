#include "rref_core/latex.hpp"

#include "rref_core/config.hpp"
#include "rref_core/writer.hpp"

#if RREF_CORE_ENABLE_LATEX
namespace rref_core::latex {
namespace {

const char* begin_env(MatrixBrackets b) noexcept {
		switch (b) {
		case MatrixBrackets::BMatrix:
				return "\\begin{bmatrix}";
		case MatrixBrackets::PMatrix:
				return "\\begin{pmatrix}";
		case MatrixBrackets::VMatrix:
				return "\\begin{vmatrix}";
		}
		return nullptr;
}

const char* end_env(MatrixBrackets b) noexcept {
		switch (b) {
		case MatrixBrackets::BMatrix:
				return "\\end{bmatrix}";
		case MatrixBrackets::PMatrix:
				return "\\end{pmatrix}";
		case MatrixBrackets::VMatrix:
				return "\\end{vmatrix}";
		}
		return nullptr;
}

ErrorCode write_matrix_inner(MatrixView m, MatrixBrackets brackets, Writer& w) {
		if (!m.data)
				return ErrorCode::Internal;

		const char* begin = begin_env(brackets);
		const char* end = end_env(brackets);
		if (!begin || !end)
				return ErrorCode::Internal;

		w.append(begin);
		for (std::size_t row = 0; row < m.rows; row++) {
				for (std::size_t col = 0; col < m.cols; col++) {
						if (col != 0)
								w.append(" & ");
						w.append_rational_latex(m.at(row, col));
				}
				if (row + 1 < m.rows)
						w.append(" \\\\ ");
		}
		w.append(end);
		return ErrorCode::Ok;
}

ErrorCode write_augmented_matrix_inner(MatrixView left, MatrixView right, Writer& w) {
		if (!left.data || !right.data)
				return ErrorCode::Internal;
		if (left.rows != right.rows)
				return ErrorCode::DimensionMismatch;
		if (left.cols == 0 || right.cols == 0)
				return ErrorCode::InvalidDimension;

		w.append("\\left[\\begin{array}{");
		for (std::size_t i = 0; i < left.cols; i++)
				w.put('r');
		w.put('|');
		for (std::size_t i = 0; i < right.cols; i++)
				w.put('r');
		w.append("}");

		const std::size_t total_cols = left.cols + right.cols;
		for (std::size_t row = 0; row < left.rows; row++) {
				for (std::size_t col = 0; col < total_cols; col++) {
						if (col != 0)
								w.append(" & ");
						if (col < left.cols)
								w.append_rational_latex(left.at(row, col));
						else
								w.append_rational_latex(right.at(row, col - left.cols));
				}
				if (row + 1 < left.rows)
						w.append(" \\\\ ");
		}

		w.append("\\end{array}\\right]");
		return ErrorCode::Ok;
}

// wraps an inner writer in $$ ... $$
template <typename Fn> ErrorCode write_display(std::string* out, Fn inner) {
		if (!out)
				return ErrorCode::Internal;
		out->clear();

		Writer w{out};
		w.append("$$");
		ErrorCode ec = inner(w);
		if (!is_ok(ec))
				return ec;
		w.append("$$");
		return ErrorCode::Ok;
}

} // namespace

ErrorCode write_rational(const Rational& r, std::string* out) {
		if (!out)
				return ErrorCode::Internal;
		out->clear();
		Writer{out}.append_rational_latex(r);
		return ErrorCode::Ok;
}

ErrorCode write_matrix(MatrixView m, MatrixBrackets brackets, std::string* out) {
		if (!out)
				return ErrorCode::Internal;
		out->clear();
		Writer w{out};
		return write_matrix_inner(m, brackets, w);
}

ErrorCode write_matrix_display(MatrixView m, MatrixBrackets brackets, std::string* out) {
		return write_display(out, [&](Writer& w) { return write_matrix_inner(m, brackets, w); });
}

ErrorCode write_augmented_matrix(MatrixView left, MatrixView right, std::string* out) {
		if (!out)
				return ErrorCode::Internal;
		out->clear();
		Writer w{out};
		return write_augmented_matrix_inner(left, right, w);
}

ErrorCode write_augmented_matrix_display(MatrixView left, MatrixView right, std::string* out) {
		return write_display(out, [&](Writer& w) { return write_augmented_matrix_inner(left, right, w); });
}

} // namespace rref_core::latex
#endif // RREF_CORE_ENABLE_LATEX
