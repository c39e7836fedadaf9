#include "rref_core/config.hpp"
#include "rref_core/latex.hpp"
#include "rref_core/row_ops.hpp"

#if !RREF_CORE_ENABLE_LATEX
namespace rref_core {

ErrorCode row_op_caption_latex(const RowOp& op, std::string* out) {
		(void)op;
		(void)out;
		return ErrorCode::FeatureDisabled;
}

} // namespace rref_core

namespace rref_core::latex {

ErrorCode write_rational(const Rational& r, std::string* out) {
		(void)r;
		(void)out;
		return ErrorCode::FeatureDisabled;
}

ErrorCode write_matrix(MatrixView m, MatrixBrackets brackets, std::string* out) {
		(void)m;
		(void)brackets;
		(void)out;
		return ErrorCode::FeatureDisabled;
}

ErrorCode write_matrix_display(MatrixView m, MatrixBrackets brackets, std::string* out) {
		(void)m;
		(void)brackets;
		(void)out;
		return ErrorCode::FeatureDisabled;
}

ErrorCode write_augmented_matrix(MatrixView left, MatrixView right, std::string* out) {
		(void)left;
		(void)right;
		(void)out;
		return ErrorCode::FeatureDisabled;
}

ErrorCode write_augmented_matrix_display(MatrixView left, MatrixView right, std::string* out) {
		(void)left;
		(void)right;
		(void)out;
		return ErrorCode::FeatureDisabled;
}

} // namespace rref_core::latex
#endif // !RREF_CORE_ENABLE_LATEX
