#include "rref_core/row_ops.hpp"

#include "rref_core/config.hpp"
#include "rref_core/writer.hpp"

namespace rref_core {

std::string row_op_caption(const RowOp& op) {
		std::string caption;
		Writer w{&caption};

		switch (op.kind) {
		case RowOpKind::Swap:
				w.append("[Type I] E");
				w.append_subscript_index1(op.target_row);
				w.append_subscript_index1(op.source_row);
				w.append(" : Swap R");
				w.append_index1(op.target_row);
				w.append(" ↔ R");
				w.append_index1(op.source_row);
				return caption;
		case RowOpKind::Scale:
				w.append("[Type II] E");
				w.append_subscript_index1(op.target_row);
				w.put('(');
				w.append_rational(op.scalar);
				w.append(") : Multiply R");
				w.append_index1(op.target_row);
				w.append(" by ");
				w.append_rational(op.scalar);
				return caption;
		case RowOpKind::Replace:
				w.append("[Type III] E");
				w.append_subscript_index1(op.target_row);
				w.append_subscript_index1(op.source_row);
				w.put('(');
				w.append_rational(op.scalar);
				w.append(") : R");
				w.append_index1(op.target_row);
				w.append(" + (");
				w.append_rational(op.scalar);
				w.append(") × R");
				w.append_index1(op.source_row);
				return caption;
		}
		__builtin_unreachable();
}

#if RREF_CORE_ENABLE_LATEX
ErrorCode row_op_caption_latex(const RowOp& op, std::string* out) {
		if (!out)
				return ErrorCode::Internal;
		out->clear();

		Writer w{out};

		switch (op.kind) {
		case RowOpKind::Swap:
				w.append("$R_{");
				w.append_index1(op.target_row);
				w.append("} \\leftrightarrow R_{");
				w.append_index1(op.source_row);
				w.append("}$");
				return ErrorCode::Ok;
		case RowOpKind::Scale:
				w.append("$R_{");
				w.append_index1(op.target_row);
				w.append("} \\leftarrow (");
				w.append_rational_latex(op.scalar);
				w.append(") R_{");
				w.append_index1(op.target_row);
				w.append("}$");
				return ErrorCode::Ok;
		case RowOpKind::Replace:
				w.append("$R_{");
				w.append_index1(op.target_row);
				w.append("} \\leftarrow R_{");
				w.append_index1(op.target_row);
				w.append("} + (");
				w.append_rational_latex(op.scalar);
				w.append(") R_{");
				w.append_index1(op.source_row);
				w.append("}$");
				return ErrorCode::Ok;
		}
		return ErrorCode::Internal;
}
#endif

} // namespace rref_core
