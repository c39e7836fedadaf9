#include "rref_core/steps.hpp"

#include "rref_core/row_reduction.hpp"

#include <utility>

namespace rref_core {
namespace {
constexpr StepKind step_kind_for(RowOpKind kind) noexcept {
		switch (kind) {
		case RowOpKind::Swap:
				return StepKind::Swap;
		case RowOpKind::Scale:
				return StepKind::Scale;
		case RowOpKind::Replace:
				return StepKind::Replace;
		}
		return StepKind::Initial;
}
} // namespace

ErrorCode step_make_initial(MatrixView input, Step* out) {
		if (!out)
				return ErrorCode::Internal;

		Step step;
		step.kind = StepKind::Initial;
		ErrorCode ec = matrix_clone(input, &step.matrix);
		if (!is_ok(ec))
				return ec;
		*out = std::move(step);
		return ErrorCode::Ok;
}

ErrorCode step_make_op(const RowOp& op, MatrixView after, Step* out) {
		if (!out)
				return ErrorCode::Internal;

		Step step;
		step.kind = step_kind_for(op.kind);
		step.target_row = op.target_row;
		if (op.kind != RowOpKind::Scale)
				step.source_row = op.source_row;
		if (op.kind != RowOpKind::Swap)
				step.scalar = op.scalar;
		ErrorCode ec = matrix_clone(after, &step.matrix);
		if (!is_ok(ec))
				return ec;
		*out = std::move(step);
		return ErrorCode::Ok;
}

bool step_has_scalar(const Step& step) noexcept {
		return step.kind == StepKind::Scale || step.kind == StepKind::Replace;
}

ErrorCode step_row_op(const Step& step, RowOp* out) {
		if (!out)
				return ErrorCode::Internal;

		RowOp op;
		op.target_row = step.target_row;
		switch (step.kind) {
		case StepKind::Initial:
				return ErrorCode::Internal;
		case StepKind::Swap:
				op.kind = RowOpKind::Swap;
				op.source_row = step.source_row;
				break;
		case StepKind::Scale:
				op.kind = RowOpKind::Scale;
				op.source_row = step.target_row;
				op.scalar = step.scalar;
				break;
		case StepKind::Replace:
				op.kind = RowOpKind::Replace;
				op.source_row = step.source_row;
				op.scalar = step.scalar;
				break;
		}
		*out = std::move(op);
		return ErrorCode::Ok;
}

std::vector<std::size_t> step_highlight_rows(const Step& step) {
		switch (step.kind) {
		case StepKind::Initial:
				return {};
		case StepKind::Scale:
				return {step.target_row};
		case StepKind::Swap:
		case StepKind::Replace:
				return {step.target_row, step.source_row};
		}
		return {};
}

ErrorCode replay_steps(MatrixView input, const std::vector<Step>& steps, std::size_t count, Matrix* out) {
		if (!out)
				return ErrorCode::Internal;
		if (count > steps.size())
				return ErrorCode::StepOutOfRange;

		Matrix work;
		ErrorCode ec = matrix_clone(input, &work);
		if (!is_ok(ec))
				return ec;

		for (std::size_t i = 0; i < count; i++) {
				if (steps[i].kind == StepKind::Initial)
						continue;

				RowOp op;
				ec = step_row_op(steps[i], &op);
				if (!is_ok(ec))
						return ec;
				ec = apply_row_op(work.mut_view(), op);
				if (!is_ok(ec))
						return ec;
		}

		*out = std::move(work);
		return ErrorCode::Ok;
}

} // namespace rref_core
