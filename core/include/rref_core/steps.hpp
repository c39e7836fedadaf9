#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "rref_core/error.hpp"
#include "rref_core/matrix.hpp"
#include "rref_core/rational.hpp"
#include "rref_core/row_ops.hpp"

namespace rref_core {
enum class StepKind : std::uint8_t {
		Initial, // unmodified input
		Swap,
		Scale,
		Replace,
};

// one entry of the elimination log. `matrix` is an independent copy of the
// working matrix right after the operation
struct Step {
		StepKind kind = StepKind::Initial;
		std::size_t target_row = 0;
		std::size_t source_row = 0;              // Swap and Replace
		Rational scalar = Rational::from_int(0); // Scale and Replace
		Matrix matrix;
};

ErrorCode step_make_initial(In MatrixView input, Out Step* out);
ErrorCode step_make_op(In const RowOp& op, In MatrixView after, Out Step* out);

bool step_has_scalar(In const Step& step) noexcept;

// the row operation a non Initial step applied. Initial has none (Internal)
ErrorCode step_row_op(In const Step& step, Out RowOp* out);

// rows the operation touched: {target, source} for Swap and Replace,
// {target} for Scale, nothing for Initial
std::vector<std::size_t> step_highlight_rows(In const Step& step);

// re-applies the operations of steps[0..count) to `input`
// count == 0 or 1 yields a copy of the input
ErrorCode replay_steps(In MatrixView input, In const std::vector<Step>& steps, In std::size_t count, Out Matrix* out);

} // namespace rref_core
