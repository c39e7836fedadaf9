#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "rref_core/error.hpp"
#include "rref_core/rational.hpp"

namespace rref_core {
enum class RowOpKind : std::uint8_t {
		Swap,    // R_i <-> R_j               (type I)
		Scale,   // R_i <- k R_i              (type II)
		Replace, // R_i <- R_i + k R_j        (type III)
};

struct RowOp {
		RowOpKind kind = RowOpKind::Swap;
		std::size_t target_row = 0;
		std::size_t source_row = 0;
		Rational scalar = Rational::from_int(0);
};

// human readable caption for a RowOp (1 based row indices), e.g.
//   [Type III] E₂₁(-3) : R2 + (-3) × R1
std::string row_op_caption(In const RowOp& op);

// the same operation as an inline LaTeX formula
ErrorCode row_op_caption_latex(In const RowOp& op, Out std::string* out);

} // namespace rref_core
