#pragma once

#include <cstdint>
#include <string>

#include "rref_core/config.hpp"
#include "rref_core/error.hpp"
#include "rref_core/matrix.hpp"
#include "rref_core/rational.hpp"

// all writers clear `out` first. with RREF_CORE_ENABLE_LATEX=0 they return
// FeatureDisabled
namespace rref_core::latex {
ErrorCode write_rational(In const Rational& r, Out std::string* out);

enum class MatrixBrackets : std::uint8_t {
		BMatrix,
		PMatrix,
		VMatrix,
};

ErrorCode write_matrix(In MatrixView m, In MatrixBrackets brackets, Out std::string* out);
ErrorCode write_matrix_display(In MatrixView m, In MatrixBrackets brackets, Out std::string* out);

// writes an augmented matrix [L | R] using the latex array environment
//
// example:
//   \\left[\\begin{array}{rr|r} ... \\end{array}\\right]
ErrorCode write_augmented_matrix(In MatrixView left, In MatrixView right, Out std::string* out);
ErrorCode write_augmented_matrix_display(In MatrixView left, In MatrixView right, Out std::string* out);
} // namespace rref_core::latex
