#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "rref_core/error.hpp"
#include "rref_core/matrix.hpp"
#include "rref_core/rational.hpp"

namespace rref_core {
enum class SolutionType : std::uint8_t {
		Unique,
		Infinite,
		Inconsistent,
};

// coefficient * t_parameter, already moved to the right-hand side
struct Term {
		std::size_t parameter = 0; // 0 based, t1 is parameter 0
		Rational coefficient = Rational::from_int(0);
};

// x_variable = constant + sum(terms), or x_variable = t_parameter when free
struct VariableSolution {
		std::size_t variable = 0;
		bool is_free = false;
		std::size_t parameter = 0; // valid when is_free
		Rational constant = Rational::from_int(0);
		std::vector<Term> terms;
};

struct Classification {
		SolutionType type = SolutionType::Unique;
		std::size_t num_variables = 0;
		std::size_t rank = 0;
		std::vector<std::size_t> free_variables;

		// absent when Inconsistent
		std::optional<std::vector<VariableSolution>> solution;

		// first row reading 0 = c with c != 0, valid when Inconsistent
		std::size_t inconsistent_row = 0;
};

// interprets an RREF augmented matrix [A | b] (last column = constants)
// `pivot_cols` is the strictly increasing pivot column list of the elimination,
// it may end with the augmented column
//
// every well formed RREF falls into exactly one SolutionType
ErrorCode classify_solution(In MatrixView rref, In const std::vector<std::size_t>& pivot_cols, Out Classification* out);

// first row index with all coefficients zero and a non-zero constant
std::optional<std::size_t> find_inconsistent_row(In MatrixView rref);

} // namespace rref_core
