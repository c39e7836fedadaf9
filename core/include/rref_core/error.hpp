#pragma once

#include <cstddef>
#include <cstdint>

// parameter direction annotations
#define In
#define Out
#define InOut

namespace rref_core {
struct Dim {
		std::size_t rows = 0;
		std::size_t cols = 0;
};

enum class ErrorCode : std::uint8_t {
		Ok = 0,
		FeatureDisabled,
		InvalidDimension,  // fewer than 1 row or 2 columns
		DimensionMismatch, // ragged rows, mismatched operands
		DivisionByZero,
		IndexOutOfRange,
		StepOutOfRange,
		Internal,
};

struct Error {
		ErrorCode code = ErrorCode::Ok;
		Dim a{};
		Dim b{};
		std::size_t i = 0;
		std::size_t j = 0;
};

constexpr bool is_ok(ErrorCode code) noexcept {
		return code == ErrorCode::Ok;
}
constexpr bool is_ok(const Error& err) noexcept {
		return is_ok(err.code);
}

constexpr Error err_dim_mismatch(Dim a, Dim b) noexcept {
		return {ErrorCode::DimensionMismatch, a, b};
}
// row `row` has a different length than row 0
constexpr Error err_ragged_row(Dim a, std::size_t row, std::size_t len) noexcept {
		return {ErrorCode::DimensionMismatch, a, {1, len}, row};
}
constexpr Error err_invalid_dim(Dim a) noexcept {
		return {ErrorCode::InvalidDimension, a};
}
constexpr Error err_division_by_zero(Dim a, std::size_t row, std::size_t col) noexcept {
		return {ErrorCode::DivisionByZero, a, {}, row, col};
}
constexpr Error err_feature_disabled() noexcept {
		return {ErrorCode::FeatureDisabled};
}
} // namespace rref_core
