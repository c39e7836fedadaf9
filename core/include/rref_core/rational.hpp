#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <gmpxx.h>

#include "rref_core/error.hpp"

namespace rref_core {
// exact fraction, always in lowest terms with a positive denominator (0 is 0/1)
class Rational {
	  public:
		Rational() = default;

		static Rational from_int(long v) { return Rational(mpz_class(v), mpz_class(1)); }
		static Rational from_mpz(In const mpz_class& v) { return Rational(v, mpz_class(1)); }

		static ErrorCode make(In const mpz_class& num, In const mpz_class& den, Out Rational* out);

		const mpz_class& num() const noexcept { return num_; }
		const mpz_class& den() const noexcept { return den_; }

		bool is_zero() const noexcept { return sgn(num_) == 0; }
		bool is_one() const noexcept { return num_ == 1 && den_ == 1; }
		int sign() const noexcept { return sgn(num_); }

		// both sides are normalized, so member-wise equality is value equality
		friend bool operator==(const Rational& a, const Rational& b) noexcept { return a.num_ == b.num_ && a.den_ == b.den_; }
		friend bool operator!=(const Rational& a, const Rational& b) noexcept { return !(a == b); }

	  private:
		mpz_class num_{0};
		mpz_class den_{1};

		Rational(mpz_class num, mpz_class den) : num_(std::move(num)), den_(std::move(den)) {}
};

ErrorCode rational_add(In const Rational& a, In const Rational& b, Out Rational* out);
ErrorCode rational_sub(In const Rational& a, In const Rational& b, Out Rational* out);
ErrorCode rational_mul(In const Rational& a, In const Rational& b, Out Rational* out);
ErrorCode rational_div(In const Rational& a, In const Rational& b, Out Rational* out);
ErrorCode rational_neg(In const Rational& a, Out Rational* out);
ErrorCode rational_abs(In const Rational& a, Out Rational* out);

// <0, 0, >0 like strcmp
int rational_cmp(In const Rational& a, In const Rational& b) noexcept;

// lenient cell parser. accepts "", "-", integers, decimals and p/d
// anything else (including p/0) parses as zero
Rational rational_parse(In std::string_view text);

// exact value of the shortest decimal that round trips `v`
// NaN and infinities parse as zero
Rational rational_from_double(In double v);

// "n" when the denominator is 1, otherwise "n/d". zero is "0"
std::string rational_to_string(In const Rational& r);

} // namespace rref_core
