#include "rref_core/rational.hpp"
#include "rref_core/latex.hpp"

#include "test_dbg.hpp"

#include <cassert>
#include <limits>
#include <string>

using rref_core::ErrorCode;
using rref_core::Rational;

static Rational make(long n, long d) {
		Rational r;
		ErrorCode ec = Rational::make(n, d, &r);
		assert(ec == ErrorCode::Ok);
		return r;
}

static bool is(const Rational& r, long n, long d) {
		return r.num() == n && r.den() == d;
}

int main() {
#ifdef NDEBUG
		rref_test::print_str("[test_rational] NDEBUG defined (asserts off)");
#else
		rref_test::print_str("[test_rational] NDEBUG not defined (asserts on)");
#endif

		// normalization
		{
				assert(is(make(2, 4), 1, 2));
				assert(is(make(-2, 4), -1, 2));
				assert(is(make(2, -4), -1, 2));
				assert(is(make(-6, -9), 2, 3));
				assert(is(make(0, -7), 0, 1));
				assert(is(Rational(), 0, 1));
				assert(is(Rational::from_int(-5), -5, 1));
		}
		{
				Rational r;
				assert(Rational::make(1, 0, &r) == ErrorCode::DivisionByZero);
				assert(Rational::make(1, 2, nullptr) == ErrorCode::Internal);
		}

		// arithmetic
		{
				Rational out;
				assert(rref_core::rational_add(make(1, 2), make(1, 3), &out) == ErrorCode::Ok);
				assert(is(out, 5, 6));
				rref_test::print_rational("1/2+1/3", out);

				assert(rref_core::rational_sub(make(1, 2), make(1, 3), &out) == ErrorCode::Ok);
				assert(is(out, 1, 6));

				assert(rref_core::rational_sub(make(1, 3), make(1, 3), &out) == ErrorCode::Ok);
				assert(out.is_zero());
				assert(is(out, 0, 1));

				assert(rref_core::rational_mul(make(3, 4), make(2, 3), &out) == ErrorCode::Ok);
				assert(is(out, 1, 2));

				assert(rref_core::rational_mul(make(-3, 4), make(0, 1), &out) == ErrorCode::Ok);
				assert(is(out, 0, 1));

				assert(rref_core::rational_div(make(3, 4), make(2, 3), &out) == ErrorCode::Ok);
				assert(is(out, 9, 8));

				assert(rref_core::rational_div(make(1, 2), make(-1, 4), &out) == ErrorCode::Ok);
				assert(is(out, -2, 1));

				assert(rref_core::rational_neg(make(-7, 3), &out) == ErrorCode::Ok);
				assert(is(out, 7, 3));

				assert(rref_core::rational_abs(make(-7, 3), &out) == ErrorCode::Ok);
				assert(is(out, 7, 3));
				assert(rref_core::rational_abs(make(7, 3), &out) == ErrorCode::Ok);
				assert(is(out, 7, 3));
		}

		// error paths
		{
				Rational out = make(5, 1);
				assert(rref_core::rational_div(make(1, 2), Rational::from_int(0), &out) == ErrorCode::DivisionByZero);
				// failed ops leave the output alone
				assert(is(out, 5, 1));

				assert(rref_core::rational_add(make(1, 2), make(1, 2), nullptr) == ErrorCode::Internal);
				assert(rref_core::rational_sub(make(1, 2), make(1, 2), nullptr) == ErrorCode::Internal);
				assert(rref_core::rational_mul(make(1, 2), make(1, 2), nullptr) == ErrorCode::Internal);
				assert(rref_core::rational_div(make(1, 2), make(1, 2), nullptr) == ErrorCode::Internal);
				assert(rref_core::rational_neg(make(1, 2), nullptr) == ErrorCode::Internal);
				assert(rref_core::rational_abs(make(1, 2), nullptr) == ErrorCode::Internal);
		}

		// no overflow past 64 bits
		{
				const Rational big = rref_core::rational_parse("123456789012345678901234567890");
				Rational sq;
				assert(rref_core::rational_mul(big, big, &sq) == ErrorCode::Ok);
				assert(rref_core::rational_to_string(sq) == "15241578753238836750495351562536198787501905199875019052100");

				Rational back;
				assert(rref_core::rational_div(sq, big, &back) == ErrorCode::Ok);
				assert(back == big);

				Rational tiny;
				assert(rref_core::rational_div(Rational::from_int(1), big, &tiny) == ErrorCode::Ok);
				assert(tiny.num() == 1);
				assert(rref_core::rational_to_string(tiny) == "1/123456789012345678901234567890");
		}

		// predicates and comparison
		{
				assert(Rational::from_int(1).is_one());
				assert(make(2, 2).is_one());
				assert(!Rational::from_int(-1).is_one());
				assert(!make(1, 2).is_one());
				assert(Rational().is_zero());
				assert(make(-1, 2).sign() < 0);
				assert(make(1, 2).sign() > 0);

				assert(rref_core::rational_cmp(make(1, 3), make(1, 2)) < 0);
				assert(rref_core::rational_cmp(make(1, 2), make(1, 3)) > 0);
				assert(rref_core::rational_cmp(make(2, 4), make(1, 2)) == 0);
				assert(rref_core::rational_cmp(make(-1, 2), make(-1, 3)) < 0);

				assert(make(2, 6) == make(1, 3));
				assert(make(1, 3) != make(1, 4));
		}

		// lenient parsing
		{
				assert(is(rref_core::rational_parse(""), 0, 1));
				assert(is(rref_core::rational_parse("-"), 0, 1));
				assert(is(rref_core::rational_parse("   "), 0, 1));
				assert(is(rref_core::rational_parse("42"), 42, 1));
				assert(is(rref_core::rational_parse("-17"), -17, 1));
				assert(is(rref_core::rational_parse("+3"), 3, 1));
				assert(is(rref_core::rational_parse("  7 "), 7, 1));
				assert(is(rref_core::rational_parse("0.5"), 1, 2));
				assert(is(rref_core::rational_parse("-2.25"), -9, 4));
				assert(is(rref_core::rational_parse(".5"), 1, 2));
				assert(is(rref_core::rational_parse("3."), 3, 1));
				assert(is(rref_core::rational_parse("0.1"), 1, 10));
				assert(is(rref_core::rational_parse("1/3"), 1, 3));
				assert(is(rref_core::rational_parse("-2/4"), -1, 2));
				assert(is(rref_core::rational_parse("2/-4"), -1, 2));
				assert(is(rref_core::rational_parse(" 6 / 8 "), 3, 4));

				// malformed text falls back to zero
				assert(is(rref_core::rational_parse("abc"), 0, 1));
				assert(is(rref_core::rational_parse("1/0"), 0, 1));
				assert(is(rref_core::rational_parse("1/"), 0, 1));
				assert(is(rref_core::rational_parse("/2"), 0, 1));
				assert(is(rref_core::rational_parse("1.5/2"), 0, 1));
				assert(is(rref_core::rational_parse("1.2.3"), 0, 1));
				assert(is(rref_core::rational_parse("1 2"), 0, 1));
				assert(is(rref_core::rational_parse("--1"), 0, 1));
				assert(is(rref_core::rational_parse("."), 0, 1));
				assert(is(rref_core::rational_parse("1e5"), 0, 1));
		}

		// numbers
		{
				assert(is(rref_core::rational_from_double(0.1), 1, 10));
				assert(is(rref_core::rational_from_double(-2.5), -5, 2));
				assert(is(rref_core::rational_from_double(8.0), 8, 1));
				assert(is(rref_core::rational_from_double(-0.0), 0, 1));
				assert(is(rref_core::rational_from_double(std::numeric_limits<double>::infinity()), 0, 1));
				assert(is(rref_core::rational_from_double(std::numeric_limits<double>::quiet_NaN()), 0, 1));
		}

		// display
		{
				assert(rref_core::rational_to_string(Rational()) == "0");
				assert(rref_core::rational_to_string(make(0, -3)) == "0");
				assert(rref_core::rational_to_string(make(-4, 2)) == "-2");
				assert(rref_core::rational_to_string(make(3, -6)) == "-1/2");
				assert(rref_core::rational_to_string(make(7, 3)) == "7/3");
		}

#if RREF_CORE_ENABLE_LATEX
		{
				std::string tex;
				assert(rref_core::latex::write_rational(make(-1, 2), &tex) == ErrorCode::Ok);
				assert(tex == "\\frac{-1}{2}");
				assert(rref_core::latex::write_rational(make(6, 3), &tex) == ErrorCode::Ok);
				assert(tex == "2");
				assert(rref_core::latex::write_rational(make(6, 3), nullptr) == ErrorCode::Internal);
		}
#endif

		return 0;
}
