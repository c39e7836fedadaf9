#include "rref_core/rational.hpp"

#include <charconv>
#include <cmath>
#include <system_error>

namespace rref_core {
namespace {
void normalize(mpz_class* num, mpz_class* den) {
		if (sgn(*num) == 0) {
				*den = 1;
				return;
		}

		if (sgn(*den) < 0) {
				*num = -*num;
				*den = -*den;
		}

		const mpz_class g = gcd(*num, *den);
		if (g > 1) {
				mpz_divexact(num->get_mpz_t(), num->get_mpz_t(), g.get_mpz_t());
				mpz_divexact(den->get_mpz_t(), den->get_mpz_t(), g.get_mpz_t());
		}
}

bool is_space(char ch) noexcept {
		return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n' || ch == '\v' || ch == '\f';
}

std::string_view trim(std::string_view s) noexcept {
		while (!s.empty() && is_space(s.front()))
				s.remove_prefix(1);
		while (!s.empty() && is_space(s.back()))
				s.remove_suffix(1);
		return s;
}

bool all_digits(std::string_view s) noexcept {
		if (s.empty())
				return false;
		for (char ch : s) {
				if (ch < '0' || ch > '9')
						return false;
		}
		return true;
}

// strips a leading sign, returns true when it was '-'
bool take_sign(std::string_view* s) noexcept {
		if (s->empty())
				return false;
		const char ch = s->front();
		if (ch != '-' && ch != '+')
				return false;
		s->remove_prefix(1);
		return ch == '-';
}

// ["+" | "-"] digits
bool parse_integer(std::string_view s, mpz_class* out) {
		const bool neg = take_sign(&s);
		// mpz_set_str skips embedded whitespace, so validate first
		if (!all_digits(s))
				return false;

		mpz_class v;
		if (v.set_str(std::string(s), 10) != 0)
				return false;
		if (neg)
				v = -v;
		*out = v;
		return true;
}

// ["+" | "-"] digits ["." digits], one side of the point may be empty
bool parse_decimal(std::string_view s, Rational* out) {
		const bool neg = take_sign(&s);

		const std::size_t dot = s.find('.');
		const std::string_view whole = s.substr(0, dot);
		const std::string_view frac = (dot == std::string_view::npos) ? std::string_view{} : s.substr(dot + 1);
		if (whole.empty() && frac.empty())
				return false;
		if (!whole.empty() && !all_digits(whole))
				return false;
		if (!frac.empty() && !all_digits(frac))
				return false;

		std::string digits;
		digits.reserve(whole.size() + frac.size());
		digits.append(whole);
		digits.append(frac);

		mpz_class num;
		if (num.set_str(digits, 10) != 0)
				return false;
		if (neg)
				num = -num;

		mpz_class den;
		mpz_ui_pow_ui(den.get_mpz_t(), 10u, static_cast<unsigned long>(frac.size()));
		return is_ok(Rational::make(num, den, out));
}

// p/d with integer p and d, d != 0
bool parse_fraction(std::string_view s, std::size_t slash, Rational* out) {
		mpz_class num;
		mpz_class den;
		if (!parse_integer(trim(s.substr(0, slash)), &num))
				return false;
		if (!parse_integer(trim(s.substr(slash + 1)), &den))
				return false;
		return is_ok(Rational::make(num, den, out));
}

} // namespace

ErrorCode Rational::make(const mpz_class& num, const mpz_class& den, Rational* out) {
		if (!out)
				return ErrorCode::Internal;
		if (sgn(den) == 0)
				return ErrorCode::DivisionByZero;

		mpz_class n = num;
		mpz_class d = den;
		normalize(&n, &d);
		*out = Rational(std::move(n), std::move(d));
		return ErrorCode::Ok;
}

ErrorCode rational_neg(const Rational& a, Rational* out) {
		if (!out)
				return ErrorCode::Internal;
		return Rational::make(-a.num(), a.den(), out);
}

ErrorCode rational_abs(const Rational& a, Rational* out) {
		if (!out)
				return ErrorCode::Internal;
		return Rational::make(abs(a.num()), a.den(), out);
}

ErrorCode rational_add(const Rational& a, const Rational& b, Rational* out) {
		if (!out)
				return ErrorCode::Internal;

		// a/b + c/d = (a*(d/g) + c*(b/g)) / (b/g*d), where g=gcd(b,d)
		const mpz_class g = gcd(a.den(), b.den());
		const mpz_class a_den_div_g = a.den() / g;
		const mpz_class b_den_div_g = b.den() / g;

		const mpz_class num = a.num() * b_den_div_g + b.num() * a_den_div_g;
		const mpz_class den = a_den_div_g * b.den();
		return Rational::make(num, den, out);
}

ErrorCode rational_sub(const Rational& a, const Rational& b, Rational* out) {
		if (!out)
				return ErrorCode::Internal;

		// a/b - c/d = (a*(d/g) - c*(b/g)) / (b/g*d), where g=gcd(b,d)
		const mpz_class g = gcd(a.den(), b.den());
		const mpz_class a_den_div_g = a.den() / g;
		const mpz_class b_den_div_g = b.den() / g;

		const mpz_class num = a.num() * b_den_div_g - b.num() * a_den_div_g;
		const mpz_class den = a_den_div_g * b.den();
		return Rational::make(num, den, out);
}

ErrorCode rational_mul(const Rational& a, const Rational& b, Rational* out) {
		if (!out)
				return ErrorCode::Internal;

		// reduce cross terms first to keep the intermediates small, (a/b)*(c/d)
		const mpz_class g1 = gcd(a.num(), b.den());
		const mpz_class g2 = gcd(b.num(), a.den());

		const mpz_class num = (a.num() / g1) * (b.num() / g2);
		const mpz_class den = (a.den() / g2) * (b.den() / g1);
		return Rational::make(num, den, out);
}

ErrorCode rational_div(const Rational& a, const Rational& b, Rational* out) {
		if (!out)
				return ErrorCode::Internal;
		if (b.is_zero())
				return ErrorCode::DivisionByZero;

		// a/b div c/d = (a/b) * (d/c)
		Rational recip;
		ErrorCode ec = Rational::make(b.den(), b.num(), &recip);
		if (!is_ok(ec))
				return ec;
		return rational_mul(a, recip, out);
}

int rational_cmp(const Rational& a, const Rational& b) noexcept {
		// denominators are positive, so cross multiplication keeps the order
		const mpz_class lhs = a.num() * b.den();
		const mpz_class rhs = b.num() * a.den();
		return cmp(lhs, rhs);
}

Rational rational_parse(std::string_view text) {
		const std::string_view s = trim(text);
		if (s.empty() || s == "-")
				return Rational::from_int(0);

		Rational r;
		const std::size_t slash = s.find('/');
		const bool ok = (slash == std::string_view::npos) ? parse_decimal(s, &r) : parse_fraction(s, slash, &r);
		if (!ok)
				return Rational::from_int(0);
		return r;
}

Rational rational_from_double(double v) {
		if (!std::isfinite(v))
				return Rational::from_int(0);

		// fixed notation of a double needs at most ~330 chars (denormals)
		char buf[512];
		const std::to_chars_result res = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed);
		if (res.ec != std::errc())
				return Rational::from_int(0);
		return rational_parse(std::string_view(buf, static_cast<std::size_t>(res.ptr - buf)));
}

std::string rational_to_string(const Rational& r) {
		if (r.den() == 1)
				return r.num().get_str();

		std::string s = r.num().get_str();
		s.push_back('/');
		s.append(r.den().get_str());
		return s;
}

} // namespace rref_core
