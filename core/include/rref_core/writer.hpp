#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "rref_core/rational.hpp"

namespace rref_core {

// string builder helper for captions and LaTeX output
struct Writer {
		std::string* out = nullptr;

		void put(char ch) { out->push_back(ch); }

		void append(std::string_view s) { out->append(s); }

		void append_u64(std::uint64_t v) {
				char buf[32];
				std::size_t n = 0;
				do {
						buf[n++] = static_cast<char>('0' + (v % 10u));
						v /= 10u;
				} while (v != 0u);

				for (std::size_t i = 0; i < n; i++)
						put(buf[n - 1 - i]);
		}

		// append a 1 based index (v+1) as decimal
		void append_index1(std::size_t v) { append_u64(static_cast<std::uint64_t>(v) + 1u); }

		// same, with unicode subscript digits (UTF-8)
		void append_subscript_index1(std::size_t v) {
				static constexpr const char* kSubscripts[10] = {"₀", "₁", "₂", "₃", "₄", "₅", "₆", "₇", "₈", "₉"};

				std::string digits;
				Writer{&digits}.append_index1(v);
				for (char ch : digits)
						append(kSubscripts[ch - '0']);
		}

		// "n" or "n/d"
		void append_rational(const Rational& r) { append(rational_to_string(r)); }

		// append a rational as LaTeX (either integer or \frac{num}{den})
		void append_rational_latex(const Rational& r) {
				if (r.den() == 1) {
						append(r.num().get_str());
						return;
				}

				append("\\frac{");
				append(r.num().get_str());
				append("}{");
				append(r.den().get_str());
				append("}");
		}
};

} // namespace rref_core
