#include "rref_shell/text.hpp"

#include "rref_shell/config.hpp"

namespace rref_shell {
namespace {

#if RREF_SHELL_LANG_FR
constexpr const char* kText[] = {
				"",
#define RREF_SHELL_TEXT_ENTRY(id, key, en, fr) fr,
#include "rref_shell/text_catalog.inc"
#undef RREF_SHELL_TEXT_ENTRY
};
#else
constexpr const char* kText[] = {
				"",
#define RREF_SHELL_TEXT_ENTRY(id, key, en, fr) en,
#include "rref_shell/text_catalog.inc"
#undef RREF_SHELL_TEXT_ENTRY
};
#endif

constexpr std::size_t kTextCount = static_cast<std::size_t>(TextId::Count);
static_assert((sizeof(kText) / sizeof(kText[0])) == kTextCount, "kText count mismatch");

} // namespace

const char* tr(TextId id) noexcept {
		const auto idx = static_cast<std::size_t>(id);
		if (idx >= kTextCount)
				return "";
		return kText[idx];
}

const char* error_message(rref_core::ErrorCode code) noexcept {
		using namespace text_literals;

		switch (code) {
		case rref_core::ErrorCode::Ok:
				return "";
		case rref_core::ErrorCode::FeatureDisabled:
				return "err.feature_disabled"_tx;
		case rref_core::ErrorCode::InvalidDimension:
				return "err.invalid_dim"_tx;
		case rref_core::ErrorCode::DimensionMismatch:
				return "err.dim_mismatch"_tx;
		case rref_core::ErrorCode::DivisionByZero:
				return "err.div_zero"_tx;
		case rref_core::ErrorCode::IndexOutOfRange:
				return "err.index"_tx;
		case rref_core::ErrorCode::StepOutOfRange:
				return "err.step"_tx;
		case rref_core::ErrorCode::Internal:
				return "err.internal"_tx;
		}
		return "err.internal"_tx;
}

} // namespace rref_shell
