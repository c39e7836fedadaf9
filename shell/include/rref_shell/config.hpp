#pragma once

#include <cstddef>

#include "rref_core/config.hpp"

// -----------------------------------------------------------------------------
// Feature flags
// -----------------------------------------------------------------------------
#ifndef RREF_SHELL_ENABLE_DEBUG
#define RREF_SHELL_ENABLE_DEBUG 0
#endif

#ifndef RREF_SHELL_LANG_FR
#define RREF_SHELL_LANG_FR 0
#endif

namespace rref_shell {
// input caps, the core itself has no upper bound
constexpr std::size_t kMinRows = rref_core::kMinRows;
constexpr std::size_t kMinCols = rref_core::kMinCols;
constexpr std::size_t kMaxRows = 10;
constexpr std::size_t kMaxCols = 10;
} // namespace rref_shell
