#pragma once

#include <cstddef>

namespace rref_core {
// smallest accepted augmented matrix: one equation, one variable
constexpr std::size_t kMinRows = 1;
constexpr std::size_t kMinCols = 2;
} // namespace rref_core

// LaTeX rendering of captions and matrices, see latex.hpp
#ifndef RREF_CORE_ENABLE_LATEX
#define RREF_CORE_ENABLE_LATEX 1
#endif
