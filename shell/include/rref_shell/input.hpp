#pragma once

#include <istream>
#include <string_view>

#include "rref_core/error.hpp"
#include "rref_core/solver.hpp"

namespace rref_shell {

// splits one line into cells at whitespace and commas, empty cells are dropped
rref_core::CellRow split_cells(std::string_view line);

// reads one matrix row per line until end of input. blank lines are skipped.
// more than kMaxRows rows or kMaxCols cells in a row -> InvalidDimension,
// a stream failure other than eof -> Internal. row length checks are left
// to the solver
rref_core::Error read_cells(std::istream& in, Out rref_core::CellMatrix* out);

} // namespace rref_shell
