#include "rref_shell/input.hpp"

#include "rref_shell/config.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace rref_shell {
namespace {
bool is_separator(char ch) noexcept {
		return ch == ',' || std::isspace(static_cast<unsigned char>(ch)) != 0;
}
} // namespace

rref_core::CellRow split_cells(std::string_view line) {
		rref_core::CellRow cells;
		std::size_t i = 0;
		while (i < line.size()) {
				while (i < line.size() && is_separator(line[i]))
						i++;
				const std::size_t start = i;
				while (i < line.size() && !is_separator(line[i]))
						i++;
				if (i > start)
						cells.emplace_back(line.substr(start, i - start));
		}
		return cells;
}

rref_core::Error read_cells(std::istream& in, rref_core::CellMatrix* out) {
		if (!out)
				return {rref_core::ErrorCode::Internal};

		rref_core::CellMatrix cells;
		std::size_t widest = 0;
		std::string line;
		while (std::getline(in, line)) {
				rref_core::CellRow row = split_cells(line);
				if (row.empty())
						continue;

				widest = std::max(widest, row.size());
				cells.push_back(std::move(row));
				if (cells.size() > kMaxRows)
						return rref_core::err_invalid_dim({cells.size(), widest});
		}
		if (in.bad())
				return {rref_core::ErrorCode::Internal};
		if (widest > kMaxCols)
				return rref_core::err_invalid_dim({cells.size(), widest});

		*out = std::move(cells);
		return {};
}

} // namespace rref_shell
