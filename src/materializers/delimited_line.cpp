#include "materializers/delimited_line.hpp"
#include "metastore_errors.hpp"

namespace dumper {

namespace {

//! RFC 4180 cell scanner. A quote opens a quoted cell only as the first
//! character of the cell; inside it "" is a literal quote. Anywhere else a
//! quote is ordinary text. Returns true when `line` ends inside a quoted cell,
//! in which case the last cell is not appended.
bool ScanCells(const std::string &line, size_t end, char delimiter, std::vector<std::string> &cells) {
	std::string current;
	bool in_quotes = false;
	bool quoted_cell = false;
	for (size_t i = 0; i < end; i++) {
		char c = line[i];
		if (in_quotes) {
			if (c != '"') {
				current.push_back(c);
			} else if (i + 1 < end && line[i + 1] == '"') {
				current.push_back('"');
				i++;
			} else {
				in_quotes = false;
			}
			continue;
		}
		if (c == '"' && current.empty() && !quoted_cell) {
			in_quotes = true;
			quoted_cell = true;
		} else if (c == delimiter) {
			cells.push_back(std::move(current));
			current.clear();
			quoted_cell = false;
		} else {
			current.push_back(c);
		}
	}
	if (in_quotes) {
		return true;
	}
	cells.push_back(std::move(current));
	return false;
}

} // namespace


std::vector<std::string> SplitDelimitedLine(const std::string &line, char delimiter) {
	size_t end = line.size();
	if (end > 0 && line[end - 1] == '\n') {
		end--;
	}
	if (end > 0 && line[end - 1] == '\r') {
		end--;
	}

	std::vector<std::string> cells;
	if (ScanCells(line, end, delimiter, cells)) {
		throw MetastoreException(MetastoreErrorCode::InvalidConfig,
		                         MetastoreErrorTag {"delimited", "SplitDelimitedLine", false},
		                         "Unterminated quoted cell in delimited line");
	}
	return cells;
}

std::string JoinDelimitedLine(const std::vector<std::string> &cells, char delimiter) {
	std::string out;
	for (size_t i = 0; i < cells.size(); i++) {
		if (i > 0) {
			out.push_back(delimiter);
		}
		const auto &cell = cells[i];
		bool needs_quotes = cell.find(delimiter) != std::string::npos || cell.find('"') != std::string::npos ||
		                    cell.find('\n') != std::string::npos || cell.find('\r') != std::string::npos;
		if (!needs_quotes) {
			out += cell;
			continue;
		}
		out.push_back('"');
		for (char c : cell) {
			if (c == '"') {
				out.push_back('"');
			}
			out.push_back(c);
		}
		out.push_back('"');
	}
	return out;
}

bool HasOpenQuote(const std::string &partial, char delimiter) {
	std::vector<std::string> cells;
	return ScanCells(partial, partial.size(), delimiter, cells);
}

} // namespace dumper
