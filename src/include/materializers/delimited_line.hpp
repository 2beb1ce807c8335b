#pragma once

#include <string>
#include <vector>

namespace dumper {

//===--------------------------------------------------------------------===//
// Delimited line codec
//
// One record per line, RFC 4180 quoting: a cell containing the delimiter, a
// double quote, CR or LF is wrapped in double quotes with inner quotes
// doubled. The \N marker is written bare, so a literal "\N" text cannot be
// told apart from an absent value.
//===--------------------------------------------------------------------===//

//! Split one record. Throws MetastoreException(InvalidConfig) on an
//! unterminated quoted cell.
std::vector<std::string> SplitDelimitedLine(const std::string &line, char delimiter = ',');

//! Join cells into one record, without a line terminator.
std::string JoinDelimitedLine(const std::vector<std::string> &cells, char delimiter = ',');

//! True while `partial` ends inside an open quoted cell, i.e. a physical line
//! break belongs to the cell and the next physical line must be appended.
//! Follows the same quoting rules as SplitDelimitedLine, so a quote in the
//! middle of an unquoted cell never opens one.
bool HasOpenQuote(const std::string &partial, char delimiter = ',');

} // namespace dumper
