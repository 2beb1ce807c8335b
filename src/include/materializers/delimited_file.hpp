#pragma once

#include "main/metastore_types.hpp"

#include <fstream>
#include <string>
#include <vector>

namespace dumper {

//===--------------------------------------------------------------------===//
// DelimitedFileReader — records of a delimited file, one per logical line
//
// A quoted cell may span physical lines. Blank lines are skipped. Records
// are numbered by the physical line they start on (1-based).
//===--------------------------------------------------------------------===//
class DelimitedFileReader {
public:
	//! Throws MetastoreException(TransportFailure) if the file cannot be opened
	DelimitedFileReader(const std::string &path, char delimiter);

	//! Read the next record into `cells`. Returns false at end of file.
	bool Next(std::vector<std::string> &cells);
	//! Line number the last record started on
	idx_t RecordLine() const {
		return record_line_;
	}

private:
	std::string path_;
	char delimiter_;
	std::ifstream in_;
	idx_t line_number_ = 0;
	idx_t record_line_ = 0;
};

//===--------------------------------------------------------------------===//
// DelimitedFileWriter — one record per line, \n terminated
//===--------------------------------------------------------------------===//
class DelimitedFileWriter {
public:
	//! Truncates `path`. Throws MetastoreException(TransportFailure) if it
	//! cannot be created.
	DelimitedFileWriter(const std::string &path, char delimiter);

	void WriteCells(const std::vector<std::string> &cells);

	template <class ROW>
	void Write(const ROW &row) {
		WriteCells(row.ToDelimitedCells());
	}

	//! Flush and close; throws TransportFailure if the stream went bad
	void Close();

	idx_t RowsWritten() const {
		return rows_written_;
	}
	const std::string &Path() const {
		return path_;
	}

private:
	std::string path_;
	char delimiter_;
	std::ofstream out_;
	idx_t rows_written_ = 0;
};

} // namespace dumper
