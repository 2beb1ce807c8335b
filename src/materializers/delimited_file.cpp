#include "materializers/delimited_file.hpp"
#include "materializers/delimited_line.hpp"
#include "metastore_errors.hpp"

namespace dumper {

namespace {

void ThrowIo(const char *operation, const std::string &path, const std::string &message) {
	MetastoreErrorTag tag {"delimited", operation, false};
	tag.entity = path;
	throw MetastoreException(MetastoreErrorCode::TransportFailure, tag, message + ": " + path);
}

} // namespace

DelimitedFileReader::DelimitedFileReader(const std::string &path, char delimiter)
    : path_(path), delimiter_(delimiter), in_(path, std::ios::binary) {
	if (!in_.is_open()) {
		ThrowIo("DelimitedFileReader", path_, "Unable to open delimited input");
	}
}

bool DelimitedFileReader::Next(std::vector<std::string> &cells) {
	std::string line;
	while (std::getline(in_, line)) {
		line_number_++;
		if (line.empty() || line == "\r") {
			continue;
		}
		record_line_ = line_number_;
		std::string record = line;
		// A line break inside a quoted cell belongs to the cell
		while (HasOpenQuote(record, delimiter_)) {
			if (!std::getline(in_, line)) {
				break;
			}
			line_number_++;
			record += "\n";
			record += line;
		}
		try {
			cells = SplitDelimitedLine(record, delimiter_);
		} catch (const MetastoreException &e) {
			MetastoreErrorTag tag = e.GetErrorTag();
			tag.entity = path_;
			tag.row_index = record_line_;
			throw MetastoreException(e.GetErrorCode(), tag,
			                         std::string(e.what()) + " at " + path_ + ":" + std::to_string(record_line_));
		}
		return true;
	}
	if (in_.bad()) {
		ThrowIo("DelimitedFileReader", path_, "Read failure on delimited input");
	}
	return false;
}

DelimitedFileWriter::DelimitedFileWriter(const std::string &path, char delimiter)
    : path_(path), delimiter_(delimiter), out_(path, std::ios::binary | std::ios::trunc) {
	if (!out_.is_open()) {
		ThrowIo("DelimitedFileWriter", path_, "Unable to create delimited output");
	}
}

void DelimitedFileWriter::WriteCells(const std::vector<std::string> &cells) {
	out_ << JoinDelimitedLine(cells, delimiter_) << '\n';
	if (!out_) {
		ThrowIo("DelimitedFileWriter", path_, "Write failure on delimited output");
	}
	rows_written_++;
}

void DelimitedFileWriter::Close() {
	if (!out_.is_open()) {
		return;
	}
	out_.flush();
	bool ok = static_cast<bool>(out_);
	out_.close();
	if (!ok || out_.fail()) {
		ThrowIo("DelimitedFileWriter", path_, "Unable to finish delimited output");
	}
}

} // namespace dumper
