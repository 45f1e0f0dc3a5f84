/// \file table_io.h
/// \brief Readers that turn CSV and JSON order files into an OrderTable.

#pragma once

#include "order.h"

#include <string>
#include <string_view>

namespace LabelSheet {

/// True for .csv and .json file names (case-insensitive).
bool IsSupportedInputFile(const std::string& filename);

/// Parses RFC 4180 CSV text. The first record is the header row; blank lines
/// are skipped, short records are padded and long records truncated to the
/// header width.
/// \throws FormatError on an unterminated quoted field or a missing header.
OrderTable ParseOrderTableCsv(std::string_view text);

/// Parses a JSON array of objects. Keys become columns in first-seen order.
/// \throws FormatError when the document is not an array of flat objects.
OrderTable ParseOrderTableJson(std::string_view text);

/// Parses \p content according to the extension of \p filename.
/// \throws InputError for unsupported extensions.
OrderTable ParseOrderTable(const std::string& filename, std::string_view content);

/// Reads and parses the file at \p path.
/// \throws IOError when the file cannot be read.
OrderTable ReadOrderTable(const std::string& path);

} // namespace LabelSheet
