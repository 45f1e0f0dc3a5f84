#include "labelsheet/table_io.h"
#include "labelsheet/error.h"
#include "detail/string_utils.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace LabelSheet {
namespace {

using json = nlohmann::ordered_json;

std::string ExtensionOf(const std::string& filename) {
    return detail::ToLowerAscii(std::filesystem::path(filename).extension().string());
}

bool IsBlankRecord(const std::vector<std::string>& record) {
    for (const std::string& field : record) {
        if (!field.empty()) { return false; }
    }
    return true;
}

/// Splits CSV text into records of fields, honoring quoted fields.
std::vector<std::vector<std::string>> SplitCsvRecords(std::string_view text) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;

    size_t i = 0;
    if (text.substr(0, 3) == "\xEF\xBB\xBF") { i = 3; }

    for (; i < text.size(); ++i) {
        const char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }
        switch (c) {
        case '"':
            in_quotes = true;
            break;
        case ',':
            record.push_back(std::move(field));
            field.clear();
            break;
        case '\r':
            // CRLF ends the record at the LF; a lone CR ends it here.
            if (i + 1 < text.size() && text[i + 1] == '\n') { break; }
            [[fallthrough]];
        case '\n':
            record.push_back(std::move(field));
            field.clear();
            records.push_back(std::move(record));
            record.clear();
            break;
        default:
            field.push_back(c);
        }
    }
    if (in_quotes) { throw FormatError("CSV: unterminated quoted field"); }
    if (!field.empty() || !record.empty()) {
        record.push_back(std::move(field));
        records.push_back(std::move(record));
    }
    return records;
}

std::string JsonCellToString(const json& value, const std::string& key) {
    if (value.is_null()) { return ""; }
    if (value.is_string()) { return value.get<std::string>(); }
    if (value.is_boolean()) { return value.get<bool>() ? "true" : "false"; }
    if (value.is_number_integer()) { return value.dump(); }
    if (value.is_number_float()) {
        const double d = value.get<double>();
        if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) < 1e15) {
            return std::to_string(static_cast<int64_t>(d));
        }
        return value.dump();
    }
    throw FormatError("JSON: value of '" + key + "' must be a string, number or null");
}

} // namespace

bool IsSupportedInputFile(const std::string& filename) {
    const std::string ext = ExtensionOf(filename);
    return ext == ".csv" || ext == ".json";
}

OrderTable ParseOrderTableCsv(std::string_view text) {
    std::vector<std::vector<std::string>> records = SplitCsvRecords(text);

    OrderTable table;
    size_t r = 0;
    while (r < records.size() && IsBlankRecord(records[r])) { ++r; }
    if (r == records.size()) { throw FormatError("CSV: missing header row"); }
    table.columns = std::move(records[r]);
    ++r;

    const size_t width = table.columns.size();
    for (; r < records.size(); ++r) {
        std::vector<std::string>& rec = records[r];
        if (IsBlankRecord(rec)) { continue; }
        rec.resize(width);
        table.rows.push_back(std::move(rec));
    }
    spdlog::debug("ParseOrderTableCsv: {} column(s), {} row(s)", table.columns.size(),
                  table.rows.size());
    return table;
}

OrderTable ParseOrderTableJson(std::string_view text) {
    json doc;
    try {
        doc = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        throw FormatError(std::string("JSON: ") + e.what());
    }
    if (!doc.is_array()) { throw FormatError("JSON: order file must be an array of objects"); }

    OrderTable table;
    std::unordered_map<std::string, size_t> index;
    for (const json& item : doc) {
        if (!item.is_object()) { throw FormatError("JSON: every order must be an object"); }
        for (auto it = item.begin(); it != item.end(); ++it) {
            if (index.emplace(it.key(), table.columns.size()).second) {
                table.columns.push_back(it.key());
            }
        }
    }

    table.rows.reserve(doc.size());
    for (const json& item : doc) {
        std::vector<std::string> row(table.columns.size());
        for (auto it = item.begin(); it != item.end(); ++it) {
            row[index.at(it.key())] = JsonCellToString(it.value(), it.key());
        }
        table.rows.push_back(std::move(row));
    }
    spdlog::debug("ParseOrderTableJson: {} column(s), {} row(s)", table.columns.size(),
                  table.rows.size());
    return table;
}

OrderTable ParseOrderTable(const std::string& filename, std::string_view content) {
    const std::string ext = ExtensionOf(filename);
    if (ext == ".csv") { return ParseOrderTableCsv(content); }
    if (ext == ".json") { return ParseOrderTableJson(content); }
    throw InputError("Unsupported order file type: " + filename);
}

OrderTable ReadOrderTable(const std::string& path) {
    if (!IsSupportedInputFile(path)) { throw InputError("Unsupported order file type: " + path); }
    std::ifstream in(path, std::ios::binary);
    if (!in) { throw IOError("Failed to open order file: " + path); }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) { throw IOError("Failed to read order file: " + path); }
    spdlog::info("Reading orders from {}", path);
    return ParseOrderTable(path, ss.str());
}

} // namespace LabelSheet
