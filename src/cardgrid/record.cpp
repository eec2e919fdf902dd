#include <cardgrid/record.h>
#include <ytrace/ytrace.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace cardgrid {

namespace {

// Scalar cell text; null and absent cells read as empty
Result<std::string> cellText(const YAML::Node& cell, size_t row, const std::string& column) {
    if (!cell || cell.IsNull()) {
        return Ok(std::string());
    }
    if (!cell.IsScalar()) {
        return Err<std::string>("row " + std::to_string(row) + ": column '" + column +
                                "' must be a scalar", ErrorCode::Parse);
    }
    return Ok(cell.Scalar());
}

std::optional<std::string> nonEmpty(std::string value) {
    if (value.empty()) return std::nullopt;
    return value;
}

} // namespace

Result<std::vector<Record>> parseRecords(const std::string& yaml, const InputColumns& columns) {
    YAML::Node doc;
    try {
        doc = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        return Err<std::vector<Record>>(std::string("malformed record document: ") + e.what(),
                                        ErrorCode::Parse);
    }

    std::vector<Record> records;
    if (!doc || doc.IsNull()) {
        return Ok(std::move(records));
    }
    if (!doc.IsSequence()) {
        return Err<std::vector<Record>>("record document must be a sequence of rows",
                                        ErrorCode::Parse);
    }

    records.reserve(doc.size());
    for (size_t i = 0; i < doc.size(); i++) {
        const YAML::Node row = doc[i];
        if (!row.IsMap()) {
            return Err<std::vector<Record>>("row " + std::to_string(i) + " must be a map",
                                            ErrorCode::Parse);
        }

        Record record;
        record.rowIndex = i;
        for (const auto& cell : row) {
            if (!cell.first.IsScalar()) {
                return Err<std::vector<Record>>("row " + std::to_string(i) +
                                                ": column names must be scalars", ErrorCode::Parse);
            }
            const std::string column = cell.first.Scalar();
            auto text = cellText(cell.second, i, column);
            if (!text) {
                return Err<std::vector<Record>>("failed to read records", text);
            }
            if (column == columns.section) {
                record.sectionKey = nonEmpty(*text);
            } else if (column == columns.title) {
                record.title = *text;
            } else if (column == columns.subtitle) {
                record.subtitle = *text;
            } else if (column == columns.image) {
                record.imagePath = nonEmpty(*text);
            } else {
                record.fields[column] = *text;
            }
        }
        records.push_back(std::move(record));
    }

    ydebug("parseRecords: {} rows", records.size());
    return Ok(std::move(records));
}

Result<std::vector<Record>> loadRecords(const std::string& path, const InputColumns& columns) {
    std::ifstream file(path);
    if (!file) {
        return Err<std::vector<Record>>("cannot open record file " + path, ErrorCode::Io);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto records = parseRecords(buffer.str(), columns);
    if (!records) {
        return Err<std::vector<Record>>("failed to load " + path, records);
    }
    yinfo("loadRecords: {} records from {}", records->size(), path);
    return records;
}

} // namespace cardgrid
