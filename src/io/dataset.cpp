// ==============================================================================
// dataset.cpp - Загрузка наборов записей трафика
// ==============================================================================

#include "mitigator/dataset.hpp"

#include "mitigator/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <sstream>
#include <unordered_map>

namespace mitigator::io {

namespace {

// Имена столбцов / ключей
constexpr const char* FIELD_TIMESTAMP = "timestamp";
constexpr const char* FIELD_BYTES = "bytes_transferred";
constexpr const char* FIELD_PROTOCOL = "protocol";
constexpr const char* FIELD_LABEL = "anomaly";
constexpr const char* FIELD_LABEL_ALIAS = "anomaly_label";

std::string_view trim(std::string_view s) {
    const auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

DatasetResult make_error(std::string message, const std::string& source) {
    DatasetResult result;
    result.error = DatasetError{std::move(message), source};
    return result;
}

// ----------------------------------------------------------------------------
// JSON -> Record
// ----------------------------------------------------------------------------

Record record_from_json(const rapidjson::Value& obj) {
    Record record;

    auto it = obj.FindMember(FIELD_TIMESTAMP);
    if (it != obj.MemberEnd() && it->value.IsString()) {
        record.timestamp = std::string(it->value.GetString(), it->value.GetStringLength());
    }

    it = obj.FindMember(FIELD_BYTES);
    if (it != obj.MemberEnd()) {
        if (it->value.IsNumber()) {
            record.bytes_transferred = it->value.GetDouble();
        } else if (it->value.IsString()) {
            record.bytes_transferred = parse_bytes(
                std::string_view(it->value.GetString(), it->value.GetStringLength()));
        }
    }

    it = obj.FindMember(FIELD_PROTOCOL);
    if (it != obj.MemberEnd() && it->value.IsString()) {
        record.protocol = std::string(it->value.GetString(), it->value.GetStringLength());
    }

    it = obj.FindMember(FIELD_LABEL);
    if (it == obj.MemberEnd()) {
        it = obj.FindMember(FIELD_LABEL_ALIAS);
    }
    if (it != obj.MemberEnd() && it->value.IsString()) {
        record.label = parse_anomaly_label(
            std::string_view(it->value.GetString(), it->value.GetStringLength()));
    }

    return record;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// Формат
// ----------------------------------------------------------------------------

const char* dataset_format_to_string(DatasetFormat format) {
    switch (format) {
    case DatasetFormat::Csv:
        return "csv";
    case DatasetFormat::Json:
        return "json";
    case DatasetFormat::Jsonl:
        return "jsonl";
    case DatasetFormat::Unknown:
        return "unknown";
    }
    return "unknown";
}

DatasetFormat dataset_format_from_path(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".csv")
        return DatasetFormat::Csv;
    if (ext == ".json")
        return DatasetFormat::Json;
    if (ext == ".jsonl")
        return DatasetFormat::Jsonl;
    return DatasetFormat::Unknown;
}

std::string DatasetError::format() const {
    std::ostringstream oss;
    oss << "failed to load dataset";
    if (!path.empty()) {
        oss << " '" << path << "'";
    }
    oss << " - " << message;
    return oss.str();
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::optional<double> parse_bytes(std::string_view text) {
    const std::string value(trim(text));
    if (value.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const double parsed = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size() || errno == ERANGE || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

std::optional<std::vector<std::string>> split_csv_line(std::string_view line) {
    std::vector<std::string> cells;
    std::string cell;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                // "" внутри кавычек: экранированная кавычка
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cell += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                cell += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            cells.push_back(std::move(cell));
            cell.clear();
        } else if (c != '\r') {
            cell += c;
        }
    }

    if (in_quotes) {
        return std::nullopt;
    }
    cells.push_back(std::move(cell));
    return cells;
}

// ----------------------------------------------------------------------------
// CSV
// ----------------------------------------------------------------------------

DatasetResult parse_csv(std::string_view content, const std::string& source) {
    DatasetResult result;

    std::istringstream input{std::string(content)};
    std::string line;
    std::size_t line_number = 0;

    // Читает логическую строку: поле в кавычках может содержать перевод строки
    auto next_row = [&](std::vector<std::string>& row, std::size_t& row_line) -> int {
        std::string buffer;
        while (std::getline(input, line)) {
            ++line_number;
            if (buffer.empty()) {
                row_line = line_number;
                if (trim(line).empty()) {
                    continue;
                }
                buffer = line;
            } else {
                buffer += '\n';
                buffer += line;
            }
            if (auto cells = split_csv_line(buffer)) {
                row = std::move(*cells);
                return 1;
            }
        }
        // 0 = конец, -1 = незакрытая кавычка
        return buffer.empty() ? 0 : -1;
    };

    std::vector<std::string> header;
    std::size_t header_line = 0;
    int status = next_row(header, header_line);
    if (status == 0) {
        return make_error("dataset is empty, expected a header row", source);
    }
    if (status < 0) {
        return make_error("unterminated quoted field at line " + std::to_string(header_line),
                          source);
    }

    std::unordered_map<std::string, std::size_t> columns;
    for (std::size_t i = 0; i < header.size(); ++i) {
        columns.emplace(std::string(trim(header[i])), i);
    }

    auto column = [&](const char* name) -> std::optional<std::size_t> {
        auto it = columns.find(name);
        if (it == columns.end()) {
            return std::nullopt;
        }
        return it->second;
    };

    const auto col_timestamp = column(FIELD_TIMESTAMP);
    const auto col_bytes = column(FIELD_BYTES);
    const auto col_protocol = column(FIELD_PROTOCOL);
    auto col_label = column(FIELD_LABEL);
    if (!col_label) {
        col_label = column(FIELD_LABEL_ALIAS);
    }

    std::vector<std::string> row;
    std::size_t row_line = 0;
    while ((status = next_row(row, row_line)) > 0) {
        if (row.size() != header.size()) {
            return make_error("line " + std::to_string(row_line) + ": expected " +
                                  std::to_string(header.size()) + " fields, found " +
                                  std::to_string(row.size()),
                              source);
        }

        auto cell = [&](const std::optional<std::size_t>& col) -> std::optional<std::string> {
            if (!col) {
                return std::nullopt;
            }
            std::string_view value = trim(row[*col]);
            if (value.empty()) {
                return std::nullopt;
            }
            return std::string(value);
        };

        Record record;
        record.timestamp = cell(col_timestamp);
        if (auto bytes = cell(col_bytes)) {
            record.bytes_transferred = parse_bytes(*bytes);
        }
        record.protocol = cell(col_protocol);
        // Метка сравнивается как есть, без обрезки пробелов
        if (col_label) {
            record.label = parse_anomaly_label(row[*col_label]);
        }
        result.dataset.push_back(std::move(record));
    }

    if (status < 0) {
        return make_error("unterminated quoted field at line " + std::to_string(row_line),
                          source);
    }

    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

DatasetResult parse_json(std::string_view content, const std::string& source) {
    DatasetResult result;

    rapidjson::Document doc;
    doc.Parse(content.data(), content.size());
    if (doc.HasParseError()) {
        return make_error(std::string("JSON parse error: ") +
                              rapidjson::GetParseError_En(doc.GetParseError()) + " at offset " +
                              std::to_string(doc.GetErrorOffset()),
                          source);
    }

    if (doc.IsObject()) {
        result.dataset.push_back(record_from_json(doc));
    } else if (doc.IsArray()) {
        result.dataset.reserve(doc.Size());
        for (rapidjson::SizeType i = 0; i < doc.Size(); ++i) {
            if (!doc[i].IsObject()) {
                return make_error("record " + std::to_string(i) + " is not an object", source);
            }
            result.dataset.push_back(record_from_json(doc[i]));
        }
    } else {
        return make_error("expected an array of records", source);
    }

    result.ok = true;
    return result;
}

DatasetResult parse_jsonl(std::string_view content, const std::string& source) {
    DatasetResult result;

    std::istringstream input{std::string(content)};
    std::string line;
    std::size_t line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        if (trim(line).empty()) {
            continue;
        }

        rapidjson::Document doc;
        doc.Parse(line.c_str(), line.size());
        if (doc.HasParseError()) {
            return make_error("JSONL line " + std::to_string(line_number) + " parse error: " +
                                  rapidjson::GetParseError_En(doc.GetParseError()),
                              source);
        }
        if (!doc.IsObject()) {
            return make_error("JSONL line " + std::to_string(line_number) + " is not an object",
                              source);
        }
        result.dataset.push_back(record_from_json(doc));
    }

    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// Загрузка файла
// ----------------------------------------------------------------------------

DatasetResult load_dataset(const std::filesystem::path& path) {
    const std::string source = platform::path_to_utf8(path);

    const DatasetFormat format = dataset_format_from_path(path);
    if (format == DatasetFormat::Unknown) {
        return make_error("unsupported file extension, expected .csv, .json or .jsonl", source);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return make_error("could not open file", source);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    const std::string content = buffer.str();

    switch (format) {
    case DatasetFormat::Csv:
        return parse_csv(content, source);
    case DatasetFormat::Json:
        return parse_json(content, source);
    case DatasetFormat::Jsonl:
        return parse_jsonl(content, source);
    case DatasetFormat::Unknown:
        break;
    }
    return make_error("unsupported file extension", source);
}

}  // namespace mitigator::io
