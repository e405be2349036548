// ==============================================================================
// mitigator/dataset.hpp - Загрузка наборов записей трафика
// ==============================================================================
//
// Назначение:
// - Определение формата по расширению (.csv, .json, .jsonl)
// - Разбор CSV (заголовок + строки, кавычки по RFC 4180)
// - Разбор JSON (массив объектов) и JSONL (объект на строку) через RapidJSON
//
// Поля записи:
//   timestamp          строка ISO 8601
//   bytes_transferred  число или числовая строка
//   protocol           строка
//   anomaly            метка классификатора (синоним: anomaly_label),
//                      сравнивается без обрезки пробелов во всех форматах
//
// Значения, которые не удалось разобрать, сохраняются как отсутствующие;
// их проверяет движок, и только у аномальных записей.
//
// ==============================================================================

#ifndef MITIGATOR_DATASET_HPP
#define MITIGATOR_DATASET_HPP

#include <mitigator/record.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace mitigator::io {

// ----------------------------------------------------------------------------
// Формат входного файла
// ----------------------------------------------------------------------------

enum class DatasetFormat { Csv, Json, Jsonl, Unknown };

const char* dataset_format_to_string(DatasetFormat format);

/// Определить формат по расширению файла (без учёта регистра)
DatasetFormat dataset_format_from_path(const std::filesystem::path& path);

// ----------------------------------------------------------------------------
// Результат загрузки
// ----------------------------------------------------------------------------

struct DatasetError {
    std::string message;
    std::string path;

    /// "failed to load dataset '<path>' - <message>"
    std::string format() const;
};

struct DatasetResult {
    bool ok = false;
    Dataset dataset;
    DatasetError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Загрузить набор из файла, формат выбирается по расширению
DatasetResult load_dataset(const std::filesystem::path& path);

/// Разобрать CSV документ
DatasetResult parse_csv(std::string_view content, const std::string& source = {});

/// Разобрать JSON документ: массив объектов или один объект
DatasetResult parse_json(std::string_view content, const std::string& source = {});

/// Разобрать JSON Lines документ; пустые строки пропускаются
DatasetResult parse_jsonl(std::string_view content, const std::string& source = {});

/// Разобрать объём: конечное число из строки целиком, иначе nullopt
std::optional<double> parse_bytes(std::string_view text);

/// Разбить строку CSV на ячейки
/// @return nullopt при незакрытой кавычке
std::optional<std::vector<std::string>> split_csv_line(std::string_view line);

}  // namespace mitigator::io

#endif  // MITIGATOR_DATASET_HPP
