// ==============================================================================
// mitigator/catalog.hpp - Каталог правил смягчения
// ==============================================================================
//
// Назначение:
// - Закрытое перечисление типов паттернов (PatternType)
// - RuleEntry: описание, упорядоченный список действий, критичность
// - Catalog: неизменяемое отображение PatternType -> RuleEntry
// - Загрузка внешнего каталога (YAML/JSON через yaml-cpp) и lint
//
// Каталог фиксируется при создании движка и далее только читается.
//
// ==============================================================================

#ifndef MITIGATOR_CATALOG_HPP
#define MITIGATOR_CATALOG_HPP

#include <array>
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace YAML {
class Node;
}  // namespace YAML

namespace mitigator::catalog {

// ============================================================================
// Enums
// ============================================================================

/// Тип обнаруженного паттерна (ключ каталога)
enum class PatternType { TrafficSpike, ProtocolAnomaly, PatternAnomaly, DataExfiltration };

/// Все типы в порядке каталога
constexpr std::array<PatternType, 4> ALL_PATTERN_TYPES = {
    PatternType::TrafficSpike, PatternType::ProtocolAnomaly, PatternType::PatternAnomaly,
    PatternType::DataExfiltration};

/// Уровень критичности
enum class Severity { Low, Medium, High };

// ============================================================================
// RuleEntry
// ============================================================================

/// Запись каталога
struct RuleEntry {
    PatternType type = PatternType::TrafficSpike;
    std::string description;
    std::vector<std::string> recommendations;  // упорядоченный список действий
    Severity severity = Severity::Low;

    bool operator==(const RuleEntry& other) const;
    bool operator!=(const RuleEntry& other) const { return !(*this == other); }
};

// ============================================================================
// Error handling
// ============================================================================

/// Некорректный внешний каталог. Фатальна при создании каталога.
class CatalogLoadError : public std::runtime_error {
public:
    CatalogLoadError(const std::string& message, std::string path = {});

    /// Источник каталога (пусто для документа в памяти)
    const std::string& path() const { return path_; }

    /// Сообщение без префикса и пути
    const std::string& message() const { return message_; }

private:
    std::string message_;
    std::string path_;
};

// ============================================================================
// Catalog
// ============================================================================

class Catalog {
public:
    /// Встроенный каталог. Никогда не завершается ошибкой.
    static Catalog defaults();

    /// Загрузить каталог из файла (.yml, .yaml, .json)
    /// @throw CatalogLoadError
    static Catalog load(const std::filesystem::path& path);

    /// Разобрать каталог из YAML/JSON документа в памяти
    /// @throw CatalogLoadError
    static Catalog parse(std::string_view text);

    /// Построить каталог из YAML узла
    ///
    /// Узел: отображение type_id -> {description, recommendations, severity},
    /// допускается обёртка в ключ `mitigation_rules`. Все четыре типа обязательны.
    ///
    /// @param source Путь источника для сообщений об ошибках
    /// @throw CatalogLoadError
    static Catalog from_yaml(const YAML::Node& root, const std::string& source = {});

    /// Запись для типа паттерна
    const RuleEntry& at(PatternType type) const&;

    /// У временного каталога запись возвращается копией
    RuleEntry at(PatternType type) const&&;

    /// Записи в порядке ALL_PATTERN_TYPES
    const std::vector<RuleEntry>& entries() const& { return entries_; }
    std::vector<RuleEntry> entries() const&& { return entries_; }

    std::size_t size() const { return entries_.size(); }

private:
    explicit Catalog(std::vector<RuleEntry> entries);

    std::vector<RuleEntry> entries_;  // индекс = static_cast<size_t>(PatternType)
};

// ============================================================================
// Lint
// ============================================================================

/// Результат проверки внешнего каталога
struct LintResult {
    bool ok = false;
    std::size_t entries = 0;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Проверить файл каталога без исключений
LintResult lint(const std::filesystem::path& path);

// ============================================================================
// String conversion
// ============================================================================

/// "TRAFFIC_SPIKE", "PROTOCOL_ANOMALY", "PATTERN_ANOMALY", "DATA_EXFILTRATION"
std::string to_string(PatternType type);

/// "LOW", "MEDIUM", "HIGH"
std::string to_string(Severity severity);

/// @throw std::invalid_argument если строка не распознана
PatternType parse_pattern_type(std::string_view s);

/// @throw std::invalid_argument если строка не распознана
Severity parse_severity(std::string_view s);

}  // namespace mitigator::catalog

#endif  // MITIGATOR_CATALOG_HPP
