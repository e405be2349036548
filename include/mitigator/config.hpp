// ==============================================================================
// mitigator/config.hpp - Конфигурация запуска
// ==============================================================================
//
// Назначение:
// - Загрузка YAML/JSON конфигурации (yaml-cpp)
// - Каталоги журнала, отчётов и данных
// - Каталог правил: файл или встроенное описание `mitigation_rules`
// - Параметры движка
//
// Формат:
//   logging:
//     directory: logs
//     file_prefix: security_logs
//     to_file: true
//   directories:
//     outputs: outputs
//     data: data
//   catalog: rules/catalog.yml   # относительно файла конфигурации
//   mitigation_rules: {...}      # приоритетнее `catalog`
//   engine:
//     sort_before_diff: false
//
// Относительные пути:
// - `catalog` разрешается от каталога файла конфигурации
// - `logging.directory` и `directories.*` остаются как есть и разрешаются
//   от текущего рабочего каталога процесса
//
// ==============================================================================

#ifndef MITIGATOR_CONFIG_HPP
#define MITIGATOR_CONFIG_HPP

#include <mitigator/catalog.hpp>
#include <mitigator/engine.hpp>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mitigator::output {
class Writer;
}  // namespace mitigator::output

namespace mitigator::config {

// ----------------------------------------------------------------------------
// Параметры
// ----------------------------------------------------------------------------

struct LoggingConfig {
    std::filesystem::path directory = "logs";
    std::string file_prefix = "security_logs";
    bool to_file = true;
};

struct Config {
    LoggingConfig logging;
    std::filesystem::path output_dir = "outputs";
    std::filesystem::path data_dir = "data";

    /// Путь к каталогу правил (уже разрешённый относительно конфигурации)
    std::optional<std::filesystem::path> catalog_path;

    /// Загруженный каталог; nullopt = встроенный
    std::optional<catalog::Catalog> catalog;

    engine::EngineOptions engine;
};

// ----------------------------------------------------------------------------
// Результат загрузки
// ----------------------------------------------------------------------------

struct ConfigError {
    std::string message;
    std::string path;

    /// "failed to load configuration '<path>' - <message>"
    std::string format() const;
};

struct LoadResult {
    bool ok = false;
    Config config;
    ConfigError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Загрузить конфигурацию из файла
LoadResult load(const std::filesystem::path& path);

/// Разобрать конфигурацию из документа в памяти
/// @param base_dir Каталог для разрешения относительного пути `catalog`
LoadResult parse(std::string_view text, const std::filesystem::path& base_dir = {},
                 const std::string& source = {});

/// Каталоги, которые должны существовать перед запуском
std::vector<std::filesystem::path> required_directories(const Config& config);

/// Создать недостающие каталоги, каждый отмечается в журнале
/// @throw std::filesystem::filesystem_error
void ensure_directories(const Config& config, output::Writer& writer);

/// <directory>/<file_prefix>_YYYYMMDD.log (дата в локальном времени)
std::filesystem::path log_file_path(const LoggingConfig& logging, std::time_t now);

/// Подготовить журнал и каталоги запуска.
/// Каталог журнала создаётся и файл журнала открывается до ensure_directories,
/// поэтому сообщения о каталогах попадают в журнал.
/// @return Путь открытого журнала; nullopt если запись в файл выключена или не удалась
/// @throw std::filesystem::filesystem_error
std::optional<std::filesystem::path> start_logging(const Config& config, output::Writer& writer,
                                                   std::time_t now);

}  // namespace mitigator::config

#endif  // MITIGATOR_CONFIG_HPP
