// ==============================================================================
// mitigator/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef MITIGATOR_CLI_HPP
#define MITIGATOR_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace mitigator::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// analyze - анализ набора записей и выдача рекомендаций
struct AnalyzeCommand {
    std::filesystem::path dataset;               // positional
    std::optional<std::filesystem::path> rules;   // -r, --rules
    std::optional<std::filesystem::path> config;  // -c, --config

    // Форматы вывода (взаимоисключающие)
    bool json = false;   // -j, --json
    bool jsonl = false;  // --jsonl
    bool csv = false;    // --csv

    std::optional<std::filesystem::path> output;  // -o, --output
    bool signals = false;                          // -s, --signals
    bool save = false;                             // --save
    bool sort_before_diff = false;                 // --sort-before-diff
};

/// lint - проверка внешнего каталога правил
struct LintCommand {
    std::filesystem::path path;
};

/// catalog - показать действующий каталог
struct CatalogCommand {
    std::optional<std::filesystem::path> rules;  // -r, --rules
    bool json = false;                           // -j, --json
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;  // опциональная подкоманда для справки
};

/// version - показать версию
struct VersionCommand {};

using Command =
    std::variant<AnalyzeCommand, LintCommand, CatalogCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (общий или для подкоманды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version: "mitigator <VERSION>\n"
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "1.0.0";

constexpr const char* ABOUT = "Recommend mitigations for anomalous network traffic";

}  // namespace mitigator::cli

#endif  // MITIGATOR_CLI_HPP
