// ==============================================================================
// mitigator/output.hpp - Пользовательский вывод и журнал
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr и в файл журнала
// - Сообщения с префиксами [+] [!] [x] [*] [~]
// - JSON вывод (RapidJSON)
// - Таблицы с рамками Unicode
// - Вывод полезной нагрузки в файл (--output)
//
// ==============================================================================

#ifndef MITIGATOR_OUTPUT_HPP
#define MITIGATOR_OUTPUT_HPP

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace mitigator::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// Формат вывода
// ----------------------------------------------------------------------------

enum class Format {
    Std,   // Таблицы/текст
    Csv,   // CSV
    Json,  // JSON документ
    Jsonl  // JSON Lines (одна рекомендация на строку)
};

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Уровни журнала
// ----------------------------------------------------------------------------

enum class Level { Trace, Debug, Info, Warning, Error };

/// "DEBUG", "INFO", "WARNING", "ERROR" (trace пишется как DEBUG)
const char* level_name(Level level);

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;           // -q: подавить [+] и [!] в консоли
    int verbose = 0;              // -v: уровень подробности (0..2+)
    bool no_banner = false;       // --no-banner: скрыть ASCII-баннер
    Format format = Format::Std;  // Формат вывода

    // Путь для полезной нагрузки (--output)
    std::optional<std::filesystem::path> output_path;

    // Файл журнала (дописывается); quiet на него не влияет
    std::optional<std::filesystem::path> log_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Записать JSON значение (компактно)
    void write_json(const rapidjson::Value& value);

    /// Записать JSON значение + newline (JSONL формат)
    void write_json_line(const rapidjson::Value& value);

    /// Записать pretty JSON (с отступами)
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Открыть файл для вывода (при output_path задан)
    bool open_output_file();
    void close_output_file();
    bool has_output_file() const { return output_file_ != nullptr; }

    /// Открыть файл журнала на дозапись (при log_path задан)
    bool open_log_file();

    /// Задать log_path и открыть журнал (каталог журнала создаётся позже Writer)
    bool open_log_file(const std::filesystem::path& path);
    void close_log_file();
    bool has_log_file() const { return log_file_ != nullptr; }

private:
    void write_impl(Stream s, std::string_view bytes);
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);

    /// Дописать строку в файл журнала
    void log(Level level, std::string_view message);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;  // --output
    FILE* log_file_ = nullptr;     // журнал
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    void set_headers(const std::vector<std::string>& headers);
    void add_row(const std::vector<std::string>& cells);

    /// Минимальная ширина столбца
    void set_column_width(size_t col, size_t width);

    /// Вывести таблицу в stdout через Writer
    void print(Writer& w);

    /// Таблица строкой; ячейки с '\n' занимают несколько строк
    std::string to_string() const;

    size_t row_count() const { return rows_.size(); }

private:
    std::string format_line(char left, char middle, char right,
                            const std::vector<size_t>& widths) const;
    std::string format_row(const std::vector<std::string>& cells,
                           const std::vector<size_t>& widths) const;
    std::vector<size_t> calculate_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<size_t> min_widths_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_info(std::string_view message);
std::string format_error(std::string_view message);
std::string format_warning(std::string_view message);
std::string format_debug(std::string_view message);

/// Строка журнала: "YYYY-MM-DD HH:MM:SS,mmm - LEVEL - message\n" (локальное время)
std::string format_log_line(std::chrono::system_clock::time_point when, Level level,
                            std::string_view message);

/// Нормализует пробелы (\n, \r, \t и повторы -> один пробел)
/// и переносит по словам на строки не длиннее width (0 = без переноса)
std::string wrap_field(std::string_view field, size_t width);

/// Ширина строки UTF-8 в кодовых точках
size_t display_width(std::string_view text);

std::string ansi_color_code(Color color);
std::string ansi_reset_code();

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace mitigator::output

#endif  // MITIGATOR_OUTPUT_HPP
