// ==============================================================================
// output.cpp - Пользовательский вывод и журнал
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr и в файл журнала.
// Байты первичны, std::endl не используется.
//
// ==============================================================================

#include "mitigator/output.hpp"

#include "mitigator/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace mitigator::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing characters, UTF-8
constexpr const char* BOX_V = "\xe2\x94\x82";      // │ U+2502
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─ U+2500
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌ U+250C
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐ U+2510
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └ U+2514
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘ U+2518
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├ U+251C
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤ U+2524
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬ U+252C
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴ U+2534
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼ U+253C

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (true) {
        size_t pos = text.find('\n', start);
        if (pos == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
    std::wstring wmode(mode, mode + std::strlen(mode));
    return _wfopen(path.c_str(), wmode.c_str());
#else
    return std::fopen(platform::path_to_utf8(path).c_str(), mode);
#endif
}

}  // namespace

const char* level_name(Level level) {
    switch (level) {
    case Level::Trace:
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
    if (config_.log_path.has_value()) {
        open_log_file();
    }
}

Writer::~Writer() {
    close_output_file();
    close_log_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    write_impl(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

void Writer::write_impl(Stream s, std::string_view bytes) {
    FILE* f = nullptr;

    // Полезная нагрузка уходит в файл при --output
    if (s == Stream::Stdout && output_file_ != nullptr) {
        f = output_file_;
    } else {
        f = get_file(s);
    }

    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    log(Level::Info, message);
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    log(Level::Warning, message);
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются даже при --quiet
    log(Level::Error, message);
    write_prefixed("[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    log(Level::Debug, message);
    write_prefixed("[*] ", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    log(Level::Trace, message);
    write_prefixed("[~] ", Color::Magenta, message);
}

void Writer::log(Level level, std::string_view message) {
    if (log_file_ == nullptr) {
        return;
    }
    const std::string line = format_log_line(std::chrono::system_clock::now(), level, message);
    std::fwrite(line.data(), 1, line.size(), log_file_);
    std::fflush(log_file_);
}

void Writer::write_json(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    flush();
}

void Writer::write_json_line(const rapidjson::Value& value) {
    write_json(value);
    write(Stream::Stdout, "\n");
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
    if (log_file_ != nullptr) {
        std::fflush(log_file_);
    }
}

bool Writer::open_output_file() {
    if (!config_.output_path.has_value()) {
        return false;
    }
    close_output_file();
    output_file_ = open_file(config_.output_path.value(), "wb");
    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

bool Writer::open_log_file() {
    if (!config_.log_path.has_value()) {
        return false;
    }
    close_log_file();
    log_file_ = open_file(config_.log_path.value(), "ab");
    return log_file_ != nullptr;
}

bool Writer::open_log_file(const std::filesystem::path& path) {
    config_.log_path = path;
    return open_log_file();
}

void Writer::close_log_file() {
    if (log_file_ != nullptr) {
        std::fclose(log_file_);
        log_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

void Table::set_column_width(size_t col, size_t width) {
    if (col >= min_widths_.size()) {
        min_widths_.resize(col + 1, 0);
    }
    min_widths_[col] = width;
}

std::vector<size_t> Table::calculate_widths() const {
    size_t num_cols = std::max(headers_.size(), min_widths_.size());
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<size_t> widths(num_cols, 0);
    for (size_t i = 0; i < min_widths_.size(); ++i) {
        widths[i] = min_widths_[i];
    }

    auto widen = [&widths](const std::vector<std::string>& cells) {
        for (size_t i = 0; i < cells.size(); ++i) {
            for (auto line : split_lines(cells[i])) {
                widths[i] = std::max(widths[i], display_width(line));
            }
        }
    };

    widen(headers_);
    for (const auto& row : rows_) {
        widen(row);
    }
    return widths;
}

std::string Table::format_line(char left, char middle, char right,
                               const std::vector<size_t>& widths) const {
    // 'T' верх, 'M' разделитель, 'B' низ
    auto pick = [](char pos, const char* top, const char* mid, const char* bottom) {
        return pos == 'T' ? top : (pos == 'M' ? mid : bottom);
    };

    std::string line = pick(left, BOX_TL, BOX_LT, BOX_BL);
    for (size_t i = 0; i < widths.size(); ++i) {
        for (size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        if (i + 1 < widths.size()) {
            line += pick(middle, BOX_TT, BOX_CROSS, BOX_BT);
        }
    }
    line += pick(right, BOX_TR, BOX_RT, BOX_BR);
    return line;
}

std::string Table::format_row(const std::vector<std::string>& cells,
                              const std::vector<size_t>& widths) const {
    std::vector<std::vector<std::string_view>> cell_lines(widths.size());
    size_t height = 1;
    for (size_t i = 0; i < widths.size(); ++i) {
        if (i < cells.size()) {
            cell_lines[i] = split_lines(cells[i]);
        }
        height = std::max(height, cell_lines[i].size());
    }

    std::string result;
    for (size_t h = 0; h < height; ++h) {
        if (h > 0) {
            result += '\n';
        }
        result += BOX_V;
        for (size_t i = 0; i < widths.size(); ++i) {
            std::string_view text = h < cell_lines[i].size() ? cell_lines[i][h] : "";
            result += ' ';
            result.append(text);
            const size_t width = display_width(text);
            if (width < widths[i]) {
                result.append(widths[i] - width, ' ');
            }
            result += ' ';
            result += BOX_V;
        }
    }
    return result;
}

std::string Table::to_string() const {
    const auto widths = calculate_widths();
    std::string result;

    result += format_line('T', 'T', 'T', widths);
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(headers_, widths);
        result += '\n';
        result += format_line('M', 'M', 'M', widths);
        result += '\n';
    }

    for (size_t r = 0; r < rows_.size(); ++r) {
        if (r > 0) {
            result += format_line('M', 'M', 'M', widths);
            result += '\n';
        }
        result += format_row(rows_[r], widths);
        result += '\n';
    }

    result += format_line('B', 'B', 'B', widths);
    result += '\n';
    return result;
}

void Table::print(Writer& w) {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_info(std::string_view message) {
    std::string result = "[+] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_error(std::string_view message) {
    std::string result = "[x] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_warning(std::string_view message) {
    std::string result = "[!] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_debug(std::string_view message) {
    std::string result = "[*] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_log_line(std::chrono::system_clock::time_point when, Level level,
                            std::string_view message) {
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() %
        1000;
    const std::tm tm = platform::local_time(std::chrono::system_clock::to_time_t(when));

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);
    char ms[8];
    std::snprintf(ms, sizeof(ms), ",%03d", static_cast<int>(millis < 0 ? millis + 1000 : millis));

    std::string line = stamp;
    line += ms;
    line += " - ";
    line += level_name(level);
    line += " - ";
    line.append(message);
    line += '\n';
    return line;
}

std::string wrap_field(std::string_view field, size_t width) {
    // Нормализация пробельных символов
    std::vector<std::string> words;
    std::string current;
    for (char c : field) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current += c;
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }

    std::string result;
    size_t line_width = 0;
    for (const auto& word : words) {
        const size_t w = display_width(word);
        if (line_width == 0) {
            result += word;
            line_width = w;
        } else if (width > 0 && line_width + 1 + w > width) {
            result += '\n';
            result += word;
            line_width = w;
        } else {
            result += ' ';
            result += word;
            line_width += 1 + w;
        }
    }
    return result;
}

size_t display_width(std::string_view text) {
    // Считаем только ведущие байты UTF-8 (не 10xxxxxx)
    size_t width = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace mitigator::output
