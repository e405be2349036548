// ==============================================================================
// datetime.cpp - Разбор временных меток
// ==============================================================================

#include "mitigator/datetime.hpp"

#include <cstdio>

namespace mitigator {

namespace {

bool parse_digits(std::string_view s, int& out) {
    if (s.empty())
        return false;
    out = 0;
    for (char c : s) {
        if (c < '0' || c > '9')
            return false;
        out = out * 10 + (c - '0');
    }
    return true;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

/// Разобрать суффикс смещения: "Z", "+HH:MM", "-HH:MM", "+HHMM", "-HHMM"
/// @return false если суффикс некорректен
bool parse_offset(std::string_view s, std::optional<int>& out) {
    if (s.empty()) {
        return true;
    }
    if (s == "Z" || s == "z") {
        out = 0;
        return true;
    }
    if (s[0] != '+' && s[0] != '-') {
        return false;
    }
    const int sign = (s[0] == '-') ? -1 : 1;
    s.remove_prefix(1);

    int hours = 0;
    int minutes = 0;
    if (s.size() == 5 && s[2] == ':') {
        if (!parse_digits(s.substr(0, 2), hours) || !parse_digits(s.substr(3, 2), minutes))
            return false;
    } else if (s.size() == 4) {
        if (!parse_digits(s.substr(0, 2), hours) || !parse_digits(s.substr(2, 2), minutes))
            return false;
    } else if (s.size() == 2) {
        if (!parse_digits(s, hours))
            return false;
    } else {
        return false;
    }
    if (hours > 23 || minutes > 59) {
        return false;
    }
    out = sign * (hours * 60 + minutes);
    return true;
}

}  // anonymous namespace

int days_in_month(int year, int month) {
    static constexpr int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

std::optional<DateTime> DateTime::parse(std::string_view str) {
    DateTime dt;

    // Минимальная длина: YYYY-MM-DD = 10 символов
    if (str.size() < 10) {
        return std::nullopt;
    }

    // YYYY-MM-DD
    if (!parse_digits(str.substr(0, 4), dt.year) || str[4] != '-')
        return std::nullopt;
    if (!parse_digits(str.substr(5, 2), dt.month) || str[7] != '-')
        return std::nullopt;
    if (!parse_digits(str.substr(8, 2), dt.day))
        return std::nullopt;
    if (dt.month < 1 || dt.month > 12)
        return std::nullopt;
    if (dt.day < 1 || dt.day > days_in_month(dt.year, dt.month))
        return std::nullopt;

    if (str.size() == 10) {
        return dt;
    }

    // Разделитель даты и времени: 'T' или пробел
    if (str[10] != 'T' && str[10] != 't' && str[10] != ' ') {
        return std::nullopt;
    }

    // HH:MM
    if (str.size() < 16)
        return std::nullopt;
    if (!parse_digits(str.substr(11, 2), dt.hour) || dt.hour > 23 || str[13] != ':')
        return std::nullopt;
    if (!parse_digits(str.substr(14, 2), dt.minute) || dt.minute > 59)
        return std::nullopt;

    std::size_t pos = 16;

    // :SS
    if (pos < str.size() && str[pos] == ':') {
        if (str.size() < 19)
            return std::nullopt;
        if (!parse_digits(str.substr(17, 2), dt.second) || dt.second > 59)
            return std::nullopt;
        pos = 19;

        // Дробная часть секунд
        if (pos < str.size() && str[pos] == '.') {
            ++pos;
            std::size_t frac_start = pos;
            while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9') {
                ++pos;
            }
            if (pos == frac_start) {
                return std::nullopt;
            }
            // Нормализуем к микросекундам (6 цифр)
            int frac_val = 0;
            std::size_t digits = 0;
            for (std::size_t i = frac_start; i < pos && digits < 6; ++i, ++digits) {
                frac_val = frac_val * 10 + (str[i] - '0');
            }
            for (; digits < 6; ++digits) {
                frac_val *= 10;
            }
            dt.microsecond = frac_val;
        }
    }

    if (!parse_offset(str.substr(pos), dt.utc_offset_minutes)) {
        return std::nullopt;
    }

    return dt;
}

std::int64_t DateTime::days_since_epoch() const {
    // Алгоритм days_from_civil (пролептический григорианский календарь)
    const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t mp = (month + 9) % 12;
    const std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

double DateTime::to_epoch_seconds() const {
    std::int64_t seconds = days_since_epoch() * 86400 + static_cast<std::int64_t>(hour) * 3600 +
                           static_cast<std::int64_t>(minute) * 60 + second;
    if (utc_offset_minutes.has_value()) {
        seconds -= static_cast<std::int64_t>(*utc_offset_minutes) * 60;
    }
    return static_cast<double>(seconds) + static_cast<double>(microsecond) / 1e6;
}

std::string DateTime::to_string() const {
    char buf[64];
    int n = 0;
    if (microsecond > 0) {
        n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06d", year, month, day,
                          hour, minute, second, microsecond);
    } else {
        n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d", year, month, day,
                          hour, minute, second);
    }
    std::string result(buf, n > 0 ? static_cast<std::size_t>(n) : 0);

    if (utc_offset_minutes.has_value()) {
        if (*utc_offset_minutes == 0) {
            result += 'Z';
        } else {
            int offset = *utc_offset_minutes;
            char sign = offset < 0 ? '-' : '+';
            if (offset < 0)
                offset = -offset;
            std::snprintf(buf, sizeof(buf), "%c%02d:%02d", sign, offset / 60, offset % 60);
            result += buf;
        }
    }
    return result;
}

bool DateTime::operator==(const DateTime& other) const {
    return year == other.year && month == other.month && day == other.day && hour == other.hour &&
           minute == other.minute && second == other.second &&
           microsecond == other.microsecond && utc_offset_minutes == other.utc_offset_minutes;
}

}  // namespace mitigator
