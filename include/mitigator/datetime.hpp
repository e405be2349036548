// ==============================================================================
// mitigator/datetime.hpp - Временные метки записей трафика
// ==============================================================================
//
// Назначение:
// - Разбор ISO 8601 временных меток записей
// - Абсолютное время (секунды от Unix epoch) для разностей между записями
// - Час суток для группировки по времени
//
// ==============================================================================

#ifndef MITIGATOR_DATETIME_HPP
#define MITIGATOR_DATETIME_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mitigator {

/// Дата и время с необязательным смещением от UTC
///
/// Поля хранят время "как записано" (wall clock). Смещение учитывается
/// только при переводе в абсолютное время.
struct DateTime {
    int year = 1970;
    int month = 1;        // 1-12
    int day = 1;          // 1-31
    int hour = 0;         // 0-23
    int minute = 0;       // 0-59
    int second = 0;       // 0-59
    int microsecond = 0;  // 0-999999

    /// Смещение от UTC в минутах (nullopt = наивное время, считается UTC)
    std::optional<int> utc_offset_minutes;

    /// Разобрать строку
    ///
    /// Поддерживаемые форматы:
    ///   YYYY-MM-DD
    ///   YYYY-MM-DD[T| ]HH:MM
    ///   YYYY-MM-DD[T| ]HH:MM:SS[.f...]
    /// с необязательным суффиксом Z, +HH:MM, -HH:MM, +HHMM или -HHMM.
    ///
    /// @return nullopt если строка не распознана или дата не существует
    static std::optional<DateTime> parse(std::string_view str);

    /// Количество дней от 1970-01-01 (по дате "как записано")
    std::int64_t days_since_epoch() const;

    /// Абсолютное время в секундах от Unix epoch (с учётом смещения)
    double to_epoch_seconds() const;

    /// ISO 8601 представление
    std::string to_string() const;

    bool operator==(const DateTime& other) const;
    bool operator!=(const DateTime& other) const { return !(*this == other); }
};

/// Количество дней в месяце с учётом високосных лет
int days_in_month(int year, int month);

}  // namespace mitigator

#endif  // MITIGATOR_DATETIME_HPP
