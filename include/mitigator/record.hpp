// ==============================================================================
// mitigator/record.hpp - Модель данных записи трафика
// ==============================================================================
//
// Назначение:
// - Record: одно наблюдаемое событие трафика
// - AnomalyLabel: метка внешнего классификатора
// - Dataset: упорядоченная последовательность записей
//
// Поля записи необязательные: некорректные поля у записей с меткой Normal
// допустимы и никогда не проверяются движком.
//
// ==============================================================================

#ifndef MITIGATOR_RECORD_HPP
#define MITIGATOR_RECORD_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mitigator {

/// Метка классификатора
enum class AnomalyLabel { Anomaly, Normal };

/// Строковое значение метки в исходных данных для положительного случая
constexpr const char* ANOMALY_LABEL_VALUE = "Anomaly";

/// Разобрать метку: "Anomaly" (с учётом регистра) -> Anomaly, иначе Normal
AnomalyLabel parse_anomaly_label(std::string_view s);

/// "Anomaly" или "Normal"
const char* to_string(AnomalyLabel label);

/// Запись трафика
struct Record {
    std::optional<std::string> timestamp;    // ISO 8601
    std::optional<double> bytes_transferred;  // объём, >= 0
    std::optional<std::string> protocol;      // "TCP", "HTTP", ...
    AnomalyLabel label = AnomalyLabel::Normal;

    bool is_anomaly() const { return label == AnomalyLabel::Anomaly; }
};

using Dataset = std::vector<Record>;

}  // namespace mitigator

#endif  // MITIGATOR_RECORD_HPP
