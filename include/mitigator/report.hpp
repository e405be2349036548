// ==============================================================================
// mitigator/report.hpp - Отчёт по результатам анализа
// ==============================================================================
//
// Назначение:
// - Сводная статистика набора (записи, аномалии, доля)
// - JSON представление рекомендаций и сигналов (RapidJSON)
// - CSV представление рекомендаций
// - Имя файла сохраняемого отчёта
//
// ==============================================================================

#ifndef MITIGATOR_REPORT_HPP
#define MITIGATOR_REPORT_HPP

#include <mitigator/engine.hpp>
#include <cstddef>
#include <ctime>
#include <rapidjson/document.h>
#include <string>
#include <string_view>
#include <vector>

namespace mitigator::report {

using Allocator = rapidjson::Document::AllocatorType;

// ----------------------------------------------------------------------------
// Статистика
// ----------------------------------------------------------------------------

struct Summary {
    std::size_t total_records = 0;
    std::size_t anomaly_count = 0;
    double anomaly_percentage = 0.0;  // округлено до 2 знаков; 0 для пустого набора
};

Summary summarize(const engine::Analysis& analysis);

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

/// {type, description, recommendations, severity}
rapidjson::Value to_json(const engine::Recommendation& rec, Allocator& alloc);

/// Массив рекомендаций в исходном порядке
rapidjson::Value recommendations_to_json(const std::vector<engine::Recommendation>& recs,
                                         Allocator& alloc);

rapidjson::Value summary_to_json(const Summary& summary, Allocator& alloc);

/// {traffic, protocol, temporal}
rapidjson::Value signals_to_json(const engine::Signals& signals, Allocator& alloc);

/// {timestamp, statistics, recommendations, signals}
/// signals = null если аномалий нет
rapidjson::Value analysis_to_json(const engine::Analysis& analysis,
                                  std::string_view generated_at, Allocator& alloc);

/// Сериализовать значение с отступами
std::string to_pretty_string(const rapidjson::Value& value);

// ----------------------------------------------------------------------------
// CSV
// ----------------------------------------------------------------------------

/// Заголовок "type,severity,description,recommendations", действия через "; "
std::string to_csv(const std::vector<engine::Recommendation>& recs);

/// Экранировать поле CSV (кавычки при , " \n \r)
std::string csv_escape(std::string_view field);

// ----------------------------------------------------------------------------
// Время и имена файлов
// ----------------------------------------------------------------------------

/// Локальное время "YYYY-MM-DDTHH:MM:SS"
std::string format_timestamp(std::time_t when);

/// "mitigation_report_YYYYMMDD_HHMMSS.json" (локальное время)
std::string report_file_name(std::time_t when);

}  // namespace mitigator::report

#endif  // MITIGATOR_REPORT_HPP
