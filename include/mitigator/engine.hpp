// ==============================================================================
// mitigator/engine.hpp - Движок рекомендаций по смягчению
// ==============================================================================
//
// Назначение:
// - Фильтрация аномального подмножества записей
// - Три независимых детектора: объём трафика, протоколы, время
// - Отображение сигналов детекторов на записи каталога
//
// Поток данных:
//   Dataset -> аномальное подмножество -> {traffic, protocol, temporal}
//           -> рекомендации
//
// Движок не выполняет ввод-вывод и не хранит изменяемого состояния:
// analyze() является чистой функцией от входа и неизменяемого каталога.
//
// ==============================================================================

#ifndef MITIGATOR_ENGINE_HPP
#define MITIGATOR_ENGINE_HPP

#include <mitigator/catalog.hpp>
#include <mitigator/datetime.hpp>
#include <mitigator/record.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace mitigator::engine {

// ============================================================================
// Константы детекторов
// ============================================================================

/// Порог выброса объёма в стандартных отклонениях
constexpr double VOLUME_SIGMA = 2.0;

/// Ширина скользящего окна для поиска всплесков
constexpr std::size_t BURST_WINDOW = 3;

/// Множитель среднего для всплеска
constexpr double BURST_FACTOR = 2.0;

/// Доля одного протокола для доминирования
constexpr double DOMINANCE_THRESHOLD = 0.7;

/// Количество различных протоколов для разнообразия (строго больше)
constexpr std::size_t DIVERSITY_THRESHOLD = 2;

/// Относительный разброс интервалов для регулярности
constexpr double REGULARITY_FACTOR = 0.1;

/// Интервал (секунды) меньше которого считается всплеском по времени
constexpr double BURST_TIMING_SECONDS = 1.0;

/// Доля записей в одном часе суток для концентрации
constexpr double CONCENTRATION_THRESHOLD = 0.3;

/// Ожидаемые протоколы
const std::set<std::string>& known_protocols();

// ============================================================================
// Ошибки
// ============================================================================

/// Обязательное поле аномальной записи отсутствует или не разбирается.
/// Фатальна для вызова analyze(): частичного результата нет.
class AnalysisError : public std::runtime_error {
public:
    AnalysisError(std::size_t record_index, const std::string& field, const std::string& reason);

    /// Индекс записи во входном наборе
    std::size_t record_index() const { return record_index_; }

    /// Имя поля ("timestamp", "bytes_transferred", "protocol")
    const std::string& field() const { return field_; }

private:
    std::size_t record_index_;
    std::string field_;
};

// ============================================================================
// Аномальное подмножество
// ============================================================================

/// Проверенная аномальная запись
struct AnomalousRecord {
    std::size_t index = 0;  // позиция во входном наборе
    DateTime timestamp;
    double epoch_seconds = 0.0;
    double bytes_transferred = 0.0;
    std::string protocol;
};

/// Выбрать записи с меткой Anomaly в исходном порядке и проверить их поля
/// @throw AnalysisError
std::vector<AnomalousRecord> filter_anomalous(const Dataset& dataset);

// ============================================================================
// Сигналы детекторов
// ============================================================================

/// Детектор объёма трафика
struct TrafficSignals {
    double mean = 0.0;
    double std_dev = 0.0;  // популяционное стандартное отклонение

    bool high_volume = false;
    bool low_volume = false;  // не отображается на рекомендацию
    bool burst_pattern = false;
};

/// Детектор протоколов
struct ProtocolSignals {
    std::map<std::string, double> distribution;  // доля каждого протокола

    bool protocol_dominance = false;
    bool protocol_diversity = false;  // не отображается на рекомендацию
    std::set<std::string> unusual_protocols;
};

/// Временной детектор
struct TemporalSignals {
    std::vector<double> time_diffs;        // секунды, |A| - 1 значений
    std::map<int, std::size_t> hour_counts;  // час суток -> количество

    bool regular_interval = false;
    bool burst_timing = false;  // не отображается на рекомендацию
    bool time_concentration = false;
};

struct Signals {
    TrafficSignals traffic;
    ProtocolSignals protocol;
    TemporalSignals temporal;
};

TrafficSignals analyze_traffic(const std::vector<AnomalousRecord>& anomalies);

ProtocolSignals analyze_protocols(const std::vector<AnomalousRecord>& anomalies);

/// @param sort_before_diff Упорядочить по времени перед вычислением разностей
TemporalSignals analyze_temporal(const std::vector<AnomalousRecord>& anomalies,
                                 bool sort_before_diff = false);

// ============================================================================
// Рекомендации
// ============================================================================

/// Копия записи каталога с типом сработавшего паттерна
struct Recommendation {
    catalog::PatternType type = catalog::PatternType::TrafficSpike;
    std::string description;
    std::vector<std::string> recommendations;
    catalog::Severity severity = catalog::Severity::Low;

    static Recommendation from_entry(const catalog::RuleEntry& entry);

    bool operator==(const Recommendation& other) const;
    bool operator!=(const Recommendation& other) const { return !(*this == other); }
};

/// Отобразить сигналы на записи каталога в фиксированном порядке:
/// TRAFFIC_SPIKE, PATTERN_ANOMALY, PROTOCOL_ANOMALY, DATA_EXFILTRATION.
/// Без дедупликации.
std::vector<Recommendation> recommend(const Signals& signals, const catalog::Catalog& catalog);

// ============================================================================
// MitigationEngine
// ============================================================================

struct EngineOptions {
    /// Сортировать аномалии по времени перед вычислением интервалов.
    /// По умолчанию интервалы считаются в порядке входа.
    bool sort_before_diff = false;
};

/// Подробный результат анализа
struct Analysis {
    std::size_t total_records = 0;
    std::size_t anomaly_count = 0;
    std::optional<Signals> signals;  // nullopt если аномалий нет
    std::vector<Recommendation> recommendations;
};

class MitigationEngine {
public:
    explicit MitigationEngine(catalog::Catalog catalog = catalog::Catalog::defaults(),
                              EngineOptions options = {});

    /// Упорядоченный список рекомендаций
    /// @throw AnalysisError
    std::vector<Recommendation> analyze(const Dataset& dataset) const;

    /// Рекомендации вместе с сигналами и счётчиками
    /// @throw AnalysisError
    Analysis analyze_detailed(const Dataset& dataset) const;

    const catalog::Catalog& catalog() const { return catalog_; }
    const EngineOptions& options() const { return options_; }

private:
    catalog::Catalog catalog_;
    EngineOptions options_;
};

}  // namespace mitigator::engine

#endif  // MITIGATOR_ENGINE_HPP
