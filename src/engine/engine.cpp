// ==============================================================================
// engine.cpp - Движок рекомендаций по смягчению
// ==============================================================================

#include "mitigator/engine.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace mitigator::engine {

namespace {

double mean_of(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

/// Стандартное отклонение с поправкой ddof (0 = популяционное, 1 = выборочное)
double std_dev_of(const std::vector<double>& values, double mean, std::size_t ddof) {
    if (values.size() <= ddof) {
        return 0.0;
    }
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size() - ddof));
}

}  // anonymous namespace

const std::set<std::string>& known_protocols() {
    static const std::set<std::string> KNOWN = {"TCP", "UDP", "HTTP", "HTTPS", "SSH", "FTP"};
    return KNOWN;
}

// ============================================================================
// AnalysisError
// ============================================================================

AnalysisError::AnalysisError(std::size_t record_index, const std::string& field,
                             const std::string& reason)
    : std::runtime_error("record " + std::to_string(record_index) + ": field '" + field + "' " +
                         reason),
      record_index_(record_index),
      field_(field) {}

// ============================================================================
// Фильтрация
// ============================================================================

std::vector<AnomalousRecord> filter_anomalous(const Dataset& dataset) {
    std::vector<AnomalousRecord> result;

    for (std::size_t i = 0; i < dataset.size(); ++i) {
        const Record& record = dataset[i];
        // Поля записей Normal не читаются
        if (!record.is_anomaly()) {
            continue;
        }

        AnomalousRecord anomaly;
        anomaly.index = i;

        if (!record.timestamp.has_value()) {
            throw AnalysisError(i, "timestamp", "is missing");
        }
        auto ts = DateTime::parse(*record.timestamp);
        if (!ts) {
            throw AnalysisError(i, "timestamp", "is not a valid timestamp: '" + *record.timestamp + "'");
        }
        anomaly.timestamp = *ts;
        anomaly.epoch_seconds = ts->to_epoch_seconds();

        if (!record.bytes_transferred.has_value()) {
            throw AnalysisError(i, "bytes_transferred", "is missing or not a number");
        }
        const double bytes = *record.bytes_transferred;
        if (!std::isfinite(bytes)) {
            throw AnalysisError(i, "bytes_transferred", "is not a finite number");
        }
        if (bytes < 0.0) {
            throw AnalysisError(i, "bytes_transferred", "is negative");
        }
        anomaly.bytes_transferred = bytes;

        if (!record.protocol.has_value()) {
            throw AnalysisError(i, "protocol", "is missing");
        }
        anomaly.protocol = *record.protocol;

        result.push_back(std::move(anomaly));
    }

    return result;
}

// ============================================================================
// Детектор объёма трафика
// ============================================================================

TrafficSignals analyze_traffic(const std::vector<AnomalousRecord>& anomalies) {
    TrafficSignals signals;
    if (anomalies.empty()) {
        return signals;
    }

    std::vector<double> bytes;
    bytes.reserve(anomalies.size());
    for (const auto& a : anomalies) {
        bytes.push_back(a.bytes_transferred);
    }

    signals.mean = mean_of(bytes);
    signals.std_dev = std_dev_of(bytes, signals.mean, 0);

    // Одна точка (или нулевой разброс) не может быть выбросом относительно себя.
    // Границы включительные: для n точек максимальное отклонение от среднего
    // равно sqrt(n - 1) сигм, и при n = 5 одиночный выброс лежит ровно на 2σ.
    if (bytes.size() > 1 && signals.std_dev > 0.0) {
        const double upper = signals.mean + VOLUME_SIGMA * signals.std_dev;
        const double lower = signals.mean - VOLUME_SIGMA * signals.std_dev;
        // Допуск на погрешность округления при сравнении с границей
        const double tolerance = 1e-12 * (std::abs(signals.mean) + signals.std_dev);

        for (double b : bytes) {
            if (b >= upper - tolerance) {
                signals.high_volume = true;
            }
            if (b <= lower + tolerance) {
                signals.low_volume = true;
            }
        }
    }

    // Скользящее среднее по окну из BURST_WINDOW записей в исходном порядке;
    // первые BURST_WINDOW - 1 позиций окна не имеют
    if (bytes.size() >= BURST_WINDOW) {
        const double threshold = BURST_FACTOR * signals.mean;
        double window_sum = 0.0;
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            window_sum += bytes[i];
            if (i >= BURST_WINDOW) {
                window_sum -= bytes[i - BURST_WINDOW];
            }
            if (i + 1 >= BURST_WINDOW) {
                const double rolling_mean = window_sum / static_cast<double>(BURST_WINDOW);
                if (rolling_mean > threshold) {
                    signals.burst_pattern = true;
                    break;
                }
            }
        }
    }

    return signals;
}

// ============================================================================
// Детектор протоколов
// ============================================================================

ProtocolSignals analyze_protocols(const std::vector<AnomalousRecord>& anomalies) {
    ProtocolSignals signals;
    if (anomalies.empty()) {
        return signals;
    }

    std::map<std::string, std::size_t> counts;
    for (const auto& a : anomalies) {
        ++counts[a.protocol];
    }

    const auto total = static_cast<double>(anomalies.size());
    const auto& known = known_protocols();

    for (const auto& [protocol, count] : counts) {
        const double fraction = static_cast<double>(count) / total;
        signals.distribution[protocol] = fraction;

        if (fraction > DOMINANCE_THRESHOLD) {
            signals.protocol_dominance = true;
        }
        if (known.find(protocol) == known.end()) {
            signals.unusual_protocols.insert(protocol);
        }
    }

    signals.protocol_diversity = counts.size() > DIVERSITY_THRESHOLD;

    return signals;
}

// ============================================================================
// Временной детектор
// ============================================================================

TemporalSignals analyze_temporal(const std::vector<AnomalousRecord>& anomalies,
                                 bool sort_before_diff) {
    TemporalSignals signals;
    if (anomalies.empty()) {
        return signals;
    }

    std::vector<double> times;
    times.reserve(anomalies.size());
    for (const auto& a : anomalies) {
        times.push_back(a.epoch_seconds);
    }
    if (sort_before_diff) {
        std::stable_sort(times.begin(), times.end());
    }

    // Разность с предыдущей записью; у первой записи разности нет
    for (std::size_t i = 1; i < times.size(); ++i) {
        signals.time_diffs.push_back(times[i] - times[i - 1]);
    }

    // Регулярность определена только для двух и более интервалов
    if (signals.time_diffs.size() >= 2) {
        const double mean = mean_of(signals.time_diffs);
        const double std_dev = std_dev_of(signals.time_diffs, mean, 1);
        signals.regular_interval = std_dev < mean * REGULARITY_FACTOR;
    }

    signals.burst_timing =
        std::any_of(signals.time_diffs.begin(), signals.time_diffs.end(),
                    [](double diff) { return diff < BURST_TIMING_SECONDS; });

    for (const auto& a : anomalies) {
        ++signals.hour_counts[a.timestamp.hour];
    }
    const double limit = CONCENTRATION_THRESHOLD * static_cast<double>(anomalies.size());
    for (const auto& [hour, count] : signals.hour_counts) {
        if (static_cast<double>(count) > limit) {
            signals.time_concentration = true;
        }
    }

    return signals;
}

// ============================================================================
// Рекомендации
// ============================================================================

Recommendation Recommendation::from_entry(const catalog::RuleEntry& entry) {
    return Recommendation{entry.type, entry.description, entry.recommendations, entry.severity};
}

bool Recommendation::operator==(const Recommendation& other) const {
    return type == other.type && description == other.description &&
           recommendations == other.recommendations && severity == other.severity;
}

std::vector<Recommendation> recommend(const Signals& signals, const catalog::Catalog& catalog) {
    using catalog::PatternType;

    std::vector<Recommendation> result;
    auto append = [&](PatternType type) {
        result.push_back(Recommendation::from_entry(catalog.at(type)));
    };

    // Объём трафика
    if (signals.traffic.high_volume) {
        append(PatternType::TrafficSpike);
    }
    if (signals.traffic.burst_pattern) {
        append(PatternType::PatternAnomaly);
    }

    // Протоколы
    if (signals.protocol.protocol_dominance || !signals.protocol.unusual_protocols.empty()) {
        append(PatternType::ProtocolAnomaly);
    }

    // Время
    if (signals.temporal.regular_interval || signals.temporal.time_concentration) {
        append(PatternType::DataExfiltration);
    }

    return result;
}

// ============================================================================
// MitigationEngine
// ============================================================================

MitigationEngine::MitigationEngine(catalog::Catalog catalog, EngineOptions options)
    : catalog_(std::move(catalog)), options_(options) {}

std::vector<Recommendation> MitigationEngine::analyze(const Dataset& dataset) const {
    return analyze_detailed(dataset).recommendations;
}

Analysis MitigationEngine::analyze_detailed(const Dataset& dataset) const {
    Analysis analysis;
    analysis.total_records = dataset.size();

    const auto anomalies = filter_anomalous(dataset);
    analysis.anomaly_count = anomalies.size();
    if (anomalies.empty()) {
        return analysis;
    }

    Signals signals;
    signals.traffic = analyze_traffic(anomalies);
    signals.protocol = analyze_protocols(anomalies);
    signals.temporal = analyze_temporal(anomalies, options_.sort_before_diff);

    analysis.recommendations = recommend(signals, catalog_);
    analysis.signals = std::move(signals);
    return analysis;
}

}  // namespace mitigator::engine
