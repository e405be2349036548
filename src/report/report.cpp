// ==============================================================================
// report.cpp - Отчёт по результатам анализа
// ==============================================================================

#include "mitigator/report.hpp"

#include "mitigator/platform.hpp"

#include <cmath>
#include <cstdint>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace mitigator::report {

namespace {

rapidjson::Value make_string(std::string_view s, Allocator& alloc) {
    rapidjson::Value v;
    v.SetString(s.data(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

std::string format_local(std::time_t when, const char* pattern) {
    const std::tm tm = platform::local_time(when);
    char buffer[64];
    const size_t n = std::strftime(buffer, sizeof(buffer), pattern, &tm);
    return std::string(buffer, n);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// Статистика
// ----------------------------------------------------------------------------

Summary summarize(const engine::Analysis& analysis) {
    Summary summary;
    summary.total_records = analysis.total_records;
    summary.anomaly_count = analysis.anomaly_count;
    if (analysis.total_records > 0) {
        const double pct = static_cast<double>(analysis.anomaly_count) * 100.0 /
                           static_cast<double>(analysis.total_records);
        summary.anomaly_percentage = std::round(pct * 100.0) / 100.0;
    }
    return summary;
}

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

rapidjson::Value to_json(const engine::Recommendation& rec, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("type", make_string(catalog::to_string(rec.type), alloc), alloc);
    obj.AddMember("description", make_string(rec.description, alloc), alloc);

    rapidjson::Value actions(rapidjson::kArrayType);
    for (const auto& action : rec.recommendations) {
        actions.PushBack(make_string(action, alloc), alloc);
    }
    obj.AddMember("recommendations", actions, alloc);
    obj.AddMember("severity", make_string(catalog::to_string(rec.severity), alloc), alloc);
    return obj;
}

rapidjson::Value recommendations_to_json(const std::vector<engine::Recommendation>& recs,
                                         Allocator& alloc) {
    rapidjson::Value arr(rapidjson::kArrayType);
    for (const auto& rec : recs) {
        arr.PushBack(to_json(rec, alloc), alloc);
    }
    return arr;
}

rapidjson::Value summary_to_json(const Summary& summary, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("total_records", static_cast<uint64_t>(summary.total_records), alloc);
    obj.AddMember("anomaly_count", static_cast<uint64_t>(summary.anomaly_count), alloc);
    obj.AddMember("anomaly_percentage", summary.anomaly_percentage, alloc);
    return obj;
}

rapidjson::Value signals_to_json(const engine::Signals& signals, Allocator& alloc) {
    rapidjson::Value traffic(rapidjson::kObjectType);
    traffic.AddMember("mean", signals.traffic.mean, alloc);
    traffic.AddMember("std_dev", signals.traffic.std_dev, alloc);
    traffic.AddMember("high_volume", signals.traffic.high_volume, alloc);
    traffic.AddMember("low_volume", signals.traffic.low_volume, alloc);
    traffic.AddMember("burst_pattern", signals.traffic.burst_pattern, alloc);

    rapidjson::Value distribution(rapidjson::kObjectType);
    for (const auto& [protocol, share] : signals.protocol.distribution) {
        distribution.AddMember(make_string(protocol, alloc), share, alloc);
    }
    rapidjson::Value unusual(rapidjson::kArrayType);
    for (const auto& protocol : signals.protocol.unusual_protocols) {
        unusual.PushBack(make_string(protocol, alloc), alloc);
    }
    rapidjson::Value protocol(rapidjson::kObjectType);
    protocol.AddMember("distribution", distribution, alloc);
    protocol.AddMember("protocol_dominance", signals.protocol.protocol_dominance, alloc);
    protocol.AddMember("protocol_diversity", signals.protocol.protocol_diversity, alloc);
    protocol.AddMember("unusual_protocols", unusual, alloc);

    rapidjson::Value hours(rapidjson::kObjectType);
    for (const auto& [hour, count] : signals.temporal.hour_counts) {
        hours.AddMember(make_string(std::to_string(hour), alloc), static_cast<uint64_t>(count),
                        alloc);
    }
    rapidjson::Value temporal(rapidjson::kObjectType);
    temporal.AddMember("hour_counts", hours, alloc);
    temporal.AddMember("regular_interval", signals.temporal.regular_interval, alloc);
    temporal.AddMember("burst_timing", signals.temporal.burst_timing, alloc);
    temporal.AddMember("time_concentration", signals.temporal.time_concentration, alloc);

    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("traffic", traffic, alloc);
    obj.AddMember("protocol", protocol, alloc);
    obj.AddMember("temporal", temporal, alloc);
    return obj;
}

rapidjson::Value analysis_to_json(const engine::Analysis& analysis,
                                  std::string_view generated_at, Allocator& alloc) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("timestamp", make_string(generated_at, alloc), alloc);
    obj.AddMember("statistics", summary_to_json(summarize(analysis), alloc), alloc);
    obj.AddMember("recommendations", recommendations_to_json(analysis.recommendations, alloc),
                  alloc);
    if (analysis.signals) {
        obj.AddMember("signals", signals_to_json(*analysis.signals, alloc), alloc);
    } else {
        obj.AddMember("signals", rapidjson::Value(rapidjson::kNullType), alloc);
    }
    return obj;
}

std::string to_pretty_string(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

// ----------------------------------------------------------------------------
// CSV
// ----------------------------------------------------------------------------

std::string csv_escape(std::string_view field) {
    if (field.find_first_of(",\"\n\r") == std::string_view::npos) {
        return std::string(field);
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') {
            out += '"';
        }
        out += c;
    }
    out += '"';
    return out;
}

std::string to_csv(const std::vector<engine::Recommendation>& recs) {
    std::string out = "type,severity,description,recommendations\n";
    for (const auto& rec : recs) {
        std::string actions;
        for (size_t i = 0; i < rec.recommendations.size(); ++i) {
            if (i > 0) {
                actions += "; ";
            }
            actions += rec.recommendations[i];
        }
        out += csv_escape(catalog::to_string(rec.type));
        out += ',';
        out += csv_escape(catalog::to_string(rec.severity));
        out += ',';
        out += csv_escape(rec.description);
        out += ',';
        out += csv_escape(actions);
        out += '\n';
    }
    return out;
}

// ----------------------------------------------------------------------------
// Время и имена файлов
// ----------------------------------------------------------------------------

std::string format_timestamp(std::time_t when) {
    return format_local(when, "%Y-%m-%dT%H:%M:%S");
}

std::string report_file_name(std::time_t when) {
    return "mitigation_report_" + format_local(when, "%Y%m%d_%H%M%S") + ".json";
}

}  // namespace mitigator::report
