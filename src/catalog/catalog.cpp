// ==============================================================================
// catalog.cpp - Каталог правил смягчения
// ==============================================================================
//
// Встроенный каталог и загрузка внешнего каталога через yaml-cpp.
// JSON читается тем же парсером (flow-синтаксис YAML).
//
// ==============================================================================

#include "mitigator/catalog.hpp"

#include "mitigator/platform.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace mitigator::catalog {

// ============================================================================
// Error formatting
// ============================================================================

namespace {

std::string format_error(const std::string& message, const std::string& path) {
    std::ostringstream oss;
    oss << "catalog error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

}  // anonymous namespace

CatalogLoadError::CatalogLoadError(const std::string& message, std::string path)
    : std::runtime_error(format_error(message, path)), message_(message), path_(std::move(path)) {}

// ============================================================================
// String conversion
// ============================================================================

std::string to_string(PatternType type) {
    switch (type) {
    case PatternType::TrafficSpike:
        return "TRAFFIC_SPIKE";
    case PatternType::ProtocolAnomaly:
        return "PROTOCOL_ANOMALY";
    case PatternType::PatternAnomaly:
        return "PATTERN_ANOMALY";
    case PatternType::DataExfiltration:
        return "DATA_EXFILTRATION";
    }
    return "UNKNOWN";
}

std::string to_string(Severity severity) {
    switch (severity) {
    case Severity::Low:
        return "LOW";
    case Severity::Medium:
        return "MEDIUM";
    case Severity::High:
        return "HIGH";
    }
    return "UNKNOWN";
}

PatternType parse_pattern_type(std::string_view s) {
    if (s == "TRAFFIC_SPIKE")
        return PatternType::TrafficSpike;
    if (s == "PROTOCOL_ANOMALY")
        return PatternType::ProtocolAnomaly;
    if (s == "PATTERN_ANOMALY")
        return PatternType::PatternAnomaly;
    if (s == "DATA_EXFILTRATION")
        return PatternType::DataExfiltration;
    throw std::invalid_argument(
        "unknown pattern type, must be: TRAFFIC_SPIKE, PROTOCOL_ANOMALY, PATTERN_ANOMALY or "
        "DATA_EXFILTRATION");
}

Severity parse_severity(std::string_view s) {
    if (s == "LOW")
        return Severity::Low;
    if (s == "MEDIUM")
        return Severity::Medium;
    if (s == "HIGH")
        return Severity::High;
    throw std::invalid_argument("unknown severity, must be: LOW, MEDIUM or HIGH");
}

bool RuleEntry::operator==(const RuleEntry& other) const {
    return type == other.type && description == other.description &&
           recommendations == other.recommendations && severity == other.severity;
}

// ============================================================================
// Catalog
// ============================================================================

Catalog::Catalog(std::vector<RuleEntry> entries) : entries_(std::move(entries)) {}

Catalog Catalog::defaults() {
    std::vector<RuleEntry> entries;
    entries.reserve(ALL_PATTERN_TYPES.size());

    entries.push_back(RuleEntry{PatternType::TrafficSpike,
                                "Unusual spike in network traffic",
                                {"Implement rate limiting", "Enable traffic throttling",
                                 "Deploy DDoS protection"},
                                Severity::High});
    entries.push_back(RuleEntry{PatternType::ProtocolAnomaly,
                                "Unusual protocol behavior",
                                {"Update firewall rules", "Enable deep packet inspection",
                                 "Implement protocol validation"},
                                Severity::Medium});
    entries.push_back(RuleEntry{PatternType::PatternAnomaly,
                                "Unusual traffic patterns",
                                {"Enable behavioral analysis", "Update IDS signatures",
                                 "Implement traffic segmentation"},
                                Severity::Medium});
    entries.push_back(RuleEntry{PatternType::DataExfiltration,
                                "Potential data exfiltration",
                                {"Enable data loss prevention", "Implement egress filtering",
                                 "Monitor data transfer patterns"},
                                Severity::High});

    return Catalog(std::move(entries));
}

const RuleEntry& Catalog::at(PatternType type) const& {
    return entries_.at(static_cast<std::size_t>(type));
}

RuleEntry Catalog::at(PatternType type) const&& {
    return entries_.at(static_cast<std::size_t>(type));
}

// ============================================================================
// YAML parsing helpers
// ============================================================================

namespace {

bool is_catalog_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".yml" || ext == ".yaml" || ext == ".json";
}

RuleEntry parse_entry(PatternType type, const YAML::Node& node) {
    const std::string type_id = to_string(type);

    if (!node.IsMap()) {
        throw std::runtime_error("entry '" + type_id + "' must be a map");
    }

    RuleEntry entry;
    entry.type = type;

    // description
    const YAML::Node description = node["description"];
    if (!description) {
        throw std::runtime_error("entry '" + type_id + "' is missing 'description'");
    }
    if (!description.IsScalar()) {
        throw std::runtime_error("entry '" + type_id + "': 'description' must be a string");
    }
    entry.description = description.as<std::string>();

    // recommendations (alias: recommended_actions)
    const YAML::Node actions =
        node["recommendations"] ? node["recommendations"] : node["recommended_actions"];
    if (!actions) {
        throw std::runtime_error("entry '" + type_id + "' is missing 'recommendations'");
    }
    if (!actions.IsSequence()) {
        throw std::runtime_error("entry '" + type_id + "': 'recommendations' must be a list");
    }
    for (const auto& action : actions) {
        if (!action.IsScalar()) {
            throw std::runtime_error("entry '" + type_id +
                                     "': 'recommendations' must contain only strings");
        }
        entry.recommendations.push_back(action.as<std::string>());
    }

    // severity
    const YAML::Node severity = node["severity"];
    if (!severity) {
        throw std::runtime_error("entry '" + type_id + "' is missing 'severity'");
    }
    if (!severity.IsScalar()) {
        throw std::runtime_error("entry '" + type_id + "': 'severity' must be a string");
    }
    try {
        entry.severity = parse_severity(severity.as<std::string>());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("entry '" + type_id + "': " + e.what());
    }

    return entry;
}

}  // anonymous namespace

Catalog Catalog::from_yaml(const YAML::Node& root, const std::string& source) {
    try {
        const YAML::Node rules =
            (root.IsMap() && root["mitigation_rules"]) ? root["mitigation_rules"] : root;

        if (!rules.IsMap()) {
            throw std::runtime_error("catalog must be a map of pattern types");
        }

        std::vector<std::optional<RuleEntry>> parsed(ALL_PATTERN_TYPES.size());

        for (const auto& kv : rules) {
            const std::string key = kv.first.as<std::string>();
            PatternType type = PatternType::TrafficSpike;
            try {
                type = parse_pattern_type(key);
            } catch (const std::invalid_argument& e) {
                throw std::runtime_error("'" + key + "': " + e.what());
            }
            auto& slot = parsed[static_cast<std::size_t>(type)];
            if (slot.has_value()) {
                throw std::runtime_error("duplicate entry '" + key + "'");
            }
            slot = parse_entry(type, kv.second);
        }

        std::vector<RuleEntry> entries;
        entries.reserve(parsed.size());
        for (PatternType type : ALL_PATTERN_TYPES) {
            auto& slot = parsed[static_cast<std::size_t>(type)];
            if (!slot.has_value()) {
                throw std::runtime_error("missing entry '" + to_string(type) + "'");
            }
            entries.push_back(std::move(*slot));
        }

        return Catalog(std::move(entries));
    } catch (const YAML::Exception& e) {
        throw CatalogLoadError(e.what(), source);
    } catch (const CatalogLoadError&) {
        throw;
    } catch (const std::exception& e) {
        throw CatalogLoadError(e.what(), source);
    }
}

Catalog Catalog::parse(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        throw CatalogLoadError(e.what());
    }
    return from_yaml(root);
}

Catalog Catalog::load(const std::filesystem::path& path) {
    const std::string source = platform::path_to_utf8(path);

    if (!is_catalog_extension(path)) {
        throw CatalogLoadError("catalog must have a yaml or json file extension", source);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        throw CatalogLoadError("could not open file", source);
    } catch (const YAML::Exception& e) {
        throw CatalogLoadError(e.what(), source);
    }
    return from_yaml(root, source);
}

// ============================================================================
// Lint
// ============================================================================

LintResult lint(const std::filesystem::path& path) {
    LintResult result;
    try {
        Catalog catalog = Catalog::load(path);
        result.entries = catalog.size();
        result.ok = true;
    } catch (const CatalogLoadError& e) {
        result.error = e.what();
    }
    return result;
}

}  // namespace mitigator::catalog
