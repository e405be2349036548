// ==============================================================================
// config.cpp - Конфигурация запуска
// ==============================================================================

#include "mitigator/config.hpp"

#include "mitigator/output.hpp"
#include "mitigator/platform.hpp"

#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace mitigator::config {

namespace {

LoadResult make_error(std::string message, const std::string& source) {
    LoadResult result;
    result.error = ConfigError{std::move(message), source};
    return result;
}

/// Прочитать строковое поле; отсутствие поля не ошибка
bool read_string(const YAML::Node& parent, const char* key, const std::string& field,
                 std::string& out, std::string& error) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return true;
    }
    if (!node.IsScalar()) {
        error = "'" + field + "' must be a string";
        return false;
    }
    out = node.as<std::string>();
    return true;
}

bool read_bool(const YAML::Node& parent, const char* key, const std::string& field, bool& out,
               std::string& error) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return true;
    }
    try {
        out = node.as<bool>();
    } catch (const YAML::BadConversion&) {
        error = "'" + field + "' must be a boolean";
        return false;
    }
    return true;
}

bool read_path(const YAML::Node& parent, const char* key, const std::string& field,
               std::filesystem::path& out, std::string& error) {
    std::string value;
    const bool had_value = parent[key] && !parent[key].IsNull();
    if (!read_string(parent, key, field, value, error)) {
        return false;
    }
    if (had_value) {
        if (value.empty()) {
            error = "'" + field + "' must not be empty";
            return false;
        }
        out = platform::path_from_utf8(value);
    }
    return true;
}

/// Проверить, что секция является отображением (или отсутствует)
bool check_section(const YAML::Node& node, const std::string& name, std::string& error) {
    if (!node || node.IsNull() || node.IsMap()) {
        return true;
    }
    error = "'" + name + "' must be a mapping";
    return false;
}

}  // anonymous namespace

std::string ConfigError::format() const {
    std::ostringstream oss;
    oss << "failed to load configuration";
    if (!path.empty()) {
        oss << " '" << path << "'";
    }
    oss << " - " << message;
    return oss.str();
}

// ----------------------------------------------------------------------------
// Разбор
// ----------------------------------------------------------------------------

LoadResult parse(std::string_view text, const std::filesystem::path& base_dir,
                 const std::string& source) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        return make_error(std::string("YAML parse error: ") + e.what(), source);
    }

    LoadResult result;
    Config& config = result.config;

    if (!root || root.IsNull()) {
        result.ok = true;
        return result;
    }
    if (!root.IsMap()) {
        return make_error("configuration root must be a mapping", source);
    }

    std::string error;

    // logging
    const YAML::Node logging = root["logging"];
    if (!check_section(logging, "logging", error)) {
        return make_error(error, source);
    }
    if (logging && logging.IsMap()) {
        if (!read_path(logging, "directory", "logging.directory", config.logging.directory,
                       error) ||
            !read_string(logging, "file_prefix", "logging.file_prefix",
                         config.logging.file_prefix, error) ||
            !read_bool(logging, "to_file", "logging.to_file", config.logging.to_file, error)) {
            return make_error(error, source);
        }
    }

    // directories
    const YAML::Node directories = root["directories"];
    if (!check_section(directories, "directories", error)) {
        return make_error(error, source);
    }
    if (directories && directories.IsMap()) {
        if (!read_path(directories, "outputs", "directories.outputs", config.output_dir, error) ||
            !read_path(directories, "data", "directories.data", config.data_dir, error)) {
            return make_error(error, source);
        }
    }

    // engine
    const YAML::Node engine = root["engine"];
    if (!check_section(engine, "engine", error)) {
        return make_error(error, source);
    }
    if (engine && engine.IsMap()) {
        if (!read_bool(engine, "sort_before_diff", "engine.sort_before_diff",
                       config.engine.sort_before_diff, error)) {
            return make_error(error, source);
        }
    }

    // catalog: встроенные правила приоритетнее файла
    std::filesystem::path catalog_file;
    if (!read_path(root, "catalog", "catalog", catalog_file, error)) {
        return make_error(error, source);
    }
    if (!catalog_file.empty()) {
        if (catalog_file.is_relative() && !base_dir.empty()) {
            catalog_file = base_dir / catalog_file;
        }
        config.catalog_path = catalog_file;
    }

    try {
        const YAML::Node inline_rules = root["mitigation_rules"];
        if (inline_rules && !inline_rules.IsNull()) {
            config.catalog = catalog::Catalog::from_yaml(inline_rules, source);
        } else if (config.catalog_path) {
            config.catalog = catalog::Catalog::load(*config.catalog_path);
        }
    } catch (const catalog::CatalogLoadError& e) {
        return make_error(e.what(), source);
    }

    result.ok = true;
    return result;
}

LoadResult load(const std::filesystem::path& path) {
    const std::string source = platform::path_to_utf8(path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return make_error("configuration file " + source + " not found", source);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return make_error("could not open file", source);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse(buffer.str(), path.parent_path(), source);
}

// ----------------------------------------------------------------------------
// Каталоги
// ----------------------------------------------------------------------------

std::vector<std::filesystem::path> required_directories(const Config& config) {
    std::vector<std::filesystem::path> dirs;
    if (config.logging.to_file) {
        dirs.push_back(config.logging.directory);
    }
    dirs.push_back(config.output_dir);
    dirs.push_back(config.data_dir);
    return dirs;
}

void ensure_directories(const Config& config, output::Writer& writer) {
    for (const auto& dir : required_directories(config)) {
        std::filesystem::create_directories(dir);
        writer.info("Ensured directory exists: " + platform::path_to_utf8(dir));
    }
}

std::filesystem::path log_file_path(const LoggingConfig& logging, std::time_t now) {
    const std::tm tm = platform::local_time(now);
    char date[16];
    std::strftime(date, sizeof(date), "%Y%m%d", &tm);
    return logging.directory / (logging.file_prefix + "_" + date + ".log");
}

std::optional<std::filesystem::path> start_logging(const Config& config, output::Writer& writer,
                                                   std::time_t now) {
    std::optional<std::filesystem::path> opened;
    if (config.logging.to_file) {
        std::filesystem::create_directories(config.logging.directory);
        const auto path = log_file_path(config.logging, now);
        if (writer.open_log_file(path)) {
            opened = path;
        } else {
            writer.warn("Could not open log file " + platform::path_to_utf8(path));
        }
    }

    ensure_directories(config, writer);
    if (opened) {
        writer.debug("Logging to " + platform::path_to_utf8(*opened));
    }
    return opened;
}

}  // namespace mitigator::config
