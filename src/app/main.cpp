// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code
//
// Исключения перехватываются на границе приложения.
//
// ==============================================================================

#include "mitigator/catalog.hpp"
#include "mitigator/cli.hpp"
#include "mitigator/config.hpp"
#include "mitigator/dataset.hpp"
#include "mitigator/engine.hpp"
#include "mitigator/output.hpp"
#include "mitigator/platform.hpp"
#include "mitigator/report.hpp"

#include <cstdio>
#include <ctime>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <rapidjson/document.h>
#include <type_traits>
#include <variant>

namespace {

// ----------------------------------------------------------------------------
// ASCII Banner (--no-banner)
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
  __  __ ___ _____ ___ ___    _ _____ ___  ___
 |  \/  |_ _|_   _|_ _/ __|  /_\_   _/ _ \| _ \
 | |\/| || |  | |  | | (_ | / _ \| || (_) |   /
 |_|  |_|___| |_| |___\___|/_/ \_\_| \___/|_|_\
)";

// Ширина столбца описаний в таблицах
constexpr size_t DESCRIPTION_WIDTH = 40;
constexpr size_t ACTION_WIDTH = 60;

void print_banner(mitigator::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(mitigator::output::Stream::Stderr, BANNER);
    writer.write_line(mitigator::output::Stream::Stderr, "");
}

std::string format_double(double value, int precision = 2) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
    return buffer;
}

const char* yes_no(bool value) {
    return value ? "yes" : "no";
}

// ----------------------------------------------------------------------------
// Табличный вывод
// ----------------------------------------------------------------------------

/// Ячейка со списком действий: по одному на строку с маркером
std::string format_actions(const std::vector<std::string>& actions) {
    std::string cell;
    for (size_t i = 0; i < actions.size(); ++i) {
        if (i > 0) {
            cell += '\n';
        }
        // Перенос с отступом под маркер
        std::string wrapped = mitigator::output::wrap_field(actions[i], ACTION_WIDTH);
        std::string indented;
        for (char c : wrapped) {
            indented += c;
            if (c == '\n') {
                indented += "  ";
            }
        }
        cell += std::string(mitigator::platform::list_prefix()) + " " + indented;
    }
    return cell;
}

void print_recommendations(const std::vector<mitigator::engine::Recommendation>& recs,
                           mitigator::output::Writer& out) {
    using namespace mitigator;

    output::Table table;
    table.set_headers({"type", "severity", "description", "recommendations"});
    for (const auto& rec : recs) {
        table.add_row({catalog::to_string(rec.type), catalog::to_string(rec.severity),
                       output::wrap_field(rec.description, DESCRIPTION_WIDTH),
                       format_actions(rec.recommendations)});
    }
    table.print(out);
}

void print_signals(const mitigator::engine::Signals& signals, mitigator::output::Writer& out) {
    using namespace mitigator;

    std::string unusual;
    for (const auto& protocol : signals.protocol.unusual_protocols) {
        if (!unusual.empty()) {
            unusual += ", ";
        }
        unusual += protocol.empty() ? "\"\"" : protocol;
    }

    std::string distribution;
    for (const auto& [protocol, share] : signals.protocol.distribution) {
        if (!distribution.empty()) {
            distribution += '\n';
        }
        distribution += protocol + ": " + format_double(share * 100.0) + "%";
    }

    output::Table table;
    table.set_headers({"detector", "signal", "value"});
    table.add_row({"traffic", "mean bytes", format_double(signals.traffic.mean)});
    table.add_row({"traffic", "std dev", format_double(signals.traffic.std_dev)});
    table.add_row({"traffic", "high volume", yes_no(signals.traffic.high_volume)});
    table.add_row({"traffic", "low volume", yes_no(signals.traffic.low_volume)});
    table.add_row({"traffic", "burst pattern", yes_no(signals.traffic.burst_pattern)});
    table.add_row({"protocol", "distribution", distribution});
    table.add_row({"protocol", "dominance", yes_no(signals.protocol.protocol_dominance)});
    table.add_row({"protocol", "diversity", yes_no(signals.protocol.protocol_diversity)});
    table.add_row({"protocol", "unusual", unusual.empty() ? "-" : unusual});
    table.add_row({"temporal", "regular interval", yes_no(signals.temporal.regular_interval)});
    table.add_row({"temporal", "burst timing", yes_no(signals.temporal.burst_timing)});
    table.add_row(
        {"temporal", "time concentration", yes_no(signals.temporal.time_concentration)});
    table.print(out);
}

// ----------------------------------------------------------------------------
// Загрузка каталога
// ----------------------------------------------------------------------------

/// --rules приоритетнее каталога из конфигурации
mitigator::catalog::Catalog resolve_catalog(const std::optional<std::filesystem::path>& rules,
                                            const mitigator::config::Config& config,
                                            mitigator::output::Writer& writer) {
    using namespace mitigator;

    if (rules.has_value()) {
        writer.debug("Loading rule catalog from " + platform::path_to_utf8(*rules));
        return catalog::Catalog::load(*rules);
    }
    if (config.catalog.has_value()) {
        writer.debug("Using rule catalog from configuration");
        return *config.catalog;
    }
    writer.debug("Using built-in rule catalog");
    return catalog::Catalog::defaults();
}

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

int run_analyze(const mitigator::cli::AnalyzeCommand& cmd, mitigator::output::Writer& writer) {
    using namespace mitigator;

    // Конфигурация
    config::Config cfg;
    if (cmd.config.has_value()) {
        auto loaded = config::load(*cmd.config);
        if (!loaded) {
            writer.error(loaded.error.format());
            return 1;
        }
        cfg = std::move(loaded.config);

        config::start_logging(cfg, writer, std::time(nullptr));
    }
    if (cmd.sort_before_diff) {
        cfg.engine.sort_before_diff = true;
    }

    catalog::Catalog rules = catalog::Catalog::defaults();
    try {
        rules = resolve_catalog(cmd.rules, cfg, writer);
    } catch (const catalog::CatalogLoadError& e) {
        writer.error(e.what());
        return 1;
    }

    // Набор данных
    writer.info("Loading dataset from: " + platform::path_to_utf8(cmd.dataset));
    auto loaded = io::load_dataset(cmd.dataset);
    if (!loaded) {
        writer.error(loaded.error.format());
        return 1;
    }
    writer.info("Loaded " + std::to_string(loaded.dataset.size()) + " records");

    // Анализ
    const engine::MitigationEngine mitigation_engine(std::move(rules), cfg.engine);
    engine::Analysis analysis;
    try {
        analysis = mitigation_engine.analyze_detailed(loaded.dataset);
    } catch (const engine::AnalysisError& e) {
        writer.error(std::string("Analysis failed - ") + e.what());
        return 1;
    }

    const report::Summary summary = report::summarize(analysis);
    writer.info("Detected " + std::to_string(summary.anomaly_count) + " anomalies (" +
                format_double(summary.anomaly_percentage) + "%)");
    if (analysis.signals) {
        writer.trace("Traffic mean " + format_double(analysis.signals->traffic.mean) +
                     ", std dev " + format_double(analysis.signals->traffic.std_dev));
    }
    writer.info("Generated " + std::to_string(analysis.recommendations.size()) +
                " mitigation recommendations");

    const std::time_t now = std::time(nullptr);

    // Вывод полезной нагрузки, при -o в отдельный Writer
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = &writer;
    if (cmd.output.has_value()) {
        output::OutputConfig out_cfg = writer.config();
        out_cfg.output_path = cmd.output;
        out_cfg.log_path.reset();
        file_writer = std::make_unique<output::Writer>(out_cfg);
        if (!file_writer->has_output_file()) {
            writer.error("Unable to write to specified output file - " +
                         platform::path_to_utf8(*cmd.output));
            return 1;
        }
        out = file_writer.get();
    }

    rapidjson::Document doc;
    auto& alloc = doc.GetAllocator();

    if (cmd.json) {
        rapidjson::Value value =
            report::analysis_to_json(analysis, report::format_timestamp(now), alloc);
        out->write_json_pretty(value);
    } else if (cmd.jsonl) {
        for (const auto& rec : analysis.recommendations) {
            out->write_json_line(report::to_json(rec, alloc));
        }
    } else if (cmd.csv) {
        out->write(output::Stream::Stdout, report::to_csv(analysis.recommendations));
    } else {
        out->write_line(output::Stream::Stdout,
                        "Total records: " + std::to_string(summary.total_records));
        out->write_line(output::Stream::Stdout,
                        "Anomalies: " + std::to_string(summary.anomaly_count) + " (" +
                            format_double(summary.anomaly_percentage) + "%)");
        if (cmd.signals && analysis.signals) {
            print_signals(*analysis.signals, *out);
        }
        if (analysis.recommendations.empty()) {
            out->write_line(output::Stream::Stdout, "No mitigation recommendations");
        } else {
            print_recommendations(analysis.recommendations, *out);
        }
    }
    out->flush();

    // Сохранение отчёта
    if (cmd.save) {
        std::filesystem::create_directories(cfg.output_dir);
        const auto report_path = cfg.output_dir / report::report_file_name(now);
        rapidjson::Value value =
            report::analysis_to_json(analysis, report::format_timestamp(now), alloc);

        std::ofstream file(report_path, std::ios::binary);
        if (!file.is_open()) {
            writer.error("Unable to write report - " + platform::path_to_utf8(report_path));
            return 1;
        }
        file << report::to_pretty_string(value) << "\n";
        writer.info("Saved report to " + platform::path_to_utf8(report_path));
    }

    return 0;
}

int run_lint(const mitigator::cli::LintCommand& cmd, mitigator::output::Writer& writer) {
    using namespace mitigator;

    writer.info("Validating rule catalog: " + platform::path_to_utf8(cmd.path));

    const catalog::LintResult result = catalog::lint(cmd.path);
    if (!result) {
        writer.error(result.error);
        return 1;
    }

    writer.info("Validated " + std::to_string(result.entries) + " catalog entries");
    return 0;
}

int run_catalog(const mitigator::cli::CatalogCommand& cmd, mitigator::output::Writer& writer) {
    using namespace mitigator;

    catalog::Catalog rules = catalog::Catalog::defaults();
    try {
        rules = resolve_catalog(cmd.rules, config::Config{}, writer);
    } catch (const catalog::CatalogLoadError& e) {
        writer.error(e.what());
        return 1;
    }

    std::vector<engine::Recommendation> entries;
    for (const auto& entry : rules.entries()) {
        entries.push_back(engine::Recommendation::from_entry(entry));
    }

    if (cmd.json) {
        rapidjson::Document doc;
        rapidjson::Value value = report::recommendations_to_json(entries, doc.GetAllocator());
        writer.write_json_pretty(value);
    } else {
        print_recommendations(entries, writer);
    }
    return 0;
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace mitigator;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg);

    // Ошибки парсинга печатаются без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                const std::string help = cli::render_help(cmd.command);
                if (help.rfind("error: ", 0) == 0) {
                    writer.write(output::Stream::Stderr, help);
                    return 2;
                }
                writer.write(output::Stream::Stdout, help);
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::AnalyzeCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_analyze(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::LintCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_lint(cmd, writer);
            } else {
                static_assert(std::is_same_v<T, cli::CatalogCommand>);
                return run_catalog(cmd, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
