// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Сообщения об ошибках повторяют формат clap:
//   error: ... \n\n Usage: ... \n\n For more information, try '--help'.
//
// ==============================================================================

#include "mitigator/cli.hpp"

#include "mitigator/platform.hpp"

#include <cstring>

namespace mitigator::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

constexpr const char* USAGE_MAIN = "Usage: mitigator [OPTIONS] <COMMAND>";
constexpr const char* USAGE_ANALYZE = "Usage: mitigator analyze [OPTIONS] <DATASET>";
constexpr const char* USAGE_LINT = "Usage: mitigator lint <CATALOG>";
constexpr const char* USAGE_CATALOG = "Usage: mitigator catalog [OPTIONS]";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

std::string usage_error(const std::string& error_msg, const char* usage) {
    return "error: " + error_msg + "\n\n" + usage + "\n\nFor more information, try '--help'.\n";
}

ParseResult fail(ParseResult result, const std::string& error_msg, const char* usage) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = usage_error(error_msg, usage);
    return result;
}

std::string missing_value(const char* option, const char* value_name) {
    return std::string("a value is required for '") + option + " <" + value_name +
           ">' but none was supplied";
}

std::string unexpected(const char* arg) {
    return std::string("unexpected argument '") + arg + "' found";
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("mitigator ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: mitigator [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  analyze  Analyse a labelled traffic dataset and recommend mitigations\n"
               "  lint     Lint a rule catalog to ensure that it loads correctly\n"
               "  catalog  Print the rule catalog in effect\n"
               "  help     Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner  Hide the banner\n"
               "  -v...            Print verbose output\n"
               "  -q               Suppress informational output\n"
               "  -h, --help       Print help\n"
               "  -V, --version    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Analyse a dataset with the built-in catalog:\n"
               "        ./mitigator analyze data/traffic.csv\n"
               "\n"
               "    Analyse with a custom catalog and output JSON:\n"
               "        ./mitigator analyze data/traffic.jsonl -r rules/catalog.yml --json\n"
               "\n"
               "    Save a report into the outputs directory:\n"
               "        ./mitigator analyze data/traffic.csv -c config.yml --save\n";
    } else if (*command == "analyze") {
        return "Analyse a labelled traffic dataset and recommend mitigations\n"
               "\n"
               "Usage: mitigator analyze [OPTIONS] <DATASET>\n"
               "\n"
               "Arguments:\n"
               "  <DATASET>  Dataset with labelled records (.csv, .json or .jsonl)\n"
               "\n"
               "Options:\n"
               "  -r, --rules <CATALOG>   A rule catalog to use instead of the built-in one\n"
               "  -c, --config <CONFIG>   A configuration file\n"
               "  -j, --json              Output as JSON\n"
               "      --jsonl             Output as JSON lines\n"
               "      --csv               Output as CSV\n"
               "  -o, --output <OUTPUT>   Save output to a file\n"
               "  -s, --signals           Print detector signals\n"
               "      --save              Save a JSON report into the outputs directory\n"
               "      --sort-before-diff  Order anomalies by time before interval analysis\n"
               "  -h, --help              Print help\n";
    } else if (*command == "lint") {
        return "Lint a rule catalog to ensure that it loads correctly\n"
               "\n"
               "Usage: mitigator lint <CATALOG>\n"
               "\n"
               "Arguments:\n"
               "  <CATALOG>  The path to a rule catalog (.yml, .yaml or .json)\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    } else if (*command == "catalog") {
        return "Print the rule catalog in effect\n"
               "\n"
               "Usage: mitigator catalog [OPTIONS]\n"
               "\n"
               "Options:\n"
               "  -r, --rules <CATALOG>  A rule catalog to print instead of the built-in one\n"
               "  -j, --json             Output as JSON\n"
               "  -h, --help             Print help\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (arg[0] == '-' && arg[1] == 'v' && arg[1 + std::strspn(arg + 1, "v")] == '\0') {
            // -v, -vv, -vvv
            result.global.verbose += static_cast<int>(std::strlen(arg) - 1);
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] != '-') {
            cmd_idx = i;
            break;
        } else {
            return fail(result, unexpected(arg), USAGE_MAIN);
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "analyze")) {
        AnalyzeCommand analyze_cmd;
        bool have_dataset = false;
        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];
            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"analyze"};
                return result;
            } else if (str_eq(arg, "-r") || str_eq(arg, "--rules")) {
                if (i + 1 >= argc) {
                    return fail(result, missing_value("--rules", "CATALOG"), USAGE_ANALYZE);
                }
                analyze_cmd.rules = platform::path_from_utf8(argv[++i]);
            } else if (str_eq(arg, "-c") || str_eq(arg, "--config")) {
                if (i + 1 >= argc) {
                    return fail(result, missing_value("--config", "CONFIG"), USAGE_ANALYZE);
                }
                analyze_cmd.config = platform::path_from_utf8(argv[++i]);
            } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
                if (i + 1 >= argc) {
                    return fail(result, missing_value("--output", "OUTPUT"), USAGE_ANALYZE);
                }
                analyze_cmd.output = platform::path_from_utf8(argv[++i]);
            } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
                analyze_cmd.json = true;
            } else if (str_eq(arg, "--jsonl")) {
                analyze_cmd.jsonl = true;
            } else if (str_eq(arg, "--csv")) {
                analyze_cmd.csv = true;
            } else if (str_eq(arg, "-s") || str_eq(arg, "--signals")) {
                analyze_cmd.signals = true;
            } else if (str_eq(arg, "--save")) {
                analyze_cmd.save = true;
            } else if (str_eq(arg, "--sort-before-diff")) {
                analyze_cmd.sort_before_diff = true;
            } else if (str_eq(arg, "-q")) {
                result.global.quiet = true;
            } else if (arg[0] != '-') {
                if (have_dataset) {
                    return fail(result, unexpected(arg), USAGE_ANALYZE);
                }
                analyze_cmd.dataset = platform::path_from_utf8(arg);
                have_dataset = true;
            } else {
                return fail(result, unexpected(arg), USAGE_ANALYZE);
            }
        }

        const int formats = static_cast<int>(analyze_cmd.json) +
                            static_cast<int>(analyze_cmd.jsonl) + static_cast<int>(analyze_cmd.csv);
        if (formats > 1) {
            return fail(result, "the arguments '--json', '--jsonl' and '--csv' cannot be combined",
                        USAGE_ANALYZE);
        }

        if (!have_dataset) {
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message =
                std::string("error: the following required arguments were not provided:\n"
                            "  <DATASET>\n\n") +
                USAGE_ANALYZE + "\n\nFor more information, try '--help'.\n";
            return result;
        }

        result.ok = true;
        result.command = analyze_cmd;
    } else if (str_eq(cmd, "lint")) {
        LintCommand lint_cmd;
        bool have_path = false;
        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];
            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"lint"};
                return result;
            } else if (arg[0] != '-' && !have_path) {
                lint_cmd.path = platform::path_from_utf8(arg);
                have_path = true;
            } else {
                return fail(result, unexpected(arg), USAGE_LINT);
            }
        }

        if (!have_path) {
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message =
                std::string("error: the following required arguments were not provided:\n"
                            "  <CATALOG>\n\n") +
                USAGE_LINT + "\n\nFor more information, try '--help'.\n";
            return result;
        }

        result.ok = true;
        result.command = lint_cmd;
    } else if (str_eq(cmd, "catalog")) {
        CatalogCommand catalog_cmd;
        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];
            if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
                result.ok = true;
                result.command = HelpCommand{"catalog"};
                return result;
            } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
                catalog_cmd.json = true;
            } else if (str_eq(arg, "-r") || str_eq(arg, "--rules")) {
                if (i + 1 >= argc) {
                    return fail(result, missing_value("--rules", "CATALOG"), USAGE_CATALOG);
                }
                catalog_cmd.rules = platform::path_from_utf8(argv[++i]);
            } else {
                return fail(result, unexpected(arg), USAGE_CATALOG);
            }
        }
        result.ok = true;
        result.command = catalog_cmd;
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{std::string(argv[cmd_idx + 1])};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        return fail(result, std::string("unrecognized subcommand '") + cmd + "'", USAGE_MAIN);
    }

    return result;
}

}  // namespace mitigator::cli
