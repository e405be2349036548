// ==============================================================================
// test_config_gtest.cpp - Тесты конфигурации (GoogleTest)
// ==============================================================================

#include "mitigator/config.hpp"
#include "mitigator/output.hpp"
#include "mitigator/platform.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <optional>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace mitigator::config::test {

namespace {

fs::path fixture(const std::string& name) {
    return fs::path(__FILE__).parent_path() / "fixtures" / "config" / name;
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // anonymous namespace

class ConfigTestFixture : public ::testing::Test {
protected:
    void SetUp() override {
        // Уникальный каталог на тест для параллельного запуска
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("mitigator_config_") + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );
        temp_dir_ = fs::temp_directory_path() / unique_name;

        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    fs::path temp_dir_;
};

// ==============================================================================
// Загрузка
// ==============================================================================

TEST(ConfigTest, Defaults) {
    const Config config;
    EXPECT_EQ(config.logging.directory, fs::path("logs"));
    EXPECT_EQ(config.logging.file_prefix, "security_logs");
    EXPECT_TRUE(config.logging.to_file);
    EXPECT_EQ(config.output_dir, fs::path("outputs"));
    EXPECT_EQ(config.data_dir, fs::path("data"));
    EXPECT_FALSE(config.catalog.has_value());
    EXPECT_FALSE(config.engine.sort_before_diff);
}

TEST(ConfigTest, Load_YamlWithCatalogFile) {
    auto result = load(fixture("config.yml"));
    ASSERT_TRUE(result.ok) << result.error.format();

    const Config& config = result.config;
    EXPECT_TRUE(config.engine.sort_before_diff);
    ASSERT_TRUE(config.catalog_path.has_value());
    EXPECT_EQ(config.catalog_path->filename(), fs::path("custom.yml"));
    ASSERT_TRUE(config.catalog.has_value());
    EXPECT_EQ(config.catalog->at(catalog::PatternType::TrafficSpike).description,
              "Volumetric surge detected");
}

TEST(ConfigTest, Load_InlineRulesWinOverCatalogFile) {
    auto result = load(fixture("inline.yml"));
    ASSERT_TRUE(result.ok) << result.error.format();

    const Config& config = result.config;
    EXPECT_FALSE(config.logging.to_file);
    ASSERT_TRUE(config.catalog.has_value());
    EXPECT_EQ(config.catalog->at(catalog::PatternType::TrafficSpike).description, "Inline spike");
}

TEST(ConfigTest, Load_Json) {
    auto result = load(fixture("config.json"));
    ASSERT_TRUE(result.ok) << result.error.format();

    const Config& config = result.config;
    EXPECT_EQ(config.logging.directory, fs::path("var/log"));
    EXPECT_EQ(config.logging.file_prefix, "mitigator");
    EXPECT_FALSE(config.logging.to_file);
    EXPECT_EQ(config.output_dir, fs::path("reports"));
    EXPECT_EQ(config.data_dir, fs::path("datasets"));
    EXPECT_FALSE(config.catalog.has_value());
}

TEST(ConfigTest, Load_MissingFile) {
    auto result = load(fixture("absent.yml"));
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("not found"), std::string::npos);
    EXPECT_NE(result.error.message.find("absent.yml"), std::string::npos);
}

TEST(ConfigTest, Parse_EmptyDocumentUsesDefaults) {
    auto result = parse("");
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.config.output_dir, fs::path("outputs"));
}

TEST(ConfigTest, Parse_WrongTypes) {
    auto not_bool = parse("logging:\n  to_file: sometimes\n");
    EXPECT_FALSE(not_bool.ok);
    EXPECT_NE(not_bool.error.message.find("logging.to_file"), std::string::npos);

    auto not_map = parse("engine: [1, 2]\n");
    EXPECT_FALSE(not_map.ok);
    EXPECT_NE(not_map.error.message.find("engine"), std::string::npos);

    auto not_string = parse("directories:\n  outputs: [a, b]\n");
    EXPECT_FALSE(not_string.ok);

    EXPECT_FALSE(parse("- just\n- a list\n").ok);
    EXPECT_FALSE(parse("logging: {directory: \"unterminated}\n").ok);
}

TEST(ConfigTest, Parse_InvalidInlineCatalog) {
    auto result = parse("mitigation_rules:\n  TRAFFIC_SPIKE: {description: a, recommendations: "
                        "[x], severity: HIGH}\n");
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("missing entry"), std::string::npos);
}

TEST(ConfigTest, Parse_RelativePathResolution) {
    const fs::path base = fixture("");
    auto result = parse("logging:\n  directory: var/log\n"
                        "directories:\n  outputs: reports\n  data: datasets\n"
                        "catalog: ../catalogs/custom.yml\n",
                        base);
    ASSERT_TRUE(result.ok) << result.error.format();

    // Каталог правил - от файла конфигурации
    ASSERT_TRUE(result.config.catalog_path.has_value());
    EXPECT_EQ(*result.config.catalog_path, base / "../catalogs/custom.yml");

    // Рабочие каталоги - от текущего каталога процесса
    EXPECT_EQ(result.config.logging.directory, fs::path("var/log"));
    EXPECT_EQ(result.config.output_dir, fs::path("reports"));
    EXPECT_EQ(result.config.data_dir, fs::path("datasets"));
}

TEST(ConfigTest, Parse_MissingCatalogFile) {
    auto result = parse("catalog: nowhere.yml\n", fixture(""));
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("could not open file"), std::string::npos);
}

// ==============================================================================
// Каталоги и журнал
// ==============================================================================

TEST(ConfigTest, RequiredDirectories_SkipsLogsWhenDisabled) {
    Config config;
    EXPECT_EQ(required_directories(config).size(), 3u);
    config.logging.to_file = false;
    const auto dirs = required_directories(config);
    ASSERT_EQ(dirs.size(), 2u);
    EXPECT_EQ(dirs[0], fs::path("outputs"));
    EXPECT_EQ(dirs[1], fs::path("data"));
}

TEST(ConfigTest, LogFilePath_UsesLocalDate) {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 2;
    tm.tm_mday = 15;
    tm.tm_hour = 12;
    tm.tm_isdst = -1;
    const std::time_t when = std::mktime(&tm);

    LoggingConfig logging;
    logging.directory = "logs";
    EXPECT_EQ(log_file_path(logging, when), fs::path("logs") / "security_logs_20240315.log");
}

TEST_F(ConfigTestFixture, EnsureDirectories_CreatesAndLogs) {
    Config config;
    config.logging.directory = temp_dir_ / "logs";
    config.output_dir = temp_dir_ / "outputs";
    config.data_dir = temp_dir_ / "nested" / "data";

    const fs::path log_path = temp_dir_ / "run.log";
    {
        output::OutputConfig out_cfg;
        out_cfg.quiet = true;
        out_cfg.log_path = log_path;
        output::Writer writer(out_cfg);
        ensure_directories(config, writer);
    }

    EXPECT_TRUE(fs::is_directory(temp_dir_ / "logs"));
    EXPECT_TRUE(fs::is_directory(temp_dir_ / "outputs"));
    EXPECT_TRUE(fs::is_directory(temp_dir_ / "nested" / "data"));

    const std::string log = read_file(log_path);
    EXPECT_NE(log.find(" - INFO - Ensured directory exists: "), std::string::npos);
    EXPECT_NE(log.find("outputs"), std::string::npos);
}

TEST_F(ConfigTestFixture, StartLogging_DirectoryMessagesReachLogFile) {
    Config config;
    config.logging.directory = temp_dir_ / "logs";
    config.logging.file_prefix = "security_logs";
    config.output_dir = temp_dir_ / "outputs";
    config.data_dir = temp_dir_ / "data";

    const std::time_t now = std::time(nullptr);
    std::optional<fs::path> log_path;
    {
        output::OutputConfig out_cfg;
        out_cfg.quiet = true;
        output::Writer writer(out_cfg);
        log_path = start_logging(config, writer, now);
        ASSERT_TRUE(writer.has_log_file());
    }

    ASSERT_TRUE(log_path.has_value());
    EXPECT_EQ(*log_path, log_file_path(config.logging, now));
    EXPECT_TRUE(fs::is_directory(temp_dir_ / "outputs"));
    EXPECT_TRUE(fs::is_directory(temp_dir_ / "data"));

    const std::string log = read_file(*log_path);
    for (const auto& dir : required_directories(config)) {
        EXPECT_NE(log.find(" - INFO - Ensured directory exists: " + platform::path_to_utf8(dir)),
                  std::string::npos)
            << log;
    }
}

TEST_F(ConfigTestFixture, StartLogging_DisabledOpensNoFile) {
    Config config;
    config.logging.to_file = false;
    config.logging.directory = temp_dir_ / "logs";
    config.output_dir = temp_dir_ / "outputs";
    config.data_dir = temp_dir_ / "data";

    output::OutputConfig out_cfg;
    out_cfg.quiet = true;
    output::Writer writer(out_cfg);
    EXPECT_FALSE(start_logging(config, writer, std::time(nullptr)).has_value());
    EXPECT_FALSE(writer.has_log_file());
    EXPECT_FALSE(fs::exists(temp_dir_ / "logs"));
    EXPECT_TRUE(fs::is_directory(temp_dir_ / "outputs"));
}

TEST_F(ConfigTestFixture, EnsureDirectories_ExistingIsNotAnError) {
    Config config;
    config.logging.to_file = false;
    config.output_dir = temp_dir_;
    config.data_dir = temp_dir_;

    output::OutputConfig out_cfg;
    out_cfg.quiet = true;
    output::Writer writer(out_cfg);
    EXPECT_NO_THROW(ensure_directories(config, writer));
}

}  // namespace mitigator::config::test
