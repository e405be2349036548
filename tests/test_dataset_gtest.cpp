// ==============================================================================
// test_dataset_gtest.cpp - Тесты загрузки наборов записей (GoogleTest)
// ==============================================================================

#include "mitigator/dataset.hpp"
#include "mitigator/engine.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>

namespace mitigator::io::test {

namespace {

std::filesystem::path fixture(const std::string& name) {
    return std::filesystem::path(__FILE__).parent_path() / "fixtures" / "datasets" / name;
}

bool same_records(const Record& a, const Record& b) {
    return a.timestamp == b.timestamp && a.bytes_transferred == b.bytes_transferred &&
           a.protocol == b.protocol && a.label == b.label;
}

}  // anonymous namespace

// ==============================================================================
// Формат
// ==============================================================================

TEST(DatasetTest, FormatFromPath) {
    EXPECT_EQ(dataset_format_from_path("traffic.csv"), DatasetFormat::Csv);
    EXPECT_EQ(dataset_format_from_path("TRAFFIC.CSV"), DatasetFormat::Csv);
    EXPECT_EQ(dataset_format_from_path("a/b/traffic.json"), DatasetFormat::Json);
    EXPECT_EQ(dataset_format_from_path("traffic.jsonl"), DatasetFormat::Jsonl);
    EXPECT_EQ(dataset_format_from_path("traffic.parquet"), DatasetFormat::Unknown);
    EXPECT_EQ(dataset_format_from_path("traffic"), DatasetFormat::Unknown);
    EXPECT_STREQ(dataset_format_to_string(DatasetFormat::Jsonl), "jsonl");
}

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

TEST(DatasetTest, ParseBytes) {
    EXPECT_EQ(parse_bytes("1024"), 1024.0);
    EXPECT_EQ(parse_bytes(" 12.5 "), 12.5);
    EXPECT_EQ(parse_bytes("1e3"), 1000.0);
    EXPECT_FALSE(parse_bytes("").has_value());
    EXPECT_FALSE(parse_bytes("abc").has_value());
    EXPECT_FALSE(parse_bytes("12kb").has_value());
    EXPECT_FALSE(parse_bytes("inf").has_value());
    EXPECT_FALSE(parse_bytes("nan").has_value());
}

TEST(DatasetTest, SplitCsvLine) {
    auto cells = split_csv_line("a,\"b,c\",\"d \"\"e\"\"\",");
    ASSERT_TRUE(cells.has_value());
    ASSERT_EQ(cells->size(), 4u);
    EXPECT_EQ((*cells)[0], "a");
    EXPECT_EQ((*cells)[1], "b,c");
    EXPECT_EQ((*cells)[2], "d \"e\"");
    EXPECT_EQ((*cells)[3], "");

    EXPECT_FALSE(split_csv_line("a,\"unterminated").has_value());
}

// ==============================================================================
// CSV
// ==============================================================================

TEST(DatasetTest, LoadCsv) {
    auto result = load_dataset(fixture("traffic_spike.csv"));
    ASSERT_TRUE(result.ok) << result.error.format();
    ASSERT_EQ(result.dataset.size(), 7u);

    const Record& first = result.dataset[0];
    EXPECT_EQ(first.timestamp, std::optional<std::string>("2024-03-01 00:00:00"));
    EXPECT_EQ(first.bytes_transferred, std::optional<double>(100.0));
    EXPECT_EQ(first.protocol, std::optional<std::string>("TCP"));
    EXPECT_TRUE(first.is_anomaly());
    EXPECT_FALSE(result.dataset[1].is_anomaly());
}

TEST(DatasetTest, ParseCsv_QuotingAndMissingValues) {
    auto result = load_dataset(fixture("quoted.csv"));
    ASSERT_TRUE(result.ok) << result.error.format();
    ASSERT_EQ(result.dataset.size(), 3u);

    EXPECT_EQ(result.dataset[0].bytes_transferred, std::optional<double>(1200.0));
    EXPECT_FALSE(result.dataset[1].bytes_transferred.has_value());
    EXPECT_FALSE(result.dataset[2].bytes_transferred.has_value());
    EXPECT_EQ(result.dataset[2].protocol, std::optional<std::string>("TCP"));
}

TEST(DatasetTest, ParseCsv_WrongCellCount_ReportsLine) {
    auto result = load_dataset(fixture("bad_row.csv"));
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("line 3"), std::string::npos);
    EXPECT_NE(result.error.format().find("bad_row.csv"), std::string::npos);
}

TEST(DatasetTest, ParseCsv_CrlfAndBlankLines) {
    auto result = parse_csv("timestamp,bytes_transferred,protocol,anomaly\r\n"
                            "\r\n"
                            "2024-03-01 00:00:00,5,TCP,Anomaly\r\n");
    ASSERT_TRUE(result.ok) << result.error.format();
    ASSERT_EQ(result.dataset.size(), 1u);
    EXPECT_EQ(result.dataset[0].protocol, std::optional<std::string>("TCP"));
    EXPECT_TRUE(result.dataset[0].is_anomaly());
}

TEST(DatasetTest, ParseCsv_LabelAliasAndMissingColumns) {
    auto result = parse_csv("protocol,anomaly_label\nUDP,Anomaly\nTCP,anomaly\n");
    ASSERT_TRUE(result.ok) << result.error.format();
    ASSERT_EQ(result.dataset.size(), 2u);
    EXPECT_TRUE(result.dataset[0].is_anomaly());
    // Метка сравнивается с учётом регистра
    EXPECT_FALSE(result.dataset[1].is_anomaly());
    EXPECT_FALSE(result.dataset[0].timestamp.has_value());
    EXPECT_FALSE(result.dataset[0].bytes_transferred.has_value());
}

TEST(DatasetTest, LabelWithSurroundingSpaces_IsNormalInEveryFormat) {
    auto csv = parse_csv("protocol,anomaly\n"
                         "TCP, Anomaly\n"
                         "TCP,Anomaly \n"
                         "TCP,\" Anomaly\"\n"
                         "TCP,Anomaly\n");
    ASSERT_TRUE(csv.ok) << csv.error.format();
    ASSERT_EQ(csv.dataset.size(), 4u);
    EXPECT_FALSE(csv.dataset[0].is_anomaly());
    EXPECT_FALSE(csv.dataset[1].is_anomaly());
    EXPECT_FALSE(csv.dataset[2].is_anomaly());
    EXPECT_TRUE(csv.dataset[3].is_anomaly());

    auto json = parse_json(R"([{"protocol": "TCP", "anomaly": " Anomaly"},
                               {"protocol": "TCP", "anomaly": "Anomaly"}])");
    ASSERT_TRUE(json.ok) << json.error.format();
    ASSERT_EQ(json.dataset.size(), 2u);
    EXPECT_FALSE(json.dataset[0].is_anomaly());
    EXPECT_TRUE(json.dataset[1].is_anomaly());

    auto jsonl = parse_jsonl("{\"anomaly_label\": \"Anomaly \"}\n");
    ASSERT_TRUE(jsonl.ok) << jsonl.error.format();
    ASSERT_EQ(jsonl.dataset.size(), 1u);
    EXPECT_FALSE(jsonl.dataset[0].is_anomaly());
}

TEST(DatasetTest, ParseCsv_Empty_Fails) {
    EXPECT_FALSE(parse_csv("").ok);
    EXPECT_FALSE(parse_csv("\n\n").ok);
}

TEST(DatasetTest, ParseCsv_HeaderOnly_IsEmptyDataset) {
    auto result = parse_csv("timestamp,bytes_transferred,protocol,anomaly\n");
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.dataset.empty());
}

// ==============================================================================
// JSON / JSONL
// ==============================================================================

TEST(DatasetTest, EquivalentInputsProduceSameRecords) {
    auto csv = load_dataset(fixture("traffic_spike.csv"));
    auto json = load_dataset(fixture("traffic_spike.json"));
    auto jsonl = load_dataset(fixture("traffic_spike.jsonl"));
    ASSERT_TRUE(csv.ok) << csv.error.format();
    ASSERT_TRUE(json.ok) << json.error.format();
    ASSERT_TRUE(jsonl.ok) << jsonl.error.format();

    ASSERT_EQ(csv.dataset.size(), json.dataset.size());
    ASSERT_EQ(csv.dataset.size(), jsonl.dataset.size());
    for (std::size_t i = 0; i < csv.dataset.size(); ++i) {
        EXPECT_TRUE(same_records(csv.dataset[i], json.dataset[i])) << "record " << i;
        EXPECT_TRUE(same_records(csv.dataset[i], jsonl.dataset[i])) << "record " << i;
    }
}

TEST(DatasetTest, LoadedDataset_RecommendsTrafficSpike) {
    auto result = load_dataset(fixture("traffic_spike.jsonl"));
    ASSERT_TRUE(result.ok) << result.error.format();

    const engine::MitigationEngine engine;
    const auto recs = engine.analyze(result.dataset);
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0].type, catalog::PatternType::TrafficSpike);
}

TEST(DatasetTest, ParseJson_SingleObject) {
    auto result = parse_json(
        R"({"timestamp": "2024-03-01T00:00:00Z", "bytes_transferred": 42, "protocol": "SSH", "anomaly": "Anomaly"})");
    ASSERT_TRUE(result.ok) << result.error.format();
    ASSERT_EQ(result.dataset.size(), 1u);
    EXPECT_EQ(result.dataset[0].bytes_transferred, std::optional<double>(42.0));
}

TEST(DatasetTest, ParseJson_WrongTypesAreAbsent) {
    auto result = parse_json(
        R"([{"timestamp": 1709251200, "bytes_transferred": "lots", "protocol": 6, "anomaly": true}])");
    ASSERT_TRUE(result.ok) << result.error.format();
    ASSERT_EQ(result.dataset.size(), 1u);
    const Record& r = result.dataset[0];
    EXPECT_FALSE(r.timestamp.has_value());
    EXPECT_FALSE(r.bytes_transferred.has_value());
    EXPECT_FALSE(r.protocol.has_value());
    EXPECT_FALSE(r.is_anomaly());
}

TEST(DatasetTest, ParseJson_Errors) {
    EXPECT_FALSE(parse_json("[{\"timestamp\": ").ok);
    EXPECT_FALSE(parse_json("42").ok);

    auto not_object = parse_json("[{}, 1]");
    EXPECT_FALSE(not_object.ok);
    EXPECT_NE(not_object.error.message.find("record 1"), std::string::npos);
}

TEST(DatasetTest, ParseJsonl_ReportsLineNumber) {
    auto result = parse_jsonl("{\"protocol\": \"TCP\"}\n\n{broken}\n");
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("line 3"), std::string::npos);
}

// ==============================================================================
// Ошибки загрузки
// ==============================================================================

TEST(DatasetTest, Load_UnknownExtension_Fails) {
    auto result = load_dataset(fixture("traffic.txt"));
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.message.find("unsupported file extension"), std::string::npos);
}

TEST(DatasetTest, Load_MissingFile_Fails) {
    auto result = load_dataset(fixture("missing.csv"));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.message, "could not open file");
}

}  // namespace mitigator::io::test
