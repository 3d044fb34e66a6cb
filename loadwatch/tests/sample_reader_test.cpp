#include <gtest/gtest.h>

#include "loadwatch/analysis/sample_reader.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace loadwatch::analysis;

namespace {

// ============================================================================
// JTL CSV
// ============================================================================

TEST(JtlCsvReaderTest, LocatesColumnsByHeaderName) {
    std::istringstream in(
        "timeStamp,elapsed,label,responseCode,responseMessage,threadName,success,bytes\n"
        "1700000000000,120,GET /cart,200,OK,Thread Group 1-1,true,512\n"
        "1700000000100,340,\"POST /cart, checkout\",500,\"Internal, Error\",Thread Group 1-2,false,64\n"
        "1700000000200,80,GET /,200,OK,Thread Group 1-3,TRUE,100\n");

    auto batch = read_jtl_csv(in);
    ASSERT_TRUE(batch.has_value());
    ASSERT_EQ(batch->records.size(), 3u);
    EXPECT_EQ(batch->malformed_count, 0u);

    EXPECT_EQ(batch->records[0], (SampleRecord{1700000000000, 120.0, true}));
    EXPECT_EQ(batch->records[1], (SampleRecord{1700000000100, 340.0, false}));
    EXPECT_TRUE(batch->records[2].success);
}

TEST(JtlCsvReaderTest, ColumnOrderDoesNotMatter) {
    std::istringstream in(
        "success,label,elapsed,timeStamp\n"
        "1,a,15.5,10\n"
        "0,b,20,20\n");

    auto batch = read_jtl_csv(in);
    ASSERT_TRUE(batch.has_value());
    ASSERT_EQ(batch->records.size(), 2u);
    EXPECT_EQ(batch->records[0], (SampleRecord{10, 15.5, true}));
    EXPECT_EQ(batch->records[1], (SampleRecord{20, 20.0, false}));
}

TEST(JtlCsvReaderTest, MalformedRowsAreCountedAndSkipped) {
    std::istringstream in(
        "timeStamp,elapsed,success\n"
        "100,10,true\n"
        "abc,10,true\n"
        "200,-5,true\n"
        "300,10,maybe\n"
        "400,10\n"
        "\n"
        "500,\"10,true\n"
        "600,20,false\n");

    auto batch = read_jtl_csv(in);
    ASSERT_TRUE(batch.has_value());
    EXPECT_EQ(batch->records.size(), 2u);
    EXPECT_EQ(batch->malformed_count, 5u);
    ASSERT_EQ(batch->malformed.size(), 5u);
    EXPECT_EQ(batch->malformed[0].line_number, 3u);
    EXPECT_NE(batch->malformed[0].reason.find("timeStamp"), std::string::npos);
    EXPECT_EQ(batch->malformed[1].line_number, 4u);
    EXPECT_EQ(batch->malformed[2].line_number, 5u);
    EXPECT_EQ(batch->malformed[3].line_number, 6u);
    EXPECT_EQ(batch->malformed[4].line_number, 8u);
}

TEST(JtlCsvReaderTest, MalformedDetailsAreCapped) {
    std::ostringstream text;
    text << "timeStamp,elapsed,success\n";
    for (int i = 0; i < 50; ++i) {
        text << "x,1,true\n";
    }
    std::istringstream in(text.str());

    auto batch = read_jtl_csv(in);
    ASSERT_TRUE(batch.has_value());
    EXPECT_EQ(batch->malformed_count, 50u);
    EXPECT_EQ(batch->malformed.size(), SampleBatch::kMaxMalformedDetails);
}

TEST(JtlCsvReaderTest, MissingRequiredColumn) {
    std::istringstream in("timeStamp,label,success\n1,a,true\n");
    auto batch = read_jtl_csv(in);
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error(), ReaderError::MISSING_COLUMN);
}

TEST(JtlCsvReaderTest, EmptyInput) {
    std::istringstream in("\n  \n");
    auto batch = read_jtl_csv(in);
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error(), ReaderError::EMPTY_FILE);
}

TEST(JtlCsvReaderTest, HeaderOnlyYieldsEmptyBatch) {
    std::istringstream in("timeStamp,elapsed,success\n");
    auto batch = read_jtl_csv(in);
    ASSERT_TRUE(batch.has_value());
    EXPECT_TRUE(batch->records.empty());
}

TEST(JtlCsvReaderTest, MissingFile) {
    auto batch = read_jtl_csv(std::filesystem::path("/nonexistent/loadwatch/results.jtl"));
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error(), ReaderError::FILE_NOT_FOUND);
}

// ============================================================================
// JSON lines
// ============================================================================

TEST(JsonlReaderTest, ReadsCanonicalAndAliasedFields) {
    std::istringstream in(
        "{\"timeStamp\": 1000, \"elapsed\": 120, \"success\": true, \"label\": \"GET /\"}\n"
        "{\"timestamp_ms\": 2000, \"elapsed_ms\": 80.5, \"ok\": false}\n");

    auto batch = read_jsonl(in);
    ASSERT_TRUE(batch.has_value());
    ASSERT_EQ(batch->records.size(), 2u);
    EXPECT_EQ(batch->records[0], (SampleRecord{1000, 120.0, true}));
    EXPECT_EQ(batch->records[1], (SampleRecord{2000, 80.5, false}));
}

TEST(JsonlReaderTest, MalformedLines) {
    std::istringstream in(
        "{\"timeStamp\": 1000, \"elapsed\": 10, \"success\": true}\n"
        "not json\n"
        "[1, 2, 3]\n"
        "{\"timeStamp\": \"1000\", \"elapsed\": 10, \"success\": true}\n"
        "{\"timeStamp\": 1000, \"elapsed\": -1, \"success\": true}\n"
        "{\"timeStamp\": 1000, \"elapsed\": 10, \"success\": \"true\"}\n"
        "\n"
        "{\"timeStamp\": 3000, \"elapsed\": 30, \"success\": false}\n");

    auto batch = read_jsonl(in);
    ASSERT_TRUE(batch.has_value());
    EXPECT_EQ(batch->records.size(), 2u);
    EXPECT_EQ(batch->malformed_count, 5u);
    EXPECT_EQ(batch->malformed.front().line_number, 2u);
    EXPECT_EQ(batch->malformed.back().line_number, 6u);
}

TEST(JsonlReaderTest, TimestampBeyondInt64IsMalformed) {
    std::istringstream in(
        "{\"timeStamp\": 18446744073709551615, \"elapsed\": 1, \"success\": true}\n"
        "{\"timeStamp\": 9223372036854775808, \"elapsed\": 1, \"success\": true}\n"
        "{\"timeStamp\": 9223372036854775807, \"elapsed\": 1, \"success\": true}\n");

    auto batch = read_jsonl(in);
    ASSERT_TRUE(batch.has_value());
    ASSERT_EQ(batch->records.size(), 1u);
    EXPECT_EQ(batch->records[0].timestamp_ms, 9223372036854775807);
    EXPECT_EQ(batch->malformed_count, 2u);
    EXPECT_EQ(batch->malformed.front().line_number, 1u);
    EXPECT_EQ(batch->malformed.front().reason, "timeStamp out of range");
}

TEST(JsonlReaderTest, EmptyInput) {
    std::istringstream in("");
    auto batch = read_jsonl(in);
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error(), ReaderError::EMPTY_FILE);
}

// ============================================================================
// Dispatch
// ============================================================================

class ReadSamplesTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("loadwatch_reader_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path dir_;
};

TEST_F(ReadSamplesTest, DispatchesOnExtension) {
    auto jsonl = write("run.JSONL", "{\"timeStamp\": 1, \"elapsed\": 2, \"success\": true}\n");
    auto ndjson = write("run.ndjson", "{\"timeStamp\": 1, \"elapsed\": 2, \"success\": true}\n");
    auto jtl = write("run.jtl", "timeStamp,elapsed,success\n1,2,true\n3,4,false\n");

    auto from_jsonl = read_samples(jsonl);
    ASSERT_TRUE(from_jsonl.has_value());
    EXPECT_EQ(from_jsonl->records.size(), 1u);

    auto from_ndjson = read_samples(ndjson);
    ASSERT_TRUE(from_ndjson.has_value());
    EXPECT_EQ(from_ndjson->records.size(), 1u);

    auto from_jtl = read_samples(jtl);
    ASSERT_TRUE(from_jtl.has_value());
    EXPECT_EQ(from_jtl->records.size(), 2u);
}

TEST_F(ReadSamplesTest, CsvContentInJsonlFileIsMalformed) {
    auto path = write("wrong.jsonl", "timeStamp,elapsed,success\n1,2,true\n");
    auto batch = read_samples(path);
    ASSERT_TRUE(batch.has_value());
    EXPECT_TRUE(batch->records.empty());
    EXPECT_EQ(batch->malformed_count, 2u);
}

TEST(ReaderErrorTest, Messages) {
    EXPECT_NE(std::string(to_string(ReaderError::MISSING_COLUMN)).find("timeStamp"), std::string::npos);
    EXPECT_STRNE(to_string(ReaderError::FILE_NOT_FOUND), "");
}

} // namespace
