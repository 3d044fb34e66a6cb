#pragma once

#include "loadwatch/analysis/sample_record.h"

#include <expected>
#include <filesystem>
#include <istream>
#include <string>

namespace loadwatch::analysis {

enum class ReaderError : int {
    FILE_NOT_FOUND = 0,
    EMPTY_FILE = 1,          ///< No header line
    MISSING_COLUMN = 2,      ///< Header lacks timeStamp, elapsed or success
    UNSUPPORTED_FORMAT = 3   ///< Header could not be parsed
};

[[nodiscard]] const char* to_string(ReaderError error) noexcept;

/**
 * @brief Read a JMeter JTL CSV result file
 *
 * Columns are located by header name (timeStamp, elapsed, success); any other
 * columns are ignored. Rows that cannot be converted are counted as malformed
 * and skipped. Line numbers are 1-based and include the header.
 */
[[nodiscard]] std::expected<SampleBatch, ReaderError> read_jtl_csv(std::istream& in);
[[nodiscard]] std::expected<SampleBatch, ReaderError> read_jtl_csv(const std::filesystem::path& path);

/**
 * @brief Read newline-delimited JSON samples
 *
 * Each line is an object with timeStamp (or timestamp_ms), elapsed (or
 * elapsed_ms) and a boolean success (or ok). Lines that are not valid JSON or lack a
 * field of the right type are malformed.
 */
[[nodiscard]] std::expected<SampleBatch, ReaderError> read_jsonl(std::istream& in);
[[nodiscard]] std::expected<SampleBatch, ReaderError> read_jsonl(const std::filesystem::path& path);

/**
 * @brief Dispatch on extension: .jsonl / .ndjson use read_jsonl, anything else read_jtl_csv
 */
[[nodiscard]] std::expected<SampleBatch, ReaderError> read_samples(const std::filesystem::path& path);

} // namespace loadwatch::analysis
