#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace loadwatch::analysis {

/**
 * @brief One completed request as recorded by the load-test harness
 */
struct SampleRecord {
    std::int64_t timestamp_ms = 0;   ///< Request start, epoch milliseconds
    double elapsed_ms = 0.0;         ///< Time to last byte
    bool success = false;

    bool operator==(const SampleRecord&) const = default;
};

/**
 * @brief A row that could not be turned into a SampleRecord
 */
struct MalformedRow {
    std::size_t line_number = 0;
    std::string reason;
};

/**
 * @brief Records of one run in original order, plus what was skipped
 */
struct SampleBatch {
    static constexpr std::size_t kMaxMalformedDetails = 20;

    std::vector<SampleRecord> records;
    std::size_t malformed_count = 0;
    std::vector<MalformedRow> malformed;   ///< First kMaxMalformedDetails rows only

    void add_malformed(std::size_t line_number, std::string reason) {
        ++malformed_count;
        if (malformed.size() < kMaxMalformedDetails) {
            malformed.push_back({line_number, std::move(reason)});
        }
    }
};

} // namespace loadwatch::analysis
