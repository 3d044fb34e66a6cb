#pragma once

#include "loadwatch/metrics/registry.h"

#include <cstddef>
#include <functional>

namespace loadwatch::metrics {

/**
 * @brief Point-in-time resource usage of the serving process
 *
 * Fields that cannot be read on the current platform stay 0.
 */
struct ProcessStats {
    std::size_t resident_memory_bytes = 0;
    std::size_t virtual_memory_bytes = 0;
    std::size_t heap_used_bytes = 0;      ///< Bytes in allocated malloc chunks
    std::size_t heap_total_bytes = 0;     ///< Bytes obtained from the system by malloc
    double cpu_seconds_total = 0.0;       ///< User + system CPU time
    std::size_t open_fds = 0;
    double start_time_seconds = 0.0;      ///< Unix epoch seconds

    /// heap_used / heap_total, 0 when heap_total is 0
    [[nodiscard]] double heap_usage_ratio() const noexcept {
        return heap_total_bytes > 0
            ? static_cast<double>(heap_used_bytes) / static_cast<double>(heap_total_bytes)
            : 0.0;
    }
};

using ProcessStatsProvider = std::function<ProcessStats()>;

/**
 * @brief Read the current process' statistics from /proc and the allocator
 */
[[nodiscard]] ProcessStats read_process_stats();

/**
 * @brief Register process_* gauges whose values are pulled from provider at scrape time
 *
 * Registers process_resident_memory_bytes, process_virtual_memory_bytes,
 * process_cpu_seconds_total, process_open_fds, process_start_time_seconds and
 * process_heap_usage_ratio.
 */
void register_process_metrics(MetricsRegistry& registry,
                              ProcessStatsProvider provider = read_process_stats);

} // namespace loadwatch::metrics
