#include "loadwatch/metrics/process_stats.h"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#ifdef __linux__
#include <malloc.h>
#include <unistd.h>
#endif

namespace loadwatch::metrics {

namespace {

#ifdef __linux__

/// Reads "VmRSS:" style lines from /proc/self/status, returning bytes
std::size_t read_status_kb(const std::string& key) {
    std::ifstream status_file("/proc/self/status");
    if (!status_file.is_open()) return 0;

    std::string line;
    while (std::getline(status_file, line)) {
        if (line.rfind(key, 0) == 0) {
            std::istringstream iss(line.substr(key.size()));
            std::size_t size = 0;
            std::string unit;
            if (iss >> size >> unit && unit == "kB") {
                return size * 1024;
            }
            return size;
        }
    }
    return 0;
}

/// Fields 14, 15 (utime, stime) and 22 (starttime) of /proc/self/stat
bool read_stat_times(double& cpu_seconds, double& start_since_boot) {
    std::ifstream stat_file("/proc/self/stat");
    if (!stat_file.is_open()) return false;

    std::string content;
    std::getline(stat_file, content);

    // comm (field 2) may contain spaces; resume after its closing parenthesis
    auto close = content.rfind(')');
    if (close == std::string::npos) return false;

    std::istringstream iss(content.substr(close + 2));
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field) {
        fields.push_back(field);
    }
    // fields[0] is field 3 (state)
    if (fields.size() < 20) return false;

    long ticks = sysconf(_SC_CLK_TCK);
    if (ticks <= 0) return false;

    try {
        double utime = std::stod(fields[11]);
        double stime = std::stod(fields[12]);
        double starttime = std::stod(fields[19]);
        cpu_seconds = (utime + stime) / static_cast<double>(ticks);
        start_since_boot = starttime / static_cast<double>(ticks);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

double read_boot_time_seconds() {
    std::ifstream stat_file("/proc/stat");
    std::string line;
    while (std::getline(stat_file, line)) {
        if (line.rfind("btime ", 0) == 0) {
            try {
                return std::stod(line.substr(6));
            } catch (const std::exception&) {
                return 0.0;
            }
        }
    }
    return 0.0;
}

std::size_t count_open_fds() {
    std::error_code ec;
    std::size_t count = 0;
    for (std::filesystem::directory_iterator it("/proc/self/fd", ec), end; !ec && it != end;
         it.increment(ec)) {
        ++count;
    }
    return count;
}

#endif

} // namespace

ProcessStats read_process_stats() {
    ProcessStats stats;

#ifdef __linux__
    stats.resident_memory_bytes = read_status_kb("VmRSS:");
    stats.virtual_memory_bytes = read_status_kb("VmSize:");

    struct mallinfo2 info = mallinfo2();
    stats.heap_used_bytes = info.uordblks + info.hblkhd;
    stats.heap_total_bytes = info.arena + info.hblkhd;

    double cpu_seconds = 0.0;
    double start_since_boot = 0.0;
    if (read_stat_times(cpu_seconds, start_since_boot)) {
        stats.cpu_seconds_total = cpu_seconds;
        double boot = read_boot_time_seconds();
        if (boot > 0.0) {
            stats.start_time_seconds = boot + start_since_boot;
        }
    }

    stats.open_fds = count_open_fds();
#endif

    return stats;
}

void register_process_metrics(MetricsRegistry& registry, ProcessStatsProvider provider) {
    auto shared = std::make_shared<ProcessStatsProvider>(std::move(provider));

    auto bind = [&registry, shared](const std::string& name, const std::string& help,
                                    auto field) {
        registry.add_gauge(name, help).set_collect([shared, field]() {
            return static_cast<double>(field((*shared)()));
        });
    };

    bind("process_resident_memory_bytes", "Resident memory size in bytes.",
         [](const ProcessStats& s) { return s.resident_memory_bytes; });
    bind("process_virtual_memory_bytes", "Virtual memory size in bytes.",
         [](const ProcessStats& s) { return s.virtual_memory_bytes; });
    bind("process_cpu_seconds_total", "Total user and system CPU time spent in seconds.",
         [](const ProcessStats& s) { return s.cpu_seconds_total; });
    bind("process_open_fds", "Number of open file descriptors.",
         [](const ProcessStats& s) { return s.open_fds; });
    bind("process_start_time_seconds", "Start time of the process since unix epoch in seconds.",
         [](const ProcessStats& s) { return s.start_time_seconds; });
    bind("process_heap_usage_ratio", "Heap usage as a ratio of heap obtained from the system",
         [](const ProcessStats& s) { return s.heap_usage_ratio(); });
}

} // namespace loadwatch::metrics
