#include "loadwatch/analysis/sample_reader.h"
#include "loadwatch/utils/logger.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

namespace loadwatch::analysis {

const char* to_string(ReaderError error) noexcept {
    switch (error) {
        case ReaderError::FILE_NOT_FOUND:     return "input file not found or unreadable";
        case ReaderError::EMPTY_FILE:         return "input has no header line";
        case ReaderError::MISSING_COLUMN:     return "header lacks a required column (timeStamp, elapsed, success)";
        case ReaderError::UNSUPPORTED_FORMAT: return "input format not recognised";
    }
    return "unknown reader error";
}

namespace {

void trim_inplace(std::string& s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    s = s.substr(start, end - start);
}

/**
 * Splits one CSV line. Quoted fields may contain commas; "" inside quotes is
 * a literal quote. Returns false on an unterminated quote.
 */
bool split_csv_line(const std::string& line, std::vector<std::string>& out) {
    out.clear();

    std::string field;
    field.reserve(line.size());
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        if (c == '"') {
            in_quotes = true;
            continue;
        }

        if (c == ',') {
            trim_inplace(field);
            out.push_back(field);
            field.clear();
            continue;
        }

        field.push_back(c);
    }

    if (in_quotes) {
        return false;
    }

    trim_inplace(field);
    out.push_back(field);
    return true;
}

std::optional<std::int64_t> to_int64(const std::string& s) {
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> to_elapsed(const std::string& s) {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) {
        return std::nullopt;
    }
    if (!std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> to_success(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "true" || s == "1") return true;
    if (s == "false" || s == "0") return false;
    return std::nullopt;
}

std::optional<std::size_t> find_column(const std::vector<std::string>& header, const std::string& name) {
    auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - header.begin());
}

void log_summary(const char* format, const SampleBatch& batch) {
    auto& logger = LoggerFactory::get_logger("reader");
    logger.with_field("format", format)
          .with_field("records", batch.records.size())
          .with_field("malformed", batch.malformed_count)
          .debug("samples loaded");
    if (batch.malformed_count > 0) {
        const auto& first = batch.malformed.front();
        logger.with_field("first_line", first.line_number)
              .warn("skipped " + std::to_string(batch.malformed_count) +
                    " malformed rows; first: " + first.reason);
    }
}

} // namespace

// ============================================================================
// JTL CSV
// ============================================================================

std::expected<SampleBatch, ReaderError> read_jtl_csv(std::istream& in) {
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        trim_inplace(line);
        if (!line.empty()) break;
    }
    if (line.empty()) {
        return std::unexpected(ReaderError::EMPTY_FILE);
    }

    std::vector<std::string> header;
    if (!split_csv_line(line, header)) {
        return std::unexpected(ReaderError::UNSUPPORTED_FORMAT);
    }

    auto ts_col = find_column(header, "timeStamp");
    auto elapsed_col = find_column(header, "elapsed");
    auto success_col = find_column(header, "success");
    if (!ts_col || !elapsed_col || !success_col) {
        return std::unexpected(ReaderError::MISSING_COLUMN);
    }
    const std::size_t needed = std::max({*ts_col, *elapsed_col, *success_col}) + 1;

    SampleBatch batch;
    std::vector<std::string> cols;

    while (std::getline(in, line)) {
        ++line_no;

        std::string probe = line;
        trim_inplace(probe);
        if (probe.empty()) continue;

        if (!split_csv_line(line, cols)) {
            batch.add_malformed(line_no, "unterminated quoted field");
            continue;
        }
        if (cols.size() < needed) {
            batch.add_malformed(line_no, "expected at least " + std::to_string(needed) +
                                         " columns, got " + std::to_string(cols.size()));
            continue;
        }

        auto ts = to_int64(cols[*ts_col]);
        if (!ts) {
            batch.add_malformed(line_no, "invalid timeStamp '" + cols[*ts_col] + "'");
            continue;
        }
        auto elapsed = to_elapsed(cols[*elapsed_col]);
        if (!elapsed) {
            batch.add_malformed(line_no, "invalid elapsed '" + cols[*elapsed_col] + "'");
            continue;
        }
        auto success = to_success(cols[*success_col]);
        if (!success) {
            batch.add_malformed(line_no, "invalid success flag '" + cols[*success_col] + "'");
            continue;
        }

        batch.records.push_back({*ts, *elapsed, *success});
    }

    log_summary("jtl", batch);
    return batch;
}

std::expected<SampleBatch, ReaderError> read_jtl_csv(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(ReaderError::FILE_NOT_FOUND);
    }
    return read_jtl_csv(in);
}

// ============================================================================
// JSON lines
// ============================================================================

namespace {

const nlohmann::json* field_of(const nlohmann::json& obj, const char* primary, const char* alternate) {
    if (auto it = obj.find(primary); it != obj.end()) return &*it;
    if (auto it = obj.find(alternate); it != obj.end()) return &*it;
    return nullptr;
}

} // namespace

std::expected<SampleBatch, ReaderError> read_jsonl(std::istream& in) {
    SampleBatch batch;
    std::string line;
    std::size_t line_no = 0;
    bool any_content = false;

    while (std::getline(in, line)) {
        ++line_no;

        std::string probe = line;
        trim_inplace(probe);
        if (probe.empty()) continue;
        any_content = true;

        auto obj = nlohmann::json::parse(probe, nullptr, false);
        if (obj.is_discarded() || !obj.is_object()) {
            batch.add_malformed(line_no, "not a JSON object");
            continue;
        }

        const auto* ts = field_of(obj, "timeStamp", "timestamp_ms");
        if (ts == nullptr || !ts->is_number_integer()) {
            batch.add_malformed(line_no, "missing or non-integer timeStamp");
            continue;
        }
        // Unsigned values past int64 would wrap in get<int64_t>
        if (ts->is_number_unsigned() &&
            ts->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            batch.add_malformed(line_no, "timeStamp out of range");
            continue;
        }
        const auto* elapsed = field_of(obj, "elapsed", "elapsed_ms");
        if (elapsed == nullptr || !elapsed->is_number()) {
            batch.add_malformed(line_no, "missing or non-numeric elapsed");
            continue;
        }
        const auto* success = field_of(obj, "success", "ok");
        if (success == nullptr || !success->is_boolean()) {
            batch.add_malformed(line_no, "missing or non-boolean success");
            continue;
        }

        double elapsed_ms = elapsed->get<double>();
        if (!std::isfinite(elapsed_ms) || elapsed_ms < 0.0) {
            batch.add_malformed(line_no, "negative elapsed");
            continue;
        }

        batch.records.push_back({ts->get<std::int64_t>(), elapsed_ms, success->get<bool>()});
    }

    if (!any_content) {
        return std::unexpected(ReaderError::EMPTY_FILE);
    }

    log_summary("jsonl", batch);
    return batch;
}

std::expected<SampleBatch, ReaderError> read_jsonl(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(ReaderError::FILE_NOT_FOUND);
    }
    return read_jsonl(in);
}

std::expected<SampleBatch, ReaderError> read_samples(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".jsonl" || ext == ".ndjson") {
        return read_jsonl(path);
    }
    return read_jtl_csv(path);
}

} // namespace loadwatch::analysis
