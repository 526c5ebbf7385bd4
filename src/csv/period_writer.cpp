// EN: Implementation of the period writer
// FR: Implémentation du writer de périodes

#include "csv/period_writer.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace VPR::CSV {

namespace {

nlohmann::json optionalToJson(const std::optional<std::string>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

} // namespace

std::optional<OutputFormat> parseOutputFormat(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "text") return OutputFormat::TEXT;
    if (lower == "ndjson" || lower == "json") return OutputFormat::NDJSON;
    return std::nullopt;
}

std::string outputFormatToString(OutputFormat format) {
    switch (format) {
        case OutputFormat::TEXT:   return "text";
        case OutputFormat::NDJSON: return "ndjson";
    }
    return "text";
}

PeriodWriter::PeriodWriter(std::ostream& output, OutputFormat format)
    : output_(output), format_(format) {}

void PeriodWriter::write(const ViewingPeriod& period) {
    switch (format_) {
        case OutputFormat::TEXT:
            output_ << formatText(period) << '\n';
            break;
        case OutputFormat::NDJSON:
            output_ << formatJsonLine(period) << '\n';
            break;
    }
    records_written_++;
}

void PeriodWriter::writeAll(const std::vector<ViewingPeriod>& periods) {
    for (const auto& period : periods) {
        write(period);
    }
}

void PeriodWriter::flush() {
    output_.flush();
}

std::string PeriodWriter::formatText(const ViewingPeriod& period) {
    std::ostringstream oss;
    oss << period;
    return oss.str();
}

// EN: Timestamps as RFC3339 strings, durations as integer milliseconds
// FR: Timestamps en chaînes RFC3339, durées en millisecondes entières
std::string PeriodWriter::formatJsonLine(const ViewingPeriod& period) {
    nlohmann::json json;
    json["provider"] = optionalToJson(period.provider);
    json["status"] = statusToString(period.status);
    json["user_id"] = period.user_id;
    json["query_time"] = formatRfc3339Millis(period.query_time);
    json["time_in_file"] = formatRfc3339Millis(period.time_in_file);
    json["end_time"] = formatRfc3339Millis(period.endTime());
    json["duration_ms"] = period.duration.count();
    json["offset_ms"] = period.offset().count();
    json["stream_id"] = optionalToJson(period.stream_id);
    json["entry_id"] = optionalToJson(period.entry_id);
    json["ber"] = period.ber;
    json["valid"] = period.valid;
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace VPR::CSV
