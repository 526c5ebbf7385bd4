// EN: Implementation of the record normalizer: alias dispatch, cell parsing and derivation rules
// FR: Implémentation du normaliseur : dispatch des alias, analyse des cellules et règles de dérivation

#include "csv/record_normalizer.hpp"

#include "csv/field_parsers.hpp"
#include "csv/reader_errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <unordered_map>

namespace VPR::CSV {

Header RecordNormalizer::parseHeader(const std::string& line, char delimiter) {
    return splitLine(line, delimiter);
}

std::vector<std::string> RecordNormalizer::splitLine(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true) {
        const std::size_t pos = line.find(delimiter, start);
        if (pos == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

ViewingPeriod RecordNormalizer::normalize(const Header& header, const std::vector<std::string>& values,
                                          std::size_t line_number) {
    RowAccumulator row;
    const std::size_t pair_count = std::min(header.size(), values.size());

    for (std::size_t i = 0; i < pair_count; ++i) {
        const std::string& column = header[i];
        const std::string value = cleanCellValue(values[i]);

        auto action = resolveColumn(column);
        if (!action) {
            stats_.unrecognized_columns++;
            const std::unordered_map<std::string, std::string> metadata = {
                {"column", column}, {"line", std::to_string(line_number)}};
            LOG_WARN_META("record_normalizer", "unrecognised field key " + column, metadata);
        } else {
            try {
                applyCell(row, *action, value, line_number);
            } catch (const FieldParseError& e) {
                // EN: Attribute the failure to the producer's column name and the input line
                // FR: Attribue l'échec au nom de colonne du producteur et à la ligne d'entrée
                throw e.withLocation(column, line_number);
            }
        }

        applyDerivations(row);
    }

    stats_.rows_normalized++;
    return row.period;
}

ViewingPeriod RecordNormalizer::normalizeLine(const Header& header, const std::string& line, char delimiter,
                                              std::size_t line_number) {
    return normalize(header, splitLine(line, delimiter), line_number);
}

void RecordNormalizer::applyCell(RowAccumulator& row, ColumnAction action, const std::string& value,
                                 std::size_t line_number) {
    ViewingPeriod& period = row.period;

    switch (action) {
        case ColumnAction::SetStatus: {
            auto status = parseStatus(value);
            if (status) {
                period.status = *status;
            } else {
                stats_.invalid_status_values++;
                const std::unordered_map<std::string, std::string> metadata = {
                    {"value", value}, {"line", std::to_string(line_number)}};
                LOG_WARN_META("record_normalizer", "failed to parse status '" + value + "'", metadata);
            }
            break;
        }
        case ColumnAction::SetUserId:
            period.user_id = value;
            break;
        case ColumnAction::SetTimeInFileFromEpochMillis:
            period.time_in_file = parseEpochMillis(value);
            break;
        case ColumnAction::SetQueryTimeFromEpochMillis:
            period.query_time = parseEpochMillis(value);
            row.query_time_assigned = true;
            break;
        case ColumnAction::SetQueryTimeFromDateTime:
            period.query_time = parseDateTime(value);
            row.query_time_assigned = true;
            break;
        case ColumnAction::SetDurationFromMillis:
            period.duration = durationFromMillis(value);
            break;
        case ColumnAction::SetDurationFromSeconds:
            period.duration = durationFromSeconds(value);
            break;
        case ColumnAction::SetStreamId:
            period.stream_id = value;
            break;
        case ColumnAction::SetProvider:
            period.provider = value;
            break;
        case ColumnAction::SetEntryId:
            period.entry_id = value;
            break;
        case ColumnAction::SetBer:
            period.ber = parseBer(value);
            break;
        case ColumnAction::SetValid:
            period.valid = parseValid(value);
            break;
        case ColumnAction::SetOffsetFromMillis:
            row.pending_offset = durationFromMillis(value);
            break;
        case ColumnAction::SetOffsetFromSeconds:
            row.pending_offset = durationFromSeconds(value);
            break;
        case ColumnAction::SetEndTimeFromDateTime:
            row.pending_end_time = parseDateTime(value);
            break;
    }
}

void RecordNormalizer::applyDerivations(RowAccumulator& row) {
    ViewingPeriod& period = row.period;

    if (row.pending_offset && row.query_time_assigned) {
        period.time_in_file = period.query_time - *row.pending_offset;
    }
    if (row.pending_end_time && row.query_time_assigned) {
        period.duration = *row.pending_end_time - period.query_time;
    }
    if (period.stream_id && !isNoMatchStreamId(*period.stream_id)) {
        period.status = Status::Match;
    }
}

} // namespace VPR::CSV
