// EN: Implementation of the column alias table
// FR: Implémentation de la table d'alias de colonnes

#include "csv/column_alias.hpp"

#include <unordered_map>
#include <utility>

namespace VPR::CSV {

namespace {

// EN: Alias table in declaration order; many names map to one action
// FR: Table d'alias dans l'ordre de déclaration ; plusieurs noms pour une action
const std::vector<std::pair<std::string, ColumnAction>>& aliasTable() {
    static const std::vector<std::pair<std::string, ColumnAction>> table = {
        {"status", ColumnAction::SetStatus},
        {"Status", ColumnAction::SetStatus},

        {"userID", ColumnAction::SetUserId},
        {"rss_id", ColumnAction::SetUserId},
        {"DEVICE_ID", ColumnAction::SetUserId},

        {"timeInFile", ColumnAction::SetTimeInFileFromEpochMillis},

        {"tStartMsec", ColumnAction::SetQueryTimeFromEpochMillis},
        {"tStart", ColumnAction::SetQueryTimeFromEpochMillis},

        {"startTime", ColumnAction::SetQueryTimeFromDateTime},
        {"start_ts", ColumnAction::SetQueryTimeFromDateTime},
        {"START", ColumnAction::SetQueryTimeFromDateTime},

        {"durationMsec", ColumnAction::SetDurationFromMillis},
        {"duration", ColumnAction::SetDurationFromSeconds},

        {"stream_id", ColumnAction::SetStreamId},
        {"Stream_id", ColumnAction::SetStreamId},
        {"stream_name", ColumnAction::SetStreamId},
        {"name", ColumnAction::SetStreamId},
        {"STREAM_LABEL", ColumnAction::SetStreamId},

        {"module_ref", ColumnAction::SetProvider},

        {"period_id", ColumnAction::SetEntryId},
        {"id", ColumnAction::SetEntryId},

        {"bitErrorRate", ColumnAction::SetBer},
        {"ber", ColumnAction::SetBer},

        {"valid", ColumnAction::SetValid},

        {"offset", ColumnAction::SetOffsetFromMillis},
        {"offset_s", ColumnAction::SetOffsetFromSeconds},
        {"OFFSET", ColumnAction::SetOffsetFromSeconds},

        {"endTime", ColumnAction::SetEndTimeFromDateTime},
        {"stop_ts", ColumnAction::SetEndTimeFromDateTime},
        {"END", ColumnAction::SetEndTimeFromDateTime},
    };
    return table;
}

const std::unordered_map<std::string, ColumnAction>& aliasIndex() {
    static const std::unordered_map<std::string, ColumnAction> index(aliasTable().begin(), aliasTable().end());
    return index;
}

} // namespace

std::optional<ColumnAction> resolveColumn(const std::string& column_name) {
    const auto& index = aliasIndex();
    auto it = index.find(column_name);
    if (it == index.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> columnAliases(ColumnAction action) {
    std::vector<std::string> aliases;
    for (const auto& [name, mapped] : aliasTable()) {
        if (mapped == action) {
            aliases.push_back(name);
        }
    }
    return aliases;
}

std::string columnActionName(ColumnAction action) {
    switch (action) {
        case ColumnAction::SetStatus:                    return "status";
        case ColumnAction::SetUserId:                    return "user_id";
        case ColumnAction::SetTimeInFileFromEpochMillis: return "time_in_file";
        case ColumnAction::SetQueryTimeFromEpochMillis:  return "query_time";
        case ColumnAction::SetQueryTimeFromDateTime:     return "query_time";
        case ColumnAction::SetDurationFromMillis:        return "duration";
        case ColumnAction::SetDurationFromSeconds:       return "duration";
        case ColumnAction::SetStreamId:                  return "stream_id";
        case ColumnAction::SetProvider:                  return "provider";
        case ColumnAction::SetEntryId:                   return "entry_id";
        case ColumnAction::SetBer:                       return "ber";
        case ColumnAction::SetValid:                     return "valid";
        case ColumnAction::SetOffsetFromMillis:          return "offset";
        case ColumnAction::SetOffsetFromSeconds:         return "offset";
        case ColumnAction::SetEndTimeFromDateTime:       return "end_time";
    }
    return "unknown";
}

} // namespace VPR::CSV
