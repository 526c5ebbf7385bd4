// EN: Implementation of the ViewingPeriod helpers: status text, UTC calendar conversion and printing.
// FR: Implémentation des utilitaires ViewingPeriod : texte du statut, conversion calendaire UTC et affichage.

#include "types/viewing_period.hpp"

#include <iomanip>
#include <sstream>

namespace VPR {

namespace {

constexpr std::int64_t kMillisPerDay = 86400000;

// EN: Proleptic Gregorian date from days since 1970-01-01.
// FR: Date grégorienne proleptique depuis les jours écoulés depuis 1970-01-01.
void civilFromDays(std::int64_t days, std::int64_t& year, unsigned& month, unsigned& day) {
    days += 719468;
    const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const auto doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<std::int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0);
}

std::int64_t floorDiv(std::int64_t value, std::int64_t divisor) {
    std::int64_t quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

}  // namespace

std::string statusToString(Status status) {
    switch (status) {
        case Status::Match:   return "MATCH";
        case Status::NoMatch: return "NO_MATCH";
        case Status::NoData:  return "NO_DATA";
        case Status::NoSound: return "NO_SOUND";
    }
    return "NO_MATCH";
}

std::optional<Status> parseStatus(const std::string& value) {
    if (value == "MATCH") return Status::Match;
    if (value == "NO_MATCH") return Status::NoMatch;
    if (value == "NO_DATA") return Status::NoData;
    if (value == "NO_SOUND") return Status::NoSound;
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, Status status) {
    return os << statusToString(status);
}

Timestamp timestampFromEpochMillis(std::int64_t millis) {
    return Timestamp(Duration(millis));
}

std::int64_t toEpochMillis(const Timestamp& timestamp) {
    return timestamp.time_since_epoch().count();
}

std::string formatRfc3339Millis(const Timestamp& timestamp) {
    const std::int64_t millis = toEpochMillis(timestamp);
    const std::int64_t days = floorDiv(millis, kMillisPerDay);
    const std::int64_t millis_of_day = millis - days * kMillisPerDay;

    std::int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civilFromDays(days, year, month, day);

    const std::int64_t hour = millis_of_day / 3600000;
    const std::int64_t minute = (millis_of_day / 60000) % 60;
    const std::int64_t second = (millis_of_day / 1000) % 60;
    const std::int64_t milli = millis_of_day % 1000;

    std::ostringstream oss;
    oss << std::setfill('0');
    if (year < 0) {
        oss << '-' << std::setw(4) << -year;
    } else {
        oss << std::setw(4) << year;
    }
    oss << '-' << std::setw(2) << month << '-' << std::setw(2) << day
        << 'T' << std::setw(2) << hour << ':' << std::setw(2) << minute << ':' << std::setw(2) << second
        << '.' << std::setw(3) << milli << 'Z';
    return oss.str();
}

std::string formatSeconds(const Duration& duration) {
    const std::int64_t millis = duration.count();
    // EN: Work on the unsigned magnitude so that INT64_MIN does not overflow.
    // FR: Travaille sur la magnitude non signée pour que INT64_MIN ne déborde pas.
    const std::uint64_t magnitude = millis < 0 ? 0 - static_cast<std::uint64_t>(millis)
                                               : static_cast<std::uint64_t>(millis);

    std::ostringstream oss;
    if (millis < 0) {
        oss << '-';
    }
    oss << magnitude / 1000 << '.' << std::setfill('0') << std::setw(3) << magnitude % 1000;
    return oss.str();
}

bool ViewingPeriod::operator==(const ViewingPeriod& other) const {
    return provider == other.provider && status == other.status && user_id == other.user_id &&
           query_time == other.query_time && time_in_file == other.time_in_file &&
           duration == other.duration && stream_id == other.stream_id && entry_id == other.entry_id &&
           ber == other.ber && valid == other.valid;
}

// EN: Output operator. The missing separators after stream_id and entry_id are part of the
//     established text format consumed downstream.
// FR: Opérateur d'affichage. Les séparateurs absents après stream_id et entry_id font partie
//     du format texte établi consommé en aval.
std::ostream& operator<<(std::ostream& os, const ViewingPeriod& period) {
    os << "user_id: " << period.user_id << ", ";
    os << "status: " << period.status << ", ";
    os << "stream_id: " << period.stream_id.value_or("");
    os << "entry_id: " << period.entry_id.value_or("");
    os << "offset_s: " << formatSeconds(period.offset()) << ", ";
    os << "startTime: " << formatRfc3339Millis(period.query_time) << ", ";
    os << "endTime: " << formatRfc3339Millis(period.endTime()) << ", ";
    os << "duration: " << formatSeconds(period.duration) << ", ";

    std::ostringstream ber;
    ber << std::fixed << std::setprecision(2) << period.ber;
    os << "ber: " << ber.str() << ", ";
    os << "valid: " << (period.valid ? "true" : "false");
    return os;
}

}  // namespace VPR
