// EN: Implementation of the typed cell parsers
// FR: Implémentation des parsers de cellules typés

#include "csv/field_parsers.hpp"

#include "csv/reader_errors.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <system_error>

namespace VPR::CSV {

namespace {

constexpr std::int64_t kMillisPerDay = 86400000;

// EN: Days since 1970-01-01 for a proleptic Gregorian date
// FR: Jours depuis 1970-01-01 pour une date grégorienne proleptique
constexpr std::int64_t daysFromCivil(std::int64_t year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
    const auto yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

constexpr std::int64_t kMinMillis = daysFromCivil(-262144, 1, 1) * kMillisPerDay;
constexpr std::int64_t kMaxMillis = (daysFromCivil(262143, 12, 31) + 1) * kMillisPerDay - 1;

// EN: Widest duration that still keeps timestamp arithmetic inside int64
// FR: Durée la plus large gardant l'arithmétique des timestamps dans int64
constexpr std::int64_t kMaxDurationMillis = kMaxMillis - kMinMillis;

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned daysInMonth(int year, unsigned month) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool isRemovable(char c) {
    return c == '\'' || c == '"' || c == ' ' || c == ',';
}

// EN: Optional sign followed by decimal digits, nothing else
// FR: Signe optionnel suivi de chiffres décimaux, rien d'autre
bool parseInt64(const std::string& value, std::int64_t& out) {
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    if (begin != end && *begin == '+') {
        ++begin;
        if (begin != end && *begin == '-') {
            return false;
        }
    }
    if (begin == end) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc() && ptr == end;
}

// EN: strtod/strtof also read hexadecimal floats ("0x1A"); cells are decimal only
// FR: strtod/strtof lisent aussi les flottants hexadécimaux ("0x1A") ; les cellules sont décimales uniquement
bool isHexFloat(const std::string& value) {
    return value.find_first_of("xX") != std::string::npos;
}

Duration checkedDuration(std::int64_t millis, const std::string& field, const std::string& value) {
    if (millis > kMaxDurationMillis || millis < -kMaxDurationMillis) {
        throw FieldParseError(field, value, "duration out of range");
    }
    return Duration(millis);
}

} // namespace

const std::int64_t kMinEpochMillis = kMinMillis;
const std::int64_t kMaxEpochMillis = kMaxMillis;

std::string cleanCellValue(const std::string& raw) {
    std::size_t begin = 0;
    std::size_t end = raw.size();

    while (begin < end && std::isspace(static_cast<unsigned char>(raw[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1]))) {
        --end;
    }
    while (begin < end && isRemovable(raw[begin])) {
        ++begin;
    }
    while (end > begin && isRemovable(raw[end - 1])) {
        --end;
    }
    return raw.substr(begin, end - begin);
}

Timestamp parseEpochMillis(const std::string& value) {
    std::int64_t millis = 0;
    if (!parseInt64(value, millis)) {
        throw FieldParseError("timestamp", value, "could not parse timestamp as integer");
    }
    if (millis < kMinEpochMillis || millis > kMaxEpochMillis) {
        throw FieldParseError("timestamp", value, "could not convert timestamp to datetime");
    }
    return timestampFromEpochMillis(millis);
}

Timestamp parseDateTime(const std::string& value) {
    static const std::regex datetime_pattern(
        R"((\d{4})-(\d{2})-(\d{2}) (\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,9}))?)");

    std::smatch match;
    if (!std::regex_match(value, match, datetime_pattern)) {
        throw FieldParseError("datetime", value, "expected format YYYY-MM-DD HH:MM:SS[.fff]");
    }

    const int year = std::stoi(match[1].str());
    const auto month = static_cast<unsigned>(std::stoi(match[2].str()));
    const auto day = static_cast<unsigned>(std::stoi(match[3].str()));
    const int hour = std::stoi(match[4].str());
    const int minute = std::stoi(match[5].str());
    const int second = std::stoi(match[6].str());

    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
        throw FieldParseError("datetime", value, "invalid calendar date");
    }
    if (hour > 23 || minute > 59 || second > 59) {
        throw FieldParseError("datetime", value, "invalid time of day");
    }

    // EN: Pad the fraction to nanoseconds, then round half up to milliseconds
    // FR: Complète la fraction en nanosecondes, puis arrondit au plus proche en millisecondes
    std::int64_t millis_fraction = 0;
    if (match[7].matched) {
        std::string digits = match[7].str();
        digits.append(9 - digits.size(), '0');
        const std::int64_t nanos = std::stoll(digits);
        millis_fraction = (nanos + 500000) / 1000000;
    }

    const std::int64_t millis = daysFromCivil(year, month, day) * kMillisPerDay +
                                (static_cast<std::int64_t>(hour) * 3600 + minute * 60 + second) * 1000 +
                                millis_fraction;
    return timestampFromEpochMillis(millis);
}

Duration durationFromMillis(const std::string& value) {
    std::int64_t millis = 0;
    if (!parseInt64(value, millis)) {
        throw FieldParseError("duration", value, "failed to parse millis from duration");
    }
    return checkedDuration(millis, "duration", value);
}

Duration durationFromSeconds(const std::string& value) {
    if (value.empty() || isHexFloat(value)) {
        throw FieldParseError("duration", value, "failed to parse seconds from duration");
    }

    char* endptr = nullptr;
    const double seconds = std::strtod(value.c_str(), &endptr);
    if (endptr != value.c_str() + value.size()) {
        throw FieldParseError("duration", value, "failed to parse seconds from duration");
    }

    const double millis = std::floor(seconds * 1000.0);
    if (!std::isfinite(millis) || std::fabs(millis) > static_cast<double>(kMaxDurationMillis)) {
        throw FieldParseError("duration", value, "duration out of range");
    }
    return Duration(static_cast<std::int64_t>(millis));
}

float parseBer(const std::string& value) {
    if (value.empty() || isHexFloat(value)) {
        throw FieldParseError("ber", value, "failed to parse ber");
    }

    char* endptr = nullptr;
    const float ber = std::strtof(value.c_str(), &endptr);
    if (endptr != value.c_str() + value.size()) {
        throw FieldParseError("ber", value, "failed to parse ber");
    }
    return ber;
}

bool parseValid(const std::string& value) {
    return value == "VALID" || value == "true" || value == "1";
}

bool isNoMatchStreamId(const std::string& stream_id) {
    return stream_id.empty() || stream_id == "0" || stream_id == "NO_DATA" ||
           stream_id == "NO_MATCH" || stream_id == "NO_SOUND";
}

} // namespace VPR::CSV
