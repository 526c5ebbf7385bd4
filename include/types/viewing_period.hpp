// EN: Declaration of the ViewingPeriod record, the canonical shape every input row is normalized into.
// FR: Déclaration de l'enregistrement ViewingPeriod, la forme canonique vers laquelle chaque ligne est normalisée.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace VPR {

// EN: Absolute UTC instant with millisecond precision, counted from the Unix epoch.
// FR: Instant UTC absolu en millisecondes, compté depuis l'époque Unix.
using Duration = std::chrono::milliseconds;
using Timestamp = std::chrono::time_point<std::chrono::system_clock, Duration>;

// EN: Outcome of a matching attempt.
// FR: Résultat d'une tentative d'identification.
enum class Status {
    Match,
    NoMatch,
    NoData,
    NoSound
};

// EN: Canonical text form: MATCH, NO_MATCH, NO_DATA, NO_SOUND.
// FR: Forme texte canonique : MATCH, NO_MATCH, NO_DATA, NO_SOUND.
std::string statusToString(Status status);

// EN: Case-sensitive parse of the canonical text form. Empty optional on unknown tokens.
// FR: Analyse sensible à la casse de la forme canonique. Optionnel vide si inconnu.
std::optional<Status> parseStatus(const std::string& value);

std::ostream& operator<<(std::ostream& os, Status status);

// EN: Milliseconds since the Unix epoch to a timestamp, and back.
// FR: Millisecondes depuis l'époque Unix vers un timestamp, et retour.
Timestamp timestampFromEpochMillis(std::int64_t millis);
std::int64_t toEpochMillis(const Timestamp& timestamp);

// EN: RFC3339 with milliseconds and a Z offset, e.g. 2023-01-02T00:03:44.041Z.
// FR: RFC3339 avec millisecondes et décalage Z, ex. 2023-01-02T00:03:44.041Z.
std::string formatRfc3339Millis(const Timestamp& timestamp);

// EN: Seconds with three decimals, e.g. 12.928 or -1.500.
// FR: Secondes avec trois décimales, ex. 12.928 ou -1.500.
std::string formatSeconds(const Duration& duration);

// EN: One normalized observation. Fields are public; the record is built once by the
//     normalizer and treated as a value afterwards.
// FR: Une observation normalisée. Les champs sont publics ; l'enregistrement est construit
//     une fois par le normaliseur puis traité comme une valeur.
struct ViewingPeriod {
    // EN: user_id placeholder when no device column is present.
    // FR: Valeur de user_id quand aucune colonne d'appareil n'est présente.
    static constexpr const char* kDefaultUserId = "0";

    std::optional<std::string> provider;
    Status status{Status::NoMatch};
    std::string user_id{kDefaultUserId};
    Timestamp query_time{};
    Timestamp time_in_file{};
    Duration duration{0};
    std::optional<std::string> stream_id;
    std::optional<std::string> entry_id;
    float ber{0.0f};
    bool valid{false};

    // EN: query_time + duration.
    // FR: query_time + duration.
    Timestamp endTime() const { return query_time + duration; }

    // EN: query_time - time_in_file.
    // FR: query_time - time_in_file.
    Duration offset() const { return query_time - time_in_file; }

    bool operator==(const ViewingPeriod& other) const;
    bool operator!=(const ViewingPeriod& other) const { return !(*this == other); }
};

// EN: Single-line text representation used by the text sink.
// FR: Représentation texte sur une ligne utilisée par la sortie texte.
std::ostream& operator<<(std::ostream& os, const ViewingPeriod& period);

}  // namespace VPR
