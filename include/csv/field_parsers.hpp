// EN: Typed cell parsers for viewing period columns (timestamps, durations, floats, flags)
// FR: Parsers de cellules typés pour les colonnes de périodes (timestamps, durées, flottants, drapeaux)

#pragma once

#include <cstdint>
#include <string>

#include "types/viewing_period.hpp"

namespace VPR::CSV {

// EN: Epoch milliseconds accepted as timestamps: years -262144 to 262143
// FR: Millisecondes epoch acceptées comme timestamps : années -262144 à 262143
extern const std::int64_t kMinEpochMillis;
extern const std::int64_t kMaxEpochMillis;

// EN: Trim surrounding whitespace, then any of ' " space , from both ends.
//     Cells pre-quoted or comma-padded upstream parse cleanly after this.
// FR: Supprime les espaces autour, puis les caractères ' " espace , aux deux extrémités.
//     Les cellules quotées ou complétées par des virgules en amont s'analysent ensuite correctement.
std::string cleanCellValue(const std::string& raw);

// EN: Signed 64-bit Unix epoch milliseconds. Throws FieldParseError.
// FR: Millisecondes epoch Unix signées 64 bits. Lève FieldParseError.
Timestamp parseEpochMillis(const std::string& value);

// EN: "YYYY-MM-DD HH:MM:SS[.fff]" in UTC. The fraction (1 to 9 digits) is rounded to
//     milliseconds. Throws FieldParseError.
// FR: "YYYY-MM-DD HH:MM:SS[.fff]" en UTC. La fraction (1 à 9 chiffres) est arrondie à la
//     milliseconde. Lève FieldParseError.
Timestamp parseDateTime(const std::string& value);

// EN: Signed integer milliseconds. Throws FieldParseError.
// FR: Millisecondes entières signées. Lève FieldParseError.
Duration durationFromMillis(const std::string& value);

// EN: Fractional seconds, floored to milliseconds (1.9999 -> 1999 ms, -0.0005 -> -1 ms).
//     Throws FieldParseError.
// FR: Secondes fractionnaires, arrondies par défaut à la milliseconde. Lève FieldParseError.
Duration durationFromSeconds(const std::string& value);

// EN: 32-bit float. Throws FieldParseError.
// FR: Flottant 32 bits. Lève FieldParseError.
float parseBer(const std::string& value);

// EN: "VALID", "true" and "1" are true, anything else is false. Never throws.
// FR: "VALID", "true" et "1" sont vrais, tout le reste est faux. Ne lève jamais.
bool parseValid(const std::string& value);

// EN: True for the stream identifiers that mean "nothing matched": "", "0", NO_DATA, NO_MATCH, NO_SOUND.
// FR: Vrai pour les identifiants de flux signifiant "aucune correspondance".
bool isNoMatchStreamId(const std::string& stream_id);

} // namespace VPR::CSV
