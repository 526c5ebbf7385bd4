// EN: Record normalizer folding a header and one data row into a canonical ViewingPeriod
// FR: Normaliseur d'enregistrements combinant un en-tête et une ligne de données en ViewingPeriod canonique

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "csv/column_alias.hpp"
#include "types/viewing_period.hpp"

namespace VPR::CSV {

// EN: Column names in header order, matched verbatim against the alias table
// FR: Noms de colonnes dans l'ordre de l'en-tête, comparés tels quels à la table d'alias
using Header = std::vector<std::string>;

// EN: Counters for the non-fatal conditions met while normalizing
// FR: Compteurs des conditions non fatales rencontrées pendant la normalisation
struct NormalizerStatistics {
    std::size_t rows_normalized{0};         // EN: Records produced / FR: Enregistrements produits
    std::size_t unrecognized_columns{0};    // EN: Cells ignored for an unknown column / FR: Cellules ignorées (colonne inconnue)
    std::size_t invalid_status_values{0};   // EN: Status cells left unapplied / FR: Cellules de statut non appliquées
};

// EN: In-progress state of one row. Pending values are only meaningful together with
//     query_time, so they are kept aside until the derivation rules can use them.
// FR: État en cours d'une ligne. Les valeurs en attente n'ont de sens qu'avec query_time,
//     elles sont donc conservées jusqu'à ce que les règles de dérivation puissent les utiliser.
struct RowAccumulator {
    ViewingPeriod period;
    std::optional<Duration> pending_offset;
    std::optional<Timestamp> pending_end_time;
    bool query_time_assigned{false};
};

// EN: Stateless apart from its statistics; every row gets a fresh accumulator.
//
//     Derivation rules run after EVERY cell, in header order:
//       1. pending offset and query_time assigned  -> time_in_file = query_time - offset
//       2. pending end time and query_time assigned -> duration = end_time - query_time
//       3. stream_id present and not a no-match token -> status = Match
//     Rule 3 therefore overrides a status column that came earlier in the row, while a
//     status column placed after stream_id overwrites the inferred Match again. Existing
//     outputs depend on this column-order behavior; keep it.
// FR: Sans état hormis ses statistiques ; chaque ligne reçoit un nouvel accumulateur.
//     Les règles de dérivation s'exécutent après CHAQUE cellule, dans l'ordre de l'en-tête.
//     La règle 3 écrase donc un statut placé avant stream_id, tandis qu'un statut placé
//     après stream_id écrase à nouveau le Match déduit. Les sorties existantes dépendent de
//     ce comportement lié à l'ordre des colonnes ; le conserver.
class RecordNormalizer {
public:
    RecordNormalizer() = default;

    // EN: Split the first line on the delimiter, no trimming or validation
    // FR: Découpe la première ligne sur le délimiteur, sans nettoyage ni validation
    static Header parseHeader(const std::string& line, char delimiter);

    // EN: Plain split: n delimiters give n + 1 fields, an empty line gives one empty field
    // FR: Découpage simple : n délimiteurs donnent n + 1 champs, une ligne vide un champ vide
    static std::vector<std::string> splitLine(const std::string& line, char delimiter);

    // EN: Normalize one row of already-split values. Header and values are zipped pairwise
    //     and the longer side's excess is ignored. Throws FieldParseError on malformed
    //     timestamp, duration or ber cells; line_number is only used for diagnostics.
    // FR: Normalise une ligne de valeurs déjà découpées. En-tête et valeurs sont appariés et
    //     l'excédent du côté le plus long est ignoré. Lève FieldParseError sur une cellule
    //     timestamp, durée ou ber malformée ; line_number ne sert qu'aux diagnostics.
    ViewingPeriod normalize(const Header& header, const std::vector<std::string>& values,
                            std::size_t line_number = 0);

    // EN: Split a raw line and normalize it
    // FR: Découpe une ligne brute et la normalise
    ViewingPeriod normalizeLine(const Header& header, const std::string& line, char delimiter,
                                std::size_t line_number = 0);

    const NormalizerStatistics& getStatistics() const { return stats_; }
    void resetStatistics() { stats_ = NormalizerStatistics{}; }

private:
    NormalizerStatistics stats_;

    // EN: Parse one cleaned value and store it according to the action
    // FR: Analyse une valeur nettoyée et la stocke selon l'action
    void applyCell(RowAccumulator& row, ColumnAction action, const std::string& value,
                   std::size_t line_number);

    static void applyDerivations(RowAccumulator& row);
};

} // namespace VPR::CSV
