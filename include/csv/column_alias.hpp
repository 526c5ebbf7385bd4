// EN: Column alias table mapping producer-specific column names onto canonical field actions
// FR: Table d'alias de colonnes associant les noms de colonnes des producteurs aux actions de champ canoniques

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace VPR::CSV {

// EN: What a recognized column does to the record being built. Each action carries
//     its parser implicitly: the normalizer dispatches on it with an exhaustive switch.
// FR: Effet d'une colonne reconnue sur l'enregistrement en construction. Chaque action porte
//     implicitement son parser : le normaliseur la traite par un switch exhaustif.
enum class ColumnAction {
    SetStatus,                      // EN: status enum / FR: enum de statut
    SetUserId,                      // EN: raw text / FR: texte brut
    SetTimeInFileFromEpochMillis,   // EN: epoch milliseconds / FR: millisecondes epoch
    SetQueryTimeFromEpochMillis,    // EN: epoch milliseconds / FR: millisecondes epoch
    SetQueryTimeFromDateTime,       // EN: YYYY-MM-DD HH:MM:SS[.fff] / FR: YYYY-MM-DD HH:MM:SS[.fff]
    SetDurationFromMillis,          // EN: integer milliseconds / FR: millisecondes entières
    SetDurationFromSeconds,         // EN: fractional seconds / FR: secondes fractionnaires
    SetStreamId,                    // EN: raw text / FR: texte brut
    SetProvider,                    // EN: raw text / FR: texte brut
    SetEntryId,                     // EN: raw text / FR: texte brut
    SetBer,                         // EN: 32-bit float / FR: flottant 32 bits
    SetValid,                       // EN: VALID|true|1 / FR: VALID|true|1
    SetOffsetFromMillis,            // EN: pending offset, integer milliseconds / FR: décalage en attente, ms entières
    SetOffsetFromSeconds,           // EN: pending offset, fractional seconds / FR: décalage en attente, secondes
    SetEndTimeFromDateTime          // EN: pending end time / FR: heure de fin en attente
};

// EN: Exact, case-sensitive lookup. Empty optional for unrecognized columns.
// FR: Recherche exacte et sensible à la casse. Optionnel vide pour les colonnes inconnues.
std::optional<ColumnAction> resolveColumn(const std::string& column_name);

// EN: Every column name mapped to the given action, in table order.
// FR: Tous les noms de colonnes associés à l'action donnée, dans l'ordre de la table.
std::vector<std::string> columnAliases(ColumnAction action);

std::string columnActionName(ColumnAction action);

} // namespace VPR::CSV
