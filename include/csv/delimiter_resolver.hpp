// EN: Field delimiter resolution from a table file's extension
// FR: Résolution du délimiteur de champ à partir de l'extension d'un fichier de table

#pragma once

#include <filesystem>

namespace VPR::CSV {

// EN: ".csv" -> ',' and ".tsv" -> '\t' (case-sensitive). Any other extension, or none,
//     throws ConfigurationError. The file itself is never opened.
// FR: ".csv" -> ',' et ".tsv" -> '\t' (sensible à la casse). Toute autre extension, ou aucune,
//     lève ConfigurationError. Le fichier n'est jamais ouvert.
char resolveDelimiter(const std::filesystem::path& path);

} // namespace VPR::CSV
