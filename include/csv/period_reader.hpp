// EN: Line source reading viewing period tables and feeding each data line to the normalizer
// FR: Source de lignes lisant les tables de périodes et transmettant chaque ligne au normaliseur

#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <istream>
#include <string>
#include <vector>

#include "csv/record_normalizer.hpp"
#include "types/viewing_period.hpp"

namespace VPR::CSV {

// EN: Reader options
// FR: Options du lecteur
struct ReaderOptions {
    bool skip_empty_lines{false};   // EN: Ignore blank data lines instead of normalizing them / FR: Ignore les lignes vides au lieu de les normaliser
    bool strip_utf8_bom{true};      // EN: Drop a UTF-8 BOM in front of the header / FR: Supprime un BOM UTF-8 devant l'en-tête
};

// EN: Reader statistics for one read operation
// FR: Statistiques du lecteur pour une opération de lecture
struct ReaderStatistics {
    std::size_t lines_read{0};              // EN: Data lines read, header excluded / FR: Lignes de données lues, en-tête exclu
    std::size_t records_produced{0};        // EN: Records handed to the caller / FR: Enregistrements transmis à l'appelant
    std::size_t lines_skipped{0};           // EN: Unreadable lines (invalid UTF-8, I/O failure) / FR: Lignes illisibles (UTF-8 invalide, échec d'E/S)
    std::size_t empty_lines{0};             // EN: Blank lines ignored / FR: Lignes vides ignorées
    std::size_t unrecognized_columns{0};    // EN: Cells of unknown columns / FR: Cellules de colonnes inconnues
    std::size_t invalid_status_values{0};   // EN: Status cells not applied / FR: Cellules de statut non appliquées
    std::size_t read_errors{0};             // EN: Hard stream failures; the rest of the input is lost / FR: Échecs du flux ; le reste de l'entrée est perdu

    std::string generateReport() const;
};

// EN: Record callback; return false to stop reading early
// FR: Callback d'enregistrement ; retourner false pour arrêter la lecture
using PeriodCallback = std::function<bool(const ViewingPeriod& period, std::size_t line_number)>;

// EN: Synchronous reader. Owns the input file only for the duration of one read call.
//     Fatal conditions (unsupported extension, unopenable file, missing header, malformed
//     cell) throw; the vector-returning overloads never hand back a partial result for them.
//     A hard I/O failure while reading data lines is not fatal: it is logged, counted in
//     ReaderStatistics::read_errors, and the records read so far are returned. That result
//     is partial; callers check read_errors to tell.
// FR: Lecteur synchrone. Possède le fichier d'entrée uniquement pendant un appel de lecture.
//     Les conditions fatales lèvent une exception ; les surcharges retournant un vecteur ne
//     renvoient jamais de résultat partiel pour elles. Un échec d'E/S sur les lignes de données
//     n'est pas fatal : il est journalisé, compté dans ReaderStatistics::read_errors, et les
//     enregistrements déjà lus sont retournés. Ce résultat est partiel.
class PeriodReader {
public:
    PeriodReader() = default;
    explicit PeriodReader(const ReaderOptions& options) : options_(options) {}

    // EN: Resolve the delimiter from the extension, open the file and read every record
    // FR: Résout le délimiteur depuis l'extension, ouvre le fichier et lit tous les enregistrements
    std::vector<ViewingPeriod> readFile(const std::filesystem::path& path);
    void readFile(const std::filesystem::path& path, const PeriodCallback& callback);

    // EN: Read an already opened source with a known delimiter
    // FR: Lit une source déjà ouverte avec un délimiteur connu
    std::vector<ViewingPeriod> readStream(std::istream& stream, char delimiter);
    void readStream(std::istream& stream, char delimiter, const PeriodCallback& callback);

    const Header& getHeader() const { return header_; }
    const ReaderStatistics& getStatistics() const { return stats_; }
    const ReaderOptions& getOptions() const { return options_; }

    // EN: Strict UTF-8 validation (no overlongs, no surrogates, max U+10FFFF)
    // FR: Validation UTF-8 stricte (pas de formes trop longues, pas de substituts, max U+10FFFF)
    static bool isValidUtf8(const std::string& text);

private:
    ReaderOptions options_;
    ReaderStatistics stats_;
    Header header_;
    RecordNormalizer normalizer_;

    // EN: Read one line, dropping a trailing '\r'. False at end of input or on stream failure.
    // FR: Lit une ligne en supprimant un '\r' final. False en fin d'entrée ou sur échec du flux.
    static bool readLine(std::istream& stream, std::string& line);

    void readHeader(std::istream& stream, char delimiter);
};

} // namespace VPR::CSV
