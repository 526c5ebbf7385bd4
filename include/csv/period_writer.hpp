// EN: Sink writing normalized viewing periods as text lines or NDJSON
// FR: Sortie écrivant les périodes normalisées en lignes texte ou NDJSON

#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "types/viewing_period.hpp"

namespace VPR::CSV {

// EN: Output formats supported by the writer
// FR: Formats de sortie supportés par le writer
enum class OutputFormat {
    TEXT,       // EN: "user_id: ..., status: ..." lines / FR: Lignes "user_id: ..., status: ..."
    NDJSON      // EN: One JSON object per line / FR: Un objet JSON par ligne
};

// EN: "text" or "ndjson" (case-insensitive)
// FR: "text" ou "ndjson" (insensible à la casse)
std::optional<OutputFormat> parseOutputFormat(const std::string& value);
std::string outputFormatToString(OutputFormat format);

// EN: Writes records in emission order to a borrowed stream
// FR: Écrit les enregistrements dans l'ordre d'émission vers un flux emprunté
class PeriodWriter {
public:
    PeriodWriter(std::ostream& output, OutputFormat format);

    void write(const ViewingPeriod& period);
    void writeAll(const std::vector<ViewingPeriod>& periods);
    void flush();

    std::size_t getRecordsWritten() const { return records_written_; }
    OutputFormat getFormat() const { return format_; }

    // EN: Single-line renderings used by write()
    // FR: Rendus sur une ligne utilisés par write()
    static std::string formatText(const ViewingPeriod& period);
    static std::string formatJsonLine(const ViewingPeriod& period);

private:
    std::ostream& output_;
    OutputFormat format_;
    std::size_t records_written_{0};
};

} // namespace VPR::CSV
