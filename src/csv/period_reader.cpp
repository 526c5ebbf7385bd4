// EN: Implementation of the period reader
// FR: Implémentation du lecteur de périodes

#include "csv/period_reader.hpp"

#include "csv/delimiter_resolver.hpp"
#include "csv/reader_errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <fstream>
#include <sstream>
#include <unordered_map>

namespace VPR::CSV {

std::string ReaderStatistics::generateReport() const {
    std::ostringstream report;
    report << "lines_read=" << lines_read
           << " records_produced=" << records_produced
           << " lines_skipped=" << lines_skipped
           << " empty_lines=" << empty_lines
           << " unrecognized_columns=" << unrecognized_columns
           << " invalid_status_values=" << invalid_status_values
           << " read_errors=" << read_errors;
    return report.str();
}

std::vector<ViewingPeriod> PeriodReader::readFile(const std::filesystem::path& path) {
    std::vector<ViewingPeriod> periods;
    readFile(path, [&periods](const ViewingPeriod& period, std::size_t) {
        periods.push_back(period);
        return true;
    });
    return periods;
}

void PeriodReader::readFile(const std::filesystem::path& path, const PeriodCallback& callback) {
    // EN: Extension first: an unsupported file is rejected before it is even opened
    // FR: Extension d'abord : un fichier non supporté est rejeté avant même d'être ouvert
    const char delimiter = resolveDelimiter(path);

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw InputError("failed to open file: " + path.string());
    }

    LOG_INFO("period_reader", "Reading periods from: " + path.string());
    readStream(file, delimiter, callback);
}

std::vector<ViewingPeriod> PeriodReader::readStream(std::istream& stream, char delimiter) {
    std::vector<ViewingPeriod> periods;
    readStream(stream, delimiter, [&periods](const ViewingPeriod& period, std::size_t) {
        periods.push_back(period);
        return true;
    });
    return periods;
}

void PeriodReader::readStream(std::istream& stream, char delimiter, const PeriodCallback& callback) {
    stats_ = ReaderStatistics{};
    normalizer_.resetStatistics();
    header_.clear();

    readHeader(stream, delimiter);

    std::string line;
    std::size_t line_number = 1;
    while (readLine(stream, line)) {
        ++line_number;
        stats_.lines_read++;

        if (!isValidUtf8(line)) {
            stats_.lines_skipped++;
            const std::unordered_map<std::string, std::string> metadata = {
                {"line", std::to_string(line_number)}};
            LOG_WARN_META("period_reader", "failed to read period line: stream did not contain valid UTF-8",
                          metadata);
            continue;
        }

        if (line.empty() && options_.skip_empty_lines) {
            stats_.empty_lines++;
            continue;
        }

        ViewingPeriod period = normalizer_.normalizeLine(header_, line, delimiter, line_number);
        stats_.records_produced++;

        if (!callback(period, line_number)) {
            LOG_DEBUG("period_reader", "Reading stopped by callback at line " + std::to_string(line_number));
            break;
        }
    }

    if (stream.bad()) {
        stats_.read_errors++;
        stats_.lines_skipped++;
        const std::unordered_map<std::string, std::string> metadata = {
            {"line", std::to_string(line_number + 1)},
            {"records_produced", std::to_string(stats_.records_produced)}};
        LOG_ERROR_META("period_reader", "failed to read period line: input stream error, remaining lines ignored",
                       metadata);
    }

    stats_.unrecognized_columns = normalizer_.getStatistics().unrecognized_columns;
    stats_.invalid_status_values = normalizer_.getStatistics().invalid_status_values;

    LOG_DEBUG("period_reader", "Reading completed: " + stats_.generateReport());
}

void PeriodReader::readHeader(std::istream& stream, char delimiter) {
    std::string line;
    if (!readLine(stream, line)) {
        throw InputError("expected table to have at least header");
    }

    if (options_.strip_utf8_bom && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        line.erase(0, 3);
    }

    if (!isValidUtf8(line)) {
        throw InputError("failed to read header from file: stream did not contain valid UTF-8");
    }

    header_ = RecordNormalizer::parseHeader(line, delimiter);
}

bool PeriodReader::readLine(std::istream& stream, std::string& line) {
    if (!std::getline(stream, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

bool PeriodReader::isValidUtf8(const std::string& text) {
    std::size_t i = 0;
    const std::size_t size = text.size();

    while (i < size) {
        const auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t length = 0;
        unsigned char min_second = 0x80;
        unsigned char max_second = 0xBF;

        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) min_second = 0xA0;        // EN: Overlong / FR: Forme trop longue
            if (lead == 0xED) max_second = 0x9F;        // EN: Surrogates / FR: Substituts
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) min_second = 0x90;        // EN: Overlong / FR: Forme trop longue
            if (lead == 0xF4) max_second = 0x8F;        // EN: Above U+10FFFF / FR: Au-delà de U+10FFFF
        } else {
            return false;
        }

        if (i + length > size) {
            return false;
        }

        const auto second = static_cast<unsigned char>(text[i + 1]);
        if (second < min_second || second > max_second) {
            return false;
        }
        for (std::size_t k = 2; k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if (next < 0x80 || next > 0xBF) {
                return false;
            }
        }
        i += length;
    }
    return true;
}

} // namespace VPR::CSV
