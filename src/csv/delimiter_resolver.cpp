// EN: Implementation of delimiter resolution
// FR: Implémentation de la résolution du délimiteur

#include "csv/delimiter_resolver.hpp"

#include "csv/reader_errors.hpp"

namespace VPR::CSV {

char resolveDelimiter(const std::filesystem::path& path) {
    const std::string extension = path.extension().string();

    if (extension == ".csv") {
        return ',';
    }
    if (extension == ".tsv") {
        return '\t';
    }
    throw ConfigurationError("unsupported file extension: '" + path.string() + "' (expected .csv or .tsv)");
}

} // namespace VPR::CSV
