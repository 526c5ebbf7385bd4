#pragma once

#include <optional>
#include <string>
#include <vector>

#include "csv/period_reader.hpp"
#include "csv/period_writer.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

namespace VPR {

// EN: Effective settings of one vpreader run, resolved from configuration.
// FR: Paramètres effectifs d'une exécution de vpreader, résolus depuis la configuration.
struct ReaderSettings {
    LogLevel log_level{LogLevel::INFO};
    std::optional<std::string> log_file;
    CSV::OutputFormat output_format{CSV::OutputFormat::TEXT};
    bool summary{false};
    CSV::ReaderOptions reader;
};

// EN: Validation rules for every key vpreader understands:
//       logging.level, logging.file, output.format, output.summary,
//       reader.skip_empty_lines, reader.strip_utf8_bom
// FR: Règles de validation pour toutes les clés comprises par vpreader.
std::vector<ConfigManager::ValidationRule> readerValidationRules();

// EN: Validate and convert the configuration. Missing keys keep their defaults.
//     Throws CSV::ConfigurationError listing every invalid key.
// FR: Valide et convertit la configuration. Les clés absentes gardent leur valeur par défaut.
//     Lève CSV::ConfigurationError listant chaque clé invalide.
ReaderSettings loadReaderSettings(ConfigManager& config);

} // namespace VPR
