// EN: Conversion of the generic configuration into vpreader settings.
// FR: Conversion de la configuration générique en paramètres de vpreader.

#include "infrastructure/config/reader_settings.hpp"

#include "csv/reader_errors.hpp"

namespace VPR {

std::vector<ConfigManager::ValidationRule> readerValidationRules() {
    std::vector<ConfigManager::ValidationRule> rules;

    ConfigManager::ValidationRule level;
    level.key = "logging.level";
    level.type = "string";
    level.allowed_values = {"debug", "info", "warn", "warning", "error"};
    level.description = "Minimum log level";
    rules.push_back(level);

    ConfigManager::ValidationRule file;
    file.key = "logging.file";
    file.type = "string";
    file.description = "Append log lines to this file instead of stderr";
    rules.push_back(file);

    ConfigManager::ValidationRule format;
    format.key = "output.format";
    format.type = "string";
    format.allowed_values = {"text", "ndjson", "json"};
    format.description = "Record output format";
    rules.push_back(format);

    ConfigManager::ValidationRule summary;
    summary.key = "output.summary";
    summary.type = "bool";
    summary.description = "Log reader statistics for every file";
    rules.push_back(summary);

    ConfigManager::ValidationRule skip_empty;
    skip_empty.key = "reader.skip_empty_lines";
    skip_empty.type = "bool";
    rules.push_back(skip_empty);

    ConfigManager::ValidationRule strip_bom;
    strip_bom.key = "reader.strip_utf8_bom";
    strip_bom.type = "bool";
    rules.push_back(strip_bom);

    return rules;
}

ReaderSettings loadReaderSettings(ConfigManager& config) {
    config.clearValidationRules();
    config.addValidationRules(readerValidationRules());

    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        std::string message = "invalid configuration:";
        for (const auto& error : errors) {
            message += " " + error + ";";
        }
        throw CSV::ConfigurationError(message);
    }

    ReaderSettings settings;

    if (auto level = config.get("logging", "level").tryAs<std::string>()) {
        // EN: Already checked against the allowed values above.
        // FR: Déjà vérifié contre les valeurs autorisées ci-dessus.
        settings.log_level = parseLogLevel(*level).value_or(LogLevel::INFO);
    }
    if (auto file = config.get("logging", "file").tryAs<std::string>()) {
        if (!file->empty()) {
            settings.log_file = *file;
        }
    }
    if (auto format = config.get("output", "format").tryAs<std::string>()) {
        settings.output_format = CSV::parseOutputFormat(*format).value_or(CSV::OutputFormat::TEXT);
    }
    settings.summary = config.get("output", "summary").asOrDefault<bool>(false);
    settings.reader.skip_empty_lines =
        config.get("reader", "skip_empty_lines").asOrDefault<bool>(settings.reader.skip_empty_lines);
    settings.reader.strip_utf8_bom =
        config.get("reader", "strip_utf8_bom").asOrDefault<bool>(settings.reader.strip_utf8_bom);

    return settings;
}

} // namespace VPR
