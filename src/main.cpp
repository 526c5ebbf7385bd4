// EN: Entry point of vpreader. Normalizes viewing period tables (.csv/.tsv) and prints one record per row.
// FR: Point d'entrée de vpreader. Normalise les tables de périodes (.csv/.tsv) et affiche un enregistrement par ligne.

#include <iostream>
#include <string>
#include <vector>

#include "csv/period_reader.hpp"
#include "csv/period_writer.hpp"
#include "csv/reader_errors.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/config/reader_settings.hpp"
#include "infrastructure/logging/logger.hpp"

namespace {

constexpr const char* kVersion = "1.0.0";

void printUsage(std::ostream& os) {
    os << "Usage: vpreader [OPTIONS] FILE..." << std::endl;
    os << std::endl;
    os << "Normalizes viewing period exports (.csv or .tsv) into canonical records." << std::endl;
    os << std::endl;
    os << "Options:" << std::endl;
    os << "  --config FILE       YAML configuration file" << std::endl;
    os << "  --format FORMAT     Output format: text (default) or ndjson" << std::endl;
    os << "  --log-level LEVEL   debug, info, warn or error" << std::endl;
    os << "  --log-file FILE     Append log lines to FILE instead of stderr" << std::endl;
    os << "  --summary           Log reader statistics for every file" << std::endl;
    os << "  -h, --help          Show this help" << std::endl;
    os << "  -v, --version       Show version" << std::endl;
}

struct CommandLine {
    std::string config_file;
    std::vector<std::string> files;
    bool show_help{false};
    bool show_version{false};
};

// EN: Flags given on the command line override the configuration file.
// FR: Les options de la ligne de commande surchargent le fichier de configuration.
bool parseCommandLine(int argc, char* argv[], CommandLine& command_line, std::string& error) {
    auto& config = VPR::ConfigManager::getInstance();

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto next_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                error = "missing value for " + arg;
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h") {
            command_line.show_help = true;
        } else if (arg == "--version" || arg == "-v") {
            command_line.show_version = true;
        } else if (arg == "--config") {
            if (!next_value(command_line.config_file)) return false;
        } else if (arg == "--format") {
            if (!next_value(value)) return false;
            config.set("cli", "format", VPR::ConfigValue(value));
        } else if (arg == "--log-level") {
            if (!next_value(value)) return false;
            config.set("cli", "log_level", VPR::ConfigValue(value));
        } else if (arg == "--log-file") {
            if (!next_value(value)) return false;
            config.set("cli", "log_file", VPR::ConfigValue(value));
        } else if (arg == "--summary") {
            config.set("cli", "summary", VPR::ConfigValue(true));
        } else if (!arg.empty() && arg[0] == '-') {
            error = "unknown option: " + arg;
            return false;
        } else {
            command_line.files.push_back(arg);
        }
    }

    if (!command_line.show_help && !command_line.show_version && command_line.files.empty()) {
        error = "no input file given";
        return false;
    }
    return true;
}

// EN: Move the cli.* values collected while parsing onto their configuration keys.
// FR: Reporte les valeurs cli.* collectées pendant l'analyse sur leurs clés de configuration.
void applyCommandLineOverrides(VPR::ConfigManager& config, const VPR::ConfigSection& cli) {
    if (cli.has("format")) config.set("output", "format", cli.get("format"));
    if (cli.has("summary")) config.set("output", "summary", cli.get("summary"));
    if (cli.has("log_level")) config.set("logging", "level", cli.get("log_level"));
    if (cli.has("log_file")) config.set("logging", "file", cli.get("log_file"));
}

} // namespace

int main(int argc, char* argv[]) {
    auto& logger = VPR::Logger::getInstance();
    auto& config = VPR::ConfigManager::getInstance();

    CommandLine command_line;
    std::string usage_error;
    if (!parseCommandLine(argc, argv, command_line, usage_error)) {
        std::cerr << "vpreader: " << usage_error << std::endl;
        printUsage(std::cerr);
        return 2;
    }
    if (command_line.show_help) {
        printUsage(std::cout);
        return 0;
    }
    if (command_line.show_version) {
        std::cout << "vpreader " << kVersion << std::endl;
        return 0;
    }

    const VPR::ConfigSection cli = config.getSection("cli");

    try {
        if (!command_line.config_file.empty() && !config.loadFromFile(command_line.config_file)) {
            throw VPR::CSV::ConfigurationError("failed to load configuration file: " + command_line.config_file);
        }
        config.loadEnvironmentOverrides("VPR_");
        applyCommandLineOverrides(config, cli);

        const VPR::ReaderSettings settings = VPR::loadReaderSettings(config);
        logger.setLogLevel(settings.log_level);
        if (settings.log_file && !logger.setOutputFile(*settings.log_file)) {
            throw VPR::CSV::ConfigurationError("failed to open log file: " + *settings.log_file);
        }
        logger.setRunId(logger.generateRunId());

        // EN: Every file is read before anything is written: a fatal error in any file
        //     aborts the run without emitting a partial result.
        // FR: Tous les fichiers sont lus avant toute écriture : une erreur fatale dans un
        //     fichier interrompt l'exécution sans émettre de résultat partiel.
        std::vector<VPR::ViewingPeriod> periods;
        VPR::CSV::PeriodReader reader(settings.reader);
        for (const auto& file : command_line.files) {
            std::vector<VPR::ViewingPeriod> file_periods = reader.readFile(file);
            periods.insert(periods.end(), file_periods.begin(), file_periods.end());

            if (settings.summary) {
                LOG_INFO("vpreader", file + ": " + reader.getStatistics().generateReport());
            }
        }

        VPR::CSV::PeriodWriter writer(std::cout, settings.output_format);
        writer.writeAll(periods);
        writer.flush();

        LOG_DEBUG("vpreader", "Wrote " + std::to_string(writer.getRecordsWritten()) + " records");
        logger.flush();
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("vpreader", e.what());
        logger.flush();
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
}
