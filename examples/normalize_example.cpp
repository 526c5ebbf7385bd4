#include "csv/period_reader.hpp"
#include "csv/period_writer.hpp"
#include "infrastructure/logging/logger.hpp"

#include <iostream>
#include <sstream>
#include <unordered_map>

int main() {
    auto& logger = VPR::Logger::getInstance();

    logger.setLogLevel(VPR::LogLevel::DEBUG);
    logger.setRunId(logger.generateRunId());
    logger.addGlobalMetadata("source", "normalize_example");

    // Two producers, two layouts, one canonical record shape
    std::istringstream legacy_export(
        "id,status,period_id,stream_id,timeInFile,tStartMsec,durationMsec,bitErrorRate,userID,valid\n"
        "5262783672,NO_MATCH,1672616922000|8d542b02|329,329,1672617736352,1672617824041,12928,0.247597,169808,1\n");

    std::istringstream device_export(
        "DEVICE_ID\tSTREAM_LABEL\tSTART\tEND\tOFFSET\n"
        "dev-7\tNO_SOUND\t2023-01-12 13:50:00.123\t2023-01-12 13:50:30.000\t2.5\n");

    VPR::CSV::PeriodReader reader;
    VPR::CSV::PeriodWriter writer(std::cout, VPR::CSV::OutputFormat::TEXT);

    writer.writeAll(reader.readStream(legacy_export, ','));

    std::unordered_map<std::string, std::string> metadata = {
        {"layout", "device"},
        {"delimiter", "tab"}
    };
    LOG_INFO_META("example", "Switching to tab separated export", metadata);

    VPR::CSV::PeriodWriter json_writer(std::cout, VPR::CSV::OutputFormat::NDJSON);
    json_writer.writeAll(reader.readStream(device_export, '\t'));

    LOG_INFO("example", reader.getStatistics().generateReport());

    logger.flush();

    return 0;
}
