// EN: Unit tests for the YAML configuration manager and the vpreader settings built on it
// FR: Tests unitaires pour le gestionnaire de configuration YAML et les paramètres vpreader associés

#include <gtest/gtest.h>
#include "csv/reader_errors.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/config/reader_settings.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace VPR;

namespace {

const std::string TEST_YAML = R"(
logging:
  level: warn
  file: ${VPR_TEST_LOG_DIR}/vpreader.log

output:
  format: ndjson
  summary: true

reader:
  skip_empty_lines: true
  strip_utf8_bom: true
  max_columns: 64
  ratio: 0.5
  extensions:
    - csv
    - tsv
)";

} // namespace

// EN: Test fixture resetting the singleton around each test
// FR: Fixture de test réinitialisant le singleton autour de chaque test
class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = VPR::Logger::getInstance();
        logger.setLogLevel(VPR::LogLevel::ERROR);
        logger.setConsoleStream(log_output_);

        ConfigManager::getInstance().reset();
        setenv("VPR_TEST_LOG_DIR", "/tmp/vpr", 1);
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
        unsetenv("VPR_TEST_LOG_DIR");
        unsetenv("VPR_OUTPUT_FORMAT");
        unsetenv("VPR_READER_SKIP_EMPTY_LINES");
        unsetenv("VPR_NOSECTION");
        VPR::Logger::getInstance().resetOutput();
    }

    std::ostringstream log_output_;
};

TEST_F(ConfigManagerTest, SetAndGetTypedValues) {
    auto& config = ConfigManager::getInstance();
    config.set("output", "format", ConfigValue("text"));
    config.set("reader", "max_columns", ConfigValue(64));
    config.set("output", "summary", ConfigValue(true));

    EXPECT_TRUE(config.has("output", "format"));
    EXPECT_EQ(config.get("output", "format").as<std::string>(), "text");
    EXPECT_EQ(config.get("reader", "max_columns").as<int>(), 64);
    EXPECT_TRUE(config.get("output", "summary").as<bool>());

    config.remove("output", "format");
    EXPECT_FALSE(config.has("output", "format"));
    EXPECT_FALSE(config.get("output", "format").isValid());
}

TEST_F(ConfigManagerTest, TypeMismatchAndDefaults) {
    ConfigValue value(42);

    EXPECT_THROW(value.as<std::string>(), std::runtime_error);
    EXPECT_FALSE(value.tryAs<bool>().has_value());
    EXPECT_EQ(value.asOrDefault<std::string>("fallback"), "fallback");
    EXPECT_EQ(value.asOrDefault<int>(0), 42);
    EXPECT_THROW(ConfigValue().as<int>(), std::runtime_error);
}

TEST_F(ConfigManagerTest, StringLiteralIsStoredAsString) {
    EXPECT_TRUE(ConfigValue("ndjson").tryAs<std::string>().has_value());
    EXPECT_FALSE(ConfigValue("ndjson").tryAs<bool>().has_value());
}

TEST_F(ConfigManagerTest, LoadsYamlString) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));

    EXPECT_EQ(config.get("logging", "level").as<std::string>(), "warn");
    EXPECT_EQ(config.get("logging", "file").as<std::string>(), "/tmp/vpr/vpreader.log");
    EXPECT_EQ(config.get("output", "format").as<std::string>(), "ndjson");
    EXPECT_TRUE(config.get("output", "summary").as<bool>());
    EXPECT_TRUE(config.get("reader", "skip_empty_lines").as<bool>());
    EXPECT_EQ(config.get("reader", "max_columns").as<int>(), 64);
    EXPECT_DOUBLE_EQ(config.get("reader", "ratio").as<double>(), 0.5);

    const std::vector<std::string> extensions = {"csv", "tsv"};
    EXPECT_EQ(config.get("reader", "extensions").as<std::vector<std::string>>(), extensions);

    const std::vector<std::string> sections = {"logging", "output", "reader"};
    EXPECT_EQ(config.getSectionNames(), sections);
}

TEST_F(ConfigManagerTest, LoadsYamlFile) {
    const auto path = std::filesystem::temp_directory_path() / "vpreader_config_test.yaml";
    {
        std::ofstream file(path);
        file << TEST_YAML;
    }

    auto& config = ConfigManager::getInstance();
    EXPECT_TRUE(config.loadFromFile(path.string()));
    EXPECT_EQ(config.get("output", "format").as<std::string>(), "ndjson");

    std::filesystem::remove(path);
    EXPECT_FALSE(config.loadFromFile(path.string()));
}

TEST_F(ConfigManagerTest, InvalidYamlKeepsPreviousContent) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString("output:\n  format: text\n"));

    EXPECT_FALSE(config.loadFromString("output: [unterminated"));
    EXPECT_FALSE(config.loadFromString("- just\n- a list\n"));
    EXPECT_FALSE(config.loadFromString("output:\n  nested:\n    deep: 1\n"));

    EXPECT_EQ(config.get("output", "format").as<std::string>(), "text");
}

TEST_F(ConfigManagerTest, EmptyDocumentIsEmptyConfiguration) {
    auto& config = ConfigManager::getInstance();
    config.set("output", "format", ConfigValue("text"));

    EXPECT_TRUE(config.loadFromString(""));
    EXPECT_TRUE(config.getSectionNames().empty());
}

TEST_F(ConfigManagerTest, ParseScalarTypes) {
    EXPECT_TRUE(ConfigManager::parseScalar("true").as<bool>());
    EXPECT_EQ(ConfigManager::parseScalar("12").as<int>(), 12);
    EXPECT_DOUBLE_EQ(ConfigManager::parseScalar("1.5").as<double>(), 1.5);
    EXPECT_EQ(ConfigManager::parseScalar("ndjson").as<std::string>(), "ndjson");
    EXPECT_EQ(ConfigManager::parseScalar("").as<std::string>(), "");
}

TEST_F(ConfigManagerTest, EnvironmentOverridesUsePrefixSectionAndKey) {
    setenv("VPR_OUTPUT_FORMAT", "ndjson", 1);
    setenv("VPR_READER_SKIP_EMPTY_LINES", "true", 1);
    setenv("VPR_NOSECTION", "ignored", 1);

    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString("output:\n  format: text\n"));

    EXPECT_GE(config.loadEnvironmentOverrides("VPR_"), 2u);
    EXPECT_EQ(config.get("output", "format").as<std::string>(), "ndjson");
    EXPECT_TRUE(config.get("reader", "skip_empty_lines").as<bool>());
    EXPECT_FALSE(config.has("nosection", ""));
}

TEST_F(ConfigManagerTest, ValidationRules) {
    auto& config = ConfigManager::getInstance();

    ConfigManager::ValidationRule columns;
    columns.key = "reader.max_columns";
    columns.type = "int";
    columns.min_value = 1;
    columns.max_value = 128;

    ConfigManager::ValidationRule name;
    name.key = "reader.name";
    name.type = "string";
    name.required = true;

    config.addValidationRules({columns, name});

    std::vector<std::string> errors;
    config.set("reader", "max_columns", ConfigValue(500));
    EXPECT_FALSE(config.validate(errors));
    EXPECT_EQ(errors.size(), 2u);

    config.set("reader", "max_columns", ConfigValue(64));
    config.set("reader", "name", ConfigValue("exports"));
    EXPECT_TRUE(config.validate(errors));
    EXPECT_TRUE(errors.empty());

    config.clearValidationRules();
    config.set("reader", "max_columns", ConfigValue("many"));
    EXPECT_TRUE(config.validate(errors));
}

TEST_F(ConfigManagerTest, DumpListsSectionsInOrder) {
    auto& config = ConfigManager::getInstance();
    config.set("output", "format", ConfigValue("text"));
    config.set("logging", "level", ConfigValue("info"));

    const std::string dump = config.dump();
    EXPECT_LT(dump.find("[logging]"), dump.find("[output]"));
    EXPECT_NE(dump.find("format = text"), std::string::npos);
}

// EN: vpreader settings
// FR: Paramètres vpreader

TEST_F(ConfigManagerTest, SettingsDefaults) {
    const ReaderSettings settings = loadReaderSettings(ConfigManager::getInstance());

    EXPECT_EQ(settings.log_level, LogLevel::INFO);
    EXPECT_FALSE(settings.log_file.has_value());
    EXPECT_EQ(settings.output_format, CSV::OutputFormat::TEXT);
    EXPECT_FALSE(settings.summary);
    EXPECT_FALSE(settings.reader.skip_empty_lines);
    EXPECT_TRUE(settings.reader.strip_utf8_bom);
}

TEST_F(ConfigManagerTest, SettingsFromYaml) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(TEST_YAML));

    const ReaderSettings settings = loadReaderSettings(config);

    EXPECT_EQ(settings.log_level, LogLevel::WARN);
    EXPECT_EQ(settings.log_file, std::optional<std::string>("/tmp/vpr/vpreader.log"));
    EXPECT_EQ(settings.output_format, CSV::OutputFormat::NDJSON);
    EXPECT_TRUE(settings.summary);
    EXPECT_TRUE(settings.reader.skip_empty_lines);
}

TEST_F(ConfigManagerTest, SettingsAcceptUpperCaseNames) {
    auto& config = ConfigManager::getInstance();
    config.set("logging", "level", ConfigValue("DEBUG"));
    config.set("output", "format", ConfigValue("NDJSON"));

    const ReaderSettings settings = loadReaderSettings(config);
    EXPECT_EQ(settings.log_level, LogLevel::DEBUG);
    EXPECT_EQ(settings.output_format, CSV::OutputFormat::NDJSON);
}

TEST_F(ConfigManagerTest, InvalidSettingsListEveryKey) {
    auto& config = ConfigManager::getInstance();
    config.set("output", "format", ConfigValue("xml"));
    config.set("output", "summary", ConfigValue("yes"));

    try {
        loadReaderSettings(config);
        FAIL() << "Expected ConfigurationError";
    } catch (const CSV::ConfigurationError& e) {
        const std::string message = e.what();
        EXPECT_NE(message.find("output.format"), std::string::npos);
        EXPECT_NE(message.find("output.summary"), std::string::npos);
    }
}

TEST_F(ConfigManagerTest, RepeatedSettingsLoadsDoNotAccumulateRules) {
    auto& config = ConfigManager::getInstance();
    loadReaderSettings(config);
    config.set("output", "format", ConfigValue("xml"));

    try {
        loadReaderSettings(config);
        FAIL() << "Expected ConfigurationError";
    } catch (const CSV::ConfigurationError& e) {
        const std::string message = e.what();
        EXPECT_EQ(message.find("output.format"), message.rfind("output.format"));
    }
}
