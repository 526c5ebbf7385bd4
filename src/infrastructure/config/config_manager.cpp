// EN: Implementation of the ConfigManager class. Provides YAML configuration parsing, environment overrides and validation.
// FR: Implémentation de la classe ConfigManager. Fournit le parsing YAML, les surcharges d'environnement et la validation.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <sstream>

#include <unistd.h>

extern char** environ;

namespace VPR {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

void ConfigSection::remove(const std::string& key) {
    values_.erase(key);
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ConfigManager implementation
ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

// EN: Load configuration from YAML file with error handling.
// FR: Charge la configuration depuis un fichier YAML avec gestion d'erreur.
bool ConfigManager::loadFromFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        if (!std::filesystem::exists(filename)) {
            LOG_ERROR("config", "Configuration file not found: " + filename);
            return false;
        }

        YAML::Node yaml = YAML::LoadFile(filename);
        loadNode(yaml);

        LOG_INFO("config", "Configuration loaded from: " + filename);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        loadNode(yaml);

        LOG_DEBUG("config", "Configuration loaded from string");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }
}

void ConfigManager::loadNode(const YAML::Node& root) {
    std::unordered_map<std::string, ConfigSection> loaded;

    // EN: An empty document is a valid, empty configuration.
    // FR: Un document vide est une configuration valide et vide.
    if (root.IsNull()) {
        sections_.swap(loaded);
        return;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("configuration root must be a mapping of sections");
    }

    for (const auto& section : root) {
        std::string section_name = section.first.as<std::string>();
        ConfigSection config_section;

        if (section.second.IsMap()) {
            for (const auto& item : section.second) {
                std::string key = item.first.as<std::string>();
                config_section.set(key, parseYamlValue(item.second));
            }
        } else {
            config_section.set("value", parseYamlValue(section.second));
        }

        loaded[section_name] = config_section;
    }

    // EN: Only replace existing content once the whole document parsed.
    // FR: Ne remplace le contenu existant qu'une fois tout le document analysé.
    sections_.swap(loaded);
}

ConfigValue ConfigManager::parseScalar(const std::string& text) {
    if (text == "true" || text == "false") {
        return ConfigValue(text == "true");
    }

    if (!text.empty()) {
        char* endptr = nullptr;
        const long long_value = std::strtol(text.c_str(), &endptr, 10);
        if (*endptr == '\0' && long_value >= INT_MIN && long_value <= INT_MAX) {
            return ConfigValue(static_cast<int>(long_value));
        }

        const double double_value = std::strtod(text.c_str(), &endptr);
        if (*endptr == '\0') {
            return ConfigValue(double_value);
        }
    }

    return ConfigValue(expandVariables(text));
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(array_value);
    }
    if (node.IsNull()) {
        return ConfigValue(std::string());
    }
    if (!node.IsScalar()) {
        throw std::runtime_error("nested mappings are not supported in configuration values");
    }
    return parseScalar(node.Scalar());
}

size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t applied = 0;

    // EN: VPR_OUTPUT_FORMAT=ndjson overrides output.format.
    // FR: VPR_OUTPUT_FORMAT=ndjson surcharge output.format.
    for (char** entry = environ; entry && *entry; ++entry) {
        const std::string variable(*entry);
        const size_t equals = variable.find('=');
        if (equals == std::string::npos || variable.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }

        const std::string name = variable.substr(prefix.size(), equals - prefix.size());
        const size_t underscore = name.find('_');
        if (underscore == std::string::npos || underscore == 0 || underscore + 1 == name.size()) {
            continue;
        }

        const std::string section = toLower(name.substr(0, underscore));
        const std::string key = toLower(name.substr(underscore + 1));
        sections_[section].set(key, parseScalar(variable.substr(equals + 1)));
        ++applied;

        LOG_DEBUG("config", "Environment override applied: " + section + "." + key);
    }

    return applied;
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
}

void ConfigManager::clearValidationRules() {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.clear();
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        size_t dot_pos = rule.key.find('.');
        std::string section_name = (dot_pos != std::string::npos) ?
            rule.key.substr(0, dot_pos) : "default";
        std::string key_name = (dot_pos != std::string::npos) ?
            rule.key.substr(dot_pos + 1) : rule.key;

        ConfigValue value;
        auto section_it = sections_.find(section_name);
        if (section_it != sections_.end()) {
            value = section_it->second.get(key_name);
        }

        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(rule.key, value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }

    return ConfigValue();
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    return section_it != sections_.end() && section_it->second.has(key);
}

void ConfigManager::remove(const std::string& section, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        section_it->second.remove(key);
    }
}

ConfigSection ConfigManager::getSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sections_.find(section);
    return it != sections_.end() ? it->second : ConfigSection();
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    validation_rules_.clear();
}

std::string ConfigManager::dump() const {
    std::vector<std::string> names = getSectionNames();

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;
    for (const auto& section_name : names) {
        const ConfigSection& section = sections_.at(section_name);
        oss << "[" << section_name << "]\n";
        for (const std::string& key : section.keys()) {
            oss << "  " << key << " = " << section.get(key).toString() << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

bool ConfigManager::validateValue(const std::string& key, const ConfigValue& value,
                                  const ValidationRule& rule, std::string& error) const {
    // Type validation
    if (rule.type == "bool" && !value.tryAs<bool>()) {
        error = "Configuration " + key + " must be a boolean";
        return false;
    } else if (rule.type == "int" && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be an integer";
        return false;
    } else if (rule.type == "double" && !value.tryAs<double>() && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be a number";
        return false;
    } else if (rule.type == "string" && !value.tryAs<std::string>()) {
        error = "Configuration " + key + " must be a string";
        return false;
    } else if (rule.type == "array" && !value.tryAs<std::vector<std::string>>()) {
        error = "Configuration " + key + " must be an array";
        return false;
    }

    // Range validation for numeric types
    if ((rule.type == "int" || rule.type == "double") &&
        (rule.min_value || rule.max_value)) {
        double numeric_value = 0.0;
        if (auto int_val = value.tryAs<int>()) {
            numeric_value = static_cast<double>(*int_val);
        } else if (auto double_val = value.tryAs<double>()) {
            numeric_value = *double_val;
        }

        if (rule.min_value && numeric_value < *rule.min_value) {
            error = "Configuration " + key + " must be >= " + std::to_string(*rule.min_value);
            return false;
        }
        if (rule.max_value && numeric_value > *rule.max_value) {
            error = "Configuration " + key + " must be <= " + std::to_string(*rule.max_value);
            return false;
        }
    }

    // Allowed values validation (case-insensitive)
    if (!rule.allowed_values.empty()) {
        const std::string str_value = toLower(value.toString());
        bool found = std::any_of(rule.allowed_values.begin(), rule.allowed_values.end(),
                                 [&str_value](const std::string& allowed) {
                                     return toLower(allowed) == str_value;
                                 });
        if (!found) {
            error = "Configuration " + key + " must be one of: ";
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                if (i > 0) error += ", ";
                error += rule.allowed_values[i];
            }
            return false;
        }
    }

    return true;
}

std::string ConfigManager::expandVariables(const std::string& value) {
    std::string result = value;
    static const std::regex var_regex(R"(\$\{([^}]+)\})");
    std::smatch match;

    std::string::const_iterator search_start = result.cbegin();
    std::string expanded;
    while (std::regex_search(search_start, result.cend(), match, var_regex)) {
        const char* env_value = std::getenv(match[1].str().c_str());
        expanded.append(match.prefix().first, match.prefix().second);
        // EN: Unknown variables are left as-is.
        // FR: Les variables inconnues sont laissées telles quelles.
        expanded += env_value ? std::string(env_value) : match[0].str();
        search_start = match[0].second;
    }
    expanded.append(search_start, result.cend());
    return expanded;
}

} // namespace VPR
