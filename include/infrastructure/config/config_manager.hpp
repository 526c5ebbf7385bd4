#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace VPR {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;
    ConfigValue(bool value) : value_(value) {}
    ConfigValue(int value) : value_(value) {}
    ConfigValue(double value) : value_(value) {}
    ConfigValue(const std::string& value) : value_(value) {}
    ConfigValue(const char* value) : value_(std::string(value)) {}
    ConfigValue(const std::vector<std::string>& value) : value_(value) {}

    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si vide ou type incorrect).
    template<typename T>
    T as() const {
        if (!value_) {
            throw std::runtime_error("ConfigValue is empty");
        }
        const T* typed = std::get_if<T>(&*value_);
        if (!typed) {
            throw std::runtime_error("ConfigValue type mismatch");
        }
        return *typed;
    }

    // EN: Try to get value as specific type (returns nullopt if empty or type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si vide ou type incorrect).
    template<typename T>
    std::optional<T> tryAs() const {
        if (!value_) {
            return std::nullopt;
        }
        const T* typed = std::get_if<T>(&*value_);
        if (!typed) {
            return std::nullopt;
        }
        return *typed;
    }

    template<typename T>
    T asOrDefault(const T& default_value) const {
        auto result = tryAs<T>();
        return result ? *result : default_value;
    }

    bool isValid() const { return value_.has_value(); }

    // EN: Convert value to string representation.
    // FR: Convertit la valeur en représentation chaîne.
    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    ConfigSection() = default;

    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;
    void remove(const std::string& key);

    // EN: Keys in sorted order.
    // FR: Clés triées.
    std::vector<std::string> keys() const;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Configuration manager reading a two-level YAML document (section -> key -> value),
//     with environment overrides and rule-based validation.
// FR: Gestionnaire de configuration lisant un document YAML à deux niveaux (section -> clé -> valeur),
//     avec surcharges d'environnement et validation par règles.
class ConfigManager {
public:
    // EN: Validation rule structure for configuration values. Keys are "section.key".
    // FR: Structure de règle de validation. Les clés sont "section.key".
    struct ValidationRule {
        std::string key;
        std::string type; // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file. Replaces the current content on success.
    // FR: Charge la configuration depuis un fichier YAML. Remplace le contenu actuel en cas de succès.
    bool loadFromFile(const std::string& filename);

    // EN: Load configuration from YAML string.
    // FR: Charge la configuration depuis une chaîne YAML.
    bool loadFromString(const std::string& yaml_content);

    // EN: Apply PREFIX<SECTION>_<KEY>=value environment variables as section.key overrides
    //     (names lower-cased). Returns the number of overrides applied.
    // FR: Applique les variables PREFIX<SECTION>_<KEY>=valeur comme surcharges de section.key
    //     (noms en minuscules). Retourne le nombre de surcharges appliquées.
    size_t loadEnvironmentOverrides(const std::string& prefix = "VPR_");

    void addValidationRules(const std::vector<ValidationRule>& rules);
    void clearValidationRules();

    // EN: Validate current configuration against rules.
    // FR: Valide la configuration actuelle contre les règles.
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& section, const std::string& key) const;
    void remove(const std::string& section, const std::string& key);

    ConfigSection getSection(const std::string& section) const;
    std::vector<std::string> getSectionNames() const;

    // EN: Reset all configuration data and rules.
    // FR: Remet à zéro toutes les données et règles de configuration.
    void reset();

    // EN: Dump current configuration as string for debugging.
    // FR: Vide la configuration actuelle en chaîne pour débogage.
    std::string dump() const;

    // EN: Typed value from a scalar string: bool, then int, then double, else string.
    // FR: Valeur typée depuis une chaîne scalaire : bool, puis int, puis double, sinon chaîne.
    static ConfigValue parseScalar(const std::string& text);

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // EN: Replace content with a parsed YAML root. Caller holds the lock.
    // FR: Remplace le contenu par une racine YAML analysée. L'appelant détient le verrou.
    void loadNode(const YAML::Node& root);

    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;

    // EN: Expand ${VAR} references from the environment.
    // FR: Étend les références ${VAR} depuis l'environnement.
    static std::string expandVariables(const std::string& value);

    ConfigValue parseYamlValue(const YAML::Node& node) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

} // namespace VPR
