// EN: Fatal error types raised while resolving, reading and normalizing viewing period tables
// FR: Types d'erreurs fatales levées lors de la résolution, lecture et normalisation des tables de périodes

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace VPR::CSV {

// EN: Invalid setup: unsupported file extension, bad configuration value
// FR: Configuration invalide : extension de fichier non supportée, mauvaise valeur de configuration
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

// EN: Input cannot be used at all: unopenable file, missing or unreadable header
// FR: Entrée inutilisable : fichier impossible à ouvrir, en-tête manquant ou illisible
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& message) : std::runtime_error(message) {}
};

// EN: Malformed cell value for a timestamp, duration or ber column. Aborts the whole run.
// FR: Valeur de cellule malformée pour une colonne timestamp, durée ou ber. Interrompt toute l'exécution.
class FieldParseError : public std::runtime_error {
public:
    FieldParseError(const std::string& field, const std::string& value, const std::string& reason,
                    std::size_t line_number = 0)
        : std::runtime_error(buildMessage(field, value, reason, line_number)),
          field_(field), value_(value), reason_(reason), line_number_(line_number) {}

    const std::string& getField() const { return field_; }
    const std::string& getValue() const { return value_; }
    const std::string& getReason() const { return reason_; }

    // EN: 1-based input line, 0 when the error was raised outside of a reader
    // FR: Ligne d'entrée en base 1, 0 si l'erreur a été levée hors d'un lecteur
    std::size_t getLineNumber() const { return line_number_; }

    // EN: Copy of this error attributed to a line and column
    // FR: Copie de cette erreur attribuée à une ligne et une colonne
    FieldParseError withLocation(const std::string& column, std::size_t line_number) const {
        return FieldParseError(column, value_, reason_, line_number);
    }

private:
    static std::string buildMessage(const std::string& field, const std::string& value,
                                    const std::string& reason, std::size_t line_number) {
        std::string message = "failed to parse field '" + field + "' from value '" + value + "': " + reason;
        if (line_number > 0) {
            message += " (line " + std::to_string(line_number) + ")";
        }
        return message;
    }

    std::string field_;
    std::string value_;
    std::string reason_;
    std::size_t line_number_;
};

} // namespace VPR::CSV
