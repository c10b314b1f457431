/*
 * validation.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef RUNSTEP_CONFIG_CORE_VALIDATION_HPP
#define RUNSTEP_CONFIG_CORE_VALIDATION_HPP

#include <string>
#include <vector>

namespace runstep::config {

/**
 * @brief A single validation error
 */
struct ConfigValidationError {
    std::string path;     ///< Path to the invalid value
    std::string message;  ///< Error description
};

/**
 * @brief Result of configuration validation
 */
struct ConfigValidationResult {
    bool valid{true};
    std::vector<ConfigValidationError> errors;

    [[nodiscard]] bool isValid() const noexcept { return valid; }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }

    void addError(std::string path, std::string message) {
        valid = false;
        errors.push_back({std::move(path), std::move(message)});
    }

    void merge(const ConfigValidationResult& other) {
        for (const auto& error : other.errors) {
            addError(error.path, error.message);
        }
    }

    /**
     * @brief All errors as "path: message" joined with "; "
     */
    [[nodiscard]] std::string summary() const {
        std::string text;
        for (const auto& error : errors) {
            if (!text.empty()) {
                text += "; ";
            }
            text += error.path + ": " + error.message;
        }
        return text;
    }
};

}  // namespace runstep::config

#endif  // RUNSTEP_CONFIG_CORE_VALIDATION_HPP
