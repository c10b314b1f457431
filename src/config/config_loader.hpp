/*
 * config_loader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Loads and validates the runstep configuration file

**************************************************/

#ifndef RUNSTEP_CONFIG_CONFIG_LOADER_HPP
#define RUNSTEP_CONFIG_CONFIG_LOADER_HPP

#include <filesystem>

#include "core/exception.hpp"
#include "sections/logging_config.hpp"
#include "sections/shell_config.hpp"
#include "sections/terraform_config.hpp"

namespace runstep::config {

/**
 * @brief Every configuration section of runstep
 */
struct RunstepConfig {
    TerraformConfig terraform;
    ShellConfig shell;
    LoggingConfig logging;

    /**
     * @brief Nested document, e.g. {"runstep": {"terraform": {...}, ...}}
     */
    [[nodiscard]] json toJson() const;

    [[nodiscard]] ConfigValidationResult validate() const;
};

class ConfigLoader {
public:
    /**
     * @brief Read, parse and validate a JSON configuration file
     *
     * @throws ConfigIOException if the file cannot be read
     * @throws BadConfigException if the file is not valid JSON
     * @throws InvalidConfigException if a value has the wrong type
     * @throws ConfigValidationException listing every invalid value
     */
    [[nodiscard]] static RunstepConfig loadFromFile(
        const std::filesystem::path& path);

    /**
     * @brief Deserialize and validate an already parsed document
     *
     * Missing sections and keys take their defaults.
     */
    [[nodiscard]] static RunstepConfig loadFromJson(const json& document);
};

}  // namespace runstep::config

#endif  // RUNSTEP_CONFIG_CONFIG_LOADER_HPP
