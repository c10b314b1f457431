/*
 * config_loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config_loader.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

namespace runstep::config {

json RunstepConfig::toJson() const {
    json document = json::object();
    terraform.writeTo(document);
    shell.writeTo(document);
    logging.writeTo(document);
    return document;
}

ConfigValidationResult RunstepConfig::validate() const {
    ConfigValidationResult result;
    result.merge(terraform.validate());
    result.merge(shell.validate());
    result.merge(logging.validate());
    return result;
}

RunstepConfig ConfigLoader::loadFromFile(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        THROW_CONFIG_IO_EXCEPTION("Failed to open file: ", path.string());
    }

    json document;
    try {
        document = json::parse(ifs);
    } catch (const json::parse_error& e) {
        THROW_BAD_CONFIG_EXCEPTION("Error parsing JSON in ", path.string(), ": ",
                                   e.what());
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return loadFromJson(document);
}

RunstepConfig ConfigLoader::loadFromJson(const json& document) {
    if (!document.is_object()) {
        THROW_INVALID_CONFIG_EXCEPTION("Configuration must be a JSON object");
    }

    RunstepConfig config;
    config.terraform = TerraformConfig::readFrom(document);
    config.shell = ShellConfig::readFrom(document);
    config.logging = LoggingConfig::readFrom(document);

    if (auto result = config.validate(); !result) {
        THROW_CONFIG_VALIDATION_EXCEPTION("Invalid configuration: ",
                                          result.summary());
    }
    return config;
}

}  // namespace runstep::config
