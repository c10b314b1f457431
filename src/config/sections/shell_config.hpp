/*
 * shell_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef RUNSTEP_CONFIG_SECTIONS_SHELL_CONFIG_HPP
#define RUNSTEP_CONFIG_SECTIONS_SHELL_CONFIG_HPP

#include <string>
#include <vector>

#include "../core/config_section.hpp"
#include "runtime/types.hpp"

namespace runstep::config {

/**
 * @brief How run step commands are executed
 */
struct ShellConfig : ConfigSection<ShellConfig> {
    static constexpr std::string_view PATH = "/runstep/shell";

    std::string shell{"sh"};
    std::vector<std::string> shellArgs{"-c"};
    bool inheritEnvironment{false};  ///< Pass the engine's environment through
    bool streamOutput{true};         ///< Forward lines to the output handler

    [[nodiscard]] json serialize() const {
        return {{"shell", shell},
                {"shellArgs", shellArgs},
                {"inheritEnvironment", inheritEnvironment},
                {"streamOutput", streamOutput}};
    }

    [[nodiscard]] static ShellConfig deserialize(const json& j) {
        ShellConfig cfg;
        cfg.shell = j.value("shell", cfg.shell);
        if (j.contains("shellArgs") && j["shellArgs"].is_array()) {
            cfg.shellArgs = j["shellArgs"].get<std::vector<std::string>>();
        }
        cfg.inheritEnvironment = j.value("inheritEnvironment", cfg.inheritEnvironment);
        cfg.streamOutput = j.value("streamOutput", cfg.streamOutput);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        return {
            {"type", "object"},
            {"properties", {
                {"shell", {{"type", "string"}, {"default", "sh"}}},
                {"shellArgs", {{"type", "array"}, {"items", {{"type", "string"}}}, {"default", {"-c"}}}},
                {"inheritEnvironment", {{"type", "boolean"}, {"default", false}}},
                {"streamOutput", {{"type", "boolean"}, {"default", true}}}
            }}
        };
    }

    [[nodiscard]] ConfigValidationResult check() const {
        ConfigValidationResult result;
        if (shell.empty()) {
            result.addError(keyPath("shell"), "must not be empty");
        }
        return result;
    }

    [[nodiscard]] runtime::CommandShell commandShell() const {
        return runtime::CommandShell{shell, shellArgs};
    }
};

}  // namespace runstep::config

#endif  // RUNSTEP_CONFIG_SECTIONS_SHELL_CONFIG_HPP
