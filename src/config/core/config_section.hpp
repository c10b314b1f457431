/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: CRTP base shared by the runstep configuration sections

**************************************************/

#ifndef RUNSTEP_CONFIG_CORE_CONFIG_SECTION_HPP
#define RUNSTEP_CONFIG_CORE_CONFIG_SECTION_HPP

#include <concepts>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "exception.hpp"
#include "validation.hpp"

namespace runstep::config {

using json = nlohmann::json;

/**
 * @brief What a section struct has to provide
 */
template <typename T>
concept ConfigSectionDerived = requires(T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { T::generateSchema() } -> std::convertible_to<json>;
    { t.check() } -> std::convertible_to<ConfigValidationResult>;
};

/**
 * @brief Base of every configuration section
 *
 * A section lives at the JSON pointer Derived::PATH of the configuration
 * document, e.g. "/runstep/shell". The derived struct supplies:
 *
 * - serialize(): the section as a JSON object
 * - static deserialize(const json&): a section from its object, with
 *   missing keys keeping their member defaults
 * - static generateSchema(): JSON schema of the object
 * - check(): value validation
 *
 * @tparam Derived The section struct
 */
template <typename Derived>
class ConfigSection {
public:
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    [[nodiscard]] static json::json_pointer pointer() {
        return json::json_pointer{std::string(Derived::PATH)};
    }

    [[nodiscard]] json toJson() const { return self().serialize(); }

    /**
     * @throws InvalidConfigException when a key has the wrong type
     */
    [[nodiscard]] static Derived fromJson(const json& object) {
        if (!object.is_object()) {
            THROW_INVALID_CONFIG_EXCEPTION("Section ", std::string(Derived::PATH),
                                           " must be an object");
        }
        try {
            return Derived::deserialize(object);
        } catch (const json::exception& e) {
            THROW_INVALID_CONFIG_EXCEPTION("Invalid value in ",
                                           std::string(Derived::PATH), ": ",
                                           e.what());
        }
    }

    /**
     * @brief The section found in a whole document, defaults when absent
     */
    [[nodiscard]] static Derived readFrom(const json& document) {
        auto at = pointer();
        if (!document.contains(at)) {
            return Derived{};
        }
        return fromJson(document.at(at));
    }

    void writeTo(json& document) const { document[pointer()] = toJson(); }

    [[nodiscard]] static json schema() { return Derived::generateSchema(); }

    [[nodiscard]] static Derived defaults() { return Derived{}; }

    [[nodiscard]] ConfigValidationResult validate() const {
        return self().check();
    }

    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == other.toJson();
    }

protected:
    /**
     * @brief Schema of one property
     */
    [[nodiscard]] static json property(std::string_view type, json fallback,
                                       std::string_view description = {}) {
        json prop{{"type", std::string(type)}, {"default", std::move(fallback)}};
        if (!description.empty()) {
            prop["description"] = std::string(description);
        }
        return prop;
    }

    /**
     * @brief "/runstep/section/key" for validation messages
     */
    [[nodiscard]] static std::string keyPath(std::string_view key) {
        return std::string(Derived::PATH) + "/" + std::string(key);
    }

private:
    [[nodiscard]] const Derived& self() const {
        return static_cast<const Derived&>(*this);
    }
};

}  // namespace runstep::config

#endif  // RUNSTEP_CONFIG_CORE_CONFIG_SECTION_HPP
