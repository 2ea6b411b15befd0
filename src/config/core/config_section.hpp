/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: ConfigSection CRTP base class for type-safe configuration sections

**************************************************/

#ifndef HEARTH_CONFIG_CORE_CONFIG_SECTION_HPP
#define HEARTH_CONFIG_CORE_CONFIG_SECTION_HPP

#include <string_view>

#include <nlohmann/json.hpp>

namespace hearth::config {

using json = nlohmann::json;

/**
 * @brief CRTP base class for type-safe configuration sections
 *
 * Derived classes must:
 *
 * 1. Define a static constexpr KEY member naming their object in the file
 * 2. Implement serialize() to convert to JSON
 * 3. Implement static deserialize(const json&) to create from JSON, taking
 *    every missing key from the default-constructed value
 *
 * @tparam Derived The derived configuration struct type (CRTP)
 */
template <typename Derived>
class ConfigSection {
public:
    [[nodiscard]] static constexpr std::string_view key() noexcept {
        return Derived::KEY;
    }

    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    [[nodiscard]] static Derived fromJson(const json& j) {
        if (!j.is_object()) {
            return Derived{};
        }
        return Derived::deserialize(j);
    }

    /**
     * @brief Read this section out of a whole configuration document
     */
    [[nodiscard]] static Derived fromDocument(const json& document) {
        auto it = document.find(std::string(Derived::KEY));
        if (it == document.end()) {
            return Derived{};
        }
        return fromJson(*it);
    }

    [[nodiscard]] static Derived defaults() { return Derived{}; }
};

}  // namespace hearth::config

#endif  // HEARTH_CONFIG_CORE_CONFIG_SECTION_HPP
