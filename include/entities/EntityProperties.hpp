/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_PROPERTIES_HPP
#define ENTITY_PROPERTIES_HPP

#include "utils/JsonReader.hpp"
#include <functional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace SneakEngine {

enum class PropertyType : uint8_t {
    Boolean,
    Number,
    String,
    StringArray
};

std::ostream& operator<<(std::ostream& os, PropertyType type);

/**
 * @brief Declares one property a kind understands.
 *
 * allowedValues is only consulted for String properties; empty means any
 * string is accepted.
 */
struct PropertyRule {
    std::string name;
    PropertyType type{PropertyType::String};
    bool required{false};
    std::vector<std::string> allowedValues{};
};

using PropertyRules = std::vector<PropertyRule>;

// A default is either a literal or a factory evaluated once per entity
using PropertyFactory = std::function<JsonValue()>;
using PropertyDefault = std::variant<JsonValue, PropertyFactory>;
using PropertyDefaults = std::vector<std::pair<std::string, PropertyDefault>>;

/**
 * @brief Validated key/value record an entity is built from.
 *
 * Built in three stages: defaults are laid down (a later entry for the same
 * key replaces an earlier one), caller values are
 * merged over them (caller wins), and any factory defaults still present
 * are evaluated. validate() then checks the record against the kind's
 * rules. Keys that no rule mentions are kept untouched.
 */
class EntityProperties {
public:
    EntityProperties() = default;

    static EntityProperties build(const PropertyDefaults& defaults,
                                  const JsonObject& overrides);

    // "a" becomes ["a"]; other values are left for validate() to judge
    void normalizeToArray(const std::string& key);

    /**
     * @throws EntityConfigError naming entityLabel and the offending property
     */
    void validate(const std::string& entityLabel, const PropertyRules& rules) const;

    [[nodiscard]] bool has(const std::string& key) const;
    [[nodiscard]] const JsonValue* find(const std::string& key) const;

    bool getBool(const std::string& key, bool fallback = false) const;
    double getNumber(const std::string& key, double fallback = 0.0) const;
    int getInt(const std::string& key, int fallback = 0) const;
    std::string getString(const std::string& key, const std::string& fallback = "") const;
    std::vector<std::string> getStringList(const std::string& key) const;

    void set(const std::string& key, JsonValue value);

    [[nodiscard]] const JsonObject& values() const noexcept { return m_values; }
    [[nodiscard]] size_t size() const noexcept { return m_values.size(); }

    std::string toString() const;

private:
    JsonObject m_values;
};

} // namespace SneakEngine

#endif // ENTITY_PROPERTIES_HPP
