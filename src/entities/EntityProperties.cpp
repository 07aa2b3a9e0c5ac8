/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/EntityProperties.hpp"
#include "core/GameErrors.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace SneakEngine {

namespace {
const char* describeType(PropertyType type) {
    switch (type) {
        case PropertyType::Boolean:     return "a boolean";
        case PropertyType::Number:      return "a number";
        case PropertyType::String:      return "a string";
        case PropertyType::StringArray: return "an array of strings";
    }
    return "unknown";
}

bool matchesType(const JsonValue& value, PropertyType type) {
    switch (type) {
        case PropertyType::Boolean:
            return value.isBool();
        case PropertyType::Number:
            return value.isNumber();
        case PropertyType::String:
            return value.isString();
        case PropertyType::StringArray: {
            const JsonArray* arr = value.tryAsArray();
            return arr != nullptr &&
                   std::all_of(arr->begin(), arr->end(),
                               [](const JsonValue& v) { return v.isString(); });
        }
    }
    return false;
}

[[noreturn]] void reject(const std::string& entityLabel, const std::string& what) {
    ENTITY_ERROR(std::format("{}: {}", entityLabel, what));
    throw EntityConfigError(entityLabel, what);
}
} // namespace

std::ostream& operator<<(std::ostream& os, PropertyType type) {
    return os << describeType(type);
}

EntityProperties EntityProperties::build(const PropertyDefaults& defaults,
                                         const JsonObject& overrides) {
    EntityProperties props;

    // Later defaults shadow earlier ones (kind over common). Walking backwards
    // means a factory is only evaluated when its value is actually used.
    for (auto it = defaults.rbegin(); it != defaults.rend(); ++it) {
        const auto& [key, def] = *it;
        if (overrides.count(key) != 0 || props.m_values.count(key) != 0) {
            continue;
        }
        if (const JsonValue* literal = std::get_if<JsonValue>(&def)) {
            props.m_values[key] = *literal;
        } else {
            props.m_values[key] = std::get<PropertyFactory>(def)();
        }
    }

    for (const auto& [key, value] : overrides) {
        props.m_values[key] = value;
    }

    return props;
}

void EntityProperties::normalizeToArray(const std::string& key) {
    auto it = m_values.find(key);
    if (it != m_values.end() && it->second.isString()) {
        JsonArray wrapped;
        wrapped.push_back(it->second);
        it->second = JsonValue(std::move(wrapped));
    }
}

void EntityProperties::validate(const std::string& entityLabel,
                                const PropertyRules& rules) const {
    for (const auto& rule : rules) {
        const JsonValue* value = find(rule.name);

        // An explicit null counts as absent
        if (value == nullptr || value->isNull()) {
            if (rule.required) {
                reject(entityLabel, std::format("missing required property '{}'", rule.name));
            }
            continue;
        }

        if (!matchesType(*value, rule.type)) {
            reject(entityLabel, std::format("property '{}' must be {}, got {}", rule.name,
                                            describeType(rule.type),
                                            jsonTypeName(value->getType())));
        }

        if (rule.type == PropertyType::String && !rule.allowedValues.empty()) {
            const std::string& text = value->asString();
            if (std::find(rule.allowedValues.begin(), rule.allowedValues.end(), text) ==
                rule.allowedValues.end()) {
                std::string allowed;
                for (const auto& option : rule.allowedValues) {
                    allowed += allowed.empty() ? option : ", " + option;
                }
                reject(entityLabel, std::format("property '{}' has value '{}', expected one of: {}",
                                                rule.name, text, allowed));
            }
        }
    }
}

bool EntityProperties::has(const std::string& key) const {
    return m_values.count(key) != 0;
}

const JsonValue* EntityProperties::find(const std::string& key) const {
    auto it = m_values.find(key);
    return it == m_values.end() ? nullptr : &it->second;
}

bool EntityProperties::getBool(const std::string& key, bool fallback) const {
    const JsonValue* v = find(key);
    return v != nullptr ? v->tryAsBool().value_or(fallback) : fallback;
}

double EntityProperties::getNumber(const std::string& key, double fallback) const {
    const JsonValue* v = find(key);
    return v != nullptr ? v->tryAsNumber().value_or(fallback) : fallback;
}

int EntityProperties::getInt(const std::string& key, int fallback) const {
    const JsonValue* v = find(key);
    return v != nullptr ? v->tryAsInt().value_or(fallback) : fallback;
}

std::string EntityProperties::getString(const std::string& key,
                                        const std::string& fallback) const {
    const JsonValue* v = find(key);
    return v != nullptr ? v->tryAsString().value_or(fallback) : fallback;
}

std::vector<std::string> EntityProperties::getStringList(const std::string& key) const {
    std::vector<std::string> result;
    const JsonValue* v = find(key);
    if (v == nullptr) {
        return result;
    }
    if (v->isString()) {
        result.push_back(v->asString());
        return result;
    }
    if (const JsonArray* arr = v->tryAsArray()) {
        result.reserve(arr->size());
        for (const auto& element : *arr) {
            if (element.isString()) {
                result.push_back(element.asString());
            }
        }
    }
    return result;
}

void EntityProperties::set(const std::string& key, JsonValue value) {
    m_values[key] = std::move(value);
}

std::string EntityProperties::toString() const {
    return JsonValue(m_values).toString();
}

} // namespace SneakEngine
