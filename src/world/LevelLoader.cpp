/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/LevelLoader.hpp"
#include "core/GameErrors.hpp"
#include "core/Logger.hpp"
#include <format>

namespace SneakEngine {

namespace {
[[noreturn]] void reject(const std::string& source, const std::string& what) {
    std::string msg = std::format("{}: {}", source, what);
    LOADER_ERROR(msg);
    throw LevelLoadError(msg);
}

int requireInt(const JsonValue& root, const std::string& key, const std::string& source) {
    const JsonValue* value = root.find(key);
    if (value == nullptr || !value->isInteger()) {
        reject(source, std::format("'{}' must be an integer", key));
    }
    return value->asInt();
}

Point readPosition(const JsonValue& value, const std::string& source, size_t index) {
    const JsonArray* pair = value.tryAsArray();
    if (pair != nullptr && pair->size() == 2 && (*pair)[0].isInteger() && (*pair)[1].isInteger()) {
        return Point((*pair)[0].asInt(), (*pair)[1].asInt());
    }
    // {"x": .., "y": ..} is accepted as well
    if (value.isObject() && value["x"].isInteger() && value["y"].isInteger()) {
        return Point(value["x"].asInt(), value["y"].asInt());
    }
    reject(source, std::format("entity #{} has a malformed position; expected [x, y]", index));
}
} // namespace

LevelDescriptor LevelLoader::loadFromFile(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        reject(path, reader.getLastError());
    }
    LOADER_DEBUG("Parsed level file: " + path);
    return fromJson(reader.getRoot(), path);
}

LevelDescriptor LevelLoader::loadFromString(std::string_view json, const std::string& sourceName) {
    JsonReader reader;
    if (!reader.parse(json)) {
        reject(sourceName, reader.getLastError());
    }
    return fromJson(reader.getRoot(), sourceName);
}

LevelDescriptor LevelLoader::fromJson(const JsonValue& root, const std::string& sourceName) {
    if (!root.isObject()) {
        reject(sourceName, "root must be a JSON object");
    }

    LevelDescriptor descriptor;
    descriptor.name = root["name"].tryAsString().value_or(sourceName);
    descriptor.width = requireInt(root, "width", sourceName);
    descriptor.height = requireInt(root, "height", sourceName);

    const std::string tilesetName = root["tileset"].tryAsString().value_or("standard");
    descriptor.tileset = Tileset::byName(tilesetName);
    if (!descriptor.tileset) {
        reject(sourceName, std::format("unknown tileset '{}'", tilesetName));
    }

    const JsonArray* tiles = root["tiles"].tryAsArray();
    if (tiles == nullptr) {
        reject(sourceName, "'tiles' must be an array");
    }
    descriptor.tiles.reserve(tiles->size());
    for (size_t i = 0; i < tiles->size(); ++i) {
        if (!(*tiles)[i].isInteger()) {
            reject(sourceName, std::format("tile #{} is not an integer", i));
        }
        descriptor.tiles.push_back((*tiles)[i].asInt());
    }

    if (const JsonValue* entities = root.find("entities")) {
        const JsonArray* list = entities->tryAsArray();
        if (list == nullptr) {
            reject(sourceName, "'entities' must be an array");
        }
        descriptor.entities.reserve(list->size());

        for (size_t i = 0; i < list->size(); ++i) {
            const JsonObject* object = (*list)[i].tryAsObject();
            if (object == nullptr) {
                reject(sourceName, std::format("entity #{} is not an object", i));
            }

            EntityDescriptor entity;
            auto typeIt = object->find("type");
            if (typeIt == object->end() || !typeIt->second.isString()) {
                reject(sourceName, std::format("entity #{} has no 'type' string", i));
            }
            entity.type = typeIt->second.asString();

            auto positionIt = object->find("position");
            if (positionIt != object->end()) {
                entity.position = readPosition(positionIt->second, sourceName, i);
            }

            for (const auto& [key, value] : *object) {
                if (key != "type" && key != "position") {
                    entity.properties.emplace(key, value);
                }
            }
            descriptor.entities.push_back(std::move(entity));
        }
    }

    LOADER_INFO(std::format("Loaded level descriptor '{}' ({}x{}, {} entities)", descriptor.name,
                            descriptor.width, descriptor.height, descriptor.entities.size()));
    return descriptor;
}

} // namespace SneakEngine
