/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/Markers.hpp"

namespace SneakEngine {

PropertyDefaults PlayerState::defaultProperties() {
    return {
        {"id", JsonValue("player")},
    };
}

} // namespace SneakEngine
