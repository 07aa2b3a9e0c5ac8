/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UNIQUE_ID_HPP
#define UNIQUE_ID_HPP

#include <atomic>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace SneakEngine {
    /**
     * @brief Process-wide counter behind generated entity IDs.
     *
     * Entities authored without an explicit "id" property receive one of the
     * form "<Kind>_<n>". The counter is never reset, so two generated IDs
     * never collide even across levels.
     */
    class UniqueID {
    public:
        using IDType = uint64_t;

        static IDType generate() {
            return m_nextID++;
        }

        // e.g. makeName("Door") -> "Door_7"
        static std::string makeName(std::string_view prefix) {
            return std::format("{}_{}", prefix, generate());
        }

        static constexpr IDType INVALID_ID = 0;

    private:
        // Starts at 1 so INVALID_ID is never handed out
        static inline std::atomic<IDType> m_nextID{1};
    };

} // namespace SneakEngine

#endif // UNIQUE_ID_HPP
