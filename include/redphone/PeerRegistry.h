/**
 * Copyright (C) 2025, Bruce MacKinnon KC1FSZ
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "redphone/Presence.h"

namespace redphone {

/**
 * A thread-safe collection of presence records, one per peer identity.
 *
 * Records are only changed through upsert() and sweep(). Readers always
 * receive copies so a concurrent sweep can never produce a torn read.
 * No I/O happens while the internal lock is held.
 */
class PeerRegistry {
public:

    static constexpr uint32_t DEFAULT_STALE_MS = 120 * 1000;
    static constexpr uint32_t DEFAULT_EVICT_MS = 10 * DEFAULT_STALE_MS;

    PeerRegistry(uint32_t staleMs = DEFAULT_STALE_MS,
        uint32_t evictMs = DEFAULT_EVICT_MS);

    void setThresholds(uint32_t staleMs, uint32_t evictMs);

    /**
     * Merges a sighting into the registry. The sighting is ignored if
     * it is older than what we already have, so duplicate or late
     * deliveries can never roll the last-seen time backwards.
     *
     * @returns true if the sighting was accepted.
     */
    bool upsert(const PresenceRecord& rec);

    /**
     * @returns A copy of all records, ordered by display name.
     */
    std::vector<PresenceRecord> snapshot() const;

    /**
     * @returns true if the identity is known, and fills in rec.
     */
    bool lookup(const std::string& identity, PresenceRecord& rec) const;

    /**
     * Marks records stale after the staleness threshold and removes
     * them entirely after the eviction threshold.
     *
     * @returns The number of records that changed.
     */
    unsigned sweep(uint32_t nowMs);

    /**
     * @returns A counter that moves every time the visible content of the
     * registry changes (add, change of name/extension/address/tier/status,
     * evict). A refresh that only moves the last-seen time does not count.
     */
    uint64_t revision() const;

    unsigned size() const;

private:

    mutable std::mutex _lock;
    uint32_t _staleMs;
    uint32_t _evictMs;
    std::map<std::string, PresenceRecord> _records;
    uint64_t _revision = 0;
};

}
