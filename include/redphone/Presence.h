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
#include <string>

namespace redphone {

/**
 * The last-known reachability and identity information for one
 * peer phone.
 */
struct PresenceRecord {

    enum Tier {
        TIER_LOCAL_SEGMENT,
        TIER_VPN_DIRECTORY,
        TIER_VPN_BROADCAST
    };

    enum Status {
        STATUS_ONLINE,
        STATUS_STALE
    };

    // Stable key, see makeIdentity()
    std::string identity;
    std::string displayName;
    unsigned extension = 0;
    // Dotted IP address of the peer
    std::string address;
    Tier tier = Tier::TIER_LOCAL_SEGMENT;
    // Times are in milliseconds on the local monotonic clock
    uint32_t firstSeenMs = 0;
    uint32_t lastSeenMs = 0;
    Status status = Status::STATUS_ONLINE;

    bool isOnline() const { return status == Status::STATUS_ONLINE; }
};

/**
 * The identity of a phone is built from its host name and extension.
 * Neither changes when the phone moves between networks.
 */
std::string makeIdentity(const char* hostName, unsigned extension);

const char* tierName(PresenceRecord::Tier tier);
const char* statusName(PresenceRecord::Status status);

/**
 * Everything a discovery source needs to know about the local phone.
 */
struct SelfIdentity {
    std::string identity;
    std::string hostName;
    std::string displayName;
    unsigned extension = 0;
    // The HTTP port where /api/info is served
    unsigned uiPort = 5000;
};

}
