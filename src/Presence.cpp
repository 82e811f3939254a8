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
#include <string>

#include "redphone/Presence.h"

namespace redphone {

std::string makeIdentity(const char* hostName, unsigned extension) {
    std::string id(hostName);
    id += "/";
    id += std::to_string(extension);
    return id;
}

const char* tierName(PresenceRecord::Tier tier) {
    switch (tier) {
        case PresenceRecord::Tier::TIER_LOCAL_SEGMENT: return "local";
        case PresenceRecord::Tier::TIER_VPN_DIRECTORY: return "vpn-directory";
        case PresenceRecord::Tier::TIER_VPN_BROADCAST: return "vpn-broadcast";
    }
    return "unknown";
}

const char* statusName(PresenceRecord::Status status) {
    return status == PresenceRecord::Status::STATUS_ONLINE ? "online" : "stale";
}

}
