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
#include <nlohmann/json.hpp>

#include "PresenceDatagram.h"

using json = nlohmann::json;

namespace redphone {

const char* PresenceDatagram::PROTOCOL_TAG = "redphone";

std::string PresenceDatagram::encode() const {
    json o;
    o["proto"] = PROTOCOL_TAG;
    o["v"] = PROTOCOL_VERSION;
    o["host"] = hostName;
    o["name"] = displayName;
    o["ext"] = extension;
    o["ui"] = uiPort;
    return o.dump();
}

PresenceDatagram::ParseResult PresenceDatagram::decode(const uint8_t* buf, 
    unsigned bufLen) {

    if (buf == 0 || bufLen == 0 || bufLen > MAX_SIZE)
        return ParseResult::PARSE_MALFORMED;

    // Parse without exceptions, a discarded document comes back
    json o = json::parse(buf, buf + bufLen, nullptr, false);
    if (o.is_discarded() || !o.is_object())
        return ParseResult::PARSE_MALFORMED;

    if (!o.contains("proto") || !o["proto"].is_string() ||
        o["proto"].get<std::string>() != PROTOCOL_TAG)
        return ParseResult::PARSE_FOREIGN;

    if (!o.contains("v") || !o["v"].is_number_unsigned() ||
        o["v"].get<unsigned>() != PROTOCOL_VERSION)
        return ParseResult::PARSE_BAD_VERSION;

    if (!o.contains("host") || !o["host"].is_string() ||
        !o.contains("ext") || !o["ext"].is_number_unsigned())
        return ParseResult::PARSE_MALFORMED;

    hostName = o["host"].get<std::string>();
    if (hostName.empty() || hostName.size() > MAX_HOST_NAME)
        return ParseResult::PARSE_MALFORMED;
    extension = o["ext"].get<unsigned>();

    if (o.contains("name") && o["name"].is_string())
        displayName = o["name"].get<std::string>();
    else 
        displayName = hostName;
    if (displayName.empty())
        displayName = hostName;

    if (o.contains("ui") && o["ui"].is_number_unsigned())
        uiPort = o["ui"].get<unsigned>();
    else 
        uiPort = 0;

    return ParseResult::PARSE_OK;
}

}
