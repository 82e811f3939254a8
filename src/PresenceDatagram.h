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
 * The presence announcement that phones broadcast to each other. On 
 * the wire this is a small JSON document:
 *
 *   {"proto":"redphone","v":1,"host":"kitchen","name":"Kitchen","ext":101,"ui":5000}
 *
 * The sender's address is taken from the datagram source, not from
 * the body.
 */
struct PresenceDatagram {

    static const char* PROTOCOL_TAG;
    static constexpr unsigned PROTOCOL_VERSION = 1;
    static constexpr unsigned MAX_SIZE = 512;
    // The longest legal DNS name
    static constexpr unsigned MAX_HOST_NAME = 253;

    enum ParseResult {
        PARSE_OK = 0,
        PARSE_MALFORMED = -1,
        PARSE_FOREIGN = -2,
        PARSE_BAD_VERSION = -3
    };

    std::string hostName;
    std::string displayName;
    unsigned extension = 0;
    unsigned uiPort = 0;

    std::string encode() const;

    /**
     * Decodes a datagram received from the network. The buffer is 
     * not trusted in any way.
     */
    ParseResult decode(const uint8_t* buf, unsigned bufLen);
};

}
