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

#include <string>
#include <vector>

namespace redphone {

/**
 * One phone as reported by a VPN directory.
 */
struct DirectoryEntry {
    std::string hostName;
    std::string displayName;
    // Dotted VPN address
    std::string address;
    // Zero if the phone's extension could not be learned
    unsigned extension = 0;
};

/**
 * Something that can list the phones carrying our tag on a VPN. The
 * call is blocking and may take a while, it is only ever made from 
 * a DirectorySource thread.
 */
class DirectoryClient {
public:

    virtual ~DirectoryClient() { }

    /**
     * @returns The number of peers found, or -1 if the directory could
     * not be reached or returned something unreadable.
     */
    virtual int listTaggedPeers(std::vector<DirectoryEntry>& peers) = 0;
};

}
