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

#include <atomic>
#include <string>
#include <vector>

#include "DirectoryClient.h"

namespace kc1fsz {
class Log;
}

namespace redphone {

/**
 * Lists tagged phones using the local API of the Tailscale daemon. The 
 * daemon is reached through its UNIX socket. Each tagged peer is then 
 * asked for its /api/info document so that we can learn its extension.
 */
class TailscaleDirectory : public DirectoryClient {
public:

    static constexpr const char* DEFAULT_SOCKET_PATH = 
        "/var/run/tailscale/tailscaled.sock";

    TailscaleDirectory(kc1fsz::Log& log, const char* socketPath, 
        const char* tag, unsigned infoPort);

    void setTrace(bool a) { _trace = a; }

    virtual int listTaggedPeers(std::vector<DirectoryEntry>& peers);

    /**
     * Pulls the online peers carrying "tag:<tag>" out of a daemon status 
     * document. The extension is not known at this point and is left 
     * at zero.
     *
     * @returns The number of peers found, or -1 if the document can't
     *   be parsed.
     */
    static int parseStatus(const std::string& doc, const char* tag,
        std::vector<DirectoryEntry>& peers);

    /**
     * Fills in the extension and display name from a peer's /api/info 
     * document. 
     *
     * @returns 0 on success, -1 if the document isn't usable.
     */
    static int parseInfo(const std::string& doc, DirectoryEntry& entry);

private:

    int _get(const char* url, const char* unixSocketPath, long timeoutSec,
        std::string& body);

    static size_t _writeCallback(void* contents, size_t size, size_t nmemb, 
        void* userp);

    kc1fsz::Log& _log;
    const std::string _socketPath;
    const std::string _tag;
    const unsigned _infoPort;
    std::atomic<bool> _trace { false };
};

}
