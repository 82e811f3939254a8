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
#include <atomic>
#include <string>
#include <thread>

#include <sys/socket.h>

#include "redphone/Presence.h"

#include "DiscoverySource.h"

namespace kc1fsz {
class Log;
class Clock;
}

namespace redphone {

/**
 * Announces this phone and listens for the announcements of others 
 * using UDP broadcast. The same class serves the local network segment
 * (255.255.255.255) and the directed broadcast address of a VPN subnet,
 * the only difference being the tier that is recorded for the peer.
 */
class BroadcastSource : public DiscoverySource {
public:

    // How long the receive thread waits for traffic before checking
    // for shutdown. This bounds the time that stop() can take.
    static constexpr unsigned RECEIVE_POLL_MS = 250;
    // Limits the datagrams consumed per wakeup, anything beyond this
    // waits in the kernel buffer (or gets dropped by the kernel).
    static constexpr unsigned MAX_READS_PER_CYCLE = 32;

    BroadcastSource(kc1fsz::Log& log, kc1fsz::Clock& clock, 
        PresenceRecord::Tier tier, const char* broadcastAddr, int port,
        unsigned announceIntervalSec = 30);
    virtual ~BroadcastSource();

    void setTrace(bool a) { _trace = a; }

    // ----- DiscoverySource -------------------------------------------------

    virtual int start(PeerRegistry& registry, const SelfIdentity& self);
    virtual void stop();
    virtual const char* name() const;

    /**
     * Handles one received datagram. Exposed for unit testing.
     *
     * @returns 0 if the registry was updated, 1 if the datagram was 
     * valid but ignored (our own announcement, or out of date), or one 
     * of the negative PresenceDatagram::ParseResult codes.
     */
    int processDatagram(PeerRegistry& registry, const SelfIdentity& self, 
        const uint8_t* buf, unsigned bufLen, const sockaddr& peerAddr);

    unsigned getDroppedCount() const { return _droppedCount; }

private:

    void _run();
    void _announce();
    bool _readOne();

    kc1fsz::Log& _log;
    kc1fsz::Clock& _clock;
    const PresenceRecord::Tier _tier;
    const std::string _broadcastAddr;
    const int _port;
    const uint32_t _announceIntervalMs;
    std::atomic<bool> _trace { false };

    int _sockFd = -1;
    PeerRegistry* _registry = 0;
    SelfIdentity _self;
    std::atomic<bool> _running;
    std::thread _thread;
    uint32_t _nextAnnounceMs = 0;
    std::atomic<unsigned> _droppedCount;
};

}
