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
#include <thread>

#include "redphone/Presence.h"

#include "DiscoverySource.h"

namespace kc1fsz {
class Log;
class Clock;
}

namespace redphone {

class DirectoryClient;

/**
 * Periodically asks a VPN directory for the tagged phones and records
 * them as VPN-directory peers. 
 *
 * A failed poll never removes anything from the registry, peers simply 
 * age out through the normal sweep if the directory stays down. After a 
 * failure the poll is retried with exponential backoff that starts at 
 * two seconds and never exceeds the regular poll interval.
 */
class DirectorySource : public DiscoverySource {
public:

    static constexpr uint32_t INITIAL_BACKOFF_MS = 2000;
    static constexpr unsigned SLEEP_MS = 100;

    DirectorySource(kc1fsz::Log& log, kc1fsz::Clock& clock, 
        DirectoryClient& client, unsigned pollIntervalSec = 30);
    virtual ~DirectorySource();

    void setTrace(bool a) { _trace = a; }

    // ----- DiscoverySource -------------------------------------------------

    virtual int start(PeerRegistry& registry, const SelfIdentity& self);
    virtual void stop();
    virtual const char* name() const;

    /**
     * Performs one poll of the directory and records what comes back.
     * Exposed for unit testing.
     *
     * @returns The number of peers recorded, or -1 on failure.
     */
    int pollOnce(PeerRegistry& registry, const SelfIdentity& self);

    /**
     * @returns The delay that will be used before the next poll.
     */
    uint32_t getNextDelayMs() const;

private:

    void _run();

    kc1fsz::Log& _log;
    kc1fsz::Clock& _clock;
    DirectoryClient& _client;
    const uint32_t _pollIntervalMs;
    std::atomic<bool> _trace { false };

    PeerRegistry* _registry = 0;
    SelfIdentity _self;
    std::atomic<bool> _running;
    std::thread _thread;
    // Zero when the last poll succeeded
    uint32_t _backoffMs = 0;
};

}
