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
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "redphone/Presence.h"
#include "redphone/PeerRegistry.h"

#include "Task.h"

namespace kc1fsz {
class Log;
class Clock;
}

namespace redphone {

class DiscoverySource;

/**
 * Owns the peer registry, fans in the discovery sources, runs the 
 * staleness sweep, and tells subscribers when the list of phones changes.
 *
 * The sweep and the subscriber notifications happen on the event loop 
 * thread. The sources write into the registry from their own threads.
 */
class DiscoveryEngine : public Task {
public:

    /**
     * Called with a fresh snapshot and its revision number whenever the
     * visible list of phones changes.
     */
    typedef std::function<void(const std::vector<PresenceRecord>& phones, 
        uint64_t revision)> Listener;

    static constexpr unsigned DEFAULT_SWEEP_INTERVAL_SEC = 15;

    DiscoveryEngine(kc1fsz::Log& log, kc1fsz::Clock& clock, 
        const SelfIdentity& self);
    virtual ~DiscoveryEngine();

    void setTrace(bool a) { _trace = a; }

    /**
     * @param staleSec Silence after which a peer is marked stale.
     * @param evictSec Silence after which a peer is removed.
     */
    void setThresholds(unsigned staleSec, unsigned evictSec);
    void setSweepInterval(unsigned sec);

    /**
     * Adds a source. The engine does not take ownership, the source 
     * must outlive the engine or be removed with stop().
     */
    void addSource(DiscoverySource* source);

    /**
     * Starts all sources. A source that fails to start is logged and 
     * skipped.
     *
     * @returns The number of sources that are running.
     */
    int start();

    void stop();

    /**
     * @returns The current phones, ordered by name. This phone is
     * never included.
     */
    std::vector<PresenceRecord> list() const;

    bool lookup(const std::string& identity, PresenceRecord& rec) const;

    uint64_t revision() const { return _registry.revision(); }

    /**
     * @returns An ID that can be passed to unsubscribe().
     */
    int subscribe(Listener listener);
    void unsubscribe(int id);

    /**
     * Runs the staleness sweep at the current time.
     */
    unsigned sweep();

    /**
     * Delivers a notification if anything has changed since the last one.
     *
     * @returns true if a notification was delivered.
     */
    bool notifyIfChanged();

    PeerRegistry& getRegistry() { return _registry; }
    const SelfIdentity& getSelf() const { return _self; }

    // ----- Task ------------------------------------------------------------

    virtual bool run2();
    virtual void oneSecTick();

private:

    kc1fsz::Log& _log;
    kc1fsz::Clock& _clock;
    const SelfIdentity _self;
    std::atomic<bool> _trace { false };

    PeerRegistry _registry;
    std::vector<DiscoverySource*> _sources;
    std::vector<DiscoverySource*> _runningSources;

    uint32_t _sweepIntervalMs;
    uint32_t _nextSweepMs;

    std::mutex _listenerLock;
    std::map<int, Listener> _listeners;
    int _nextListenerId = 1;
    uint64_t _notifiedRevision = 0;
};

}
