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
#include <exception>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"

#include "DiscoverySource.h"
#include "DiscoveryEngine.h"

using namespace std;
using namespace kc1fsz;

namespace redphone {

DiscoveryEngine::DiscoveryEngine(Log& log, Clock& clock, 
    const SelfIdentity& self) 
:   _log(log),
    _clock(clock),
    _self(self),
    _sweepIntervalMs(DEFAULT_SWEEP_INTERVAL_SEC * 1000),
    _nextSweepMs(_clock.time() + _sweepIntervalMs) {
}

DiscoveryEngine::~DiscoveryEngine() {
    stop();
}

void DiscoveryEngine::setThresholds(unsigned staleSec, unsigned evictSec) {
    _registry.setThresholds(staleSec * 1000, evictSec * 1000);
}

void DiscoveryEngine::setSweepInterval(unsigned sec) {
    _sweepIntervalMs = sec * 1000;
    _nextSweepMs = _clock.time() + _sweepIntervalMs;
}

void DiscoveryEngine::addSource(DiscoverySource* source) {
    _sources.push_back(source);
}

int DiscoveryEngine::start() {
    stop();
    for (DiscoverySource* source : _sources) {
        if (source->start(_registry, _self) == 0) 
            _runningSources.push_back(source);
        else 
            _log.error("Discovery source %s failed to start", source->name());
    }
    _log.info("Discovery running with %u sources", 
        (unsigned)_runningSources.size());
    return (int)_runningSources.size();
}

void DiscoveryEngine::stop() {
    for (DiscoverySource* source : _runningSources)
        source->stop();
    _runningSources.clear();
}

std::vector<PresenceRecord> DiscoveryEngine::list() const {
    std::vector<PresenceRecord> all = _registry.snapshot();
    std::vector<PresenceRecord> result;
    result.reserve(all.size());
    for (const PresenceRecord& rec : all)
        if (rec.identity != _self.identity)
            result.push_back(rec);
    return result;
}

bool DiscoveryEngine::lookup(const std::string& identity, PresenceRecord& rec) const {
    if (identity == _self.identity)
        return false;
    return _registry.lookup(identity, rec);
}

int DiscoveryEngine::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(_listenerLock);
    int id = _nextListenerId++;
    _listeners[id] = listener;
    return id;
}

void DiscoveryEngine::unsubscribe(int id) {
    std::lock_guard<std::mutex> lock(_listenerLock);
    _listeners.erase(id);
}

unsigned DiscoveryEngine::sweep() {
    unsigned changed = _registry.sweep(_clock.time());
    if (_trace && changed)
        _log.info("Sweep changed %u records", changed);
    return changed;
}

bool DiscoveryEngine::notifyIfChanged() {

    uint64_t rev = _registry.revision();
    if (rev == _notifiedRevision)
        return false;
    _notifiedRevision = rev;

    // Listeners are called without holding any lock so that they are 
    // free to call back into the engine.
    std::vector<Listener> targets;
    {
        std::lock_guard<std::mutex> lock(_listenerLock);
        for (const auto& p : _listeners)
            targets.push_back(p.second);
    }
    if (targets.empty())
        return false;

    std::vector<PresenceRecord> phones = list();
    for (Listener& l : targets) {
        try {
            l(phones, rev);
        }
        catch (const std::exception& ex) {
            _log.error("Discovery listener failed: %s", ex.what());
        }
    }
    return true;
}

bool DiscoveryEngine::run2() {
    notifyIfChanged();
    return false;
}

void DiscoveryEngine::oneSecTick() {
    if (_clock.isPast(_nextSweepMs)) {
        _nextSweepMs = _clock.time() + _sweepIntervalMs;
        sweep();
    }
}

}
