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
#include <algorithm>
#include <chrono>
#include <exception>
#include <vector>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"

#include "redphone/PeerRegistry.h"

#include "DirectoryClient.h"
#include "DirectorySource.h"
#include "ThreadUtil.h"

using namespace std;
using namespace kc1fsz;

namespace redphone {

DirectorySource::DirectorySource(Log& log, Clock& clock, 
    DirectoryClient& client, unsigned pollIntervalSec)
:   _log(log),
    _clock(clock),
    _client(client),
    _pollIntervalMs(pollIntervalSec * 1000),
    _running(false) {
}

DirectorySource::~DirectorySource() {
    stop();
}

const char* DirectorySource::name() const {
    return tierName(PresenceRecord::Tier::TIER_VPN_DIRECTORY);
}

int DirectorySource::start(PeerRegistry& registry, const SelfIdentity& self) {
    stop();
    _registry = &registry;
    _self = self;
    _backoffMs = 0;
    _running = true;
    _thread = std::thread(&DirectorySource::_run, this);
    _log.info("%s: Polling every %u seconds", name(), _pollIntervalMs / 1000);
    return 0;
}

void DirectorySource::stop() {
    _running = false;
    if (_thread.joinable()) {
        _thread.join();
        _log.info("%s: Stopped", name());
    }
}

uint32_t DirectorySource::getNextDelayMs() const {
    return _backoffMs == 0 ? _pollIntervalMs : _backoffMs;
}

void DirectorySource::_run() {
    setThreadName("rp-directory");
    // First poll happens right away
    uint32_t nextPollMs = _clock.time();
    while (_running.load()) {
        if (_clock.isPast(nextPollMs)) {
            pollOnce(*_registry, _self);
            nextPollMs = _clock.time() + getNextDelayMs();
        }
        // A directory request in progress can't be interrupted, but 
        // otherwise we come back quickly to check for shutdown.
        std::this_thread::sleep_for(std::chrono::milliseconds(SLEEP_MS));
    }
}

int DirectorySource::pollOnce(PeerRegistry& registry, const SelfIdentity& self) {

    std::vector<DirectoryEntry> peers;
    int rc;
    try {
        rc = _client.listTaggedPeers(peers);
    }
    catch (const std::exception& ex) {
        _log.error("%s: Directory error %s", name(), ex.what());
        rc = -1;
    }

    if (rc < 0) {
        if (_backoffMs == 0)
            _backoffMs = std::min(INITIAL_BACKOFF_MS, _pollIntervalMs);
        else 
            _backoffMs = std::min(_backoffMs * 2, _pollIntervalMs);
        _log.error("%s: Directory poll failed, retrying in %u ms", name(), _backoffMs);
        return -1;
    }

    _backoffMs = 0;

    uint32_t now = _clock.time();
    int count = 0;

    for (const DirectoryEntry& entry : peers) {
        // Without an extension the identity can't be formed
        if (entry.extension == 0) {
            if (_trace)
                _log.info("%s: Skipping %s, extension unknown", name(), 
                    entry.hostName.c_str());
            continue;
        }
        PresenceRecord rec;
        rec.identity = makeIdentity(entry.hostName.c_str(), entry.extension);
        if (rec.identity == self.identity)
            continue;
        rec.displayName = entry.displayName.empty() ? entry.hostName : entry.displayName;
        rec.extension = entry.extension;
        rec.address = entry.address;
        rec.tier = PresenceRecord::Tier::TIER_VPN_DIRECTORY;
        rec.firstSeenMs = now;
        rec.lastSeenMs = now;
        rec.status = PresenceRecord::Status::STATUS_ONLINE;
        if (registry.upsert(rec))
            count++;
    }

    if (_trace)
        _log.info("%s: Poll found %d peers", name(), count);

    return count;
}

}
