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

#include "redphone/PeerRegistry.h"

namespace redphone {

PeerRegistry::PeerRegistry(uint32_t staleMs, uint32_t evictMs) 
:   _staleMs(staleMs),
    _evictMs(evictMs) {
}

void PeerRegistry::setThresholds(uint32_t staleMs, uint32_t evictMs) {
    std::lock_guard<std::mutex> lock(_lock);
    _staleMs = staleMs;
    _evictMs = evictMs;
}

bool PeerRegistry::upsert(const PresenceRecord& rec) {

    std::lock_guard<std::mutex> lock(_lock);

    auto it = _records.find(rec.identity);

    // First sighting
    if (it == _records.end()) {
        PresenceRecord r = rec;
        if (r.firstSeenMs == 0 || (int32_t)(r.lastSeenMs - r.firstSeenMs) < 0)
            r.firstSeenMs = r.lastSeenMs;
        r.status = PresenceRecord::Status::STATUS_ONLINE;
        _records[r.identity] = r;
        _revision++;
        return true;
    }

    PresenceRecord& existing = it->second;

    // Late or duplicate delivery of an older sighting. The millisecond
    // clock wraps so the comparison is made on the signed difference.
    if ((int32_t)(rec.lastSeenMs - existing.lastSeenMs) < 0)
        return false;

    bool visibleChange = 
        existing.displayName != rec.displayName ||
        existing.extension != rec.extension ||
        existing.address != rec.address ||
        existing.tier != rec.tier ||
        existing.status != PresenceRecord::Status::STATUS_ONLINE;

    existing.displayName = rec.displayName;
    existing.extension = rec.extension;
    existing.address = rec.address;
    existing.tier = rec.tier;
    existing.lastSeenMs = rec.lastSeenMs;
    // A fresh sighting always brings a stale peer back
    existing.status = PresenceRecord::Status::STATUS_ONLINE;

    if (visibleChange)
        _revision++;

    return true;
}

std::vector<PresenceRecord> PeerRegistry::snapshot() const {

    std::vector<PresenceRecord> result;
    {
        std::lock_guard<std::mutex> lock(_lock);
        result.reserve(_records.size());
        for (const auto& p : _records)
            result.push_back(p.second);
    }

    // Sorting happens outside of the lock 
    std::sort(result.begin(), result.end(), 
        [](const PresenceRecord& a, const PresenceRecord& b) {
            if (a.displayName != b.displayName)
                return a.displayName < b.displayName;
            return a.identity < b.identity;
        });

    return result;
}

bool PeerRegistry::lookup(const std::string& identity, PresenceRecord& rec) const {
    std::lock_guard<std::mutex> lock(_lock);
    auto it = _records.find(identity);
    if (it == _records.end())
        return false;
    rec = it->second;
    return true;
}

unsigned PeerRegistry::sweep(uint32_t nowMs) {

    std::lock_guard<std::mutex> lock(_lock);

    unsigned changes = 0;

    for (auto it = _records.begin(); it != _records.end(); ) {
        PresenceRecord& rec = it->second;
        // Protect against a sighting stamped slightly after the sweep time
        int32_t delta = (int32_t)(nowMs - rec.lastSeenMs);
        uint32_t ageMs = delta > 0 ? (uint32_t)delta : 0;
        if (ageMs > _evictMs) {
            it = _records.erase(it);
            changes++;
            continue;
        }
        if (ageMs > _staleMs && rec.status == PresenceRecord::Status::STATUS_ONLINE) {
            rec.status = PresenceRecord::Status::STATUS_STALE;
            changes++;
        }
        it++;
    }

    if (changes)
        _revision++;

    return changes;
}

uint64_t PeerRegistry::revision() const {
    std::lock_guard<std::mutex> lock(_lock);
    return _revision;
}

unsigned PeerRegistry::size() const {
    std::lock_guard<std::mutex> lock(_lock);
    return _records.size();
}

}
