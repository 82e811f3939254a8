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

namespace redphone {

class PeerRegistry;
struct SelfIdentity;

/**
 * Something that learns about peer phones and writes what it learns into
 * the registry. Each source runs on its own thread, so one that is stuck
 * waiting on the network can never hold up the others.
 */
class DiscoverySource {
public:

    virtual ~DiscoverySource() { }

    /**
     * Starts the background activity.
     *
     * @returns 0 on success, -1 if the source could not be started. A source
     * that fails to start is simply left out, the others keep going.
     */
    virtual int start(PeerRegistry& registry, const SelfIdentity& self) = 0;

    /**
     * Stops the background activity and waits for it to finish. Calling
     * stop() on a source that isn't running does nothing.
     */
    virtual void stop() = 0;

    virtual const char* name() const = 0;
};

}
