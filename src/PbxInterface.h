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

namespace redphone {

/**
 * Call progress reported by the PBX. Inbound calls show up as a RINGING
 * event on a handle that we have never seen before.
 */
struct PbxEvent {

    enum Type {
        TYPE_RINGING,
        TYPE_ANSWERED,
        TYPE_BUSY,
        TYPE_NO_ANSWER,
        TYPE_REMOTE_HANGUP,
        TYPE_FAILED
    };

    Type type = Type::TYPE_FAILED;
    int callHandle = 0;
    // Only filled in for inbound calls
    unsigned remoteExtension = 0;
    std::string remoteAddress;
};

const char* pbxEventName(PbxEvent::Type type);

/**
 * Commands that can be sent to the PBX. None of these wait for the PBX,
 * the outcome arrives later as a PbxEvent.
 */
class PbxControl {
public:

    virtual ~PbxControl() { }

    /**
     * @returns A positive call handle, or -1 if the request could not
     *   even be queued.
     */
    virtual int dial(const char* targetAddress, unsigned targetExtension,
        unsigned fromExtension) = 0;

    virtual void answer(int callHandle) = 0;

    virtual void terminate(int callHandle) = 0;
};

/**
 * Something that wants to hear about PBX events.
 */
class PbxEventSink {
public:
    virtual ~PbxEventSink() { }
    virtual void onPbxEvent(const PbxEvent& ev) = 0;
};

}
