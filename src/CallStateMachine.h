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
#include <ctime>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "redphone/Presence.h"
#include "redphone/QuietHours.h"

#include "PbxInterface.h"
#include "Task.h"

namespace kc1fsz {
class Log;
class Clock;
}

namespace redphone {

class DiscoveryEngine;

/**
 * Drives the one call that a phone can have at a time, on either the
 * caller or the callee side.
 *
 * Handset events, PBX events, and requests from the UI can arrive from 
 * different threads. Each one is processed completely under a single 
 * lock, so they are applied in one consistent order. Commands to the PBX
 * are fire-and-forget, their outcome comes back through onPbxEvent().
 */
class CallStateMachine : public Task, public PbxEventSink {
public:

    enum State {
        STATE_IDLE,
        STATE_DIALING,
        STATE_AWAITING_CONFIRMATION,
        STATE_CALLING,
        STATE_RINGING,
        STATE_IN_CALL,
        STATE_ENDED
    };

    enum Role {
        ROLE_NONE,
        ROLE_CALLER,
        ROLE_CALLEE
    };

    enum DialResult {
        DIAL_ACCEPTED,
        DIAL_BUSY,
        DIAL_UNREACHABLE
    };

    enum ActionResult {
        ACTION_OK,
        // The request isn't valid in the current state
        ACTION_CONFLICT,
        // The target of the call went away before it could be placed
        ACTION_UNREACHABLE
    };

    enum EndReason {
        END_NONE,
        END_LOCAL_HANGUP,
        END_REMOTE_HANGUP,
        END_BUSY,
        END_NO_ANSWER,
        END_FAILED,
        END_REJECTED
    };

    // How long the user has to pick a target or confirm
    static constexpr uint32_t SELECTION_TIMEOUT_MS = 30 * 1000;

    /**
     * A copy of the session, safe to hold onto.
     */
    struct Status {
        State state = State::STATE_IDLE;
        Role role = Role::ROLE_NONE;
        std::string peerIdentity;
        std::string peerName;
        unsigned peerExtension = 0;
        std::string peerAddress;
        int callHandle = 0;
        uint32_t elapsedSec = 0;
        bool quietHoursAcknowledged = false;
        bool handsetLifted = false;
        // How the most recent session ended
        EndReason lastEndReason = EndReason::END_NONE;
    };

    typedef std::function<void(const Status& status)> StateListener;

    CallStateMachine(kc1fsz::Log& log, kc1fsz::Clock& clock, PbxControl& pbx,
        DiscoveryEngine& discovery, const SelfIdentity& self);

    void setTrace(bool a) { _trace = a; }

    /**
     * Replaces the quiet-hours window as a whole.
     */
    void setQuietHours(const QuietHoursWindow& window);
    QuietHoursWindow getQuietHours() const;

    /**
     * Replaces the source of wall-clock time used for the quiet-hours
     * check. 
     */
    void setWallClock(std::function<time_t()> wallClock);

    /**
     * The listener is called (outside of the lock) for every state 
     * entered. An ended session is reported as ENDED and then IDLE.
     */
    void setStateListener(StateListener listener);

    // ----- Handset ---------------------------------------------------------

    void handsetLifted();
    void handsetReplaced();

    // ----- User requests ---------------------------------------------------

    /**
     * Places a call to the phone with the given identity. Allowed from 
     * IDLE or DIALING. The target must be a known, online phone that isn't
     * this one.
     */
    DialResult dial(const std::string& targetIdentity);

    ActionResult confirm();
    ActionResult cancel();
    ActionResult answer();
    ActionResult hangup();

    Status status() const;

    bool isQuietHours() const;

    // ----- PbxEventSink ----------------------------------------------------

    virtual void onPbxEvent(const PbxEvent& ev);

    // ----- Task ------------------------------------------------------------

    virtual void oneSecTick();

    static const char* stateName(State s);
    static const char* roleName(Role r);
    static const char* dialResultName(DialResult r);
    static const char* endReasonName(EndReason r);

private:

    struct Session {
        Role role = Role::ROLE_NONE;
        PresenceRecord peer;
        int callHandle = 0;
        uint32_t startMs = 0;
        bool quietHoursAcknowledged = false;
    };

    // All of these are called with the lock held
    void _setState(State s);
    bool _reachable(const std::string& identity, PresenceRecord& target);
    void _startCalling();
    void _end(EndReason reason, bool endedByPbx);
    void _reset();
    Status _status() const;
    void _identifyCaller(const PbxEvent& ev, PresenceRecord& peer);

    void _fireListener(const std::vector<Status>& changes);

    kc1fsz::Log& _log;
    kc1fsz::Clock& _clock;
    PbxControl& _pbx;
    DiscoveryEngine& _discovery;
    const SelfIdentity _self;
    std::atomic<bool> _trace { false };

    mutable std::mutex _lock;
    State _state = State::STATE_IDLE;
    uint32_t _stateStartMs = 0;
    Session _session;
    bool _handsetLifted = false;
    EndReason _lastEndReason = EndReason::END_NONE;
    QuietHoursWindow _quietHours;
    std::function<time_t()> _wallClock;
    StateListener _listener;
    // States entered during the current operation, reported after
    // the lock is released
    std::vector<Status> _pendingChanges;
};

}
