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

#include "DiscoveryEngine.h"
#include "CallStateMachine.h"

using namespace std;
using namespace kc1fsz;

namespace redphone {

CallStateMachine::CallStateMachine(Log& log, Clock& clock, PbxControl& pbx,
    DiscoveryEngine& discovery, const SelfIdentity& self)
:   _log(log),
    _clock(clock),
    _pbx(pbx),
    _discovery(discovery),
    _self(self),
    _stateStartMs(clock.time()),
    _wallClock([]() { return ::time(0); }) {
}

void CallStateMachine::setQuietHours(const QuietHoursWindow& window) {
    std::lock_guard<std::mutex> lock(_lock);
    _quietHours = window;
    _log.info("%s", describe(window).c_str());
}

QuietHoursWindow CallStateMachine::getQuietHours() const {
    std::lock_guard<std::mutex> lock(_lock);
    return _quietHours;
}

void CallStateMachine::setWallClock(std::function<time_t()> wallClock) {
    std::lock_guard<std::mutex> lock(_lock);
    _wallClock = wallClock;
}

void CallStateMachine::setStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lock(_lock);
    _listener = listener;
}

bool CallStateMachine::isQuietHours() const {
    std::lock_guard<std::mutex> lock(_lock);
    return requiresConfirmation(_wallClock(), _quietHours);
}

CallStateMachine::Status CallStateMachine::status() const {
    std::lock_guard<std::mutex> lock(_lock);
    return _status();
}

void CallStateMachine::handsetLifted() {
    std::vector<Status> changes;
    {
        std::lock_guard<std::mutex> lock(_lock);
        _handsetLifted = true;
        if (_state == State::STATE_IDLE) {
            _reset();
            _session.role = Role::ROLE_CALLER;
            _setState(State::STATE_DIALING);
        }
        else if (_state == State::STATE_RINGING) {
            _pbx.answer(_session.callHandle);
            _setState(State::STATE_IN_CALL);
        }
        changes.swap(_pendingChanges);
    }
    _fireListener(changes);
}

void CallStateMachine::handsetReplaced() {
    std::vector<Status> changes;
    {
        std::lock_guard<std::mutex> lock(_lock);
        _handsetLifted = false;
        if (_state == State::STATE_DIALING ||
            _state == State::STATE_AWAITING_CONFIRMATION) {
            _reset();
            _setState(State::STATE_IDLE);
        }
        else if (_state == State::STATE_CALLING || 
                 _state == State::STATE_IN_CALL) {
            _end(EndReason::END_LOCAL_HANGUP, false);
        }
        else if (_state == State::STATE_RINGING) {
            _end(EndReason::END_REJECTED, false);
        }
        changes.swap(_pendingChanges);
    }
    _fireListener(changes);
}

CallStateMachine::DialResult CallStateMachine::dial(const std::string& targetIdentity) {
    std::vector<Status> changes;
    DialResult result = DialResult::DIAL_ACCEPTED;
    {
        std::lock_guard<std::mutex> lock(_lock);

        PresenceRecord target;

        if (_state != State::STATE_IDLE && _state != State::STATE_DIALING) {
            _log.info("Dial to %s rejected, phone is %s", targetIdentity.c_str(),
                stateName(_state));
            result = DialResult::DIAL_BUSY;
        }
        else if (!_reachable(targetIdentity, target)) {
            _log.info("Dial to %s rejected, target unreachable", targetIdentity.c_str());
            result = DialResult::DIAL_UNREACHABLE;
        }
        else {
            // Coming from IDLE means the selection happened without a 
            // handset lift (i.e. the call button on the screen)
            if (_state == State::STATE_IDLE) {
                _reset();
                _session.role = Role::ROLE_CALLER;
                _setState(State::STATE_DIALING);
            }
            // The address is captured now. It is only checked again if 
            // the call waits for confirmation.
            _session.peer = target;
            if (requiresConfirmation(_wallClock(), _quietHours)) {
                _log.info("Quiet hours, confirmation needed to call %s",
                    target.displayName.c_str());
                _setState(State::STATE_AWAITING_CONFIRMATION);
            }
            else {
                _startCalling();
            }
        }
        changes.swap(_pendingChanges);
    }
    _fireListener(changes);
    return result;
}

CallStateMachine::ActionResult CallStateMachine::confirm() {
    std::vector<Status> changes;
    ActionResult result = ActionResult::ACTION_OK;
    {
        std::lock_guard<std::mutex> lock(_lock);
        PresenceRecord target;
        if (_state != State::STATE_AWAITING_CONFIRMATION) {
            result = ActionResult::ACTION_CONFLICT;
        }
        // The target may have gone stale while the prompt was up
        else if (!_reachable(_session.peer.identity, target)) {
            _log.info("Call to %s abandoned, target unreachable", 
                _session.peer.identity.c_str());
            _reset();
            _setState(State::STATE_IDLE);
            result = ActionResult::ACTION_UNREACHABLE;
        }
        else {
            _session.peer = target;
            _session.quietHoursAcknowledged = true;
            _startCalling();
        }
        changes.swap(_pendingChanges);
    }
    _fireListener(changes);
    return result;
}

CallStateMachine::ActionResult CallStateMachine::cancel() {
    std::vector<Status> changes;
    ActionResult result = ActionResult::ACTION_OK;
    {
        std::lock_guard<std::mutex> lock(_lock);
        if (_state == State::STATE_AWAITING_CONFIRMATION) {
            _log.info("Call to %s cancelled", _session.peer.displayName.c_str());
            _reset();
            _setState(State::STATE_IDLE);
        }
        else {
            result = ActionResult::ACTION_CONFLICT;
        }
        changes.swap(_pendingChanges);
    }
    _fireListener(changes);
    return result;
}

CallStateMachine::ActionResult CallStateMachine::answer() {
    std::vector<Status> changes;
    ActionResult result = ActionResult::ACTION_OK;
    {
        std::lock_guard<std::mutex> lock(_lock);
        if (_state == State::STATE_RINGING) {
            _pbx.answer(_session.callHandle);
            _setState(State::STATE_IN_CALL);
        }
        else {
            result = ActionResult::ACTION_CONFLICT;
        }
        changes.swap(_pendingChanges);
    }
    _fireListener(changes);
    return result;
}

CallStateMachine::ActionResult CallStateMachine::hangup() {
    std::vector<Status> changes;
    ActionResult result = ActionResult::ACTION_OK;
    {
        std::lock_guard<std::mutex> lock(_lock);
        if (_state == State::STATE_CALLING ||
            _state == State::STATE_RINGING ||
            _state == State::STATE_IN_CALL) {
            _end(EndReason::END_LOCAL_HANGUP, false);
        }
        else if (_state == State::STATE_DIALING || 
                 _state == State::STATE_AWAITING_CONFIRMATION) {
            _reset();
            _setState(State::STATE_IDLE);
        }
        else {
            result = ActionResult::ACTION_CONFLICT;
        }
        changes.swap(_pendingChanges);
    }
    _fireListener(changes);
    return result;
}

void CallStateMachine::onPbxEvent(const PbxEvent& ev) {
    std::vector<Status> changes;
    {
        std::lock_guard<std::mutex> lock(_lock);

        if (_trace)
            _log.info("PBX event %s for call %d in %s", pbxEventName(ev.type), 
                ev.callHandle, stateName(_state));

        const bool current = _session.callHandle != 0 && 
            ev.callHandle == _session.callHandle;

        if (ev.type == PbxEvent::Type::TYPE_RINGING) {
            if (current) {
                // Progress on our own outbound call, nothing to do
            }
            else if (_state == State::STATE_IDLE) {
                _reset();
                _session.role = Role::ROLE_CALLEE;
                _session.callHandle = ev.callHandle;
                _session.startMs = _clock.time();
                _identifyCaller(ev, _session.peer);
                _log.info("Incoming call from %s", _session.peer.displayName.c_str());
                _setState(State::STATE_RINGING);
            }
            else {
                // Only one session at a time, the caller gets busy
                _log.info("Rejecting call %d, phone is %s", ev.callHandle,
                    stateName(_state));
                _pbx.terminate(ev.callHandle);
            }
        }
        // Anything else only matters for the live session. This also
        // takes care of duplicates that arrive after the session ended.
        else if (current) {
            switch (ev.type) {
            case PbxEvent::Type::TYPE_ANSWERED:
                if (_state == State::STATE_CALLING || _state == State::STATE_RINGING)
                    _setState(State::STATE_IN_CALL);
                break;
            case PbxEvent::Type::TYPE_BUSY:
                _end(EndReason::END_BUSY, true);
                break;
            case PbxEvent::Type::TYPE_NO_ANSWER:
                _end(EndReason::END_NO_ANSWER, true);
                break;
            case PbxEvent::Type::TYPE_REMOTE_HANGUP:
                _end(EndReason::END_REMOTE_HANGUP, true);
                break;
            case PbxEvent::Type::TYPE_FAILED:
                _end(EndReason::END_FAILED, true);
                break;
            default:
                break;
            }
        }
        else if (_trace) {
            _log.info("Ignoring event for call %d", ev.callHandle);
        }

        changes.swap(_pendingChanges);
    }
    _fireListener(changes);
}

void CallStateMachine::oneSecTick() {
    std::vector<Status> changes;
    {
        std::lock_guard<std::mutex> lock(_lock);
        if ((_state == State::STATE_DIALING || 
             _state == State::STATE_AWAITING_CONFIRMATION) &&
            _clock.time() - _stateStartMs >= SELECTION_TIMEOUT_MS) {
            _log.info("Timed out in %s", stateName(_state));
            _reset();
            _setState(State::STATE_IDLE);
        }
        changes.swap(_pendingChanges);
    }
    _fireListener(changes);
}

void CallStateMachine::_setState(State s) {
    if (s != _state)
        _log.info("State %s -> %s", stateName(_state), stateName(s));
    _state = s;
    _stateStartMs = _clock.time();
    _pendingChanges.push_back(_status());
}

bool CallStateMachine::_reachable(const std::string& identity, PresenceRecord& target) {
    return identity != _self.identity &&
        _discovery.lookup(identity, target) &&
        target.isOnline();
}

void CallStateMachine::_startCalling() {
    int handle = _pbx.dial(_session.peer.address.c_str(), _session.peer.extension,
        _self.extension);
    if (handle <= 0) {
        _log.error("Unable to dial %s", _session.peer.identity.c_str());
        _end(EndReason::END_FAILED, true);
        return;
    }
    _session.startMs = _clock.time();
    _session.callHandle = handle;
    _log.info("Calling %s (%s) as call %d", _session.peer.displayName.c_str(),
        _session.peer.address.c_str(), handle);
    _setState(State::STATE_CALLING);
}

void CallStateMachine::_end(EndReason reason, bool endedByPbx) {
    if (!endedByPbx && _session.callHandle > 0)
        _pbx.terminate(_session.callHandle);
    _lastEndReason = reason;
    _log.info("Call ended (%s)", endReasonName(reason));
    _setState(State::STATE_ENDED);
    // Nothing is left to clean up, the session is released right away
    _reset();
    _setState(State::STATE_IDLE);
}

void CallStateMachine::_reset() {
    _session = Session();
}

CallStateMachine::Status CallStateMachine::_status() const {
    Status s;
    s.state = _state;
    s.role = _session.role;
    s.peerIdentity = _session.peer.identity;
    s.peerName = _session.peer.displayName;
    s.peerExtension = _session.peer.extension;
    s.peerAddress = _session.peer.address;
    s.callHandle = _session.callHandle;
    if (_state == State::STATE_CALLING || 
        _state == State::STATE_RINGING ||
        _state == State::STATE_IN_CALL)
        s.elapsedSec = (_clock.time() - _session.startMs) / 1000;
    s.quietHoursAcknowledged = _session.quietHoursAcknowledged;
    s.handsetLifted = _handsetLifted;
    s.lastEndReason = _lastEndReason;
    return s;
}

void CallStateMachine::_identifyCaller(const PbxEvent& ev, PresenceRecord& peer) {
    // Prefer a match on address, then fall back to the extension
    const PresenceRecord* byExt = 0;
    std::vector<PresenceRecord> phones = _discovery.list();
    for (const PresenceRecord& rec : phones) {
        if (!ev.remoteAddress.empty() && rec.address == ev.remoteAddress &&
            (ev.remoteExtension == 0 || rec.extension == ev.remoteExtension)) {
            peer = rec;
            return;
        }
        if (byExt == 0 && ev.remoteExtension != 0 && rec.extension == ev.remoteExtension)
            byExt = &rec;
    }
    if (byExt) {
        peer = *byExt;
        return;
    }
    peer = PresenceRecord();
    peer.extension = ev.remoteExtension;
    peer.address = ev.remoteAddress;
    if (ev.remoteExtension != 0)
        peer.displayName = "Extension " + std::to_string(ev.remoteExtension);
    else if (!ev.remoteAddress.empty())
        peer.displayName = ev.remoteAddress;
    else 
        peer.displayName = "Unknown";
}

void CallStateMachine::_fireListener(const std::vector<Status>& changes) {
    if (changes.empty())
        return;
    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(_lock);
        listener = _listener;
    }
    if (!listener)
        return;
    for (const Status& s : changes) {
        try {
            listener(s);
        }
        catch (const std::exception& ex) {
            _log.error("State listener failed: %s", ex.what());
        }
    }
}

const char* CallStateMachine::stateName(State s) {
    switch (s) {
        case State::STATE_IDLE: return "IDLE";
        case State::STATE_DIALING: return "DIALING";
        case State::STATE_AWAITING_CONFIRMATION: return "AWAITING_CONFIRMATION";
        case State::STATE_CALLING: return "CALLING";
        case State::STATE_RINGING: return "RINGING";
        case State::STATE_IN_CALL: return "IN_CALL";
        case State::STATE_ENDED: return "ENDED";
        default: return "UNKNOWN";
    }
}

const char* CallStateMachine::roleName(Role r) {
    switch (r) {
        case Role::ROLE_CALLER: return "caller";
        case Role::ROLE_CALLEE: return "callee";
        default: return "none";
    }
}

const char* CallStateMachine::dialResultName(DialResult r) {
    switch (r) {
        case DialResult::DIAL_ACCEPTED: return "accepted";
        case DialResult::DIAL_BUSY: return "busy";
        case DialResult::DIAL_UNREACHABLE: return "unreachable";
        default: return "unknown";
    }
}

const char* CallStateMachine::endReasonName(EndReason r) {
    switch (r) {
        case EndReason::END_NONE: return "none";
        case EndReason::END_LOCAL_HANGUP: return "localHangup";
        case EndReason::END_REMOTE_HANGUP: return "remoteHangup";
        case EndReason::END_BUSY: return "busy";
        case EndReason::END_NO_ANSWER: return "noAnswer";
        case EndReason::END_FAILED: return "failed";
        case EndReason::END_REJECTED: return "rejected";
        default: return "unknown";
    }
}

}
