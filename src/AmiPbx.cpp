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
#include <unistd.h>
#include <poll.h>
#include <errno.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdlib>
#include <cstring>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"
#include "kc1fsz-tools/NetUtils.h"

#include "AmiPbx.h"

using namespace std;
using namespace kc1fsz;

namespace redphone {

static const char* LOGIN_ACTION_ID = "login";
static const char* CALL_ACTION_PREFIX = "rp-";
static const uint32_t CONNECT_TIMEOUT_MS = 5 * 1000;
// Anything bigger than this without a message boundary is garbage
static const size_t MAX_INBUF_SIZE = 64 * 1024;

// Asterisk originate failure reasons
static const int REASON_HANGUP = 1;
static const int REASON_NO_ANSWER = 3;
static const int REASON_ANSWERED = 4;
static const int REASON_BUSY = 5;

// Q.850 hangup causes
static const int CAUSE_USER_BUSY = 17;
static const int CAUSE_NO_USER_RESPONSE = 18;
static const int CAUSE_NO_ANSWER = 19;

AmiPbx::AmiPbx(Log& log, Clock& clock)
:   _log(log),
    _clock(clock),
    _nextHandle(1) {
}

AmiPbx::~AmiPbx() {
    if (_fd >= 0)
        ::close(_fd);
}

void AmiPbx::configure(const char* host, int port, const char* user, 
    const char* secret, const char* dialTemplate, const char* localChannel,
    const char* inboundContext, const char* answerCommand) {

    bool changed = _host != host || _port != port || _user != user || 
        _secret != secret;

    _host = host;
    _port = port;
    _user = user;
    _secret = secret;
    _dialTemplate = dialTemplate;
    _localChannel = localChannel;
    _inboundContext = inboundContext;
    _answerCommand = answerCommand;
    _configured = true;

    // New credentials take effect on the next connection
    if (changed && _state != State::STATE_DISCONNECTED) {
        disconnect();
        _nextConnectMs = _clock.time();
    }
}

std::string AmiPbx::formatDialString(const std::string& dialTemplate,
    unsigned extension, const std::string& address) {
    std::string result = dialTemplate;
    std::string ext = std::to_string(extension);
    size_t p;
    while ((p = result.find("{ext}")) != std::string::npos)
        result.replace(p, 5, ext);
    while ((p = result.find("{addr}")) != std::string::npos)
        result.replace(p, 6, address);
    return result;
}

// ----- PbxControl ------------------------------------------------------------

int AmiPbx::dial(const char* targetAddress, unsigned targetExtension,
    unsigned fromExtension) {
    Request req;
    req.type = Request::Type::TYPE_DIAL;
    req.callHandle = _nextHandle++;
    req.address = targetAddress;
    req.extension = targetExtension;
    req.fromExtension = fromExtension;
    _requests.push(req);
    return req.callHandle;
}

void AmiPbx::answer(int callHandle) {
    Request req;
    req.type = Request::Type::TYPE_ANSWER;
    req.callHandle = callHandle;
    _requests.push(req);
}

void AmiPbx::terminate(int callHandle) {
    Request req;
    req.type = Request::Type::TYPE_TERMINATE;
    req.callHandle = callHandle;
    _requests.push(req);
}

// ----- Task ------------------------------------------------------------------

int AmiPbx::getPolls(pollfd* fds, unsigned fdsCapacity) {
    if (_fd < 0)
        return 0;
    if (fdsCapacity == 0)
        return -1;
    fds[0].fd = _fd;
    fds[0].events = _state == State::STATE_CONNECTING ? POLLOUT : POLLIN;
    fds[0].revents = 0;
    return 1;
}

void AmiPbx::oneSecTick() {
    if (_state == State::STATE_DISCONNECTED) {
        if (_configured && _clock.isPast(_nextConnectMs))
            _connect();
    }
    else if (_state == State::STATE_CONNECTING) {
        if (_clock.time() - _connectStartMs > CONNECT_TIMEOUT_MS) {
            _log.error("Timed out connecting to manager at %s:%d", _host.c_str(), _port);
            disconnect();
        }
    }
}

bool AmiPbx::run2() {

    bool didWork = false;

    // Waiting for the non-blocking connect to finish
    if (_state == State::STATE_CONNECTING) {
        pollfd fds[1];
        fds[0].fd = _fd;
        fds[0].events = POLLOUT;
        fds[0].revents = 0;
        if (::poll(fds, 1, 0) > 0) {
            int err = 0;
            socklen_t errLen = sizeof(err);
            if (getsockopt(_fd, SOL_SOCKET, SO_ERROR, &err, &errLen) < 0 || err != 0) {
                _log.error("Unable to connect to manager at %s:%d (%d)", 
                    _host.c_str(), _port, err);
                disconnect();
            }
            else {
                int fd = _fd;
                _fd = -1;
                attach(fd);
            }
            didWork = true;
        }
    }

    if (_fd >= 0 && _state != State::STATE_CONNECTING) {
        char buf[1024];
        int rc = ::read(_fd, buf, sizeof(buf));
        if (rc == 0) {
            _log.info("Manager connection closed");
            disconnect();
        }
        else if (rc < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                _log.error("Manager read error %d", errno);
                disconnect();
            }
        }
        else {
            _inBuf.append(buf, rc);
            didWork = true;

            if (!_bannerSeen) {
                size_t eol = _inBuf.find("\r\n");
                if (eol != std::string::npos) {
                    if (_inBuf.compare(0, 21, "Asterisk Call Manager") == 0) {
                        _log.info("Connected to %s", _inBuf.substr(0, eol).c_str());
                        _inBuf.erase(0, eol + 2);
                    }
                    _bannerSeen = true;
                }
            }

            if (_bannerSeen) {
                size_t end;
                while ((end = _inBuf.find("\r\n\r\n")) != std::string::npos) {
                    std::string msg = _inBuf.substr(0, end);
                    _inBuf.erase(0, end + 4);
                    processMessage(msg);
                }
            }

            if (_inBuf.size() > MAX_INBUF_SIZE) {
                _log.error("Manager message too large, discarded");
                _inBuf.clear();
            }
        }
    }

    Request req;
    while (_requests.try_pop(req)) {
        _processRequest(req);
        didWork = true;
    }

    return didWork;
}

// ----- Connection ------------------------------------------------------------

void AmiPbx::_connect() {

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        _log.error("Unable to open manager socket %d", errno);
        _nextConnectMs = _clock.time() + RECONNECT_INTERVAL_MS;
        return;
    }
    if (makeNonBlocking(fd) != 0) {
        _log.error("fcntl failed (%d)", errno);
        ::close(fd);
        _nextConnectMs = _clock.time() + RECONNECT_INTERVAL_MS;
        return;
    }

    struct sockaddr_storage addr;
    memset(&addr, 0, sizeof(addr));
    addr.ss_family = AF_INET;
    setIPAddr(addr, _host.c_str());
    setIPPort(addr, _port);

    int rc = ::connect(fd, (const sockaddr*)&addr, getIPAddrSize((const sockaddr&)addr));
    if (rc < 0 && errno != EINPROGRESS) {
        _log.error("Unable to connect to manager at %s:%d (%d)", _host.c_str(), 
            _port, errno);
        ::close(fd);
        _nextConnectMs = _clock.time() + RECONNECT_INTERVAL_MS;
        return;
    }

    _fd = fd;
    _connectStartMs = _clock.time();
    if (rc == 0) {
        _fd = -1;
        attach(fd);
    }
    else {
        _state = State::STATE_CONNECTING;
    }
}

void AmiPbx::attach(int fd) {

    if (_fd >= 0)
        disconnect();

    if (makeNonBlocking(fd) != 0) {
        _log.error("fcntl failed (%d)", errno);
        ::close(fd);
        _state = State::STATE_DISCONNECTED;
        _nextConnectMs = _clock.time() + RECONNECT_INTERVAL_MS;
        return;
    }

    _fd = fd;
    _state = State::STATE_LOGGING_IN;
    _bannerSeen = false;
    _inBuf.clear();

    std::string msg;
    msg += "Action: Login\r\n";
    msg += "ActionID: "; msg += LOGIN_ACTION_ID; msg += "\r\n";
    msg += "Username: " + _user + "\r\n";
    msg += "Secret: " + _secret + "\r\n";
    msg += "Events: call\r\n";
    msg += "\r\n";
    _send(msg);
}

void AmiPbx::disconnect() {
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
    _state = State::STATE_DISCONNECTED;
    _bannerSeen = false;
    _inBuf.clear();
    _nextConnectMs = _clock.time() + RECONNECT_INTERVAL_MS;
    _failAllCalls();
}

void AmiPbx::_failAllCalls() {
    // Calls can't be tracked without the manager connection
    std::map<int, Call> calls;
    calls.swap(_calls);
    for (const auto& p : calls) 
        if (!p.second.hangupSent)
            _emit(PbxEvent::Type::TYPE_FAILED, p.first);
}

void AmiPbx::_send(const std::string& msg) {
    if (_fd < 0)
        return;
    if (_trace)
        _log.info("AMI send:\n%s", msg.c_str());
    // No SIGPIPE if the manager has gone away
    int rc = ::send(_fd, msg.c_str(), msg.length(), MSG_NOSIGNAL);
    if (rc < 0) 
        _log.error("Manager write error %d", errno);
    else if ((unsigned)rc != msg.length()) 
        _log.error("Manager write truncated");
}

void AmiPbx::_emit(PbxEvent::Type type, int callHandle, unsigned remoteExt,
    const std::string& remoteAddr) {
    if (_trace)
        _log.info("PBX event %s for call %d", pbxEventName(type), callHandle);
    if (!_sink)
        return;
    PbxEvent ev;
    ev.type = type;
    ev.callHandle = callHandle;
    ev.remoteExtension = remoteExt;
    ev.remoteAddress = remoteAddr;
    _sink->onPbxEvent(ev);
}

// ----- Requests --------------------------------------------------------------

void AmiPbx::_processRequest(const Request& req) {

    if (req.type == Request::Type::TYPE_DIAL) {
        if (_state != State::STATE_LOGGED_IN) {
            _log.error("Unable to dial, not connected to the manager");
            _emit(PbxEvent::Type::TYPE_FAILED, req.callHandle);
            return;
        }

        Call call;
        call.inbound = false;
        call.uniqueId = CALL_ACTION_PREFIX + std::to_string(req.callHandle);
        _calls[req.callHandle] = call;

        std::string msg;
        msg += "Action: Originate\r\n";
        msg += "ActionID: " + call.uniqueId + "\r\n";
        msg += "ChannelId: " + call.uniqueId + "\r\n";
        msg += "Channel: " + formatDialString(_dialTemplate, req.extension, req.address) + "\r\n";
        msg += "Application: Dial\r\n";
        msg += "Data: " + _localChannel + "\r\n";
        msg += "CallerID: " + std::to_string(req.fromExtension) + "\r\n";
        msg += "Timeout: 30000\r\n";
        msg += "Async: true\r\n";
        msg += "\r\n";
        _send(msg);
    }
    else if (req.type == Request::Type::TYPE_ANSWER) {
        auto it = _calls.find(req.callHandle);
        if (it == _calls.end() || !it->second.inbound) {
            _log.error("Unable to answer unknown call %d", req.callHandle);
            return;
        }
        std::string msg;
        msg += "Action: Command\r\n";
        msg += "ActionID: answer-" + std::to_string(req.callHandle) + "\r\n";
        msg += "Command: " + _answerCommand + "\r\n";
        msg += "\r\n";
        _send(msg);
    }
    else if (req.type == Request::Type::TYPE_TERMINATE) {
        auto it = _calls.find(req.callHandle);
        if (it == _calls.end()) {
            if (_trace)
                _log.info("Terminate for finished call %d", req.callHandle);
            return;
        }
        _sendHangup(req.callHandle, it->second);
    }
}

void AmiPbx::_sendHangup(int callHandle, Call& call) {
    if (call.channel.empty()) {
        call.hangupPending = true;
        return;
    }
    call.hangupPending = false;
    call.hangupSent = true;
    std::string msg;
    msg += "Action: Hangup\r\n";
    msg += "ActionID: hangup-" + std::to_string(callHandle) + "\r\n";
    msg += "Channel: " + call.channel + "\r\n";
    msg += "\r\n";
    _send(msg);
}

int AmiPbx::_findByUniqueId(const std::string& uniqueId) const {
    for (const auto& p : _calls)
        if (p.second.uniqueId == uniqueId)
            return p.first;
    return -1;
}

// ----- Events ----------------------------------------------------------------

void AmiPbx::processMessage(const std::string& msg) {

    if (_trace)
        _log.info("AMI recv:\n%s", msg.c_str());

    std::map<std::string, std::string> fields;
    visitFields(msg, [&fields](const std::string& name, const std::string& value) {
        fields[name] = value;
    });
    auto get = [&fields](const char* name) {
        auto it = fields.find(name);
        return it == fields.end() ? std::string() : it->second;
    };

    const std::string response = get("Response");
    const std::string event = get("Event");
    const std::string actionId = get("ActionID");

    if (event.empty() && !response.empty()) {
        if (actionId == LOGIN_ACTION_ID) {
            if (response == "Success") {
                _state = State::STATE_LOGGED_IN;
                _log.info("Logged in to manager as %s", _user.c_str());
            } 
            else {
                _log.error("Manager login failed: %s", get("Message").c_str());
                disconnect();
            }
        }
        // A rejected Originate never produces an OriginateResponse
        else if (response == "Error" && 
                 actionId.compare(0, 3, CALL_ACTION_PREFIX) == 0) {
            int handle = _findByUniqueId(actionId);
            if (handle > 0) {
                _log.error("Manager rejected call %d: %s", handle, get("Message").c_str());
                _calls.erase(handle);
                _emit(PbxEvent::Type::TYPE_FAILED, handle);
            }
        }
        else if (response == "Error") {
            _log.error("Manager error for %s: %s", actionId.c_str(), get("Message").c_str());
        }
        return;
    }

    if (event == "OriginateResponse") {
        int handle = _findByUniqueId(actionId);
        if (handle <= 0)
            return;
        Call& call = _calls[handle];
        int reason = atoi(get("Reason").c_str());
        if (response == "Success" || reason == REASON_ANSWERED) {
            if (call.channel.empty())
                call.channel = get("Channel");
            if (call.hangupPending)
                _sendHangup(handle, call);
            else
                _emit(PbxEvent::Type::TYPE_ANSWERED, handle);
        }
        else {
            _calls.erase(handle);
            if (reason == REASON_BUSY)
                _emit(PbxEvent::Type::TYPE_BUSY, handle);
            else if (reason == REASON_NO_ANSWER || reason == REASON_HANGUP)
                _emit(PbxEvent::Type::TYPE_NO_ANSWER, handle);
            else 
                _emit(PbxEvent::Type::TYPE_FAILED, handle);
        }
    }
    else if (event == "Newchannel") {
        const std::string uniqueId = get("Uniqueid");
        int handle = _findByUniqueId(uniqueId);
        if (handle > 0) {
            // Our own originated channel
            Call& call = _calls[handle];
            call.channel = get("Channel");
            if (call.hangupPending)
                _sendHangup(handle, call);
        }
        else if (get("Context") == _inboundContext) {
            Call call;
            call.inbound = true;
            call.uniqueId = uniqueId;
            call.channel = get("Channel");
            handle = _nextHandle++;
            _calls[handle] = call;
            unsigned remoteExt = strtoul(get("CallerIDNum").c_str(), 0, 10);
            _log.info("Inbound call %d from %s", handle, call.channel.c_str());
            _emit(PbxEvent::Type::TYPE_RINGING, handle, remoteExt);
        }
    }
    else if (event == "Hangup") {
        int handle = _findByUniqueId(get("Uniqueid"));
        if (handle <= 0)
            return;
        bool hangupSent = _calls[handle].hangupSent;
        _calls.erase(handle);
        // Nothing to report if we asked for it
        if (hangupSent)
            return;
        int cause = atoi(get("Cause").c_str());
        if (cause == CAUSE_USER_BUSY)
            _emit(PbxEvent::Type::TYPE_BUSY, handle);
        else if (cause == CAUSE_NO_USER_RESPONSE || cause == CAUSE_NO_ANSWER)
            _emit(PbxEvent::Type::TYPE_NO_ANSWER, handle);
        else
            _emit(PbxEvent::Type::TYPE_REMOTE_HANGUP, handle);
    }
}

int visitFields(const std::string& msg, 
    std::function<void(const std::string& name, const std::string& value)> fn) {

    int count = 0;
    size_t start = 0;

    while (start < msg.length()) {
        size_t eol = msg.find("\r\n", start);
        if (eol == std::string::npos)
            eol = msg.length();
        std::string line = msg.substr(start, eol - start);
        start = eol + 2;

        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0)
            continue;
        std::string name = line.substr(0, colon);
        // Skip the spaces after the colon
        size_t v = colon + 1;
        while (v < line.length() && line[v] == ' ')
            v++;
        fn(name, line.substr(v));
        count++;
    }

    return count;
}

}
