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
#include <functional>
#include <map>
#include <string>

#include "kc1fsz-tools/threadsafequeue.h"

#include "PbxInterface.h"
#include "Task.h"

namespace kc1fsz {
class Log;
class Clock;
}

namespace redphone {

/**
 * Talks to Asterisk through the Asterisk Manager Interface (AMI).
 *
 * Outbound calls are placed with an asynchronous Originate: the remote
 * phone is dialed first and, once it answers, is bridged to the local
 * audio channel. Inbound calls are recognized by a new channel showing up
 * in the inbound dialplan context.
 *
 * The PbxControl methods may be called from any thread. They only queue 
 * a request, all socket activity happens on the event loop thread.
 */
class AmiPbx : public Task, public PbxControl {
public:

    static constexpr uint32_t RECONNECT_INTERVAL_MS = 10 * 1000;

    AmiPbx(kc1fsz::Log& log, kc1fsz::Clock& clock);
    virtual ~AmiPbx();

    void setTrace(bool a) { _trace = a; }

    void configure(const char* host, int port, const char* user, 
        const char* secret, const char* dialTemplate, 
        const char* localChannel, const char* inboundContext,
        const char* answerCommand);

    void setEventSink(PbxEventSink* sink) { _sink = sink; }

    /**
     * Starts using a socket that is already connected to the manager. 
     * The login is sent right away.
     */
    void attach(int fd);

    void disconnect();

    bool isLoggedIn() const { return _state == State::STATE_LOGGED_IN; }

    /**
     * Handles one complete manager message (without the trailing blank 
     * line). Exposed for unit testing.
     */
    void processMessage(const std::string& msg);

    /**
     * Fills in the {ext} and {addr} placeholders of a dial template.
     */
    static std::string formatDialString(const std::string& dialTemplate,
        unsigned extension, const std::string& address);

    // ----- PbxControl ------------------------------------------------------

    virtual int dial(const char* targetAddress, unsigned targetExtension,
        unsigned fromExtension);
    virtual void answer(int callHandle);
    virtual void terminate(int callHandle);

    // ----- Task ------------------------------------------------------------

    virtual int getPolls(pollfd* fds, unsigned fdsCapacity);
    virtual bool run2();
    virtual void oneSecTick();

private:

    enum State {
        STATE_DISCONNECTED,
        STATE_CONNECTING,
        STATE_LOGGING_IN,
        STATE_LOGGED_IN
    };

    struct Request {
        enum Type { TYPE_DIAL, TYPE_ANSWER, TYPE_TERMINATE };
        Type type = Type::TYPE_DIAL;
        int callHandle = 0;
        std::string address;
        unsigned extension = 0;
        unsigned fromExtension = 0;
    };

    struct Call {
        bool inbound = false;
        std::string uniqueId;
        std::string channel;
        // A hangup was asked for before the channel name was known
        bool hangupPending = false;
        bool hangupSent = false;
    };

    void _connect();
    void _processRequest(const Request& req);
    void _send(const std::string& msg);
    void _emit(PbxEvent::Type type, int callHandle, unsigned remoteExt = 0,
        const std::string& remoteAddr = std::string());
    void _sendHangup(int callHandle, Call& call);
    int _findByUniqueId(const std::string& uniqueId) const;
    void _failAllCalls();

    kc1fsz::Log& _log;
    kc1fsz::Clock& _clock;
    bool _trace = false;
    PbxEventSink* _sink = 0;

    std::string _host = "127.0.0.1";
    int _port = 5038;
    std::string _user;
    std::string _secret;
    std::string _dialTemplate = "PJSIP/{ext}@{addr}";
    std::string _localChannel = "Console/dsp";
    std::string _inboundContext = "redphone-inbound";
    std::string _answerCommand = "console answer";

    State _state = State::STATE_DISCONNECTED;
    int _fd = -1;
    bool _configured = false;
    uint32_t _nextConnectMs = 0;
    uint32_t _connectStartMs = 0;
    // The manager starts with a one-line banner
    bool _bannerSeen = false;
    std::string _inBuf;

    std::atomic<int> _nextHandle;
    kc1fsz::threadsafequeue<Request> _requests;
    std::map<int, Call> _calls;
};

/**
 * Calls fn for each "Name: Value" line of a manager message. Lines 
 * without a colon are skipped.
 *
 * @returns The number of fields visited.
 */
int visitFields(const std::string& msg, 
    std::function<void(const std::string& name, const std::string& value)> fn);

}
