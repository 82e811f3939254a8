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
#include <arpa/inet.h>
#include <sys/socket.h>

#include <cstring>
#include <exception>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"
#include "kc1fsz-tools/NetUtils.h"

#include "redphone/PeerRegistry.h"

#include "PresenceDatagram.h"
#include "ThreadUtil.h"
#include "BroadcastSource.h"

using namespace std;
using namespace kc1fsz;

namespace redphone {

BroadcastSource::BroadcastSource(Log& log, Clock& clock, 
    PresenceRecord::Tier tier, const char* broadcastAddr, int port,
    unsigned announceIntervalSec)
:   _log(log),
    _clock(clock),
    _tier(tier),
    _broadcastAddr(broadcastAddr),
    _port(port),
    _announceIntervalMs(announceIntervalSec * 1000),
    _running(false),
    _droppedCount(0) {
}

BroadcastSource::~BroadcastSource() {
    stop();
}

const char* BroadcastSource::name() const {
    return tierName(_tier);
}

int BroadcastSource::start(PeerRegistry& registry, const SelfIdentity& self) {

    stop();

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        _log.error("%s: Unable to open socket (%d)", name(), errno);
        return -1;
    }

    int enable = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(int)) < 0) {
        _log.error("%s: Unable to set SO_REUSEADDR (%d)", name(), errno);
        ::close(fd);
        return -1;
    }
    if (setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(int)) < 0) {
        _log.error("%s: Unable to set SO_BROADCAST (%d)", name(), errno);
        ::close(fd);
        return -1;
    }

    struct sockaddr_in servaddr;
    memset(&servaddr, 0, sizeof(servaddr));
    servaddr.sin_family = AF_INET;
    servaddr.sin_addr.s_addr = INADDR_ANY;
    servaddr.sin_port = htons(_port);
    if (::bind(fd, (const struct sockaddr*)&servaddr, sizeof(servaddr)) < 0) {
        _log.error("%s: Unable to bind to port %d (%d)", name(), _port, errno);
        ::close(fd);
        return -1;
    }

    if (makeNonBlocking(fd) != 0) {
        _log.error("%s: fcntl failed (%d)", name(), errno);
        ::close(fd);
        return -1;
    }

    _sockFd = fd;
    _registry = &registry;
    _self = self;
    _nextAnnounceMs = _clock.time();
    _running = true;
    _thread = std::thread(&BroadcastSource::_run, this);

    _log.info("%s: Listening on UDP port %d, announcing to %s", name(), _port,
        _broadcastAddr.c_str());

    return 0;
}

void BroadcastSource::stop() {
    _running = false;
    if (_thread.joinable())
        _thread.join();
    if (_sockFd >= 0) {
        ::close(_sockFd);
        _sockFd = -1;
        _log.info("%s: Stopped", name());
    }
}

void BroadcastSource::_run() {
    setThreadName(_tier == PresenceRecord::Tier::TIER_LOCAL_SEGMENT ? 
        "rp-local" : "rp-vpn");
    while (_running.load()) {
        try {
            pollfd fds[1];
            fds[0].fd = _sockFd;
            fds[0].events = POLLIN;
            fds[0].revents = 0;
            int rc = ::poll(fds, 1, RECEIVE_POLL_MS);
            if (rc < 0 && errno != EINTR) 
                _log.error("%s: Poll error %d", name(), errno);
            else if (rc > 0 && (fds[0].revents & POLLIN)) {
                for (unsigned i = 0; i < MAX_READS_PER_CYCLE; i++)
                    if (!_readOne())
                        break;
            }
            if (_clock.isPast(_nextAnnounceMs)) {
                _announce();
                _nextAnnounceMs = _clock.time() + _announceIntervalMs;
            }
        }
        catch (const std::exception& ex) {
            _log.error("%s: Receive loop error %s", name(), ex.what());
        }
    }
}

bool BroadcastSource::_readOne() {

    uint8_t readBuffer[PresenceDatagram::MAX_SIZE + 1];
    struct sockaddr_storage peerAddr;
    socklen_t peerAddrLen = sizeof(peerAddr);

    int rc = ::recvfrom(_sockFd, readBuffer, sizeof(readBuffer), 0,
        (sockaddr*)&peerAddr, &peerAddrLen);
    if (rc < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK)
            _log.error("%s: Receive error %d", name(), errno);
        return false;
    }
    if (rc == 0)
        return true;
    // Anything that fills the whole buffer is oversized
    if ((unsigned)rc > PresenceDatagram::MAX_SIZE) {
        _droppedCount++;
        if (_trace)
            _log.info("%s: Oversized datagram ignored", name());
        return true;
    }

    processDatagram(*_registry, _self, readBuffer, rc, (const sockaddr&)peerAddr);
    return true;
}

int BroadcastSource::processDatagram(PeerRegistry& registry, 
    const SelfIdentity& self, const uint8_t* buf, unsigned bufLen,
    const sockaddr& peerAddr) {

    char addrStr[64];
    formatIPAddr(peerAddr, addrStr, 64);

    PresenceDatagram dg;
    PresenceDatagram::ParseResult pr = dg.decode(buf, bufLen);
    if (pr != PresenceDatagram::ParseResult::PARSE_OK) {
        _droppedCount++;
        if (_trace)
            _log.info("%s: Ignored datagram from %s (%d)", name(), addrStr, (int)pr);
        return (int)pr;
    }

    PresenceRecord rec;
    rec.identity = makeIdentity(dg.hostName.c_str(), dg.extension);
    // Our own announcement comes back to us
    if (rec.identity == self.identity)
        return 1;

    rec.displayName = dg.displayName;
    rec.extension = dg.extension;
    rec.address = addrStr;
    rec.tier = _tier;
    rec.firstSeenMs = _clock.time();
    rec.lastSeenMs = rec.firstSeenMs;
    rec.status = PresenceRecord::Status::STATUS_ONLINE;

    if (_trace)
        _log.info("%s: Presence from %s at %s", name(), rec.identity.c_str(), addrStr);

    return registry.upsert(rec) ? 0 : 1;
}

void BroadcastSource::_announce() {

    PresenceDatagram dg;
    dg.hostName = _self.hostName;
    dg.displayName = _self.displayName;
    dg.extension = _self.extension;
    dg.uiPort = _self.uiPort;
    std::string msg = dg.encode();

    struct sockaddr_storage destAddr;
    memset(&destAddr, 0, sizeof(destAddr));
    destAddr.ss_family = AF_INET;
    setIPAddr(destAddr, _broadcastAddr.c_str());
    setIPPort(destAddr, _port);

    int rc = ::sendto(_sockFd, msg.c_str(), msg.length(), 0, 
        (const sockaddr*)&destAddr, getIPAddrSize((const sockaddr&)destAddr));
    if (rc < 0) {
        if (errno == ENETUNREACH) 
            _log.error("%s: Network is unreachable to %s", name(), _broadcastAddr.c_str());
        else 
            _log.error("%s: Send error %d", name(), errno);
    }
    else if (_trace) 
        _log.info("%s: Announced %s", name(), _self.identity.c_str());
}

}
