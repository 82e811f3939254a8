#include <iostream>
#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

#include "kc1fsz-tools/Log.h"

#include "redphone/PeerRegistry.h"
#include "DirectorySource.h"
#include "TailscaleDirectory.h"
#include "tests/TestUtil.h"

using namespace std;
using namespace kc1fsz;
using namespace redphone;

static DirectoryEntry makeEntry(const char* host, const char* name, 
    const char* addr, unsigned ext) {
    DirectoryEntry e;
    e.hostName = host;
    e.displayName = name;
    e.address = addr;
    e.extension = ext;
    return e;
}

static SelfIdentity makeSelf() {
    SelfIdentity self;
    self.hostName = "kitchen";
    self.displayName = "Kitchen";
    self.extension = 101;
    self.identity = makeIdentity("kitchen", 101);
    return self;
}

class ThrowingClient : public DirectoryClient {
public:
    int listTaggedPeers(std::vector<DirectoryEntry>&) {
        throw std::runtime_error("socket gone");
    }
};

static void pollTest() {

    Log log;
    TestClock clock(log);
    clock.setTime(2000);
    FakeDirectoryClient client;
    client.peers.push_back(makeEntry("bedroom", "Bedroom", "100.64.0.2", 102));
    client.peers.push_back(makeEntry("kitchen", "Kitchen", "100.64.0.1", 101));
    client.peers.push_back(makeEntry("garage", "", "100.64.0.4", 104));
    // Not answering /api/info yet
    client.peers.push_back(makeEntry("attic", "Attic", "100.64.0.5", 0));

    DirectorySource source(log, clock, client, 30);
    PeerRegistry reg;
    SelfIdentity self = makeSelf();

    assert(source.pollOnce(reg, self) == 2);
    assert(client.callCount == 1);
    assert(reg.size() == 2);

    PresenceRecord rec;
    assert(reg.lookup("bedroom/102", rec));
    assert(rec.tier == PresenceRecord::Tier::TIER_VPN_DIRECTORY);
    assert(rec.address == "100.64.0.2");
    assert(rec.lastSeenMs == 2000);
    assert(reg.lookup("garage/104", rec));
    assert(rec.displayName == "garage");
    // Never ourselves
    assert(!reg.lookup("kitchen/101", rec));
    assert(source.getNextDelayMs() == 30000);
}

static void backoffTest() {

    Log log;
    TestClock clock(log);
    FakeDirectoryClient client;
    client.fail = true;

    DirectorySource source(log, clock, client, 30);
    PeerRegistry reg;
    reg.upsert(makeRecord("bedroom", 102, "Bedroom", "100.64.0.2", 0, 
        PresenceRecord::Tier::TIER_VPN_DIRECTORY));
    SelfIdentity self = makeSelf();

    assert(source.getNextDelayMs() == 30000);
    assert(source.pollOnce(reg, self) == -1);
    assert(source.getNextDelayMs() == 2000);
    assert(source.pollOnce(reg, self) == -1);
    assert(source.getNextDelayMs() == 4000);
    assert(source.pollOnce(reg, self) == -1);
    assert(source.getNextDelayMs() == 8000);
    assert(source.pollOnce(reg, self) == -1);
    assert(source.getNextDelayMs() == 16000);
    assert(source.pollOnce(reg, self) == -1);
    assert(source.getNextDelayMs() == 30000);
    assert(source.pollOnce(reg, self) == -1);
    assert(source.getNextDelayMs() == 30000);

    // A failure doesn't touch what we already know
    assert(reg.size() == 1);

    // Recovery resets the backoff
    client.fail = false;
    client.peers.push_back(makeEntry("bedroom", "Bedroom", "100.64.0.2", 102));
    clock.setTime(10000);
    assert(source.pollOnce(reg, self) == 1);
    assert(source.getNextDelayMs() == 30000);
    PresenceRecord rec;
    assert(reg.lookup("bedroom/102", rec));
    assert(rec.lastSeenMs == 10000);

    // Exceptions from the client are failures too
    ThrowingClient thrower;
    DirectorySource source2(log, clock, thrower, 30);
    assert(source2.pollOnce(reg, self) == -1);
    assert(source2.getNextDelayMs() == 2000);

    // Short poll intervals cap the backoff
    client.fail = true;
    DirectorySource source3(log, clock, client, 1);
    assert(source3.pollOnce(reg, self) == -1);
    assert(source3.getNextDelayMs() == 1000);
}

static const char* STATUS_DOC = R"({
    "Self": { "HostName": "kitchen", "TailscaleIPs": ["100.64.0.1"] },
    "Peer": {
        "nodekey:aaaa": {
            "HostName": "bedroom",
            "DisplayName": "Bedroom Phone",
            "TailscaleIPs": ["100.64.0.2", "fd7a:115c:a1e0::2"],
            "Tags": ["tag:redphone"],
            "Online": true
        },
        "nodekey:bbbb": {
            "HostName": "laptop",
            "TailscaleIPs": ["100.64.0.3"],
            "Online": true
        },
        "nodekey:cccc": {
            "HostName": "garage",
            "TailscaleIPs": ["100.64.0.4"],
            "Tags": ["tag:server", "tag:redphone"],
            "Online": false
        },
        "nodekey:dddd": {
            "HostName": "attic",
            "TailscaleIPs": ["100.64.0.5"],
            "Tags": ["tag:redphone"],
            "Online": true
        },
        "nodekey:eeee": {
            "HostName": "broken",
            "TailscaleIPs": [],
            "Tags": ["tag:redphone"],
            "Online": true
        },
        "nodekey:ffff": {
            "HostName": "other",
            "TailscaleIPs": ["100.64.0.6"],
            "Tags": ["tag:redphone-lab"],
            "Online": true
        }
    }
})";

static void tailscaleParseTest() {

    std::vector<DirectoryEntry> peers;
    assert(TailscaleDirectory::parseStatus(STATUS_DOC, "redphone", peers) == 2);
    assert(peers.size() == 2);

    bool sawBedroom = false, sawAttic = false;
    for (const DirectoryEntry& e : peers) {
        assert(e.extension == 0);
        if (e.hostName == "bedroom") {
            sawBedroom = true;
            assert(e.address == "100.64.0.2");
            assert(e.displayName == "Bedroom Phone");
        }
        else if (e.hostName == "attic") {
            sawAttic = true;
            assert(e.displayName == "attic");
        }
    }
    assert(sawBedroom && sawAttic);

    peers.clear();
    assert(TailscaleDirectory::parseStatus("{\"BackendState\":\"Stopped\"}", "redphone", peers) == 0);
    assert(peers.empty());
    assert(TailscaleDirectory::parseStatus("<html>", "redphone", peers) == -1);
    assert(TailscaleDirectory::parseStatus("", "redphone", peers) == -1);

    DirectoryEntry e = makeEntry("bedroom", "Bedroom Phone", "100.64.0.2", 0);
    assert(TailscaleDirectory::parseInfo("{\"name\":\"Bedroom\",\"extension\":102,\"hostname\":\"bedroom\"}", e) == 0);
    assert(e.extension == 102);
    assert(e.displayName == "Bedroom");

    DirectoryEntry f = makeEntry("attic", "attic", "100.64.0.5", 0);
    assert(TailscaleDirectory::parseInfo("{\"name\":\"\",\"extension\":105}", f) == 0);
    assert(f.extension == 105);
    assert(f.displayName == "attic");

    DirectoryEntry g = makeEntry("x", "x", "100.64.0.9", 0);
    assert(TailscaleDirectory::parseInfo("{\"name\":\"X\"}", g) == -1);
    assert(TailscaleDirectory::parseInfo("{\"extension\":\"102\"}", g) == -1);
    assert(TailscaleDirectory::parseInfo("{\"extension\":0}", g) == -1);
    assert(TailscaleDirectory::parseInfo("nope", g) == -1);
    assert(g.extension == 0);
}

int main(int, const char**) {
    pollTest();
    backoffTest();
    tailscaleParseTest();
    cout << "directory-test OK" << endl;
}
