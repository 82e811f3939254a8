#include <iostream>
#include <cassert>
#include <stdexcept>
#include <vector>

#include "kc1fsz-tools/Log.h"

#include "redphone/Presence.h"
#include "DiscoveryEngine.h"
#include "tests/TestUtil.h"

using namespace std;
using namespace kc1fsz;
using namespace redphone;

static SelfIdentity makeSelf() {
    SelfIdentity self;
    self.hostName = "kitchen";
    self.displayName = "Kitchen";
    self.extension = 101;
    self.identity = makeIdentity("kitchen", 101);
    return self;
}

// Walks one peer through online, stale and gone
static void lifecycleTest() {

    Log log;
    TestClock clock(log);
    DiscoveryEngine engine(log, clock, makeSelf());
    engine.setThresholds(120, 1200);
    ManualSource local("local");
    engine.addSource(&local);
    assert(engine.start() == 1);
    assert(local.startCount == 1);

    clock.setTime(0);
    assert(local.announce(makeRecord("bedroom", 102, "Bedroom", "192.168.1.22", 0)));

    clock.setTime(1000);
    engine.sweep();
    vector<PresenceRecord> phones = engine.list();
    assert(phones.size() == 1);
    assert(phones[0].identity == "bedroom/102");
    assert(phones[0].isOnline());

    clock.setTime(150 * 1000);
    engine.sweep();
    phones = engine.list();
    assert(phones.size() == 1);
    assert(phones[0].status == PresenceRecord::Status::STATUS_STALE);

    clock.setTime(1300 * 1000);
    engine.sweep();
    assert(engine.list().empty());

    PresenceRecord rec;
    assert(!engine.lookup("bedroom/102", rec));

    engine.stop();
    assert(local.stopCount == 1);
}

// The sweep is driven from the one second tick 
static void tickTest() {

    Log log;
    TestClock clock(log);
    clock.setTime(0);
    DiscoveryEngine engine(log, clock, makeSelf());
    engine.setThresholds(5, 50);
    engine.setSweepInterval(2);
    ManualSource local("local");
    engine.addSource(&local);
    engine.start();

    local.announce(makeRecord("bedroom", 102, "Bedroom", "192.168.1.22", 0));

    for (unsigned t = 1; t <= 10; t++) {
        clock.setTime(t * 1000);
        engine.oneSecTick();
    }
    assert(engine.list().size() == 1);
    assert(!engine.list()[0].isOnline());
}

static void selfTest() {

    Log log;
    TestClock clock(log);
    DiscoveryEngine engine(log, clock, makeSelf());
    ManualSource local("local");
    engine.addSource(&local);
    engine.start();

    // Even if a source lets it through, we never list ourselves
    local.announce(makeRecord("kitchen", 101, "Kitchen", "192.168.1.21", 10));
    local.announce(makeRecord("bedroom", 102, "Bedroom", "192.168.1.22", 10));
    vector<PresenceRecord> phones = engine.list();
    assert(phones.size() == 1);
    assert(phones[0].identity == "bedroom/102");
    PresenceRecord rec;
    assert(!engine.lookup("kitchen/101", rec));
    assert(engine.lookup("bedroom/102", rec));
}

static void subscribeTest() {

    Log log;
    TestClock clock(log);
    DiscoveryEngine engine(log, clock, makeSelf());
    ManualSource local("local");
    engine.addSource(&local);
    engine.start();

    // The first listener always blows up, the second must still hear
    engine.subscribe([](const vector<PresenceRecord>&, uint64_t) {
        throw std::runtime_error("listener broke");
    });
    unsigned calls = 0;
    uint64_t lastRev = 0;
    size_t lastSize = 0;
    int id = engine.subscribe([&calls, &lastRev, &lastSize]
        (const vector<PresenceRecord>& phones, uint64_t rev) {
        calls++;
        lastRev = rev;
        lastSize = phones.size();
    });

    clock.setTime(100);
    local.announce(makeRecord("bedroom", 102, "Bedroom", "192.168.1.22", 100));
    assert(engine.notifyIfChanged());
    assert(calls == 1);
    assert(lastSize == 1);
    assert(lastRev == engine.revision());

    // Nothing new
    assert(!engine.notifyIfChanged());
    engine.run2();
    assert(calls == 1);

    // A plain refresh is not a change
    local.announce(makeRecord("bedroom", 102, "Bedroom", "192.168.1.22", 200));
    engine.run2();
    assert(calls == 1);

    // A new phone is
    local.announce(makeRecord("garage", 104, "Garage", "192.168.1.24", 300));
    engine.run2();
    assert(calls == 2);
    assert(lastSize == 2);

    engine.unsubscribe(id);
    local.announce(makeRecord("attic", 105, "Attic", "192.168.1.25", 400));
    engine.run2();
    assert(calls == 2);
}

static void failedSourceTest() {

    Log log;
    TestClock clock(log);
    DiscoveryEngine engine(log, clock, makeSelf());
    ManualSource local("local");
    ManualSource broken("vpn-broadcast", -1);
    ManualSource directory("vpn-directory");
    engine.addSource(&local);
    engine.addSource(&broken);
    engine.addSource(&directory);

    assert(engine.start() == 2);
    assert(broken.startCount == 1);

    // The others keep working
    assert(directory.announce(makeRecord("bedroom", 102, "Bedroom", "100.64.0.2", 10,
        PresenceRecord::Tier::TIER_VPN_DIRECTORY)));
    assert(!broken.announce(makeRecord("garage", 104, "Garage", "100.64.0.4", 10)));
    assert(engine.list().size() == 1);

    engine.stop();
    assert(local.stopCount == 1);
    assert(directory.stopCount == 1);
    // Never started, never stopped
    assert(broken.stopCount == 0);
}

int main(int, const char**) {
    lifecycleTest();
    tickTest();
    selfTest();
    subscribeTest();
    failedSourceTest();
    cout << "engine-test OK" << endl;
}
