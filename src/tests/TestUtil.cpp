#include <cstring>

#include "tests/TestUtil.h"

namespace redphone {

int FakePbx::dial(const char* targetAddress, unsigned targetExtension, 
    unsigned) {
    Command c;
    c.type = "dial";
    c.address = targetAddress;
    c.extension = targetExtension;
    if (failDial) {
        c.callHandle = -1;
        commands.push_back(c);
        return -1;
    }
    c.callHandle = nextHandle++;
    commands.push_back(c);
    return c.callHandle;
}

void FakePbx::answer(int callHandle) {
    Command c;
    c.type = "answer";
    c.callHandle = callHandle;
    commands.push_back(c);
}

void FakePbx::terminate(int callHandle) {
    Command c;
    c.type = "terminate";
    c.callHandle = callHandle;
    commands.push_back(c);
}

unsigned FakePbx::count(const char* type) const {
    unsigned n = 0;
    for (const Command& c : commands)
        if (c.type == type)
            n++;
    return n;
}

PresenceRecord makeRecord(const char* hostName, unsigned extension, 
    const char* displayName, const char* address, uint32_t seenMs,
    PresenceRecord::Tier tier) {
    PresenceRecord rec;
    rec.identity = makeIdentity(hostName, extension);
    rec.displayName = displayName;
    rec.extension = extension;
    rec.address = address;
    rec.tier = tier;
    rec.firstSeenMs = seenMs;
    rec.lastSeenMs = seenMs;
    return rec;
}

}
