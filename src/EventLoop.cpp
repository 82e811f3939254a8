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
#include <poll.h>
#include <errno.h>

#include <algorithm>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"
#include "kc1fsz-tools/StdPollTimer.h"

#include "Task.h"
#include "EventLoop.h"

namespace redphone {

// The longest we will block waiting for socket activity. This bounds
// how quickly a shutdown request is noticed.
static const int MAX_SLEEP_MS = 100;

// Prevents a single busy task from starving the others
static const unsigned MAX_RUN2_PASSES = 16;

void EventLoop::run(kc1fsz::Log& log, kc1fsz::Clock& clock, 
    Task** tasks, unsigned taskCount,
    std::function<bool()> cb, bool trace) {

    kc1fsz::StdPollTimer timer1s(clock, 1000000);
    kc1fsz::StdPollTimer timer10s(clock, 10000000);

    timer1s.reset();
    timer10s.reset();

    unsigned long slowestLoopUs = 0;
    unsigned long loopCount = 0;   

    while (true) {        

        // Everything the tasks are waiting on
        const unsigned fdsCapacity = 32;
        unsigned fdsSize = 0;
        pollfd fds[fdsCapacity];

        for (unsigned i = 0; i < taskCount; i++) {
            int used = tasks[i]->getPolls(fds + fdsSize, fdsCapacity - fdsSize);
            if (used < 0) {
                log.error("Not enough poll fds");
                break;
            }
            fdsSize += used;
        }

        // Sleep until there is socket activity or the timeout passes
        int rc = poll(fds, fdsSize, MAX_SLEEP_MS);
        if (rc < 0 && errno != EINTR) {
            log.error("Poll error %d", errno);
        } 

        uint64_t workStartUs = clock.timeUs();

        // Keep going while anyone says there might be more work
        for (unsigned pass = 0; pass < MAX_RUN2_PASSES; pass++) {
            bool more = false;
            for (unsigned i = 0; i < taskCount; i++)
                if (tasks[i]->run2())
                    more = true;
            if (!more)
                break;
        }

        if (timer1s.poll()) {
            for (unsigned i = 0; i < taskCount; i++)
                tasks[i]->oneSecTick();
        }

        bool showStats = false;

        if (timer10s.poll()) {
            for (unsigned i = 0; i < taskCount; i++)
                tasks[i]->tenSecTick();
            showStats = true;
        }

        if (cb) {
            if (cb() == false)
                break;
        }

        unsigned long workTimeUs = clock.timeUs() - workStartUs;
        if (workTimeUs > slowestLoopUs) 
            slowestLoopUs = workTimeUs;

        loopCount++;

        if (trace && showStats) {
            log.info("Loops: %lu, MaxWork: %lu us", loopCount, slowestLoopUs);
            slowestLoopUs = 0;
            loopCount = 0;
        }
    }
}

}
