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
#include <functional>
#include <string>

#include "Task.h"

namespace kc1fsz {
class Log;
class Clock;
}

namespace redphone {

/**
 * Watches the handset hook switch through the Linux sysfs GPIO interface
 * and reports debounced lift/replace transitions.
 */
class GpioHookSwitch : public Task {
public:

    // A level has to be steady this long before it is believed
    static constexpr uint32_t DEBOUNCE_MS = 50;
    static constexpr uint32_t SAMPLE_INTERVAL_MS = 10;

    enum Logic {
        LOGIC_HIGH_ON_LIFT,
        LOGIC_LOW_ON_LIFT
    };

    typedef std::function<void(bool lifted)> Callback;

    GpioHookSwitch(kc1fsz::Log& log, kc1fsz::Clock& clock, Callback cb);
    virtual ~GpioHookSwitch();

    /**
     * Exports the pin (if needed), makes it an input, and takes an 
     * initial reading. 
     *
     * @returns 0 on success, -1 on failure.
     */
    int open(unsigned pin, Logic logic, 
        const char* sysfsRoot = "/sys/class/gpio");

    void close();

    /**
     * Feeds one raw level (0 or 1) through the debounce logic. Exposed 
     * for unit testing, normally called from run2().
     */
    void sample(int level);

    bool isLifted() const;

    static Logic parseLogic(const char* s);

    // ----- Task ------------------------------------------------------------

    virtual bool run2();

private:

    int _read();

    kc1fsz::Log& _log;
    kc1fsz::Clock& _clock;
    Callback _cb;
    Logic _logic = Logic::LOGIC_HIGH_ON_LIFT;
    int _fd = -1;
    uint32_t _nextSampleMs = 0;

    int _lastReading = 0;
    int _currentLevel = 0;
    uint32_t _lastChangeMs = 0;
};

}
