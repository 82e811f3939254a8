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
#include <fcntl.h>
#include <errno.h>

#include <cstdio>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"

#include "GpioHookSwitch.h"

using namespace std;
using namespace kc1fsz;

namespace redphone {

GpioHookSwitch::GpioHookSwitch(Log& log, Clock& clock, Callback cb)
:   _log(log),
    _clock(clock),
    _cb(cb) {
}

GpioHookSwitch::~GpioHookSwitch() {
    close();
}

GpioHookSwitch::Logic GpioHookSwitch::parseLogic(const char* s) {
    if (strcmp(s, "low_on_lift") == 0)
        return Logic::LOGIC_LOW_ON_LIFT;
    return Logic::LOGIC_HIGH_ON_LIFT;
}

int GpioHookSwitch::open(unsigned pin, Logic logic, const char* sysfsRoot) {

    close();
    _logic = logic;

    std::filesystem::path root(sysfsRoot);
    std::filesystem::path pinDir = root / ("gpio" + std::to_string(pin));

    // Export the pin if the kernel hasn't done it already
    std::error_code ec;
    if (!std::filesystem::exists(pinDir, ec)) {
        std::ofstream exportFile(root / "export");
        exportFile << pin << std::endl;
        if (!exportFile.good()) {
            _log.error("Unable to export GPIO %u", pin);
            return -1;
        }
    }

    {
        std::ofstream dirFile(pinDir / "direction");
        dirFile << "in" << std::endl;
        if (!dirFile.good()) 
            _log.info("Unable to set direction of GPIO %u, continuing", pin);
    }

    std::string valuePath = (pinDir / "value").string();
    int fd = ::open(valuePath.c_str(), O_RDONLY);
    if (fd < 0) {
        _log.error("Unable to open %s (%d)", valuePath.c_str(), errno);
        return -1;
    }
    _fd = fd;

    int level = _read();
    if (level < 0) {
        close();
        return -1;
    }
    _lastReading = level;
    _currentLevel = level;
    _lastChangeMs = _clock.time();
    _nextSampleMs = _clock.time() + SAMPLE_INTERVAL_MS;

    _log.info("Hook switch on GPIO %u, handset is %s", pin, 
        isLifted() ? "lifted" : "down");

    if (isLifted() && _cb)
        _cb(true);

    return 0;
}

void GpioHookSwitch::close() {
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
}

bool GpioHookSwitch::isLifted() const {
    if (_logic == Logic::LOGIC_HIGH_ON_LIFT)
        return _currentLevel == 1;
    else 
        return _currentLevel == 0;
}

int GpioHookSwitch::_read() {
    char buf[4];
    if (::lseek(_fd, 0, SEEK_SET) < 0) {
        _log.error("GPIO seek failed (%d)", errno);
        return -1;
    }
    int rc = ::read(_fd, buf, sizeof(buf));
    if (rc <= 0) {
        _log.error("GPIO read failed (%d)", errno);
        return -1;
    }
    return buf[0] == '1' ? 1 : 0;
}

void GpioHookSwitch::sample(int level) {

    uint32_t now = _clock.time();

    // Any change restarts the debounce timer
    if (level != _lastReading) {
        _lastReading = level;
        _lastChangeMs = now;
        return;
    }

    if (now - _lastChangeMs >= DEBOUNCE_MS && level != _currentLevel) {
        _currentLevel = level;
        bool lifted = isLifted();
        _log.info("Handset %s", lifted ? "lifted" : "replaced");
        if (_cb) {
            try {
                _cb(lifted);
            }
            catch (const std::exception& ex) {
                _log.error("Hook callback failed: %s", ex.what());
            }
        }
    }
}

bool GpioHookSwitch::run2() {
    if (_fd < 0)
        return false;
    if (!_clock.isPast(_nextSampleMs))
        return false;
    _nextSampleMs = _clock.time() + SAMPLE_INTERVAL_MS;
    int level = _read();
    if (level >= 0)
        sample(level);
    return false;
}

}
