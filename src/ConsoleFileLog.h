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

#include <fstream>
#include <mutex>
#include <string>

#include "kc1fsz-tools/Log.h"

namespace redphone {

/**
 * Writes to the console and, optionally, appends to a log file. 
 *
 * This logger is thread-safe.
 */
class ConsoleFileLog : public kc1fsz::Log {
public:

    ConsoleFileLog() { }

    /**
     * Starts (or stops, if the name is empty) appending to a file.
     *
     * @returns 0 on success, -1 if the file can't be opened.
     */
    int setFile(const std::string& fileName);

protected:

    virtual void _out(const char* sev, const char* dt, const char* msg);

private:

    std::mutex _lock;
    std::string _fileName;
    std::ofstream _file;
};

}
