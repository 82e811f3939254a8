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
#include <pthread.h>

#include <iostream>

#include "ConsoleFileLog.h"

using namespace std;

namespace redphone {

int ConsoleFileLog::setFile(const std::string& fileName) {
    std::lock_guard<std::mutex> lock(_lock);
    if (fileName == _fileName)
        return 0;
    if (_file.is_open())
        _file.close();
    _fileName = fileName;
    if (_fileName.empty())
        return 0;
    _file.open(_fileName, std::ios::out | std::ios::app);
    if (!_file.is_open()) {
        _fileName.clear();
        return -1;
    }
    return 0;
}

void ConsoleFileLog::_out(const char* sev, const char* dt, const char* msg) {
    char tid[16];
    pthread_getname_np(pthread_self(), tid, sizeof(tid));
    std::lock_guard<std::mutex> lock(_lock);
    std::cout << tid << " " << sev << ": " << dt << " " << msg << std::endl;
    if (_file.is_open())
        _file << tid << " " << sev << ": " << dt << " " << msg << std::endl;
}

}
