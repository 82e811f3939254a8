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
#include "PbxInterface.h"

namespace redphone {

const char* pbxEventName(PbxEvent::Type type) {
    switch (type) {
        case PbxEvent::Type::TYPE_RINGING: return "ringing";
        case PbxEvent::Type::TYPE_ANSWERED: return "answered";
        case PbxEvent::Type::TYPE_BUSY: return "busy";
        case PbxEvent::Type::TYPE_NO_ANSWER: return "noAnswer";
        case PbxEvent::Type::TYPE_REMOTE_HANGUP: return "remoteHangup";
        case PbxEvent::Type::TYPE_FAILED: return "failed";
        default: return "unknown";
    }
}

}
