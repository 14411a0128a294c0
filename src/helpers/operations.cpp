#include "operations.hpp"

#include <cstdio>

namespace radiohal {
namespace helpers {

std::string FormatPayload(const std::vector<uint8_t>& payload) {
    bool printable = !payload.empty();
    for (uint8_t byte : payload) {
        if (byte < 0x20 || byte > 0x7E) {
            printable = false;
            break;
        }
    }

    if (printable) {
        return "'" + std::string(payload.begin(), payload.end()) + "'";
    }

    std::string out = "[";
    char byte_text[8];
    for (size_t i = 0; i < payload.size(); ++i) {
        snprintf(byte_text, sizeof(byte_text), i == 0 ? "%02x" : " %02x",
                 payload[i]);
        out += byte_text;
    }
    out += "]";
    return out;
}

const char* OperationName(const Operation& operation) {
    switch (operation.index()) {
        case 0:
            return "tx";
        case 1:
            return "rx";
        case 2:
            return "rssi";
        case 3:
            return "echo";
        case 4:
            return "ping-pong";
        default:
            return "unknown";
    }
}

}  // namespace helpers
}  // namespace radiohal
