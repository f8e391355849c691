/// @file game_serializer.cpp
/// @brief Non-template parts of GameSerializer.

#include "ger/foundation/game_serializer.hpp"

#include <cstdio>

namespace ger::foundation {

namespace detail {

void writeString(std::vector<uint8_t>& buf, std::string_view val) {
    writePrimitive(buf, static_cast<uint32_t>(val.size()));
    writeBytes(buf, val.data(), val.size());
}

bool BinaryReader::readString(std::string& val) {
    uint32_t len = 0;
    if (!readPrimitive(len)) return false;
    if (!canRead(len)) {
        return fail(ErrorCode::InvalidBinaryData, "string length exceeds data");
    }
    val.assign(reinterpret_cast<const char*>(data.data() + pos), len);
    pos += len;
    return true;
}

std::string escapeJson(std::string_view sv) {
    std::string out;
    out.reserve(sv.size());
    for (char c : sv) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char hex[7];
                    std::snprintf(hex, sizeof(hex), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += hex;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

}  // namespace detail

GameSerializer& GameSerializer::instance() {
    static GameSerializer inst;
    return inst;
}

}  // namespace ger::foundation
