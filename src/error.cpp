#include "clienthello/error.hpp"

#include <cstdio>

namespace clienthello {

std::string describe(const DecodeError& error) {
    char buf[96];

    switch (error.kind) {
        case ErrorKind::InputTooShort:
            std::snprintf(buf, sizeof(buf), "buffer too short: need %zu bytes, have %zu",
                          error.need, error.have);
            return buf;
        case ErrorKind::UnexpectedContentType:
            std::snprintf(buf, sizeof(buf),
                          "unexpected content type: expected 0x16 (Handshake), got 0x%02x",
                          static_cast<unsigned>(error.actual));
            return buf;
        case ErrorKind::UnexpectedHandshakeType:
            std::snprintf(buf, sizeof(buf),
                          "unexpected handshake type: expected 0x01 (ClientHello), got 0x%02x",
                          static_cast<unsigned>(error.actual));
            return buf;
        case ErrorKind::Truncated: {
            std::string msg = "truncated ";
            msg += error.field;
            return msg;
        }
    }
    return std::string(error_kind_to_string(error.kind));
}

}  // namespace clienthello
