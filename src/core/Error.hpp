#pragma once

#include <string>
#include <cstdint>

enum eErrorKind : uint8_t {
    ERROR_TRANSPORT = 0,
    ERROR_NOT_FOUND,
    ERROR_TIMEOUT,
    ERROR_MALFORMED,
    ERROR_INVALID_REQUEST,
    ERROR_SANDBOX, // the sandbox itself could not be started
};

struct SError {
    eErrorKind  kind    = ERROR_TRANSPORT;
    std::string message = "";
};

inline const char* errorKindToString(eErrorKind k) {
    switch (k) {
        case ERROR_TRANSPORT: return "TRANSPORT";
        case ERROR_NOT_FOUND: return "NOT_FOUND";
        case ERROR_TIMEOUT: return "TIMEOUT";
        case ERROR_MALFORMED: return "MALFORMED";
        case ERROR_INVALID_REQUEST: return "INVALID_REQUEST";
        case ERROR_SANDBOX: return "SANDBOX";
    }

    return "ERROR";
}
