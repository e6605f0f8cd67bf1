/**
 * @file status.cpp
 * @brief Status class implementation
 */

#include "mdfkit/status.hpp"

namespace mdfkit {

std::string Status::to_string() const {
    std::string result;

    switch (code_) {
        case StatusCode::kOk:                  result = "OK"; break;
        case StatusCode::kError:               result = "Error"; break;
        case StatusCode::kNotFound:            result = "NotFound"; break;
        case StatusCode::kInvalidArgument:     result = "InvalidArgument"; break;
        case StatusCode::kIOError:             result = "IOError"; break;
        case StatusCode::kCorruption:          result = "Corruption"; break;
        case StatusCode::kNotSupported:        result = "NotSupported"; break;
        case StatusCode::kInternal:            result = "Internal"; break;
        case StatusCode::kMalformedPage:       result = "MalformedPage"; break;
        case StatusCode::kRecordTooShort:      result = "RecordTooShort"; break;
        case StatusCode::kBrokenLobChain:      result = "BrokenLobChain"; break;
        case StatusCode::kCatalogCorrupt:      result = "CatalogCorrupt"; break;
        case StatusCode::kForwardLoopDetected: result = "ForwardLoopDetected"; break;
        case StatusCode::kUnsupportedType:     result = "UnsupportedType"; break;
    }

    if (!message_.empty()) {
        result += ": ";
        result += message_;
    }

    return result;
}

}  // namespace mdfkit
