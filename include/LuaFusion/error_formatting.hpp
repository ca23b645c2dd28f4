#pragma once

#include <format>
#include <string>

#include "errors.hpp"

namespace LuaFusion {

/// One line describing a serialization outcome, e.g.
///   "LuaFusion serialize error: SINK_ERROR (OUTPUT_OVERFLOW) after 12 bytes"
inline std::string SerializeResultToString(const SerializeResult & res) {
    if(res) {
        return std::format("LuaFusion serialize ok: {} bytes", res.bytesWritten());
    }
    std::string details;
    if(res.error() == SerializeError::SINK_ERROR) {
        details = std::format(" ({})", sink_error_to_string(res.sinkError()));
    } else if(!res.message().empty()) {
        details = std::format(": {}", res.message());
    }
    return std::format("LuaFusion serialize error: {}{} after {} bytes",
                       error_to_string(res.error()), details, res.bytesWritten());
}

} // namespace LuaFusion
