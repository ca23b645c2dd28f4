#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace LuaFusion {


enum class SerializeError {
    NO_ERROR,

    SINK_ERROR,          // the sink refused a write
    CUSTOM_ERROR,        // the value's own description declined to proceed
    INVALID_KEY_KIND,    // map key is not an integer, character, string or variant name

    NON_FINITE_FLOAT,    // NaN / infinity with NonFinitePolicy::Reject
    MAX_DEPTH_EXCEEDED,
    LENGTH_MISMATCH,     // element written to a compound opened with zero length
    INTERLEAVED_COMPOUND // write to a table other than the innermost open one, or a table left open
};

constexpr std::string_view error_to_string(SerializeError e) {
    switch(e) {
    case SerializeError::NO_ERROR: return "NO_ERROR"; break;
    case SerializeError::SINK_ERROR: return "SINK_ERROR"; break;
    case SerializeError::CUSTOM_ERROR: return "CUSTOM_ERROR"; break;
    case SerializeError::INVALID_KEY_KIND: return "INVALID_KEY_KIND"; break;
    case SerializeError::NON_FINITE_FLOAT: return "NON_FINITE_FLOAT"; break;
    case SerializeError::MAX_DEPTH_EXCEEDED: return "MAX_DEPTH_EXCEEDED"; break;
    case SerializeError::LENGTH_MISMATCH: return "LENGTH_MISMATCH"; break;
    case SerializeError::INTERLEAVED_COMPOUND: return "INTERLEAVED_COMPOUND"; break;
    }
    return "N/A";
}

enum class SinkError {
    NO_ERROR,
    OUTPUT_OVERFLOW,
    STREAM_FAILURE
};

constexpr std::string_view sink_error_to_string(SinkError e) {
    switch(e) {
    case SinkError::NO_ERROR: return "NO_ERROR"; break;
    case SinkError::OUTPUT_OVERFLOW: return "OUTPUT_OVERFLOW"; break;
    case SinkError::STREAM_FAILURE: return "STREAM_FAILURE"; break;
    }
    return "N/A";
}


class SerializeResult {
    SerializeError m_error = SerializeError::NO_ERROR;
    SinkError m_sinkError = SinkError::NO_ERROR;
    std::string m_message;
    std::size_t m_bytesWritten = 0;
public:
    constexpr SerializeResult(SerializeError err, SinkError serr, std::string message, std::size_t written):
        m_error(err), m_sinkError(serr), m_message(std::move(message)), m_bytesWritten(written)
    {}
    constexpr operator bool() const {
        return m_error == SerializeError::NO_ERROR;
    }
    constexpr SerializeError error() const {
        return m_error;
    }
    constexpr SinkError sinkError() const {
        return m_sinkError;
    }
    // Payload of CUSTOM_ERROR; empty otherwise
    constexpr std::string_view message() const {
        return m_message;
    }
    constexpr std::size_t bytesWritten() const {
        return m_bytesWritten;
    }
};

} // namespace LuaFusion
