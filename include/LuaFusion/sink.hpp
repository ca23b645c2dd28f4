#pragma once
#include <cstdint>
#include <cstddef>
#include <concepts>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

#include "errors.hpp"
#include "io.hpp"

namespace LuaFusion {

// ============================================================================
// SinkLike Concept
// ============================================================================

/// Concept for append-only byte destinations the formatters write into.
/// A sink never seeks back: once put()/write() returned true, the bytes are final.
///
/// put()/write() return false when the destination refused the bytes; the
/// reason is then available from getError() and the sink stays failed.
template<typename T>
concept SinkLike = requires(T& sink, const T& csink,
                            char ch, const char* data, std::size_t size) {
    { sink.put(ch) } -> std::same_as<bool>;
    { sink.write(data, size) } -> std::same_as<bool>;
    { csink.bytes_written() } -> std::convertible_to<std::size_t>;
    { csink.getError() } -> std::same_as<SinkError>;
};

// ============================================================================
// IteratorSink - bounded [first, last) output range
// ============================================================================

template<CharOutputIterator It, CharSentinelForOut<It> Sent = It>
class IteratorSink {
    It m_current;
    Sent end_;
    std::size_t m_bytesWritten = 0;
    SinkError m_error = SinkError::NO_ERROR;

    constexpr bool overflow() {
        m_error = SinkError::OUTPUT_OVERFLOW;
        return false;
    }
public:
    using iterator_type = It;

    constexpr IteratorSink(It first, Sent last): m_current(first), end_(last) {}

    constexpr bool put(char c) {
        if(m_error != SinkError::NO_ERROR) return false;
        if(m_current == end_) {
            return overflow();
        }
        *m_current++ = c; m_bytesWritten ++;
        return true;
    }

    constexpr bool write(const char* data, std::size_t size) {
        if(m_error != SinkError::NO_ERROR) return false;
        if constexpr (std::is_pointer_v<It> && std::is_pointer_v<Sent>) {
            // Fast path: contiguous output, all-or-nothing
            if(static_cast<std::size_t>(end_ - m_current) < size) {
                return overflow();
            }
            for(std::size_t i = 0; i < size; ++i) {
                m_current[i] = data[i];
            }
            m_current += size;
            m_bytesWritten += size;
            return true;
        } else {
            for(std::size_t i = 0; i < size; ++i) {
                if(m_current == end_) {
                    return overflow();
                }
                *m_current++ = data[i]; m_bytesWritten ++;
            }
            return true;
        }
    }

    constexpr It current() const {
        return m_current;
    }
    constexpr std::size_t bytes_written() const {
        return m_bytesWritten;
    }
    constexpr SinkError getError() const {
        return m_error;
    }
};

// ============================================================================
// StringSink - appends to a caller-owned std::string, never fails
// ============================================================================

class StringSink {
    std::string * m_out;
    std::size_t m_bytesWritten = 0;
public:
    constexpr explicit StringSink(std::string & out): m_out(&out) {}

    constexpr bool put(char c) {
        m_out->push_back(c); m_bytesWritten ++;
        return true;
    }
    constexpr bool write(const char* data, std::size_t size) {
        m_out->append(data, size); m_bytesWritten += size;
        return true;
    }
    constexpr std::size_t bytes_written() const {
        return m_bytesWritten;
    }
    constexpr SinkError getError() const {
        return SinkError::NO_ERROR;
    }
    constexpr std::string & str() const {
        return *m_out;
    }
};

// ============================================================================
// VectorSink - appends raw bytes to a caller-owned std::vector<std::uint8_t>
// ============================================================================

class VectorSink {
    std::vector<std::uint8_t> * m_out;
    std::size_t m_bytesWritten = 0;
public:
    constexpr explicit VectorSink(std::vector<std::uint8_t> & out): m_out(&out) {}

    constexpr bool put(char c) {
        m_out->push_back(static_cast<std::uint8_t>(c)); m_bytesWritten ++;
        return true;
    }
    constexpr bool write(const char* data, std::size_t size) {
        for(std::size_t i = 0; i < size; ++i) {
            m_out->push_back(static_cast<std::uint8_t>(data[i]));
        }
        m_bytesWritten += size;
        return true;
    }
    constexpr std::size_t bytes_written() const {
        return m_bytesWritten;
    }
    constexpr SinkError getError() const {
        return SinkError::NO_ERROR;
    }
};

// ============================================================================
// StreamSink - std::ostream adapter
// ============================================================================

class StreamSink {
    std::ostream * m_os;
    std::size_t m_bytesWritten = 0;
    SinkError m_error = SinkError::NO_ERROR;
public:
    explicit StreamSink(std::ostream & os): m_os(&os) {
        if(!*m_os) {
            m_error = SinkError::STREAM_FAILURE;
        }
    }

    bool put(char c) {
        if(m_error != SinkError::NO_ERROR) return false;
        if(!m_os->put(c)) {
            m_error = SinkError::STREAM_FAILURE;
            return false;
        }
        m_bytesWritten ++;
        return true;
    }
    bool write(const char* data, std::size_t size) {
        if(m_error != SinkError::NO_ERROR) return false;
        if(!m_os->write(data, static_cast<std::streamsize>(size))) {
            m_error = SinkError::STREAM_FAILURE;
            return false;
        }
        m_bytesWritten += size;
        return true;
    }
    std::size_t bytes_written() const {
        return m_bytesWritten;
    }
    SinkError getError() const {
        return m_error;
    }
};

// ============================================================================
// Static Assertions - Verify Concept Satisfaction
// ============================================================================

static_assert(SinkLike<IteratorSink<char*, char*>>, "IteratorSink<char*> should satisfy SinkLike");
static_assert(SinkLike<StringSink>, "StringSink should satisfy SinkLike");
static_assert(SinkLike<VectorSink>, "VectorSink should satisfy SinkLike");
static_assert(SinkLike<StreamSink>, "StreamSink should satisfy SinkLike");

} // namespace LuaFusion
