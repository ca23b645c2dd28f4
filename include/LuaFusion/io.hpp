#pragma once

#include <iterator>

namespace LuaFusion {

// 1) Iterator you can:
//    - write as *it = ch
//    - advance as it++ / ++it
template <class It>
concept CharOutputIterator =
    std::output_iterator<It, char>;

// 2) Matching "end" type you can:
//    - compare as it == end / it != end
template <class Sent, class It>
concept CharSentinelForOut =
    std::sentinel_for<Sent, It>;

namespace io_details {

// Sentinel for unbounded outputs (back inserters): never reached.
struct limitless_sentinel {};

template <class It>
constexpr bool operator==(const It&, const limitless_sentinel&) noexcept {
    return false;
}

} // namespace io_details

} // namespace LuaFusion
