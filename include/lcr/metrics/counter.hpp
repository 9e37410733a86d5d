#pragma once

#include <type_traits>
#include <cstdint>

namespace lcr {
namespace metrics {

// ---------------------------------------------------------------------------
// counter - monotonically increasing cumulative metric
// ---------------------------------------------------------------------------
//
// Not thread-safe. Owned and mutated by a single poll thread; readers take
// copies through copy_to().
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct counter {
public:
    constexpr counter() noexcept = default;
    constexpr explicit counter(T initial) noexcept : value_(initial) {}

    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    inline void copy_to(counter& dst) const noexcept {
        dst.value_ = value_;
    }

    inline constexpr T load() const noexcept { return value_; }
    inline constexpr void inc(T n = 1) noexcept { value_ += n; }
    inline constexpr void reset() noexcept { value_ = 0; }

private:
    T value_{0};
};

using counter32 = counter<uint32_t>;
using counter64 = counter<uint64_t>;
static_assert(std::is_standard_layout_v<counter32>, "counter32 must be standard layout");

} // namespace metrics
} // namespace lcr
