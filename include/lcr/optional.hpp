#pragma once

#include <chrono>
#include <cassert>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>


namespace lcr {

/*
===============================================================================
 lcr::optional<T>
===============================================================================

Value slot with a presence flag, used for every "known / not yet known" field
of the wire schemas and rate-limit records (limit, remaining, reset instant,
sequence, session id, close code).

  - T is default constructible; an empty slot holds T{}
  - reset() clears the flag and restores T{}
  - value() on an empty slot is a programming error (asserted)
===============================================================================
*/

template <typename T>
class optional {
    static_assert(std::is_default_constructible_v<T>, "lcr::optional requires a default constructible T");

public:
    optional() = default;
    optional(const T& v) : value_(v), has_(true) {}
    optional(T&& v) : value_(std::move(v)), has_(true) {}

    inline optional& operator=(const T& v) {
        value_ = v;
        has_ = true;
        return *this;
    }

    inline optional& operator=(T&& v) {
        value_ = std::move(v);
        has_ = true;
        return *this;
    }

    [[nodiscard]] inline bool has() const noexcept { return has_; }

    [[nodiscard]] inline T& value() {
        assert(has_ && "lcr::optional: value() on empty slot");
        return value_;
    }

    [[nodiscard]] inline const T& value() const {
        assert(has_ && "lcr::optional: value() on empty slot");
        return value_;
    }

    [[nodiscard]] inline T value_or(T fallback) const {
        return has_ ? value_ : std::move(fallback);
    }

    inline void reset() {
        value_ = T{};
        has_ = false;
    }

    // Both empty, or both set to equal values
    [[nodiscard]] friend bool operator==(const optional& a, const optional& b) {
        return a.has_ == b.has_ && (!a.has_ || a.value_ == b.value_);
    }

    // Set and equal to v
    [[nodiscard]] friend bool operator==(const optional& a, const T& v) {
        return a.has_ && a.value_ == v;
    }

private:
    T value_{};
    bool has_{false};
};


namespace detail {

template <typename>
inline constexpr bool is_duration_v = false;

template <typename Rep, typename Period>
inline constexpr bool is_duration_v<std::chrono::duration<Rep, Period>> = true;

} // namespace detail

// Log rendering: "null" when empty, quoted strings, "<n>ms" for durations.
template <typename T>
[[nodiscard]]
inline std::string to_string(const optional<T>& opt) {
    if (!opt.has()) {
        return "null";
    }
    const T& v = opt.value();
    if constexpr (std::is_same_v<T, bool>) {
        return v ? "true" : "false";
    }
    else if constexpr (std::is_arithmetic_v<T>) {
        return std::to_string(v);
    }
    else if constexpr (std::is_same_v<T, std::string>) {
        return "\"" + v + "\"";
    }
    else if constexpr (detail::is_duration_v<T>) {
        return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(v).count()) + "ms";
    }
    else {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
}

} // namespace lcr
