#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tributary::planner {

enum class WindowKind : std::uint8_t {
    Tumbling = 0,
    Sliding,
    Session,
    Instant
};

struct WindowType final {
    WindowKind kind = WindowKind::Instant;
    std::chrono::microseconds width{0};
    std::chrono::microseconds slide{0};
    std::chrono::microseconds gap{0};

    static WindowType tumbling(std::chrono::microseconds width) noexcept;
    static WindowType sliding(std::chrono::microseconds width, std::chrono::microseconds slide) noexcept;
    static WindowType session(std::chrono::microseconds gap) noexcept;
    static WindowType instant() noexcept;

    [[nodiscard]] bool is_session() const noexcept { return kind == WindowKind::Session; }
    [[nodiscard]] std::string describe() const;

    bool operator==(const WindowType& other) const = default;
};

[[nodiscard]] std::string window_kind_name(WindowKind kind);

}  // namespace tributary::planner
