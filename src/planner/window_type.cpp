#include "tributary/planner/window_type.hpp"

#include "tributary/planner/data_type.hpp"

namespace tributary::planner {

WindowType WindowType::tumbling(std::chrono::microseconds width) noexcept
{
    WindowType window{};
    window.kind = WindowKind::Tumbling;
    window.width = width;
    return window;
}

WindowType WindowType::sliding(std::chrono::microseconds width, std::chrono::microseconds slide) noexcept
{
    WindowType window{};
    window.kind = WindowKind::Sliding;
    window.width = width;
    window.slide = slide;
    return window;
}

WindowType WindowType::session(std::chrono::microseconds gap) noexcept
{
    WindowType window{};
    window.kind = WindowKind::Session;
    window.gap = gap;
    return window;
}

WindowType WindowType::instant() noexcept
{
    return WindowType{};
}

std::string WindowType::describe() const
{
    switch (kind) {
    case WindowKind::Tumbling:
        return "tumble(" + format_duration(width) + ")";
    case WindowKind::Sliding:
        return "hop(" + format_duration(width) + ", " + format_duration(slide) + ")";
    case WindowKind::Session:
        return "session(" + format_duration(gap) + ")";
    case WindowKind::Instant:
        return "instant";
    }
    return "unknown";
}

std::string window_kind_name(WindowKind kind)
{
    switch (kind) {
    case WindowKind::Tumbling:
        return "tumbling";
    case WindowKind::Sliding:
        return "sliding";
    case WindowKind::Session:
        return "session";
    case WindowKind::Instant:
        return "instant";
    }
    return "unknown";
}

}  // namespace tributary::planner
