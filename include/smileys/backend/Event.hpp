#pragma once

#include <string_view>

namespace SM::Backend {

enum class EventType {
    Window,
    Quit,
    PointerPress,
    KeyPress,
    Other,
};

enum class Key {
    Unknown,
    Escape,
    Q,
    Space,
    Left,
    Right,
    Up,
    Down,
};

struct Event {
    EventType type = EventType::Other;
    int x = 0;
    int y = 0;
    Key key = Key::Unknown;

    static auto window() -> Event { return Event{.type = EventType::Window}; }
    static auto quit() -> Event { return Event{.type = EventType::Quit}; }
    static auto pointer_press(int x, int y) -> Event {
        return Event{.type = EventType::PointerPress, .x = x, .y = y};
    }
    static auto key_press(Key key) -> Event {
        return Event{.type = EventType::KeyPress, .key = key};
    }
};

[[nodiscard]] inline auto to_string(EventType type) -> std::string_view {
    switch (type) {
    case EventType::Window:
        return "window";
    case EventType::Quit:
        return "quit";
    case EventType::PointerPress:
        return "pointer_press";
    case EventType::KeyPress:
        return "key_press";
    case EventType::Other:
        return "other";
    }
    return "other";
}

[[nodiscard]] inline auto to_string(Key key) -> std::string_view {
    switch (key) {
    case Key::Unknown:
        return "unknown";
    case Key::Escape:
        return "escape";
    case Key::Q:
        return "q";
    case Key::Space:
        return "space";
    case Key::Left:
        return "left";
    case Key::Right:
        return "right";
    case Key::Up:
        return "up";
    case Key::Down:
        return "down";
    }
    return "unknown";
}

} // namespace SM::Backend
