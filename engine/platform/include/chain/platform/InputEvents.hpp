#pragma once

namespace chain::platform {

enum class InputEventType {
    Quit,
    MouseMove,
    MouseButtonDown,
    KeyDown,
    ControllerButtonDown,
    WindowResized
};

enum class MouseButton { Left, Right, Middle, Unknown };

enum class KeyCode { Escape, Up, Down, Left, Right, Enter, Space, R, Unknown };

enum class ControllerButton { A, B, Menu, DPadUp, DPadDown, DPadLeft, DPadRight, Unknown };

struct InputEvent {
    InputEventType type = InputEventType::Quit;
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
    MouseButton mouse_button = MouseButton::Unknown;
    KeyCode key = KeyCode::Unknown;
    ControllerButton controller_button = ControllerButton::Unknown;
};

}  // namespace chain::platform
