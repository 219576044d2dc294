#pragma once

// ----------------------------------------------------------
// Eingabegerät (6-Achsen + Tasten)
// ----------------------------------------------------------
enum class InputEventType
{
    None,       // nothing pending
    Motion,
    Button
};

struct MotionEvent
{
    int x = 0, y = 0, z = 0;
    int rx = 0, ry = 0, rz = 0;
    unsigned int period = 0;   // ms since the previous motion event
};

struct ButtonEvent
{
    int button = 0;
    bool pressed = false;
};

struct InputEvent
{
    InputEventType type = InputEventType::None;
    MotionEvent motion;
    ButtonEvent button;

    static InputEvent makeMotion(int rx, int ry, int rz)
    {
        InputEvent ev;
        ev.type = InputEventType::Motion;
        ev.motion.rx = rx;
        ev.motion.ry = ry;
        ev.motion.rz = rz;
        return ev;
    }

    static InputEvent makeButton(int button, bool pressed)
    {
        InputEvent ev;
        ev.type = InputEventType::Button;
        ev.button.button = button;
        ev.button.pressed = pressed;
        return ev;
    }
};

class InputDevice
{
public:
    virtual ~InputDevice() = default;

    // throws ConnectionError when the driver is not reachable
    virtual void open() = 0;

    // Non-blocking. Returns a None event when nothing is pending,
    // throws ConnectionError when the driver went away.
    virtual InputEvent poll() = 0;

    virtual void close() = 0;
};
