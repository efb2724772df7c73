#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputGatherSystem — Pre-Update; snapshots keyboard and gamepads into the
// InputRecord resource (created on first run).
// ---------------------------------------------------------------------------

class InputGatherSystem {
public:
    static void Update(ecs::World& world);

    // Filters out joystick devices that are not gamepads (sensors, keyboards
    // and other HID nodes some platforms expose as joysticks).
    static bool IsRealGamepad(int slot);
};
