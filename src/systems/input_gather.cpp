#include "input_gather.hpp"
#include "../input_state.hpp"
#include <raylib.h>
#include <string>

static constexpr int MAX_PAD_SLOTS = 16;

bool InputGatherSystem::IsRealGamepad(int slot) {
    if (!IsGamepadAvailable(slot)) return false;

    // Anything with fewer than two sticks cannot drive a twin-stick shooter.
    if (GetGamepadAxisCount(slot) < 4) return false;

    const char* name = GetGamepadName(slot);
    if (!name) return false;
    const std::string n = name;
    static const char* const not_pads[] = {
        "Keyboard", "Mouse", "Touchpad", "Accelerometer",
        "Sensor", "Consumer Control", "System Control", "Power Button",
    };
    for (const char* bad : not_pads) {
        if (n.find(bad) != std::string::npos) return false;
    }
    return true;
}

void InputGatherSystem::Update(ecs::World& world) {
    auto* record = world.try_resource<InputRecord>();
    if (!record) {
        world.set_resource(InputRecord{});
        record = world.try_resource<InputRecord>();
    }

    for (int k = 0; k < InputRecord::KEY_SLOTS; k++) {
        record->keys_down[k]    = IsKeyDown(k);
        record->keys_pressed[k] = IsKeyPressed(k);
    }

    record->pads.clear();
    for (int slot = 0; slot < MAX_PAD_SLOTS; slot++) {
        if (!IsRealGamepad(slot)) continue;

        PadState pad;
        pad.id = slot;
        const int axis_count = GetGamepadAxisCount(slot);
        for (int a = 0; a < 8 && a < axis_count; a++) {
            pad.axes[a] = GetGamepadAxisMovement(slot, a);
        }
        for (int b = 0; b < 32; b++) {
            pad.buttons[b]         = IsGamepadButtonDown(slot, b);
            pad.buttons_pressed[b] = IsGamepadButtonPressed(slot, b);
        }
        record->pads.push_back(pad);
    }
}
