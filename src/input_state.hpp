#pragma once
#include <raylib.h>
#include <vector>

// ---------------------------------------------------------------------------
// InputRecord — one frame of raw device state, captured by InputGatherSystem.
//
// Stored as a World resource. Everything downstream (PlayerInputSystem, the
// debug overlay toggle) reads this snapshot instead of polling raylib, so a
// frame sees one consistent view of the devices.
// ---------------------------------------------------------------------------

struct PadState {
    int   id = -1;
    float axes[8] = {0};
    bool  buttons[32] = {false};
    bool  buttons_pressed[32] = {false};

    // Triggers idle at -1 on most drivers; remap to [0, 1].
    float trigger(int axis) const { return (axes[axis] + 1.0f) * 0.5f; }
};

struct InputRecord {
    static constexpr int KEY_SLOTS = 512;

    bool keys_down[KEY_SLOTS]    = {false};
    bool keys_pressed[KEY_SLOTS] = {false};

    std::vector<PadState> pads; // real gamepads only

    bool key_down(int key) const    { return key >= 0 && key < KEY_SLOTS && keys_down[key]; }
    bool key_pressed(int key) const { return key >= 0 && key < KEY_SLOTS && keys_pressed[key]; }
};
