#include "player_input.hpp"
#include "../components.hpp"
#include "../input_state.hpp"
#include "../match_state.hpp"
#include <cmath>

using namespace ecs;

static constexpr float DEADZONE = 0.15f;

static void clamp_unit(Vec2& v) {
    const float mag_sq = v.x * v.x + v.y * v.y;
    if (mag_sq > 1.0f) {
        const float mag = std::sqrt(mag_sq);
        v.x /= mag;
        v.y /= mag;
    }
}

void PlayerInputSystem::Update(World& world) {
    const auto* record = world.try_resource<InputRecord>();
    if (!record) return;

    if (auto* match = world.try_resource<MatchInput>()) {
        match->confirm = record->key_pressed(KEY_ENTER);
        match->pause   = record->key_pressed(KEY_P);
        for (const auto& pad : record->pads) {
            if (pad.buttons_pressed[GAMEPAD_BUTTON_RIGHT_FACE_DOWN]) match->confirm = true;
            if (pad.buttons_pressed[GAMEPAD_BUTTON_MIDDLE_RIGHT])    match->pause   = true;
        }
    }

    world.each<PlayerInput>([&](Entity, PlayerInput& input) {
        input = PlayerInput{};

        // Screen y grows downward; arena y grows upward.
        if (record->key_down(KEY_W)) input.move_input.y += 1.0f;
        if (record->key_down(KEY_S)) input.move_input.y -= 1.0f;
        if (record->key_down(KEY_A)) input.move_input.x -= 1.0f;
        if (record->key_down(KEY_D)) input.move_input.x += 1.0f;

        if (record->key_down(KEY_UP))    input.aim_input.y += 1.0f;
        if (record->key_down(KEY_DOWN))  input.aim_input.y -= 1.0f;
        if (record->key_down(KEY_LEFT))  input.aim_input.x -= 1.0f;
        if (record->key_down(KEY_RIGHT)) input.aim_input.x += 1.0f;

        input.fire = record->key_down(KEY_SPACE);
        input.dash = record->key_pressed(KEY_LEFT_SHIFT) || record->key_pressed(KEY_RIGHT_SHIFT);

        for (const auto& pad : record->pads) {
            const float lx = pad.axes[GAMEPAD_AXIS_LEFT_X];
            const float ly = pad.axes[GAMEPAD_AXIS_LEFT_Y];
            const float rx = pad.axes[GAMEPAD_AXIS_RIGHT_X];
            const float ry = pad.axes[GAMEPAD_AXIS_RIGHT_Y];

            if (std::abs(lx) > DEADZONE) input.move_input.x += lx;
            if (std::abs(ly) > DEADZONE) input.move_input.y -= ly;
            if (std::abs(rx) > DEADZONE) input.aim_input.x  += rx;
            if (std::abs(ry) > DEADZONE) input.aim_input.y  -= ry;

            if (pad.trigger(GAMEPAD_AXIS_RIGHT_TRIGGER) > 0.5f) input.fire = true;
            if (pad.buttons_pressed[GAMEPAD_BUTTON_RIGHT_FACE_RIGHT]) input.dash = true;
        }

        clamp_unit(input.move_input);
        clamp_unit(input.aim_input);
    });
}
