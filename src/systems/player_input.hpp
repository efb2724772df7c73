#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// PlayerInputSystem — Pre-Update; maps the InputRecord onto the player's
// PlayerInput component and the MatchInput resource.
//
//   WASD / left stick      move
//   arrows / right stick   aim
//   Space / right trigger  fire
//   Shift / east button    dash
//   P / Start              pause
//   Enter / south button   confirm (start and game-over screens)
// ---------------------------------------------------------------------------

class PlayerInputSystem {
public:
    static void Update(ecs::World& world);
};
