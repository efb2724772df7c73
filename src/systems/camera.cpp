#include "camera.hpp"
#include "../components.hpp"
#include "../events.hpp"
#include "../match_state.hpp"
#include <algorithm>
#include <cmath>

using namespace ecs;

static constexpr float DEATH_SHAKE  = 1.0f;
static constexpr float FOLLOW_RATE  = 6.0f;

void CameraSystem::add_trauma(float& trauma, float amount) {
    trauma = std::clamp(trauma + amount, 0.0f, 1.0f);
}

void CameraSystem::Update(World& world, float dt) {
    auto* cam = world.try_resource<MainCamera>();
    if (!cam) return;

    if (const auto* hits = world.try_resource<Events<PlayerHitEvent>>()) {
        for (const auto& ev : hits->read()) add_trauma(cam->trauma, ev.shake);
    }
    if (const auto* changes = world.try_resource<Events<StateChangedEvent>>()) {
        for (const auto& ev : changes->read()) {
            if (ev.to == GameState::DeathAnimation) add_trauma(cam->trauma, DEATH_SHAKE);
        }
    }

    // Follow
    world.each<Player, LocalTransform>([&](Entity, Player&, LocalTransform& t) {
        const float k = std::clamp(FOLLOW_RATE * dt, 0.0f, 1.0f);
        cam->lerp_target.x += (t.position.x - cam->lerp_target.x) * k;
        cam->lerp_target.y += (t.position.y - cam->lerp_target.y) * k;
    });

    // Shake: squared trauma, two detuned sines per axis.
    cam->shake_time += dt;
    const float s = cam->trauma * cam->trauma * MAX_OFFSET;
    const float t = cam->shake_time;
    cam->shake_offset.x = s * (std::sin(t * 47.0f) * 0.6f + std::sin(t * 83.0f) * 0.4f);
    cam->shake_offset.y = s * (std::sin(t * 53.0f) * 0.6f + std::sin(t * 71.0f) * 0.4f);
    cam->trauma = std::max(0.0f, cam->trauma - TRAUMA_DECAY * dt);
}
