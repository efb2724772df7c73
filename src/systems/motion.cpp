#include "motion.hpp"
#include "../components.hpp"
#include "../config.hpp"
#include "../match_state.hpp"
#include <cmath>

using namespace ecs;

static bool motion_active(World& world) {
    auto* flow = world.try_resource<GameFlow>();
    if (!flow) return true;
    if (flow->paused) return false;
    return flow->state == GameState::Playing ||
           flow->state == GameState::DeathAnimation ||
           flow->state == GameState::LevelTransition;
}

static void integrate(LocalTransform& t, const Velocity& v, float dt) {
    t.position.x += v.linear.x * dt;
    t.position.y += v.linear.y * dt;
}

void MotionSystem::Update(World& world, float dt) {
    if (!motion_active(world)) return;

    float arena = 29.0f;
    if (auto* cfg = world.try_resource<BalanceConfig>()) arena = cfg->arena_radius;

    // Player: clamped to the arena disc.
    world.each<Player, Velocity, LocalTransform>(
        [&](Entity, Player& p, Velocity& v, LocalTransform& t) {
            if (!p.alive) return;
            integrate(t, v, dt);
            const float d = std::sqrt(t.position.x * t.position.x + t.position.y * t.position.y);
            if (d > arena) {
                t.position.x *= arena / d;
                t.position.y *= arena / d;
            }
        });

    // Enemies: bounce off the arena edge.
    world.each<Enemy, Velocity, LocalTransform>(
        [&](Entity, Enemy& e, Velocity& v, LocalTransform& t) {
            if (!e.alive) return;
            integrate(t, v, dt);
            const float d = std::sqrt(t.position.x * t.position.x + t.position.y * t.position.y);
            if (d <= arena || d < 0.001f) return;
            const float nx = t.position.x / d;
            const float ny = t.position.y / d;
            const float outward = v.linear.x * nx + v.linear.y * ny;
            if (outward > 0.0f) {
                v.linear.x -= 2.0f * outward * nx;
                v.linear.y -= 2.0f * outward * ny;
            }
        });

    // Projectiles: expire on lifetime or when well outside the arena.
    world.each<Projectile, Velocity, LocalTransform>(
        [&](Entity, Projectile& p, Velocity& v, LocalTransform& t) {
            if (!p.alive) return;
            integrate(t, v, dt);
            p.lifetime -= dt;
            const float d = std::sqrt(t.position.x * t.position.x + t.position.y * t.position.y);
            if (p.lifetime <= 0.0f || d > arena + 5.0f) p.alive = false;
        });
}
