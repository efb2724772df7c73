#include "weapons.hpp"
#include "player.hpp"
#include "../actor_factory.hpp"
#include "../config.hpp"
#include "../events.hpp"
#include "../match_state.hpp"
#include <cmath>
#include <vector>

using namespace ecs;

static constexpr float ENEMY_BULLET_RADIUS   = 0.25f;
static constexpr float ENEMY_BULLET_LIFETIME = 5.0f;

namespace {

struct ShotRequest {
    ProjectileOwner owner;
    Vec3  position;
    Vec3  velocity;
    int   damage;
    float radius;
    float lifetime;
};

Vec3 direction_to(const Vec3& from, const Vec3& to) {
    const float dx = to.x - from.x;
    const float dy = to.y - from.y;
    const float len = std::sqrt(dx * dx + dy * dy);
    if (len < 0.001f) return {0, 0, 0};
    return {dx / len, dy / len, 0};
}

} // namespace

void WeaponSystem::cycle_laser(LaserBeam& beam, float dt, const Vec3& to_player) {
    beam.cycle_timer += dt;
    if (!beam.firing) {
        if (beam.cycle_timer >= beam.charge_time) {
            beam.firing         = true;
            beam.cycle_timer    = 0.0f;
            beam.hit_this_burst = false;
            if (to_player.x != 0.0f || to_player.y != 0.0f) beam.direction = to_player;
        }
    } else if (beam.cycle_timer >= beam.fire_time) {
        beam.firing      = false;
        beam.cycle_timer = 0.0f;
    }
}

void WeaponSystem::Update(World& world, float dt) {
    if (!gameplay_active(world)) return;
    auto* cfg = world.try_resource<BalanceConfig>();
    if (!cfg) return;

    std::vector<ShotRequest> shots;
    Vec3 player_pos = {0, 0, 0};
    bool have_player = false;

    // 1. Player weapon
    world.each<Player, PlayerInput, LocalTransform, CircleCollider>(
        [&](Entity, Player& p, PlayerInput& input, LocalTransform& t, CircleCollider& c) {
            if (!p.alive) return;
            player_pos  = t.position;
            have_player = true;

            if (!input.fire || p.fire_cooldown > 0.0f) return;
            p.fire_cooldown = cfg->player.fire_interval;

            const auto& pc = cfg->player;
            const float offset = c.radius + pc.projectile_radius;
            shots.push_back({
                ProjectileOwner::Player,
                {t.position.x + p.aim.x * offset, t.position.y + p.aim.y * offset, 0},
                {p.aim.x * pc.projectile_speed, p.aim.y * pc.projectile_speed, 0},
                PlayerSystem::projectile_damage(p, pc),
                pc.projectile_radius,
                pc.projectile_range / pc.projectile_speed,
            });
        });

    if (!have_player) return;

    // 2. Enemy bullets
    world.each<Enemy, LocalTransform>([&](Entity, Enemy& e, LocalTransform& t) {
        if (!e.alive) return;
        const EnemyStats& stats = cfg->enemies[index_of(e.type)];
        if (stats.fire_interval <= 0.0f || stats.bullet_speed <= 0.0f) return;

        e.fire_timer -= dt;
        if (e.fire_timer > 0.0f) return;
        e.fire_timer = stats.fire_interval;

        const Vec3 dir = direction_to(t.position, player_pos);
        if (dir.x == 0.0f && dir.y == 0.0f) return;
        shots.push_back({
            ProjectileOwner::Enemy,
            t.position,
            {dir.x * stats.bullet_speed, dir.y * stats.bullet_speed, 0},
            stats.bullet_damage,
            ENEMY_BULLET_RADIUS,
            ENEMY_BULLET_LIFETIME,
        });
    });

    // 3. Laser beams
    world.each<Enemy, LaserBeam, LocalTransform>(
        [&](Entity, Enemy& e, LaserBeam& beam, LocalTransform& t) {
            if (!e.alive) {
                beam.firing = false;
                return;
            }
            cycle_laser(beam, dt, direction_to(t.position, player_pos));
        });

    for (const auto& s : shots) {
        ActorFactory::spawn_projectile(world, s.owner, s.position, s.velocity,
                                       s.damage, s.radius, s.lifetime);
        emit(world, ShotFiredEvent{s.owner});
    }
}
