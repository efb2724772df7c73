#include "player.hpp"
#include "../math_util.hpp"
#include "../match_state.hpp"
#include <algorithm>
#include <cmath>

using namespace ecs;

bool PlayerSystem::is_invulnerable(const Player& p) {
    return is_dashing(p) || p.invulnerable_grant;
}

bool PlayerSystem::is_dashing(const Player& p) {
    return p.dash_timer > 0.0f;
}

int PlayerSystem::take_damage(Player& p, int amount) {
    if (!p.alive || amount <= 0) return 0;
    if (p.invulnerable_grant) return 0; // shield is kept

    if (p.shield) {
        p.shield = false;
        return 0;
    }

    const int before = p.health;
    p.health = std::max(0, p.health - amount);
    if (p.health == 0) p.alive = false;
    return before - p.health;
}

void PlayerSystem::heal(Player& p, int amount) {
    if (!p.alive || amount <= 0) return;
    p.health = std::min(p.max_health, p.health + amount);
}

bool PlayerSystem::collect_power_up(Player& p) {
    if (p.power_level >= p.max_power_level) return false;
    p.power_level++;
    return true;
}

bool PlayerSystem::collect_speed_up(Player& p) {
    if (p.speed_level >= p.max_speed_level) return false;
    p.speed_level++;
    return true;
}

bool PlayerSystem::collect_shield(Player& p) {
    if (!p.shield) p.shield = true;
    return true;
}

bool PlayerSystem::collect_invulnerable(Player& p) {
    p.invulnerable_grant = true;
    p.invulnerable_timer = p.invulnerable_duration;
    return true;
}

void PlayerSystem::clear_invulnerable(Player& p) {
    p.invulnerable_grant = false;
    p.invulnerable_timer = 0.0f;
}

int PlayerSystem::add_xp(Player& p, int amount, float growth) {
    if (amount <= 0) return 0;
    p.xp += amount;

    int gained = 0;
    while (p.xp_to_next > 0 && p.xp >= p.xp_to_next) {
        p.xp -= p.xp_to_next;
        p.level++;
        p.xp_to_next = static_cast<int>(std::floor(p.xp_to_next * growth));
        gained++;
    }
    return gained;
}

void PlayerSystem::tick_timers(Player& p, float dt) {
    if (p.invulnerable_grant) {
        p.invulnerable_timer -= dt;
        if (p.invulnerable_timer <= 0.0f) clear_invulnerable(p);
    }
    p.dash_timer    = std::max(0.0f, p.dash_timer - dt);
    p.dash_cooldown = std::max(0.0f, p.dash_cooldown - dt);
    p.fire_cooldown = std::max(0.0f, p.fire_cooldown - dt);
}

float PlayerSystem::move_speed(const Player& p, const PlayerConfig& cfg) {
    return cfg.speed * (1.0f + cfg.speed_per_level * static_cast<float>(p.speed_level));
}

int PlayerSystem::projectile_damage(const Player& p, const PlayerConfig& cfg) {
    const float scale = 1.0f + cfg.damage_per_power * static_cast<float>(p.power_level);
    return static_cast<int>(std::round(cfg.projectile_damage * scale));
}

void PlayerSystem::Update(World& world, float dt) {
    if (!gameplay_active(world)) return;
    auto* cfg = world.try_resource<BalanceConfig>();
    if (!cfg) return;

    world.each<Player, PlayerInput, Velocity>(
        [&](Entity, Player& p, PlayerInput& input, Velocity& vel) {
            tick_timers(p, dt);
            if (!p.alive) {
                vel.linear = {0, 0, 0};
                return;
            }

            const Vec2 move = engine::math::normalize_2d(input.move_input);
            const Vec2 aim  = engine::math::normalize_2d(input.aim_input);
            const bool moving = (move.x != 0.0f || move.y != 0.0f);

            if (aim.x != 0.0f || aim.y != 0.0f) p.aim = aim;
            else if (moving)                    p.aim = move;

            if (input.dash && moving && p.dash_cooldown <= 0.0f) {
                p.dash_timer    = cfg->player.dash_duration;
                p.dash_cooldown = cfg->player.dash_cooldown;
                p.dash_dir      = move;
            }

            if (p.dash_timer > 0.0f) {
                const float s = cfg->player.dash_speed;
                vel.linear = {p.dash_dir.x * s, p.dash_dir.y * s, 0};
            } else {
                const float s = move_speed(p, cfg->player);
                vel.linear = {move.x * s, move.y * s, 0};
            }
        });
}
