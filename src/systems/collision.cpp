#include "collision.hpp"
#include "enemy.hpp"
#include "player.hpp"
#include "../config.hpp"
#include "../events.hpp"
#include "../match_state.hpp"
#include "../math_util.hpp"
#include <array>
#include <vector>

using namespace ecs;

static constexpr float SHAKE_CONTACT    = 0.5f;
static constexpr float SHAKE_PROJECTILE = 0.3f;
static constexpr float SHAKE_LASER      = 0.4f;

static constexpr std::array<PickupKind, PICKUP_KIND_COUNT> PICKUP_ORDER = {
    PickupKind::PowerUp, PickupKind::SpeedUp, PickupKind::MedPack,
    PickupKind::Shield,  PickupKind::Invulnerable,
};

bool CollisionSystem::overlaps(const Vec3& a, float ra, const Vec3& b, float rb) {
    return engine::math::circles_overlap(a, ra, b, rb);
}

CollisionSystem::BeamHit CollisionSystem::check_laser_hit(const LaserBeam& beam,
                                                          const Vec3& origin,
                                                          const Vec3& player_pos,
                                                          float player_radius) {
    if (!beam.firing) return {};

    const auto proj = engine::math::project_onto_ray(origin, beam.direction, player_pos);
    if (proj.along < 0.0f || proj.along > beam.length) return {};
    if (proj.off < player_radius + beam.thickness) return {true, beam.damage};
    return {};
}

bool CollisionSystem::try_collect(Player& p, const Pickup& pickup) {
    switch (pickup.kind) {
        case PickupKind::PowerUp:      return PlayerSystem::collect_power_up(p);
        case PickupKind::SpeedUp:      return PlayerSystem::collect_speed_up(p);
        case PickupKind::MedPack:      PlayerSystem::heal(p, pickup.heal_amount); return true;
        case PickupKind::Shield:       return PlayerSystem::collect_shield(p);
        case PickupKind::Invulnerable: return PlayerSystem::collect_invulnerable(p);
    }
    return false;
}

// ---------------------------------------------------------------------------
// Frame resolution
// ---------------------------------------------------------------------------

namespace {

struct PlayerRef {
    Player*     player = nullptr;
    Vec3        position = {0, 0, 0};
    float       radius = 0.0f;
};

void hit_player(World& world, PlayerRef& pr, DamageSource source, int damage, float shake) {
    const bool had_shield = pr.player->shield;
    const int  lost = PlayerSystem::take_damage(*pr.player, damage);
    emit(world, PlayerHitEvent{source, damage, lost, had_shield && !pr.player->shield, shake});
}

} // namespace

void CollisionSystem::Update(World& world, float /*dt*/) {
    if (!gameplay_active(world)) return;

    auto* cfg = world.try_resource<BalanceConfig>();
    const EnemyTable& table = cfg ? cfg->enemies : default_enemy_table();

    // --- Snapshots ---
    PlayerRef pr;
    world.each<Player, LocalTransform, CircleCollider>(
        [&](Entity, Player& p, LocalTransform& t, CircleCollider& c) {
            pr.player   = &p;
            pr.position = t.position;
            pr.radius   = c.radius;
        });

    std::vector<Entity> enemies;
    world.each<Enemy, LocalTransform, CircleCollider>(
        [&](Entity e, Enemy&, LocalTransform&, CircleCollider&) { enemies.push_back(e); });

    std::vector<Entity> player_shots;
    std::vector<Entity> enemy_shots;
    world.each<Projectile, LocalTransform, CircleCollider>(
        [&](Entity e, Projectile& p, LocalTransform&, CircleCollider&) {
            (p.owner == ProjectileOwner::Player ? player_shots : enemy_shots).push_back(e);
        });

    std::vector<Entity> beams;
    world.each<Enemy, LaserBeam, LocalTransform>(
        [&](Entity e, Enemy&, LaserBeam&, LocalTransform&) { beams.push_back(e); });

    std::vector<Entity> pickups;
    world.each<Pickup, LocalTransform, CircleCollider>(
        [&](Entity e, Pickup&, LocalTransform&, CircleCollider&) { pickups.push_back(e); });

    auto player_alive = [&]() { return pr.player && pr.player->alive; };
    const bool gated = !player_alive() || PlayerSystem::is_dashing(*pr.player);

    // 1. Player ↔ Enemy
    if (!gated) {
        for (auto e : enemies) {
            if (!player_alive()) break;
            auto* en = world.try_get<Enemy>(e);
            if (!en || !en->alive) continue;
            const auto& t = *world.try_get<LocalTransform>(e);
            const auto& c = *world.try_get<CircleCollider>(e);
            if (!overlaps(pr.position, pr.radius, t.position, c.radius)) continue;

            hit_player(world, pr, DamageSource::EnemyContact, en->damage, SHAKE_CONTACT);
            if (EnemySystem::force_kill(*en, table[index_of(en->type)].death_duration)) {
                emit(world, EnemyDestroyedEvent{e, en->type, t.position, RemovalCause::PlayerCollision});
            }
        }
    }

    // 2. Enemy projectile → Player
    if (!gated) {
        for (auto e : enemy_shots) {
            if (!player_alive()) break;
            auto* p = world.try_get<Projectile>(e);
            if (!p || !p->alive) continue;
            const auto& t = *world.try_get<LocalTransform>(e);
            const auto& c = *world.try_get<CircleCollider>(e);
            if (!overlaps(pr.position, pr.radius, t.position, c.radius)) continue;

            hit_player(world, pr, DamageSource::EnemyProjectile, p->damage, SHAKE_PROJECTILE);
            p->alive = false;
        }
    }

    // 3. Laser beams → Player
    if (!gated) {
        for (auto e : beams) {
            if (!player_alive()) break;
            auto* en = world.try_get<Enemy>(e);
            auto* beam = world.try_get<LaserBeam>(e);
            if (!en || !beam || !en->alive || beam->hit_this_burst) continue;
            const auto hit = check_laser_hit(*beam, world.try_get<LocalTransform>(e)->position,
                                             pr.position, pr.radius);
            if (!hit.hit) continue;

            beam->hit_this_burst = true;
            hit_player(world, pr, DamageSource::Laser, hit.damage, SHAKE_LASER);
        }
    }

    // 4. Player projectile → Enemy (first hit wins)
    for (auto s : player_shots) {
        auto* p = world.try_get<Projectile>(s);
        if (!p || !p->alive) continue;
        const auto& st = *world.try_get<LocalTransform>(s);
        const auto& sc = *world.try_get<CircleCollider>(s);

        for (auto e : enemies) {
            auto* en = world.try_get<Enemy>(e);
            if (!en || !en->alive) continue;
            const auto& t = *world.try_get<LocalTransform>(e);
            const auto& c = *world.try_get<CircleCollider>(e);
            if (!overlaps(st.position, sc.radius, t.position, c.radius)) continue;

            EnemySystem::take_damage(*en, p->damage, table[index_of(en->type)].death_duration);
            p->alive = false;

            if (EnemySystem::should_track_kill(*en)) {
                EnemySystem::mark_kill_tracked(*en);
                emit(world, KillCredit{e, en->type, t.position, en->xp_value});
            }
            break;
        }
    }

    // 5. Player ↔ Pickup, one pass per kind
    if (!player_alive()) return;
    for (PickupKind kind : PICKUP_ORDER) {
        for (auto e : pickups) {
            auto* pk = world.try_get<Pickup>(e);
            if (!pk || !pk->alive || pk->kind != kind) continue;
            const auto& t = *world.try_get<LocalTransform>(e);
            const auto& c = *world.try_get<CircleCollider>(e);
            if (!overlaps(pr.position, pr.radius, t.position, c.radius)) {
                pk->touching = false;
                continue;
            }

            if (try_collect(*pr.player, *pk)) {
                pk->alive = false;
                emit(world, PickupCollectedEvent{kind, t.position});
            } else if (!pk->touching) {
                emit(world, PickupRejectedEvent{kind});
            }
            pk->touching = true;
        }
    }
}
