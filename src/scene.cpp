#include "scene.hpp"
#include "actor_factory.hpp"
#include "components.hpp"
#include "config.hpp"
#include <ecs/modules/transform.hpp>
#include <nlohmann/json.hpp>
#include <raylib.h>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static ecs::Vec3 parse_vec3(const json& j) {
    // [x, y] is accepted for the planar arena; z defaults to 0
    const float z = j.size() > 2 ? j[2].get<float>() : 0.0f;
    return {j.at(0).get<float>(), j.at(1).get<float>(), z};
}

static EnemyType parse_enemy(const std::string& s) {
    if (auto t = parse_enemy_type(s)) return *t;
    throw std::runtime_error("SceneLoader: unknown enemy type '" + s + "'");
}

static PickupKind parse_pickup(const std::string& s) {
    if (auto k = parse_pickup_kind(s)) return *k;
    throw std::runtime_error("SceneLoader: unknown pickup kind '" + s + "'");
}

static ProjectileOwner parse_owner(const std::string& s) {
    if (s == "Player") return ProjectileOwner::Player;
    if (s == "Enemy")  return ProjectileOwner::Enemy;
    throw std::runtime_error("SceneLoader: unknown projectile owner '" + s + "'");
}

// ---------------------------------------------------------------------------
// Actor specs (parsed fully before anything is spawned)
// ---------------------------------------------------------------------------

namespace {

enum class ActorKind { Player, Enemy, Projectile, Pickup };

struct ActorSpec {
    ActorKind  kind     = ActorKind::Enemy;
    ecs::Vec3  position = {0, 0, 0};
    ecs::Vec3  velocity = {0, 0, 0};
    json       body;
};

ActorSpec parse_entity(const json& e) {
    ActorSpec spec;
    if (e.contains("transform") && e["transform"].contains("position")) {
        spec.position = parse_vec3(e["transform"]["position"]);
    }
    if (e.contains("velocity")) spec.velocity = parse_vec3(e["velocity"]);

    int kinds = 0;
    if (e.contains("player"))     { spec.kind = ActorKind::Player;     spec.body = e["player"];     kinds++; }
    if (e.contains("enemy"))      { spec.kind = ActorKind::Enemy;      spec.body = e["enemy"];      kinds++; }
    if (e.contains("projectile")) { spec.kind = ActorKind::Projectile; spec.body = e["projectile"]; kinds++; }
    if (e.contains("pickup"))     { spec.kind = ActorKind::Pickup;     spec.body = e["pickup"];     kinds++; }
    if (kinds != 1) throw std::runtime_error("SceneLoader: entity must have exactly one actor block");

    // Validate type names now so a bad file spawns nothing.
    if (spec.kind == ActorKind::Enemy)      parse_enemy(spec.body.at("type").get<std::string>());
    if (spec.kind == ActorKind::Pickup)     parse_pickup(spec.body.at("type").get<std::string>());
    if (spec.kind == ActorKind::Projectile) parse_owner(spec.body.value("owner", std::string("Player")));
    return spec;
}

void spawn(ecs::World& world, const BalanceConfig& cfg, const ActorSpec& spec) {
    const json& b = spec.body;
    switch (spec.kind) {
        case ActorKind::Player: {
            auto e = ActorFactory::spawn_player(world, cfg, spec.position);
            auto& p = *world.try_get<Player>(e);
            p.health      = b.value("health", p.health);
            p.power_level = b.value("power_level", p.power_level);
            p.speed_level = b.value("speed_level", p.speed_level);
            p.shield      = b.value("shield", p.shield);
            if (b.value("invulnerable", false)) {
                p.invulnerable_grant = true;
                p.invulnerable_timer = p.invulnerable_duration;
            }
            break;
        }
        case ActorKind::Enemy: {
            const EnemyType type = parse_enemy(b.at("type").get<std::string>());
            auto e = ActorFactory::spawn_enemy(world, cfg, type, spec.position, spec.velocity);
            auto& en = *world.try_get<Enemy>(e);
            en.health = b.value("health", en.health);
            en.damage = b.value("damage", en.damage);
            break;
        }
        case ActorKind::Projectile: {
            ActorFactory::spawn_projectile(world,
                parse_owner(b.value("owner", std::string("Player"))),
                spec.position, spec.velocity,
                b.value("damage",   cfg.player.projectile_damage),
                b.value("radius",   cfg.player.projectile_radius),
                b.value("lifetime", 2.0f));
            break;
        }
        case ActorKind::Pickup: {
            ActorFactory::spawn_pickup(world, cfg, parse_pickup(b.at("type").get<std::string>()),
                                       spec.position);
            break;
        }
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool SceneLoader::load_from_string(ecs::World& world, const std::string& json_str) {
    std::vector<ActorSpec> specs;
    try {
        json scene = json::parse(json_str);
        for (const auto& entity_json : scene.at("entities")) {
            specs.push_back(parse_entity(entity_json));
        }
    } catch (const std::exception& e) {
        TraceLog(LOG_WARNING, "SCENE: rejected scene: %s", e.what());
        return false;
    }

    const BalanceConfig defaults;
    const auto* cfg = world.try_resource<BalanceConfig>();
    for (const auto& spec : specs) spawn(world, cfg ? *cfg : defaults, spec);
    return true;
}

bool SceneLoader::load(ecs::World& world, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        TraceLog(LOG_WARNING, "SCENE: cannot open %s", path.c_str());
        return false;
    }
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(world, content);
}

void SceneLoader::unload(ecs::World& world) {
    std::vector<ecs::Entity> to_destroy;
    world.each<ArenaTag>([&](ecs::Entity e, ArenaTag&) { to_destroy.push_back(e); });
    for (auto e : to_destroy) world.destroy(e);
    world.deferred().flush(world);
}
