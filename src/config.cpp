#include "config.hpp"
#include <nlohmann/json.hpp>
#include <raylib.h>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Built-in level table
// ---------------------------------------------------------------------------

namespace {

// Objective / spawn-interval columns are ordered by EnemyType:
// DataMite, ScanDrone, ChaosWorm, VoidSphere, CrystalShardSwarm, Fizzer, UFO, Boss
LevelDef make_level(const char* name,
                    std::array<int, ENEMY_TYPE_COUNT> objectives,
                    std::array<float, ENEMY_TYPE_COUNT> intervals) {
    LevelDef def;
    def.name            = name;
    def.objectives      = objectives;
    def.spawn_intervals = intervals;
    return def;
}

} // namespace

std::vector<LevelDef> BalanceConfig::default_levels() {
    // Fizzers never spawn on a timer; they come from multiplier milestones.
    return {
        make_level("NEURAL INITIALIZATION", { 5,  1, 0, 0, 0, 1, 0, 0},
                   {1.5f, 8.0f,  0.0f,  0.0f,  0.0f, 0,  0.0f,  0.0f}),
        make_level("SYSTEM BREACH",         { 0,  0, 0, 0, 0, 0, 0, 1},
                   {1.2f, 5.0f,  0.0f, 15.0f,  0.0f, 0,  0.0f, 30.0f}),
        make_level("CHAOS CORRUPTION",      { 0,  0, 2, 0, 1, 0, 1, 0},
                   {1.0f, 4.0f, 30.0f,  0.0f,  0.0f, 0, 10.0f,  0.0f}),
        make_level("CRYSTALLINE MATRIX",    {10,  1, 1, 1, 1, 0, 1, 0},
                   {0.9f, 3.5f, 25.0f, 35.0f, 40.0f, 0, 30.0f,  0.0f}),
        make_level("VOID EMERGENCE",        {10,  0, 3, 1, 2, 0, 0, 0},
                   {0.8f, 3.0f, 20.0f, 60.0f, 35.0f, 0,  0.0f,  0.0f}),
        make_level("ALIEN INCURSION",       { 0, 10, 1, 1, 3, 0, 3, 0},
                   {0.7f, 2.5f, 18.0f, 50.0f, 30.0f, 0, 25.0f,  0.0f}),
        make_level("NEURAL OVERLOAD",       {45, 20, 4, 2, 3, 2, 4, 0},
                   {0.6f, 2.0f, 15.0f, 40.0f, 25.0f, 0, 20.0f,  0.0f}),
        make_level("DREADNOUGHT ASSAULT",   {50, 22, 4, 2, 4, 2, 5, 1},
                   {0.5f, 1.8f, 12.0f, 35.0f, 22.0f, 0, 18.0f, 90.0f}),
        make_level("DIGITAL APOCALYPSE",    {60, 25, 5, 3, 4, 3, 6, 2},
                   {0.4f, 1.5f, 10.0f, 30.0f, 20.0f, 0, 15.0f, 60.0f}),
        make_level("NEURAL BREAK",          {75, 30, 6, 4, 5, 4, 8, 3},
                   {0.3f, 1.2f,  8.0f, 25.0f, 18.0f, 0, 12.0f, 45.0f}),
    };
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

template<typename T>
static void read_key(const json& j, const char* key, T& out) {
    if (j.contains(key)) out = j.at(key).get<T>();
}

static EnemyType parse_enemy_key(const std::string& s) {
    if (auto t = parse_enemy_type(s)) return *t;
    throw std::runtime_error("ConfigLoader: unknown enemy type '" + s + "'");
}

static PickupKind parse_pickup_key(const std::string& s) {
    if (auto k = parse_pickup_kind(s)) return *k;
    throw std::runtime_error("ConfigLoader: unknown pickup kind '" + s + "'");
}

static void parse_player(const json& j, PlayerConfig& p) {
    read_key(j, "max_health",            p.max_health);
    read_key(j, "radius",                p.radius);
    read_key(j, "speed",                 p.speed);
    read_key(j, "max_power_level",       p.max_power_level);
    read_key(j, "max_speed_level",       p.max_speed_level);
    read_key(j, "speed_per_level",       p.speed_per_level);
    read_key(j, "invulnerable_duration", p.invulnerable_duration);
    read_key(j, "dash_speed",            p.dash_speed);
    read_key(j, "dash_duration",         p.dash_duration);
    read_key(j, "dash_cooldown",         p.dash_cooldown);
    read_key(j, "xp_to_first_level",     p.xp_to_first_level);
    read_key(j, "xp_growth",             p.xp_growth);
    read_key(j, "fire_interval",         p.fire_interval);
    read_key(j, "projectile_damage",     p.projectile_damage);
    read_key(j, "damage_per_power",      p.damage_per_power);
    read_key(j, "projectile_speed",      p.projectile_speed);
    read_key(j, "projectile_radius",     p.projectile_radius);
    read_key(j, "projectile_range",      p.projectile_range);
}

static void parse_scoring(const json& j, ScoringConfig& s) {
    read_key(j, "max_multiplier",          s.max_multiplier);
    read_key(j, "kill_chain_window",       s.kill_chain_window);
    read_key(j, "decay_time",              s.decay_time);
    read_key(j, "combo_duration",          s.combo_duration);
    read_key(j, "lost_threshold",          s.lost_threshold);
    read_key(j, "bonus_spawn_multipliers", s.bonus_spawn_multipliers);
}

static void parse_lifecycle(const json& j, LifecycleConfig& l) {
    read_key(j, "death_animation_duration", l.death_animation_duration);
    read_key(j, "clearing_duration",        l.clearing_duration);
    read_key(j, "display_duration",         l.display_duration);
    read_key(j, "max_clear_stagger",        l.max_clear_stagger);
}

static void parse_pickups(const json& j, PickupConfig& p) {
    read_key(j, "med_pack_heal",       p.med_pack_heal);
    read_key(j, "radius",              p.radius);
    read_key(j, "spawn_radius",        p.spawn_radius);
    read_key(j, "min_player_distance", p.min_player_distance);
    read_key(j, "spawn_attempts",      p.spawn_attempts);

    if (j.contains("spawners")) {
        for (const auto& [name, sj] : j.at("spawners").items()) {
            auto& s = p.spawners[index_of(parse_pickup_key(name))];
            read_key(sj, "spawns_per_level", s.spawns_per_level);
            read_key(sj, "interval_min",     s.interval_min);
            read_key(sj, "interval_max",     s.interval_max);
            read_key(sj, "health_threshold", s.health_threshold);
            if (s.interval_max < s.interval_min)
                throw std::runtime_error("ConfigLoader: interval_max < interval_min for '" + name + "'");
        }
    }
}

static void parse_enemies(const json& j, EnemyTable& table) {
    for (const auto& [name, ej] : j.items()) {
        auto& e = table[index_of(parse_enemy_key(name))];
        read_key(ej, "base_points",    e.base_points);
        read_key(ej, "health",         e.health);
        read_key(ej, "damage",         e.damage);
        read_key(ej, "xp_value",       e.xp_value);
        read_key(ej, "radius",         e.radius);
        read_key(ej, "death_duration", e.death_duration);
        read_key(ej, "speed",          e.speed);
        read_key(ej, "fire_interval",  e.fire_interval);
        read_key(ej, "bullet_damage",  e.bullet_damage);
        read_key(ej, "bullet_speed",   e.bullet_speed);
    }
}

static LevelDef parse_level(const json& j) {
    LevelDef def;
    def.name     = j.value("name", std::string("UNNAMED"));
    def.duration = j.value("duration", 0.0f);
    if (j.contains("objectives")) {
        for (const auto& [name, count] : j.at("objectives").items())
            def.objectives[index_of(parse_enemy_key(name))] = count.get<int>();
    }
    if (j.contains("spawn_intervals")) {
        for (const auto& [name, secs] : j.at("spawn_intervals").items())
            def.spawn_intervals[index_of(parse_enemy_key(name))] = secs.get<float>();
    }
    return def;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool ConfigLoader::load_from_string(const std::string& json_str, BalanceConfig& cfg) {
    try {
        const json root = json::parse(json_str);
        BalanceConfig out = cfg;

        if (root.contains("player"))    parse_player(root.at("player"), out.player);
        if (root.contains("scoring"))   parse_scoring(root.at("scoring"), out.scoring);
        if (root.contains("lifecycle")) parse_lifecycle(root.at("lifecycle"), out.lifecycle);
        if (root.contains("pickups"))   parse_pickups(root.at("pickups"), out.pickups);
        if (root.contains("enemies"))   parse_enemies(root.at("enemies"), out.enemies);

        if (root.contains("levels")) {
            std::vector<LevelDef> levels;
            for (const auto& lj : root.at("levels")) levels.push_back(parse_level(lj));
            if (levels.empty())
                throw std::runtime_error("ConfigLoader: 'levels' must not be empty");
            out.levels = std::move(levels);
        }

        read_key(root, "arena_radius", out.arena_radius);
        read_key(root, "rng_seed",     out.rng_seed);
        read_key(root, "log_level",    out.log_level);
        if (root.contains("laser")) {
            const auto& lj = root.at("laser");
            read_key(lj, "damage",    out.laser_damage);
            read_key(lj, "length",    out.laser_length);
            read_key(lj, "thickness", out.laser_thickness);
        }

        cfg = std::move(out);
        return true;
    } catch (const std::exception& e) {
        TraceLog(LOG_WARNING, "CONFIG: rejected balance data: %s", e.what());
        return false;
    }
}

bool ConfigLoader::load(const std::string& path, BalanceConfig& cfg) {
    std::ifstream file(path);
    if (!file.is_open()) {
        TraceLog(LOG_WARNING, "CONFIG: cannot open %s, using defaults", path.c_str());
        return false;
    }
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(content, cfg);
}
