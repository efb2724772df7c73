#pragma once
#include "actor_types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// BalanceConfig — every tunable number in the game, stored as a World resource.
//
// Defaults below are the shipped balance; ConfigLoader overlays whatever a
// JSON file provides (missing keys keep their default).
// No Raylib dependency — compilable in the headless test target.
// ---------------------------------------------------------------------------

struct PlayerConfig {
    int   max_health            = 130;
    float radius                = 0.5f;
    float speed                 = 7.0f;
    int   max_power_level       = 10;
    int   max_speed_level       = 20;
    float speed_per_level       = 0.05f;  // fractional boost per speed level
    float invulnerable_duration = 7.0f;
    float dash_speed            = 32.0f;
    float dash_duration         = 0.45f;
    float dash_cooldown         = 2.5f;
    int   xp_to_first_level     = 10;
    float xp_growth             = 1.3f;
    float fire_interval         = 0.12f;
    int   projectile_damage     = 12;
    float damage_per_power      = 0.6f;   // fractional damage boost per power level
    float projectile_speed      = 22.0f;
    float projectile_radius     = 0.2f;
    float projectile_range      = 38.0f;
};

struct ScoringConfig {
    int   max_multiplier    = 15;
    float kill_chain_window = 1.5f;
    float decay_time        = 2.0f;
    float combo_duration    = 3.0f;
    int   lost_threshold    = 3;      // reset from >= this is a "multiplier lost"
    std::vector<int> bonus_spawn_multipliers = {5, 8, 11};
};

struct LifecycleConfig {
    float death_animation_duration = 2.0f;
    float clearing_duration        = 3.0f;
    float display_duration         = 3.0f;
    float max_clear_stagger        = 1.0f;
};

struct PickupSpawnConfig {
    int   spawns_per_level = 2;
    float interval_min     = 20.0f;
    float interval_max     = 30.0f;
    float health_threshold = 1.0f; // spawns only while health/max < threshold
};

struct PickupConfig {
    std::array<PickupSpawnConfig, PICKUP_KIND_COUNT> spawners = {{
        {2, 30.0f, 45.0f, 1.0f},   // PowerUp
        {2, 25.0f, 35.0f, 1.0f},   // SpeedUp
        {3, 20.0f, 30.0f, 0.8f},   // MedPack
        {2, 20.0f, 30.0f, 1.0f},   // Shield
        {1, 60.0f, 90.0f, 1.0f},   // Invulnerable
    }};
    int   med_pack_heal       = 35;
    float radius              = 0.6f;
    float spawn_radius        = 28.0f;
    float min_player_distance = 5.0f;
    int   spawn_attempts      = 20;
};

struct LevelDef {
    std::string name;
    std::array<int, ENEMY_TYPE_COUNT>   objectives{};
    std::array<float, ENEMY_TYPE_COUNT> spawn_intervals{}; // seconds; 0 = never
    float duration = 0.0f; // 0 = objectives only
};

struct BalanceConfig {
    PlayerConfig    player;
    ScoringConfig   scoring;
    LifecycleConfig lifecycle;
    PickupConfig    pickups;
    EnemyTable      enemies = default_enemy_table();
    std::vector<LevelDef> levels = default_levels();

    float         arena_radius    = 29.0f;
    int           laser_damage    = 10;
    float         laser_length    = 20.0f;
    float         laser_thickness = 0.2f;
    std::uint32_t rng_seed     = 1337;
    std::string   log_level    = "info";

    static std::vector<LevelDef> default_levels();
};

// ---------------------------------------------------------------------------
// ConfigLoader — overlays JSON balance data onto a BalanceConfig.
//
// Returns false if the file cannot be opened, the JSON is malformed, or it
// names an unknown enemy / pickup type. On failure cfg is left untouched.
// ---------------------------------------------------------------------------

class ConfigLoader {
public:
    static bool load(const std::string& path, BalanceConfig& cfg);
    static bool load_from_string(const std::string& json, BalanceConfig& cfg);
};
