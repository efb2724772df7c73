#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

// ---------------------------------------------------------------------------
// Actor type enumerations and the per-type enemy balance table.
//
// Every per-type decision (kill points, death sound, objective slot, spawn
// interval) is a lookup keyed by these enums. No engine dependencies.
// ---------------------------------------------------------------------------

enum class EnemyType : uint8_t {
    DataMite,
    ScanDrone,
    ChaosWorm,
    VoidSphere,
    CrystalShardSwarm,
    Fizzer,
    UFO,
    Boss,
};
inline constexpr std::size_t ENEMY_TYPE_COUNT = 8;

enum class PickupKind : uint8_t {
    PowerUp,
    SpeedUp,
    MedPack,
    Shield,
    Invulnerable,
};
inline constexpr std::size_t PICKUP_KIND_COUNT = 5;

constexpr std::size_t index_of(EnemyType t)  { return static_cast<std::size_t>(t); }
constexpr std::size_t index_of(PickupKind k) { return static_cast<std::size_t>(k); }

struct EnemyStats {
    int   base_points    = 100;
    int   health         = 1;
    int   damage         = 5;    // collision damage dealt to the player
    int   xp_value       = 1;
    float radius         = 0.5f;
    float death_duration = 0.0f; // corpse persistence after death, seconds
    float speed          = 1.5f;
    float fire_interval  = 0.0f; // 0 = never fires
    int   bullet_damage  = 0;
    float bullet_speed   = 0.0f;
};

using EnemyTable = std::array<EnemyStats, ENEMY_TYPE_COUNT>;

const EnemyTable& default_enemy_table();

const char* enemy_type_name(EnemyType type);
std::optional<EnemyType> parse_enemy_type(std::string_view name);

const char* pickup_kind_name(PickupKind kind);
std::optional<PickupKind> parse_pickup_kind(std::string_view name);
