#include "actor_types.hpp"

namespace {

constexpr const char* ENEMY_NAMES[ENEMY_TYPE_COUNT] = {
    "DataMite", "ScanDrone", "ChaosWorm", "VoidSphere",
    "CrystalShardSwarm", "Fizzer", "UFO", "Boss",
};

constexpr const char* PICKUP_NAMES[PICKUP_KIND_COUNT] = {
    "PowerUp", "SpeedUp", "MedPack", "Shield", "Invulnerable",
};

// Ordered by EnemyType.
//   points  hp  dmg  xp   radius  death  speed  fire  bdmg  bspeed
const EnemyTable DEFAULT_TABLE = {{
    { 100,    1,   5,   1, 0.42f, 0.0f, 1.5f, 0.0f,  0, 0.0f},  // DataMite
    { 250,    3,   8,   5, 1.10f, 0.0f, 1.2f, 3.0f, 10, 6.0f},  // ScanDrone
    { 500,  100,  15,  35, 2.50f, 2.0f, 1.5f, 0.0f,  0, 0.0f},  // ChaosWorm
    {1000,  150,  30,  50, 3.20f, 0.0f, 0.5f, 4.0f, 15, 5.0f},  // VoidSphere
    { 750,   80,  25,  45, 4.50f, 0.0f, 1.4f, 3.5f, 10, 8.0f},  // CrystalShardSwarm
    { 200,    2,   6,  15, 0.35f, 0.0f, 6.0f, 3.5f,  6, 9.0f},  // Fizzer
    {1500,   30,  12,  25, 1.20f, 0.0f, 2.8f, 2.0f, 14, 8.0f},  // UFO
    {5000,  180,  25, 100, 4.00f, 2.5f, 0.3f, 1.5f, 18, 6.5f},  // Boss
}};

} // namespace

const EnemyTable& default_enemy_table() {
    return DEFAULT_TABLE;
}

const char* enemy_type_name(EnemyType type) {
    const auto i = index_of(type);
    return i < ENEMY_TYPE_COUNT ? ENEMY_NAMES[i] : "Unknown";
}

std::optional<EnemyType> parse_enemy_type(std::string_view name) {
    for (std::size_t i = 0; i < ENEMY_TYPE_COUNT; ++i) {
        if (name == ENEMY_NAMES[i]) return static_cast<EnemyType>(i);
    }
    return std::nullopt;
}

const char* pickup_kind_name(PickupKind kind) {
    const auto i = index_of(kind);
    return i < PICKUP_KIND_COUNT ? PICKUP_NAMES[i] : "Unknown";
}

std::optional<PickupKind> parse_pickup_kind(std::string_view name) {
    for (std::size_t i = 0; i < PICKUP_KIND_COUNT; ++i) {
        if (name == PICKUP_NAMES[i]) return static_cast<PickupKind>(i);
    }
    return std::nullopt;
}
