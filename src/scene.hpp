#pragma once
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// SceneLoader — reads JSON actor lists and populates an ECS World.
//
// Format: { "entities": [ { "transform": { "position": [x, y, z] },
//                           "player" | "enemy" | "projectile" | "pickup": {...},
//                           "velocity": [x, y, z] } ] }
//
// Actors are assembled through ActorFactory using the world's BalanceConfig
// (built-in defaults when none is set), then per-entity overrides apply.
// No Raylib dependency beyond logging — usable in the headless test target.
// ---------------------------------------------------------------------------

class SceneLoader {
public:
    // Load entities from a JSON file into world.
    // Returns false if the file cannot be opened or the JSON is malformed.
    static bool load(ecs::World& world, const std::string& path);

    // Parse and spawn from a JSON string — identical to load() but avoids
    // file I/O. Nothing is spawned unless the whole document is valid.
    static bool load_from_string(ecs::World& world, const std::string& json);

    // Destroy all ArenaTag entities and flush deferred commands.
    static void unload(ecs::World& world);
};
