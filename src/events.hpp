#pragma once
#include "actor_types.hpp"
#include "components.hpp"
#include "match_state.hpp"
#include <ecs/ecs.hpp>
#include <functional>
#include <vector>

// ---------------------------------------------------------------------------
// Events<T> — typed, frame-scoped event queue
//
// Stored as a World resource. Systems emit via send() and consume via read().
// EventRegistry::flush_all() clears all queues at the start of each frame, so
// every consumer sees exactly the events emitted since the previous frame.
// ---------------------------------------------------------------------------

template<typename T>
struct Events {
    void send(T event)                     { buffer_.push_back(std::move(event)); }
    const std::vector<T>& read()   const  { return buffer_; }
    bool                  empty()  const  { return buffer_.empty(); }
    std::size_t           size()   const  { return buffer_.size(); }
    void                  clear()         { buffer_.clear(); }

private:
    std::vector<T> buffer_;
};

// Sends through the queue resource if it is registered; silent otherwise.
// Lets systems run in partial worlds (unit tests, tools).
template<typename T>
void emit(ecs::World& world, T event) {
    if (auto* q = world.try_resource<Events<T>>()) q->send(std::move(event));
}

// ---------------------------------------------------------------------------
// EventRegistry — flush coordinator (stored as a World resource)
//
// Call register_queue<T>(world) once per event type during startup.
// Call flush_all() as the first Pre-Update step each frame.
// ---------------------------------------------------------------------------

class EventRegistry {
public:
    template<typename T>
    void register_queue(ecs::World& world) {
        if (world.try_resource<Events<T>>()) return;
        world.set_resource(Events<T>{});
        flush_fns_.push_back([&world]() {
            if (auto* q = world.try_resource<Events<T>>()) q->clear();
        });
    }

    void flush_all() {
        for (auto& fn : flush_fns_) fn();
    }

    std::size_t queue_count() const { return flush_fns_.size(); }

private:
    std::vector<std::function<void()>> flush_fns_;
};

// ---------------------------------------------------------------------------
// Internal hand-off: CollisionSystem → ScoringSystem
// ---------------------------------------------------------------------------

// An enemy death newly recognised this frame (kill_tracked just set).
struct KillCredit {
    ecs::Entity entity;
    EnemyType   type;
    ecs::Vec3   position;
    int         xp_value;
};

// ---------------------------------------------------------------------------
// Presentation events (audio, camera, HUD). Nothing here feeds back into
// gameplay decisions.
// ---------------------------------------------------------------------------

enum class DamageSource : uint8_t { EnemyContact, EnemyProjectile, Laser };

// Emitted by CollisionSystem for every hit that passed the invulnerability gate.
// health_lost is 0 when a shield absorbed the hit.
struct PlayerHitEvent {
    DamageSource source;
    int          damage;
    int          health_lost;
    bool         shield_absorbed;
    float        shake;
};

// Emitted by ScoringSystem once per scored kill.
struct EnemyKilledEvent {
    ecs::Entity entity;
    EnemyType   type;
    ecs::Vec3   position;
    int         points;
    int         multiplier;
};

enum class RemovalCause : uint8_t { PlayerCollision, LevelClear, Cleanup };

// Enemy removed without score (still gets its death effects).
struct EnemyDestroyedEvent {
    ecs::Entity  entity;
    EnemyType    type;
    ecs::Vec3    position;
    RemovalCause cause;
};

enum class MultiplierChange : uint8_t {
    Increased,
    Expired,  // inactivity decay
    Reset,    // player damage below the "lost" threshold
    Lost,     // player damage at or above the "lost" threshold
};

struct MultiplierEvent {
    int              multiplier;
    int              previous;
    MultiplierChange change;
};

struct ComboEvent {
    int count;
};

// Multiplier newly raised to a bonus milestone; spawns a Fizzer.
struct BonusSpawnEvent {
    int multiplier;
};

struct PickupCollectedEvent {
    PickupKind kind;
    ecs::Vec3  position;
};

// Power-up / speed-up touched while already at the level cap.
struct PickupRejectedEvent {
    PickupKind kind;
};

struct ShotFiredEvent {
    ProjectileOwner owner;
};

struct StateChangedEvent {
    GameState       from;
    GameState       to;
    TransitionPhase phase;
};

struct LevelCompleteEvent {
    int level;
};

struct LevelStartedEvent {
    int level;
};

struct GameOverEvent {
    bool victory;
    int  score;
};
