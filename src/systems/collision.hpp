#pragma once
#include <ecs/ecs.hpp>
#include "../components.hpp"

// ---------------------------------------------------------------------------
// CollisionSystem — first Encounter-phase step; runs only while Playing.
//
// Fixed resolution order per frame:
//   1. player ↔ enemy           (skipped while dashing; unscored forced kill)
//   2. enemy projectile → player (skipped while dashing)
//   3. laser beam → player       (skipped while dashing)
//   4. player projectile → enemy (first overlapping enemy wins)
//   5. player ↔ pickup           (PowerUp, SpeedUp, MedPack, Shield, Invulnerable)
//
// Actor sets are snapshotted up front and every component is re-fetched and
// its alive flag re-checked immediately before acting. Nothing is destroyed
// here; actors are only marked dead for ReaperSystem.
//
// Emits: KillCredit (for ScoringSystem), PlayerHitEvent, EnemyDestroyedEvent,
// PickupCollectedEvent, PickupRejectedEvent.
// ---------------------------------------------------------------------------

class CollisionSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Strict: centres closer than the summed radii. Tangency is a miss.
    static bool overlaps(const ecs::Vec3& a, float ra, const ecs::Vec3& b, float rb);

    struct BeamHit {
        bool hit    = false;
        int  damage = 0;
    };

    // Non-projectile hit query for a firing beam emitted from `origin`.
    static BeamHit check_laser_hit(const LaserBeam& beam, const ecs::Vec3& origin,
                                   const ecs::Vec3& player_pos, float player_radius);

    // Applies one pickup's acceptance rule to the player. false = pickup stays.
    static bool try_collect(Player& p, const Pickup& pickup);
};
