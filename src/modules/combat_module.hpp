#pragma once
#include "../components.hpp"
#include "../config.hpp"
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../match_state.hpp"
#include "../pipeline.hpp"
#include "../systems/collision.hpp"
#include "../systems/motion.hpp"
#include "../systems/player.hpp"
#include "../systems/scoring.hpp"
#include "../systems/weapons.hpp"
#include <ecs/ecs.hpp>
#include <algorithm>
#include <string>

// ---------------------------------------------------------------------------
// CombatModule
//
// Player rules, firing, motion, collision resolution and scoring. Registers
// the queues those systems emit and creates the scoring resources if absent.
//
// Ordering summary:
//   logic:     Player → Weapons → Motion
//   encounter: Collision → Scoring
// ProgressionModule::install must follow, so that level bookkeeping and the
// lifecycle see this frame's kills and hits.
// ---------------------------------------------------------------------------

struct CombatModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        if (!world.try_resource<BalanceConfig>())   world.set_resource(BalanceConfig{});
        if (!world.try_resource<MultiplierState>()) world.set_resource(MultiplierState{});
        if (!world.try_resource<GameStats>())       world.set_resource(GameStats{});

        auto& reg = world.resource<EventRegistry>();
        reg.register_queue<KillCredit>(world);
        reg.register_queue<PlayerHitEvent>(world);
        reg.register_queue<EnemyKilledEvent>(world);
        reg.register_queue<EnemyDestroyedEvent>(world);
        reg.register_queue<MultiplierEvent>(world);
        reg.register_queue<ComboEvent>(world);
        reg.register_queue<BonusSpawnEvent>(world);
        reg.register_queue<PickupCollectedEvent>(world);
        reg.register_queue<PickupRejectedEvent>(world);
        reg.register_queue<ShotFiredEvent>(world);

        pipeline.add_logic([](ecs::World& w, float dt) { PlayerSystem::Update(w, dt); });
        pipeline.add_logic([](ecs::World& w, float dt) { WeaponSystem::Update(w, dt); });
        pipeline.add_logic([](ecs::World& w, float dt) { MotionSystem::Update(w, dt); });

        pipeline.add_encounter([](ecs::World& w, float dt) { CollisionSystem::Update(w, dt); });
        pipeline.add_encounter([](ecs::World& w, float dt) { ScoringSystem::Update(w, dt); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Scoring", "Multiplier", [&world]() {
                auto* m = world.try_resource<MultiplierState>();
                return m ? "x" + std::to_string(m->multiplier) : std::string("-");
            });
            panel->watch("Scoring", "Combo", [&world]() {
                auto* m = world.try_resource<MultiplierState>();
                return m ? std::to_string(m->combo_count) : std::string("-");
            });
            panel->watch("Scoring", "Decay In", [&world]() {
                auto* m = world.try_resource<MultiplierState>();
                return m ? DebugPanel::fixed(m->decay_timer, 2, " s") : std::string("-");
            });
            panel->watch("Player", "Health", [&world]() {
                std::string r = "-";
                world.each<Player>([&](ecs::Entity, Player& p) {
                    r = std::to_string(p.health) + "/" + std::to_string(p.max_health);
                });
                return r;
            });
            panel->watch("Player", "Invulnerable", [&world]() {
                std::string r = "-";
                world.each<Player>([&](ecs::Entity, Player& p) {
                    r = PlayerSystem::is_invulnerable(p)
                        ? DebugPanel::fixed(std::max(p.invulnerable_timer, p.dash_timer), 1, " s")
                        : std::string("no");
                });
                return r;
            });
        }
    }
};
