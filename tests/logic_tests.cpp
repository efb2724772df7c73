#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/actor_factory.hpp"
#include "../src/components.hpp"
#include "../src/config.hpp"
#include "../src/debug_panel.hpp"
#include "../src/events.hpp"
#include "../src/match_state.hpp"
#include "../src/math_util.hpp"
#include "../src/pipeline.hpp"
#include "../src/scene.hpp"
#include "../src/timer.hpp"
#include "../src/modules/combat_module.hpp"
#include "../src/modules/event_bus_module.hpp"
#include "../src/modules/progression_module.hpp"
#include "../src/systems/camera.hpp"
#include "../src/systems/collision.hpp"
#include "../src/systems/enemy.hpp"
#include "../src/systems/level.hpp"
#include "../src/systems/lifecycle.hpp"
#include "../src/systems/pickup_spawner.hpp"
#include "../src/systems/player.hpp"
#include "../src/systems/scoring.hpp"
#include "../src/systems/weapons.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>
#include <cmath>
#include <string>

// Everything below runs headless: the core library only touches raylib for
// TraceLog, so no window or audio device is needed.

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ---------------------------------------------------------------------------
// Harness
// ---------------------------------------------------------------------------

static constexpr float FRAME = 1.0f / 60.0f;

// Levels with unreachable objectives and no timed spawns, pickups disabled:
// nothing happens unless a test places it.
static BalanceConfig quiet_config(int levels = 2) {
    BalanceConfig cfg;
    LevelDef def;
    def.name = "TEST";
    def.objectives[index_of(EnemyType::DataMite)] = 1000;
    cfg.levels.assign(static_cast<std::size_t>(levels), def);
    for (auto& s : cfg.pickups.spawners) s.spawns_per_level = 0;
    return cfg;
}

// A world wired exactly like the game (minus input, audio and rendering).
struct Arena {
    ecs::World    world;
    ecs::Pipeline pipeline;

    explicit Arena(const BalanceConfig& cfg = quiet_config()) {
        world.set_resource(cfg);
        EventBusModule::install(world, pipeline);
        CombatModule::install(world, pipeline);
        ProgressionModule::install(world, pipeline);
    }

    void start() { REQUIRE(LifecycleSystem::start_match(world)); }

    void step(float dt = FRAME, int frames = 1) {
        for (int i = 0; i < frames; ++i) pipeline.update(world, dt);
    }

    // Steps until pred() holds; false if it never did within max_frames.
    template<typename Pred>
    bool run_until(Pred pred, float dt, int max_frames) {
        for (int i = 0; i < max_frames; ++i) {
            pipeline.update(world, dt);
            if (pred()) return true;
        }
        return false;
    }

    const BalanceConfig& cfg()   { return world.resource<BalanceConfig>(); }
    GameFlow&            flow()  { return world.resource<GameFlow>(); }
    GameStats&           stats() { return world.resource<GameStats>(); }
    MultiplierState&     mult()  { return world.resource<MultiplierState>(); }
    LevelProgress&       level() { return world.resource<LevelProgress>(); }

    Player& player() {
        Player* out = nullptr;
        world.each<Player>([&](ecs::Entity, Player& p) { out = &p; });
        REQUIRE(out != nullptr);
        return *out;
    }

    ecs::Entity enemy(EnemyType type, ecs::Vec3 pos) {
        return ActorFactory::spawn_enemy(world, cfg(), type, pos);
    }

    ecs::Entity player_shot(ecs::Vec3 pos, int damage = 12) {
        return ActorFactory::spawn_projectile(world, ProjectileOwner::Player, pos, {0, 0, 0},
                                              damage, 0.2f, 2.0f);
    }

    ecs::Entity enemy_shot(ecs::Vec3 pos, int damage = 10) {
        return ActorFactory::spawn_projectile(world, ProjectileOwner::Enemy, pos, {0, 0, 0},
                                              damage, 0.25f, 5.0f);
    }

    template<typename T>
    const std::vector<T>& events() { return world.resource<Events<T>>().read(); }
};

template<typename T>
static int count_of(ecs::World& world) {
    int n = 0;
    world.each<T>([&](ecs::Entity, T&) { ++n; });
    return n;
}

static int alive_enemies(ecs::World& world) {
    int n = 0;
    world.each<Enemy>([&](ecs::Entity, Enemy& e) { if (e.alive) ++n; });
    return n;
}

static int alive_projectiles(ecs::World& world) {
    int n = 0;
    world.each<Projectile>([&](ecs::Entity, Projectile& p) { if (p.alive) ++n; });
    return n;
}

// ---------------------------------------------------------------------------
// Geometry
// ---------------------------------------------------------------------------

TEST_CASE("Overlap - tangent circles do not collide", "[collision]") {
    CHECK_FALSE(CollisionSystem::overlaps({0, 0, 0}, 0.5f, {1, 0, 0}, 0.5f));
    CHECK(CollisionSystem::overlaps({0, 0, 0}, 0.5f, {0.999f, 0, 0}, 0.5f));
    CHECK_FALSE(CollisionSystem::overlaps({0, 0, 0}, 0.5f, {0, 2, 0}, 0.5f));
}

TEST_CASE("Overlap - distance is planar", "[math]") {
    CHECK_THAT(engine::math::distance_2d({0, 0, 0}, {3, 4, 9}), WithinAbs(5.0f, 1e-5f));
    const auto n = engine::math::normalize_2d({3, 4});
    CHECK_THAT(n.x, WithinAbs(0.6f, 1e-5f));
    CHECK_THAT(n.y, WithinAbs(0.8f, 1e-5f));
    const auto z = engine::math::normalize_2d({0, 0});
    CHECK(z.x == 0.0f);
    CHECK(z.y == 0.0f);
}

TEST_CASE("Laser - beam hit query", "[collision][laser]") {
    LaserBeam beam;
    beam.firing    = true;
    beam.direction = {1, 0, 0};
    beam.length    = 20.0f;
    beam.thickness = 0.2f;
    beam.damage    = 10;
    const ecs::Vec3 origin = {0, 0, 0};

    SECTION("Player on the beam is hit for the beam damage") {
        const auto hit = CollisionSystem::check_laser_hit(beam, origin, {10, 0.6f, 0}, 0.5f);
        CHECK(hit.hit);
        CHECK(hit.damage == 10);
    }
    SECTION("Too far off the beam") {
        CHECK_FALSE(CollisionSystem::check_laser_hit(beam, origin, {10, 0.75f, 0}, 0.5f).hit);
    }
    SECTION("Behind the emitter") {
        CHECK_FALSE(CollisionSystem::check_laser_hit(beam, origin, {-1, 0, 0}, 0.5f).hit);
    }
    SECTION("Past the end of the beam") {
        CHECK_FALSE(CollisionSystem::check_laser_hit(beam, origin, {21, 0, 0}, 0.5f).hit);
    }
    SECTION("Charging beam never hits") {
        beam.firing = false;
        const auto hit = CollisionSystem::check_laser_hit(beam, origin, {10, 0, 0}, 0.5f);
        CHECK_FALSE(hit.hit);
        CHECK(hit.damage == 0);
    }
}

TEST_CASE("Laser - charge and fire cycle", "[weapons][laser]") {
    LaserBeam beam;
    beam.hit_this_burst = true;

    WeaponSystem::cycle_laser(beam, 3.0f, {0, 1, 0});
    CHECK_FALSE(beam.firing);

    WeaponSystem::cycle_laser(beam, 1.0f, {0, 1, 0});
    CHECK(beam.firing);
    CHECK_FALSE(beam.hit_this_burst);
    CHECK(beam.direction.y == 1.0f);

    WeaponSystem::cycle_laser(beam, 1.5f, {1, 0, 0});
    CHECK_FALSE(beam.firing);
    CHECK(beam.direction.y == 1.0f); // locked for the whole burst
}

// ---------------------------------------------------------------------------
// Collision resolver (full frames)
// ---------------------------------------------------------------------------

TEST_CASE("Collision - one player projectile damages only the first enemy", "[collision]") {
    Arena a;
    a.start();
    a.enemy(EnemyType::DataMite, {5.0f, 0, 0});
    a.enemy(EnemyType::DataMite, {5.3f, 0, 0});
    a.player_shot({5.15f, 0, 0});

    a.step();

    CHECK(count_of<Enemy>(a.world) == 1);
    CHECK(alive_enemies(a.world) == 1);
    CHECK(count_of<Projectile>(a.world) == 0);
    CHECK(a.stats().score == 100);
    CHECK(a.stats().enemies_killed == 1);
    REQUIRE(a.events<EnemyKilledEvent>().size() == 1);
    CHECK(a.events<EnemyKilledEvent>()[0].points == 100);
}

TEST_CASE("Collision - a death is scored once while the corpse persists", "[collision][scoring]") {
    Arena a;
    a.start();
    const auto worm = a.enemy(EnemyType::ChaosWorm, {6, 0, 0});
    a.player_shot({6, 0, 0}, 500);

    a.step();
    CHECK(a.stats().score == 500);
    CHECK(a.stats().enemies_killed == 1);
    CHECK(a.stats().kills_by_type[index_of(EnemyType::ChaosWorm)] == 1);
    CHECK(a.stats().total_xp == 35);

    auto* en = a.world.try_get<Enemy>(worm);
    REQUIRE(en != nullptr);
    CHECK_FALSE(en->alive);
    CHECK(en->kill_tracked);

    // Shots pass through the corpse and nothing is credited again.
    a.player_shot({6, 0, 0}, 500);
    a.step(FRAME, 10);
    CHECK(a.stats().score == 500);
    CHECK(a.stats().enemies_killed == 1);
    CHECK(a.stats().total_xp == 35);
    CHECK(alive_projectiles(a.world) == 1);
    CHECK(count_of<Enemy>(a.world) == 1);

    // Death sequence over: the corpse is reaped.
    a.step(0.1f, 25);
    CHECK(count_of<Enemy>(a.world) == 0);
}

TEST_CASE("Collision - kill eligibility flag is one-shot", "[enemy]") {
    Enemy e;
    e.health = 3;
    EnemySystem::take_damage(e, 2, 0.0f);
    CHECK(e.alive);
    CHECK_FALSE(EnemySystem::should_track_kill(e));

    EnemySystem::take_damage(e, 5, 1.5f);
    CHECK_FALSE(e.alive);
    CHECK(e.health == 0);
    CHECK_THAT(e.death_timer, WithinAbs(1.5f, 1e-6f));
    REQUIRE(EnemySystem::should_track_kill(e));

    EnemySystem::mark_kill_tracked(e);
    CHECK_FALSE(EnemySystem::should_track_kill(e));
    CHECK_FALSE(EnemySystem::force_kill(e, 1.0f));
}

TEST_CASE("Collision - dash frames gate hits but not projectile kills", "[collision]") {
    Arena a;
    a.start();
    a.player().dash_timer = 0.3f;

    a.enemy(EnemyType::DataMite, {0.6f, 0, 0});
    a.enemy_shot({-0.6f, 0, 0});
    a.player_shot({0.6f, 0.1f, 0});

    a.step();

    CHECK(a.player().health == 130);
    CHECK(a.events<PlayerHitEvent>().empty());
    CHECK(alive_projectiles(a.world) == 1); // the enemy shot is still there
    CHECK(a.stats().score == 100);           // the player shot still killed
    CHECK(a.events<EnemyDestroyedEvent>().empty());
}

TEST_CASE("Collision - invulnerable grant blocks health loss only", "[collision][scoring]") {
    Arena a;
    a.start();
    PlayerSystem::collect_invulnerable(a.player());
    a.player().shield = true;
    a.mult().multiplier = 4;
    a.mult().combo_count = 3;

    a.enemy(EnemyType::DataMite, {0.6f, 0, 0});
    a.enemy_shot({-0.6f, 0, 0});

    a.step();

    CHECK(a.player().health == 130);
    CHECK(a.player().shield);
    CHECK(a.stats().damage_taken == 0);

    // Contact still force-kills, unscored.
    CHECK(alive_enemies(a.world) == 0);
    REQUIRE(a.events<EnemyDestroyedEvent>().size() == 1);
    CHECK(a.events<EnemyDestroyedEvent>()[0].cause == RemovalCause::PlayerCollision);
    CHECK(a.stats().score == 0);

    // The enemy shot is spent on the player.
    CHECK(alive_projectiles(a.world) == 0);

    const auto& hits = a.events<PlayerHitEvent>();
    REQUIRE(hits.size() == 2);
    CHECK(hits[0].source == DamageSource::EnemyContact);
    CHECK(hits[1].source == DamageSource::EnemyProjectile);
    for (const auto& hit : hits) {
        CHECK(hit.health_lost == 0);
        CHECK_FALSE(hit.shield_absorbed);
    }

    CHECK(a.mult().multiplier == 1);
    CHECK(a.mult().combo_count == 0);
    REQUIRE(a.events<MultiplierEvent>().size() == 1);
    CHECK(a.events<MultiplierEvent>()[0].change == MultiplierChange::Lost);
}

TEST_CASE("Collision - enemy contact is an unscored forced kill", "[collision][scoring]") {
    Arena a;
    a.start();
    a.mult().multiplier    = 5;
    a.mult().has_last_kill = true;
    a.mult().last_kill_time = a.mult().clock;
    a.mult().combo_count   = 4;

    a.enemy(EnemyType::DataMite, {0.6f, 0, 0});
    a.step();

    CHECK(a.player().health == 125);
    CHECK(a.stats().damage_taken == 5);
    CHECK(a.stats().score == 0);
    CHECK(a.stats().enemies_killed == 0);
    CHECK(a.mult().multiplier == 1);
    CHECK(a.mult().combo_count == 0);

    REQUIRE(a.events<EnemyDestroyedEvent>().size() == 1);
    CHECK(a.events<EnemyDestroyedEvent>()[0].cause == RemovalCause::PlayerCollision);
    REQUIRE(a.events<PlayerHitEvent>().size() == 1);
    CHECK(a.events<PlayerHitEvent>()[0].source == DamageSource::EnemyContact);
    CHECK(a.events<PlayerHitEvent>()[0].health_lost == 5);
    CHECK(a.events<EnemyKilledEvent>().empty());

    REQUIRE(a.events<MultiplierEvent>().size() == 1);
    CHECK(a.events<MultiplierEvent>()[0].change == MultiplierChange::Lost);
    CHECK(a.events<MultiplierEvent>()[0].previous == 5);
}

TEST_CASE("Collision - shield absorbs one enemy projectile", "[collision]") {
    Arena a;
    a.start();
    a.player().shield = true;
    a.enemy_shot({0.5f, 0, 0}, 10);

    a.step();

    CHECK(a.player().health == 130);
    CHECK_FALSE(a.player().shield);
    CHECK(count_of<Projectile>(a.world) == 0);
    REQUIRE(a.events<PlayerHitEvent>().size() == 1);
    CHECK(a.events<PlayerHitEvent>()[0].shield_absorbed);
    CHECK(a.events<PlayerHitEvent>()[0].health_lost == 0);

    // The next one lands.
    a.enemy_shot({0.5f, 0, 0}, 10);
    a.step();
    CHECK(a.player().health == 120);
}

TEST_CASE("Collision - a firing laser hits once per burst", "[collision][laser]") {
    Arena a;
    a.start();
    const auto ufo = a.enemy(EnemyType::UFO, {-10, 0, 0});
    auto* beam = a.world.try_get<LaserBeam>(ufo);
    REQUIRE(beam != nullptr);
    beam->firing      = true;
    beam->direction   = {1, 0, 0};
    beam->cycle_timer = 0.0f;

    a.step();
    CHECK(a.player().health == 130 - a.cfg().laser_damage);
    REQUIRE(a.events<PlayerHitEvent>().size() == 1);
    CHECK(a.events<PlayerHitEvent>()[0].source == DamageSource::Laser);

    a.step(FRAME, 5);
    CHECK(a.player().health == 130 - a.cfg().laser_damage);
}

TEST_CASE("Collision - dead player stops further hits", "[collision]") {
    Arena a;
    a.start();
    a.player().health = 5;
    a.enemy_shot({0.5f, 0, 0}, 10);
    a.enemy_shot({-0.5f, 0, 0}, 10);

    a.step();

    CHECK(a.player().health == 0);
    CHECK_FALSE(a.player().alive);
    CHECK(a.events<PlayerHitEvent>().size() == 1);
}

// ---------------------------------------------------------------------------
// Pickups
// ---------------------------------------------------------------------------

TEST_CASE("Pickup - acceptance rules", "[pickup]") {
    Player p;
    Pickup pk;

    SECTION("Power-up rejected at cap") {
        p.power_level = p.max_power_level;
        pk.kind = PickupKind::PowerUp;
        CHECK_FALSE(CollisionSystem::try_collect(p, pk));
        CHECK(p.power_level == p.max_power_level);
    }
    SECTION("Speed-up accepted below cap") {
        pk.kind = PickupKind::SpeedUp;
        CHECK(CollisionSystem::try_collect(p, pk));
        CHECK(p.speed_level == 1);
    }
    SECTION("Med-pack always consumed, heals up to max") {
        pk.kind = PickupKind::MedPack;
        pk.heal_amount = 35;
        p.health = 120;
        CHECK(CollisionSystem::try_collect(p, pk));
        CHECK(p.health == p.max_health);
        CHECK(CollisionSystem::try_collect(p, pk));
    }
    SECTION("Shield consumed even when already held") {
        pk.kind = PickupKind::Shield;
        p.shield = true;
        CHECK(CollisionSystem::try_collect(p, pk));
        CHECK(p.shield);
    }
    SECTION("Invulnerable refreshes the timer") {
        pk.kind = PickupKind::Invulnerable;
        p.invulnerable_grant = true;
        p.invulnerable_timer = 2.0f;
        CHECK(CollisionSystem::try_collect(p, pk));
        CHECK_THAT(p.invulnerable_timer, WithinAbs(p.invulnerable_duration, 1e-6f));
    }
}

TEST_CASE("Pickup - rejected pickup stays and reports once per touch", "[pickup][collision]") {
    Arena a;
    a.start();
    a.player().power_level = a.player().max_power_level;
    ActorFactory::spawn_pickup(a.world, a.cfg(), PickupKind::PowerUp, {0.5f, 0, 0});

    a.step();
    CHECK(count_of<Pickup>(a.world) == 1);
    REQUIRE(a.events<PickupRejectedEvent>().size() == 1);
    CHECK(a.events<PickupRejectedEvent>()[0].kind == PickupKind::PowerUp);

    a.step();
    CHECK(count_of<Pickup>(a.world) == 1);
    CHECK(a.events<PickupRejectedEvent>().empty());
}

TEST_CASE("Pickup - collected pickup is removed", "[pickup][collision]") {
    Arena a;
    a.start();
    a.player().health = 100;
    ActorFactory::spawn_pickup(a.world, a.cfg(), PickupKind::MedPack, {0.5f, 0, 0});

    a.step();

    CHECK(a.player().health == 130);
    CHECK(count_of<Pickup>(a.world) == 0);
    REQUIRE(a.events<PickupCollectedEvent>().size() == 1);
    CHECK(a.events<PickupCollectedEvent>()[0].kind == PickupKind::MedPack);
}

TEST_CASE("Pickup spawner - caps, intervals and the med-pack health gate", "[pickup][spawner]") {
    const PickupConfig pc;
    const auto& med   = pc.spawners[index_of(PickupKind::MedPack)];
    const auto& power = pc.spawners[index_of(PickupKind::PowerUp)];

    PickupSpawnerState st;
    st.since_last    = 40.0f;
    st.next_interval = 22.0f;

    CHECK_FALSE(PickupSpawnerSystem::should_spawn(st, med, 0.9f));
    CHECK(PickupSpawnerSystem::should_spawn(st, med, 0.5f));
    CHECK(PickupSpawnerSystem::should_spawn(st, power, 1.0f));

    st.spawned_this_level = power.spawns_per_level;
    CHECK_FALSE(PickupSpawnerSystem::should_spawn(st, power, 1.0f));

    st.spawned_this_level = 0;
    st.since_last = 10.0f;
    CHECK_FALSE(PickupSpawnerSystem::should_spawn(st, power, 1.0f));
}

TEST_CASE("Pickup spawner - positions stay in the disc and clear of the player", "[pickup][spawner]") {
    const PickupConfig pc;
    std::mt19937 rng{42};
    for (int i = 0; i < 50; ++i) {
        const auto pos = PickupSpawnerSystem::pick_position(rng, pc, {0, 0, 0});
        const float d = engine::math::distance_2d(pos, {0, 0, 0});
        CHECK(d <= pc.spawn_radius + 1e-4f);
        CHECK(d >= pc.min_player_distance);
    }
}

TEST_CASE("Pickup spawner - reset for a new level", "[pickup][spawner]") {
    const PickupConfig pc;
    PickupSpawners spawners;
    for (auto& st : spawners.kinds) {
        st.spawned_this_level = 2;
        st.since_last = 99.0f;
    }
    PickupSpawnerSystem::reset_for_new_level(spawners, pc);
    for (std::size_t i = 0; i < PICKUP_KIND_COUNT; ++i) {
        CHECK(spawners.kinds[i].spawned_this_level == 0);
        CHECK(spawners.kinds[i].since_last == 0.0f);
        CHECK(spawners.kinds[i].next_interval >= pc.spawners[i].interval_min);
        CHECK(spawners.kinds[i].next_interval <= pc.spawners[i].interval_max);
    }
}

// ---------------------------------------------------------------------------
// Scoring and multiplier
// ---------------------------------------------------------------------------

TEST_CASE("Scoring - chain, miss and decay scenario", "[scoring]") {
    const ScoringConfig cfg;
    MultiplierState s;
    GameStats stats;

    // A: first kill at t=0 never chains.
    auto r = ScoringSystem::register_kill(s, stats, cfg, EnemyType::DataMite, 100, 0.0f);
    CHECK(r.multiplier == 1);
    CHECK_FALSE(r.increased);
    CHECK(stats.score == 100);

    // B: inside the chain window.
    r = ScoringSystem::register_kill(s, stats, cfg, EnemyType::DataMite, 100, 1.0f);
    CHECK(r.multiplier == 2);
    CHECK(r.increased);
    CHECK(r.points == 200);
    CHECK(stats.score == 300);

    // C: window missed and decay expired; decay is checked first.
    CHECK(ScoringSystem::apply_decay(s, cfg, 3.5f));
    CHECK(s.multiplier == 1);
    r = ScoringSystem::register_kill(s, stats, cfg, EnemyType::ScanDrone, 250, 3.5f);
    CHECK(r.multiplier == 1);
    CHECK(stats.score == 550);
    CHECK(stats.highest_multiplier == 2);
    CHECK(stats.enemies_killed == 3);
    CHECK(stats.kills_by_type[index_of(EnemyType::ScanDrone)] == 1);
}

TEST_CASE("Scoring - missing the window alone does not reset", "[scoring]") {
    const ScoringConfig cfg;
    MultiplierState s;
    GameStats stats;
    ScoringSystem::register_kill(s, stats, cfg, EnemyType::DataMite, 100, 0.0f);
    ScoringSystem::register_kill(s, stats, cfg, EnemyType::DataMite, 100, 1.0f);
    REQUIRE(s.multiplier == 2);

    // 1.8 s later: outside the 1.5 s chain window, inside the 2.0 s decay.
    CHECK_FALSE(ScoringSystem::apply_decay(s, cfg, 2.8f));
    const auto r = ScoringSystem::register_kill(s, stats, cfg, EnemyType::DataMite, 100, 2.8f);
    CHECK(r.multiplier == 2);
    CHECK_FALSE(r.increased);
}

TEST_CASE("Scoring - total equals the sum of base times multiplier, capped at 15", "[scoring]") {
    const ScoringConfig cfg;
    MultiplierState s;
    GameStats stats;

    int expected = 0;
    float t = 0.0f;
    for (int i = 0; i < 25; ++i) {
        const auto r = ScoringSystem::register_kill(s, stats, cfg, EnemyType::Fizzer, 200, t);
        CHECK(r.points == 200 * r.multiplier);
        CHECK(r.multiplier >= 1);
        CHECK(r.multiplier <= 15);
        expected += r.points;
        t += 0.5f;
    }
    CHECK(s.multiplier == 15);
    CHECK(stats.score == expected);
    CHECK(stats.highest_multiplier == 15);
    CHECK(stats.highest_combo == 25);
}

TEST_CASE("Scoring - bonus milestones fire on the way up only", "[scoring]") {
    const ScoringConfig cfg;
    MultiplierState s;
    GameStats stats;

    int milestones = 0;
    for (int i = 0; i < 12; ++i) {
        const auto r = ScoringSystem::register_kill(s, stats, cfg, EnemyType::DataMite, 100, i * 1.0f);
        if (r.milestone) {
            ++milestones;
            CHECK((r.multiplier == 5 || r.multiplier == 8 || r.multiplier == 11));
        }
    }
    CHECK(milestones == 3);

    // Holding at 15 never re-triggers.
    s.multiplier = 15;
    const auto r = ScoringSystem::register_kill(s, stats, cfg, EnemyType::DataMite, 100, 12.5f);
    CHECK_FALSE(r.milestone);
}

TEST_CASE("Scoring - damage resets multiplier and combo", "[scoring]") {
    MultiplierState s;
    s.multiplier  = 5;
    s.combo_count = 7;
    s.combo_timer = 2.0f;

    CHECK(ScoringSystem::reset_on_damage(s) == 5);
    CHECK(s.multiplier == 1);
    CHECK(s.combo_count == 0);
}

TEST_CASE("Scoring - combo expires independently of the multiplier", "[scoring]") {
    const ScoringConfig cfg;
    MultiplierState s;
    GameStats stats;
    ScoringSystem::register_kill(s, stats, cfg, EnemyType::DataMite, 100, 0.0f);
    ScoringSystem::register_kill(s, stats, cfg, EnemyType::DataMite, 100, 0.5f);
    REQUIRE(s.combo_count == 2);

    ScoringSystem::tick_combo(s, 3.1f);
    CHECK(s.combo_count == 0);
    CHECK(s.multiplier == 2);
}

TEST_CASE("Scoring - reset keeps the clock", "[scoring]") {
    MultiplierState s;
    s.clock = 42.0f;
    s.multiplier = 9;
    s.has_last_kill = true;
    ScoringSystem::reset(s);
    CHECK(s.clock == 42.0f);
    CHECK(s.multiplier == 1);
    CHECK_FALSE(s.has_last_kill);
}

TEST_CASE("Scoring - inactivity decay happens only while playing", "[scoring][lifecycle]") {
    Arena a;
    a.start();
    a.mult().multiplier     = 4;
    a.mult().has_last_kill  = true;
    a.mult().last_kill_time = a.mult().clock;

    SECTION("Playing: decays after the decay time with an Expired event") {
        REQUIRE(a.run_until([&] { return a.mult().multiplier == 1; }, 0.1f, 40));
        CHECK(a.mult().clock > a.cfg().scoring.decay_time);
        REQUIRE(a.events<MultiplierEvent>().size() == 1);
        CHECK(a.events<MultiplierEvent>()[0].change == MultiplierChange::Expired);
        CHECK(a.events<MultiplierEvent>()[0].previous == 4);
    }
    SECTION("Paused: the scoring clock stops") {
        LifecycleSystem::set_paused(a.world, true);
        a.step(0.1f, 50);
        CHECK(a.mult().multiplier == 4);
        CHECK(a.mult().clock == 0.0f);
    }
}

TEST_CASE("Scoring - a milestone kill spawns a bonus Fizzer", "[scoring][spawner]") {
    Arena a;
    a.start();
    a.mult().multiplier     = 4;
    a.mult().has_last_kill  = true;
    a.mult().last_kill_time = a.mult().clock;

    a.enemy(EnemyType::DataMite, {5, 0, 0});
    a.player_shot({5, 0, 0});
    a.step();

    CHECK(a.mult().multiplier == 5);
    REQUIRE(a.events<BonusSpawnEvent>().size() == 1);
    int fizzers = 0;
    a.world.each<Enemy>([&](ecs::Entity, Enemy& e) { if (e.type == EnemyType::Fizzer) ++fizzers; });
    CHECK(fizzers == 1);
}

TEST_CASE("Scoring - kills grant player XP", "[scoring][player]") {
    Arena a;
    a.start();
    a.enemy(EnemyType::ScanDrone, {5, 0, 0});
    a.player_shot({5, 0, 0}, 50);
    a.step();

    CHECK(a.player().xp == 5);
    CHECK(a.stats().total_xp == 5);
    CHECK(a.level().kills[index_of(EnemyType::ScanDrone)] == 1);
}

// ---------------------------------------------------------------------------
// Player rules
// ---------------------------------------------------------------------------

TEST_CASE("Player - damage, healing and death", "[player]") {
    Player p;
    CHECK(PlayerSystem::take_damage(p, 30) == 30);
    CHECK(p.health == 100);

    PlayerSystem::heal(p, 500);
    CHECK(p.health == p.max_health);

    CHECK(PlayerSystem::take_damage(p, 1000) == 130);
    CHECK(p.health == 0);
    CHECK_FALSE(p.alive);
    CHECK(PlayerSystem::take_damage(p, 10) == 0);
}

TEST_CASE("Player - invulnerability sources", "[player]") {
    Player p;
    CHECK_FALSE(PlayerSystem::is_invulnerable(p));

    p.dash_timer = 0.2f;
    CHECK(PlayerSystem::is_invulnerable(p));
    CHECK(PlayerSystem::is_dashing(p));
    PlayerSystem::tick_timers(p, 0.3f);
    CHECK_FALSE(PlayerSystem::is_invulnerable(p));

    PlayerSystem::collect_invulnerable(p);
    CHECK(PlayerSystem::is_invulnerable(p));
    CHECK_FALSE(PlayerSystem::is_dashing(p));
    CHECK(PlayerSystem::take_damage(p, 40) == 0);
    CHECK(p.health == p.max_health);
    PlayerSystem::tick_timers(p, p.invulnerable_duration + 0.1f);
    CHECK_FALSE(p.invulnerable_grant);

    PlayerSystem::collect_invulnerable(p);
    PlayerSystem::clear_invulnerable(p);
    CHECK_FALSE(PlayerSystem::is_invulnerable(p));
}

TEST_CASE("Player - XP thresholds grow per level", "[player]") {
    Player p;
    p.xp_to_next = 10;
    CHECK(PlayerSystem::add_xp(p, 30, 1.5f) == 2);
    CHECK(p.level == 3);
    CHECK(p.xp == 5);
    CHECK(p.xp_to_next == 22);
}

TEST_CASE("Player - weapon damage and speed scale with levels", "[player]") {
    const PlayerConfig pc;
    Player p;
    CHECK(PlayerSystem::projectile_damage(p, pc) == 12);
    p.power_level = 5;
    CHECK(PlayerSystem::projectile_damage(p, pc) == 48);

    CHECK_THAT(PlayerSystem::move_speed(p, pc), WithinRel(7.0f));
    p.speed_level = 10;
    CHECK_THAT(PlayerSystem::move_speed(p, pc), WithinRel(10.5f));
}

TEST_CASE("Player - fire input spawns a shot and respects the cooldown", "[player][weapons]") {
    Arena a;
    a.start();
    a.world.each<PlayerInput>([](ecs::Entity, PlayerInput& in) { in.fire = true; });

    a.step();
    CHECK(count_of<Projectile>(a.world) == 1);
    REQUIRE(a.events<ShotFiredEvent>().size() == 1);
    CHECK(a.events<ShotFiredEvent>()[0].owner == ProjectileOwner::Player);
    a.world.each<Projectile, Velocity>([](ecs::Entity, Projectile& p, Velocity& v) {
        CHECK(p.owner == ProjectileOwner::Player);
        CHECK(p.damage == 12);
        CHECK(v.linear.y > 0.0f);
    });

    a.step();
    CHECK(count_of<Projectile>(a.world) == 1);
}

TEST_CASE("Motion - projectiles expire on lifetime", "[motion]") {
    Arena a;
    a.start();
    ActorFactory::spawn_projectile(a.world, ProjectileOwner::Player, {10, 0, 0}, {1, 0, 0},
                                   12, 0.2f, 0.05f);
    a.step(0.1f);
    CHECK(count_of<Projectile>(a.world) == 0);
}

// ---------------------------------------------------------------------------
// Levels
// ---------------------------------------------------------------------------

TEST_CASE("Level - objectives, latching and advancement", "[level]") {
    BalanceConfig cfg = quiet_config(2);
    cfg.levels[0].objectives = {};
    cfg.levels[0].objectives[index_of(EnemyType::DataMite)]  = 2;
    cfg.levels[0].objectives[index_of(EnemyType::ScanDrone)] = 1;

    LevelProgress lp;
    LevelSystem::begin_level(lp, cfg, 1);
    const LevelDef& def = LevelSystem::current_def(lp, cfg);
    CHECK(lp.total_levels == 2);

    LevelSystem::register_kill(lp, EnemyType::DataMite);
    LevelSystem::register_kill(lp, EnemyType::DataMite);
    CHECK_FALSE(LevelSystem::check_objectives_complete(lp, def));
    CHECK_THAT(LevelSystem::completion_percent(lp, def), WithinAbs(66.6667f, 1e-3f));

    LevelSystem::register_kill(lp, EnemyType::ScanDrone);
    CHECK(LevelSystem::check_objectives_complete(lp, def));
    CHECK(lp.objectives_complete);

    LevelSystem::register_kill(lp, EnemyType::DataMite);
    CHECK(lp.kills[index_of(EnemyType::DataMite)] == 2);

    CHECK_FALSE(LevelSystem::is_game_complete(lp));
    CHECK(LevelSystem::advance_level(lp, cfg));
    CHECK(lp.current_level == 2);
    CHECK_FALSE(lp.objectives_complete);
    CHECK(LevelSystem::is_final_level(lp));
    CHECK_FALSE(LevelSystem::advance_level(lp, cfg));
    CHECK(lp.current_level == 2);
}

TEST_CASE("Level - a level without objectives or timer never completes", "[level]") {
    BalanceConfig cfg = quiet_config(1);
    cfg.levels[0].objectives = {};
    LevelProgress lp;
    LevelSystem::begin_level(lp, cfg, 1);
    CHECK_FALSE(LevelSystem::check_objectives_complete(lp, cfg.levels[0]));
    CHECK_FALSE(lp.level_timer.running());
}

TEST_CASE("Level - begin_level clamps to the table", "[level]") {
    const BalanceConfig cfg;
    LevelProgress lp;
    LevelSystem::begin_level(lp, cfg, 99);
    CHECK(lp.current_level == 10);
    CHECK(LevelSystem::current_def(lp, cfg).name == "NEURAL BREAK");
    LevelSystem::begin_level(lp, cfg, 0);
    CHECK(lp.current_level == 1);
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

TEST_CASE("Lifecycle - start_match enters Playing with a fresh player", "[lifecycle]") {
    Arena a;
    CHECK(a.flow().state == GameState::StartScreen);
    a.start();

    CHECK(a.flow().state == GameState::Playing);
    CHECK(count_of<Player>(a.world) == 1);
    CHECK(a.level().current_level == 1);
    CHECK(a.stats().score == 0);
    CHECK(a.flow().spawning_enabled);

    // Re-entry while a match runs is a no-op.
    CHECK_FALSE(LifecycleSystem::start_match(a.world));
    CHECK(count_of<Player>(a.world) == 1);
}

TEST_CASE("Lifecycle - death animation then game over", "[lifecycle]") {
    Arena a;
    a.start();
    a.player().health = 5;
    a.enemy_shot({0.5f, 0, 0}, 10);

    a.step();
    CHECK(a.flow().state == GameState::DeathAnimation);
    CHECK_FALSE(a.flow().spawning_enabled);
    CHECK_FALSE(LifecycleSystem::start_death_animation(a.world));
    CHECK_FALSE(LifecycleSystem::start_level_transition(a.world));

    REQUIRE(a.run_until([&] { return a.flow().state == GameState::GameOver; }, 0.1f, 30));
    CHECK_FALSE(a.flow().victory);
    REQUIRE(a.events<GameOverEvent>().size() == 1);
    CHECK_FALSE(a.events<GameOverEvent>()[0].victory);
}

TEST_CASE("Lifecycle - pause freezes timed transitions", "[lifecycle]") {
    Arena a;
    a.start();
    REQUIRE(LifecycleSystem::start_death_animation(a.world));

    a.world.resource<MatchInput>().pause = true;
    a.step();
    a.world.resource<MatchInput>().pause = false;
    REQUIRE(a.flow().paused);

    a.step(0.1f, 50);
    CHECK(a.flow().state == GameState::DeathAnimation);

    LifecycleSystem::set_paused(a.world, false);
    CHECK(a.run_until([&] { return a.flow().state == GameState::GameOver; }, 0.1f, 30));
}

TEST_CASE("Lifecycle - confirm from game over restarts with a clean arena", "[lifecycle]") {
    Arena a;
    a.start();
    a.enemy(EnemyType::DataMite, {10, 0, 0});
    a.stats().score = 1234;
    REQUIRE(LifecycleSystem::start_death_animation(a.world));
    REQUIRE(a.run_until([&] { return a.flow().state == GameState::GameOver; }, 0.1f, 30));

    a.world.resource<MatchInput>().confirm = true;
    a.step();
    a.world.resource<MatchInput>().confirm = false;

    CHECK(a.flow().state == GameState::Playing);
    CHECK(a.stats().score == 0);
    CHECK(count_of<Enemy>(a.world) == 0);
    CHECK(count_of<Player>(a.world) == 1);
    CHECK(a.player().alive);
}

TEST_CASE("Lifecycle - clearing leaves no enemy alive and moves to Displaying", "[lifecycle]") {
    Arena a;
    a.start();
    for (int i = 0; i < 10; ++i) {
        const float ang = i * 0.628f;
        a.enemy(EnemyType::DataMite, {15.0f * std::cos(ang), 15.0f * std::sin(ang), 0});
    }
    REQUIRE(alive_enemies(a.world) == 10);

    REQUIRE(LifecycleSystem::start_level_transition(a.world));
    CHECK(a.flow().state == GameState::LevelTransition);
    CHECK(a.flow().phase == TransitionPhase::Clearing);
    CHECK(a.flow().pending_kills.size() == 10);

    // Re-entry is a silent no-op.
    CHECK_FALSE(LifecycleSystem::start_level_transition(a.world));
    CHECK(a.flow().pending_kills.size() == 10);

    a.step(0.1f, 32);
    CHECK(a.flow().state == GameState::LevelTransition);
    CHECK(a.flow().phase == TransitionPhase::Displaying);
    CHECK(alive_enemies(a.world) == 0);
    CHECK(a.flow().pending_kills.empty());
    CHECK(a.stats().score == 0); // clearing kills are unscored
}

TEST_CASE("Lifecycle - clearing kills fire on schedule and are idempotent", "[lifecycle]") {
    Arena a;
    a.start();
    const auto first  = a.enemy(EnemyType::DataMite, {10, 0, 0});
    const auto second = a.enemy(EnemyType::DataMite, {-10, 0, 0});
    const auto third  = a.enemy(EnemyType::DataMite, {0, 10, 0});

    // Third was already killed by other means.
    a.world.try_get<Enemy>(third)->alive = false;

    a.flow().pending_kills = {{first, 0.2f}, {second, 0.8f}, {third, 0.1f}};

    CHECK(LifecycleSystem::fire_pending_kills(a.world, 0.5f, false) == 1);
    CHECK_FALSE(a.world.try_get<Enemy>(first)->alive);
    CHECK(a.world.try_get<Enemy>(second)->alive);
    CHECK(a.flow().pending_kills.size() == 1);

    CHECK(LifecycleSystem::fire_pending_kills(a.world, 0.5f, false) == 0);
    CHECK(LifecycleSystem::fire_pending_kills(a.world, 0.5f, true) == 1);
    CHECK_FALSE(a.world.try_get<Enemy>(second)->alive);
    CHECK(a.flow().pending_kills.empty());

    // Scheduling an already-dead enemy again does nothing.
    a.flow().pending_kills = {{first, 0.0f}};
    CHECK(LifecycleSystem::fire_pending_kills(a.world, 1.0f, true) == 0);

    int level_clear = 0;
    for (const auto& ev : a.events<EnemyDestroyedEvent>()) {
        if (ev.cause == RemovalCause::LevelClear) ++level_clear;
    }
    CHECK(level_clear == 2);
}

TEST_CASE("Lifecycle - met objectives start the transition the same frame", "[lifecycle][level]") {
    BalanceConfig cfg = quiet_config(2);
    cfg.levels[0].objectives = {};
    cfg.levels[0].objectives[index_of(EnemyType::DataMite)] = 1;
    Arena a(cfg);
    a.start();

    a.enemy(EnemyType::DataMite, {5, 0, 0});
    a.player_shot({5, 0, 0});
    a.step();

    CHECK(a.stats().score == 100);
    CHECK(a.flow().state == GameState::LevelTransition);
    CHECK(a.flow().phase == TransitionPhase::Clearing);
    REQUIRE(a.events<LevelCompleteEvent>().size() == 1);
    CHECK(a.events<LevelCompleteEvent>()[0].level == 1);
}

TEST_CASE("Lifecycle - invulnerable grant does not carry into the next level", "[lifecycle][player]") {
    Arena a;
    a.start();
    PlayerSystem::collect_invulnerable(a.player());
    a.mult().multiplier = 6;
    ActorFactory::spawn_pickup(a.world, a.cfg(), PickupKind::Invulnerable, {10, 0, 0});
    ActorFactory::spawn_pickup(a.world, a.cfg(), PickupKind::MedPack, {-10, 0, 0});

    auto pickups_of = [&](PickupKind kind) {
        int n = 0;
        a.world.each<Pickup>([&](ecs::Entity, Pickup& p) { n += p.kind == kind ? 1 : 0; });
        return n;
    };

    REQUIRE(LifecycleSystem::start_level_transition(a.world));
    CHECK(a.player().invulnerable_grant);
    CHECK(pickups_of(PickupKind::Invulnerable) == 1);

    REQUIRE(a.run_until([&] { return a.flow().state == GameState::Playing; }, 0.1f, 100));
    CHECK(a.level().current_level == 2);
    CHECK(a.stats().level == 2);
    CHECK_FALSE(a.player().invulnerable_grant);
    CHECK_FALSE(PlayerSystem::is_invulnerable(a.player()));
    CHECK(pickups_of(PickupKind::Invulnerable) == 0);
    CHECK(pickups_of(PickupKind::MedPack) == 1);
    CHECK(count_of<Pickup>(a.world) == 1);
    CHECK(a.mult().multiplier == 1);
    CHECK(a.flow().spawning_enabled);
    REQUIRE(a.events<LevelStartedEvent>().size() == 1);
    CHECK(a.events<LevelStartedEvent>()[0].level == 2);
}

TEST_CASE("Lifecycle - completing the final level ends in victory", "[lifecycle]") {
    BalanceConfig cfg = quiet_config(1);
    cfg.levels[0].objectives = {};
    cfg.levels[0].objectives[index_of(EnemyType::DataMite)] = 1;
    Arena a(cfg);
    a.start();

    a.enemy(EnemyType::DataMite, {5, 0, 0});
    a.player_shot({5, 0, 0});
    a.step();
    REQUIRE(a.flow().state == GameState::LevelTransition);

    bool saw_displaying = false;
    REQUIRE(a.run_until([&] {
        if (a.flow().phase == TransitionPhase::Displaying) saw_displaying = true;
        return a.flow().state == GameState::GameOver;
    }, 0.1f, 40));
    CHECK_FALSE(saw_displaying);
    CHECK(a.flow().victory);
    REQUIRE(a.events<GameOverEvent>().size() == 1);
    CHECK(a.events<GameOverEvent>()[0].victory);
    CHECK(a.events<GameOverEvent>()[0].score == 100);
}

TEST_CASE("Lifecycle - a timed level completes when its timer runs out", "[lifecycle][level]") {
    BalanceConfig cfg = quiet_config(2);
    cfg.levels[0].objectives = {};
    cfg.levels[0].duration   = 1.0f;
    Arena a(cfg);
    a.start();
    CHECK(a.level().level_timer.running());

    a.step(0.1f, 5);
    CHECK(a.flow().state == GameState::Playing);
    CHECK(a.run_until([&] { return a.flow().state == GameState::LevelTransition; }, 0.1f, 10));
}

TEST_CASE("Enemy spawner - timed waves enter at the arena edge heading inward", "[spawner]") {
    BalanceConfig cfg = quiet_config(1);
    cfg.levels[0].spawn_intervals[index_of(EnemyType::DataMite)] = 1.0f;
    Arena a(cfg);
    a.start();

    a.step(0.25f, 3);
    CHECK(count_of<Enemy>(a.world) == 0);
    a.step(0.25f);
    REQUIRE(count_of<Enemy>(a.world) == 1);

    a.world.each<Enemy, ecs::LocalTransform, Velocity>(
        [&](ecs::Entity, Enemy& e, ecs::LocalTransform& t, Velocity& v) {
            CHECK(e.type == EnemyType::DataMite);
            CHECK_THAT(engine::math::distance_2d(t.position, {0, 0, 0}),
                       WithinAbs(cfg.arena_radius * 0.95f, 1e-3f));
            CHECK(t.position.x * v.linear.x + t.position.y * v.linear.y < 0.0f);
        });
}

// ---------------------------------------------------------------------------
// GameTimer
// ---------------------------------------------------------------------------

TEST_CASE("GameTimer - counts accumulated dt only while running", "[timer]") {
    GameTimer t(2.0f);
    t.update(1.0f);
    CHECK(t.elapsed() == 0.0f);
    CHECK_FALSE(t.running());

    t.start();
    t.update(0.5f);
    CHECK_THAT(t.remaining(), WithinAbs(1.5f, 1e-6f));
    CHECK_THAT(t.progress(), WithinAbs(25.0f, 1e-4f));
    CHECK_FALSE(t.is_expired());

    t.stop();
    t.update(10.0f);
    CHECK_THAT(t.elapsed(), WithinAbs(0.5f, 1e-6f));

    t.start();
    CHECK(t.elapsed() == 0.0f);
    t.update(2.5f);
    CHECK(t.is_expired());
    CHECK(t.remaining() == 0.0f);
    CHECK(t.progress() == 100.0f);
}

TEST_CASE("GameTimer - zero duration and formatting", "[timer]") {
    GameTimer zero;
    zero.start();
    CHECK(zero.is_expired());
    CHECK(zero.progress() == 100.0f);

    GameTimer t(65.0f);
    t.start();
    CHECK(t.formatted_remaining() == "01:05");
    t.update(0.5f);
    CHECK(t.formatted_remaining() == "01:04");
    t.update(100.0f);
    CHECK(t.formatted_remaining() == "00:00");
}

// ---------------------------------------------------------------------------
// ConfigLoader
// ---------------------------------------------------------------------------

TEST_CASE("Config - partial overlay keeps defaults", "[config]") {
    BalanceConfig cfg;
    REQUIRE(ConfigLoader::load_from_string(R"({
        "scoring": { "max_multiplier": 10 },
        "enemies": { "Boss": { "base_points": 9000 } },
        "pickups": { "spawners": { "MedPack": { "health_threshold": 0.5 } } },
        "rng_seed": 7
    })", cfg));

    CHECK(cfg.scoring.max_multiplier == 10);
    CHECK_THAT(cfg.scoring.kill_chain_window, WithinAbs(1.5f, 1e-6f));
    CHECK(cfg.enemies[index_of(EnemyType::Boss)].base_points == 9000);
    CHECK(cfg.enemies[index_of(EnemyType::Boss)].health == 180);
    CHECK_THAT(cfg.pickups.spawners[index_of(PickupKind::MedPack)].health_threshold, WithinAbs(0.5f, 1e-6f));
    CHECK(cfg.rng_seed == 7u);
    CHECK(cfg.levels.size() == 10);
}

TEST_CASE("Config - levels replace the built-in table", "[config]") {
    BalanceConfig cfg;
    REQUIRE(ConfigLoader::load_from_string(R"({
        "levels": [
            { "name": "ONE", "objectives": { "DataMite": 3 }, "spawn_intervals": { "DataMite": 1.0 } },
            { "name": "TWO", "duration": 30 }
        ]
    })", cfg));
    REQUIRE(cfg.levels.size() == 2);
    CHECK(cfg.levels[0].name == "ONE");
    CHECK(cfg.levels[0].objectives[index_of(EnemyType::DataMite)] == 3);
    CHECK_THAT(cfg.levels[0].spawn_intervals[index_of(EnemyType::DataMite)], WithinAbs(1.0f, 1e-6f));
    CHECK_THAT(cfg.levels[1].duration, WithinAbs(30.0f, 1e-6f));
}

TEST_CASE("Config - bad input is rejected and leaves the config untouched", "[config]") {
    BalanceConfig cfg;
    cfg.scoring.max_multiplier = 12;

    SECTION("Malformed JSON") {
        CHECK_FALSE(ConfigLoader::load_from_string("{ not json", cfg));
    }
    SECTION("Unknown enemy type") {
        CHECK_FALSE(ConfigLoader::load_from_string(
            R"({ "scoring": { "max_multiplier": 3 }, "enemies": { "Goblin": { "health": 1 } } })", cfg));
    }
    SECTION("Unknown pickup kind") {
        CHECK_FALSE(ConfigLoader::load_from_string(
            R"({ "pickups": { "spawners": { "Banana": {} } } })", cfg));
    }
    SECTION("Inverted spawn interval") {
        CHECK_FALSE(ConfigLoader::load_from_string(
            R"({ "pickups": { "spawners": { "Shield": { "interval_min": 30, "interval_max": 10 } } } })", cfg));
    }
    SECTION("Empty level list") {
        CHECK_FALSE(ConfigLoader::load_from_string(R"({ "levels": [] })", cfg));
    }
    SECTION("Missing file") {
        CHECK_FALSE(ConfigLoader::load("does/not/exist.json", cfg));
    }

    CHECK(cfg.scoring.max_multiplier == 12);
    CHECK(cfg.levels.size() == 10);
}

TEST_CASE("Config - shipped balance file loads", "[config]") {
    BalanceConfig cfg;
    REQUIRE(ConfigLoader::load(NEURAL_BREAK_RESOURCE_DIR "/config/balance.json", cfg));
    const BalanceConfig defaults;
    REQUIRE(cfg.levels.size() == defaults.levels.size());
    for (std::size_t i = 0; i < cfg.levels.size(); ++i) {
        CHECK(cfg.levels[i].name == defaults.levels[i].name);
        CHECK(cfg.levels[i].objectives == defaults.levels[i].objectives);
    }
    CHECK(cfg.scoring.max_multiplier == 15);
}

TEST_CASE("Actor types - names round-trip through the lookup table", "[config]") {
    for (std::size_t i = 0; i < ENEMY_TYPE_COUNT; ++i) {
        const auto type = static_cast<EnemyType>(i);
        const auto parsed = parse_enemy_type(enemy_type_name(type));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == type);
    }
    CHECK_FALSE(parse_enemy_type("Goblin").has_value());
    CHECK_FALSE(parse_pickup_kind("Banana").has_value());
    CHECK(default_enemy_table()[index_of(EnemyType::Boss)].base_points == 5000);
    CHECK(default_enemy_table()[index_of(EnemyType::CrystalShardSwarm)].base_points == 750);
}

// ---------------------------------------------------------------------------
// Events<T> / EventRegistry
// ---------------------------------------------------------------------------

struct TestEvent { int value; };

TEST_CASE("Events - send and read in order", "[events]") {
    Events<TestEvent> queue;
    CHECK(queue.empty());

    for (int i = 0; i < 5; ++i) queue.send({i});

    const auto& v = queue.read();
    REQUIRE(v.size() == 5);
    for (int i = 0; i < 5; ++i) CHECK(v[i].value == i);

    queue.clear();
    CHECK(queue.empty());
}

TEST_CASE("Events - registry flushes every registered queue", "[events]") {
    ecs::World world;
    world.set_resource(EventRegistry{});
    auto& reg = world.resource<EventRegistry>();
    reg.register_queue<TestEvent>(world);
    reg.register_queue<TestEvent>(world);
    reg.register_queue<ComboEvent>(world);
    CHECK(reg.queue_count() == 2);

    emit(world, TestEvent{1});
    emit(world, ComboEvent{3});
    CHECK(world.resource<Events<TestEvent>>().size() == 1);

    reg.flush_all();
    CHECK(world.resource<Events<TestEvent>>().empty());
    CHECK(world.resource<Events<ComboEvent>>().empty());
}

TEST_CASE("Events - emit without a registered queue is silent", "[events]") {
    ecs::World world;
    emit(world, TestEvent{1});
    CHECK(world.try_resource<Events<TestEvent>>() == nullptr);
}

// ---------------------------------------------------------------------------
// SceneLoader
// ---------------------------------------------------------------------------

static const char* ARENA_SCENE = R"({
  "entities": [
    { "transform": { "position": [1.0, 2.0, 0.0] }, "player": { "health": 90, "shield": true } },
    { "transform": { "position": [5.0, 0.0, 0.0] }, "enemy": { "type": "DataMite" }, "velocity": [-1.0, 0.0, 0.0] },
    { "transform": { "position": [-8.0, 4.0, 0.0] }, "enemy": { "type": "UFO" } },
    { "transform": { "position": [0.0, -6.0, 0.0] }, "pickup": { "type": "MedPack" } },
    { "transform": { "position": [3.0, 3.0, 0.0] }, "projectile": { "owner": "Enemy", "damage": 7 } }
  ]
})";

TEST_CASE("SceneLoader - spawns every actor", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, ARENA_SCENE));
    CHECK(world.count() == 5);
    CHECK(count_of<ArenaTag>(world) == 5);
    CHECK(count_of<Enemy>(world) == 2);
    CHECK(count_of<LaserBeam>(world) == 1);
}

TEST_CASE("SceneLoader - per-entity overrides apply", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, ARENA_SCENE));

    bool found = false;
    world.each<Player, ecs::LocalTransform>([&](ecs::Entity, Player& p, ecs::LocalTransform& t) {
        CHECK(p.health == 90);
        CHECK(p.shield);
        CHECK_THAT(t.position.x, WithinAbs(1.0f, 1e-4f));
        CHECK_THAT(t.position.y, WithinAbs(2.0f, 1e-4f));
        found = true;
    });
    CHECK(found);

    world.each<Projectile>([](ecs::Entity, Projectile& p) {
        CHECK(p.owner == ProjectileOwner::Enemy);
        CHECK(p.damage == 7);
    });
    world.each<Enemy, Velocity>([](ecs::Entity, Enemy& e, Velocity& v) {
        if (e.type == EnemyType::DataMite) CHECK(v.linear.x == -1.0f);
    });
}

TEST_CASE("SceneLoader - uses the world's balance data", "[scene]") {
    ecs::World world;
    BalanceConfig cfg;
    cfg.pickups.med_pack_heal = 50;
    world.set_resource(cfg);
    REQUIRE(SceneLoader::load_from_string(world, ARENA_SCENE));
    world.each<Pickup>([](ecs::Entity, Pickup& p) { CHECK(p.heal_amount == 50); });
}

TEST_CASE("SceneLoader - invalid documents spawn nothing", "[scene]") {
    ecs::World world;

    SECTION("Malformed JSON") {
        CHECK_FALSE(SceneLoader::load_from_string(world, "{bad json"));
    }
    SECTION("Unknown enemy type after valid entries") {
        CHECK_FALSE(SceneLoader::load_from_string(world, R"({ "entities": [
            { "enemy": { "type": "DataMite" } },
            { "enemy": { "type": "Goblin" } } ] })"));
    }
    SECTION("Entity with two actor blocks") {
        CHECK_FALSE(SceneLoader::load_from_string(world, R"({ "entities": [
            { "enemy": { "type": "DataMite" }, "pickup": { "type": "Shield" } } ] })"));
    }
    SECTION("Missing file") {
        CHECK_FALSE(SceneLoader::load(world, "does/not/exist.json"));
    }
    CHECK(world.count() == 0);
}

TEST_CASE("SceneLoader - unload removes arena actors", "[scene]") {
    ecs::World world;
    REQUIRE(SceneLoader::load_from_string(world, ARENA_SCENE));
    SceneLoader::unload(world);
    CHECK(world.count() == 0);
}

// ---------------------------------------------------------------------------
// Camera shake
// ---------------------------------------------------------------------------

TEST_CASE("Camera - hit events add trauma, which decays", "[camera]") {
    ecs::World world;
    world.set_resource(EventRegistry{});
    world.resource<EventRegistry>().register_queue<PlayerHitEvent>(world);
    world.set_resource(MainCamera{});

    emit(world, PlayerHitEvent{DamageSource::EnemyContact, 5, 5, false, 0.5f});
    CameraSystem::Update(world, 0.0f);
    CHECK_THAT(world.resource<MainCamera>().trauma, WithinAbs(0.5f, 1e-6f));

    world.resource<EventRegistry>().flush_all();
    CameraSystem::Update(world, 1.0f);
    CHECK(world.resource<MainCamera>().trauma == 0.0f);

    float trauma = 0.8f;
    CameraSystem::add_trauma(trauma, 0.5f);
    CHECK(trauma == 1.0f);
}

// ---------------------------------------------------------------------------
// DebugPanel
// ---------------------------------------------------------------------------

TEST_CASE("DebugPanel - sections keep registration order", "[debug]") {
    DebugPanel panel;
    panel.watch("Engine",  "FPS",        []() { return std::string("60"); });
    panel.watch("Scoring", "Multiplier", []() { return std::string("x3"); });
    panel.watch("Engine",  "Entities",   []() { return std::string("15"); });

    REQUIRE(panel.sections().size() == 2);
    CHECK(panel.sections()[0].title == "Engine");
    CHECK(panel.sections()[0].rows.size() == 2);
    CHECK(panel.sections()[1].rows[0].fn() == "x3");
    CHECK(panel.row_count() == 3);
    CHECK(panel.find("Scoring") != nullptr);
    CHECK(panel.find("Camera") == nullptr);
    CHECK_FALSE(panel.visible);
}

TEST_CASE("DebugPanel - fixed formatting", "[debug]") {
    CHECK(DebugPanel::fixed(1.23456f, 2) == "1.23");
    CHECK(DebugPanel::fixed(16.0f, 1, " ms") == "16.0 ms");
    CHECK(DebugPanel::fixed(99.6f, 0, "%") == "100%");
}

TEST_CASE("DebugPanel - game modules add live rows", "[debug]") {
    ecs::World world;
    ecs::Pipeline pipeline;
    world.set_resource(quiet_config());
    world.set_resource(DebugPanel{});
    EventBusModule::install(world, pipeline);
    CombatModule::install(world, pipeline);
    ProgressionModule::install(world, pipeline);

    auto& panel = world.resource<DebugPanel>();
    auto* scoring = panel.find("Scoring");
    REQUIRE(scoring != nullptr);
    REQUIRE_FALSE(scoring->rows.empty());
    CHECK(scoring->rows[0].fn() == "x1");

    world.resource<MultiplierState>().multiplier = 7;
    CHECK(scoring->rows[0].fn() == "x7");

    auto* match = panel.find("Match");
    REQUIRE(match != nullptr);
    CHECK(match->rows[0].fn() == "StartScreen");
}
