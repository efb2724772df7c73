#include "renderer.hpp"
#include "level.hpp"
#include "player.hpp"
#include "../components.hpp"
#include "../config.hpp"
#include "../match_state.hpp"
#include <raylib.h>
#include <cmath>
#include <cstdio>
#include <string>

using namespace ecs;

// Indexed by index_of(EnemyType).
static const Color ENEMY_COLORS[ENEMY_TYPE_COUNT] = {
    {120, 220, 255, 255}, // DataMite
    {255, 170,  60, 255}, // ScanDrone
    {170, 255,  90, 255}, // ChaosWorm
    {150,  80, 255, 255}, // VoidSphere
    {100, 255, 230, 255}, // CrystalShardSwarm
    {255, 240,  80, 255}, // Fizzer
    {200, 200, 220, 255}, // UFO
    {255,  60,  90, 255}, // Boss
};

// Indexed by index_of(PickupKind).
static const Color PICKUP_COLORS[PICKUP_KIND_COUNT] = {
    {255, 120,  40, 255}, // PowerUp
    { 60, 200, 255, 255}, // SpeedUp
    { 80, 255, 120, 255}, // MedPack
    { 80, 140, 255, 255}, // Shield
    {255, 230,  60, 255}, // Invulnerable
};

static constexpr Color BG          = {12, 12, 20, 255};
static constexpr Color ARENA_EDGE  = {60, 60, 90, 255};
static constexpr Color HUD_TEXT    = {220, 220, 230, 255};
static constexpr Color HUD_DIM     = {140, 140, 160, 255};

// Arena is y-up; raylib screen space is y-down.
static Vector2 to_draw(const Vec3& p) { return {p.x, -p.y}; }

static void draw_centered(const char* text, int y, int size, Color color) {
    DrawText(text, (GetScreenWidth() - MeasureText(text, size)) / 2, y, size, color);
}

Camera2D RenderSystem::arena_camera(World& world) {
    Camera2D camera = {};
    camera.offset = {GetScreenWidth() * 0.5f, GetScreenHeight() * 0.5f};
    camera.zoom   = 1.0f;
    if (const auto* cam = world.try_resource<MainCamera>()) {
        camera.target = {cam->lerp_target.x + cam->shake_offset.x,
                         -(cam->lerp_target.y + cam->shake_offset.y)};
        camera.zoom   = cam->zoom;
    }
    return camera;
}

static void draw_world(World& world) {
    const Camera2D camera = RenderSystem::arena_camera(world);

    float arena = 29.0f;
    if (const auto* cfg = world.try_resource<BalanceConfig>()) arena = cfg->arena_radius;

    BeginMode2D(camera);
    DrawRing({0, 0}, arena - 0.1f, arena + 0.1f, 0.0f, 360.0f, 96, ARENA_EDGE);

    world.each<Pickup, LocalTransform, CircleCollider>(
        [&](Entity, Pickup& p, LocalTransform& t, CircleCollider& c) {
            if (!p.alive) return;
            DrawCircleV(to_draw(t.position), c.radius, PICKUP_COLORS[index_of(p.kind)]);
        });

    world.each<Enemy, LocalTransform, CircleCollider>(
        [&](Entity e, Enemy& en, LocalTransform& t, CircleCollider& c) {
            Color col = ENEMY_COLORS[index_of(en.type)];
            if (!en.alive) col.a = 90; // corpse during its death sequence
            DrawCircleV(to_draw(t.position), c.radius, col);

            if (const auto* beam = world.try_get<LaserBeam>(e); beam && en.alive) {
                const Vec3 end = {t.position.x + beam->direction.x * beam->length,
                                  t.position.y + beam->direction.y * beam->length, 0};
                const Color beam_col = beam->firing ? Color{255, 60, 60, 230} : Color{255, 60, 60, 50};
                DrawLineEx(to_draw(t.position), to_draw(end),
                           beam->firing ? beam->thickness * 2.0f : 0.05f, beam_col);
            }
        });

    world.each<Projectile, LocalTransform, CircleCollider>(
        [&](Entity, Projectile& p, LocalTransform& t, CircleCollider& c) {
            if (!p.alive) return;
            DrawCircleV(to_draw(t.position), c.radius,
                        p.owner == ProjectileOwner::Player ? SKYBLUE : ORANGE);
        });

    world.each<Player, LocalTransform, CircleCollider>(
        [&](Entity, Player& p, LocalTransform& t, CircleCollider& c) {
            if (!p.alive) return;
            Color body = RAYWHITE;
            if (PlayerSystem::is_invulnerable(p)) body = GOLD;
            DrawCircleV(to_draw(t.position), c.radius, body);
            if (p.shield) DrawRing(to_draw(t.position), c.radius + 0.2f, c.radius + 0.35f, 0.0f, 360.0f, 32, BLUE);
            const Vec3 tip = {t.position.x + p.aim.x * (c.radius + 0.4f),
                              t.position.y + p.aim.y * (c.radius + 0.4f), 0};
            DrawLineEx(to_draw(t.position), to_draw(tip), 0.12f, RED);
        });
    EndMode2D();
}

static void draw_hud(World& world) {
    const auto* stats = world.try_resource<GameStats>();
    const auto* mult  = world.try_resource<MultiplierState>();
    const auto* prog  = world.try_resource<LevelProgress>();
    const auto* cfg   = world.try_resource<BalanceConfig>();
    if (!stats || !mult || !prog || !cfg) return;

    char buf[96];
    std::snprintf(buf, sizeof(buf), "SCORE %d", stats->score);
    DrawText(buf, 20, 16, 28, HUD_TEXT);

    std::snprintf(buf, sizeof(buf), "x%d", mult->multiplier);
    DrawText(buf, 20, 50, 24, mult->multiplier > 1 ? GOLD : HUD_DIM);
    if (mult->combo_count >= 2) {
        std::snprintf(buf, sizeof(buf), "COMBO %d", mult->combo_count);
        DrawText(buf, 90, 54, 20, ORANGE);
    }

    const LevelDef& def = LevelSystem::current_def(*prog, *cfg);
    std::snprintf(buf, sizeof(buf), "LEVEL %d/%d  %s", prog->current_level, prog->total_levels, def.name.c_str());
    DrawText(buf, GetScreenWidth() - MeasureText(buf, 20) - 20, 16, 20, HUD_TEXT);

    int row = 42;
    for (int i = 0; i < ENEMY_TYPE_COUNT; i++) {
        if (def.objectives[i] <= 0) continue;
        std::snprintf(buf, sizeof(buf), "%s %d/%d", enemy_type_name(static_cast<EnemyType>(i)),
                      prog->kills[i], def.objectives[i]);
        DrawText(buf, GetScreenWidth() - MeasureText(buf, 16) - 20, row, 16, HUD_DIM);
        row += 18;
    }
    if (def.duration > 0.0f) {
        const std::string t = prog->level_timer.formatted_remaining();
        DrawText(t.c_str(), GetScreenWidth() - MeasureText(t.c_str(), 20) - 20, row + 4, 20, HUD_TEXT);
    }

    world.each<Player>([&](Entity, Player& p) {
        const int w = 260, h = 14, x = 20, y = GetScreenHeight() - 36;
        const float frac = p.max_health > 0 ? static_cast<float>(p.health) / p.max_health : 0.0f;
        DrawRectangle(x, y, w, h, {50, 50, 60, 255});
        DrawRectangle(x, y, static_cast<int>(w * frac), h, frac > 0.3f ? GREEN : RED);
        std::snprintf(buf, sizeof(buf), "HP %d/%d  PWR %d  SPD %d  LV %d", p.health, p.max_health,
                      p.power_level, p.speed_level, p.level);
        DrawText(buf, x, y - 20, 16, HUD_TEXT);
    });
}

static void draw_banner(World& world) {
    const auto* flow = world.try_resource<GameFlow>();
    if (!flow) return;
    const int cy = GetScreenHeight() / 2;

    switch (flow->state) {
        case GameState::StartScreen:
            draw_centered("NEURAL BREAK", cy - 60, 56, HUD_TEXT);
            draw_centered("ENTER / SOUTH to start", cy + 10, 20, HUD_DIM);
            break;
        case GameState::GameOver: {
            draw_centered(flow->victory ? "SYSTEM PURGED" : "GAME OVER", cy - 60, 48,
                          flow->victory ? GOLD : RED);
            if (const auto* stats = world.try_resource<GameStats>()) {
                char buf[96];
                std::snprintf(buf, sizeof(buf), "score %d   kills %d   best combo %d",
                              stats->score, stats->enemies_killed, stats->highest_combo);
                draw_centered(buf, cy + 4, 20, HUD_TEXT);
            }
            draw_centered("ENTER / SOUTH to play again", cy + 40, 20, HUD_DIM);
            break;
        }
        case GameState::LevelTransition:
            if (flow->phase == TransitionPhase::Displaying) {
                if (const auto* prog = world.try_resource<LevelProgress>()) {
                    char buf[48];
                    std::snprintf(buf, sizeof(buf), "LEVEL %d COMPLETE", prog->current_level);
                    draw_centered(buf, cy - 24, 40, GOLD);
                }
            }
            break;
        case GameState::Playing:
        case GameState::DeathAnimation:
            break;
    }
    if (flow->paused) draw_centered("PAUSED", cy - 20, 40, HUD_TEXT);
}

void RenderSystem::Update(World& world) {
    BeginDrawing();
    ClearBackground(BG);
    draw_world(world);
    draw_hud(world);
    draw_banner(world);
}

void RenderSystem::Present(World& /*world*/) {
    EndDrawing();
}
