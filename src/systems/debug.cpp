#include "debug.hpp"
#include "player.hpp"
#include "renderer.hpp"
#include "../components.hpp"
#include "../config.hpp"
#include "../debug_panel.hpp"
#include "../input_state.hpp"
#include <raylib.h>
#include <string>
#include <utility>

using namespace ecs;

static constexpr int   PAD     = 8;
static constexpr int   ROW_H   = 15;
static constexpr int   FONT    = 10;
static constexpr int   LABEL_X = 4;    // label indent inside a section
static constexpr int   VALUE_X = 128;  // value column, from content-left
static constexpr int   WIDTH   = 250;

static constexpr Color BG        = {16, 16, 28, 215};
static constexpr Color RULE      = {70, 70, 100, 200};
static constexpr Color C_TITLE   = {150, 150, 180, 255};
static constexpr Color C_SECTION = {120, 220, 255, 255};
static constexpr Color C_LABEL   = {175, 175, 190, 255};
static constexpr Color C_VALUE   = {245, 245, 255, 255};

static constexpr Color HIT_LIVE   = {120, 255, 120, 160};
static constexpr Color HIT_DEAD   = {255, 80, 80, 120};
static constexpr Color HIT_GATED  = {255, 215, 0, 200};
static constexpr Color SPAWN_RING = {255, 255, 255, 40};

// ---------------------------------------------------------------------------
// Arena-space overlay: the exact circles and beam corridors CollisionSystem
// tests against, plus the pickup spawn disc and its keep-out ring.
// ---------------------------------------------------------------------------

static Vector2 flip(const Vec3& p) { return {p.x, -p.y}; }

static void draw_ring(Vector2 c, float r, Color col) {
    DrawRing(c, r - 0.04f, r + 0.04f, 0.0f, 360.0f, 36, col);
}

static void draw_hit_shapes(World& world) {
    PickupConfig pickups;
    if (const auto* cfg = world.try_resource<BalanceConfig>()) pickups = cfg->pickups;

    BeginMode2D(RenderSystem::arena_camera(world));
    draw_ring({0, 0}, pickups.spawn_radius, SPAWN_RING);

    world.each<Enemy, LocalTransform, CircleCollider>(
        [&](Entity e, Enemy& en, LocalTransform& t, CircleCollider& c) {
            draw_ring(flip(t.position), c.radius, en.alive ? HIT_LIVE : HIT_DEAD);

            const auto* beam = world.try_get<LaserBeam>(e);
            if (!beam || !en.alive) return;
            // Corridor edges at +/- thickness around the beam axis.
            const Vec3 n   = {-beam->direction.y * beam->thickness, beam->direction.x * beam->thickness, 0};
            const Vec3 end = {t.position.x + beam->direction.x * beam->length,
                              t.position.y + beam->direction.y * beam->length, 0};
            const Color col = beam->hit_this_burst ? HIT_DEAD : HIT_LIVE;
            DrawLineV(flip({t.position.x + n.x, t.position.y + n.y, 0}), flip({end.x + n.x, end.y + n.y, 0}), col);
            DrawLineV(flip({t.position.x - n.x, t.position.y - n.y, 0}), flip({end.x - n.x, end.y - n.y, 0}), col);
        });

    world.each<Projectile, LocalTransform, CircleCollider>(
        [&](Entity, Projectile& p, LocalTransform& t, CircleCollider& c) {
            if (p.alive) draw_ring(flip(t.position), c.radius, HIT_LIVE);
        });

    world.each<Pickup, LocalTransform, CircleCollider>(
        [&](Entity, Pickup& p, LocalTransform& t, CircleCollider& c) {
            draw_ring(flip(t.position), c.radius, p.touching ? HIT_GATED : HIT_LIVE);
        });

    world.each<Player, LocalTransform, CircleCollider>(
        [&](Entity, Player& p, LocalTransform& t, CircleCollider& c) {
            const bool gated = !p.alive || PlayerSystem::is_dashing(p);
            draw_ring(flip(t.position), c.radius, gated ? HIT_GATED : HIT_LIVE);
            draw_ring(flip(t.position), pickups.min_player_distance, SPAWN_RING);
        });
    EndMode2D();
}

// ---------------------------------------------------------------------------
// Provider table, top right under the HUD
// ---------------------------------------------------------------------------

static void draw_panel(const DebugPanel& panel) {
    const auto& sections = panel.sections();
    const int lines  = static_cast<int>(panel.row_count() + sections.size()) + 2; // + title, legend
    const int height = PAD * 2 + lines * ROW_H + static_cast<int>(sections.size()) * 4;
    const int x = GetScreenWidth() - WIDTH - 10;
    int y = 110;

    DrawRectangle(x, y, WIDTH, height, BG);
    DrawRectangleLines(x, y, WIDTH, height, RULE);
    y += PAD;

    DrawText("NEURAL BREAK / DEBUG", x + PAD, y, FONT + 1, C_TITLE);
    DrawText("[F3]", x + WIDTH - PAD - MeasureText("[F3]", FONT), y, FONT, RULE);
    y += ROW_H;
    int lx = x + PAD;
    for (const auto& [word, col] : {std::pair{"live", HIT_LIVE}, std::pair{"dead", HIT_DEAD},
                                    std::pair{"gated", HIT_GATED}}) {
        DrawText(word, lx, y, FONT, col);
        lx += MeasureText(word, FONT) + 10;
    }
    y += ROW_H;

    for (const auto& sec : sections) {
        DrawLine(x + PAD, y, x + WIDTH - PAD, y, RULE);
        y += 4;
        DrawText(sec.title.c_str(), x + PAD, y, FONT + 1, C_SECTION);
        y += ROW_H;
        for (const auto& row : sec.rows) {
            const std::string value = row.fn();
            // "-": the provider had nothing to report (no player, no match).
            DrawText(row.label.c_str(), x + PAD + LABEL_X, y, FONT, C_LABEL);
            DrawText(value.c_str(), x + PAD + VALUE_X, y, FONT, value == "-" ? RULE : C_VALUE);
            y += ROW_H;
        }
    }
}

void DebugSystem::Update(World& world, float /*dt*/) {
    auto* panel = world.try_resource<DebugPanel>();
    if (!panel) return;

    if (const auto* input = world.try_resource<InputRecord>(); input && input->key_pressed(KEY_F3)) {
        panel->visible = !panel->visible;
    }
    if (!panel->visible) return;

    draw_hit_shapes(world);
    draw_panel(*panel);
}
