#include "config.hpp"
#include "events.hpp"
#include "pipeline.hpp"
#include "modules/audio_module.hpp"
#include "modules/camera_module.hpp"
#include "modules/combat_module.hpp"
#include "modules/debug_module.hpp"
#include "modules/event_bus_module.hpp"
#include "modules/input_module.hpp"
#include "modules/progression_module.hpp"
#include "modules/render_module.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <algorithm>
#include <string>

static const char* CONFIG_PATH = "resources/config/balance.json";

static int trace_level(const std::string& name) {
    if (name == "debug")   return LOG_DEBUG;
    if (name == "warning") return LOG_WARNING;
    if (name == "error")   return LOG_ERROR;
    return LOG_INFO;
}

int main() {
  BalanceConfig cfg;
  if (!ConfigLoader::load(CONFIG_PATH, cfg)) {
      TraceLog(LOG_WARNING, "CONFIG: using built-in balance defaults");
  }
  SetTraceLogLevel(trace_level(cfg.log_level));

  InitWindow(1280, 720, "Neural Break");
  SetTargetFPS(60);

  ecs::World world;
  world.set_resource(cfg);

  ecs::Pipeline pipeline;

  // --- Module Installation ---
  // Order matters: EventBus first (creates the registry), DebugPanel before
  // any module that adds rows, Combat before Progression (encounter order),
  // presentation consumers after both, Present last in the Render phase.
  EventBusModule::install(world, pipeline);
  DebugModule::create(world);
  InputModule::install(world, pipeline);
  CombatModule::install(world, pipeline);
  ProgressionModule::install(world, pipeline);
  CameraModule::install(world, pipeline);
  AudioModule::install(world, pipeline);
  RenderModule::install(world, pipeline);
  DebugModule::install(world, pipeline);
  RenderModule::install_present(world, pipeline);

  TraceLog(LOG_INFO, "GAME: %d levels loaded, seed %u",
           static_cast<int>(cfg.levels.size()), static_cast<unsigned>(cfg.rng_seed));

  // --- Main Loop ---
  // One simulation step per rendered frame; long frames are clamped so a
  // stall cannot tunnel projectiles through enemies.
  const float max_dt = 1.0f / 30.0f;

  while (!WindowShouldClose()) {
    const float dt = std::min(GetFrameTime(), max_dt);
    pipeline.update(world, dt);
    pipeline.render(world, dt);
  }

  AudioModule::shutdown(world);
  CloseWindow();
  return 0;
}
