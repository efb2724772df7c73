#pragma once
#include <ecs/ecs.hpp>
#include <vector>
#include <functional>

namespace ecs {

/**
 * @brief Manages groups of systems categorized by execution phase.
 *
 * One update() per rendered frame advances the whole simulation by dt:
 * pre-update (event flush, input), logic (movement, firing, spawning), then
 * encounter (collision → scoring → progression → lifecycle → reaper).
 */
class Pipeline {
public:
    using SystemFunc = std::function<void(World&, float)>;

    void add_pre_update(SystemFunc func) { pre_update_.push_back(std::move(func)); }
    void add_logic(SystemFunc func) { logic_.push_back(std::move(func)); }
    void add_encounter(SystemFunc func) { encounter_.push_back(std::move(func)); }
    void add_render(SystemFunc func) { render_.push_back(std::move(func)); }

    /**
     * @brief Executes the standard update flow.
     */
    void update(World& world, float dt) {
        // 1. Input / Pre-processing
        for (auto& sys : pre_update_) sys(world, dt);

        // 2. Gameplay Logic
        for (auto& sys : logic_) sys(world, dt);

        // 3. Sync structural changes (spawned actors) before resolution
        world.deferred().flush(world);

        // 4. Encounter resolution, strictly ordered
        for (auto& sys : encounter_) sys(world, dt);

        // 5. Cleanup / Sync structural changes before rendering
        world.deferred().flush(world);
    }

    /**
     * @brief Executes rendering systems.
     */
    void render(World& world, float dt = 0.0f) {
        for (auto& sys : render_) sys(world, dt);
    }

private:
    std::vector<SystemFunc> pre_update_;
    std::vector<SystemFunc> logic_;
    std::vector<SystemFunc> encounter_;
    std::vector<SystemFunc> render_;
};

} // namespace ecs
