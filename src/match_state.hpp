#pragma once
#include "actor_types.hpp"
#include "timer.hpp"
#include <ecs/ecs.hpp>
#include <array>
#include <cstdint>
#include <random>
#include <vector>

// ---------------------------------------------------------------------------
// Match-level World resources.
//
// MultiplierState and GameStats are written only by ScoringSystem (and reset
// by LifecycleSystem at match/level boundaries). GameFlow and LevelProgress
// are written only by LifecycleSystem / LevelSystem. Everything else reads.
// ---------------------------------------------------------------------------

enum class GameState : uint8_t {
    StartScreen,
    Playing,
    DeathAnimation,
    GameOver,
    LevelTransition,
};

enum class TransitionPhase : uint8_t {
    None,
    Clearing,
    Displaying,
    Complete,
};

inline const char* game_state_name(GameState s) {
    switch (s) {
        case GameState::StartScreen:     return "StartScreen";
        case GameState::Playing:         return "Playing";
        case GameState::DeathAnimation:  return "DeathAnimation";
        case GameState::GameOver:        return "GameOver";
        case GameState::LevelTransition: return "LevelTransition";
    }
    return "?";
}

inline const char* transition_phase_name(TransitionPhase p) {
    switch (p) {
        case TransitionPhase::None:       return "None";
        case TransitionPhase::Clearing:   return "Clearing";
        case TransitionPhase::Displaying: return "Displaying";
        case TransitionPhase::Complete:   return "Complete";
    }
    return "?";
}

struct MultiplierState {
    float clock          = 0.0f;  // scoring time; advances only while Playing
    int   multiplier     = 1;
    int   combo_count    = 0;
    bool  has_last_kill  = false;
    float last_kill_time = 0.0f;  // clock value at the previous kill
    float combo_timer    = 0.0f;  // seconds remaining
    float decay_timer    = 0.0f;  // seconds remaining, for display only
};

struct GameStats {
    int   score              = 0;
    float survived_time      = 0.0f;
    int   level              = 1;
    int   enemies_killed     = 0;
    std::array<int, ENEMY_TYPE_COUNT> kills_by_type{};
    int   damage_taken       = 0;
    int   total_xp           = 0;
    int   highest_combo      = 0;
    int   highest_multiplier = 1;
};

struct LevelProgress {
    int  current_level       = 1;  // 1-based
    int  total_levels        = 1;
    std::array<int, ENEMY_TYPE_COUNT> kills{};
    bool objectives_complete = false;
    GameTimer level_timer;         // only runs for levels with a duration
};

// A forced clearing death scheduled for a future point of the transition.
struct PendingKill {
    ecs::Entity entity;
    float       fire_at = 0.0f;   // seconds since Clearing began
};

struct GameFlow {
    GameState       state   = GameState::StartScreen;
    TransitionPhase phase   = TransitionPhase::None;
    bool            paused  = false;
    bool            victory = false;
    bool            spawning_enabled = false;

    GameTimer death_timer;
    GameTimer phase_timer;
    std::vector<PendingKill> pending_kills;

    std::mt19937 rng{1337};
};

// Menu-level commands, written by the host input layer.
struct MatchInput {
    bool confirm = false;
    bool pause   = false;
};

inline bool is_playing(const GameFlow& flow) {
    return flow.state == GameState::Playing && !flow.paused;
}

// Gameplay systems early-out unless this holds. A world without GameFlow
// (unit tests, tools) is always treated as playing.
inline bool gameplay_active(ecs::World& world) {
    auto* flow = world.try_resource<GameFlow>();
    return !flow || is_playing(*flow);
}
