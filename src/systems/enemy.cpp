#include "enemy.hpp"
#include <algorithm>

void EnemySystem::take_damage(Enemy& e, int amount, float death_duration) {
    if (!e.alive || amount <= 0) return;
    e.health = std::max(0, e.health - amount);
    if (e.health == 0) {
        e.alive       = false;
        e.death_timer = death_duration;
    }
}

bool EnemySystem::should_track_kill(const Enemy& e) {
    return !e.alive && !e.kill_tracked;
}

void EnemySystem::mark_kill_tracked(Enemy& e) {
    e.kill_tracked = true;
}

bool EnemySystem::force_kill(Enemy& e, float death_duration) {
    if (!e.alive) return false;
    e.health       = 0;
    e.alive        = false;
    e.death_timer  = death_duration;
    e.kill_tracked = true;
    return true;
}
