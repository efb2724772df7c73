#include "timer.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

void GameTimer::start() {
    running_ = true;
    elapsed_ = 0.0f;
}

void GameTimer::stop() {
    running_ = false;
}

void GameTimer::update(float dt) {
    if (running_) elapsed_ += dt;
}

float GameTimer::remaining() const {
    return std::max(0.0f, duration_ - elapsed_);
}

float GameTimer::progress() const {
    if (duration_ <= 0.0f) return 100.0f;
    return std::min(100.0f, (elapsed_ / duration_) * 100.0f);
}

std::string GameTimer::formatted_remaining() const {
    const int total   = static_cast<int>(std::floor(remaining()));
    const int minutes = total / 60;
    const int seconds = total % 60;
    char b[16];
    std::snprintf(b, sizeof(b), "%02d:%02d", minutes, seconds);
    return b;
}
