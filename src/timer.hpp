#pragma once
#include <string>

// ---------------------------------------------------------------------------
// GameTimer — countdown driven purely by accumulated dt.
//
// Does nothing until start(). A stopped timer keeps its elapsed value. A
// timer with a zero duration reads as expired as soon as it is started.
// No engine dependencies.
// ---------------------------------------------------------------------------

class GameTimer {
public:
    GameTimer() = default;
    explicit GameTimer(float duration) : duration_(duration) {}

    void start();
    void stop();
    void update(float dt);

    // Changes the duration without touching elapsed time.
    void set_duration(float duration) { duration_ = duration; }

    float duration()   const { return duration_; }
    float elapsed()    const { return elapsed_; }
    float remaining()  const;
    bool  running()    const { return running_; }
    bool  is_expired() const { return elapsed_ >= duration_; }

    // Percentage of the duration consumed, clamped to [0, 100].
    float progress() const;

    // Remaining time as "MM:SS".
    std::string formatted_remaining() const;

private:
    float duration_ = 0.0f;
    float elapsed_  = 0.0f;
    bool  running_  = false;
};
