#include "tick_scheduler.hpp"

#include <algorithm>
#include <stdexcept>

TickScheduler::TickScheduler(float threshold, int minSpeed, int maxSpeed)
    : maxTickProgress(threshold), minSpeed(minSpeed), maxSpeed(maxSpeed), tickSpeed(minSpeed) {
    if (!(threshold > 0.0f)) {
        throw std::invalid_argument("tick threshold must be positive");
    }
    if (minSpeed < 1 || maxSpeed < minSpeed) {
        throw std::invalid_argument("tick speed range is empty");
    }
}

bool TickScheduler::update(float deltaTime) {
    if (tickProgress >= maxTickProgress) {
        tickProgress = 0.0f;
        return true;
    }
    if (!isPaused && deltaTime > 0.0f) {
        tickProgress += tickSpeed * deltaTime;
    }
    return false;
}

void TickScheduler::increaseSpeed() {
    tickSpeed = std::min(maxSpeed, tickSpeed + 1);
}

void TickScheduler::decreaseSpeed() {
    tickSpeed = std::max(minSpeed, tickSpeed - 1);
}
