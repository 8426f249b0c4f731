#include "sim_params.hpp"

#include <stdexcept>
#include <string>

void validateParams(const SimParams& params) {
    if (params.arenaSize < 1 || params.arenaSize > MAX_ARENA_SIZE) {
        throw std::invalid_argument("arena size must lie in [1, " + std::to_string(MAX_ARENA_SIZE) +
                                    "], got " + std::to_string(params.arenaSize));
    }
    if (!(params.cellSize > 0.0f)) {
        throw std::invalid_argument("cell size must be positive");
    }
    if (!(params.maxTickProgress > 0.0f)) {
        throw std::invalid_argument("tick threshold must be positive");
    }
    if (params.minSpeed < 1 || params.maxSpeed < params.minSpeed) {
        throw std::invalid_argument("speed range [" + std::to_string(params.minSpeed) + ", " +
                                    std::to_string(params.maxSpeed) + "] is empty");
    }
    if (params.seedDensity < 0.0f || params.seedDensity > 1.0f) {
        throw std::invalid_argument("seed density must lie in [0, 1]");
    }
}
