#pragma once

// ============================================================
// Simulation parameters
// ============================================================
constexpr int   ARENA_SIZE        = 128;
constexpr int   MAX_ARENA_SIZE    = 256;     // keeps size^3 cell indices well inside int
constexpr float CELL_SIZE         = 1.0f;
constexpr float MAX_TICK_PROGRESS = 0.25f;   // one generation per quarter second at speed 1
constexpr int   MIN_TICK_SPEED    = 1;
constexpr int   MAX_TICK_SPEED    = 5;

// ============================================================
// Seeding
// ============================================================
constexpr float SEED_DENSITY = 0.15f;
constexpr int   SEED_EXTENT  = 24;           // side of the centered seeded cube
constexpr unsigned SEED      = 42;
constexpr bool  SEED_ON_START = true;

// Generations between status lines on stdout.
constexpr int REPORT_EVERY = 50;

struct SimParams {
    int arenaSize = ARENA_SIZE;
    float cellSize = CELL_SIZE;
    float maxTickProgress = MAX_TICK_PROGRESS;
    int minSpeed = MIN_TICK_SPEED;
    int maxSpeed = MAX_TICK_SPEED;

    float seedDensity = SEED_DENSITY;
    int seedExtent = SEED_EXTENT;
    unsigned seed = SEED;
    bool seedOnStart = SEED_ON_START;
};

// Throws std::invalid_argument when a field is out of its usable range.
void validateParams(const SimParams& params);
