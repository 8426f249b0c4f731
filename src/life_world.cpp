#include "life_world.hpp"

#include <utility>

#include "generation.hpp"
#include "seeding.hpp"

static const SimParams& checked(const SimParams& params) {
    validateParams(params);
    return params;
}

LifeWorld::LifeWorld(const SimParams& params)
    : simParams(checked(params)),
      cells(params.arenaSize),
      cur(params.arenaSize),
      ticks(params.maxTickProgress, params.minSpeed, params.maxSpeed),
      emitter(params.cellSize) {
    if (simParams.seedOnStart) apply(Command::Randomize);
}

bool LifeWorld::frame(float deltaTime) {
    if (!ticks.update(deltaTime)) return false;
    step();
    return true;
}

void LifeWorld::step() {
    Grid next = stepGeneration(cells);
    cells = std::move(next);
    generation++;
    liveCells = cells.countAlive();
}

void LifeWorld::apply(Command command) {
    switch (command) {
        case Command::MoveXPlus:  cur.move(Axis::X, 1); break;
        case Command::MoveXMinus: cur.move(Axis::X, -1); break;
        case Command::MoveYPlus:  cur.move(Axis::Y, 1); break;
        case Command::MoveYMinus: cur.move(Axis::Y, -1); break;
        case Command::MoveZPlus:  cur.move(Axis::Z, 1); break;
        case Command::MoveZMinus: cur.move(Axis::Z, -1); break;
        case Command::FlipCell:
            liveCells += isAlive(cur.flip(cells)) ? 1 : -1;
            break;
        case Command::TogglePause: ticks.togglePause(); break;
        case Command::SpeedUp:     ticks.increaseSpeed(); break;
        case Command::SpeedDown:   ticks.decreaseSpeed(); break;
        case Command::Randomize:
            randomize(cells, simParams.seedDensity, simParams.seed + randomizeCount,
                      simParams.seedExtent);
            randomizeCount++;
            liveCells = cells.countAlive();
            break;
        case Command::Clear:
            cells.clear();
            liveCells = 0;
            break;
    }
}

void LifeWorld::emitInstances(InstanceRenderer& renderer) {
    emitter.rebuild(cells, cur);
    emitter.submit(renderer);
}

Vec3 LifeWorld::cursorPosition() const {
    return cellToWorld(cur.x(), cur.y(), cur.z(), cells.size(), simParams.cellSize);
}

LifeStats LifeWorld::stats() const {
    LifeStats s;
    s.generation = generation;
    s.liveCells = liveCells;
    s.speed = ticks.speed();
    s.paused = ticks.paused();
    return s;
}
