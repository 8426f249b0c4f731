#include <cassert>
#include <iostream>
#include <stdexcept>
#include "life_world.hpp"
#include "recording_renderer.hpp"

SimParams small_params() {
    SimParams params;
    params.arenaSize = 8;
    params.seedExtent = 6;
    params.seedDensity = 0.5f;
    params.seedOnStart = false;
    return params;
}

void test_starts_empty() {
    LifeWorld world(small_params());
    LifeStats stats = world.stats();
    assert(stats.generation == 0);
    assert(stats.liveCells == 0);
    assert(stats.speed == 1);
    assert(!stats.paused);
    assert(world.grid().size() == 8);
    std::cout << "PASSED: test_starts_empty\n";
}

void test_seeds_on_start() {
    SimParams params = small_params();
    params.seedOnStart = true;
    LifeWorld world(params);
    assert(world.stats().generation == 0);
    assert(world.stats().liveCells > 0);
    assert(world.stats().liveCells == world.grid().countAlive());

    // same as an explicit Randomize on an empty world
    LifeWorld manual(small_params());
    manual.apply(Command::Randomize);
    assert(world.grid() == manual.grid());
    std::cout << "PASSED: test_seeds_on_start\n";
}

void test_frames_drive_generations() {
    LifeWorld world(small_params());
    assert(!world.frame(0.1f));
    assert(!world.frame(0.1f));
    assert(!world.frame(0.1f));
    assert(world.frame(0.1f));
    assert(world.stats().generation == 1);
    assert(!world.frame(0.0f));
    assert(world.stats().generation == 1);
    std::cout << "PASSED: test_frames_drive_generations\n";
}

void test_commands_move_and_flip() {
    LifeWorld world(small_params());
    world.apply(Command::MoveXPlus);
    world.apply(Command::MoveYMinus);
    world.apply(Command::MoveZMinus);
    world.apply(Command::MoveZMinus);
    assert(world.cursor().at(5, 3, 2));

    world.apply(Command::FlipCell);
    assert(world.grid().get(5, 3, 2) == Cell::Alive);
    assert(world.stats().liveCells == 1);
    world.apply(Command::FlipCell);
    assert(world.grid().get(5, 3, 2) == Cell::Dead);
    assert(world.stats().liveCells == 0);

    world.apply(Command::MoveXMinus);
    world.apply(Command::MoveYPlus);
    world.apply(Command::MoveZPlus);
    assert(world.cursor().at(4, 4, 3));
    std::cout << "PASSED: test_commands_move_and_flip\n";
}

void test_pause_and_speed_commands() {
    LifeWorld world(small_params());
    world.apply(Command::SpeedUp);
    world.apply(Command::SpeedUp);
    assert(world.stats().speed == 3);
    world.apply(Command::SpeedDown);
    assert(world.stats().speed == 2);

    world.apply(Command::TogglePause);
    assert(world.stats().paused);
    for (int i = 0; i < 50; i++) assert(!world.frame(0.5f));
    assert(world.stats().generation == 0);
    world.apply(Command::TogglePause);
    assert(!world.stats().paused);
    std::cout << "PASSED: test_pause_and_speed_commands\n";
}

void test_randomize_and_clear() {
    LifeWorld world(small_params());
    world.apply(Command::Randomize);
    int first = world.stats().liveCells;
    assert(first > 0);
    assert(first == world.grid().countAlive());

    world.apply(Command::Clear);
    assert(world.stats().liveCells == 0);
    assert(world.grid().countAlive() == 0);

    // the same sequence of commands reproduces the same arena
    LifeWorld other(small_params());
    other.apply(Command::Randomize);
    LifeWorld again(small_params());
    again.apply(Command::Randomize);
    assert(other.grid() == again.grid());
    std::cout << "PASSED: test_randomize_and_clear\n";
}

void test_step_replaces_grid() {
    LifeWorld world(small_params());
    world.apply(Command::FlipCell);   // a lone cell at the center
    world.step();
    assert(world.stats().generation == 1);
    assert(world.stats().liveCells == 0);
    assert(world.grid().countAlive() == 0);
    std::cout << "PASSED: test_step_replaces_grid\n";
}

void test_emit_skips_cursor() {
    LifeWorld world(small_params());
    world.apply(Command::FlipCell);
    world.apply(Command::MoveXPlus);
    world.apply(Command::FlipCell);

    RecordingRenderer renderer;
    world.emitInstances(renderer);
    assert(renderer.draws == 1);
    assert(renderer.positions.size() == 1);
    assert(renderer.positions[0] == (Vec3{0.0f, 0.0f, 0.0f}));
    assert(world.cursorPosition() == (Vec3{1.0f, 0.0f, 0.0f}));
    std::cout << "PASSED: test_emit_skips_cursor\n";
}

void test_rejects_bad_params() {
    SimParams params = small_params();
    params.arenaSize = 0;
    bool threw = false;
    try {
        LifeWorld world(params);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    params = small_params();
    params.seedDensity = 1.5f;
    threw = false;
    try {
        LifeWorld world(params);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    params = small_params();
    params.arenaSize = MAX_ARENA_SIZE + 1;
    threw = false;
    try {
        LifeWorld world(params);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED: test_rejects_bad_params\n";
}

int main() {
    test_starts_empty();
    test_seeds_on_start();
    test_frames_drive_generations();
    test_commands_move_and_flip();
    test_pause_and_speed_commands();
    test_randomize_and_clear();
    test_step_replaces_grid();
    test_emit_skips_cursor();
    test_rejects_bad_params();

    std::cout << "\nAll world tests passed!\n";
    return 0;
}
