#pragma once
#include "cell_grid.hpp"
#include "cursor.hpp"
#include "instances.hpp"
#include "sim_params.hpp"
#include "tick_scheduler.hpp"
#include "vec3.hpp"

// Discrete commands delivered by the input layer.
enum class Command {
    MoveXPlus, MoveXMinus,
    MoveYPlus, MoveYMinus,
    MoveZPlus, MoveZMinus,
    FlipCell,
    TogglePause,
    SpeedUp, SpeedDown,
    Randomize,
    Clear
};

struct LifeStats {
    unsigned long generation;
    int liveCells;
    int speed;
    bool paused;
};

/*
LifeWorld: the simulation as the front end sees it. Owns the grid and
replaces it wholesale on every generation; the cursor and the commands
are the only other ways the grid changes. Starts with the center seeded
unless params.seedOnStart is false.
*/
class LifeWorld {
    public:
        explicit LifeWorld(const SimParams& params = SimParams());

        // Advances the scheduler by one frame. Returns true if a generation ran.
        bool frame(float deltaTime);

        // Runs one generation now, regardless of the scheduler.
        void step();

        void apply(Command command);

        // Rebuilds the instance list from the current grid and hands it over.
        void emitInstances(InstanceRenderer& renderer);

        Vec3 cursorPosition() const;
        LifeStats stats() const;

        const Grid& grid() const { return cells; }
        const Cursor& cursor() const { return cur; }
        const TickScheduler& scheduler() const { return ticks; }
        const SimParams& params() const { return simParams; }

    private:
        SimParams simParams;
        Grid cells;
        Cursor cur;
        TickScheduler ticks;
        InstanceEmitter emitter;

        unsigned long generation = 0;
        int liveCells = 0;
        unsigned randomizeCount = 0;
};
