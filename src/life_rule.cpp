#include "life_rule.hpp"

Cell nextState(Cell current, int liveNeighbours) {
    Cell next = Cell::Dead;
    if (isAlive(current)) {
        if (liveNeighbours == 3 || liveNeighbours == 5) next = Cell::Alive;
    } else if (liveNeighbours == 5) {
        next = Cell::Alive;
    }
    return next;
}
