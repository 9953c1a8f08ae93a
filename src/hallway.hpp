#pragma once

#include "dungeon.hpp"
#include "grid_layout.hpp"
#include "rng.hpp"

#include <vector>

// Tiles a hallway between start and end would cover, in order from start.
// Points sharing an axis give a straight line. Otherwise a horizontal hallway runs
// start -> (middleX, start.y) -> (middleX, end.y) -> end, and a vertical one
// start -> (start.x, middleY) -> (end.x, middleY) -> end.
std::vector<Vec2i> hallwayPath(Vec2i start, Vec2i end, bool vertical, int middleX, int middleY);

// Carves the path from both ends. Each pass turns walls into hallway floor and stops
// at the first tile that is already open (the starting tile excepted) or impassable.
// Returns the number of tiles carved.
int createHallway(TileGrid& grid, Vec2i start, Vec2i end, bool vertical, int middleX, int middleY);

// Carves one hallway per linked pair of cells, row-major, right link before bottom link.
// Returns the number of hallways created.
int createGridCellConnections(TileGrid& grid, const DungeonGrid& cells, RandomSource& rng);
