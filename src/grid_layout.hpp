#pragma once

#include "dungeon.hpp"
#include "floor_props.hpp"
#include "rng.hpp"

#include <cstdint>
#include <vector>

// Grid layout planner
//
// The floor is partitioned into a cols x rows arrangement of cells. Each valid cell
// becomes either a room (a random rectangle inset from the cell) or a hallway anchor
// (a single placeholder tile at the cell centre). Connections between neighbouring
// cells are recorded here and carved later by the hallway carver.
//
// The cell grid only lives for one generation attempt.

enum class CellRole : uint8_t {
    Unused = 0,
    Room,
    HallwayAnchor,
};

struct GridCell {
    Recti bounds;           // tile-space rectangle of the cell
    Recti area;             // room rectangle, or the 1x1 anchor tile
    CellRole role = CellRole::Unused;
    bool invalid = false;   // cut by the floor size class or the layout shape
    uint8_t roomIndex = ROOM_HALLWAY;

    bool connTop = false;
    bool connBottom = false;
    bool connLeft = false;
    bool connRight = false;

    // Fused with the room cell below (shares its room index and rectangle).
    bool mergedBelow = false;

    bool usable() const { return !invalid && role != CellRole::Unused; }
    int connectionCount() const {
        return static_cast<int>(connTop) + static_cast<int>(connBottom) +
               static_cast<int>(connLeft) + static_cast<int>(connRight);
    }
};

struct DungeonGrid {
    int cols = 0;
    int rows = 0;
    // Cell boundaries: xs has cols+1 entries, ys has rows+1 entries.
    std::vector<int> xs;
    std::vector<int> ys;
    std::vector<GridCell> cells;

    bool inGrid(int x, int y) const { return x >= 0 && y >= 0 && x < cols && y < rows; }

    GridCell& cell(int x, int y) { return cells[static_cast<size_t>(y * cols + x)]; }
    const GridCell& cell(int x, int y) const { return cells[static_cast<size_t>(y * cols + x)]; }

    bool usable(int x, int y) const { return inGrid(x, y) && cell(x, y).usable(); }
};

// Boundary list for `count` cells over `extent` tiles: list[i] = i * (extent / count),
// with the last entry pinned to extent.
std::vector<int> gridPositions(int extent, int count);

// Sizes the grid and computes cell rectangles. Columns past the floor size class are
// marked invalid (medium keeps 3/4 of the columns, small keeps half, at least one).
void initDungeonGrid(DungeonGrid& grid, int width, int height, int cols, int rows, FloorSize size);

// Distributes room roles over the valid cells (everything else becomes an anchor).
// Returns the number of rooms assigned.
int assignRooms(DungeonGrid& grid, int roomDensity, RandomSource& rng);

// Links neighbouring cells on both sides. dir uses the DIRS4 order.
void linkCells(DungeonGrid& grid, int x, int y, int dir);
bool cellsLinked(const DungeonGrid& grid, int x, int y, int dir);

// Random walk of `steps` moves over usable cells, linking every cell it crosses.
void assignGridCellConnections(DungeonGrid& grid, int steps, RandomSource& rng);

// Links isolated rooms to a neighbour, drops isolated anchors and (unless dead ends
// are allowed) gives single-connection anchors a second link where one is possible.
void ensureConnectedGrid(DungeonGrid& grid, bool allowDeadEnds, RandomSource& rng);

// Stamps rooms and anchors into the tile grid and records RoomInfo entries.
// Returns false when a room cell is too small for a 5x4 room (structural failure).
bool createRoomsAndAnchors(Floor& floor, DungeonGrid& grid, const FloorProperties& props, RandomSource& rng);

// Fuses the room cells in column x from row y0 to row y1 (inclusive) into one room.
bool mergeRoomsVertically(Floor& floor, DungeonGrid& grid, int x, int y0, int y1);

// The guaranteed-valid fallback: one room covering the floor minus a 2 tile margin,
// flagged as a Monster House.
void buildOneRoomMonsterHouse(Floor& floor);

// Runs the planner for one macro layout. The floor must be freshly reset.
// Returns false on a structural precondition failure.
bool planLayout(Floor& floor, DungeonGrid& grid, FloorLayout layout, const FloorProperties& props, RandomSource& rng);
