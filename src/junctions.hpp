#pragma once

#include "dungeon.hpp"

// Junction resolver
//
// finalizeJunctions is a single row-major scan. Every open hallway tile flags its open
// non-hallway neighbours as junctions, and hallway anchors are turned into plain
// hallway at the moment the scan reaches them. An anchor therefore gets flagged only
// when one of its hallway neighbours comes before it in scan order:
//
//   xxxxx            xxxxx
//   ---ox  flagged   xo---  not flagged
//   xxx|x            x|xxx
//
// Callers depend on this exact order; do not make it order-independent.
void finalizeJunctions(TileGrid& grid);

// Order-independent variant over the inclusive tile range [x0, x1] x [y0, y1]
// (clipped to the grid). Used for hallways carved after the main scan.
void flagHallwayJunctions(TileGrid& grid, int x0, int y0, int x1, int y1);

// True if (x, y) or any of its 8 neighbours is an open hallway tile.
bool isNextToHallway(const TileGrid& grid, int x, int y);
