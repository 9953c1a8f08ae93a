#pragma once

#include "dungeon.hpp"

struct ReachabilityResult {
    bool ok = false;
    int visited = 0;
    int walkable = 0;
    int unreachable = 0;
};

// Breadth-first walk from the stairs over 4-connected walkable tiles (open and not
// impassable). Every walkable tile that was not reached gets TF_Unreachable, all
// others have it cleared. ok is false when anything is unreachable or the stairs tile
// itself is not walkable, unless alwaysSucceed is set (diagnostic mode: the
// annotations are still written).
ReachabilityResult stairsAlwaysReachable(TileGrid& grid, Vec2i stairs, bool alwaysSucceed = false);
