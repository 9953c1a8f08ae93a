#include "reachability.hpp"

#include <deque>
#include <vector>

ReachabilityResult stairsAlwaysReachable(TileGrid& grid, Vec2i stairs, bool alwaysSucceed) {
    ReachabilityResult out;
    const int W = grid.width;
    const int H = grid.height;
    auto idx = [&](int x, int y) -> size_t { return static_cast<size_t>(y * W + x); };

    grid.clearFlagEverywhere(TF_Unreachable);

    std::vector<uint8_t> seen(static_cast<size_t>(W * H), 0);
    std::deque<Vec2i> q;
    if (grid.isWalkable(stairs.x, stairs.y)) {
        seen[idx(stairs.x, stairs.y)] = 1;
        q.push_back(stairs);
    }

    while (!q.empty()) {
        const Vec2i p = q.front();
        q.pop_front();
        out.visited++;
        for (const auto& dv : DIRS4) {
            const int nx = p.x + dv[0];
            const int ny = p.y + dv[1];
            if (!grid.isWalkable(nx, ny) || seen[idx(nx, ny)]) continue;
            seen[idx(nx, ny)] = 1;
            q.push_back({nx, ny});
        }
    }

    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            if (!grid.isWalkable(x, y)) continue;
            out.walkable++;
            if (seen[idx(x, y)]) continue;
            grid.at(x, y).set(TF_Unreachable);
            out.unreachable++;
        }
    }

    out.ok = alwaysSucceed || (out.visited > 0 && out.unreachable == 0);
    return out;
}
