#pragma once

#include "dungeon.hpp"
#include "fixed_room.hpp"
#include "floor_features.hpp"
#include "floor_props.hpp"
#include "grid_layout.hpp"
#include "rng.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Floor orchestrator
//
// An explicit state machine around the generation phases:
//
//   ResetFloor -> LayoutSelected -> GridBuilt -> HallwaysCarved -> JunctionsResolved
//     -> FeaturesApplied -> ReachabilityChecked -> Accepted | Retry
//   Retry -> ResetFloor, or Fallback once the attempt cap is reached
//   Accepted | Fallback -> EntitiesPlaced -> Done
//   LayoutSelected -> FixedRoomLoaded -> Done   (fixed rooms carry their own spawns)
//
// The fallback (one room Monster House) is valid by construction and skips features
// and the reachability check.

enum class GenState : uint8_t {
    ResetFloor = 0,
    LayoutSelected,
    GridBuilt,
    HallwaysCarved,
    JunctionsResolved,
    FeaturesApplied,
    ReachabilityChecked,
    Accepted,
    Retry,
    Fallback,
    FixedRoomLoaded,
    EntitiesPlaced,
    Done,
};

const char* genStateName(GenState s);

enum class GenFailure : uint8_t {
    None = 0,
    StructuralFailure,
    FixedRoomNotFound,
    AttemptsExhausted,
};

const char* genFailureName(GenFailure f);

struct GeneratorOptions {
    int maxAttempts = 10;
};

struct FloorGenReport {
    int attempts = 0;
    bool usedFallback = false;
    bool usedFixedRoom = false;
    FloorLayout layout = FloorLayout::Standard;
    std::vector<GenState> trace;
    std::vector<GenFailure> failures;
    int lastUnreachable = 0;
    FeatureSummary features;
    std::vector<std::string> warnings;
};

class FloorGenerator {
public:
    FloorGenerator(const FloorProperties& props, RandomSource& rng,
                   const FixedRoomProvider* fixedRooms = nullptr,
                   GeneratorOptions options = GeneratorOptions{});

    // Runs to Done. Always produces a floor. Returns false if a mandatory entity
    // (stairs or player) could not be placed; the report says which.
    bool generate(Floor& floor);

    // Performs the work of the current state and moves to the next one.
    // Returns false once Done is reached.
    bool step(Floor& floor);

    GenState state() const { return state_; }
    const FloorGenReport& report() const { return report_; }

private:
    void enter(GenState s);
    void fail(GenFailure f);

    void doLayoutSelected(Floor& floor);
    void doFeaturesApplied(Floor& floor);
    void doPlaceEntities(Floor& floor);
    void checkMandatorySpawns(const Floor& floor);

    FloorProperties props_;
    RandomSource& rng_;
    const FixedRoomProvider* fixedRooms_ = nullptr;
    GeneratorOptions options_;

    GenState state_ = GenState::ResetFloor;
    FloorGenReport report_;
    DungeonGrid cells_;
    bool fixedRoomTried_ = false;
    bool reachable_ = false;
    bool complete_ = true;
};

// Convenience wrapper: one generator run into a floor sized from props.
bool generateFloor(Floor& floor, const FloorProperties& props, RandomSource& rng,
                   const FixedRoomProvider* fixedRooms = nullptr,
                   FloorGenReport* outReport = nullptr,
                   GeneratorOptions options = GeneratorOptions{});
