#include "floor_generator.hpp"

#include "hallway.hpp"
#include "junctions.hpp"
#include "reachability.hpp"
#include "spawn.hpp"

#include <algorithm>

const char* genStateName(GenState s) {
    switch (s) {
        case GenState::ResetFloor:          return "ResetFloor";
        case GenState::LayoutSelected:      return "LayoutSelected";
        case GenState::GridBuilt:           return "GridBuilt";
        case GenState::HallwaysCarved:      return "HallwaysCarved";
        case GenState::JunctionsResolved:   return "JunctionsResolved";
        case GenState::FeaturesApplied:     return "FeaturesApplied";
        case GenState::ReachabilityChecked: return "ReachabilityChecked";
        case GenState::Accepted:            return "Accepted";
        case GenState::Retry:               return "Retry";
        case GenState::Fallback:            return "Fallback";
        case GenState::FixedRoomLoaded:     return "FixedRoomLoaded";
        case GenState::EntitiesPlaced:      return "EntitiesPlaced";
        case GenState::Done:                return "Done";
    }
    return "Unknown";
}

const char* genFailureName(GenFailure f) {
    switch (f) {
        case GenFailure::None:              return "None";
        case GenFailure::StructuralFailure: return "StructuralFailure";
        case GenFailure::FixedRoomNotFound: return "FixedRoomNotFound";
        case GenFailure::AttemptsExhausted: return "AttemptsExhausted";
    }
    return "Unknown";
}

FloorGenerator::FloorGenerator(const FloorProperties& props, RandomSource& rng,
                               const FixedRoomProvider* fixedRooms, GeneratorOptions options)
    : props_(props), rng_(rng), fixedRooms_(fixedRooms), options_(options) {
    props_.width = clampi(props_.width, FLOOR_MIN_WIDTH, FLOOR_MAX_WIDTH);
    props_.height = clampi(props_.height, FLOOR_MIN_HEIGHT, FLOOR_MAX_HEIGHT);
    options_.maxAttempts = std::max(1, options_.maxAttempts);
    report_.layout = props_.layout;
    report_.trace.push_back(state_);
}

void FloorGenerator::enter(GenState s) {
    state_ = s;
    report_.trace.push_back(s);
}

void FloorGenerator::fail(GenFailure f) {
    report_.failures.push_back(f);
}

bool FloorGenerator::generate(Floor& floor) {
    while (step(floor)) {
    }
    return complete_;
}

bool FloorGenerator::step(Floor& floor) {
    switch (state_) {
        case GenState::ResetFloor:
            if (floor.width() != props_.width || floor.height() != props_.height) {
                floor = Floor(props_.width, props_.height);
            } else {
                floor.reset();
            }
            cells_ = DungeonGrid{};
            reachable_ = false;
            report_.attempts++;
            enter(GenState::LayoutSelected);
            return true;

        case GenState::LayoutSelected:
            doLayoutSelected(floor);
            return true;

        case GenState::GridBuilt:
            createGridCellConnections(floor.grid, cells_, rng_);
            enter(GenState::HallwaysCarved);
            return true;

        case GenState::HallwaysCarved:
            finalizeJunctions(floor.grid);
            enter(GenState::JunctionsResolved);
            return true;

        case GenState::JunctionsResolved:
            report_.features = applyFloorFeatures(floor, props_, rng_);
            enter(GenState::FeaturesApplied);
            return true;

        case GenState::FeaturesApplied:
            doFeaturesApplied(floor);
            enter(GenState::ReachabilityChecked);
            return true;

        case GenState::ReachabilityChecked:
            if (reachable_) {
                enter(GenState::Accepted);
            } else {
                fail(GenFailure::StructuralFailure);
                enter(GenState::Retry);
            }
            return true;

        case GenState::Retry:
            if (report_.attempts >= options_.maxAttempts) {
                fail(GenFailure::AttemptsExhausted);
                enter(GenState::Fallback);
            } else {
                enter(GenState::ResetFloor);
            }
            return true;

        case GenState::Fallback:
            floor.reset();
            buildOneRoomMonsterHouse(floor);
            finalizeJunctions(floor.grid);
            report_.usedFallback = true;
            report_.layout = FloorLayout::OneRoomMonsterHouse;
            report_.features = FeatureSummary{};
            report_.features.monsterHouseRoom = 0;
            doPlaceEntities(floor);
            enter(GenState::EntitiesPlaced);
            return true;

        case GenState::Accepted:
            doPlaceEntities(floor);
            enter(GenState::EntitiesPlaced);
            return true;

        case GenState::FixedRoomLoaded:
        case GenState::EntitiesPlaced:
            checkMandatorySpawns(floor);
            enter(GenState::Done);
            return true;

        case GenState::Done:
            return false;
    }
    return false;
}

void FloorGenerator::doLayoutSelected(Floor& floor) {
    if (props_.fixedRoomId > 0 && !fixedRoomTried_) {
        fixedRoomTried_ = true;

        FixedRoomData data;
        if (fixedRooms_ && fixedRooms_->load(props_.fixedRoomId, data)) {
            std::string err;
            if (stampFixedRoom(floor, data, &err)) {
                report_.usedFixedRoom = true;
                enter(GenState::FixedRoomLoaded);
                return;
            }
            report_.warnings.push_back(err);
        }

        fail(GenFailure::FixedRoomNotFound);
        report_.warnings.push_back("fixed room " + std::to_string(props_.fixedRoomId) +
                                   " not available; generating a " + floorLayoutName(props_.layout) + " floor");
    }

    if (planLayout(floor, cells_, props_.layout, props_, rng_)) {
        enter(GenState::GridBuilt);
    } else {
        fail(GenFailure::StructuralFailure);
        enter(GenState::Retry);
    }
}

void FloorGenerator::doFeaturesApplied(Floor& floor) {
    // The reachability walk starts at the stairs, so they are placed here.
    if (!spawnStairs(floor, props_, rng_)) {
        reachable_ = false;
        report_.lastUnreachable = 0;
        return;
    }

    const ReachabilityResult r = stairsAlwaysReachable(floor.grid, floor.stairs);
    reachable_ = r.ok;
    if (!r.ok) report_.lastUnreachable = r.unreachable;
}

void FloorGenerator::doPlaceEntities(Floor& floor) {
    const bool house = floor.grid.countFlag(TF_MonsterHouse) > 0;
    const bool emptyHouse = house && rng_.chancePct(props_.emptyMonsterHouseChance);

    spawnNonEnemies(floor, props_, emptyHouse, rng_);
    spawnEnemies(floor, props_, emptyHouse, rng_);
    resolveInvalidSpawns(floor);
}

void FloorGenerator::checkMandatorySpawns(const Floor& floor) {
    if (!floor.hasSpawn(SpawnKind::Stairs)) {
        complete_ = false;
        report_.warnings.push_back("no eligible tile for the stairs");
    }
    if (!floor.hasSpawn(SpawnKind::Player)) {
        complete_ = false;
        report_.warnings.push_back("no eligible tile for the player");
    }
}

bool generateFloor(Floor& floor, const FloorProperties& props, RandomSource& rng,
                   const FixedRoomProvider* fixedRooms, FloorGenReport* outReport,
                   GeneratorOptions options) {
    FloorGenerator gen(props, rng, fixedRooms, options);
    const bool ok = gen.generate(floor);
    if (outReport) *outReport = gen.report();
    return ok;
}
