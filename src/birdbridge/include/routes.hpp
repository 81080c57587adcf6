#pragma once
#include <chrono>
#include "http_server.hpp"
#include "auth.hpp"
#include "motion_engine.hpp"
#include "sighting_tracker.hpp"
#include "species_detector.hpp"

// Everything the API reads from or drives. Owned by main.
struct BridgeContext {
    SightingTracker& tracker;
    MotionEngine& motion;
    SpeciesDetector& detector;
    std::chrono::steady_clock::time_point started;
};

void register_routes(HttpServer& srv, Auth& auth, BridgeContext& ctx);
