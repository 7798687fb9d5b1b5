#pragma once

#include <cstddef>
#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef GRIDGEOM_ENABLE_DEBUG
#define GRIDGEOM_ENABLE_DEBUG 0
#endif

// Debug levels
#define GRIDGEOM_DEBUG_LEVEL_NONE 0
#define GRIDGEOM_DEBUG_LEVEL_BASIC 1
#define GRIDGEOM_DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef GRIDGEOM_CURRENT_DEBUG_LEVEL
#define GRIDGEOM_CURRENT_DEBUG_LEVEL GRIDGEOM_DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define GRIDGEOM_DEBUG_MSG(level, x) do { \
    if (GRIDGEOM_ENABLE_DEBUG && level <= GRIDGEOM_CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Helper class for collecting measurement stats
class DebugStats {
public:
    static void reset() {
        segments_measured = 0;
        total_distance = 0.0;
        max_segment_distance = 0.0;
        paths_rasterized = 0;
        lattice_points = 0;
    }

    static void recordSegment(double distance) {
        segments_measured++;
        total_distance += distance;
        if (distance > max_segment_distance) {
            max_segment_distance = distance;
        }
    }

    static void recordPath(std::size_t points) {
        paths_rasterized++;
        lattice_points += points;
    }

    static std::size_t segmentCount() { return segments_measured; }
    static std::size_t latticePointCount() { return lattice_points; }

    static void printMeasureStats() {
        GRIDGEOM_DEBUG_MSG(GRIDGEOM_DEBUG_LEVEL_BASIC,
            "Measure stats:\n"
            "  Segments measured: " << segments_measured << "\n"
            "  Total distance: " << total_distance << "\n"
            "  Max segment: " << max_segment_distance << "\n"
        );
    }

    static void printRasterStats() {
        GRIDGEOM_DEBUG_MSG(GRIDGEOM_DEBUG_LEVEL_BASIC,
            "Raster stats:\n"
            "  Paths rasterized: " << paths_rasterized << "\n"
            "  Lattice points: " << lattice_points << "\n"
            "  Avg points/path: " << (paths_rasterized > 0 ? double(lattice_points) / paths_rasterized : 0.0) << "\n"
        );
    }

private:
    static std::size_t segments_measured;
    static double total_distance;
    static double max_segment_distance;
    static std::size_t paths_rasterized;
    static std::size_t lattice_points;
};
