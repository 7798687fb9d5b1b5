#include "gridgeom/core/debug.hpp"

// Initialize static members
std::size_t DebugStats::segments_measured = 0;
double DebugStats::total_distance = 0.0;
double DebugStats::max_segment_distance = 0.0;
std::size_t DebugStats::paths_rasterized = 0;
std::size_t DebugStats::lattice_points = 0;
