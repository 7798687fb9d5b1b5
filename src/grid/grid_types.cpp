#include "gridgeom/grid/grid_types.hpp"

#include <ostream>

namespace GridGeom {

std::ostream& operator<<(std::ostream& out, const GridOffset3d& o) {
    return out << "{i: " << o.i << ", j: " << o.j << ", k: " << o.k << "}";
}

std::ostream& operator<<(std::ostream& out, const HexCube3d& h) {
    return out << "{q: " << h.q << ", r: " << h.r << ", s: " << h.s << ", k: " << h.k << "}";
}

} // namespace GridGeom
