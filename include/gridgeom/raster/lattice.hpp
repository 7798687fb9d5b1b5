/**
 * @file lattice.hpp
 * @brief Integer lattice points produced by the line rasterizers
 */

#ifndef GRIDGEOM_LATTICE_HPP
#define GRIDGEOM_LATTICE_HPP

#include <iosfwd>

namespace GridGeom {

struct LatticePoint2 {
    int x = 0;
    int y = 0;

    bool operator==(const LatticePoint2& o) const { return x == o.x && y == o.y; }
    bool operator!=(const LatticePoint2& o) const { return !(*this == o); }
};

struct LatticePoint3 {
    int x = 0;
    int y = 0;
    int z = 0;

    bool operator==(const LatticePoint3& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const LatticePoint3& o) const { return !(*this == o); }
};

struct LatticePoint4 {
    int x = 0;
    int y = 0;
    int z = 0;
    int w = 0;

    bool operator==(const LatticePoint4& o) const { return x == o.x && y == o.y && z == o.z && w == o.w; }
    bool operator!=(const LatticePoint4& o) const { return !(*this == o); }
};

std::ostream& operator<<(std::ostream& out, const LatticePoint2& p);
std::ostream& operator<<(std::ostream& out, const LatticePoint3& p);
std::ostream& operator<<(std::ostream& out, const LatticePoint4& p);

} // namespace GridGeom

#endif // GRIDGEOM_LATTICE_HPP
