#include "gridgeom/raster/bresenham.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <ostream>
#include <stdexcept>

#include "gridgeom/grid/i_grid_provider.hpp"

namespace GridGeom {

namespace {

int sgn(int v) {
    return (v > 0) - (v < 0);
}

/**
 * N-axis Bresenham. One error term per secondary axis; a secondary axis steps
 * when its error reaches zero and then pays back twice the driving delta.
 */
template <std::size_t N>
std::vector<std::array<int, N>> bresenhamN(const std::array<int, N>& a, const std::array<int, N>& b) {
    std::array<int, N> delta{};
    std::array<int, N> step{};
    std::size_t drive = 0;
    for (std::size_t i = 0; i < N; ++i) {
        delta[i] = std::abs(b[i] - a[i]);
        step[i] = sgn(b[i] - a[i]);
        if (delta[i] > delta[drive]) {
            drive = i;
        }
    }

    int const n = delta[drive];
    std::vector<std::array<int, N>> path;
    path.reserve(static_cast<std::size_t>(n) + 1);

    std::array<int, N> cur = a;
    path.push_back(cur);

    std::array<int, N> err{};
    for (std::size_t i = 0; i < N; ++i) {
        err[i] = (2 * delta[i]) - n;
    }

    for (int t = 0; t < n; ++t) {
        for (std::size_t i = 0; i < N; ++i) {
            if (i == drive) continue;
            if (err[i] >= 0) {
                cur[i] += step[i];
                err[i] -= 2 * n;
            }
            err[i] += 2 * delta[i];
        }
        cur[drive] += step[drive];
        path.push_back(cur);
    }

    assert(path.back() == b && "Bresenham line must end on its endpoint.");
    return path;
}

/**
 * Spreads `minor` unit steps over `major` driving steps. Entry t (1-based) is
 * true when the minor axis moves on driving step t.
 */
std::vector<bool> coupledSteps(int major, int minor) {
    std::vector<bool> moves(static_cast<std::size_t>(major) + 1, false);
    int err = (2 * minor) - major;
    for (int t = 1; t <= major; ++t) {
        if (err >= 0) {
            moves[t] = true;
            err -= 2 * major;
        }
        err += 2 * minor;
    }
    return moves;
}

} // namespace

std::vector<LatticePoint2> bresenham2d(const LatticePoint2& a, const LatticePoint2& b) {
    auto const pts = bresenhamN<2>({a.x, a.y}, {b.x, b.y});
    std::vector<LatticePoint2> path;
    path.reserve(pts.size());
    for (auto const& p : pts) {
        path.push_back({p[0], p[1]});
    }
    return path;
}

std::vector<LatticePoint3> bresenham3d(const LatticePoint3& a, const LatticePoint3& b) {
    auto const pts = bresenhamN<3>({a.x, a.y, a.z}, {b.x, b.y, b.z});
    std::vector<LatticePoint3> path;
    path.reserve(pts.size());
    for (auto const& p : pts) {
        path.push_back({p[0], p[1], p[2]});
    }
    return path;
}

std::vector<LatticePoint4> bresenham4d(const LatticePoint4& a, const LatticePoint4& b) {
    auto const pts = bresenhamN<4>({a.x, a.y, a.z, a.w}, {b.x, b.y, b.z, b.w});
    std::vector<LatticePoint4> path;
    path.reserve(pts.size());
    for (auto const& p : pts) {
        path.push_back({p[0], p[1], p[2], p[3]});
    }
    return path;
}

std::vector<LatticePoint3> bresenham3dVerticalPrimary(const LatticePoint3& a, const LatticePoint3& b) {
    std::vector<LatticePoint2> const planar = bresenham2d({a.x, a.y}, {b.x, b.y});
    int const planarSteps = static_cast<int>(planar.size()) - 1;
    int const dz = std::abs(b.z - a.z);
    int const sz = sgn(b.z - a.z);

    std::vector<LatticePoint3> path;
    path.reserve(static_cast<std::size_t>(std::max(planarSteps, dz)) + 1);
    path.push_back(a);

    int z = a.z;
    if (dz > planarSteps) {
        // Elevation drives; planar steps ride along.
        std::vector<bool> const planarMoves = coupledSteps(dz, planarSteps);
        std::size_t idx = 0;
        for (int t = 1; t <= dz; ++t) {
            if (planarMoves[t]) ++idx;
            z += sz;
            path.push_back({planar[idx].x, planar[idx].y, z});
        }
    } else {
        std::vector<bool> const elevationMoves = coupledSteps(planarSteps, dz);
        for (int t = 1; t <= planarSteps; ++t) {
            if (elevationMoves[t]) z += sz;
            path.push_back({planar[t].x, planar[t].y, z});
        }
    }

    assert(path.back() == b && "Vertical-primary line must end on its endpoint.");
    return path;
}

std::vector<HexCube3d> hexLine3d(const HexCube3d& a, const HexCube3d& b) {
    if (a.q + a.r + a.s != 0 || b.q + b.r + b.s != 0) {
        throw std::invalid_argument("hexLine3d endpoints must satisfy q + r + s == 0");
    }

    int const planarSteps = IGridProvider::cubeDistance(a.cube(), b.cube());
    int const n = std::max(planarSteps, std::abs(b.k - a.k));

    std::vector<HexCube3d> path;
    path.reserve(static_cast<std::size_t>(n) + 1);
    path.push_back(a);
    if (n == 0) return path;

    // Nudge off hex edges so ties round the same way along the whole line.
    // The nudge sums to zero and keeps the fractional point on the q + r + s = 0 plane.
    constexpr double nudgeQ = 1e-6;
    constexpr double nudgeR = 1e-6;
    constexpr double nudgeS = -2e-6;

    double const dq = static_cast<double>(b.q - a.q) / n;
    double const dr = static_cast<double>(b.r - a.r) / n;
    double const ds = static_cast<double>(b.s - a.s) / n;
    double const dk = static_cast<double>(b.k - a.k) / n;

    for (int t = 1; t <= n; ++t) {
        FractionalCube frac;
        frac.q = a.q + (dq * t) + nudgeQ;
        frac.r = a.r + (dr * t) + nudgeR;
        frac.s = a.s + (ds * t) + nudgeS;
        HexCube const cube = IGridProvider::cubeRound(frac);
        int const k = static_cast<int>(std::lround(a.k + (dk * t)));

        assert(cube.q + cube.r + cube.s == 0 && "Rasterized hex must satisfy q + r + s == 0.");
        path.push_back({cube.q, cube.r, cube.s, k});
    }

    assert(path.back() == b && "Hex line must end on its endpoint.");
    return path;
}

std::ostream& operator<<(std::ostream& out, const LatticePoint2& p) {
    return out << "(" << p.x << ", " << p.y << ")";
}

std::ostream& operator<<(std::ostream& out, const LatticePoint3& p) {
    return out << "(" << p.x << ", " << p.y << ", " << p.z << ")";
}

std::ostream& operator<<(std::ostream& out, const LatticePoint4& p) {
    return out << "(" << p.x << ", " << p.y << ", " << p.z << ", " << p.w << ")";
}

} // namespace GridGeom
