#include "gridgeom/rendering/path_renderer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "gridgeom/components/token.hpp"
#include "gridgeom/core/constants.hpp"
#include "gridgeom/grid/hex_grid.hpp"

namespace {

const sf::Color GridLineColor(70, 70, 70);
const sf::Color PathFillColor(40, 120, 200, 90);
const sf::Color PathOutlineColor(60, 160, 240);
const sf::Color WaypointColor(240, 200, 60);

// Half-angle between the two arrowhead barbs
const double ArrowSpread = GridConstants::Pi / 6.0;

const char* const FontCandidates[] = {
    "assets/fonts/arial.ttf",
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/TTF/DejaVuSans.ttf",
    "/Library/Fonts/Arial.ttf",
};

sf::Vector2f toScreen(const GridGeom::Position& p) {
    return sf::Vector2f(static_cast<float>(p.x), static_cast<float>(p.y));
}

} // namespace

PathRenderer::PathRenderer(int screenWidth, int screenHeight)
    : window()
    , font()
    , initialized(false)
    , fontLoaded(false)
    , screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
}

bool PathRenderer::init() {
    window.create(sf::VideoMode(screenWidth, screenHeight), "Grid Geometry Viewer");
    window.setFramerateLimit(60);

    if (!window.isOpen()) {
        std::cerr << "Failed to open the viewer window\n";
        return false;
    }

    for (const char* path : FontCandidates) {
        if (font.loadFromFile(path)) {
            fontLoaded = true;
            break;
        }
    }
    if (!fontLoaded) {
        std::cerr << "No font found; status text is disabled\n";
    }
    initialized = true;
    return true;
}

void PathRenderer::clear() {
    window.clear(sf::Color::Black);
}

void PathRenderer::present() {
    window.display();
}

void PathRenderer::drawCell(const GridGeom::IGridProvider& grid, const GridGeom::Position& center,
                            sf::Color fill, sf::Color outline) {
    float const size = static_cast<float>(grid.cellSize());

    if (grid.isHexagonal()) {
        // Adjacent centres are `size` apart, so the circumradius is size / sqrt(3).
        float const radius = size / static_cast<float>(GridConstants::Sqrt3);
        sf::CircleShape hex(radius, 6);
        hex.setOrigin(radius, radius);
        hex.setPosition(toScreen(center));
        if (static_cast<const GridGeom::HexGrid&>(grid).columns()) {
            hex.setRotation(30.f);
        }
        hex.setFillColor(fill);
        hex.setOutlineColor(outline);
        hex.setOutlineThickness(1.f);
        window.draw(hex);
        return;
    }

    sf::RectangleShape square(sf::Vector2f(size, size));
    square.setOrigin(size / 2.f, size / 2.f);
    square.setPosition(toScreen(center));
    square.setFillColor(fill);
    square.setOutlineColor(outline);
    square.setOutlineThickness(1.f);
    window.draw(square);
}

void PathRenderer::renderGrid(const GridGeom::IGridProvider& grid) {
    if (grid.isGridless()) return;

    double const size = grid.cellSize();
    int const span = static_cast<int>(std::ceil(std::max(screenWidth, screenHeight) / size)) + 2;

    if (!grid.isHexagonal()) {
        for (int i = 0; i < span; ++i) {
            for (int j = 0; j < span; ++j) {
                drawCell(grid, grid.offsetToWorldCenter({i, j, 0}), sf::Color::Transparent, GridLineColor);
            }
        }
        return;
    }

    // Axial rows shear sideways, so sweep a wider column range and cull.
    for (int i = -1; i < span; ++i) {
        for (int j = -span; j < span; ++j) {
            GridGeom::Position const c = grid.offsetToWorldCenter({i, j, 0});
            if (c.x < -size || c.y < -size || c.x > screenWidth + size || c.y > screenHeight + size) {
                continue;
            }
            drawCell(grid, c, sf::Color::Transparent, GridLineColor);
        }
    }
}

void PathRenderer::renderPaths(const entt::registry& registry, const GridGeom::IGridProvider& grid) {
    if (!grid.isGridless()) {
        auto cells = registry.view<Components::PlannedPath>();
        for (auto entity : cells) {
            for (auto const& c : cells.get<Components::PlannedPath>(entity).cells) {
                drawCell(grid, c, PathFillColor, PathOutlineColor);
            }
        }
    }

    auto tokens = registry.view<Components::Position, Components::Waypoints>();
    for (auto [entity, pos, waypoints] : tokens.each()) {
        sf::VertexArray line(sf::LineStrip);
        line.append(sf::Vertex(toScreen(pos), WaypointColor));
        for (auto const& w : waypoints.points) {
            line.append(sf::Vertex(toScreen(w), WaypointColor));
        }
        window.draw(line);

        GridGeom::Position from = pos;
        for (auto const& w : waypoints.points) {
            drawArrowhead(from, w, grid.cellSize() * 0.25);
            from = w;
        }

        float const radius = static_cast<float>(grid.cellSize()) * 0.3f;
        sf::CircleShape marker(radius);
        marker.setOrigin(radius, radius);
        marker.setPosition(toScreen(pos));
        marker.setFillColor(WaypointColor);
        window.draw(marker);

        // Elevated waypoints carry their elevation step beside the point.
        for (auto const& w : waypoints.points) {
            int const k = grid.unitElevation(w.z);
            if (k != 0) {
                renderText((k > 0 ? "+" : "") + std::to_string(k), static_cast<int>(w.x) + 6,
                           static_cast<int>(w.y) - 18, WaypointColor);
            }
        }
    }
}

void PathRenderer::drawArrowhead(const GridGeom::Position& from, const GridGeom::Position& to, double length) {
    GridGeom::Vector const dir = to.to2d() - from.to2d();
    if (dir.length() < GridGeom::EPSILON) return;

    GridGeom::Vector const back = -dir.normalized() * length;
    sf::VertexArray head(sf::Triangles, 3);
    head[0] = sf::Vertex(toScreen(to), WaypointColor);
    head[1] = sf::Vertex(toScreen(to + GridGeom::rotateByAngle(back, ArrowSpread)), WaypointColor);
    head[2] = sf::Vertex(toScreen(to + GridGeom::rotateByAngle(back, -ArrowSpread)), WaypointColor);
    window.draw(head);
}

void PathRenderer::renderText(const std::string& text, int x, int y, sf::Color color) {
    if (!fontLoaded) return;

    sf::Text sfText;
    sfText.setFont(font);
    sfText.setString(text);
    sfText.setCharacterSize(14);
    sfText.setFillColor(color);
    sfText.setPosition(static_cast<float>(x), static_cast<float>(y));
    window.draw(sfText);
}
