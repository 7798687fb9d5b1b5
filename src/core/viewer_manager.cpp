/**
 * @file viewer_manager.cpp
 * @brief Implementation of ViewerManager, which ties input, measurement and drawing together.
 */

#include "gridgeom/core/viewer_manager.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include <SFML/Window/Event.hpp>

#include "gridgeom/components/token.hpp"
#include "gridgeom/core/constants.hpp"
#include "gridgeom/systems/movement_measure.hpp"

ViewerManager::ViewerManager()
    : renderer(static_cast<int>(GridConstants::ScreenLength),
               static_cast<int>(GridConstants::ScreenLength))
    , presetManager()
    , registry()
    , grid()
    , measurer()
    , token(entt::null)
    , rule(GridGeom::DiagonalRule::EQUIDISTANT)
    , pendingElevation(0)
    , running(true)
{
}

bool ViewerManager::init()
{
    if (!renderer.init())
    {
        std::cerr << "Renderer initialization failed." << std::endl;
        return false;
    }

    presetManager.buildPresetList();
    presetManager.setCurrentPreset(GridPreset::SQUARE_5FT);
    rebuildGrid();

    token = registry.create();
    registry.emplace<Components::Name>(token, "Token");
    registry.emplace<Components::Position>(token, measurer->gridCenterForPoint({50.0, 50.0, 0.0}));
    registry.emplace<Components::Waypoints>(token);
    registry.emplace<Components::Speed>(token, 30.0);

    remeasure();
    return true;
}

void ViewerManager::run()
{
    while (running && renderer.getWindow().isOpen())
    {
        if (!handleEvents())
        {
            break;
        }
        render();
    }
    renderer.getWindow().close();
}

bool ViewerManager::handleEvents()
{
    sf::RenderWindow& window = renderer.getWindow();

    sf::Event event;
    while (window.pollEvent(event))
    {
        if (event.type == sf::Event::Closed)
        {
            running = false;
        }
        else if (event.type == sf::Event::KeyPressed)
        {
            auto const rules = GridConstants::getAllDiagonalRules();
            int const ruleIndex = static_cast<int>(event.key.code) - static_cast<int>(sf::Keyboard::Num1);
            if (ruleIndex >= 0 && ruleIndex < static_cast<int>(rules.size()))
            {
                selectRule(rules[ruleIndex]);
                continue;
            }

            switch (event.key.code)
            {
                case sf::Keyboard::Escape:
                    running = false;
                    break;
                case sf::Keyboard::G:
                    selectPreset(presetManager.cyclePreset());
                    break;
                case sf::Keyboard::Up:
                    ++pendingElevation;
                    break;
                case sf::Keyboard::Down:
                    --pendingElevation;
                    break;
                case sf::Keyboard::BackSpace:
                    removeLastWaypoint();
                    break;
                default:
                    break;
            }
        }
        else if (event.type == sf::Event::MouseButtonPressed)
        {
            if (event.mouseButton.button == sf::Mouse::Left)
            {
                addWaypoint(event.mouseButton.x, event.mouseButton.y);
            }
            else if (event.mouseButton.button == sf::Mouse::Right)
            {
                placeToken(event.mouseButton.x, event.mouseButton.y);
            }
        }
    }

    return running;
}

void ViewerManager::render()
{
    renderer.clear();
    renderer.renderGrid(*grid);
    renderer.renderPaths(registry, *grid);

    const auto& measured = registry.get<Components::MovementMeasurement>(token);
    std::ostringstream status;
    status << std::fixed << std::setprecision(2)
           << GridPresetManager::getPresetName(presetManager.getCurrentPreset()) << " | "
           << GridConstants::getDiagonalRuleName(rule) << " | distance " << measured.distance
           << " | cost " << measured.offsetCost << " | diagonals " << measured.diagonals
           << " | next elevation " << pendingElevation;
    sf::Color const statusColor = Systems::MovementMeasureSystem::withinSpeed(registry, token)
                                      ? sf::Color::White
                                      : sf::Color(240, 90, 90);
    renderer.renderText(status.str(), 8, 8, statusColor);

    renderer.present();
}

void ViewerManager::selectPreset(GridPreset preset)
{
    presetManager.setCurrentPreset(preset);
    rebuildGrid();

    // Snap the token onto the new grid.
    auto& pos = registry.get<Components::Position>(token);
    pos = measurer->gridCenterForPoint(pos);
    remeasure();
}

void ViewerManager::selectRule(GridGeom::DiagonalRule newRule)
{
    rule = newRule;
    rebuildGrid();
    remeasure();
}

void ViewerManager::addWaypoint(double x, double y)
{
    GridGeom::Position p(x, y, grid->elevationForUnit(pendingElevation));
    if (!grid->isGridless())
    {
        p = measurer->gridCenterForPoint(p);
    }
    registry.get<Components::Waypoints>(token).points.push_back(p);
    remeasure();
}

void ViewerManager::removeLastWaypoint()
{
    auto& waypoints = registry.get<Components::Waypoints>(token);
    if (!waypoints.points.empty())
    {
        waypoints.points.pop_back();
        remeasure();
    }
}

void ViewerManager::placeToken(double x, double y)
{
    registry.replace<Components::Position>(token, measurer->gridCenterForPoint({x, y, 0.0}));
    registry.get<Components::Waypoints>(token).points.clear();
    pendingElevation = 0;
    remeasure();
}

void ViewerManager::remeasure()
{
    Systems::MovementMeasureSystem::update(registry, *measurer);

    const auto& measured = registry.get<Components::MovementMeasurement>(token);
    const auto& path = registry.get<Components::PlannedPath>(token);
    std::cout << GridConstants::getDiagonalRuleName(rule) << ": distance " << measured.distance
              << ", offset cost " << measured.offsetCost << ", diagonals " << measured.diagonals
              << ", cells " << path.cells.size() << std::endl;
}

void ViewerManager::rebuildGrid()
{
    // The measurer references the grid, so drop it first.
    measurer.reset();
    grid = GridPresetManager::createGrid(GridPresetManager::configFor(presetManager.getCurrentPreset(), rule));
    measurer = std::make_unique<GridGeom::GridMeasurer>(*grid);
}
