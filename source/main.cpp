#include <SFML/Graphics.hpp>
#include <SFML/Window.hpp>
#include <SFML/System.hpp>
#include <iostream>
#include <iomanip>
#include <string>
#include <stdexcept>
#include <exception>
#include <algorithm>
#include <cstdint>

#include "SimulationSettings.h"
#include "ForagingSimulation.h"
#include "ForagingRenderer.h"
#include "UIManager.h"
#include "VectorMath.h"

static const char *SETTINGS_FILE = "settings.txt";

struct LaunchOptions
{
    int headlessTicks = 0; // 0 opens the window
    std::string settingsFile;
};

// what the left mouse button is currently holding
struct DragState
{
    enum class Target
    {
        None,
        Obstacle,
        Food,
        Nest
    };

    Target target = Target::None;
    size_t index = 0;
    std::uint64_t layoutRevision = 0;
    sf::Vector2f lastPosition;
};

static void printUsage(const char *program)
{
    std::cout << "Usage: " << program << " [--headless <ticks>] [--settings <file>]" << std::endl;
}

static LaunchOptions parseArguments(int argc, char *argv[])
{
    LaunchOptions options;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--headless" || arg == "--settings")
        {
            if (i + 1 >= argc)
                throw std::invalid_argument("missing value after " + arg);
            std::string value = argv[++i];
            if (arg == "--headless")
            {
                options.headlessTicks = std::stoi(value);
                if (options.headlessTicks <= 0)
                    throw std::invalid_argument("--headless needs a positive tick count");
            }
            else
            {
                options.settingsFile = value;
            }
        }
        else
        {
            throw std::invalid_argument("unknown argument " + arg);
        }
    }
    return options;
}

static void printSummary(const char *label, const DeliverySummary &summary)
{
    std::cout << std::fixed << std::setprecision(1);
    std::cout << label << ": " << summary.count << " deliveries";
    if (summary.count > 0)
    {
        std::cout << ", round trip " << summary.meanRoundTripTicks << " ticks / "
                  << summary.meanRoundTripPathPoints << " points, return leg " << summary.meanPathPoints
                  << " points, efficiency " << std::setprecision(3) << summary.meanEfficiency;
    }
    std::cout << std::endl;
}

static int runHeadless(const SimulationSettings &settings, int ticks)
{
    ForagingSimulation simulation(settings);

    sf::Clock clock;
    simulation.run(ticks);
    float seconds = clock.getElapsedTime().asSeconds();

    const SimulationStats &stats = simulation.getStats();
    const Nest &nest = simulation.getNest();

    std::cout << "=== Foraging statistics ===" << std::endl;
    std::cout << "Ticks: " << stats.ticks << " in " << std::fixed << std::setprecision(2) << seconds << "s" << std::endl;
    std::cout << "Ants: " << simulation.getAntCount() << " | Deaths: " << stats.deaths
              << " | Spawned: " << stats.spawned << std::endl;
    std::cout << "Pickups: " << stats.pickups << " | Deliveries: " << stats.deliveries
              << " | Food delivered: " << stats.foodDelivered << " | Food wasted: " << stats.foodWasted << std::endl;
    std::cout << "Nest: " << nest.getFoodStored() << "/" << nest.getMaxCapacity()
              << (nest.isFull() ? " (full)" : "") << " | Efficiency: " << std::setprecision(3)
              << nest.getEfficiency() << std::endl;
    std::cout << "Food sources replaced: " << stats.foodSourcesReplaced
              << " | Trapped ants ejected: " << stats.trappedEjections << std::endl;

    // trail convergence shows up as shorter trips late in the run
    std::int64_t window = std::max<std::int64_t>(1, stats.ticks / 10);
    printSummary("First 10%", stats.summarize(0, window));
    printSummary("Last 10%", stats.summarize(stats.ticks - window, stats.ticks + 1));
    return 0;
}

// picks the topmost thing under the cursor: nest, then food, then obstacles
static DragState beginDrag(const ForagingSimulation &simulation, const sf::Vector2f &mousePos)
{
    DragState drag;
    drag.lastPosition = mousePos;
    drag.layoutRevision = simulation.getLayoutRevision();

    const Nest &nest = simulation.getNest();
    if (vec::distance(mousePos, nest.getPosition()) <= nest.getRadius())
    {
        drag.target = DragState::Target::Nest;
        return drag;
    }

    const auto &foodSources = simulation.getFoodSources();
    for (size_t i = 0; i < foodSources.size(); ++i)
    {
        if (vec::distance(mousePos, foodSources[i].position) <= foodSources[i].radius)
        {
            drag.target = DragState::Target::Food;
            drag.index = i;
            return drag;
        }
    }

    const auto &obstacles = simulation.getObstacles();
    for (size_t i = 0; i < obstacles.size(); ++i)
    {
        if (vec::distance(mousePos, obstacles[i].center()) <= obstacles[i].baseRadius())
        {
            drag.target = DragState::Target::Obstacle;
            drag.index = i;
            return drag;
        }
    }
    return drag;
}

static void continueDrag(ForagingSimulation &simulation, DragState &drag, const sf::Vector2f &mousePos)
{
    // a replaced food source or a new layout shifts the indices
    if (drag.layoutRevision != simulation.getLayoutRevision())
    {
        drag.target = DragState::Target::None;
        return;
    }

    bool moved = true;
    switch (drag.target)
    {
    case DragState::Target::Obstacle:
        moved = simulation.translateObstacle(drag.index, mousePos - drag.lastPosition);
        break;
    case DragState::Target::Food:
        moved = simulation.moveFoodSource(drag.index, mousePos);
        break;
    case DragState::Target::Nest:
        simulation.moveNest(mousePos);
        break;
    case DragState::Target::None:
        return;
    }

    // the layout changed under us (reset while dragging)
    if (!moved)
        drag.target = DragState::Target::None;
    drag.lastPosition = mousePos;
}

static int runWindowed(SimulationSettings &settings)
{
    sf::RenderWindow window(sf::VideoMode({static_cast<unsigned>(settings.width), static_cast<unsigned>(settings.height)}),
                            "Ant Foraging Simulation");
    window.setFramerateLimit(60);

    // initialize font
    sf::Font font;
    if (!font.openFromFile("DejaVuSans.ttf") &&
        !font.openFromFile("bin/DejaVuSans.ttf") &&
        !font.openFromFile("source/DejaVuSans.ttf"))
    {
        std::cout << "Warning: Could not load font file, HUD text may not display properly" << std::endl;
    }

    ForagingSimulation simulation(settings);
    ForagingRenderer renderer(simulation);
    UIManager ui(font);

    bool paused = false;
    DragState drag;

    ui.onReset = [&]()
    {
        drag.target = DragState::Target::None;
        simulation.reset();
    };
    ui.onRestart = [&]()
    {
        drag.target = DragState::Target::None;
        simulation.restart();
    };
    ui.onTogglePause = [&]()
    {
        paused = !paused;
        std::cout << (paused ? "Paused" : "Resumed") << " at tick " << simulation.getTick() << std::endl;
    };
    ui.onAntCountChange = [&](int delta)
    {
        simulation.adjustAntCount(delta);
        settings.numAnts = simulation.getAntCount();
    };
    ui.onSettingsChanged = [&]()
    {
        simulation.updateSettings(settings);
    };
    ui.onSaveSettings = [&]()
    {
        if (settings.saveToFile(SETTINGS_FILE))
            std::cout << "Settings saved to " << SETTINGS_FILE << std::endl;
    };
    ui.onLoadSettings = [&]()
    {
        SimulationSettings loaded = settings;
        if (!loaded.loadFromFile(SETTINGS_FILE))
            return;

        // the window keeps its size, the arena follows it
        loaded.width = settings.width;
        loaded.height = settings.height;
        settings = loaded;
        simulation.updateSettings(settings);
        simulation.setAntCount(settings.numAnts);
        std::cout << "Settings loaded from " << SETTINGS_FILE << std::endl;
    };
    ui.onQuit = [&]()
    {
        window.close();
    };

    while (window.isOpen())
    {
        // handle events
        while (const std::optional event = window.pollEvent())
        {
            if (event->is<sf::Event::Closed>())
            {
                window.close();
            }
            else if (const auto *keyPressed = event->getIf<sf::Event::KeyPressed>())
            {
                ui.handleInput(keyPressed, settings);
            }
            else if (const auto *mousePressed = event->getIf<sf::Event::MouseButtonPressed>())
            {
                if (mousePressed->button == sf::Mouse::Button::Left)
                    drag = beginDrag(simulation, window.mapPixelToCoords(mousePressed->position));
            }
            else if (const auto *mouseReleased = event->getIf<sf::Event::MouseButtonReleased>())
            {
                if (mouseReleased->button == sf::Mouse::Button::Left)
                    drag.target = DragState::Target::None;
            }
            else if (const auto *mouseMoved = event->getIf<sf::Event::MouseMoved>())
            {
                if (drag.target != DragState::Target::None)
                    continueDrag(simulation, drag, window.mapPixelToCoords(mouseMoved->position));
            }
        }

        if (!window.isOpen())
            break;

        // update simulation
        if (!paused)
        {
            for (int i = 0; i < settings.stepsPerFrame; ++i)
                simulation.step();
        }

        // render
        window.clear(sf::Color::Black);
        renderer.draw(window, simulation, settings.displayThreshold);
        ui.drawHUD(window, simulation, paused);
        window.display();
    }
    return 0;
}

int main(int argc, char *argv[])
{
    try
    {
        LaunchOptions options = parseArguments(argc, argv);

        SimulationSettings settings;
        if (!options.settingsFile.empty() && !settings.loadFromFile(options.settingsFile))
        {
            std::cerr << "Error: could not load settings from " << options.settingsFile << std::endl;
            return 1;
        }

        if (options.headlessTicks > 0)
            return runHeadless(settings, options.headlessTicks);
        return runWindowed(settings);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 2;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
