#include "quadsim/arch/native/sim_manager.hpp"

#include <sstream>

#include "quadsim/core/profile.hpp"

SimManager::SimManager(const SimConfig& config)
    : simulator(config)
    , renderer(static_cast<unsigned int>(config.WorldWidth), static_cast<unsigned int>(config.WorldHeight))
{
}

bool SimManager::init() {
    return renderer.init("quadsim");
}

bool SimManager::handleEvents() {
    sf::RenderWindow& window = renderer.getWindow();

    sf::Event event;
    while (window.pollEvent(event)) {
        if (event.type == sf::Event::Closed) {
            running = false;
        } else if (event.type == sf::Event::KeyPressed) {
            switch (event.key.code) {
                case sf::Keyboard::Escape:
                    running = false;
                    break;
                case sf::Keyboard::Space:
                    paused = !paused;
                    break;
                case sf::Keyboard::Q:
                    showTree = !showTree;
                    break;
                case sf::Keyboard::R:
                    simulator.reset();
                    break;
                default:
                    break;
            }
        }
    }
    return running;
}

void SimManager::applyPlayerInput() {
    using sf::Keyboard;
    Vector dir;
    if (Keyboard::isKeyPressed(Keyboard::Left) || Keyboard::isKeyPressed(Keyboard::A)) dir.x -= 1.0;
    if (Keyboard::isKeyPressed(Keyboard::Right) || Keyboard::isKeyPressed(Keyboard::D)) dir.x += 1.0;
    if (Keyboard::isKeyPressed(Keyboard::Up) || Keyboard::isKeyPressed(Keyboard::W)) dir.y -= 1.0;
    if (Keyboard::isKeyPressed(Keyboard::Down) || Keyboard::isKeyPressed(Keyboard::S)) dir.y += 1.0;
    simulator.setPlayerDirection(dir);
}

void SimManager::render() {
    renderer.clear();

    if (showTree) {
        simulator.getQuadtreeOutline().draw(renderer);
    }
    EntityDrawList(simulator.getRegistry()).draw(renderer);

    renderer.present();

    if (simulator.getTickCount() % 30 == 0) {
        const auto& stats = simulator.getLastCollisionStats();
        std::ostringstream title;
        title << "quadsim - " << stats.inserted << " particles, " << stats.nodes << " nodes, depth "
              << stats.depth << ", " << stats.candidates << " candidates, " << stats.hits << " hits"
              << (paused ? " [paused]" : "");
        renderer.setTitle(title.str());
    }
}

void SimManager::run() {
    while (handleEvents()) {
        if (!paused) {
            applyPlayerInput();
            simulator.tick();
        }
        render();
    }
}
