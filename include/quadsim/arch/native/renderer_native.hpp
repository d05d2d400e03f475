/**
 * @file renderer_native.hpp
 * @brief SFML front end for the debug viewer
 *
 * Implements IDrawVisitor so both the quadtree overlay and the entity list
 * can draw themselves into the window.
 */

#pragma once

#include <string>
#include <SFML/Graphics.hpp>

#include "quadsim/rendering/drawable.hpp"

class Renderer : public IDrawVisitor {
public:
    Renderer(unsigned int screenWidth, unsigned int screenHeight);
    ~Renderer() override = default;

    /**
     * @brief Opens the window
     * @return false if the window could not be created
     */
    bool init(const std::string& title);

    void clear();
    void present();
    void setTitle(const std::string& title);

    void drawRect(const Rect& region, int depth) override;
    void drawCircle(const Position& center, double radius, const Components::Color& color) override;

    sf::RenderWindow& getWindow() { return window; }

private:
    sf::RenderWindow window;
    sf::RectangleShape cellShape;
    sf::CircleShape circleShape;
    unsigned int screenWidth;
    unsigned int screenHeight;
};
