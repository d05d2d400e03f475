#include "quadsim/arch/native/renderer_native.hpp"

#include <algorithm>
#include <iostream>

Renderer::Renderer(unsigned int screenWidth, unsigned int screenHeight)
    : screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
    cellShape.setFillColor(sf::Color::Transparent);
    cellShape.setOutlineThickness(1.0f);
    circleShape.setPointCount(16);
}

bool Renderer::init(const std::string& title) {
    window.create(sf::VideoMode(screenWidth, screenHeight), title);
    if (!window.isOpen()) {
        std::cerr << "Error: Could not create " << screenWidth << "x" << screenHeight << " window.\n";
        return false;
    }
    window.setFramerateLimit(60);
    return true;
}

void Renderer::clear() {
    window.clear(sf::Color(12, 12, 18));
}

void Renderer::present() {
    window.display();
}

void Renderer::setTitle(const std::string& title) {
    window.setTitle(title);
}

void Renderer::drawRect(const Rect& region, int depth) {
    // Deeper cells fade out so the coarse structure stays readable
    auto const alpha = static_cast<sf::Uint8>(std::max(40, 160 - depth * 20));
    cellShape.setOutlineColor(sf::Color(0, 255, 0, alpha));
    cellShape.setPosition(static_cast<float>(region.x()), static_cast<float>(region.y()));
    cellShape.setSize(sf::Vector2f(static_cast<float>(region.width()), static_cast<float>(region.height())));
    window.draw(cellShape);
}

void Renderer::drawCircle(const Position& center, double radius, const Components::Color& color) {
    auto const r = static_cast<float>(radius);
    circleShape.setRadius(r);
    circleShape.setOrigin(r, r);
    circleShape.setPosition(static_cast<float>(center.x), static_cast<float>(center.y));
    circleShape.setFillColor(sf::Color(color.r, color.g, color.b));
    window.draw(circleShape);
}
