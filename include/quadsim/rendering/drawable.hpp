/**
 * @file drawable.hpp
 * @brief Draw capability shared by debug overlays and entity rendering
 *
 * The simulation never draws anything itself. Anything that can be shown
 * implements IDrawable and describes itself to an IDrawVisitor, which is
 * supplied by whichever front end is active (SFML window, test recorder).
 */

#ifndef QUADSIM_DRAWABLE_HPP
#define QUADSIM_DRAWABLE_HPP

#include <vector>
#include <entt/entt.hpp>

#include "quadsim/components/basic.hpp"
#include "quadsim/math/rect.hpp"
#include "quadsim/spatial/quadtree.hpp"

class IDrawVisitor {
public:
    virtual ~IDrawVisitor() = default;

    /**
     * @brief Outline of a quadtree node
     * @param region Node region in world coordinates
     * @param depth Node depth, root is 0
     */
    virtual void drawRect(const Rect& region, int depth) = 0;

    virtual void drawCircle(const Position& center, double radius, const Components::Color& color) = 0;
};

class IDrawable {
public:
    virtual ~IDrawable() = default;
    virtual void draw(IDrawVisitor& visitor) const = 0;
};

/**
 * @class QuadtreeOutline
 * @brief Snapshot of a quadtree's node regions in depth-first order
 *
 * Captured while the tree is alive so the overlay can be drawn after the
 * tick has dropped the tree.
 */
class QuadtreeOutline : public IDrawable {
public:
    struct Cell {
        Rect region;
        int depth;
        bool leaf;
    };

    QuadtreeOutline() = default;

    static QuadtreeOutline capture(const Quadtree& tree);

    void draw(IDrawVisitor& visitor) const override;

    const std::vector<Cell>& getCells() const { return cells; }
    bool empty() const { return cells.empty(); }

private:
    std::vector<Cell> cells;
};

/**
 * @class EntityDrawList
 * @brief Draws every entity that has a Position and a Radius as a circle
 *
 * Entities without a Color component are drawn white.
 */
class EntityDrawList : public IDrawable {
public:
    explicit EntityDrawList(const entt::registry& registry);

    void draw(IDrawVisitor& visitor) const override;

private:
    const entt::registry& registry;
};

#endif // QUADSIM_DRAWABLE_HPP
