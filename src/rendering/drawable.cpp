#include "quadsim/rendering/drawable.hpp"

QuadtreeOutline QuadtreeOutline::capture(const Quadtree& tree) {
    QuadtreeOutline outline;
    outline.cells.reserve(tree.nodeCount());
    tree.traverse([&outline](const Rect& region, int depth, bool leaf) {
        outline.cells.push_back({region, depth, leaf});
    });
    return outline;
}

void QuadtreeOutline::draw(IDrawVisitor& visitor) const {
    for (const auto& cell : cells) {
        visitor.drawRect(cell.region, cell.depth);
    }
}

EntityDrawList::EntityDrawList(const entt::registry& registry)
    : registry(registry)
{
}

void EntityDrawList::draw(IDrawVisitor& visitor) const {
    auto view = registry.view<Components::Position, Components::Radius>();
    for (auto [entity, pos, radius] : view.each()) {
        Components::Color color;
        if (const auto* c = registry.try_get<Components::Color>(entity)) {
            color = *c;
        }
        visitor.drawCircle(pos, radius.value, color);
    }
}
