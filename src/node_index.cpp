/**
 * @file node_index.cpp
 * @brief Lookup helpers over a decoded chunk forest.
 */

#include <maxdump/node_index.hpp>

namespace maxdump {

std::map<std::int16_t, const Node*> index_by_id(const NodeList& nodes) {
    return index_by(nodes, [](const Node& node) { return node.id(); });
}

std::map<std::int16_t, std::vector<const Node*>> group_by_id(const NodeList& nodes) {
    return group_by(nodes, [](const Node& node) { return node.id(); });
}

const Node* find_child(const NodeList& nodes, std::initializer_list<std::int16_t> path) {
    const NodeList* level = &nodes;
    const Node* found = nullptr;

    for (std::int16_t id : path) {
        found = nullptr;
        for (const auto& node : *level) {
            if (node.id() == id) {
                found = &node;
                break;
            }
        }
        if (found == nullptr) {
            return nullptr;
        }
        level = &found->children();
    }

    return found;
}

std::size_t count_nodes(const NodeList& nodes) noexcept {
    std::size_t count = 0;
    for (const auto& node : nodes) {
        count += 1 + count_nodes(node.children());
    }
    return count;
}

} // namespace maxdump
