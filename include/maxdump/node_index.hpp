/**
 * @file node_index.hpp
 * @brief Lookup helpers over a decoded chunk forest.
 *
 * Indexes hold pointers into the forest; they are valid as long as the
 * NodeList they were built from.
 */

#ifndef MAXDUMP_NODE_INDEX_HPP
#define MAXDUMP_NODE_INDEX_HPP

#include "chunk.hpp"
#include "config.hpp"

#include <initializer_list>
#include <map>
#include <type_traits>
#include <vector>

namespace maxdump {

/**
 * @brief Index sibling nodes by a key.
 *
 * When two nodes share a key the later one wins.
 *
 * @tparam KeyFn Callable taking const Node& and returning the key
 */
template <typename KeyFn>
auto index_by(const NodeList& nodes, KeyFn key_fn)
    -> std::map<std::decay_t<std::invoke_result_t<KeyFn, const Node&>>, const Node*> {
    std::map<std::decay_t<std::invoke_result_t<KeyFn, const Node&>>, const Node*> index;
    for (const auto& node : nodes) {
        index[key_fn(node)] = &node;
    }
    return index;
}

/**
 * @brief Group sibling nodes by a key, keeping stream order in each group.
 *
 * @tparam KeyFn Callable taking const Node& and returning the key
 */
template <typename KeyFn>
auto group_by(const NodeList& nodes, KeyFn key_fn)
    -> std::map<std::decay_t<std::invoke_result_t<KeyFn, const Node&>>,
                std::vector<const Node*>> {
    std::map<std::decay_t<std::invoke_result_t<KeyFn, const Node&>>, std::vector<const Node*>>
        groups;
    for (const auto& node : nodes) {
        groups[key_fn(node)].push_back(&node);
    }
    return groups;
}

/// index_by() keyed on the chunk identifier.
std::map<std::int16_t, const Node*> index_by_id(const NodeList& nodes);

/// group_by() keyed on the chunk identifier.
std::map<std::int16_t, std::vector<const Node*>> group_by_id(const NodeList& nodes);

/**
 * @brief Follow a path of identifiers through nested containers.
 *
 * Each step picks the first sibling with the given identifier.
 *
 * @return Matching node, or nullptr if any step fails or the path is empty
 */
const Node* find_child(const NodeList& nodes, std::initializer_list<std::int16_t> path);

/**
 * @brief Total number of nodes in a forest, containers included.
 */
std::size_t count_nodes(const NodeList& nodes) noexcept;

} // namespace maxdump

#endif // MAXDUMP_NODE_INDEX_HPP
