#pragma once

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/status.hpp"

namespace hearth {
namespace graph {

enum class LinkType { BRIDGE, PROXY, SYNC, MIRROR };

enum class LinkDirection { BIDIRECTIONAL, UNIDIRECTIONAL };

const char *link_type_to_string(LinkType type);
std::optional<LinkType> string_to_link_type(const std::string &str);

const char *link_direction_to_string(LinkDirection direction);
std::optional<LinkDirection> string_to_link_direction(const std::string &str);

struct DeviceLink {
    std::string from;
    std::string to;
    LinkType type = LinkType::BRIDGE;
    LinkDirection direction = LinkDirection::UNIDIRECTIONAL;
};

// One hit of related_devices(): the device, how we got there and at which depth
struct RelatedDevice {
    std::string device_id;
    std::vector<std::string> path;  // start device first, device_id last
    LinkType link_type = LinkType::BRIDGE;  // type of the last edge on the path
    int depth = 0;
};

/**
 * @brief Depth-bounded relationship graph between devices
 *
 * Storage is an arena: nodes live in a vector indexed through an id map and
 * edges refer to node indices. Each node keeps its incident edges in insertion
 * order, which gives traversal a deterministic tie-break. Removed edges stay
 * in the arena until they outnumber the live ones; the arena is then rebuilt
 * without them and without devices left with no links.
 *
 * Invariant: after every accepted add_link(), no walk of at most max_depth hops
 * returns to its starting device without reusing an edge. Insertion therefore
 * rejects any edge whose endpoints are already connected, in the direction that
 * would close a loop, by a path of at most max_depth - 1 hops.
 *
 * Thread Safety:
 * - add_link/remove_link take exclusive access
 * - related_devices and the other readers take shared access
 */
class DeviceLinkGraph {
public:
    explicit DeviceLinkGraph(int max_depth = 5);

    DeviceLinkGraph(const DeviceLinkGraph &) = delete;
    DeviceLinkGraph &operator=(const DeviceLinkGraph &) = delete;

    /**
     * @brief Insert a link
     *
     * @return INVALID_ARGUMENT for empty ids, LINK_EXISTS if the same link (or a
     *         bidirectional link between the pair) is present, CYCLE_REJECTED if
     *         the link would close a loop within max_depth hops
     */
    Status add_link(const std::string &from, const std::string &to, LinkType type, LinkDirection direction);

    // String overload for config/plugin input; maps unknown names to
    // INVALID_LINK_TYPE / INVALID_DIRECTION before touching the graph
    Status add_link(const std::string &from, const std::string &to, const std::string &type,
                    const std::string &direction);

    /**
     * @brief Remove the link from -> to
     *
     * A bidirectional link stored as to -> from also matches.
     * @return NOT_FOUND if no such link exists
     */
    Status remove_link(const std::string &from, const std::string &to);

    /**
     * @brief Bounded breadth-first traversal from a device
     *
     * Unidirectional links are followed from -> to only, bidirectional links both
     * ways. Traversal stops at max_depth regardless of graph shape. Ties are broken
     * by link insertion order. Unknown devices have no related devices.
     */
    std::vector<RelatedDevice> related_devices(const std::string &device_id) const;

    // Active links in insertion order
    std::vector<DeviceLink> links() const;

    // Links touching a device, in insertion order
    std::vector<DeviceLink> links_for(const std::string &device_id) const;

    // Drop every link touching a device (device removed from inventory)
    size_t remove_device(const std::string &device_id);

    size_t link_count() const;
    int max_depth() const { return max_depth_; }

    // Arena occupancy, removed-but-not-yet-compacted entries included
    size_t edge_slots() const;
    size_t node_slots() const;

    // Bumped on every successful mutation; lets remote plugins skip unchanged snapshots
    uint64_t revision() const;

private:
    struct Node {
        std::string id;
        std::vector<size_t> incident;  // edge indices, insertion order
    };

    struct Edge {
        size_t from;
        size_t to;
        LinkType type;
        LinkDirection direction;
        bool active;
    };

    // Caller holds mutex_ (any mode)
    std::optional<size_t> find_node(const std::string &id) const;
    std::optional<size_t> find_edge(size_t from, size_t to) const;
    bool reachable_within(size_t source, size_t target, int max_hops) const;

    // Caller holds mutex_ exclusively
    size_t ensure_node(const std::string &id);
    void deactivate_edge(size_t edge_index);
    void maybe_compact();

    const int max_depth_;

    mutable std::shared_mutex mutex_;
    std::vector<Node> nodes_;
    std::unordered_map<std::string, size_t> node_index_;
    std::vector<Edge> edges_;
    size_t active_edges_ = 0;
    uint64_t revision_ = 0;
};

}  // namespace graph
}  // namespace hearth
