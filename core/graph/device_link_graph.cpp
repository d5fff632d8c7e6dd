#include "device_link_graph.hpp"

#include <deque>
#include <mutex>

#include "logging/logger.hpp"

namespace hearth {
namespace graph {

namespace {

// Removed edges tolerated before the arena is rebuilt
constexpr size_t kCompactThreshold = 32;
constexpr size_t kDropped = static_cast<size_t>(-1);

}  // namespace

const char *link_type_to_string(LinkType type) {
    switch (type) {
        case LinkType::BRIDGE:
            return "bridge";
        case LinkType::PROXY:
            return "proxy";
        case LinkType::SYNC:
            return "sync";
        case LinkType::MIRROR:
            return "mirror";
        default:
            return "unknown";
    }
}

std::optional<LinkType> string_to_link_type(const std::string &str) {
    if (str == "bridge") return LinkType::BRIDGE;
    if (str == "proxy") return LinkType::PROXY;
    if (str == "sync") return LinkType::SYNC;
    if (str == "mirror") return LinkType::MIRROR;
    return std::nullopt;
}

const char *link_direction_to_string(LinkDirection direction) {
    switch (direction) {
        case LinkDirection::BIDIRECTIONAL:
            return "bidirectional";
        case LinkDirection::UNIDIRECTIONAL:
            return "unidirectional";
        default:
            return "unknown";
    }
}

std::optional<LinkDirection> string_to_link_direction(const std::string &str) {
    if (str == "bidirectional") return LinkDirection::BIDIRECTIONAL;
    if (str == "unidirectional") return LinkDirection::UNIDIRECTIONAL;
    return std::nullopt;
}

DeviceLinkGraph::DeviceLinkGraph(int max_depth) : max_depth_(max_depth < 1 ? 1 : max_depth) {}

Status DeviceLinkGraph::add_link(const std::string &from, const std::string &to, const std::string &type,
                                 const std::string &direction) {
    auto parsed_type = string_to_link_type(type);
    if (!parsed_type) {
        return Status::error(ErrorCode::INVALID_LINK_TYPE,
                             "Invalid link type '" + type + "': must be bridge, proxy, sync or mirror");
    }
    auto parsed_direction = string_to_link_direction(direction);
    if (!parsed_direction) {
        return Status::error(ErrorCode::INVALID_DIRECTION,
                             "Invalid link direction '" + direction + "': must be bidirectional or unidirectional");
    }
    return add_link(from, to, *parsed_type, *parsed_direction);
}

Status DeviceLinkGraph::add_link(const std::string &from, const std::string &to, LinkType type,
                                 LinkDirection direction) {
    if (from.empty() || to.empty()) {
        return Status::error(ErrorCode::INVALID_ARGUMENT, "Link endpoints must not be empty");
    }
    if (from == to) {
        return Status::error(ErrorCode::CYCLE_REJECTED, "Self-link on '" + from + "'");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto from_index = find_node(from);
    auto to_index = find_node(to);

    // Both endpoints known: the edge may duplicate an existing one or close a loop
    if (from_index && to_index) {
        if (find_edge(*from_index, *to_index)) {
            return Status::error(ErrorCode::LINK_EXISTS, "Link " + from + " -> " + to + " already exists");
        }
        auto reverse = find_edge(*to_index, *from_index);
        if (reverse && edges_[*reverse].direction == LinkDirection::BIDIRECTIONAL) {
            return Status::error(ErrorCode::LINK_EXISTS,
                                 "Bidirectional link " + to + " <-> " + from + " already exists");
        }

        // A new loop must use the new edge, so it exists iff the rest of it is
        // already a path back to the start of the new edge.
        const int budget = max_depth_ - 1;
        bool cycle = reachable_within(*to_index, *from_index, budget);
        if (!cycle && direction == LinkDirection::BIDIRECTIONAL) {
            cycle = reachable_within(*from_index, *to_index, budget);
        }
        if (cycle) {
            LOG_WARN("[LinkGraph] Rejected " << from << " -> " << to << " (" << link_type_to_string(type)
                                             << "): would close a loop within " << max_depth_ << " hops");
            return Status::error(ErrorCode::CYCLE_REJECTED, "Link " + from + " -> " + to +
                                                                " would create a cycle within " +
                                                                std::to_string(max_depth_) + " hops");
        }
    }

    const size_t f = ensure_node(from);
    const size_t t = ensure_node(to);

    edges_.push_back(Edge{f, t, type, direction, true});
    const size_t edge_index = edges_.size() - 1;
    nodes_[f].incident.push_back(edge_index);
    nodes_[t].incident.push_back(edge_index);
    active_edges_++;
    revision_++;

    LOG_DEBUG("[LinkGraph] Added " << from << (direction == LinkDirection::BIDIRECTIONAL ? " <-> " : " -> ") << to
                                   << " (" << link_type_to_string(type) << ")");
    return Status::success();
}

Status DeviceLinkGraph::remove_link(const std::string &from, const std::string &to) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto from_index = find_node(from);
    auto to_index = find_node(to);
    if (!from_index || !to_index) {
        return Status::error(ErrorCode::NOT_FOUND, "No link " + from + " -> " + to);
    }

    auto edge = find_edge(*from_index, *to_index);
    if (!edge) {
        auto reverse = find_edge(*to_index, *from_index);
        if (reverse && edges_[*reverse].direction == LinkDirection::BIDIRECTIONAL) {
            edge = reverse;
        }
    }
    if (!edge) {
        return Status::error(ErrorCode::NOT_FOUND, "No link " + from + " -> " + to);
    }

    deactivate_edge(*edge);
    LOG_DEBUG("[LinkGraph] Removed " << from << " -> " << to);
    maybe_compact();
    return Status::success();
}

std::vector<RelatedDevice> DeviceLinkGraph::related_devices(const std::string &device_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<RelatedDevice> result;
    auto start = find_node(device_id);
    if (!start) {
        return result;
    }

    struct Frontier {
        size_t node;
        std::vector<std::string> path;
        int depth;
    };

    std::vector<bool> visited(nodes_.size(), false);
    std::deque<Frontier> queue;
    visited[*start] = true;
    queue.push_back(Frontier{*start, {device_id}, 0});

    while (!queue.empty()) {
        Frontier current = std::move(queue.front());
        queue.pop_front();

        if (current.depth >= max_depth_) {
            continue;
        }

        for (size_t edge_index : nodes_[current.node].incident) {
            const Edge &edge = edges_[edge_index];
            size_t neighbor;
            if (edge.from == current.node) {
                neighbor = edge.to;
            } else if (edge.direction == LinkDirection::BIDIRECTIONAL) {
                neighbor = edge.from;
            } else {
                continue;  // unidirectional edge pointing at us
            }

            if (visited[neighbor]) {
                continue;
            }
            visited[neighbor] = true;

            std::vector<std::string> path = current.path;
            path.push_back(nodes_[neighbor].id);

            RelatedDevice related;
            related.device_id = nodes_[neighbor].id;
            related.path = path;
            related.link_type = edge.type;
            related.depth = current.depth + 1;
            result.push_back(std::move(related));

            queue.push_back(Frontier{neighbor, std::move(path), current.depth + 1});
        }
    }

    return result;
}

std::vector<DeviceLink> DeviceLinkGraph::links() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<DeviceLink> result;
    result.reserve(active_edges_);
    for (const auto &edge : edges_) {
        if (edge.active) {
            result.push_back(DeviceLink{nodes_[edge.from].id, nodes_[edge.to].id, edge.type, edge.direction});
        }
    }
    return result;
}

std::vector<DeviceLink> DeviceLinkGraph::links_for(const std::string &device_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<DeviceLink> result;
    auto index = find_node(device_id);
    if (!index) {
        return result;
    }
    for (size_t edge_index : nodes_[*index].incident) {
        const Edge &edge = edges_[edge_index];
        result.push_back(DeviceLink{nodes_[edge.from].id, nodes_[edge.to].id, edge.type, edge.direction});
    }
    return result;
}

size_t DeviceLinkGraph::remove_device(const std::string &device_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto index = find_node(device_id);
    if (!index) {
        return 0;
    }

    // Copy: deactivate_edge mutates the incident list
    const std::vector<size_t> incident = nodes_[*index].incident;
    for (size_t edge_index : incident) {
        deactivate_edge(edge_index);
    }
    maybe_compact();
    return incident.size();
}

size_t DeviceLinkGraph::link_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return active_edges_;
}

size_t DeviceLinkGraph::edge_slots() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return edges_.size();
}

size_t DeviceLinkGraph::node_slots() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return nodes_.size();
}

uint64_t DeviceLinkGraph::revision() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return revision_;
}

std::optional<size_t> DeviceLinkGraph::find_node(const std::string &id) const {
    auto it = node_index_.find(id);
    if (it == node_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<size_t> DeviceLinkGraph::find_edge(size_t from, size_t to) const {
    for (size_t edge_index : nodes_[from].incident) {
        const Edge &edge = edges_[edge_index];
        if (edge.from == from && edge.to == to) {
            return edge_index;
        }
    }
    return std::nullopt;
}

bool DeviceLinkGraph::reachable_within(size_t source, size_t target, int max_hops) const {
    if (max_hops <= 0) {
        return false;
    }

    std::vector<int> depth(nodes_.size(), -1);
    std::deque<size_t> queue;
    depth[source] = 0;
    queue.push_back(source);

    while (!queue.empty()) {
        size_t current = queue.front();
        queue.pop_front();
        if (depth[current] >= max_hops) {
            continue;
        }

        for (size_t edge_index : nodes_[current].incident) {
            const Edge &edge = edges_[edge_index];
            size_t neighbor;
            if (edge.from == current) {
                neighbor = edge.to;
            } else if (edge.direction == LinkDirection::BIDIRECTIONAL) {
                neighbor = edge.from;
            } else {
                continue;
            }

            if (neighbor == target) {
                return true;
            }
            if (depth[neighbor] < 0) {
                depth[neighbor] = depth[current] + 1;
                queue.push_back(neighbor);
            }
        }
    }
    return false;
}

size_t DeviceLinkGraph::ensure_node(const std::string &id) {
    auto existing = find_node(id);
    if (existing) {
        return *existing;
    }
    nodes_.push_back(Node{id, {}});
    node_index_[id] = nodes_.size() - 1;
    return nodes_.size() - 1;
}

void DeviceLinkGraph::deactivate_edge(size_t edge_index) {
    Edge &edge = edges_[edge_index];
    if (!edge.active) {
        return;
    }
    edge.active = false;

    for (size_t endpoint : {edge.from, edge.to}) {
        auto &incident = nodes_[endpoint].incident;
        for (auto it = incident.begin(); it != incident.end(); ++it) {
            if (*it == edge_index) {
                incident.erase(it);
                break;
            }
        }
    }
    active_edges_--;
    revision_++;
}

void DeviceLinkGraph::maybe_compact() {
    const size_t removed = edges_.size() - active_edges_;
    if (removed < kCompactThreshold || removed < active_edges_) {
        return;
    }

    // Surviving edges and nodes keep their relative order
    std::vector<size_t> edge_map(edges_.size(), kDropped);
    std::vector<Edge> edges;
    edges.reserve(active_edges_);
    for (size_t i = 0; i < edges_.size(); ++i) {
        if (edges_[i].active) {
            edge_map[i] = edges.size();
            edges.push_back(edges_[i]);
        }
    }

    std::vector<size_t> node_map(nodes_.size(), kDropped);
    std::vector<Node> nodes;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (!nodes_[i].incident.empty()) {
            node_map[i] = nodes.size();
            nodes.push_back(std::move(nodes_[i]));
        }
    }

    for (auto &node : nodes) {
        for (auto &edge_index : node.incident) {
            edge_index = edge_map[edge_index];
        }
    }
    for (auto &edge : edges) {
        edge.from = node_map[edge.from];
        edge.to = node_map[edge.to];
    }

    node_index_.clear();
    for (size_t i = 0; i < nodes.size(); ++i) {
        node_index_[nodes[i].id] = i;
    }

    LOG_DEBUG("[LinkGraph] Compacted arena: " << edges_.size() << " -> " << edges.size() << " edges, "
                                              << nodes_.size() << " -> " << nodes.size() << " devices");
    edges_ = std::move(edges);
    nodes_ = std::move(nodes);
}

}  // namespace graph
}  // namespace hearth
