#include "parcelgrid/core/route_map.hpp"
#include <boost/graph/breadth_first_search.hpp>
#include <boost/graph/visitors.hpp>
#include <boost/graph/filtered_graph.hpp>

namespace parcelgrid::core {

namespace {

// Up, right, down, left.
constexpr Move kDirections[] = {Move::Up, Move::Right, Move::Down, Move::Left};

// Keeps every vertex whose flag is clear.
struct OpenVertex {
    const std::vector<bool>* closed = nullptr;

    template <typename Vertex>
    bool operator()(const Vertex& v) const { return !(*closed)[v]; }
};

} // namespace

RouteMap::RouteMap(const Grid& grid) : grid_(grid) {
    build_graph();
}

void RouteMap::build_graph() {
    // Create vertices for each free cell
    for (const auto& cell : grid_.free_cells()) {
        cell_to_vertex_[cell] = vertex_to_cell_.size();
        vertex_to_cell_.push_back(cell);
    }

    graph_ = GridGraph(vertex_to_cell_.size());

    // Right and down neighbours only, so each undirected edge is added once
    for (std::size_t v = 0; v < vertex_to_cell_.size(); ++v) {
        const Cell& cell = vertex_to_cell_[v];
        for (Move move : {Move::Right, Move::Down}) {
            auto it = cell_to_vertex_.find(apply_move(cell, move));
            if (it != cell_to_vertex_.end()) {
                boost::add_edge(v, it->second, graph_);
            }
        }
    }
}

const std::vector<int>* RouteMap::distances_to(const Cell& goal) const {
    auto goal_it = cell_to_vertex_.find(goal);
    if (goal_it == cell_to_vertex_.end()) {
        return nullptr;
    }

    auto cached = distance_cache_.find(goal);
    if (cached != distance_cache_.end()) {
        return &cached->second;
    }

    std::vector<int> dist(vertex_to_cell_.size(), kUnreachable);
    dist[goal_it->second] = 0;
    boost::breadth_first_search(graph_, goal_it->second,
        boost::visitor(boost::make_bfs_visitor(
            boost::record_distances(dist.data(), boost::on_tree_edge()))));

    auto it = distance_cache_.emplace(goal, std::move(dist)).first;
    return &it->second;
}

int RouteMap::distance(const Cell& from, const Cell& to) const {
    auto from_it = cell_to_vertex_.find(from);
    const auto* dist = distances_to(to);
    if (from_it == cell_to_vertex_.end() || dist == nullptr) {
        return kUnreachable;
    }
    return (*dist)[from_it->second];
}

std::optional<Move> RouteMap::next_move(const Cell& from, const Cell& to) const {
    if (from == to) {
        return Move::Stay;
    }

    int remaining = distance(from, to);
    if (remaining == kUnreachable) {
        return std::nullopt;
    }

    const auto& dist = *distances_to(to);
    for (Move move : kDirections) {
        auto it = cell_to_vertex_.find(apply_move(from, move));
        if (it != cell_to_vertex_.end() && dist[it->second] == remaining - 1) {
            return move;
        }
    }
    return std::nullopt;
}

std::optional<Move> RouteMap::next_move_avoiding(const Cell& from, const Cell& to,
                                                const std::unordered_set<Cell, CellHash>& avoid) const {
    if (from == to) {
        return Move::Stay;
    }

    auto from_it = cell_to_vertex_.find(from);
    auto goal_it = cell_to_vertex_.find(to);
    if (from_it == cell_to_vertex_.end() || goal_it == cell_to_vertex_.end()) {
        return std::nullopt;
    }

    std::vector<bool> closed(vertex_to_cell_.size(), false);
    for (const auto& cell : avoid) {
        auto it = cell_to_vertex_.find(cell);
        if (it != cell_to_vertex_.end()) {
            closed[it->second] = true;
        }
    }
    closed[from_it->second] = false;
    closed[goal_it->second] = false;

    boost::filtered_graph<GridGraph, boost::keep_all, OpenVertex> open(
        graph_, boost::keep_all(), OpenVertex{&closed});

    std::vector<int> dist(vertex_to_cell_.size(), kUnreachable);
    dist[goal_it->second] = 0;
    boost::breadth_first_search(open, goal_it->second,
        boost::visitor(boost::make_bfs_visitor(
            boost::record_distances(dist.data(), boost::on_tree_edge())))
        .vertex_index_map(boost::get(boost::vertex_index, graph_)));

    int remaining = dist[from_it->second];
    if (remaining == kUnreachable) {
        return std::nullopt;
    }

    for (Move move : kDirections) {
        auto it = cell_to_vertex_.find(apply_move(from, move));
        if (it != cell_to_vertex_.end() && !closed[it->second] && dist[it->second] == remaining - 1) {
            return move;
        }
    }
    return std::nullopt;
}

std::vector<Move> RouteMap::open_moves(const Cell& from) const {
    std::vector<Move> moves;
    for (Move move : kDirections) {
        if (grid_.is_free(apply_move(from, move))) {
            moves.push_back(move);
        }
    }
    return moves;
}

} // namespace parcelgrid::core
