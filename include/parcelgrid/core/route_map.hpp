#pragma once

#include "parcelgrid/core/grid.hpp"
#include <boost/graph/adjacency_list.hpp>
#include <vector>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace parcelgrid::core {

// Shortest-path distances over the free cells of a grid. Distance fields are
// computed lazily per goal cell and cached, since goals repeat across ticks.
class RouteMap {
public:
    static constexpr int kUnreachable = -1;

    explicit RouteMap(const Grid& grid);

    int distance(const Cell& from, const Cell& to) const;

    // First move of a shortest path; Stay when already there, nullopt when
    // `to` cannot be reached.
    std::optional<Move> next_move(const Cell& from, const Cell& to) const;

    // Like next_move, but treats the `avoid` cells as blocked. Used to steer
    // around other robots; nullopt when they wall off every shortest route.
    std::optional<Move> next_move_avoiding(const Cell& from, const Cell& to,
                                           const std::unordered_set<Cell, CellHash>& avoid) const;

    // Directional moves that lead onto a free cell.
    std::vector<Move> open_moves(const Cell& from) const;

    std::size_t vertex_count() const noexcept { return vertex_to_cell_.size(); }

private:
    const Grid& grid_;

    using GridGraph = boost::adjacency_list<
        boost::vecS,
        boost::vecS,
        boost::undirectedS
    >;

    GridGraph graph_;
    std::unordered_map<Cell, std::size_t, CellHash> cell_to_vertex_;
    std::vector<Cell> vertex_to_cell_;
    mutable std::unordered_map<Cell, std::vector<int>, CellHash> distance_cache_;

    void build_graph();
    const std::vector<int>* distances_to(const Cell& goal) const;
};

} // namespace parcelgrid::core
