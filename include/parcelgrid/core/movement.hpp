#pragma once

#include "parcelgrid/core/grid.hpp"
#include <boost/graph/adjacency_list.hpp>
#include <vector>

namespace parcelgrid::core {

enum class MoveVerdict {
    Stayed,   // asked to stay
    Moved,
    Invalid,  // target off-grid or an obstacle
    Bumped,   // target already claimed by a robot resolved earlier
    Cycle,    // part of a wait cycle (includes head-on swaps)
    Blocked   // waiting behind a robot stuck in a cycle
};

struct MovementOutcome {
    std::vector<Cell> final_positions;
    std::vector<MoveVerdict> verdicts;

    bool moved(std::size_t robot) const {
        return verdicts.at(robot) == MoveVerdict::Moved;
    }
};

// Turns one move request per robot into a conflict-free set of positions.
//
// Robot i waits on robot j when i's proposed cell is j's current cell. These
// edges form a wait-for graph in which every robot waits on at most one other.
// Robots are decided in topological order, always taking the lowest index among
// those that are ready; a decided robot takes its proposed cell unless an
// earlier robot already claimed it, in which case it stays. Robots left on or
// behind a cycle never become ready and stay where they are, which rules out
// swaps.
class MovementResolver {
public:
    explicit MovementResolver(const Grid& grid) : grid_(grid) {}

    // Proposed cell for a single move; invalid moves collapse to `from`.
    Cell propose(const Cell& from, Move move) const noexcept;

    MovementOutcome resolve(const std::vector<Cell>& positions,
                            const std::vector<Move>& moves) const;

private:
    const Grid& grid_;

    using WaitGraph = boost::adjacency_list<
        boost::vecS,
        boost::vecS,
        boost::directedS
    >;

    void classify_unresolved(const WaitGraph& graph,
                             const std::vector<bool>& resolved,
                             std::vector<MoveVerdict>& verdicts) const;
};

std::string_view to_string(MoveVerdict verdict) noexcept;

} // namespace parcelgrid::core
