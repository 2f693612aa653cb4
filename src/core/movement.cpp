#include "parcelgrid/core/movement.hpp"
#include "parcelgrid/core/errors.hpp"
#include <boost/graph/strong_components.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <queue>
#include <unordered_map>
#include <unordered_set>

namespace parcelgrid::core {

Cell MovementResolver::propose(const Cell& from, Move move) const noexcept {
    Cell next = apply_move(from, move);
    if (!grid_.is_free(next)) {
        return from;
    }
    return next;
}

MovementOutcome MovementResolver::resolve(const std::vector<Cell>& positions,
                                          const std::vector<Move>& moves) const {
    if (positions.size() != moves.size()) {
        throw InvocationError("Expected one move per robot");
    }

    const std::size_t n = positions.size();
    MovementOutcome outcome;
    outcome.final_positions = positions;
    outcome.verdicts.assign(n, MoveVerdict::Stayed);

    std::vector<Cell> proposed(n);
    std::unordered_map<Cell, std::size_t, CellHash> occupant;
    for (std::size_t i = 0; i < n; ++i) {
        proposed[i] = propose(positions[i], moves[i]);
        occupant[positions[i]] = i;
        if (is_directional(moves[i]) && proposed[i] == positions[i]) {
            outcome.verdicts[i] = MoveVerdict::Invalid;
        }
    }

    // Edge j -> i: robot i can only be decided once robot j has been.
    WaitGraph graph(n);
    std::vector<int> pending_on(n, 0);
    for (std::size_t i = 0; i < n; ++i) {
        auto it = occupant.find(proposed[i]);
        if (it != occupant.end() && it->second != i) {
            boost::add_edge(it->second, i, graph);
            ++pending_on[i];
        }
    }

    std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready;
    for (std::size_t i = 0; i < n; ++i) {
        if (pending_on[i] == 0) {
            ready.push(i);
        }
    }

    std::unordered_set<Cell, CellHash> claimed;
    std::vector<bool> resolved(n, false);

    while (!ready.empty()) {
        std::size_t i = ready.top();
        ready.pop();

        if (claimed.insert(proposed[i]).second) {
            outcome.final_positions[i] = proposed[i];
            if (proposed[i] != positions[i]) {
                outcome.verdicts[i] = MoveVerdict::Moved;
            }
        } else {
            claimed.insert(positions[i]);
            outcome.final_positions[i] = positions[i];
            outcome.verdicts[i] = MoveVerdict::Bumped;
        }
        resolved[i] = true;

        for (auto [e, e_end] = boost::out_edges(i, graph); e != e_end; ++e) {
            auto waiter = boost::target(*e, graph);
            if (--pending_on[waiter] == 0) {
                ready.push(waiter);
            }
        }
    }

    classify_unresolved(graph, resolved, outcome.verdicts);
    return outcome;
}

void MovementResolver::classify_unresolved(const WaitGraph& graph,
                                           const std::vector<bool>& resolved,
                                           std::vector<MoveVerdict>& verdicts) const {
    if (std::all_of(resolved.begin(), resolved.end(), [](bool r) { return r; })) {
        return;
    }

    std::vector<int> component(boost::num_vertices(graph));
    int n_components = boost::strong_components(graph, component.data());

    std::vector<int> component_size(n_components, 0);
    for (int c : component) {
        ++component_size[c];
    }

    for (std::size_t i = 0; i < resolved.size(); ++i) {
        if (resolved[i]) continue;
        verdicts[i] = component_size[component[i]] > 1 ? MoveVerdict::Cycle : MoveVerdict::Blocked;
        spdlog::debug("Robot {} held in place ({})", i, to_string(verdicts[i]));
    }
}

std::string_view to_string(MoveVerdict verdict) noexcept {
    switch (verdict) {
        case MoveVerdict::Stayed:  return "stayed";
        case MoveVerdict::Moved:   return "moved";
        case MoveVerdict::Invalid: return "invalid";
        case MoveVerdict::Bumped:  return "bumped";
        case MoveVerdict::Cycle:   return "cycle";
        case MoveVerdict::Blocked: return "blocked";
    }
    return "unknown";
}

} // namespace parcelgrid::core
