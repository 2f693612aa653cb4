#include "parcelgrid/adapters/basic_policies.hpp"
#include "parcelgrid/adapters/greedy_policy.hpp"
#include <boost/random/uniform_int_distribution.hpp>
#include <spdlog/spdlog.h>

namespace parcelgrid::adapters {

std::vector<core::Action> RandomPolicy::get_actions(const core::Snapshot& snapshot) {
    boost::random::uniform_int_distribution<int> move_dist(0, 4);
    boost::random::uniform_int_distribution<int> package_dist(0, 2);

    std::vector<core::Action> actions;
    actions.reserve(snapshot.robots.size());
    for (std::size_t i = 0; i < snapshot.robots.size(); ++i) {
        actions.push_back({static_cast<core::Move>(move_dist(rng_)),
                           static_cast<core::PackageAction>(package_dist(rng_))});
    }
    return actions;
}

parcelgrid::ports::PolicyPtr make_policy(std::string_view name, uint64_t seed) {
    if (name == "greedy") {
        return std::make_unique<GreedyPolicy>();
    }
    if (name == "random") {
        return std::make_unique<RandomPolicy>(seed);
    }
    if (name == "idle") {
        return std::make_unique<IdlePolicy>();
    }

    spdlog::error("Unknown policy: {}", name);
    return nullptr;
}

} // namespace parcelgrid::adapters
