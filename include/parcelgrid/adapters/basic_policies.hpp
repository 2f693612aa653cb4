#pragma once

#include "parcelgrid/ports/policy.hpp"
#include <random>
#include <string_view>

namespace parcelgrid::adapters {

// Uniformly random moves and package actions from a seeded stream.
class RandomPolicy : public parcelgrid::ports::IPolicy {
public:
    explicit RandomPolicy(uint64_t seed) : rng_(seed) {}
    ~RandomPolicy() override = default;

    void reset(const core::Snapshot&) override {}
    std::vector<core::Action> get_actions(const core::Snapshot& snapshot) override;
    std::string_view name() const override { return "random"; }

private:
    std::mt19937_64 rng_;
};

// Every robot stays put and does nothing.
class IdlePolicy : public parcelgrid::ports::IPolicy {
public:
    void reset(const core::Snapshot&) override {}
    std::vector<core::Action> get_actions(const core::Snapshot& snapshot) override {
        return std::vector<core::Action>(snapshot.robots.size());
    }
    std::string_view name() const override { return "idle"; }
};

// "greedy", "random" or "idle"; nullptr for anything else.
parcelgrid::ports::PolicyPtr make_policy(std::string_view name, uint64_t seed);

} // namespace parcelgrid::adapters
