#pragma once

#include "parcelgrid/core/snapshot.hpp"
#include <memory>
#include <concepts>
#include <string_view>
#include <vector>

namespace parcelgrid::ports {

// Decides one action per robot from the latest snapshot. Snapshots only list
// packages revealed at their own tick, so a policy has to remember earlier ones.
class IPolicy {
public:
    virtual ~IPolicy() = default;

    virtual void reset(const parcelgrid::core::Snapshot& initial) = 0;
    virtual std::vector<parcelgrid::core::Action> get_actions(const parcelgrid::core::Snapshot& snapshot) = 0;
    virtual std::string_view name() const = 0;
};

template<typename T>
concept PolicyImpl = std::derived_from<T, IPolicy>;

using PolicyPtr = std::unique_ptr<IPolicy>;

} // namespace parcelgrid::ports
