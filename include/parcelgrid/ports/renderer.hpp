#pragma once

#include "parcelgrid/core/grid.hpp"
#include "parcelgrid/core/metrics.hpp"
#include <memory>
#include <concepts>
#include <vector>

namespace parcelgrid::ports {

struct RenderState {
    std::shared_ptr<const parcelgrid::core::Grid> grid;
    std::vector<parcelgrid::core::Robot> robots;
    std::vector<parcelgrid::core::Package> packages;  // revealed so far
    parcelgrid::core::MetricsSnapshot metrics;
    parcelgrid::core::Tick current_tick = 0;
    double total_reward = 0.0;
    bool simulation_running = false;
    bool simulation_complete = false;
};

class IRenderer {
public:
    virtual ~IRenderer() = default;

    virtual bool initialize() = 0;
    virtual void shutdown() = 0;
    virtual bool should_quit() const = 0;
    virtual void render(const RenderState& state) = 0;
    virtual void present() = 0;

    virtual bool is_paused() const = 0;
    virtual bool step_requested() const = 0;
    virtual bool reset_requested() const = 0;
    virtual float get_speed_multiplier() const = 0;
};

template<typename T>
concept RendererImpl = std::derived_from<T, IRenderer>;

using RendererPtr = std::unique_ptr<IRenderer>;

} // namespace parcelgrid::ports
