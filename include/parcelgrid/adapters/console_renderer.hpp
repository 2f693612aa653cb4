#pragma once

#include "parcelgrid/ports/renderer.hpp"
#include <iosfwd>
#include <string>

namespace parcelgrid::adapters {

// Plain-text frames: the map with robots, package starts and targets drawn on
// it, followed by a robot and undelivered-package listing. Never interactive.
class ConsoleRenderer : public parcelgrid::ports::IRenderer {
public:
    explicit ConsoleRenderer(std::ostream& out);
    ~ConsoleRenderer() override = default;

    bool initialize() override { return true; }
    void shutdown() override {}
    bool should_quit() const override { return false; }
    void render(const parcelgrid::ports::RenderState& state) override;
    void present() override;

    bool is_paused() const override { return false; }
    bool step_requested() const override { return false; }
    bool reset_requested() const override { return false; }
    float get_speed_multiplier() const override { return 1.0f; }

    static std::string draw_map(const parcelgrid::ports::RenderState& state);

private:
    std::ostream& out_;
    std::string frame_;
};

} // namespace parcelgrid::adapters
