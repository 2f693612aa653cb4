#pragma once

#include "parcelgrid/ports/renderer.hpp"
#include <SDL.h>
#include <deque>
#include <vector>

namespace parcelgrid::adapters {

class ImGuiRenderer : public parcelgrid::ports::IRenderer {
public:
    ImGuiRenderer();
    ~ImGuiRenderer() override;

    bool initialize() override;
    void shutdown() override;
    bool should_quit() const override;
    void render(const parcelgrid::ports::RenderState& state) override;
    void present() override;

    bool is_paused() const override { return paused_; }
    bool step_requested() const override;
    bool reset_requested() const override;
    float get_speed_multiplier() const override { return speed_multiplier_; }

private:
    void render_grid(const parcelgrid::ports::RenderState& state);
    void render_metrics(const parcelgrid::ports::RenderState& state);
    void render_packages(const parcelgrid::ports::RenderState& state);
    void render_controls();
    void update_robot_trails(const std::vector<parcelgrid::core::Robot>& robots);
    void reset_visualization();

    SDL_Window* window_ = nullptr;
    SDL_GLContext gl_context_ = nullptr;
    bool quit_requested_ = false;
    bool paused_ = false;
    bool show_trails_ = true;
    bool step_requested_flag_ = false;
    bool reset_requested_flag_ = false;
    float speed_multiplier_ = 1.0f;

    // Grid rendering parameters
    static constexpr int CELL_SIZE = 24;
    static constexpr std::size_t MAX_TRAIL = 30;

    // Indexed by robot
    std::vector<std::deque<parcelgrid::core::Cell>> robot_trails_;
    std::vector<parcelgrid::core::Cell> last_robot_positions_;
};

} // namespace parcelgrid::adapters
