#include "parcelgrid/adapters/imgui_renderer.hpp"
#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_opengl3.h>
#include <SDL_opengl.h>
#ifdef __APPLE__
#include <OpenGL/gl.h>
#else
#include <GL/gl.h>
#endif
#include <spdlog/spdlog.h>
#include <array>

namespace parcelgrid::adapters {

using parcelgrid::core::Cell;
using parcelgrid::core::PackageStatus;

namespace {

constexpr std::array<ImU32, 10> kRobotPalette = {
    IM_COL32(230, 25, 75, 255),
    IM_COL32(60, 180, 75, 255),
    IM_COL32(255, 225, 25, 255),
    IM_COL32(0, 130, 200, 255),
    IM_COL32(245, 130, 48, 255),
    IM_COL32(145, 30, 180, 255),
    IM_COL32(70, 240, 240, 255),
    IM_COL32(240, 50, 230, 255),
    IM_COL32(210, 245, 60, 255),
    IM_COL32(250, 190, 212, 255),
};

ImU32 robot_color(std::size_t index) {
    return kRobotPalette[index % kRobotPalette.size()];
}

ImU32 with_alpha(ImU32 color, int alpha) {
    return (color & ~IM_COL32_A_MASK) | (static_cast<ImU32>(alpha) << IM_COL32_A_SHIFT);
}

ImVec2 cell_center(const ImVec2& origin, const Cell& cell, int cell_size) {
    float half = cell_size * 0.5f;
    return ImVec2(origin.x + cell.col * cell_size + half, origin.y + cell.row * cell_size + half);
}

} // namespace

ImGuiRenderer::ImGuiRenderer() = default;

ImGuiRenderer::~ImGuiRenderer() {
    shutdown();
}

bool ImGuiRenderer::initialize() {
    if (window_) {
        return true;
    }

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        spdlog::error("Failed to initialize SDL: {}", SDL_GetError());
        return false;
    }

    // GL 3.2 Core + GLSL 150 for macOS compatibility
    const char* glsl_version = "#version 150";
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, SDL_GL_CONTEXT_FORWARD_COMPATIBLE_FLAG);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 2);

    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
    SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 24);
    SDL_GL_SetAttribute(SDL_GL_STENCIL_SIZE, 8);

    SDL_WindowFlags window_flags = static_cast<SDL_WindowFlags>(
        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI
    );

    window_ = SDL_CreateWindow(
        "Parcel Grid Simulator",
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        1280, 800,
        window_flags
    );

    if (!window_) {
        spdlog::error("Failed to create SDL window: {}", SDL_GetError());
        SDL_Quit();
        return false;
    }

    gl_context_ = SDL_GL_CreateContext(window_);
    if (!gl_context_) {
        spdlog::error("Failed to create GL context: {}", SDL_GetError());
        shutdown();
        return false;
    }
    SDL_GL_MakeCurrent(window_, gl_context_);
    SDL_GL_SetSwapInterval(1); // Enable vsync

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::StyleColorsDark();

    ImGui_ImplSDL2_InitForOpenGL(window_, gl_context_);
    ImGui_ImplOpenGL3_Init(glsl_version);

    spdlog::info("GUI initialized successfully");
    return true;
}

void ImGuiRenderer::shutdown() {
    if (gl_context_) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();

        SDL_GL_DeleteContext(gl_context_);
        gl_context_ = nullptr;
    }

    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
        SDL_Quit();
    }
}

bool ImGuiRenderer::should_quit() const {
    return quit_requested_;
}

bool ImGuiRenderer::step_requested() const {
    bool result = step_requested_flag_;
    const_cast<ImGuiRenderer*>(this)->step_requested_flag_ = false;
    return result;
}

bool ImGuiRenderer::reset_requested() const {
    bool result = reset_requested_flag_;
    if (result) {
        const_cast<ImGuiRenderer*>(this)->reset_visualization();
    }
    const_cast<ImGuiRenderer*>(this)->reset_requested_flag_ = false;
    return result;
}

void ImGuiRenderer::render(const parcelgrid::ports::RenderState& state) {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        ImGui_ImplSDL2_ProcessEvent(&event);
        if (event.type == SDL_QUIT) {
            quit_requested_ = true;
        }
    }

    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();

    glViewport(0, 0, static_cast<int>(ImGui::GetIO().DisplaySize.x), static_cast<int>(ImGui::GetIO().DisplaySize.y));
    glClearColor(0.45f, 0.55f, 0.60f, 1.00f);
    glClear(GL_COLOR_BUFFER_BIT);

    if (state.grid) {
        render_grid(state);
    }
    render_metrics(state);
    render_packages(state);
    render_controls();

    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
}

void ImGuiRenderer::present() {
    SDL_GL_SwapWindow(window_);
}

void ImGuiRenderer::update_robot_trails(const std::vector<parcelgrid::core::Robot>& robots) {
    if (robot_trails_.size() != robots.size()) {
        robot_trails_.assign(robots.size(), {});
        last_robot_positions_.clear();
    }

    for (std::size_t i = 0; i < robots.size(); ++i) {
        if (i < last_robot_positions_.size() && last_robot_positions_[i] != robots[i].position) {
            auto& trail = robot_trails_[i];
            trail.push_back(last_robot_positions_[i]);
            if (trail.size() > MAX_TRAIL) {
                trail.pop_front();
            }
        }
    }

    last_robot_positions_.clear();
    for (const auto& robot : robots) {
        last_robot_positions_.push_back(robot.position);
    }
}

void ImGuiRenderer::reset_visualization() {
    robot_trails_.clear();
    last_robot_positions_.clear();
}

void ImGuiRenderer::render_grid(const parcelgrid::ports::RenderState& state) {
    const auto& grid = *state.grid;
    update_robot_trails(state.robots);

    ImGui::Begin("Warehouse", nullptr, ImGuiWindowFlags_AlwaysAutoResize);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    ImVec2 canvas_pos = ImGui::GetCursorScreenPos();

    float grid_width = static_cast<float>(grid.cols() * CELL_SIZE);
    float grid_height = static_cast<float>(grid.rows() * CELL_SIZE);

    draw_list->AddRectFilled(canvas_pos, ImVec2(canvas_pos.x + grid_width, canvas_pos.y + grid_height),
                             IM_COL32(50, 50, 50, 255));

    ImU32 line_color = IM_COL32(100, 100, 100, 255);
    for (int c = 0; c <= grid.cols(); ++c) {
        float px = canvas_pos.x + c * CELL_SIZE;
        draw_list->AddLine(ImVec2(px, canvas_pos.y), ImVec2(px, canvas_pos.y + grid_height), line_color);
    }
    for (int r = 0; r <= grid.rows(); ++r) {
        float py = canvas_pos.y + r * CELL_SIZE;
        draw_list->AddLine(ImVec2(canvas_pos.x, py), ImVec2(canvas_pos.x + grid_width, py), line_color);
    }

    ImU32 obstacle_color = IM_COL32(139, 69, 19, 255);
    for (int r = 0; r < grid.rows(); ++r) {
        for (int c = 0; c < grid.cols(); ++c) {
            if (!grid.is_free(Cell{r, c})) {
                ImVec2 top_left(canvas_pos.x + c * CELL_SIZE + 1, canvas_pos.y + r * CELL_SIZE + 1);
                ImVec2 bottom_right(canvas_pos.x + (c + 1) * CELL_SIZE - 1, canvas_pos.y + (r + 1) * CELL_SIZE - 1);
                draw_list->AddRectFilled(top_left, bottom_right, obstacle_color);
            }
        }
    }

    if (show_trails_) {
        for (std::size_t i = 0; i < robot_trails_.size(); ++i) {
            ImU32 trail_color = with_alpha(robot_color(i), 70);
            for (const auto& cell : robot_trails_[i]) {
                ImVec2 top_left(canvas_pos.x + cell.col * CELL_SIZE + 3, canvas_pos.y + cell.row * CELL_SIZE + 3);
                ImVec2 bottom_right(canvas_pos.x + (cell.col + 1) * CELL_SIZE - 3, canvas_pos.y + (cell.row + 1) * CELL_SIZE - 3);
                draw_list->AddRectFilled(top_left, bottom_right, trail_color);
            }
        }
    }

    // Waiting packages as boxes on their start cell, every live target as a ring
    ImU32 package_color = IM_COL32(222, 184, 135, 255);
    ImU32 target_color = IM_COL32(255, 255, 255, 200);
    for (const auto& package : state.packages) {
        if (package.status == PackageStatus::Delivered) continue;

        if (package.status == PackageStatus::Waiting) {
            ImVec2 top_left(canvas_pos.x + package.start.col * CELL_SIZE + 6, canvas_pos.y + package.start.row * CELL_SIZE + 6);
            ImVec2 bottom_right(canvas_pos.x + (package.start.col + 1) * CELL_SIZE - 6, canvas_pos.y + (package.start.row + 1) * CELL_SIZE - 6);
            draw_list->AddRectFilled(top_left, bottom_right, package_color);
        }

        bool overdue = state.current_tick > package.deadline;
        draw_list->AddCircle(cell_center(canvas_pos, package.target, CELL_SIZE), CELL_SIZE * 0.35f,
                             overdue ? IM_COL32(255, 60, 60, 220) : target_color, 12, 2.0f);
    }

    for (std::size_t i = 0; i < state.robots.size(); ++i) {
        const auto& robot = state.robots[i];
        ImVec2 center = cell_center(canvas_pos, robot.position, CELL_SIZE);

        draw_list->AddCircleFilled(center, CELL_SIZE * 0.3f, robot_color(i));
        draw_list->AddCircle(center, CELL_SIZE * 0.3f, IM_COL32(255, 255, 255, 255), 12, 2.0f);
        if (robot.is_carrying()) {
            draw_list->AddRectFilled(ImVec2(center.x - 3, center.y - 3), ImVec2(center.x + 3, center.y + 3),
                                     package_color);
        }
    }

    ImGui::Dummy(ImVec2(grid_width, grid_height));

    ImGui::End();
}

void ImGuiRenderer::render_metrics(const parcelgrid::ports::RenderState& state) {
    const auto& metrics = state.metrics;

    ImGui::Begin("Simulation Metrics");

    ImGui::Text("Current Tick: %d", state.current_tick);
    ImGui::Text("Total Reward: %.2f", state.total_reward);
    ImGui::Text("Status: %s", state.simulation_complete ? "Complete" :
                              state.simulation_running ? "Running" : "Paused");

    ImGui::Separator();

    ImGui::Text("Pickups: %llu", static_cast<unsigned long long>(metrics.pickups));
    ImGui::Text("On-time Deliveries: %llu", static_cast<unsigned long long>(metrics.on_time_deliveries));
    ImGui::Text("Late Deliveries: %llu", static_cast<unsigned long long>(metrics.late_deliveries));

    ImGui::Separator();

    ImGui::Text("Moves: %llu", static_cast<unsigned long long>(metrics.moves));
    ImGui::Text("Blocked Moves: %llu", static_cast<unsigned long long>(metrics.blocked_moves));
    ImGui::Text("Cycle Stalls: %llu", static_cast<unsigned long long>(metrics.cycle_stalls));

    ImGui::End();
}

void ImGuiRenderer::render_packages(const parcelgrid::ports::RenderState& state) {
    ImGui::Begin("Packages");

    if (ImGui::BeginTable("packages", 5, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg)) {
        ImGui::TableSetupColumn("Id");
        ImGui::TableSetupColumn("Start");
        ImGui::TableSetupColumn("Target");
        ImGui::TableSetupColumn("Deadline");
        ImGui::TableSetupColumn("Status");
        ImGui::TableHeadersRow();

        for (const auto& package : state.packages) {
            ImGui::TableNextRow();
            ImGui::TableNextColumn();
            ImGui::Text("%d", package.id);
            ImGui::TableNextColumn();
            ImGui::Text("(%d, %d)", package.start.row + 1, package.start.col + 1);
            ImGui::TableNextColumn();
            ImGui::Text("(%d, %d)", package.target.row + 1, package.target.col + 1);
            ImGui::TableNextColumn();
            ImGui::Text("%d", package.deadline);
            ImGui::TableNextColumn();
            auto status = parcelgrid::core::to_string(package.status);
            ImGui::TextUnformatted(status.data(), status.data() + status.size());
        }
        ImGui::EndTable();
    }

    ImGui::End();
}

void ImGuiRenderer::render_controls() {
    ImGui::Begin("Simulation Controls");

    if (ImGui::Button(paused_ ? "Resume" : "Pause")) {
        paused_ = !paused_;
    }

    ImGui::SameLine();
    if (ImGui::Button("Step") && paused_) {
        step_requested_flag_ = true;
    }

    ImGui::SameLine();
    if (ImGui::Button("Reset")) {
        reset_requested_flag_ = true;
    }

    ImGui::Separator();

    ImGui::SliderFloat("Speed", &speed_multiplier_, 0.1f, 5.0f, "%.1fx");
    ImGui::Checkbox("Show trails", &show_trails_);

    ImGui::End();
}

} // namespace parcelgrid::adapters
