#include "parcelgrid/adapters/map_loader_file.hpp"
#include "parcelgrid/core/errors.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>

namespace parcelgrid::adapters {

std::optional<parcelgrid::core::Grid> MapLoaderFile::load(const std::filesystem::path& path) {
    namespace fs = std::filesystem;

    if (!fs::exists(path)) {
        spdlog::error("Map file does not exist: {}", path.string());
        return std::nullopt;
    }

    auto matrix = read_grid_file(path);
    if (matrix.empty() || !validate_grid(matrix)) {
        spdlog::error("Invalid grid format in file: {}", path.string());
        return std::nullopt;
    }

    try {
        core::Grid grid(matrix);
        spdlog::info("Loaded map {}x{} from {} ({} free cells)",
                     grid.rows(), grid.cols(), path.string(), grid.free_cell_count());
        return grid;
    } catch (const core::ConfigError& e) {
        spdlog::error("Rejected map {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

std::vector<std::vector<int>> MapLoaderFile::read_grid_file(const std::filesystem::path& path) const {
    std::vector<std::vector<int>> matrix;
    std::ifstream file(path);

    if (!file) {
        spdlog::error("Failed to open file: {}", path.string());
        return {};
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;

        // Trim whitespace
        line.erase(0, line.find_first_not_of(" \t\r"));
        line.erase(line.find_last_not_of(" \t\r") + 1);

        // Skip empty lines and comments
        if (line.empty() || line.rfind("//", 0) == 0) {
            continue;
        }

        std::vector<int> row;
        std::istringstream tokens(line);
        std::string token;
        while (tokens >> token) {
            if (token != "0" && token != "1") {
                spdlog::error("Invalid cell '{}' on line {}", token, line_number);
                return {};
            }
            row.push_back(token == "1" ? 1 : 0);
        }
        matrix.push_back(std::move(row));
    }

    return matrix;
}

bool MapLoaderFile::validate_grid(const std::vector<std::vector<int>>& matrix) const {
    std::size_t width = matrix.front().size();
    if (width == 0) {
        return false;
    }

    // Check all rows have same width
    for (const auto& row : matrix) {
        if (row.size() != width) {
            spdlog::error("Inconsistent row width: expected {}, got {}", width, row.size());
            return false;
        }
    }

    std::size_t free_cells = 0;
    for (const auto& row : matrix) {
        free_cells += std::count(row.begin(), row.end(), 0);
    }

    if (free_cells == 0) {
        spdlog::error("Map has no free cells");
        return false;
    }

    return true;
}

} // namespace parcelgrid::adapters
