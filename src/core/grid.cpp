#include "parcelgrid/core/grid.hpp"
#include "parcelgrid/core/errors.hpp"
#include <spdlog/fmt/fmt.h>

namespace parcelgrid::core {

Grid::Grid(const std::vector<std::vector<int>>& matrix) {
    if (matrix.empty() || matrix.front().empty()) {
        throw ConfigError("Grid must have at least one row and one column");
    }

    rows_ = static_cast<int>(matrix.size());
    cols_ = static_cast<int>(matrix.front().size());
    cells_.reserve(static_cast<std::size_t>(rows_) * cols_);

    for (int r = 0; r < rows_; ++r) {
        const auto& row = matrix[r];
        if (static_cast<int>(row.size()) != cols_) {
            throw ConfigError(fmt::format(
                "Inconsistent row width at row {}: expected {}, got {}", r, cols_, row.size()));
        }

        for (int value : row) {
            if (value != 0 && value != 1) {
                throw ConfigError(fmt::format("Invalid cell value {} at row {}", value, r));
            }
            cells_.push_back(value == 0 ? Terrain::Free : Terrain::Obstacle);
            if (value == 0) {
                ++free_count_;
            }
        }
    }
}

Terrain Grid::at(const Cell& cell) const {
    if (!in_bounds(cell)) {
        throw std::out_of_range(fmt::format("Cell ({}, {}) is outside the grid", cell.row, cell.col));
    }
    return cells_[index_of(cell)];
}

std::vector<Cell> Grid::free_cells() const {
    std::vector<Cell> free;
    free.reserve(free_count_);
    for (int r = 0; r < rows_; ++r) {
        for (int c = 0; c < cols_; ++c) {
            if (cells_[index_of({r, c})] == Terrain::Free) {
                free.push_back({r, c});
            }
        }
    }
    return free;
}

std::vector<std::vector<int>> Grid::to_matrix() const {
    std::vector<std::vector<int>> matrix(rows_, std::vector<int>(cols_, 0));
    for (int r = 0; r < rows_; ++r) {
        for (int c = 0; c < cols_; ++c) {
            matrix[r][c] = static_cast<int>(cells_[index_of({r, c})]);
        }
    }
    return matrix;
}

} // namespace parcelgrid::core
