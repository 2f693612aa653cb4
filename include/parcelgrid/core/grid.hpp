#pragma once

#include "parcelgrid/core/types.hpp"
#include <vector>
#include <cstdint>

namespace parcelgrid::core {

enum class Terrain : std::uint8_t {
    Free = 0,
    Obstacle = 1
};

// Immutable obstacle mask. Row-major, (0, 0) is the top-left cell.
class Grid {
public:
    // Throws ConfigError when the matrix is empty, ragged, or holds values other than 0/1.
    explicit Grid(const std::vector<std::vector<int>>& matrix);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }

    bool in_bounds(const Cell& cell) const noexcept {
        return cell.row >= 0 && cell.row < rows_ &&
               cell.col >= 0 && cell.col < cols_;
    }

    bool is_free(const Cell& cell) const noexcept {
        if (!in_bounds(cell)) return false;
        return cells_[index_of(cell)] == Terrain::Free;
    }

    Terrain at(const Cell& cell) const;

    std::vector<Cell> free_cells() const;
    std::size_t free_cell_count() const noexcept { return free_count_; }

    std::vector<std::vector<int>> to_matrix() const;

private:
    int rows_ = 0;
    int cols_ = 0;
    std::size_t free_count_ = 0;
    std::vector<Terrain> cells_;

    std::size_t index_of(const Cell& cell) const noexcept {
        return static_cast<std::size_t>(cell.row) * cols_ + cell.col;
    }
};

} // namespace parcelgrid::core
