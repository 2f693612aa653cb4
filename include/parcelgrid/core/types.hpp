#pragma once

#include <boost/functional/hash.hpp>
#include <vector>
#include <string>
#include <string_view>
#include <cstdint>
#include <optional>
#include <functional>

namespace parcelgrid::core {

struct Cell {
    int row;
    int col;

    bool operator==(const Cell& other) const noexcept {
        return row == other.row && col == other.col;
    }

    bool operator!=(const Cell& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Cell& other) const noexcept {
        if (row != other.row) return row < other.row;
        return col < other.col;
    }
};

using Tick = int;
using PackageId = int;

// Package id 0 is reserved for "not carrying anything".
inline constexpr PackageId kNoPackage = 0;

enum class Move {
    Stay,
    Left,
    Right,
    Up,
    Down
};

enum class PackageAction {
    None,
    Pickup,
    Drop
};

struct Action {
    Move move = Move::Stay;
    PackageAction package_action = PackageAction::None;

    bool operator==(const Action& other) const noexcept = default;
};

// Ordered: a package never moves to a lower status.
enum class PackageStatus {
    Pending,
    Waiting,
    InTransit,
    Delivered
};

struct Robot {
    Cell position;
    PackageId carrying = kNoPackage;

    bool is_carrying() const noexcept { return carrying != kNoPackage; }
};

struct Package {
    PackageId id = kNoPackage;
    Cell start;
    Cell target;
    Tick spawn_time = 0;
    Tick deadline = 0;
    PackageStatus status = PackageStatus::Pending;
};

struct RewardParams {
    double move_cost = -0.01;
    double delivery_reward = 10.0;
    double delay_reward = 1.0;
};

bool is_directional(Move move) noexcept;
Cell apply_move(const Cell& cell, Move move) noexcept;

// Single-character encoding: S L R U D for moves, 0 1 2 for package actions.
std::optional<Move> parse_move(char c) noexcept;
std::optional<PackageAction> parse_package_action(char c) noexcept;
char to_char(Move move) noexcept;
char to_char(PackageAction action) noexcept;
std::string_view to_string(PackageStatus status) noexcept;

struct CellHash {
    std::size_t operator()(const Cell& cell) const noexcept {
        std::size_t seed = 0;
        boost::hash_combine(seed, cell.row);
        boost::hash_combine(seed, cell.col);
        return seed;
    }
};

} // namespace parcelgrid::core
