#include "parcelgrid/core/types.hpp"

namespace parcelgrid::core {

bool is_directional(Move move) noexcept {
    return move != Move::Stay;
}

Cell apply_move(const Cell& cell, Move move) noexcept {
    switch (move) {
        case Move::Left:  return {cell.row, cell.col - 1};
        case Move::Right: return {cell.row, cell.col + 1};
        case Move::Up:    return {cell.row - 1, cell.col};
        case Move::Down:  return {cell.row + 1, cell.col};
        case Move::Stay:  break;
    }
    return cell;
}

std::optional<Move> parse_move(char c) noexcept {
    switch (c) {
        case 'S': return Move::Stay;
        case 'L': return Move::Left;
        case 'R': return Move::Right;
        case 'U': return Move::Up;
        case 'D': return Move::Down;
        default:  return std::nullopt;
    }
}

std::optional<PackageAction> parse_package_action(char c) noexcept {
    switch (c) {
        case '0': return PackageAction::None;
        case '1': return PackageAction::Pickup;
        case '2': return PackageAction::Drop;
        default:  return std::nullopt;
    }
}

char to_char(Move move) noexcept {
    switch (move) {
        case Move::Stay:  return 'S';
        case Move::Left:  return 'L';
        case Move::Right: return 'R';
        case Move::Up:    return 'U';
        case Move::Down:  return 'D';
    }
    return 'S';
}

char to_char(PackageAction action) noexcept {
    switch (action) {
        case PackageAction::None:   return '0';
        case PackageAction::Pickup: return '1';
        case PackageAction::Drop:   return '2';
    }
    return '0';
}

std::string_view to_string(PackageStatus status) noexcept {
    switch (status) {
        case PackageStatus::Pending:   return "pending";
        case PackageStatus::Waiting:   return "waiting";
        case PackageStatus::InTransit: return "in_transit";
        case PackageStatus::Delivered: return "delivered";
    }
    return "unknown";
}

} // namespace parcelgrid::core
