#pragma once

#include "parcelgrid/ports/imap_loader.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace parcelgrid::adapters {

// Reads maps written as rows of whitespace-separated 0 (free) / 1 (obstacle).
class MapLoaderFile : public parcelgrid::ports::IMapLoader {
public:
    MapLoaderFile() = default;
    ~MapLoaderFile() override = default;

    std::optional<core::Grid> load(const std::filesystem::path& path) override;

private:
    std::vector<std::vector<int>> read_grid_file(const std::filesystem::path& path) const;
    bool validate_grid(const std::vector<std::vector<int>>& matrix) const;
};

} // namespace parcelgrid::adapters
