#pragma once

#include "parcelgrid/core/grid.hpp"
#include <filesystem>
#include <optional>
#include <memory>

namespace parcelgrid::ports {

class IMapLoader {
public:
    virtual ~IMapLoader() = default;

    virtual std::optional<parcelgrid::core::Grid> load(const std::filesystem::path& path) = 0;
};

using MapLoaderPtr = std::unique_ptr<IMapLoader>;

} // namespace parcelgrid::ports
