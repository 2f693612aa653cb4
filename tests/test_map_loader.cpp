#include <catch2/catch_test_macros.hpp>
#include "parcelgrid/adapters/map_loader_file.hpp"
#include <filesystem>
#include <fstream>

using namespace parcelgrid::adapters;
using parcelgrid::core::Cell;
namespace fs = std::filesystem;

TEST_CASE("MapLoaderFile operations", "[map_loader]") {
    MapLoaderFile loader;

    SECTION("Load valid map file") {
        fs::path temp_map = fs::temp_directory_path() / "parcelgrid_test_map.txt";
        std::ofstream file(temp_map);
        file << "0 0 0 0 0\n";
        file << "0 0 1 0 0\n";
        file << "0 0 0 0 0\n";
        file << "0 0 1 0 0\n";
        file.close();

        auto grid = loader.load(temp_map);
        REQUIRE(grid.has_value());
        REQUIRE(grid->rows() == 4);
        REQUIRE(grid->cols() == 5);
        REQUIRE(!grid->is_free(Cell{1, 2}));
        REQUIRE(grid->is_free(Cell{0, 0}));
        REQUIRE(grid->free_cell_count() == 18);

        fs::remove(temp_map);
    }

    SECTION("Reject non-existent file") {
        fs::path fake_path = "/non/existent/map.txt";
        REQUIRE(!loader.load(fake_path).has_value());
    }

    SECTION("Skip comments, blank lines and stray whitespace") {
        fs::path temp_map = fs::temp_directory_path() / "parcelgrid_test_map_comments.txt";
        std::ofstream file(temp_map);
        file << "// warehouse floor\n";
        file << "\n";
        file << "  0 1 0\t\r\n";
        file << "// aisle\n";
        file << "0 0 0\n";
        file << "\n";
        file.close();

        auto grid = loader.load(temp_map);
        REQUIRE(grid.has_value());
        REQUIRE(grid->rows() == 2);
        REQUIRE(grid->cols() == 3);
        REQUIRE(!grid->is_free(Cell{0, 1}));

        fs::remove(temp_map);
    }

    SECTION("Reject invalid cell values") {
        fs::path temp_map = fs::temp_directory_path() / "parcelgrid_test_map_invalid.txt";
        std::ofstream file(temp_map);
        file << "0 0 2 0\n";
        file << "0 0 0 0\n";
        file.close();

        REQUIRE(!loader.load(temp_map).has_value());

        fs::remove(temp_map);
    }

    SECTION("Reject inconsistent row widths") {
        fs::path temp_map = fs::temp_directory_path() / "parcelgrid_test_map_inconsistent.txt";
        std::ofstream file(temp_map);
        file << "0 0 0 0\n";
        file << "0 0\n";
        file << "0 0 0 0\n";
        file.close();

        REQUIRE(!loader.load(temp_map).has_value());

        fs::remove(temp_map);
    }

    SECTION("Reject a map without free cells") {
        fs::path temp_map = fs::temp_directory_path() / "parcelgrid_test_map_blocked.txt";
        std::ofstream file(temp_map);
        file << "1 1\n";
        file << "1 1\n";
        file.close();

        REQUIRE(!loader.load(temp_map).has_value());

        fs::remove(temp_map);
    }

    SECTION("Reject an empty file") {
        fs::path temp_map = fs::temp_directory_path() / "parcelgrid_test_map_empty.txt";
        std::ofstream file(temp_map);
        file << "// nothing but a comment\n";
        file.close();

        REQUIRE(!loader.load(temp_map).has_value());

        fs::remove(temp_map);
    }
}
