#include <datapod/datapod.hpp>
namespace dp = datapod;
#include "griffine/griffine.hpp"
#include <iostream>

int main() {
    std::cout << "=== Griffine Tiling Demo ===" << std::endl;

    const griffine::Grid grid(1024 * 10 + 7, 1024 * 5 + 3);
    const griffine::Affine transform(0.5, 0, 500000, 0, -0.5, 4200000);

    griffine::TiledAffineGrid tiled = grid.add_transform(transform).tile_via(griffine::Size{1024, 1024});
    std::cout << "Grid " << grid.size() << " tiled by " << tiled.tile_size() << " gives " << tiled.size() << " ("
              << tiled.tile_count() << " tiles)" << std::endl;

    // Only the last column and row are truncated
    for (std::size_t row = 0; row < tiled.rows(); ++row) {
        for (std::size_t col = 0; col < tiled.cols(); ++col) {
            auto tile = tiled.tile_at(col, row);
            if (tile.tile().is_truncated()) {
                std::cout << "Tile " << tile.cell() << " size " << tile.size() << " origin " << tile.origin()
                          << std::endl;
            }
        }
    }

    // Query with a datapod point, as produced by a robot pose
    dp::Point position{502600.25, 4198800.75, 12.0};
    try {
        auto tile = tiled.tile_containing(position);
        auto cell = tile.cell_containing(position);
        std::cout << "\nPosition (" << position.x << ", " << position.y << ") is in tile " << tile.cell()
                  << ", local " << cell.cell() << ", global " << tile.tile().to_global(cell.cell()) << std::endl;
    } catch (const griffine::griffine_error &e) {
        std::cerr << "Lookup failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
