#include "griffine/griffine.hpp"
#include <iostream>

int main() {
    std::cout << "=== Griffine Grid Demo ===" << std::endl;

    griffine::Grid grid(10000, 5000);
    griffine::Affine transform(10, 0, 200000, 0, -10, 6100000);

    std::cout << "Grid size: " << grid.size() << std::endl;
    std::cout << "Transform: " << transform << std::endl;

    auto affine = grid.add_transform(transform);
    auto cell = affine.cell_at(0, 0);
    std::cout << "\nCell (0,0):" << std::endl;
    std::cout << "  origin:     " << cell.origin() << std::endl;
    std::cout << "  centroid:   " << cell.centroid() << std::endl;
    std::cout << "  antiorigin: " << cell.antiorigin() << std::endl;

    griffine::Point query(212345.0, 6056785.0);
    try {
        auto found = affine.cell_containing(query);
        std::cout << "\n" << query << " lies in " << found.cell() << std::endl;
    } catch (const griffine::griffine_error &e) {
        std::cerr << "Lookup failed: " << e.what() << std::endl;
        return 1;
    }

    griffine::Point outside(100.0, 100.0);
    try {
        auto found = affine.cell_containing(outside);
        std::cout << outside << " lies in " << found.cell() << std::endl;
    } catch (const griffine::out_of_bounds_error &e) {
        std::cout << outside << " is outside the grid: " << e.what() << std::endl;
    }

    return 0;
}
