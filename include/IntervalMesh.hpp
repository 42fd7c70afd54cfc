#ifndef INTERVAL_MESH_HPP
#define INTERVAL_MESH_HPP

#include "GOAS.hpp"

#include <vector>
#include <string>

namespace GOAS {

/**
 * @brief Geometry of a single mesh cell
 */
struct CellGeometry {
    PetscInt index;             ///< Cell index
    PetscReal x0;               ///< Left vertex coordinate
    PetscReal x1;               ///< Right vertex coordinate
    PetscReal h;                ///< Cell length
    PetscInt level;             ///< Refinement level
};

/**
 * @brief One-dimensional interval mesh
 *
 * Vertices are stored sorted; cell c spans [x_c, x_{c+1}]. A mesh is never
 * modified after construction, refinement produces a new mesh.
 */
class IntervalMesh {
public:
    /**
     * @brief Uniform mesh of [a, b] with n cells
     */
    IntervalMesh(PetscReal a, PetscReal b, PetscInt n);

    /**
     * @brief Mesh from explicit vertex coordinates and per-cell levels
     *
     * @param vertices Strictly increasing coordinates (at least two)
     * @param levels Refinement level of each cell (empty means all zero)
     */
    IntervalMesh(std::vector<PetscReal> vertices, std::vector<PetscInt> levels = {});

    PetscInt numCells() const { return static_cast<PetscInt>(vertices_.size()) - 1; }
    PetscInt numVertices() const { return static_cast<PetscInt>(vertices_.size()); }
    PetscInt dimension() const { return 1; }

    CellGeometry cell(PetscInt c) const;
    PetscReal vertex(PetscInt v) const { return vertices_[v]; }
    const std::vector<PetscReal>& vertices() const { return vertices_; }
    PetscInt level(PetscInt c) const { return levels_[c]; }

    PetscReal lower() const { return vertices_.front(); }
    PetscReal upper() const { return vertices_.back(); }
    PetscReal minCellSize() const;
    PetscReal maxCellSize() const;
    PetscInt maxLevel() const;

    /**
     * @brief Locate the cell containing x (boundary points go to the end cells)
     */
    PetscInt findCell(PetscReal x) const;

    /**
     * @brief Bisect the flagged cells
     *
     * @param split Per-cell flag, length numCells()
     * @return New mesh
     */
    IntervalMesh bisect(const std::vector<bool>& split) const;

private:
    std::vector<PetscReal> vertices_;
    std::vector<PetscInt> levels_;
};

} // namespace GOAS

#endif // INTERVAL_MESH_HPP
