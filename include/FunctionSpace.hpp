#ifndef FUNCTION_SPACE_HPP
#define FUNCTION_SPACE_HPP

#include "GOAS.hpp"
#include "IntervalMesh.hpp"

#include <memory>
#include <vector>

namespace GOAS {

/**
 * @brief Continuous piecewise-linear function space on an IntervalMesh
 *
 * Each vertex carries numComponents() degrees of freedom, interleaved:
 * dof(v, i) = v * numComponents() + i. A cell owns the dofs of its two
 * vertices, left vertex first.
 *
 * The companion error space is piecewise constant: one dof per cell.
 */
class FunctionSpace {
public:
    FunctionSpace(std::shared_ptr<const IntervalMesh> mesh, PetscInt num_components);

    const IntervalMesh& mesh() const { return *mesh_; }
    std::shared_ptr<const IntervalMesh> meshPtr() const { return mesh_; }

    PetscInt numComponents() const { return num_components_; }
    PetscInt numDofs() const { return mesh_->numVertices() * num_components_; }
    PetscInt numCellDofs() const { return 2 * num_components_; }
    PetscInt numCells() const { return mesh_->numCells(); }

    PetscInt dof(PetscInt vertex, PetscInt component) const {
        return vertex * num_components_ + component;
    }

    /**
     * @brief Global dof indices of cell c (numCellDofs() entries)
     */
    void cellDofs(PetscInt c, PetscInt* dofs) const;

    /**
     * @brief Gather the cell-local values of a global array
     */
    void gather(PetscInt c, const PetscScalar* global, PetscScalar* local) const;

    /**
     * @brief Create a vector in this space
     */
    PetscErrorCode createVector(Vec* v) const;

    /**
     * @brief Create a vector in the piecewise-constant error space
     */
    PetscErrorCode createErrorVector(Vec* v) const;

    /**
     * @brief Interpolate a pointwise function into v
     */
    PetscErrorCode interpolate(const std::function<void(PetscReal, PetscScalar*)>& f,
                               Vec v) const;

private:
    std::shared_ptr<const IntervalMesh> mesh_;
    PetscInt num_components_;
};

} // namespace GOAS

#endif // FUNCTION_SPACE_HPP
