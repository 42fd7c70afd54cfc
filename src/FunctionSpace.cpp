#include "FunctionSpace.hpp"
#include <stdexcept>

namespace GOAS {

FunctionSpace::FunctionSpace(std::shared_ptr<const IntervalMesh> mesh, PetscInt num_components)
    : mesh_(std::move(mesh)), num_components_(num_components) {
    if (!mesh_) {
        throw std::invalid_argument("FunctionSpace: mesh is null");
    }
    if (num_components_ < 1) {
        throw std::invalid_argument("FunctionSpace: at least one component is required");
    }
}

void FunctionSpace::cellDofs(PetscInt c, PetscInt* dofs) const {
    for (PetscInt i = 0; i < num_components_; i++) {
        dofs[i] = dof(c, i);
        dofs[num_components_ + i] = dof(c + 1, i);
    }
}

void FunctionSpace::gather(PetscInt c, const PetscScalar* global, PetscScalar* local) const {
    for (PetscInt i = 0; i < num_components_; i++) {
        local[i] = global[dof(c, i)];
        local[num_components_ + i] = global[dof(c + 1, i)];
    }
}

PetscErrorCode FunctionSpace::createVector(Vec* v) const {
    PetscFunctionBeginUser;
    PetscCall(VecCreateSeq(PETSC_COMM_SELF, numDofs(), v));
    PetscCall(VecSetBlockSize(*v, num_components_));
    PetscCall(VecZeroEntries(*v));
    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode FunctionSpace::createErrorVector(Vec* v) const {
    PetscFunctionBeginUser;
    PetscCall(VecCreateSeq(PETSC_COMM_SELF, mesh_->numCells(), v));
    PetscCall(PetscObjectSetName((PetscObject)*v, "Error Indicator"));
    PetscCall(VecZeroEntries(*v));
    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode FunctionSpace::interpolate(const std::function<void(PetscReal, PetscScalar*)>& f,
                                          Vec v) const {
    PetscFunctionBeginUser;

    PetscScalar* array;
    PetscCall(VecGetArray(v, &array));
    for (PetscInt vtx = 0; vtx < mesh_->numVertices(); vtx++) {
        f(mesh_->vertex(vtx), &array[dof(vtx, 0)]);
    }
    PetscCall(VecRestoreArray(v, &array));

    PetscFunctionReturn(PETSC_SUCCESS);
}

} // namespace GOAS
