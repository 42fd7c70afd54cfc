#include "ResidualForms.hpp"
#include <vector>

namespace GOAS {

ThetaResidual::ThetaResidual(const Problem& problem, PetscReal t, PetscReal k,
                             PetscReal theta, bool indicator_mode)
    : problem_(problem), t_(t), k_(k), theta_(theta), indicator_mode_(indicator_mode) {}

PetscErrorCode ThetaResidual::cellResidual(const CellGeometry& cell, const PetscScalar* w,
                                           const PetscScalar* w_prev, PetscScalar* r) const {
    PetscFunctionBeginUser;

    const PetscInt n = numCellDofs();
    std::vector<PetscScalar> w_theta(n);
    for (PetscInt i = 0; i < n; i++) {
        w_theta[i] = (1.0 - theta_) * w_prev[i] + theta_ * w[i];
    }

    ResidualArguments args;
    args.t = t_;
    args.k = k_;
    args.w_theta = w_theta.data();
    args.w = w;
    args.w_prev = w_prev;
    args.indicator_mode = indicator_mode_;

    PetscCall(problem_.weakResidual(cell, args, r));

    PetscFunctionReturn(PETSC_SUCCESS);
}

SteadyResidual::SteadyResidual(const Problem& problem, bool indicator_mode)
    : problem_(problem), indicator_mode_(indicator_mode) {}

PetscErrorCode SteadyResidual::cellResidual(const CellGeometry& cell, const PetscScalar* w,
                                            const PetscScalar*, PetscScalar* r) const {
    PetscFunctionBeginUser;

    ResidualArguments args;
    args.t = 0.0;
    args.k = 0.0;
    args.w_theta = w;
    args.w = w;
    args.w_prev = nullptr;
    args.indicator_mode = indicator_mode_;

    PetscCall(problem_.weakResidual(cell, args, r));

    PetscFunctionReturn(PETSC_SUCCESS);
}

} // namespace GOAS
