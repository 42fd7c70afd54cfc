#include "AdjointBackend.hpp"
#include "NumericalBackend.hpp"

namespace GOAS {

TapeAdjointBackend::TapeAdjointBackend(const NumericalBackend& backend) : backend_(backend) {}

PetscErrorCode TapeAdjointBackend::solveAdjointStep(const Problem& problem,
                                                    const FunctionSpace& space,
                                                    const AdjointStep& step, Vec dual) const {
    PetscFunctionBeginUser;

    PetscCheck(step.form && step.bcs && step.w, PETSC_COMM_SELF, PETSC_ERR_ARG_NULL,
               "Adjoint step is missing its residual form or state");

    Vec rhs;
    Mat A;

    PetscCall(VecDuplicate(step.w, &rhs));
    PetscCall(backend_.assembleFunctionalGradient(problem, space, step.t, step.w, rhs));
    PetscCall(VecScale(rhs, step.functional_weight));

    PetscCall(backend_.createMatrix(space, &A));

    // Coupling to the newer step through its dependence on w_n
    if (step.next_form) {
        PetscCheck(step.next_bcs && step.w_next && step.dual_next, PETSC_COMM_SELF,
                   PETSC_ERR_ARG_NULL, "Adjoint step is missing the newer step's data");

        Vec coupling;
        PetscCall(VecDuplicate(step.w, &coupling));
        PetscCall(backend_.assembleJacobian(*step.next_form, space, *step.next_bcs,
                                            step.w_next, step.w, JacobianArgument::PREVIOUS, A));
        PetscCall(MatMultTranspose(A, step.dual_next, coupling));
        PetscCall(VecAXPY(rhs, -1.0, coupling));
        PetscCall(VecDestroy(&coupling));
    }

    PetscCall(backend_.assembleJacobian(*step.form, space, *step.bcs, step.w, step.w_prev,
                                        JacobianArgument::CURRENT, A));
    PetscCall(backend_.homogenizeDirichlet(*step.bcs, space, A, rhs));
    PetscCall(backend_.solveTranspose(A, rhs, dual));

    PetscCall(MatDestroy(&A));
    PetscCall(VecDestroy(&rhs));

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode NullAdjointBackend::solveAdjointStep(const Problem&, const FunctionSpace&,
                                                    const AdjointStep&, Vec) const {
    PetscFunctionBeginUser;
    SETERRQ(PETSC_COMM_SELF, PETSC_ERR_SUP,
            "Adjoint solves are unsupported: no adjoint-capable backend is configured");
}

} // namespace GOAS
