#include "NumericalBackend.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace GOAS {

namespace {

// Central-difference step for an entry of size |x|
PetscReal differenceStep(PetscScalar x) {
    return std::cbrt(PETSC_MACHINE_EPSILON) * std::max((PetscReal)1.0, PetscAbsScalar(x));
}

} // namespace

NumericalBackend::NumericalBackend(const SolverOptions& options) : options_(options) {}

std::shared_ptr<FunctionSpace> NumericalBackend::createFunctionSpace(
    std::shared_ptr<const IntervalMesh> mesh, PetscInt num_components) const {
    return std::make_shared<FunctionSpace>(std::move(mesh), num_components);
}

PetscErrorCode NumericalBackend::createMatrix(const FunctionSpace& space, Mat* J) const {
    PetscFunctionBeginUser;

    const PetscInt n = space.numDofs();
    const PetscInt nc = space.numCellDofs();

    // A vertex couples with itself and its two neighbours
    PetscCall(MatCreateSeqAIJ(PETSC_COMM_SELF, n, n, 3 * space.numComponents(), nullptr, J));
    PetscCall(MatSetOption(*J, MAT_KEEP_NONZERO_PATTERN, PETSC_TRUE));

    std::vector<PetscInt> dofs(nc);
    std::vector<PetscScalar> zeros(nc * nc, 0.0);
    for (PetscInt c = 0; c < space.numCells(); c++) {
        space.cellDofs(c, dofs.data());
        PetscCall(MatSetValues(*J, nc, dofs.data(), nc, dofs.data(), zeros.data(), ADD_VALUES));
    }
    // Dirichlet rows need a diagonal entry even for isolated dofs
    for (PetscInt i = 0; i < n; i++) {
        PetscCall(MatSetValue(*J, i, i, 0.0, ADD_VALUES));
    }
    PetscCall(MatAssemblyBegin(*J, MAT_FINAL_ASSEMBLY));
    PetscCall(MatAssemblyEnd(*J, MAT_FINAL_ASSEMBLY));

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode NumericalBackend::assembleResidual(const ResidualForm& form,
                                                  const FunctionSpace& space,
                                                  const std::vector<DirichletBC>& bcs,
                                                  Vec w, Vec w_prev, Vec F) const {
    PetscFunctionBeginUser;

    PetscCheck(!form.dependsOnPrevious() || w_prev, PETSC_COMM_SELF, PETSC_ERR_ARG_NULL,
               "Residual form needs the previous state");

    const PetscInt nc = space.numCellDofs();
    std::vector<PetscInt> dofs(nc);
    std::vector<PetscScalar> w_loc(nc), wp_loc(nc, 0.0), r_loc(nc);

    const PetscScalar* w_array;
    const PetscScalar* wp_array = nullptr;
    PetscScalar* f_array;

    PetscCall(VecZeroEntries(F));
    PetscCall(VecGetArrayRead(w, &w_array));
    if (w_prev) PetscCall(VecGetArrayRead(w_prev, &wp_array));
    PetscCall(VecGetArray(F, &f_array));

    for (PetscInt c = 0; c < space.numCells(); c++) {
        const CellGeometry cell = space.mesh().cell(c);
        space.cellDofs(c, dofs.data());
        space.gather(c, w_array, w_loc.data());
        if (wp_array) space.gather(c, wp_array, wp_loc.data());

        PetscCall(form.cellResidual(cell, w_loc.data(), wp_loc.data(), r_loc.data()));

        for (PetscInt i = 0; i < nc; i++) {
            f_array[dofs[i]] += r_loc[i];
        }
    }

    for (const auto& bc : bcs) {
        const PetscInt row = space.dof(bc.vertex, bc.component);
        f_array[row] = w_array[row] - bc.value;
    }

    PetscCall(VecRestoreArray(F, &f_array));
    if (w_prev) PetscCall(VecRestoreArrayRead(w_prev, &wp_array));
    PetscCall(VecRestoreArrayRead(w, &w_array));

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode NumericalBackend::assembleJacobian(const ResidualForm& form,
                                                  const FunctionSpace& space,
                                                  const std::vector<DirichletBC>& bcs,
                                                  Vec w, Vec w_prev,
                                                  JacobianArgument wrt, Mat J) const {
    PetscFunctionBeginUser;

    PetscCheck(!form.dependsOnPrevious() || w_prev, PETSC_COMM_SELF, PETSC_ERR_ARG_NULL,
               "Residual form needs the previous state");

    PetscCall(MatZeroEntries(J));

    const bool differentiate = (wrt == JacobianArgument::CURRENT) || form.dependsOnPrevious();

    if (differentiate) {
        const PetscInt nc = space.numCellDofs();
        std::vector<PetscInt> dofs(nc);
        std::vector<PetscScalar> w_loc(nc), wp_loc(nc, 0.0);
        std::vector<PetscScalar> r_plus(nc), r_minus(nc), J_loc(nc * nc);

        const PetscScalar* w_array;
        const PetscScalar* wp_array = nullptr;
        PetscCall(VecGetArrayRead(w, &w_array));
        if (w_prev) PetscCall(VecGetArrayRead(w_prev, &wp_array));

        for (PetscInt c = 0; c < space.numCells(); c++) {
            const CellGeometry cell = space.mesh().cell(c);
            space.cellDofs(c, dofs.data());
            space.gather(c, w_array, w_loc.data());
            if (wp_array) space.gather(c, wp_array, wp_loc.data());

            std::vector<PetscScalar>& x = (wrt == JacobianArgument::CURRENT) ? w_loc : wp_loc;

            for (PetscInt j = 0; j < nc; j++) {
                const PetscScalar saved = x[j];
                const PetscReal h = differenceStep(saved);

                x[j] = saved + h;
                PetscCall(form.cellResidual(cell, w_loc.data(), wp_loc.data(), r_plus.data()));
                x[j] = saved - h;
                PetscCall(form.cellResidual(cell, w_loc.data(), wp_loc.data(), r_minus.data()));
                x[j] = saved;

                for (PetscInt i = 0; i < nc; i++) {
                    J_loc[i * nc + j] = (r_plus[i] - r_minus[i]) / (2.0 * h);
                }
            }

            PetscCall(MatSetValues(J, nc, dofs.data(), nc, dofs.data(), J_loc.data(), ADD_VALUES));
        }

        if (w_prev) PetscCall(VecRestoreArrayRead(w_prev, &wp_array));
        PetscCall(VecRestoreArrayRead(w, &w_array));
    }

    PetscCall(MatAssemblyBegin(J, MAT_FINAL_ASSEMBLY));
    PetscCall(MatAssemblyEnd(J, MAT_FINAL_ASSEMBLY));

    if (!bcs.empty()) {
        std::vector<PetscInt> rows;
        rows.reserve(bcs.size());
        for (const auto& bc : bcs) {
            rows.push_back(space.dof(bc.vertex, bc.component));
        }
        const PetscScalar diag = (wrt == JacobianArgument::CURRENT) ? 1.0 : 0.0;
        PetscCall(MatZeroRows(J, static_cast<PetscInt>(rows.size()), rows.data(), diag,
                              nullptr, nullptr));
    }

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode NumericalBackend::applyDirichletValues(const std::vector<DirichletBC>& bcs,
                                                      const FunctionSpace& space, Vec w) const {
    PetscFunctionBeginUser;
    for (const auto& bc : bcs) {
        PetscCall(VecSetValue(w, space.dof(bc.vertex, bc.component), bc.value, INSERT_VALUES));
    }
    PetscCall(VecAssemblyBegin(w));
    PetscCall(VecAssemblyEnd(w));
    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode NumericalBackend::homogenizeDirichlet(const std::vector<DirichletBC>& bcs,
                                                     const FunctionSpace& space, Mat A,
                                                     Vec b) const {
    PetscFunctionBeginUser;

    if (bcs.empty()) PetscFunctionReturn(PETSC_SUCCESS);

    std::vector<PetscInt> rows;
    rows.reserve(bcs.size());
    for (const auto& bc : bcs) {
        rows.push_back(space.dof(bc.vertex, bc.component));
    }

    PetscCall(MatZeroRowsColumns(A, static_cast<PetscInt>(rows.size()), rows.data(), 1.0,
                                 nullptr, nullptr));
    for (PetscInt row : rows) {
        PetscCall(VecSetValue(b, row, 0.0, INSERT_VALUES));
    }
    PetscCall(VecAssemblyBegin(b));
    PetscCall(VecAssemblyEnd(b));

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode NumericalBackend::FormFunction(SNES snes, Vec x, Vec F, void* ctx) {
    (void)snes;  // Part of PETSc callback interface - accessed via ctx

    PetscFunctionBeginUser;
    SNESContext* sc = static_cast<SNESContext*>(ctx);
    PetscCall(sc->backend->assembleResidual(*sc->form, *sc->space, *sc->bcs, x, sc->w_prev, F));
    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode NumericalBackend::FormJacobian(SNES snes, Vec x, Mat J, Mat P, void* ctx) {
    (void)snes;
    (void)J;    // Same matrix as P

    PetscFunctionBeginUser;
    SNESContext* sc = static_cast<SNESContext*>(ctx);
    PetscCall(sc->backend->assembleJacobian(*sc->form, *sc->space, *sc->bcs, x, sc->w_prev,
                                            JacobianArgument::CURRENT, P));
    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode NumericalBackend::MonitorFunction(SNES snes, PetscInt its, PetscReal fnorm,
                                                 void* ctx) {
    PetscFunctionBeginUser;
    SNESContext* sc = static_cast<SNESContext*>(ctx);

    if (sc->backend->options_.monitor_convergence) {
        PetscCall(PetscPrintf(PETSC_COMM_SELF, "  Newton iteration %" PetscInt_FMT
                              ": ||F|| = %g\n", its, (double)fnorm));
    }

    if (its > 0 && sc->on_iterate && *sc->on_iterate) {
        Vec x;
        PetscCall(SNESGetSolution(snes, &x));
        PetscCall((*sc->on_iterate)(its, x));
    }

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode NumericalBackend::solveNonlinear(const ResidualForm& form,
                                                const FunctionSpace& space,
                                                const std::vector<DirichletBC>& bcs,
                                                Vec w, Vec w_prev,
                                                const IterateCallback& on_iterate,
                                                NonlinearSolveStats* stats) const {
    PetscFunctionBeginUser;

    SNESContext ctx;
    ctx.backend = this;
    ctx.form = &form;
    ctx.space = &space;
    ctx.bcs = &bcs;
    ctx.w_prev = w_prev;
    ctx.on_iterate = &on_iterate;

    SNES snes;
    KSP ksp;
    PC pc;
    Vec F;
    Mat J;

    PetscCall(applyDirichletValues(bcs, space, w));

    PetscCall(VecDuplicate(w, &F));
    PetscCall(createMatrix(space, &J));

    PetscCall(SNESCreate(PETSC_COMM_SELF, &snes));
    PetscCall(SNESSetType(snes, SNESNEWTONLS));
    PetscCall(SNESSetFunction(snes, F, FormFunction, &ctx));
    PetscCall(SNESSetJacobian(snes, J, J, FormJacobian, &ctx));
    PetscCall(SNESSetTolerances(snes, options_.absolute_tolerance, options_.relative_tolerance,
                                PETSC_DEFAULT, options_.max_nonlinear_iterations, PETSC_DEFAULT));
    PetscCall(SNESMonitorSet(snes, MonitorFunction, &ctx, nullptr));

    PetscCall(SNESGetKSP(snes, &ksp));
    PetscCall(KSPSetType(ksp, KSPPREONLY));
    PetscCall(KSPGetPC(ksp, &pc));
    PetscCall(PCSetType(pc, PCLU));

    PetscCall(SNESSolve(snes, nullptr, w));

    SNESConvergedReason reason;
    PetscInt its;
    PetscReal fnorm;
    PetscCall(SNESGetConvergedReason(snes, &reason));
    PetscCall(SNESGetIterationNumber(snes, &its));
    PetscCall(SNESGetFunctionNorm(snes, &fnorm));

    PetscCall(SNESDestroy(&snes));
    PetscCall(MatDestroy(&J));
    PetscCall(VecDestroy(&F));

    if (stats) {
        stats->iterations = its;
        stats->residual_norm = fnorm;
        stats->reason = reason;
    }

    PetscCheck(reason > 0, PETSC_COMM_SELF, PETSC_ERR_NOT_CONVERGED,
               "Nonlinear solve diverged: %s after %" PetscInt_FMT " iterations (||F|| = %g)",
               SNESConvergedReasons[reason], its, (double)fnorm);

    PetscCall(PetscInfo(nullptr, "Nonlinear solve converged in %" PetscInt_FMT
                        " iterations, ||F|| = %g\n", its, (double)fnorm));

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode NumericalBackend::solveTranspose(Mat A, Vec b, Vec x) const {
    PetscFunctionBeginUser;

    KSP ksp;
    PC pc;
    PetscCall(KSPCreate(PETSC_COMM_SELF, &ksp));
    PetscCall(KSPSetOperators(ksp, A, A));
    PetscCall(KSPSetType(ksp, KSPPREONLY));
    PetscCall(KSPGetPC(ksp, &pc));
    PetscCall(PCSetType(pc, PCLU));
    PetscCall(KSPSolveTranspose(ksp, b, x));

    KSPConvergedReason reason;
    PetscCall(KSPGetConvergedReason(ksp, &reason));
    PetscCall(KSPDestroy(&ksp));

    PetscCheck(reason >= 0, PETSC_COMM_SELF, PETSC_ERR_NOT_CONVERGED,
               "Transposed linear solve failed: %s", KSPConvergedReasons[reason]);

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode NumericalBackend::assembleFunctional(const Problem& problem,
                                                    const FunctionSpace& space,
                                                    PetscReal t, Vec w, PetscReal* value) const {
    PetscFunctionBeginUser;

    const PetscInt nc = space.numCellDofs();
    std::vector<PetscScalar> w_loc(nc);
    const PetscScalar* w_array;

    *value = 0.0;
    PetscCall(VecGetArrayRead(w, &w_array));
    for (PetscInt c = 0; c < space.numCells(); c++) {
        PetscReal contribution;
        space.gather(c, w_array, w_loc.data());
        PetscCall(problem.functional(space.mesh().cell(c), t, w_loc.data(), &contribution));
        *value += contribution;
    }
    PetscCall(VecRestoreArrayRead(w, &w_array));

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode NumericalBackend::assembleFunctionalGradient(const Problem& problem,
                                                            const FunctionSpace& space,
                                                            PetscReal t, Vec w,
                                                            Vec gradient) const {
    PetscFunctionBeginUser;

    const PetscInt nc = space.numCellDofs();
    std::vector<PetscInt> dofs(nc);
    std::vector<PetscScalar> w_loc(nc), g_loc(nc);
    const PetscScalar* w_array;
    PetscScalar* g_array;

    PetscCall(VecZeroEntries(gradient));
    PetscCall(VecGetArrayRead(w, &w_array));
    PetscCall(VecGetArray(gradient, &g_array));

    for (PetscInt c = 0; c < space.numCells(); c++) {
        const CellGeometry cell = space.mesh().cell(c);
        space.cellDofs(c, dofs.data());
        space.gather(c, w_array, w_loc.data());

        for (PetscInt j = 0; j < nc; j++) {
            const PetscScalar saved = w_loc[j];
            const PetscReal h = differenceStep(saved);
            PetscReal j_plus, j_minus;

            w_loc[j] = saved + h;
            PetscCall(problem.functional(cell, t, w_loc.data(), &j_plus));
            w_loc[j] = saved - h;
            PetscCall(problem.functional(cell, t, w_loc.data(), &j_minus));
            w_loc[j] = saved;

            g_array[dofs[j]] += (j_plus - j_minus) / (2.0 * h);
        }
    }

    PetscCall(VecRestoreArray(gradient, &g_array));
    PetscCall(VecRestoreArrayRead(w, &w_array));

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode NumericalBackend::assembleCellIndicators(const ResidualForm& form,
                                                        const FunctionSpace& space,
                                                        Vec w, Vec w_prev, Vec dual,
                                                        InsertMode mode, Vec ei) const {
    PetscFunctionBeginUser;

    PetscInt n_ei;
    PetscCall(VecGetSize(ei, &n_ei));
    PetscCheck(n_ei == space.numCells(), PETSC_COMM_SELF, PETSC_ERR_ARG_SIZ,
               "Error indicator field has %" PetscInt_FMT " entries for %" PetscInt_FMT " cells",
               n_ei, space.numCells());
    PetscCheck(!form.dependsOnPrevious() || w_prev, PETSC_COMM_SELF, PETSC_ERR_ARG_NULL,
               "Residual form needs the previous state");

    const PetscInt nc = space.numCellDofs();
    std::vector<PetscScalar> w_loc(nc), wp_loc(nc, 0.0), z_loc(nc), r_loc(nc);

    const PetscScalar* w_array;
    const PetscScalar* wp_array = nullptr;
    const PetscScalar* z_array;
    PetscScalar* ei_array;

    PetscCall(VecGetArrayRead(w, &w_array));
    if (w_prev) PetscCall(VecGetArrayRead(w_prev, &wp_array));
    PetscCall(VecGetArrayRead(dual, &z_array));
    PetscCall(VecGetArray(ei, &ei_array));

    for (PetscInt c = 0; c < space.numCells(); c++) {
        space.gather(c, w_array, w_loc.data());
        if (wp_array) space.gather(c, wp_array, wp_loc.data());
        space.gather(c, z_array, z_loc.data());

        PetscCall(form.cellResidual(space.mesh().cell(c), w_loc.data(), wp_loc.data(),
                                    r_loc.data()));

        PetscScalar eta = 0.0;
        for (PetscInt i = 0; i < nc; i++) {
            eta += r_loc[i] * z_loc[i];
        }

        if (mode == ADD_VALUES) {
            ei_array[c] += eta;
        } else {
            ei_array[c] = eta;
        }
    }

    PetscCall(VecRestoreArray(ei, &ei_array));
    PetscCall(VecRestoreArrayRead(dual, &z_array));
    if (w_prev) PetscCall(VecRestoreArrayRead(w_prev, &wp_array));
    PetscCall(VecRestoreArrayRead(w, &w_array));

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode NumericalBackend::refineMesh(const IntervalMesh& mesh,
                                            const std::vector<bool>& markers,
                                            const std::string& algorithm,
                                            std::shared_ptr<const IntervalMesh>* refined) const {
    PetscFunctionBeginUser;

    const PetscInt n = mesh.numCells();
    PetscCheck(static_cast<PetscInt>(markers.size()) == n, PETSC_COMM_SELF, PETSC_ERR_ARG_SIZ,
               "%" PetscInt_FMT " markers for %" PetscInt_FMT " cells",
               static_cast<PetscInt>(markers.size()), n);

    std::vector<bool> split(markers);

    if (algorithm == "regular_cut") {
        // marked cells only
    } else if (algorithm == "buffered") {
        // One buffer layer around every marked cell
        for (PetscInt c = 0; c < n; c++) {
            if (!markers[c]) continue;
            if (c > 0) split[c - 1] = true;
            if (c + 1 < n) split[c + 1] = true;
        }
    } else {
        SETERRQ(PETSC_COMM_SELF, PETSC_ERR_ARG_UNKNOWN_TYPE,
                "Unknown refinement algorithm '%s' (expected regular_cut or buffered)",
                algorithm.c_str());
    }

    *refined = std::make_shared<const IntervalMesh>(mesh.bisect(split));

    PetscCall(PetscInfo(nullptr, "Refined mesh from %" PetscInt_FMT " to %" PetscInt_FMT
                        " cells (%s)\n", n, (*refined)->numCells(), algorithm.c_str()));

    PetscFunctionReturn(PETSC_SUCCESS);
}

} // namespace GOAS
