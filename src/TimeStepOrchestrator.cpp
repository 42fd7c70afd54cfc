#include "TimeStepOrchestrator.hpp"
#include "NumericalBackend.hpp"
#include "ResidualForms.hpp"
#include "OutputWriter.hpp"
#include "Tape.hpp"
#include "DualSweepEngine.hpp"

#include <cmath>

namespace GOAS {

namespace {

// Machine epsilon analogue used when testing the remainder of T - t0
const PetscReal kDivisionEps = 3e-16;

} // namespace

TimeStepOrchestrator::TimeStepOrchestrator(const SolverOptions& options,
                                           const NumericalBackend& backend)
    : options_(options), backend_(backend) {}

PetscErrorCode TimeStepOrchestrator::adjustTimeStep(PetscReal t0, PetscReal T, PetscReal k,
                                                    PetscReal* k_adjusted) {
    PetscFunctionBeginUser;

    PetscCheck(T > t0, PETSC_COMM_SELF, PETSC_ERR_ARG_OUTOFRANGE,
               "End time %g must exceed start time %g", (double)T, (double)t0);
    PetscCheck(k > 0.0, PETSC_COMM_SELF, PETSC_ERR_ARG_OUTOFRANGE,
               "Time step %g must be positive", (double)k);

    const PetscReal length = T - t0;
    const PetscReal d = std::floor(length / k);
    const PetscReal r = length - d * k;

    *k_adjusted = (r > kDivisionEps) ? length / (d + 1.0) : k;

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscInt TimeStepOrchestrator::countSteps(PetscReal t0, PetscReal T, PetscReal k) {
    PetscInt n = 0;
    for (PetscReal t = t0; t < T - k / 2.0; t += k) n++;
    return n;
}

PetscErrorCode TimeStepOrchestrator::solve(const Problem& problem, const FunctionSpace& space,
                                           PetscReal k, bool compute_functional,
                                           PrimalResult* result) const {
    PetscFunctionBeginUser;

    PetscCall(validateProblem(problem, compute_functional));

    result->has_functional = compute_functional;
    result->functional = 0.0;
    result->steps = 0;
    result->cpu_time = 0.0;

    if (problem.isSteady()) {
        result->k = 0.0;
        PetscCall(solveSteady(problem, space, compute_functional, result));
    } else {
        result->k = k;
        PetscCall(timeStepper(problem, space, k, compute_functional, result));
    }

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode TimeStepOrchestrator::solveSteady(const Problem& problem,
                                                 const FunctionSpace& space,
                                                 bool compute_functional,
                                                 PrimalResult* result) const {
    PetscFunctionBeginUser;

    Vec w;
    PetscLogDouble t_start, t_end;
    std::vector<DirichletBC> bcs;
    NonlinearSolveStats stats;

    PetscCall(space.createVector(&w));
    PetscCall(PetscObjectSetName((PetscObject)w, "Primal"));
    if (problem.capabilities().initial_conditions) {
        PetscCall(problem.initialConditions(space, w));
    }
    PetscCall(problem.boundaryConditions(space, 0.0, &bcs));

    SteadyResidual form(problem);

    NumericalBackend::IterateCallback on_iterate;
    if (options_.tape_nonlinear_iterates && tape_) {
        on_iterate = [this](PetscInt, Vec x) {
            return tape_->record(DualSweepEngine::primalVariable(), 0, 0.0, x);
        };
    }

    PetscCall(PetscTime(&t_start));
    if (pre_step_) PetscCall(pre_step_(problem, 0.0, 0.0, space, w, nullptr));
    PetscCall(backend_.solveNonlinear(form, space, bcs, w, nullptr, on_iterate, &stats));
    if (post_step_) PetscCall(post_step_(problem, 0.0, 0.0, space, w, nullptr));
    PetscCall(PetscTime(&t_end));
    result->cpu_time = t_end - t_start;

    if (tape_) PetscCall(tape_->record(DualSweepEngine::primalVariable(), 0, 0.0, w));

    if (compute_functional) {
        PetscCall(backend_.assembleFunctional(problem, space, 0.0, w, &result->functional));
    }

    if (output_ && output_->shouldSave(0)) {
        PetscCall(output_->writeState(space, w, 0.0, 0, false));
    }

    if (options_.check_mem_usage) {
        PetscLogDouble mem;
        PetscCall(PetscMemoryGetCurrentUsage(&mem));
        PetscCall(PetscPrintf(PETSC_COMM_SELF, "Memory usage is: %.1f MB\n", mem / 1048576.0));
    }

    result->solution = w;

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode TimeStepOrchestrator::timeStepper(const Problem& problem,
                                                 const FunctionSpace& space, PetscReal k,
                                                 bool compute_functional,
                                                 PrimalResult* result) const {
    PetscFunctionBeginUser;

    PetscCheck(k > 0.0, PETSC_COMM_SELF, PETSC_ERR_ARG_OUTOFRANGE,
               "Time step %g must be positive", (double)k);

    const TimeDomain td = problem.timeDomain();
    const bool update_bcs = problem.capabilities().update;

    PetscReal t = td.t0;
    PetscInt timestep = 0;

    Vec w, w_prev;
    std::vector<DirichletBC> bcs;
    PetscLogDouble t_start, t_end;

    PetscCall(space.createVector(&w));
    PetscCall(space.createVector(&w_prev));
    PetscCall(PetscObjectSetName((PetscObject)w, "Primal"));

    PetscCall(problem.initialConditions(space, w_prev));
    PetscCall(VecCopy(w_prev, w));
    PetscCall(problem.boundaryConditions(space, t, &bcs));

    // Initial condition
    if (tape_) PetscCall(tape_->record(DualSweepEngine::initialVariable(), 0, t, w_prev));
    PetscCall(finishStep(problem, space, w_prev, t, timestep, 0.0));

    if (compute_functional) {
        PetscReal J;
        PetscCall(backend_.assembleFunctional(problem, space, t, w_prev, &J));
        result->functional = k * J;
    }

    while (t < td.T - k / 2.0) {
        t += k;
        timestep++;

        PetscCall(PetscTime(&t_start));

        if (update_bcs) {
            PetscCall(problem.update(space, t, &bcs));
        }

        ThetaResidual form(problem, t, k, options_.theta);

        NumericalBackend::IterateCallback on_iterate;
        if (options_.tape_nonlinear_iterates && tape_) {
            on_iterate = [this, timestep, t](PetscInt, Vec x) {
                return tape_->record(DualSweepEngine::primalVariable(), timestep, t, x);
            };
        }

        if (pre_step_) PetscCall(pre_step_(problem, t, k, space, w, w_prev));

        NonlinearSolveStats stats;
        PetscCall(backend_.solveNonlinear(form, space, bcs, w, w_prev, on_iterate, &stats));

        if (post_step_) PetscCall(post_step_(problem, t, k, space, w, w_prev));

        PetscCall(VecCopy(w, w_prev));

        if (compute_functional) {
            PetscReal J;
            PetscCall(backend_.assembleFunctional(problem, space, t, w_prev, &J));
            result->functional += k * J;
        }

        if (tape_) PetscCall(tape_->record(DualSweepEngine::primalVariable(), timestep, t, w));

        PetscCall(PetscTime(&t_end));
        result->cpu_time += t_end - t_start;

        PetscCall(finishStep(problem, space, w_prev, t, timestep, t_end - t_start));
    }

    if (options_.verbosity > 0) {
        PetscCall(PetscPrintf(PETSC_COMM_SELF, "\n"));
    }

    PetscCall(VecDestroy(&w_prev));

    result->steps = timestep;
    result->solution = w;

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode TimeStepOrchestrator::finishStep(const Problem& problem,
                                                const FunctionSpace& space, Vec w,
                                                PetscReal t, PetscInt timestep,
                                                PetscLogDouble step_time) const {
    PetscFunctionBeginUser;

    if (output_ && output_->shouldSave(timestep)) {
        PetscCall(output_->writeState(space, w, t, timestep, false));
    }

    if (options_.check_mem_usage) {
        PetscLogDouble mem;
        PetscCall(PetscMemoryGetCurrentUsage(&mem));
        PetscCall(PetscPrintf(PETSC_COMM_SELF, "Memory usage is: %.1f MB\n", mem / 1048576.0));
    }

    if (timestep > 0 && options_.verbosity > 0) {
        const TimeDomain td = problem.timeDomain();
        const PetscReal percent = 100.0 * (t - td.t0) / (td.T - td.t0);
        PetscCall(PetscPrintf(PETSC_COMM_SELF,
                              "\033[KTime step %" PetscInt_FMT " finished in %g seconds, "
                              "%g%% done (t = %g, T = %g).\r",
                              timestep, (double)step_time, (double)percent, (double)t,
                              (double)td.T));
    }

    PetscFunctionReturn(PETSC_SUCCESS);
}

} // namespace GOAS
