#ifndef TIME_STEP_ORCHESTRATOR_HPP
#define TIME_STEP_ORCHESTRATOR_HPP

/**
 * @file TimeStepOrchestrator.hpp
 * @brief Theta-method primal time stepping
 *
 * Advances the primal state from t0 to T with the theta method
 *   F(w, w_prev) = weakResidual(w_theta), w_theta = (1 - theta) w_prev + theta w
 * while accumulating the goal functional, calling the step hooks, recording
 * the tape and writing snapshots.
 */

#include "GOAS.hpp"
#include "FunctionSpace.hpp"
#include "Problem.hpp"

#include <functional>

namespace GOAS {

/**
 * @brief Outcome of a primal solve
 */
struct PrimalResult {
    Vec solution = nullptr;         ///< Final state, owned by the caller
    PetscReal functional = 0.0;     ///< k * sum_n J(w_n) (J(w) when steady)
    bool has_functional = false;
    PetscInt steps = 0;             ///< Time steps taken (0 when steady)
    PetscReal k = 0.0;              ///< Step used
    PetscReal cpu_time = 0.0;       ///< Wall clock of all steps
};

class TimeStepOrchestrator {
public:
    /**
     * @brief Hook run around every nonlinear solve: (problem, t, k, space, w, w_prev)
     */
    using StepHook = std::function<PetscErrorCode(const Problem&, PetscReal, PetscReal,
                                                  const FunctionSpace&, Vec, Vec)>;

    TimeStepOrchestrator(const SolverOptions& options, const NumericalBackend& backend);

    /**
     * @brief Largest step k' <= k that divides T - t0 evenly
     *
     * With d, r = divmod(T - t0, k): k' = k if r <= 3e-16, otherwise
     * k' = (T - t0) / (d + 1).
     *
     * @return PETSC_ERR_ARG_OUTOFRANGE unless T > t0 and k > 0
     */
    static PetscErrorCode adjustTimeStep(PetscReal t0, PetscReal T, PetscReal k,
                                         PetscReal* k_adjusted);

    /**
     * @brief Number of steps of the loop `while t < T - k/2: t += k`
     */
    static PetscInt countSteps(PetscReal t0, PetscReal T, PetscReal k);

    void setPreStepHook(StepHook hook) { pre_step_ = std::move(hook); }
    void setPostStepHook(StepHook hook) { post_step_ = std::move(hook); }

    /**
     * @brief Tape receiving w_initial and every step result (null for none)
     */
    void setTape(Tape* tape) { tape_ = tape; }

    /**
     * @brief Snapshot sink (null for none)
     */
    void setOutput(OutputWriter* output) { output_ = output; }

    /**
     * @brief Solve the primal problem on a space
     *
     * @param problem Problem to solve
     * @param space Space of the current mesh
     * @param k Effective time step (ignored for steady problems)
     * @param compute_functional Accumulate the goal functional
     * @param result Output; result->solution is created here
     * @return PETSC_ERR_USER for a problem without weak residual or space
     */
    PetscErrorCode solve(const Problem& problem, const FunctionSpace& space, PetscReal k,
                         bool compute_functional, PrimalResult* result) const;

private:
    const SolverOptions& options_;
    const NumericalBackend& backend_;
    StepHook pre_step_;
    StepHook post_step_;
    Tape* tape_ = nullptr;
    OutputWriter* output_ = nullptr;

    PetscErrorCode timeStepper(const Problem& problem, const FunctionSpace& space, PetscReal k,
                               bool compute_functional, PrimalResult* result) const;
    PetscErrorCode solveSteady(const Problem& problem, const FunctionSpace& space,
                               bool compute_functional, PrimalResult* result) const;
    PetscErrorCode finishStep(const Problem& problem, const FunctionSpace& space, Vec w,
                              PetscReal t, PetscInt timestep, PetscLogDouble step_time) const;
};

} // namespace GOAS

#endif // TIME_STEP_ORCHESTRATOR_HPP
