#ifndef ADAPTIVE_CONTROLLER_HPP
#define ADAPTIVE_CONTROLLER_HPP

/**
 * @file AdaptiveController.hpp
 * @brief Goal-oriented adaptive solve loop
 *
 * Each adaptive iteration runs
 *   1. an annotated primal solve (TimeStepOrchestrator, recording the Tape)
 *   2. the reverse dual sweep (DualSweepEngine)
 *   3. the indicator assembly (ErrorIndicatorBuilder)
 *   4. the stopping test and, if it fails, refinement (MeshRefiner)
 * until the stopping metric drops below the tolerance or the iteration
 * budget is spent. A final primal solve on the resulting mesh follows,
 * optionally succeeded by the problem's optimization driver.
 *
 * Usage:
 * @code
 *   SolverOptions options;
 *   options.adaptive = true;
 *   AdaptiveController controller(options);
 *   AdaptiveResult result;
 *   PetscCall(controller.solve(problem, &result));
 * @endcode
 */

#include "GOAS.hpp"
#include "IntervalMesh.hpp"
#include "FunctionSpace.hpp"
#include "Problem.hpp"
#include "NumericalBackend.hpp"
#include "AdjointBackend.hpp"
#include "Tape.hpp"
#include "OutputWriter.hpp"
#include "TimeStepOrchestrator.hpp"
#include "DualSweepEngine.hpp"

#include <memory>
#include <string>
#include <vector>

namespace GOAS {

// ============================================================================
// Stopping criteria
// ============================================================================

/**
 * @brief Metric compared against the adaptive tolerance
 */
class StoppingCriterion {
public:
    virtual ~StoppingCriterion() = default;

    virtual const char* name() const = 0;

    /**
     * @param ei Indicator field of the iteration
     * @param m Functional value of the iteration
     * @param m_prev Functional value of the previous iteration (0 at first)
     * @param metric Output
     */
    virtual PetscErrorCode evaluate(Vec ei, PetscReal m, PetscReal m_prev,
                                    PetscReal* metric) const = 0;
};

/**
 * @brief sum(|ei|), for problems without Galerkin orthogonality
 */
class IndicatorSumCriterion : public StoppingCriterion {
public:
    const char* name() const override { return "sum(abs(ei))"; }
    PetscErrorCode evaluate(Vec ei, PetscReal m, PetscReal m_prev,
                            PetscReal* metric) const override;
};

/**
 * @brief |sum(ei)|
 */
class SignedIndicatorSumCriterion : public StoppingCriterion {
public:
    const char* name() const override { return "abs(sum(ei))"; }
    PetscErrorCode evaluate(Vec ei, PetscReal m, PetscReal m_prev,
                            PetscReal* metric) const override;
};

/**
 * @brief |m - m_prev|, for Galerkin-orthogonal problems
 */
class FunctionalDifferenceCriterion : public StoppingCriterion {
public:
    const char* name() const override { return "abs(m - m_prev)"; }
    PetscErrorCode evaluate(Vec ei, PetscReal m, PetscReal m_prev,
                            PetscReal* metric) const override;
};

std::unique_ptr<StoppingCriterion> createStoppingCriterion(StoppingMetricType type);

// ============================================================================
// Result
// ============================================================================

/**
 * @brief Outcome of AdaptiveController::solve
 */
struct AdaptiveResult {
    AdaptiveResult() = default;
    ~AdaptiveResult();
    AdaptiveResult(const AdaptiveResult&) = delete;
    AdaptiveResult& operator=(const AdaptiveResult&) = delete;

    std::shared_ptr<const IntervalMesh> mesh;
    std::shared_ptr<FunctionSpace> space;
    Vec solution = nullptr;                 ///< Final primal state (owned)
    PetscReal functional_value = 0.0;
    bool has_functional = false;
    PetscReal k = 0.0;                      ///< Time step of the final solve
    PetscInt steps = 0;
    AdaptiveState state = AdaptiveState::NOT_ADAPTED;
    PetscInt iterations = 0;                ///< Adaptive iterations run
    PetscReal stopping_metric = PETSC_MAX_REAL;
    std::vector<IterationRecord> history;
};

// ============================================================================
// Controller
// ============================================================================

class AdaptiveController {
public:
    explicit AdaptiveController(const SolverOptions& options);
    ~AdaptiveController() = default;

    AdaptiveController(const AdaptiveController&) = delete;
    AdaptiveController& operator=(const AdaptiveController&) = delete;

    /**
     * @brief Solve a problem, adaptively if configured
     */
    PetscErrorCode solve(Problem& problem, AdaptiveResult* result);

    /**
     * @brief Annotated or plain primal solve on a given space
     *
     * Drops the tape of the previous call together with its spill files.
     * When annotating, records the pass on a fresh tape with its own
     * checkpoint budget. Available to optimization drivers.
     */
    PetscErrorCode solvePrimal(const Problem& problem, const FunctionSpace& space, PetscReal k,
                               bool annotate, PrimalResult* result);

    /**
     * @brief Dual sweep over the tape of the last annotated primal solve
     */
    PetscErrorCode solveDual(const Problem& problem, const FunctionSpace& space, PetscReal k,
                             DualSequence* duals);

    /**
     * @brief Ordinal of the mesh of adaptive iteration n (0 is the initial mesh)
     *
     * "initial", "1st adapted", "2nd adapted", ..., "11th adapted", "21st adapted"
     */
    static std::string whichMesh(PetscInt n);

    void setStoppingCriterion(std::unique_ptr<StoppingCriterion> criterion);
    void setAdjointBackend(std::unique_ptr<AdjointBackend> adjoint);
    void setPreStepHook(TimeStepOrchestrator::StepHook hook) { pre_step_ = std::move(hook); }
    void setPostStepHook(TimeStepOrchestrator::StepHook hook) { post_step_ = std::move(hook); }

    const SolverOptions& options() const { return options_; }
    const NumericalBackend& backend() const { return backend_; }
    const AdjointBackend& adjoint() const { return *adjoint_; }
    const StoppingCriterion& stoppingCriterion() const { return *criterion_; }
    /// Tape of the last annotated solvePrimal, null when there is none
    const Tape* tape() const { return tape_.get(); }
    const AdaptiveRun& run() const { return run_; }

private:
    const SolverOptions options_;
    NumericalBackend backend_;
    std::unique_ptr<AdjointBackend> adjoint_;
    std::unique_ptr<StoppingCriterion> criterion_;
    std::unique_ptr<Tape> tape_;
    std::unique_ptr<OutputWriter> output_;
    AdaptiveRun run_;
    TimeStepOrchestrator::StepHook pre_step_;
    TimeStepOrchestrator::StepHook post_step_;

    PetscErrorCode createTape(const Problem& problem, PetscReal k,
                              std::unique_ptr<Tape>* tape) const;
    PetscErrorCode runPrimal(const Problem& problem, const FunctionSpace& space, PetscReal k,
                             Tape* tape, PrimalResult* result);
    PetscErrorCode runDual(const Problem& problem, const FunctionSpace& space, PetscReal k,
                           const Tape& tape, DualSequence* duals);
    PetscErrorCode adaptivity(const Problem& problem, PetscReal* k,
                              std::vector<IterationRecord>* history);
    PetscErrorCode adaptiveSolve(const Problem& problem, const FunctionSpace& space,
                                 PetscReal k, PrimalResult* primal, Vec* ei,
                                 PetscInt* num_duals);
};

} // namespace GOAS

#endif // ADAPTIVE_CONTROLLER_HPP
