#include "AdaptiveController.hpp"
#include "CheckpointPlanner.hpp"
#include "ErrorIndicatorBuilder.hpp"
#include "MeshRefiner.hpp"

#include <cmath>
#include <stdexcept>

namespace GOAS {

// ============================================================================
// Enum helpers
// ============================================================================

const char* adaptiveStateName(AdaptiveState state) {
    switch (state) {
        case AdaptiveState::NOT_ADAPTED:            return "NOT_ADAPTED";
        case AdaptiveState::PRIMAL:                 return "PRIMAL";
        case AdaptiveState::DUAL:                   return "DUAL";
        case AdaptiveState::INDICATOR:              return "INDICATOR";
        case AdaptiveState::REFINE:                 return "REFINE";
        case AdaptiveState::CONVERGED:              return "CONVERGED";
        case AdaptiveState::MAX_ITERATIONS_REACHED: return "MAX_ITERATIONS_REACHED";
    }
    return "UNKNOWN";
}

StoppingMetricType parseStoppingMetric(const std::string& name) {
    if (name == "indicator_sum" || name == "abs_sum") {
        return StoppingMetricType::INDICATOR_ABS_SUM;
    } else if (name == "signed_indicator_sum" || name == "signed_sum") {
        return StoppingMetricType::INDICATOR_SIGNED_SUM;
    } else if (name == "functional_difference" || name == "functional") {
        return StoppingMetricType::FUNCTIONAL_DIFFERENCE;
    }
    throw std::invalid_argument("Unknown stopping metric: " + name);
}

const char* stoppingMetricName(StoppingMetricType type) {
    switch (type) {
        case StoppingMetricType::INDICATOR_ABS_SUM:     return "indicator_sum";
        case StoppingMetricType::INDICATOR_SIGNED_SUM:  return "signed_indicator_sum";
        case StoppingMetricType::FUNCTIONAL_DIFFERENCE: return "functional_difference";
    }
    return "unknown";
}

// ============================================================================
// Stopping criteria
// ============================================================================

PetscErrorCode IndicatorSumCriterion::evaluate(Vec ei, PetscReal, PetscReal,
                                               PetscReal* metric) const {
    PetscFunctionBeginUser;
    PetscCall(VecNorm(ei, NORM_1, metric));
    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode SignedIndicatorSumCriterion::evaluate(Vec ei, PetscReal, PetscReal,
                                                     PetscReal* metric) const {
    PetscFunctionBeginUser;
    PetscScalar sum;
    PetscCall(VecSum(ei, &sum));
    *metric = PetscAbsScalar(sum);
    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode FunctionalDifferenceCriterion::evaluate(Vec, PetscReal m, PetscReal m_prev,
                                                       PetscReal* metric) const {
    PetscFunctionBeginUser;
    *metric = std::abs(m - m_prev);
    PetscFunctionReturn(PETSC_SUCCESS);
}

std::unique_ptr<StoppingCriterion> createStoppingCriterion(StoppingMetricType type) {
    switch (type) {
        case StoppingMetricType::INDICATOR_SIGNED_SUM:
            return std::make_unique<SignedIndicatorSumCriterion>();
        case StoppingMetricType::FUNCTIONAL_DIFFERENCE:
            return std::make_unique<FunctionalDifferenceCriterion>();
        case StoppingMetricType::INDICATOR_ABS_SUM:
            return std::make_unique<IndicatorSumCriterion>();
    }
    return std::make_unique<IndicatorSumCriterion>();
}

// ============================================================================
// AdaptiveResult
// ============================================================================

AdaptiveResult::~AdaptiveResult() {
    PetscCallVoid(VecDestroy(&solution));
}

// ============================================================================
// AdaptiveController
// ============================================================================

AdaptiveController::AdaptiveController(const SolverOptions& options)
    : options_(options),
      backend_(options_),
      adjoint_(std::make_unique<TapeAdjointBackend>(backend_)),
      criterion_(createStoppingCriterion(options.stopping_metric)) {}

void AdaptiveController::setStoppingCriterion(std::unique_ptr<StoppingCriterion> criterion) {
    criterion_ = std::move(criterion);
}

void AdaptiveController::setAdjointBackend(std::unique_ptr<AdjointBackend> adjoint) {
    adjoint_ = std::move(adjoint);
}

std::string AdaptiveController::whichMesh(PetscInt n) {
    if (n <= 0) return "initial";

    std::string suffix = "th";
    const PetscInt last_two = n % 100;
    if (last_two < 11 || last_two > 13) {
        switch (n % 10) {
            case 1: suffix = "st"; break;
            case 2: suffix = "nd"; break;
            case 3: suffix = "rd"; break;
            default: break;
        }
    }
    return std::to_string(n) + suffix + " adapted";
}

PetscErrorCode AdaptiveController::createTape(const Problem& problem, PetscReal k,
                                              std::unique_ptr<Tape>* tape) const {
    PetscFunctionBeginUser;

    *tape = std::make_unique<Tape>(options_.folder + "goas_tape_");
    if (!problem.isSteady()) {
        const TimeDomain td = problem.timeDomain();
        CheckpointBudget budget;
        PetscCall(CheckpointPlanner::plan(TimeStepOrchestrator::countSteps(td.t0, td.T, k),
                                          options_.on_disk, &budget));
        PetscCall((*tape)->configure(budget));
    }
    (*tape)->startRecording();

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode AdaptiveController::runPrimal(const Problem& problem, const FunctionSpace& space,
                                             PetscReal k, Tape* tape, PrimalResult* result) {
    PetscFunctionBeginUser;

    TimeStepOrchestrator stepper(options_, backend_);
    stepper.setPreStepHook(pre_step_);
    stepper.setPostStepHook(post_step_);
    stepper.setTape(tape);
    stepper.setOutput(output_.get());

    PetscCall(stepper.solve(problem, space, k, problem.capabilities().functional, result));

    if (tape) tape->stopRecording();

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode AdaptiveController::solvePrimal(const Problem& problem, const FunctionSpace& space,
                                               PetscReal k, bool annotate,
                                               PrimalResult* result) {
    PetscFunctionBeginUser;

    // The previous tape goes first so that its spill files are gone
    tape_.reset();
    if (annotate) PetscCall(createTape(problem, k, &tape_));
    PetscCall(runPrimal(problem, space, k, tape_.get(), result));

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode AdaptiveController::solveDual(const Problem& problem, const FunctionSpace& space,
                                             PetscReal k, DualSequence* duals) {
    PetscFunctionBeginUser;
    PetscCheck(tape_, PETSC_COMM_SELF, PETSC_ERR_ARG_WRONGSTATE,
               "Dual solve needs an annotated primal solve first");
    PetscCall(runDual(problem, space, k, *tape_, duals));
    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode AdaptiveController::runDual(const Problem& problem, const FunctionSpace& space,
                                           PetscReal k, const Tape& tape, DualSequence* duals) {
    PetscFunctionBeginUser;

    const bool steady = problem.isSteady();
    const TimeDomain td = problem.timeDomain();
    PetscInt count = 0;
    PetscLogDouble last;
    PetscCall(PetscTime(&last));

    DualSweepEngine engine(options_, *adjoint_);
    engine.setDualCallback([&](PetscReal t, PetscInt, Vec dual) -> PetscErrorCode {
        PetscFunctionBeginUser;
        PetscLogDouble now;
        PetscCall(PetscTime(&now));

        if (output_ && output_->shouldSave(count)) {
            PetscCall(output_->writeState(space, dual, t, count, true));
        }
        if (!steady && options_.verbosity > 0) {
            const PetscReal percent = 100.0 - 100.0 * (t - td.t0) / (td.T - td.t0);
            PetscCall(PetscPrintf(PETSC_COMM_SELF,
                                  "\033[KTime step %" PetscInt_FMT " finished in %g seconds, "
                                  "%g%% done (t = %g, T = %g).\r",
                                  count, (double)(now - last), (double)percent, (double)t,
                                  (double)td.T));
        }
        count++;
        last = now;
        PetscFunctionReturn(PETSC_SUCCESS);
    });

    PetscCall(engine.sweep(problem, space, tape, k, duals));

    if (!steady && options_.verbosity > 0) {
        PetscCall(PetscPrintf(PETSC_COMM_SELF, "\n"));
    }

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode AdaptiveController::adaptiveSolve(const Problem& problem,
                                                 const FunctionSpace& space, PetscReal k,
                                                 PrimalResult* primal, Vec* ei,
                                                 PetscInt* num_duals) {
    PetscFunctionBeginUser;

    // Tape and checkpoint budget live for this iteration only
    std::unique_ptr<Tape> tape;
    PetscCall(createTape(problem, k, &tape));

    run_.state = AdaptiveState::PRIMAL;
    PetscCall(PetscPrintf(PETSC_COMM_SELF, "Solving the primal problem.\n"));
    PetscCall(runPrimal(problem, space, k, tape.get(), primal));

    run_.state = AdaptiveState::DUAL;
    PetscCall(PetscPrintf(PETSC_COMM_SELF, "Solving the dual problem.\n"));
    DualSequence duals;
    PetscCall(runDual(problem, space, k, *tape, &duals));
    *num_duals = duals.size();

    run_.state = AdaptiveState::INDICATOR;
    PetscCall(PetscPrintf(PETSC_COMM_SELF, "Building error indicators.\n"));
    ErrorIndicatorBuilder builder(options_, backend_);
    PetscCall(builder.build(problem, space, duals, k, ei));

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode AdaptiveController::adaptivity(const Problem& problem, PetscReal* k,
                                              std::vector<IterationRecord>* history) {
    PetscFunctionBeginUser;

    const TimeDomain td = problem.timeDomain();
    const bool steady = problem.isSteady();
    MeshRefiner refiner(options_, backend_);

    run_.iteration = 1;
    run_.functional_value = 0.0;
    run_.previous_functional_value = 0.0;
    run_.stopping_metric = PETSC_MAX_REAL;

    while (run_.iteration <= options_.max_adaptations &&
           run_.stopping_metric > options_.adaptive_tolerance) {
        const PetscInt n = run_.iteration - 1;

        output_->setNaming(n, false);
        if (output_->enabled()) PetscCall(output_->writeMesh(*run_.mesh));

        PetscCall(PetscPrintf(PETSC_COMM_SELF, "Solving on %s mesh.\n", whichMesh(n).c_str()));

        std::shared_ptr<FunctionSpace> space =
            backend_.createFunctionSpace(run_.mesh, problem.numComponents());

        PrimalResult primal;
        Vec ei;
        IterationRecord record;

        run_.previous_functional_value = run_.functional_value;
        PetscCall(adaptiveSolve(problem, *space, *k, &primal, &ei, &record.num_duals));

        run_.functional_value = primal.functional;
        PetscCall(criterion_->evaluate(ei, run_.functional_value, run_.previous_functional_value,
                                       &run_.stopping_metric));

        PetscCall(PetscPrintf(PETSC_COMM_SELF, "DOFs=%" PetscInt_FMT " functional=%0.5G "
                              "err_est=%0.5G\n", space->numDofs(),
                              (double)run_.functional_value, (double)run_.stopping_metric));

        if (output_->enabled()) PetscCall(output_->writeIndicators(*run_.mesh, ei, n));

        record.iteration = run_.iteration;
        record.num_cells = run_.mesh->numCells();
        record.num_dofs = space->numDofs();
        record.num_steps = primal.steps;
        record.k = *k;
        record.functional_value = run_.functional_value;
        record.stopping_metric = run_.stopping_metric;

        if (run_.stopping_metric > options_.adaptive_tolerance) {
            run_.state = AdaptiveState::REFINE;
            PetscCall(PetscPrintf(PETSC_COMM_SELF, "Refining mesh.\n"));

            std::shared_ptr<const IntervalMesh> refined;
            PetscCall(refiner.refine(*run_.mesh, ei, &refined, &record.cells_marked));
            run_.mesh = refined;

            if (problem.capabilities().time_step && !steady) {
                PetscReal k_new;
                PetscCall(problem.timeStep(*space, primal.solution, *run_.mesh, &k_new));
                PetscCall(TimeStepOrchestrator::adjustTimeStep(td.t0, td.T, k_new, k));
                PetscCall(PetscInfo(nullptr, "Time step for the next iteration: %g\n",
                                    (double)*k));
            }
        }

        history->push_back(record);

        PetscCall(VecDestroy(&ei));
        PetscCall(VecDestroy(&primal.solution));

        run_.iteration++;
    }

    if (run_.stopping_metric > options_.adaptive_tolerance) {
        run_.state = AdaptiveState::MAX_ITERATIONS_REACHED;
        PetscCall(PetscPrintf(PETSC_COMM_SELF, "Warning: reached max adaptive iterations with "
                              "%s = %0.3G. Solution may not be accurate.\n",
                              criterion_->name(), (double)run_.stopping_metric));
    } else {
        run_.state = AdaptiveState::CONVERGED;
    }

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode AdaptiveController::solve(Problem& problem, AdaptiveResult* result) {
    PetscFunctionBeginUser;

    const ProblemCapabilities caps = problem.capabilities();
    bool adaptive = options_.adaptive;
    bool optimize = options_.optimize && caps.optimize;

    PetscCall(validateProblem(problem, adaptive || optimize));
    PetscCheck(options_.theta >= 0.0 && options_.theta <= 1.0, PETSC_COMM_SELF,
               PETSC_ERR_ARG_OUTOFRANGE, "Theta %g must lie in [0, 1]", (double)options_.theta);

    PetscReal k = 0.0;
    if (!problem.isSteady()) {
        const TimeDomain td = problem.timeDomain();
        PetscCall(TimeStepOrchestrator::adjustTimeStep(td.t0, td.T, td.k, &k));
    }

    output_ = std::make_unique<OutputWriter>(options_, problem);
    PetscCall(output_->prepareFolder());

    run_ = AdaptiveRun();
    run_.mesh = problem.initialMesh();
    result->history.clear();

    if (adaptive && !adjoint_->isAvailable()) {
        PetscCall(PetscPrintf(PETSC_COMM_SELF, "Warning: adaptivity requested, but the adjoint "
                              "backend '%s' is unavailable.\nSolving without adaptivity.\n",
                              adjoint_->name().c_str()));
        adaptive = false;
    }
    if (optimize && !adjoint_->isAvailable()) {
        PetscCall(PetscPrintf(PETSC_COMM_SELF, "Warning: optimization requested, but the adjoint "
                              "backend '%s' is unavailable.\nNot running optimization.\n",
                              adjoint_->name().c_str()));
        optimize = false;
    }

    if (adaptive) {
        PetscCall(adaptivity(problem, &k, &result->history));
    }

    PetscCall(PetscPrintf(PETSC_COMM_SELF, "Solving the primal problem.\n"));
    output_->setNaming(-1, false);

    std::shared_ptr<FunctionSpace> space =
        backend_.createFunctionSpace(run_.mesh, problem.numComponents());
    if (output_->enabled()) PetscCall(output_->writeMesh(*run_.mesh));

    PrimalResult primal;
    PetscCall(solvePrimal(problem, *space, k, optimize, &primal));

    if (primal.has_functional) {
        PetscCall(PetscPrintf(PETSC_COMM_SELF, "The size of the functional is: %0.3G\n",
                              (double)primal.functional));
    }

    if (optimize) {
        PetscCall(problem.optimize(*this, *space, primal.solution));

        output_->setNaming(-1, true);
        PetscCall(VecDestroy(&primal.solution));
        PetscCall(solvePrimal(problem, *space, k, false, &primal));

        if (primal.has_functional) {
            PetscCall(PetscPrintf(PETSC_COMM_SELF, "The size of the optimized functional is: "
                                  "%0.3G\n", (double)primal.functional));
        }
    }

    tape_.reset();

    PetscCall(VecDestroy(&result->solution));
    result->mesh = run_.mesh;
    result->space = space;
    result->solution = primal.solution;
    result->functional_value = primal.functional;
    result->has_functional = primal.has_functional;
    result->k = primal.k;
    result->steps = primal.steps;
    result->state = run_.state;
    result->iterations = adaptive ? run_.iteration - 1 : 0;
    result->stopping_metric = run_.stopping_metric;

    PetscFunctionReturn(PETSC_SUCCESS);
}

} // namespace GOAS
