#ifndef GOAS_HPP
#define GOAS_HPP

#include <petsc.h>
#include <petscsnes.h>
#include <petscksp.h>

#include <string>
#include <vector>
#include <memory>
#include <map>
#include <functional>

namespace GOAS {

// Forward declarations
class IntervalMesh;
class FunctionSpace;
class Problem;
class NumericalBackend;
class AdjointBackend;
class Tape;
class OutputWriter;
class AdaptiveController;

/**
 * @brief Phases of the adaptive state machine
 *
 * NOT_ADAPTED -> {PRIMAL, DUAL, INDICATOR, REFINE}* -> {CONVERGED | MAX_ITERATIONS_REACHED}
 */
enum class AdaptiveState {
    NOT_ADAPTED,
    PRIMAL,
    DUAL,
    INDICATOR,
    REFINE,
    CONVERGED,
    MAX_ITERATIONS_REACHED
};

/**
 * @brief Built-in stopping metrics for the adaptive loop
 */
enum class StoppingMetricType {
    INDICATOR_ABS_SUM,          ///< sum(|ei|), non-Galerkin-orthogonal problems
    INDICATOR_SIGNED_SUM,       ///< |sum(ei)|
    FUNCTIONAL_DIFFERENCE       ///< |m - m_prev|, Galerkin-orthogonal problems
};

/**
 * @brief Time interval and nominal step
 */
struct TimeDomain {
    PetscReal t0 = 0.0;         ///< Start time
    PetscReal T = 1.0;          ///< End time
    PetscReal k = 0.1;          ///< Time step
};

/**
 * @brief Adjoint checkpointing budget
 *
 * Invariant: snaps_in_memory + snaps_on_secondary_storage == steps
 */
struct CheckpointBudget {
    PetscInt steps = 0;
    PetscInt snaps_in_memory = 0;
    PetscInt snaps_on_secondary_storage = 0;
};

/**
 * @brief Immutable solver configuration
 *
 * Built once (from a config file, the command line or code) and passed by
 * const reference into every component.
 */
struct SolverOptions {
    std::string solver_name = "Theta";

    // Time stepping
    PetscReal theta = 0.5;

    // Nonlinear solver
    PetscReal absolute_tolerance = 1e-10;
    PetscReal relative_tolerance = 1e-9;
    PetscInt max_nonlinear_iterations = 50;
    bool monitor_convergence = false;

    // Adaptivity
    bool adaptive = false;
    PetscReal adapt_ratio = 0.1;
    PetscInt max_adaptations = 10;
    PetscReal adaptive_tolerance = 1e-4;
    StoppingMetricType stopping_metric = StoppingMetricType::INDICATOR_ABS_SUM;
    std::string refinement_algorithm = "regular_cut";
    PetscReal on_disk = 0.0;             ///< Fraction of tape snapshots spilled to disk
    bool tape_nonlinear_iterates = false;

    // Optimization
    bool optimize = false;

    // Output
    bool save_solution = false;
    PetscInt save_frequency = 0;
    std::string folder = "./";
    bool check_mem_usage = false;
    PetscInt verbosity = 1;
};

/**
 * @brief Mutable state of one adaptive run
 */
struct AdaptiveRun {
    PetscInt iteration = 1;
    PetscReal functional_value = 0.0;
    PetscReal previous_functional_value = 0.0;
    PetscReal stopping_metric = PETSC_MAX_REAL;
    std::shared_ptr<const IntervalMesh> mesh;
    AdaptiveState state = AdaptiveState::NOT_ADAPTED;
};

/**
 * @brief Summary of one adaptive iteration
 */
struct IterationRecord {
    PetscInt iteration = 0;
    PetscInt num_cells = 0;
    PetscInt num_dofs = 0;
    PetscInt num_steps = 0;
    PetscInt num_duals = 0;
    PetscReal k = 0.0;
    PetscReal functional_value = 0.0;
    PetscReal stopping_metric = 0.0;
    PetscInt cells_marked = 0;
};

const char* adaptiveStateName(AdaptiveState state);
StoppingMetricType parseStoppingMetric(const std::string& name);
const char* stoppingMetricName(StoppingMetricType type);

} // namespace GOAS

#endif // GOAS_HPP
