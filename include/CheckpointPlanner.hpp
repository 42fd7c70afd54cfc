#ifndef CHECKPOINT_PLANNER_HPP
#define CHECKPOINT_PLANNER_HPP

#include "GOAS.hpp"

namespace GOAS {

/**
 * @brief Split of tape snapshots between memory and secondary storage
 *
 * Only meaningful for time-dependent problems; steady problems skip
 * planning.
 */
class CheckpointPlanner {
public:
    /**
     * @brief Compute the checkpoint budget of a primal pass
     *
     * snaps_on_secondary_storage = floor(on_disk_fraction * steps)
     * snaps_in_memory            = steps - snaps_on_secondary_storage
     *
     * @param steps Number of time steps, >= 0
     * @param on_disk_fraction Fraction in [0, 1]
     * @param budget Output budget
     * @return PETSC_ERR_ARG_OUTOFRANGE for a fraction outside [0, 1]
     */
    static PetscErrorCode plan(PetscInt steps, PetscReal on_disk_fraction,
                               CheckpointBudget* budget);
};

} // namespace GOAS

#endif // CHECKPOINT_PLANNER_HPP
