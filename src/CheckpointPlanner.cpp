#include "CheckpointPlanner.hpp"
#include <cmath>

namespace GOAS {

PetscErrorCode CheckpointPlanner::plan(PetscInt steps, PetscReal on_disk_fraction,
                                       CheckpointBudget* budget) {
    PetscFunctionBeginUser;

    PetscCheck(on_disk_fraction >= 0.0 && on_disk_fraction <= 1.0, PETSC_COMM_SELF,
               PETSC_ERR_ARG_OUTOFRANGE,
               "On-disk checkpoint fraction %g must lie in [0, 1]", (double)on_disk_fraction);
    PetscCheck(steps >= 0, PETSC_COMM_SELF, PETSC_ERR_ARG_OUTOFRANGE,
               "Number of steps %" PetscInt_FMT " must be non-negative", steps);

    budget->steps = steps;
    budget->snaps_on_secondary_storage =
        static_cast<PetscInt>(std::floor(on_disk_fraction * steps));
    budget->snaps_in_memory = steps - budget->snaps_on_secondary_storage;

    PetscCall(PetscInfo(nullptr, "Checkpoint budget: %" PetscInt_FMT " steps, %" PetscInt_FMT
                        " in memory, %" PetscInt_FMT " on disk\n", budget->steps,
                        budget->snaps_in_memory, budget->snaps_on_secondary_storage));

    PetscFunctionReturn(PETSC_SUCCESS);
}

} // namespace GOAS
