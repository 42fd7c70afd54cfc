#include "ErrorIndicatorBuilder.hpp"
#include "NumericalBackend.hpp"
#include "ResidualForms.hpp"

namespace GOAS {

ErrorIndicatorBuilder::ErrorIndicatorBuilder(const SolverOptions& options,
                                             const NumericalBackend& backend)
    : options_(options), backend_(backend) {}

PetscErrorCode ErrorIndicatorBuilder::build(const Problem& problem, const FunctionSpace& space,
                                            const DualSequence& duals, PetscReal k,
                                            Vec* ei) const {
    PetscFunctionBeginUser;

    PetscCheck(!duals.empty(), PETSC_COMM_SELF, PETSC_ERR_ARG_WRONGSTATE,
               "No dual states to build error indicators from");

    PetscCall(space.createErrorVector(ei));

    if (problem.isSteady()) {
        SteadyResidual form(problem, true);
        PetscCall(backend_.assembleCellIndicators(form, space, duals[0].value, nullptr,
                                                  duals[0].dual, INSERT_VALUES, *ei));
        PetscFunctionReturn(PETSC_SUCCESS);
    }

    // Reverse order: entry i + 1 is the step before entry i
    for (PetscInt i = 0; i + 1 < duals.size(); i++) {
        ThetaResidual form(problem, duals[i].time, k, options_.theta, true);
        PetscCall(backend_.assembleCellIndicators(form, space, duals[i].value,
                                                  duals[i + 1].value, duals[i].dual,
                                                  ADD_VALUES, *ei));
    }

    PetscCall(PetscInfo(nullptr, "Assembled error indicators over %" PetscInt_FMT
                        " step pairs\n", duals.size() - 1));

    PetscFunctionReturn(PETSC_SUCCESS);
}

} // namespace GOAS
