#include "Problem.hpp"

namespace GOAS {

PetscErrorCode Problem::weakResidual(const CellGeometry&, const ResidualArguments&,
                                     PetscScalar*) const {
    PetscFunctionBeginUser;
    SETERRQ(PETSC_COMM_SELF, PETSC_ERR_USER,
            "No weak residual provided by problem '%s'", name().c_str());
}

PetscErrorCode Problem::initialConditions(const FunctionSpace&, Vec) const {
    PetscFunctionBeginUser;
    SETERRQ(PETSC_COMM_SELF, PETSC_ERR_USER,
            "No initial conditions provided by problem '%s'", name().c_str());
}

PetscErrorCode Problem::functional(const CellGeometry&, PetscReal, const PetscScalar*,
                                   PetscReal*) const {
    PetscFunctionBeginUser;
    SETERRQ(PETSC_COMM_SELF, PETSC_ERR_USER,
            "No functional provided by problem '%s'", name().c_str());
}

PetscErrorCode Problem::update(const FunctionSpace&, PetscReal, std::vector<DirichletBC>*) const {
    PetscFunctionBeginUser;
    SETERRQ(PETSC_COMM_SELF, PETSC_ERR_SUP,
            "Problem '%s' does not update boundary conditions", name().c_str());
}

PetscErrorCode Problem::timeStep(const FunctionSpace&, Vec, const IntervalMesh&, PetscReal*) const {
    PetscFunctionBeginUser;
    SETERRQ(PETSC_COMM_SELF, PETSC_ERR_SUP,
            "Problem '%s' has no time step rule", name().c_str());
}

PetscErrorCode Problem::optimize(AdaptiveController&, const FunctionSpace&, Vec) {
    PetscFunctionBeginUser;
    SETERRQ(PETSC_COMM_SELF, PETSC_ERR_SUP,
            "Problem '%s' has no optimization driver", name().c_str());
}

PetscErrorCode validateProblem(const Problem& problem, bool needs_functional) {
    PetscFunctionBeginUser;

    const ProblemCapabilities caps = problem.capabilities();

    PetscCheck(caps.function_space, PETSC_COMM_SELF, PETSC_ERR_USER,
               "NO FUNCTION SPACE PROVIDED: problem '%s' must define a function space",
               problem.name().c_str());
    PetscCheck(caps.weak_residual, PETSC_COMM_SELF, PETSC_ERR_USER,
               "NO WEAK RESIDUAL PROVIDED: problem '%s' must define a weak residual",
               problem.name().c_str());
    PetscCheck(problem.numComponents() > 0, PETSC_COMM_SELF, PETSC_ERR_USER,
               "Problem '%s' declares %" PetscInt_FMT " solution components",
               problem.name().c_str(), problem.numComponents());
    PetscCheck(problem.isSteady() || caps.initial_conditions, PETSC_COMM_SELF, PETSC_ERR_USER,
               "Time-dependent problem '%s' must define initial conditions",
               problem.name().c_str());
    PetscCheck(!needs_functional || caps.functional, PETSC_COMM_SELF, PETSC_ERR_USER,
               "Problem '%s' must define a functional for adaptivity or optimization",
               problem.name().c_str());
    PetscCheck(problem.initialMesh() != nullptr, PETSC_COMM_SELF, PETSC_ERR_USER,
               "Problem '%s' provides no mesh", problem.name().c_str());

    if (!problem.isSteady()) {
        const TimeDomain td = problem.timeDomain();
        PetscCheck(td.T > td.t0, PETSC_COMM_SELF, PETSC_ERR_ARG_OUTOFRANGE,
                   "End time %g must exceed start time %g", (double)td.T, (double)td.t0);
        PetscCheck(td.k > 0.0, PETSC_COMM_SELF, PETSC_ERR_ARG_OUTOFRANGE,
                   "Time step %g must be positive", (double)td.k);
    }

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode currentBoundaryConditions(const Problem& problem, const FunctionSpace& space,
                                         PetscReal t0, PetscReal t,
                                         std::vector<DirichletBC>* bcs) {
    PetscFunctionBeginUser;
    bcs->clear();
    if (problem.capabilities().update) {
        PetscCall(problem.update(space, t, bcs));
    } else {
        PetscCall(problem.boundaryConditions(space, t0, bcs));
    }
    PetscFunctionReturn(PETSC_SUCCESS);
}

} // namespace GOAS
