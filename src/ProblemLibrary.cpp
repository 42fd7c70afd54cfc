#include "ProblemLibrary.hpp"
#include "AdaptiveController.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace GOAS {

namespace {

// 3-point Gauss rule on [0, 1]
const PetscReal kGaussPoints[3] = {0.5 - 0.5 * 0.7745966692414834, 0.5,
                                   0.5 + 0.5 * 0.7745966692414834};
const PetscReal kGaussWeights[3] = {5.0 / 18.0, 8.0 / 18.0, 5.0 / 18.0};

// P1 interpolation at local coordinate s
inline PetscScalar interp(const PetscScalar* v, PetscReal s) {
    return v[0] * (1.0 - s) + v[1] * s;
}

} // namespace

// ============================================================================
// IntervalProblem
// ============================================================================

IntervalProblem::IntervalProblem(const ProblemParameters& params)
    : params_(params),
      mesh_(std::make_shared<const IntervalMesh>(params.lower, params.upper, params.nx)) {}

PetscReal IntervalProblem::goalWeight(PetscReal x) const {
    const PetscReal d = (x - params_.goal_center) / params_.goal_width;
    return std::exp(-d * d);
}

PetscErrorCode IntervalProblem::dirichletEnds(const FunctionSpace& space, PetscScalar left,
                                              PetscScalar right,
                                              std::vector<DirichletBC>* bcs) const {
    PetscFunctionBeginUser;
    bcs->clear();
    bcs->push_back({0, 0, left});
    bcs->push_back({space.mesh().numVertices() - 1, 0, right});
    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode IntervalProblem::boundaryConditions(const FunctionSpace& space, PetscReal,
                                                   std::vector<DirichletBC>* bcs) const {
    PetscFunctionBeginUser;
    PetscCall(dirichletEnds(space, 0.0, 0.0, bcs));
    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode IntervalProblem::functional(const CellGeometry& cell, PetscReal,
                                           const PetscScalar* w, PetscReal* value) const {
    PetscFunctionBeginUser;
    *value = 0.0;
    for (int q = 0; q < 3; q++) {
        const PetscReal s = kGaussPoints[q];
        const PetscReal x = cell.x0 + s * cell.h;
        *value += kGaussWeights[q] * cell.h * goalWeight(x) * PetscRealPart(interp(w, s));
    }
    PetscFunctionReturn(PETSC_SUCCESS);
}

// ============================================================================
// HeatProblem
// ============================================================================

HeatProblem::HeatProblem(const ProblemParameters& params) : IntervalProblem(params) {
    kappa_ = params.coefficient > 0.0 ? params.coefficient : 0.1;
    if (params_.goal_center < 0.0) params_.goal_center = 0.75;
}

ProblemCapabilities HeatProblem::capabilities() const {
    ProblemCapabilities caps;
    caps.weak_residual = true;
    caps.function_space = true;
    caps.initial_conditions = true;
    caps.functional = true;
    caps.update = true;
    return caps;
}

PetscErrorCode HeatProblem::weakResidual(const CellGeometry& cell, const ResidualArguments& args,
                                         PetscScalar* r) const {
    PetscFunctionBeginUser;

    const PetscReal h = cell.h;
    const PetscScalar du = (args.w_theta[1] - args.w_theta[0]) / h;

    r[0] = 0.0;
    r[1] = 0.0;
    for (int q = 0; q < 3; q++) {
        const PetscReal s = kGaussPoints[q];
        const PetscReal wq = kGaussWeights[q] * h;
        PetscScalar u_t = 0.0;
        if (args.k > 0.0 && args.w_prev) {
            u_t = (interp(args.w, s) - interp(args.w_prev, s)) / args.k;
        }
        r[0] += wq * (u_t * (1.0 - s) - kappa_ * du / h);
        r[1] += wq * (u_t * s + kappa_ * du / h);
    }

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode HeatProblem::initialConditions(const FunctionSpace& space, Vec w) const {
    PetscFunctionBeginUser;
    const PetscReal L = params_.upper - params_.lower;
    const PetscReal a = params_.lower;
    PetscCall(space.interpolate([L, a](PetscReal x, PetscScalar* u) {
        u[0] = std::sin(PETSC_PI * (x - a) / L);
    }, w));
    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode HeatProblem::update(const FunctionSpace& space, PetscReal t,
                                   std::vector<DirichletBC>* bcs) const {
    PetscFunctionBeginUser;
    PetscCall(dirichletEnds(space, 0.0, params_.boundary_rate * t, bcs));
    PetscFunctionReturn(PETSC_SUCCESS);
}

// ============================================================================
// BurgersProblem
// ============================================================================

BurgersProblem::BurgersProblem(const ProblemParameters& params) : IntervalProblem(params) {
    nu_ = params.coefficient > 0.0 ? params.coefficient : 0.05;
    if (params_.goal_center < 0.0) params_.goal_center = 0.6;
}

ProblemCapabilities BurgersProblem::capabilities() const {
    ProblemCapabilities caps;
    caps.weak_residual = true;
    caps.function_space = true;
    caps.initial_conditions = true;
    caps.functional = true;
    caps.time_step = true;
    return caps;
}

PetscErrorCode BurgersProblem::weakResidual(const CellGeometry& cell,
                                            const ResidualArguments& args,
                                            PetscScalar* r) const {
    PetscFunctionBeginUser;

    const PetscReal h = cell.h;
    const PetscScalar du = (args.w_theta[1] - args.w_theta[0]) / h;

    r[0] = 0.0;
    r[1] = 0.0;
    for (int q = 0; q < 3; q++) {
        const PetscReal s = kGaussPoints[q];
        const PetscReal wq = kGaussWeights[q] * h;
        const PetscScalar u = interp(args.w_theta, s);
        const PetscScalar flux = 0.5 * u * u;
        PetscScalar u_t = 0.0;
        if (args.k > 0.0 && args.w_prev) {
            u_t = (interp(args.w, s) - interp(args.w_prev, s)) / args.k;
        }
        // -flux * dphi/dx + nu * du * dphi/dx
        r[0] += wq * (u_t * (1.0 - s) + (flux - nu_ * du) / h);
        r[1] += wq * (u_t * s - (flux - nu_ * du) / h);
    }

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode BurgersProblem::initialConditions(const FunctionSpace& space, Vec w) const {
    PetscFunctionBeginUser;
    const PetscReal L = params_.upper - params_.lower;
    const PetscReal a = params_.lower;
    PetscCall(space.interpolate([L, a](PetscReal x, PetscScalar* u) {
        u[0] = std::sin(2.0 * PETSC_PI * (x - a) / L);
    }, w));
    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode BurgersProblem::timeStep(const FunctionSpace&, Vec w, const IntervalMesh& mesh,
                                        PetscReal* k) const {
    PetscFunctionBeginUser;
    PetscReal u_max;
    PetscCall(VecNorm(w, NORM_INFINITY, &u_max));
    *k = params_.time.k;
    if (u_max > PETSC_SMALL) {
        *k = std::min(*k, params_.cfl * mesh.minCellSize() / u_max);
    }
    PetscFunctionReturn(PETSC_SUCCESS);
}

// ============================================================================
// PoissonProblem
// ============================================================================

PoissonProblem::PoissonProblem(const ProblemParameters& params)
    : IntervalProblem(params), source_(params.source) {
    if (params_.goal_center < 0.0) params_.goal_center = 0.3;
}

ProblemCapabilities PoissonProblem::capabilities() const {
    ProblemCapabilities caps;
    caps.weak_residual = true;
    caps.function_space = true;
    caps.functional = true;
    caps.optimize = true;
    return caps;
}

PetscErrorCode PoissonProblem::weakResidual(const CellGeometry& cell,
                                            const ResidualArguments& args,
                                            PetscScalar* r) const {
    PetscFunctionBeginUser;
    const PetscReal h = cell.h;
    const PetscScalar du = (args.w[1] - args.w[0]) / h;
    r[0] = -du - 0.5 * h * source_;
    r[1] = du - 0.5 * h * source_;
    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode PoissonProblem::optimize(AdaptiveController& controller,
                                        const FunctionSpace& space, Vec w) {
    PetscFunctionBeginUser;

    const PetscReal target = params_.target_functional;
    const PetscReal tol = 1e-10 * std::max((PetscReal)1.0, std::abs(target));
    const PetscInt last_vertex = space.mesh().numVertices() - 1;

    for (PetscInt it = 0; it < 5; it++) {
        PrimalResult primal;
        PetscCall(controller.solvePrimal(*this, space, 0.0, true, &primal));
        PetscCall(VecCopy(primal.solution, w));

        const PetscReal J = primal.functional;
        PetscCall(PetscPrintf(PETSC_COMM_SELF, "  Optimization iteration %" PetscInt_FMT
                              ": f = %g, J = %g (target %g)\n", it, (double)source_,
                              (double)J, (double)target));

        if (std::abs(J - target) < tol) {
            PetscCall(VecDestroy(&primal.solution));
            break;
        }

        DualSequence duals;
        PetscCall(controller.solveDual(*this, space, 0.0, &duals));

        // dJ/df = z^T b over the interior rows, b_i = \int phi_i
        const PetscScalar* z;
        PetscReal gradient = 0.0;
        PetscCall(VecGetArrayRead(duals[0].dual, &z));
        for (PetscInt c = 0; c < space.numCells(); c++) {
            const PetscReal h = space.mesh().cell(c).h;
            for (PetscInt v = c; v <= c + 1; v++) {
                if (v == 0 || v == last_vertex) continue;
                gradient += 0.5 * h * PetscRealPart(z[space.dof(v, 0)]);
            }
        }
        PetscCall(VecRestoreArrayRead(duals[0].dual, &z));
        PetscCall(VecDestroy(&primal.solution));

        PetscCheck(std::abs(gradient) > PETSC_SMALL, PETSC_COMM_SELF, PETSC_ERR_NOT_CONVERGED,
                   "Functional does not depend on the source, cannot reach target %g",
                   (double)target);

        source_ += (target - J) / gradient;
    }

    PetscFunctionReturn(PETSC_SUCCESS);
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<IntervalProblem> createProblem(const ProblemParameters& params) {
    if (params.nx < 1) {
        throw std::invalid_argument("Problem needs at least one cell, got nx = " +
                                    std::to_string(params.nx));
    }
    if (params.name == "heat") {
        return std::make_unique<HeatProblem>(params);
    } else if (params.name == "burgers") {
        return std::make_unique<BurgersProblem>(params);
    } else if (params.name == "poisson") {
        return std::make_unique<PoissonProblem>(params);
    }
    throw std::invalid_argument("Unknown problem: " + params.name);
}

std::vector<std::string> availableProblems() {
    return {"heat", "burgers", "poisson"};
}

} // namespace GOAS
