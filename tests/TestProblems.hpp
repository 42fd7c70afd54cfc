#ifndef GOAS_TEST_PROBLEMS_HPP
#define GOAS_TEST_PROBLEMS_HPP

/**
 * @file TestProblems.hpp
 * @brief Small problems shared by the unit and integration tests
 */

#include "GOAS.hpp"
#include "Problem.hpp"
#include "AdjointBackend.hpp"

#include <memory>
#include <vector>

namespace GOAS {
namespace Testing {

/**
 * @brief u_t = u_xx on (0, 1), u = 0 at both ends, J = \int u
 */
class DiffusionProblem : public Problem {
public:
    explicit DiffusionProblem(PetscInt nx = 8, PetscReal T = 1.0, PetscReal k = 0.25)
        : mesh_(std::make_shared<const IntervalMesh>(0.0, 1.0, nx)) {
        time_.T = T;
        time_.k = k;
    }

    std::string name() const override { return "Diffusion"; }

    ProblemCapabilities capabilities() const override {
        ProblemCapabilities caps;
        caps.weak_residual = true;
        caps.function_space = true;
        caps.initial_conditions = true;
        caps.functional = true;
        return caps;
    }

    std::shared_ptr<const IntervalMesh> initialMesh() const override { return mesh_; }
    TimeDomain timeDomain() const override { return time_; }
    PetscInt nx() const override { return mesh_->numCells(); }

    PetscErrorCode weakResidual(const CellGeometry& cell, const ResidualArguments& args,
                                PetscScalar* r) const override {
        PetscFunctionBeginUser;
        const PetscReal h = cell.h;
        const PetscScalar du = (args.w_theta[1] - args.w_theta[0]) / h;
        PetscScalar dt[2] = {0.0, 0.0};
        if (args.k > 0.0 && args.w_prev) {
            dt[0] = (args.w[0] - args.w_prev[0]) / args.k;
            dt[1] = (args.w[1] - args.w_prev[1]) / args.k;
        }
        // Consistent P1 mass matrix h/6 [2 1; 1 2]
        r[0] = h / 6.0 * (2.0 * dt[0] + dt[1]) - du;
        r[1] = h / 6.0 * (dt[0] + 2.0 * dt[1]) + du;
        PetscFunctionReturn(PETSC_SUCCESS);
    }

    PetscErrorCode boundaryConditions(const FunctionSpace& space, PetscReal,
                                      std::vector<DirichletBC>* bcs) const override {
        PetscFunctionBeginUser;
        bcs->clear();
        bcs->push_back({0, 0, 0.0});
        bcs->push_back({space.mesh().numVertices() - 1, 0, 0.0});
        PetscFunctionReturn(PETSC_SUCCESS);
    }

    PetscErrorCode initialConditions(const FunctionSpace& space, Vec w) const override {
        PetscFunctionBeginUser;
        PetscCall(space.interpolate([](PetscReal x, PetscScalar* u) {
            u[0] = x * (1.0 - x);
        }, w));
        PetscFunctionReturn(PETSC_SUCCESS);
    }

    PetscErrorCode functional(const CellGeometry& cell, PetscReal, const PetscScalar* w,
                              PetscReal* value) const override {
        PetscFunctionBeginUser;
        *value = 0.5 * cell.h * PetscRealPart(w[0] + w[1]);
        PetscFunctionReturn(PETSC_SUCCESS);
    }

private:
    std::shared_ptr<const IntervalMesh> mesh_;
    TimeDomain time_;
};

/**
 * @brief DiffusionProblem whose right end follows u(1, t) = t
 *
 * Counts the update calls made through the const interface.
 */
class RampBoundaryProblem : public DiffusionProblem {
public:
    using DiffusionProblem::DiffusionProblem;

    ProblemCapabilities capabilities() const override {
        ProblemCapabilities caps = DiffusionProblem::capabilities();
        caps.update = true;
        return caps;
    }

    PetscErrorCode update(const FunctionSpace& space, PetscReal t,
                          std::vector<DirichletBC>* bcs) const override {
        PetscFunctionBeginUser;
        PetscCall(boundaryConditions(space, t, bcs));
        bcs->back().value = t;
        *update_calls_ += 1;
        PetscFunctionReturn(PETSC_SUCCESS);
    }

    PetscInt updateCalls() const { return *update_calls_; }

private:
    std::shared_ptr<PetscInt> update_calls_ = std::make_shared<PetscInt>(0);
};

/**
 * @brief -u'' = 1 on (0, 1), u = 0 at both ends, J = \int u
 *
 * Exact solution x (1 - x) / 2, reproduced at the vertices by P1 elements,
 * J = 1/12.
 */
class SteadyLoadProblem : public Problem {
public:
    explicit SteadyLoadProblem(PetscInt nx = 8)
        : mesh_(std::make_shared<const IntervalMesh>(0.0, 1.0, nx)) {}

    std::string name() const override { return "SteadyLoad"; }

    ProblemCapabilities capabilities() const override {
        ProblemCapabilities caps;
        caps.weak_residual = true;
        caps.function_space = true;
        caps.functional = true;
        return caps;
    }

    std::shared_ptr<const IntervalMesh> initialMesh() const override { return mesh_; }
    bool isSteady() const override { return true; }

    PetscErrorCode weakResidual(const CellGeometry& cell, const ResidualArguments& args,
                                PetscScalar* r) const override {
        PetscFunctionBeginUser;
        const PetscScalar du = (args.w[1] - args.w[0]) / cell.h;
        r[0] = -du - 0.5 * cell.h;
        r[1] = du - 0.5 * cell.h;
        PetscFunctionReturn(PETSC_SUCCESS);
    }

    PetscErrorCode boundaryConditions(const FunctionSpace& space, PetscReal,
                                      std::vector<DirichletBC>* bcs) const override {
        PetscFunctionBeginUser;
        bcs->clear();
        bcs->push_back({0, 0, 0.0});
        bcs->push_back({space.mesh().numVertices() - 1, 0, 0.0});
        PetscFunctionReturn(PETSC_SUCCESS);
    }

    PetscErrorCode functional(const CellGeometry& cell, PetscReal, const PetscScalar* w,
                              PetscReal* value) const override {
        PetscFunctionBeginUser;
        *value = 0.5 * cell.h * PetscRealPart(w[0] + w[1]);
        PetscFunctionReturn(PETSC_SUCCESS);
    }

private:
    std::shared_ptr<const IntervalMesh> mesh_;
};

/**
 * @brief Declares a residual but no function space and no functional
 */
class IncompleteProblem : public DiffusionProblem {
public:
    std::string name() const override { return "Incomplete"; }

    ProblemCapabilities capabilities() const override {
        ProblemCapabilities caps;
        caps.weak_residual = true;
        caps.initial_conditions = true;
        return caps;
    }
};

/**
 * @brief Adjoint backend recording the steps it is asked to solve
 *
 * Every dual is set to a constant, the step's time level.
 */
class RecordingAdjointBackend : public AdjointBackend {
public:
    struct Call {
        PetscReal t;
        PetscReal weight;
        bool has_next;
    };

    bool isAvailable() const override { return true; }
    std::string name() const override { return "recording"; }

    PetscErrorCode solveAdjointStep(const Problem&, const FunctionSpace&,
                                    const AdjointStep& step, Vec dual) const override {
        PetscFunctionBeginUser;
        calls_->push_back({step.t, step.functional_weight, step.next_form != nullptr});
        PetscCall(VecSet(dual, step.t));
        PetscFunctionReturn(PETSC_SUCCESS);
    }

    const std::vector<Call>& calls() const { return *calls_; }

private:
    std::shared_ptr<std::vector<Call>> calls_ = std::make_shared<std::vector<Call>>();
};

} // namespace Testing
} // namespace GOAS

#endif // GOAS_TEST_PROBLEMS_HPP
