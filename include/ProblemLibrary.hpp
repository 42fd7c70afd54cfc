#ifndef PROBLEM_LIBRARY_HPP
#define PROBLEM_LIBRARY_HPP

/**
 * @file ProblemLibrary.hpp
 * @brief Model problems on an interval
 *
 * Problems:
 * - heat:    u_t - kappa u_xx = 0, u(x, 0) = sin(pi x), u(0) = 0, u(1) = a t
 * - burgers: u_t + (u^2/2)_x - nu u_xx = 0, u(x, 0) = sin(2 pi x), u = 0 on the boundary
 * - poisson: -u_xx = f (steady), u = 0 on the boundary
 *
 * Every problem measures the goal functional
 *   J(u) = \int psi(x) u dx,  psi(x) = exp(-((x - x_c) / sigma)^2)
 * with a Gaussian weight localized around x_c.
 */

#include "GOAS.hpp"
#include "Problem.hpp"

#include <memory>
#include <string>
#include <vector>

namespace GOAS {

/**
 * @brief Parameters of the model problems
 */
struct ProblemParameters {
    std::string name = "heat";
    PetscInt nx = 16;                   ///< Initial cell count
    PetscReal lower = 0.0;
    PetscReal upper = 1.0;
    TimeDomain time;

    PetscReal coefficient = -1.0;       ///< Diffusivity / viscosity (< 0: problem default)
    PetscReal source = 1.0;             ///< Poisson load f
    PetscReal boundary_rate = 0.0;      ///< Heat: u(1, t) = boundary_rate * t
    PetscReal goal_center = -1.0;       ///< x_c (< 0: problem default)
    PetscReal goal_width = 0.05;        ///< sigma
    PetscReal cfl = 0.5;                ///< Burgers time step rule
    PetscReal target_functional = 0.01; ///< Poisson optimization target
};

/**
 * @brief Common base: interval mesh, Dirichlet ends, Gaussian goal
 */
class IntervalProblem : public Problem {
public:
    explicit IntervalProblem(const ProblemParameters& params);

    std::shared_ptr<const IntervalMesh> initialMesh() const override { return mesh_; }
    TimeDomain timeDomain() const override { return params_.time; }
    PetscInt nx() const override { return params_.nx; }

    PetscErrorCode boundaryConditions(const FunctionSpace& space, PetscReal t,
                                      std::vector<DirichletBC>* bcs) const override;

    PetscErrorCode functional(const CellGeometry& cell, PetscReal t, const PetscScalar* w,
                              PetscReal* value) const override;

    const ProblemParameters& parameters() const { return params_; }

    /**
     * @brief Goal weight psi(x)
     */
    PetscReal goalWeight(PetscReal x) const;

protected:
    ProblemParameters params_;
    std::shared_ptr<const IntervalMesh> mesh_;

    PetscErrorCode dirichletEnds(const FunctionSpace& space, PetscScalar left, PetscScalar right,
                                 std::vector<DirichletBC>* bcs) const;
};

class HeatProblem : public IntervalProblem {
public:
    explicit HeatProblem(const ProblemParameters& params);

    std::string name() const override { return "Heat"; }
    ProblemCapabilities capabilities() const override;

    PetscErrorCode weakResidual(const CellGeometry& cell, const ResidualArguments& args,
                                PetscScalar* r) const override;
    PetscErrorCode initialConditions(const FunctionSpace& space, Vec w) const override;
    PetscErrorCode update(const FunctionSpace& space, PetscReal t,
                          std::vector<DirichletBC>* bcs) const override;

private:
    PetscReal kappa_;
};

class BurgersProblem : public IntervalProblem {
public:
    explicit BurgersProblem(const ProblemParameters& params);

    std::string name() const override { return "Burgers"; }
    ProblemCapabilities capabilities() const override;

    PetscErrorCode weakResidual(const CellGeometry& cell, const ResidualArguments& args,
                                PetscScalar* r) const override;
    PetscErrorCode initialConditions(const FunctionSpace& space, Vec w) const override;

    /**
     * @brief CFL step cfl * h_min / max|u|
     */
    PetscErrorCode timeStep(const FunctionSpace& space, Vec w, const IntervalMesh& mesh,
                            PetscReal* k) const override;

private:
    PetscReal nu_;
};

class PoissonProblem : public IntervalProblem {
public:
    explicit PoissonProblem(const ProblemParameters& params);

    std::string name() const override { return "Poisson"; }
    ProblemCapabilities capabilities() const override;
    bool isSteady() const override { return true; }

    PetscErrorCode weakResidual(const CellGeometry& cell, const ResidualArguments& args,
                                PetscScalar* r) const override;

    /**
     * @brief Calibrate the load f so that J(u) hits the target functional
     *
     * J is linear in f and dJ/df = z^T b with z the dual and b the load
     * vector of a unit source, so a few adjoint-gradient Newton steps
     * converge.
     */
    PetscErrorCode optimize(AdaptiveController& controller, const FunctionSpace& space,
                            Vec w) override;

    PetscReal source() const { return source_; }

private:
    PetscReal source_;
};

/**
 * @brief Create a model problem by name (heat, burgers, poisson)
 *
 * @throws std::invalid_argument for an unknown name
 */
std::unique_ptr<IntervalProblem> createProblem(const ProblemParameters& params);

std::vector<std::string> availableProblems();

} // namespace GOAS

#endif // PROBLEM_LIBRARY_HPP
