#ifndef PROBLEM_HPP
#define PROBLEM_HPP

#include "GOAS.hpp"
#include "IntervalMesh.hpp"
#include "FunctionSpace.hpp"

#include <memory>
#include <string>
#include <vector>

namespace GOAS {

/**
 * @brief Members a Problem implementation provides
 *
 * Declared once by the implementation and queried at configuration time.
 * Missing required members are configuration errors, missing optional
 * members disable the corresponding feature.
 */
struct ProblemCapabilities {
    // Required
    bool weak_residual = false;
    bool function_space = false;
    bool initial_conditions = false;    ///< Required for time-dependent problems

    // Required for adaptivity and optimization
    bool functional = false;

    // Optional
    bool update = false;                ///< Time-dependent boundary conditions
    bool time_step = false;             ///< Dynamic time step rule
    bool optimize = false;              ///< Optimization driver
};

/**
 * @brief Strong Dirichlet condition on one vertex dof
 */
struct DirichletBC {
    PetscInt vertex;
    PetscInt component;
    PetscScalar value;
};

/**
 * @brief Arguments of a cell-local weak residual evaluation
 *
 * All state pointers refer to cell-local arrays of length
 * 2 * numComponents() (left vertex first). For steady problems k is zero,
 * w_prev is null and w_theta aliases w.
 */
struct ResidualArguments {
    PetscReal t;                    ///< Time level of w
    PetscReal k;                    ///< Time step
    const PetscScalar* w_theta;     ///< Theta-weighted state
    const PetscScalar* w;           ///< Current state
    const PetscScalar* w_prev;      ///< Previous state
    bool indicator_mode;            ///< Assembling error indicators
};

/**
 * @brief Problem collaborator
 *
 * Supplies the mesh, time domain, weak residual, boundary and initial
 * conditions and the goal functional of a PDE. The weak residual is given
 * cell by cell: r[i] is the residual tested against the i-th local basis
 * function of the cell.
 */
class Problem {
public:
    virtual ~Problem() = default;

    virtual std::string name() const = 0;
    virtual ProblemCapabilities capabilities() const = 0;

    virtual std::shared_ptr<const IntervalMesh> initialMesh() const = 0;
    virtual bool isSteady() const { return false; }
    virtual TimeDomain timeDomain() const { return TimeDomain(); }

    /**
     * @brief Number of solution components per vertex
     */
    virtual PetscInt numComponents() const { return 1; }

    /**
     * @brief Cell residual
     *
     * @param cell Cell geometry
     * @param args States and step
     * @param r Output, 2 * numComponents() entries
     */
    virtual PetscErrorCode weakResidual(const CellGeometry& cell, const ResidualArguments& args,
                                        PetscScalar* r) const;

    virtual PetscErrorCode boundaryConditions(const FunctionSpace& space, PetscReal t,
                                              std::vector<DirichletBC>* bcs) const = 0;

    virtual PetscErrorCode initialConditions(const FunctionSpace& space, Vec w) const;

    /**
     * @brief Goal functional contribution of one cell
     */
    virtual PetscErrorCode functional(const CellGeometry& cell, PetscReal t,
                                      const PetscScalar* w, PetscReal* value) const;

    // Optional members
    virtual PetscErrorCode update(const FunctionSpace& space, PetscReal t,
                                  std::vector<DirichletBC>* bcs) const;
    virtual PetscErrorCode timeStep(const FunctionSpace& space, Vec w,
                                    const IntervalMesh& mesh, PetscReal* k) const;
    virtual PetscErrorCode optimize(AdaptiveController& controller,
                                    const FunctionSpace& space, Vec w);

    /**
     * @brief Initial cell count, used for output naming (-1 if unknown)
     */
    virtual PetscInt nx() const { return -1; }
};

/**
 * @brief Check that a Problem declares everything a run needs
 *
 * @param problem Problem to validate
 * @param needs_functional Adaptivity or optimization requested
 * @return PETSC_ERR_USER if a required member is missing
 */
PetscErrorCode validateProblem(const Problem& problem, bool needs_functional);

/**
 * @brief Boundary conditions in force at time t
 *
 * update(space, t) when the problem declares it, otherwise the conditions
 * set up at the start time t0.
 */
PetscErrorCode currentBoundaryConditions(const Problem& problem, const FunctionSpace& space,
                                         PetscReal t0, PetscReal t,
                                         std::vector<DirichletBC>* bcs);

} // namespace GOAS

#endif // PROBLEM_HPP
