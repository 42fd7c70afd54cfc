#ifndef NUMERICAL_BACKEND_HPP
#define NUMERICAL_BACKEND_HPP

/**
 * @file NumericalBackend.hpp
 * @brief PETSc assembly, solver and refinement primitives
 *
 * The backend knows nothing about time stepping or adaptivity. It assembles
 * cell-wise residual forms into PETSc vectors and matrices, solves the
 * resulting nonlinear systems with SNES, solves transposed linear systems
 * with KSP and subdivides interval meshes.
 *
 * PETSc Components Used:
 * - Vec / Mat (SeqAIJ): states, residuals, Jacobians
 * - SNES: Newton line search for the primal step
 * - KSP: transposed solves for the adjoint
 */

#include "GOAS.hpp"
#include "IntervalMesh.hpp"
#include "FunctionSpace.hpp"
#include "Problem.hpp"
#include "ResidualForms.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace GOAS {

/**
 * @brief Argument a Jacobian is taken with respect to
 */
enum class JacobianArgument {
    CURRENT,        ///< dF/dw
    PREVIOUS        ///< dF/dw_prev
};

/**
 * @brief Outcome of a nonlinear solve
 */
struct NonlinearSolveStats {
    PetscInt iterations = 0;
    PetscReal residual_norm = 0.0;
    SNESConvergedReason reason = SNES_CONVERGED_ITERATING;
};

class NumericalBackend {
public:
    explicit NumericalBackend(const SolverOptions& options);
    ~NumericalBackend() = default;

    /**
     * @brief Called with every intermediate Newton iterate (iteration >= 1)
     */
    using IterateCallback = std::function<PetscErrorCode(PetscInt, Vec)>;

    std::shared_ptr<FunctionSpace> createFunctionSpace(std::shared_ptr<const IntervalMesh> mesh,
                                                       PetscInt num_components) const;

    /**
     * @brief Create a matrix with the cell coupling pattern of a space
     */
    PetscErrorCode createMatrix(const FunctionSpace& space, Mat* J) const;

    /**
     * @brief Assemble F(w, w_prev) with Dirichlet rows w_i - g_i
     *
     * @param w_prev Previous state, may be null if the form ignores it
     */
    PetscErrorCode assembleResidual(const ResidualForm& form, const FunctionSpace& space,
                                    const std::vector<DirichletBC>& bcs,
                                    Vec w, Vec w_prev, Vec F) const;

    /**
     * @brief Assemble dF/dw or dF/dw_prev by element finite differences
     *
     * Dirichlet rows become identity rows (CURRENT) or zero rows (PREVIOUS).
     */
    PetscErrorCode assembleJacobian(const ResidualForm& form, const FunctionSpace& space,
                                    const std::vector<DirichletBC>& bcs,
                                    Vec w, Vec w_prev, JacobianArgument wrt, Mat J) const;

    /**
     * @brief Solve F(w, w_prev) = 0 for w, starting from the content of w
     */
    PetscErrorCode solveNonlinear(const ResidualForm& form, const FunctionSpace& space,
                                  const std::vector<DirichletBC>& bcs,
                                  Vec w, Vec w_prev,
                                  const IterateCallback& on_iterate,
                                  NonlinearSolveStats* stats) const;

    /**
     * @brief Solve A^T x = b
     */
    PetscErrorCode solveTranspose(Mat A, Vec b, Vec x) const;

    /**
     * @brief Sum of the problem's cell functional over the mesh
     */
    PetscErrorCode assembleFunctional(const Problem& problem, const FunctionSpace& space,
                                      PetscReal t, Vec w, PetscReal* value) const;

    /**
     * @brief Derivative of the functional with respect to w
     */
    PetscErrorCode assembleFunctionalGradient(const Problem& problem, const FunctionSpace& space,
                                              PetscReal t, Vec w, Vec gradient) const;

    /**
     * @brief Homogeneous Dirichlet conditions for an adjoint system A^T z = b
     *
     * Zeroes the Dirichlet rows and columns of A (unit diagonal) and the
     * matching entries of b, so the dual vanishes on Dirichlet dofs.
     */
    PetscErrorCode homogenizeDirichlet(const std::vector<DirichletBC>& bcs,
                                       const FunctionSpace& space, Mat A, Vec b) const;

    /**
     * @brief Cell residuals tested against the dual, one value per cell
     *
     * Projects the dual-weighted residual onto the piecewise-constant error
     * space. Dirichlet rows play no part as long as the dual vanishes on
     * Dirichlet dofs (see homogenizeDirichlet).
     *
     * @param mode INSERT_VALUES replaces, ADD_VALUES accumulates into ei
     */
    PetscErrorCode assembleCellIndicators(const ResidualForm& form, const FunctionSpace& space,
                                          Vec w, Vec w_prev, Vec dual,
                                          InsertMode mode, Vec ei) const;

    /**
     * @brief Subdivide the marked cells
     *
     * @param algorithm "regular_cut" or "buffered"
     */
    PetscErrorCode refineMesh(const IntervalMesh& mesh, const std::vector<bool>& markers,
                              const std::string& algorithm,
                              std::shared_ptr<const IntervalMesh>* refined) const;

    const SolverOptions& options() const { return options_; }

private:
    SolverOptions options_;

    struct SNESContext {
        const NumericalBackend* backend;
        const ResidualForm* form;
        const FunctionSpace* space;
        const std::vector<DirichletBC>* bcs;
        Vec w_prev;
        const IterateCallback* on_iterate;
    };

    static PetscErrorCode FormFunction(SNES snes, Vec x, Vec F, void* ctx);
    static PetscErrorCode FormJacobian(SNES snes, Vec x, Mat J, Mat P, void* ctx);
    static PetscErrorCode MonitorFunction(SNES snes, PetscInt its, PetscReal fnorm, void* ctx);

    PetscErrorCode applyDirichletValues(const std::vector<DirichletBC>& bcs,
                                        const FunctionSpace& space, Vec w) const;
};

} // namespace GOAS

#endif // NUMERICAL_BACKEND_HPP
