#ifndef ADJOINT_BACKEND_HPP
#define ADJOINT_BACKEND_HPP

/**
 * @file AdjointBackend.hpp
 * @brief Adjoint capability of the numerical backend
 *
 * A controller holds one AdjointBackend. TapeAdjointBackend solves the
 * discrete adjoint of the recorded theta-method steps; NullAdjointBackend
 * stands in when no adjoint is available and rejects every request.
 */

#include "GOAS.hpp"
#include "FunctionSpace.hpp"
#include "Problem.hpp"
#include "ResidualForms.hpp"

#include <string>
#include <vector>

namespace GOAS {

/**
 * @brief Data of one reverse step
 *
 * Solves (dF_n/dw_n)^T z_n = weight * dJ/dw_n - (dF_{n+1}/dw_n)^T z_{n+1}
 * on the free dofs; z_n is zero on the Dirichlet dofs of step n.
 * The "next" members are null for the newest step and for steady problems.
 */
struct AdjointStep {
    const ResidualForm* form = nullptr;             ///< F_n
    const std::vector<DirichletBC>* bcs = nullptr;  ///< Dirichlet rows of F_n
    Vec w = nullptr;                                ///< w_n
    Vec w_prev = nullptr;                           ///< w_{n-1}
    PetscReal t = 0.0;                              ///< Time level of w_n
    PetscReal functional_weight = 1.0;              ///< k, or 1 for steady problems

    const ResidualForm* next_form = nullptr;        ///< F_{n+1}
    const std::vector<DirichletBC>* next_bcs = nullptr;
    Vec w_next = nullptr;                           ///< w_{n+1}
    Vec dual_next = nullptr;                        ///< z_{n+1}
};

class AdjointBackend {
public:
    virtual ~AdjointBackend() = default;

    virtual bool isAvailable() const = 0;
    virtual std::string name() const = 0;

    /**
     * @brief Solve one adjoint step into dual
     */
    virtual PetscErrorCode solveAdjointStep(const Problem& problem, const FunctionSpace& space,
                                            const AdjointStep& step, Vec dual) const = 0;
};

/**
 * @brief Discrete adjoint built from backend Jacobians
 */
class TapeAdjointBackend : public AdjointBackend {
public:
    explicit TapeAdjointBackend(const NumericalBackend& backend);

    bool isAvailable() const override { return true; }
    std::string name() const override { return "tape"; }

    PetscErrorCode solveAdjointStep(const Problem& problem, const FunctionSpace& space,
                                    const AdjointStep& step, Vec dual) const override;

private:
    const NumericalBackend& backend_;
};

/**
 * @brief Placeholder when no adjoint is available
 */
class NullAdjointBackend : public AdjointBackend {
public:
    bool isAvailable() const override { return false; }
    std::string name() const override { return "none"; }

    PetscErrorCode solveAdjointStep(const Problem& problem, const FunctionSpace& space,
                                    const AdjointStep& step, Vec dual) const override;
};

} // namespace GOAS

#endif // ADJOINT_BACKEND_HPP
