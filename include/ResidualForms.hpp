#ifndef RESIDUAL_FORMS_HPP
#define RESIDUAL_FORMS_HPP

#include "GOAS.hpp"
#include "Problem.hpp"

namespace GOAS {

/**
 * @brief Cell-wise residual F(w, w_prev) seen by the numerical backend
 *
 * The backend differentiates a form with respect to either argument, so the
 * form must be a pure function of the two cell-local states.
 */
class ResidualForm {
public:
    virtual ~ResidualForm() = default;

    virtual PetscErrorCode cellResidual(const CellGeometry& cell, const PetscScalar* w,
                                        const PetscScalar* w_prev, PetscScalar* r) const = 0;

    virtual PetscInt numCellDofs() const = 0;

    /**
     * @brief Whether the form reads w_prev at all
     */
    virtual bool dependsOnPrevious() const = 0;
};

/**
 * @brief Theta-method residual of one time step
 *
 * Evaluates the problem's weak residual at
 *   w_theta = (1 - theta) * w_prev + theta * w
 * with the time level t of w.
 */
class ThetaResidual : public ResidualForm {
public:
    ThetaResidual(const Problem& problem, PetscReal t, PetscReal k, PetscReal theta,
                  bool indicator_mode = false);

    PetscErrorCode cellResidual(const CellGeometry& cell, const PetscScalar* w,
                                const PetscScalar* w_prev, PetscScalar* r) const override;

    PetscInt numCellDofs() const override { return 2 * problem_.numComponents(); }
    bool dependsOnPrevious() const override { return true; }

    PetscReal time() const { return t_; }
    PetscReal timeStep() const { return k_; }
    PetscReal theta() const { return theta_; }

private:
    const Problem& problem_;
    PetscReal t_;
    PetscReal k_;
    PetscReal theta_;
    bool indicator_mode_;
};

/**
 * @brief Residual of a steady problem, F(w)
 */
class SteadyResidual : public ResidualForm {
public:
    explicit SteadyResidual(const Problem& problem, bool indicator_mode = false);

    PetscErrorCode cellResidual(const CellGeometry& cell, const PetscScalar* w,
                                const PetscScalar* w_prev, PetscScalar* r) const override;

    PetscInt numCellDofs() const override { return 2 * problem_.numComponents(); }
    bool dependsOnPrevious() const override { return false; }

private:
    const Problem& problem_;
    bool indicator_mode_;
};

} // namespace GOAS

#endif // RESIDUAL_FORMS_HPP
