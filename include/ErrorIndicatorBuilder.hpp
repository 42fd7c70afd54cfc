#ifndef ERROR_INDICATOR_BUILDER_HPP
#define ERROR_INDICATOR_BUILDER_HPP

#include "GOAS.hpp"
#include "FunctionSpace.hpp"
#include "Problem.hpp"
#include "DualSweepEngine.hpp"

namespace GOAS {

/**
 * @brief Dual-weighted residual indicators, one value per cell
 *
 * Time-dependent problems sum over consecutive pairs (i, i+1) of the
 * reverse-ordered duals: the theta residual at
 *   theta * w[i] + (1 - theta) * w[i+1]
 * tested against the cell-restricted dual[i]. Steady problems use the single
 * dual. The field lives in the piecewise-constant error space regardless of
 * the primal space.
 */
class ErrorIndicatorBuilder {
public:
    ErrorIndicatorBuilder(const SolverOptions& options, const NumericalBackend& backend);

    /**
     * @brief Build the indicator field
     *
     * @param problem Problem of the primal and dual solves
     * @param space Primal space
     * @param duals Sweep result, newest time first
     * @param k Time step (ignored for steady problems)
     * @param ei Output, created here with one entry per cell
     */
    PetscErrorCode build(const Problem& problem, const FunctionSpace& space,
                         const DualSequence& duals, PetscReal k, Vec* ei) const;

private:
    const SolverOptions& options_;
    const NumericalBackend& backend_;
};

} // namespace GOAS

#endif // ERROR_INDICATOR_BUILDER_HPP
