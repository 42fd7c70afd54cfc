#ifndef MESH_REFINER_HPP
#define MESH_REFINER_HPP

#include "GOAS.hpp"
#include "IntervalMesh.hpp"

#include <memory>
#include <vector>

namespace GOAS {

/**
 * @brief Order-statistic marking and refinement
 *
 * With C cells and ratio r, adapt_n = floor(C * r) - 1 and gamma_0 is the
 * adapt_n-th largest |ei| (0-based). Cells with |ei| > gamma_0 are marked,
 * so ties with gamma_0 stay unmarked. adapt_n < 0 marks nothing.
 * Subdivision itself is done by NumericalBackend::refineMesh.
 */
class MeshRefiner {
public:
    MeshRefiner(const SolverOptions& options, const NumericalBackend& backend);

    /**
     * @brief Mark cells from indicator values
     *
     * @param ei One indicator per cell
     * @param ratio Marking ratio in (0, 1]
     * @param markers Output, one flag per cell
     * @param num_marked Output, number of flags set (may be null)
     * @return PETSC_ERR_ARG_OUTOFRANGE for a ratio outside (0, 1]
     */
    static PetscErrorCode markCells(const std::vector<PetscReal>& ei, PetscReal ratio,
                                    std::vector<bool>* markers, PetscInt* num_marked);

    /**
     * @brief Mark from an indicator field
     */
    static PetscErrorCode markCells(Vec ei, PetscReal ratio, std::vector<bool>* markers,
                                    PetscInt* num_marked);

    /**
     * @brief Mark with the configured ratio and refine with the configured algorithm
     *
     * @param mesh Current mesh
     * @param ei Indicator field on mesh
     * @param refined Output mesh
     * @param num_marked Output, number of marked cells (may be null)
     */
    PetscErrorCode refine(const IntervalMesh& mesh, Vec ei,
                          std::shared_ptr<const IntervalMesh>* refined,
                          PetscInt* num_marked) const;

private:
    const SolverOptions& options_;
    const NumericalBackend& backend_;
};

} // namespace GOAS

#endif // MESH_REFINER_HPP
