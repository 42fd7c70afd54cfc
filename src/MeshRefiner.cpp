#include "MeshRefiner.hpp"
#include "NumericalBackend.hpp"

#include <algorithm>
#include <cmath>
#include <functional>

namespace GOAS {

MeshRefiner::MeshRefiner(const SolverOptions& options, const NumericalBackend& backend)
    : options_(options), backend_(backend) {}

PetscErrorCode MeshRefiner::markCells(const std::vector<PetscReal>& ei, PetscReal ratio,
                                      std::vector<bool>* markers, PetscInt* num_marked) {
    PetscFunctionBeginUser;

    PetscCheck(ratio > 0.0 && ratio <= 1.0, PETSC_COMM_SELF, PETSC_ERR_ARG_OUTOFRANGE,
               "Adapt ratio %g must lie in (0, 1]", (double)ratio);

    const PetscInt n = static_cast<PetscInt>(ei.size());
    markers->assign(ei.size(), false);
    if (num_marked) *num_marked = 0;

    const PetscInt adapt_n = static_cast<PetscInt>(std::floor(n * ratio)) - 1;
    if (adapt_n < 0) {
        PetscCall(PetscInfo(nullptr, "Too few cells (%" PetscInt_FMT ") for ratio %g, "
                            "nothing marked\n", n, (double)ratio));
        PetscFunctionReturn(PETSC_SUCCESS);
    }

    // Sort magnitudes, largest first
    std::vector<PetscReal> gamma(ei.size());
    std::transform(ei.begin(), ei.end(), gamma.begin(),
                   [](PetscReal e) { return std::abs(e); });
    std::sort(gamma.begin(), gamma.end(), std::greater<PetscReal>());
    const PetscReal gamma_0 = gamma[adapt_n];

    PetscInt count = 0;
    for (PetscInt c = 0; c < n; c++) {
        if (std::abs(ei[c]) > gamma_0) {
            (*markers)[c] = true;
            count++;
        }
    }
    if (num_marked) *num_marked = count;

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode MeshRefiner::markCells(Vec ei, PetscReal ratio, std::vector<bool>* markers,
                                      PetscInt* num_marked) {
    PetscFunctionBeginUser;

    PetscInt n;
    const PetscScalar* array;
    PetscCall(VecGetSize(ei, &n));

    std::vector<PetscReal> values(n);
    PetscCall(VecGetArrayRead(ei, &array));
    for (PetscInt c = 0; c < n; c++) values[c] = PetscRealPart(array[c]);
    PetscCall(VecRestoreArrayRead(ei, &array));

    PetscCall(markCells(values, ratio, markers, num_marked));

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode MeshRefiner::refine(const IntervalMesh& mesh, Vec ei,
                                   std::shared_ptr<const IntervalMesh>* refined,
                                   PetscInt* num_marked) const {
    PetscFunctionBeginUser;

    std::vector<bool> markers;
    PetscInt marked;
    PetscCall(markCells(ei, options_.adapt_ratio, &markers, &marked));

    PetscCheck(static_cast<PetscInt>(markers.size()) == mesh.numCells(), PETSC_COMM_SELF,
               PETSC_ERR_ARG_SIZ, "Indicator field has %" PetscInt_FMT " entries for %"
               PetscInt_FMT " cells", static_cast<PetscInt>(markers.size()), mesh.numCells());

    if (options_.verbosity > 0) {
        PetscCall(PetscPrintf(PETSC_COMM_SELF, "Refining %" PetscInt_FMT " of %" PetscInt_FMT
                              " cells (%.1f%%).\n", marked, mesh.numCells(),
                              100.0 * marked / mesh.numCells()));
    }

    PetscCall(backend_.refineMesh(mesh, markers, options_.refinement_algorithm, refined));
    if (num_marked) *num_marked = marked;

    PetscFunctionReturn(PETSC_SUCCESS);
}

} // namespace GOAS
