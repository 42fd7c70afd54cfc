#ifndef OUTPUT_WRITER_HPP
#define OUTPUT_WRITER_HPP

/**
 * @file OutputWriter.hpp
 * @brief File naming and gnuplot data sinks
 *
 * All files of a run share the base name
 *   <folder><solver><problem>1D T<T>[Nx<nx>]K<k>
 * and differ by suffix:
 *   _u.dat, _uDual.dat, _mesh.dat        final solve
 *   _uOpt.dat                            solve after optimization
 *   _uNN.dat, _uDualNN.dat, _meshNN.dat  adaptive iteration NN
 *   _ei.dat                              error indicators, all iterations
 *
 * Series files hold one gnuplot index block per snapshot (blocks are
 * separated by two blank lines, select with `index n`).
 */

#include "GOAS.hpp"
#include "IntervalMesh.hpp"
#include "FunctionSpace.hpp"

#include <fstream>
#include <set>
#include <string>

namespace GOAS {

class OutputWriter {
public:
    OutputWriter(const SolverOptions& options, const Problem& problem);

    /**
     * @brief Base name shared by all files of the run
     */
    const std::string& baseName() const { return base_; }

    /**
     * @brief Select the file set
     *
     * @param iteration Adaptive iteration index (0 for the initial mesh),
     *                  -1 for the final solve
     * @param optimized Solve after optimization
     */
    void setNaming(PetscInt iteration, bool optimized);

    std::string solutionFile() const;
    std::string dualFile() const;
    std::string meshFile() const;
    std::string indicatorFile() const;

    /**
     * @brief Whether a snapshot of this time step index is kept
     *
     * Time step 0 and every step with (timestep - 1) % save_frequency == 0;
     * nothing when saving is off or save_frequency is 0.
     */
    bool shouldSave(PetscInt timestep) const;

    bool enabled() const { return options_.save_solution; }

    /**
     * @brief Create the output folder when saving is on or the tape spills to disk
     */
    PetscErrorCode prepareFolder() const;

    /**
     * @brief Append a state snapshot to the solution or dual series
     */
    PetscErrorCode writeState(const FunctionSpace& space, Vec w, PetscReal t, PetscInt timestep,
                              bool dual);

    PetscErrorCode writeMesh(const IntervalMesh& mesh);

    /**
     * @brief Append the indicator field of one adaptive iteration
     */
    PetscErrorCode writeIndicators(const IntervalMesh& mesh, Vec ei, PetscInt iteration);

    static std::string formatNumber(PetscReal value);

private:
    const SolverOptions& options_;
    std::string base_;
    PetscInt iteration_ = -1;
    bool optimized_ = false;
    std::set<std::string> started_;

    std::string numbered(const std::string& stem) const;
    PetscErrorCode openSeries(const std::string& path, std::ofstream& out);
};

} // namespace GOAS

#endif // OUTPUT_WRITER_HPP
