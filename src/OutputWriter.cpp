#include "OutputWriter.hpp"
#include "Problem.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace GOAS {

OutputWriter::OutputWriter(const SolverOptions& options, const Problem& problem)
    : options_(options) {
    std::ostringstream s;
    s << options.folder << options.solver_name << problem.name() << "1D";

    if (!problem.isSteady()) {
        s << "T" << formatNumber(problem.timeDomain().T);
    }
    if (problem.nx() >= 0) {
        s << "Nx" << problem.nx();
    }
    if (!problem.isSteady()) {
        s << "K" << formatNumber(problem.timeDomain().k);
    }
    base_ = s.str();
}

std::string OutputWriter::formatNumber(PetscReal value) {
    std::ostringstream s;
    s << std::setprecision(12) << static_cast<double>(value);
    return s.str();
}

void OutputWriter::setNaming(PetscInt iteration, bool optimized) {
    iteration_ = iteration;
    optimized_ = optimized;
}

std::string OutputWriter::numbered(const std::string& stem) const {
    if (iteration_ < 0) return base_ + stem + ".dat";
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d", static_cast<int>(iteration_));
    return base_ + stem + buf + ".dat";
}

std::string OutputWriter::solutionFile() const {
    if (iteration_ < 0 && optimized_) return base_ + "_uOpt.dat";
    return numbered("_u");
}

std::string OutputWriter::dualFile() const { return numbered("_uDual"); }

std::string OutputWriter::meshFile() const { return numbered("_mesh"); }

std::string OutputWriter::indicatorFile() const { return base_ + "_ei.dat"; }

bool OutputWriter::shouldSave(PetscInt timestep) const {
    if (!options_.save_solution || options_.save_frequency == 0) return false;
    return timestep == 0 || (timestep - 1) % options_.save_frequency == 0;
}

PetscErrorCode OutputWriter::prepareFolder() const {
    PetscFunctionBeginUser;

    const bool spills = options_.on_disk > 0.0;
    if ((!options_.save_solution && !spills) || options_.folder.empty()) {
        PetscFunctionReturn(PETSC_SUCCESS);
    }

    std::error_code ec;
    std::filesystem::create_directories(options_.folder, ec);
    PetscCheck(!ec, PETSC_COMM_SELF, PETSC_ERR_FILE_OPEN, "Cannot create output folder %s: %s",
               options_.folder.c_str(), ec.message().c_str());

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode OutputWriter::openSeries(const std::string& path, std::ofstream& out) {
    PetscFunctionBeginUser;

    // First write of a run truncates, later writes append a block
    const bool first = started_.insert(path).second;
    out.open(path, first ? std::ios::out | std::ios::trunc : std::ios::out | std::ios::app);
    PetscCheck(out.is_open(), PETSC_COMM_SELF, PETSC_ERR_FILE_OPEN,
               "Cannot open output file %s", path.c_str());
    if (!first) out << "\n\n";

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode OutputWriter::writeState(const FunctionSpace& space, Vec w, PetscReal t,
                                        PetscInt timestep, bool dual) {
    PetscFunctionBeginUser;

    std::ofstream out;
    PetscCall(openSeries(dual ? dualFile() : solutionFile(), out));

    out << "# " << (dual ? "dual" : "primal") << " t = " << formatNumber(t)
        << " timestep = " << timestep << "\n";
    out << "# x";
    for (PetscInt i = 0; i < space.numComponents(); i++) out << "  w" << i;
    out << "\n";

    const PetscScalar* array;
    PetscCall(VecGetArrayRead(w, &array));
    out << std::scientific << std::setprecision(10);
    for (PetscInt v = 0; v < space.mesh().numVertices(); v++) {
        out << space.mesh().vertex(v);
        for (PetscInt i = 0; i < space.numComponents(); i++) {
            out << "  " << PetscRealPart(array[space.dof(v, i)]);
        }
        out << "\n";
    }
    PetscCall(VecRestoreArrayRead(w, &array));

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode OutputWriter::writeMesh(const IntervalMesh& mesh) {
    PetscFunctionBeginUser;

    const std::string path = meshFile();
    std::ofstream out(path);
    PetscCheck(out.is_open(), PETSC_COMM_SELF, PETSC_ERR_FILE_OPEN,
               "Cannot open output file %s", path.c_str());

    out << "# " << mesh.numCells() << " cells\n";
    out << "# x  level(cell to the right)\n";
    out << std::scientific << std::setprecision(14);
    for (PetscInt v = 0; v < mesh.numVertices(); v++) {
        out << mesh.vertex(v) << "  " << (v < mesh.numCells() ? mesh.level(v) : -1) << "\n";
    }

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode OutputWriter::writeIndicators(const IntervalMesh& mesh, Vec ei,
                                             PetscInt iteration) {
    PetscFunctionBeginUser;

    std::ofstream out;
    PetscCall(openSeries(indicatorFile(), out));

    out << "# iteration " << iteration << "\n";
    out << "# x_mid  h  ei\n";

    const PetscScalar* array;
    PetscCall(VecGetArrayRead(ei, &array));
    out << std::scientific << std::setprecision(10);
    for (PetscInt c = 0; c < mesh.numCells(); c++) {
        const CellGeometry cell = mesh.cell(c);
        out << 0.5 * (cell.x0 + cell.x1) << "  " << cell.h << "  "
            << PetscRealPart(array[c]) << "\n";
    }
    PetscCall(VecRestoreArrayRead(ei, &array));

    PetscFunctionReturn(PETSC_SUCCESS);
}

} // namespace GOAS
