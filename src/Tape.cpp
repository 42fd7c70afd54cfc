#include "Tape.hpp"
#include <cstdio>

namespace GOAS {

Tape::Tape(const std::string& spill_prefix) : spill_prefix_(spill_prefix) {}

Tape::~Tape() {
    PetscCallVoid(reset());
}

PetscErrorCode Tape::configure(const CheckpointBudget& budget) {
    PetscFunctionBeginUser;
    PetscCheck(budget.snaps_in_memory + budget.snaps_on_secondary_storage == budget.steps,
               PETSC_COMM_SELF, PETSC_ERR_ARG_INCOMP,
               "Checkpoint budget %" PetscInt_FMT " + %" PetscInt_FMT " != %" PetscInt_FMT,
               budget.snaps_in_memory, budget.snaps_on_secondary_storage, budget.steps);
    budget_ = budget;
    PetscFunctionReturn(PETSC_SUCCESS);
}

bool Tape::spills(PetscInt timestep) const {
    return timestep >= 1 && timestep <= budget_.snaps_on_secondary_storage;
}

PetscErrorCode Tape::record(const std::string& variable, PetscInt timestep, PetscReal time,
                            Vec value) {
    PetscFunctionBeginUser;

    if (!recording_) PetscFunctionReturn(PETSC_SUCCESS);

    TapeEntry e;
    e.variable = variable;
    e.timestep = timestep;
    e.time = time;
    PetscCall(VecGetSize(value, &e.size));

    auto it = last_.find(variable);
    if (it != last_.end() && it->second.first == timestep) {
        e.iteration = it->second.second + 1;
    } else {
        e.iteration = 0;
    }
    last_[variable] = std::make_pair(timestep, e.iteration);

    if (spills(timestep)) {
        PetscViewer viewer;
        e.file = spill_prefix_ + std::to_string(entries_.size()) + ".bin";
        PetscCall(PetscViewerBinaryOpen(PETSC_COMM_SELF, e.file.c_str(), FILE_MODE_WRITE, &viewer));
        PetscCall(VecView(value, viewer));
        PetscCall(PetscViewerDestroy(&viewer));
    } else {
        PetscCall(VecDuplicate(value, &e.value));
        PetscCall(VecCopy(value, e.value));
    }

    entries_.push_back(std::move(e));

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode Tape::value(PetscInt i, Vec* v) const {
    PetscFunctionBeginUser;

    PetscCheck(i >= 0 && i < size(), PETSC_COMM_SELF, PETSC_ERR_ARG_OUTOFRANGE,
               "Tape entry %" PetscInt_FMT " out of range [0, %" PetscInt_FMT ")", i, size());

    const TapeEntry& e = entries_[i];
    if (e.value) {
        PetscCall(VecDuplicate(e.value, v));
        PetscCall(VecCopy(e.value, *v));
    } else {
        PetscViewer viewer;
        PetscCall(VecCreateSeq(PETSC_COMM_SELF, e.size, v));
        PetscCall(PetscViewerBinaryOpen(PETSC_COMM_SELF, e.file.c_str(), FILE_MODE_READ, &viewer));
        PetscCall(VecLoad(*v, viewer));
        PetscCall(PetscViewerDestroy(&viewer));
    }

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscInt Tape::numSpilled() const {
    PetscInt n = 0;
    for (const auto& e : entries_) {
        if (!e.file.empty()) n++;
    }
    return n;
}

PetscErrorCode Tape::reset() {
    PetscFunctionBeginUser;

    for (auto& e : entries_) {
        if (e.value) PetscCall(VecDestroy(&e.value));
        if (!e.file.empty()) {
            if (std::remove(e.file.c_str()) != 0) {
                PetscCall(PetscInfo(nullptr, "Could not remove tape file %s\n", e.file.c_str()));
            }
            // The binary viewer may or may not have written an options file
            const std::string info = e.file + ".info";
            if (std::remove(info.c_str()) != 0) {
                PetscCall(PetscInfo(nullptr, "No options file %s\n", info.c_str()));
            }
        }
    }
    entries_.clear();
    last_.clear();
    budget_ = CheckpointBudget();
    recording_ = false;

    PetscFunctionReturn(PETSC_SUCCESS);
}

} // namespace GOAS
