#ifndef TAPE_HPP
#define TAPE_HPP

/**
 * @file Tape.hpp
 * @brief Record of the annotated forward pass
 *
 * Entries are appended in forward time order and replayed in exactly the
 * reverse order by the dual sweep. Entries of the earliest time steps can be
 * spilled to PETSc binary files according to a CheckpointBudget and are
 * loaded back on demand.
 */

#include "GOAS.hpp"

#include <map>
#include <string>
#include <vector>

namespace GOAS {

/**
 * @brief One recorded value
 */
struct TapeEntry {
    std::string variable;       ///< Name of the recorded variable
    PetscInt timestep;          ///< Forward time step index
    PetscInt iteration;         ///< Repeat count within the time step
    PetscReal time;             ///< Time level of the value
    PetscInt size;              ///< Vector length
    Vec value = nullptr;        ///< In-memory copy, null if spilled
    std::string file;           ///< Spill file, empty if in memory
};

class Tape {
public:
    /**
     * @param spill_prefix Path prefix of spill files
     */
    explicit Tape(const std::string& spill_prefix = "./goas_tape_");
    ~Tape();

    Tape(const Tape&) = delete;
    Tape& operator=(const Tape&) = delete;

    /**
     * @brief Apply a checkpoint budget to the entries recorded from now on
     *
     * Time steps 1..snaps_on_secondary_storage are spilled to disk, later
     * steps stay in memory.
     */
    PetscErrorCode configure(const CheckpointBudget& budget);

    void startRecording() { recording_ = true; }
    void stopRecording() { recording_ = false; }
    bool isRecording() const { return recording_; }

    /**
     * @brief Append a copy of value
     *
     * The iteration counter restarts at 0 when the time step of the variable
     * changes and increments otherwise. Ignored while not recording.
     */
    PetscErrorCode record(const std::string& variable, PetscInt timestep, PetscReal time,
                          Vec value);

    PetscInt size() const { return static_cast<PetscInt>(entries_.size()); }
    bool empty() const { return entries_.empty(); }
    const TapeEntry& entry(PetscInt i) const { return entries_[i]; }

    /**
     * @brief Copy of the recorded value of entry i (caller destroys)
     */
    PetscErrorCode value(PetscInt i, Vec* v) const;

    PetscInt numSpilled() const;
    const CheckpointBudget& budget() const { return budget_; }

    /**
     * @brief Drop all entries and spill files
     */
    PetscErrorCode reset();

private:
    std::string spill_prefix_;
    bool recording_ = false;
    CheckpointBudget budget_;
    std::vector<TapeEntry> entries_;
    std::map<std::string, std::pair<PetscInt, PetscInt>> last_;   // variable -> (timestep, iteration)

    bool spills(PetscInt timestep) const;
};

} // namespace GOAS

#endif // TAPE_HPP
