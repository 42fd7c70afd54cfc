#ifndef DUAL_SWEEP_ENGINE_HPP
#define DUAL_SWEEP_ENGINE_HPP

/**
 * @file DualSweepEngine.hpp
 * @brief Reverse replay of the primal tape
 *
 * The sweep walks the recorded primal variable from the newest to the
 * oldest entry, keeps the converged state of every time step and solves
 * one adjoint step per time step through the AdjointBackend. Duals are
 * produced newest-time-first and handed to a callback as soon as they
 * exist.
 */

#include "GOAS.hpp"
#include "FunctionSpace.hpp"
#include "Problem.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace GOAS {

/**
 * @brief Converged primal state of one time step and its dual
 */
struct DualEntry {
    PetscInt tape_index = -1;
    PetscInt timestep = 0;
    PetscInt iteration = 0;
    PetscReal time = 0.0;
    Vec value = nullptr;        ///< Primal tape value
    Vec dual = nullptr;         ///< Adjoint state
};

/**
 * @brief Duals in reverse time order, owning their vectors
 */
class DualSequence {
public:
    DualSequence() = default;
    ~DualSequence();

    DualSequence(const DualSequence&) = delete;
    DualSequence& operator=(const DualSequence&) = delete;
    DualSequence(DualSequence&& other) noexcept;
    DualSequence& operator=(DualSequence&& other) noexcept;

    /**
     * @brief Append an entry, taking ownership of its vectors
     */
    void push(const DualEntry& entry) { entries_.push_back(entry); }

    PetscInt size() const { return static_cast<PetscInt>(entries_.size()); }
    bool empty() const { return entries_.empty(); }
    const DualEntry& operator[](PetscInt i) const { return entries_[i]; }
    const DualEntry& back() const { return entries_.back(); }

    PetscErrorCode clear();

private:
    std::vector<DualEntry> entries_;
};

class DualSweepEngine {
public:
    /**
     * @brief Called with (t, timestep, dual) for every dual produced
     */
    using DualCallback = std::function<PetscErrorCode(PetscReal, PetscInt, Vec)>;

    DualSweepEngine(const SolverOptions& options, const AdjointBackend& adjoint);

    void setDualCallback(DualCallback callback) { callback_ = std::move(callback); }

    /**
     * @brief (timestep, iteration) pairs for a sequence of recorded timesteps
     *
     * The iteration restarts at 0 whenever the timestep changes and
     * increments while it repeats: [1, 1, 2] gives (1,0), (1,1), (2,0).
     */
    static std::vector<std::pair<PetscInt, PetscInt>>
    trackIterations(const std::vector<PetscInt>& timesteps);

    /**
     * @brief Solve the dual problem backwards over the recorded tape
     *
     * @param problem Problem that produced the tape
     * @param space Space of the recorded states
     * @param tape Tape of the annotated primal pass
     * @param k Time step of the primal pass (ignored for steady problems)
     * @param duals Output, newest time first
     * @return PETSC_ERR_ARG_WRONGSTATE for an empty or malformed tape
     */
    PetscErrorCode sweep(const Problem& problem, const FunctionSpace& space, const Tape& tape,
                         PetscReal k, DualSequence* duals) const;

    static const char* primalVariable() { return "w"; }
    static const char* initialVariable() { return "w_initial"; }

private:
    const SolverOptions& options_;
    const AdjointBackend& adjoint_;
    DualCallback callback_;

    PetscErrorCode collectConverged(const Tape& tape, std::vector<PetscInt>* converged) const;
    PetscErrorCode sweepSteady(const Problem& problem, const FunctionSpace& space,
                               const Tape& tape, PetscInt index, DualSequence* duals) const;
};

} // namespace GOAS

#endif // DUAL_SWEEP_ENGINE_HPP
