#include "DualSweepEngine.hpp"
#include "AdjointBackend.hpp"
#include "ResidualForms.hpp"
#include "Tape.hpp"

#include <memory>

namespace GOAS {

// ============================================================================
// DualSequence
// ============================================================================

DualSequence::~DualSequence() {
    PetscCallVoid(clear());
}

DualSequence::DualSequence(DualSequence&& other) noexcept
    : entries_(std::move(other.entries_)) {
    other.entries_.clear();
}

DualSequence& DualSequence::operator=(DualSequence&& other) noexcept {
    // other releases what this sequence held
    entries_.swap(other.entries_);
    return *this;
}

PetscErrorCode DualSequence::clear() {
    PetscFunctionBeginUser;
    for (auto& e : entries_) {
        PetscCall(VecDestroy(&e.value));
        PetscCall(VecDestroy(&e.dual));
    }
    entries_.clear();
    PetscFunctionReturn(PETSC_SUCCESS);
}

// ============================================================================
// DualSweepEngine
// ============================================================================

DualSweepEngine::DualSweepEngine(const SolverOptions& options, const AdjointBackend& adjoint)
    : options_(options), adjoint_(adjoint) {}

std::vector<std::pair<PetscInt, PetscInt>>
DualSweepEngine::trackIterations(const std::vector<PetscInt>& timesteps) {
    std::vector<std::pair<PetscInt, PetscInt>> tracked;
    tracked.reserve(timesteps.size());

    PetscInt iteration = 0;
    for (size_t i = 0; i < timesteps.size(); i++) {
        if (i > 0 && timesteps[i] == timesteps[i - 1]) {
            iteration++;
        } else {
            iteration = 0;
        }
        tracked.emplace_back(timesteps[i], iteration);
    }
    return tracked;
}

PetscErrorCode DualSweepEngine::collectConverged(const Tape& tape,
                                                 std::vector<PetscInt>* converged) const {
    PetscFunctionBeginUser;

    PetscCheck(!tape.empty(), PETSC_COMM_SELF, PETSC_ERR_ARG_WRONGSTATE,
               "Tape is empty: no annotated primal pass to replay");

    // Reverse walk over the primal variable
    std::vector<PetscInt> indices;
    std::vector<PetscInt> timesteps;
    for (PetscInt i = tape.size() - 1; i >= 0; i--) {
        const TapeEntry& e = tape.entry(i);
        if (e.variable != primalVariable()) continue;
        PetscCheck(timesteps.empty() || e.timestep <= timesteps.back(), PETSC_COMM_SELF,
                   PETSC_ERR_ARG_WRONGSTATE,
                   "Malformed tape: time step %" PetscInt_FMT " follows %" PetscInt_FMT
                   " in the reverse walk", e.timestep, timesteps.back());
        indices.push_back(i);
        timesteps.push_back(e.timestep);
    }

    PetscCheck(!indices.empty(), PETSC_COMM_SELF, PETSC_ERR_ARG_WRONGSTATE,
               "Tape holds no entries of the primal variable '%s'", primalVariable());

    // Recorded iterations must match the forward bookkeeping
    const std::vector<PetscInt> forward(timesteps.rbegin(), timesteps.rend());
    const auto tracked = trackIterations(forward);
    for (size_t j = 0; j < tracked.size(); j++) {
        const TapeEntry& e = tape.entry(indices[indices.size() - 1 - j]);
        PetscCheck(e.iteration == tracked[j].second, PETSC_COMM_SELF, PETSC_ERR_ARG_WRONGSTATE,
                   "Malformed tape: time step %" PetscInt_FMT " recorded iteration %" PetscInt_FMT
                   ", expected %" PetscInt_FMT, e.timestep, e.iteration, tracked[j].second);
    }

    // The first entry of each time step in the reverse walk is the converged one
    converged->clear();
    for (size_t j = 0; j < indices.size(); j++) {
        if (j == 0 || timesteps[j] != timesteps[j - 1]) {
            converged->push_back(indices[j]);
        }
    }

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode DualSweepEngine::sweepSteady(const Problem& problem, const FunctionSpace& space,
                                            const Tape& tape, PetscInt index,
                                            DualSequence* duals) const {
    PetscFunctionBeginUser;

    const TapeEntry& e = tape.entry(index);
    SteadyResidual form(problem);
    std::vector<DirichletBC> bcs;
    PetscCall(currentBoundaryConditions(problem, space, 0.0, 0.0, &bcs));

    DualEntry d;
    d.tape_index = index;
    d.timestep = e.timestep;
    d.iteration = e.iteration;
    d.time = e.time;
    PetscCall(tape.value(index, &d.value));
    PetscCall(space.createVector(&d.dual));

    AdjointStep step;
    step.form = &form;
    step.bcs = &bcs;
    step.w = d.value;
    step.t = e.time;
    step.functional_weight = 1.0;

    PetscCall(adjoint_.solveAdjointStep(problem, space, step, d.dual));
    duals->push(d);

    if (callback_) PetscCall(callback_(d.time, d.timestep, d.dual));

    PetscFunctionReturn(PETSC_SUCCESS);
}

PetscErrorCode DualSweepEngine::sweep(const Problem& problem, const FunctionSpace& space,
                                      const Tape& tape, PetscReal k,
                                      DualSequence* duals) const {
    PetscFunctionBeginUser;

    PetscCheck(adjoint_.isAvailable(), PETSC_COMM_SELF, PETSC_ERR_SUP,
               "Dual sweep requested but adjoint backend '%s' is unavailable",
               adjoint_.name().c_str());

    PetscCall(duals->clear());

    std::vector<PetscInt> converged;
    PetscCall(collectConverged(tape, &converged));

    if (problem.isSteady()) {
        PetscCall(sweepSteady(problem, space, tape, converged.front(), duals));
        PetscFunctionReturn(PETSC_SUCCESS);
    }

    PetscCheck(k > 0.0, PETSC_COMM_SELF, PETSC_ERR_ARG_OUTOFRANGE,
               "Time step %g must be positive", (double)k);

    // Converged steps must run N, N-1, ..., 1
    const PetscInt newest = tape.entry(converged.front()).timestep;
    const PetscInt n = static_cast<PetscInt>(converged.size());
    for (PetscInt j = 0; j < n; j++) {
        PetscCheck(tape.entry(converged[j]).timestep == newest - j, PETSC_COMM_SELF,
                   PETSC_ERR_ARG_WRONGSTATE, "Malformed tape: time step %" PetscInt_FMT
                   " is missing", newest - j);
    }
    PetscCheck(newest - n + 1 == 1, PETSC_COMM_SELF, PETSC_ERR_ARG_WRONGSTATE,
               "Malformed tape: oldest recorded time step is %" PetscInt_FMT ", expected 1",
               newest - n + 1);

    PetscInt initial = -1;
    for (PetscInt i = 0; i < tape.size(); i++) {
        if (tape.entry(i).variable == initialVariable()) {
            initial = i;
            break;
        }
    }
    PetscCheck(initial >= 0, PETSC_COMM_SELF, PETSC_ERR_ARG_WRONGSTATE,
               "Tape holds no initial condition '%s'", initialVariable());

    const PetscReal t0 = problem.timeDomain().t0;

    std::unique_ptr<ThetaResidual> next_form;
    std::vector<DirichletBC> next_bcs;

    Vec w;
    PetscCall(tape.value(converged.front(), &w));

    for (PetscInt j = 0; j < n; j++) {
        const TapeEntry& e = tape.entry(converged[j]);

        Vec w_prev;
        PetscCall(tape.value(j + 1 < n ? converged[j + 1] : initial, &w_prev));

        auto form = std::make_unique<ThetaResidual>(problem, e.time, k, options_.theta);
        std::vector<DirichletBC> bcs;
        PetscCall(currentBoundaryConditions(problem, space, t0, e.time, &bcs));

        AdjointStep step;
        step.form = form.get();
        step.bcs = &bcs;
        step.w = w;
        step.w_prev = w_prev;
        step.t = e.time;
        step.functional_weight = k;
        if (next_form) {
            step.next_form = next_form.get();
            step.next_bcs = &next_bcs;
            step.w_next = duals->back().value;
            step.dual_next = duals->back().dual;
        }

        DualEntry d;
        d.tape_index = converged[j];
        d.timestep = e.timestep;
        d.iteration = e.iteration;
        d.time = e.time;
        d.value = w;
        PetscCall(space.createVector(&d.dual));

        PetscCall(adjoint_.solveAdjointStep(problem, space, step, d.dual));
        duals->push(d);

        if (callback_) PetscCall(callback_(d.time, d.timestep, d.dual));

        next_form = std::move(form);
        next_bcs.swap(bcs);
        w = w_prev;
    }

    // w now holds the initial condition
    PetscCall(VecDestroy(&w));

    PetscCall(PetscInfo(nullptr, "Dual sweep produced %" PetscInt_FMT " duals from %" PetscInt_FMT
                        " tape entries\n", duals->size(), tape.size()));

    PetscFunctionReturn(PETSC_SUCCESS);
}

} // namespace GOAS
