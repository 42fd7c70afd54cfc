/**
 * @file test_time_step_orchestrator.cpp
 * @brief Unit tests for theta-method primal time stepping
 */

#include <gtest/gtest.h>
#include <petsc.h>
#include "TimeStepOrchestrator.hpp"
#include "NumericalBackend.hpp"
#include "Tape.hpp"
#include "TestProblems.hpp"

#include <cmath>

using namespace GOAS;
using namespace GOAS::Testing;

TEST(TimeStepAdjustTest, KeepsDividingStep) {
    PetscReal k;
    ASSERT_EQ(TimeStepOrchestrator::adjustTimeStep(0.0, 1.0, 0.25, &k), 0);
    EXPECT_DOUBLE_EQ(k, 0.25);

    ASSERT_EQ(TimeStepOrchestrator::adjustTimeStep(0.0, 1.0, 1.0, &k), 0);
    EXPECT_DOUBLE_EQ(k, 1.0);
}

TEST(TimeStepAdjustTest, ShrinksToDivideInterval) {
    PetscReal k;
    ASSERT_EQ(TimeStepOrchestrator::adjustTimeStep(0.0, 1.0, 0.3, &k), 0);
    EXPECT_DOUBLE_EQ(k, 0.25);

    ASSERT_EQ(TimeStepOrchestrator::adjustTimeStep(1.0, 3.0, 0.7, &k), 0);
    EXPECT_NEAR(k, 2.0 / 3.0, 1e-14);

    // A step longer than the interval becomes the whole interval
    ASSERT_EQ(TimeStepOrchestrator::adjustTimeStep(0.0, 0.5, 2.0, &k), 0);
    EXPECT_DOUBLE_EQ(k, 0.5);
}

TEST(TimeStepAdjustTest, RejectsBadInterval) {
    PetscReal k;
    EXPECT_EQ(TimeStepOrchestrator::adjustTimeStep(1.0, 1.0, 0.1, &k), PETSC_ERR_ARG_OUTOFRANGE);
    EXPECT_EQ(TimeStepOrchestrator::adjustTimeStep(0.0, 1.0, 0.0, &k), PETSC_ERR_ARG_OUTOFRANGE);
}

TEST(TimeStepAdjustTest, CountSteps) {
    EXPECT_EQ(TimeStepOrchestrator::countSteps(0.0, 1.0, 0.25), 4);
    EXPECT_EQ(TimeStepOrchestrator::countSteps(0.0, 1.0, 0.1), 10);
    EXPECT_EQ(TimeStepOrchestrator::countSteps(0.0, 1.0, 1.0), 1);
}

class TimeStepOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.theta = 0.5;
        options_.verbosity = 0;
    }

    SolverOptions options_;
};

TEST_F(TimeStepOrchestratorTest, AdvancesToEndTime) {
    DiffusionProblem problem(8, 1.0, 0.25);
    NumericalBackend backend(options_);
    auto space = backend.createFunctionSpace(problem.initialMesh(), 1);

    TimeStepOrchestrator stepper(options_, backend);
    PrimalResult result;
    PetscErrorCode ierr = stepper.solve(problem, *space, 0.25, true, &result);
    ASSERT_EQ(ierr, 0);

    EXPECT_EQ(result.steps, 4);
    EXPECT_DOUBLE_EQ(result.k, 0.25);
    EXPECT_TRUE(result.has_functional);
    ASSERT_NE(result.solution, nullptr);

    // Diffusion decays the initial bump but keeps it positive
    PetscReal max;
    ASSERT_EQ(VecMax(result.solution, nullptr, &max), 0);
    EXPECT_GT(max, 0.0);
    EXPECT_LT(max, 0.25);
    EXPECT_GT(result.functional, 0.0);

    VecDestroy(&result.solution);
}

TEST_F(TimeStepOrchestratorTest, RecordsInitialAndEveryStep) {
    DiffusionProblem problem(8, 1.0, 0.25);
    NumericalBackend backend(options_);
    auto space = backend.createFunctionSpace(problem.initialMesh(), 1);

    Tape tape("./test_stepper_tape_");
    tape.startRecording();

    TimeStepOrchestrator stepper(options_, backend);
    stepper.setTape(&tape);
    PrimalResult result;
    ASSERT_EQ(stepper.solve(problem, *space, 0.25, true, &result), 0);

    ASSERT_EQ(tape.size(), 5);
    EXPECT_EQ(tape.entry(0).variable, "w_initial");
    EXPECT_EQ(tape.entry(0).timestep, 0);
    for (PetscInt n = 1; n <= 4; n++) {
        EXPECT_EQ(tape.entry(n).variable, "w");
        EXPECT_EQ(tape.entry(n).timestep, n);
        EXPECT_EQ(tape.entry(n).iteration, 0);
        EXPECT_NEAR(tape.entry(n).time, 0.25 * n, 1e-14);
    }

    VecDestroy(&result.solution);
}

TEST_F(TimeStepOrchestratorTest, RecordsNewtonIterates) {
    options_.tape_nonlinear_iterates = true;
    DiffusionProblem problem(8, 0.5, 0.25);
    NumericalBackend backend(options_);
    auto space = backend.createFunctionSpace(problem.initialMesh(), 1);

    Tape tape("./test_stepper_iterates_");
    tape.startRecording();

    TimeStepOrchestrator stepper(options_, backend);
    stepper.setTape(&tape);
    PrimalResult result;
    ASSERT_EQ(stepper.solve(problem, *space, 0.25, true, &result), 0);

    // The converged value of each step is its last entry
    PetscInt last_of_step2 = -1;
    for (PetscInt i = 0; i < tape.size(); i++) {
        if (tape.entry(i).variable == "w" && tape.entry(i).timestep == 2) last_of_step2 = i;
    }
    ASSERT_EQ(last_of_step2, tape.size() - 1);
    EXPECT_GE(tape.entry(last_of_step2).iteration, 1);

    VecDestroy(&result.solution);
}

TEST_F(TimeStepOrchestratorTest, FunctionalAccumulatesOverSteps) {
    // Single step of length T: m = k J(w0) + k J(w1)
    DiffusionProblem problem(8, 0.1, 0.1);
    NumericalBackend backend(options_);
    auto space = backend.createFunctionSpace(problem.initialMesh(), 1);

    TimeStepOrchestrator stepper(options_, backend);
    PrimalResult result;
    ASSERT_EQ(stepper.solve(problem, *space, 0.1, true, &result), 0);

    Vec w0;
    ASSERT_EQ(space->createVector(&w0), 0);
    ASSERT_EQ(problem.initialConditions(*space, w0), 0);
    PetscReal J0, J1;
    ASSERT_EQ(backend.assembleFunctional(problem, *space, 0.0, w0, &J0), 0);
    ASSERT_EQ(backend.assembleFunctional(problem, *space, 0.1, result.solution, &J1), 0);

    EXPECT_NEAR(result.functional, 0.1 * (J0 + J1), 1e-12);

    VecDestroy(&w0);
    VecDestroy(&result.solution);
}

TEST_F(TimeStepOrchestratorTest, HooksSeeEveryStep) {
    DiffusionProblem problem(4, 1.0, 0.25);
    NumericalBackend backend(options_);
    auto space = backend.createFunctionSpace(problem.initialMesh(), 1);

    std::vector<PetscReal> pre_times;
    PetscInt post_calls = 0;

    TimeStepOrchestrator stepper(options_, backend);
    stepper.setPreStepHook([&](const Problem&, PetscReal t, PetscReal k, const FunctionSpace&,
                               Vec, Vec) -> PetscErrorCode {
        PetscFunctionBeginUser;
        EXPECT_DOUBLE_EQ(k, 0.25);
        pre_times.push_back(t);
        PetscFunctionReturn(PETSC_SUCCESS);
    });
    stepper.setPostStepHook([&](const Problem&, PetscReal, PetscReal, const FunctionSpace&,
                                Vec, Vec) -> PetscErrorCode {
        PetscFunctionBeginUser;
        post_calls++;
        PetscFunctionReturn(PETSC_SUCCESS);
    });

    PrimalResult result;
    ASSERT_EQ(stepper.solve(problem, *space, 0.25, false, &result), 0);

    ASSERT_EQ(pre_times.size(), 4u);
    EXPECT_EQ(post_calls, 4);
    EXPECT_NEAR(pre_times.front(), 0.25, 1e-14);
    EXPECT_NEAR(pre_times.back(), 1.0, 1e-14);
    EXPECT_FALSE(result.has_functional);

    VecDestroy(&result.solution);
}

TEST_F(TimeStepOrchestratorTest, FailingHookAbortsSolve) {
    DiffusionProblem problem(4, 1.0, 0.25);
    NumericalBackend backend(options_);
    auto space = backend.createFunctionSpace(problem.initialMesh(), 1);

    TimeStepOrchestrator stepper(options_, backend);
    stepper.setPreStepHook([](const Problem&, PetscReal, PetscReal, const FunctionSpace&,
                              Vec, Vec) -> PetscErrorCode {
        PetscFunctionBeginUser;
        SETERRQ(PETSC_COMM_SELF, PETSC_ERR_USER, "hook failure");
    });

    PrimalResult result;
    EXPECT_EQ(stepper.solve(problem, *space, 0.25, false, &result), PETSC_ERR_USER);
    VecDestroy(&result.solution);
}

TEST_F(TimeStepOrchestratorTest, UpdatesBoundaryConditions) {
    RampBoundaryProblem problem(4, 1.0, 0.25);
    NumericalBackend backend(options_);
    auto space = backend.createFunctionSpace(problem.initialMesh(), 1);

    TimeStepOrchestrator stepper(options_, backend);
    PrimalResult result;
    ASSERT_EQ(stepper.solve(problem, *space, 0.25, false, &result), 0);

    EXPECT_GE(problem.updateCalls(), 4);

    // u(1, T) = T
    const PetscScalar* u;
    ASSERT_EQ(VecGetArrayRead(result.solution, &u), 0);
    EXPECT_NEAR(PetscRealPart(u[4]), 1.0, 1e-12);
    EXPECT_NEAR(PetscRealPart(u[0]), 0.0, 1e-12);
    VecRestoreArrayRead(result.solution, &u);

    VecDestroy(&result.solution);
}

TEST_F(TimeStepOrchestratorTest, SteadySolveRecordsSingleEntry) {
    SteadyLoadProblem problem(16);
    NumericalBackend backend(options_);
    auto space = backend.createFunctionSpace(problem.initialMesh(), 1);

    Tape tape("./test_stepper_steady_");
    tape.startRecording();

    TimeStepOrchestrator stepper(options_, backend);
    stepper.setTape(&tape);
    PrimalResult result;
    ASSERT_EQ(stepper.solve(problem, *space, 0.0, true, &result), 0);

    EXPECT_EQ(result.steps, 0);
    ASSERT_EQ(tape.size(), 1);
    EXPECT_EQ(tape.entry(0).variable, "w");
    EXPECT_EQ(tape.entry(0).timestep, 0);

    // Nodally exact: u(1/2) = 1/8, J = 1/12
    const PetscScalar* u;
    ASSERT_EQ(VecGetArrayRead(result.solution, &u), 0);
    EXPECT_NEAR(PetscRealPart(u[8]), 0.125, 1e-10);
    VecRestoreArrayRead(result.solution, &u);
    EXPECT_NEAR(result.functional, 1.0 / 12.0, 1e-3);

    VecDestroy(&result.solution);
}

TEST_F(TimeStepOrchestratorTest, RejectsIncompleteProblem) {
    IncompleteProblem problem;
    NumericalBackend backend(options_);
    auto space = backend.createFunctionSpace(problem.initialMesh(), 1);

    TimeStepOrchestrator stepper(options_, backend);
    PrimalResult result;
    EXPECT_EQ(stepper.solve(problem, *space, 0.25, false, &result), PETSC_ERR_USER);
}
