/**
 * @file test_error_indicators.cpp
 * @brief Unit tests for dual-weighted residual indicators
 */

#include <gtest/gtest.h>
#include <petsc.h>
#include "ErrorIndicatorBuilder.hpp"
#include "AdjointBackend.hpp"
#include "NumericalBackend.hpp"
#include "ProblemLibrary.hpp"
#include "ResidualForms.hpp"
#include "Tape.hpp"
#include "TimeStepOrchestrator.hpp"
#include "TestProblems.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

using namespace GOAS;
using namespace GOAS::Testing;

class ErrorIndicatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.theta = 0.5;
        options_.verbosity = 0;
    }

    // Primal pass plus dual sweep on the initial mesh of a problem
    void solveBoth(const Problem& problem, PetscReal k, DualSequence* duals) {
        NumericalBackend backend(options_);
        TapeAdjointBackend adjoint(backend);
        space_ = backend.createFunctionSpace(problem.initialMesh(), 1);

        Tape tape("./test_indicator_tape_");
        tape.startRecording();
        TimeStepOrchestrator stepper(options_, backend);
        stepper.setTape(&tape);
        PrimalResult result;
        ASSERT_EQ(stepper.solve(problem, *space_, k, true, &result), 0);
        VecDestroy(&result.solution);

        DualSweepEngine engine(options_, adjoint);
        ASSERT_EQ(engine.sweep(problem, *space_, tape, k, duals), 0);
    }

    SolverOptions options_;
    std::shared_ptr<FunctionSpace> space_;
};

TEST_F(ErrorIndicatorTest, OneValuePerCell) {
    DiffusionProblem problem(6, 1.0, 0.25);
    DualSequence duals;
    solveBoth(problem, 0.25, &duals);

    NumericalBackend backend(options_);
    ErrorIndicatorBuilder builder(options_, backend);
    Vec ei;
    ASSERT_EQ(builder.build(problem, *space_, duals, 0.25, &ei), 0);

    PetscInt n;
    ASSERT_EQ(VecGetSize(ei, &n), 0);
    EXPECT_EQ(n, 6);

    // Symmetric data on a symmetric mesh gives symmetric indicators
    const PetscScalar* e;
    ASSERT_EQ(VecGetArrayRead(ei, &e), 0);
    for (PetscInt c = 0; c < 3; c++) {
        EXPECT_NEAR(PetscRealPart(e[c]), PetscRealPart(e[5 - c]), 1e-8);
    }
    VecRestoreArrayRead(ei, &e);

    VecDestroy(&ei);
}

TEST_F(ErrorIndicatorTest, AccumulatesConsecutivePairs) {
    DiffusionProblem problem(4, 1.0, 0.25);
    DualSequence duals;
    solveBoth(problem, 0.25, &duals);
    ASSERT_EQ(duals.size(), 4);

    NumericalBackend backend(options_);
    ErrorIndicatorBuilder builder(options_, backend);
    Vec ei;
    ASSERT_EQ(builder.build(problem, *space_, duals, 0.25, &ei), 0);

    // Sum of the N - 1 pair contributions, assembled one at a time
    Vec expected, part;
    ASSERT_EQ(space_->createErrorVector(&expected), 0);
    ASSERT_EQ(space_->createErrorVector(&part), 0);
    for (PetscInt i = 0; i + 1 < duals.size(); i++) {
        ThetaResidual form(problem, duals[i].time, 0.25, options_.theta, true);
        ASSERT_EQ(backend.assembleCellIndicators(form, *space_, duals[i].value,
                                                 duals[i + 1].value, duals[i].dual,
                                                 INSERT_VALUES, part), 0);
        ASSERT_EQ(VecAXPY(expected, 1.0, part), 0);
    }

    ASSERT_EQ(VecAXPY(expected, -1.0, ei), 0);
    PetscReal diff;
    ASSERT_EQ(VecNorm(expected, NORM_INFINITY, &diff), 0);
    EXPECT_LT(diff, 1e-12);

    VecDestroy(&expected);
    VecDestroy(&part);
    VecDestroy(&ei);
}

TEST_F(ErrorIndicatorTest, SingleDualGivesZeroField) {
    DiffusionProblem problem(4, 0.25, 0.25);
    DualSequence duals;
    solveBoth(problem, 0.25, &duals);
    ASSERT_EQ(duals.size(), 1);

    NumericalBackend backend(options_);
    ErrorIndicatorBuilder builder(options_, backend);
    Vec ei;
    ASSERT_EQ(builder.build(problem, *space_, duals, 0.25, &ei), 0);

    PetscReal norm;
    ASSERT_EQ(VecNorm(ei, NORM_1, &norm), 0);
    EXPECT_DOUBLE_EQ(norm, 0.0);
    VecDestroy(&ei);
}

TEST_F(ErrorIndicatorTest, SteadyIndicatorsSumToResidualTimesDual) {
    SteadyLoadProblem problem(8);
    DualSequence duals;
    solveBoth(problem, 0.0, &duals);
    ASSERT_EQ(duals.size(), 1);

    NumericalBackend backend(options_);
    ErrorIndicatorBuilder builder(options_, backend);
    Vec ei;
    ASSERT_EQ(builder.build(problem, *space_, duals, 0.0, &ei), 0);

    PetscInt n;
    ASSERT_EQ(VecGetSize(ei, &n), 0);
    EXPECT_EQ(n, 8);

    std::vector<DirichletBC> bcs;
    ASSERT_EQ(problem.boundaryConditions(*space_, 0.0, &bcs), 0);
    SteadyResidual form(problem, true);

    // Galerkin solution: R(w_h) z_h vanishes and so does the indicator sum
    Vec F;
    ASSERT_EQ(space_->createVector(&F), 0);
    ASSERT_EQ(backend.assembleResidual(form, *space_, bcs, duals[0].value, nullptr, F), 0);
    PetscScalar dot, sum;
    ASSERT_EQ(VecDot(F, duals[0].dual, &dot), 0);
    ASSERT_EQ(VecSum(ei, &sum), 0);
    EXPECT_NEAR(PetscRealPart(sum), PetscRealPart(dot), 1e-12);

    // Away from the discrete solution the sum still equals R(w) z
    Vec w;
    ASSERT_EQ(VecDuplicate(duals[0].value, &w), 0);
    ASSERT_EQ(VecCopy(duals[0].value, w), 0);
    ASSERT_EQ(VecSetValue(w, 3, 0.01, ADD_VALUES), 0);
    ASSERT_EQ(VecAssemblyBegin(w), 0);
    ASSERT_EQ(VecAssemblyEnd(w), 0);

    Vec part;
    ASSERT_EQ(space_->createErrorVector(&part), 0);
    ASSERT_EQ(backend.assembleCellIndicators(form, *space_, w, nullptr, duals[0].dual,
                                             INSERT_VALUES, part), 0);
    ASSERT_EQ(backend.assembleResidual(form, *space_, bcs, w, nullptr, F), 0);
    ASSERT_EQ(VecDot(F, duals[0].dual, &dot), 0);
    ASSERT_EQ(VecSum(part, &sum), 0);
    EXPECT_GT(std::abs(PetscRealPart(dot)), 1e-6);
    EXPECT_NEAR(PetscRealPart(sum), PetscRealPart(dot), 1e-12);

    VecDestroy(&part);
    VecDestroy(&w);
    VecDestroy(&F);
    VecDestroy(&ei);
}

TEST_F(ErrorIndicatorTest, SteadyBuildReplacesField) {
    SteadyLoadProblem problem(8);
    DualSequence duals;
    solveBoth(problem, 0.0, &duals);

    NumericalBackend backend(options_);
    ErrorIndicatorBuilder builder(options_, backend);
    Vec first, second;
    ASSERT_EQ(builder.build(problem, *space_, duals, 0.0, &first), 0);
    ASSERT_EQ(builder.build(problem, *space_, duals, 0.0, &second), 0);

    PetscBool same;
    ASSERT_EQ(VecEqual(first, second, &same), 0);
    EXPECT_TRUE(same);

    // Inserting twice into the same field leaves it unchanged, adding doubles it
    SteadyResidual form(problem, true);
    Vec field;
    ASSERT_EQ(space_->createErrorVector(&field), 0);
    for (int pass = 0; pass < 2; pass++) {
        ASSERT_EQ(backend.assembleCellIndicators(form, *space_, duals[0].value, nullptr,
                                                 duals[0].dual, INSERT_VALUES, field), 0);
    }
    ASSERT_EQ(VecEqual(first, field, &same), 0);
    EXPECT_TRUE(same);

    ASSERT_EQ(backend.assembleCellIndicators(form, *space_, duals[0].value, nullptr,
                                             duals[0].dual, ADD_VALUES, field), 0);
    ASSERT_EQ(VecAXPY(field, -2.0, first), 0);
    PetscReal diff;
    ASSERT_EQ(VecNorm(field, NORM_INFINITY, &diff), 0);
    EXPECT_LT(diff, 1e-15);

    VecDestroy(&field);
    VecDestroy(&second);
    VecDestroy(&first);
}

TEST_F(ErrorIndicatorTest, BoundaryCellsSeeOnlyInteriorDofs) {
    ProblemParameters params;
    params.name = "poisson";
    params.nx = 16;
    PoissonProblem problem(params);
    DualSequence duals;
    solveBoth(problem, 0.0, &duals);
    ASSERT_EQ(duals.size(), 1);

    NumericalBackend backend(options_);
    ErrorIndicatorBuilder builder(options_, backend);
    Vec ei;
    ASSERT_EQ(builder.build(problem, *space_, duals, 0.0, &ei), 0);

    const PetscReal h = 1.0 / 16.0;
    const PetscScalar *e, *u, *z;
    ASSERT_EQ(VecGetArrayRead(ei, &e), 0);
    ASSERT_EQ(VecGetArrayRead(duals[0].value, &u), 0);
    ASSERT_EQ(VecGetArrayRead(duals[0].dual, &z), 0);

    // The Dirichlet dof of a boundary cell carries a zero dual weight
    const PetscReal du_left = PetscRealPart(u[1] - u[0]) / h;
    const PetscReal du_right = PetscRealPart(u[16] - u[15]) / h;
    EXPECT_NEAR(PetscRealPart(e[0]), (du_left - 0.5 * h) * PetscRealPart(z[1]), 1e-12);
    EXPECT_NEAR(PetscRealPart(e[15]), (-du_right - 0.5 * h) * PetscRealPart(z[15]), 1e-12);

    // Boundary cells stay on the scale of the interior ones
    PetscReal interior_max = 0.0;
    for (PetscInt c = 1; c < 15; c++) {
        interior_max = std::max(interior_max, std::abs(PetscRealPart(e[c])));
    }
    EXPECT_GT(interior_max, 0.0);
    EXPECT_LT(std::abs(PetscRealPart(e[0])), 2.0 * interior_max);
    EXPECT_LT(std::abs(PetscRealPart(e[15])), 2.0 * interior_max);

    VecRestoreArrayRead(duals[0].dual, &z);
    VecRestoreArrayRead(duals[0].value, &u);
    VecRestoreArrayRead(ei, &e);
    VecDestroy(&ei);
}

TEST_F(ErrorIndicatorTest, EmptySequenceIsWrongState) {
    DiffusionProblem problem(4);
    NumericalBackend backend(options_);
    auto space = backend.createFunctionSpace(problem.initialMesh(), 1);

    ErrorIndicatorBuilder builder(options_, backend);
    DualSequence duals;
    Vec ei = nullptr;
    EXPECT_EQ(builder.build(problem, *space, duals, 0.25, &ei), PETSC_ERR_ARG_WRONGSTATE);
}
