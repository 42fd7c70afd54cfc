/**
 * @file test_checkpoint_planner.cpp
 * @brief Unit tests for the tape checkpoint budget
 */

#include <gtest/gtest.h>
#include <petsc.h>
#include "CheckpointPlanner.hpp"

using namespace GOAS;

TEST(CheckpointPlannerTest, SplitsByFraction) {
    CheckpointBudget budget;
    PetscErrorCode ierr = CheckpointPlanner::plan(10, 0.3, &budget);
    ASSERT_EQ(ierr, 0);

    EXPECT_EQ(budget.steps, 10);
    EXPECT_EQ(budget.snaps_on_secondary_storage, 3);
    EXPECT_EQ(budget.snaps_in_memory, 7);
}

TEST(CheckpointPlannerTest, FloorsTheDiskShare) {
    CheckpointBudget budget;
    ASSERT_EQ(CheckpointPlanner::plan(7, 0.5, &budget), 0);
    EXPECT_EQ(budget.snaps_on_secondary_storage, 3);
    EXPECT_EQ(budget.snaps_in_memory, 4);
}

TEST(CheckpointPlannerTest, BoundaryFractions) {
    CheckpointBudget budget;

    ASSERT_EQ(CheckpointPlanner::plan(12, 0.0, &budget), 0);
    EXPECT_EQ(budget.snaps_on_secondary_storage, 0);
    EXPECT_EQ(budget.snaps_in_memory, 12);

    ASSERT_EQ(CheckpointPlanner::plan(12, 1.0, &budget), 0);
    EXPECT_EQ(budget.snaps_on_secondary_storage, 12);
    EXPECT_EQ(budget.snaps_in_memory, 0);

    ASSERT_EQ(CheckpointPlanner::plan(0, 0.4, &budget), 0);
    EXPECT_EQ(budget.steps, 0);
    EXPECT_EQ(budget.snaps_in_memory + budget.snaps_on_secondary_storage, 0);
}

TEST(CheckpointPlannerTest, BudgetAlwaysCoversAllSteps) {
    for (PetscInt steps = 0; steps < 25; steps += 3) {
        for (PetscReal f : {0.0, 0.1, 0.33, 0.5, 0.99, 1.0}) {
            CheckpointBudget budget;
            ASSERT_EQ(CheckpointPlanner::plan(steps, f, &budget), 0);
            EXPECT_EQ(budget.snaps_in_memory + budget.snaps_on_secondary_storage, steps)
                << "steps=" << steps << " fraction=" << f;
        }
    }
}

TEST(CheckpointPlannerTest, RejectsFractionOutOfRange) {
    CheckpointBudget budget;
    EXPECT_EQ(CheckpointPlanner::plan(10, 1.5, &budget), PETSC_ERR_ARG_OUTOFRANGE);
    EXPECT_EQ(CheckpointPlanner::plan(10, -0.1, &budget), PETSC_ERR_ARG_OUTOFRANGE);
}

TEST(CheckpointPlannerTest, RejectsNegativeSteps) {
    CheckpointBudget budget;
    EXPECT_EQ(CheckpointPlanner::plan(-1, 0.5, &budget), PETSC_ERR_ARG_OUTOFRANGE);
}
