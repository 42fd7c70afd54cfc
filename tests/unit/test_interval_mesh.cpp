/**
 * @file test_interval_mesh.cpp
 * @brief Unit tests for IntervalMesh and FunctionSpace
 */

#include <gtest/gtest.h>
#include <petsc.h>
#include "IntervalMesh.hpp"
#include "FunctionSpace.hpp"

#include <stdexcept>

using namespace GOAS;

TEST(IntervalMeshTest, UniformConstruction) {
    IntervalMesh mesh(-1.0, 1.0, 4);

    EXPECT_EQ(mesh.numCells(), 4);
    EXPECT_EQ(mesh.numVertices(), 5);
    EXPECT_EQ(mesh.dimension(), 1);
    EXPECT_DOUBLE_EQ(mesh.lower(), -1.0);
    EXPECT_DOUBLE_EQ(mesh.upper(), 1.0);
    EXPECT_DOUBLE_EQ(mesh.minCellSize(), 0.5);
    EXPECT_DOUBLE_EQ(mesh.maxCellSize(), 0.5);
    EXPECT_EQ(mesh.maxLevel(), 0);

    CellGeometry c = mesh.cell(2);
    EXPECT_EQ(c.index, 2);
    EXPECT_DOUBLE_EQ(c.x0, 0.0);
    EXPECT_DOUBLE_EQ(c.x1, 0.5);
    EXPECT_DOUBLE_EQ(c.h, 0.5);
}

TEST(IntervalMeshTest, RejectsInvalidInput) {
    EXPECT_THROW(IntervalMesh(0.0, 1.0, 0), std::invalid_argument);
    EXPECT_THROW(IntervalMesh(1.0, 0.0, 4), std::invalid_argument);
    EXPECT_THROW(IntervalMesh(std::vector<PetscReal>{0.0}), std::invalid_argument);
    EXPECT_THROW(IntervalMesh(std::vector<PetscReal>{0.0, 0.5, 0.5}), std::invalid_argument);
    EXPECT_THROW(IntervalMesh(std::vector<PetscReal>{0.0, 1.0}, {0, 1}), std::invalid_argument);
}

TEST(IntervalMeshTest, BisectMarkedCells) {
    IntervalMesh mesh(0.0, 1.0, 4);
    IntervalMesh fine = mesh.bisect({false, true, false, true});

    ASSERT_EQ(fine.numCells(), 6);
    EXPECT_DOUBLE_EQ(fine.vertex(2), 0.375);
    EXPECT_DOUBLE_EQ(fine.vertex(6), 1.0);
    EXPECT_EQ(fine.level(0), 0);
    EXPECT_EQ(fine.level(1), 1);
    EXPECT_EQ(fine.level(2), 1);
    EXPECT_EQ(fine.level(3), 0);
    EXPECT_EQ(fine.maxLevel(), 1);
    EXPECT_DOUBLE_EQ(fine.minCellSize(), 0.125);

    // Refining again raises the level
    std::vector<bool> split(fine.numCells(), false);
    split[1] = true;
    IntervalMesh finer = fine.bisect(split);
    EXPECT_EQ(finer.maxLevel(), 2);
    EXPECT_EQ(finer.numCells(), 7);
}

TEST(IntervalMeshTest, BisectNeedsOneFlagPerCell) {
    IntervalMesh mesh(0.0, 1.0, 4);
    EXPECT_THROW(mesh.bisect({true}), std::invalid_argument);
}

TEST(IntervalMeshTest, FindCell) {
    IntervalMesh mesh(std::vector<PetscReal>{0.0, 0.1, 0.5, 1.0});
    EXPECT_EQ(mesh.findCell(-1.0), 0);
    EXPECT_EQ(mesh.findCell(0.05), 0);
    EXPECT_EQ(mesh.findCell(0.3), 1);
    EXPECT_EQ(mesh.findCell(0.7), 2);
    EXPECT_EQ(mesh.findCell(1.0), 2);
}

class FunctionSpaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        mesh_ = std::make_shared<const IntervalMesh>(0.0, 1.0, 4);
    }

    std::shared_ptr<const IntervalMesh> mesh_;
};

TEST_F(FunctionSpaceTest, InterleavedDofs) {
    FunctionSpace space(mesh_, 2);

    EXPECT_EQ(space.numDofs(), 10);
    EXPECT_EQ(space.numCellDofs(), 4);
    EXPECT_EQ(space.dof(3, 1), 7);

    PetscInt dofs[4];
    space.cellDofs(1, dofs);
    EXPECT_EQ(dofs[0], 2);
    EXPECT_EQ(dofs[1], 3);
    EXPECT_EQ(dofs[2], 4);
    EXPECT_EQ(dofs[3], 5);
}

TEST_F(FunctionSpaceTest, InterpolateAndGather) {
    FunctionSpace space(mesh_, 1);
    Vec v;
    ASSERT_EQ(space.createVector(&v), 0);
    ASSERT_EQ(space.interpolate([](PetscReal x, PetscScalar* u) { u[0] = 2.0 * x; }, v), 0);

    const PetscScalar* a;
    ASSERT_EQ(VecGetArrayRead(v, &a), 0);
    PetscScalar local[2];
    space.gather(2, a, local);
    EXPECT_DOUBLE_EQ(PetscRealPart(local[0]), 1.0);
    EXPECT_DOUBLE_EQ(PetscRealPart(local[1]), 1.5);
    VecRestoreArrayRead(v, &a);

    VecDestroy(&v);
}

TEST_F(FunctionSpaceTest, ErrorSpaceHasOneDofPerCell) {
    FunctionSpace space(mesh_, 3);
    Vec ei;
    ASSERT_EQ(space.createErrorVector(&ei), 0);

    PetscInt n;
    ASSERT_EQ(VecGetSize(ei, &n), 0);
    EXPECT_EQ(n, 4);

    PetscReal norm;
    ASSERT_EQ(VecNorm(ei, NORM_1, &norm), 0);
    EXPECT_DOUBLE_EQ(norm, 0.0);

    VecDestroy(&ei);
}
