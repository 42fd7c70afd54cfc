/**
 * @file test_output_writer.cpp
 * @brief Unit tests for output naming and gnuplot files
 */

#include <gtest/gtest.h>
#include <petsc.h>
#include "OutputWriter.hpp"
#include "ProblemLibrary.hpp"
#include "TestProblems.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace GOAS;
using namespace GOAS::Testing;

class OutputWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        folder_ = "test_output_writer_dir/";
        std::filesystem::remove_all(folder_);
        options_.folder = folder_;
        options_.save_solution = true;
        options_.save_frequency = 2;

        params_.name = "heat";
        params_.nx = 4;
        params_.time.T = 1.0;
        params_.time.k = 0.25;
    }

    void TearDown() override {
        std::filesystem::remove_all(folder_);
    }

    std::string readFile(const std::string& path) {
        std::ifstream in(path);
        std::stringstream s;
        s << in.rdbuf();
        return s.str();
    }

    std::string folder_;
    SolverOptions options_;
    ProblemParameters params_;
};

TEST_F(OutputWriterTest, BaseNameCarriesRunParameters) {
    HeatProblem problem(params_);
    OutputWriter writer(options_, problem);
    EXPECT_EQ(writer.baseName(), folder_ + "ThetaHeat1DT1Nx4K0.25");

    PoissonProblem steady(params_);
    OutputWriter steady_writer(options_, steady);
    EXPECT_EQ(steady_writer.baseName(), folder_ + "ThetaPoisson1DNx4");
}

TEST_F(OutputWriterTest, FileSuffixes) {
    HeatProblem problem(params_);
    OutputWriter writer(options_, problem);
    const std::string base = writer.baseName();

    writer.setNaming(3, false);
    EXPECT_EQ(writer.solutionFile(), base + "_u03.dat");
    EXPECT_EQ(writer.dualFile(), base + "_uDual03.dat");
    EXPECT_EQ(writer.meshFile(), base + "_mesh03.dat");

    writer.setNaming(-1, false);
    EXPECT_EQ(writer.solutionFile(), base + "_u.dat");
    EXPECT_EQ(writer.meshFile(), base + "_mesh.dat");

    writer.setNaming(-1, true);
    EXPECT_EQ(writer.solutionFile(), base + "_uOpt.dat");
    EXPECT_EQ(writer.indicatorFile(), base + "_ei.dat");
}

TEST_F(OutputWriterTest, SaveFrequency) {
    HeatProblem problem(params_);
    OutputWriter writer(options_, problem);

    EXPECT_TRUE(writer.shouldSave(0));
    EXPECT_TRUE(writer.shouldSave(1));
    EXPECT_FALSE(writer.shouldSave(2));
    EXPECT_TRUE(writer.shouldSave(3));
    EXPECT_FALSE(writer.shouldSave(4));

    options_.save_frequency = 0;
    OutputWriter never(options_, problem);
    EXPECT_FALSE(never.shouldSave(0));

    options_.save_frequency = 1;
    options_.save_solution = false;
    OutputWriter disabled(options_, problem);
    EXPECT_FALSE(disabled.shouldSave(0));
}

TEST_F(OutputWriterTest, SeriesAppendIndexBlocks) {
    DiffusionProblem problem(4);
    OutputWriter writer(options_, problem);
    ASSERT_EQ(writer.prepareFolder(), 0);
    EXPECT_TRUE(std::filesystem::is_directory(folder_));

    FunctionSpace space(problem.initialMesh(), 1);
    Vec w;
    ASSERT_EQ(space.createVector(&w), 0);
    ASSERT_EQ(VecSet(w, 1.5), 0);

    writer.setNaming(0, false);
    ASSERT_EQ(writer.writeState(space, w, 0.0, 0, false), 0);
    ASSERT_EQ(writer.writeState(space, w, 0.25, 1, false), 0);
    ASSERT_EQ(writer.writeMesh(*problem.initialMesh()), 0);

    const std::string series = readFile(writer.solutionFile());
    EXPECT_NE(series.find("# primal t = 0 timestep = 0"), std::string::npos);
    EXPECT_NE(series.find("\n\n\n# primal t = 0.25 timestep = 1"), std::string::npos);
    EXPECT_NE(readFile(writer.meshFile()).find("# 4 cells"), std::string::npos);

    // A second writer of the same run starts the series afresh
    OutputWriter again(options_, problem);
    again.setNaming(0, false);
    ASSERT_EQ(again.writeState(space, w, 0.5, 2, false), 0);
    EXPECT_EQ(readFile(again.solutionFile()).find("timestep = 0"), std::string::npos);

    VecDestroy(&w);
}

TEST_F(OutputWriterTest, IndicatorFileHoldsEveryIteration) {
    DiffusionProblem problem(4);
    OutputWriter writer(options_, problem);
    ASSERT_EQ(writer.prepareFolder(), 0);

    Vec ei;
    ASSERT_EQ(VecCreateSeq(PETSC_COMM_SELF, 4, &ei), 0);
    ASSERT_EQ(VecSet(ei, 0.1), 0);
    ASSERT_EQ(writer.writeIndicators(*problem.initialMesh(), ei, 0), 0);
    ASSERT_EQ(writer.writeIndicators(*problem.initialMesh(), ei, 1), 0);

    const std::string content = readFile(writer.indicatorFile());
    EXPECT_NE(content.find("# iteration 0"), std::string::npos);
    EXPECT_NE(content.find("# iteration 1"), std::string::npos);

    VecDestroy(&ei);
}

TEST_F(OutputWriterTest, UnwritableFolder) {
    options_.folder = "/proc/goas_no_such_dir/";
    DiffusionProblem problem(4);
    OutputWriter writer(options_, problem);
    writer.setNaming(-1, false);
    EXPECT_EQ(writer.writeMesh(*problem.initialMesh()), PETSC_ERR_FILE_OPEN);
}
