#include "geotour/distance_matrix.h"
#include "geotour/errors.h"
#include "geotour/solver.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

namespace geotour {
namespace {

LocationSet FourLocations() {
  return LocationSet({{"auburn", {32.627837, -85.445105}},
                      {"montgomery", {31.855989, -86.635765}},
                      {"birmingham", {33.5186, -86.8104}},
                      {"mobile", {30.6954, -88.0399}}});
}

class ExternalSolverTest : public ::testing::Test {
  protected:
  void SetUp() override {
    workdir_ = std::filesystem::path(::testing::TempDir()) /
               ::testing::UnitTest::GetInstance()->current_test_info()->name();
    std::filesystem::remove_all(workdir_);
    config_.working_directory = workdir_.string();
  }

  void TearDown() override {
    std::filesystem::remove_all(workdir_);
  }

  std::filesystem::path workdir_;
  ExternalSolverConfig config_;
};

TEST_F(ExternalSolverTest, CommandLineSubstitutesPlaceholders) {
  config_.command = "solver -o {output} {input}";
  config_.request_file = "in.tsp";
  config_.response_file = "out.sol";
  ExternalSolver solver(config_);
  EXPECT_EQ(solver.CommandLine(),
            "cd '" + workdir_.string() + "' && solver -o 'out.sol' 'in.tsp'");
  EXPECT_EQ(solver.RequestPath(), (workdir_ / "in.tsp").string());
  EXPECT_EQ(solver.ResponsePath(), (workdir_ / "out.sol").string());
}

TEST_F(ExternalSolverTest, ReadsRouteFromStubSolver) {
  config_.command = "test -s {input} && printf '4\\n3 1 0 2\\n' > {output}";
  LocationSet locations = FourLocations();
  ExternalSolver solver(config_);
  Route route = solver.Solve(locations, BuildDistanceMatrix(locations));
  EXPECT_EQ(route, (Route{3, 1, 0, 2}));
  EXPECT_FALSE(std::filesystem::exists(solver.RequestPath()));
  EXPECT_FALSE(std::filesystem::exists(solver.ResponsePath()));
}

TEST_F(ExternalSolverTest, KeepsFilesOnRequest) {
  config_.command = "printf '4\\n0 1 2 3\\n' > {output}";
  config_.keep_files = true;
  LocationSet locations = FourLocations();
  ExternalSolver solver(config_);
  solver.Solve(locations, BuildDistanceMatrix(locations));

  ASSERT_TRUE(std::filesystem::exists(solver.RequestPath()));
  std::ifstream request(solver.RequestPath());
  std::stringstream contents;
  contents << request.rdbuf();
  EXPECT_NE(contents.str().find("DIMENSION: 4\n"), std::string::npos);
  EXPECT_NE(contents.str().find("3 30.695400 -88.039900\n"), std::string::npos);
  EXPECT_TRUE(std::filesystem::exists(solver.ResponsePath()));
}

TEST_F(ExternalSolverTest, NonZeroExitIsSolverFailure) {
  config_.command = "exit 3";
  LocationSet locations = FourLocations();
  ExternalSolver solver(config_);
  EXPECT_THROW(solver.Solve(locations, BuildDistanceMatrix(locations)), SolverFailure);
}

TEST_F(ExternalSolverTest, FailureReportsExitCode) {
  config_.command = "exit 3";
  LocationSet locations = FourLocations();
  ExternalSolver solver(config_);
  try {
    solver.Solve(locations, BuildDistanceMatrix(locations));
    FAIL() << "expected SolverFailure";
  } catch (const SolverFailure& error) {
    EXPECT_NE(std::string(error.what()).find("exit status 3"), std::string::npos) << error.what();
  }
}

TEST_F(ExternalSolverTest, UncreatableWorkdirIsSolverFailure) {
  std::filesystem::create_directories(workdir_);
  std::ofstream(workdir_ / "plain_file") << "x";
  config_.working_directory = (workdir_ / "plain_file" / "sub").string();
  config_.command = "printf '4\\n0 1 2 3\\n' > {output}";
  LocationSet locations = FourLocations();
  ExternalSolver solver(config_);
  EXPECT_THROW(solver.Solve(locations, BuildDistanceMatrix(locations)), SolverFailure);
}

TEST_F(ExternalSolverTest, FailedSolveRemovesFiles) {
  config_.command = "printf '4\\n0 1 1 3\\n' > {output}";
  LocationSet locations = FourLocations();
  ExternalSolver solver(config_);
  EXPECT_THROW(solver.Solve(locations, BuildDistanceMatrix(locations)), SolverOutputMismatch);
  EXPECT_FALSE(std::filesystem::exists(solver.RequestPath()));
  EXPECT_FALSE(std::filesystem::exists(solver.ResponsePath()));
}

TEST_F(ExternalSolverTest, FailedSolveKeepsFilesOnRequest) {
  config_.command = "exit 1";
  config_.keep_files = true;
  LocationSet locations = FourLocations();
  ExternalSolver solver(config_);
  EXPECT_THROW(solver.Solve(locations, BuildDistanceMatrix(locations)), SolverFailure);
  EXPECT_TRUE(std::filesystem::exists(solver.RequestPath()));
}

TEST_F(ExternalSolverTest, MissingResponseIsSolverFailure) {
  config_.command = "true";
  LocationSet locations = FourLocations();
  ExternalSolver solver(config_);
  EXPECT_THROW(solver.Solve(locations, BuildDistanceMatrix(locations)), SolverFailure);
}

TEST_F(ExternalSolverTest, IncompleteRouteIsMismatch) {
  config_.command = "printf '4\\n0 1 1 3\\n' > {output}";
  LocationSet locations = FourLocations();
  ExternalSolver solver(config_);
  EXPECT_THROW(solver.Solve(locations, BuildDistanceMatrix(locations)), SolverOutputMismatch);
}

TEST_F(ExternalSolverTest, WrongCountIsMismatch) {
  config_.command = "printf '3\\n0 1 2\\n' > {output}";
  LocationSet locations = FourLocations();
  ExternalSolver solver(config_);
  EXPECT_THROW(solver.Solve(locations, BuildDistanceMatrix(locations)), SolverOutputMismatch);
}

TEST_F(ExternalSolverTest, MatrixMustMatchLocations) {
  LocationSet locations = FourLocations();
  LocationSet fewer({{"a", {0.0, 0.0}}, {"b", {1.0, 1.0}}});
  ExternalSolver solver(config_);
  EXPECT_THROW(solver.Solve(locations, BuildDistanceMatrix(fewer)), SolverOutputMismatch);
  EXPECT_THROW(solver.Solve(LocationSet(), BuildDistanceMatrix(fewer)), EmptyInput);
}

}// namespace
}// namespace geotour
