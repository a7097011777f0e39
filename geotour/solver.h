#pragma once

#include "geotour/distance_matrix.h"
#include "geotour/task.h"

#include <string>

namespace geotour {

// Exact or heuristic TSP backend.
class Solver {
  public:
  virtual ~Solver() = default;

  // Returns a visiting order over all locations. The matrix is indexed the same
  // way as the locations.
  virtual Route Solve(const LocationSet& locations, const DistanceMatrix& matrix) = 0;
};

struct ExternalSolverConfig {
  // "{input}" and "{output}" are replaced with the request and response paths.
  std::string command = "concorde -x -o {output} {input}";
  std::string working_directory = ".";
  std::string request_file = "geotour.tsp";
  std::string response_file = "geotour.sol";
  std::string problem_name = "geotour";
  std::string comment = "great-circle tour";
  bool keep_files = false;
};

// Runs a solver executable on a TSPLIB request file and reads back its result
// file. The command runs through the shell and blocks until it exits.
class ExternalSolver : public Solver {
  public:
  explicit ExternalSolver(ExternalSolverConfig config);

  Route Solve(const LocationSet& locations, const DistanceMatrix& matrix) override;

  std::string RequestPath() const;
  std::string ResponsePath() const;
  // Shell command with placeholders substituted and the working directory set.
  std::string CommandLine() const;

  private:
  ExternalSolverConfig config_;
};

}// namespace geotour
