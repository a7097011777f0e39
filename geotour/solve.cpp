#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "geotour/distance_matrix.h"
#include "geotour/protocol.h"
#include "geotour/report.h"
#include "geotour/solver.h"
#include "geotour/task.h"
#include "glog/logging.h"

#include <exception>
#include <iostream>
#include <string>

ABSL_FLAG(std::string, input, {}, "Locations file");
ABSL_FLAG(std::string, output, {}, "Output file for the route");
ABSL_FLAG(std::string, solver_command, geotour::ExternalSolverConfig{}.command,
          "Solver command; {input} and {output} are replaced with file names");
ABSL_FLAG(std::string, solver_workdir, ".", "Directory the solver runs in");
ABSL_FLAG(std::string, name, "geotour", "Problem name in the request file");
ABSL_FLAG(std::string, comment, "great-circle tour", "Comment in the request file");
ABSL_FLAG(bool, keep_files, false, "Keep the solver request and response files");
ABSL_FLAG(double, radius, geotour::kEarthRadiusKm, "Earth radius in kilometers");

int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);
  google::InitGoogleLogging(argv[0]);
  std::string input = absl::GetFlag(FLAGS_input);
  std::string output = absl::GetFlag(FLAGS_output);

  geotour::ExternalSolverConfig config;
  config.command = absl::GetFlag(FLAGS_solver_command);
  config.working_directory = absl::GetFlag(FLAGS_solver_workdir);
  config.problem_name = absl::GetFlag(FLAGS_name);
  config.comment = absl::GetFlag(FLAGS_comment);
  config.keep_files = absl::GetFlag(FLAGS_keep_files);

  try {
    geotour::LocationSet locations = geotour::LocationsFromFile(input);
    LOG(INFO) << "Loaded " << locations.size() << " locations from " << input;
    geotour::DistanceMatrix matrix =
            geotour::BuildDistanceMatrix(locations, absl::GetFlag(FLAGS_radius));

    geotour::ExternalSolver solver(config);
    geotour::Route route = solver.Solve(locations, matrix);

    geotour::DistanceMatrix miles = geotour::ToMiles(matrix);
    std::cout << geotour::FormatRouteReport(geotour::RouteLegs(miles, locations, route), "mi");
    std::cerr << "score = " << geotour::RouteLength(miles, route) << std::endl;
    if (!output.empty()) {
      geotour::RouteToFile(route, output);
    }
  } catch (const std::exception& error) {
    LOG(ERROR) << error.what();
    return 1;
  }
  return 0;
}
