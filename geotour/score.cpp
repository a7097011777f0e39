#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "geotour/distance_matrix.h"
#include "geotour/protocol.h"
#include "geotour/report.h"
#include "geotour/task.h"
#include "glog/logging.h"

#include <exception>
#include <iostream>
#include <string>

ABSL_FLAG(std::string, input, {}, "Locations file");
ABSL_FLAG(std::string, route, {}, "Solver result file");
ABSL_FLAG(double, radius, geotour::kEarthRadiusKm, "Earth radius in kilometers");

int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);
  google::InitGoogleLogging(argv[0]);
  std::string input = absl::GetFlag(FLAGS_input);
  std::string route_file = absl::GetFlag(FLAGS_route);

  try {
    geotour::LocationSet locations = geotour::LocationsFromFile(input);
    geotour::Route route = geotour::RouteFromFile(route_file, locations.size());
    geotour::DistanceMatrix miles =
            geotour::ToMiles(geotour::BuildDistanceMatrix(locations, absl::GetFlag(FLAGS_radius)));

    std::cout << geotour::FormatRouteReport(geotour::RouteLegs(miles, locations, route), "mi");
    std::cerr << "score = " << geotour::RouteLength(miles, route) << std::endl;
  } catch (const std::exception& error) {
    LOG(ERROR) << error.what();
    return 1;
  }
  return 0;
}
