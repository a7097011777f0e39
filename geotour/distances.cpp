#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "geotour/distance_matrix.h"
#include "geotour/report.h"
#include "geotour/task.h"
#include "glog/logging.h"

#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

ABSL_FLAG(std::string, input, {}, "Locations file");
ABSL_FLAG(std::string, output, {}, "Output file");
ABSL_FLAG(std::string, unit, "mi", "Unit of the written matrix: km or mi");
ABSL_FLAG(double, radius, geotour::kEarthRadiusKm, "Earth radius in kilometers");
ABSL_FLAG(uint32_t, histogram_bins, 10, "Bins in the logged distance histogram, 0 to skip");

int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);
  google::InitGoogleLogging(argv[0]);
  std::string input = absl::GetFlag(FLAGS_input);
  std::string output = absl::GetFlag(FLAGS_output);
  std::string unit = absl::GetFlag(FLAGS_unit);
  double radius = absl::GetFlag(FLAGS_radius);
  uint32_t histogram_bins = absl::GetFlag(FLAGS_histogram_bins);

  if (unit != "km" && unit != "mi") {
    LOG(ERROR) << "Unknown unit " << unit;
    return 1;
  }

  try {
    geotour::LocationSet locations = geotour::LocationsFromFile(input);
    LOG(INFO) << "Loaded " << locations.size() << " locations from " << input;

    geotour::DistanceMatrix matrix = geotour::BuildDistanceMatrix(locations, radius);
    if (unit == "mi") {
      matrix = geotour::ToMiles(matrix);
    }
    geotour::DistanceMatrixToFile(matrix, output);

    if (locations.size() > 1) {
      std::cerr << geotour::FormatSummary(geotour::SummarizeDistances(matrix), unit)
                << std::endl;
      if (histogram_bins > 0) {
        std::cerr << geotour::FormatHistogram(
                geotour::DistanceHistogram(matrix, histogram_bins), unit);
      }
    }
  } catch (const std::exception& error) {
    LOG(ERROR) << error.what();
    return 1;
  }
  return 0;
}
