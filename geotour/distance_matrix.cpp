#include "geotour/distance_matrix.h"

#include "absl/strings/str_cat.h"
#include "geotour/errors.h"
#include "glog/logging.h"

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <limits>
#include <stdexcept>
#include <utility>

namespace geotour {

DistanceMatrix::DistanceMatrix(Table table, std::string unit)
    : table_(std::move(table)), unit_(std::move(unit)) {
  for (const auto& row : table_) {
    if (row.size() != table_.size()) {
      throw std::invalid_argument("distance matrix must be square");
    }
  }
}

double DistanceMatrix::Between(const LocationSet& locations, const std::string& from,
                               const std::string& to) const {
  if (locations.size() != size()) {
    throw std::invalid_argument("location set does not match the distance matrix");
  }
  return (*this)(locations.IndexOf(from), locations.IndexOf(to));
}

DistanceMatrix BuildDistanceMatrix(const LocationSet& locations, double radius) {
  if (locations.empty()) {
    throw EmptyInput("cannot build a distance matrix without locations");
  }
  ValidateRadius(radius);
  uint32_t n = locations.size();
  DistanceMatrix::Table table(n, std::vector<double>(n, 0.0));
  for (Index i = 0; i < n; ++i) {
    for (Index j = i + 1; j < n; ++j) {
      double distance =
              GreatCircleDistance(locations[i].coordinate, locations[j].coordinate, radius);
      table[i][j] = distance;
      table[j][i] = distance;
    }
  }
  LOG(INFO) << "Built " << n << "x" << n << " distance matrix";
  return DistanceMatrix(std::move(table), "km");
}

DistanceMatrix ToMiles(const DistanceMatrix& kilometers) {
  if (kilometers.unit() != "km") {
    throw std::invalid_argument("expected a kilometer matrix, got " + kilometers.unit());
  }
  DistanceMatrix::Table table = kilometers.table();
  for (auto& row : table) {
    for (double& value : row) {
      value = KilometersToMiles(value);
    }
  }
  return DistanceMatrix(std::move(table), "mi");
}

DistanceMatrix DistanceMatrixFromFile(const std::string& filename, const std::string& unit) {
  std::ifstream input(filename);
  if (!input) {
    throw MalformedInput("cannot open " + filename);
  }
  int64_t vertices_count;
  if (!(input >> vertices_count)) {
    throw MalformedInput(filename + ": missing matrix size");
  }
  if (vertices_count < 0 || vertices_count > std::numeric_limits<uint32_t>::max()) {
    throw MalformedInput(absl::StrCat(filename, ": bad matrix size ", vertices_count));
  }
  // Allocation follows the values actually read, not the declared size.
  DistanceMatrix::Table result;
  for (Index u = 0; u < vertices_count; ++u) {
    std::vector<double> row;
    for (Index v = 0; v < vertices_count; ++v) {
      double value;
      if (!(input >> value)) {
        throw MalformedInput(absl::StrCat(filename, ": missing value at (", u, ", ", v, ")"));
      }
      row.push_back(value);
    }
    result.emplace_back(std::move(row));
  }
  double extra;
  if (input >> extra) {
    throw MalformedInput(filename + ": more values than the matrix size allows");
  }
  return DistanceMatrix(std::move(result), unit);
}

void DistanceMatrixToFile(const DistanceMatrix& matrix, const std::string& filename) {
  std::ofstream output(filename);
  if (!output) {
    throw std::runtime_error("cannot write " + filename);
  }
  output << std::setprecision(std::numeric_limits<double>::max_digits10);
  uint32_t vertices_count = matrix.size();
  output << vertices_count << '\n';
  for (Index u = 0; u < vertices_count; ++u) {
    for (Index v = 0; v < vertices_count; ++v) {
      if (v != 0) {
        output << ' ';
      }
      output << matrix(u, v);
    }
    output << '\n';
  }
}

}// namespace geotour
