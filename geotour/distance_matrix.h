#pragma once

#include "geotour/geodesic.h"
#include "geotour/task.h"

#include <cstdint>
#include <string>
#include <vector>

namespace geotour {

class DistanceMatrix {
  public:
  using Table = std::vector<std::vector<double>>;

  // The table must be square; it is not checked for symmetry.
  DistanceMatrix(Table table, std::string unit);

  uint32_t size() const {
    return table_.size();
  }
  const std::string& unit() const {
    return unit_;
  }
  const Table& table() const {
    return table_;
  }

  double operator()(Index from, Index to) const {
    return table_[from][to];
  }

  // Distance between two locations of the set the matrix was built from.
  double Between(const LocationSet& locations, const std::string& from,
                 const std::string& to) const;

  private:
  Table table_;
  std::string unit_;
};

// Kilometer matrix, each unordered pair computed once and mirrored. Throws
// EmptyInput for an empty set.
DistanceMatrix BuildDistanceMatrix(const LocationSet& locations,
                                   double radius = kEarthRadiusKm);

DistanceMatrix ToMiles(const DistanceMatrix& kilometers);

DistanceMatrix DistanceMatrixFromFile(const std::string& filename, const std::string& unit);

void DistanceMatrixToFile(const DistanceMatrix& matrix, const std::string& filename);

}// namespace geotour
