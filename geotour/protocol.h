#pragma once

#include "geotour/task.h"

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

namespace geotour {

struct RequestHeader {
  std::string name;
  std::string comment;
};

// TSPLIB-style GEO instance. Node i is the i-th location of the set, so the
// set must not be reordered until the response has been read.
void WriteRequest(std::ostream& output, const RequestHeader& header,
                  const LocationSet& locations);

void RequestToFile(const std::string& filename, const RequestHeader& header,
                   const LocationSet& locations);

// Throws SolverOutputMismatch unless the route is a permutation of
// 0..vertices_count-1.
void ValidateRoute(const Route& route, uint32_t vertices_count);

// Solver result: a vertex count followed by that many indices. Throws
// SolverOutputMismatch if the count differs from expected_count or the indices
// are not a permutation.
Route ReadResponse(std::istream& input, uint32_t expected_count);

Route RouteFromFile(const std::string& filename, uint32_t expected_count);

void RouteToFile(const Route& route, const std::string& filename);

}// namespace geotour
