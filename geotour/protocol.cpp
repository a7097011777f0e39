#include "geotour/protocol.h"

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "geotour/errors.h"

#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <vector>

namespace geotour {

namespace {

constexpr uint32_t kIndicesPerLine = 10;

uint32_t ReadIndex(std::istream& input, const char* what) {
  std::string token;
  if (!(input >> token)) {
    throw SolverOutputMismatch(absl::StrCat("solver output ended before ", what));
  }
  uint32_t value;
  if (!absl::SimpleAtoi(token, &value)) {
    throw SolverOutputMismatch(absl::StrCat("solver output has a bad ", what, ": ", token));
  }
  return value;
}

}// namespace

void WriteRequest(std::ostream& output, const RequestHeader& header,
                  const LocationSet& locations) {
  output << "NAME: " << header.name << '\n';
  output << "COMMENT: " << header.comment << '\n';
  output << "TYPE: TSP\n";
  output << "DIMENSION: " << locations.size() << '\n';
  output << "EDGE_WEIGHT_TYPE: GEO\n";
  output << "NODE_COORD_SECTION\n";
  output << std::fixed << std::setprecision(6);
  for (Index i = 0; i < locations.size(); ++i) {
    const Coordinate& point = locations[i].coordinate;
    output << i << ' ' << point.latitude << ' ' << point.longitude << '\n';
  }
  output << "EOF\n";
}

void RequestToFile(const std::string& filename, const RequestHeader& header,
                   const LocationSet& locations) {
  std::ofstream output(filename);
  if (!output) {
    throw std::runtime_error("cannot write " + filename);
  }
  WriteRequest(output, header, locations);
}

void ValidateRoute(const Route& route, uint32_t vertices_count) {
  if (route.size() != vertices_count) {
    throw SolverOutputMismatch(absl::StrCat("route visits ", route.size(),
                                            " vertices, expected ", vertices_count));
  }
  std::vector<bool> seen(vertices_count);
  for (Index v : route) {
    if (v >= vertices_count) {
      throw SolverOutputMismatch(absl::StrCat("vertex ", v, " out of range"));
    }
    if (seen[v]) {
      throw SolverOutputMismatch(absl::StrCat("vertex ", v, " visited twice"));
    }
    seen[v] = true;
  }
}

Route ReadResponse(std::istream& input, uint32_t expected_count) {
  uint32_t vertices_count = ReadIndex(input, "vertex count");
  if (vertices_count != expected_count) {
    throw SolverOutputMismatch(absl::StrCat("solver returned ", vertices_count,
                                            " vertices, expected ", expected_count));
  }
  Route result(vertices_count);
  for (uint32_t i = 0; i < vertices_count; ++i) {
    result[i] = ReadIndex(input, "vertex index");
  }
  std::string extra;
  if (input >> extra) {
    throw SolverOutputMismatch("solver output has trailing data: " + extra);
  }
  ValidateRoute(result, expected_count);
  return result;
}

Route RouteFromFile(const std::string& filename, uint32_t expected_count) {
  std::ifstream input(filename);
  if (!input) {
    throw MalformedInput("cannot open solver output " + filename);
  }
  return ReadResponse(input, expected_count);
}

void RouteToFile(const Route& route, const std::string& filename) {
  std::ofstream output(filename);
  if (!output) {
    throw std::runtime_error("cannot write " + filename);
  }
  uint32_t vertices_count = route.size();
  output << vertices_count << '\n';
  for (uint32_t i = 0; i < vertices_count; ++i) {
    if (i % kIndicesPerLine != 0) {
      output << ' ';
    }
    output << route[i];
    if (i % kIndicesPerLine == kIndicesPerLine - 1 || i + 1 == vertices_count) {
      output << '\n';
    }
  }
}

}// namespace geotour
