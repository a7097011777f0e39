#include "geotour/task.h"

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "geotour/errors.h"

#include <fstream>
#include <stdexcept>
#include <utility>

namespace geotour {

LocationSet::LocationSet(const std::vector<Location>& locations) {
  for (const Location& location : locations) {
    Add(location);
  }
}

Index LocationSet::Add(Location location) {
  ValidateCoordinate(location.coordinate);
  if (Contains(location.id)) {
    throw DuplicateLocation(absl::StrCat("duplicate location id: ", location.id));
  }
  Index index = locations_.size();
  index_by_id_.emplace(location.id, index);
  locations_.emplace_back(std::move(location));
  return index;
}

bool LocationSet::Contains(const std::string& id) const {
  return index_by_id_.count(id) != 0;
}

Index LocationSet::IndexOf(const std::string& id) const {
  auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) {
    throw std::out_of_range("unknown location id: " + id);
  }
  return it->second;
}

LocationSet LocationsFromStream(std::istream& input) {
  LocationSet result;
  std::string line;
  uint32_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    absl::string_view stripped = absl::StripAsciiWhitespace(line);
    if (stripped.empty() || stripped.front() == '#') {
      continue;
    }

    std::vector<absl::string_view> fields =
            absl::StrSplit(stripped, absl::ByAnyChar(" \t,"), absl::SkipEmpty());
    if (fields.size() != 3) {
      throw MalformedInput(absl::StrCat("line ", line_number, ": expected 3 fields, got ",
                                        fields.size()));
    }
    Coordinate coordinate;
    if (!absl::SimpleAtod(fields[1], &coordinate.latitude) ||
        !absl::SimpleAtod(fields[2], &coordinate.longitude)) {
      throw MalformedInput(absl::StrCat("line ", line_number, ": bad coordinate"));
    }
    result.Add(Location{std::string(fields[0]), coordinate});
  }
  return result;
}

LocationSet LocationsFromFile(const std::string& filename) {
  std::ifstream input(filename);
  if (!input) {
    throw MalformedInput("cannot open " + filename);
  }
  return LocationsFromStream(input);
}

Route CloseRoute(const Route& route) {
  Route result = route;
  if (!route.empty()) {
    result.push_back(route.front());
  }
  return result;
}

std::vector<std::string> RouteIdentifiers(const LocationSet& locations, const Route& route) {
  std::vector<std::string> result;
  result.reserve(route.size());
  for (Index index : route) {
    if (index >= locations.size()) {
      throw SolverOutputMismatch(absl::StrCat("route index ", index, " out of range"));
    }
    result.push_back(locations[index].id);
  }
  return result;
}

}// namespace geotour
