#pragma once

#include "geotour/geodesic.h"

#include <cstdint>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace geotour {

using Index = uint32_t;
// Positional indices into a LocationSet, in visiting order.
using Route = std::vector<Index>;

struct Location {
  std::string id;
  Coordinate coordinate;
};

// Ordered set of uniquely named locations. The position of a location is the
// index the solver protocol refers to it by, so locations are only appended.
class LocationSet {
  public:
  LocationSet() = default;
  explicit LocationSet(const std::vector<Location>& locations);

  // Throws DuplicateLocation or InvalidCoordinate.
  Index Add(Location location);

  uint32_t size() const {
    return locations_.size();
  }
  bool empty() const {
    return locations_.empty();
  }
  const Location& operator[](Index index) const {
    return locations_[index];
  }
  std::vector<Location>::const_iterator begin() const {
    return locations_.begin();
  }
  std::vector<Location>::const_iterator end() const {
    return locations_.end();
  }

  bool Contains(const std::string& id) const;
  // Throws std::out_of_range for an unknown identifier.
  Index IndexOf(const std::string& id) const;

  private:
  std::vector<Location> locations_;
  std::unordered_map<std::string, Index> index_by_id_;
};

// One location per line: "<id> <latitude> <longitude>", separated by
// whitespace or commas. Blank lines and lines starting with '#' are skipped.
LocationSet LocationsFromStream(std::istream& input);

LocationSet LocationsFromFile(const std::string& filename);

// Appends the first index, so that the route ends where it started.
Route CloseRoute(const Route& route);

std::vector<std::string> RouteIdentifiers(const LocationSet& locations, const Route& route);

}// namespace geotour
