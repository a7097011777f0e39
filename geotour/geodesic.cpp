#include "geotour/geodesic.h"

#include "absl/strings/str_cat.h"
#include "geotour/errors.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace geotour {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kRadiansPerDegree = kPi / 180.0;

// Longitudes -180 and 180 name the same meridian, and every longitude names the
// same point at a pole.
bool SamePoint(const Coordinate& a, const Coordinate& b) {
  if (a.latitude != b.latitude) {
    return false;
  }
  if (std::abs(a.latitude) == 90.0 || a.longitude == b.longitude) {
    return true;
  }
  return std::abs(a.longitude) == 180.0 && std::abs(b.longitude) == 180.0;
}

}// namespace

void ValidateRadius(double radius) {
  if (!(radius > 0) || !std::isfinite(radius)) {
    throw std::invalid_argument(absl::StrCat("radius must be positive and finite: ", radius));
  }
}

void ValidateCoordinate(const Coordinate& point) {
  // Written as negated ranges so that NaN is rejected too.
  if (!(point.latitude >= -90.0 && point.latitude <= 90.0)) {
    throw InvalidCoordinate(absl::StrCat("latitude out of range: ", point.latitude));
  }
  if (!(point.longitude >= -180.0 && point.longitude <= 180.0)) {
    throw InvalidCoordinate(absl::StrCat("longitude out of range: ", point.longitude));
  }
}

// phi --- polar angle, 0 at the north pole
// theta --- azimuthal angle
// cos(angle) = sin(phi_a) sin(phi_b) cos(theta_a - theta_b) + cos(phi_a) cos(phi_b)
double GreatCircleDistance(const Coordinate& a, const Coordinate& b, double radius) {
  ValidateRadius(radius);
  ValidateCoordinate(a);
  ValidateCoordinate(b);
  if (SamePoint(a, b)) {
    return 0.0;
  }

  const double phi_a = (90.0 - a.latitude) * kRadiansPerDegree;
  const double phi_b = (90.0 - b.latitude) * kRadiansPerDegree;
  const double theta_a = a.longitude * kRadiansPerDegree;
  const double theta_b = b.longitude * kRadiansPerDegree;

  double cos_angle = std::sin(phi_a) * std::sin(phi_b) * std::cos(theta_a - theta_b) +
                     std::cos(phi_a) * std::cos(phi_b);
  // Rounding can push the value just outside the domain of acos.
  cos_angle = std::clamp(cos_angle, -1.0, 1.0);
  return std::acos(cos_angle) * radius;
}

double KilometersToMiles(double kilometers) {
  return kilometers / kKilometersPerMile;
}

}// namespace geotour
