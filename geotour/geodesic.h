#pragma once

namespace geotour {

// Mean earth radius used by the TSPLIB GEO distance.
constexpr double kEarthRadiusKm = 6378.388;
constexpr double kKilometersPerMile = 1.60934;

struct Coordinate {
  double latitude;
  double longitude;
};

// Throws InvalidCoordinate if the latitude is outside [-90, 90] or the
// longitude is outside [-180, 180].
void ValidateCoordinate(const Coordinate& point);

// Throws std::invalid_argument unless the radius is positive and finite.
void ValidateRadius(double radius);

// Great-circle distance on a sphere of the given radius, in the unit of the
// radius. Both points and the radius are validated.
double GreatCircleDistance(const Coordinate& a, const Coordinate& b,
                           double radius = kEarthRadiusKm);

double KilometersToMiles(double kilometers);

}// namespace geotour
