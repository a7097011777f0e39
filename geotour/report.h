#pragma once

#include "geotour/distance_matrix.h"
#include "geotour/task.h"

#include <cstdint>
#include <string>
#include <vector>

namespace geotour {

// Statistics over the off-diagonal pairs (i < j) of a distance matrix.
struct DistanceSummary {
  uint32_t pairs = 0;
  double min = 0.0;
  double max = 0.0;
  double mean = 0.0;
  double median = 0.0;
};

struct HistogramBin {
  double lower;
  double upper;
  uint32_t count;
};

struct Leg {
  std::string from;
  std::string to;
  double distance;
};

// Throws EmptyInput if the matrix has fewer than two locations.
DistanceSummary SummarizeDistances(const DistanceMatrix& matrix);

// Equal-width bins between the smallest and largest pair distance.
std::vector<HistogramBin> DistanceHistogram(const DistanceMatrix& matrix, uint32_t bins);

// Length of the closed tour.
double RouteLength(const DistanceMatrix& matrix, const Route& route);

// One leg per step of the closed tour, including the return leg.
std::vector<Leg> RouteLegs(const DistanceMatrix& matrix, const LocationSet& locations,
                           const Route& route);

std::string FormatSummary(const DistanceSummary& summary, const std::string& unit);

std::string FormatHistogram(const std::vector<HistogramBin>& histogram, const std::string& unit);

std::string FormatRouteReport(const std::vector<Leg>& legs, const std::string& unit);

}// namespace geotour
