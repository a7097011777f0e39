#include "geotour/report.h"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "geotour/errors.h"
#include "geotour/protocol.h"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace geotour {

namespace {

std::vector<double> PairDistances(const DistanceMatrix& matrix) {
  std::vector<double> result;
  result.reserve(static_cast<size_t>(matrix.size()) * (matrix.size() - 1) / 2);
  for (Index i = 0; i < matrix.size(); ++i) {
    for (Index j = i + 1; j < matrix.size(); ++j) {
      result.push_back(matrix(i, j));
    }
  }
  if (result.empty()) {
    throw EmptyInput("distance matrix has no pairs");
  }
  return result;
}

}// namespace

DistanceSummary SummarizeDistances(const DistanceMatrix& matrix) {
  std::vector<double> distances = PairDistances(matrix);
  std::sort(distances.begin(), distances.end());

  DistanceSummary summary;
  summary.pairs = distances.size();
  summary.min = distances.front();
  summary.max = distances.back();
  summary.mean = std::accumulate(distances.begin(), distances.end(), 0.0) / distances.size();
  size_t middle = distances.size() / 2;
  if (distances.size() % 2 == 0) {
    summary.median = (distances[middle - 1] + distances[middle]) / 2;
  } else {
    summary.median = distances[middle];
  }
  return summary;
}

std::vector<HistogramBin> DistanceHistogram(const DistanceMatrix& matrix, uint32_t bins) {
  if (bins == 0) {
    throw std::invalid_argument("histogram needs at least one bin");
  }
  std::vector<double> distances = PairDistances(matrix);
  auto [min_it, max_it] = std::minmax_element(distances.begin(), distances.end());
  const double min = *min_it;
  const double max = *max_it;
  const double width = (max - min) / bins;

  std::vector<HistogramBin> result(bins);
  for (uint32_t b = 0; b < bins; ++b) {
    result[b].lower = min + width * b;
    result[b].upper = (b + 1 == bins) ? max : min + width * (b + 1);
    result[b].count = 0;
  }
  for (double distance : distances) {
    uint32_t b = width > 0 ? static_cast<uint32_t>((distance - min) / width) : 0;
    // The maximum falls on the upper edge of the last bin.
    b = std::min(b, bins - 1);
    ++result[b].count;
  }
  return result;
}

double RouteLength(const DistanceMatrix& matrix, const Route& route) {
  ValidateRoute(route, matrix.size());
  double result = 0;
  for (uint32_t i = 0; i < route.size(); ++i) {
    Index u = route[i];
    Index v = (i + 1 == route.size()) ? route[0] : route[i + 1];
    result += matrix(u, v);
  }
  return result;
}

std::vector<Leg> RouteLegs(const DistanceMatrix& matrix, const LocationSet& locations,
                           const Route& route) {
  if (locations.size() != matrix.size()) {
    throw SolverOutputMismatch(absl::StrCat("distance matrix has ", matrix.size(),
                                            " rows for ", locations.size(), " locations"));
  }
  ValidateRoute(route, matrix.size());
  std::vector<Leg> legs;
  Route closed = CloseRoute(route);
  for (uint32_t i = 0; i + 1 < closed.size(); ++i) {
    Index u = closed[i];
    Index v = closed[i + 1];
    legs.push_back(Leg{locations[u].id, locations[v].id, matrix(u, v)});
  }
  return legs;
}

std::string FormatSummary(const DistanceSummary& summary, const std::string& unit) {
  return absl::StrFormat(
          "%u pairs: min %.2f %s, max %.2f %s, mean %.2f %s, median %.2f %s", summary.pairs,
          summary.min, unit, summary.max, unit, summary.mean, unit, summary.median, unit);
}

std::string FormatHistogram(const std::vector<HistogramBin>& histogram, const std::string& unit) {
  std::string result;
  for (const HistogramBin& bin : histogram) {
    absl::StrAppend(&result, absl::StrFormat("%10.2f - %10.2f %s: %u\n", bin.lower, bin.upper,
                                             unit, bin.count));
  }
  return result;
}

std::string FormatRouteReport(const std::vector<Leg>& legs, const std::string& unit) {
  size_t width = 4;
  for (const Leg& leg : legs) {
    width = std::max({width, leg.from.size(), leg.to.size()});
  }
  const int w = static_cast<int>(width);

  std::string result = absl::StrFormat("%4s  %-*s  %-*s  %12s\n", "#", w, "from", w, "to",
                                       absl::StrCat("distance ", unit));
  double total = 0;
  for (size_t i = 0; i < legs.size(); ++i) {
    const Leg& leg = legs[i];
    total += leg.distance;
    absl::StrAppend(&result, absl::StrFormat("%4u  %-*s  %-*s  %12.2f\n", i + 1, w, leg.from, w,
                                             leg.to, leg.distance));
  }
  absl::StrAppend(&result, absl::StrFormat("total: %.2f %s over %u legs\n", total, unit,
                                           legs.size()));
  return result;
}

}// namespace geotour
