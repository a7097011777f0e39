#pragma once

#include <stdexcept>
#include <string>

namespace geotour {

class Error : public std::runtime_error {
  public:
  using std::runtime_error::runtime_error;
};

// Latitude outside [-90, 90] or longitude outside [-180, 180].
class InvalidCoordinate : public Error {
  public:
  using Error::Error;
};

class EmptyInput : public Error {
  public:
  using Error::Error;
};

// Solver response does not describe a permutation of the submitted locations.
class SolverOutputMismatch : public Error {
  public:
  using Error::Error;
};

class DuplicateLocation : public Error {
  public:
  using Error::Error;
};

class MalformedInput : public Error {
  public:
  using Error::Error;
};

class SolverFailure : public Error {
  public:
  using Error::Error;
};

}// namespace geotour
