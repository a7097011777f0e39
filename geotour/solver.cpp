#include "geotour/solver.h"

#include "absl/cleanup/cleanup.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "geotour/errors.h"
#include "geotour/protocol.h"
#include "glog/logging.h"

#include <cstdlib>
#include <filesystem>
#include <sys/wait.h>
#include <system_error>
#include <utility>

namespace geotour {

namespace {

std::string ShellQuote(const std::string& value) {
  return absl::StrCat("'", absl::StrReplaceAll(value, {{"'", "'\\''"}}), "'");
}

void RemoveFile(const std::string& path) {
  std::error_code error;
  std::filesystem::remove(path, error);
  if (error) {
    LOG(WARNING) << "Cannot remove " << path << ": " << error.message();
  }
}

// std::system returns a wait status, not the exit code.
std::string DescribeStatus(int status) {
  if (status == -1) {
    return "no shell available";
  }
  if (WIFEXITED(status)) {
    return absl::StrCat("exit status ", WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return absl::StrCat("signal ", WTERMSIG(status));
  }
  return absl::StrCat("wait status ", status);
}

}// namespace

ExternalSolver::ExternalSolver(ExternalSolverConfig config) : config_(std::move(config)) {
}

std::string ExternalSolver::RequestPath() const {
  return (std::filesystem::path(config_.working_directory) / config_.request_file).string();
}

std::string ExternalSolver::ResponsePath() const {
  return (std::filesystem::path(config_.working_directory) / config_.response_file).string();
}

std::string ExternalSolver::CommandLine() const {
  std::string command = absl::StrReplaceAll(
          config_.command, {{"{input}", ShellQuote(config_.request_file)},
                            {"{output}", ShellQuote(config_.response_file)}});
  return absl::StrCat("cd ", ShellQuote(config_.working_directory), " && ", command);
}

Route ExternalSolver::Solve(const LocationSet& locations, const DistanceMatrix& matrix) {
  if (locations.empty()) {
    throw EmptyInput("nothing to solve");
  }
  if (matrix.size() != locations.size()) {
    throw SolverOutputMismatch(absl::StrCat("distance matrix has ", matrix.size(),
                                            " rows for ", locations.size(), " locations"));
  }

  std::error_code error;
  std::filesystem::create_directories(config_.working_directory, error);
  if (error) {
    throw SolverFailure(absl::StrCat("cannot create ", config_.working_directory, ": ",
                                     error.message()));
  }
  const std::string request_path = RequestPath();
  const std::string response_path = ResponsePath();
  // A result left over from an earlier run must not be mistaken for this one.
  RemoveFile(response_path);

  auto remove_files = absl::MakeCleanup([&] {
    if (!config_.keep_files) {
      RemoveFile(request_path);
      RemoveFile(response_path);
    }
  });

  RequestToFile(request_path, RequestHeader{config_.problem_name, config_.comment}, locations);
  LOG(INFO) << "Wrote " << locations.size() << " locations to " << request_path;

  const std::string command = CommandLine();
  LOG(INFO) << "Running solver: " << command;
  int status = std::system(command.c_str());
  if (status != 0) {
    throw SolverFailure(absl::StrCat("solver command failed with ", DescribeStatus(status), ": ",
                                     command));
  }
  if (!std::filesystem::exists(response_path)) {
    throw SolverFailure("solver did not produce " + response_path);
  }

  Route route = RouteFromFile(response_path, locations.size());
  LOG(INFO) << "Solver returned a route over " << route.size() << " locations";
  return route;
}

}// namespace geotour
