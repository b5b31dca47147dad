#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace matdim {

enum class ErrorKind {
  DegenerateCell,
  InconsistentPeriodicity,
  SymmetryTimeout,
  EmptyPrimaryRegion,
  SymmetryDatabase,
};

// Base of all fatal classification failures. A classification call that
// throws one of these produced no result; the offending atom indices (if
// any) are attached so the caller can diagnose without re-running.
class ClassificationError : public std::runtime_error {
public:
  ClassificationError(ErrorKind kind, const std::string& msg, std::vector<std::size_t> atoms = {})
      : std::runtime_error(msg), kind_(kind), atoms_(std::move(atoms)) {}

  ErrorKind kind() const { return kind_; }
  const std::vector<std::size_t>& atoms() const { return atoms_; }

private:
  ErrorKind kind_;
  std::vector<std::size_t> atoms_;
};

// Near-singular lattice.
class DegenerateCellError : public ClassificationError {
public:
  DegenerateCellError(const std::string& msg, double relative_volume)
      : ClassificationError(ErrorKind::DegenerateCell, msg), relative_volume_(relative_volume) {}

  double relative_volume() const { return relative_volume_; }

private:
  double relative_volume_;
};

// More propagating directions were measured than the structure declares as
// periodic (or one of them is declared non-periodic).
class InconsistentPeriodicityError : public ClassificationError {
public:
  InconsistentPeriodicityError(const std::string& msg,
                               std::size_t measured,
                               std::size_t declared,
                               std::vector<std::size_t> directions,
                               std::vector<std::size_t> atoms = {})
      : ClassificationError(ErrorKind::InconsistentPeriodicity, msg, std::move(atoms)),
        measured_(measured), declared_(declared), directions_(std::move(directions)) {}

  std::size_t measured() const { return measured_; }
  std::size_t declared() const { return declared_; }
  const std::vector<std::size_t>& directions() const { return directions_; }

private:
  std::size_t measured_;
  std::size_t declared_;
  std::vector<std::size_t> directions_;
};

class SymmetryTimeoutError : public ClassificationError {
public:
  SymmetryTimeoutError(const std::string& msg, std::chrono::milliseconds timeout)
      : ClassificationError(ErrorKind::SymmetryTimeout, msg), timeout_(timeout) {}

  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  std::chrono::milliseconds timeout_;
};

class EmptyPrimaryRegionError : public ClassificationError {
public:
  EmptyPrimaryRegionError(const std::string& msg, std::size_t n_atoms)
      : ClassificationError(ErrorKind::EmptyPrimaryRegion, msg), n_atoms_(n_atoms) {}

  std::size_t n_atoms() const { return n_atoms_; }

private:
  std::size_t n_atoms_;
};

// The external symmetry database reported a failure (not a timeout).
class SymmetryDatabaseError : public ClassificationError {
public:
  SymmetryDatabaseError(const std::string& msg, std::vector<std::size_t> atoms = {})
      : ClassificationError(ErrorKind::SymmetryDatabase, msg, std::move(atoms)) {}
};

inline std::string error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::DegenerateCell: return "degenerate_cell";
    case ErrorKind::InconsistentPeriodicity: return "inconsistent_periodicity";
    case ErrorKind::SymmetryTimeout: return "symmetry_timeout";
    case ErrorKind::EmptyPrimaryRegion: return "empty_primary_region";
    case ErrorKind::SymmetryDatabase: return "symmetry_database";
  }
  return "unknown";
}

} // namespace matdim
