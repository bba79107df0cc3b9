#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cadhistory {

/**
 * Base exception class for all history-related errors
 */
class HistoryException : public std::runtime_error {
  public:
    explicit HistoryException(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * Exception for lookups of an operation id that is not in the tree
 */
class NotFoundError : public HistoryException {
  public:
    explicit NotFoundError(std::uint64_t operation_id)
        : HistoryException("Operation not found: " +
                           std::to_string(operation_id)),
          m_operation_id(operation_id) {}

    std::uint64_t operation_id() const noexcept { return m_operation_id; }

  private:
    std::uint64_t m_operation_id;
};

/**
 * Exception for registering a branch name twice
 */
class DuplicateBranchError : public HistoryException {
  public:
    explicit DuplicateBranchError(const std::string &branch)
        : HistoryException("Branch already exists: '" + branch + "'"),
          m_branch(branch) {}

    const std::string &branch() const noexcept { return m_branch; }

  private:
    std::string m_branch;
};

/**
 * Exception for switching to a branch name that was never registered
 */
class UnknownBranchError : public HistoryException {
  public:
    explicit UnknownBranchError(const std::string &branch)
        : HistoryException("Unknown branch: '" + branch + "'"),
          m_branch(branch) {}

    const std::string &branch() const noexcept { return m_branch; }

  private:
    std::string m_branch;
};

/**
 * Exception for operations the tree cannot accept (null or reused id)
 */
class InvalidOperationError : public HistoryException {
  public:
    explicit InvalidOperationError(const std::string &message)
        : HistoryException("Invalid operation: " + message) {}
};

/**
 * Exception for a tree whose structure violates its invariants
 */
class InvariantError : public HistoryException {
  public:
    explicit InvariantError(const std::string &message)
        : HistoryException("History invariant violated: " + message) {}
};

/**
 * Exception for I/O operations (file read/write, JSON parsing)
 */
class IOError : public HistoryException {
  public:
    explicit IOError(const std::string &message)
        : HistoryException("I/O error: " + message) {}
};

/**
 * Exception for configuration validation errors
 */
class ConfigError : public HistoryException {
  public:
    explicit ConfigError(const std::string &message)
        : HistoryException("Configuration error: " + message) {}
};

} // namespace cadhistory
