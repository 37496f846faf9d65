#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// Error taxonomy. Input problems derive from std::invalid_argument and are
// raised before any subsampling work starts; runtime problems derive from
// std::runtime_error. Degenerate metrics are never thrown: they come back as
// NaN in the summary.
// ---------------------------------------------------------------------------

class InvalidProportion : public std::invalid_argument {
public:
    explicit InvalidProportion(double proportion)
        : std::invalid_argument("Proportion must be in (0, 1], got " +
                                std::to_string(proportion)),
          proportion_(proportion) {}

    double proportion() const { return proportion_; }

private:
    double proportion_;
};

class HandlerContractViolation : public std::runtime_error {
public:
    HandlerContractViolation(const std::string& handler, const std::string& field,
                             const std::string& detail = "")
        : std::runtime_error("Handler '" + handler + "' violated the result contract (" +
                             field + (detail.empty() ? "" : ": " + detail) + ")"),
          handler_(handler), field_(field) {}

    const std::string& handler() const { return handler_; }
    const std::string& field() const { return field_; }

private:
    std::string handler_;
    std::string field_;
};

class IncompatibleHandlerArguments : public std::invalid_argument {
public:
    explicit IncompatibleHandlerArguments(const std::string& what)
        : std::invalid_argument(what) {}
};

class OracleJoinFailure : public std::runtime_error {
public:
    explicit OracleJoinFailure(const std::string& method)
        : std::runtime_error("Oracle shares no gene ID with rows of method '" + method + "'"),
          method_(method) {}

    const std::string& method() const { return method_; }

private:
    std::string method_;
};

class InvalidSeedReuse : public std::invalid_argument {
public:
    explicit InvalidSeedReuse(const std::string& what)
        : std::invalid_argument(what) {}
};

// Thrown when a run is cancelled and the caller asked for partial results to
// be discarded.
class SubsampleCancelled : public std::runtime_error {
public:
    SubsampleCancelled(size_t completed, size_t total)
        : std::runtime_error("Subsampling cancelled after " + std::to_string(completed) +
                             " of " + std::to_string(total) + " tasks"),
          completed_(completed), total_(total) {}

    size_t completed() const { return completed_; }
    size_t total() const { return total_; }

private:
    size_t completed_;
    size_t total_;
};
