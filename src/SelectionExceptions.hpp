#ifndef SELECTION_EXCEPTIONS_HPP
#define SELECTION_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

// Bad container or shape passed to verification or subsetting
class InvalidDataException : public std::invalid_argument
{
public:
    explicit InvalidDataException(const std::string &message)
        : std::invalid_argument("Invalid data: " + message) {}
};

// Unrecognized scoring strategy name
class InvalidStrategyException : public std::invalid_argument
{
public:
    explicit InvalidStrategyException(const std::string &message)
        : std::invalid_argument("Invalid scoring strategy: " + message) {}
};

// More rounds requested than there are variables left to select
class ExhaustedCandidatesException : public std::runtime_error
{
public:
    explicit ExhaustedCandidatesException(const std::string &message)
        : std::runtime_error("Exhausted candidates: " + message) {}
};

// The scoring function threw while evaluating a candidate
class WorkerFailureException : public std::runtime_error
{
private:
    int variable_index;

public:
    WorkerFailureException(int variable, const std::string &message)
        : std::runtime_error("Scoring failed for variable " + std::to_string(variable) + ": " + message),
          variable_index(variable) {}

    int getVariableIndex() const { return variable_index; }
};

#endif // SELECTION_EXCEPTIONS_HPP
