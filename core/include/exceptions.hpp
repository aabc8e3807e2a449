#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class MatchEdgeException : public std::runtime_error {
    public:
        explicit MatchEdgeException(const std::string& message)
            : std::runtime_error(message) {}

        explicit MatchEdgeException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public MatchEdgeException {
    public: using MatchEdgeException::MatchEdgeException; };

    // Malformed caller input: probability outside [0,1], price < 1, unknown team/league, bad date
    class ValidationException : public MatchEdgeException {
    public: using MatchEdgeException::MatchEdgeException; };

    class DataLoadException : public MatchEdgeException {
    public: using MatchEdgeException::MatchEdgeException; };

    // A single fixture's model could not be evaluated (matrix failed to normalize)
    class NumericalException : public MatchEdgeException {
    public: using MatchEdgeException::MatchEdgeException; };

    // Attempt to settle a bet that is no longer PENDING
    class SettlementConflictException : public MatchEdgeException {
    public: using MatchEdgeException::MatchEdgeException; };

    // A query read match data at or after its as-of date. Programming error, never recovered.
    class LeakageViolation : public std::logic_error {
    public:
        explicit LeakageViolation(const std::string& message)
            : std::logic_error(message) {}
    };

} // namespace core
