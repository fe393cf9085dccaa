#pragma once
/**
 * @file Error.h
 * @brief Exception types raised by the orchestration engine.
 */
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ensemble {
    /** @brief Base class of every engine error. */
    class EnsembleError : public std::runtime_error {
    public:
        explicit EnsembleError(const std::string& msg) : std::runtime_error(msg) {}
    };

    /**
     * @brief Invalid user configuration, detected before any Run is created.
     */
    class ConfigurationError : public EnsembleError {
    public:
        explicit ConfigurationError(const std::string& msg) : EnsembleError(msg) {}
    };

    /** @brief Unknown distribution signature or invalid distribution arguments. */
    class DistributionSpecError : public ConfigurationError {
    public:
        explicit DistributionSpecError(const std::string& msg) : ConfigurationError(msg) {}
    };

    /** @brief Linked parameters reference each other in a loop. */
    class CyclicLinkError : public ConfigurationError {
    public:
        explicit CyclicLinkError(std::vector<std::string> cycle);

        /** @brief Parameter names along the cycle; the first name is repeated at the end. */
        const std::vector<std::string>& cycle() const noexcept { return cycle_; }

    private:
        std::vector<std::string> cycle_;
    };

    /** @brief A `{name}` placeholder without a binding in the variable environment. */
    class UnresolvedVariableError : public ConfigurationError {
    public:
        UnresolvedVariableError(std::string variable, const std::string& text)
            : ConfigurationError("Unresolved variable '{" + variable + "}' in \"" + text + "\""),
              variable_(std::move(variable)) {}

        const std::string& variable() const noexcept { return variable_; }

    private:
        std::string variable_;
    };

    /** @brief The simulation declares no baseline experiment. */
    class MissingBaselineError : public ConfigurationError {
    public:
        explicit MissingBaselineError(const std::string& msg) : ConfigurationError(msg) {}
    };

    /** @brief Failure reported by the relational state store. */
    class StoreError : public EnsembleError {
    public:
        explicit StoreError(const std::string& msg) : EnsembleError(msg) {}
    };

    /** @brief A model step could not be executed. */
    class ExecutionError : public EnsembleError {
    public:
        explicit ExecutionError(const std::string& msg) : EnsembleError(msg) {}
    };

    inline std::string joinCycle(const std::vector<std::string>& cycle) {
        std::string out;
        for (size_t i = 0; i < cycle.size(); ++i) {
            if (i) out += " -> ";
            out += cycle[i];
        }
        return out;
    }

    inline CyclicLinkError::CyclicLinkError(std::vector<std::string> cycle)
        : ConfigurationError("Cyclic parameter link: " + joinCycle(cycle)), cycle_(std::move(cycle)) {}
}
