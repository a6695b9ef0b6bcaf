#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace inject {

    // Thrown whenever resolution cannot complete.
    // Wrap sites raise it through std::throw_with_nested, so the underlying failure
    // stays reachable with std::rethrow_if_nested.
    class InjectionFailure : public std::runtime_error
    {
    public:
        explicit InjectionFailure(const std::string& message)
            : std::runtime_error(message) {}
    }; // class InjectionFailure

    // A type was requested again while it was still being resolved.
    class CyclicDependency : public InjectionFailure
    {
    public:
        explicit CyclicDependency(const std::string& message)
            : InjectionFailure(message) {}
    }; // class CyclicDependency


    // Messages from the outermost failure to the root cause.
    std::vector<std::string> messageChain(const std::exception& e);

    // messageChain joined with ": ".
    std::string formatChain(const std::exception& e);

    // Whether a CyclicDependency appears anywhere in the chain.
    bool isCyclic(const std::exception& e);

} // namespace inject
