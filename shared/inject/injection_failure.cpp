#include "injection_failure.hpp"
#include <exception>

namespace inject {

namespace {

void collect(const std::exception& e, std::vector<std::string>& chain)
{
    chain.emplace_back(e.what());
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        collect(nested, chain);
    } catch (...) {
        chain.emplace_back("<non-standard exception>");
    }
}

} // namespace

std::vector<std::string> messageChain(const std::exception& e)
{
    std::vector<std::string> chain;
    collect(e, chain);
    return chain;
}

std::string formatChain(const std::exception& e)
{
    std::string out;
    for (const auto& message : messageChain(e)) {
        if (!out.empty()) out += ": ";
        out += message;
    }
    return out;
}

bool isCyclic(const std::exception& e)
{
    if (dynamic_cast<const CyclicDependency*>(&e)) return true;
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        return isCyclic(nested);
    } catch (...) {
        return false;
    }
    return false;
}

} // namespace inject
