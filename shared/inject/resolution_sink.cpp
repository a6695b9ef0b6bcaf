#include "resolution_sink.hpp"
#include "logging.hpp"

namespace inject {

LoggingSink::LoggingSink(std::string tag, logging::Level level)
    : tag_(std::move(tag)), level_(level)
{
}

void LoggingSink::onResolve(TypeKey type)
{
    logging::log(tag_.c_str(), level_, "Attempting to resolve {}", type.name());
}

} // namespace inject
