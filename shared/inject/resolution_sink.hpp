#pragma once
#include <string>

#include "logging_def.hpp"
#include "type_key.hpp"

namespace inject {

    // Receives one notification per resolve entry. Never affects control flow.
    class ResolutionSink
    {
    public:
        virtual ~ResolutionSink() = default;
        virtual void onResolve(TypeKey type) = 0;
    }; // interface ResolutionSink


    class NullSink final : public ResolutionSink
    {
    public:
        void onResolve(TypeKey) override {}
    }; // class NullSink


    // Forwards resolution attempts to the logging facade under the given tag.
    class LoggingSink final : public ResolutionSink
    {
    public:
        explicit LoggingSink(std::string tag = "Injector", logging::Level level = logging::Level::Info);

        void onResolve(TypeKey type) override;

        const std::string& tag() const { return tag_; }
        logging::Level level() const { return level_; }

    private:
        std::string tag_;
        logging::Level level_;
    }; // class LoggingSink

} // namespace inject
