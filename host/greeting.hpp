#pragma once
#include <memory>
#include <string>

#include "inject.hpp"

namespace host {

// 출력할 문구 (instance 로 바인딩)
struct Greeting {
    explicit Greeting(std::string text) : text(std::move(text)) {}
    std::string text;
};

class MessageSource {
public:
    virtual ~MessageSource() = default;
    virtual std::string message() const = 0;
};

class GreetingSource : public MessageSource {
public:
    explicit GreetingSource(std::shared_ptr<Greeting> greeting)
        : greeting_(std::move(greeting)) {}

    std::string message() const override { return greeting_->text; }

private:
    std::shared_ptr<Greeting> greeting_;
};

class Printer {
public:
    Printer(std::shared_ptr<MessageSource> source, std::shared_ptr<Greeting> greeting)
        : source_(std::move(source)), greeting_(std::move(greeting)) {}

    std::string render() const {
        return source_->message() + " (" + std::to_string(greeting_.use_count()) + " holders)";
    }

private:
    std::shared_ptr<MessageSource> source_;
    std::shared_ptr<Greeting> greeting_;
};

} // namespace host

INJECT_CONSTRUCTOR(host::GreetingSource, host::Greeting);
INJECT_CONSTRUCTOR(host::Printer, host::MessageSource, host::Greeting);
