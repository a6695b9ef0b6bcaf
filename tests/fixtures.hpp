#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "inject.hpp"

namespace fixtures {

struct SimpleMarkerInterface {
    virtual ~SimpleMarkerInterface() = default;
};

struct Fooable : SimpleMarkerInterface {
    virtual std::string bazValue() const = 0;
    virtual std::string barBazValue() const = 0;
};

struct Baz {
    explicit Baz(std::string value) : value(std::move(value)) {}
    // injectable form; only resolvable when std::string is
    explicit Baz(std::shared_ptr<std::string> value) : value(*value) {}

    std::string value;
};

struct Bar {
    explicit Bar(std::shared_ptr<Baz> baz) : baz(std::move(baz)) {}

    std::shared_ptr<Baz> baz;
};

struct Foo : Fooable {
    Foo(std::shared_ptr<Bar> bar, std::shared_ptr<Baz> baz)
        : bar(std::move(bar)), baz(std::move(baz)) {}

    std::string bazValue() const override { return baz->value; }
    std::string barBazValue() const override { return bar->baz->value; }

    std::shared_ptr<Bar> bar;
    std::shared_ptr<Baz> baz;
};

struct Bogus {
    explicit Bogus(std::shared_ptr<Baz>) {
        throw std::invalid_argument("oh no you didn't");
    }
};

struct MultipleConstructors {
    explicit MultipleConstructors(std::shared_ptr<Bogus>) {}
    MultipleConstructors(std::shared_ptr<Baz>, std::shared_ptr<Bar>) {}
};

// Constructor failure that already carries its own cause.
struct Layered {
    explicit Layered(std::shared_ptr<Baz> baz) {
        try {
            throw std::out_of_range("index " + baz->value);
        } catch (...) {
            std::throw_with_nested(std::runtime_error("layered setup failed"));
        }
    }
};

struct Leaf {};

struct Egg;
struct Chicken {
    explicit Chicken(std::shared_ptr<Egg>) {}
};
struct Egg {
    explicit Egg(std::shared_ptr<Chicken>) {}
};

class RecordingSink : public inject::ResolutionSink {
public:
    void onResolve(inject::TypeKey type) override { seen.push_back(type); }

    std::vector<inject::TypeKey> seen;
};

class ThrowingSink : public inject::ResolutionSink {
public:
    void onResolve(inject::TypeKey) override { throw std::runtime_error("sink is down"); }
};

// Throws something that is not a std::exception.
class RawThrowingSink : public inject::ResolutionSink {
public:
    void onResolve(inject::TypeKey) override { throw 42; }
};

// Catalog with the constructors of every fixture type above.
inline std::shared_ptr<inject::TypeCatalog> makeCatalog() {
    auto catalog = std::make_shared<inject::TypeCatalog>();
    const Result<void> declared[] = {
        catalog->declare<Baz, std::string>(),
        catalog->declare<Bar, Baz>(),
        catalog->declare<Foo, Bar, Baz>(),
        catalog->declare<Bogus, Baz>(),
        catalog->declare<MultipleConstructors, Bogus>(),
        catalog->declare<MultipleConstructors, Baz, Bar>(),
        catalog->declare<Layered, Baz>(),
        catalog->declare<Leaf>(),
        catalog->declare<Chicken, Egg>(),
        catalog->declare<Egg, Chicken>(),
    };
    for (const auto& r : declared) {
        if (r.hasError()) throw std::logic_error(to_string(r));
    }
    return catalog;
}

inline inject::ContainerOptions makeOptions(std::shared_ptr<inject::ResolutionSink> sink = nullptr) {
    return inject::ContainerOptions{ std::move(sink), makeCatalog() };
}

} // namespace fixtures
