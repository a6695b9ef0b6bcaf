#include <catch2/catch.hpp>

#include "fixtures.hpp"

using namespace fixtures;

TEST_CASE("bound instance is returned as is", "[resolution]") {
    inject::Container container(makeOptions());
    auto bound = std::make_shared<Baz>("hello world");
    container.bindInstance<Baz>(bound);

    auto baz = container.resolve<Baz>();
    REQUIRE(baz == bound);
    REQUIRE(baz->value == "hello world");

    // repeated resolution never reconstructs
    REQUIRE(container.resolve<Baz>() == bound);
    REQUIRE(container.resolve<Baz>() == bound);
}

TEST_CASE("constructor dependencies are injected", "[resolution]") {
    inject::Container container(makeOptions());
    container.bindInstance<Baz>(std::make_shared<Baz>("hi"));

    auto bar = container.resolve<Bar>();
    REQUIRE(bar != nullptr);
    REQUIRE(bar->baz->value == "hi");
}

TEST_CASE("dependencies are resolved recursively", "[resolution]") {
    inject::Container container(makeOptions());
    auto bound = std::make_shared<Baz>("xyzzy");
    container.bindInstance<Baz>(bound);

    auto foo = container.resolve<Foo>();
    REQUIRE(foo->bazValue() == "xyzzy");
    REQUIRE(foo->barBazValue() == "xyzzy");

    // one shared instance, not two constructions
    REQUIRE(foo->baz == bound);
    REQUIRE(foo->bar->baz == bound);
}

TEST_CASE("zero-argument constructors are used directly", "[resolution]") {
    inject::Container container(makeOptions());
    REQUIRE(container.resolve<Leaf>() != nullptr);
}

TEST_CASE("unbound types are constructed anew on every request", "[resolution]") {
    inject::Container container(makeOptions());
    container.bindInstance<Baz>(std::make_shared<Baz>("v"));

    auto first = container.resolve<Bar>();
    auto second = container.resolve<Bar>();
    REQUIRE(first != second);
    REQUIRE(first->baz == second->baz);
}

TEST_CASE("interface bound to a concrete type", "[resolution]") {
    inject::Container container(makeOptions());
    container.bindInstance<Baz>(std::make_shared<Baz>("qwerty"));
    container.bindAlias<Fooable, Foo>();

    auto fooable = container.resolve<Fooable>();
    REQUIRE(fooable->bazValue() == "qwerty");
    REQUIRE(fooable->barBazValue() == "qwerty");
    REQUIRE(std::dynamic_pointer_cast<Foo>(fooable) != nullptr);
}

TEST_CASE("alias bindings are not cached", "[resolution]") {
    inject::Container container(makeOptions());
    container.bindInstance<Baz>(std::make_shared<Baz>("v"));
    container.bindAlias<Fooable, Foo>();

    auto first = container.resolve<Fooable>();
    auto second = container.resolve<Fooable>();
    REQUIRE(first != second);
}

TEST_CASE("alias bindings compose through several levels", "[resolution]") {
    inject::Container container(makeOptions());

    SECTION("down to a structurally constructed type") {
        container.bindInstance<Baz>(std::make_shared<Baz>("whoa!"));
        container.bindAlias<Fooable, Foo>();
        container.bindAlias<SimpleMarkerInterface, Fooable>();

        auto marker = container.resolve<SimpleMarkerInterface>();
        REQUIRE(marker != nullptr);
        REQUIRE(std::dynamic_pointer_cast<Foo>(marker) != nullptr);
    }

    SECTION("down to an instance binding") {
        auto foo = std::make_shared<Foo>(
            std::make_shared<Bar>(std::make_shared<Baz>("a")), std::make_shared<Baz>("b"));
        container.bindAlias<SimpleMarkerInterface, Fooable>();
        container.bindAlias<Fooable, Foo>();
        container.bindInstance<Foo>(foo);

        auto marker = container.resolve<SimpleMarkerInterface>();
        REQUIRE(std::dynamic_pointer_cast<Foo>(marker) == foo);
        REQUIRE(container.resolve<SimpleMarkerInterface>() == marker);
    }
}

TEST_CASE("bindings take precedence over structural construction", "[resolution]") {
    auto sink = std::make_shared<RecordingSink>();
    inject::Container container(makeOptions(sink));
    auto bar = std::make_shared<Bar>(std::make_shared<Baz>("bound"));
    container.bindInstance<Bar>(bar);

    REQUIRE(container.resolve<Bar>() == bar);

    // Bar's constructor was never considered, so Baz was never requested
    REQUIRE(sink->seen.size() == 1);
    REQUIRE(sink->seen.front() == inject::getTypeKey<Bar>());
}

TEST_CASE("instances may be bound under a base type", "[resolution]") {
    inject::Container container(makeOptions());
    auto foo = std::make_shared<Foo>(
        std::make_shared<Bar>(std::make_shared<Baz>("x")), std::make_shared<Baz>("y"));
    container.bindInstance<Fooable>(foo);

    auto fooable = container.resolve<Fooable>();
    REQUIRE(fooable.get() == foo.get());
    REQUIRE(fooable->bazValue() == "y");
}

TEST_CASE("rebinding replaces the previous binding", "[resolution]") {
    inject::Container container(makeOptions());
    container.bindInstance<Baz>(std::make_shared<Baz>("old"));
    container.bindInstance<Baz>(std::make_shared<Baz>("new"));
    REQUIRE(container.resolve<Baz>()->value == "new");

    container.bindAlias<Fooable, Foo>();
    auto replacement = std::make_shared<Foo>(
        std::make_shared<Bar>(std::make_shared<Baz>("p")), std::make_shared<Baz>("q"));
    container.bindInstance<Fooable>(replacement);
    REQUIRE(container.resolve<Fooable>().get() == replacement.get());
}

TEST_CASE("a null instance binding resolves to null", "[resolution]") {
    inject::Container container(makeOptions());
    container.bindInstance<Baz>(std::shared_ptr<Baz>());

    REQUIRE(container.resolve<Baz>() == nullptr);
}

TEST_CASE("tryResolve reports success with the instance", "[resolution]") {
    inject::Container container(makeOptions());
    container.bindInstance<Baz>(std::make_shared<Baz>("ok"));

    auto result = container.tryResolve<Bar>();
    REQUIRE_FALSE(result.hasError());
    REQUIRE(result.code() == ResultCode::OK);
    REQUIRE(result.value()->baz->value == "ok");
}
