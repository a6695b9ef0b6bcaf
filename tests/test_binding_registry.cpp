#include <catch2/catch.hpp>

#include "fixtures.hpp"

using namespace fixtures;

TEST_CASE("binding registry lookup", "[registry]") {
    inject::BindingRegistry registry;
    const auto baz = inject::getTypeKey<Baz>();

    SECTION("absent type yields no provider") {
        REQUIRE(registry.lookup(baz) == nullptr);
        REQUIRE_FALSE(registry.contains(baz));
        REQUIRE(registry.size() == 0);
    }

    SECTION("bound provider is returned as registered") {
        auto provider = std::make_shared<inject::InstanceProvider<Baz>>(std::make_shared<Baz>("a"));
        registry.bind(baz, provider);

        REQUIRE(registry.lookup(baz) == provider);
        REQUIRE(registry.lookup(baz)->providedType() == baz);
        REQUIRE(registry.contains(baz));
        REQUIRE_FALSE(registry.contains(inject::getTypeKey<Bar>()));
    }

    SECTION("last bind wins") {
        auto first = std::make_shared<inject::InstanceProvider<Baz>>(std::make_shared<Baz>("first"));
        auto second = std::make_shared<inject::InstanceProvider<Baz>>(std::make_shared<Baz>("second"));
        registry.bind(baz, first);
        registry.bind(baz, second);

        REQUIRE(registry.lookup(baz) == second);
        REQUIRE(registry.size() == 1);
    }
}

TEST_CASE("providers describe what they produce", "[registry]") {
    inject::InstanceProvider<Baz> instance(std::make_shared<Baz>("x"));
    inject::AliasProvider<Fooable, Foo> alias;

    REQUIRE(instance.providedType() == inject::getTypeKey<Baz>());
    REQUIRE(instance.name() == "instance of fixtures::Baz");
    REQUIRE(alias.providedType() == inject::getTypeKey<Fooable>());
    REQUIRE(alias.name() == "alias to fixtures::Foo");
}

TEST_CASE("container bindings land in its own registry", "[registry]") {
    inject::Container first(makeOptions());
    inject::Container second(makeOptions());

    first.bindInstance<Baz>(std::make_shared<Baz>("only here"));
    first.bindAlias<Fooable, Foo>();

    REQUIRE(first.isBound<Baz>());
    REQUIRE(first.isBound<Fooable>());
    REQUIRE_FALSE(first.isBound<Foo>());
    REQUIRE(first.registry().size() == 2);

    REQUIRE_FALSE(second.isBound<Baz>());
    REQUIRE(second.registry().size() == 0);
}

TEST_CASE("resolving never adds bindings", "[registry]") {
    inject::Container container(makeOptions());
    container.bindInstance<Baz>(std::make_shared<Baz>("v"));

    auto foo = container.resolve<Foo>();
    REQUIRE(foo != nullptr);
    REQUIRE(container.registry().size() == 1);
    REQUIRE_FALSE(container.isBound<Foo>());
    REQUIRE_FALSE(container.isBound<Bar>());
}
