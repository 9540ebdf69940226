// tests/di/test_dependency_context.cpp
#define BOOST_TEST_MODULE dependency_context_tests
#include <boost/test/unit_test.hpp>
#include <memory>
#include <string>
#include <vector>

#include "weave/di/di.hpp"

using namespace weave::di;

namespace {

struct Settings {
    std::string environment = "production";
};

class Service {
public:
    static int called;
    explicit Service(DependencyContext& context)
        : settings_(context.get<Settings>("settings")) {
        ++called;
    }

    const Settings& settings() const { return *settings_; }

private:
    std::shared_ptr<Settings> settings_;
};

int Service::called = 0;

struct ContextFixture {
    ContextFixture() {
        Service::called = 0;
        settings_calls = 0;
        provider = create_provider([this](ServiceRegistryBuilder& builder) {
            builder
                .add_singleton<Settings>("settings",
                                         [this] {
                                             ++settings_calls;
                                             return std::make_shared<Settings>();
                                         })
                .add_scoped<Service>("service");
        });
    }

    int settings_calls;
    std::unique_ptr<ServiceProvider> provider;
};

}  // namespace

BOOST_FIXTURE_TEST_SUITE(context_suite, ContextFixture)

BOOST_AUTO_TEST_CASE(test_access_is_lazy) {
    auto context = provider->begin();

    BOOST_CHECK_EQUAL(settings_calls, 0);
    BOOST_CHECK_EQUAL(Service::called, 0);

    context.get<Service>("service");
    BOOST_CHECK_EQUAL(settings_calls, 1);
    BOOST_CHECK_EQUAL(Service::called, 1);
}

BOOST_AUTO_TEST_CASE(test_exotic_value_overrides_registry) {
    auto override_settings = std::make_shared<Settings>();
    override_settings->environment = "test";

    ExoticContext exotic;
    exotic.set_value("settings", override_settings);
    auto context = provider->begin_scope()->create_context(exotic);

    BOOST_CHECK_EQUAL(context.get<Settings>("settings").get(),
                      override_settings.get());
    BOOST_CHECK_EQUAL(context.get<Settings>("settings").get(),
                      override_settings.get());
    BOOST_CHECK_EQUAL(context.get<Service>("service")->settings().environment,
                      "test");
    BOOST_CHECK_EQUAL(settings_calls, 0);
}

BOOST_AUTO_TEST_CASE(test_exotic_accessor_runs_on_every_access) {
    int accessor_calls = 0;
    ExoticContext exotic;
    exotic.set_accessor<Settings>("request_settings", [&accessor_calls] {
        ++accessor_calls;
        return std::make_shared<Settings>();
    });
    auto context = provider->begin_scope()->create_context(exotic);

    auto first = context.get<Settings>("request_settings");
    auto second = context.get<Settings>("request_settings");

    BOOST_CHECK_EQUAL(accessor_calls, 2);
    BOOST_CHECK_NE(first.get(), second.get());
    BOOST_CHECK_EQUAL(context.scope().scoped_count(), 0u);
}

BOOST_AUTO_TEST_CASE(test_exotic_entries_keep_order) {
    ExoticContext exotic;
    exotic.set_value("b", std::make_shared<Settings>())
        .set_value("a", std::make_shared<Settings>())
        .set_value("b", std::make_shared<Settings>());

    BOOST_CHECK_EQUAL(exotic.size(), 2u);
    BOOST_CHECK_EQUAL(exotic.names().front(), "b");
    BOOST_CHECK(exotic.contains("a"));
    BOOST_CHECK_THROW(exotic.get("missing"), ResolveError);
}

BOOST_AUTO_TEST_CASE(test_thenable_probe_is_empty) {
    auto context = provider->begin();

    BOOST_CHECK(context.resolve(DependencyContext::THENABLE_PROBE).empty());
    BOOST_CHECK(context.get<Settings>("then") == nullptr);
    BOOST_CHECK(!context.has("then"));
    BOOST_CHECK_EQUAL(settings_calls, 0);
}

BOOST_AUTO_TEST_CASE(test_has) {
    ExoticContext exotic;
    exotic.set_value("extra", std::make_shared<Settings>());
    auto context = provider->begin_scope()->create_context(exotic);

    BOOST_CHECK(context.has("settings"));
    BOOST_CHECK(context.has("service"));
    BOOST_CHECK(context.has("extra"));
    BOOST_CHECK(!context.has("missing"));
    BOOST_CHECK(!context.has(""));
}

BOOST_AUTO_TEST_CASE(test_resolve_all) {
    ExoticContext exotic;
    auto extra = std::make_shared<Settings>();
    exotic.set_value("extra", extra);
    auto context = provider->begin_scope()->create_context(exotic);

    InstanceMap instances = context.resolve_all();

    BOOST_CHECK_EQUAL(instances.size(), 3u);
    BOOST_CHECK_EQUAL(
        boost::any_cast<std::shared_ptr<Settings>>(instances.at("extra")).get(),
        extra.get());
    BOOST_CHECK(instances.count("settings") == 1);
    BOOST_CHECK(instances.count("service") == 1);
    BOOST_CHECK_EQUAL(
        boost::any_cast<std::shared_ptr<Service>>(instances.at("service"))
            .get(),
        context.get<Service>("service").get());
    BOOST_CHECK_EQUAL(Service::called, 1);
}

BOOST_AUTO_TEST_CASE(test_resolve_all_construction_order) {
    std::vector<std::string> order;
    auto ordered = create_provider([&order](ServiceRegistryBuilder& builder) {
        builder
            .add_transient<Settings>("zeta",
                                     [&order] {
                                         order.push_back("zeta");
                                         return std::make_shared<Settings>();
                                     })
            .add_transient<Settings>("alpha", [&order] {
                order.push_back("alpha");
                return std::make_shared<Settings>();
            });
    });

    ExoticContext exotic;
    exotic.set_accessor<Settings>("middle", [&order] {
        order.push_back("middle");
        return std::make_shared<Settings>();
    });
    auto context = ordered->begin_scope()->create_context(exotic);

    InstanceMap instances = context.resolve_all();

    BOOST_CHECK((order == std::vector<std::string>{"middle", "zeta", "alpha"}));
    std::vector<std::string> keys;
    for (const auto& [name, instance] : instances) {
        keys.push_back(name);
    }
    BOOST_CHECK((keys == std::vector<std::string>{"alpha", "middle", "zeta"}));
}

BOOST_AUTO_TEST_CASE(test_context_copies_share_scope) {
    auto context = provider->begin();
    DependencyContext copy = context;

    BOOST_CHECK_EQUAL(&copy.scope(), &context.scope());
    BOOST_CHECK_EQUAL(copy.get<Service>("service").get(),
                      context.get<Service>("service").get());
    BOOST_CHECK_EQUAL(Service::called, 1);
}

BOOST_AUTO_TEST_CASE(test_contexts_of_one_scope_share_cache) {
    auto scope = provider->begin_scope();
    ExoticContext exotic;
    exotic.set_value("extra", std::make_shared<Settings>());

    auto plain = scope->create_context();
    auto extended = scope->create_context(exotic);

    BOOST_CHECK_EQUAL(plain.get<Service>("service").get(),
                      extended.get<Service>("service").get());
    BOOST_CHECK(plain.exotic() == nullptr);
    BOOST_REQUIRE(extended.exotic() != nullptr);
    BOOST_CHECK_EQUAL(extended.exotic()->size(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
