#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "core/Runner.h"
#include "core/Errors.h"
#include "examples/Catalog.h"
#include "examples/ChainOfResponsibilityExample.h"
#include "examples/DeterministicSource.h"
#include "examples/IteratorExample.h"
#include "examples/FlyweightExample.h"
#include "examples/InterpreterExample.h"
#include "examples/ProxyExample.h"
#include "examples/SingletonExample.h"
#include <set>
#include <stdexcept>

namespace pattern_harness {

class CatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        // timing is covered in test_runner
        config.time_budget_ms = 0;
    }

    Config config;
};

TEST_F(CatalogTest, TwentyThreeUniqueNames) {
    auto specs = examples::default_catalog(config);
    ASSERT_EQ(specs.size(), 23u);
    std::set<std::string> names;
    for (const auto& s : specs) names.insert(s.name);
    EXPECT_EQ(names.size(), 23u);
}

TEST_F(CatalogTest, CategoryCounts) {
    int creational = 0, structural = 0, behavioral = 0;
    for (const auto& s : examples::default_catalog(config)) {
        switch (s.category) {
            case Category::Creational: ++creational; break;
            case Category::Structural: ++structural; break;
            case Category::Behavioral: ++behavioral; break;
        }
    }
    EXPECT_EQ(creational, 5);
    EXPECT_EQ(structural, 7);
    EXPECT_EQ(behavioral, 11);
}

TEST_F(CatalogTest, DescribeMatchesRegisteredName) {
    for (const auto& s : examples::default_catalog(config)) {
        ExamplePtr ex = s.factory();
        ASSERT_NE(ex, nullptr) << s.name;
        ExampleInfo info = ex->describe();
        EXPECT_EQ(info.name, s.name);
        EXPECT_FALSE(info.intent.empty()) << s.name;
    }
}

TEST_F(CatalogTest, EveryExampleSucceedsByDefault) {
    ExampleRegistry registry;
    registry.register_all_default(config);
    Runner runner(registry, config);

    auto results = runner.run_all();
    ASSERT_EQ(results.size(), 23u);
    for (const auto& r : results) {
        EXPECT_EQ(r.status, RunStatus::Success) << r.name << ": " << r.failure_reason.value_or("");
        EXPECT_FALSE(r.output.empty()) << r.name;
    }
}

TEST_F(CatalogTest, RepeatedRunsAreIdentical) {
    ExampleRegistry registry;
    registry.register_all_default(config);
    Runner runner(registry, config);

    auto first = runner.run_all();
    auto second = runner.run_all();
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].output, second[i].output) << first[i].name;
    }
}

TEST_F(CatalogTest, SingletonConstructedOnce) {
    ExampleRegistry registry;
    registry.register_all_default(config);
    Runner runner(registry, config);

    runner.run_one("Singleton");
    runner.run_one("Singleton");
    EXPECT_EQ(examples::President::constructions(), 1);
    EXPECT_EQ(&examples::President::instance(), &examples::President::instance());
}

TEST_F(CatalogTest, FlyweightDependsOnlyOnSeed) {
    examples::FlyweightExample a(7), b(7);
    a.setup();
    b.setup();
    auto out_a = a.run();
    EXPECT_EQ(out_a, b.run());
    EXPECT_EQ(out_a, a.run());
    ASSERT_EQ(out_a.size(), static_cast<std::size_t>(examples::FlyweightExample::kCircles) + 1);
    EXPECT_THAT(out_a.front(), ::testing::StartsWith("circle #1 color="));
    EXPECT_THAT(out_a.back(), ::testing::StartsWith("flyweights created: "));
}

TEST_F(CatalogTest, ChainRepeatsOnSameInstance) {
    examples::ChainOfResponsibilityExample chain;
    chain.setup();
    auto first = chain.run();
    EXPECT_EQ(chain.run(), first);
    EXPECT_THAT(first, ::testing::Contains("paid 259 using bitcoin"));
}

TEST_F(CatalogTest, IteratorRepeatsOnSameInstance) {
    examples::IteratorExample iterator;
    iterator.setup();
    auto first = iterator.run();
    EXPECT_EQ(iterator.run(), first);
    ASSERT_FALSE(first.empty());
    EXPECT_EQ(first.front(), "removed: 1");
}

TEST_F(CatalogTest, DeterministicSourceRejectsEmptyRange) {
    examples::DeterministicSource source(1);
    EXPECT_THROW(source.next(0), std::invalid_argument);
    EXPECT_LT(source.next(4), 4u);
}

TEST_F(CatalogTest, FlyweightSharesStyles) {
    examples::CircleStyleFactory styles;
    const examples::CircleStyle& first = styles.get("red");
    const examples::CircleStyle& second = styles.get("red");
    EXPECT_EQ(&first, &second);
    styles.get("blue");
    EXPECT_EQ(styles.size(), 2u);
}

TEST_F(CatalogTest, SimulatedOutageErrorsOnlyNamedExamples) {
    config.simulate_unavailable = {"Proxy", "Facade"};
    ExampleRegistry registry;
    registry.register_all_default(config);
    Runner runner(registry, config);

    auto results = runner.run_all();
    ASSERT_EQ(results.size(), 23u);
    for (const auto& r : results) {
        if (r.name == "Proxy" || r.name == "Facade") {
            EXPECT_EQ(r.status, RunStatus::Error) << r.name;
            EXPECT_EQ(r.state, RunState::Errored);
            EXPECT_EQ(r.failure_reason.value_or(""),
                      "setup: collaborator unavailable for " + r.name + " (simulated)");
            EXPECT_TRUE(r.output.empty());
        } else {
            EXPECT_EQ(r.status, RunStatus::Success) << r.name;
        }
    }
}

TEST_F(CatalogTest, OutageKeepsDescription) {
    config.simulate_unavailable = {"Bridge"};
    for (const auto& s : examples::default_catalog(config)) {
        if (s.name != "Bridge") continue;
        ExamplePtr ex = s.factory();
        EXPECT_EQ(ex->describe().name, "Bridge");
        EXPECT_THROW(ex->setup(), SetupError);
    }
}

TEST_F(CatalogTest, CategoryFilterSelectsCreational) {
    config.category = "creational";
    ExampleRegistry registry;
    registry.register_all_default(config);
    Runner runner(registry, config);

    auto results = runner.run_all();
    ASSERT_EQ(results.size(), 5u);
    EXPECT_EQ(results.front().name, "AbstractFactory");
    EXPECT_EQ(results.back().name, "Singleton");
}

TEST_F(CatalogTest, RunBeforeSetupIsRejected) {
    examples::ProxyExample proxy;
    EXPECT_THROW(proxy.run(), std::logic_error);
    proxy.setup();
    EXPECT_EQ(proxy.run().size(), 3u);
}

TEST_F(CatalogTest, InterpreterEvaluatesPostfix) {
    auto expr = examples::parse_postfix("6 2 / 1 -");
    EXPECT_EQ(expr->interpret(), 2);
    EXPECT_EQ(expr->to_string(), "((6 / 2) - 1)");
}

TEST_F(CatalogTest, InterpreterRejectsMalformedPrograms) {
    EXPECT_THROW(examples::parse_postfix("1 +"), std::invalid_argument);
    EXPECT_THROW(examples::parse_postfix("1 2"), std::invalid_argument);
    EXPECT_THROW(examples::parse_postfix("1 x +"), std::invalid_argument);
    EXPECT_THROW(examples::parse_postfix(""), std::invalid_argument);
}

}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
