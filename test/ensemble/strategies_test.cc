#include <gtest/gtest.h>
#include "../../src/common/errors.h"
#include "../../src/ensemble/strategies.h"

#include <algorithm>
#include <limits>

using namespace Mosaic;

namespace {

// Reference user strategy: positional zip emitted as YAML
YAML::Node ZipStrategy(const ParamNames& names, const ParamValueLists& values, const StrategyOptions&) {
    YAML::Node out(YAML::NodeType::Sequence);
    for (const auto& assignment : StepValues(names, values)) {
        out.push_back(AssignmentToYaml(assignment));
    }
    return out;
}

} // namespace

class StrategiesTest : public ::testing::Test {
protected:
    void SetUp() override {
        space_.Add("h", std::vector<ParamValue>{int64_t{5}, int64_t{6}});
        space_.Add("g", std::vector<ParamValue>{int64_t{7}, int64_t{8}, int64_t{9}});
    }

    ParameterSpace space_;
};

TEST_F(StrategiesTest, AllPermutationsSingleKeyKeepsOrder) {
    ParameterSpace space;
    space.Add("h", std::vector<ParamValue>{int64_t{1}, std::string("two"), int64_t{3}});

    auto result = PermutationStrategy::AllPermutations().Expand(space, {});
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0].at("h"), ParamValue(int64_t{1}));
    EXPECT_EQ(result[1].at("h"), ParamValue(std::string("two")));
    EXPECT_EQ(result[2].at("h"), ParamValue(int64_t{3}));
}

TEST_F(StrategiesTest, AllPermutationsLastParameterVariesFastest) {
    auto result = PermutationStrategy::AllPermutations().Expand(space_, {});
    ASSERT_EQ(result.size(), 6u);

    const int64_t expected[6][2] = {{5, 7}, {5, 8}, {5, 9}, {6, 7}, {6, 8}, {6, 9}};
    for (size_t i = 0; i < result.size(); ++i) {
        EXPECT_EQ(std::get<int64_t>(result[i].at("h")), expected[i][0]) << "assignment " << i;
        EXPECT_EQ(std::get<int64_t>(result[i].at("g")), expected[i][1]) << "assignment " << i;
    }
}

TEST_F(StrategiesTest, SteppedTruncatesToShortestList) {
    auto result = PermutationStrategy::Stepped().Expand(space_, {});
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(std::get<int64_t>(result[0].at("h")), 5);
    EXPECT_EQ(std::get<int64_t>(result[0].at("g")), 7);
    EXPECT_EQ(std::get<int64_t>(result[1].at("h")), 6);
    EXPECT_EQ(std::get<int64_t>(result[1].at("g")), 8);
}

TEST_F(StrategiesTest, RandomDrawsCountMembers) {
    const std::vector<ParamValue> candidates{int64_t{4}, int64_t{5}, int64_t{6}, int64_t{7}, int64_t{8}};
    ParameterSpace space;
    space.Add("h", candidates);

    StrategyOptions options;
    options.count = 12;
    auto result = PermutationStrategy::Random().Expand(space, options);
    ASSERT_EQ(result.size(), 12u);
    for (const auto& assignment : result) {
        EXPECT_NE(std::find(candidates.begin(), candidates.end(), assignment.at("h")), candidates.end());
    }
}

TEST_F(StrategiesTest, RandomWithSeedIsReproducible) {
    StrategyOptions options;
    options.count = 8;
    options.seed = 42;
    auto first = PermutationStrategy::Random().Expand(space_, options);
    auto second = PermutationStrategy::Random().Expand(space_, options);
    EXPECT_EQ(first, second);
}

TEST_F(StrategiesTest, RandomRequiresCount) {
    EXPECT_THROW(PermutationStrategy::Random().Expand(space_, {}), ConfigurationError);
}

TEST_F(StrategiesTest, OversizedRandomCountIsRejected) {
    StrategyOptions options;
    options.count = std::numeric_limits<size_t>::max();
    EXPECT_THROW(PermutationStrategy::Random().Expand(space_, options), ConfigurationError);

    options.count = kMaxAssignments + 1;
    EXPECT_THROW(PermutationStrategy::Random().Expand(space_, options), ConfigurationError);
}

TEST_F(StrategiesTest, OversizedProductIsRejected) {
    std::vector<ParamValue> values;
    for (int64_t v = 0; v < 1000; ++v) {
        values.push_back(v);
    }
    ParameterSpace space;
    space.Add("a", values);
    space.Add("b", values);
    space.Add("c", values);
    EXPECT_THROW(PermutationStrategy::AllPermutations().Expand(space, {}), ConfigurationError);
}

TEST_F(StrategiesTest, UnknownNameListsBuiltins) {
    try {
        PermutationStrategy::FromName("not-a-strategy");
        FAIL() << "expected UnsupportedCapabilityError";
    } catch (const UnsupportedCapabilityError& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("all_perm"), std::string::npos);
        EXPECT_NE(msg.find("step"), std::string::npos);
        EXPECT_NE(msg.find("random"), std::string::npos);
    }
}

TEST_F(StrategiesTest, FromNameSelectsBuiltins) {
    EXPECT_EQ(PermutationStrategy::FromName("all_perm").kind(), PermutationStrategy::Kind::ALL_PERMUTATIONS);
    EXPECT_EQ(PermutationStrategy::FromName("step").kind(), PermutationStrategy::Kind::STEPPED);
    EXPECT_EQ(PermutationStrategy::FromName("random").kind(), PermutationStrategy::Kind::RANDOM);
}

TEST_F(StrategiesTest, CustomStrategyMatchesBuiltin) {
    auto custom = PermutationStrategy::Custom("zip", ZipStrategy);
    EXPECT_EQ(custom.Expand(space_, {}), PermutationStrategy::Stepped().Expand(space_, {}));
}

TEST_F(StrategiesTest, CustomStrategyKeepsStringValues) {
    ParameterSpace space;
    space.Add("label", std::vector<ParamValue>{std::string("10"), std::string("abc")});

    auto result = PermutationStrategy::Custom("zip", ZipStrategy).Expand(space, {});
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].at("label"), ParamValue(std::string("10")));
    EXPECT_EQ(result[1].at("label"), ParamValue(std::string("abc")));
}

TEST_F(StrategiesTest, CustomStrategyKeepsNumericLookingStrings) {
    ParameterSpace space;
    space.Add("label", std::vector<ParamValue>{std::string("10"), std::string("007")});
    auto echo = PermutationStrategy::Custom("echo",
            [](const ParamNames&, const ParamValueLists&, const StrategyOptions&) {
                YAML::Node out(YAML::NodeType::Sequence);
                for (const std::string label : {"10", "007"}) {
                    YAML::Node assignment;
                    assignment["label"] = label;
                    out.push_back(assignment);
                }
                return out;
            });

    auto result = echo.Expand(space, {});
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].at("label"), ParamValue(std::string("10")));
    EXPECT_EQ(result[1].at("label"), ParamValue(std::string("007")));
}

TEST_F(StrategiesTest, CustomStrategyKeepsIntegerValues) {
    auto echo = PermutationStrategy::Custom("echo",
            [](const ParamNames&, const ParamValueLists&, const StrategyOptions&) {
                YAML::Node assignment;
                assignment["h"] = int64_t{6};
                assignment["g"] = int64_t{9};
                YAML::Node out(YAML::NodeType::Sequence);
                out.push_back(assignment);
                return out;
            });

    auto result = echo.Expand(space_, {});
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].at("h"), ParamValue(int64_t{6}));
    EXPECT_EQ(result[0].at("g"), ParamValue(int64_t{9}));
}

TEST_F(StrategiesTest, NonListResultNamesStrategy) {
    auto bad = PermutationStrategy::Custom("returns_scalar",
            [](const ParamNames&, const ParamValueLists&, const StrategyOptions&) {
                return YAML::Node(-1);
            });
    try {
        bad.Expand(space_, {});
        FAIL() << "expected StrategyContractError";
    } catch (const StrategyContractError& e) {
        EXPECT_EQ(e.strategy(), "returns_scalar");
        EXPECT_NE(std::string(e.what()).find("returns_scalar"), std::string::npos);
    }
}

TEST_F(StrategiesTest, ListOfListsIsRejected) {
    auto bad = PermutationStrategy::Custom("returns_lists",
            [](const ParamNames&, const ParamValueLists& values, const StrategyOptions&) {
                YAML::Node out(YAML::NodeType::Sequence);
                YAML::Node inner(YAML::NodeType::Sequence);
                for (const auto& value : values[0]) inner.push_back(ParamValueToYaml(value));
                out.push_back(inner);
                return out;
            });
    EXPECT_THROW(bad.Expand(space_, {}), StrategyContractError);
}

TEST_F(StrategiesTest, NestedValueIsRejected) {
    auto bad = PermutationStrategy::Custom("nested",
            [](const ParamNames&, const ParamValueLists&, const StrategyOptions&) {
                return YAML::Load("[{h: [5, 6], g: 7}]");
            });
    EXPECT_THROW(bad.Expand(space_, {}), StrategyContractError);
}

TEST_F(StrategiesTest, MissingOrUnknownParameterIsRejected) {
    auto missing = PermutationStrategy::Custom("missing",
            [](const ParamNames&, const ParamValueLists&, const StrategyOptions&) {
                return YAML::Load("[{h: 5}]");
            });
    EXPECT_THROW(missing.Expand(space_, {}), StrategyContractError);

    auto unknown = PermutationStrategy::Custom("unknown",
            [](const ParamNames&, const ParamValueLists&, const StrategyOptions&) {
                return YAML::Load("[{h: 5, g: 7, z: 1}]");
            });
    EXPECT_THROW(unknown.Expand(space_, {}), StrategyContractError);
}

TEST_F(StrategiesTest, ThrowingStrategyIsWrapped) {
    auto bad = PermutationStrategy::Custom("throws",
            [](const ParamNames&, const ParamValueLists&, const StrategyOptions&) -> YAML::Node {
                throw std::runtime_error("boom");
            });
    EXPECT_THROW(bad.Expand(space_, {}), StrategyContractError);
}

TEST_F(StrategiesTest, CustomStrategyReceivesOptions) {
    StrategyOptions options;
    options.extra["pick"] = "1";
    auto pick = PermutationStrategy::Custom("pick",
            [](const ParamNames& names, const ParamValueLists& values, const StrategyOptions& opts) {
                size_t index = std::stoul(opts.extra.at("pick"));
                ParamAssignment assignment;
                for (size_t i = 0; i < names.size(); ++i) assignment[names[i]] = values[i][index];
                YAML::Node out(YAML::NodeType::Sequence);
                out.push_back(AssignmentToYaml(assignment));
                return out;
            });
    auto result = pick.Expand(space_, options);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(result[0].at("h")), 6);
    EXPECT_EQ(std::get<int64_t>(result[0].at("g")), 8);
}

TEST_F(StrategiesTest, NullCallableIsRejected) {
    EXPECT_THROW(PermutationStrategy::Custom("null", nullptr), TypeError);
}
