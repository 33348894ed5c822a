#include <gtest/gtest.h>
#include "fusion_engine.hpp"
#include "errors.hpp"
#include <numeric>

namespace deepscan {

namespace {

BackboneResult constant_result(const std::string& name, size_t frames, double probability) {
    BackboneResult result;
    result.name = name;
    result.ready = true;
    for (size_t i = 0; i < frames; ++i) {
        result.probabilities.push_back({i, probability});
    }
    return result;
}

BackboneResult failed_result(const std::string& name) {
    BackboneResult result;
    result.name = name;
    result.ready = false;
    result.error = "load failed";
    return result;
}

double weight_sum(const std::map<std::string, double>& weights) {
    double total = 0.0;
    for (const auto& [name, weight] : weights) {
        total += weight;
    }
    return total;
}

} // namespace

class FusionEngineTest : public ::testing::Test {
protected:
    FusionConfig priors_config() {
        FusionConfig config;
        config.backbone_priors = {{"clip", 0.4}, {"resnet50", 0.5}, {"laa_net", 0.1}};
        return config;
    }
};

TEST_F(FusionEngineTest, WeightsFollowPriorsAndSumToOne) {
    FusionEngine engine(priors_config());

    auto weights = engine.compute_weights({"clip", "resnet50", "laa_net"});
    EXPECT_NEAR(weights["clip"], 0.4, 1e-12);
    EXPECT_NEAR(weights["resnet50"], 0.5, 1e-12);
    EXPECT_NEAR(weights["laa_net"], 0.1, 1e-12);
    EXPECT_NEAR(weight_sum(weights), 1.0, 1e-12);
}

TEST_F(FusionEngineTest, WeightsRenormalizeOverReadySubset) {
    FusionEngine engine(priors_config());

    auto weights = engine.compute_weights({"clip", "laa_net"});
    EXPECT_EQ(weights.size(), 2u);
    EXPECT_NEAR(weights["clip"], 0.8, 1e-12);
    EXPECT_NEAR(weights["laa_net"], 0.2, 1e-12);
    EXPECT_NEAR(weight_sum(weights), 1.0, 1e-12);
}

TEST_F(FusionEngineTest, MissingPriorDefaultsToOne) {
    FusionEngine engine(priors_config());

    auto weights = engine.compute_weights({"resnet50", "swin"});
    EXPECT_NEAR(weights["resnet50"], 0.5 / 1.5, 1e-12);
    EXPECT_NEAR(weights["swin"], 1.0 / 1.5, 1e-12);
}

TEST_F(FusionEngineTest, AllZeroPriorsFallBackToUniform) {
    FusionConfig config;
    config.backbone_priors = {{"a", 0.0}, {"b", 0.0}, {"c", 0.0}, {"d", 0.0}};
    FusionEngine engine(config);

    auto weights = engine.compute_weights({"a", "b", "c", "d"});
    for (const auto& [name, weight] : weights) {
        EXPECT_DOUBLE_EQ(weight, 0.25) << name;
    }
}

TEST_F(FusionEngineTest, NoReadyBackbone) {
    FusionEngine engine;
    EXPECT_THROW(engine.compute_weights({}), NoModelsAvailableError);
    EXPECT_THROW(engine.fuse(16, {failed_result("a"), failed_result("b")}), NoModelsAvailableError);
}

TEST_F(FusionEngineTest, UnanimousFakeEnsemble) {
    FusionEngine engine;
    std::vector<BackboneResult> results;
    for (const auto& name : {"resnet50", "efficientnet", "convnext", "clip"}) {
        results.push_back(constant_result(name, 16, 0.9));
    }

    auto outcome = engine.fuse(16, results);
    EXPECT_NEAR(outcome.video_probability, 0.9, 1e-12);
    EXPECT_EQ(outcome.verdict, Verdict::Fake);
    EXPECT_NEAR(outcome.overall_confidence, 0.8, 1e-12);
    EXPECT_EQ(outcome.frames.size(), 16u);
    EXPECT_TRUE(outcome.uncovered_frames.empty());
}

TEST_F(FusionEngineTest, DegradedEnsembleStillDecides) {
    FusionEngine engine;
    std::vector<BackboneResult> results = {
        constant_result("resnet50", 16, 0.2),
        constant_result("efficientnet", 16, 0.3),
        constant_result("convnext", 16, 0.25),
        failed_result("clip")
    };

    auto outcome = engine.fuse(16, results);
    EXPECT_NEAR(outcome.video_probability, 0.25, 1e-9);
    EXPECT_EQ(outcome.verdict, Verdict::Real);
    EXPECT_EQ(outcome.weights.size(), 3u);
    EXPECT_EQ(outcome.weights.count("clip"), 0u);
}

TEST_F(FusionEngineTest, MissingFrameBackbonePairIsExcluded) {
    FusionEngine engine;
    BackboneResult a = constant_result("a", 4, 0.8);
    BackboneResult b = constant_result("b", 4, 0.2);
    // b could not score frame 2
    b.probabilities.erase(b.probabilities.begin() + 2);
    b.dropped_frames = {2};

    auto outcome = engine.fuse(4, {a, b});
    ASSERT_EQ(outcome.frames.size(), 4u);
    EXPECT_NEAR(outcome.frames[0].probability, 0.5, 1e-12);
    EXPECT_EQ(outcome.frames[2].contributors, 1u);
    // Not pulled toward 0.5 by an imputed value
    EXPECT_NEAR(outcome.frames[2].probability, 0.8, 1e-12);
}

TEST_F(FusionEngineTest, UncoveredFramesAreOmitted) {
    FusionEngine engine;
    BackboneResult a;
    a.name = "a";
    a.ready = true;
    a.probabilities = {{0, 0.9}, {2, 0.7}};

    auto outcome = engine.fuse(3, {a});
    ASSERT_EQ(outcome.frames.size(), 2u);
    EXPECT_EQ(outcome.uncovered_frames, std::vector<size_t>{1});
    EXPECT_NEAR(outcome.video_probability, 0.8, 1e-12);
}

TEST_F(FusionEngineTest, WeightedPerFrameMean) {
    FusionEngine engine(priors_config());
    auto outcome = engine.fuse(1, {constant_result("clip", 1, 1.0), constant_result("laa_net", 1, 0.0)});

    EXPECT_NEAR(outcome.video_probability, 0.8, 1e-12);
}

TEST_F(FusionEngineTest, VideoProbabilityIsMeanOfFrames) {
    FusionEngine engine;
    BackboneResult a;
    a.name = "a";
    a.ready = true;
    a.probabilities = {{0, 0.1}, {1, 0.5}, {2, 0.9}};

    auto outcome = engine.fuse(3, {a});
    EXPECT_NEAR(outcome.video_probability, 0.5, 1e-12);
    EXPECT_EQ(outcome.verdict, Verdict::Suspicious);
    EXPECT_NEAR(outcome.overall_confidence, 0.0, 1e-12);
}

TEST_F(FusionEngineTest, ThresholdsAreInclusive) {
    FusionEngine engine;
    EXPECT_EQ(engine.classify(0.65), Verdict::Fake);
    EXPECT_EQ(engine.classify(0.35), Verdict::Real);
    EXPECT_EQ(engine.classify(0.6499), Verdict::Suspicious);
    EXPECT_EQ(engine.classify(0.3501), Verdict::Suspicious);
    EXPECT_EQ(engine.classify(1.0), Verdict::Fake);
    EXPECT_EQ(engine.classify(0.0), Verdict::Real);
}

TEST_F(FusionEngineTest, BoundarySurvivesWeightedRounding) {
    FusionConfig config;
    config.backbone_priors = {{"a", 0.3}, {"b", 0.7}};
    FusionEngine engine(config);

    // 0.3 * 0.65 + 0.7 * 0.65 is not exactly 0.65 in binary
    auto outcome = engine.fuse(1, {constant_result("a", 1, 0.65), constant_result("b", 1, 0.65)});
    EXPECT_EQ(outcome.verdict, Verdict::Fake);
}

TEST_F(FusionEngineTest, CustomThresholds) {
    FusionConfig config;
    config.high_threshold = 0.8;
    config.low_threshold = 0.2;
    FusionEngine engine(config);

    EXPECT_EQ(engine.classify(0.7), Verdict::Suspicious);
    EXPECT_EQ(engine.classify(0.8), Verdict::Fake);
    EXPECT_EQ(engine.classify(0.2), Verdict::Real);
}

TEST_F(FusionEngineTest, InvertedThresholdsRejected) {
    FusionConfig config;
    config.high_threshold = 0.3;
    config.low_threshold = 0.7;
    EXPECT_THROW(FusionEngine engine(config), ConfigError);
}

TEST_F(FusionEngineTest, SameInputSameOutcome) {
    FusionEngine engine(priors_config());
    std::vector<BackboneResult> results = {
        constant_result("clip", 8, 0.61), constant_result("resnet50", 8, 0.72)
    };

    auto first = engine.fuse(8, results);
    auto second = engine.fuse(8, results);
    EXPECT_EQ(first.verdict, second.verdict);
    EXPECT_DOUBLE_EQ(first.video_probability, second.video_probability);
}

} // namespace deepscan
