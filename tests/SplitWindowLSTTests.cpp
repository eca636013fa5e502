#include "lst/SplitWindowLST.hpp"
#include "ExpressionEvaluator.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>
#include <fmt/format.h>

#include <cmath>
#include <limits>
#include <thread>

using namespace splitwindow;
using splitwindow::test::ExpectSplitWindowError;
using splitwindow::test::ExpressionEvaluator;
using splitwindow::test::PublishedWithoutFullRange;
using splitwindow::test::ReplaceAll;
using splitwindow::test::SingleSubrangeTable;

namespace {

// Hand evaluation of the split-window equation, term by term
f64 HandEvaluate(const Array<f64, 8>& b, f64 e10, f64 e11, f64 t10, f64 t11) {
    f64 ae = 0.5 * (e10 + e11);
    f64 de = e10 - e11;
    return b[0]
         + (b[1] + b[2] * ((1 - ae) / ae))
         + b[3] * (de / ae) * ((t10 + t11) / 2)
         + (b[4] + b[5] * ((1 - ae) / ae) + b[6] * (de / (ae * ae))) * ((t10 - t11) / 2)
         + b[7] * ((t10 - t11) * (t10 - t11));
}

const Array<f64, 8> kRange1 = {-2.78009, 1.01408, 0.15833, -0.34991, 4.04487, 3.55414, -8.88394, 0.09152};

} // namespace

// ============================================================================
// Input validation
// ============================================================================

TEST(CheckT1xRange, AcceptsDigitalNumberDomain) {
    EXPECT_NO_THROW(CheckT1xRange(1.0));
    EXPECT_NO_THROW(CheckT1xRange(295.0));
    EXPECT_NO_THROW(CheckT1xRange(4095.0));
    EXPECT_NO_THROW(CheckT1xRange(65535.0));
}

TEST(CheckT1xRange, RejectsOutsideDomain) {
    for (f64 dn : {0.0, 0.999, -5.0, 65535.5, 70000.0, std::numeric_limits<f64>::quiet_NaN()}) {
        ExpectSplitWindowError([dn] { CheckT1xRange(dn); }, ErrorCode::OutOfRangeInput);
    }
}

TEST(CheckT1xRange, MessageNamesOperandAndValue) {
    try {
        CheckT1xRange(0.0, "T11");
        FAIL() << "Expected OutOfRangeInput";
    } catch (const SplitWindowError& err) {
        String message = err.what();
        EXPECT_NE(message.find("T11 = 0"), String::npos) << message;
    }
}

TEST(SplitWindowLST, ComputeRejectsOutOfRangeOperands) {
    SplitWindowLST lst(0.97, 0.98, 1.5, PublishedWithoutFullRange());

    try {
        lst.ComputeLST(0.0, 295.0);
        FAIL() << "Expected OutOfRangeInput";
    } catch (const SplitWindowError& err) {
        EXPECT_EQ(err.code(), ErrorCode::OutOfRangeInput);
        String message = err.what();
        EXPECT_NE(message.find("T10 = 0"), String::npos) << message;
        EXPECT_EQ(message.find("T11"), String::npos) << message;
    }

    try {
        lst.ComputeLST(300.0, 70000.0);
        FAIL() << "Expected OutOfRangeInput";
    } catch (const SplitWindowError& err) {
        String message = err.what();
        EXPECT_EQ(message.find("T10"), String::npos) << message;
        EXPECT_NE(message.find("T11 = 70000"), String::npos) << message;
    }
}

TEST(SplitWindowLST, ComputeReportsBothOperandsInOrder) {
    SplitWindowLST lst(0.97, 0.98, 1.5, PublishedWithoutFullRange());

    try {
        lst.ComputeLST(-1.0, 65536.0);
        FAIL() << "Expected OutOfRangeInput";
    } catch (const SplitWindowError& err) {
        String message = err.what();
        usize t10 = message.find("T10 = -1");
        usize t11 = message.find("T11 = 65536");
        ASSERT_NE(t10, String::npos) << message;
        ASSERT_NE(t11, String::npos) << message;
        EXPECT_LT(t10, t11);
    }
}

TEST(SplitWindowLST, RejectsInvalidEmissivity) {
    CoefficientTable table = PublishedWithoutFullRange();

    for (f64 e : {0.0, -0.1, 1.01, std::numeric_limits<f64>::quiet_NaN()}) {
        ExpectSplitWindowError([&] { SplitWindowLST lst(e, 0.98, 1.5, table); },
                               ErrorCode::InvalidEmissivity);
        ExpectSplitWindowError([&] { SplitWindowLST lst(0.97, e, 1.5, table); },
                               ErrorCode::InvalidEmissivity);
    }

    EXPECT_NO_THROW(SplitWindowLST(1.0, 1.0, 1.5, table));
}

TEST(SplitWindowLST, ConstructionFailsWithoutMatchingSubrange) {
    CoefficientTable table = CoefficientTable::Published();

    ExpectSplitWindowError([&] { SplitWindowLST lst(0.97, 0.98, 0.0, table); },
                           ErrorCode::NoMatchingSubrange);
    ExpectSplitWindowError([&] { SplitWindowLST lst(0.97, 0.98, 7.0, table); },
                           ErrorCode::NoMatchingSubrange);
}

TEST(SplitWindowLST, ConstructionHonoursRejectAmbiguous) {
    SplitWindowOptions options;
    options.tieBreak = SubrangeTieBreak::RejectAmbiguous;

    ExpectSplitWindowError(
        [&] { SplitWindowLST lst(0.97, 0.98, 1.5, CoefficientTable::Published(), options); },
        ErrorCode::AmbiguousSubrange);
}

// ============================================================================
// Derived state
// ============================================================================

TEST(SplitWindowLST, DerivedEmissivityTerms) {
    SplitWindowLST lst(0.97, 0.98, 1.5, PublishedWithoutFullRange());

    EXPECT_DOUBLE_EQ(lst.GetEmissivityT10(), 0.97);
    EXPECT_DOUBLE_EQ(lst.GetEmissivityT11(), 0.98);
    EXPECT_DOUBLE_EQ(lst.GetAverageEmissivity(), 0.975);
    EXPECT_DOUBLE_EQ(lst.GetDeltaEmissivity(), 0.97 - 0.98);
    EXPECT_DOUBLE_EQ(lst.GetColumnWaterVapour(), 1.5);
}

TEST(SplitWindowLST, ExposesResolvedSubrange) {
    SplitWindowLST lst(0.97, 0.98, 1.5, PublishedWithoutFullRange());

    EXPECT_EQ(lst.GetSubrangeKey(), "Range_1");
    EXPECT_EQ(lst.GetCwvCoefficients(), kRange1);
    EXPECT_DOUBLE_EQ(lst.GetRMSE(), 0.34);
    EXPECT_EQ(lst.ReportRMSE(), "Associated RMSE: 0.34");
}

TEST(SplitWindowLST, SeededConstructionIsReproducible) {
    SplitWindowOptions options;
    options.seed = 99;

    CoefficientTable table = CoefficientTable::Published();
    SplitWindowLST first(0.97, 0.98, 1.5, table, options);
    SplitWindowLST second(0.97, 0.98, 1.5, table, options);
    EXPECT_EQ(first.GetSubrangeKey(), second.GetSubrangeKey());

    std::mt19937 rngA(5);
    std::mt19937 rngB(5);
    SplitWindowLST third(0.97, 0.98, 1.5, table, SubrangeTieBreak::Random, rngA);
    SplitWindowLST fourth(0.97, 0.98, 1.5, table, SubrangeTieBreak::Random, rngB);
    EXPECT_EQ(third.GetSubrangeKey(), fourth.GetSubrangeKey());
    EXPECT_TRUE(third.GetSubrangeKey() == "Range_1" || third.GetSubrangeKey() == "Range_6");
}

// ============================================================================
// Evaluation
// ============================================================================

TEST(SplitWindowLST, ConstantCoefficientsCollapseToB0PlusB1) {
    SplitWindowLST lst(0.98, 0.98, 1.5, SingleSubrangeTable({-1.0, 4.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0}));

    EXPECT_DOUBLE_EQ(lst.GetDeltaEmissivity(), 0.0);
    EXPECT_DOUBLE_EQ(lst.ComputeLST(300.0, 295.0), 3.0);
    EXPECT_DOUBLE_EQ(lst.ComputeLST(295.0, 300.0), 3.0);
    EXPECT_DOUBLE_EQ(lst.ComputeLST(1.0, 65535.0), 3.0);
}

TEST(SplitWindowLST, GoldenPublishedCoefficients) {
    SplitWindowLST lst(0.97, 0.98, 1.5, PublishedWithoutFullRange());

    Kelvin value = lst.ComputeLST(300.0, 295.0);
    EXPECT_DOUBLE_EQ(value, HandEvaluate(kRange1, 0.97, 0.98, 300.0, 295.0));
    EXPECT_NEAR(value, 12.167362521367524, 1e-9);
}

TEST(SplitWindowLST, FullRangeSubrangeGolden) {
    CoefficientTable table;
    table.subranges.push_back(*CoefficientTable::Published().Get("Range_6"));

    SplitWindowLST lst(0.97, 0.98, 1.5, table);
    EXPECT_NEAR(lst.ComputeLST(300.0, 295.0), 17.750259095989485, 1e-9);
}

TEST(SplitWindowLST, ComputeIsIdempotent) {
    SplitWindowLST lst(0.97, 0.98, 1.5, PublishedWithoutFullRange());

    Kelvin first = lst.ComputeLST(301.25, 298.5);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(lst.ComputeLST(301.25, 298.5), first);
    }
}

TEST(SplitWindowLST, SwappingBandsFlipsOnlyDifferenceTerms) {
    SplitWindowLST lst(0.97, 0.98, 1.5, PublishedWithoutFullRange());

    Kelvin forward = lst.ComputeLST(300.0, 295.0);
    Kelvin swapped = lst.ComputeLST(295.0, 300.0);
    EXPECT_NEAR(swapped, -8.979914829059828, 1e-9);

    // b0, b1/b2, b3 and b7 terms are symmetric; the (t10 - t11)/2 term changes sign
    f64 ae = 0.975;
    f64 de = 0.97 - 0.98;
    f64 symmetric = kRange1[0]
                  + (kRange1[1] + kRange1[2] * ((1 - ae) / ae))
                  + kRange1[3] * (de / ae) * 297.5
                  + kRange1[7] * 25.0;
    EXPECT_NEAR(forward + swapped, 2.0 * symmetric, 1e-9);

    f64 antisymmetric = (kRange1[4] + kRange1[5] * ((1 - ae) / ae) + kRange1[6] * (de / (ae * ae))) * 2.5;
    EXPECT_NEAR(forward - swapped, 2.0 * antisymmetric, 1e-9);
}

TEST(SplitWindowLST, ConcurrentComputeMatchesSequential) {
    const SplitWindowLST lst(0.971, 0.968, 2.2, PublishedWithoutFullRange());
    const Kelvin expected = lst.ComputeLST(290.0, 288.0);

    std::vector<Kelvin> results(8, 0.0);
    std::vector<std::thread> workers;
    for (usize i = 0; i < results.size(); ++i) {
        workers.emplace_back([&lst, &results, i] {
            for (int n = 0; n < 1000; ++n) {
                results[i] = lst.ComputeLST(290.0, 288.0);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (Kelvin value : results) {
        EXPECT_EQ(value, expected);
    }
}

// ============================================================================
// Rendering
// ============================================================================

TEST(SplitWindowLST, ReportLSTKeepsFullPrecision) {
    SplitWindowLST lst(0.97, 0.98, 1.5, PublishedWithoutFullRange());

    EXPECT_EQ(lst.ReportLST(300.0, 295.0), "300 295 12.167362521367524");
    EXPECT_EQ(lst.ReportLST(300.5, 295.25),
              fmt::format("300.5 295.25 {}", lst.ComputeLST(300.5, 295.25)));
    ExpectSplitWindowError([&] { (void)lst.ReportLST(0.0, 295.0); }, ErrorCode::OutOfRangeInput);
}

TEST(SplitWindowLST, EquationIsSymbolic) {
    EXPECT_EQ(SplitWindowLST::GetEquation(),
              "[b0 + (b1 + b2*((1-ae)/ae)) + b3*(de/ae) * ((t10 + t11)/2) + "
              "(b4 + b5*((1-ae)/ae) + b6*(de/ae^2))*((t10 - t11)/2) + b7*(t10 - t11)^2]");
}

TEST(SplitWindowLST, ModelSubstitutesCoefficientsAndEmissivities) {
    SplitWindowLST lst(0.98, 0.98, 1.5, SingleSubrangeTable({-1.0, 4.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0}));

    EXPECT_EQ(lst.RenderModel(),
              "[-1 + (4 + 0*((1-0.98)/0.98)) + 0*(0/0.98) * ((0.98 + 0.98)/2) + "
              "(0 + 0*((1-0.98)/0.98) + 0*(0/0.98^2))*((0.98 - 0.98)/2) + 0*(0.98 - 0.98)^2]");
}

TEST(SplitWindowLST, ToStringShowsEquationAndModel) {
    SplitWindowLST lst(0.97, 0.98, 1.5, PublishedWithoutFullRange());
    String text = lst.ToString();

    EXPECT_EQ(text.rfind("   > The equation: [b0 + ", 0), 0u);
    EXPECT_NE(text.find("\n   > The model: [-2.78009 + (1.01408 + "), String::npos) << text;
}

TEST(SplitWindowLST, FormulaKeepsPlaceholderTokens) {
    SplitWindowLST lst(0.97, 0.98, 1.5, PublishedWithoutFullRange());
    String formula = lst.RenderFormula();

    EXPECT_STREQ(constants::MAPCALC_TOKEN_T10, "Input_T10");
    EXPECT_STREQ(constants::MAPCALC_TOKEN_T11, "Input_T11");
    EXPECT_NE(formula.find("((Input_T10 + Input_T11)/2)"), String::npos) << formula;
    EXPECT_NE(formula.find("(Input_T10 - Input_T11)^2"), String::npos) << formula;
    EXPECT_EQ(formula.find('['), String::npos);
    EXPECT_EQ(formula, lst.RenderFormula());
}

TEST(SplitWindowLST, SubstitutedFormulaMatchesCompute) {
    CoefficientTable table = PublishedWithoutFullRange();

    struct Case { f64 e10, e11, cwv, t10, t11; };
    for (const Case& c : {Case{0.97, 0.98, 1.5, 300.0, 295.0},
                          Case{0.995, 0.996, 2.8, 288.5, 286.25},
                          Case{0.969, 0.978, 4.7, 310.0, 312.0},
                          Case{0.992, 0.998, 5.9, 273.15, 270.0}}) {
        SplitWindowLST lst(c.e10, c.e11, c.cwv, table);

        String expression = lst.RenderFormula();
        expression = ReplaceAll(expression, constants::MAPCALC_TOKEN_T10, fmt::format("{}", c.t10));
        expression = ReplaceAll(expression, constants::MAPCALC_TOKEN_T11, fmt::format("{}", c.t11));

        EXPECT_DOUBLE_EQ(ExpressionEvaluator::Evaluate(expression), lst.ComputeLST(c.t10, c.t11))
            << lst.GetSubrangeKey() << ": " << expression;
    }
}

// ============================================================================
// Configuration
// ============================================================================

TEST(SplitWindowLST, FromConfigWithExplicitEmissivities) {
    auto config = Config::Parse(R"(
        [scene]
        emissivity_b10 = 0.97
        emissivity_b11 = 0.98
        cwv = 1.5
    )");
    ASSERT_TRUE(config.has_value()) << config.error();

    auto lst = SplitWindowLST::FromConfig(*config, PublishedWithoutFullRange(), EmissivityTable::Published());
    ASSERT_TRUE(lst.has_value()) << lst.error();
    EXPECT_EQ(lst->GetSubrangeKey(), "Range_1");
    EXPECT_NEAR(lst->ComputeLST(300.0, 295.0), 12.167362521367524, 1e-9);
}

TEST(SplitWindowLST, FromConfigLooksUpLandCover) {
    auto config = Config::Parse(R"(
        [scene]
        land_cover = "Forest"
        emissivity_b10 = 0.5
        cwv = 3
    )");
    ASSERT_TRUE(config.has_value()) << config.error();

    auto lst = SplitWindowLST::FromConfig(*config, PublishedWithoutFullRange(), EmissivityTable::Published());
    ASSERT_TRUE(lst.has_value()) << lst.error();
    EXPECT_DOUBLE_EQ(lst->GetEmissivityT10(), 0.995);
    EXPECT_DOUBLE_EQ(lst->GetEmissivityT11(), 0.996);
    EXPECT_DOUBLE_EQ(lst->GetColumnWaterVapour(), 3.0);
}

TEST(SplitWindowLST, FromConfigReportsProblems) {
    CoefficientTable table = CoefficientTable::Published();
    EmissivityTable emissivities = EmissivityTable::Published();

    auto expectError = [&](const char* toml, const char* fragment) {
        auto config = Config::Parse(toml);
        ASSERT_TRUE(config.has_value()) << config.error();
        auto lst = SplitWindowLST::FromConfig(*config, table, emissivities);
        ASSERT_FALSE(lst.has_value()) << toml;
        EXPECT_NE(lst.error().find(fragment), String::npos) << lst.error();
    };

    expectError("[scene]\nemissivity_b10 = 0.97\nemissivity_b11 = 0.98\n", "scene.cwv");
    expectError("[scene]\ncwv = 1.5\nemissivity_b10 = 0.97\n", "scene.emissivity_b11");
    expectError("[scene]\ncwv = 1.5\nland_cover = \"Ocean\"\n", "Ocean");
    expectError("[scene]\ncwv = 1.5\nland_cover = \"Forest\"\n[coefficients]\ntie_break = \"first\"\n", "tie_break");
    expectError("[scene]\ncwv = 1.5\nland_cover = \"Forest\"\n[coefficients]\ntie_break = \"reject_ambiguous\"\n",
                "Ambiguous");
    expectError("[scene]\ncwv = 9.0\nland_cover = \"Forest\"\n", "No matching");
    expectError("[scene]\ncwv = 1.5\nemissivity_b10 = 0.0\nemissivity_b11 = 0.98\n", "Invalid emissivity");
}

TEST(SplitWindowLST, FromConfigRejectsSeedBeyondUnsigned32) {
    auto config = Config::Parse(R"(
        [scene]
        land_cover = "Cropland"
        cwv = 1.5

        [coefficients]
        seed = 4294967338
    )");
    ASSERT_TRUE(config.has_value()) << config.error();

    auto lst = SplitWindowLST::FromConfig(*config, CoefficientTable::Published(), EmissivityTable::Published());
    ASSERT_FALSE(lst.has_value());
    EXPECT_EQ(lst.error(), "Type mismatch for key: coefficients.seed");
}

TEST(SplitWindowLST, FromConfigSeedFixesTieBreak) {
    auto config = Config::Parse(R"(
        [scene]
        land_cover = "Cropland"
        cwv = 1.5

        [coefficients]
        tie_break = "random"
        seed = 42
    )");
    ASSERT_TRUE(config.has_value()) << config.error();

    CoefficientTable table = CoefficientTable::Published();
    auto first = SplitWindowLST::FromConfig(*config, table, EmissivityTable::Published());
    auto second = SplitWindowLST::FromConfig(*config, table, EmissivityTable::Published());
    ASSERT_TRUE(first.has_value()) << first.error();
    ASSERT_TRUE(second.has_value()) << second.error();
    EXPECT_EQ(first->GetSubrangeKey(), second->GetSubrangeKey());
}
