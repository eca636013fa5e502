#include "SplitWindowLST.hpp"
#include "core/Log.hpp"

SW_DISABLE_WARNINGS_PUSH
#include <fmt/format.h>
SW_DISABLE_WARNINGS_POP

namespace splitwindow {

namespace {

// Symbolic equation, as reported to users
constexpr const char* kEquation =
    "[b0 + "
    "(b1 + "
    "b2*((1-ae)/ae)) + "
    "b3*(de/ae) * ((t10 + t11)/2) + "
    "(b4 + "
    "b5*((1-ae)/ae) + "
    "b6*(de/ae^2))*((t10 - t11)/2) + "
    "b7*(t10 - t11)^2]";

// Model with coefficients and emissivities substituted
constexpr const char* kModelTemplate =
    "[{b0} + "
    "({b1} + "
    "{b2}*((1-{ae})/{ae})) + "
    "{b3}*({de}/{ae}) * (({t10} + {t11})/2) + "
    "({b4} + "
    "{b5}*((1-{ae})/{ae}) + "
    "{b6}*({de}/{ae}^2))*(({t10} - {t11})/2) + "
    "{b7}*({t10} - {t11})^2]";

// r.mapcalc expression; coefficients are parenthesised so negative values stay unambiguous
constexpr const char* kFormulaTemplate =
    "{b0} + "
    "({b1} + "
    "({b2})*((1-{ae})/{ae})) + "
    "({b3})*({de}/{ae}) * (({t10} + {t11})/2) + "
    "({b4} + "
    "({b5})*((1-{ae})/{ae}) + "
    "({b6})*({de}/{ae}^2))*(({t10} - {t11})/2) + "
    "({b7})*({t10} - {t11})^2";

bool IsInDnRange(f64 dn) {
    // Written so NaN falls outside
    return dn >= constants::DN_MIN && dn <= constants::DN_MAX;
}

// Emissivity must lie in (0, 1]
bool IsValidEmissivity(f64 emissivity) {
    return emissivity > 0.0 && emissivity <= 1.0;
}

template<typename T10, typename T11>
String FormatEquation(const char* pattern, const CoefficientSubrange& c,
                      f64 ae, f64 de, const T10& t10, const T11& t11) {
    return fmt::format(fmt::runtime(pattern),
                       fmt::arg("b0", c.b0), fmt::arg("b1", c.b1),
                       fmt::arg("b2", c.b2), fmt::arg("b3", c.b3),
                       fmt::arg("b4", c.b4), fmt::arg("b5", c.b5),
                       fmt::arg("b6", c.b6), fmt::arg("b7", c.b7),
                       fmt::arg("ae", ae), fmt::arg("de", de),
                       fmt::arg("t10", t10), fmt::arg("t11", t11));
}

} // namespace

void CheckT1xRange(f64 dn, StringView operand) {
    if (!IsInDnRange(dn)) {
        throw SplitWindowError(ErrorCode::OutOfRangeInput,
            fmt::format("{} = {} is outside the expected range [1, 65535]", operand, dn));
    }
}

// ============================================================================
// Construction
// ============================================================================

SplitWindowLST::SplitWindowLST(f64 emissivityB10, f64 emissivityB11, f64 cwv)
    : m_emissivityT10(emissivityB10)
    , m_emissivityT11(emissivityB11)
    , m_averageEmissivity(0.5 * (emissivityB10 + emissivityB11))
    , m_deltaEmissivity(emissivityB10 - emissivityB11)
    , m_cwv(cwv)
{
    if (!IsValidEmissivity(emissivityB10)) {
        throw SplitWindowError(ErrorCode::InvalidEmissivity,
            fmt::format("emissivity_b10 = {} is outside (0, 1]", emissivityB10));
    }
    if (!IsValidEmissivity(emissivityB11)) {
        throw SplitWindowError(ErrorCode::InvalidEmissivity,
            fmt::format("emissivity_b11 = {} is outside (0, 1]", emissivityB11));
    }
}

SplitWindowLST::SplitWindowLST(f64 emissivityB10, f64 emissivityB11, f64 cwv,
                               const CoefficientTable& table,
                               const SplitWindowOptions& options)
    : SplitWindowLST(emissivityB10, emissivityB11, cwv)
{
    std::mt19937 rng(options.seed ? *options.seed : std::random_device{}());
    m_subrange = ResolveSubrange(cwv, table, options.tieBreak, rng);
}

SplitWindowLST::SplitWindowLST(f64 emissivityB10, f64 emissivityB11, f64 cwv,
                               const CoefficientTable& table,
                               SubrangeTieBreak tieBreak, std::mt19937& rng)
    : SplitWindowLST(emissivityB10, emissivityB11, cwv)
{
    m_subrange = ResolveSubrange(cwv, table, tieBreak, rng);
}

Result<SplitWindowLST, String> SplitWindowLST::FromConfig(const Config& config,
                                                          const CoefficientTable& table,
                                                          const EmissivityTable& emissivities) {
    auto cwv = config.GetRequired<f64>("scene.cwv");
    if (!cwv) {
        return Result<SplitWindowLST, String>::Err(cwv.error());
    }

    BandEmissivity emissivity;
    if (config.Has("scene.land_cover")) {
        String landCover = config.Get<String>("scene.land_cover");
        auto found = emissivities.Get(landCover);
        if (!found) {
            String known;
            for (const auto& name : emissivities.Classes()) {
                if (!known.empty()) known += ", ";
                known += name;
            }
            return Result<SplitWindowLST, String>::Err(
                "Unknown land cover class '" + landCover + "' (known: " + known + ")");
        }
        emissivity = *found;
        SW_LOG_INFO("Land cover {}: emissivity B10={}, B11={}",
                    landCover, emissivity.b10, emissivity.b11);
    } else {
        auto e10 = config.GetRequired<f64>("scene.emissivity_b10");
        if (!e10) {
            return Result<SplitWindowLST, String>::Err(e10.error());
        }
        auto e11 = config.GetRequired<f64>("scene.emissivity_b11");
        if (!e11) {
            return Result<SplitWindowLST, String>::Err(e11.error());
        }
        emissivity = {*e10, *e11};
    }

    SplitWindowOptions options;

    String tieBreakName = config.Get<String>("coefficients.tie_break", "random");
    auto tieBreak = ParseTieBreak(tieBreakName);
    if (!tieBreak) {
        return Result<SplitWindowLST, String>::Err(
            "coefficients.tie_break must be 'random' or 'reject_ambiguous', got '" + tieBreakName + "'");
    }
    options.tieBreak = *tieBreak;

    if (config.Has("coefficients.seed")) {
        auto seed = config.GetRequired<u32>("coefficients.seed");
        if (!seed) {
            return Result<SplitWindowLST, String>::Err(seed.error());
        }
        options.seed = *seed;
    }

    try {
        SplitWindowLST estimator(emissivity.b10, emissivity.b11, *cwv, table, options);

        SW_LOG_INFO("Split-window estimator: CWV={} -> {} (tie-break: {}), RMSE={}",
                    estimator.GetColumnWaterVapour(), estimator.GetSubrangeKey(),
                    TieBreakToString(options.tieBreak), estimator.GetRMSE());
        return estimator;
    }
    catch (const SplitWindowError& err) {
        return Result<SplitWindowLST, String>::Err(String(err.what()));
    }
}

// ============================================================================
// Evaluation
// ============================================================================

Kelvin SplitWindowLST::ComputeLST(Kelvin t10, Kelvin t11) const {
    // Both operands are checked, always t10 first
    String failures;
    if (!IsInDnRange(t10)) {
        failures += fmt::format("T10 = {}", t10);
    }
    if (!IsInDnRange(t11)) {
        if (!failures.empty()) failures += ", ";
        failures += fmt::format("T11 = {}", t11);
    }
    if (!failures.empty()) {
        throw SplitWindowError(ErrorCode::OutOfRangeInput,
            failures + " outside the expected range [1, 65535]");
    }

    const f64 ae = m_averageEmissivity;
    const f64 de = m_deltaEmissivity;
    const CoefficientSubrange& k = m_subrange;

    // Addends
    f64 a = k.b0;
    f64 b = k.b1 + k.b2 * ((1 - ae) / ae);
    f64 c = k.b3 * (de / ae) * ((t10 + t11) / 2);
    f64 d1 = k.b4 + k.b5 * ((1 - ae) / ae) + k.b6 * (de / (ae * ae));
    f64 d2 = (t10 - t11) / 2;
    f64 d = d1 * d2;
    f64 e = k.b7 * ((t10 - t11) * (t10 - t11));

    return a + b + c + d + e;
}

// ============================================================================
// Rendering
// ============================================================================

String SplitWindowLST::GetEquation() {
    return kEquation;
}

String SplitWindowLST::RenderModel() const {
    return FormatEquation(kModelTemplate, m_subrange, m_averageEmissivity, m_deltaEmissivity,
                          m_emissivityT10, m_emissivityT11);
}

String SplitWindowLST::RenderFormula() const {
    return FormatEquation(kFormulaTemplate, m_subrange, m_averageEmissivity, m_deltaEmissivity,
                          constants::MAPCALC_TOKEN_T10, constants::MAPCALC_TOKEN_T11);
}

String SplitWindowLST::ToString() const {
    return "   > The equation: " + GetEquation() + "\n" +
           "   > The model: " + RenderModel();
}

String SplitWindowLST::ReportRMSE() const {
    return fmt::format("Associated RMSE: {}", m_subrange.rmse);
}

String SplitWindowLST::ReportLST(Kelvin t10, Kelvin t11) const {
    return fmt::format("{} {} {}", t10, t11, ComputeLST(t10, t11));
}

} // namespace splitwindow
