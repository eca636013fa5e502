#pragma once

#include "core/CoefficientTable.hpp"
#include "core/EmissivityTable.hpp"
#include "core/Config.hpp"
#include "lst/SubrangeResolver.hpp"

#include <random>

// ============================================================================
// SplitWindowLST - split-window Land Surface Temperature estimator
// ============================================================================
// Removes the atmospheric effect through the differential absorption of the
// two adjacent TIRS channels (~10.9 um and ~12.0 um):
//
//   LST = b0
//       + (b1 + b2*((1-ae)/ae))
//       + b3*(de/ae) * ((t10 + t11)/2)
//       + (b4 + b5*((1-ae)/ae) + b6*(de/ae^2)) * ((t10 - t11)/2)
//       + b7*(t10 - t11)^2
//
//   ae = (e10 + e11) / 2      average emissivity
//   de = e10 - e11            emissivity difference
//
// The coefficient subrange is resolved once from the CWV estimate at
// construction; afterwards the estimator is immutable and ComputeLST() may be
// called concurrently.
// ============================================================================

namespace splitwindow {

namespace constants {
    // Placeholders left in the mapcalc expression for per-pixel band references
    inline constexpr const char* MAPCALC_TOKEN_T10 = "Input_T10";
    inline constexpr const char* MAPCALC_TOKEN_T11 = "Input_T11";
}

inline constexpr const char* kCitation =
    "Du, Chen; Ren, Huazhong; Qin, Qiming; Meng, Jinjie; Zhao, Shaohua. 2015. "
    "\"A Practical Split-Window Algorithm for Estimating Land Surface Temperature "
    "from Landsat 8 Data.\" Remote Sens. 7, no. 1: 647-665.";

// Throws SplitWindowError(OutOfRangeInput) unless 1 <= dn <= 65535
SW_API void CheckT1xRange(f64 dn, StringView operand = "T1x");

struct SplitWindowOptions {
    SubrangeTieBreak tieBreak = SubrangeTieBreak::Random;

    // Seed for the random tie-break; nondeterministic when unset
    Optional<u32> seed;
};

class SW_API SplitWindowLST {
public:
    /// Resolve the coefficient subrange for cwv from table.
    /// Throws SplitWindowError (InvalidEmissivity, NoMatchingSubrange, AmbiguousSubrange).
    SplitWindowLST(f64 emissivityB10, f64 emissivityB11, f64 cwv,
                   const CoefficientTable& table,
                   const SplitWindowOptions& options = SplitWindowOptions{});

    /// Same, drawing any random tie-break from a caller-owned engine
    SplitWindowLST(f64 emissivityB10, f64 emissivityB11, f64 cwv,
                   const CoefficientTable& table,
                   SubrangeTieBreak tieBreak, std::mt19937& rng);

    /// Build from the [scene] and [coefficients] sections of a config.
    /// scene.land_cover, when present, is looked up in emissivities and
    /// overrides scene.emissivity_b10 / scene.emissivity_b11.
    static Result<SplitWindowLST, String> FromConfig(const Config& config,
                                                     const CoefficientTable& table,
                                                     const EmissivityTable& emissivities);

    /// Land Surface Temperature (K) from brightness temperatures of bands 10 and 11.
    /// Throws SplitWindowError(OutOfRangeInput) naming every operand outside [1, 65535].
    Kelvin ComputeLST(Kelvin t10, Kelvin t11) const;

    // ========================================================================
    // Rendering
    // ========================================================================

    /// Symbolic equation
    static String GetEquation();

    /// Equation with the resolved coefficients, ae, de and the two band
    /// emissivities (in the t10/t11 slots) substituted
    String RenderModel() const;

    /// Expression for a raster calculator: numeric coefficients, t10/t11 left
    /// as MAPCALC_TOKEN_T10 / MAPCALC_TOKEN_T11
    String RenderFormula() const;

    /// Equation and model, one per line
    String ToString() const;

    /// "Associated RMSE: <rmse>"
    String ReportRMSE() const;

    /// "<t10> <t11> <lst>" at full precision; throws like ComputeLST()
    String ReportLST(Kelvin t10, Kelvin t11) const;

    // ========================================================================
    // Accessors
    // ========================================================================

    f64 GetEmissivityT10() const { return m_emissivityT10; }
    f64 GetEmissivityT11() const { return m_emissivityT11; }
    f64 GetAverageEmissivity() const { return m_averageEmissivity; }
    f64 GetDeltaEmissivity() const { return m_deltaEmissivity; }
    f64 GetColumnWaterVapour() const { return m_cwv; }

    const String& GetSubrangeKey() const { return m_subrange.key; }
    Array<f64, 8> GetCwvCoefficients() const { return m_subrange.Coefficients(); }
    f64 GetRMSE() const { return m_subrange.rmse; }

private:
    SplitWindowLST(f64 emissivityB10, f64 emissivityB11, f64 cwv);

    f64 m_emissivityT10;
    f64 m_emissivityT11;
    f64 m_averageEmissivity;
    f64 m_deltaEmissivity;
    f64 m_cwv;

    CoefficientSubrange m_subrange;
};

} // namespace splitwindow
