#pragma once

#include "Platform.hpp"
#include "Types.hpp"

#include <unordered_map>

namespace splitwindow {

// ============================================================================
// CoefficientTable - split-window regression coefficients per CWV subrange
// ============================================================================
// Each subrange covers an open interval (low, high) of column water vapour
// (g/cm^2) and carries the eight regression coefficients b0..b7 of the
// split-window equation together with the RMSE (K) of the regression.
//
// Subranges may overlap or touch. The published Landsat 8 table ends with a
// full-range entry (0.0, 6.3) overlapping every other subrange.
//
// Tables are plain values: load once, then share read-only.
// ============================================================================

struct SW_API CoefficientSubrange {
    String key;

    // Open CWV interval
    f64 low = 0.0;
    f64 high = 0.0;

    f64 b0 = 0.0;
    f64 b1 = 0.0;
    f64 b2 = 0.0;
    f64 b3 = 0.0;
    f64 b4 = 0.0;
    f64 b5 = 0.0;
    f64 b6 = 0.0;
    f64 b7 = 0.0;

    f64 rmse = 0.0;

    // True if low < cwv < high
    bool Contains(f64 cwv) const { return low < cwv && cwv < high; }

    Array<f64, 8> Coefficients() const { return {b0, b1, b2, b3, b4, b5, b6, b7}; }

    static CoefficientSubrange FromCoefficients(String key, f64 low, f64 high,
                                                const Array<f64, 8>& b, f64 rmse);
};

// Bounds of one subrange, as enumerated by the provider
struct SubrangeBounds {
    String key;
    f64 low = 0.0;
    f64 high = 0.0;
};

struct SW_API CoefficientTable {
    // Subranges in provider order
    Vector<CoefficientSubrange> subranges;

    // e.g., {"citation": "...", "sensor": "Landsat 8 TIRS"}
    std::unordered_map<String, String> metadata;

    // Non-empty, unique keys, finite values and low < high for every subrange
    bool IsValid() const;

    usize Size() const { return subranges.size(); }

    // Coefficients and RMSE of one subrange
    Optional<CoefficientSubrange> Get(StringView key) const;

    // Every subrange key with its (low, high) bounds
    Vector<SubrangeBounds> Enumerate() const;

    // Du et al. (2015) coefficients for Landsat 8 TIRS bands 10/11
    static CoefficientTable Published();
};

} // namespace splitwindow
