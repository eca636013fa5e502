#pragma once

#include "Platform.hpp"
#include "Types.hpp"

namespace splitwindow {

// ============================================================================
// EmissivityTable - average TIRS band emissivities per land-cover class
// ============================================================================

struct BandEmissivity {
    f64 b10 = 0.0;
    f64 b11 = 0.0;
};

struct SW_API EmissivityTable {
    struct Entry {
        String landCover;
        BandEmissivity emissivity;
    };

    Vector<Entry> entries;

    // Exact, case-sensitive class lookup
    Optional<BandEmissivity> Get(StringView landCover) const;

    Vector<String> Classes() const;

    // Du et al. (2015) averages for Landsat 8 TIRS
    static EmissivityTable Published();
};

} // namespace splitwindow
