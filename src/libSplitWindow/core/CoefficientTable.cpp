#include "CoefficientTable.hpp"

#include <cmath>
#include <unordered_set>

namespace splitwindow {

CoefficientSubrange CoefficientSubrange::FromCoefficients(String key, f64 low, f64 high,
                                                          const Array<f64, 8>& b, f64 rmse) {
    CoefficientSubrange subrange;
    subrange.key = std::move(key);
    subrange.low = low;
    subrange.high = high;
    subrange.b0 = b[0];
    subrange.b1 = b[1];
    subrange.b2 = b[2];
    subrange.b3 = b[3];
    subrange.b4 = b[4];
    subrange.b5 = b[5];
    subrange.b6 = b[6];
    subrange.b7 = b[7];
    subrange.rmse = rmse;
    return subrange;
}

bool CoefficientTable::IsValid() const {
    if (subranges.empty()) return false;

    std::unordered_set<StringView> keys;
    for (const auto& subrange : subranges) {
        if (subrange.key.empty() || !keys.insert(subrange.key).second) {
            return false;
        }

        if (!std::isfinite(subrange.low) || !std::isfinite(subrange.high) ||
            subrange.low >= subrange.high) {
            return false;
        }

        for (f64 b : subrange.Coefficients()) {
            if (!std::isfinite(b)) return false;
        }

        if (!std::isfinite(subrange.rmse) || subrange.rmse < 0.0) {
            return false;
        }
    }

    return true;
}

Optional<CoefficientSubrange> CoefficientTable::Get(StringView key) const {
    for (const auto& subrange : subranges) {
        if (subrange.key == key) {
            return subrange;
        }
    }
    return std::nullopt;
}

Vector<SubrangeBounds> CoefficientTable::Enumerate() const {
    Vector<SubrangeBounds> bounds;
    bounds.reserve(subranges.size());
    for (const auto& subrange : subranges) {
        bounds.push_back({subrange.key, subrange.low, subrange.high});
    }
    return bounds;
}

CoefficientTable CoefficientTable::Published() {
    CoefficientTable table;

    // Du, Ren, Qin, Meng, Zhao (2015), Remote Sens. 7(1), Table 2
    //                                                         b0         b1        b2        b3         b4         b5         b6         b7        RMSE
    table.subranges = {
        CoefficientSubrange::FromCoefficients("Range_1", 0.0, 2.5, {-2.78009,  1.01408,  0.15833, -0.34991,  4.04487,  3.55414,  -8.88394,  0.09152}, 0.34),
        CoefficientSubrange::FromCoefficients("Range_2", 2.0, 3.5, {11.00824,  0.95995,  0.17243, -0.28852,  7.11492,  0.42684,  -6.62025, -0.06381}, 0.60),
        CoefficientSubrange::FromCoefficients("Range_3", 3.0, 4.5, { 9.62610,  0.96202,  0.13834, -0.17262,  7.87883,  5.17910, -13.26611, -0.07603}, 0.71),
        CoefficientSubrange::FromCoefficients("Range_4", 4.0, 5.5, { 0.61258,  0.99124,  0.10051, -0.09664,  7.85758,  6.86626, -15.00742, -0.01185}, 0.86),
        CoefficientSubrange::FromCoefficients("Range_5", 5.0, 6.3, {-0.34808,  0.98123,  0.05599, -0.03518, 11.96444,  9.06710, -14.74085, -0.20471}, 0.93),
        CoefficientSubrange::FromCoefficients("Range_6", 0.0, 6.3, {-0.41165,  1.00522,  0.14543, -0.27297,  4.06655, -6.92512, -18.27461,  0.24468}, 0.87),
    };

    table.metadata["sensor"] = "Landsat 8 TIRS";
    table.metadata["citation"] =
        "Du, Chen; Ren, Huazhong; Qin, Qiming; Meng, Jinjie; Zhao, Shaohua. 2015. "
        "\"A Practical Split-Window Algorithm for Estimating Land Surface Temperature "
        "from Landsat 8 Data.\" Remote Sens. 7, no. 1: 647-665.";

    return table;
}

} // namespace splitwindow
