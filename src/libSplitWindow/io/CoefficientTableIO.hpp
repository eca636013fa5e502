#pragma once

#include "core/CoefficientTable.hpp"
#include "core/Log.hpp"
#include <string>
#include <optional>

namespace splitwindow {

// ============================================================================
// CoefficientTableIO - CWV coefficient tables in HDF5
// ============================================================================
// Expected HDF5 structure:
//   /subranges/<key>               - Group per CWV subrange
//       @order                     - Scalar uint32 attribute, position in the table
//       @low, @high                - Scalar float64 attributes, open interval
//       @rmse                      - Scalar float64 attribute, K
//       coefficients               - 1D dataset [8], float64, b0..b7
//   /metadata                      - Group with string attributes
//
// Subranges are returned in @order order (link order when it is absent).
// ============================================================================

class SW_API CoefficientTableIO {
public:
    // Load table from HDF5 file; nullopt (and an error log) on failure
    static std::optional<CoefficientTable> LoadHDF5(const std::string& filepath);

    // Save table to HDF5 file, replacing any existing file
    static bool SaveHDF5(const std::string& filepath, const CoefficientTable& table);

    static bool FileExists(const std::string& filepath);
};

} // namespace splitwindow
