#include "CoefficientTableIO.hpp"

#include <H5Cpp.h>
#include <algorithm>
#include <filesystem>
#include <utility>

namespace splitwindow {

namespace {

constexpr const char* kSubrangesGroup = "/subranges";
constexpr const char* kMetadataGroup = "/metadata";
constexpr const char* kCoefficientsDataset = "coefficients";

// ============================================================================
// Helper: scalar float64 attributes
// ============================================================================

f64 ReadScalarAttribute(const H5::Group& group, const std::string& name) {
    H5::Attribute attr = group.openAttribute(name);
    f64 value = 0.0;
    attr.read(H5::PredType::NATIVE_DOUBLE, &value);
    return value;
}

void WriteScalarAttribute(H5::Group& group, const std::string& name, f64 value) {
    H5::DataSpace scalar(H5S_SCALAR);
    H5::Attribute attr = group.createAttribute(name, H5::PredType::NATIVE_DOUBLE, scalar);
    attr.write(H5::PredType::NATIVE_DOUBLE, &value);
}

// Provider position; links themselves are iterated by name
constexpr const char* kOrderAttribute = "order";

void WriteOrderAttribute(H5::Group& group, u32 order) {
    H5::DataSpace scalar(H5S_SCALAR);
    H5::Attribute attr = group.createAttribute(kOrderAttribute, H5::PredType::NATIVE_UINT32, scalar);
    attr.write(H5::PredType::NATIVE_UINT32, &order);
}

// Falls back to the link index for files written without @order
u32 ReadOrderAttribute(const H5::Group& group, u32 linkIndex) {
    if (!group.attrExists(kOrderAttribute)) {
        return linkIndex;
    }
    u32 order = linkIndex;
    group.openAttribute(kOrderAttribute).read(H5::PredType::NATIVE_UINT32, &order);
    return order;
}

// ============================================================================
// Helper: one subrange group
// ============================================================================

bool ReadSubrange(const H5::Group& parent, const std::string& key, u32 linkIndex,
                  CoefficientSubrange& out, u32& order) {
    try {
        H5::Group group = parent.openGroup(key);

        H5::DataSet dataset = group.openDataSet(kCoefficientsDataset);
        H5::DataSpace dataspace = dataset.getSpace();

        int rank = dataspace.getSimpleExtentNdims();
        if (rank != 1) {
            SW_LOG_ERROR("CoefficientTableIO: Expected 1D coefficients for {}, got rank {}", key, rank);
            return false;
        }

        hsize_t dims[1];
        dataspace.getSimpleExtentDims(dims);
        if (dims[0] != 8) {
            SW_LOG_ERROR("CoefficientTableIO: Expected 8 coefficients for {}, got {}", key, dims[0]);
            return false;
        }

        Array<f64, 8> b{};
        dataset.read(b.data(), H5::PredType::NATIVE_DOUBLE);

        out = CoefficientSubrange::FromCoefficients(
            key,
            ReadScalarAttribute(group, "low"),
            ReadScalarAttribute(group, "high"),
            b,
            ReadScalarAttribute(group, "rmse"));
        order = ReadOrderAttribute(group, linkIndex);
        return true;

    } catch (const H5::Exception& e) {
        SW_LOG_ERROR("CoefficientTableIO: Failed to read subrange {}: {}", key, e.getDetailMsg());
        return false;
    }
}

bool WriteSubrange(H5::Group& parent, const CoefficientSubrange& subrange, u32 order) {
    try {
        H5::Group group = parent.createGroup(subrange.key);

        WriteOrderAttribute(group, order);
        WriteScalarAttribute(group, "low", subrange.low);
        WriteScalarAttribute(group, "high", subrange.high);
        WriteScalarAttribute(group, "rmse", subrange.rmse);

        hsize_t dims[1] = {8};
        H5::DataSpace dataspace(1, dims);
        H5::DataSet dataset = group.createDataSet(
            kCoefficientsDataset, H5::PredType::NATIVE_DOUBLE, dataspace);

        Array<f64, 8> b = subrange.Coefficients();
        dataset.write(b.data(), H5::PredType::NATIVE_DOUBLE);
        return true;

    } catch (const H5::Exception& e) {
        SW_LOG_ERROR("CoefficientTableIO: Failed to write subrange {}: {}", subrange.key, e.getDetailMsg());
        return false;
    }
}

// ============================================================================
// Helper: /metadata group
// ============================================================================

void ReadMetadata(H5::H5File& file, CoefficientTable& table) {
    if (!file.nameExists(kMetadataGroup)) {
        return;
    }

    try {
        H5::Group metaGroup = file.openGroup(kMetadataGroup);

        for (int i = 0; i < metaGroup.getNumAttrs(); ++i) {
            H5::Attribute attr = metaGroup.openAttribute(static_cast<unsigned int>(i));
            std::string name = attr.getName();

            H5::DataType dtype = attr.getDataType();
            if (dtype.getClass() != H5T_STRING) {
                continue;
            }

            H5::StrType strType = attr.getStrType();
            std::string value;

            if (strType.isVariableStr()) {
                char* c_str = nullptr;
                attr.read(strType, &c_str);
                if (c_str != nullptr) {
                    value = std::string(c_str);
                    // Variable-length strings are allocated by HDF5
                    H5free_memory(c_str);
                }
            } else {
                size_t str_len = strType.getSize();
                std::vector<char> buffer(str_len + 1, '\0');
                attr.read(strType, buffer.data());
                value = std::string(buffer.data());
            }

            table.metadata[name] = value;
        }

    } catch (const H5::Exception& e) {
        SW_LOG_WARN("CoefficientTableIO: Failed to read metadata: {}", e.getDetailMsg());
    }
}

void WriteMetadata(H5::H5File& file, const CoefficientTable& table) {
    try {
        H5::Group metaGroup = file.createGroup(kMetadataGroup);
        H5::StrType strType(H5::PredType::C_S1, H5T_VARIABLE);
        H5::DataSpace scalar(H5S_SCALAR);

        for (const auto& [key, value] : table.metadata) {
            H5::Attribute attr = metaGroup.createAttribute(key, strType, scalar);
            attr.write(strType, value);
        }

    } catch (const H5::Exception& e) {
        SW_LOG_WARN("CoefficientTableIO: Failed to write metadata: {}", e.getDetailMsg());
    }
}

} // namespace

// ============================================================================
// Public API: LoadHDF5
// ============================================================================

std::optional<CoefficientTable> CoefficientTableIO::LoadHDF5(const std::string& filepath) {
    if (!FileExists(filepath)) {
        SW_LOG_ERROR("CoefficientTableIO::LoadHDF5: File not found: {}", filepath);
        return std::nullopt;
    }

    try {
        H5::H5File file(filepath, H5F_ACC_RDONLY);
        H5::Group subrangesGroup = file.openGroup(kSubrangesGroup);

        CoefficientTable table;

        hsize_t count = subrangesGroup.getNumObjs();
        Vector<std::pair<u32, CoefficientSubrange>> ordered;
        ordered.reserve(count);

        for (hsize_t i = 0; i < count; ++i) {
            std::string key = subrangesGroup.getObjnameByIdx(i);

            CoefficientSubrange subrange;
            u32 order = 0;
            if (!ReadSubrange(subrangesGroup, key, static_cast<u32>(i), subrange, order)) {
                return std::nullopt;
            }
            ordered.emplace_back(order, std::move(subrange));
        }

        // Restore provider order
        std::stable_sort(ordered.begin(), ordered.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });

        table.subranges.reserve(ordered.size());
        for (auto& entry : ordered) {
            table.subranges.push_back(std::move(entry.second));
        }

        ReadMetadata(file, table);

        if (!table.IsValid()) {
            SW_LOG_ERROR("CoefficientTableIO::LoadHDF5: Loaded table failed validation ({})",
                         ErrorCodeToString(ErrorCode::CoefficientTableCorrupted));
            return std::nullopt;
        }

        SW_LOG_INFO("CoefficientTableIO::LoadHDF5: Loaded {} CWV subranges from {}",
                    table.Size(), filepath);
        return table;

    } catch (const H5::Exception& e) {
        SW_LOG_ERROR("CoefficientTableIO::LoadHDF5: Failed to load {}: {}",
                     filepath, e.getDetailMsg());
        return std::nullopt;
    }
}

// ============================================================================
// Public API: SaveHDF5
// ============================================================================

bool CoefficientTableIO::SaveHDF5(const std::string& filepath, const CoefficientTable& table) {
    if (!table.IsValid()) {
        SW_LOG_ERROR("CoefficientTableIO::SaveHDF5: Invalid coefficient table");
        return false;
    }

    try {
        H5::H5File file(filepath, H5F_ACC_TRUNC);
        H5::Group subrangesGroup = file.createGroup(kSubrangesGroup);

        for (usize i = 0; i < table.subranges.size(); ++i) {
            if (!WriteSubrange(subrangesGroup, table.subranges[i], static_cast<u32>(i))) {
                return false;
            }
        }

        WriteMetadata(file, table);

        SW_LOG_INFO("CoefficientTableIO::SaveHDF5: Saved {} CWV subranges to {}",
                    table.Size(), filepath);
        return true;

    } catch (const H5::Exception& e) {
        SW_LOG_ERROR("CoefficientTableIO::SaveHDF5: Failed to save {}: {}",
                     filepath, e.getDetailMsg());
        return false;
    }
}

bool CoefficientTableIO::FileExists(const std::string& filepath) {
    return std::filesystem::exists(filepath) &&
           std::filesystem::is_regular_file(filepath);
}

} // namespace splitwindow
