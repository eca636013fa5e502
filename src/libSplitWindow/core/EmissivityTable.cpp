#include "EmissivityTable.hpp"

namespace splitwindow {

Optional<BandEmissivity> EmissivityTable::Get(StringView landCover) const {
    for (const auto& entry : entries) {
        if (entry.landCover == landCover) {
            return entry.emissivity;
        }
    }
    return std::nullopt;
}

Vector<String> EmissivityTable::Classes() const {
    Vector<String> classes;
    classes.reserve(entries.size());
    for (const auto& entry : entries) {
        classes.push_back(entry.landCover);
    }
    return classes;
}

EmissivityTable EmissivityTable::Published() {
    EmissivityTable table;
    table.entries = {
        {"Cropland",     {0.971, 0.968}},
        {"Forest",       {0.995, 0.996}},
        {"Grasslands",   {0.970, 0.971}},
        {"Shrublands",   {0.969, 0.970}},
        {"Wetlands",     {0.992, 0.998}},
        {"Waterbodies",  {0.992, 0.998}},
        {"Tundra",       {0.980, 0.984}},
        {"Impervious",   {0.973, 0.981}},
        {"Barren_Land",  {0.969, 0.978}},
        {"Snow_and_ice", {0.992, 0.998}},
    };
    return table;
}

} // namespace splitwindow
