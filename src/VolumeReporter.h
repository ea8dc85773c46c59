#pragma once
#include "VolumeData.h"
#include <string>

// ─── VolumeReporter — fixed-width cut/fill table ─────────────────────────────
class VolumeReporter {
public:
    std::string title      = "EXCAVATION AND FILLING VOLUME INFORMATION - CROSS SECTION";
    std::string unit       = "m\xC2\xB3";   // m³
    std::string noDataText = "No volume data found.";
    int         ruleWidth  = 120;

    // Column widths: list, material, start, end, cut, fill, net, cum cut, cum fill
    static constexpr int kListWidth     = 20;
    static constexpr int kMaterialWidth = 15;
    static constexpr int kNumberWidth   = 12;

    // UTF-8 text. An empty table gives only `noDataText`.
    std::string render(const ReportTable& table) const;

    // `s` cut or space-padded to exactly `width` characters (not bytes)
    static std::string fitColumn(const std::string& s, int width);
};
