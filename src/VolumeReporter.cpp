#include "VolumeReporter.h"
#include <QString>
#include <iomanip>
#include <locale>
#include <sstream>

std::string VolumeReporter::fitColumn(const std::string& s, int width) {
    // counted in characters; setw would pad multi-byte names short
    return QString::fromStdString(s).left(width).leftJustified(width).toStdString();
}

std::string VolumeReporter::render(const ReportTable& table) const {
    if (table.empty()) return noDataText;

    const std::string heavy(static_cast<std::size_t>(ruleWidth), '=');
    const std::string light(static_cast<std::size_t>(ruleWidth), '-');

    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::left;

    out << heavy << "\n";
    out << title << "\n";
    out << heavy << "\n";

    out << std::setw(kListWidth)     << "Material List" << ' '
        << std::setw(kMaterialWidth) << "Material"      << ' '
        << std::setw(kNumberWidth)   << "Start Stn"     << ' '
        << std::setw(kNumberWidth)   << "End Stn"       << ' '
        << std::setw(kNumberWidth)   << "Cut Vol"       << ' '
        << std::setw(kNumberWidth)   << "Fill Vol"      << ' '
        << std::setw(kNumberWidth)   << "Net Vol"       << ' '
        << std::setw(kNumberWidth)   << "Cum Cut"       << ' '
        << std::setw(kNumberWidth)   << "Cum Fill"      << "\n";
    out << light << "\n";

    out << std::fixed;
    for (const auto& r : table.rows) {
        out << fitColumn(r.materialListName, kListWidth) << ' '
            << fitColumn(r.materialName, kMaterialWidth) << ' '
            << std::setprecision(3)
            << std::setw(kNumberWidth)   << r.stationStart   << ' '
            << std::setw(kNumberWidth)   << r.stationEnd     << ' '
            << std::setprecision(2)
            << std::setw(kNumberWidth)   << r.cutVolume      << ' '
            << std::setw(kNumberWidth)   << r.fillVolume     << ' '
            << std::setw(kNumberWidth)   << r.netVolume      << ' '
            << std::setw(kNumberWidth)   << r.cumulativeCut  << ' '
            << std::setw(kNumberWidth)   << r.cumulativeFill << "\n";
    }

    out << light << "\n";
    out << std::setprecision(2)
        << "SUMMARY: Total Cut Volume: " << table.totalCut << ' ' << unit
        << ", Total Fill Volume: "       << table.totalFill << ' ' << unit
        << ", Net Volume: "              << table.totalCut - table.totalFill << ' ' << unit
        << "\n";
    out << heavy << "\n";

    return out.str();
}
