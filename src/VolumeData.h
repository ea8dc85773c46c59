#pragma once
#include <string>
#include <vector>

// ─── Host records (read-only, owned by the drawing) ──────────────────────────
struct Alignment {
    std::string id;      // opaque handle from the host
    std::string name;
};

struct MaterialRecord {
    std::string id;
    std::string name;
    std::string alignmentId;
};

struct ItemRecord {
    std::string id;
    std::string name;    // topsoil, rock, ...
};

// stationStart <= stationEnd is the author's business, not checked here
struct QuantityRecord {
    double stationStart = 0;
    double stationEnd   = 0;
    double cutVolume    = 0;
    double fillVolume   = 0;
};

// ─── Derived rows ─────────────────────────────────────────────────────────────
struct VolumeRow {
    std::string materialListName;
    std::string materialName;
    double stationStart   = 0;
    double stationEnd     = 0;
    double cutVolume      = 0;
    double fillVolume     = 0;
    double netVolume      = 0;   // cut - fill, may be negative
    double cumulativeCut  = 0;   // includes this row
    double cumulativeFill = 0;
};

struct ReportTable {
    std::vector<VolumeRow> rows;
    double totalCut  = 0;
    double totalFill = 0;

    bool empty() const { return rows.empty(); }
};

// ─── Skipped records ─────────────────────────────────────────────────────────
enum class FaultStage { Collection, Extraction };

struct RecordFault {
    std::string recordId;
    FaultStage  stage = FaultStage::Collection;
    std::string reason;
};

const char* faultStageName(FaultStage stage);
