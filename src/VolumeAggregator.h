#pragma once
#include "MaterialListSource.h"
#include <vector>

// ─── VolumeAggregator ─────────────────────────────────────────────────────────
// Walks lists -> items -> quantities in source order and emits one row per
// quantity record. Cumulative cut/fill run over the whole sequence (never
// reset per list). A list or item the source cannot read contributes no rows
// and is reported in `faults` instead.
class VolumeAggregator {
public:
    struct AggregateResult {
        ReportTable              table;
        std::vector<RecordFault> faults;
    };

    bool verboseLogging = false; // per list / per item trace via qDebug

    AggregateResult aggregate(const std::vector<MaterialRecord>& lists,
                              const MaterialListSource& source) const;
};
