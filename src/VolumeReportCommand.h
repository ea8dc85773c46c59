#pragma once
#include "MaterialListSource.h"
#include "VolumeReporter.h"
#include <string>
#include <vector>

// ─── Outcome of one report run ────────────────────────────────────────────────
struct CommandOutcome {
    enum Status {
        Ok,
        Cancelled,         // nothing selected
        SelectionFailed,   // selected id is not an alignment of the drawing
        NoData,            // no material lists, or no quantity rows
        Failed             // unexpected error
    };

    Status      status = Failed;
    std::string message;
    std::string report;               // rendered table, only when status == Ok
    std::vector<RecordFault> faults;  // records skipped while reading
    int         rowCount = 0;

    // What the caller should print
    std::string text() const;
    // Process exit status for console callers: 0 for Ok and NoData
    int exitCode() const;
};

// ─── VolumeReportCommand ──────────────────────────────────────────────────────
// Cross-section cut/fill report for one alignment. The caller owns the
// source and keeps it open (read-only) for the duration of run().
class VolumeReportCommand {
public:
    VolumeReporter reporter;
    bool verboseLogging = false;

    CommandOutcome run(const std::string& alignmentId,
                       const MaterialListSource& source) const;
};
