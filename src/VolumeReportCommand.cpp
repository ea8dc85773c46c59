#include "VolumeReportCommand.h"
#include "MaterialListCollector.h"
#include "VolumeAggregator.h"
#include <QDebug>
#include <QString>
#include <exception>
#include <sstream>

static QString qs(const std::string& s) { return QString::fromStdString(s); }

static void logFaults(const std::vector<RecordFault>& faults) {
    for (const auto& f : faults) {
        qWarning().noquote() << "Skipped" << faultStageName(f.stage)
                             << "record" << qs(f.recordId) << ":" << qs(f.reason);
    }
}

std::string CommandOutcome::text() const {
    if (status != Ok) return message;

    std::ostringstream out;
    out << report;
    for (const auto& f : faults) {
        out << "Skipped " << faultStageName(f.stage) << " record "
            << f.recordId << ": " << f.reason << "\n";
    }
    return out.str();
}

int CommandOutcome::exitCode() const {
    return (status == Ok || status == NoData) ? 0 : 1;
}

CommandOutcome VolumeReportCommand::run(const std::string& alignmentId,
                                        const MaterialListSource& source) const
{
    CommandOutcome res;

    if (alignmentId.empty()) {
        res.status  = CommandOutcome::Cancelled;
        res.message = "Command cancelled.";
        qInfo().noquote() << qs(res.message);
        return res;
    }

    try {
        auto alignment = source.alignment(alignmentId);
        if (!alignment) {
            res.status  = CommandOutcome::SelectionFailed;
            res.message = "Failed to get Alignment object.";
            qWarning().noquote() << qs(res.message) << "id:" << qs(alignmentId);
            return res;
        }
        qInfo().noquote() << "Volume report for alignment" << qs(alignment->name);

        auto collected = MaterialListCollector::collect(alignment->id, source);
        res.faults = collected.faults;
        if (!collected.success)
            qWarning() << "Material lists could not be enumerated";

        if (collected.lists.empty()) {
            logFaults(res.faults);
            res.status  = CommandOutcome::NoData;
            res.message = "No Material Lists found for the selected Alignment.";
            qInfo().noquote() << qs(res.message);
            return res;
        }

        VolumeAggregator aggregator;
        aggregator.verboseLogging = verboseLogging;
        auto aggregated = aggregator.aggregate(collected.lists, source);
        res.faults.insert(res.faults.end(),
                          aggregated.faults.begin(), aggregated.faults.end());
        logFaults(res.faults);

        res.rowCount = static_cast<int>(aggregated.table.rows.size());
        if (aggregated.table.empty()) {
            res.status  = CommandOutcome::NoData;
            res.message = reporter.noDataText;
            qInfo().noquote() << qs(res.message);
            return res;
        }

        res.report = reporter.render(aggregated.table);
        res.status = CommandOutcome::Ok;

        std::ostringstream msg;
        msg << res.rowCount << " rows from " << collected.lists.size()
            << " material list(s)";
        if (!res.faults.empty()) msg << ", " << res.faults.size() << " record(s) skipped";
        res.message = msg.str();
        qInfo().noquote() << qs(res.message);
    } catch (const std::exception& e) {
        res.status  = CommandOutcome::Failed;
        res.message = std::string("Error: ") + e.what();
        res.report.clear();
        qWarning().noquote() << qs(res.message);
    }
    return res;
}
