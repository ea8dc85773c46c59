#include "DrawingDatabase.h"
#include "VolumeReportCommand.h"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <iostream>

// Console front end: print the volume report of one alignment to stdout
int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("sectionvolumes-report");
    app.setApplicationVersion("1.0");
    app.setOrganizationName("SectionVolumes");

    QCommandLineParser parser;
    parser.setApplicationDescription("Excavation and filling volumes per cross-section");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption drawingOpt({"d", "drawing"}, "Drawing database file.", "file");
    QCommandLineOption alignmentOpt({"a", "alignment"}, "Alignment id or name.", "alignment");
    QCommandLineOption listOpt({"l", "list-alignments"}, "List the alignments of the drawing.");
    QCommandLineOption verboseOpt({"v", "verbose"}, "Trace every material list and item.");
    parser.addOption(drawingOpt);
    parser.addOption(alignmentOpt);
    parser.addOption(listOpt);
    parser.addOption(verboseOpt);
    parser.process(app);

    if (!parser.isSet(drawingOpt)) {
        std::cerr << "missing --drawing\n";
        parser.showHelp(1);
    }

    DrawingDatabase drawing;
    if (!drawing.open(parser.value(drawingOpt), DrawingDatabase::ReadOnly)) {
        std::cerr << "Error: " << drawing.lastError().toStdString() << "\n";
        return 1;
    }

    if (parser.isSet(listOpt)) {
        auto all = drawing.alignments();
        if (!drawing.lastError().isEmpty()) {
            std::cerr << "Error: " << drawing.lastError().toStdString() << "\n";
            return 1;
        }
        for (const auto& a : all)
            std::cout << a.id << '\t' << a.name << '\n';
        return 0;
    }

    VolumeReportCommand command;
    command.verboseLogging = parser.isSet(verboseOpt);

    CommandOutcome outcome;
    {
        DrawingDatabase::ReadScope scope(drawing);

        // no --alignment gives an empty id, which the command reports as cancelled
        std::string alignmentId;
        try {
            alignmentId = drawing.resolveAlignmentId(parser.value(alignmentOpt));
        } catch (const SourceError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
        outcome = command.run(alignmentId, drawing);
    }

    // report is UTF-8 (m³), written as is
    std::cout << outcome.text();
    if (outcome.status != CommandOutcome::Ok) std::cout << '\n';
    std::cout.flush();

    return outcome.exitCode();
}
