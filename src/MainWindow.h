#pragma once
#include <QMainWindow>
#include <memory>
#include "DrawingDatabase.h"
#include "VolumeReportCommand.h"

class QApplication;
class QComboBox;
class QPushButton;
class QLabel;
class QTextEdit;
class QTabWidget;
class QCheckBox;

// ─── MainWindow ───────────────────────────────────────────────────────────────
class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow();

    // Opens `fileName` read-only and fills the alignment list
    bool openDrawing(const QString& fileName);
    int alignmentCount() const;

    // Fusion style with the dark palette used by the report views
    static void applyDarkTheme(QApplication& app);

private slots:
    void onOpenDrawing();
    void onRunReport();
    void onAlignmentChanged(int idx);

private:
    void setupUI();
    void setupMenuBar();
    bool reloadAlignments();
    void showOutcome(const CommandOutcome& outcome);

    QTabWidget*  tabs_          = nullptr;   // Report / Log
    QTextEdit*   reportView_    = nullptr;
    QTextEdit*   logView_       = nullptr;

    QLabel*      drawingLabel_  = nullptr;
    QComboBox*   alignmentCombo_= nullptr;
    QCheckBox*   verboseChk_    = nullptr;
    QPushButton* runBtn_        = nullptr;
    QLabel*      statusLabel_   = nullptr;

    std::unique_ptr<DrawingDatabase> drawing_;
    VolumeReportCommand command_;
};
