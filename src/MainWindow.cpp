#include "MainWindow.h"
#include <QApplication>
#include <QHBoxLayout>
#include <QVBoxLayout>
#include <QGroupBox>
#include <QPushButton>
#include <QLabel>
#include <QComboBox>
#include <QCheckBox>
#include <QTextEdit>
#include <QTabWidget>
#include <QFileDialog>
#include <QFileInfo>
#include <QMessageBox>
#include <QMenuBar>
#include <QStatusBar>
#include <QSettings>
#include <QStyleFactory>
#include <QPalette>

static const char* kLastDrawingKey = "drawing/last";

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
    setWindowTitle("SectionVolumes — Cross-section cut/fill report");
    resize(1180, 720);
    setupUI();
    setupMenuBar();
    statusBar()->showMessage("Ready");

    QSettings settings;
    QString last = settings.value(kLastDrawingKey).toString();
    if (!last.isEmpty() && QFileInfo::exists(last)) openDrawing(last);
}

MainWindow::~MainWindow() = default;

void MainWindow::applyDarkTheme(QApplication& app) {
    app.setStyle(QStyleFactory::create("Fusion"));
    const QColor panel(40, 42, 46), field(24, 25, 28);
    QPalette p;
    p.setColor(QPalette::Window,          panel);
    p.setColor(QPalette::Button,          panel);
    p.setColor(QPalette::Base,            field);
    p.setColor(QPalette::WindowText,      Qt::white);
    p.setColor(QPalette::ButtonText,      Qt::white);
    p.setColor(QPalette::Text,            Qt::white);
    p.setColor(QPalette::Highlight,       QColor(30, 132, 73));
    p.setColor(QPalette::HighlightedText, Qt::white);
    p.setColor(QPalette::Disabled, QPalette::Text,       Qt::gray);
    p.setColor(QPalette::Disabled, QPalette::ButtonText, Qt::gray);
    app.setPalette(p);
}

// ─── Menu ─────────────────────────────────────────────────────────────────────
void MainWindow::setupMenuBar() {
    auto* file = menuBar()->addMenu("File");
    file->addAction("Open Drawing...", this, &MainWindow::onOpenDrawing, QKeySequence::Open);
    file->addSeparator();
    file->addAction("Exit", qApp, &QApplication::quit, QKeySequence::Quit);

    menuBar()->addAction("About", this, [this]() {
        QMessageBox::about(this, "About SectionVolumes",
            "<b>SectionVolumes</b><br><br>"
            "Excavation and filling volumes per cross-section,<br>"
            "read from the material lists of one alignment.");
    });
}

// ─── UI ───────────────────────────────────────────────────────────────────────
void MainWindow::setupUI() {
    auto* central = new QWidget(this);
    setCentralWidget(central);
    auto* root = new QHBoxLayout(central);
    root->setSpacing(6);
    root->setContentsMargins(6, 6, 6, 6);

    // ── Left: selection ───────────────────────────────────────────────────────
    auto* selBox = new QGroupBox("Alignment");
    auto* selLay = new QVBoxLayout(selBox);

    drawingLabel_ = new QLabel("No drawing");
    drawingLabel_->setWordWrap(true);
    drawingLabel_->setStyleSheet("color:#aaa;font-size:11px;");
    selLay->addWidget(drawingLabel_);

    alignmentCombo_ = new QComboBox;
    alignmentCombo_->setEnabled(false);
    selLay->addWidget(alignmentCombo_);

    verboseChk_ = new QCheckBox("Verbose log");
    verboseChk_->setStyleSheet("color:#888;font-size:11px;");
    verboseChk_->setToolTip("Trace every material list and item in the log");
    selLay->addWidget(verboseChk_);

    runBtn_ = new QPushButton("Run report");
    runBtn_->setStyleSheet(
        "background:#1e8449;color:white;font-size:13px;padding:10px;border-radius:4px;");
    runBtn_->setEnabled(false);
    selLay->addWidget(runBtn_);
    selLay->addStretch();

    statusLabel_ = new QLabel("Open a drawing to start");
    statusLabel_->setWordWrap(true);
    statusLabel_->setStyleSheet("color:#aaa;font-size:11px;");
    selLay->addWidget(statusLabel_);
    selBox->setFixedWidth(250);

    // ── Center: Report / Log ──────────────────────────────────────────────────
    tabs_ = new QTabWidget;

    reportView_ = new QTextEdit;
    reportView_->setReadOnly(true);
    reportView_->setFontFamily("Courier New");
    reportView_->setLineWrapMode(QTextEdit::NoWrap);
    tabs_->addTab(reportView_, "Report");

    logView_ = new QTextEdit;
    logView_->setReadOnly(true);
    logView_->setFontFamily("Courier New");
    tabs_->addTab(logView_, "Log");

    root->addWidget(selBox);
    root->addWidget(tabs_, 1);

    connect(runBtn_, &QPushButton::clicked, this, &MainWindow::onRunReport);
    connect(alignmentCombo_, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &MainWindow::onAlignmentChanged);
}

// ─── Drawing ──────────────────────────────────────────────────────────────────
void MainWindow::onOpenDrawing() {
    QSettings settings;
    QString file = QFileDialog::getOpenFileName(
        this, "Open drawing", settings.value(kLastDrawingKey).toString(),
        "Drawing database (*.sqlite *.db);;All (*)");
    if (file.isEmpty()) return;
    if (!openDrawing(file)) {
        QMessageBox::warning(this, "Error",
            QString("Could not open the drawing:\n%1").arg(statusLabel_->text()));
    }
}

bool MainWindow::openDrawing(const QString& fileName) {
    auto db = std::make_unique<DrawingDatabase>();
    if (!db->open(fileName, DrawingDatabase::ReadOnly)) {
        statusLabel_->setText(db->lastError());
        logView_->append(QString("✖ %1: %2").arg(fileName, db->lastError()));
        return false;
    }

    drawing_ = std::move(db);
    QSettings().setValue(kLastDrawingKey, fileName);
    drawingLabel_->setText(QFileInfo(fileName).fileName());
    logView_->append(QString("─── Drawing: %1 ───").arg(fileName));
    return reloadAlignments();
}

int MainWindow::alignmentCount() const {
    return alignmentCombo_->count();
}

bool MainWindow::reloadAlignments() {
    alignmentCombo_->clear();
    reportView_->clear();
    runBtn_->setEnabled(false);
    if (!drawing_) return false;

    auto all = drawing_->alignments();
    if (!drawing_->lastError().isEmpty()) {
        alignmentCombo_->setEnabled(false);
        statusLabel_->setText("Alignments could not be read: " + drawing_->lastError());
        logView_->append("✖ " + statusLabel_->text());
        return false;
    }
    for (const auto& a : all) {
        alignmentCombo_->addItem(QString::fromStdString(a.name),
                                 QString::fromStdString(a.id));
    }
    bool any = alignmentCombo_->count() > 0;
    alignmentCombo_->setEnabled(any);
    runBtn_->setEnabled(any);
    statusLabel_->setText(any ? QString("%1 alignment(s)").arg(alignmentCombo_->count())
                              : QString("The drawing has no alignments"));
    return true;
}

void MainWindow::onAlignmentChanged(int) {
    reportView_->clear();
}

// ─── Run ──────────────────────────────────────────────────────────────────────
void MainWindow::onRunReport() {
    if (!drawing_) return;

    // an empty id is the "nothing selected" case and cancels the command
    std::string alignmentId = alignmentCombo_->currentData().toString().toStdString();

    command_.verboseLogging = verboseChk_->isChecked();
    CommandOutcome outcome;
    {
        DrawingDatabase::ReadScope scope(*drawing_);
        outcome = command_.run(alignmentId, *drawing_);
    }
    showOutcome(outcome);
}

void MainWindow::showOutcome(const CommandOutcome& outcome) {
    QString message = QString::fromStdString(outcome.message);
    statusLabel_->setText(message);
    statusBar()->showMessage(message, 4000);

    switch (outcome.status) {
        case CommandOutcome::Ok:
            reportView_->setPlainText(QString::fromStdString(outcome.text()));
            tabs_->setCurrentIndex(0);
            logView_->append("✔ " + message);
            break;
        case CommandOutcome::NoData:
        case CommandOutcome::Cancelled:
            reportView_->setPlainText(message);
            logView_->append("─── " + message + " ───");
            break;
        case CommandOutcome::SelectionFailed:
        case CommandOutcome::Failed:
            reportView_->clear();
            logView_->append("✖ " + message);
            QMessageBox::warning(this, "Volume report", message);
            break;
    }

    for (const auto& f : outcome.faults) {
        logView_->append(QString("⚠ Skipped %1 record %2: %3")
            .arg(faultStageName(f.stage))
            .arg(QString::fromStdString(f.recordId))
            .arg(QString::fromStdString(f.reason)));
    }
}
