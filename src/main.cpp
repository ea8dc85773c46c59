#include <QApplication>
#include "MainWindow.h"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("SectionVolumes");
    app.setApplicationVersion("1.0");
    app.setOrganizationName("SectionVolumes");
    MainWindow::applyDarkTheme(app);

    MainWindow w;
    if (argc > 1) w.openDrawing(QString::fromLocal8Bit(argv[1]));
    w.show();
    return app.exec();
}
