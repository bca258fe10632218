#include <QApplication>
#include <QDebug>
#include <QFile>

#include "MainWindow.hpp"

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);

    QFile styleFile(":/styles/demo.qss");
    if (styleFile.open(QFile::ReadOnly | QFile::Text))
        app.setStyleSheet(QLatin1String(styleFile.readAll()));
    else
        qWarning() << "Failed to open stylesheet file!";

    MainWindow win;
    win.show();
    return app.exec();
}
