#include <Services/AppConfig.h>
#include <Services/Logger.h>
#include <Services/LogCategories.h>
#include <Window/MainWindow/MainWindow.h>

#include <QApplication>
#include <QFileInfo>
#include <QSurfaceFormat>
#include <QStyleFactory>
#include <QTimer>
#include <QVTKOpenGLNativeWidget.h>
#include <vtkOutputWindow.h>

int main(int argc, char* argv[])
{
    // вывод VTK идёт через VtkErrorCatcher / лог
    vtkOutputWindow::SetGlobalWarningDisplay(false);

    QSurfaceFormat::setDefaultFormat(QVTKOpenGLNativeWidget::defaultFormat());
    QApplication app(argc, argv);
    app.setApplicationName("MedView3D");
    app.setStyle(QStyleFactory::create("Fusion"));

    const QString configPath = AppConfig::defaultPath();
    AppConfig cfg = AppConfig::loadOrCreateDefault(configPath);

    QString err;
    if (!Logger::install(cfg.logSettings(), &err))
        qCWarning(lcApp) << "Logging to file disabled:" << err;
    if (!cfg.ensureDirectories(&err))
        qCWarning(lcConfig) << err;

    qCInfo(lcApp) << "Starting" << cfg.appName << "config" << configPath;

    MainWindow w(cfg, configPath);
    w.show();

    // --- если есть аргумент пути ---
    if (argc > 1)
    {
        const QString argPath = QString::fromLocal8Bit(argv[1]);
        if (QFileInfo::exists(argPath))
            QTimer::singleShot(0, &w, [&w, argPath]() { w.openPath(argPath); });
        else
            qCWarning(lcApp) << "No such file:" << argPath;
    }

    const int rc = app.exec();
    Logger::uninstall();
    return rc;
}
