#include <gtest/gtest.h>
#include <QCoreApplication>
#include <vtkOutputWindow.h>

int main(int argc, char** argv)
{
    // QFile/QDir/QNetwork нужен экземпляр приложения
    QCoreApplication app(argc, argv);
    vtkOutputWindow::SetGlobalWarningDisplay(false);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
