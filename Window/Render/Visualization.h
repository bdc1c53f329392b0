#pragma once
#include <QString>
#include <vtkSmartPointer.h>
#include <Services/Rgb.h>

class vtkRenderer;
class vtkRenderWindow;
class vtkRenderWindowInteractor;
class vtkOrientationMarkerWidget;
class vtkCubeAxesActor;
class vtkLight;
class vtkTextActor;

namespace Visualization {

    // size - доля вьюпорта (0, 1], маркер в левом нижнем углу
    vtkSmartPointer<vtkOrientationMarkerWidget> AddAxes(vtkRenderWindowInteractor* iren,
        const Rgb& color = { 1.0, 1.0, 1.0 }, double size = 0.2, QString* error = nullptr);

    // Куб по границам видимых объектов сцены
    vtkSmartPointer<vtkCubeAxesActor> AddBoundingBox(vtkRenderer* renderer,
        const Rgb& color = { 0.8, 0.8, 0.8 }, bool gridLines = false, QString* error = nullptr);

    vtkSmartPointer<vtkLight> AddLighting(vtkRenderer* renderer, const double position[3],
        double intensity = 1.0, double ambient = 0.3, QString* error = nullptr);

    bool SetBackground(vtkRenderer* renderer, const Rgb& color, QString* error = nullptr);

    // x, y в нормализованных координатах вьюпорта
    vtkSmartPointer<vtkTextActor> AddTextOverlay(vtkRenderer* renderer, const QString& text,
        double x = 0.02, double y = 0.95, const Rgb& color = { 1.0, 1.0, 1.0 }, int fontSize = 14,
        QString* error = nullptr);

    // PNG / JPEG по расширению
    bool SaveView(vtkRenderWindow* window, const QString& path, QString* error = nullptr);

} // namespace Visualization
