#pragma once
#include <QString>
#include <QStringList>
#include <array>
#include <functional>
#include <vector>
#include <vtkSmartPointer.h>

class vtkRenderer;
class vtkRenderWindowInteractor;
class vtkProp;
class vtkProp3D;
class vtkPlaneCollection;
class vtkDistanceWidget;
class vtkTextWidget;

namespace Interaction {

    using Vec3 = std::array<double, 3>;

    // trackball, joystick, flight, image
    QStringList StyleNames();
    bool SetInteractionStyle(vtkRenderWindowInteractor* iren, const QString& name, QString* error = nullptr);

    // Одна точка на все нормали, иначе количества должны совпадать.
    // Пустые списки: (0,0,0) и три оси.
    vtkSmartPointer<vtkPlaneCollection> MakePlanes(const std::vector<Vec3>& origins,
        const std::vector<Vec3>& normals, QString* error = nullptr);

    bool AddClippingPlanes(vtkProp3D* prop, const std::vector<Vec3>& origins = {},
        const std::vector<Vec3>& normals = {}, QString* error = nullptr);
    void RemoveClippingPlanes(vtkProp3D* prop);

    using PickCallback = std::function<void(const double pos[3], vtkProp* prop, long long cellId)>;

    // Возвращает tag наблюдателя для RemoveObserver
    unsigned long AddPicking(vtkRenderWindowInteractor* iren, vtkRenderer* renderer, PickCallback cb);

    vtkSmartPointer<vtkDistanceWidget> AddMeasurementTool(vtkRenderWindowInteractor* iren,
        std::function<void(double)> onMeasured = {});

    vtkSmartPointer<vtkTextWidget> AddAnnotationTool(vtkRenderWindowInteractor* iren, const QString& text);

} // namespace Interaction
