#pragma once
#include <QString>
#include <array>
#include <vtkSmartPointer.h>
#include <vtkType.h>

#include "Rgb.h"

class vtkActor;
class vtkPolyData;

struct ModelOptions
{
    Rgb     color{ 1.0, 1.0, 1.0 };
    double  opacity = 1.0;
    QString shading = "gouraud";        // flat | gouraud | phong
    bool    edgeVisibility = false;
    Rgb     edgeColor{ 0.0, 0.0, 0.0 };
    double  edgeWidth = 1.0;
};

struct ModelInfo
{
    QString   filePath;
    qint64    fileSize = 0;
    double    bounds[6]{ 0, 0, 0, 0, 0, 0 };
    vtkIdType numPoints = 0;
    vtkIdType numCells = 0;
    double    surfaceArea = 0.0;
    double    volume = 0.0;
    std::array<double, 3> centerOfMass{ 0.0, 0.0, 0.0 };
};

namespace ModelLoader {

    enum class Shading { Flat, Gouraud, Phong };

    bool parseShading(const QString& text, Shading& out);

    // Проверка параметров без обращения к файлу.
    bool validate(const ModelOptions& opt, QString* error = nullptr);

    vtkSmartPointer<vtkPolyData> ReadPolyData(const QString& path, QString* error = nullptr);

    // STL/OBJ -> actor. Параметры проверяются раньше, чем существование файла.
    vtkSmartPointer<vtkActor> Load(const QString& path, const ModelOptions& opt = ModelOptions(), QString* error = nullptr);

    bool ApplyOptions(vtkActor* actor, const ModelOptions& opt, QString* error = nullptr);

    ModelInfo GetInfo(vtkPolyData* poly);
    bool GetInfo(const QString& path, ModelInfo& out, QString* error = nullptr);

    // Сдвиг/масштаб применяются к геометрии на входе мэппера.
    bool Center(vtkActor* actor, QString* error = nullptr);
    bool Normalize(vtkActor* actor, QString* error = nullptr);

} // namespace ModelLoader
