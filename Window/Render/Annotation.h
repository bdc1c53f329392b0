#pragma once
#include <QString>
#include <vtkSmartPointer.h>

class vtkTextActor;

namespace Annotation {

    // Подпись в мировых координатах; пустой text -> "(x, y, z)"
    vtkSmartPointer<vtkTextActor> CreateAnnotation(const double point[3], const QString& text = QString());

    double  MeasureDistance(const double a[3], const double b[3]);
    QString FormatPoint(const double p[3]);
    QString FormatDistance(double d);

} // namespace Annotation
