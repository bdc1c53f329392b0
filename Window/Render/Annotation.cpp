#include "Annotation.h"

#include <vtkCoordinate.h>
#include <vtkTextActor.h>
#include <vtkTextProperty.h>
#include <cmath>

vtkSmartPointer<vtkTextActor> Annotation::CreateAnnotation(const double point[3], const QString& text)
{
    auto actor = vtkSmartPointer<vtkTextActor>::New();
    const QByteArray utf8 = (text.isEmpty() ? FormatPoint(point) : text).toUtf8();
    actor->SetInput(utf8.constData());

    actor->GetPositionCoordinate()->SetCoordinateSystemToWorld();
    actor->GetPositionCoordinate()->SetValue(point[0], point[1], point[2]);

    auto* tp = actor->GetTextProperty();
    tp->SetFontSize(20);
    tp->SetColor(1.0, 1.0, 1.0);
    tp->SetShadow(1);
    return actor;
}

double Annotation::MeasureDistance(const double a[3], const double b[3])
{
    const double dx = b[0] - a[0];
    const double dy = b[1] - a[1];
    const double dz = b[2] - a[2];
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

QString Annotation::FormatPoint(const double p[3])
{
    return QString::asprintf("(%.2f, %.2f, %.2f)", p[0], p[1], p[2]);
}

QString Annotation::FormatDistance(double d)
{
    return QString::asprintf("Distance: %.2f mm", d);
}
