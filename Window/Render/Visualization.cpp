#include "Visualization.h"
#include <Services/LogCategories.h>

#include <QFile>
#include <QFileInfo>

#include <vtkActor.h>
#include <vtkActorCollection.h>
#include <vtkAxesActor.h>
#include <vtkCamera.h>
#include <vtkCaptionActor2D.h>
#include <vtkCoordinate.h>
#include <vtkCubeAxesActor.h>
#include <vtkJPEGWriter.h>
#include <vtkLight.h>
#include <vtkMath.h>
#include <vtkOrientationMarkerWidget.h>
#include <vtkPNGWriter.h>
#include <vtkProperty.h>
#include <vtkRenderWindow.h>
#include <vtkRenderWindowInteractor.h>
#include <vtkRenderer.h>
#include <vtkTextActor.h>
#include <vtkTextProperty.h>
#include <vtkVolume.h>
#include <vtkVolumeCollection.h>
#include <vtkVolumeProperty.h>
#include <vtkWindowToImageFilter.h>

namespace
{
    template <typename T>
    T fail(QString* error, const QString& msg, T value)
    {
        qCWarning(lcRender).noquote() << msg;
        if (error) *error = msg;
        return value;
    }

    inline bool unit(double v) { return v >= 0.0 && v <= 1.0; }
}

vtkSmartPointer<vtkOrientationMarkerWidget> Visualization::AddAxes(vtkRenderWindowInteractor* iren,
    const Rgb& color, double size, QString* error)
{
    using Ret = vtkSmartPointer<vtkOrientationMarkerWidget>;
    if (!(size > 0.0 && size <= 1.0))
        return fail(error, "Axes size must be in (0, 1]", Ret());
    if (!IsUnitRgb(color))
        return fail(error, "Color values must be between 0 and 1", Ret());
    if (!iren)
        return fail(error, "No interactor", Ret());

    auto axes = vtkSmartPointer<vtkAxesActor>::New();
    for (vtkProperty* p : { axes->GetXAxisShaftProperty(), axes->GetYAxisShaftProperty(), axes->GetZAxisShaftProperty() })
        p->SetColor(color[0], color[1], color[2]);
    for (vtkCaptionActor2D* c : { axes->GetXAxisCaptionActor2D(), axes->GetYAxisCaptionActor2D(), axes->GetZAxisCaptionActor2D() })
        c->GetCaptionTextProperty()->SetColor(color[0], color[1], color[2]);

    auto w = vtkSmartPointer<vtkOrientationMarkerWidget>::New();
    w->SetOrientationMarker(axes);
    w->SetInteractor(iren);
    w->SetViewport(0.0, 0.0, size, size);
    w->SetOutlineColor(color[0], color[1], color[2]);
    w->EnabledOn();
    w->InteractiveOff();
    return w;
}

vtkSmartPointer<vtkCubeAxesActor> Visualization::AddBoundingBox(vtkRenderer* renderer,
    const Rgb& color, bool gridLines, QString* error)
{
    using Ret = vtkSmartPointer<vtkCubeAxesActor>;
    if (!IsUnitRgb(color))
        return fail(error, "Color values must be between 0 and 1", Ret());
    if (!renderer)
        return fail(error, "No renderer", Ret());

    double b[6];
    renderer->ComputeVisiblePropBounds(b);
    if (!vtkMath::AreBoundsInitialized(b))
        return fail(error, "Nothing in the scene to bound", Ret());

    auto cube = vtkSmartPointer<vtkCubeAxesActor>::New();
    cube->SetUseBounds(false);     // сам в границы не входит
    cube->SetBounds(b);
    cube->SetCamera(renderer->GetActiveCamera());
    cube->SetFlyModeToOuterEdges();

    for (int i = 0; i < 3; ++i)
    {
        cube->GetTitleTextProperty(i)->SetColor(color[0], color[1], color[2]);
        cube->GetLabelTextProperty(i)->SetColor(color[0], color[1], color[2]);
    }
    cube->GetXAxesLinesProperty()->SetColor(color[0], color[1], color[2]);
    cube->GetYAxesLinesProperty()->SetColor(color[0], color[1], color[2]);
    cube->GetZAxesLinesProperty()->SetColor(color[0], color[1], color[2]);

    if (gridLines)
    {
        cube->DrawXGridlinesOn();
        cube->DrawYGridlinesOn();
        cube->DrawZGridlinesOn();
        cube->GetXAxesGridlinesProperty()->SetColor(color[0], color[1], color[2]);
        cube->GetYAxesGridlinesProperty()->SetColor(color[0], color[1], color[2]);
        cube->GetZAxesGridlinesProperty()->SetColor(color[0], color[1], color[2]);
    }

    renderer->AddActor(cube);
    return cube;
}

vtkSmartPointer<vtkLight> Visualization::AddLighting(vtkRenderer* renderer, const double position[3],
    double intensity, double ambient, QString* error)
{
    using Ret = vtkSmartPointer<vtkLight>;
    if (!unit(intensity))
        return fail(error, "Light intensity must be between 0 and 1", Ret());
    if (!unit(ambient))
        return fail(error, "Ambient must be between 0 and 1", Ret());
    if (!renderer)
        return fail(error, "No renderer", Ret());

    auto light = vtkSmartPointer<vtkLight>::New();
    light->SetLightTypeToSceneLight();
    light->SetPosition(position[0], position[1], position[2]);
    light->SetFocalPoint(0.0, 0.0, 0.0);
    light->SetIntensity(intensity);
    renderer->AddLight(light);

    vtkActorCollection* actors = renderer->GetActors();
    actors->InitTraversal();
    while (vtkActor* a = actors->GetNextActor())
        a->GetProperty()->SetAmbient(ambient);

    vtkVolumeCollection* volumes = renderer->GetVolumes();
    volumes->InitTraversal();
    while (vtkVolume* v = volumes->GetNextVolume())
        if (v->GetProperty()) v->GetProperty()->SetAmbient(ambient);

    return light;
}

bool Visualization::SetBackground(vtkRenderer* renderer, const Rgb& color, QString* error)
{
    if (!IsUnitRgb(color))
        return fail(error, "Color values must be between 0 and 1", false);
    if (!renderer)
        return fail(error, "No renderer", false);

    renderer->SetBackground(color[0], color[1], color[2]);
    return true;
}

vtkSmartPointer<vtkTextActor> Visualization::AddTextOverlay(vtkRenderer* renderer, const QString& text,
    double x, double y, const Rgb& color, int fontSize, QString* error)
{
    using Ret = vtkSmartPointer<vtkTextActor>;
    if (!unit(x) || !unit(y))
        return fail(error, "Text position must be between 0 and 1", Ret());
    if (!IsUnitRgb(color))
        return fail(error, "Color values must be between 0 and 1", Ret());
    if (fontSize <= 0)
        return fail(error, "Font size must be positive", Ret());
    if (!renderer)
        return fail(error, "No renderer", Ret());

    auto actor = vtkSmartPointer<vtkTextActor>::New();
    const QByteArray utf8 = text.toUtf8();
    actor->SetInput(utf8.constData());
    actor->GetPositionCoordinate()->SetCoordinateSystemToNormalizedViewport();
    actor->GetPositionCoordinate()->SetValue(x, y);

    auto* tp = actor->GetTextProperty();
    tp->SetFontSize(fontSize);
    tp->SetColor(color[0], color[1], color[2]);
    // верхний край текста на y
    tp->SetVerticalJustificationToTop();

    renderer->AddActor2D(actor);
    return actor;
}

bool Visualization::SaveView(vtkRenderWindow* window, const QString& path, QString* error)
{
    if (!window)
        return fail(error, "No render window", false);

    const QString ext = QFileInfo(path).suffix().toLower();
    if (ext != "png" && ext != "jpg" && ext != "jpeg")
        return fail(error, QString("Unsupported image format: .%1 (use png or jpg)").arg(ext), false);

    window->Render();

    auto grab = vtkSmartPointer<vtkWindowToImageFilter>::New();
    grab->SetInput(window);
    grab->SetInputBufferTypeToRGB();
    grab->ReadFrontBufferOff();
    grab->Update();

    const QByteArray native = QFile::encodeName(path);
    if (ext == "png")
    {
        auto w = vtkSmartPointer<vtkPNGWriter>::New();
        w->SetFileName(native.constData());
        w->SetInputConnection(grab->GetOutputPort());
        w->Write();
        if (w->GetErrorCode() != 0)
            return fail(error, QString("Failed to write %1").arg(path), false);
    }
    else
    {
        auto w = vtkSmartPointer<vtkJPEGWriter>::New();
        w->SetFileName(native.constData());
        w->SetQuality(95);
        w->SetInputConnection(grab->GetOutputPort());
        w->Write();
        if (w->GetErrorCode() != 0)
            return fail(error, QString("Failed to write %1").arg(path), false);
    }

    qCInfo(lcRender) << "View saved to" << path;
    return true;
}
