#include "Interaction.h"
#include <Services/LogCategories.h>

#include <vtkAbstractMapper.h>
#include <vtkActor.h>
#include <vtkCellPicker.h>
#include <vtkCommand.h>
#include <vtkCoordinate.h>
#include <vtkDistanceRepresentation.h>
#include <vtkDistanceRepresentation2D.h>
#include <vtkDistanceWidget.h>
#include <vtkInteractorStyleFlight.h>
#include <vtkInteractorStyleImage.h>
#include <vtkInteractorStyleJoystickCamera.h>
#include <vtkInteractorStyleTrackballCamera.h>
#include <vtkMath.h>
#include <vtkPlane.h>
#include <vtkPlaneCollection.h>
#include <vtkRenderWindowInteractor.h>
#include <vtkRenderer.h>
#include <vtkTextActor.h>
#include <vtkTextProperty.h>
#include <vtkTextRepresentation.h>
#include <vtkTextWidget.h>
#include <vtkVolume.h>

namespace
{
    template <typename T>
    T fail(QString* error, const QString& msg, T value)
    {
        qCWarning(lcRender).noquote() << msg;
        if (error) *error = msg;
        return value;
    }

    vtkAbstractMapper* mapperOf(vtkProp3D* prop)
    {
        if (auto* a = vtkActor::SafeDownCast(prop))
            return a->GetMapper();
        if (auto* v = vtkVolume::SafeDownCast(prop))
            return v->GetMapper();
        return nullptr;
    }

    class PickCommand : public vtkCommand
    {
    public:
        static PickCommand* New() { return new PickCommand; }

        vtkSmartPointer<vtkCellPicker> Picker;
        vtkRenderer* Renderer = nullptr;
        Interaction::PickCallback Callback;

        void Execute(vtkObject* caller, unsigned long, void*) override
        {
            auto* iren = vtkRenderWindowInteractor::SafeDownCast(caller);
            if (!iren || !Renderer) return;

            const int* pos = iren->GetEventPosition();
            Picker->Pick(pos[0], pos[1], 0, Renderer);
            if (Picker->GetCellId() < 0)
                return;

            double p[3];
            Picker->GetPickPosition(p);
            qCDebug(lcRender) << "Picked" << p[0] << p[1] << p[2] << "cell" << Picker->GetCellId();
            if (Callback)
                Callback(p, Picker->GetViewProp(), static_cast<long long>(Picker->GetCellId()));
        }
    };

    class DistanceEndCommand : public vtkCommand
    {
    public:
        static DistanceEndCommand* New() { return new DistanceEndCommand; }
        std::function<void(double)> Callback;

        void Execute(vtkObject* caller, unsigned long, void*) override
        {
            auto* w = vtkDistanceWidget::SafeDownCast(caller);
            if (!w) return;
            auto* rep = vtkDistanceRepresentation::SafeDownCast(w->GetRepresentation());
            if (!rep) return;
            const double d = rep->GetDistance();
            qCInfo(lcRender) << "Measured distance" << d;
            if (Callback) Callback(d);
        }
    };
}

QStringList Interaction::StyleNames()
{
    return { "trackball", "joystick", "flight", "image" };
}

bool Interaction::SetInteractionStyle(vtkRenderWindowInteractor* iren, const QString& name, QString* error)
{
    const QString key = name.trimmed().toLower();
    vtkSmartPointer<vtkInteractorObserver> style;
    if (key == "trackball")     style = vtkSmartPointer<vtkInteractorStyleTrackballCamera>::New();
    else if (key == "joystick") style = vtkSmartPointer<vtkInteractorStyleJoystickCamera>::New();
    else if (key == "flight")   style = vtkSmartPointer<vtkInteractorStyleFlight>::New();
    else if (key == "image")    style = vtkSmartPointer<vtkInteractorStyleImage>::New();
    else
        return fail(error, QString("Unknown interaction style: %1 (use %2)").arg(name, StyleNames().join(", ")), false);

    if (!iren)
        return fail(error, "No interactor", false);

    iren->SetInteractorStyle(style);
    qCDebug(lcRender) << "Interaction style" << key;
    return true;
}

vtkSmartPointer<vtkPlaneCollection> Interaction::MakePlanes(const std::vector<Vec3>& originsIn,
    const std::vector<Vec3>& normalsIn, QString* error)
{
    using Ret = vtkSmartPointer<vtkPlaneCollection>;

    std::vector<Vec3> origins = originsIn;
    std::vector<Vec3> normals = normalsIn;
    if (origins.empty()) origins = { Vec3{ 0.0, 0.0, 0.0 } };
    if (normals.empty()) normals = { Vec3{ 1.0, 0.0, 0.0 }, Vec3{ 0.0, 1.0, 0.0 }, Vec3{ 0.0, 0.0, 1.0 } };

    if (origins.size() != 1 && origins.size() != normals.size())
        return fail(error, QString("Number of origins (%1) must be 1 or match number of normals (%2)")
            .arg(origins.size()).arg(normals.size()), Ret());

    auto planes = Ret::New();
    for (size_t i = 0; i < normals.size(); ++i)
    {
        double n[3] = { normals[i][0], normals[i][1], normals[i][2] };
        if (vtkMath::Norm(n) == 0.0)
            return fail(error, QString("Normal %1 is zero").arg(i), Ret());

        const Vec3& o = origins.size() == 1 ? origins[0] : origins[i];
        auto p = vtkSmartPointer<vtkPlane>::New();
        p->SetOrigin(o[0], o[1], o[2]);
        p->SetNormal(n);
        planes->AddItem(p);
    }
    return planes;
}

bool Interaction::AddClippingPlanes(vtkProp3D* prop, const std::vector<Vec3>& origins,
    const std::vector<Vec3>& normals, QString* error)
{
    vtkAbstractMapper* mapper = mapperOf(prop);
    if (!mapper)
        return fail(error, "Clipping needs an actor or volume with a mapper", false);

    auto planes = MakePlanes(origins, normals, error);
    if (!planes)
        return false;

    mapper->SetClippingPlanes(planes);
    qCDebug(lcRender) << "Clipping planes:" << planes->GetNumberOfItems();
    return true;
}

void Interaction::RemoveClippingPlanes(vtkProp3D* prop)
{
    if (vtkAbstractMapper* mapper = mapperOf(prop))
        mapper->RemoveAllClippingPlanes();
}

unsigned long Interaction::AddPicking(vtkRenderWindowInteractor* iren, vtkRenderer* renderer, PickCallback cb)
{
    if (!iren || !renderer)
        return 0;

    auto cmd = vtkSmartPointer<PickCommand>::New();
    cmd->Picker = vtkSmartPointer<vtkCellPicker>::New();
    cmd->Picker->SetTolerance(1e-6);
    cmd->Renderer = renderer;
    cmd->Callback = std::move(cb);
    return iren->AddObserver(vtkCommand::LeftButtonPressEvent, cmd);
}

vtkSmartPointer<vtkDistanceWidget> Interaction::AddMeasurementTool(vtkRenderWindowInteractor* iren,
    std::function<void(double)> onMeasured)
{
    if (!iren)
        return nullptr;

    auto rep = vtkSmartPointer<vtkDistanceRepresentation2D>::New();
    rep->SetLabelFormat("%-#6.3g mm");

    auto w = vtkSmartPointer<vtkDistanceWidget>::New();
    w->SetInteractor(iren);
    w->SetRepresentation(rep);

    auto cmd = vtkSmartPointer<DistanceEndCommand>::New();
    cmd->Callback = std::move(onMeasured);
    w->AddObserver(vtkCommand::EndInteractionEvent, cmd);

    w->On();
    return w;
}

vtkSmartPointer<vtkTextWidget> Interaction::AddAnnotationTool(vtkRenderWindowInteractor* iren, const QString& text)
{
    if (!iren)
        return nullptr;

    auto actor = vtkSmartPointer<vtkTextActor>::New();
    const QByteArray utf8 = text.toUtf8();
    actor->SetInput(utf8.constData());
    actor->GetTextProperty()->SetColor(1.0, 1.0, 1.0);

    auto rep = vtkSmartPointer<vtkTextRepresentation>::New();
    rep->GetPositionCoordinate()->SetValue(0.15, 0.15);
    rep->GetPosition2Coordinate()->SetValue(0.3, 0.08);

    auto w = vtkSmartPointer<vtkTextWidget>::New();
    w->SetRepresentation(rep);
    w->SetInteractor(iren);
    w->SetTextActor(actor);
    w->SelectableOff();
    w->On();
    return w;
}
