#include "ClipBoxController.h"
#include <Services/LogCategories.h>

#include <vtkAbstractMapper.h>
#include <vtkActor.h>
#include <vtkBoxRepresentation.h>
#include <vtkBoxWidget2.h>
#include <vtkCallbackCommand.h>
#include <vtkGPUVolumeRayCastMapper.h>
#include <vtkPlane.h>
#include <vtkPlaneCollection.h>
#include <vtkPlanes.h>
#include <vtkProperty.h>
#include <vtkRenderWindow.h>
#include <vtkRenderWindowInteractor.h>
#include <vtkRenderer.h>
#include <vtkVolume.h>

namespace
{
    vtkAbstractMapper* mapperOf(vtkProp3D* prop)
    {
        if (auto* a = vtkActor::SafeDownCast(prop))  return a->GetMapper();
        if (auto* v = vtkVolume::SafeDownCast(prop)) return v->GetMapper();
        return nullptr;
    }
}

ClipBoxController::ClipBoxController(QObject* parent)
    : QObject(parent)
{
    mRep = vtkSmartPointer<vtkBoxRepresentation>::New();
    mRep->SetPlaceFactor(1.0);
    mRep->InsideOutOn();          // нормали внутрь: оставляем содержимое коробки
    mRep->HandlesOn();
    mRep->GetOutlineProperty()->SetColor(0.2, 0.8, 1.0);
    mRep->GetSelectedOutlineProperty()->SetColor(1.0, 0.8, 0.2);

    mWidget = vtkSmartPointer<vtkBoxWidget2>::New();
    mWidget->SetRepresentation(mRep);
    mWidget->RotationEnabledOff();
    mWidget->EnabledOff();

    mCb = vtkSmartPointer<vtkCallbackCommand>::New();
    mCb->SetClientData(this);
    mCb->SetCallback(&ClipBoxController::onInteraction);

    mWidget->AddObserver(vtkCommand::InteractionEvent, mCb);
    mWidget->AddObserver(vtkCommand::EndInteractionEvent, mCb);
}

ClipBoxController::~ClipBoxController()
{
    if (mWidget)
    {
        mWidget->RemoveObserver(mCb);
        if (mInteractor) mWidget->EnabledOff();
    }
}

void ClipBoxController::setRenderer(vtkRenderer* ren)
{
    mRenderer = ren;
    mWidget->SetCurrentRenderer(mRenderer);
    mWidget->SetDefaultRenderer(mRenderer);
}

void ClipBoxController::setInteractor(vtkRenderWindowInteractor* iren)
{
    mInteractor = iren;
    mWidget->SetInteractor(mInteractor);
}

void ClipBoxController::attach(vtkProp3D* prop)
{
    if (mTarget && mTarget != prop)
        clearClipping();

    mTarget = prop;
    if (!mTarget)
    {
        setEnabled(false);
        return;
    }

    resetToBounds();
    if (mEnabled)
        applyClippingFromBox();
    render();
}

void ClipBoxController::setEnabled(bool on)
{
    const bool hasTarget = mRenderer && mInteractor && mTarget;
    const bool want = on && hasTarget;
    if (mEnabled == want) return;

    mEnabled = want;
    mWidget->SetEnabled(mEnabled ? 1 : 0);

    if (mEnabled)
    {
        // всегда с ровной коробки по объекту
        resetToBounds();
        applyClippingFromBox();
    }
    else
    {
        clearClipping();
    }

    qCDebug(lcRender) << "Clip box" << (mEnabled ? "on" : "off");
    render();
}

void ClipBoxController::resetToBounds()
{
    if (!mTarget) return;
    double b[6];
    mTarget->GetBounds(b);
    mRep->PlaceWidget(b);
}

void ClipBoxController::applyNow()
{
    if (!mEnabled) return;
    applyClippingFromBox();
    render();
}

vtkSmartPointer<vtkPlaneCollection> ClipBoxController::currentPlanes() const
{
    auto planes = vtkSmartPointer<vtkPlanes>::New();
    mRep->GetPlanes(planes);

    auto out = vtkSmartPointer<vtkPlaneCollection>::New();
    for (int i = 0; i < planes->GetNumberOfPlanes(); ++i)
    {
        // GetPlane(i) возвращает внутренний объект, копируем
        auto p = vtkSmartPointer<vtkPlane>::New();
        vtkPlane* src = planes->GetPlane(i);
        p->SetOrigin(src->GetOrigin());
        p->SetNormal(src->GetNormal());
        out->AddItem(p);
    }
    return out;
}

void ClipBoxController::applyClippingFromBox()
{
    if (!mEnabled || !mTarget) return;
    vtkAbstractMapper* mapper = mapperOf(mTarget);
    if (!mapper) return;

    if (auto* gm = vtkGPUVolumeRayCastMapper::SafeDownCast(mapper))
        gm->SetCropping(false);

    mapper->RemoveAllClippingPlanes();
    mapper->SetClippingPlanes(currentPlanes());
    mapper->Modified();
    emit clipChanged();
}

void ClipBoxController::clearClipping()
{
    if (vtkAbstractMapper* mapper = mapperOf(mTarget))
    {
        mapper->RemoveAllClippingPlanes();
        mapper->Modified();
    }
}

void ClipBoxController::render()
{
    if (!mRenderer) return;
    mRenderer->ResetCameraClippingRange();
    if (auto* rw = mRenderer->GetRenderWindow())
        rw->Render();
}

void ClipBoxController::onInteraction(vtkObject*, unsigned long evId, void* cd, void*)
{
    auto* self = static_cast<ClipBoxController*>(cd);
    if (!self) return;

    self->applyClippingFromBox();
    if (evId == vtkCommand::EndInteractionEvent)
        self->render();
}
