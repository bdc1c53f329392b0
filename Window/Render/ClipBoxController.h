#pragma once
#include <QObject>
#include <vtkSmartPointer.h>

class vtkRenderer;
class vtkRenderWindowInteractor;
class vtkBoxWidget2;
class vtkBoxRepresentation;
class vtkCallbackCommand;
class vtkObject;
class vtkProp3D;
class vtkPlaneCollection;

// Интерактивная коробка, режущая текущий объём или модель шестью плоскостями
class ClipBoxController : public QObject
{
    Q_OBJECT
public:
    explicit ClipBoxController(QObject* parent = nullptr);
    ~ClipBoxController() override;

    void setRenderer(vtkRenderer* ren);
    void setInteractor(vtkRenderWindowInteractor* iren);

    // vtkVolume или vtkActor; nullptr отключает
    void attach(vtkProp3D* prop);
    vtkProp3D* target() const { return mTarget; }

    void setEnabled(bool on);
    bool isEnabled() const { return mEnabled; }

    void resetToBounds();
    void applyNow();

    // Текущие плоскости коробки, нормали внутрь
    vtkSmartPointer<vtkPlaneCollection> currentPlanes() const;

signals:
    void clipChanged();

private:
    void applyClippingFromBox();
    void clearClipping();
    void render();

    static void onInteraction(vtkObject*, unsigned long, void*, void*);

private:
    bool mEnabled{ false };

    vtkSmartPointer<vtkRenderer>                mRenderer;
    vtkSmartPointer<vtkRenderWindowInteractor>  mInteractor;
    vtkSmartPointer<vtkProp3D>                  mTarget;
    vtkSmartPointer<vtkBoxWidget2>              mWidget;
    vtkSmartPointer<vtkBoxRepresentation>       mRep;
    vtkSmartPointer<vtkCallbackCommand>         mCb;
};
