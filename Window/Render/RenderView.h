#pragma once
#include <QWidget>
#include <QPointer>
#include <QString>
#include <QVector>
#include <memory>
#include <vtkSmartPointer.h>

#include <Services/DicomLoader.h>
#include <Services/DicomRange.h>
#include <Services/Rgb.h>
#include "ClipBoxController.h"
#include "TransferFunction.h"

class QVTKOpenGLNativeWidget;
class QToolButton;
class QMenu;
class vtkRenderer;
class vtkRenderWindow;
class vtkActor;
class vtkVolume;
class vtkImageData;
class vtkOrientationMarkerWidget;
class vtkCubeAxesActor;
class vtkTextActor;
class vtkDistanceWidget;
class vtkPiecewiseFunction;

enum class ViewPreset { AP, PA, LAO, RAO, L, R };

class RenderView : public QWidget
{
    Q_OBJECT
public:
    explicit RenderView(QWidget* parent = nullptr);
    ~RenderView() override;

    // Модель STL/OBJ (актёр уже с опциями ModelLoader)
    void showModel(vtkSmartPointer<vtkActor> actor);
    // Объём DICOM/NIfTI
    bool showVolume(vtkSmartPointer<vtkImageData> image, const DicomInfo& info,
        const VolumeOptions& opt = VolumeOptions(), QString* error = nullptr);
    void clearScene();

    void resetCamera();
    void setViewPreset(ViewPreset v);

    void setSceneColors(const Rgb& background, const Rgb& axes, const Rgb& boundingBox);
    bool setAxesVisible(bool on);
    bool axesVisible() const;
    bool setBoundingBoxVisible(bool on, QString* error = nullptr);
    bool boundingBoxVisible() const { return mBoundingBox != nullptr; }

    bool setInteractionStyle(const QString& name, QString* error = nullptr);
    QString interactionStyle() const { return mStyle; }

    void setMeasureMode(bool on);
    bool measureMode() const { return mMeasure != nullptr; }
    void setAnnotateMode(bool on);
    bool annotateMode() const { return mAnnotate; }
    void clearAnnotations();

    void setClipEnabled(bool on);
    bool clipEnabled() const { return mClip && mClip->isEnabled(); }

    // 0..1: модель - opacity актёра, объём - множитель OTF
    void setOpacity(double value);
    void setWindow(double width, double center);
    bool applyPreset(TFPreset p);

    void setOverlayText(const QString& text);
    bool saveView(const QString& path, QString* error = nullptr);

    QVTKOpenGLNativeWidget* vtkWidget() const { return mVtk; }
    vtkRenderer* renderer() const { return mRenderer; }
    vtkActor* model() const { return mModel; }
    vtkVolume* volume() const { return mVolume; }
    vtkImageData* image() const { return mImage; }
    const DicomInfo& dicomInfo() const { return DI; }

signals:
    void pointPicked(double x, double y, double z);
    void distanceMeasured(double d);
    void annotationAdded(const QString& text);
    void clipToggled(bool on);
    void showInfo(const QString& text);
    void showWarning(const QString& text);

protected:
    void resizeEvent(QResizeEvent* e) override;
    void showEvent(QShowEvent* e) override;

private:
    void buildOverlay();
    void repositionOverlay();
    void showOverlays();
    void updateOverlayState();
    void attachScene();
    void onPicked(const double pos[3]);
    void render();

    QVTKOpenGLNativeWidget* mVtk{ nullptr };
    vtkSmartPointer<vtkRenderer> mRenderer;
    vtkSmartPointer<vtkRenderWindow> mWindow;

    vtkSmartPointer<vtkActor> mModel;
    vtkSmartPointer<vtkVolume> mVolume;
    vtkSmartPointer<vtkImageData> mImage;
    DicomInfo DI;

    vtkSmartPointer<vtkOrientationMarkerWidget> mOrMarker;
    vtkSmartPointer<vtkCubeAxesActor> mBoundingBox;
    vtkSmartPointer<vtkTextActor> mOverlayText;
    vtkSmartPointer<vtkDistanceWidget> mMeasure;
    QVector<vtkSmartPointer<vtkTextActor>> mAnnotations;
    bool mAnnotate{ false };
    unsigned long mPickTag{ 0 };

    Rgb mBackground{ 0.2, 0.3, 0.4 };
    Rgb mAxesColor{ 1.0, 1.0, 1.0 };
    Rgb mBoxColor{ 0.8, 0.8, 0.8 };
    QString mStyle = "trackball";

    std::unique_ptr<ClipBoxController> mClip;

    // окно и прозрачность объёма
    double mWidth = 400.0;
    double mCenter = 40.0;
    double mOpacity = 1.0;
    TFPreset mPreset = TFPreset::Window;
    vtkSmartPointer<vtkPiecewiseFunction> mBaseOTF;

    QWidget* mRightOverlay{ nullptr };
    QWidget* mTopOverlay{ nullptr };
    QToolButton* mBtnAP{ nullptr };
    QToolButton* mBtnPA{ nullptr };
    QToolButton* mBtnL{ nullptr };
    QToolButton* mBtnR{ nullptr };
    QToolButton* mBtnLAO{ nullptr };
    QToolButton* mBtnRAO{ nullptr };
    QToolButton* mBtnClip{ nullptr };
    QToolButton* mBtnReset{ nullptr };
    QToolButton* mBtnTF{ nullptr };
    QMenu* mTfMenu{ nullptr };

    bool mOverlaysBuilt{ false };
    bool mOverlaysShown{ false };
};
