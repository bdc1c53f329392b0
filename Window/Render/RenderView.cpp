#include "RenderView.h"
#include "Annotation.h"
#include "Interaction.h"
#include "Visualization.h"
#include <Services/LogCategories.h>

#include <QApplication>
#include <QFrame>
#include <QHBoxLayout>
#include <QMenu>
#include <QTimer>
#include <QToolButton>
#include <QVBoxLayout>
#include <QVTKOpenGLNativeWidget.h>

#include <vtkActor.h>
#include <vtkCamera.h>
#include <vtkCubeAxesActor.h>
#include <vtkDistanceWidget.h>
#include <vtkGenericOpenGLRenderWindow.h>
#include <vtkImageData.h>
#include <vtkMatrix3x3.h>
#include <vtkNew.h>
#include <vtkOrientationMarkerWidget.h>
#include <vtkPiecewiseFunction.h>
#include <vtkProperty.h>
#include <vtkRenderWindowInteractor.h>
#include <vtkRenderer.h>
#include <vtkTextActor.h>
#include <vtkVolume.h>
#include <vtkVolumeProperty.h>

#include <algorithm>
#include <cmath>

static void getPatientAxes(vtkImageData* img, double L[3], double P[3], double S[3])
{
    // без изображения (модель) - мировые оси
    vtkNew<vtkMatrix3x3> keep;
    keep->Identity();
    vtkMatrix3x3* M = (img && img->GetDirectionMatrix()) ? img->GetDirectionMatrix() : keep.GetPointer();

    // столбцы - оси данных в мире (LPS)
    double I[3]{ M->GetElement(0,0), M->GetElement(1,0), M->GetElement(2,0) };
    double J[3]{ M->GetElement(0,1), M->GetElement(1,1), M->GetElement(2,1) };
    double K[3];

    auto norm = [](double v[3]) {
        const double l = std::sqrt(v[0] * v[0] + v[1] * v[1] + v[2] * v[2]); if (l > 0) { v[0] /= l; v[1] /= l; v[2] /= l; }
        };
    norm(I); norm(J);

    auto sgn = [](double x) { return x >= 0 ? 1.0 : -1.0; };
    const double sI = sgn(I[0]); for (int t = 0; t < 3; ++t) I[t] *= sI;       // к +L
    const double sJ = sgn(J[1]); for (int t = 0; t < 3; ++t) J[t] *= sJ;       // к +P

    // K = I x J, det +1
    K[0] = I[1] * J[2] - I[2] * J[1];
    K[1] = I[2] * J[0] - I[0] * J[2];
    K[2] = I[0] * J[1] - I[1] * J[0];
    norm(K);
    if (K[2] < 0) { for (int t = 0; t < 3; ++t) K[t] *= -1.0; }                // к +S

    for (int t = 0; t < 3; ++t) { L[t] = I[t]; P[t] = J[t]; S[t] = K[t]; }
}

static void applyMenuStyle(QMenu* m, int width = 180)
{
    m->setAttribute(Qt::WA_StyledBackground, true);
    m->setAutoFillBackground(true);
    m->setFixedWidth(width);

    m->setStyleSheet(
        "QMenu{"
        "  background:rgba(22,22,22,0.96);"
        "  border:1px solid rgba(255,255,255,0.18);"
        "  border-radius:10px;"
        "  padding:6px;"
        "}"
        "QMenu::separator{"
        "  height:1px; background:rgba(255,255,255,0.12);"
        "  margin:6px 8px;"
        "}"
        "QMenu::item{"
        "  color:#fff; padding:6px 10px;"
        "  border-radius:6px;"
        "}"
        "QMenu::item:selected{"
        "  background:rgba(255,255,255,0.12);"
        "}"
    );
}

static QWidget* makeNativeOverlay(QWidget* owner)
{
    auto* w = new QWidget(owner);
    w->setAttribute(Qt::WA_TranslucentBackground, true);
    w->setAttribute(Qt::WA_NoSystemBackground, true);
    w->setAttribute(Qt::WA_ShowWithoutActivating, true);
    w->setFocusPolicy(Qt::NoFocus);
    return w;
}

RenderView::RenderView(QWidget* parent) : QWidget(parent)
{
    auto* lay = new QVBoxLayout(this);
    lay->setContentsMargins(0, 0, 0, 0);

    mVtk = new QVTKOpenGLNativeWidget(this);
    lay->addWidget(mVtk);

    mWindow = vtkSmartPointer<vtkGenericOpenGLRenderWindow>::New();
    mVtk->setRenderWindow(mWindow);

    mRenderer = vtkSmartPointer<vtkRenderer>::New();
    mWindow->AddRenderer(mRenderer);
    Visualization::SetBackground(mRenderer, mBackground);

    QString err;
    if (!Interaction::SetInteractionStyle(mVtk->interactor(), mStyle, &err))
        qCWarning(lcRender).noquote() << err;

    mOrMarker = Visualization::AddAxes(mVtk->interactor(), mAxesColor, 0.2, &err);

    mPickTag = Interaction::AddPicking(mVtk->interactor(), mRenderer,
        [this](const double pos[3], vtkProp*, long long) { onPicked(pos); });

    buildOverlay();

    mClip = std::make_unique<ClipBoxController>(this);
    mClip->setRenderer(mRenderer);
    mClip->setInteractor(mVtk->interactor());

    connect(mBtnClip, &QToolButton::toggled, this, [this](bool on) { setClipEnabled(on); });
}

RenderView::~RenderView()
{
    if (mMeasure) mMeasure->Off();
    if (mVtk && mVtk->interactor() && mPickTag)
        mVtk->interactor()->RemoveObserver(mPickTag);
}

void RenderView::buildOverlay()
{
    // ---------- ПРАВАЯ ПАНЕЛЬ ----------
    mRightOverlay = makeNativeOverlay(this);

    auto* rightPanel = new QWidget(mRightOverlay);
    auto* rv = new QVBoxLayout(rightPanel);
    rv->setContentsMargins(0, 42, 12, 0);
    rv->setSpacing(6);

    auto makeBtn = [&](QWidget* parent, const QString& text, int width) {
        auto* b = new QToolButton(parent);
        b->setText(text);
        b->setCursor(Qt::PointingHandCursor);
        b->setFocusPolicy(Qt::NoFocus);
        b->setFixedSize(width, 26);
        b->setStyleSheet(
            "QToolButton{ color:#fff; background:rgba(40,40,40,110);"
            " border:1px solid rgba(255,255,255,30); border-radius:6px; padding:0 8px; }"
            "QToolButton:hover{ background:rgba(255,255,255,40); }"
            "QToolButton:pressed{ background:rgba(255,255,255,70); }"
            "QToolButton:checked{ background:rgba(0,180,100,140); }"
        );
        return b;
        };

    mBtnAP = makeBtn(rightPanel, "AP", 62);
    mBtnPA = makeBtn(rightPanel, "PA", 62);
    mBtnL = makeBtn(rightPanel, "L", 62);
    mBtnR = makeBtn(rightPanel, "R", 62);
    mBtnLAO = makeBtn(rightPanel, "LAO", 62);
    mBtnRAO = makeBtn(rightPanel, "RAO", 62);

    const std::pair<QToolButton*, ViewPreset> presets[] = {
        { mBtnAP, ViewPreset::AP }, { mBtnPA, ViewPreset::PA }, { mBtnL, ViewPreset::L },
        { mBtnR, ViewPreset::R }, { mBtnLAO, ViewPreset::LAO }, { mBtnRAO, ViewPreset::RAO } };
    for (const auto& p : presets)
    {
        rv->addWidget(p.first);
        const ViewPreset v = p.second;
        connect(p.first, &QToolButton::clicked, this, [this, v] { setViewPreset(v); });
    }

    auto* line = new QFrame(rightPanel);
    line->setFrameShape(QFrame::HLine);
    line->setStyleSheet("color: rgba(255,255,255,40);");
    rv->addWidget(line);

    mBtnClip = makeBtn(rightPanel, tr("Clip"), 62);
    mBtnClip->setCheckable(true);
    rv->addWidget(mBtnClip);

    mBtnReset = makeBtn(rightPanel, tr("Reset"), 62);
    connect(mBtnReset, &QToolButton::clicked, this, &RenderView::resetCamera);
    rv->addWidget(mBtnReset);
    rv->addStretch();

    rightPanel->adjustSize();
    mRightOverlay->resize(rightPanel->sizeHint());

    // ---------- ВЕРХНЯЯ ПАНЕЛЬ ----------
    mTopOverlay = makeNativeOverlay(this);

    auto* topPanel = new QWidget(mTopOverlay);
    auto* th = new QHBoxLayout(topPanel);
    th->setContentsMargins(12, 8, 0, 0);
    th->setSpacing(6);

    mBtnTF = makeBtn(topPanel, tr("Transfer Function"), 146);
    mTfMenu = TF::CreateMenu(mTopOverlay, [this](TFPreset p) { applyPreset(p); });
    applyMenuStyle(mTfMenu, mBtnTF->width());
    mBtnTF->setMenu(mTfMenu);
    mBtnTF->setPopupMode(QToolButton::InstantPopup);
    th->addWidget(mBtnTF);

    topPanel->adjustSize();
    mTopOverlay->resize(topPanel->sizeHint());

    mOverlaysBuilt = true;
    updateOverlayState();
}

void RenderView::updateOverlayState()
{
    const bool any = mModel || mVolume;
    for (auto* b : { mBtnAP, mBtnPA, mBtnL, mBtnR, mBtnLAO, mBtnRAO, mBtnClip, mBtnReset })
        if (b) b->setEnabled(any);
    if (mBtnTF) mBtnTF->setEnabled(mVolume != nullptr);
}

void RenderView::showOverlays()
{
    if (mOverlaysShown) return;
    if (mRightOverlay) { mRightOverlay->show(); mRightOverlay->raise(); }
    if (mTopOverlay) { mTopOverlay->show(); mTopOverlay->raise(); }
    mOverlaysShown = true;
}

void RenderView::resizeEvent(QResizeEvent* e)
{
    QWidget::resizeEvent(e);
    repositionOverlay();
}

void RenderView::showEvent(QShowEvent* e)
{
    QWidget::showEvent(e);

    if (!mOverlaysBuilt)
        buildOverlay();

    // геометрия валидна только на следующем тике
    QTimer::singleShot(0, this, [this] {
        showOverlays();
        repositionOverlay();
        render();
        });
}

void RenderView::repositionOverlay()
{
    if (!mVtk) return;

    const QRect r = mVtk->geometry();
    const int pad = 8;

    if (mRightOverlay) {
        const QSize sz = mRightOverlay->size();
        mRightOverlay->move(r.right() - sz.width() - pad, r.top() + pad);
        mRightOverlay->raise();
    }
    if (mTopOverlay) {
        mTopOverlay->move(r.left() + pad, r.top() + pad);
        mTopOverlay->raise();
    }
}

void RenderView::render()
{
    if (mVtk && mVtk->renderWindow())
        mVtk->renderWindow()->Render();
}

void RenderView::clearScene()
{
    setMeasureMode(false);
    setAnnotateMode(false);
    if (mClip) mClip->attach(nullptr);
    if (mBtnClip) { QSignalBlocker b(mBtnClip); mBtnClip->setChecked(false); }

    mRenderer->RemoveAllViewProps();
    mAnnotations.clear();
    mBoundingBox = nullptr;
    mOverlayText = nullptr;
    mModel = nullptr;
    mVolume = nullptr;
    mImage = nullptr;
    mBaseOTF = nullptr;
    DI = DicomInfo();
    updateOverlayState();
}

void RenderView::attachScene()
{
    if (mClip)
    {
        mClip->attach(mVolume ? static_cast<vtkProp3D*>(mVolume) : static_cast<vtkProp3D*>(mModel));
        mClip->setEnabled(false);
    }
    if (mBtnClip) { QSignalBlocker b(mBtnClip); mBtnClip->setChecked(false); }

    if (mOrMarker) mOrMarker->SetEnabled(1);
    updateOverlayState();
}

void RenderView::showModel(vtkSmartPointer<vtkActor> actor)
{
    clearScene();
    if (!actor) return;

    mModel = actor;
    mOpacity = actor->GetProperty()->GetOpacity();
    mRenderer->AddActor(mModel);
    attachScene();
    resetCamera();
}

bool RenderView::showVolume(vtkSmartPointer<vtkImageData> image, const DicomInfo& info,
    const VolumeOptions& opt, QString* error)
{
    auto vol = DicomLoader::MakeVolume(image, opt, error);
    if (!vol)
        return false;

    clearScene();
    mImage = image;
    mVolume = vol;
    DI = info;
    mWidth = opt.windowWidth;
    mCenter = opt.windowCenter;
    mOpacity = opt.opacity;
    mPreset = TFPreset::Window;

    // MakeVolume строит OTF окна в обеих ветках, база без opacity
    mBaseOTF = TF::MakeOTF_Window(mWidth, mCenter, 1.0);

    mRenderer->AddVolume(mVolume);
    attachScene();
    mRenderer->ResetCamera();
    setViewPreset(ViewPreset::AP);
    return true;
}

void RenderView::resetCamera()
{
    mRenderer->ResetCamera();
    mRenderer->ResetCameraClippingRange();
    render();
}

void RenderView::setViewPreset(ViewPreset v)
{
    vtkProp3D* target = mVolume ? static_cast<vtkProp3D*>(mVolume) : static_cast<vtkProp3D*>(mModel);
    if (!target || !mRenderer) return;

    double b[6]; target->GetBounds(b);
    const double cx = 0.5 * (b[0] + b[1]);
    const double cy = 0.5 * (b[2] + b[3]);
    const double cz = 0.5 * (b[4] + b[5]);
    const double diag = std::sqrt((b[1] - b[0]) * (b[1] - b[0]) + (b[3] - b[2]) * (b[3] - b[2]) + (b[5] - b[4]) * (b[5] - b[4]));
    const double dist = std::max(diag, 1e-3) * 1.5;

    double L[3], P[3], S[3];
    getPatientAxes(mVolume ? mImage.GetPointer() : nullptr, L, P, S);

    const double A[3]{ -P[0], -P[1], -P[2] };
    const double Rv[3]{ -L[0], -L[1], -L[2] };
    const double a = std::sqrt(0.5);

    // направление взгляда
    double dir[3]{ P[0], P[1], P[2] };
    switch (v) {
    case ViewPreset::AP:  break;
    case ViewPreset::PA:  std::copy(A, A + 3, dir); break;
    case ViewPreset::L:   std::copy(L, L + 3, dir); break;
    case ViewPreset::R:   std::copy(Rv, Rv + 3, dir); break;
    case ViewPreset::LAO: for (int i = 0; i < 3; ++i) dir[i] = a * A[i] + a * L[i]; break;
    case ViewPreset::RAO: for (int i = 0; i < 3; ++i) dir[i] = a * A[i] + a * Rv[i]; break;
    }
    const double len = std::sqrt(dir[0] * dir[0] + dir[1] * dir[1] + dir[2] * dir[2]);
    for (int i = 0; i < 3; ++i) dir[i] /= (len > 0 ? len : 1);

    auto* cam = mRenderer->GetActiveCamera();
    cam->SetFocalPoint(cx, cy, cz);
    cam->SetPosition(cx - dir[0] * dist, cy - dir[1] * dist, cz - dir[2] * dist);
    cam->SetViewUp(S);                 // верх = Superior
    cam->OrthogonalizeViewUp();
    mRenderer->ResetCameraClippingRange();
    render();
}

void RenderView::setSceneColors(const Rgb& background, const Rgb& axes, const Rgb& boundingBox)
{
    QString err;
    if (Visualization::SetBackground(mRenderer, background, &err))
        mBackground = background;
    else
        emit showWarning(err);

    if (IsUnitRgb(axes) && axes != mAxesColor)
    {
        mAxesColor = axes;
        const bool was = axesVisible();
        if (mOrMarker) mOrMarker->SetEnabled(0);
        mOrMarker = Visualization::AddAxes(mVtk->interactor(), mAxesColor, 0.2, &err);
        if (mOrMarker && !was) mOrMarker->SetEnabled(0);
    }
    if (IsUnitRgb(boundingBox))
    {
        mBoxColor = boundingBox;
        if (mBoundingBox) { setBoundingBoxVisible(false); setBoundingBoxVisible(true); }
    }
    render();
}

bool RenderView::axesVisible() const
{
    return mOrMarker && mOrMarker->GetEnabled();
}

bool RenderView::setAxesVisible(bool on)
{
    if (!mOrMarker) return false;
    mOrMarker->SetEnabled(on ? 1 : 0);
    if (!on) mOrMarker->InteractiveOff();
    render();
    return true;
}

bool RenderView::setBoundingBoxVisible(bool on, QString* error)
{
    if (mBoundingBox)
    {
        mRenderer->RemoveActor(mBoundingBox);
        mBoundingBox = nullptr;
    }
    if (on)
    {
        mBoundingBox = Visualization::AddBoundingBox(mRenderer, mBoxColor, false, error);
        if (!mBoundingBox)
            return false;
    }
    render();
    return true;
}

bool RenderView::setInteractionStyle(const QString& name, QString* error)
{
    if (!Interaction::SetInteractionStyle(mVtk->interactor(), name, error))
        return false;
    mStyle = name.trimmed().toLower();
    return true;
}

void RenderView::setMeasureMode(bool on)
{
    if (on == measureMode()) return;
    if (on)
    {
        mMeasure = Interaction::AddMeasurementTool(mVtk->interactor(),
            [this](double d) { emit distanceMeasured(d); });
    }
    else
    {
        mMeasure->Off();
        mMeasure = nullptr;
    }
    render();
}

void RenderView::setAnnotateMode(bool on)
{
    mAnnotate = on;
}

void RenderView::clearAnnotations()
{
    for (auto& a : mAnnotations)
        mRenderer->RemoveActor2D(a);
    mAnnotations.clear();
    render();
}

void RenderView::onPicked(const double pos[3])
{
    emit pointPicked(pos[0], pos[1], pos[2]);
    if (!mAnnotate)
        return;

    auto actor = Annotation::CreateAnnotation(pos);
    mRenderer->AddActor2D(actor);
    mAnnotations.push_back(actor);
    emit annotationAdded(Annotation::FormatPoint(pos));
    render();
}

void RenderView::setClipEnabled(bool on)
{
    if (!mClip) return;
    mClip->setEnabled(on);
    if (mBtnClip && mBtnClip->isChecked() != mClip->isEnabled())
    {
        QSignalBlocker b(mBtnClip);
        mBtnClip->setChecked(mClip->isEnabled());
    }
    emit clipToggled(mClip->isEnabled());
}

void RenderView::setOpacity(double value)
{
    mOpacity = std::clamp(value, 0.0, 1.0);
    if (mModel)
    {
        mModel->GetProperty()->SetOpacity(mOpacity);
    }
    else if (mVolume && mBaseOTF)
    {
        TF::ScaleOpacity(mVolume->GetProperty(), mBaseOTF, mOpacity);
    }
    render();
}

void RenderView::setWindow(double width, double center)
{
    if (!mVolume || width <= 0.0) return;
    mWidth = width;
    mCenter = center;
    if (mPreset == TFPreset::Window)
        applyPreset(TFPreset::Window);
}

bool RenderView::applyPreset(TFPreset p)
{
    if (!mVolume || !mImage) return false;
    auto* prop = mVolume->GetProperty();
    if (!prop) return false;

    double r[2]{ DI.physicalMin, DI.physicalMax };
    if (!(r[1] > r[0]))
        mImage->GetScalarRange(r);

    mPreset = p;
    TF::ApplyPreset(prop, p, r[0], r[1], mWidth, mCenter, 1.0);

    // база без множителя прозрачности
    if (!mBaseOTF) mBaseOTF = vtkSmartPointer<vtkPiecewiseFunction>::New();
    if (auto* o = prop->GetScalarOpacity(0)) mBaseOTF->DeepCopy(o);
    TF::ScaleOpacity(prop, mBaseOTF, mOpacity);

    qCDebug(lcRender).noquote() << "Transfer function" << TF::PresetName(p);
    render();
    return true;
}

void RenderView::setOverlayText(const QString& text)
{
    if (mOverlayText)
    {
        mRenderer->RemoveActor2D(mOverlayText);
        mOverlayText = nullptr;
    }
    if (!text.isEmpty())
    {
        QString err;
        mOverlayText = Visualization::AddTextOverlay(mRenderer, text, 0.02, 0.95, { 1.0, 1.0, 1.0 }, 14, &err);
        if (!mOverlayText)
            emit showWarning(err);
    }
    render();
}

bool RenderView::saveView(const QString& path, QString* error)
{
    // оверлеи Qt в снимок не попадают, только сцена VTK
    return Visualization::SaveView(mVtk->renderWindow(), path, error);
}
