#include "MainWindow.h"

#include <Services/AI/Analysis.h>
#include <Services/AI/ModelManager.h>
#include <Services/CloudStorage.h>
#include <Services/DicomLoader.h>
#include <Services/LogCategories.h>
#include <Window/Render/Annotation.h>
#include <Window/Render/Interaction.h>

#include <QAction>
#include <QActionGroup>
#include <QApplication>
#include <QCloseEvent>
#include <QComboBox>
#include <QFileDialog>
#include <QFileInfo>
#include <QFormLayout>
#include <QFrame>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QMenuBar>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QScopedValueRollback>
#include <QSlider>
#include <QSplitter>
#include <QTabWidget>
#include <QTimer>
#include <QVBoxLayout>

#include <algorithm>

#include <vtkActor.h>
#include <vtkImageData.h>
#include <vtkPolyData.h>
#include <vtkPolyDataMapper.h>

namespace
{
    const QString kTumorModel = "tumor_detection";
    const QString kLandmarkModel = "landmark_detection";

    LoadResult loadFile(const QString& path, FileKind kind)
    {
        LoadResult r;
        r.path = path;
        r.kind = kind;

        if (kind == FileKind::Model)
        {
            r.actor = ModelLoader::Load(path, ModelOptions(), &r.error);
            if (r.actor)
            {
                auto* poly = vtkPolyData::SafeDownCast(r.actor->GetMapper()->GetInputDataObject(0, 0));
                r.model = ModelLoader::GetInfo(poly);
                r.model.filePath = path;
                r.model.fileSize = QFileInfo(path).size();
            }
            return r;
        }

        r.image = DicomLoader::ReadImage(path, &r.error, &r.dicom, &r.patient);
        return r;
    }

    QString fmt3(const double v[3])
    {
        return QString("%1, %2, %3").arg(v[0], 0, 'f', 2).arg(v[1], 0, 'f', 2).arg(v[2], 0, 'f', 2);
    }

    struct AnalysisOutcome
    {
        bool ok = false;
        QString error;
        Analysis::AnalysisResult result;
    };

    struct VolumeOutcome
    {
        bool ok = false;
        QString error;
        Analysis::VolumeAnalysis result;
    };

    struct LandmarkOutcome
    {
        bool ok = false;
        QString error;
        std::vector<Analysis::Landmark> landmarks;
    };

    struct UploadOutcome
    {
        QString url;
        QString error;
    };
}

MainWindow::MainWindow(const AppConfig& config, const QString& configPath, QWidget* parent)
    : QMainWindow(parent)
    , mConfig(config)
    , mConfigPath(configPath)
{
    setWindowTitle(mConfig.appName);
    setMinimumSize(800, 560);
    setGeometry(mConfig.windowGeometry);

    buildUi();
    buildMenus();
    mUiToDisable = centralWidget();
    buildStyles();
    wireSignals();
    updateActions();

    QTimer::singleShot(0, this, &MainWindow::initServices);
}

MainWindow::~MainWindow()
{
    mLoadWatcher.waitForFinished();
    mJobs.waitForDone();
}

void MainWindow::buildUi()
{
    auto* central = new QWidget(this);
    central->setObjectName("CentralCard");

    auto* v = new QVBoxLayout(central);
    v->setContentsMargins(0, 0, 0, 0);
    v->setSpacing(0);

    auto* split = new QSplitter(Qt::Horizontal, central);
    split->setObjectName("MainSplit");
    split->setHandleWidth(8);
    split->setChildrenCollapsible(false);

    // 3D
    mRenderView = new RenderView(split);
    mRenderView->setObjectName("RenderView");
    mRenderView->setSceneColors(mConfig.background, mConfig.axesColor, mConfig.boundingBoxColor);

    // боковая панель
    mSideTabs = new QTabWidget(split);
    mSideTabs->setObjectName("SidePanel");
    mSideTabs->setMinimumWidth(240);
    mSideTabs->setMaximumWidth(360);

    auto* display = new QWidget(mSideTabs);
    auto* dl = new QVBoxLayout(display);
    dl->setContentsMargins(8, 8, 8, 8);
    dl->setSpacing(8);

    auto* gbOpacity = new QGroupBox(tr("Opacity"), display);
    auto* ol = new QVBoxLayout(gbOpacity);
    mOpacity = new QSlider(Qt::Horizontal, gbOpacity);
    mOpacity->setRange(0, 100);
    mOpacity->setValue(100);
    ol->addWidget(mOpacity);
    dl->addWidget(gbOpacity);

    auto* gbWindow = new QGroupBox(tr("Window"), display);
    auto* wl = new QFormLayout(gbWindow);
    mWindowWidth = new QSlider(Qt::Horizontal, gbWindow);
    mWindowWidth->setRange(1, 4000);
    mWindowCenter = new QSlider(Qt::Horizontal, gbWindow);
    mWindowCenter->setRange(-1000, 3000);
    mWindowLabel = new QLabel(gbWindow);
    wl->addRow(tr("Width"), mWindowWidth);
    wl->addRow(tr("Center"), mWindowCenter);
    wl->addRow(mWindowLabel);
    dl->addWidget(gbWindow);

    auto* gbPreset = new QGroupBox(tr("Transfer function"), display);
    auto* pl = new QVBoxLayout(gbPreset);
    mPreset = new QComboBox(gbPreset);
    for (TFPreset p : { TFPreset::Window, TFPreset::Grayscale, TFPreset::Rainbow, TFPreset::Bone,
                        TFPreset::Angio, TFPreset::SoftTissue, TFPreset::Lungs, TFPreset::HotMetal })
        mPreset->addItem(TF::PresetName(p), static_cast<int>(p));
    pl->addWidget(mPreset);
    dl->addWidget(gbPreset);
    dl->addStretch();

    mInfoText = new QPlainTextEdit(mSideTabs);
    mInfoText->setReadOnly(true);
    mInfoText->setPlainText(tr("No file loaded"));

    mSideTabs->addTab(display, tr("Display"));
    mSideTabs->addTab(mInfoText, tr("Info"));

    split->setStretchFactor(0, 1);
    split->setStretchFactor(1, 0);
    v->addWidget(split, 1);

    auto* footerSep = new QFrame(central);
    footerSep->setObjectName("FooterSep");
    footerSep->setFrameShape(QFrame::HLine);
    footerSep->setFrameShadow(QFrame::Plain);
    footerSep->setFixedHeight(1);
    v->addWidget(footerSep);

    mFooter = new QWidget(central);
    mFooter->setObjectName("InnerStatusBar");
    mFooter->setFixedHeight(28);
    auto* fb = new QHBoxLayout(mFooter);
    fb->setContentsMargins(20, 4, 20, 4);
    fb->setSpacing(8);

    constexpr int kProgWidth = 180;
    mProgBox = new QWidget(mFooter);
    auto* pbLay = new QHBoxLayout(mProgBox);
    pbLay->setContentsMargins(0, 0, 0, 0);

    mProgress = new QProgressBar(mProgBox);
    mProgress->setTextVisible(false);
    mProgress->setFixedHeight(4);
    mProgress->setFixedWidth(kProgWidth);
    mProgress->setRange(0, 100);
    pbLay->addWidget(mProgress);

    // место сохраняется и при hide()
    auto pol = mProgBox->sizePolicy();
    pol.setRetainSizeWhenHidden(true);
    mProgBox->setSizePolicy(pol);
    mProgBox->setFixedWidth(kProgWidth);
    mProgBox->setVisible(false);

    auto* leftMirror = new QWidget(mFooter);
    leftMirror->setFixedWidth(kProgWidth);

    mStatusText = new QLabel(tr("Ready"), mFooter);
    mStatusText->setAlignment(Qt::AlignCenter);
    mStatusText->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Preferred);

    fb->addWidget(leftMirror, 0);
    fb->addWidget(mStatusText, 1);
    fb->addWidget(mProgBox, 0, Qt::AlignRight);
    v->addWidget(mFooter, 0);

    setCentralWidget(central);
}

void MainWindow::buildMenus()
{
    auto* mb = menuBar();
    mb->setNativeMenuBar(false);

    // File
    auto* mFile = mb->addMenu(tr("&File"));
    auto* actOpen = mFile->addAction(tr("&Open File..."), this, &MainWindow::onOpenFile);
    actOpen->setShortcut(QKeySequence::Open);
    auto* actOpenDir = mFile->addAction(tr("Open &Folder..."), this, &MainWindow::onOpenFolder);
    actOpenDir->setShortcut(QKeySequence(tr("Ctrl+Shift+O")));
    mActSaveView = mFile->addAction(tr("&Save View..."), this, &MainWindow::onSaveView);
    mActSaveView->setShortcut(QKeySequence::Save);
    mFile->addSeparator();
    auto* actExit = mFile->addAction(tr("E&xit"), this, &QWidget::close);
    actExit->setShortcut(QKeySequence::Quit);

    // View
    auto* mView = mb->addMenu(tr("&View"));
    auto* actReset = mView->addAction(tr("&Reset Camera"), mRenderView, &RenderView::resetCamera);
    actReset->setShortcut(QKeySequence(Qt::Key_R));
    mActAxes = mView->addAction(tr("Toggle &Axes"));
    mActAxes->setShortcut(QKeySequence(Qt::Key_A));
    mActAxes->setCheckable(true);
    mActAxes->setChecked(mRenderView->axesVisible());
    mActBox = mView->addAction(tr("Toggle &Bounding Box"));
    mActBox->setShortcut(QKeySequence(Qt::Key_B));
    mActBox->setCheckable(true);

    auto* mStyle = mView->addMenu(tr("Interaction &Style"));
    mStyleGroup = new QActionGroup(this);
    mStyleGroup->setExclusive(true);
    for (const QString& name : Interaction::StyleNames())
    {
        QString title = name;
        title[0] = title[0].toUpper();
        auto* a = mStyle->addAction(title);
        a->setCheckable(true);
        a->setData(name);
        a->setChecked(name == mRenderView->interactionStyle());
        mStyleGroup->addAction(a);
    }

    // Tools
    auto* mTools = mb->addMenu(tr("&Tools"));
    mActMeasure = mTools->addAction(tr("&Measure Distance"));
    mActMeasure->setCheckable(true);
    mActAnnotate = mTools->addAction(tr("&Annotate"));
    mActAnnotate->setCheckable(true);
    mTools->addAction(tr("Clear Annotations"), mRenderView, &RenderView::clearAnnotations);
    mTools->addSeparator();
    mActClip = mTools->addAction(tr("&Clip Box"));
    mActClip->setCheckable(true);

    // Analysis
    auto* mAnalysis = mb->addMenu(tr("&Analysis"));
    mActAnalyze = mAnalysis->addAction(tr("Run &AI Analysis"), this, &MainWindow::onRunAnalysis);
    mActAnalyzeVolume = mAnalysis->addAction(tr("Analyze &Volume"), this, &MainWindow::onAnalyzeVolume);
    mActLandmarks = mAnalysis->addAction(tr("Detect &Landmarks"), this, &MainWindow::onDetectLandmarks);

    // Upload
    auto* mUpload = mb->addMenu(tr("&Upload"));
    mActUploadS3 = mUpload->addAction(tr("Upload to AWS &S3"), this, &MainWindow::onUploadS3);
    mActUploadFb = mUpload->addAction(tr("Upload to &Firebase"), this, &MainWindow::onUploadFirebase);
}

void MainWindow::buildStyles()
{
    QString ss;

    ss += "#CentralCard {"
        "  background:#1f2023;"
        "}\n";

    ss += "#InnerStatusBar {"
        "  background: transparent;"
        "  border: none;"
        "}\n";

    // тонкая линия над футером
    ss += "#FooterSep {"
        "  background: rgba(255,255,255,0.10);"
        "  border: none;"
        "  margin: 0;"
        "}\n";

    ss += R"(
        QMainWindow, QWidget { color: #ddd; }

        QMenuBar {
            background: #1e1f22;
            border-bottom: 1px solid rgba(255,255,255,0.12);
        }
        QMenuBar::item { background: transparent; padding: 4px 10px; }
        QMenuBar::item:selected { background: rgba(255,255,255,0.10); border-radius: 4px; }

        QMenu {
            background: rgba(22,22,22,0.96);
            border: 1px solid rgba(255,255,255,0.18);
            padding: 6px;
        }
        QMenu::item { color: #fff; padding: 6px 18px; border-radius: 6px; }
        QMenu::item:selected { background: rgba(255,255,255,0.12); }
        QMenu::item:disabled { color: rgba(255,255,255,0.35); }
        QMenu::separator { height: 1px; background: rgba(255,255,255,0.12); margin: 6px 8px; }

        QToolBar { background: #1e1f22; border: none; spacing: 4px; }

        QPushButton, QToolButton {
            background: rgba(255,255,255,0.06);
            border: 1px solid rgba(255,255,255,0.14);
            border-radius: 6px;
            padding: 4px 10px;
        }
        QPushButton:hover, QToolButton:hover { background: rgba(255,255,255,0.12); }
        QPushButton:pressed, QToolButton:pressed { background: rgba(255,255,255,0.20); }

        QSlider::groove:horizontal {
            height: 4px; background: rgba(255,255,255,0.14); border-radius: 2px;
        }
        QSlider::handle:horizontal {
            width: 12px; margin: -5px 0; border-radius: 6px; background: #4aa3ff;
        }
        QSlider::sub-page:horizontal { background: rgba(74,163,255,0.55); border-radius: 2px; }

        QScrollBar:vertical { background: transparent; width: 8px; margin: 4px 0 4px 0; }
        QScrollBar::handle:vertical { background: rgba(255,255,255,0.18); min-height: 24px; border-radius: 4px; }
        QScrollBar::handle:vertical:hover { background: rgba(255,255,255,0.32); }
        QScrollBar::add-line:vertical, QScrollBar::sub-line:vertical { height: 0; }

        QProgressBar { background: rgba(255,255,255,0.08); border: none; border-radius: 2px; }
        QProgressBar::chunk { background: #4aa3ff; border-radius: 2px; }

        QGroupBox {
            border: 1px solid rgba(255,255,255,0.12);
            border-radius: 8px;
            margin-top: 14px;
            padding: 8px 6px 6px 6px;
        }
        QGroupBox::title { subcontrol-origin: margin; left: 10px; padding: 0 4px; color: #aaa; }

        QTabWidget::pane { border: 1px solid rgba(255,255,255,0.12); border-radius: 6px; top: -1px; }
        QTabBar::tab {
            background: rgba(255,255,255,0.04);
            padding: 6px 14px;
            border-top-left-radius: 6px; border-top-right-radius: 6px;
            margin-right: 2px;
        }
        QTabBar::tab:selected { background: rgba(255,255,255,0.14); }

        QComboBox, QPlainTextEdit {
            background: rgba(255,255,255,0.04);
            border: 1px solid rgba(255,255,255,0.14);
            border-radius: 6px;
            padding: 3px 6px;
        }
        )";

    ss += R"(
        #MainSplit::handle:horizontal {
            background: qlineargradient(
                x1:0, y1:0, x2:1, y2:0,
                stop:0   rgba(0,0,0,0),
                stop:0.46 rgba(255,255,255,0.09),
                stop:0.54 rgba(255,255,255,0.09),
                stop:1   rgba(0,0,0,0)
            );
            width: 8px;
        }
        #MainSplit::handle:horizontal:hover {
            background: qlineargradient(
                x1:0, y1:0, x2:1, y2:0,
                stop:0   rgba(0,0,0,0),
                stop:0.46 rgba(255,255,255,0.18),
                stop:0.54 rgba(255,255,255,0.18),
                stop:1   rgba(0,0,0,0)
            );
        }
        )";

    qApp->setStyleSheet(ss);
}

void MainWindow::wireSignals()
{
    connect(mActAxes, &QAction::toggled, this, [this](bool on) { mRenderView->setAxesVisible(on); });

    connect(mActBox, &QAction::toggled, this, [this](bool on) {
        QString err;
        if (!mRenderView->setBoundingBoxVisible(on, &err))
        {
            QSignalBlocker b(mActBox);
            mActBox->setChecked(false);
            showInfo(err);
        }
        });

    connect(mStyleGroup, &QActionGroup::triggered, this, [this](QAction* a) {
        QString err;
        if (mRenderView->setInteractionStyle(a->data().toString(), &err))
            showInfo(tr("Interaction style: %1").arg(a->text()));
        else
            QMessageBox::warning(this, tr("Interaction Style"), err);
        });

    connect(mActMeasure, &QAction::toggled, this, [this](bool on) {
        if (on && mActAnnotate->isChecked()) mActAnnotate->setChecked(false);
        mRenderView->setMeasureMode(on);
        showInfo(on ? tr("Measure: drag the two end points") : tr("Ready"));
        });

    connect(mActAnnotate, &QAction::toggled, this, [this](bool on) {
        if (on && mActMeasure->isChecked()) mActMeasure->setChecked(false);
        mRenderView->setAnnotateMode(on);
        showInfo(on ? tr("Annotate: click on the object") : tr("Ready"));
        });

    connect(mActClip, &QAction::toggled, mRenderView, &RenderView::setClipEnabled);
    connect(mRenderView, &RenderView::clipToggled, this, [this](bool on) {
        QSignalBlocker b(mActClip);
        mActClip->setChecked(on);
        });

    connect(mRenderView, &RenderView::distanceMeasured, this, [this](double d) {
        showInfo(Annotation::FormatDistance(d));
        });
    connect(mRenderView, &RenderView::pointPicked, this, [this](double x, double y, double z) {
        const double p[3]{ x, y, z };
        showInfo(tr("Picked %1").arg(Annotation::FormatPoint(p)));
        });
    connect(mRenderView, &RenderView::annotationAdded, this, [this](const QString& text) {
        showInfo(tr("Annotation added at %1").arg(text));
        });
    connect(mRenderView, &RenderView::showInfo, this, &MainWindow::showInfo);
    connect(mRenderView, &RenderView::showWarning, this, [this](const QString& text) {
        QMessageBox::warning(this, windowTitle(), text);
        });

    // Display
    connect(mOpacity, &QSlider::valueChanged, this, [this](int v) {
        mRenderView->setOpacity(v / 100.0);
        });

    auto applyWindow = [this]() {
        const int w = mWindowWidth->value();
        const int c = mWindowCenter->value();
        mWindowLabel->setText(tr("W %1 / C %2").arg(w).arg(c));
        mRenderView->setWindow(w, c);
        };
    connect(mWindowWidth, &QSlider::valueChanged, this, applyWindow);
    connect(mWindowCenter, &QSlider::valueChanged, this, applyWindow);

    connect(mPreset, QOverload<int>::of(&QComboBox::currentIndexChanged), this, [this](int idx) {
        if (idx < 0) return;
        mRenderView->applyPreset(static_cast<TFPreset>(mPreset->itemData(idx).toInt()));
        });

    connect(&mLoadWatcher, &QFutureWatcher<LoadResult>::finished, this, [this]() {
        finishProgress();
        onLoaded(mLoadWatcher.result());
        });
    connect(&mJobs, &BackgroundJobs::busyChanged, this, [this](bool busy) {
        if (!busy) finishProgress();
        });
}

void MainWindow::initServices()
{
    mModels = std::make_unique<ModelManager>(mConfig.confidenceThreshold);

    const QString modelsDir = mConfig.resolve(mConfig.modelsDir);
    ModelManager* mgr = mModels.get();
    runAsync<int>(tr("Loading AI models..."),
        [mgr, modelsDir]() { return mgr->loadModels(modelsDir); },
        [this](int n) {
            mModelsReady = true;
            showInfo(n > 0 ? tr("AI models loaded: %1").arg(n) : tr("Ready"));
            updateActions();
        });

    mCloud = std::make_unique<CloudStorage>(mConfig);
    QString err;
    mCloudReady = mCloud->initialize(&err);
    if (!mCloudReady)
    {
        QMessageBox::warning(this, tr("Cloud Services"),
            tr("Failed to initialize cloud services. Cloud features will be disabled."));
    }
    updateActions();
}

void MainWindow::updateActions()
{
    const bool any = !mCurrentPath.isEmpty();
    const bool vol = mRenderView && mRenderView->image();

    if (mActSaveView) mActSaveView->setEnabled(any);
    for (QAction* a : { mActBox, mActMeasure, mActAnnotate, mActClip })
        if (a) a->setEnabled(any);

    if (mActAnalyze) mActAnalyze->setEnabled(mModelsReady);
    if (mActAnalyzeVolume) mActAnalyzeVolume->setEnabled(mModelsReady);
    if (mActLandmarks) mActLandmarks->setEnabled(mModelsReady);

    if (mActUploadS3) mActUploadS3->setEnabled(mCloudReady && mCloud && mCloud->s3Available());
    if (mActUploadFb) mActUploadFb->setEnabled(mCloudReady && mCloud && mCloud->firebaseAvailable());

    if (mWindowWidth) mWindowWidth->setEnabled(vol);
    if (mWindowCenter) mWindowCenter->setEnabled(vol);
    if (mPreset) mPreset->setEnabled(vol);
}

void MainWindow::StartLoading()
{
    if (mLoading)
        return;
    QScopedValueRollback<bool> lk(mLoading, true);

    if (mUiToDisable) mUiToDisable->setEnabled(false);
    if (menuBar()) menuBar()->setEnabled(false);
    QApplication::setOverrideCursor(Qt::BusyCursor);
    qApp->processEvents(QEventLoop::ExcludeUserInputEvents);
}

void MainWindow::StopLoading()
{
    while (QApplication::overrideCursor())
        QApplication::restoreOverrideCursor();

    if (mUiToDisable) mUiToDisable->setEnabled(true);
    if (menuBar()) menuBar()->setEnabled(true);
    qApp->processEvents(QEventLoop::ExcludeUserInputEvents);
}

// UI возвращается, когда не осталось ни загрузки, ни фоновых задач
void MainWindow::finishProgress()
{
    if (mJobs.busy() || mLoadWatcher.isRunning())
        return;
    StopLoading();
    mProgress->setRange(0, 100);
    mProgBox->setVisible(false);
}

void MainWindow::showInfo(const QString& text)
{
    if (mStatusText) mStatusText->setText(text);
}

void MainWindow::onOpenFile()
{
    const QString path = QFileDialog::getOpenFileName(this, tr("Open File"), QString(),
        FileSniffer::openDialogFilter());
    if (!path.isEmpty())
        openPath(path);
}

void MainWindow::onOpenFolder()
{
    const QString path = QFileDialog::getExistingDirectory(this, tr("Open DICOM Folder"));
    if (!path.isEmpty())
        openPath(path);
}

void MainWindow::openPath(const QString& path)
{
    if (mLoadWatcher.isRunning())
        return;

    const FileKind kind = FileSniffer::classify(path);
    if (kind == FileKind::None)
    {
        QMessageBox::warning(this, tr("Open File"), tr("Unsupported file: %1").arg(path));
        return;
    }

    qCInfo(lcApp) << "Opening" << FileSniffer::kindName(kind) << path;

    StartLoading();
    mProgBox->setVisible(true);
    mProgress->setRange(0, 0);
    showInfo(tr("Loading %1...").arg(QFileInfo(path).fileName()));
    mLoadWatcher.setFuture(QtConcurrent::run([path, kind]() { return loadFile(path, kind); }));
}

void MainWindow::onLoaded(const LoadResult& r)
{
    if (!r.error.isEmpty() || (!r.actor && !r.image))
    {
        const QString msg = r.error.isEmpty() ? tr("Nothing was loaded") : r.error;
        QMessageBox::warning(this, tr("Error"), tr("Failed to load file: %1").arg(msg));
        showInfo(tr("Ready"));
        return;
    }

    mCurrentPath = r.path;
    mCurrentKind = r.kind;
    mCurrentPatient = r.patient;

    if (mActMeasure) mActMeasure->setChecked(false);
    if (mActAnnotate) mActAnnotate->setChecked(false);
    if (mActBox) mActBox->setChecked(false);

    if (r.actor)
    {
        mRenderView->showModel(r.actor);
        showModelInfo(r.model);
    }
    else
    {
        VolumeOptions opt;
        if (r.dicom.mode != Modality::CT && r.dicom.physicalMax > r.dicom.physicalMin)
        {
            opt.windowWidth = r.dicom.physicalMax - r.dicom.physicalMin;
            opt.windowCenter = 0.5 * (r.dicom.physicalMax + r.dicom.physicalMin);
        }

        QString err;
        if (!mRenderView->showVolume(r.image, r.dicom, opt, &err))
        {
            QMessageBox::warning(this, tr("Error"), tr("Failed to load file: %1").arg(err));
            mCurrentPath.clear();
            updateActions();
            return;
        }
        showVolumeInfo(r);
    }

    resetDisplayControls();
    updateActions();
    showInfo(tr("Loaded: %1").arg(QFileInfo(r.path).fileName()));
    emit fileOpened(r.path);

    // авто-анализ после загрузки объёма
    if (r.image && mModelsReady && mModels->hasModel(kTumorModel))
        onRunAnalysis();
}

void MainWindow::resetDisplayControls()
{
    {
        QSignalBlocker b(mOpacity);
        mOpacity->setValue(100);
    }

    const DicomInfo& di = mRenderView->dicomInfo();
    if (mRenderView->image())
    {
        double r[2]{ di.physicalMin, di.physicalMax };
        if (!(r[1] > r[0])) mRenderView->image()->GetScalarRange(r);

        QSignalBlocker bw(mWindowWidth), bc(mWindowCenter), bp(mPreset);
        mWindowWidth->setRange(1, std::max(4000, int(r[1] - r[0])));
        mWindowCenter->setRange(std::min(-1000, int(r[0])), std::max(3000, int(r[1])));
        if (di.mode == Modality::CT)
        {
            mWindowWidth->setValue(400);
            mWindowCenter->setValue(40);
        }
        else
        {
            mWindowWidth->setValue(std::max(1, int(r[1] - r[0])));
            mWindowCenter->setValue(int(0.5 * (r[0] + r[1])));
        }
        mPreset->setCurrentIndex(0);
        mWindowLabel->setText(tr("W %1 / C %2").arg(mWindowWidth->value()).arg(mWindowCenter->value()));
    }
    else
    {
        mWindowLabel->clear();
    }
}

void MainWindow::showModelInfo(const ModelInfo& info)
{
    QStringList t;
    t << tr("File: %1").arg(QFileInfo(info.filePath).fileName())
      << tr("Size: %1 KB").arg(info.fileSize / 1024.0, 0, 'f', 1)
      << tr("Points: %1").arg(info.numPoints)
      << tr("Cells: %1").arg(info.numCells)
      << tr("Bounds: [%1, %2] [%3, %4] [%5, %6]")
            .arg(info.bounds[0], 0, 'f', 2).arg(info.bounds[1], 0, 'f', 2)
            .arg(info.bounds[2], 0, 'f', 2).arg(info.bounds[3], 0, 'f', 2)
            .arg(info.bounds[4], 0, 'f', 2).arg(info.bounds[5], 0, 'f', 2)
      << tr("Surface area: %1").arg(info.surfaceArea, 0, 'f', 2)
      << tr("Volume: %1").arg(info.volume, 0, 'f', 2)
      << tr("Center of mass: (%1)").arg(fmt3(info.centerOfMass.data()));
    mInfoText->setPlainText(t.join('\n'));
}

void MainWindow::showVolumeInfo(const LoadResult& r)
{
    int dims[3]; r.image->GetDimensions(dims);
    double sp[3]; r.image->GetSpacing(sp);
    double range[2]; r.image->GetScalarRange(range);

    QStringList t;
    t << tr("Path: %1").arg(r.path)
      << tr("Type: %1").arg(FileSniffer::kindName(r.kind))
      << tr("Dimensions: %1 x %2 x %3").arg(dims[0]).arg(dims[1]).arg(dims[2])
      << tr("Spacing: (%1)").arg(fmt3(sp))
      << tr("Scalar range: [%1, %2]").arg(range[0]).arg(range[1]);

    if (!r.dicom.modalityText.isEmpty())
        t << tr("Modality: %1").arg(r.dicom.modalityText);

    const PatientInfo& p = r.patient;
    const std::pair<QString, QString> fields[] = {
        { tr("Patient"), p.patientName }, { tr("Patient ID"), p.patientId }, { tr("Sex"), p.sex },
        { tr("Birth date"), p.birthDate }, { tr("Study"), p.StudyDescription }, { tr("Series"), p.Description },
        { tr("Study date"), p.StudyDate }, { tr("Manufacturer"), p.Manufacturer } };
    for (const auto& f : fields)
        if (!f.second.isEmpty())
            t << QString("%1: %2").arg(f.first, f.second);

    mInfoText->setPlainText(t.join('\n'));
}

void MainWindow::onSaveView()
{
    if (mCurrentPath.isEmpty())
        return;

    QString path = QFileDialog::getSaveFileName(this, tr("Save View"),
        QFileInfo(mCurrentPath).completeBaseName() + ".png", tr("PNG image (*.png);;JPEG image (*.jpg *.jpeg)"));
    if (path.isEmpty())
        return;
    if (QFileInfo(path).suffix().isEmpty())
        path += ".png";

    QString err;
    if (!mRenderView->saveView(path, &err))
    {
        QMessageBox::warning(this, tr("Save View"), err);
        return;
    }
    showInfo(tr("View saved: %1").arg(path));
}

bool MainWindow::requireVolume(const QString& title)
{
    if (mRenderView->image())
        return true;
    QMessageBox::warning(this, title, tr("Please load a DICOM or NIfTI volume first."));
    return false;
}

bool MainWindow::requireModel(const QString& name, const QString& title)
{
    if (mModelsReady && mModels && mModels->hasModel(name))
        return true;
    QMessageBox::warning(this, title, tr("AI model '%1' is not available.").arg(name));
    return false;
}

void MainWindow::onRunAnalysis()
{
    const QString title = tr("AI Analysis");
    if (!requireVolume(title) || !requireModel(kTumorModel, title))
        return;

    ModelManager* mgr = mModels.get();
    vtkSmartPointer<vtkImageData> img = mRenderView->image();
    runAsync<AnalysisOutcome>(tr("Running AI analysis..."),
        [mgr, img]() {
            AnalysisOutcome o;
            o.ok = Analysis::AnalyzeDicom(*mgr, img, o.result, &o.error);
            return o;
        },
        [this, title](const AnalysisOutcome& o) {
            if (!o.ok)
            {
                QMessageBox::warning(this, title, tr("AI analysis failed: %1").arg(o.error));
                showInfo(tr("Ready"));
                return;
            }
            showInfo(o.result.summary);
            mRenderView->setOverlayText(o.result.summary);
        });
}

void MainWindow::onAnalyzeVolume()
{
    const QString title = tr("Volume Analysis");
    if (!requireVolume(title) || !requireModel(kTumorModel, title))
        return;

    ModelManager* mgr = mModels.get();
    vtkSmartPointer<vtkImageData> img = mRenderView->image();
    runAsync<VolumeOutcome>(tr("Analyzing volume..."),
        [mgr, img]() {
            VolumeOutcome o;
            o.ok = Analysis::AnalyzeVolume(*mgr, img, 5, o.result, &o.error);
            return o;
        },
        [this, title](const VolumeOutcome& o) {
            if (!o.ok)
            {
                QMessageBox::warning(this, title, tr("Volume analysis failed: %1").arg(o.error));
                showInfo(tr("Ready"));
                return;
            }
            QStringList t;
            t << tr("Total slices: %1").arg(o.result.totalSlices)
              << tr("Analyzed slices: %1").arg(o.result.analyzedSlices)
              << tr("Positive findings: %1").arg(o.result.positiveFindings);
            for (const auto& f : o.result.findings)
                t << tr("  slice %1: %2").arg(f.sliceIndex).arg(f.confidence, 0, 'f', 2);

            mInfoText->appendPlainText("\n" + t.join('\n'));
            mSideTabs->setCurrentWidget(mInfoText);
            showInfo(tr("Volume analysis: %1 positive of %2 analyzed")
                .arg(o.result.positiveFindings).arg(o.result.analyzedSlices));
        });
}

void MainWindow::onDetectLandmarks()
{
    const QString title = tr("Landmark Detection");
    if (!requireVolume(title) || !requireModel(kLandmarkModel, title))
        return;

    ModelManager* mgr = mModels.get();
    vtkSmartPointer<vtkImageData> img = mRenderView->image();
    const double threshold = mConfig.confidenceThreshold;
    runAsync<LandmarkOutcome>(tr("Detecting landmarks..."),
        [mgr, img, threshold]() {
            LandmarkOutcome o;
            o.ok = Analysis::DetectLandmarks(*mgr, img, threshold, o.landmarks, &o.error);
            return o;
        },
        [this, title](const LandmarkOutcome& o) {
            if (!o.ok)
            {
                QMessageBox::warning(this, title, tr("Landmark detection failed: %1").arg(o.error));
                showInfo(tr("Ready"));
                return;
            }
            QStringList t;
            t << tr("Landmarks: %1").arg(o.landmarks.size());
            for (const auto& lm : o.landmarks)
                t << QString("  %1: (%2, %3) %4").arg(lm.name)
                        .arg(lm.x, 0, 'f', 1).arg(lm.y, 0, 'f', 1).arg(lm.confidence, 0, 'f', 2);
            mInfoText->appendPlainText("\n" + t.join('\n'));
            mSideTabs->setCurrentWidget(mInfoText);
            showInfo(tr("Landmarks detected: %1").arg(o.landmarks.size()));
        });
}

void MainWindow::upload(bool s3)
{
    const QString title = s3 ? tr("Upload to AWS S3") : tr("Upload to Firebase");
    if (mCurrentPath.isEmpty())
    {
        QMessageBox::warning(this, title, tr("Please load a file before uploading."));
        return;
    }
    if (!QFileInfo(mCurrentPath).isFile())
    {
        QMessageBox::warning(this, title, tr("Folder upload is not supported: %1").arg(mCurrentPath));
        return;
    }

    CloudStorage* cloud = mCloud.get();
    const QString path = mCurrentPath;
    runAsync<UploadOutcome>(tr("Uploading %1...").arg(QFileInfo(path).fileName()),
        [cloud, path, s3]() {
            UploadOutcome o;
            o.url = s3 ? cloud->uploadToS3(path, QString(), &o.error)
                       : cloud->uploadToFirebase(path, QString(), &o.error);
            return o;
        },
        [this, title](const UploadOutcome& o) {
            if (o.url.isEmpty())
            {
                QMessageBox::critical(this, title, o.error);
                showInfo(tr("Upload failed"));
                return;
            }
            QMessageBox::information(this, title, tr("File uploaded successfully:\n%1").arg(o.url));
            showInfo(tr("Uploaded: %1").arg(o.url));
        });
}

void MainWindow::onUploadS3()
{
    upload(true);
}

void MainWindow::onUploadFirebase()
{
    upload(false);
}

void MainWindow::closeEvent(QCloseEvent* e)
{
    if (mLoadWatcher.isRunning() || mJobs.busy())
    {
        showInfo(tr("Waiting for background tasks to finish..."));
        e->ignore();
        return;
    }

    mConfig.windowGeometry = geometry();
    if (!mConfigPath.isEmpty() && !mConfig.save(mConfigPath))
        qCWarning(lcConfig) << "Could not save window geometry to" << mConfigPath;

    QMainWindow::closeEvent(e);
}
