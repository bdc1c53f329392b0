#pragma once
#include <QMainWindow>
#include <QFutureWatcher>
#include <QLabel>
#include <QProgressBar>
#include <QtConcurrent/QtConcurrentRun>
#include <memory>

#include <Services/AppConfig.h>
#include <Services/BackgroundJobs.h>
#include <Services/FileSniffer.h>
#include <Services/ModelLoader.h>
#include <Services/PatientInfo.h>
#include <Services/DicomRange.h>
#include <Window/Render/RenderView.h>

class QAction;
class QActionGroup;
class QComboBox;
class QPlainTextEdit;
class QSlider;
class QTabWidget;
class ModelManager;
class CloudStorage;

// Результат фоновой загрузки файла
struct LoadResult
{
    QString  path;
    FileKind kind = FileKind::None;
    QString  error;

    vtkSmartPointer<vtkActor> actor;
    ModelInfo model;

    vtkSmartPointer<vtkImageData> image;
    DicomInfo   dicom;
    PatientInfo patient;
};

class MainWindow final : public QMainWindow
{
    Q_OBJECT
public:
    MainWindow(const AppConfig& config, const QString& configPath, QWidget* parent = nullptr);
    ~MainWindow() override;

    void openPath(const QString& path);
    void StartLoading();
    void StopLoading();

signals:
    void fileOpened(const QString& path);

protected:
    void closeEvent(QCloseEvent* e) override;

private slots:
    void onOpenFile();
    void onOpenFolder();
    void onSaveView();
    void onRunAnalysis();
    void onAnalyzeVolume();
    void onDetectLandmarks();
    void onUploadS3();
    void onUploadFirebase();

private:
    void buildUi();
    void buildMenus();
    void buildStyles();
    void wireSignals();
    void initServices();

    void onLoaded(const LoadResult& r);
    void showModelInfo(const ModelInfo& info);
    void showVolumeInfo(const LoadResult& r);
    void resetDisplayControls();
    void updateActions();
    void showInfo(const QString& text);
    bool requireVolume(const QString& title);
    bool requireModel(const QString& name, const QString& title);
    void upload(bool s3);

    void finishProgress();

    // QtConcurrent::run + QFutureWatcher через mJobs, done вызывается в GUI-потоке
    template <typename T, typename Job, typename Done>
    void runAsync(const QString& status, Job job, Done done)
    {
        StartLoading();
        showInfo(status);
        mProgBox->setVisible(true);
        mProgress->setRange(0, 0);
        mJobs.run<T>(job, done);
    }

private:
    AppConfig mConfig;
    QString   mConfigPath;

    std::unique_ptr<ModelManager> mModels;
    std::unique_ptr<CloudStorage> mCloud;
    bool mModelsReady{ false };
    bool mCloudReady{ false };

    // --- текущий файл ---
    QString  mCurrentPath;
    FileKind mCurrentKind{ FileKind::None };
    PatientInfo mCurrentPatient;

    // --- центральная область ---
    RenderView* mRenderView{ nullptr };
    QTabWidget* mSideTabs{ nullptr };
    QSlider* mOpacity{ nullptr };
    QSlider* mWindowWidth{ nullptr };
    QSlider* mWindowCenter{ nullptr };
    QLabel* mWindowLabel{ nullptr };
    QComboBox* mPreset{ nullptr };
    QPlainTextEdit* mInfoText{ nullptr };

    // --- действия ---
    QAction* mActSaveView{ nullptr };
    QAction* mActAxes{ nullptr };
    QAction* mActBox{ nullptr };
    QActionGroup* mStyleGroup{ nullptr };
    QAction* mActMeasure{ nullptr };
    QAction* mActAnnotate{ nullptr };
    QAction* mActClip{ nullptr };
    QAction* mActAnalyze{ nullptr };
    QAction* mActAnalyzeVolume{ nullptr };
    QAction* mActLandmarks{ nullptr };
    QAction* mActUploadS3{ nullptr };
    QAction* mActUploadFb{ nullptr };

    // --- нижняя панель / статус ---
    QWidget* mFooter{ nullptr };
    QLabel* mStatusText{ nullptr };
    QWidget* mProgBox{ nullptr };
    QProgressBar* mProgress{ nullptr };

    bool mLoading = false;
    QWidget* mUiToDisable{ nullptr };
    QFutureWatcher<LoadResult> mLoadWatcher;

    // после mModels/mCloud: разрушается первым и дожидается задач, которые их используют
    BackgroundJobs mJobs;
};
