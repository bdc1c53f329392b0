#include <gtest/gtest.h>
#include <Services/AI/Analysis.h>
#include <Services/AI/ModelManager.h>
#include <Services/AI/Preprocessing.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <algorithm>
#include <functional>

#include <vtkImageData.h>

namespace
{
    // Модель-заглушка: выход задаётся функцией от входа
    class FakeModel : public InferenceModel
    {
    public:
        using Fn = std::function<void(const std::vector<float>&, Tensor&)>;

        FakeModel(QString name, std::vector<int64_t> in, Fn fn)
            : mName(std::move(name)), mIn(std::move(in)), mFn(std::move(fn)) {}

        QString name() const override { return mName; }
        std::vector<int64_t> inputShape() const override { return mIn; }
        std::vector<int64_t> outputShape() const override { return { 1, 1 }; }

        bool run(const std::vector<float>& input, Tensor& output, QString*) override
        {
            ++calls;
            lastInputSize = input.size();
            mFn(input, output);
            return true;
        }

        int calls = 0;
        size_t lastInputSize = 0;

    private:
        QString mName;
        std::vector<int64_t> mIn;
        Fn mFn;
    };

    // confidence = максимум входа
    std::unique_ptr<FakeModel> maxModel(const QString& name)
    {
        return std::make_unique<FakeModel>(name, std::vector<int64_t>{ 1, 16, 16, 1 },
            [](const std::vector<float>& in, Tensor& out) {
                out.data = { *std::max_element(in.begin(), in.end()) };
                out.shape = { 1, 1 };
            });
    }

    std::unique_ptr<FakeModel> constModel(const QString& name, std::vector<float> data, std::vector<int64_t> shape)
    {
        return std::make_unique<FakeModel>(name, std::vector<int64_t>{ 1, 16, 16, 1 },
            [data, shape](const std::vector<float>&, Tensor& out) {
                out.data = data;
                out.shape = shape;
            });
    }

    // срез z заполнен значением z * 50
    vtkSmartPointer<vtkImageData> layeredVolume(int n, int slices)
    {
        auto img = vtkSmartPointer<vtkImageData>::New();
        img->SetDimensions(n, n, slices);
        img->AllocateScalars(VTK_SHORT, 1);
        auto* p = static_cast<short*>(img->GetScalarPointer());
        for (int z = 0; z < slices; ++z)
            std::fill_n(p + vtkIdType(z) * n * n, n * n, static_cast<short>(z * 50));
        return img;
    }
}

TEST(ModelManager, InputSizeFromShape)
{
    EXPECT_EQ(maxModel("m")->inputSize(), 16);
    FakeModel nchw("nchw", { 1, 1, 64, 64 }, [](const std::vector<float>&, Tensor&) {});
    EXPECT_EQ(nchw.inputSize(), 64);
    FakeModel dyn("dyn", { -1, -1, -1, 1 }, [](const std::vector<float>&, Tensor&) {});
    EXPECT_EQ(dyn.inputSize(), 128);
}

TEST(ModelManager, LoadModelsSkipsBrokenFiles)
{
    ModelManager mgr;
    EXPECT_EQ(mgr.loadModels("/nonexistent/models"), 0);

    QTemporaryDir dir;
    QFile f(dir.filePath("tumor_detection.onnx"));
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write("not a model");
    f.close();

    EXPECT_EQ(mgr.loadModels(dir.path()), 0);
    EXPECT_FALSE(mgr.hasModel("tumor_detection"));
}

TEST(ModelManager, PredictUsesThreshold)
{
    ModelManager mgr(0.5);
    auto model = maxModel("tumor_detection");
    FakeModel* raw = model.get();
    mgr.addModel(std::move(model));
    EXPECT_EQ(mgr.modelNames(), QStringList{ "tumor_detection" });

    PredictionResult r;
    QString err;
    ASSERT_TRUE(mgr.predict("tumor_detection", Preprocessing::MakeSlice(40, 30, 204.0), r, &err));
    EXPECT_NEAR(r.confidence, 0.8, 1e-6);
    EXPECT_TRUE(r.positive);
    EXPECT_EQ(r.prediction(), "positive");
    EXPECT_EQ(raw->lastInputSize, 256u);

    mgr.setThreshold(0.9);
    ASSERT_TRUE(mgr.predict("tumor_detection", Preprocessing::MakeSlice(40, 30, 204.0), r, &err));
    EXPECT_FALSE(r.positive);
    EXPECT_DOUBLE_EQ(r.threshold, 0.9);

    EXPECT_FALSE(mgr.predict("organ_segmentation", Preprocessing::MakeSlice(4, 4), r, &err));
    EXPECT_EQ(err, "Model not found: organ_segmentation");
    EXPECT_FALSE(mgr.predict("tumor_detection", nullptr, r, &err));
    EXPECT_EQ(err, "No image");
}

TEST(ModelManager, BatchLabels)
{
    ModelManager mgr;
    mgr.addModel(maxModel("tumor_detection"));

    auto lo = Preprocessing::MakeSlice(8, 8, 100.0);
    auto hi = Preprocessing::MakeSlice(8, 8, 200.0);
    std::vector<int> labels;
    ASSERT_TRUE(mgr.predictBatch("tumor_detection", { lo, hi, lo }, labels));
    EXPECT_EQ(labels, (std::vector<int>{ 0, 1, 0 }));
}

TEST(Analysis, SummaryText)
{
    EXPECT_EQ(Analysis::Summary(true, 0.934), "Possible Tumor Detected (Confidence: 0.93)");
    EXPECT_EQ(Analysis::Summary(false, 0.1), "No Tumor Detected (Confidence: 0.10)");
}

TEST(Analysis, AnalyzeDicomUsesMiddleSlice)
{
    ModelManager mgr(0.8);
    mgr.addModel(maxModel("tumor_detection"));

    Analysis::AnalysisResult r;
    QString err;
    ASSERT_TRUE(Analysis::AnalyzeDicom(mgr, layeredVolume(12, 8), r, &err)) << err.toStdString();
    EXPECT_EQ(r.sliceIndex, 4);
    EXPECT_NEAR(r.confidence, 200.0 / 255.0, 1e-6);
    EXPECT_FALSE(r.positive);
    EXPECT_EQ(r.summary, "No Tumor Detected (Confidence: 0.78)");

    // 2D вход используется как есть
    ASSERT_TRUE(Analysis::AnalyzeDicom(mgr, Preprocessing::MakeSlice(10, 10, 255.0), r, &err));
    EXPECT_EQ(r.sliceIndex, 0);
    EXPECT_TRUE(r.positive);
    EXPECT_TRUE(r.summary.startsWith("Possible Tumor Detected"));

    ModelManager empty;
    EXPECT_FALSE(Analysis::AnalyzeDicom(empty, layeredVolume(4, 4), r, &err));
    EXPECT_EQ(err, "Model not found: tumor_detection");
}

TEST(Analysis, AnalyzeVolumeEveryNthSlice)
{
    ModelManager mgr(0.8);
    auto model = maxModel("tumor_detection");
    FakeModel* raw = model.get();
    mgr.addModel(std::move(model));

    Analysis::VolumeAnalysis va;
    QString err;
    ASSERT_TRUE(Analysis::AnalyzeVolume(mgr, layeredVolume(8, 8), 2, va, &err)) << err.toStdString();
    EXPECT_EQ(va.totalSlices, 8);
    EXPECT_EQ(va.analyzedSlices, 4);
    EXPECT_EQ(raw->calls, 4);
    ASSERT_EQ(va.positiveFindings, 1);
    ASSERT_EQ(va.findings.size(), 1u);
    EXPECT_EQ(va.findings[0].sliceIndex, 6);
    EXPECT_NEAR(va.findings[0].confidence, 300.0 / 255.0, 1e-6);

    EXPECT_FALSE(Analysis::AnalyzeVolume(mgr, layeredVolume(4, 4), 0, va, &err));
    EXPECT_EQ(err, "Slice interval must be at least 1");
    EXPECT_FALSE(Analysis::AnalyzeVolume(mgr, nullptr, 1, va, &err));
    EXPECT_EQ(err, "No volume data");
}

TEST(Analysis, SegmentationAreaAndPerimeter)
{
    std::vector<float> mask(64, 0.0f);
    for (int y = 2; y < 6; ++y)
        for (int x = 2; x < 6; ++x)
            mask[size_t(y) * 8 + x] = 0.9f;

    ModelManager mgr;
    mgr.addModel(constModel("organ_segmentation", mask, { 1, 8, 8, 1 }));

    Analysis::SegmentationResult seg;
    QString err;
    ASSERT_TRUE(Analysis::SegmentAnatomy(mgr, Preprocessing::MakeSlice(32, 32), seg, &err)) << err.toStdString();
    EXPECT_EQ(seg.area, 16);
    EXPECT_EQ(seg.perimeter, 12);
    int d[3]; seg.mask->GetDimensions(d);
    EXPECT_EQ(d[0], 8);
    EXPECT_EQ(d[1], 8);

    ModelManager flat;
    flat.addModel(constModel("organ_segmentation", { 0.7f }, { 1, 1 }));
    EXPECT_FALSE(Analysis::SegmentAnatomy(flat, Preprocessing::MakeSlice(8, 8), seg, &err));
    EXPECT_EQ(err, "Segmentation output is not a 2D mask");
}

TEST(Analysis, SegmentationReadsFirstChannelInEitherLayout)
{
    // 10x6: квадрат 4x4 в канале 0, остальные каналы заполнены единицами
    const int w = 10, h = 6, c = 3;
    auto inSquare = [](int x, int y) { return x >= 3 && x < 7 && y >= 1 && y < 5; };

    std::vector<float> chw(size_t(c) * w * h, 1.0f);
    std::vector<float> hwc(size_t(c) * w * h, 1.0f);
    for (int y = 0; y < h; ++y)
        for (int x = 0; x < w; ++x)
        {
            const float v = inSquare(x, y) ? 0.9f : 0.1f;
            chw[size_t(y) * w + x] = v;
            hwc[(size_t(y) * w + x) * c] = v;
        }

    struct Case { std::vector<float> data; std::vector<int64_t> shape; };
    const Case cases[] = {
        { chw, { 1, c, h, w } },
        { hwc, { 1, h, w, c } },
        { std::vector<float>(chw.begin(), chw.begin() + w * h), { 1, 1, h, w } },
        { std::vector<float>(chw.begin(), chw.begin() + w * h), { h, w } },
    };

    for (const Case& cs : cases)
    {
        ModelManager mgr;
        mgr.addModel(constModel("organ_segmentation", cs.data, cs.shape));

        Analysis::SegmentationResult seg;
        QString err;
        ASSERT_TRUE(Analysis::SegmentAnatomy(mgr, Preprocessing::MakeSlice(32, 32), seg, &err)) << err.toStdString();
        int d[3]; seg.mask->GetDimensions(d);
        EXPECT_EQ(d[0], w);
        EXPECT_EQ(d[1], h);
        EXPECT_EQ(seg.area, 16);
        EXPECT_EQ(seg.perimeter, 12);
    }

    // размер данных не совпадает с формой
    ModelManager bad;
    bad.addModel(constModel("organ_segmentation", chw, { 1, 1, h, w }));
    Analysis::SegmentationResult seg;
    QString err;
    EXPECT_FALSE(Analysis::SegmentAnatomy(bad, Preprocessing::MakeSlice(8, 8), seg, &err));
    EXPECT_EQ(err, "Segmentation output is not a 2D mask");
}

TEST(Analysis, LandmarksScaledToSlice)
{
    ModelManager mgr;
    mgr.addModel(constModel("landmark_detection",
        { 0.5f, 0.25f, 0.9f,  0.1f, 0.1f, 0.3f,  1.0f, 1.0f, 0.95f }, { 1, 3, 3 }));

    std::vector<Analysis::Landmark> lms;
    QString err;
    ASSERT_TRUE(Analysis::DetectLandmarks(mgr, Preprocessing::MakeSlice(40, 20), 0.5, lms, &err))
        << err.toStdString();
    ASSERT_EQ(lms.size(), 2u);
    EXPECT_EQ(lms[0].name, "Landmark 0");
    EXPECT_DOUBLE_EQ(lms[0].x, 20.0);
    EXPECT_DOUBLE_EQ(lms[0].y, 5.0);
    EXPECT_EQ(lms[1].name, "Landmark 2");
    EXPECT_NEAR(lms[1].confidence, 0.95, 1e-6);

    // плоские пары без уверенности
    ModelManager pairs;
    pairs.addModel(constModel("landmark_detection", { 0.5f, 0.5f, 0.25f, 0.75f }, { 1, 4 }));
    ASSERT_TRUE(Analysis::DetectLandmarks(pairs, Preprocessing::MakeSlice(10, 10), 0.8, lms, &err));
    ASSERT_EQ(lms.size(), 2u);
    EXPECT_DOUBLE_EQ(lms[1].x, 2.5);
    EXPECT_DOUBLE_EQ(lms[1].confidence, 1.0);

    ModelManager odd;
    odd.addModel(constModel("landmark_detection", { 0.5f, 0.5f, 0.25f }, { 1, 3 }));
    EXPECT_FALSE(Analysis::DetectLandmarks(odd, Preprocessing::MakeSlice(10, 10), 0.5, lms, &err));
}
