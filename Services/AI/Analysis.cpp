#include "Analysis.h"
#include "ModelManager.h"
#include <Services/DicomLoader.h>
#include <Services/LogCategories.h>

#include <vtkImageData.h>

namespace
{
    template <typename T>
    T fail(QString* error, const QString& msg, T value)
    {
        qCWarning(lcAi).noquote() << msg;
        if (error) *error = msg;
        return value;
    }

    const QString kTumorModel = "tumor_detection";
    const QString kSegmentationModel = "organ_segmentation";
    const QString kLandmarkModel = "landmark_detection";

    // 2D срез как есть, у объёма - средний аксиальный
    vtkSmartPointer<vtkImageData> sliceOf(vtkImageData* image, int* index, QString* error)
    {
        if (!image)
            return fail(error, "No image", vtkSmartPointer<vtkImageData>());

        int d[3]; image->GetDimensions(d);
        if (d[2] == 1)
        {
            if (index) *index = 0;
            return image;
        }
        const int mid = DicomLoader::SliceCount(image, SliceOrientation::Axial) / 2;
        if (index) *index = mid;
        return DicomLoader::ExtractSlice(image, mid, SliceOrientation::Axial, error);
    }

    // Раскладка выхода сегментации: [H,W], [1,H,W,C] (каналы последними) или [1,C,H,W]
    struct MaskLayout
    {
        int w = 0;
        int h = 0;
        int channels = 1;
        bool channelsFirst = false;

        size_t index(vtkIdType pixel, int channel) const
        {
            return channelsFirst ? size_t(channel) * size_t(w) * h + size_t(pixel)
                                 : size_t(pixel) * channels + channel;
        }
    };

    constexpr int64_t kMaxChannels = 4;

    bool maskLayout(const Tensor& t, MaskLayout& out)
    {
        std::vector<int64_t> s = t.shape;
        if (s.size() >= 3)
            s.erase(s.begin());     // батч

        if (s.size() == 2)
        {
            out.h = static_cast<int>(s[0]);
            out.w = static_cast<int>(s[1]);
        }
        else if (s.size() == 3)
        {
            const bool smallFirst = s[0] <= kMaxChannels;
            const bool smallLast = s[2] <= kMaxChannels;
            out.channelsFirst = smallFirst && !smallLast;
            if (out.channelsFirst)
            {
                out.channels = static_cast<int>(s[0]);
                out.h = static_cast<int>(s[1]);
                out.w = static_cast<int>(s[2]);
            }
            else
            {
                out.h = static_cast<int>(s[0]);
                out.w = static_cast<int>(s[1]);
                out.channels = static_cast<int>(s[2]);
            }
        }
        else
            return false;

        if (out.w <= 1 || out.h <= 1 || out.channels < 1)
            return false;
        return size_t(out.w) * out.h * out.channels == t.data.size();
    }
}

QString Analysis::Summary(bool positive, double confidence)
{
    return positive
        ? QString::asprintf("Possible Tumor Detected (Confidence: %.2f)", confidence)
        : QString::asprintf("No Tumor Detected (Confidence: %.2f)", confidence);
}

bool Analysis::AnalyzeDicom(ModelManager& mgr, vtkImageData* volume, AnalysisResult& out, QString* error)
{
    int index = 0;
    auto slice = sliceOf(volume, &index, error);
    if (!slice)
        return false;

    PredictionResult p;
    if (!mgr.predict(kTumorModel, slice, p, error))
        return false;

    out.model = p.model;
    out.sliceIndex = index;
    out.confidence = p.confidence;
    out.positive = p.positive;
    out.summary = Summary(p.positive, p.confidence);

    qCInfo(lcAi).noquote() << "Analysis completed:" << out.summary << "slice" << index;
    return true;
}

bool Analysis::AnalyzeVolume(ModelManager& mgr, vtkImageData* volume, int sliceInterval, VolumeAnalysis& out,
    QString* error)
{
    out = VolumeAnalysis();
    if (sliceInterval < 1)
        return fail(error, "Slice interval must be at least 1", false);
    if (!volume)
        return fail(error, "No volume data", false);

    out.totalSlices = DicomLoader::SliceCount(volume, SliceOrientation::Axial);
    for (int z = 0; z < out.totalSlices; z += sliceInterval)
    {
        auto slice = DicomLoader::ExtractSlice(volume, z, SliceOrientation::Axial, error);
        if (!slice)
            return false;

        PredictionResult p;
        if (!mgr.predict(kTumorModel, slice, p, error))
            return false;

        ++out.analyzedSlices;
        if (p.positive)
        {
            ++out.positiveFindings;
            out.findings.push_back({ z, p.confidence });
        }
    }

    qCInfo(lcAi) << "Volume analysis:" << out.analyzedSlices << "of" << out.totalSlices
                 << "slices," << out.positiveFindings << "positive";
    return true;
}

vtkIdType Analysis::BoundaryPixels(vtkImageData* mask)
{
    if (!mask) return 0;
    int d[3]; mask->GetDimensions(d);
    const auto* m = static_cast<const unsigned char*>(mask->GetScalarPointer());
    const int w = d[0], h = d[1];

    auto at = [&](int x, int y) -> bool {
        if (x < 0 || y < 0 || x >= w || y >= h) return false;
        return m[vtkIdType(y) * w + x] != 0;
    };

    vtkIdType n = 0;
    for (int y = 0; y < h; ++y)
        for (int x = 0; x < w; ++x)
            if (at(x, y) && (!at(x - 1, y) || !at(x + 1, y) || !at(x, y - 1) || !at(x, y + 1)))
                ++n;
    return n;
}

bool Analysis::SegmentAnatomy(ModelManager& mgr, vtkImageData* image, SegmentationResult& out, QString* error)
{
    out = SegmentationResult();
    auto slice = sliceOf(image, nullptr, error);
    if (!slice)
        return false;

    Tensor t;
    if (!mgr.infer(kSegmentationModel, slice, t, error))
        return false;

    MaskLayout layout;
    if (!maskLayout(t, layout))
        return fail(error, "Segmentation output is not a 2D mask", false);

    auto mask = vtkSmartPointer<vtkImageData>::New();
    mask->SetDimensions(layout.w, layout.h, 1);
    mask->AllocateScalars(VTK_UNSIGNED_CHAR, 1);
    auto* m = static_cast<unsigned char*>(mask->GetScalarPointer());

    // первый канал
    for (vtkIdType i = 0; i < vtkIdType(layout.w) * layout.h; ++i)
    {
        const unsigned char v = t.data[layout.index(i, 0)] > 0.5f ? 1 : 0;
        m[i] = v;
        out.area += v;
    }

    out.mask = mask;
    out.perimeter = BoundaryPixels(mask);
    qCInfo(lcAi) << "Segmentation: area" << out.area << "perimeter" << out.perimeter;
    return true;
}

bool Analysis::DetectLandmarks(ModelManager& mgr, vtkImageData* image, double threshold, std::vector<Landmark>& out,
    QString* error)
{
    out.clear();
    auto slice = sliceOf(image, nullptr, error);
    if (!slice)
        return false;

    Tensor t;
    if (!mgr.infer(kLandmarkModel, slice, t, error))
        return false;

    // [1,N,3] - (x, y, conf); иначе плоские пары (x, y)
    const bool triples = t.shape.size() == 3 && t.shape[2] == 3;
    const size_t stride = triples ? 3 : 2;
    if (t.data.size() % stride != 0)
        return fail(error, QString("Unexpected landmark output size %1").arg(t.data.size()), false);

    int d[3]; slice->GetDimensions(d);
    const size_t n = t.data.size() / stride;
    for (size_t i = 0; i < n; ++i)
    {
        Landmark lm;
        lm.name = QString("Landmark %1").arg(i);
        lm.x = t.data[i * stride] * d[0];
        lm.y = t.data[i * stride + 1] * d[1];
        lm.confidence = triples ? t.data[i * stride + 2] : 1.0;
        if (lm.confidence >= threshold)
            out.push_back(lm);
    }

    qCInfo(lcAi) << "Landmarks detected:" << out.size() << "of" << n;
    return true;
}
