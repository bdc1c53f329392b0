#pragma once
#include <QString>
#include <vector>
#include <vtkSmartPointer.h>
#include <vtkType.h>

class vtkImageData;
class ModelManager;

namespace Analysis {

    struct AnalysisResult
    {
        QString model;
        int     sliceIndex = -1;
        double  confidence = 0.0;
        bool    positive = false;
        QString summary;
    };

    struct Finding
    {
        int    sliceIndex = 0;
        double confidence = 0.0;
    };

    struct VolumeAnalysis
    {
        int totalSlices = 0;
        int analyzedSlices = 0;
        int positiveFindings = 0;
        std::vector<Finding> findings;
    };

    struct SegmentationResult
    {
        vtkSmartPointer<vtkImageData> mask;     // unsigned char 0/1
        vtkIdType area = 0;
        vtkIdType perimeter = 0;
    };

    struct Landmark
    {
        QString name;
        double  x = 0.0;
        double  y = 0.0;
        double  confidence = 0.0;
    };

    // tumor_detection на среднем аксиальном срезе
    bool AnalyzeDicom(ModelManager& mgr, vtkImageData* volume, AnalysisResult& out, QString* error = nullptr);

    // Срезы 0, interval, 2*interval, ...
    bool AnalyzeVolume(ModelManager& mgr, vtkImageData* volume, int sliceInterval, VolumeAnalysis& out,
        QString* error = nullptr);

    // organ_segmentation; slice - 2D срез или объём (берётся средний срез)
    bool SegmentAnatomy(ModelManager& mgr, vtkImageData* image, SegmentationResult& out, QString* error = nullptr);

    // landmark_detection; координаты в пикселях среза
    bool DetectLandmarks(ModelManager& mgr, vtkImageData* image, double threshold, std::vector<Landmark>& out,
        QString* error = nullptr);

    QString Summary(bool positive, double confidence);

    // Пиксели маски, у которых хотя бы один 4-сосед вне маски (или за краем)
    vtkIdType BoundaryPixels(vtkImageData* mask);

} // namespace Analysis
