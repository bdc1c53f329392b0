#pragma once
#include <QString>
#include <QMap>
#include <vtkSmartPointer.h>

#include "DicomRange.h"
#include "PatientInfo.h"

class vtkImageData;
class vtkVolume;
class vtkColorTransferFunction;

struct VolumeOptions
{
    double  windowWidth = 400.0;
    double  windowCenter = 40.0;
    vtkSmartPointer<vtkColorTransferFunction> colorTable;   // null: серый по окну
    double  opacity = 1.0;
    bool    shade = true;
    QString interpolation = "linear";                       // linear | nearest
};

enum class SliceOrientation { Axial, Sagittal, Coronal };

struct VolumeInfo
{
    QString directory;
    int     numFiles = 0;
    int     dimensions[3]{ 0, 0, 0 };
    double  spacing[3]{ 1.0, 1.0, 1.0 };
    double  scalarRange[2]{ 0.0, 0.0 };
    QMap<QString, QString> tags;
    DicomInfo   ranges;
    PatientInfo patient;
};

namespace DicomLoader {

    bool validate(const VolumeOptions& opt, QString* error = nullptr);

    // Каталог DICOM, одиночный DICOM-файл или .nii/.nii.gz
    vtkSmartPointer<vtkImageData> ReadImage(const QString& path, QString* error = nullptr,
        DicomInfo* info = nullptr, PatientInfo* patient = nullptr);

    vtkSmartPointer<vtkVolume> MakeVolume(vtkImageData* image, const VolumeOptions& opt = VolumeOptions(),
        QString* error = nullptr);

    vtkSmartPointer<vtkVolume> Load(const QString& path, const VolumeOptions& opt = VolumeOptions(),
        QString* error = nullptr);

    bool GetInfo(const QString& path, VolumeInfo& out, QString* error = nullptr);

    // Имя тега по словарю, для неизвестных "(gggg,eeee)"
    QString TagName(unsigned short group, unsigned short element);

    bool parseOrientation(const QString& text, SliceOrientation& out);
    int  SliceCount(vtkImageData* image, SliceOrientation o);

    // index отсчитывается от начала экстента по выбранной оси
    vtkSmartPointer<vtkImageData> ExtractSlice(vtkImageData* image, int index, SliceOrientation o,
        QString* error = nullptr);
    vtkSmartPointer<vtkImageData> ExtractSlice(vtkImageData* image, int index, const QString& orientation,
        QString* error = nullptr);

    // Проекция максимальной интенсивности вдоль доминирующей оси direction
    vtkSmartPointer<vtkImageData> MaximumIntensityProjection(vtkImageData* image, const double direction[3],
        QString* error = nullptr);

} // namespace DicomLoader
