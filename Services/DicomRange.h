#pragma once
#include <vtkSmartPointer.h>
#include <QString>

class vtkDICOMReader;
class vtkImageData;

enum class Modality { Unknown, CT, MR, Other };

struct DicomInfo
{
    Modality mode = Modality::Unknown;
    QString  modalityText;
    double physicalMin = 0.0, physicalMax = 0.0;
    int bitsAllocated = 16, bitsStored = 12, highBit = 11, pixelRep = 0;
    double slope = 1.0, intercept = 0.0;
    double mSpX{ 1.0 }, mSpY{ 1.0 }, mSpZ{ 1.0 };
};

Modality ModalityFromText(const QString& text);

// Диапазоны и параметры пикселей по метаданным ридера (после Update()).
DicomInfo GetDicomRangesVTK(vtkDICOMReader* r);

// То же для изображений без DICOM-заголовка (NIfTI, GDCM-декод).
DicomInfo GetImageRanges(vtkImageData* img);
