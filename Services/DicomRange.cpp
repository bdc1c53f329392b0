#include "DicomRange.h"
#include <vtkDICOMReader.h>
#include <vtkDICOMMetaData.h>
#include <vtkDICOMTag.h>
#include <vtkDICOMDictionary.h>
#include <vtkImageData.h>

Modality ModalityFromText(const QString& text)
{
    const QString m = text.trimmed().toUpper();
    if (m.isEmpty()) return Modality::Unknown;
    if (m == "CT") return Modality::CT;
    if (m == "MR" || m == "MRI") return Modality::MR;
    return Modality::Other;
}

DicomInfo GetImageRanges(vtkImageData* img)
{
    DicomInfo out{};
    if (!img) return out;

    double rminmax[2]{};
    img->GetScalarRange(rminmax);
    out.physicalMin = rminmax[0];
    out.physicalMax = rminmax[1];

    double sp[3]{ 1, 1, 1 };
    img->GetSpacing(sp);
    out.mSpX = sp[0]; out.mSpY = sp[1]; out.mSpZ = sp[2];
    out.bitsAllocated = img->GetScalarSize() * 8;
    out.bitsStored = out.bitsAllocated;
    out.highBit = out.bitsStored - 1;
    return out;
}

DicomInfo GetDicomRangesVTK(vtkDICOMReader* r)
{
    DicomInfo out = GetImageRanges(r ? r->GetOutput() : nullptr);
    auto* md = r ? r->GetMetaData() : nullptr;
    if (!md) return out;

    auto getInt = [&](unsigned short g, unsigned short e, int def = 0) {
        vtkDICOMTag tag(g, e);
        return md->Has(tag) ? md->Get(tag).AsInt() : def;
        };
    auto getDbl = [&](unsigned short g, unsigned short e, double def = 0.0) {
        vtkDICOMTag tag(g, e);
        return md->Has(tag) ? md->Get(tag).AsDouble() : def;
        };

    out.bitsAllocated = getInt(0x0028, 0x0100, 16);
    out.bitsStored = getInt(0x0028, 0x0101, 12);
    out.highBit = getInt(0x0028, 0x0102, out.bitsStored - 1);
    out.pixelRep = getInt(0x0028, 0x0103, 0);
    out.slope = getDbl(0x0028, 0x1053, 1.0);
    out.intercept = getDbl(0x0028, 0x1052, 0.0);

    if (md->Has(DC::Modality))
    {
        out.modalityText = QString::fromStdString(md->Get(DC::Modality).AsString()).trimmed();
        out.mode = ModalityFromText(out.modalityText);
    }
    return out;
}
