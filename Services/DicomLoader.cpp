#include "DicomLoader.h"
#include "FileSniffer.h"
#include "LogCategories.h"
#include "VtkErrorCatcher.h"
#include <Window/Render/TransferFunction.h>

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QStringList>

#include <vtkDICOMReader.h>
#include <vtkDICOMMetaData.h>
#include <vtkDICOMDictionary.h>
#include <vtkDICOMDictEntry.h>
#include <vtkDICOMFileSorter.h>
#include <vtkDICOMTag.h>
#include <vtkDICOMValue.h>
#include <vtkDICOMVR.h>
#include <vtkGDCMImageReader.h>
#include <vtkNIFTIImageReader.h>
#include <vtkNIFTIImageHeader.h>

#include <vtkColorTransferFunction.h>
#include <vtkExtractVOI.h>
#include <vtkGPUVolumeRayCastMapper.h>
#include <vtkImageData.h>
#include <vtkMatrix3x3.h>
#include <vtkMatrix4x4.h>
#include <vtkPiecewiseFunction.h>
#include <vtkPointData.h>
#include <vtkStringArray.h>
#include <vtkVolume.h>
#include <vtkVolumeProperty.h>

#include <algorithm>
#include <cmath>

namespace
{
    template <typename T>
    T fail(QString* error, const QString& msg, T value)
    {
        qCWarning(lcDicom).noquote() << msg;
        if (error) *error = msg;
        return value;
    }

    bool hasScalars(vtkImageData* img)
    {
        if (!img || !img->GetPointData() || !img->GetPointData()->GetScalars())
            return false;
        int ext[6]; img->GetExtent(ext);
        return ext[1] >= ext[0] && ext[3] >= ext[2] && ext[5] >= ext[4];
    }

    QStringList collectDicomFiles(const QString& path)
    {
        QStringList files;
        const QFileInfo fi(path);
        if (fi.isFile())
        {
            files << fi.absoluteFilePath();
            return files;
        }

        QDirIterator it(path, QDir::Files | QDir::NoDotAndDotDot);
        while (it.hasNext())
        {
            const QString f = it.next();
            if (FileSniffer::looksLikeDicomFile(f))
                files << f;
        }
        files.sort();
        return files;
    }

    // Из нескольких серий в каталоге берём самую длинную
    vtkSmartPointer<vtkStringArray> largestSeries(const QStringList& files)
    {
        auto names = vtkSmartPointer<vtkStringArray>::New();
        for (const QString& f : files)
            names->InsertNextValue(QFile::encodeName(f).toStdString());

        auto sorter = vtkSmartPointer<vtkDICOMFileSorter>::New();
        sorter->SetInputFileNames(names);
        sorter->Update();

        const int nSeries = sorter->GetNumberOfSeries();
        if (nSeries <= 0)
            return names;

        int best = 0;
        for (int i = 1; i < nSeries; ++i)
        {
            if (sorter->GetFileNamesForSeries(i)->GetNumberOfValues() >
                sorter->GetFileNamesForSeries(best)->GetNumberOfValues())
                best = i;
        }
        if (nSeries > 1)
            qCInfo(lcDicom) << "Found" << nSeries << "series, using series" << best;

        auto out = vtkSmartPointer<vtkStringArray>::New();
        out->DeepCopy(sorter->GetFileNamesForSeries(best));
        return out;
    }

    bool isCompressedTS(vtkDICOMMetaData* m)
    {
        if (!m || !m->Has(DC::TransferSyntaxUID)) return false;
        const std::string ts = m->Get(DC::TransferSyntaxUID).AsString();
        return ts.rfind("1.2.840.10008.1.2.4.", 0) == 0 || ts == "1.2.840.10008.1.2.5";
    }

    // ориентация LPS из матрицы пациента: direction = R, origin = R*o + t
    void applyPatientMatrix(vtkImageData* img, vtkMatrix4x4* pm)
    {
        if (!img || !pm) return;

        double o[3]; img->GetOrigin(o);
        double no[3];
        for (int i = 0; i < 3; ++i)
            no[i] = pm->GetElement(i, 0) * o[0] + pm->GetElement(i, 1) * o[1] + pm->GetElement(i, 2) * o[2] + pm->GetElement(i, 3);

        vtkNew<vtkMatrix3x3> dir;
        for (int i = 0; i < 3; ++i)
            for (int j = 0; j < 3; ++j)
                dir->SetElement(i, j, pm->GetElement(i, j));

        img->SetDirectionMatrix(dir);
        img->SetOrigin(no);
    }

    QString text(vtkDICOMMetaData* md, vtkDICOMTag tag)
    {
        if (!md || !md->Has(tag)) return QString();
        return QString::fromStdString(md->Get(0, tag).AsUTF8String()).trimmed();
    }

    PatientInfo patientFrom(vtkDICOMMetaData* md, const QString& path)
    {
        PatientInfo p;
        p.patientName = text(md, DC::PatientName);
        p.patientId = text(md, DC::PatientID);
        p.sex = text(md, DC::PatientSex);
        p.birthDate = text(md, DC::PatientBirthDate);
        p.Mode = text(md, DC::Modality);
        p.StudyDescription = text(md, DC::StudyDescription);
        p.Description = text(md, DC::SeriesDescription);
        p.StudyDate = text(md, DC::StudyDate);
        p.Manufacturer = text(md, DC::Manufacturer);
        p.SeriesNumber = text(md, DC::SeriesNumber);
        p.SliceThickness = text(md, DC::SliceThickness);
        p.DicomPath = path;
        return p;
    }

    struct DicomRead
    {
        vtkSmartPointer<vtkImageData> image;
        vtkSmartPointer<vtkDICOMMetaData> meta;
        DicomInfo info;
        int numFiles = 0;
    };

    bool readDicomSeries(const QString& path, DicomRead& out, QString* error)
    {
        const QStringList files = collectDicomFiles(path);
        if (files.isEmpty())
            return fail(error, QString("No DICOM files found in %1").arg(path), false);

        auto names = largestSeries(files);
        out.numFiles = static_cast<int>(names->GetNumberOfValues());

        auto reader = vtkSmartPointer<vtkDICOMReader>::New();
        auto errObs1 = vtkSmartPointer<VtkErrorCatcher>::New();
        reader->AddObserver(vtkCommand::ErrorEvent, errObs1);
        reader->SetFileNames(names);
        reader->UpdateInformation();

        if (errObs1->hasError || !reader->GetMetaData())
            return fail(error, QString("DICOM metadata read failed: %1").arg(errObs1->text()), false);

        vtkDICOMMetaData* md = reader->GetMetaData();
        vtkSmartPointer<vtkImageData> decoded;

        // 2a) без сжатия - vtkDICOMReader
        if (!isCompressedTS(md))
        {
            reader->Update();
            if (errObs1->hasError || !hasScalars(reader->GetOutput()))
                return fail(error, QString("DICOM read failed: %1").arg(errObs1->text()), false);

            decoded = reader->GetOutput();
            out.info = GetDicomRangesVTK(reader);
        }
        // 2b) сжатый transfer syntax - декодируем через GDCM
        else
        {
            qCInfo(lcDicom) << "Compressed transfer syntax, decoding with GDCM";
            auto gdcm = vtkSmartPointer<vtkGDCMImageReader>::New();
            auto errObs2 = vtkSmartPointer<VtkErrorCatcher>::New();
            gdcm->AddObserver(vtkCommand::ErrorEvent, errObs2);
            gdcm->SetFileNames(names);
            gdcm->Update();

            if (errObs2->hasError || !hasScalars(gdcm->GetOutput()))
                return fail(error, QString("GDCM decode failed: %1").arg(errObs2->text()), false);

            decoded = gdcm->GetOutput();
            out.info = GetImageRanges(decoded);
            const DicomInfo tags = GetDicomRangesVTK(reader);
            out.info.slope = tags.slope;
            out.info.intercept = tags.intercept;
            out.info.mode = tags.mode;
            out.info.modalityText = tags.modalityText;
        }

        out.image = vtkSmartPointer<vtkImageData>::New();
        out.image->DeepCopy(decoded);
        applyPatientMatrix(out.image, reader->GetPatientMatrix());

        out.meta = md;
        return true;
    }

    vtkSmartPointer<vtkImageData> readNifti(const QString& path, DicomInfo* info, QString* error,
        vtkNIFTIImageHeader* headerOut = nullptr)
    {
        auto reader = vtkSmartPointer<vtkNIFTIImageReader>::New();
        auto errObs = vtkSmartPointer<VtkErrorCatcher>::New();
        reader->AddObserver(vtkCommand::ErrorEvent, errObs);
        const QByteArray native = QFile::encodeName(path);
        reader->SetFileName(native.constData());
        reader->Update();

        if (errObs->hasError || !hasScalars(reader->GetOutput()))
            return fail(error, QString("NIfTI read failed: %1").arg(errObs->text()), vtkSmartPointer<vtkImageData>());

        auto img = vtkSmartPointer<vtkImageData>::New();
        img->DeepCopy(reader->GetOutput());

        if (info)
        {
            *info = GetImageRanges(img);
            info->slope = reader->GetRescaleSlope() != 0.0 ? reader->GetRescaleSlope() : 1.0;
            info->intercept = reader->GetRescaleIntercept();
        }
        if (headerOut && reader->GetNIFTIHeader())
            headerOut->DeepCopy(reader->GetNIFTIHeader());
        return img;
    }

    template <class T>
    void mipExecute(vtkImageData* in, vtkImageData* out, int axis, T*)
    {
        int ext[6]; in->GetExtent(ext);
        const int nc = in->GetNumberOfScalarComponents();
        const int first = ext[2 * axis];

        for (int k = ext[4]; k <= ext[5]; ++k)
            for (int j = ext[2]; j <= ext[3]; ++j)
                for (int i = ext[0]; i <= ext[1]; ++i)
                {
                    int o[3]{ i, j, k };
                    const bool seed = (o[axis] == first);
                    o[axis] = first;

                    const T* src = static_cast<const T*>(in->GetScalarPointer(i, j, k));
                    T* dst = static_cast<T*>(out->GetScalarPointer(o[0], o[1], o[2]));
                    for (int c = 0; c < nc; ++c)
                        dst[c] = seed ? src[c] : std::max(dst[c], src[c]);
                }
    }
}

bool DicomLoader::validate(const VolumeOptions& opt, QString* error)
{
    if (!(opt.opacity >= 0.0 && opt.opacity <= 1.0))
        return fail(error, "Opacity must be between 0 and 1", false);
    const QString interp = opt.interpolation.trimmed().toLower();
    if (interp != "linear" && interp != "nearest")
        return fail(error, QString("Invalid interpolation: %1 (expected linear or nearest)").arg(opt.interpolation), false);
    if (!(opt.windowWidth > 0.0))
        return fail(error, "Window width must be positive", false);
    return true;
}

vtkSmartPointer<vtkImageData> DicomLoader::ReadImage(const QString& path, QString* error,
    DicomInfo* info, PatientInfo* patient)
{
    const QFileInfo fi(path);
    if (!fi.exists())
        return fail(error, QString("Path not found: %1").arg(path), vtkSmartPointer<vtkImageData>());

    if (fi.isFile() && FileSniffer::isNifti(path))
    {
        auto img = readNifti(path, info, error);
        if (img && patient)
        {
            *patient = PatientInfo();
            patient->DicomPath = path;
        }
        if (img) qCInfo(lcDicom) << "Loaded NIfTI" << path;
        return img;
    }

    DicomRead r;
    if (!readDicomSeries(path, r, error))
        return nullptr;

    if (info) *info = r.info;
    if (patient) *patient = patientFrom(r.meta, path);

    int dims[3]; r.image->GetDimensions(dims);
    qCInfo(lcDicom) << "Loaded DICOM" << path << "files" << r.numFiles
                    << "dims" << dims[0] << dims[1] << dims[2];
    return r.image;
}

vtkSmartPointer<vtkVolume> DicomLoader::MakeVolume(vtkImageData* image, const VolumeOptions& opt, QString* error)
{
    if (!validate(opt, error))
        return nullptr;
    if (!hasScalars(image))
        return fail(error, "Invalid image: empty extent or no scalars.", vtkSmartPointer<vtkVolume>());

    auto mapper = vtkSmartPointer<vtkGPUVolumeRayCastMapper>::New();
    mapper->SetInputData(image);
    mapper->SetBlendModeToComposite();
    mapper->SetAutoAdjustSampleDistances(true);
    mapper->SetUseJittering(true);

    auto prop = vtkSmartPointer<vtkVolumeProperty>::New();
    prop->SetIndependentComponents(true);
    if (opt.colorTable)
    {
        prop->SetColor(0, opt.colorTable);
        prop->SetScalarOpacity(0, TF::MakeOTF_Window(opt.windowWidth, opt.windowCenter, opt.opacity));
    }
    else
    {
        TF::ApplyWindow(prop, opt.windowWidth, opt.windowCenter, opt.opacity);
    }

    prop->SetShade(opt.shade ? 1 : 0);
    prop->SetAmbient(0.05);
    prop->SetDiffuse(0.9);
    prop->SetSpecular(0.1);
    if (opt.interpolation.trimmed().toLower() == "nearest")
        prop->SetInterpolationTypeToNearest();
    else
        prop->SetInterpolationTypeToLinear();

    double sp[3]{ 1,1,1 };
    image->GetSpacing(sp);
    const double smin = std::min({ sp[0],sp[1],sp[2] });
    prop->SetScalarOpacityUnitDistance(std::max(0.3 * smin, 1e-3));

    auto vol = vtkSmartPointer<vtkVolume>::New();
    vol->SetMapper(mapper);
    vol->SetProperty(prop);
    return vol;
}

vtkSmartPointer<vtkVolume> DicomLoader::Load(const QString& path, const VolumeOptions& opt, QString* error)
{
    if (!validate(opt, error))
        return nullptr;

    auto img = ReadImage(path, error);
    if (!img)
        return nullptr;
    return MakeVolume(img, opt, error);
}

bool DicomLoader::GetInfo(const QString& path, VolumeInfo& out, QString* error)
{
    const QFileInfo fi(path);
    if (!fi.exists())
        return fail(error, QString("Path not found: %1").arg(path), false);

    out = VolumeInfo();
    out.directory = fi.isDir() ? fi.absoluteFilePath() : fi.absolutePath();

    vtkSmartPointer<vtkImageData> img;

    if (fi.isFile() && FileSniffer::isNifti(path))
    {
        auto header = vtkSmartPointer<vtkNIFTIImageHeader>::New();
        img = readNifti(path, &out.ranges, error, header);
        if (!img) return false;

        out.numFiles = 1;
        out.tags.insert("Description", QString::fromLatin1(header->GetDescrip()).trimmed());
        out.tags.insert("QFormCode", QString::number(header->GetQFormCode()));
        out.tags.insert("SFormCode", QString::number(header->GetSFormCode()));
        out.patient.DicomPath = path;
    }
    else
    {
        DicomRead r;
        if (!readDicomSeries(path, r, error))
            return false;

        img = r.image;
        out.numFiles = r.numFiles;
        out.ranges = r.info;
        out.patient = patientFrom(r.meta, path);

        for (auto it = r.meta->Begin(); it != r.meta->End(); ++it)
        {
            const vtkDICOMTag tag = it->GetTag();
            if (tag == vtkDICOMTag(DC::PixelData))
                continue;

            const vtkDICOMValue& v = r.meta->Get(0, tag);
            const vtkDICOMVR vr = v.GetVR();
            if (vr == vtkDICOMVR::SQ || vr == vtkDICOMVR::OB || vr == vtkDICOMVR::OW ||
                vr == vtkDICOMVR::OF || vr == vtkDICOMVR::OD || vr == vtkDICOMVR::UN)
                continue;

            out.tags.insert(TagName(tag.GetGroup(), tag.GetElement()),
                QString::fromStdString(v.AsUTF8String()).trimmed());
        }
    }

    img->GetDimensions(out.dimensions);
    img->GetSpacing(out.spacing);
    img->GetScalarRange(out.scalarRange);
    return true;
}

QString DicomLoader::TagName(unsigned short group, unsigned short element)
{
    const vtkDICOMDictEntry e = vtkDICOMDictionary::FindDictEntry(vtkDICOMTag(group, element));
    if (e.IsValid() && e.GetName() && *e.GetName())
        return QString::fromLatin1(e.GetName());
    return QString("(%1,%2)").arg(group, 4, 16, QChar('0')).arg(element, 4, 16, QChar('0'));
}

bool DicomLoader::parseOrientation(const QString& text, SliceOrientation& out)
{
    const QString s = text.trimmed().toLower();
    if (s == "axial")    { out = SliceOrientation::Axial;    return true; }
    if (s == "sagittal") { out = SliceOrientation::Sagittal; return true; }
    if (s == "coronal")  { out = SliceOrientation::Coronal;  return true; }
    return false;
}

static int axisOf(SliceOrientation o)
{
    switch (o)
    {
    case SliceOrientation::Sagittal: return 0;
    case SliceOrientation::Coronal:  return 1;
    case SliceOrientation::Axial:    break;
    }
    return 2;
}

int DicomLoader::SliceCount(vtkImageData* image, SliceOrientation o)
{
    if (!image) return 0;
    int ext[6]; image->GetExtent(ext);
    const int a = axisOf(o);
    return std::max(0, ext[2 * a + 1] - ext[2 * a] + 1);
}

vtkSmartPointer<vtkImageData> DicomLoader::ExtractSlice(vtkImageData* image, int index, SliceOrientation o, QString* error)
{
    if (!hasScalars(image))
        return fail(error, "No volume data", vtkSmartPointer<vtkImageData>());

    const int n = SliceCount(image, o);
    if (index < 0 || index >= n)
        return fail(error, QString("Slice index %1 out of range [0, %2)").arg(index).arg(n), vtkSmartPointer<vtkImageData>());

    int voi[6]; image->GetExtent(voi);
    const int a = axisOf(o);
    voi[2 * a] = voi[2 * a] + index;
    voi[2 * a + 1] = voi[2 * a];

    auto extract = vtkSmartPointer<vtkExtractVOI>::New();
    extract->SetInputData(image);
    extract->SetVOI(voi);
    extract->Update();

    auto out = vtkSmartPointer<vtkImageData>::New();
    out->DeepCopy(extract->GetOutput());
    return out;
}

vtkSmartPointer<vtkImageData> DicomLoader::ExtractSlice(vtkImageData* image, int index, const QString& orientation, QString* error)
{
    SliceOrientation o;
    if (!parseOrientation(orientation, o))
        return fail(error, QString("Invalid orientation: %1 (expected axial, sagittal or coronal)").arg(orientation),
            vtkSmartPointer<vtkImageData>());
    return ExtractSlice(image, index, o, error);
}

vtkSmartPointer<vtkImageData> DicomLoader::MaximumIntensityProjection(vtkImageData* image, const double direction[3], QString* error)
{
    if (!hasScalars(image))
        return fail(error, "No volume data", vtkSmartPointer<vtkImageData>());

    const double ax = std::abs(direction[0]), ay = std::abs(direction[1]), az = std::abs(direction[2]);
    if (!(ax > 0.0 || ay > 0.0 || az > 0.0))
        return fail(error, "Projection direction must be non-zero", vtkSmartPointer<vtkImageData>());

    int axis = 2;
    if (ax >= ay && ax >= az) axis = 0;
    else if (ay >= az) axis = 1;

    int ext[6]; image->GetExtent(ext);
    int outExt[6]{ ext[0], ext[1], ext[2], ext[3], ext[4], ext[5] };
    outExt[2 * axis + 1] = outExt[2 * axis];

    auto out = vtkSmartPointer<vtkImageData>::New();
    out->SetExtent(outExt);
    out->SetSpacing(image->GetSpacing());
    out->SetOrigin(image->GetOrigin());
    out->SetDirectionMatrix(image->GetDirectionMatrix());
    out->AllocateScalars(image->GetScalarType(), image->GetNumberOfScalarComponents());

    switch (image->GetScalarType())
    {
        vtkTemplateMacro(mipExecute(image, out.GetPointer(), axis, static_cast<VTK_TT*>(nullptr)));
    default:
        return fail(error, "Unsupported scalar type for projection", vtkSmartPointer<vtkImageData>());
    }
    return out;
}
