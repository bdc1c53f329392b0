#include <gtest/gtest.h>
#include <Services/DicomLoader.h>
#include "TestData.h"

#include <Services/FileSniffer.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QTemporaryDir>

#include <vtkColorTransferFunction.h>
#include <vtkNIFTIImageWriter.h>
#include <vtkVolume.h>
#include <vtkVolumeProperty.h>

namespace
{
    short voxel(vtkImageData* img, int x, int y, int z)
    {
        return *static_cast<short*>(img->GetScalarPointer(x, y, z));
    }

    // Две серии в одном каталоге: head (4 среза, один файл без расширения) и scout (2 среза)
    QString makeTwoSeriesFolder(const QTemporaryDir& dir, QString* renamed)
    {
        const QString folder = dir.filePath("study");
        if (!QDir(dir.path()).mkdir("study")) return QString();
        if (!TestData::WriteCtSeries(folder, "head", 4, "Test^Phantom")) return QString();
        if (!TestData::WriteCtSeries(folder, "scout", 2, "Test^Phantom")) return QString();

        const QStringList head = QDir(folder).entryList({ "head-*.dcm" }, QDir::Files, QDir::Name);
        if (head.size() != 4) return QString();

        *renamed = folder + "/IM_HEAD_LAST";
        if (!QFile::rename(folder + "/" + head.last(), *renamed)) return QString();
        return folder;
    }
}

TEST(DicomLoader, ValidateOptions)
{
    QString err;
    VolumeOptions opt;
    EXPECT_TRUE(DicomLoader::validate(opt, &err));

    opt.opacity = -0.1;
    EXPECT_FALSE(DicomLoader::validate(opt, &err));
    EXPECT_EQ(err, "Opacity must be between 0 and 1");

    opt = VolumeOptions();
    opt.interpolation = "cubic";
    EXPECT_FALSE(DicomLoader::validate(opt, &err));
    EXPECT_TRUE(err.startsWith("Invalid interpolation"));

    opt = VolumeOptions();
    opt.windowWidth = 0.0;
    EXPECT_FALSE(DicomLoader::validate(opt, &err));
}

TEST(DicomLoader, ValidationPrecedesPathCheck)
{
    VolumeOptions opt;
    opt.opacity = 3.0;
    QString err;
    EXPECT_FALSE(DicomLoader::Load("/nonexistent/series", opt, &err));
    EXPECT_EQ(err, "Opacity must be between 0 and 1");

    EXPECT_FALSE(DicomLoader::Load("/nonexistent/series", VolumeOptions(), &err));
    EXPECT_TRUE(err.startsWith("Path not found"));
}

TEST(DicomLoader, SlicesAlongEachOrientation)
{
    auto vol = TestData::MakeVolume(4, 3, 5);

    EXPECT_EQ(DicomLoader::SliceCount(vol, SliceOrientation::Axial), 5);
    EXPECT_EQ(DicomLoader::SliceCount(vol, SliceOrientation::Sagittal), 4);
    EXPECT_EQ(DicomLoader::SliceCount(vol, SliceOrientation::Coronal), 3);

    QString err;
    auto axial = DicomLoader::ExtractSlice(vol, 2, "axial", &err);
    ASSERT_TRUE(axial) << err.toStdString();
    int d[3]; axial->GetDimensions(d);
    EXPECT_EQ(d[0], 4); EXPECT_EQ(d[1], 3); EXPECT_EQ(d[2], 1);
    EXPECT_EQ(voxel(axial, 3, 1, 2), 213);

    auto sag = DicomLoader::ExtractSlice(vol, 1, SliceOrientation::Sagittal, &err);
    ASSERT_TRUE(sag);
    sag->GetDimensions(d);
    EXPECT_EQ(d[0], 1); EXPECT_EQ(d[1], 3); EXPECT_EQ(d[2], 5);
    EXPECT_EQ(voxel(sag, 1, 2, 4), 421);

    EXPECT_FALSE(DicomLoader::ExtractSlice(vol, 5, SliceOrientation::Axial, &err));
    EXPECT_EQ(err, "Slice index 5 out of range [0, 5)");

    EXPECT_FALSE(DicomLoader::ExtractSlice(vol, 0, "oblique", &err));
    EXPECT_TRUE(err.startsWith("Invalid orientation"));

    EXPECT_FALSE(DicomLoader::ExtractSlice(nullptr, 0, SliceOrientation::Axial, &err));
    EXPECT_EQ(err, "No volume data");
}

TEST(DicomLoader, MaximumIntensityProjectionUsesDominantAxis)
{
    auto vol = TestData::MakeVolume(4, 3, 5);
    QString err;

    const double dirZ[3]{ 0.1, -0.2, -1.0 };
    auto mip = DicomLoader::MaximumIntensityProjection(vol, dirZ, &err);
    ASSERT_TRUE(mip) << err.toStdString();
    int d[3]; mip->GetDimensions(d);
    EXPECT_EQ(d[2], 1);
    EXPECT_EQ(voxel(mip, 2, 1, 0), 412);

    const double dirX[3]{ 1.0, 0.0, 0.0 };
    mip = DicomLoader::MaximumIntensityProjection(vol, dirX, &err);
    ASSERT_TRUE(mip);
    mip->GetDimensions(d);
    EXPECT_EQ(d[0], 1);
    EXPECT_EQ(voxel(mip, 0, 2, 3), 323);

    const double zero[3]{ 0.0, 0.0, 0.0 };
    EXPECT_FALSE(DicomLoader::MaximumIntensityProjection(vol, zero, &err));
    EXPECT_EQ(err, "Projection direction must be non-zero");
}

TEST(DicomLoader, MakeVolumeFromImage)
{
    auto vol = TestData::MakeVolume(8, 8, 8);
    VolumeOptions opt;
    opt.shade = false;
    opt.interpolation = "nearest";

    QString err;
    auto v = DicomLoader::MakeVolume(vol, opt, &err);
    ASSERT_TRUE(v) << err.toStdString();
    EXPECT_EQ(v->GetProperty()->GetShade(), 0);
    EXPECT_EQ(v->GetProperty()->GetInterpolationType(), VTK_NEAREST_INTERPOLATION);

    auto empty = vtkSmartPointer<vtkImageData>::New();
    EXPECT_FALSE(DicomLoader::MakeVolume(empty, opt, &err));
    EXPECT_TRUE(err.startsWith("Invalid image"));
}

TEST(DicomLoader, ReadsNiftiVolume)
{
    QTemporaryDir dir;
    const QString path = dir.filePath("phantom.nii.gz");
    const QByteArray native = path.toLocal8Bit();

    auto src = TestData::MakeVolume(6, 5, 4);
    auto w = vtkSmartPointer<vtkNIFTIImageWriter>::New();
    w->SetInputData(src);
    w->SetFileName(native.constData());
    w->Write();

    QString err;
    DicomInfo info;
    PatientInfo patient;
    auto img = DicomLoader::ReadImage(path, &err, &info, &patient);
    ASSERT_TRUE(img) << err.toStdString();

    int d[3]; img->GetDimensions(d);
    EXPECT_EQ(d[0], 6); EXPECT_EQ(d[1], 5); EXPECT_EQ(d[2], 4);
    EXPECT_DOUBLE_EQ(info.physicalMin, 0.0);
    EXPECT_DOUBLE_EQ(info.physicalMax, 345.0);
    EXPECT_DOUBLE_EQ(info.mSpZ, 2.0);
    EXPECT_EQ(patient.DicomPath, path);

    VolumeInfo vi;
    ASSERT_TRUE(DicomLoader::GetInfo(path, vi, &err)) << err.toStdString();
    EXPECT_EQ(vi.dimensions[1], 5);
    EXPECT_DOUBLE_EQ(vi.scalarRange[1], 345.0);
}

TEST(DicomLoader, RangesFromImage)
{
    auto vol = TestData::MakeVolume(3, 3, 3);
    const DicomInfo di = GetImageRanges(vol);
    EXPECT_DOUBLE_EQ(di.physicalMax, 222.0);
    EXPECT_EQ(di.bitsAllocated, 16);
    EXPECT_DOUBLE_EQ(di.mSpX, 0.5);

    EXPECT_EQ(ModalityFromText("CT"), Modality::CT);
    EXPECT_EQ(ModalityFromText("mr"), Modality::MR);
    EXPECT_EQ(ModalityFromText(""), Modality::Unknown);
}

TEST(DicomLoader, TagNamesFromDictionary)
{
    EXPECT_EQ(DicomLoader::TagName(0x0010, 0x0010), "PatientName");
    EXPECT_EQ(DicomLoader::TagName(0x0008, 0x0060), "Modality");
    EXPECT_EQ(DicomLoader::TagName(0x0009, 0x10ab), "(0009,10ab)");
}

TEST(DicomLoader, ReadsLargestSeriesFromFolder)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString renamed;
    const QString folder = makeTwoSeriesFolder(dir, &renamed);
    ASSERT_FALSE(folder.isEmpty());

    EXPECT_EQ(FileSniffer::classify(folder), FileKind::DicomFolder);
    EXPECT_EQ(FileSniffer::classify(renamed), FileKind::DicomFile);

    QString err;
    DicomInfo info;
    PatientInfo patient;
    auto img = DicomLoader::ReadImage(folder, &err, &info, &patient);
    ASSERT_TRUE(img) << err.toStdString();

    int dims[3]; img->GetDimensions(dims);
    EXPECT_EQ(dims[0], 8);
    EXPECT_EQ(dims[1], 8);
    EXPECT_EQ(dims[2], 4);
    EXPECT_EQ(patient.patientName, "Test^Phantom");
    EXPECT_EQ(patient.Mode, "CT");
    EXPECT_EQ(patient.DicomPath, folder);
}

TEST(DicomLoader, InfoForDicomFolder)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString renamed;
    const QString folder = makeTwoSeriesFolder(dir, &renamed);
    ASSERT_FALSE(folder.isEmpty());

    QString err;
    VolumeInfo info;
    ASSERT_TRUE(DicomLoader::GetInfo(folder, info, &err)) << err.toStdString();

    EXPECT_EQ(info.numFiles, 4);
    EXPECT_EQ(info.directory, QFileInfo(folder).absoluteFilePath());
    EXPECT_EQ(info.dimensions[2], 4);

    EXPECT_EQ(info.tags.value("Modality"), "CT");
    EXPECT_EQ(info.tags.value("PatientName"), "Test^Phantom");
    EXPECT_FALSE(info.tags.contains("PixelData"));
    EXPECT_FALSE(info.tags.contains("(7fe0,0010)"));

    const QRegularExpression fallback("^\\([0-9a-f]{4},[0-9a-f]{4}\\)$");
    for (auto it = info.tags.cbegin(); it != info.tags.cend(); ++it)
    {
        if (it.key().startsWith('('))
            EXPECT_TRUE(fallback.match(it.key()).hasMatch()) << it.key().toStdString();
        else
            EXPECT_FALSE(it.key().contains(' ')) << it.key().toStdString();
    }
}

TEST(DicomLoader, ReadsSingleDicomFileWithoutExtension)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString renamed;
    ASSERT_FALSE(makeTwoSeriesFolder(dir, &renamed).isEmpty());

    QString err;
    auto img = DicomLoader::ReadImage(renamed, &err);
    ASSERT_TRUE(img) << err.toStdString();
    int dims[3]; img->GetDimensions(dims);
    EXPECT_EQ(dims[0], 8);
    EXPECT_EQ(dims[2], 1);

    VolumeInfo info;
    ASSERT_TRUE(DicomLoader::GetInfo(renamed, info, &err));
    EXPECT_EQ(info.numFiles, 1);
}
