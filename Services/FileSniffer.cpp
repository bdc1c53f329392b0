#include "FileSniffer.h"
#include <QFileInfo>
#include <QFile>
#include <QDir>
#include <QDirIterator>
#include <QIODevice>

namespace FileSniffer {
    bool isDicomdirName(const QString& fileName) noexcept {
        return (fileName.compare(QStringLiteral("DICOMDIR"), Qt::CaseInsensitive) == 0) || (fileName.compare(QStringLiteral("DIRFILE"), Qt::CaseInsensitive) == 0);
    }

    bool looksLikeDicomFile(const QString& filePath) noexcept {
        const QFileInfo fi(filePath);
        if (!fi.isFile() || !fi.exists()) return false;
        if (isDicomdirName(fi.fileName())) return false;

        const QString lower = fi.fileName().toLower();
        if (lower.endsWith(".dcm") || lower.endsWith(".dicom") || lower.endsWith(".ima"))
            return true;

        QFile f(filePath);
        if (!f.open(QIODevice::ReadOnly) || f.size() < 132) return false;

        if (!f.seek(128)) return false;
        char magic[4];
        if (f.read(magic, 4) != 4) return false;
        return magic[0] == 'D' && magic[1] == 'I' && magic[2] == 'C' && magic[3] == 'M';
    }

    bool isModelFile(const QString& filePath) noexcept {
        const QString lower = filePath.toLower();
        return lower.endsWith(".stl") || lower.endsWith(".obj");
    }

    bool isNifti(const QString& filePath) noexcept {
        const QString lower = filePath.toLower();
        return lower.endsWith(".nii") || lower.endsWith(".nii.gz");
    }

    bool isMedicalImage(const QString& filePath) noexcept {
        const QFileInfo fi(filePath);
        if (fi.isDir()) return folderHasDicom(filePath);
        return isNifti(filePath) || looksLikeDicomFile(filePath);
    }

    bool folderHasDicom(const QString& dirPath) noexcept {
        QDirIterator it(dirPath, QDir::Files | QDir::NoDotAndDotDot);
        while (it.hasNext()) {
            if (looksLikeDicomFile(it.next()))
                return true;
        }
        return false;
    }

    FileKind classify(const QString& path) noexcept {
        const QFileInfo fi(path);
        if (!fi.exists()) return FileKind::None;

        if (fi.isDir())
            return folderHasDicom(path) ? FileKind::DicomFolder : FileKind::None;

        if (isModelFile(path)) return FileKind::Model;
        if (isNifti(path)) return FileKind::Nifti;
        if (looksLikeDicomFile(path)) return FileKind::DicomFile;
        return FileKind::None;
    }

    QString kindName(FileKind kind) {
        switch (kind) {
        case FileKind::Model:       return QStringLiteral("3D model");
        case FileKind::DicomFile:   return QStringLiteral("DICOM file");
        case FileKind::DicomFolder: return QStringLiteral("DICOM folder");
        case FileKind::Nifti:       return QStringLiteral("NIfTI volume");
        case FileKind::None:        break;
        }
        return QStringLiteral("unknown");
    }

    QString openDialogFilter() {
        return QStringLiteral("All supported (*.stl *.obj *.dcm *.nii *.nii.gz);;"
                              "3D Models (*.stl *.obj);;"
                              "Medical Images (*.dcm *.nii *.nii.gz);;"
                              "All files (*)");
    }
}
