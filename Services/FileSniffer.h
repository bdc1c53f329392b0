#pragma once
#include <QString>

enum class FileKind { None, Model, DicomFile, DicomFolder, Nifti };

namespace FileSniffer {
    bool isDicomdirName(const QString& fileName) noexcept;
    bool looksLikeDicomFile(const QString& filePath) noexcept;
    bool isModelFile(const QString& filePath) noexcept;
    bool isNifti(const QString& filePath) noexcept;
    bool isMedicalImage(const QString& filePath) noexcept;
    bool folderHasDicom(const QString& dirPath) noexcept;

    FileKind classify(const QString& path) noexcept;
    QString kindName(FileKind kind);

    QString openDialogFilter();
}
