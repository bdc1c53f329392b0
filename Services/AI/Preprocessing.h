#pragma once
#include <QString>
#include <random>
#include <vector>
#include <vtkSmartPointer.h>

class vtkImageData;

// Операции над одиночными 2D срезами (dims w x h x 1, один канал).
// Результат всегда double, origin 0, spacing 1.
namespace Preprocessing {

    enum class Padding { Valid, Same };
    bool ParsePadding(const QString& text, Padding* out);

    struct EnhanceOptions
    {
        bool contrast = true;   // выравнивание гистограммы
        bool denoise = true;    // гаусс sigma 1
        bool sharpen = true;    // unsharp mask radius 1, amount 1
    };

    struct AugmentOptions
    {
        double rotationDeg = 10.0;              // +-
        double shift = 0.1;                     // +- доля размера
        double zoomMin = 0.9, zoomMax = 1.1;
        bool   flipHorizontal = true;
        bool   flipVertical = true;
        double brightnessMin = 0.8, brightnessMax = 1.2;
    };

    vtkSmartPointer<vtkImageData> MakeSlice(int width, int height, double fill = 0.0);

    vtkSmartPointer<vtkImageData> NormalizeImage(vtkImageData* img, double minVal = 0.0, double maxVal = 1.0,
        QString* error = nullptr);

    vtkSmartPointer<vtkImageData> ResizeImage(vtkImageData* img, int width, int height,
        bool preserveAspect = true, QString* error = nullptr);

    vtkSmartPointer<vtkImageData> EnhanceImage(vtkImageData* img, const EnhanceOptions& opt = {},
        QString* error = nullptr);

    // stride 0 -> равен размеру патча
    bool ExtractPatches(vtkImageData* img, int patchW, int patchH, int strideW, int strideH,
        Padding padding, std::vector<vtkSmartPointer<vtkImageData>>& out, QString* error = nullptr);

    // Поворот, сдвиг, масштаб, отражения, яркость, в этом порядке
    vtkSmartPointer<vtkImageData> AugmentImage(vtkImageData* img, std::mt19937& rng,
        const AugmentOptions& opt = {}, QString* error = nullptr);

    // size x size без сохранения пропорций, /255, построчно
    bool ToModelInput(vtkImageData* img, int size, std::vector<float>& out, QString* error = nullptr);

    // Шум 0..255 и при withLesion яркий диск в центре
    vtkSmartPointer<vtkImageData> MakeSyntheticSlice(int size, bool withLesion, std::mt19937& rng);

} // namespace Preprocessing
