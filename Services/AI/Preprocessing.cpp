#include "Preprocessing.h"
#include <Services/LogCategories.h>

#include <vtkImageCast.h>
#include <vtkImageChangeInformation.h>
#include <vtkImageData.h>
#include <vtkImageFlip.h>
#include <vtkImageGaussianSmooth.h>
#include <vtkImageReslice.h>
#include <vtkImageResize.h>
#include <vtkImageShiftScale.h>
#include <vtkTransform.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace
{
    template <typename T>
    T fail(QString* error, const QString& msg, T value)
    {
        qCWarning(lcAi).noquote() << msg;
        if (error) *error = msg;
        return value;
    }

    bool checkSlice(vtkImageData* img, QString* error)
    {
        if (!img)
            return fail(error, "No image", false);
        int d[3]; img->GetDimensions(d);
        if (d[0] < 1 || d[1] < 1 || d[2] != 1)
            return fail(error, QString("Expected a 2D slice, got %1x%2x%3").arg(d[0]).arg(d[1]).arg(d[2]), false);
        if (img->GetNumberOfScalarComponents() != 1)
            return fail(error, "Expected a single-component image", false);
        return true;
    }

    // double, extent от 0, origin 0, spacing 1
    vtkSmartPointer<vtkImageData> asDouble(vtkImageData* img)
    {
        auto cast = vtkSmartPointer<vtkImageCast>::New();
        cast->SetInputData(img);
        cast->SetOutputScalarTypeToDouble();

        auto info = vtkSmartPointer<vtkImageChangeInformation>::New();
        info->SetInputConnection(cast->GetOutputPort());
        info->SetOutputExtentStart(0, 0, 0);
        info->SetOutputOrigin(0.0, 0.0, 0.0);
        info->SetOutputSpacing(1.0, 1.0, 1.0);
        info->Update();

        auto out = vtkSmartPointer<vtkImageData>::New();
        out->DeepCopy(info->GetOutput());
        return out;
    }

    inline double* px(vtkImageData* img) { return static_cast<double*>(img->GetScalarPointer()); }

    inline vtkIdType count(vtkImageData* img)
    {
        int d[3]; img->GetDimensions(d);
        return vtkIdType(d[0]) * d[1];
    }

    vtkSmartPointer<vtkImageData> gaussian(vtkImageData* img, double sigma)
    {
        auto g = vtkSmartPointer<vtkImageGaussianSmooth>::New();
        g->SetInputData(img);
        g->SetDimensionality(2);
        g->SetStandardDeviations(sigma, sigma, 0.0);
        g->SetRadiusFactors(4.0, 4.0, 0.0);
        g->Update();

        auto out = vtkSmartPointer<vtkImageData>::New();
        out->DeepCopy(g->GetOutput());
        return out;
    }

    vtkSmartPointer<vtkImageData> equalize(vtkImageData* img)
    {
        constexpr int kBins = 256;
        double r[2]; img->GetScalarRange(r);
        auto out = Preprocessing::MakeSlice(img->GetDimensions()[0], img->GetDimensions()[1]);
        const vtkIdType n = count(img);
        if (r[1] <= r[0])
            return out;

        const double* s = px(img);
        auto binOf = [&](double v) {
            const int b = static_cast<int>((v - r[0]) / (r[1] - r[0]) * kBins);
            return std::clamp(b, 0, kBins - 1);
        };

        std::array<double, kBins> cdf{};
        for (vtkIdType i = 0; i < n; ++i)
            cdf[binOf(s[i])] += 1.0;
        for (int b = 1; b < kBins; ++b)
            cdf[b] += cdf[b - 1];

        double* d = px(out);
        for (vtkIdType i = 0; i < n; ++i)
            d[i] = cdf[binOf(s[i])] / cdf[kBins - 1];
        return out;
    }

    // заполняет канву нулями и кладёт src со смещением
    void paste(vtkImageData* src, vtkImageData* dst, int offX, int offY)
    {
        int sd[3], dd[3];
        src->GetDimensions(sd);
        dst->GetDimensions(dd);
        const double* s = px(src);
        double* d = px(dst);
        for (int y = 0; y < sd[1]; ++y)
        {
            const int ty = y + offY;
            if (ty < 0 || ty >= dd[1]) continue;
            for (int x = 0; x < sd[0]; ++x)
            {
                const int tx = x + offX;
                if (tx < 0 || tx >= dd[0]) continue;
                d[vtkIdType(ty) * dd[0] + tx] = s[vtkIdType(y) * sd[0] + x];
            }
        }
    }

    vtkSmartPointer<vtkImageData> crop(vtkImageData* src, int x0, int y0, int w, int h)
    {
        auto out = Preprocessing::MakeSlice(w, h);
        paste(src, out, -x0, -y0);
        return out;
    }
}

bool Preprocessing::ParsePadding(const QString& text, Padding* out)
{
    const QString t = text.trimmed().toLower();
    Padding p;
    if (t == "valid") p = Padding::Valid;
    else if (t == "same") p = Padding::Same;
    else return false;
    if (out) *out = p;
    return true;
}

vtkSmartPointer<vtkImageData> Preprocessing::MakeSlice(int width, int height, double fill)
{
    auto img = vtkSmartPointer<vtkImageData>::New();
    img->SetDimensions(std::max(1, width), std::max(1, height), 1);
    img->SetOrigin(0.0, 0.0, 0.0);
    img->SetSpacing(1.0, 1.0, 1.0);
    img->AllocateScalars(VTK_DOUBLE, 1);
    std::fill_n(px(img), count(img), fill);
    return img;
}

vtkSmartPointer<vtkImageData> Preprocessing::NormalizeImage(vtkImageData* img, double minVal, double maxVal,
    QString* error)
{
    using Ret = vtkSmartPointer<vtkImageData>;
    if (!(minVal < maxVal))
        return fail(error, "Normalization min must be less than max", Ret());
    if (!checkSlice(img, error))
        return Ret();

    auto out = asDouble(img);
    double r[2]; out->GetScalarRange(r);
    double* d = px(out);
    const vtkIdType n = count(out);

    if (r[1] - r[0] == 0.0)
    {
        std::fill_n(d, n, minVal);
        return out;
    }

    const double k = (maxVal - minVal) / (r[1] - r[0]);
    for (vtkIdType i = 0; i < n; ++i)
        d[i] = (d[i] - r[0]) * k + minVal;
    out->Modified();
    return out;
}

vtkSmartPointer<vtkImageData> Preprocessing::ResizeImage(vtkImageData* img, int width, int height,
    bool preserveAspect, QString* error)
{
    using Ret = vtkSmartPointer<vtkImageData>;
    if (width <= 0 || height <= 0)
        return fail(error, "Target size must be positive", Ret());
    if (!checkSlice(img, error))
        return Ret();

    auto src = asDouble(img);
    int d[3]; src->GetDimensions(d);

    int nw = width, nh = height;
    if (preserveAspect)
    {
        const double scale = std::min(double(width) / d[0], double(height) / d[1]);
        nw = std::max(1, int(d[0] * scale));
        nh = std::max(1, int(d[1] * scale));
    }

    Ret resized;
    if (nw == d[0] && nh == d[1])
    {
        resized = src;
    }
    else
    {
        auto rs = vtkSmartPointer<vtkImageResize>::New();
        rs->SetInputData(src);
        rs->SetResizeMethodToOutputDimensions();
        rs->SetOutputDimensions(nw, nh, 1);
        rs->InterpolateOn();
        rs->Update();
        resized = asDouble(rs->GetOutput());
    }

    if (nw == width && nh == height)
        return resized;

    // по центру на нулевой канве
    auto canvas = MakeSlice(width, height);
    paste(resized, canvas, (width - nw) / 2, (height - nh) / 2);
    return canvas;
}

vtkSmartPointer<vtkImageData> Preprocessing::EnhanceImage(vtkImageData* img, const EnhanceOptions& opt,
    QString* error)
{
    using Ret = vtkSmartPointer<vtkImageData>;
    if (!checkSlice(img, error))
        return Ret();

    Ret cur = asDouble(img);
    if (opt.contrast)
        cur = equalize(cur);
    else
        cur = NormalizeImage(cur, 0.0, 1.0);

    if (opt.denoise)
        cur = gaussian(cur, 1.0);

    if (opt.sharpen)
    {
        // img + amount * (img - blur), amount 1
        auto blur = gaussian(cur, 1.0);
        double* c = px(cur);
        const double* b = px(blur);
        const vtkIdType n = count(cur);
        for (vtkIdType i = 0; i < n; ++i)
            c[i] = c[i] + (c[i] - b[i]);
    }

    double* c = px(cur);
    const vtkIdType n = count(cur);
    for (vtkIdType i = 0; i < n; ++i)
        c[i] = std::clamp(c[i], 0.0, 1.0);
    cur->Modified();
    return cur;
}

bool Preprocessing::ExtractPatches(vtkImageData* img, int patchW, int patchH, int strideW, int strideH,
    Padding padding, std::vector<vtkSmartPointer<vtkImageData>>& out, QString* error)
{
    out.clear();
    if (patchW <= 0 || patchH <= 0)
        return fail(error, "Patch size must be positive", false);
    if (strideW == 0) strideW = patchW;
    if (strideH == 0) strideH = patchH;
    if (strideW < 0 || strideH < 0)
        return fail(error, "Stride must be positive", false);
    if (!checkSlice(img, error))
        return false;

    auto src = asDouble(img);
    int d[3]; src->GetDimensions(d);

    if (padding == Padding::Valid)
    {
        if (patchW > d[0] || patchH > d[1])
            return true;   // ни одного целого патча
        for (int y = 0; y + patchH <= d[1]; y += strideH)
            for (int x = 0; x + patchW <= d[0]; x += strideW)
                out.push_back(crop(src, x, y, patchW, patchH));
        return true;
    }

    // same: нули (p-1)/2 сверху/слева, h/stride патчей по каждой оси
    const int padX = (patchW - 1) / 2;
    const int padY = (patchH - 1) / 2;
    const int nx = d[0] / strideW;
    const int ny = d[1] / strideH;
    for (int j = 0; j < ny; ++j)
        for (int i = 0; i < nx; ++i)
            out.push_back(crop(src, i * strideW - padX, j * strideH - padY, patchW, patchH));
    return true;
}

vtkSmartPointer<vtkImageData> Preprocessing::AugmentImage(vtkImageData* img, std::mt19937& rng,
    const AugmentOptions& opt, QString* error)
{
    using Ret = vtkSmartPointer<vtkImageData>;
    if (!checkSlice(img, error))
        return Ret();
    if (opt.zoomMin <= 0.0 || opt.zoomMax < opt.zoomMin)
        return fail(error, "Invalid zoom range", Ret());
    if (opt.brightnessMax < opt.brightnessMin)
        return fail(error, "Invalid brightness range", Ret());

    auto uniform = [&rng](double a, double b) {
        return std::uniform_real_distribution<double>(a, b)(rng);
    };

    Ret cur = asDouble(img);
    int d[3]; cur->GetDimensions(d);

    const double angle = opt.rotationDeg != 0.0 ? uniform(-opt.rotationDeg, opt.rotationDeg) : 0.0;
    double shiftX = 0.0, shiftY = 0.0;
    if (opt.shift != 0.0)
    {
        shiftY = uniform(-opt.shift, opt.shift) * d[1];
        shiftX = uniform(-opt.shift, opt.shift) * d[0];
    }
    const double zoom = (opt.zoomMin != 1.0 || opt.zoomMax != 1.0) ? uniform(opt.zoomMin, opt.zoomMax) : 1.0;

    if (angle != 0.0 || shiftX != 0.0 || shiftY != 0.0 || zoom != 1.0)
    {
        const double cx = 0.5 * (d[0] - 1);
        const double cy = 0.5 * (d[1] - 1);

        // трансформ выход -> вход
        auto t = vtkSmartPointer<vtkTransform>::New();
        t->PostMultiply();
        t->Translate(-cx - shiftX, -cy - shiftY, 0.0);
        t->Scale(1.0 / zoom, 1.0 / zoom, 1.0);
        t->RotateZ(-angle);
        t->Translate(cx, cy, 0.0);

        auto rs = vtkSmartPointer<vtkImageReslice>::New();
        rs->SetInputData(cur);
        rs->SetResliceTransform(t);
        rs->SetInterpolationModeToLinear();
        rs->SetBackgroundLevel(0.0);
        rs->SetOutputExtent(0, d[0] - 1, 0, d[1] - 1, 0, 0);
        rs->SetOutputOrigin(0.0, 0.0, 0.0);
        rs->SetOutputSpacing(1.0, 1.0, 1.0);
        rs->Update();
        cur = asDouble(rs->GetOutput());
    }

    const bool flipH = opt.flipHorizontal && uniform(0.0, 1.0) < 0.5;
    const bool flipV = opt.flipVertical && uniform(0.0, 1.0) < 0.5;
    for (int axis : { 0, 1 })
    {
        if ((axis == 0 && !flipH) || (axis == 1 && !flipV))
            continue;
        auto f = vtkSmartPointer<vtkImageFlip>::New();
        f->SetInputData(cur);
        f->SetFilteredAxis(axis);
        f->Update();
        cur = asDouble(f->GetOutput());
    }

    if (opt.brightnessMin != 1.0 || opt.brightnessMax != 1.0)
    {
        auto ss = vtkSmartPointer<vtkImageShiftScale>::New();
        ss->SetInputData(cur);
        ss->SetScale(uniform(opt.brightnessMin, opt.brightnessMax));
        ss->SetOutputScalarTypeToDouble();
        ss->Update();
        cur = asDouble(ss->GetOutput());
    }
    return cur;
}

bool Preprocessing::ToModelInput(vtkImageData* img, int size, std::vector<float>& out, QString* error)
{
    out.clear();
    auto r = ResizeImage(img, size, size, false, error);
    if (!r)
        return false;

    const double* s = px(r);
    const vtkIdType n = count(r);
    out.resize(static_cast<size_t>(n));
    for (vtkIdType i = 0; i < n; ++i)
        out[size_t(i)] = static_cast<float>(s[i] / 255.0);
    return true;
}

vtkSmartPointer<vtkImageData> Preprocessing::MakeSyntheticSlice(int size, bool withLesion, std::mt19937& rng)
{
    auto img = MakeSlice(size, size);
    double* d = px(img);

    std::normal_distribution<double> bg(50.0, 10.0);
    std::normal_distribution<double> lesion(200.0, 10.0);

    const double c = 0.5 * (size - 1);
    const double r2 = std::pow(std::max(2.0, size / 8.0), 2);
    for (int y = 0; y < size; ++y)
        for (int x = 0; x < size; ++x)
        {
            const bool inside = withLesion && ((x - c) * (x - c) + (y - c) * (y - c) <= r2);
            d[vtkIdType(y) * size + x] = std::clamp(inside ? lesion(rng) : bg(rng), 0.0, 255.0);
        }
    img->Modified();
    return img;
}
