#include "TransferFunction.h"
#include <vtkSmartPointer.h>
#include <vtkVolumeProperty.h>
#include <vtkColorTransferFunction.h>
#include <vtkPiecewiseFunction.h>
#include <QMenu>
#include <QAction>
#include <QObject>
#include <algorithm>
#include <vector>

namespace {

    inline void fixRange(double& a, double& b)
    {
        // пустой диапазон: хотя бы единичный интервал, чтобы точки не слиплись
        if (a == b) {
            b = a + 1.0;
        }
        if (a > b)
            std::swap(a, b);
    }

    inline double Lerp(double a, double b, double t) { return a + (b - a) * t; }

    template<typename F>
    vtkSmartPointer<vtkColorTransferFunction>
        buildCTF(double min, double max, F&& add)
    {
        auto c = vtkSmartPointer<vtkColorTransferFunction>::New();
        c->RemoveAllPoints();
        add(c.GetPointer(), min, max);
        return c;
    }

    template<typename F>
    vtkSmartPointer<vtkPiecewiseFunction>
        buildOTF(double min, double max, F&& add)
    {
        auto o = vtkSmartPointer<vtkPiecewiseFunction>::New();
        o->RemoveAllPoints();
        add(o.GetPointer(), min, max);
        return o;
    }

} // namespace

QMenu* TF::CreateMenu(QWidget* parent, std::function<void(TFPreset)> onChosen) {
    auto* m = new QMenu(parent);
    for (TFPreset p : { TFPreset::Window, TFPreset::Grayscale, TFPreset::Rainbow, TFPreset::Bone,
                        TFPreset::Angio, TFPreset::SoftTissue, TFPreset::Lungs, TFPreset::HotMetal })
    {
        if (p == TFPreset::Grayscale) m->addSeparator();
        QObject::connect(m->addAction(PresetName(p)), &QAction::triggered, [onChosen, p] { onChosen(p); });
    }
    return m;
}

QString TF::PresetName(TFPreset preset)
{
    switch (preset) {
    case TFPreset::Window:     return QObject::tr("Window / Level");
    case TFPreset::Grayscale:  return QObject::tr("Grayscale");
    case TFPreset::Rainbow:    return QObject::tr("Rainbow");
    case TFPreset::Bone:       return QObject::tr("Bone");
    case TFPreset::Angio:      return QObject::tr("Angio");
    case TFPreset::SoftTissue: return QObject::tr("SoftTissue");
    case TFPreset::Lungs:      return QObject::tr("Lungs");
    case TFPreset::HotMetal:   return QObject::tr("Hot Metal");
    }
    return QString();
}

vtkSmartPointer<vtkColorTransferFunction> TF::MakeCTF_Window(double width, double center)
{
    const double lo = center - width / 2.0;
    const double hi = center + width / 2.0;
    return buildCTF(lo, hi, [center](auto* c, double a, double b) {
        c->AddRGBPoint(-1000, 0.0, 0.0, 0.0);
        c->AddRGBPoint(a, 0.0, 0.0, 0.0);
        c->AddRGBPoint(center, 0.5, 0.5, 0.5);
        c->AddRGBPoint(b, 1.0, 1.0, 1.0);
        c->AddRGBPoint(1000, 1.0, 1.0, 1.0);
        });
}

vtkSmartPointer<vtkPiecewiseFunction> TF::MakeOTF_Window(double width, double center, double opacity)
{
    const double lo = center - width / 2.0;
    const double hi = center + width / 2.0;
    return buildOTF(lo, hi, [center, opacity](auto* o, double a, double b) {
        o->AddPoint(-1000, 0.0);
        o->AddPoint(a, 0.0);
        o->AddPoint(center, opacity);
        o->AddPoint(b, opacity);
        o->AddPoint(1000, opacity);
        });
}

void TF::ApplyWindow(vtkVolumeProperty* prop, double width, double center, double opacity)
{
    if (!prop) return;
    prop->SetIndependentComponents(true);
    prop->SetColor(0, MakeCTF_Window(width, center));
    prop->SetScalarOpacity(0, MakeOTF_Window(width, center, opacity));
    prop->Modified();
}

void TF::ApplyPreset(vtkVolumeProperty* prop, TFPreset preset, double min, double max,
    double width, double center, double opacity)
{
    if (!prop) return;
    fixRange(min, max);

    if (preset == TFPreset::Window) { ApplyWindow(prop, width, center, opacity); return; }

    auto ctf = MakeCTF(preset, min, max);
    auto otf = MakeOTF(preset, min, max);

    // Обязательно компонент 0
    prop->SetIndependentComponents(true);
    prop->SetColor(0, ctf);
    prop->SetScalarOpacity(0, otf);
    prop->Modified();
}

void TF::ScaleOpacity(vtkVolumeProperty* prop, vtkPiecewiseFunction* base, double factor)
{
    if (!prop || !base) return;
    factor = std::clamp(factor, 0.0, 1.0);

    auto o = vtkSmartPointer<vtkPiecewiseFunction>::New();
    for (int i = 0, n = base->GetSize(); i < n; ++i) {
        double v[4]; base->GetNodeValue(i, v); // x, y, mid, sharp
        o->AddPoint(v[0], v[1] * factor, v[2], v[3]);
    }
    prop->SetScalarOpacity(0, o);
    prop->Modified();
}

// -------------------- PRESETS --------------------
// Точки пресета в долях интервала [lo, hi]: цвет и непрозрачность
namespace {

    struct Stop { double t; double r, g, b; double a; };

    const std::vector<Stop>& stopsFor(TFPreset preset)
    {
        static const std::vector<Stop> gray = {
            { 0.00, 0.00, 0.00, 0.00, 0.00 },
            { 0.30, 0.30, 0.30, 0.30, 0.15 },
            { 1.00, 1.00, 1.00, 1.00, 0.80 } };
        static const std::vector<Stop> rainbow = {
            { 0.00, 0.00, 0.00, 0.50, 0.00 },
            { 0.20, 0.00, 0.00, 1.00, 0.05 },
            { 0.40, 0.00, 1.00, 1.00, 0.20 },
            { 0.60, 1.00, 1.00, 0.00, 0.40 },
            { 0.80, 1.00, 0.00, 0.00, 0.60 },
            { 1.00, 0.50, 0.00, 0.00, 0.80 } };
        static const std::vector<Stop> hot = {
            { 0.00, 0.00, 0.00, 0.00, 0.00 },
            { 0.40, 0.90, 0.00, 0.00, 0.15 },
            { 0.70, 1.00, 0.60, 0.00, 0.50 },
            { 1.00, 1.00, 1.00, 1.00, 0.90 } };
        // КТ-окна, см. PresetWindow
        static const std::vector<Stop> bone = {
            { 0.00, 0.00, 0.00, 0.00, 0.00 },
            { 0.28, 0.30, 0.25, 0.20, 0.00 },   // вода
            { 0.42, 0.80, 0.75, 0.65, 0.10 },
            { 0.70, 0.95, 0.93, 0.88, 0.50 },
            { 1.00, 1.00, 1.00, 1.00, 0.70 } };
        static const std::vector<Stop> angio = {
            { 0.00, 0.00, 0.00, 0.00, 0.00 },
            { 0.30, 0.55, 0.15, 0.10, 0.02 },
            { 0.50, 0.90, 0.35, 0.25, 0.25 },   // контраст
            { 0.75, 1.00, 0.85, 0.70, 0.55 },
            { 1.00, 1.00, 1.00, 1.00, 0.70 } };
        static const std::vector<Stop> soft = {
            { 0.00, 0.00, 0.00, 0.00, 0.00 },
            { 0.25, 0.55, 0.35, 0.25, 0.03 },   // жир
            { 0.50, 0.85, 0.60, 0.50, 0.15 },
            { 0.75, 0.95, 0.80, 0.70, 0.35 },
            { 1.00, 1.00, 1.00, 0.95, 0.60 } };
        static const std::vector<Stop> lungs = {
            { 0.00, 0.00, 0.00, 0.00, 0.00 },
            { 0.20, 0.00, 0.00, 0.00, 0.00 },   // воздух
            { 0.35, 0.25, 0.30, 0.40, 0.04 },
            { 0.55, 0.50, 0.55, 0.60, 0.12 },   // паренхима
            { 0.85, 0.80, 0.75, 0.70, 0.30 },
            { 1.00, 1.00, 1.00, 1.00, 0.50 } };

        switch (preset) {
        case TFPreset::Rainbow:    return rainbow;
        case TFPreset::HotMetal:   return hot;
        case TFPreset::Bone:       return bone;
        case TFPreset::Angio:      return angio;
        case TFPreset::SoftTissue: return soft;
        case TFPreset::Lungs:      return lungs;
        case TFPreset::Window:
        case TFPreset::Grayscale:  break;
        }
        return gray;
    }

    // КТ-пресеты работают в своём окне, остальные по диапазону данных
    void presetInterval(TFPreset preset, double min, double max, double& lo, double& hi)
    {
        double w = 0.0, c = 0.0;
        if (TF::PresetWindow(preset, w, c)) {
            lo = c - w / 2.0;
            hi = c + w / 2.0;
            return;
        }
        fixRange(min, max);
        lo = min;
        hi = max;
    }

} // namespace

bool TF::PresetWindow(TFPreset preset, double& width, double& center)
{
    switch (preset) {
    case TFPreset::Bone:       width = 1800.0; center = 400.0;  return true;
    case TFPreset::Angio:      width = 600.0;  center = 170.0;  return true;
    case TFPreset::SoftTissue: width = 400.0;  center = 40.0;   return true;
    case TFPreset::Lungs:      width = 1500.0; center = -600.0; return true;
    default: break;
    }
    return false;
}

vtkSmartPointer<vtkColorTransferFunction> TF::MakeCTF(TFPreset preset, double min, double max)
{
    if (preset == TFPreset::Window) {
        fixRange(min, max);
        return MakeCTF_Window(max - min, (min + max) / 2.0);
    }
    double lo = 0.0, hi = 1.0;
    presetInterval(preset, min, max, lo, hi);
    return buildCTF(lo, hi, [preset](auto* c, double a, double b) {
        for (const Stop& s : stopsFor(preset))
            c->AddRGBPoint(Lerp(a, b, s.t), s.r, s.g, s.b);
        });
}

vtkSmartPointer<vtkPiecewiseFunction> TF::MakeOTF(TFPreset preset, double min, double max)
{
    if (preset == TFPreset::Window) {
        fixRange(min, max);
        return MakeOTF_Window(max - min, (min + max) / 2.0, 1.0);
    }
    double lo = 0.0, hi = 1.0;
    presetInterval(preset, min, max, lo, hi);
    return buildOTF(lo, hi, [preset](auto* o, double a, double b) {
        for (const Stop& s : stopsFor(preset))
            o->AddPoint(Lerp(a, b, s.t), s.a);
        });
}
