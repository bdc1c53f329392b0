#pragma once
// TransferFunction.h
// Пресеты цветовой/прозрачностной передаточной функции для VTK.

#include <functional>
#include <vtkSmartPointer.h>
#include <QString>

class QWidget;
class QMenu;
class vtkVolumeProperty;
class vtkColorTransferFunction;
class vtkPiecewiseFunction;

enum class TFPreset {
    Window,        // окно/уровень по текущим width/center
    Grayscale,
    Rainbow,
    Bone,
    Angio,
    SoftTissue,
    Lungs,
    HotMetal
};

namespace TF {
    QMenu* CreateMenu(QWidget* parent, std::function<void(TFPreset)> onChosen);
    QString PresetName(TFPreset preset);

    // Окно: CTF -1000 -> 0, c-w/2 -> 0, c -> 0.5, c+w/2 -> 1, 1000 -> 1 (серый),
    //       OTF -1000 -> 0, c-w/2 -> 0, c..1000 -> opacity.
    vtkSmartPointer<vtkColorTransferFunction> MakeCTF_Window(double width, double center);
    vtkSmartPointer<vtkPiecewiseFunction>     MakeOTF_Window(double width, double center, double opacity);
    void ApplyWindow(vtkVolumeProperty* prop, double width, double center, double opacity);

    // Пресет в компонент 0; Window берёт width/center/opacity
    void ApplyPreset(vtkVolumeProperty* prop, TFPreset preset, double min, double max,
        double width = 400.0, double center = 40.0, double opacity = 1.0);

    // Множитель прозрачности поверх текущей OTF
    void ScaleOpacity(vtkVolumeProperty* prop, vtkPiecewiseFunction* base, double factor);

    // КТ-окно (HU) пресета: Bone, Angio, SoftTissue, Lungs; false для остальных
    bool PresetWindow(TFPreset preset, double& width, double& center);

    // Палитровые пресеты растягиваются на [min, max], КТ-пресеты - на своё окно
    vtkSmartPointer<vtkColorTransferFunction> MakeCTF(TFPreset preset, double min, double max);
    vtkSmartPointer<vtkPiecewiseFunction>     MakeOTF(TFPreset preset, double min, double max);
}
