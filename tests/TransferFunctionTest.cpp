#include <gtest/gtest.h>
#include <Window/Render/TransferFunction.h>

#include <vtkColorTransferFunction.h>
#include <vtkPiecewiseFunction.h>
#include <vtkVolumeProperty.h>

TEST(TransferFunction, WindowMapsCenterToMidGray)
{
    auto ctf = TF::MakeCTF_Window(400.0, 40.0);
    double rgb[3];
    ctf->GetColor(40.0, rgb);
    EXPECT_NEAR(rgb[0], 0.5, 1e-6);
    ctf->GetColor(-160.0, rgb);
    EXPECT_NEAR(rgb[0], 0.0, 1e-6);
    ctf->GetColor(240.0, rgb);
    EXPECT_NEAR(rgb[0], 1.0, 1e-6);

    auto otf = TF::MakeOTF_Window(400.0, 40.0, 0.7);
    EXPECT_NEAR(otf->GetValue(-500.0), 0.0, 1e-6);
    EXPECT_NEAR(otf->GetValue(100.0), 0.7, 1e-6);
}

TEST(TransferFunction, ApplyPresetReplacesComponentZero)
{
    auto prop = vtkSmartPointer<vtkVolumeProperty>::New();
    TF::ApplyPreset(prop, TFPreset::Grayscale, 0.0, 1000.0);

    double rgb[3];
    prop->GetRGBTransferFunction(0)->GetColor(1000.0, rgb);
    EXPECT_NEAR(rgb[0], 1.0, 1e-6);
    EXPECT_NEAR(prop->GetScalarOpacity(0)->GetValue(1000.0), 0.8, 1e-6);

    TF::ApplyPreset(prop, TFPreset::Window, 0.0, 1000.0, 200.0, 100.0, 1.0);
    prop->GetRGBTransferFunction(0)->GetColor(100.0, rgb);
    EXPECT_NEAR(rgb[0], 0.5, 1e-6);
}

TEST(TransferFunction, ScaleOpacityMultipliesBaseCurve)
{
    auto prop = vtkSmartPointer<vtkVolumeProperty>::New();
    auto base = TF::MakeOTF_Window(400.0, 40.0, 1.0);

    TF::ScaleOpacity(prop, base, 0.25);
    EXPECT_NEAR(prop->GetScalarOpacity(0)->GetValue(500.0), 0.25, 1e-6);

    // множитель обрезается до 1, базовая кривая не меняется
    TF::ScaleOpacity(prop, base, 3.0);
    EXPECT_NEAR(prop->GetScalarOpacity(0)->GetValue(500.0), 1.0, 1e-6);
    EXPECT_NEAR(base->GetValue(500.0), 1.0, 1e-6);
}

TEST(TransferFunction, PresetNames)
{
    EXPECT_EQ(TF::PresetName(TFPreset::Bone), "Bone");
    EXPECT_EQ(TF::PresetName(TFPreset::HotMetal), "Hot Metal");
}

TEST(TransferFunction, CtPresetsUseClinicalWindows)
{
    double w = 0.0, c = 0.0;
    ASSERT_TRUE(TF::PresetWindow(TFPreset::SoftTissue, w, c));
    EXPECT_DOUBLE_EQ(w, 400.0);
    EXPECT_DOUBLE_EQ(c, 40.0);
    ASSERT_TRUE(TF::PresetWindow(TFPreset::Lungs, w, c));
    EXPECT_DOUBLE_EQ(c, -600.0);
    EXPECT_FALSE(TF::PresetWindow(TFPreset::Rainbow, w, c));
    EXPECT_FALSE(TF::PresetWindow(TFPreset::Window, w, c));

    // окно Bone [-500, 1300] не зависит от диапазона данных
    for (double hi : { 100.0, 4000.0 })
    {
        auto otf = TF::MakeOTF(TFPreset::Bone, -1024.0, hi);
        EXPECT_NEAR(otf->GetValue(-500.0), 0.0, 1e-6);
        EXPECT_NEAR(otf->GetValue(1300.0), 0.7, 1e-6);
    }

    // воздух в лёгочном окне прозрачен
    auto lungs = TF::MakeOTF(TFPreset::Lungs, -1024.0, 3000.0);
    EXPECT_NEAR(lungs->GetValue(-1050.0), 0.0, 1e-6);
    EXPECT_NEAR(lungs->GetValue(150.0), 0.5, 1e-6);
}

TEST(TransferFunction, PalettePresetsStretchOverDataRange)
{
    auto prop = vtkSmartPointer<vtkVolumeProperty>::New();
    TF::ApplyPreset(prop, TFPreset::HotMetal, 10.0, 510.0);

    double rgb[3];
    prop->GetRGBTransferFunction(0)->GetColor(510.0, rgb);
    EXPECT_NEAR(rgb[0], 1.0, 1e-6);
    EXPECT_NEAR(rgb[2], 1.0, 1e-6);
    EXPECT_NEAR(prop->GetScalarOpacity(0)->GetValue(510.0), 0.9, 1e-6);
    EXPECT_NEAR(prop->GetScalarOpacity(0)->GetValue(10.0), 0.0, 1e-6);

    // пустой диапазон не схлопывает точки
    auto ctf = TF::MakeCTF(TFPreset::Grayscale, 5.0, 5.0);
    EXPECT_EQ(ctf->GetSize(), 3);
}
