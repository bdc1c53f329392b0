#include <gtest/gtest.h>
#include <Window/Render/Annotation.h>
#include <Window/Render/ClipBoxController.h>
#include <Window/Render/Interaction.h>
#include <Window/Render/Visualization.h>

#include <vtkActor.h>
#include <vtkActor2DCollection.h>
#include <vtkActorCollection.h>
#include <vtkCommand.h>
#include <vtkCoordinate.h>
#include <vtkCubeAxesActor.h>
#include <vtkCubeSource.h>
#include <vtkInteractorStyleJoystickCamera.h>
#include <vtkLight.h>
#include <vtkLightCollection.h>
#include <vtkPlane.h>
#include <vtkPlaneCollection.h>
#include <vtkPolyDataMapper.h>
#include <vtkProperty.h>
#include <vtkRenderWindow.h>
#include <vtkRenderWindowInteractor.h>
#include <vtkRenderer.h>
#include <vtkTextActor.h>
#include <vtkTextProperty.h>

namespace
{
    vtkSmartPointer<vtkActor> makeCube(double size)
    {
        auto src = vtkSmartPointer<vtkCubeSource>::New();
        src->SetXLength(size);
        src->SetYLength(size);
        src->SetZLength(size);
        src->Update();

        auto mapper = vtkSmartPointer<vtkPolyDataMapper>::New();
        mapper->SetInputConnection(src->GetOutputPort());

        auto actor = vtkSmartPointer<vtkActor>::New();
        actor->SetMapper(mapper);
        return actor;
    }
}

TEST(Annotation, DistanceAndFormatting)
{
    const double a[3]{ 0.0, 0.0, 0.0 };
    const double b[3]{ 3.0, 4.0, 0.0 };
    EXPECT_DOUBLE_EQ(Annotation::MeasureDistance(a, b), 5.0);
    EXPECT_EQ(Annotation::FormatDistance(5.0), "Distance: 5.00 mm");
    EXPECT_EQ(Annotation::FormatPoint(b), "(3.00, 4.00, 0.00)");
}

TEST(Annotation, LabelSitsAtWorldPoint)
{
    const double p[3]{ 1.5, -2.0, 7.25 };
    auto label = Annotation::CreateAnnotation(p);
    ASSERT_TRUE(label);
    EXPECT_STREQ(label->GetInput(), "(1.50, -2.00, 7.25)");
    EXPECT_EQ(label->GetPositionCoordinate()->GetCoordinateSystem(), VTK_WORLD);
    EXPECT_DOUBLE_EQ(label->GetPositionCoordinate()->GetValue()[2], 7.25);
    EXPECT_EQ(label->GetTextProperty()->GetFontSize(), 20);

    auto named = Annotation::CreateAnnotation(p, "lesion");
    EXPECT_STREQ(named->GetInput(), "lesion");
}

TEST(Visualization, ParameterValidation)
{
    QString err;
    EXPECT_FALSE(Visualization::AddAxes(nullptr, { 1.0, 1.0, 1.0 }, 1.5, &err));
    EXPECT_EQ(err, "Axes size must be in (0, 1]");
    EXPECT_FALSE(Visualization::AddAxes(nullptr, { 1.0, -1.0, 1.0 }, 0.2, &err));
    EXPECT_EQ(err, "Color values must be between 0 and 1");
    EXPECT_FALSE(Visualization::AddAxes(nullptr, { 1.0, 1.0, 1.0 }, 0.2, &err));
    EXPECT_EQ(err, "No interactor");

    auto ren = vtkSmartPointer<vtkRenderer>::New();
    const double pos[3]{ 1.0, 1.0, 1.0 };
    EXPECT_FALSE(Visualization::AddLighting(ren, pos, 1.2, 0.3, &err));
    EXPECT_EQ(err, "Light intensity must be between 0 and 1");
    EXPECT_FALSE(Visualization::AddLighting(ren, pos, 1.0, -0.1, &err));
    EXPECT_EQ(err, "Ambient must be between 0 and 1");

    EXPECT_FALSE(Visualization::AddTextOverlay(ren, "x", 1.2, 0.5, { 1.0, 1.0, 1.0 }, 14, &err));
    EXPECT_EQ(err, "Text position must be between 0 and 1");
    EXPECT_FALSE(Visualization::AddTextOverlay(ren, "x", 0.5, 0.5, { 1.0, 1.0, 1.0 }, 0, &err));
    EXPECT_EQ(err, "Font size must be positive");

    EXPECT_FALSE(Visualization::SetBackground(ren, { 0.0, 0.0, 3.0 }, &err));
    EXPECT_TRUE(Visualization::SetBackground(ren, { 0.1, 0.2, 0.3 }, &err));
    EXPECT_DOUBLE_EQ(ren->GetBackground()[2], 0.3);
}

TEST(Visualization, BoundingBoxNeedsContent)
{
    auto ren = vtkSmartPointer<vtkRenderer>::New();
    QString err;
    EXPECT_FALSE(Visualization::AddBoundingBox(ren, { 0.8, 0.8, 0.8 }, false, &err));
    EXPECT_EQ(err, "Nothing in the scene to bound");

    ren->AddActor(makeCube(2.0));
    auto box = Visualization::AddBoundingBox(ren, { 0.8, 0.8, 0.8 }, true, &err);
    ASSERT_TRUE(box) << err.toStdString();
    const double* b = box->GetBounds();
    EXPECT_DOUBLE_EQ(b[0], -1.0);
    EXPECT_DOUBLE_EQ(b[5], 1.0);
    EXPECT_TRUE(box->GetDrawXGridlines());
    EXPECT_EQ(ren->GetActors()->GetNumberOfItems(), 2);
}

TEST(Visualization, LightingSetsAmbientOnActors)
{
    auto ren = vtkSmartPointer<vtkRenderer>::New();
    auto cube = makeCube(1.0);
    ren->AddActor(cube);

    const double pos[3]{ 5.0, 5.0, 5.0 };
    QString err;
    auto light = Visualization::AddLighting(ren, pos, 0.8, 0.4, &err);
    ASSERT_TRUE(light) << err.toStdString();
    EXPECT_DOUBLE_EQ(light->GetIntensity(), 0.8);
    EXPECT_EQ(ren->GetLights()->GetNumberOfItems(), 1);
    EXPECT_DOUBLE_EQ(cube->GetProperty()->GetAmbient(), 0.4);
}

TEST(Visualization, TextOverlayUsesNormalizedViewport)
{
    auto ren = vtkSmartPointer<vtkRenderer>::New();
    QString err;
    auto text = Visualization::AddTextOverlay(ren, "Possible Tumor", 0.02, 0.95, { 1.0, 0.0, 0.0 }, 18, &err);
    ASSERT_TRUE(text) << err.toStdString();
    EXPECT_EQ(text->GetPositionCoordinate()->GetCoordinateSystem(), VTK_NORMALIZED_VIEWPORT);
    EXPECT_DOUBLE_EQ(text->GetPositionCoordinate()->GetValue()[1], 0.95);
    EXPECT_EQ(text->GetTextProperty()->GetFontSize(), 18);
    EXPECT_EQ(ren->GetActors2D()->GetNumberOfItems(), 1);
}

TEST(Visualization, SaveViewRejectsUnknownFormat)
{
    QString err;
    EXPECT_FALSE(Visualization::SaveView(nullptr, "/tmp/view.png", &err));
    EXPECT_EQ(err, "No render window");

    auto win = vtkSmartPointer<vtkRenderWindow>::New();
    EXPECT_FALSE(Visualization::SaveView(win, "/tmp/view.bmp", &err));
    EXPECT_EQ(err, "Unsupported image format: .bmp (use png or jpg)");
}

TEST(Interaction, InteractionStyles)
{
    auto iren = vtkSmartPointer<vtkRenderWindowInteractor>::New();
    QString err;

    ASSERT_TRUE(Interaction::SetInteractionStyle(iren, "Joystick", &err));
    EXPECT_TRUE(vtkInteractorStyleJoystickCamera::SafeDownCast(iren->GetInteractorStyle()));

    EXPECT_FALSE(Interaction::SetInteractionStyle(iren, "orbit", &err));
    EXPECT_TRUE(err.startsWith("Unknown interaction style: orbit"));

    EXPECT_FALSE(Interaction::SetInteractionStyle(nullptr, "image", &err));
    EXPECT_EQ(err, "No interactor");

    EXPECT_EQ(Interaction::StyleNames().size(), 4);
}

TEST(Interaction, PlaneConstruction)
{
    QString err;
    auto planes = Interaction::MakePlanes({}, {}, &err);
    ASSERT_TRUE(planes);
    EXPECT_EQ(planes->GetNumberOfItems(), 3);

    using V = Interaction::Vec3;
    planes = Interaction::MakePlanes({ V{ 1.0, 2.0, 3.0 } }, { V{ 0.0, 0.0, 1.0 }, V{ 0.0, 1.0, 0.0 } }, &err);
    ASSERT_TRUE(planes);
    EXPECT_DOUBLE_EQ(planes->GetItem(1)->GetOrigin()[1], 2.0);

    EXPECT_FALSE(Interaction::MakePlanes({ V{}, V{} }, { V{ 1, 0, 0 }, V{ 0, 1, 0 }, V{ 0, 0, 1 } }, &err));
    EXPECT_EQ(err, "Number of origins (2) must be 1 or match number of normals (3)");

    EXPECT_FALSE(Interaction::MakePlanes({}, { V{ 1, 0, 0 }, V{ 0, 0, 0 } }, &err));
    EXPECT_EQ(err, "Normal 1 is zero");
}

TEST(Interaction, ClippingPlanesOnActorMapper)
{
    auto cube = makeCube(1.0);
    QString err;
    ASSERT_TRUE(Interaction::AddClippingPlanes(cube, {}, {}, &err)) << err.toStdString();
    EXPECT_EQ(cube->GetMapper()->GetClippingPlanes()->GetNumberOfItems(), 3);

    Interaction::RemoveClippingPlanes(cube);
    EXPECT_EQ(cube->GetMapper()->GetClippingPlanes()->GetNumberOfItems(), 0);

    auto bare = vtkSmartPointer<vtkActor>::New();
    EXPECT_FALSE(Interaction::AddClippingPlanes(bare, {}, {}, &err));
    EXPECT_EQ(err, "Clipping needs an actor or volume with a mapper");
}

TEST(Interaction, PickingObserver)
{
    auto iren = vtkSmartPointer<vtkRenderWindowInteractor>::New();
    auto ren = vtkSmartPointer<vtkRenderer>::New();

    EXPECT_EQ(Interaction::AddPicking(nullptr, ren, {}), 0u);
    const unsigned long tag = Interaction::AddPicking(iren, ren, [](const double*, vtkProp*, long long) {});
    EXPECT_NE(tag, 0u);
    EXPECT_TRUE(iren->GetCommand(tag));
    iren->RemoveObserver(tag);
    EXPECT_FALSE(iren->GetCommand(tag));
}

TEST(ClipBox, PlanesFollowTargetBounds)
{
    auto ren = vtkSmartPointer<vtkRenderer>::New();
    auto cube = makeCube(2.0);
    ren->AddActor(cube);

    ClipBoxController clip;
    clip.setRenderer(ren);
    clip.attach(cube);
    EXPECT_EQ(clip.target(), cube.GetPointer());

    auto planes = clip.currentPlanes();
    ASSERT_EQ(planes->GetNumberOfItems(), 6);
    const double center[3]{ 0.0, 0.0, 0.0 };
    for (int i = 0; i < 6; ++i)
    {
        vtkPlane* p = planes->GetItem(i);
        // нормали внутрь: центр на положительной стороне, на расстоянии 1
        EXPECT_NEAR(p->EvaluateFunction(const_cast<double*>(center)), 1.0, 1e-9);
    }

    // без интерактора включить нельзя, плоскости на мэппер не ставятся
    clip.setEnabled(true);
    EXPECT_FALSE(clip.isEnabled());
    EXPECT_TRUE(!cube->GetMapper()->GetClippingPlanes()
        || cube->GetMapper()->GetClippingPlanes()->GetNumberOfItems() == 0);
}
