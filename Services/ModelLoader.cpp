#include "ModelLoader.h"
#include "FileSniffer.h"
#include "LogCategories.h"
#include "VtkErrorCatcher.h"

#include <QFile>
#include <QFileInfo>

#include <vtkActor.h>
#include <vtkCellArray.h>
#include <vtkMassProperties.h>
#include <vtkOBJReader.h>
#include <vtkPoints.h>
#include <vtkPolyData.h>
#include <vtkPolyDataMapper.h>
#include <vtkProperty.h>
#include <vtkSTLReader.h>
#include <vtkTransform.h>
#include <vtkTransformPolyDataFilter.h>
#include <vtkTriangleFilter.h>

#include <algorithm>
#include <cmath>

namespace
{
    bool fail(QString* error, const QString& msg)
    {
        qCWarning(lcModel).noquote() << msg;
        if (error) *error = msg;
        return false;
    }

    vtkPolyData* mapperInput(vtkActor* actor)
    {
        if (!actor) return nullptr;
        auto* pm = vtkPolyDataMapper::SafeDownCast(actor->GetMapper());
        return pm ? pm->GetInput() : nullptr;
    }

    bool transformMapperInput(vtkActor* actor, vtkTransform* t, QString* error)
    {
        auto* pm = actor ? vtkPolyDataMapper::SafeDownCast(actor->GetMapper()) : nullptr;
        if (!pm || !pm->GetInput())
            return fail(error, "Actor has no polygonal input");

        auto tf = vtkSmartPointer<vtkTransformPolyDataFilter>::New();
        tf->SetInputData(pm->GetInput());
        tf->SetTransform(t);
        tf->Update();

        auto out = vtkSmartPointer<vtkPolyData>::New();
        out->DeepCopy(tf->GetOutput());
        pm->SetInputData(out);
        pm->Modified();
        return true;
    }

    // центр масс поверхности: центроиды треугольников с весом по площади
    std::array<double, 3> surfaceCentroid(vtkPolyData* tri)
    {
        std::array<double, 3> c{ 0.0, 0.0, 0.0 };
        double total = 0.0;

        vtkCellArray* polys = tri->GetPolys();
        if (!polys) return c;

        vtkPoints* pts = tri->GetPoints();
        vtkIdType npts = 0;
        const vtkIdType* ids = nullptr;
        for (polys->InitTraversal(); polys->GetNextCell(npts, ids);)
        {
            if (npts != 3) continue;
            double a[3], b[3], d[3];
            pts->GetPoint(ids[0], a);
            pts->GetPoint(ids[1], b);
            pts->GetPoint(ids[2], d);

            const double u[3]{ b[0] - a[0], b[1] - a[1], b[2] - a[2] };
            const double v[3]{ d[0] - a[0], d[1] - a[1], d[2] - a[2] };
            const double cx = u[1] * v[2] - u[2] * v[1];
            const double cy = u[2] * v[0] - u[0] * v[2];
            const double cz = u[0] * v[1] - u[1] * v[0];
            const double area = 0.5 * std::sqrt(cx * cx + cy * cy + cz * cz);

            for (int k = 0; k < 3; ++k)
                c[k] += area * (a[k] + b[k] + d[k]) / 3.0;
            total += area;
        }

        if (total > 0.0)
            for (double& v : c) v /= total;
        else if (pts && pts->GetNumberOfPoints() > 0)
        {
            double b[6]; tri->GetBounds(b);
            c = { 0.5 * (b[0] + b[1]), 0.5 * (b[2] + b[3]), 0.5 * (b[4] + b[5]) };
        }
        return c;
    }
}

bool ModelLoader::parseShading(const QString& text, Shading& out)
{
    const QString s = text.trimmed().toLower();
    if (s == "flat")    { out = Shading::Flat;    return true; }
    if (s == "gouraud") { out = Shading::Gouraud; return true; }
    if (s == "phong")   { out = Shading::Phong;   return true; }
    return false;
}

bool ModelLoader::validate(const ModelOptions& opt, QString* error)
{
    if (!IsUnitRgb(opt.color))
        return fail(error, "Color values must be between 0 and 1");
    if (!(opt.opacity >= 0.0 && opt.opacity <= 1.0))
        return fail(error, "Opacity must be between 0 and 1");
    Shading sh;
    if (!parseShading(opt.shading, sh))
        return fail(error, QString("Invalid interpolation: %1 (expected flat, gouraud or phong)").arg(opt.shading));
    if (!IsUnitRgb(opt.edgeColor))
        return fail(error, "Edge color values must be between 0 and 1");
    if (!(opt.edgeWidth > 0.0))
        return fail(error, "Edge width must be positive");
    return true;
}

vtkSmartPointer<vtkPolyData> ModelLoader::ReadPolyData(const QString& path, QString* error)
{
    const QFileInfo fi(path);
    if (!fi.exists() || !fi.isFile())
    {
        fail(error, QString("File not found: %1").arg(path));
        return nullptr;
    }

    const QString ext = fi.suffix().toLower();
    auto err = vtkSmartPointer<VtkErrorCatcher>::New();
    const QByteArray native = QFile::encodeName(fi.absoluteFilePath());
    vtkSmartPointer<vtkPolyData> poly;

    if (ext == "stl")
    {
        auto r = vtkSmartPointer<vtkSTLReader>::New();
        r->AddObserver(vtkCommand::ErrorEvent, err);
        r->SetFileName(native.constData());
        r->Update();
        poly = r->GetOutput();
    }
    else if (ext == "obj")
    {
        auto r = vtkSmartPointer<vtkOBJReader>::New();
        r->AddObserver(vtkCommand::ErrorEvent, err);
        r->SetFileName(native.constData());
        r->Update();
        poly = r->GetOutput();
    }
    else
    {
        fail(error, QString("Unsupported file format: .%1").arg(ext));
        return nullptr;
    }

    if (err->hasError)
    {
        fail(error, QString("Failed to read %1: %2").arg(fi.fileName(), err->text()));
        return nullptr;
    }
    if (!poly || poly->GetNumberOfPoints() == 0)
    {
        fail(error, QString("No geometry in %1").arg(fi.fileName()));
        return nullptr;
    }

    qCInfo(lcModel) << "Read" << fi.fileName() << "points" << poly->GetNumberOfPoints()
                    << "cells" << poly->GetNumberOfCells();
    return poly;
}

bool ModelLoader::ApplyOptions(vtkActor* actor, const ModelOptions& opt, QString* error)
{
    if (!actor) return fail(error, "No actor");
    if (!validate(opt, error)) return false;

    Shading sh = Shading::Gouraud;
    parseShading(opt.shading, sh);

    auto* p = actor->GetProperty();
    p->SetColor(opt.color[0], opt.color[1], opt.color[2]);
    p->SetOpacity(opt.opacity);
    switch (sh)
    {
    case Shading::Flat:    p->SetInterpolationToFlat();    break;
    case Shading::Gouraud: p->SetInterpolationToGouraud(); break;
    case Shading::Phong:   p->SetInterpolationToPhong();   break;
    }
    p->SetEdgeVisibility(opt.edgeVisibility ? 1 : 0);
    p->SetEdgeColor(opt.edgeColor[0], opt.edgeColor[1], opt.edgeColor[2]);
    p->SetLineWidth(static_cast<float>(opt.edgeWidth));
    return true;
}

vtkSmartPointer<vtkActor> ModelLoader::Load(const QString& path, const ModelOptions& opt, QString* error)
{
    if (!validate(opt, error))
        return nullptr;

    if (!FileSniffer::isModelFile(path) && QFileInfo::exists(path))
    {
        fail(error, QString("Unsupported file format: %1").arg(path));
        return nullptr;
    }

    auto poly = ReadPolyData(path, error);
    if (!poly)
        return nullptr;

    auto mapper = vtkSmartPointer<vtkPolyDataMapper>::New();
    mapper->SetInputData(poly);

    auto actor = vtkSmartPointer<vtkActor>::New();
    actor->SetMapper(mapper);
    ApplyOptions(actor, opt, error);

    qCInfo(lcModel) << "Loaded model" << path;
    return actor;
}

ModelInfo ModelLoader::GetInfo(vtkPolyData* poly)
{
    ModelInfo info;
    if (!poly) return info;

    poly->GetBounds(info.bounds);
    info.numPoints = poly->GetNumberOfPoints();
    info.numCells = poly->GetNumberOfCells();

    auto tri = vtkSmartPointer<vtkTriangleFilter>::New();
    tri->SetInputData(poly);
    tri->Update();

    if (tri->GetOutput()->GetNumberOfPolys() > 0)
    {
        auto mass = vtkSmartPointer<vtkMassProperties>::New();
        mass->SetInputConnection(tri->GetOutputPort());
        mass->Update();
        info.surfaceArea = mass->GetSurfaceArea();
        info.volume = mass->GetVolume();
    }
    info.centerOfMass = surfaceCentroid(tri->GetOutput());
    return info;
}

bool ModelLoader::GetInfo(const QString& path, ModelInfo& out, QString* error)
{
    auto poly = ReadPolyData(path, error);
    if (!poly) return false;

    out = GetInfo(poly);
    out.filePath = QFileInfo(path).absoluteFilePath();
    out.fileSize = QFileInfo(path).size();
    return true;
}

bool ModelLoader::Center(vtkActor* actor, QString* error)
{
    vtkPolyData* in = mapperInput(actor);
    if (!in) return fail(error, "Actor has no polygonal input");

    double b[6]; in->GetBounds(b);
    auto t = vtkSmartPointer<vtkTransform>::New();
    t->Translate(-0.5 * (b[0] + b[1]), -0.5 * (b[2] + b[3]), -0.5 * (b[4] + b[5]));
    return transformMapperInput(actor, t, error);
}

bool ModelLoader::Normalize(vtkActor* actor, QString* error)
{
    vtkPolyData* in = mapperInput(actor);
    if (!in) return fail(error, "Actor has no polygonal input");

    double b[6]; in->GetBounds(b);
    const double extent = std::max({ b[1] - b[0], b[3] - b[2], b[5] - b[4] });
    if (!(extent > 0.0))
        return fail(error, "Cannot normalize a model with zero extent");

    auto t = vtkSmartPointer<vtkTransform>::New();
    t->Scale(1.0 / extent, 1.0 / extent, 1.0 / extent);
    return transformMapperInput(actor, t, error);
}
