#pragma once
#include <QFile>
#include <QString>
#include <QTextStream>

#include <vtkDICOMCTGenerator.h>
#include <vtkDICOMMetaData.h>
#include <vtkDICOMWriter.h>
#include <vtkImageData.h>
#include <vtkSmartPointer.h>

// Общие генераторы тестовых данных
namespace TestData {

    // Единичный куб [0,1]^3, нормали наружу
    inline QString UnitCubeStl()
    {
        static const int tris[12][3][3] = {
            { {0,0,0}, {0,1,0}, {1,1,0} }, { {0,0,0}, {1,1,0}, {1,0,0} },   // z = 0
            { {0,0,1}, {1,0,1}, {1,1,1} }, { {0,0,1}, {1,1,1}, {0,1,1} },   // z = 1
            { {0,0,0}, {1,0,0}, {1,0,1} }, { {0,0,0}, {1,0,1}, {0,0,1} },   // y = 0
            { {0,1,0}, {0,1,1}, {1,1,1} }, { {0,1,0}, {1,1,1}, {1,1,0} },   // y = 1
            { {0,0,0}, {0,0,1}, {0,1,1} }, { {0,0,0}, {0,1,1}, {0,1,0} },   // x = 0
            { {1,0,0}, {1,1,0}, {1,1,1} }, { {1,0,0}, {1,1,1}, {1,0,1} },   // x = 1
        };

        QString s = "solid cube\n";
        for (const auto& t : tris)
        {
            s += "  facet normal 0 0 0\n    outer loop\n";
            for (const auto& v : t)
                s += QString("      vertex %1 %2 %3\n").arg(v[0]).arg(v[1]).arg(v[2]);
            s += "    endloop\n  endfacet\n";
        }
        s += "endsolid cube\n";
        return s;
    }

    inline bool WriteFile(const QString& path, const QByteArray& data)
    {
        QFile f(path);
        if (!f.open(QIODevice::WriteOnly))
            return false;
        return f.write(data) == data.size();
    }

    // 128 нулей + "DICM"
    inline bool WriteDicomPreamble(const QString& path)
    {
        QByteArray data(128, '\0');
        data += "DICM";
        data += QByteArray(16, '\0');
        return WriteFile(path, data);
    }

    // short-объём; значение вокселя = z * 100 + y * 10 + x
    inline vtkSmartPointer<vtkImageData> MakeVolume(int nx, int ny, int nz)
    {
        auto img = vtkSmartPointer<vtkImageData>::New();
        img->SetDimensions(nx, ny, nz);
        img->SetSpacing(0.5, 0.5, 2.0);
        img->AllocateScalars(VTK_SHORT, 1);
        auto* p = static_cast<short*>(img->GetScalarPointer());
        for (int z = 0; z < nz; ++z)
            for (int y = 0; y < ny; ++y)
                for (int x = 0; x < nx; ++x)
                    *p++ = static_cast<short>(z * 100 + y * 10 + x);
        return img;
    }

    // КТ-серия 8x8xN через vtkDICOMWriter: <dir>/<prefix>-NNNN.dcm, у каждого вызова свой SeriesInstanceUID
    inline bool WriteCtSeries(const QString& dir, const QString& prefix, int slices, const char* patientName)
    {
        auto meta = vtkSmartPointer<vtkDICOMMetaData>::New();
        meta->SetAttributeValue(DC::PatientName, patientName);
        meta->SetAttributeValue(DC::SeriesDescription, prefix.toStdString());

        auto gen = vtkSmartPointer<vtkDICOMCTGenerator>::New();
        auto writer = vtkSmartPointer<vtkDICOMWriter>::New();
        writer->SetInputData(MakeVolume(8, 8, slices));
        writer->SetMetaData(meta);
        writer->SetGenerator(gen);

        const QByteArray native = QFile::encodeName(dir);
        const QByteArray pattern = ("%s/" + prefix + "-%04.4d.dcm").toLatin1();
        writer->SetFilePrefix(native.constData());
        writer->SetFilePattern(pattern.constData());
        writer->Write();
        return writer->GetErrorCode() == 0;
    }

} // namespace TestData
