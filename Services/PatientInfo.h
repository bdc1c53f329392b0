#pragma once
#include <QString>

struct PatientInfo
{
	QString patientName;
	QString patientId;
	QString sex;
	QString birthDate;
	QString Mode;
	QString StudyDescription;
	QString Description;
	QString StudyDate;
	QString Manufacturer;
	QString SeriesNumber;
	QString SliceThickness;

	QString DicomPath;
};
