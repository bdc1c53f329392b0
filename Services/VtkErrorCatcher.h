#pragma once
#include <vtkCommand.h>
#include <QString>
#include <string>

// Observer for vtkCommand::ErrorEvent: VTK reports reader errors only through events.
class VtkErrorCatcher : public vtkCommand {
public:
    static VtkErrorCatcher* New() { return new VtkErrorCatcher; }
    void Execute(vtkObject*, unsigned long, void* callData) override {
        hasError = true;
        if (callData) message = static_cast<const char*>(callData);
    }
    QString text() const { return QString::fromStdString(message).trimmed(); }

    bool hasError = false;
    std::string message;
};
