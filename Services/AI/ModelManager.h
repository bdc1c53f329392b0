#pragma once
#include <QString>
#include <QStringList>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

class vtkImageData;

namespace Ort { struct Session; }

struct Tensor
{
    std::vector<float>   data;
    std::vector<int64_t> shape;
};

// Модель с одним входом и одним выходом float
class InferenceModel
{
public:
    virtual ~InferenceModel() = default;

    virtual QString name() const = 0;
    virtual std::vector<int64_t> inputShape() const = 0;    // -1 для динамических осей
    virtual std::vector<int64_t> outputShape() const = 0;
    virtual bool run(const std::vector<float>& input, Tensor& output, QString* error = nullptr) = 0;

    // Сторона квадратного входа; динамическая -> 128
    int inputSize() const;
};

class OnnxModel : public InferenceModel
{
public:
    ~OnnxModel() override;

    static std::unique_ptr<OnnxModel> load(const QString& path, QString* error = nullptr);

    QString name() const override { return mName; }
    std::vector<int64_t> inputShape() const override { return mInputShape; }
    std::vector<int64_t> outputShape() const override { return mOutputShape; }
    bool run(const std::vector<float>& input, Tensor& output, QString* error = nullptr) override;

private:
    OnnxModel();

    QString mName;
    std::unique_ptr<Ort::Session> mSession;
    std::string mInputName;
    std::string mOutputName;
    std::vector<int64_t> mInputShape;
    std::vector<int64_t> mOutputShape;
};

struct PredictionResult
{
    QString model;
    double  confidence = 0.0;
    double  threshold = 0.0;
    bool    positive = false;

    QString prediction() const { return positive ? "positive" : "negative"; }
};

class ModelManager
{
public:
    explicit ModelManager(double threshold = 0.8);

    // Все *.onnx каталога, ключ - имя файла без расширения. Возвращает число загруженных.
    int  loadModels(const QString& dir);
    void addModel(std::unique_ptr<InferenceModel> model);

    bool hasModel(const QString& name) const;
    QStringList modelNames() const;
    InferenceModel* model(const QString& name) const;

    double threshold() const { return mThreshold; }
    void   setThreshold(double t) { mThreshold = t; }

    // Срез -> вход модели -> выход как есть
    bool infer(const QString& name, vtkImageData* image, Tensor& out, QString* error = nullptr);

    // confidence = output[0], positive при confidence > threshold
    bool predict(const QString& name, vtkImageData* image, PredictionResult& out, QString* error = nullptr);

    // Метки 0/1 по порогу 0.5
    bool predictBatch(const QString& name, const std::vector<vtkImageData*>& images,
        std::vector<int>& labels, QString* error = nullptr);

private:
    std::map<QString, std::unique_ptr<InferenceModel>> mModels;
    double mThreshold;
};
