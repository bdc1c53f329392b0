#include "ModelManager.h"
#include "Preprocessing.h"
#include <Services/LogCategories.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <onnxruntime_cxx_api.h>

#include <algorithm>
#include <numeric>
#include <thread>

namespace
{
    template <typename T>
    T fail(QString* error, const QString& msg, T value)
    {
        qCWarning(lcAi).noquote() << msg;
        if (error) *error = msg;
        return value;
    }

    constexpr int kDefaultInputSize = 128;

    Ort::Env& ortEnv()
    {
        static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "medview3d");
        return env;
    }

    QString shapeText(const std::vector<int64_t>& shape)
    {
        QStringList parts;
        for (int64_t d : shape)
            parts << (d < 0 ? QString("dynamic") : QString::number(d));
        return parts.join('x');
    }
}

int InferenceModel::inputSize() const
{
    // [N,H,W,C] / [N,C,H,W]: первая ось > 1 после батча
    const auto shape = inputShape();
    for (size_t i = 1; i < shape.size(); ++i)
        if (shape[i] > 1)
            return static_cast<int>(shape[i]);
    return kDefaultInputSize;
}

OnnxModel::OnnxModel() = default;
OnnxModel::~OnnxModel() = default;

std::unique_ptr<OnnxModel> OnnxModel::load(const QString& path, QString* error)
{
    if (!QFileInfo::exists(path))
        return fail(error, QString("Model file not found: %1").arg(path), std::unique_ptr<OnnxModel>());

    std::unique_ptr<OnnxModel> m(new OnnxModel);
    m->mName = QFileInfo(path).completeBaseName();

    try
    {
        Ort::SessionOptions opts;
        opts.SetIntraOpNumThreads(static_cast<int>(std::max(1u, std::thread::hardware_concurrency())));
        opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        const QByteArray native = QFile::encodeName(path);
        m->mSession = std::make_unique<Ort::Session>(ortEnv(), native.constData(), opts);

        if (m->mSession->GetInputCount() != 1 || m->mSession->GetOutputCount() < 1)
            return fail(error, QString("Model %1 must have one input and at least one output").arg(m->mName),
                std::unique_ptr<OnnxModel>());

        Ort::AllocatorWithDefaultOptions allocator;
        m->mInputName = m->mSession->GetInputNameAllocated(0, allocator).get();
        m->mOutputName = m->mSession->GetOutputNameAllocated(0, allocator).get();
        m->mInputShape = m->mSession->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        m->mOutputShape = m->mSession->GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    }
    catch (const Ort::Exception& e)
    {
        qCCritical(lcAi) << "ONNX model load failed:" << path << e.what();
        if (error) *error = QString("Failed to load model %1: %2").arg(path, e.what());
        return nullptr;
    }

    qCInfo(lcAi).noquote() << "Loaded model" << m->mName << "input" << shapeText(m->mInputShape)
                           << "output" << shapeText(m->mOutputShape);
    return m;
}

bool OnnxModel::run(const std::vector<float>& input, Tensor& output, QString* error)
{
    if (!mSession)
        return fail(error, "Model session is not initialized", false);

    // динамические оси: батч 1, остальные по размеру входа
    std::vector<int64_t> shape = mInputShape;
    const int side = inputSize();
    for (size_t i = 0; i < shape.size(); ++i)
        if (shape[i] < 0)
            shape[i] = (i == 0) ? 1 : side;

    const int64_t expected = std::accumulate(shape.begin(), shape.end(), int64_t(1), std::multiplies<int64_t>());
    if (expected != static_cast<int64_t>(input.size()))
        return fail(error, QString("Input size %1 does not match model shape %2")
            .arg(input.size()).arg(shapeText(shape)), false);

    try
    {
        auto mem = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        auto tensor = Ort::Value::CreateTensor<float>(mem, const_cast<float*>(input.data()), input.size(),
            shape.data(), shape.size());

        const char* inNames[] = { mInputName.c_str() };
        const char* outNames[] = { mOutputName.c_str() };
        auto results = mSession->Run(Ort::RunOptions{ nullptr }, inNames, &tensor, 1, outNames, 1);
        if (results.empty() || !results[0].IsTensor())
            return fail(error, QString("Model %1 returned no tensor").arg(mName), false);

        auto info = results[0].GetTensorTypeAndShapeInfo();
        const size_t n = info.GetElementCount();
        const float* data = results[0].GetTensorData<float>();
        output.data.assign(data, data + n);
        output.shape = info.GetShape();
    }
    catch (const Ort::Exception& e)
    {
        qCCritical(lcAi) << "ONNX inference failed:" << mName << e.what();
        if (error) *error = QString("Prediction failed: %1").arg(e.what());
        return false;
    }
    return true;
}

ModelManager::ModelManager(double threshold)
    : mThreshold(threshold)
{
}

int ModelManager::loadModels(const QString& dir)
{
    QDir d(dir);
    if (!d.exists())
    {
        qCWarning(lcAi) << "Models directory not found:" << dir;
        return 0;
    }

    int loaded = 0;
    const QFileInfoList files = d.entryInfoList({ "*.onnx" }, QDir::Files, QDir::Name);
    for (const QFileInfo& fi : files)
    {
        QString err;
        auto m = OnnxModel::load(fi.absoluteFilePath(), &err);
        if (!m)
        {
            qCCritical(lcAi).noquote() << "Skipping model" << fi.fileName() << ":" << err;
            continue;
        }
        addModel(std::move(m));
        ++loaded;
    }
    qCInfo(lcAi) << "Models loaded:" << loaded << "from" << dir;
    return loaded;
}

void ModelManager::addModel(std::unique_ptr<InferenceModel> model)
{
    if (!model) return;
    const QString key = model->name();
    mModels[key] = std::move(model);
}

bool ModelManager::hasModel(const QString& name) const
{
    return mModels.count(name) > 0;
}

QStringList ModelManager::modelNames() const
{
    QStringList names;
    for (const auto& kv : mModels)
        names << kv.first;
    return names;
}

InferenceModel* ModelManager::model(const QString& name) const
{
    auto it = mModels.find(name);
    return it == mModels.end() ? nullptr : it->second.get();
}

bool ModelManager::infer(const QString& name, vtkImageData* image, Tensor& out, QString* error)
{
    InferenceModel* m = model(name);
    if (!m)
        return fail(error, QString("Model not found: %1").arg(name), false);
    if (!image)
        return fail(error, "No image", false);

    std::vector<float> input;
    if (!Preprocessing::ToModelInput(image, m->inputSize(), input, error))
        return false;

    return m->run(input, out, error);
}

bool ModelManager::predict(const QString& name, vtkImageData* image, PredictionResult& out, QString* error)
{
    Tensor t;
    if (!infer(name, image, t, error))
        return false;
    if (t.data.empty())
        return fail(error, QString("Model %1 returned an empty output").arg(name), false);

    out.model = name;
    out.confidence = t.data[0];
    out.threshold = mThreshold;
    out.positive = out.confidence > mThreshold;

    qCDebug(lcAi) << "Prediction" << name << out.confidence << out.prediction();
    return true;
}

bool ModelManager::predictBatch(const QString& name, const std::vector<vtkImageData*>& images,
    std::vector<int>& labels, QString* error)
{
    labels.clear();
    labels.reserve(images.size());
    for (vtkImageData* img : images)
    {
        Tensor t;
        if (!infer(name, img, t, error))
            return false;
        if (t.data.empty())
            return fail(error, QString("Model %1 returned an empty output").arg(name), false);
        labels.push_back(t.data[0] > 0.5f ? 1 : 0);
    }
    return true;
}
