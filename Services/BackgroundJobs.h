#pragma once
#include <QObject>
#include <QFutureWatcher>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrentRun>

// Фоновые задачи окна: свой пул, счётчик незавершённых, ожидание при разрушении.
// done() вызывается в потоке владельца, пока объект жив, после снятия busy.
class BackgroundJobs final : public QObject
{
    Q_OBJECT
public:
    explicit BackgroundJobs(QObject* parent = nullptr);
    ~BackgroundJobs() override;

    int  pending() const { return mPending; }
    bool busy() const { return mPending > 0; }

    // Блокирует до завершения всех задач пула (без вызова done)
    void waitForDone();

    template <typename T, typename Job, typename Done>
    void run(Job job, Done done)
    {
        if (mPending++ == 0)
            emit busyChanged(true);

        auto* w = new QFutureWatcher<T>(this);
        connect(w, &QFutureWatcher<T>::finished, this, [this, w, done]() {
            w->deleteLater();
            finishOne();
            done(w->result());
            });
        w->setFuture(QtConcurrent::run(&mPool, job));
    }

signals:
    void busyChanged(bool busy);

private:
    void finishOne();

    QThreadPool mPool;
    int mPending{ 0 };
};
