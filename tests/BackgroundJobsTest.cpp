#include <gtest/gtest.h>
#include <Services/BackgroundJobs.h>

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QSemaphore>
#include <QThread>
#include <atomic>
#include <functional>
#include <memory>

namespace
{
    bool waitUntil(const std::function<bool()>& cond, int ms = 5000)
    {
        QElapsedTimer t;
        t.start();
        while (!cond() && t.elapsed() < ms)
        {
            QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
            QThread::msleep(1);
        }
        return cond();
    }
}

TEST(BackgroundJobs, DeliversResultAndClearsBusy)
{
    BackgroundJobs jobs;
    QList<bool> busyLog;
    QObject::connect(&jobs, &BackgroundJobs::busyChanged, [&](bool b) { busyLog << b; });

    int result = 0;
    bool busyInDone = true;
    jobs.run<int>([]() { return 42; }, [&](int v) { result = v; busyInDone = jobs.busy(); });

    EXPECT_TRUE(jobs.busy());
    ASSERT_TRUE(waitUntil([&]() { return result == 42; }));
    EXPECT_FALSE(jobs.busy());
    EXPECT_FALSE(busyInDone);
    EXPECT_EQ(busyLog, (QList<bool>{ true, false }));
}

TEST(BackgroundJobs, StaysBusyUntilLastJobFinishes)
{
    BackgroundJobs jobs;
    QSemaphore gateA, gateB;
    int finished = 0;

    jobs.run<int>([&]() { gateA.acquire(); return 1; }, [&](int) { ++finished; });
    jobs.run<int>([&]() { gateB.acquire(); return 2; }, [&](int) { ++finished; });
    EXPECT_EQ(jobs.pending(), 2);

    gateA.release();
    ASSERT_TRUE(waitUntil([&]() { return finished == 1; }));
    EXPECT_TRUE(jobs.busy());
    EXPECT_EQ(jobs.pending(), 1);

    gateB.release();
    ASSERT_TRUE(waitUntil([&]() { return finished == 2; }));
    EXPECT_FALSE(jobs.busy());
}

TEST(BackgroundJobs, DestructorWaitsForRunningJob)
{
    // сервис живёт дольше задачи: разрушение пула дожидается её
    auto service = std::make_unique<std::atomic<int>>(0);
    std::atomic<bool> started{ false };
    std::atomic<int>* raw = service.get();
    bool doneCalled = false;

    {
        BackgroundJobs jobs;
        jobs.run<int>([raw, &started]() {
            started = true;
            QThread::msleep(100);
            raw->store(7);
            return 0;
            }, [&](int) { doneCalled = true; });
        ASSERT_TRUE(waitUntil([&]() { return started.load(); }));
    }

    EXPECT_EQ(service->load(), 7);
    QCoreApplication::processEvents();
    EXPECT_FALSE(doneCalled);
}

TEST(BackgroundJobs, WaitForDoneDoesNotRunCallbacks)
{
    BackgroundJobs jobs;
    std::atomic<bool> ran{ false };
    bool doneCalled = false;

    jobs.run<int>([&]() { QThread::msleep(20); ran = true; return 0; }, [&](int) { doneCalled = true; });
    jobs.waitForDone();

    EXPECT_TRUE(ran.load());
    EXPECT_FALSE(doneCalled);
    EXPECT_TRUE(jobs.busy());

    ASSERT_TRUE(waitUntil([&]() { return doneCalled; }));
    EXPECT_FALSE(jobs.busy());
}
