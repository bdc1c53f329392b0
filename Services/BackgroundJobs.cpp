#include "BackgroundJobs.h"
#include "LogCategories.h"

BackgroundJobs::BackgroundJobs(QObject* parent)
    : QObject(parent)
{
}

BackgroundJobs::~BackgroundJobs()
{
    // задачи держат сырые указатели на сервисы владельца
    if (mPending > 0)
        qCInfo(lcApp) << "Waiting for" << mPending << "background job(s)";
    mPool.waitForDone();
}

void BackgroundJobs::waitForDone()
{
    mPool.waitForDone();
}

void BackgroundJobs::finishOne()
{
    if (--mPending == 0)
        emit busyChanged(false);
}
