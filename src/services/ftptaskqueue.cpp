#include "ftptaskqueue.h"

#include "utils/logging.h"

#include <QDebug>
#include <QTimer>

FtpTaskQueue::FtpTaskQueue(QObject *parent)
    : QObject(parent)
{
}

FtpTaskQueue::~FtpTaskQueue()
{
    *alive_ = false;
    if (!tasks_.isEmpty()) {
        qDebug() << "FtpTaskQueue: Dropping" << tasks_.size() << "pending tasks";
    }
}

void FtpTaskQueue::enqueue(const QString &label, Task task)
{
    tasks_.enqueue(Entry{label, std::move(task)});
    LOG_VERBOSE() << "FtpTaskQueue: Queued" << label << "(pending:" << tasks_.size() << ")";

    if (!running_) {
        scheduleProcessNext();
    }
}

void FtpTaskQueue::runQueued(const QString &label,
                             std::function<void(StatusCallback)> operation,
                             StatusCallback callback)
{
    enqueue(label, [operation, callback](const Settle &settle) {
        operation([settle, callback](const FtpError &error) {
            settle();
            if (callback) {
                callback(error);
            }
        });
    });
}

void FtpTaskQueue::scheduleProcessNext()
{
    // Deferred so that a completion callback submitting new work never
    // starts it re-entrantly
    if (processScheduled_) {
        return;
    }
    processScheduled_ = true;
    QTimer::singleShot(0, this, &FtpTaskQueue::processNext);
}

void FtpTaskQueue::processNext()
{
    processScheduled_ = false;

    if (running_) {
        return;
    }
    if (tasks_.isEmpty()) {
        emit idle();
        return;
    }

    Entry entry = tasks_.dequeue();
    running_ = true;
    runningTaskId_ = ++nextTaskId_;
    runningLabel_ = entry.label;
    LOG_VERBOSE() << "FtpTaskQueue: Starting" << entry.label;

    const quint64 taskId = runningTaskId_;
    std::weak_ptr<bool> alive = alive_;
    auto settled = std::make_shared<bool>(false);

    Settle settleOnce = [this, alive, taskId, settled]() {
        if (*settled) {
            qWarning() << "FtpTaskQueue: Task settled more than once, ignoring";
            return;
        }
        *settled = true;
        auto lock = alive.lock();
        if (!lock || !*lock) {
            return;
        }
        settle(taskId);
    };

    entry.task(settleOnce);
}

void FtpTaskQueue::settle(quint64 taskId)
{
    if (!running_ || taskId != runningTaskId_) {
        return;
    }
    LOG_VERBOSE() << "FtpTaskQueue: Finished" << runningLabel_;
    running_ = false;
    runningLabel_.clear();
    scheduleProcessNext();
}
