/**
 * @file ftptaskqueue.h
 * @brief Strict FIFO serialization of operations against the shared session.
 */

#ifndef FTPTASKQUEUE_H
#define FTPTASKQUEUE_H

#include <QObject>
#include <QQueue>
#include <QString>

#include <functional>
#include <memory>

#include "ftperror.h"

/**
 * @brief Runs queued operations one at a time in submission order.
 *
 * The FTP control connection carries a single working-directory cursor and
 * allows one command at a time, so every operation that touches the session
 * is submitted here. An operation starts only after every previously
 * submitted operation has settled; a failing operation never blocks those
 * behind it. Each operation's outcome is delivered to its own callback.
 *
 * The next operation is always started from the event loop, never from
 * inside the completion of the previous one.
 *
 * @par Example usage:
 * @code
 * queue->runQueued<qint64>(QStringLiteral("size"),
 *     [session](ResultCallback<qint64> done) { session->size("/a.txt", done); },
 *     [](const FtpResult<qint64> &result) { qDebug() << result.value; });
 * @endcode
 */
class FtpTaskQueue : public QObject
{
    Q_OBJECT

public:
    /// Signals that the running task has settled; further calls are ignored
    using Settle = std::function<void()>;

    /// A unit of work; must eventually call the supplied Settle exactly once
    using Task = std::function<void(Settle settle)>;

    explicit FtpTaskQueue(QObject *parent = nullptr);
    ~FtpTaskQueue() override;

    /**
     * @brief Appends a raw task.
     * @param label Short description used in log output.
     * @param task Work to run once every earlier task settled.
     */
    void enqueue(const QString &label, Task task);

    /**
     * @brief Appends an operation producing FtpResult<T>.
     *
     * @p operation receives a completion callback; when it is called the
     * result is forwarded to @p callback and the queue moves on.
     */
    template <typename T>
    void runQueued(const QString &label,
                   std::function<void(ResultCallback<T>)> operation,
                   ResultCallback<T> callback)
    {
        enqueue(label, [operation, callback](const Settle &settle) {
            operation([settle, callback](const FtpResult<T> &result) {
                settle();
                if (callback) {
                    callback(result);
                }
            });
        });
    }

    /**
     * @brief Appends an operation that only reports success or failure.
     */
    void runQueued(const QString &label,
                   std::function<void(StatusCallback)> operation,
                   StatusCallback callback);

    /// @brief Number of tasks waiting to start (excluding the running one)
    [[nodiscard]] int pendingCount() const { return static_cast<int>(tasks_.size()); }

    /// @brief True while a task is running
    [[nodiscard]] bool isBusy() const { return running_; }

signals:
    /**
     * @brief Emitted when the last task settled and nothing is waiting.
     */
    void idle();

private:
    struct Entry {
        QString label;
        Task task;
    };

    void scheduleProcessNext();
    void processNext();
    void settle(quint64 taskId);

    QQueue<Entry> tasks_;
    bool running_ = false;
    bool processScheduled_ = false;
    quint64 nextTaskId_ = 0;
    quint64 runningTaskId_ = 0;
    QString runningLabel_;

    // Outstanding Settle callbacks must not touch a destroyed queue
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

#endif // FTPTASKQUEUE_H
