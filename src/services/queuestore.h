/**
 * @file queuestore.h
 * @brief Durable storage for the queue document.
 */

#ifndef QUEUESTORE_H
#define QUEUESTORE_H

#include <QString>

#include "models/queuedocument.h"
#include "models/queueerror.h"

/**
 * @brief Reads and atomically writes the queue document.
 *
 * QueueStore does no locking of its own. Callers run every
 * load/transform/save sequence inside QueueGate::withExclusiveLock().
 *
 * A missing file loads as an empty document. A file that cannot be read or
 * does not contain a JSON object fails with QueueError::StoreUnavailable.
 * save() goes through QSaveFile, so readers see either the old or the new
 * document and never a partial one.
 */
class QueueStore
{
public:
    explicit QueueStore(const QString &filePath);

    [[nodiscard]] const QString &filePath() const { return filePath_; }

    /**
     * @brief Loads the document.
     * @param doc Receives the document on success.
     * @return True on success (including "file does not exist yet").
     */
    bool load(QueueDocument &doc);

    /**
     * @brief Atomically replaces the stored document.
     * @return True if the new document was committed.
     */
    bool save(const QueueDocument &doc);

    /**
     * @brief Prepares the store for first use by this process.
     *
     * Writes an empty document when none exists. A corrupt document is
     * moved aside (suffix ".corrupt-<timestamp>") and replaced by an empty
     * one. Must be called inside the gate.
     *
     * @return True if a readable document is in place afterwards.
     */
    bool initialize();

    /// @return Path of the last quarantined corrupt file, empty if none.
    [[nodiscard]] QString quarantinedPath() const { return quarantinedPath_; }

    [[nodiscard]] QueueError error() const { return error_; }
    [[nodiscard]] QString errorString() const { return errorString_; }

private:
    void setError(QueueError error, const QString &message);
    void clearError();

    QString filePath_;
    QString quarantinedPath_;
    QueueError error_ = QueueError::None;
    QString errorString_;
};

#endif // QUEUESTORE_H
