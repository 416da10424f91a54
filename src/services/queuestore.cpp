#include "queuestore.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>

QueueStore::QueueStore(const QString &filePath)
    : filePath_(filePath)
{
}

bool QueueStore::load(QueueDocument &doc)
{
    clearError();

    QFile file(filePath_);
    if (!file.exists()) {
        doc = QueueDocument();
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        setError(QueueError::StoreUnavailable,
                 QString("Cannot read %1: %2").arg(filePath_, file.errorString()));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument json = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(QueueError::StoreUnavailable,
                 QString("Malformed queue document %1: %2")
                     .arg(filePath_, parseError.errorString()));
        return false;
    }

    if (!json.isObject()) {
        setError(QueueError::StoreUnavailable,
                 QString("Queue document %1 is not a JSON object").arg(filePath_));
        return false;
    }

    doc = QueueDocument::fromJson(json.object());

    const QStringList duplicates = doc.duplicateIds();
    if (!duplicates.isEmpty()) {
        qWarning() << "QueueStore: job ids present in more than one place:" << duplicates;
    }

    return true;
}

bool QueueStore::save(const QueueDocument &doc)
{
    clearError();

    const QString dirPath = QFileInfo(filePath_).absolutePath();
    if (!QDir().mkpath(dirPath)) {
        setError(QueueError::StoreUnavailable,
                 QString("Cannot create state directory %1").arg(dirPath));
        return false;
    }

    QSaveFile file(filePath_);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(QueueError::StoreUnavailable,
                 QString("Cannot write %1: %2").arg(filePath_, file.errorString()));
        return false;
    }

    const QByteArray bytes = doc.toBytes();
    if (file.write(bytes) != bytes.size()) {
        setError(QueueError::StoreUnavailable,
                 QString("Short write to %1: %2").arg(filePath_, file.errorString()));
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        setError(QueueError::StoreUnavailable,
                 QString("Cannot commit %1: %2").arg(filePath_, file.errorString()));
        return false;
    }

    return true;
}

bool QueueStore::initialize()
{
    QueueDocument doc;
    if (!QFile::exists(filePath_)) {
        qInfo() << "QueueStore: creating empty queue at" << filePath_;
        return save(doc);
    }

    if (load(doc)) {
        return true;
    }

    // Unreadable at first use: keep the broken file for inspection and start over
    const QString stamp = QDateTime::currentDateTime().toString("yyyyMMddhhmmss");
    const QString aside = QString("%1.corrupt-%2").arg(filePath_, stamp);
    qWarning().noquote() << "QueueStore:" << errorString_ << "- moving it to" << aside;

    if (!QFile::rename(filePath_, aside)) {
        setError(QueueError::StoreUnavailable,
                 QString("Cannot move corrupt queue document %1 aside").arg(filePath_));
        return false;
    }

    quarantinedPath_ = aside;
    return save(QueueDocument());
}

void QueueStore::setError(QueueError error, const QString &message)
{
    error_ = error;
    errorString_ = message;
}

void QueueStore::clearError()
{
    error_ = QueueError::None;
    errorString_.clear();
}
