#include "JsonFileAnnotationStore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QSaveFile>

JsonFileAnnotationStore::JsonFileAnnotationStore(const QString& directory)
    : m_directory(directory)
{
}

QString JsonFileAnnotationStore::filePathForKey(const QString& key) const
{
    // Lowercase hex of the UTF-8 key: keys differing only in case stay
    // distinct on case-insensitive file systems
    const QString fileName = QString::fromLatin1(key.toUtf8().toHex()) + QStringLiteral(".json");
    return QDir(m_directory).filePath(fileName);
}

bool JsonFileAnnotationStore::put(const QString& key, const SurfaceRecord& record)
{
    if (!QDir().mkpath(m_directory)) {
        setLastError(QStringLiteral("Cannot create directory %1").arg(m_directory));
        qWarning() << "JsonFileAnnotationStore:" << lastError();
        return false;
    }

    QSaveFile file(filePathForKey(key));
    if (!file.open(QIODevice::WriteOnly)) {
        setLastError(file.errorString());
        qWarning() << "JsonFileAnnotationStore: Cannot write" << file.fileName() << "-" << lastError();
        return false;
    }

    file.write(QJsonDocument(record.toJson()).toJson(QJsonDocument::Compact));
    if (!file.commit()) {
        setLastError(file.errorString());
        qWarning() << "JsonFileAnnotationStore: Commit failed for" << key << "-" << lastError();
        return false;
    }
    return true;
}

bool JsonFileAnnotationStore::get(const QString& key, SurfaceRecord& record) const
{
    QFile file(filePathForKey(key));
    if (!file.exists()) {
        return false;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "JsonFileAnnotationStore: Cannot read" << file.fileName();
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "JsonFileAnnotationStore: JSON parse error in" << file.fileName()
                   << ":" << parseError.errorString();
        return false;
    }

    bool ok = false;
    SurfaceRecord parsed = SurfaceRecord::fromJson(doc.object(), &ok);
    if (!ok) {
        qWarning() << "JsonFileAnnotationStore: Malformed record in" << file.fileName();
        return false;
    }
    record = parsed;
    return true;
}

bool JsonFileAnnotationStore::remove(const QString& key)
{
    QFile file(filePathForKey(key));
    if (!file.exists()) {
        return true;
    }
    if (!file.remove()) {
        setLastError(file.errorString());
        qWarning() << "JsonFileAnnotationStore: Cannot delete" << file.fileName() << "-" << lastError();
        return false;
    }
    return true;
}

QStringList JsonFileAnnotationStore::keys() const
{
    QStringList result;
    QDir dir(m_directory);
    if (!dir.exists()) {
        return result;
    }

    const QStringList files = dir.entryList({QStringLiteral("*.json")}, QDir::Files, QDir::Name);
    for (const QString& fileName : files) {
        QString encoded = fileName;
        encoded.chop(5);
        const QByteArray key = QByteArray::fromHex(encoded.toLatin1());
        if (key.isEmpty() || key.toHex() != encoded.toLower().toLatin1()) {
            continue;   // Not a record file
        }
        result.append(QString::fromUtf8(key));
    }
    return result;
}
