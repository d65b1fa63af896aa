#include "PathStore.h"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QDebug>

bool PathStore::append(const InkPath& path)
{
    if (!path.isValid()) {
        return false;
    }
    m_paths.append(path);
    return true;
}

bool PathStore::append(InkPath&& path)
{
    if (!path.isValid()) {
        return false;
    }
    m_paths.append(std::move(path));
    return true;
}

bool PathStore::undo()
{
    if (m_paths.isEmpty()) {
        return false;
    }
    m_paths.removeLast();
    return true;
}

void PathStore::load(const QVector<InkPath>& paths)
{
    m_paths.clear();
    m_paths.reserve(paths.size());
    for (const auto& path : paths) {
        if (path.isValid()) {
            m_paths.append(path);
        }
    }
    if (m_paths.size() != paths.size()) {
        qWarning() << "PathStore: dropped" << paths.size() - m_paths.size()
                   << "paths with fewer than 2 points";
    }
}

QJsonArray PathStore::toJson() const
{
    QJsonArray array;
    for (const auto& path : m_paths) {
        array.append(path.toJson());
    }
    return array;
}

QByteArray PathStore::serialize() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

bool PathStore::deserialize(const QByteArray& data, QVector<InkPath>& paths)
{
    paths.clear();

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "PathStore: JSON parse error" << parseError.errorString();
        return false;
    }
    if (!doc.isArray()) {
        qWarning() << "PathStore: serialized paths are not an array";
        return false;
    }
    return fromJson(doc.array(), paths);
}

bool PathStore::fromJson(const QJsonArray& array, QVector<InkPath>& paths)
{
    paths.clear();
    paths.reserve(array.size());
    for (int i = 0; i < array.size(); ++i) {
        bool ok = false;
        InkPath path = InkPath::fromJson(array[i].toObject(), &ok);
        if (!array[i].isObject() || !ok) {
            qWarning() << "PathStore: path" << i << "is structurally invalid";
            paths.clear();
            return false;
        }
        paths.append(std::move(path));
    }
    return true;
}
