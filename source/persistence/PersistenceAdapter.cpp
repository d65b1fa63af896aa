#include "PersistenceAdapter.h"

#include <QDebug>
#include <QJsonArray>

const QString PersistenceAdapter::LIBRARY_TYPE = QStringLiteral("VERSEINK_ANNOTATION_LIBRARY");

PersistenceAdapter::PersistenceAdapter(std::unique_ptr<AnnotationStore> store, QObject* parent)
    : QObject(parent)
    , m_store(std::move(store))
{
    m_drainTimer.setSingleShot(true);
    m_drainTimer.setInterval(0);
    connect(&m_drainTimer, &QTimer::timeout, this, &PersistenceAdapter::drainQueue);
}

PersistenceAdapter::~PersistenceAdapter()
{
    // Unsaved records must not be lost on shutdown
    flush();
}

void PersistenceAdapter::save(const SurfaceKey& key, const QString& canvasData, qreal canvasHeight)
{
    if (!key.isValid()) {
        qWarning() << "PersistenceAdapter: Refusing to save with invalid key";
        return;
    }

    SurfaceRecord record = SurfaceRecord::create(key, canvasData, canvasHeight);

    bool coalesced = false;
    for (SurfaceRecord& pending : m_pending) {
        if (pending.id == record.id) {
            pending = record;
            coalesced = true;
            break;
        }
    }
    if (!coalesced) {
        m_pending.append(record);
    }

    if (!m_drainTimer.isActive()) {
        m_drainTimer.start();
    }
}

bool PersistenceAdapter::load(const SurfaceKey& key, SurfaceRecord& record)
{
    if (!key.isValid()) {
        return false;
    }

    if (readRecord(key.toString(), record)) {
        return true;
    }

    // Records written before panels existed carry no panel discriminator
    if (key.hasPanel()) {
        const QString legacyKey = key.withoutPanel().toString();
        if (readRecord(legacyKey, record)) {
#if VERSEINK_DEBUG
            qDebug() << "PersistenceAdapter: Loaded" << key.toString() << "from legacy key" << legacyKey;
#endif
            return true;
        }
    }
    return false;
}

bool PersistenceAdapter::readRecord(const QString& key, SurfaceRecord& record)
{
    if (!drainKey(key)) {
        qWarning() << "PersistenceAdapter: Reading unsaved version of" << key;
    }

    auto unsaved = m_unsaved.constFind(key);
    if (unsaved != m_unsaved.constEnd()) {
        record = unsaved.value();
        return true;
    }
    return m_store->get(key, record);
}

bool PersistenceAdapter::remove(const SurfaceKey& key)
{
    const QString id = key.toString();
    for (int i = m_pending.size() - 1; i >= 0; --i) {
        if (m_pending[i].id == id) {
            m_pending.removeAt(i);
        }
    }
    m_unsaved.remove(id);

    if (!m_store->remove(id)) {
        qWarning() << "PersistenceAdapter: Failed to delete" << id << "-" << m_store->lastError();
        return false;
    }
    return true;
}

bool PersistenceAdapter::flush()
{
    m_drainTimer.stop();

    // Retry rejected writes unless a newer save is already queued
    for (auto it = m_unsaved.constBegin(); it != m_unsaved.constEnd(); ++it) {
        bool queued = false;
        for (const SurfaceRecord& pending : m_pending) {
            if (pending.id == it.key()) {
                queued = true;
                break;
            }
        }
        if (!queued) {
            m_pending.append(it.value());
        }
    }

    bool allOk = true;
    while (!m_pending.isEmpty()) {
        SurfaceRecord record = m_pending.takeFirst();
        if (!write(record)) {
            allOk = false;
        }
    }
    return allOk;
}

void PersistenceAdapter::drainQueue()
{
    flush();
}

bool PersistenceAdapter::drainKey(const QString& key)
{
    for (int i = 0; i < m_pending.size(); ++i) {
        if (m_pending[i].id == key) {
            SurfaceRecord record = m_pending.takeAt(i);
            return write(record);
        }
    }
    return true;
}

bool PersistenceAdapter::write(const SurfaceRecord& record)
{
    if (!m_store->put(record.id, record)) {
        const QString message = m_store->lastError();
        qWarning() << "PersistenceAdapter: Save failed for" << record.id << "-" << message;
        m_unsaved.insert(record.id, record);
        emit saveFailed(record.id, message);
        return false;
    }
    m_unsaved.remove(record.id);
    emit saved(record.id);
    return true;
}

// ============================================================================
// Library Operations
// ============================================================================

QVector<SurfaceRecord> PersistenceAdapter::recordsForDocument(const QString& documentId)
{
    flush();

    QVector<SurfaceRecord> result;
    QStringList keys = m_store->keys();
    keys.sort();
    for (const QString& key : keys) {
        SurfaceRecord record;
        if (m_store->get(key, record) && record.documentId == documentId) {
            result.append(record);
        }
    }
    return result;
}

QJsonObject PersistenceAdapter::exportLibrary()
{
    flush();

    QJsonArray records;
    QStringList keys = m_store->keys();
    keys.sort();
    for (const QString& key : keys) {
        SurfaceRecord record;
        if (m_store->get(key, record)) {
            records.append(record.toJson());
        }
    }

    QJsonObject library;
    library["type"] = LIBRARY_TYPE;
    library["version"] = LIBRARY_VERSION;
    library["exportedAt"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    library["records"] = records;
    return library;
}

int PersistenceAdapter::importLibrary(const QJsonObject& library, QString* errorMessage)
{
    auto fail = [errorMessage](const QString& message) {
        qWarning() << "PersistenceAdapter: Import rejected -" << message;
        if (errorMessage) {
            *errorMessage = message;
        }
        return -1;
    };

    if (library["type"].toString() != LIBRARY_TYPE) {
        return fail(QStringLiteral("Not an annotation library"));
    }
    const int version = library["version"].toInt(0);
    if (version < 1 || version > LIBRARY_VERSION) {
        return fail(QStringLiteral("Unsupported library version %1").arg(version));
    }
    if (!library["records"].isArray()) {
        return fail(QStringLiteral("Missing records"));
    }

    flush();

    int imported = 0;
    const QJsonArray records = library["records"].toArray();
    for (const QJsonValue& value : records) {
        bool ok = false;
        SurfaceRecord record = SurfaceRecord::fromJson(value.toObject(), &ok);
        if (!ok || record.documentId.isEmpty()) {
            qWarning() << "PersistenceAdapter: Skipping malformed record in library";
            continue;
        }
        if (!m_store->put(record.id, record)) {
            qWarning() << "PersistenceAdapter: Import of" << record.id << "failed -" << m_store->lastError();
            continue;
        }
        ++imported;
    }
    return imported;
}
