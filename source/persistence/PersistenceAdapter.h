#pragma once

// ============================================================================
// PersistenceAdapter - Queued persistence of surface records
// ============================================================================
// Sits between the SurfaceController and an AnnotationStore backend.
//
// save() is fire-and-forget: the record is queued and written on the next
// event-loop turn. Repeated saves of one key before the queue drains are
// coalesced into the latest one. load() first drains any pending write for
// the same key, so a save issued before a load of that key is never
// reordered after it (rapid switch-back between surfaces).
//
// Storage failures do not touch in-memory state; they are reported through
// saveFailed() and the backend's lastError(). A record whose write failed
// is kept and retried on the next flush, and load() returns it in place of
// the older stored version, so a session always reads back its own saves.
// ============================================================================

#include "AnnotationStore.h"
#include "SurfaceRecord.h"

#include <QJsonObject>
#include <QMap>
#include <QObject>
#include <QTimer>
#include <QVector>

#include <memory>

class PersistenceAdapter : public QObject {
    Q_OBJECT

public:
    /// Type tag of exported annotation libraries
    static const QString LIBRARY_TYPE;
    static constexpr int LIBRARY_VERSION = 1;

    /**
     * @param store Backend; the adapter takes ownership.
     */
    explicit PersistenceAdapter(std::unique_ptr<AnnotationStore> store, QObject* parent = nullptr);
    ~PersistenceAdapter() override;

    // ===== Surface Operations =====

    /**
     * @brief Queue an upsert of the surface record.
     * @param key Surface identity.
     * @param canvasData Serialized path sequence (PathStore::serialize()).
     * @param canvasHeight Extra expanded height.
     */
    void save(const SurfaceKey& key, const QString& canvasData, qreal canvasHeight);

    /**
     * @brief Load the record for a surface.
     *
     * Pending writes for the key are drained first; a record whose write
     * failed is returned as is. If a key with a panel has no record, the
     * same key without the panel is tried.
     *
     * @return False if no record exists (empty surface).
     */
    bool load(const SurfaceKey& key, SurfaceRecord& record);

    /**
     * @brief Delete the record of a surface (pending and unsaved writes are
     *        dropped).
     * @return False if the backend failed; an absent record is not a failure.
     */
    bool remove(const SurfaceKey& key);

    /**
     * @brief Write every pending record now, retrying earlier failures.
     * @return False if any write failed.
     */
    bool flush();

    bool hasPendingWrites() const { return !m_pending.isEmpty(); }
    int pendingCount() const { return m_pending.size(); }

    /// Records whose last write was rejected by the backend
    int unsavedCount() const { return m_unsaved.size(); }

    // ===== Library Operations =====

    /**
     * @brief All records belonging to one document, ordered by key.
     */
    QVector<SurfaceRecord> recordsForDocument(const QString& documentId);

    /**
     * @brief Export every stored record as a self-describing JSON object.
     */
    QJsonObject exportLibrary();

    /**
     * @brief Upsert every record of an exported library.
     * @param library Object produced by exportLibrary().
     * @param errorMessage Receives the reason on failure.
     * @return Number of records imported, or -1 if the library was rejected.
     */
    int importLibrary(const QJsonObject& library, QString* errorMessage = nullptr);

    AnnotationStore* store() const { return m_store.get(); }

signals:
    void saved(const QString& key);
    void saveFailed(const QString& key, const QString& message);

private slots:
    void drainQueue();

private:
    bool write(const SurfaceRecord& record);
    bool drainKey(const QString& key);
    bool readRecord(const QString& key, SurfaceRecord& record);

    std::unique_ptr<AnnotationStore> m_store;
    QVector<SurfaceRecord> m_pending;   ///< Write order, one entry per key
    QMap<QString, SurfaceRecord> m_unsaved;  ///< Rejected writes, by key
    QTimer m_drainTimer;
};
