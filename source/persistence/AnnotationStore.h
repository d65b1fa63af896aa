#pragma once

// ============================================================================
// AnnotationStore - Abstract key-value backend for surface records
// ============================================================================
// Keys are the opaque strings produced by SurfaceKey::toString(). Backends
// are synchronous; the PersistenceAdapter provides the queued,
// fire-and-forget behavior on top.
// ============================================================================

#include "SurfaceRecord.h"

#include <QString>
#include <QStringList>

class AnnotationStore {
public:
    virtual ~AnnotationStore() = default;

    /**
     * @brief Insert or overwrite the record stored under key.
     * @return False if the write was rejected (see lastError()).
     */
    virtual bool put(const QString& key, const SurfaceRecord& record) = 0;

    /**
     * @brief Look up a record.
     * @return False if no (readable) record exists under key.
     */
    virtual bool get(const QString& key, SurfaceRecord& record) const = 0;

    /**
     * @brief Delete a record. Removing an absent key is not an error.
     * @return False only if the backend failed.
     */
    virtual bool remove(const QString& key) = 0;

    /**
     * @brief All keys currently stored.
     */
    virtual QStringList keys() const = 0;

    /**
     * @brief Description of the most recent failure.
     */
    QString lastError() const { return m_lastError; }

protected:
    void setLastError(const QString& error) { m_lastError = error; }

private:
    QString m_lastError;
};
