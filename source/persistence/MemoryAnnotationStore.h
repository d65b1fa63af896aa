#pragma once

// ============================================================================
// MemoryAnnotationStore - In-process AnnotationStore
// ============================================================================

#include "AnnotationStore.h"

#include <QMap>

class MemoryAnnotationStore : public AnnotationStore {
public:
    MemoryAnnotationStore() = default;

    bool put(const QString& key, const SurfaceRecord& record) override;
    bool get(const QString& key, SurfaceRecord& record) const override;
    bool remove(const QString& key) override;
    QStringList keys() const override { return m_records.keys(); }

    int count() const { return m_records.size(); }
    int putCount() const { return m_putCount; }

    /**
     * @brief Reject every subsequent put/remove (simulates quota errors).
     */
    void setFailWrites(bool fail) { m_failWrites = fail; }

private:
    QMap<QString, SurfaceRecord> m_records;
    bool m_failWrites = false;
    int m_putCount = 0;
};
