#include "MemoryAnnotationStore.h"

bool MemoryAnnotationStore::put(const QString& key, const SurfaceRecord& record)
{
    if (m_failWrites) {
        setLastError(QStringLiteral("Write rejected for %1").arg(key));
        return false;
    }
    m_records.insert(key, record);
    ++m_putCount;
    return true;
}

bool MemoryAnnotationStore::get(const QString& key, SurfaceRecord& record) const
{
    auto it = m_records.constFind(key);
    if (it == m_records.constEnd()) {
        return false;
    }
    record = it.value();
    return true;
}

bool MemoryAnnotationStore::remove(const QString& key)
{
    if (m_failWrites) {
        setLastError(QStringLiteral("Delete rejected for %1").arg(key));
        return false;
    }
    m_records.remove(key);
    return true;
}
