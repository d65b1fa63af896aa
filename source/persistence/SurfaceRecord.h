#pragma once

// ============================================================================
// SurfaceRecord - Persisted state of one annotation surface
// ============================================================================
// One record per surface key, overwritten on every save. canvasData holds
// the serialized path sequence verbatim (see PathStore::serialize()) so an
// empty store ("[]") stays distinct from a missing record.
// ============================================================================

#include "../core/SurfaceKey.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

struct SurfaceRecord {
    QString id;                 ///< Store key, "documentId:page[:panelId]"
    QString documentId;
    int page = 0;
    QString panelId;
    QString canvasData;         ///< Serialized InkPath array (JSON text)
    qreal canvasHeight = 0.0;   ///< Extra expanded height, >= 0
    QDateTime lastModified;     ///< UTC

    SurfaceKey key() const { return SurfaceKey{documentId, page, panelId}; }

    /**
     * @brief Build a record for a surface, stamped with the current time.
     */
    static SurfaceRecord create(const SurfaceKey& key, const QString& canvasData, qreal canvasHeight);

    QJsonObject toJson() const;

    /**
     * @brief Parse a record written by toJson().
     * @param ok Set to false when id or canvasData is missing or the height
     *        is negative.
     */
    static SurfaceRecord fromJson(const QJsonObject& obj, bool* ok = nullptr);
};
