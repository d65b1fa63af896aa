#pragma once

// ============================================================================
// SurfaceKey - Identity of one annotation surface
// ============================================================================
// A surface is one document location (document id + page) optionally split
// into panels. The string form "documentId:page[:panelId]" is the key used
// by the annotation store.
// ============================================================================

#include <QString>

struct SurfaceKey {
    QString documentId;     ///< Document identifier (e.g. book id)
    int page = 0;           ///< Page within the document (e.g. chapter)
    QString panelId;        ///< Optional panel discriminator, empty if none

    bool isValid() const { return !documentId.isEmpty(); }
    bool hasPanel() const { return !panelId.isEmpty(); }

    /**
     * @brief Store key in the form "documentId:page" or "documentId:page:panelId".
     */
    QString toString() const;

    /**
     * @brief The same surface without the panel discriminator.
     *
     * Records written before panels existed are stored under this key.
     */
    SurfaceKey withoutPanel() const { return SurfaceKey{documentId, page, QString()}; }

    /**
     * @brief Parse a store key.
     * @param key String in the form "id:page[:panel]".
     * @param ok Set to false if the string is not a valid key.
     */
    static SurfaceKey fromString(const QString& key, bool* ok = nullptr);

    bool operator==(const SurfaceKey& other) const {
        return documentId == other.documentId && page == other.page && panelId == other.panelId;
    }
    bool operator!=(const SurfaceKey& other) const { return !(*this == other); }
};
