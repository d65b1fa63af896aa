#pragma once

// ============================================================================
// JsonFileAnnotationStore - One JSON file per surface record
// ============================================================================
// Records live in a single directory. File names are the hex-encoded UTF-8
// key plus ".json"; writes go through QSaveFile so a crash mid-write never
// leaves a truncated record behind.
// ============================================================================

#include "AnnotationStore.h"

class JsonFileAnnotationStore : public AnnotationStore {
public:
    /**
     * @param directory Storage directory; created on first write if missing.
     */
    explicit JsonFileAnnotationStore(const QString& directory);

    bool put(const QString& key, const SurfaceRecord& record) override;
    bool get(const QString& key, SurfaceRecord& record) const override;
    bool remove(const QString& key) override;
    QStringList keys() const override;

    QString directory() const { return m_directory; }

    /**
     * @brief Full path of the file holding key.
     */
    QString filePathForKey(const QString& key) const;

private:
    QString m_directory;
};
