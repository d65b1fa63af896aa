#pragma once

// ============================================================================
// InkSettings - User-tunable ink engine settings
// ============================================================================
// Persisted through QSettings("VerseInk", "App"). Every value is validated
// on load; out-of-range values are clamped, unparsable ones fall back to
// the default.
// ============================================================================

#include "ToolType.h"

#include <QString>

class QSettings;

struct InkSettings {
    static constexpr int MIN_FRAME_INTERVAL_MS = 4;
    static constexpr int MAX_FRAME_INTERVAL_MS = 100;
    static constexpr qreal MIN_SIZE = 0.5;
    static constexpr qreal MAX_SIZE = 50.0;

    QString storageDirectory;           ///< Where JsonFileAnnotationStore keeps records
    int frameIntervalMs = 16;
    qreal passiveOpacity = 0.35;
    ToolType defaultTool = ToolType::Pen;
    QString defaultColor = QStringLiteral("#000000");
    qreal defaultSize = 2.0;

    /**
     * @brief Default storage directory (AppDataLocation/annotations).
     */
    static QString defaultStorageDirectory();

    /**
     * @brief Load from the application settings.
     */
    static InkSettings load();

    /**
     * @brief Load from an explicit settings object (tests use an ini file).
     */
    static InkSettings load(QSettings& settings);

    void save() const;
    void save(QSettings& settings) const;
};
