#pragma once

// ============================================================================
// SurfaceController - Binds ink state to one logical annotation surface
// ============================================================================
// Owns the PathStore, StrokeSession, InkCanvas and RenderScheduler of the
// currently mounted surface and mediates between them:
//
//  - Surface switching: persist the outgoing surface if dirty, swap the key,
//    load the incoming record (absent => empty, zero height), full replay.
//  - Modes: active (captures input, full opacity, blocks the document
//    beneath) and passive (read-only faint overlay, or nothing at all when
//    there is no ink and no expansion).
//  - Expansion: extra height below the natural content, clamped to
//    [0, MAX_EXPANSION], persisted with the record.
//
// The host drives it through the SurfaceHandle methods (undo, clear,
// setTool...) and feeds input through handlePointerSample().
// ============================================================================

#include "PathStore.h"
#include "SurfaceKey.h"
#include "ToolType.h"
#include "../input/PointerSample.h"
#include "../render/InkCanvas.h"

#include <QObject>
#include <QPointer>

class PersistenceAdapter;
class RenderScheduler;
class StrokeSession;
class SurfaceHandle;
class ToolState;

class SurfaceController : public QObject {
    Q_OBJECT

public:
    static constexpr qreal MAX_EXPANSION = 2000.0;
    static constexpr qreal DEFAULT_PASSIVE_OPACITY = 0.35;

    /**
     * @param toolState Shared tool configuration (not owned).
     * @param persistence Record persistence (not owned); may be null for an
     *        unpersisted surface.
     */
    SurfaceController(ToolState* toolState, PersistenceAdapter* persistence, QObject* parent = nullptr);
    ~SurfaceController() override;

    /**
     * @brief Imperative interface for the host.
     */
    SurfaceHandle handle();

    // ===== Surface =====

    /**
     * @brief Switch to another surface.
     *
     * Any stroke in progress is dropped without being appended.
     */
    void setSurface(const SurfaceKey& key);
    SurfaceKey surfaceKey() const { return m_key; }

    // ===== Mode =====

    void setActive(bool active);
    bool isActive() const { return m_active; }

    /**
     * @brief Opacity the raster is presented with (1.0 when active).
     */
    qreal overlayOpacity() const { return m_active ? 1.0 : m_passiveOpacity; }
    void setPassiveOpacity(qreal opacity);
    qreal passiveOpacity() const { return m_passiveOpacity; }

    /**
     * @brief Whether the surface renders anything at all.
     *
     * A passive surface without ink and without expansion is hidden.
     */
    bool isOverlayVisible() const;

    // ===== Geometry =====

    /**
     * @brief Natural content height the surface must at least cover.
     */
    void setContentHeight(qreal height);
    void setSurfaceWidth(qreal width);
    void setDevicePixelRatio(qreal dpr);

    qreal contentHeight() const { return m_contentHeight; }
    qreal surfaceWidth() const { return m_surfaceWidth; }
    qreal extraHeight() const { return m_extraHeight; }
    qreal totalHeight() const { return m_contentHeight + m_extraHeight; }

    // ===== Expansion =====

    /**
     * @brief Set the expanded height, clamped to [0, MAX_EXPANSION].
     * @return The height actually applied.
     */
    qreal setExtraHeight(qreal height);

    /**
     * @brief Grow or shrink the expanded height by delta (clamped).
     */
    qreal expandBy(qreal delta);

    /// Drag gesture on the expand handle; y is in any fixed coordinate space.
    void beginExpand(qreal y);
    void updateExpand(qreal y);
    void endExpand();
    bool isExpanding() const { return m_expanding; }

    // ===== Input =====

    /**
     * @brief Route an input sample to the stroke session (active mode only).
     * @return True if the sample was consumed.
     */
    bool handlePointerSample(const PointerSample& sample);

    // ===== Handle Operations =====

    bool undo();
    void clear();

    /**
     * @brief Clear the ink, reset the expansion and delete the stored record.
     * @return False if the record could not be deleted; an empty record is
     *         saved over it instead.
     */
    bool clearAll();

    void setTool(ToolType tool);
    void setColor(const QString& color);
    void setSize(qreal size);

    /**
     * @brief Replace the surface's ink wholesale.
     */
    void loadPaths(const QVector<InkPath>& paths);

    /**
     * @brief Serialized path sequence of the surface ("[]" when empty).
     */
    QString serializedData() const;

    // ===== Persistence =====

    /**
     * @brief Save the current surface now (queued in the adapter).
     */
    void persist();
    bool isDirty() const { return m_dirty; }

    // ===== Access =====

    const PathStore& pathStore() const { return m_store; }
    const InkCanvas& canvas() const { return m_canvas; }
    const QImage& raster() const { return m_canvas.image(); }
    StrokeSession* session() const { return m_session; }
    RenderScheduler* scheduler() const { return m_scheduler; }
    ToolState* toolState() const { return m_toolState; }

signals:
    /// The raster changed and should be repainted on screen.
    void rasterUpdated();

    /// Total height, width or visibility changed.
    void geometryChanged();

    void modeChanged(bool active);

    /// Committed ink changed (stroke, undo, clear, load).
    void contentChanged();

private slots:
    void onStrokeStarted();
    void onStrokeCommitted(const InkPath& path);
    void onStrokeCancelled();
    void onToolStateChanged();
    void onSaveFailed(const QString& key, const QString& message);

private:
    void markContentChanged();
    void updateCanvasGeometry();
    qreal clampExpansion(qreal height) const;

    ToolState* m_toolState;                     ///< Not owned
    QPointer<PersistenceAdapter> m_persistence; ///< Not owned

    SurfaceKey m_key;
    PathStore m_store;
    InkCanvas m_canvas;
    StrokeSession* m_session = nullptr;         ///< Child QObject
    RenderScheduler* m_scheduler = nullptr;     ///< Child QObject

    bool m_active = false;
    bool m_dirty = false;
    qreal m_passiveOpacity = DEFAULT_PASSIVE_OPACITY;

    qreal m_contentHeight = 0.0;
    qreal m_surfaceWidth = 0.0;
    qreal m_extraHeight = 0.0;
    qreal m_dpr = 1.0;

    // Expand drag
    bool m_expanding = false;
    qreal m_expandStartY = 0.0;
    qreal m_expandStartHeight = 0.0;
};
