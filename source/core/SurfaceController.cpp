#include "SurfaceController.h"
#include "StrokeSession.h"
#include "SurfaceHandle.h"
#include "ToolState.h"
#include "../persistence/PersistenceAdapter.h"
#include "../render/RenderScheduler.h"

#include <QDebug>
#include <QtMath>

SurfaceController::SurfaceController(ToolState* toolState, PersistenceAdapter* persistence, QObject* parent)
    : QObject(parent)
    , m_toolState(toolState)
    , m_persistence(persistence)
{
    m_session = new StrokeSession(m_toolState, this);
    m_scheduler = new RenderScheduler(&m_canvas, &m_store, m_session, this);

    connect(m_session, &StrokeSession::strokeStarted, this, &SurfaceController::onStrokeStarted);
    connect(m_session, &StrokeSession::pointsAppended, m_scheduler, &RenderScheduler::markDirty);
    connect(m_session, &StrokeSession::strokeCommitted, this, &SurfaceController::onStrokeCommitted);
    connect(m_session, &StrokeSession::strokeCancelled, this, &SurfaceController::onStrokeCancelled);
    connect(m_scheduler, &RenderScheduler::painted, this, &SurfaceController::rasterUpdated);
    connect(m_toolState, &ToolState::changed, this, &SurfaceController::onToolStateChanged);

    if (m_persistence) {
        connect(m_persistence, &PersistenceAdapter::saveFailed, this, &SurfaceController::onSaveFailed);
    }
}

SurfaceController::~SurfaceController()
{
    if (m_dirty) {
        persist();
    }
}

SurfaceHandle SurfaceController::handle()
{
    return SurfaceHandle(this);
}

// ============================================================================
// Surface
// ============================================================================

void SurfaceController::setSurface(const SurfaceKey& key)
{
    if (key == m_key) {
        return;
    }

    // (a) Drop any in-progress stroke, then flush the outgoing surface
    m_session->cancel();
    if (m_dirty) {
        persist();
    }

    // (b) Swap the key
    m_key = key;
    m_expanding = false;

    // (c) Load the incoming record
    QVector<InkPath> paths;
    qreal height = 0.0;
    SurfaceRecord record;
    if (m_persistence && key.isValid() && m_persistence->load(key, record)) {
        if (!PathStore::deserialize(record.canvasData.toUtf8(), paths)) {
            qWarning() << "SurfaceController: Malformed ink in" << record.id << "- treating as empty";
        }
        height = record.canvasHeight;
    }
    m_store.load(paths);
    m_extraHeight = clampExpansion(height);
    m_dirty = false;

    // (d) Full replay
    updateCanvasGeometry();
    m_scheduler->requestFullReplay();
    m_scheduler->flush();

    emit contentChanged();
    emit geometryChanged();
}

// ============================================================================
// Mode
// ============================================================================

void SurfaceController::setActive(bool active)
{
    if (m_active == active) {
        return;
    }
    m_active = active;
    m_session->setEnabled(active);

    updateCanvasGeometry();
    m_scheduler->requestFullReplay();
    m_scheduler->flush();

    emit modeChanged(active);
    emit geometryChanged();
}

void SurfaceController::setPassiveOpacity(qreal opacity)
{
    m_passiveOpacity = qBound(0.0, opacity, 1.0);
    if (!m_active) {
        emit rasterUpdated();
    }
}

bool SurfaceController::isOverlayVisible() const
{
    return m_active || !m_store.isEmpty() || m_extraHeight > 0.0;
}

// ============================================================================
// Geometry
// ============================================================================

void SurfaceController::setContentHeight(qreal height)
{
    height = qMax(0.0, height);
    if (qFuzzyCompare(1.0 + height, 1.0 + m_contentHeight)) {
        return;
    }
    m_contentHeight = height;
    updateCanvasGeometry();
    emit geometryChanged();
}

void SurfaceController::setSurfaceWidth(qreal width)
{
    width = qMax(0.0, width);
    if (qFuzzyCompare(1.0 + width, 1.0 + m_surfaceWidth)) {
        return;
    }
    m_surfaceWidth = width;
    updateCanvasGeometry();
    emit geometryChanged();
}

void SurfaceController::setDevicePixelRatio(qreal dpr)
{
    if (dpr <= 0.0 || qFuzzyCompare(dpr, m_dpr)) {
        return;
    }
    m_dpr = dpr;
    updateCanvasGeometry();
}

void SurfaceController::updateCanvasGeometry()
{
    QSize size;
    if (isOverlayVisible()) {
        size = QSize(qCeil(m_surfaceWidth), qCeil(totalHeight()));
    }

    // A reallocated raster has lost its content
    if (m_canvas.resize(size, m_dpr) && !size.isEmpty()) {
        m_scheduler->requestFullReplay();
    }
}

// ============================================================================
// Expansion
// ============================================================================

qreal SurfaceController::clampExpansion(qreal height) const
{
    return qBound(0.0, height, MAX_EXPANSION);
}

qreal SurfaceController::setExtraHeight(qreal height)
{
    const qreal clamped = clampExpansion(height);
    if (qFuzzyCompare(1.0 + clamped, 1.0 + m_extraHeight)) {
        return m_extraHeight;
    }

    m_extraHeight = clamped;
    m_dirty = true;
    updateCanvasGeometry();
    emit geometryChanged();

    // During a drag the height is persisted once, on release
    if (!m_expanding) {
        persist();
    }
    return m_extraHeight;
}

qreal SurfaceController::expandBy(qreal delta)
{
    return setExtraHeight(m_extraHeight + delta);
}

void SurfaceController::beginExpand(qreal y)
{
    m_expanding = true;
    m_expandStartY = y;
    m_expandStartHeight = m_extraHeight;
}

void SurfaceController::updateExpand(qreal y)
{
    if (!m_expanding) {
        return;
    }
    setExtraHeight(m_expandStartHeight + (y - m_expandStartY));
}

void SurfaceController::endExpand()
{
    if (!m_expanding) {
        return;
    }
    m_expanding = false;
    if (m_dirty) {
        persist();
    }
}

// ============================================================================
// Input
// ============================================================================

bool SurfaceController::handlePointerSample(const PointerSample& sample)
{
    if (!m_active) {
        return false;
    }
    return m_session->handleSample(sample);
}

void SurfaceController::onStrokeStarted()
{
    m_canvas.resetLive();
}

void SurfaceController::onStrokeCommitted(const InkPath& path)
{
    if (!m_store.append(path)) {
        return;
    }
    m_scheduler->commitLive(path);
    markContentChanged();
}

void SurfaceController::onStrokeCancelled()
{
    // Partially painted ink is discarded by repainting the committed state
    m_canvas.resetLive();
    m_scheduler->requestFullReplay();
}

void SurfaceController::onToolStateChanged()
{
    if (!m_active && isOverlayVisible()) {
        m_scheduler->requestFullReplay();
    }
}

void SurfaceController::onSaveFailed(const QString& key, const QString& message)
{
    if (key != m_key.toString()) {
        return;
    }
    // In-memory ink stays authoritative; retry on the next save
    qWarning() << "SurfaceController: Ink for" << key << "not saved:" << message;
    m_dirty = true;
}

// ============================================================================
// Handle Operations
// ============================================================================

bool SurfaceController::undo()
{
    if (!m_store.undo()) {
        return false;
    }
    markContentChanged();
    updateCanvasGeometry();
    m_scheduler->requestFullReplay();
    return true;
}

void SurfaceController::clear()
{
    if (m_store.isEmpty()) {
        return;
    }
    m_store.clear();
    markContentChanged();
    updateCanvasGeometry();
    m_scheduler->requestFullReplay();
}

bool SurfaceController::clearAll()
{
    m_session->cancel();
    m_store.clear();
    m_extraHeight = 0.0;
    m_dirty = false;

    bool removed = true;
    if (m_persistence && m_key.isValid() && !m_persistence->remove(m_key)) {
        // The old record must not come back on the next load: overwrite it
        qWarning() << "SurfaceController: Could not delete" << m_key.toString() << "- saving it empty";
        removed = false;
        m_dirty = true;
        persist();
    }

    updateCanvasGeometry();
    m_scheduler->requestFullReplay();
    emit contentChanged();
    emit geometryChanged();
    return removed;
}

void SurfaceController::setTool(ToolType tool)
{
    m_toolState->setTool(tool);
}

void SurfaceController::setColor(const QString& color)
{
    m_toolState->setColor(color);
}

void SurfaceController::setSize(qreal size)
{
    m_toolState->setSize(size);
}

void SurfaceController::loadPaths(const QVector<InkPath>& paths)
{
    m_store.load(paths);
    markContentChanged();
    updateCanvasGeometry();
    m_scheduler->requestFullReplay();
}

QString SurfaceController::serializedData() const
{
    return QString::fromUtf8(m_store.serialize());
}

// ============================================================================
// Persistence
// ============================================================================

void SurfaceController::markContentChanged()
{
    m_dirty = true;
    persist();
    emit contentChanged();
}

void SurfaceController::persist()
{
    if (!m_persistence || !m_key.isValid()) {
        return;
    }
    m_persistence->save(m_key, serializedData(), m_extraHeight);
    m_dirty = false;
}
