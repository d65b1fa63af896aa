#include "AnnotationOverlay.h"
#include "../core/SurfaceController.h"
#include "../input/PointNormalizer.h"

#include <QMouseEvent>
#include <QPainter>
#include <QPaintEvent>
#include <QTabletEvent>
#include <QTouchEvent>
#include <QtMath>

AnnotationOverlay::AnnotationOverlay(SurfaceController* controller, QWidget* parent)
    : QWidget(parent)
    , m_controller(controller)
{
    // Transparent: the document text shows through
    setAttribute(Qt::WA_NoSystemBackground, true);
    setAttribute(Qt::WA_TabletTracking, true);
    setAttribute(Qt::WA_AcceptTouchEvents, true);
    setAutoFillBackground(false);

    connect(m_controller, &SurfaceController::rasterUpdated, this, QOverload<>::of(&QWidget::update));
    connect(m_controller, &SurfaceController::geometryChanged, this, &AnnotationOverlay::syncGeometry);
    connect(m_controller, &SurfaceController::contentChanged, this, &AnnotationOverlay::syncGeometry);
    connect(m_controller, &SurfaceController::modeChanged, this, &AnnotationOverlay::syncMode);

    syncMode();
}

int AnnotationOverlay::preferredHeight() const
{
    return qCeil(m_controller->totalHeight());
}

QSize AnnotationOverlay::sizeHint() const
{
    return QSize(qCeil(m_controller->surfaceWidth()), preferredHeight());
}

void AnnotationOverlay::syncMode()
{
    // Passive ink must not block interaction with the document beneath
    setAttribute(Qt::WA_TransparentForMouseEvents, !m_controller->isActive());
    setCursor(m_controller->isActive() ? Qt::CrossCursor : Qt::ArrowCursor);
    syncGeometry();
}

void AnnotationOverlay::syncGeometry()
{
    const int h = preferredHeight();
    if (height() != h) {
        resize(width(), h);
    }
    setVisible(m_controller->isOverlayVisible());
    updateGeometry();
    update();
}

void AnnotationOverlay::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    m_controller->setDevicePixelRatio(devicePixelRatioF());
    m_controller->setSurfaceWidth(width());
}

void AnnotationOverlay::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event)

    QPainter painter(this);
    const QImage& raster = m_controller->raster();
    if (!raster.isNull()) {
        painter.setOpacity(m_controller->overlayOpacity());
        painter.drawImage(QPointF(0, 0), raster);
        painter.setOpacity(1.0);
    }

    // Margin line between the natural content and the expanded area
    if (m_controller->extraHeight() > 0.0) {
        const qreal y = m_controller->contentHeight();
        QColor lineColor(120, 120, 120, m_controller->isActive() ? 160 : 60);
        QPen pen(lineColor, 1.0, Qt::DashLine);
        painter.setPen(pen);
        painter.drawLine(QPointF(0, y), QPointF(width(), y));
    }
}

// ===== Input =====

void AnnotationOverlay::tabletEvent(QTabletEvent* event)
{
    PointerSample sample;
    if (PointNormalizer::fromTabletEvent(event, sample) && m_controller->handlePointerSample(sample)) {
        event->accept();
        return;
    }
    event->ignore();
}

bool AnnotationOverlay::forwardMouse(QMouseEvent* event)
{
    PointerSample sample;
    if (!PointNormalizer::fromMouseEvent(event, sample)) {
        return false;
    }
    return m_controller->handlePointerSample(sample);
}

void AnnotationOverlay::mousePressEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton && forwardMouse(event)) {
        event->accept();
        return;
    }
    QWidget::mousePressEvent(event);
}

void AnnotationOverlay::mouseMoveEvent(QMouseEvent* event)
{
    if ((event->buttons() & Qt::LeftButton) && forwardMouse(event)) {
        event->accept();
        return;
    }
    QWidget::mouseMoveEvent(event);
}

void AnnotationOverlay::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton && forwardMouse(event)) {
        event->accept();
        return;
    }
    QWidget::mouseReleaseEvent(event);
}

bool AnnotationOverlay::event(QEvent* event)
{
    switch (event->type()) {
        case QEvent::TouchBegin:
        case QEvent::TouchUpdate:
        case QEvent::TouchEnd:
        case QEvent::TouchCancel: {
            auto* touchEvent = static_cast<QTouchEvent*>(event);
            PointerSample sample;
            if (PointNormalizer::fromTouchEvent(touchEvent, sample)) {
                m_controller->handlePointerSample(sample);
            }
            // Accept TouchBegin in active mode so the rest of the sequence
            // arrives here and Qt does not synthesize a mouse stream from it
            event->setAccepted(m_controller->isActive());
            return true;
        }
        default:
            return QWidget::event(event);
    }
}
