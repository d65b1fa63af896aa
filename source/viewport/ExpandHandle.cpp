#include "ExpandHandle.h"
#include "../core/SurfaceController.h"

#include <QMouseEvent>
#include <QPainter>

ExpandHandle::ExpandHandle(SurfaceController* controller, QWidget* parent)
    : QWidget(parent)
    , m_controller(controller)
{
    setCursor(Qt::SizeVerCursor);
    setFixedHeight(HANDLE_HEIGHT);
    setToolTip(tr("Drag to extend the drawing area"));

    // Only an editable surface can be expanded
    auto syncVisibility = [this]() { setVisible(m_controller->isActive()); };
    connect(m_controller, &SurfaceController::modeChanged, this, syncVisibility);
    syncVisibility();
}

QSize ExpandHandle::sizeHint() const
{
    return QSize(120, HANDLE_HEIGHT);
}

void ExpandHandle::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event)

    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing, true);

    const bool dragging = m_controller->isExpanding();
    painter.setPen(Qt::NoPen);
    painter.setBrush(palette().color(dragging ? QPalette::Highlight : QPalette::Mid));

    // Grip pill, centered
    QRectF grip(width() / 2.0 - 24, height() / 2.0 - 2, 48, 4);
    painter.drawRoundedRect(grip, 2, 2);
}

void ExpandHandle::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        QWidget::mousePressEvent(event);
        return;
    }
    // Global coordinates: the handle itself moves while dragging
    m_controller->beginExpand(event->globalPosition().y());
    update();
    event->accept();
}

void ExpandHandle::mouseMoveEvent(QMouseEvent* event)
{
    if (!m_controller->isExpanding()) {
        QWidget::mouseMoveEvent(event);
        return;
    }
    m_controller->updateExpand(event->globalPosition().y());
    event->accept();
}

void ExpandHandle::mouseReleaseEvent(QMouseEvent* event)
{
    if (!m_controller->isExpanding()) {
        QWidget::mouseReleaseEvent(event);
        return;
    }
    m_controller->updateExpand(event->globalPosition().y());
    m_controller->endExpand();
    update();
    event->accept();
}
