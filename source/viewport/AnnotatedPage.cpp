#include "AnnotatedPage.h"
#include "AnnotationOverlay.h"
#include "ExpandHandle.h"
#include "../core/SurfaceController.h"

#include <QLabel>
#include <QtMath>

AnnotatedPage::AnnotatedPage(SurfaceController* controller, QWidget* parent)
    : QWidget(parent)
    , m_controller(controller)
{
    m_text = new QLabel(this);
    m_text->setWordWrap(true);
    m_text->setAlignment(Qt::AlignTop | Qt::AlignLeft);
    m_text->setTextInteractionFlags(Qt::TextSelectableByMouse);
    m_text->setContentsMargins(12, 12, 12, 12);

    m_overlay = new AnnotationOverlay(m_controller, this);
    m_overlay->raise();

    m_handle = new ExpandHandle(m_controller, this);

    connect(m_controller, &SurfaceController::geometryChanged, this, &AnnotatedPage::relayout);
    connect(m_controller, &SurfaceController::modeChanged, this, &AnnotatedPage::relayout);
}

void AnnotatedPage::setText(const QString& text)
{
    m_text->setText(text);
    relayout();
}

QSize AnnotatedPage::sizeHint() const
{
    return QSize(400, qCeil(m_controller->totalHeight()) + ExpandHandle::HANDLE_HEIGHT);
}

QSize AnnotatedPage::minimumSizeHint() const
{
    return QSize(200, qCeil(m_controller->totalHeight()) + ExpandHandle::HANDLE_HEIGHT);
}

void AnnotatedPage::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    relayout();
}

void AnnotatedPage::relayout()
{
    const int w = width();
    const int textHeight = m_text->heightForWidth(w);
    m_text->setGeometry(0, 0, w, textHeight);

    // The surface must at least cover the text
    m_controller->setSurfaceWidth(w);
    m_controller->setContentHeight(textHeight);

    const int surfaceHeight = qCeil(m_controller->totalHeight());
    m_overlay->setGeometry(0, 0, w, surfaceHeight);
    m_handle->setGeometry(0, surfaceHeight, w, ExpandHandle::HANDLE_HEIGHT);

    setMinimumHeight(surfaceHeight + ExpandHandle::HANDLE_HEIGHT);
    updateGeometry();
}
