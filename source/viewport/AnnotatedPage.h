// ============================================================================
// AnnotatedPage - One panel: document text with an ink surface above it
// ============================================================================
// Stacks, top to bottom:
//   [ text label ]           natural content height (reported to controller)
//   [ AnnotationOverlay ]    covers the text plus the expanded area
//   [ ExpandHandle ]         directly below the overlay (active mode only)
// The overlay is a sibling drawn above the label, not a layout item, so it
// can extend past the text without reflowing it.
// ============================================================================

#pragma once

#include <QWidget>

class QLabel;
class SurfaceController;
class AnnotationOverlay;
class ExpandHandle;

class AnnotatedPage : public QWidget {
    Q_OBJECT

public:
    AnnotatedPage(SurfaceController* controller, QWidget* parent = nullptr);

    void setText(const QString& text);

    SurfaceController* controller() const { return m_controller; }
    AnnotationOverlay* overlay() const { return m_overlay; }

    QSize sizeHint() const override;
    QSize minimumSizeHint() const override;

protected:
    void resizeEvent(QResizeEvent* event) override;

private slots:
    void relayout();

private:
    SurfaceController* m_controller;   ///< Not owned
    QLabel* m_text = nullptr;
    AnnotationOverlay* m_overlay = nullptr;
    ExpandHandle* m_handle = nullptr;
};
