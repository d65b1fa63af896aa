// ============================================================================
// AnnotationOverlay - Presents one surface's ink above the document text
// ============================================================================
// Transparent widget stacked over the text of a panel. In active mode it
// captures tablet, touch and mouse input and forwards it to its
// SurfaceController; in passive mode it is transparent for input so the
// document beneath stays interactive, and it paints the ink faintly (or is
// hidden when the surface has nothing to show).
//
// A dashed margin line marks where the natural content ends and the
// expanded area begins.
// ============================================================================

#pragma once

#include <QWidget>

class SurfaceController;

class AnnotationOverlay : public QWidget {
    Q_OBJECT

public:
    /**
     * @param controller Surface to present (not owned).
     */
    explicit AnnotationOverlay(SurfaceController* controller, QWidget* parent = nullptr);
    ~AnnotationOverlay() override = default;

    SurfaceController* controller() const { return m_controller; }

    /**
     * @brief Height the overlay wants (content + expansion).
     */
    int preferredHeight() const;

    QSize sizeHint() const override;

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void tabletEvent(QTabletEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    bool event(QEvent* event) override;

private slots:
    void syncMode();
    void syncGeometry();

private:
    bool forwardMouse(QMouseEvent* event);

    SurfaceController* m_controller;
};
