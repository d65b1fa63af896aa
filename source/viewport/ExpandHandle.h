// ============================================================================
// ExpandHandle - Drag grip that grows the annotation surface downward
// ============================================================================

#pragma once

#include <QWidget>

class SurfaceController;

class ExpandHandle : public QWidget {
    Q_OBJECT

public:
    static constexpr int HANDLE_HEIGHT = 14;

    explicit ExpandHandle(SurfaceController* controller, QWidget* parent = nullptr);

    QSize sizeHint() const override;

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;

private:
    SurfaceController* m_controller;  ///< Not owned
};
