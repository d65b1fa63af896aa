#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>

#include "core/InkSettings.h"
#include "core/ToolType.h"

class QAction;
class QActionGroup;
class QDoubleSpinBox;
class QSpinBox;
class QToolButton;
class AnnotatedPage;
class PersistenceAdapter;
class SurfaceController;
class ToolState;

/**
 * @brief Host window: one chapter shown in two mirrored language panels.
 *
 * Both panels share a single ToolState, so choosing a tool, color or size
 * from the toolbar applies to whichever panel is drawn on next. Undo and
 * clear act on the panel that was last drawn on.
 */
class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    /**
     * @param settings Loaded ink settings (storage, pacing, defaults).
     */
    explicit MainWindow(const InkSettings& settings, QWidget* parent = nullptr);
    ~MainWindow() override;

    /**
     * @brief Show another chapter; the panels' ink is saved and reloaded.
     */
    void showChapter(int chapter);

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onAnnotateToggled(bool enabled);
    void onToolTriggered(QAction* action);
    void onPickColor();
    void onUndo();
    void onClear();
    void onClearAll();
    void onSaveFailed(const QString& key, const QString& message);

private:
    void setupToolbar();
    void setupPanels();
    void syncToolbarFromState();
    SurfaceController* currentController() const;
    static QString placeholderText(const QString& panelId, int chapter);

    InkSettings m_settings;
    ToolState* m_toolState = nullptr;
    PersistenceAdapter* m_persistence = nullptr;

    SurfaceController* m_primary = nullptr;     ///< Left panel
    SurfaceController* m_secondary = nullptr;   ///< Right panel (mirrored)
    AnnotatedPage* m_primaryPage = nullptr;
    AnnotatedPage* m_secondaryPage = nullptr;
    SurfaceController* m_lastDrawn = nullptr;

    QString m_documentId = QStringLiteral("john");
    int m_chapter = 1;

    // Toolbar
    QAction* m_annotateAction = nullptr;
    QActionGroup* m_toolGroup = nullptr;
    QToolButton* m_colorButton = nullptr;
    QDoubleSpinBox* m_sizeSpin = nullptr;
    QSpinBox* m_chapterSpin = nullptr;
};

#endif // MAINWINDOW_H
