#include "MainWindow.h"
#include "core/SurfaceController.h"
#include "core/SurfaceHandle.h"
#include "core/ToolState.h"
#include "persistence/JsonFileAnnotationStore.h"
#include "persistence/PersistenceAdapter.h"
#include "render/RenderScheduler.h"
#include "render/StrokeRenderer.h"
#include "viewport/AnnotatedPage.h"

#include <QAction>
#include <QActionGroup>
#include <QCloseEvent>
#include <QColorDialog>
#include <QDebug>
#include <QDoubleSpinBox>
#include <QLabel>
#include <QMessageBox>
#include <QPixmap>
#include <QScrollArea>
#include <QSpinBox>
#include <QSplitter>
#include <QStatusBar>
#include <QToolBar>
#include <QToolButton>

MainWindow::MainWindow(const InkSettings& settings, QWidget* parent)
    : QMainWindow(parent)
    , m_settings(settings)
{
    setWindowTitle(tr("VerseInk"));
    resize(1100, 760);

    m_toolState = new ToolState(m_settings.defaultTool, m_settings.defaultColor,
                                m_settings.defaultSize, this);

    m_persistence = new PersistenceAdapter(
        std::make_unique<JsonFileAnnotationStore>(m_settings.storageDirectory), this);
    connect(m_persistence, &PersistenceAdapter::saveFailed, this, &MainWindow::onSaveFailed);

    setupPanels();
    setupToolbar();
    syncToolbarFromState();
    connect(m_toolState, &ToolState::changed, this, &MainWindow::syncToolbarFromState);

    showChapter(m_chapter);
}

MainWindow::~MainWindow()
{
    // Pages hold raw controller pointers: remove them first. Controllers
    // persist dirty surfaces in their destructors, so they go before the
    // adapter is flushed and before QObject deletes the remaining children.
    delete takeCentralWidget();
    delete m_primary;
    m_primary = nullptr;
    delete m_secondary;
    m_secondary = nullptr;
    m_persistence->flush();
}

void MainWindow::setupPanels()
{
    auto makeController = [this]() {
        auto* controller = new SurfaceController(m_toolState, m_persistence, this);
        controller->setPassiveOpacity(m_settings.passiveOpacity);
        controller->scheduler()->setFrameInterval(m_settings.frameIntervalMs);
        connect(controller, &SurfaceController::contentChanged, this, [this, controller]() {
            m_lastDrawn = controller;
        });
        return controller;
    };

    m_primary = makeController();
    m_secondary = makeController();
    m_lastDrawn = m_primary;

    auto wrap = [](AnnotatedPage* page) {
        auto* scroll = new QScrollArea;
        scroll->setWidgetResizable(true);
        scroll->setWidget(page);
        return scroll;
    };

    m_primaryPage = new AnnotatedPage(m_primary);
    m_secondaryPage = new AnnotatedPage(m_secondary);

    auto* splitter = new QSplitter(Qt::Horizontal, this);
    splitter->addWidget(wrap(m_primaryPage));
    splitter->addWidget(wrap(m_secondaryPage));
    setCentralWidget(splitter);
}

void MainWindow::setupToolbar()
{
    QToolBar* toolbar = addToolBar(tr("Ink"));
    toolbar->setMovable(false);

    m_chapterSpin = new QSpinBox(toolbar);
    m_chapterSpin->setRange(1, 150);
    m_chapterSpin->setPrefix(tr("Chapter "));
    m_chapterSpin->setValue(m_chapter);
    connect(m_chapterSpin, QOverload<int>::of(&QSpinBox::valueChanged), this, &MainWindow::showChapter);
    toolbar->addWidget(m_chapterSpin);
    toolbar->addSeparator();

    m_annotateAction = toolbar->addAction(tr("Annotate"));
    m_annotateAction->setCheckable(true);
    m_annotateAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_D));
    connect(m_annotateAction, &QAction::toggled, this, &MainWindow::onAnnotateToggled);
    toolbar->addSeparator();

    m_toolGroup = new QActionGroup(this);
    m_toolGroup->setExclusive(true);
    const ToolType tools[] = { ToolType::Pen, ToolType::Marker, ToolType::Highlighter, ToolType::Eraser };
    const QString labels[] = { tr("Pen"), tr("Marker"), tr("Highlighter"), tr("Eraser") };
    for (int i = 0; i < 4; ++i) {
        QAction* action = toolbar->addAction(labels[i]);
        action->setCheckable(true);
        action->setData(static_cast<int>(tools[i]));
        m_toolGroup->addAction(action);
    }
    connect(m_toolGroup, &QActionGroup::triggered, this, &MainWindow::onToolTriggered);

    m_colorButton = new QToolButton(toolbar);
    m_colorButton->setToolTip(tr("Ink color"));
    connect(m_colorButton, &QToolButton::clicked, this, &MainWindow::onPickColor);
    toolbar->addWidget(m_colorButton);

    m_sizeSpin = new QDoubleSpinBox(toolbar);
    m_sizeSpin->setRange(InkSettings::MIN_SIZE, InkSettings::MAX_SIZE);
    m_sizeSpin->setSingleStep(0.5);
    m_sizeSpin->setToolTip(tr("Stroke size"));
    connect(m_sizeSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged), this, [this](double value) {
        m_toolState->setSize(value);
    });
    toolbar->addWidget(m_sizeSpin);
    toolbar->addSeparator();

    QAction* undoAction = toolbar->addAction(tr("Undo"));
    undoAction->setShortcut(QKeySequence::Undo);
    connect(undoAction, &QAction::triggered, this, &MainWindow::onUndo);

    QAction* clearAction = toolbar->addAction(tr("Clear"));
    connect(clearAction, &QAction::triggered, this, &MainWindow::onClear);

    QAction* clearAllAction = toolbar->addAction(tr("Clear All"));
    connect(clearAllAction, &QAction::triggered, this, &MainWindow::onClearAll);
}

void MainWindow::syncToolbarFromState()
{
    const int toolValue = static_cast<int>(m_toolState->tool());
    for (QAction* action : m_toolGroup->actions()) {
        if (action->data().toInt() == toolValue) {
            action->setChecked(true);
        }
    }

    QPixmap swatch(16, 16);
    swatch.fill(StrokeRenderer::parseColor(m_toolState->color()));
    m_colorButton->setIcon(QIcon(swatch));

    const QSignalBlocker blocker(m_sizeSpin);
    m_sizeSpin->setValue(m_toolState->size());
}

// ============================================================================
// Chapter Navigation
// ============================================================================

void MainWindow::showChapter(int chapter)
{
    m_chapter = chapter;

    m_primary->setSurface(SurfaceKey{m_documentId, chapter, QStringLiteral("english")});
    m_secondary->setSurface(SurfaceKey{m_documentId, chapter, QStringLiteral("chinese")});

    m_primaryPage->setText(placeholderText(QStringLiteral("english"), chapter));
    m_secondaryPage->setText(placeholderText(QStringLiteral("chinese"), chapter));

    const int annotated = m_persistence->recordsForDocument(m_documentId).size();
    statusBar()->showMessage(tr("%1 %2 - %3 annotated surfaces in this book")
                             .arg(m_documentId).arg(chapter).arg(annotated));
}

QString MainWindow::placeholderText(const QString& panelId, int chapter)
{
    // Verse text comes from an external provider; show numbered placeholders
    QStringList verses;
    for (int verse = 1; verse <= 24; ++verse) {
        verses << QStringLiteral("<p><b>%1:%2</b> [%3]</p>").arg(chapter).arg(verse).arg(panelId);
    }
    return verses.join(QString());
}

// ============================================================================
// Toolbar Actions
// ============================================================================

void MainWindow::onAnnotateToggled(bool enabled)
{
    m_primary->setActive(enabled);
    m_secondary->setActive(enabled);
}

void MainWindow::onToolTriggered(QAction* action)
{
    currentController()->handle().setTool(static_cast<ToolType>(action->data().toInt()));
}

void MainWindow::onPickColor()
{
    const QColor color = QColorDialog::getColor(StrokeRenderer::parseColor(m_toolState->color()), this, tr("Ink Color"));
    if (color.isValid()) {
        currentController()->handle().setColor(color.name());
    }
}

void MainWindow::onUndo()
{
    currentController()->handle().undo();
}

void MainWindow::onClear()
{
    currentController()->handle().clear();
}

void MainWindow::onClearAll()
{
    auto reply = QMessageBox::question(this, tr("Clear All"),
        tr("Remove all ink and the extended area from this panel?"));
    if (reply == QMessageBox::Yes) {
        if (!currentController()->handle().clearAll()) {
            statusBar()->showMessage(tr("Stored annotations could not be deleted; they were saved empty instead"), 8000);
        }
    }
}

void MainWindow::onSaveFailed(const QString& key, const QString& message)
{
    statusBar()->showMessage(tr("Annotations for %1 could not be saved: %2").arg(key, message), 8000);
}

SurfaceController* MainWindow::currentController() const
{
    return m_lastDrawn ? m_lastDrawn : m_primary;
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    for (SurfaceController* controller : { m_primary, m_secondary }) {
        if (controller->isDirty()) {
            controller->persist();
        }
    }
    if (!m_persistence->flush()) {
        qWarning() << "MainWindow: Some annotations were not saved on close";
    }
    event->accept();
}
