#include "Novelist/editor/qt/nv_main_window.hpp"
#include "Novelist/core/logger.hpp"
#include "Novelist/editor/qt/nv_zoom_actions.hpp"
#include "Novelist/editor/qt/nv_zoomable_text_edit.hpp"

#include <QAction>
#include <QFile>
#include <QFileDialog>
#include <QFileInfo>
#include <QKeySequence>
#include <QLabel>
#include <QMenuBar>
#include <QMessageBox>
#include <QSplitter>
#include <QStatusBar>
#include <QTextStream>

namespace Novelist::editor::qt {

NVMainWindow::NVMainWindow(ZoomCoordinator* coordinator, const EditorConfig& config,
                           QWidget* parent)
    : QMainWindow(parent), m_coordinator(coordinator), m_config(config) {
  setWindowTitle(tr("Novelist"));
  resize(1280, 800);

  setupEditors();
  setupMenuBar();
  setupStatusBar();
}

// Editors unregister themselves as Qt deletes them
NVMainWindow::~NVMainWindow() = default;

void NVMainWindow::setupEditors() {
  auto* splitter = new QSplitter(Qt::Horizontal, this);

  m_manuscriptEditor = new NVZoomableRichTextEdit(m_coordinator, splitter);
  m_manuscriptEditor->setObjectName("manuscriptEditor");
  m_manuscriptEditor->setWheelZoomStep(m_config.zoomStep);
  m_manuscriptEditor->setPlaceholderText(tr("Write your story here..."));

  m_notesEditor = new NVZoomablePlainTextEdit(m_coordinator, splitter);
  m_notesEditor->setObjectName("notesEditor");
  m_notesEditor->setWheelZoomStep(m_config.zoomStep);
  m_notesEditor->setPlaceholderText(tr("Notes"));

  splitter->addWidget(m_manuscriptEditor);
  splitter->addWidget(m_notesEditor);
  splitter->setStretchFactor(0, 3);
  splitter->setStretchFactor(1, 1);
  setCentralWidget(splitter);
}

void NVMainWindow::setupMenuBar() {
  QMenu* fileMenu = menuBar()->addMenu(tr("&File"));

  QAction* openAction = fileMenu->addAction(tr("&Open..."));
  openAction->setShortcut(QKeySequence::Open);
  connect(openAction, &QAction::triggered, this, &NVMainWindow::onOpenRequested);

  fileMenu->addSeparator();
  QAction* quitAction = fileMenu->addAction(tr("&Quit"));
  quitAction->setShortcut(QKeySequence::Quit);
  connect(quitAction, &QAction::triggered, this, &QWidget::close);

  QMenu* viewMenu = menuBar()->addMenu(tr("&View"));
  m_zoomActions = new NVZoomActions(m_coordinator, this);
  m_zoomActions->setZoomStep(m_config.zoomStep);
  m_zoomActions->populateMenu(viewMenu);
}

void NVMainWindow::setupStatusBar() {
  m_zoomLabel = new QLabel(m_zoomActions->statusText(), this);
  statusBar()->addPermanentWidget(m_zoomLabel);

  connect(m_zoomActions, &NVZoomActions::zoomLevelChanged, this, [this](int level) {
    m_zoomLabel->setText(m_zoomActions->statusText());
    statusBar()->showMessage(tr("Zoom set to %1%").arg(level), 2000);
  });
}

bool NVMainWindow::openFile(const QString& path) {
  QFile file(path);
  if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
    NOVELIST_LOG_WARN("Failed to open '{}': {}", path.toStdString(),
                      file.errorString().toStdString());
    return false;
  }

  QTextStream in(&file);
  const QString content = in.readAll();

  const QString suffix = QFileInfo(path).suffix().toLower();
  if (suffix == "html" || suffix == "htm") {
    m_manuscriptEditor->replaceHtml(content);
  } else {
    m_manuscriptEditor->replacePlainText(content);
  }

  NOVELIST_LOG_INFO("Opened '{}'", path.toStdString());
  setWindowTitle(tr("Novelist - %1").arg(QFileInfo(path).fileName()));
  return true;
}

void NVMainWindow::onOpenRequested() {
  const QString path = QFileDialog::getOpenFileName(
      this, tr("Open"), QString(), tr("Text files (*.txt *.md *.html *.htm);;All files (*)"));
  if (path.isEmpty()) {
    return;
  }

  if (!openFile(path)) {
    QMessageBox::warning(this, tr("Open Failed"), tr("Could not open %1").arg(path));
  }
}

} // namespace Novelist::editor::qt
