#include "Novelist/editor/qt/nv_zoomable_text_edit.hpp"

#include <QCloseEvent>
#include <QWheelEvent>
#include <algorithm>

namespace Novelist::editor::qt {

NVZoomableTextEdit::NVZoomableTextEdit(ZoomCoordinator* coordinator, QWidget* parent,
                                       bool autoRegister)
    : QTextEdit(parent), ZoomableSurface(coordinator) {
  // Pixel-sized fonts report -1; fall back to a point size we can scale
  m_basePointSize = font().pointSizeF();
  if (m_basePointSize <= 0.0) {
    m_basePointSize = 10.0;
    renderAt(DEFAULT_ZOOM);
  }

  if (autoRegister) {
    attachToCoordinator();
  }
}

NVZoomableTextEdit::~NVZoomableTextEdit() { detachFromCoordinator(); }

void NVZoomableTextEdit::replaceHtml(const QString& html) {
  replaceContent(html.toStdString(), ContentFormat::RichText);
}

void NVZoomableTextEdit::replacePlainText(const QString& text) {
  replaceContent(text.toStdString(), ContentFormat::PlainText);
}

void NVZoomableTextEdit::replaceText(const QString& text) {
  if (text.contains(QLatin1Char('<')) && text.contains(QLatin1Char('>'))) {
    replaceHtml(text);
  } else {
    replacePlainText(text);
  }
}

std::string NVZoomableTextEdit::zoomableName() const {
  const QString name = objectName();
  return name.isEmpty() ? std::string(metaObject()->className()) : name.toStdString();
}

void NVZoomableTextEdit::zoomStepIn() { renderAt(static_cast<i64>(m_renderedLevel) + 1); }

void NVZoomableTextEdit::zoomStepOut() { renderAt(static_cast<i64>(m_renderedLevel) - 1); }

void NVZoomableTextEdit::performContentReplacement(const std::string& content,
                                                   ContentFormat format) {
  const QString text = QString::fromStdString(content);
  if (format == ContentFormat::RichText) {
    QTextEdit::setHtml(text);
  } else {
    QTextEdit::setPlainText(text);
  }

  // Whatever the replacement did to the font is what we are rendering now
  m_renderedLevel = levelFromFont();
}

void NVZoomableTextEdit::wheelEvent(QWheelEvent* event) {
  if (event->modifiers().testFlag(Qt::ControlModifier)) {
    const int delta = event->angleDelta().y();
    if (delta > 0) {
      increaseZoom(m_wheelZoomStep);
    } else if (delta < 0) {
      decreaseZoom(m_wheelZoomStep);
    }
    event->accept();
    return;
  }

  QTextEdit::wheelEvent(event);
}

void NVZoomableTextEdit::closeEvent(QCloseEvent* event) {
  detachFromCoordinator();
  QTextEdit::closeEvent(event);
}

void NVZoomableTextEdit::renderAt(i64 level) {
  m_renderedLevel = static_cast<ZoomLevel>(level);

  QFont scaled = font();
  scaled.setPointSizeF(std::max<qreal>(1.0, m_basePointSize * static_cast<qreal>(level) / 100.0));
  setFont(scaled);
}

ZoomLevel NVZoomableTextEdit::levelFromFont() const {
  const qreal pointSize = font().pointSizeF();
  if (pointSize <= 0.0) {
    return DEFAULT_ZOOM;
  }
  return static_cast<ZoomLevel>(qRound(100.0 * pointSize / m_basePointSize));
}

// ============================================================================
// Variants
// ============================================================================

NVZoomablePlainTextEdit::NVZoomablePlainTextEdit(ZoomCoordinator* coordinator, QWidget* parent,
                                                 bool autoRegister)
    : NVZoomableTextEdit(coordinator, parent, autoRegister) {
  setAcceptRichText(false);
}

NVZoomableRichTextEdit::NVZoomableRichTextEdit(ZoomCoordinator* coordinator, QWidget* parent,
                                               bool autoRegister)
    : NVZoomableTextEdit(coordinator, parent, autoRegister) {
  setAcceptRichText(true);
}

} // namespace Novelist::editor::qt
