#pragma once

/**
 * @file nv_zoomable_text_edit.hpp
 * @brief QTextEdit that follows the editor-wide zoom level
 *
 * Every text editor in Novelist derives from NVZoomableTextEdit so that:
 * - it registers with the ZoomCoordinator and starts at the current level
 * - Ctrl+wheel zooms every editor, not just the one under the cursor
 * - replacing its content (replaceHtml/replacePlainText/replaceText) keeps
 *   the zoom level
 *
 * One zoom percentage point is one rendering step of 1% of the base font
 * size, so 200% renders the base font at twice its size.
 */

#include "Novelist/editor/zoomable_surface.hpp"

#include <QFont>
#include <QTextEdit>

class QCloseEvent;
class QWheelEvent;

namespace Novelist::editor::qt {

class NVZoomableTextEdit : public QTextEdit, public ZoomableSurface {
  Q_OBJECT

public:
  /**
   * @param coordinator Zoom coordinator, must outlive this widget (may be null)
   * @param autoRegister Register with @p coordinator right away
   */
  explicit NVZoomableTextEdit(ZoomCoordinator* coordinator, QWidget* parent = nullptr,
                              bool autoRegister = true);
  ~NVZoomableTextEdit() override;

  void replaceHtml(const QString& html);
  void replacePlainText(const QString& text);

  /// Replace as HTML when @p text contains both '<' and '>', as plain text otherwise
  void replaceText(const QString& text);

  /// Step used for Ctrl+wheel zoom requests
  void setWheelZoomStep(i32 step) { m_wheelZoomStep = step; }
  [[nodiscard]] i32 wheelZoomStep() const { return m_wheelZoomStep; }

  /// Base font size that renders at 100%
  [[nodiscard]] qreal basePointSize() const { return m_basePointSize; }

  [[nodiscard]] std::string zoomableName() const override;

protected:
  void zoomStepIn() override;
  void zoomStepOut() override;
  void performContentReplacement(const std::string& content, ContentFormat format) override;
  [[nodiscard]] ZoomLevel contentResetBaseline() const override { return m_renderedLevel; }

  void wheelEvent(QWheelEvent* event) override;
  void closeEvent(QCloseEvent* event) override;

private:
  void renderAt(i64 level);
  [[nodiscard]] ZoomLevel levelFromFont() const;

  qreal m_basePointSize = 10.0;
  ZoomLevel m_renderedLevel = DEFAULT_ZOOM;
  i32 m_wheelZoomStep = DEFAULT_ZOOM_STEP;
};

/**
 * @brief Plain-text variant (rich text paste disabled)
 */
class NVZoomablePlainTextEdit : public NVZoomableTextEdit {
  Q_OBJECT

public:
  explicit NVZoomablePlainTextEdit(ZoomCoordinator* coordinator, QWidget* parent = nullptr,
                                   bool autoRegister = true);
};

/**
 * @brief Rich-text variant
 */
class NVZoomableRichTextEdit : public NVZoomableTextEdit {
  Q_OBJECT

public:
  explicit NVZoomableRichTextEdit(ZoomCoordinator* coordinator, QWidget* parent = nullptr,
                                  bool autoRegister = true);
};

} // namespace Novelist::editor::qt
