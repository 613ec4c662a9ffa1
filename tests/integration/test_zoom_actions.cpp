/**
 * @file test_zoom_actions.cpp
 * @brief Integration tests for the View menu zoom actions and main window
 */

#include <catch2/catch_test_macros.hpp>

#include "Novelist/editor/editor_config.hpp"
#include "Novelist/editor/qt/nv_main_window.hpp"
#include "Novelist/editor/qt/nv_zoom_actions.hpp"
#include "Novelist/editor/qt/nv_zoomable_text_edit.hpp"
#include "Novelist/editor/zoom_coordinator.hpp"

#include <QAction>
#include <QApplication>
#include <QFile>
#include <QKeySequence>
#include <QMenu>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTextStream>

using namespace Novelist;
using namespace Novelist::editor;
using namespace Novelist::editor::qt;

namespace {

void ensureQtApp() {
  if (!QApplication::instance()) {
    static int argc = 1;
    static char arg0[] = "integration_tests";
    static char* argv[] = {arg0, nullptr};
    new QApplication(argc, argv);
  }
}

bool writeFile(const QString& path, const QString& content) {
  QFile file(path);
  if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
    return false;
  }
  QTextStream out(&file);
  out << content;
  return true;
}

} // namespace

TEST_CASE("NVZoomActions drive the coordinator", "[zoom][qt][actions]") {
  ensureQtApp();
  ZoomCoordinator coordinator;
  NVZoomActions actions(&coordinator);
  QSignalSpy spy(&actions, &NVZoomActions::zoomLevelChanged);

  SECTION("initial state") {
    CHECK(actions.zoomInAction()->isEnabled());
    CHECK(actions.zoomOutAction()->isEnabled());
    CHECK_FALSE(actions.resetZoomAction()->isEnabled());
    CHECK(actions.statusText() == "Zoom: 100%");
    CHECK(actions.resetZoomAction()->shortcut() == QKeySequence("Ctrl+0"));
  }

  SECTION("zoom in") {
    actions.zoomInAction()->trigger();
    CHECK(coordinator.level() == 110);
    REQUIRE(spy.count() == 1);
    CHECK(spy.at(0).at(0).toInt() == 110);
    CHECK(actions.resetZoomAction()->isEnabled());
    CHECK(actions.statusText() == "Zoom: 110%");
  }

  SECTION("custom step") {
    actions.setZoomStep(25);
    actions.zoomOutAction()->trigger();
    CHECK(coordinator.level() == 75);
  }

  SECTION("reset") {
    coordinator.setLevel(180);
    actions.resetZoomAction()->trigger();
    CHECK(coordinator.level() == 100);
    CHECK(spy.count() == 2);
  }

  SECTION("level changes from elsewhere are reported") {
    coordinator.setLevel(60);
    REQUIRE(spy.count() == 1);
    CHECK(spy.at(0).at(0).toInt() == 60);
  }
}

TEST_CASE("NVZoomActions enablement at the bounds", "[zoom][qt][actions]") {
  ensureQtApp();
  ZoomCoordinator coordinator;
  NVZoomActions actions(&coordinator);

  coordinator.setLevel(MAX_ZOOM);
  CHECK_FALSE(actions.zoomInAction()->isEnabled());
  CHECK(actions.zoomOutAction()->isEnabled());

  coordinator.setLevel(MIN_ZOOM);
  CHECK(actions.zoomInAction()->isEnabled());
  CHECK_FALSE(actions.zoomOutAction()->isEnabled());

  SECTION("a coordinator already at a bound") {
    NVZoomActions late(&coordinator);
    CHECK_FALSE(late.zoomOutAction()->isEnabled());
  }
}

TEST_CASE("NVZoomActions lifecycle", "[zoom][qt][actions]") {
  ensureQtApp();

  SECTION("without a coordinator everything is disabled") {
    NVZoomActions actions(nullptr);
    CHECK_FALSE(actions.zoomInAction()->isEnabled());
    CHECK_FALSE(actions.zoomOutAction()->isEnabled());
    CHECK_FALSE(actions.resetZoomAction()->isEnabled());
    CHECK(actions.statusText() == "Zoom: 100%");
  }

  SECTION("destroyed actions stop listening") {
    ZoomCoordinator coordinator;
    {
      NVZoomActions actions(&coordinator);
    }
    REQUIRE_NOTHROW(coordinator.setLevel(120));
  }

  SECTION("menu population") {
    ZoomCoordinator coordinator;
    NVZoomActions actions(&coordinator);
    QMenu menu;
    actions.populateMenu(&menu);
    CHECK(menu.actions().size() == 3);
    REQUIRE_NOTHROW(actions.populateMenu(nullptr));
  }
}

TEST_CASE("NVMainWindow shares one zoom level between its editors", "[zoom][qt][main_window]") {
  ensureQtApp();
  ZoomCoordinator coordinator;
  EditorConfig config;
  config.zoomStep = 5;

  NVMainWindow window(&coordinator, config);
  REQUIRE(window.manuscriptEditor() != nullptr);
  REQUIRE(window.notesEditor() != nullptr);
  CHECK(coordinator.surfaceCount() == 2);
  CHECK(window.manuscriptEditor()->wheelZoomStep() == 5);
  CHECK(window.zoomActions()->zoomStep() == 5);

  window.zoomActions()->zoomInAction()->trigger();
  CHECK(coordinator.level() == 105);
  CHECK(window.manuscriptEditor()->zoomLevel() == 105);
  CHECK(window.notesEditor()->zoomLevel() == 105);

  SECTION("opening a file keeps the zoom level") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    const QString htmlPath = dir.filePath("chapter.html");
    REQUIRE(writeFile(htmlPath, "<h1>Chapter</h1><p>Body</p>"));
    REQUIRE(window.openFile(htmlPath));
    CHECK(window.manuscriptEditor()->toPlainText().contains("Chapter"));
    CHECK_FALSE(window.manuscriptEditor()->toPlainText().contains("<h1>"));

    const QString textPath = dir.filePath("notes.txt");
    REQUIRE(writeFile(textPath, "<h1> stays literal"));
    REQUIRE(window.openFile(textPath));
    CHECK(window.manuscriptEditor()->toPlainText() == "<h1> stays literal");

    CHECK(window.manuscriptEditor()->zoomLevel() == 105);
    CHECK(coordinator.level() == 105);
  }

  SECTION("missing file") {
    CHECK_FALSE(window.openFile("/nonexistent/novelist/chapter.txt"));
  }
}

TEST_CASE("NVMainWindow unregisters its editors on destruction", "[zoom][qt][main_window]") {
  ensureQtApp();
  ZoomCoordinator coordinator;
  {
    NVMainWindow window(&coordinator, EditorConfig{});
    CHECK(coordinator.surfaceCount() == 2);
  }
  CHECK(coordinator.surfaceCount() == 0);
}
