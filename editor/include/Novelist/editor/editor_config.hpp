#pragma once

/**
 * @file editor_config.hpp
 * @brief Startup configuration of the editor
 *
 * Values come from the user's settings (QSettings, "Novelist"/"Editor") and
 * can be overridden on the command line:
 *
 *   novelist_editor --zoom-step 5 --zoom 120 --log-level debug --log-file editor.log
 *
 * Invalid values never abort startup: they are reported and the field keeps
 * its default.
 */

#include "Novelist/core/logger.hpp"
#include "Novelist/core/result.hpp"
#include "Novelist/editor/zoom_types.hpp"

#include <QStringList>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class QSettings;

namespace Novelist::editor {

struct EditorConfig {
  i32 zoomStep = DEFAULT_ZOOM_STEP;
  std::optional<ZoomLevel> initialZoom; // overrides the saved level, not persisted
  core::LogLevel logLevel = core::LogLevel::Info;
  std::string logFile;
};

namespace config_keys {
inline constexpr const char* ZOOM_STEP = "editor/zoomStep";
inline constexpr const char* LOG_LEVEL = "logging/level";
inline constexpr const char* LOG_FILE = "logging/file";
} // namespace config_keys

[[nodiscard]] Result<core::LogLevel> parseLogLevel(std::string_view name);
[[nodiscard]] Result<i32> validateZoomStep(i64 step);
[[nodiscard]] Result<ZoomLevel> validateInitialZoom(i64 level);

/**
 * @brief Read the configuration stored in @p settings
 * @param problems Receives one message per rejected value
 */
[[nodiscard]] EditorConfig loadEditorConfig(const QSettings& settings,
                                            std::vector<std::string>& problems);

/**
 * @brief Apply command-line overrides on top of @p config
 *
 * @p arguments includes the program name, as QCoreApplication::arguments().
 * Rejected option values are appended to @p problems; a malformed command
 * line (unknown option, missing value) is returned as an error.
 */
Result<void> applyCommandLine(EditorConfig& config, const QStringList& arguments,
                              std::vector<std::string>& problems);

/// Configure the process logger from @p config
void applyLoggingConfig(const EditorConfig& config);

} // namespace Novelist::editor
