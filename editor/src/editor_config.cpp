#include "Novelist/editor/editor_config.hpp"

#include <QCommandLineParser>
#include <QSettings>
#include <algorithm>
#include <array>
#include <cctype>

namespace Novelist::editor {

namespace {

struct LogLevelName {
  const char* name;
  core::LogLevel level;
};

constexpr std::array<LogLevelName, 8> kLogLevelNames = {{
    {"trace", core::LogLevel::Trace},
    {"debug", core::LogLevel::Debug},
    {"info", core::LogLevel::Info},
    {"warning", core::LogLevel::Warning},
    {"warn", core::LogLevel::Warning},
    {"error", core::LogLevel::Error},
    {"fatal", core::LogLevel::Fatal},
    {"off", core::LogLevel::Off},
}};

std::string toLower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

} // namespace

Result<core::LogLevel> parseLogLevel(std::string_view name) {
  const std::string lowered = toLower(name);
  for (const auto& entry : kLogLevelNames) {
    if (lowered == entry.name) {
      return Result<core::LogLevel>::ok(entry.level);
    }
  }
  return Result<core::LogLevel>::error("Unknown log level '" + std::string(name) + "'");
}

Result<i32> validateZoomStep(i64 step) {
  constexpr i64 maxStep = MAX_ZOOM - MIN_ZOOM;
  if (step < 1 || step > maxStep) {
    return Result<i32>::error("Zoom step " + std::to_string(step) + " must be between 1 and " +
                              std::to_string(maxStep));
  }
  return Result<i32>::ok(static_cast<i32>(step));
}

Result<ZoomLevel> validateInitialZoom(i64 level) {
  if (!isValidZoomLevel(level)) {
    return Result<ZoomLevel>::error("Zoom level " + std::to_string(level) + "% must be between " +
                                    std::to_string(MIN_ZOOM) + "% and " +
                                    std::to_string(MAX_ZOOM) + "%");
  }
  return Result<ZoomLevel>::ok(static_cast<ZoomLevel>(level));
}

EditorConfig loadEditorConfig(const QSettings& settings, std::vector<std::string>& problems) {
  EditorConfig config;

  if (settings.contains(config_keys::ZOOM_STEP)) {
    bool ok = false;
    const int step = settings.value(config_keys::ZOOM_STEP).toInt(&ok);
    auto validated = ok ? validateZoomStep(step)
                        : Result<i32>::error(std::string(config_keys::ZOOM_STEP) +
                                             " is not an integer");
    if (validated.isOk()) {
      config.zoomStep = validated.value();
    } else {
      problems.push_back(validated.error());
    }
  }

  if (settings.contains(config_keys::LOG_LEVEL)) {
    const std::string name = settings.value(config_keys::LOG_LEVEL).toString().toStdString();
    auto level = parseLogLevel(name);
    if (level.isOk()) {
      config.logLevel = level.value();
    } else {
      problems.push_back(level.error());
    }
  }

  config.logFile = settings.value(config_keys::LOG_FILE).toString().toStdString();
  return config;
}

Result<void> applyCommandLine(EditorConfig& config, const QStringList& arguments,
                              std::vector<std::string>& problems) {
  QCommandLineParser parser;

  const QCommandLineOption zoomStepOption("zoom-step", "Zoom step in percent.", "percent");
  const QCommandLineOption zoomOption("zoom", "Initial zoom level in percent.", "percent");
  const QCommandLineOption logLevelOption(
      "log-level", "Log level (trace, debug, info, warning, error, off).", "level");
  const QCommandLineOption logFileOption("log-file", "Also write the log to this file.", "path");
  parser.addOption(zoomStepOption);
  parser.addOption(zoomOption);
  parser.addOption(logLevelOption);
  parser.addOption(logFileOption);

  if (!parser.parse(arguments)) {
    return Result<void>::error(parser.errorText().toStdString());
  }

  if (parser.isSet(zoomStepOption)) {
    bool ok = false;
    const qlonglong step = parser.value(zoomStepOption).toLongLong(&ok);
    auto validated =
        ok ? validateZoomStep(step)
           : Result<i32>::error("--zoom-step expects an integer, got '" +
                                parser.value(zoomStepOption).toStdString() + "'");
    if (validated.isOk()) {
      config.zoomStep = validated.value();
    } else {
      problems.push_back(validated.error());
    }
  }

  if (parser.isSet(zoomOption)) {
    bool ok = false;
    const qlonglong level = parser.value(zoomOption).toLongLong(&ok);
    auto validated =
        ok ? validateInitialZoom(level)
           : Result<ZoomLevel>::error("--zoom expects an integer, got '" +
                                      parser.value(zoomOption).toStdString() + "'");
    if (validated.isOk()) {
      config.initialZoom = validated.value();
    } else {
      problems.push_back(validated.error());
    }
  }

  if (parser.isSet(logLevelOption)) {
    auto level = parseLogLevel(parser.value(logLevelOption).toStdString());
    if (level.isOk()) {
      config.logLevel = level.value();
    } else {
      problems.push_back(level.error());
    }
  }

  if (parser.isSet(logFileOption)) {
    config.logFile = parser.value(logFileOption).toStdString();
  }

  return Result<void>::ok();
}

void applyLoggingConfig(const EditorConfig& config) {
  auto& logger = core::Logger::instance();
  logger.setLevel(config.logLevel);

  if (!config.logFile.empty() && !logger.setOutputFile(config.logFile)) {
    NOVELIST_LOG_WARN("Could not open log file '{}'", config.logFile);
  }
}

} // namespace Novelist::editor
