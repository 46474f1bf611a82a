#pragma once

#include <cstdlib>
#include <string>

#include <QByteArray>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>

#include "RecognitionConfig.hpp"
#include "utils/Logger.hpp"

namespace sm {

namespace detail {

inline void readPositiveInt(const QJsonObject &obj, const char *key, int &target) {
  const QJsonValue value = obj.value(QLatin1String(key));
  if (value.isUndefined())
    return;
  const int parsed = value.toInt(0);
  if (!value.isDouble() || parsed < 1) {
    SM_LOG(LogLevel::Warn, std::string("Config: ignoring invalid ") + key);
    return;
  }
  target = parsed;
}

template <typename T>
void readNonNegative(const QJsonObject &obj, const char *key, T &target) {
  const QJsonValue value = obj.value(QLatin1String(key));
  if (value.isUndefined())
    return;
  if (!value.isDouble() || value.toDouble() < 0.0) {
    SM_LOG(LogLevel::Warn, std::string("Config: ignoring invalid ") + key);
    return;
  }
  target = static_cast<T>(value.toDouble());
}

} // namespace detail

// Applies the keys present in `obj` on top of `config`. Unknown keys are
// ignored; invalid values keep the previous setting.
inline void applyConfigObject(const QJsonObject &obj, RecognitionConfig &config) {
  detail::readPositiveInt(obj, "precision", config.precision);
  detail::readPositiveInt(obj, "libraryCount", config.libraryCount);
  detail::readNonNegative(obj, "drawDistance", config.drawDistance);
  detail::readNonNegative(obj, "overlapDistance", config.overlapDistance);

  const QJsonValue weights = obj.value(QStringLiteral("weights"));
  if (weights.isObject()) {
    const QJsonObject w = weights.toObject();
    detail::readNonNegative(w, "grid", config.weights.grid);
    detail::readNonNegative(w, "circle", config.weights.circle);
    detail::readNonNegative(w, "horizontal", config.weights.horizontal);
    detail::readNonNegative(w, "vertical", config.weights.vertical);
  }

  const QJsonValue libraryFile = obj.value(QStringLiteral("libraryFile"));
  if (libraryFile.isString() && !libraryFile.toString().isEmpty())
    config.libraryFile = libraryFile.toString().toStdString();

  const QJsonValue level = obj.value(QStringLiteral("logLevel"));
  if (level.isString())
    config.logLevel = parseLogLevel(level.toString().toStdString());
}

// SM_PRECISION and SM_LIBRARY_FILE win over the file.
inline void applyEnvironmentOverrides(RecognitionConfig &config) {
  if (const char *env = std::getenv("SM_PRECISION")) {
    const int precision = std::atoi(env);
    if (precision >= 1)
      config.precision = precision;
    else
      SM_LOG(LogLevel::Warn, std::string("Ignoring SM_PRECISION=") + env);
  }
  if (const char *env = std::getenv("SM_LIBRARY_FILE")) {
    if (*env)
      config.libraryFile = env;
  }
}

// Missing or malformed files leave the defaults in place.
inline RecognitionConfig loadRecognitionConfig(const std::string &path) {
  RecognitionConfig config;
  QFile file(QString::fromStdString(path));
  if (!file.open(QIODevice::ReadOnly)) {
    SM_LOG(LogLevel::Info, "No config at " + path + ", using defaults");
  } else {
    const QByteArray data = file.readAll();
    file.close();
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError) {
      SM_LOG(LogLevel::Warn, "Config " + path + " unreadable: " +
                                 error.errorString().toStdString());
    } else if (!doc.isObject()) {
      SM_LOG(LogLevel::Warn, "Config " + path + " is not a JSON object");
    } else {
      applyConfigObject(doc.object(), config);
    }
  }
  applyEnvironmentOverrides(config);
  return config;
}

} // namespace sm
