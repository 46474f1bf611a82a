#pragma once

#include <optional>
#include <string>
#include <vector>

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QString>

#include "core/recognition/CharacterLibrary.hpp"
#include "utils/Logger.hpp"

namespace sm {

// Reads and writes character libraries as JSON. Only the source points of
// each character are stored; bitmaps are rebuilt on load at the library's
// precision.
//
// {"version":1,"libraries":[{"name":..,"precision":..,
//   "weights":{"grid":..,"circle":..,"horizontal":..,"vertical":..},
//   "characters":[{"name":..,"points":[[x,y],...]}]}]}
class LibraryStore {
public:
  static constexpr int kFormatVersion = 1;

  static QJsonObject libraryToJson(const CharacterLibrary &library) {
    QJsonObject obj;
    obj.insert(QStringLiteral("name"), QString::fromStdString(library.name()));
    obj.insert(QStringLiteral("precision"), library.precision());

    QJsonObject weights;
    weights.insert(QStringLiteral("grid"), library.weights().grid);
    weights.insert(QStringLiteral("circle"), library.weights().circle);
    weights.insert(QStringLiteral("horizontal"), library.weights().horizontal);
    weights.insert(QStringLiteral("vertical"), library.weights().vertical);
    obj.insert(QStringLiteral("weights"), weights);

    QJsonArray characters;
    for (const Character &c : library.characters()) {
      // the blank reserved entry is rebuilt by the library itself
      if (c.name() == CharacterLibrary::kEmptyName && c.bitmap().pointCount() == 0)
        continue;
      QJsonArray points;
      for (const Point &p : c.bitmap().points())
        points.append(QJsonArray{static_cast<double>(p.x), static_cast<double>(p.y)});
      QJsonObject entry;
      entry.insert(QStringLiteral("name"), QString::fromStdString(c.name()));
      entry.insert(QStringLiteral("points"), points);
      characters.append(entry);
    }
    obj.insert(QStringLiteral("characters"), characters);
    return obj;
  }

  static std::optional<CharacterLibrary> libraryFromJson(const QJsonObject &obj) {
    const QString name = obj.value(QStringLiteral("name")).toString();
    if (name.isEmpty()) {
      SM_LOG(LogLevel::Warn, "Skipping library without a name");
      return std::nullopt;
    }
    const int precision = obj.value(QStringLiteral("precision")).toInt(4);
    CharacterLibrary library(name.toStdString(), precision);

    const QJsonObject w = obj.value(QStringLiteral("weights")).toObject();
    if (!library.setWeights(w.value(QStringLiteral("grid")).toDouble(1.0),
                            w.value(QStringLiteral("circle")).toDouble(1.0),
                            w.value(QStringLiteral("horizontal")).toDouble(1.0),
                            w.value(QStringLiteral("vertical")).toDouble(1.0)))
      SM_LOG(LogLevel::Warn, "Library " + library.name() + " keeps default weights");

    const QJsonArray characters = obj.value(QStringLiteral("characters")).toArray();
    for (const QJsonValue &value : characters) {
      const QJsonObject entry = value.toObject();
      const QString charName = entry.value(QStringLiteral("name")).toString();
      std::vector<Point> points;
      if (charName.isEmpty() || !readPoints(entry.value(QStringLiteral("points")), points)) {
        SM_LOG(LogLevel::Warn, "Skipping malformed character in library " + library.name());
        continue;
      }
      library.add(charName.toStdString(), Bitmap(std::move(points), library.precision()));
    }
    return library;
  }

  static bool save(const std::string &path, const std::vector<CharacterLibrary> &libraries) {
    const QString filePath = QString::fromStdString(path);
    QDir dir = QFileInfo(filePath).absoluteDir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
      SM_LOG(LogLevel::Error, "Cannot create directory for " + path);
      return false;
    }

    QJsonArray libs;
    for (const CharacterLibrary &library : libraries)
      libs.append(libraryToJson(library));
    QJsonObject root;
    root.insert(QStringLiteral("version"), kFormatVersion);
    root.insert(QStringLiteral("libraries"), libs);

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
      SM_LOG(LogLevel::Error, "Cannot write " + path);
      return false;
    }
    const QByteArray data = QJsonDocument(root).toJson(QJsonDocument::Indented);
    const bool ok = file.write(data) == data.size();
    file.close();
    if (!ok)
      SM_LOG(LogLevel::Error, "Short write to " + path);
    return ok;
  }

  static std::optional<std::vector<CharacterLibrary>> load(const std::string &path) {
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
      SM_LOG(LogLevel::Info, "No library file at " + path);
      return std::nullopt;
    }
    const QByteArray data = file.readAll();
    file.close();

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError) {
      SM_LOG(LogLevel::Error, "Library file " + path + " unreadable: " +
                                  error.errorString().toStdString());
      return std::nullopt;
    }
    if (!doc.isObject()) {
      SM_LOG(LogLevel::Error, "Library file " + path + " is not a JSON object");
      return std::nullopt;
    }
    const QJsonObject root = doc.object();
    const int version = root.value(QStringLiteral("version")).toInt(0);
    if (version != kFormatVersion) {
      SM_LOG(LogLevel::Error, "Library file " + path + " has unsupported version " +
                                  std::to_string(version));
      return std::nullopt;
    }

    std::vector<CharacterLibrary> libraries;
    const QJsonArray libs = root.value(QStringLiteral("libraries")).toArray();
    for (const QJsonValue &value : libs) {
      std::optional<CharacterLibrary> library = libraryFromJson(value.toObject());
      if (library)
        libraries.push_back(std::move(*library));
    }
    SM_LOG(LogLevel::Info, "Loaded " + std::to_string(libraries.size()) + " libraries from " + path);
    return libraries;
  }

private:
  static bool readPoints(const QJsonValue &value, std::vector<Point> &out) {
    if (!value.isArray())
      return false;
    const QJsonArray array = value.toArray();
    out.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue &pt : array) {
      const QJsonArray pair = pt.toArray();
      if (pair.size() != 2 || !pair.at(0).isDouble() || !pair.at(1).isDouble())
        return false;
      out.push_back({static_cast<float>(pair.at(0).toDouble()),
                     static_cast<float>(pair.at(1).toDouble())});
    }
    return true;
  }
};

} // namespace sm
