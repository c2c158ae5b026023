#include "preferencesstore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>
#include <QStandardPaths>
#include <QtMath>

namespace {

const QString FontNameKey = QStringLiteral("print_font_name");
const QString DoubleSpacingKey = QStringLiteral("double_spacing");
const QString DuplexKey = QStringLiteral("duplex_printing");
const QString LineLengthKey = QStringLiteral("line_length");
const QString LastSavePathKey = QStringLiteral("last_save_path");

constexpr int MinLineLength = 40;
constexpr int MaxLineLength = 120;

} // namespace

bool Preferences::operator==(const Preferences &other) const
{
    return fontName == other.fontName && doubleSpaced == other.doubleSpaced
        && doubleSided == other.doubleSided && lineLength == other.lineLength
        && lastSavePath == other.lastSavePath;
}

PreferencesStore::PreferencesStore(const QString &filePath)
    : m_filePath(filePath)
{
}

QString PreferencesStore::defaultFilePath()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation) + QStringLiteral("/settings.json");
}

Preferences PreferencesStore::loadPreferences(const QString &documentPath)
{
    Preferences preferences;
    if (documentPath.isEmpty()) {
        return preferences;
    }

    const QString key = documentKey(documentPath);
    const QJsonValue entry = loadAll().value(key);
    if (entry.isUndefined()) {
        return preferences;
    }
    if (!entry.isObject()) {
        qWarning() << "[PreferencesStore] Settings for" << key << "are not an object, ignoring";
        return preferences;
    }

    const QJsonObject settings = entry.toObject();
    for (auto it = settings.constBegin(); it != settings.constEnd(); ++it) {
        if (!validateSetting(it.key(), it.value())) {
            qWarning() << "[PreferencesStore] Dropping invalid setting" << it.key() << "for" << key;
            continue;
        }
        if (it.value().isNull()) {
            continue;
        }
        if (it.key() == FontNameKey) {
            preferences.fontName = it.value().toString();
        } else if (it.key() == DoubleSpacingKey) {
            preferences.doubleSpaced = it.value().toBool();
        } else if (it.key() == DuplexKey) {
            preferences.doubleSided = it.value().toBool();
        } else if (it.key() == LineLengthKey) {
            preferences.lineLength = it.value().toInt();
        } else if (it.key() == LastSavePathKey) {
            preferences.lastSavePath = it.value().toString();
        }
    }
    return preferences;
}

bool PreferencesStore::savePreferences(const QString &documentPath, const Preferences &preferences)
{
    if (documentPath.isEmpty()) {
        return false;
    }

    QJsonObject all = loadAll();
    const QString key = documentKey(documentPath);

    // Keys this version does not know about are kept.
    QJsonObject settings = all.value(key).toObject();
    settings.insert(FontNameKey, preferences.fontName);
    settings.insert(DoubleSpacingKey, preferences.doubleSpaced);
    settings.insert(DuplexKey, preferences.doubleSided);
    settings.insert(LineLengthKey, preferences.lineLength);
    if (preferences.lastSavePath.isEmpty()) {
        settings.remove(LastSavePathKey);
    } else {
        settings.insert(LastSavePathKey, preferences.lastSavePath);
    }
    all.insert(key, settings);

    const QFileInfo info(m_filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        qWarning() << "[PreferencesStore] Could not create" << info.absolutePath();
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[PreferencesStore] Could not open" << m_filePath << ":" << file.errorString();
        return false;
    }
    const QByteArray data = QJsonDocument(all).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size()) {
        qWarning() << "[PreferencesStore] Write failed:" << file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        qWarning() << "[PreferencesStore] Could not save" << m_filePath << ":" << file.errorString();
        return false;
    }

    m_cache = all;
    m_cached = true;
    return true;
}

void PreferencesStore::clear()
{
    m_cache = QJsonObject();
    m_cached = false;
}

bool PreferencesStore::validateSetting(const QString &key, const QJsonValue &value)
{
    if (value.isNull()) {
        return true;
    }
    if (key == FontNameKey || key == LastSavePathKey) {
        return value.isString();
    }
    if (key == DoubleSpacingKey || key == DuplexKey) {
        return value.isBool();
    }
    if (key == LineLengthKey) {
        if (!value.isDouble()) {
            return false;
        }
        const double length = value.toDouble();
        return length == qFloor(length) && length >= MinLineLength && length <= MaxLineLength;
    }
    // Unknown keys are passed through untouched.
    return true;
}

QJsonObject PreferencesStore::loadAll()
{
    if (m_cached) {
        return m_cache;
    }
    m_cached = true;
    m_cache = QJsonObject();

    QFile file(m_filePath);
    if (!file.exists()) {
        return m_cache;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[PreferencesStore] Could not read" << m_filePath << ":" << file.errorString();
        return m_cache;
    }

    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        qWarning() << "[PreferencesStore] Settings file" << m_filePath << "is not a JSON object, ignoring";
        return m_cache;
    }
    m_cache = document.object();
    return m_cache;
}

QString PreferencesStore::documentKey(const QString &documentPath)
{
    return QFileInfo(documentPath).absoluteFilePath();
}
