#pragma once

#include "platenconstants.h"

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

// Print preferences remembered per document.
struct Preferences {
    QString fontName = QStringLiteral("Courier");
    bool doubleSpaced = false;
    bool doubleSided = true;
    int lineLength = PlatenConstants::DocumentWidth;
    QString lastSavePath;

    bool operator==(const Preferences &other) const;
    bool operator!=(const Preferences &other) const { return !(*this == other); }
};

// JSON settings file mapping absolute document paths to their preferences.
// The host loads once at startup and saves once at exit.
class PreferencesStore {
public:
    explicit PreferencesStore(const QString &filePath = defaultFilePath());

    static QString defaultFilePath();
    const QString &filePath() const { return m_filePath; }

    Preferences loadPreferences(const QString &documentPath);
    bool savePreferences(const QString &documentPath, const Preferences &preferences);
    void clear();

    static bool validateSetting(const QString &key, const QJsonValue &value);

private:
    QJsonObject loadAll();
    static QString documentKey(const QString &documentPath);

    QString m_filePath;
    QJsonObject m_cache;
    bool m_cached = false;
};
