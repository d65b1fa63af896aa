#include "InkSettings.h"
#include "../render/StrokeRenderer.h"

#include <QDebug>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>

QString InkSettings::defaultStorageDirectory()
{
    return QDir(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation))
        .filePath(QStringLiteral("annotations"));
}

InkSettings InkSettings::load()
{
    QSettings settings("VerseInk", "App");
    return load(settings);
}

InkSettings InkSettings::load(QSettings& settings)
{
    InkSettings result;

    settings.beginGroup("ink");

    result.storageDirectory = settings.value("storageDirectory").toString();
    if (result.storageDirectory.isEmpty()) {
        result.storageDirectory = defaultStorageDirectory();
    }

    bool ok = false;
    int interval = settings.value("frameIntervalMs", result.frameIntervalMs).toInt(&ok);
    if (ok) {
        result.frameIntervalMs = qBound(MIN_FRAME_INTERVAL_MS, interval, MAX_FRAME_INTERVAL_MS);
    }

    qreal opacity = settings.value("passiveOpacity", result.passiveOpacity).toDouble(&ok);
    if (ok) {
        result.passiveOpacity = qBound(0.0, opacity, 1.0);
    }

    if (settings.contains("defaultTool")) {
        ToolType tool = toolFromName(settings.value("defaultTool").toString(), &ok);
        if (ok) {
            result.defaultTool = tool;
        } else {
            qWarning() << "InkSettings: Unknown default tool" << settings.value("defaultTool").toString();
        }
    }

    const QString color = settings.value("defaultColor", result.defaultColor).toString();
    StrokeRenderer::parseColor(color, &ok);
    if (ok) {
        result.defaultColor = color;
    } else {
        qWarning() << "InkSettings: Invalid default color" << color;
    }

    qreal size = settings.value("defaultSize", result.defaultSize).toDouble(&ok);
    if (ok) {
        result.defaultSize = qBound(MIN_SIZE, size, MAX_SIZE);
    }

    settings.endGroup();
    return result;
}

void InkSettings::save() const
{
    QSettings settings("VerseInk", "App");
    save(settings);
}

void InkSettings::save(QSettings& settings) const
{
    settings.beginGroup("ink");
    settings.setValue("storageDirectory", storageDirectory);
    settings.setValue("frameIntervalMs", frameIntervalMs);
    settings.setValue("passiveOpacity", passiveOpacity);
    settings.setValue("defaultTool", toolName(defaultTool));
    settings.setValue("defaultColor", defaultColor);
    settings.setValue("defaultSize", defaultSize);
    settings.endGroup();
}
