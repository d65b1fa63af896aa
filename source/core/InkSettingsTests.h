#ifndef INKSETTINGSTESTS_H
#define INKSETTINGSTESTS_H

#include <QObject>
#include <QTest>
#include <QSettings>
#include <QTemporaryDir>
#include "InkSettings.h"

/**
 * Unit tests for InkSettings validation, backed by a throwaway ini file.
 */
class InkSettingsTests : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_dir;

    QString iniPath(const QString& name) const { return m_dir.filePath(name + ".ini"); }

private slots:
    void initTestCase() {
        QVERIFY(m_dir.isValid());
    }

    void testDefaultsWhenEmpty() {
        QSettings settings(iniPath("empty"), QSettings::IniFormat);
        InkSettings loaded = InkSettings::load(settings);

        QCOMPARE(loaded.frameIntervalMs, 16);
        QCOMPARE(loaded.passiveOpacity, 0.35);
        QVERIFY(loaded.defaultTool == ToolType::Pen);
        QCOMPARE(loaded.defaultColor, QString("#000000"));
        QCOMPARE(loaded.defaultSize, 2.0);
        QVERIFY(!loaded.storageDirectory.isEmpty());
    }

    void testOutOfRangeValuesAreClamped() {
        QSettings settings(iniPath("clamp"), QSettings::IniFormat);
        settings.beginGroup("ink");
        settings.setValue("frameIntervalMs", 1);
        settings.setValue("passiveOpacity", 3.0);
        settings.setValue("defaultSize", 400.0);
        settings.endGroup();

        InkSettings loaded = InkSettings::load(settings);
        QCOMPARE(loaded.frameIntervalMs, InkSettings::MIN_FRAME_INTERVAL_MS);
        QCOMPARE(loaded.passiveOpacity, 1.0);
        QCOMPARE(loaded.defaultSize, InkSettings::MAX_SIZE);
    }

    void testUnparsableValuesFallBack() {
        QSettings settings(iniPath("invalid"), QSettings::IniFormat);
        settings.beginGroup("ink");
        settings.setValue("defaultTool", "crayon");
        settings.setValue("defaultColor", "not-a-color");
        settings.setValue("frameIntervalMs", "fast");
        settings.endGroup();

        InkSettings loaded = InkSettings::load(settings);
        QVERIFY(loaded.defaultTool == ToolType::Pen);
        QCOMPARE(loaded.defaultColor, QString("#000000"));
        QCOMPARE(loaded.frameIntervalMs, 16);
    }

    void testSaveThenLoad() {
        QSettings settings(iniPath("roundtrip"), QSettings::IniFormat);
        InkSettings original;
        original.storageDirectory = m_dir.filePath("records");
        original.frameIntervalMs = 33;
        original.passiveOpacity = 0.5;
        original.defaultTool = ToolType::Highlighter;
        original.defaultColor = "rgba(255, 0, 0, 0.5)";
        original.defaultSize = 8.0;
        original.save(settings);
        settings.sync();

        InkSettings loaded = InkSettings::load(settings);
        QCOMPARE(loaded.storageDirectory, original.storageDirectory);
        QCOMPARE(loaded.frameIntervalMs, 33);
        QCOMPARE(loaded.passiveOpacity, 0.5);
        QVERIFY(loaded.defaultTool == ToolType::Highlighter);
        QCOMPARE(loaded.defaultColor, original.defaultColor);
        QCOMPARE(loaded.defaultSize, 8.0);
    }
};

inline int runInkSettingsTests() {
    InkSettingsTests tests;
    return QTest::qExec(&tests);
}

#endif // INKSETTINGSTESTS_H
