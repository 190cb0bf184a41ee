#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <memory>

#include "Settings.h"

class tst_Settings : public QObject {
    Q_OBJECT

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<Settings> m_settings;

private slots:
    void init()
    {
        m_dir = std::make_unique<QTemporaryDir>();
        QVERIFY(m_dir->isValid());
        m_settings = std::make_unique<Settings>(m_dir->filePath(QStringLiteral("reshelf.ini")));
    }

    void cleanup()
    {
        m_settings.reset();
        m_dir.reset();
    }

    // ── Defaults ─────────────────────────────────────────────────
    void defaults()
    {
        QCOMPARE(m_settings->activeTemplate(), QStringLiteral("default"));
        QCOMPARE(m_settings->organizeMode(), QStringLiteral("simulate"));
        QVERIFY(m_settings->destinationRoot().isEmpty());
        QVERIFY(!m_settings->requireYear());
        QCOMPARE(m_settings->albumMode(), QStringLiteral("tags"));
        QVERIFY(m_settings->fallbackToTags());
        QCOMPARE(m_settings->maxDisambiguation(), 99);
        QCOMPARE(m_settings->substitute(), QStringLiteral("_"));
        QCOMPARE(m_settings->maxSegmentLength(), 200);
        QCOMPARE(m_settings->duplicatePolicy(), QStringLiteral("skip"));
        QVERIFY(!m_settings->useContentHash());
        QCOMPARE(m_settings->hashSampleSize(), qint64(64 * 1024));
        QCOMPARE(m_settings->durationTolerance(), 1.0);
        QCOMPARE(m_settings->maxRetries(), 3);
        QCOMPARE(m_settings->retryDelayMs(), 50);
    }

    void defaults_stateLivesBesideIniFile()
    {
        const QString dir = m_dir->path();
        QCOMPARE(m_settings->dataDirectory(), dir);
        QCOMPARE(m_settings->undoLogPath(), dir + QStringLiteral("/undo.jsonl"));
        QCOMPARE(m_settings->quarantineDir(), dir + QStringLiteral("/quarantine"));
        QCOMPARE(m_settings->trashDir(), dir + QStringLiteral("/trash"));

        m_settings->setTrashDir(QStringLiteral("/elsewhere/trash"));
        QCOMPARE(m_settings->trashDir(), QStringLiteral("/elsewhere/trash"));
    }

    // ── Templates ────────────────────────────────────────────────
    void templates_builtins()
    {
        QCOMPARE(m_settings->templatePattern(QStringLiteral("default")),
                 QStringLiteral("{Genero}/{Año}/{Artista}/{Álbum}/{TrackNo - Título}.{ext}"));
        QCOMPARE(m_settings->templatePattern(QStringLiteral("artist-album")),
                 QStringLiteral("{Artista}/{Álbum}/{TrackNo - Título}.{ext}"));
        QVERIFY(m_settings->templatePattern(QStringLiteral("release")).contains(QStringLiteral("{ReleaseID}")));
        QCOMPARE(Settings::tagFallbackTemplate(), Settings::builtinTemplate(QStringLiteral("artist-album")));
    }

    void templates_configuredOverridesBuiltin()
    {
        QSignalSpy spy(m_settings.get(), &Settings::templatesChanged);
        m_settings->setTemplatePattern(QStringLiteral("default"), QStringLiteral("{Artista}/{Título}.{ext}"));
        m_settings->setTemplatePattern(QStringLiteral("mine"), QStringLiteral("{Álbum}/{Título}.{ext}"));
        QCOMPARE(spy.count(), 2);

        QCOMPARE(m_settings->templatePattern(QStringLiteral("default")),
                 QStringLiteral("{Artista}/{Título}.{ext}"));
        QCOMPARE(m_settings->templatePattern(QStringLiteral("mine")),
                 QStringLiteral("{Álbum}/{Título}.{ext}"));

        const QStringList names = m_settings->templateNames();
        QCOMPARE(names.mid(0, 3), (QStringList{QStringLiteral("default"), QStringLiteral("artist-album"),
                                               QStringLiteral("release")}));
        QVERIFY(names.contains(QStringLiteral("mine")));
        QCOMPARE(names.count(QStringLiteral("default")), 1);
    }

    void templates_unknownNameIsPattern()
    {
        const QString pattern = QStringLiteral("{Artista} - {Título}.{ext}");
        QCOMPARE(m_settings->templatePattern(pattern), pattern);
    }

    void templates_hasTemplate()
    {
        QVERIFY(m_settings->hasTemplate(QStringLiteral("default")));
        QVERIFY(m_settings->hasTemplate(QStringLiteral("release")));
        QVERIFY(!m_settings->hasTemplate(QStringLiteral("artst-album")));

        m_settings->setTemplatePattern(QStringLiteral("mine"), QStringLiteral("{Título}.{ext}"));
        QVERIFY(m_settings->hasTemplate(QStringLiteral("mine")));
    }

    // ── Signals ──────────────────────────────────────────────────
    void signals_emitted()
    {
        QSignalSpy templates(m_settings.get(), &Settings::templatesChanged);
        QSignalSpy root(m_settings.get(), &Settings::destinationRootChanged);

        m_settings->setActiveTemplate(QStringLiteral("release"));
        m_settings->setDestinationRoot(QStringLiteral("/library"));

        QCOMPARE(templates.count(), 1);
        QCOMPARE(root.count(), 1);
        QCOMPARE(root.takeFirst().at(0).toString(), QStringLiteral("/library"));
        QCOMPARE(m_settings->activeTemplate(), QStringLiteral("release"));
        QCOMPARE(m_settings->destinationRoot(), QStringLiteral("/library"));
    }

    // ── Bounds ───────────────────────────────────────────────────
    void bounds_clamped()
    {
        m_settings->setMaxDisambiguation(0);
        QCOMPARE(m_settings->maxDisambiguation(), 2);
        m_settings->setMaxSegmentLength(1000);
        QCOMPARE(m_settings->maxSegmentLength(), 255);
        m_settings->setMaxSegmentLength(1);
        QCOMPARE(m_settings->maxSegmentLength(), 16);
        m_settings->setMaxRetries(-4);
        QCOMPARE(m_settings->maxRetries(), 0);
        m_settings->setHashSampleSize(0);
        QCOMPARE(m_settings->hashSampleSize(), qint64(64 * 1024));
        m_settings->setDurationTolerance(-1.0);
        QCOMPARE(m_settings->durationTolerance(), 1.0);
    }

    // ── Persistence ──────────────────────────────────────────────
    void persistence_reloadsFromIni()
    {
        m_settings->setDuplicatePolicy(QStringLiteral("quarantine"));
        m_settings->setRequireYear(true);
        m_settings->sync();

        Settings reopened(m_settings->fileName());
        QCOMPARE(reopened.duplicatePolicy(), QStringLiteral("quarantine"));
        QVERIFY(reopened.requireYear());
    }
};

QTEST_MAIN(tst_Settings)
#include "tst_Settings.moc"
