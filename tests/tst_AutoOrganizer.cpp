#include <QtTest/QtTest>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <memory>

#include "Settings.h"
#include "library/AutoOrganizer.h"
#include "library/LibraryDatabase.h"
#include "organizer/FileOperations.h"

static bool writeFile(const QString& path, const QByteArray& data)
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly))
        return false;
    return f.write(data) == data.size();
}

class tst_AutoOrganizer : public QObject {
    Q_OBJECT

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<LibraryDatabase> m_db;
    std::unique_ptr<Settings> m_settings;
    LocalFileOperations m_fileOps;
    QString m_incoming;
    QString m_library;

    QString addFile(const QString& id, const QString& artist, const QString& title,
                    int bitrate = 900, const QByteArray& body = QByteArray())
    {
        const QString path = m_incoming + QLatin1Char('/') + id + QStringLiteral(".flac");
        const QByteArray content = body.isEmpty()
            ? QByteArrayLiteral("fLaC") + id.toUtf8().repeated(256)
            : body;
        writeFile(path, content);

        Track t;
        t.id = id;
        t.filePath = path;
        t.fileSize = content.size();
        t.duration = 200.0;
        t.format = AudioFormat::FLAC;
        t.bitrate = bitrate;
        t.artist = artist;
        t.title = title;
        t.album = QStringLiteral("Album");
        m_db->insertTrack(t);
        return path;
    }

    OrganizeRequest request(OrganizeMode mode) const
    {
        OrganizeRequest req;
        req.templateName = QStringLiteral("flat");
        req.mode = mode;
        return req;
    }

private slots:
    void init()
    {
        m_dir = std::make_unique<QTemporaryDir>();
        QVERIFY(m_dir->isValid());
        m_incoming = m_dir->filePath(QStringLiteral("incoming"));
        m_library = m_dir->filePath(QStringLiteral("library"));
        QVERIFY(QDir().mkpath(m_incoming));
        QVERIFY(QDir().mkpath(m_dir->filePath(QStringLiteral("state"))));

        m_settings = std::make_unique<Settings>(m_dir->filePath(QStringLiteral("state/reshelf.ini")));
        m_settings->setTemplatePattern(QStringLiteral("flat"), QStringLiteral("{Artista}/{Título}.{ext}"));
        m_settings->setDestinationRoot(m_library);
        m_settings->setRetryDelayMs(0);

        m_db = std::make_unique<LibraryDatabase>(m_dir->filePath(QStringLiteral("state/library.sqlite")));
        QVERIFY(m_db->open());
    }

    void cleanup()
    {
        m_db->close();
        m_db.reset();
        m_settings.reset();
        m_dir.reset();
    }

    // ── Setup errors ─────────────────────────────────────────────
    void preview_requiresDestinationRoot()
    {
        m_settings->setDestinationRoot(QString());
        addFile(QStringLiteral("a"), QStringLiteral("Artist"), QStringLiteral("Song"));

        AutoOrganizer organizer(*m_db, *m_settings, m_fileOps);
        QString error;
        QVERIFY(!organizer.preview(request(OrganizeMode::Move), &error).has_value());
        QCOMPARE(error, QStringLiteral("No destination root configured"));
    }

    void organize_rejectsBrokenTemplate()
    {
        const QString source = addFile(QStringLiteral("a"), QStringLiteral("Artist"), QStringLiteral("Song"));

        AutoOrganizer organizer(*m_db, *m_settings, m_fileOps);
        OrganizeRequest req = request(OrganizeMode::Move);
        req.templateName = QStringLiteral("{Artista/{Título}.{ext}");
        const OrganizeResult result = organizer.organize(req);

        QVERIFY(!result.ok());
        QVERIFY(!result.error.isEmpty());
        QVERIFY(result.plan.entries.isEmpty());
        QVERIFY(QFile::exists(source));
        QVERIFY(organizer.history().isEmpty());
    }

    void organize_rejectsMisspelledTemplateName()
    {
        const QString source = addFile(QStringLiteral("a"), QStringLiteral("Artist"), QStringLiteral("Song"));

        AutoOrganizer organizer(*m_db, *m_settings, m_fileOps);
        OrganizeRequest req = request(OrganizeMode::Move);
        req.templateName = QStringLiteral("artst-album");
        const OrganizeResult result = organizer.organize(req);

        QVERIFY(!result.ok());
        QCOMPARE(result.error, QStringLiteral("no template named 'artst-album'"));
        QVERIFY(result.plan.entries.isEmpty());
        QVERIFY(QFile::exists(source));

        // A raw pattern is still accepted
        req.templateName = QStringLiteral("{Artista}/{Título}.{ext}");
        req.mode = OrganizeMode::Simulate;
        QVERIFY(organizer.organize(req).ok());
    }

    // ── Simulate ─────────────────────────────────────────────────
    void organize_simulateTouchesNothing()
    {
        const QString source = addFile(QStringLiteral("a"), QStringLiteral("Artist"), QStringLiteral("Song"));

        AutoOrganizer organizer(*m_db, *m_settings, m_fileOps);
        const OrganizeResult result = organizer.organize(request(OrganizeMode::Simulate));

        QVERIFY(result.ok());
        QCOMPARE(result.report.succeeded, 1);
        QVERIFY(result.report.batchId.isEmpty());
        QVERIFY(QFile::exists(source));
        QVERIFY(!QDir(m_library).exists());
        QCOMPARE(m_db->trackById(QStringLiteral("a"))->filePath, source);
        QVERIFY(!QFile::exists(m_settings->undoLogPath()));
    }

    // ── Move + undo ──────────────────────────────────────────────
    void organize_moveUpdatesCatalogAndUndoRestores()
    {
        const QString a = addFile(QStringLiteral("a"), QStringLiteral("Alpha"), QStringLiteral("One"));
        const QString b = addFile(QStringLiteral("b"), QStringLiteral("Beta"), QStringLiteral("Two"));

        AutoOrganizer organizer(*m_db, *m_settings, m_fileOps);
        const OrganizeResult result = organizer.organize(request(OrganizeMode::Move));
        QVERIFY(result.ok());
        QCOMPARE(result.report.succeeded, 2);
        QVERIFY(!result.report.batchId.isEmpty());

        const QString movedA = m_library + QStringLiteral("/Alpha/One.flac");
        QVERIFY(QFile::exists(movedA));
        QVERIFY(!QFile::exists(a));
        QCOMPARE(m_db->trackById(QStringLiteral("a"))->filePath, movedA);
        QCOMPARE(m_db->trackById(QStringLiteral("b"))->filePath,
                 m_library + QStringLiteral("/Beta/Two.flac"));

        // Second run finds everything in place
        const OrganizeResult again = organizer.organize(request(OrganizeMode::Move));
        QCOMPARE(again.plan.count(PlanOperation::NoOp), 2);
        QCOMPARE(again.plan.mutationCount(), 0);

        // The no-op run still seals an (empty) batch; undo it first
        QCOMPARE(organizer.history(false).size(), 2);
        QVERIFY(organizer.undo().complete());

        const UndoReport undo = organizer.undo();
        QVERIFY(undo.complete());
        QCOMPARE(undo.batchId, result.report.batchId);
        QCOMPARE(undo.succeeded, 2);
        QVERIFY(QFile::exists(a));
        QVERIFY(QFile::exists(b));
        QCOMPARE(m_db->trackById(QStringLiteral("a"))->filePath, a);
        QVERIFY(!QDir(m_library + QStringLiteral("/Alpha")).exists());
    }

    void undo_withEmptyHistory()
    {
        AutoOrganizer organizer(*m_db, *m_settings, m_fileOps);
        const UndoReport report = organizer.undo();
        QVERIFY(!report.hadBatch());
        QVERIFY(report.error.isEmpty());
    }

    // ── Duplicates ───────────────────────────────────────────────
    void organize_quarantinesDuplicateLoser()
    {
        const QByteArray body = QByteArrayLiteral("same recording").repeated(64);
        addFile(QStringLiteral("hi"), QStringLiteral("Artist"), QStringLiteral("Song"), 1000, body);
        const QString lowPath = addFile(QStringLiteral("lo"), QStringLiteral("Artist"),
                                        QStringLiteral("Song"), 320, body);

        AutoOrganizer organizer(*m_db, *m_settings, m_fileOps);
        OrganizeRequest req = request(OrganizeMode::Move);
        req.resolveDuplicates = true;
        req.policy = DuplicatePolicy::Quarantine;
        const OrganizeResult result = organizer.organize(req);

        QVERIFY(result.ok());
        QCOMPARE(result.duplicates.size(), 1);
        QCOMPARE(result.duplicates.first().keeperId, QStringLiteral("hi"));
        QCOMPARE(result.duplicates.first().loserIds, QStringList{QStringLiteral("lo")});

        const QString quarantined = m_settings->quarantineDir() + QStringLiteral("/lo.flac");
        QVERIFY(QFile::exists(m_library + QStringLiteral("/Artist/Song.flac")));
        QVERIFY(QFile::exists(quarantined));
        QVERIFY(!QFile::exists(lowPath));
        QCOMPARE(m_db->trackById(QStringLiteral("lo"))->filePath, quarantined);
        QVERIFY(!m_db->trackById(QStringLiteral("lo"))->deleted);
    }

    void organize_trashMarksDeletedAndUndoRestores()
    {
        const QByteArray body = QByteArrayLiteral("same recording").repeated(64);
        addFile(QStringLiteral("hi"), QStringLiteral("Artist"), QStringLiteral("Song"), 1000, body);
        const QString lowPath = addFile(QStringLiteral("lo"), QStringLiteral("Artist"),
                                        QStringLiteral("Song"), 320, body);

        AutoOrganizer organizer(*m_db, *m_settings, m_fileOps);
        OrganizeRequest req = request(OrganizeMode::Move);
        req.resolveDuplicates = true;
        req.policy = DuplicatePolicy::Delete;
        const OrganizeResult result = organizer.organize(req);

        QVERIFY(result.ok());
        QCOMPARE(result.plan.count(PlanOperation::Trash), 1);
        QVERIFY(QFile::exists(m_settings->trashDir() + QStringLiteral("/lo.flac")));
        QVERIFY(m_db->trackById(QStringLiteral("lo"))->deleted);
        QCOMPARE(m_db->trackCount(), 1);

        QVERIFY(organizer.undo().complete());
        QVERIFY(QFile::exists(lowPath));
        QVERIFY(!m_db->trackById(QStringLiteral("lo"))->deleted);
        QCOMPARE(m_db->trackById(QStringLiteral("lo"))->filePath, lowPath);
        QCOMPARE(m_db->trackCount(), 2);
    }

    void findDuplicates_cachesContentHash()
    {
        const QByteArray body = QByteArrayLiteral("same recording").repeated(64);
        addFile(QStringLiteral("hi"), QStringLiteral("Artist"), QStringLiteral("Song"), 1000, body);
        addFile(QStringLiteral("lo"), QStringLiteral("Artist"), QStringLiteral("Song"), 320, body);

        AutoOrganizer organizer(*m_db, *m_settings, m_fileOps);
        const auto groups = organizer.findDuplicates(TrackFilter(), true);
        QCOMPARE(groups.size(), 1);
        QVERIFY(m_db->trackById(QStringLiteral("hi"))->contentHash.has_value());
        QCOMPARE(*m_db->trackById(QStringLiteral("hi"))->contentHash,
                 *m_db->trackById(QStringLiteral("lo"))->contentHash);
    }

    // ── History ──────────────────────────────────────────────────
    void history_persistsAcrossInstances()
    {
        addFile(QStringLiteral("a"), QStringLiteral("Artist"), QStringLiteral("Song"));
        QString batchId;
        {
            AutoOrganizer organizer(*m_db, *m_settings, m_fileOps);
            OrganizeRequest req = request(OrganizeMode::Copy);
            batchId = organizer.organize(req).report.batchId;
            QVERIFY(!batchId.isEmpty());
        }

        AutoOrganizer reopened(*m_db, *m_settings, m_fileOps);
        const auto batches = reopened.history();
        QCOMPARE(batches.size(), 1);
        QCOMPARE(batches.first().id, batchId);
        QCOMPARE(batches.first().mode, OrganizeMode::Copy);
        QCOMPARE(batches.first().entries.size(), 1);
    }
};

QTEST_MAIN(tst_AutoOrganizer)
#include "tst_AutoOrganizer.moc"
