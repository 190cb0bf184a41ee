#include <QtTest/QtTest>
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QTemporaryDir>
#include <atomic>
#include <memory>

#include "FaultyFileOperations.h"
#include "MemoryTrackStore.h"
#include "organizer/OrganizeExecutor.h"
#include "organizer/OrganizePlanner.h"
#include "organizer/UndoLog.h"

static bool writeFile(const QString& path, const QByteArray& data)
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly))
        return false;
    return f.write(data) == data.size();
}

static QByteArray readFile(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return QByteArray();
    return f.readAll();
}

class tst_OrganizeExecutor : public QObject {
    Q_OBJECT

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    QString m_src;
    QString m_lib;
    QString m_logPath;
    MemoryTrackStore* m_store = nullptr;
    TemplatePlan m_template;

    Track addSource(const QString& id, const QString& artist, const QString& title)
    {
        const QString path = m_src + QLatin1Char('/') + id + QStringLiteral(".flac");
        const QByteArray content = QByteArrayLiteral("fLaC") + id.toUtf8().repeated(512);
        writeFile(path, content);

        Track t;
        t.id = id;
        t.filePath = path;
        t.fileSize = content.size();
        t.duration = 180.0;
        t.format = AudioFormat::FLAC;
        t.artist = artist;
        t.title = title;
        m_store->add(t);
        return t;
    }

    OrganizePlan planFor(OrganizeMode mode)
    {
        return OrganizePlanner().plan(m_store->load(), m_template, m_lib, mode);
    }

private slots:
    void initTestCase()
    {
        m_template = PathTemplate::compile(QStringLiteral("{Artista}/{Título}.{ext}")).value_or(TemplatePlan());
        QVERIFY(m_template.isValid());
    }

    void init()
    {
        m_dir = std::make_unique<QTemporaryDir>();
        QVERIFY(m_dir->isValid());
        m_src = m_dir->filePath(QStringLiteral("src"));
        m_lib = m_dir->filePath(QStringLiteral("lib"));
        m_logPath = m_dir->filePath(QStringLiteral("state/undo.jsonl"));
        QVERIFY(QDir().mkpath(m_src));
        delete m_store;
        m_store = new MemoryTrackStore;
    }

    void cleanup()
    {
        delete m_store;
        m_store = nullptr;
        m_dir.reset();
    }

    // ── Copy with one failing entry ──────────────────────────────
    void copy_partialFailureIsIsolated()
    {
        addSource(QStringLiteral("t1"), QStringLiteral("Alpha"), QStringLiteral("One"));
        addSource(QStringLiteral("t2"), QStringLiteral("Beta"), QStringLiteral("Two"));
        addSource(QStringLiteral("t3"), QStringLiteral("Gamma"), QStringLiteral("Three"));
        const OrganizePlan plan = planFor(OrganizeMode::Copy);
        QCOMPARE(plan.mutationCount(), 3);

        FaultyFileOperations fileOps;
        const QString blocked = m_lib + QStringLiteral("/Beta/Two.flac");
        fileOps.failOn(blocked, FailureKind::PermissionDenied);

        UndoLog log(m_logPath);
        OrganizeExecutor executor(fileOps, m_store, &log);
        const ExecutionReport report = executor.execute(plan, OrganizeMode::Copy);

        QVERIFY(!report.aborted());
        QCOMPARE(report.attempted, 3);
        QCOMPARE(report.succeeded, 2);
        QCOMPARE(report.failed, 1);
        QCOMPARE(report.failures().size(), 1);
        QCOMPARE(report.failures().first().failure, FailureKind::PermissionDenied);
        QCOMPARE(report.failures().first().entry.trackId, QStringLiteral("t2"));

        QVERIFY(QFile::exists(m_lib + QStringLiteral("/Alpha/One.flac")));
        QVERIFY(QFile::exists(m_lib + QStringLiteral("/Gamma/Three.flac")));
        QVERIFY(!QFile::exists(blocked));
        QVERIFY(!QDir(m_lib + QStringLiteral("/Beta")).exists());
        QVERIFY(QFile::exists(m_src + QStringLiteral("/t1.flac")));

        // Copies leave the catalog on the originals
        QCOMPARE(m_store->track(QStringLiteral("t1")).filePath, m_src + QStringLiteral("/t1.flac"));

        auto batch = log.lastBatch();
        QVERIFY(batch.has_value());
        QCOMPARE(batch->id, report.batchId);
        QVERIFY(batch->sealed);
        QCOMPARE(batch->entries.size(), 2);

        const UndoReport undo = log.undoLastBatch(fileOps, m_store);
        QVERIFY(undo.complete());
        QCOMPARE(undo.succeeded, 2);
        QVERIFY(!QFile::exists(m_lib + QStringLiteral("/Alpha/One.flac")));
        QVERIFY(!QFile::exists(m_lib + QStringLiteral("/Gamma/Three.flac")));
        QVERIFY(QFile::exists(m_src + QStringLiteral("/t1.flac")));
        QVERIFY(QFile::exists(m_src + QStringLiteral("/t3.flac")));
    }

    // ── Move and undo round trip ─────────────────────────────────
    void move_undoRestoresEverything()
    {
        addSource(QStringLiteral("t1"), QStringLiteral("Alpha"), QStringLiteral("One"));
        addSource(QStringLiteral("t2"), QStringLiteral("Beta"), QStringLiteral("Two"));
        const QByteArray before1 = readFile(m_src + QStringLiteral("/t1.flac"));
        const QByteArray before2 = readFile(m_src + QStringLiteral("/t2.flac"));

        LocalFileOperations fileOps;
        UndoLog log(m_logPath);
        OrganizeExecutor executor(fileOps, m_store, &log);
        const ExecutionReport report = executor.execute(planFor(OrganizeMode::Move), OrganizeMode::Move);
        QCOMPARE(report.succeeded, 2);
        QCOMPARE(report.failed, 0);

        const QString moved1 = m_lib + QStringLiteral("/Alpha/One.flac");
        QVERIFY(!QFile::exists(m_src + QStringLiteral("/t1.flac")));
        QCOMPARE(readFile(moved1), before1);
        QCOMPARE(m_store->track(QStringLiteral("t1")).filePath, moved1);

        const UndoReport undo = log.undoLastBatch(fileOps, m_store);
        QVERIFY(undo.complete());
        QCOMPARE(undo.attempted, 2);
        QCOMPARE(readFile(m_src + QStringLiteral("/t1.flac")), before1);
        QCOMPARE(readFile(m_src + QStringLiteral("/t2.flac")), before2);
        QCOMPARE(m_store->track(QStringLiteral("t1")).filePath, m_src + QStringLiteral("/t1.flac"));
        QVERIFY(!QDir(m_lib).exists());
    }

    // ── Catalog write-back refused ───────────────────────────────
    void move_catalogRefusalRevertsEntry()
    {
        addSource(QStringLiteral("t1"), QStringLiteral("Alpha"), QStringLiteral("One"));
        addSource(QStringLiteral("t2"), QStringLiteral("Beta"), QStringLiteral("Two"));
        const OrganizePlan plan = planFor(OrganizeMode::Move);

        // Stale record outside the planned set that still claims t1's target
        const QString target = m_lib + QStringLiteral("/Alpha/One.flac");
        Track stale;
        stale.id = QStringLiteral("stale");
        stale.filePath = target;
        m_store->add(stale);

        LocalFileOperations fileOps;
        UndoLog log(m_logPath);
        OrganizeExecutor executor(fileOps, m_store, &log);
        const ExecutionReport report = executor.execute(plan, OrganizeMode::Move);

        QCOMPARE(report.attempted, 2);
        QCOMPARE(report.succeeded, 1);
        QCOMPARE(report.failed, 1);
        QCOMPARE(report.failures().first().entry.trackId, QStringLiteral("t1"));
        QCOMPARE(report.failures().first().failure, FailureKind::CatalogError);
        QCOMPARE(report.failures().first().state, EntryState::Failed);
        QVERIFY(!report.failures().first().message.isEmpty());

        // File and record both stay where they were
        QVERIFY(QFile::exists(m_src + QStringLiteral("/t1.flac")));
        QVERIFY(!QFile::exists(target));
        QVERIFY(!QDir(m_lib + QStringLiteral("/Alpha")).exists());
        QCOMPARE(m_store->track(QStringLiteral("t1")).filePath, m_src + QStringLiteral("/t1.flac"));
        QCOMPARE(m_store->track(QStringLiteral("t2")).filePath, m_lib + QStringLiteral("/Beta/Two.flac"));

        // Only the committed entry is undoable
        auto batch = log.lastBatch();
        QVERIFY(batch.has_value());
        QCOMPARE(batch->entries.size(), 1);
        QCOMPARE(batch->entries.first().trackId, QStringLiteral("t2"));
    }

    void link_createsSecondName()
    {
        addSource(QStringLiteral("t1"), QStringLiteral("Alpha"), QStringLiteral("One"));
        LocalFileOperations fileOps;
        UndoLog log(m_logPath);
        OrganizeExecutor executor(fileOps, m_store, &log);
        const ExecutionReport report = executor.execute(planFor(OrganizeMode::Link), OrganizeMode::Link);
        QCOMPARE(report.succeeded, 1);
        QVERIFY(QFile::exists(m_src + QStringLiteral("/t1.flac")));
        QCOMPARE(readFile(m_lib + QStringLiteral("/Alpha/One.flac")), readFile(m_src + QStringLiteral("/t1.flac")));
    }

    // ── Verification failures ────────────────────────────────────
    void existingTargetIsNeverOverwritten()
    {
        addSource(QStringLiteral("t1"), QStringLiteral("Alpha"), QStringLiteral("One"));
        addSource(QStringLiteral("t2"), QStringLiteral("Beta"), QStringLiteral("Two"));
        const OrganizePlan plan = planFor(OrganizeMode::Move);

        // Someone drops a file at the target after planning
        QVERIFY(QDir().mkpath(m_lib + QStringLiteral("/Alpha")));
        QVERIFY(writeFile(m_lib + QStringLiteral("/Alpha/One.flac"), QByteArrayLiteral("intruder")));

        LocalFileOperations fileOps;
        UndoLog log(m_logPath);
        const ExecutionReport report = OrganizeExecutor(fileOps, m_store, &log).execute(plan, OrganizeMode::Move);
        QCOMPARE(report.succeeded, 1);
        QCOMPARE(report.failed, 1);
        QCOMPARE(report.failures().first().failure, FailureKind::TargetExists);
        QCOMPARE(readFile(m_lib + QStringLiteral("/Alpha/One.flac")), QByteArrayLiteral("intruder"));
        QVERIFY(QFile::exists(m_src + QStringLiteral("/t1.flac")));
    }

    void missingSourceFails()
    {
        addSource(QStringLiteral("t1"), QStringLiteral("Alpha"), QStringLiteral("One"));
        const OrganizePlan plan = planFor(OrganizeMode::Move);
        QVERIFY(QFile::remove(m_src + QStringLiteral("/t1.flac")));

        LocalFileOperations fileOps;
        UndoLog log(m_logPath);
        const ExecutionReport report = OrganizeExecutor(fileOps, m_store, &log).execute(plan, OrganizeMode::Move);
        QCOMPARE(report.failed, 1);
        QCOMPARE(report.failures().first().failure, FailureKind::SourceMissing);
        QCOMPARE(log.lastBatch()->entries.size(), 0);
    }

    // ── Setup ────────────────────────────────────────────────────
    void destinationThatIsAFileAborts()
    {
        addSource(QStringLiteral("t1"), QStringLiteral("Alpha"), QStringLiteral("One"));
        const OrganizePlan plan = planFor(OrganizeMode::Move);
        QVERIFY(writeFile(m_lib, QByteArrayLiteral("not a directory")));

        LocalFileOperations fileOps;
        UndoLog log(m_logPath);
        const ExecutionReport report = OrganizeExecutor(fileOps, m_store, &log).execute(plan, OrganizeMode::Move);
        QVERIFY(report.aborted());
        QCOMPARE(report.attempted, 0);
        QVERIFY(report.batchId.isEmpty());
        QVERIFY(QFile::exists(m_src + QStringLiteral("/t1.flac")));
        QVERIFY(!QFile::exists(m_logPath));
    }

    void unwritableUndoLogAborts()
    {
        addSource(QStringLiteral("t1"), QStringLiteral("Alpha"), QStringLiteral("One"));
        QVERIFY(QDir().mkpath(m_logPath));   // a directory where the log file should be

        LocalFileOperations fileOps;
        UndoLog log(m_logPath);
        const ExecutionReport report = OrganizeExecutor(fileOps, m_store, &log).execute(planFor(OrganizeMode::Move),
                                                                                        OrganizeMode::Move);
        QVERIFY(report.aborted());
        QVERIFY(QFile::exists(m_src + QStringLiteral("/t1.flac")));
        QVERIFY(!QDir(m_lib).exists());
    }

    void simulateTouchesNothing()
    {
        addSource(QStringLiteral("t1"), QStringLiteral("Alpha"), QStringLiteral("One"));
        addSource(QStringLiteral("t2"), QStringLiteral("Beta"), QStringLiteral("Two"));
        const OrganizePlan plan = planFor(OrganizeMode::Simulate);
        QCOMPARE(plan.entries.first().operation, PlanOperation::Move);

        LocalFileOperations fileOps;
        UndoLog log(m_logPath);
        const ExecutionReport report = OrganizeExecutor(fileOps, m_store, &log).execute(plan, OrganizeMode::Simulate);
        QVERIFY(!report.aborted());
        QCOMPARE(report.succeeded, 2);
        QVERIFY(report.batchId.isEmpty());
        for (const auto& o : report.outcomes)
            QCOMPARE(o.state, EntryState::Verified);

        QVERIFY(QFile::exists(m_src + QStringLiteral("/t1.flac")));
        QVERIFY(!QDir(m_lib).exists());
        QVERIFY(!QFile::exists(m_logPath));
        QCOMPARE(m_store->track(QStringLiteral("t1")).filePath, m_src + QStringLiteral("/t1.flac"));
        QVERIFY(report.summary().contains(QStringLiteral("would succeed")));
    }

    void simulateWithoutUndoLogIsFine()
    {
        addSource(QStringLiteral("t1"), QStringLiteral("Alpha"), QStringLiteral("One"));
        LocalFileOperations fileOps;
        const ExecutionReport report = OrganizeExecutor(fileOps, nullptr, nullptr).execute(planFor(OrganizeMode::Move),
                                                                                           OrganizeMode::Simulate);
        QVERIFY(!report.aborted());
        QCOMPARE(report.succeeded, 1);

        const ExecutionReport real = OrganizeExecutor(fileOps, nullptr, nullptr).execute(planFor(OrganizeMode::Move),
                                                                                         OrganizeMode::Move);
        QVERIFY(real.aborted());
    }

    // ── Cancellation and retry ───────────────────────────────────
    void cancellationSealsPartialBatch()
    {
        addSource(QStringLiteral("t1"), QStringLiteral("Alpha"), QStringLiteral("One"));
        addSource(QStringLiteral("t2"), QStringLiteral("Beta"), QStringLiteral("Two"));
        addSource(QStringLiteral("t3"), QStringLiteral("Gamma"), QStringLiteral("Three"));

        std::atomic<bool> cancel{false};
        LocalFileOperations fileOps;
        UndoLog log(m_logPath);
        OrganizeExecutor executor(fileOps, m_store, &log);
        executor.setCancelFlag(&cancel);
        int progressCalls = 0;
        executor.setProgressCallback([&](int done, int total, const EntryOutcome&) {
            ++progressCalls;
            QCOMPARE(total, 3);
            if (done == 1)
                cancel.store(true);
        });

        const ExecutionReport report = executor.execute(planFor(OrganizeMode::Move), OrganizeMode::Move);
        QVERIFY(report.cancelled);
        QCOMPARE(report.succeeded, 1);
        QCOMPARE(report.skipped, 2);
        QCOMPARE(progressCalls, 1);
        QCOMPARE(report.outcomes.last().failure, FailureKind::Cancelled);

        UndoLog reloaded(m_logPath);
        QVERIFY(reloaded.load());
        auto batch = reloaded.lastBatch();
        QVERIFY(batch.has_value());
        QCOMPARE(batch->id, report.batchId);
        QVERIFY(batch->sealed);
        QCOMPARE(batch->entries.size(), 1);
    }

    void transientFailuresAreRetried()
    {
        addSource(QStringLiteral("t1"), QStringLiteral("Alpha"), QStringLiteral("One"));
        const QString target = m_lib + QStringLiteral("/Alpha/One.flac");

        FaultyFileOperations fileOps;
        fileOps.failTransiently(target, 2);
        UndoLog log(m_logPath);
        OrganizeExecutor executor(fileOps, m_store, &log);
        executor.setRetryPolicy(RetryPolicy{3, 0});
        const ExecutionReport report = executor.execute(planFor(OrganizeMode::Move), OrganizeMode::Move);
        QCOMPARE(report.succeeded, 1);
        QCOMPARE(fileOps.calls(target), 3);
        QVERIFY(QFile::exists(target));
    }

    void retriesAreBounded()
    {
        addSource(QStringLiteral("t1"), QStringLiteral("Alpha"), QStringLiteral("One"));
        const QString target = m_lib + QStringLiteral("/Alpha/One.flac");

        FaultyFileOperations fileOps;
        fileOps.failTransiently(target, 5);
        UndoLog log(m_logPath);
        OrganizeExecutor executor(fileOps, m_store, &log);
        executor.setRetryPolicy(RetryPolicy{1, 0});
        const ExecutionReport report = executor.execute(planFor(OrganizeMode::Move), OrganizeMode::Move);
        QCOMPARE(report.failed, 1);
        QCOMPARE(report.failures().first().failure, FailureKind::IOError);
        QCOMPARE(fileOps.calls(target), 2);
        QVERIFY(QFile::exists(m_src + QStringLiteral("/t1.flac")));
    }

    void permanentFailureIsNotRetried()
    {
        int attempts = 0;
        const FileOpResult r = retryTransient(RetryPolicy{3, 0}, [] {
            return FileOpResult::fail(FailureKind::PermissionDenied, QStringLiteral("denied"));
        }, &attempts);
        QCOMPARE(r.failure, FailureKind::PermissionDenied);
        QCOMPARE(attempts, 1);
    }

    // ── Reporting ────────────────────────────────────────────────
    void conflictsAreSkipped()
    {
        addSource(QStringLiteral("t1"), QStringLiteral("Alpha"), QString());
        const OrganizePlan plan = planFor(OrganizeMode::Move);
        QCOMPARE(plan.conflictCount(), 1);

        LocalFileOperations fileOps;
        UndoLog log(m_logPath);
        const ExecutionReport report = OrganizeExecutor(fileOps, m_store, &log).execute(plan, OrganizeMode::Move);
        QCOMPARE(report.attempted, 0);
        QCOMPARE(report.skipped, 1);
        QCOMPARE(report.outcomes.first().state, EntryState::Skipped);
        QCOMPARE(report.outcomes.first().message, QStringLiteral("missing-field"));
    }

    void reportJsonListsFailures()
    {
        addSource(QStringLiteral("t1"), QStringLiteral("Alpha"), QStringLiteral("One"));
        const OrganizePlan plan = planFor(OrganizeMode::Copy);
        QVERIFY(QFile::remove(m_src + QStringLiteral("/t1.flac")));

        LocalFileOperations fileOps;
        UndoLog log(m_logPath);
        const ExecutionReport report = OrganizeExecutor(fileOps, m_store, &log).execute(plan, OrganizeMode::Copy);
        const QJsonObject json = report.toJson();
        QCOMPARE(json.value(QStringLiteral("mode")).toString(), QStringLiteral("copy"));
        QCOMPARE(json.value(QStringLiteral("failed")).toInt(), 1);
        const QJsonArray failures = json.value(QStringLiteral("failures")).toArray();
        QCOMPARE(failures.size(), 1);
        QCOMPARE(failures.first().toObject().value(QStringLiteral("failure")).toString(),
                 QStringLiteral("SourceMissing"));
        QCOMPARE(report.summary(), QStringLiteral("copy: 1 attempted, 0 succeeded, 1 failed, 0 skipped"));
    }
};

QTEST_MAIN(tst_OrganizeExecutor)
#include "tst_OrganizeExecutor.moc"
