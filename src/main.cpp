#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QTextStream>
#include <atomic>
#include <csignal>
#include <memory>

#include "core/AppLog.h"
#include "core/MusicData.h"
#include "core/Settings.h"
#include "core/library/AutoOrganizer.h"
#include "core/library/LibraryDatabase.h"
#include "core/organizer/FileOperations.h"

// Ctrl-C stops between entries; the batch is still sealed
static std::atomic<bool> s_cancelRequested{false};

static void interruptHandler(int)
{
    s_cancelRequested.store(true);
}

static QTextStream& out()
{
    static QTextStream s(stdout);
    return s;
}

static QTextStream& err()
{
    static QTextStream s(stderr);
    return s;
}

enum ExitCode {
    ExitOk = 0,
    ExitPartial = 1,     // some entries failed or conflicted
    ExitUsage = 2,
    ExitSetup = 3
};

// ── organize ────────────────────────────────────────────────────────
static int runOrganize(const QCommandLineParser& parser, AutoOrganizer& organizer, Settings& settings)
{
    OrganizeRequest request;
    request.templateName = parser.value(QStringLiteral("template"));
    request.destinationRoot = parser.value(QStringLiteral("dest"));

    const QString modeText = parser.isSet(QStringLiteral("mode")) ? parser.value(QStringLiteral("mode"))
                                                                  : settings.organizeMode();
    bool modeOk = false;
    request.mode = organizeModeFromString(modeText, &modeOk);
    if (!modeOk) {
        err() << "Unknown mode: " << modeText << " (simulate, move, copy, link)\n";
        return ExitUsage;
    }

    request.resolveDuplicates = parser.isSet(QStringLiteral("dupes"));
    if (parser.isSet(QStringLiteral("policy"))) {
        const QString p = parser.value(QStringLiteral("policy")).toLower();
        if (p != QStringLiteral("skip") && p != QStringLiteral("quarantine") && p != QStringLiteral("delete")) {
            err() << "Unknown duplicate policy: " << p << " (skip, quarantine, delete)\n";
            return ExitUsage;
        }
        request.policy = duplicatePolicyFromString(p);
    }
    if (parser.isSet(QStringLiteral("hash")))
        request.useContentHash = true;
    if (parser.isSet(QStringLiteral("prefix")))
        request.filter.pathPrefix = QDir::cleanPath(QFileInfo(parser.value(QStringLiteral("prefix"))).absoluteFilePath());

    organizer.setCancelFlag(&s_cancelRequested);

    QString error;
    auto plan = organizer.preview(request, &error);
    if (!plan) {
        err() << "Cannot plan: " << error << "\n";
        return ExitSetup;
    }

    out() << plan->toTable();
    if (!plan->excludedTrackIds.isEmpty())
        out() << plan->excludedTrackIds.size() << " tracks excluded by filters or duplicate policy\n";
    out().flush();

    if (parser.isSet(QStringLiteral("export-csv"))) {
        const QString csvPath = parser.value(QStringLiteral("export-csv"));
        QString csvError;
        if (!plan->writeCsv(csvPath, &csvError)) {
            err() << "Cannot write " << csvPath << ": " << csvError << "\n";
            return ExitSetup;
        }
        out() << "Plan written to " << csvPath << "\n";
    }

    const ExecutionReport report = organizer.execute(*plan, request.mode);
    if (parser.isSet(QStringLiteral("json")))
        out() << QJsonDocument(report.toJson()).toJson(QJsonDocument::Indented);
    out() << report.summary() << "\n";
    for (const auto& f : report.failures())
        out() << "  FAILED " << failureKindToString(f.failure) << ": " << f.message << "\n";

    if (report.aborted())
        return ExitSetup;
    return (report.failed > 0 || plan->conflictCount() > 0 || report.cancelled) ? ExitPartial : ExitOk;
}

// ── dupes ───────────────────────────────────────────────────────────
static int runDupes(const QCommandLineParser& parser, AutoOrganizer& organizer, LibraryDatabase& db)
{
    std::optional<bool> useHash;
    if (parser.isSet(QStringLiteral("hash")))
        useHash = true;

    const QVector<DuplicateGroup> groups = organizer.findDuplicates(TrackFilter(), useHash);
    for (const auto& g : groups) {
        out() << audioFormatToString(g.format) << ", " << formatFileSize(g.fileSize) << ", "
              << formatDuration(g.minDuration) << "\n";
        for (const auto& id : g.memberIds()) {
            auto t = db.trackById(id);
            out() << (id == g.keeperId ? "  keep  " : "  lose  ")
                  << (t ? t->filePath : id)
                  << (t && t->bitrate > 0 ? QStringLiteral("  (%1 kbps)").arg(t->bitrate) : QString())
                  << "\n";
        }
    }
    out() << groups.size() << " duplicate groups\n";
    return ExitOk;
}

// ── undo / history ──────────────────────────────────────────────────
static int runUndo(AutoOrganizer& organizer)
{
    const UndoReport report = organizer.undo();
    if (!report.hadBatch()) {
        if (!report.error.isEmpty()) {
            err() << report.error << "\n";
            return ExitSetup;
        }
        out() << "Nothing to undo\n";
        return ExitOk;
    }

    out() << "Undid batch " << report.batchId << ": " << report.attempted << " attempted, "
          << report.succeeded << " restored, " << report.failed << " failed\n";
    for (const auto& o : report.outcomes) {
        if (!o.ok())
            out() << "  FAILED " << failureKindToString(o.failure) << ": " << o.message << "\n";
    }
    return report.complete() ? ExitOk : ExitPartial;
}

static int runHistory(const QCommandLineParser& parser, AutoOrganizer& organizer)
{
    const QVector<UndoBatch> batches = organizer.history(parser.isSet(QStringLiteral("all")));
    for (int i = batches.size() - 1; i >= 0; --i) {
        const UndoBatch& b = batches.at(i);
        out() << b.startedAt.toLocalTime().toString(Qt::ISODate) << "  " << b.id << "  "
              << organizeModeToString(b.mode) << "  " << b.entries.size() << " entries"
              << (b.undone ? QStringLiteral("  (undone)") : QString()) << "\n";
    }
    if (batches.isEmpty())
        out() << "No batches\n";
    return ExitOk;
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Reshelf"));
    QCoreApplication::setApplicationName(QStringLiteral("Reshelf"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Reorganize a music library into a metadata-driven folder layout.\n\n"
        "Commands:\n"
        "  organize   plan (and optionally apply) a reorganization\n"
        "  dupes      list duplicate groups\n"
        "  undo       reverse the most recent batch\n"
        "  history    list executed batches"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("organize | dupes | undo | history"));

    parser.addOptions({
        {QStringLiteral("db"), QStringLiteral("Catalog database."), QStringLiteral("path")},
        {QStringLiteral("config"), QStringLiteral("Settings file (INI)."), QStringLiteral("path")},
        {QStringLiteral("log"), QStringLiteral("Log file."), QStringLiteral("path")},
        {{QStringLiteral("v"), QStringLiteral("verbose")}, QStringLiteral("Include debug output.")},
        {{QStringLiteral("t"), QStringLiteral("template")}, QStringLiteral("Template name or pattern."), QStringLiteral("template")},
        {{QStringLiteral("d"), QStringLiteral("dest")}, QStringLiteral("Destination root."), QStringLiteral("dir")},
        {{QStringLiteral("m"), QStringLiteral("mode")}, QStringLiteral("simulate, move, copy or link."), QStringLiteral("mode")},
        {QStringLiteral("prefix"), QStringLiteral("Only tracks under this folder."), QStringLiteral("dir")},
        {QStringLiteral("export-csv"), QStringLiteral("Write the plan as CSV."), QStringLiteral("file")},
        {QStringLiteral("dupes"), QStringLiteral("Resolve duplicates while organizing.")},
        {QStringLiteral("policy"), QStringLiteral("Duplicate losers: skip, quarantine or delete."), QStringLiteral("policy")},
        {QStringLiteral("hash"), QStringLiteral("Confirm duplicates with a partial content hash.")},
        {QStringLiteral("json"), QStringLiteral("Print the execution report as JSON.")},
        {QStringLiteral("all"), QStringLiteral("history: include undone batches.")},
    });
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        err() << parser.helpText();
        return ExitUsage;
    }
    const QString command = args.first();

    AppLog::install(parser.isSet(QStringLiteral("log")) ? parser.value(QStringLiteral("log"))
                                                        : AppLog::defaultLogPath(),
                    parser.isSet(QStringLiteral("verbose")));

    std::unique_ptr<Settings> ownedSettings;
    Settings* settings = Settings::instance();
    if (parser.isSet(QStringLiteral("config"))) {
        ownedSettings = std::make_unique<Settings>(parser.value(QStringLiteral("config")));
        settings = ownedSettings.get();
    }

    LibraryDatabase db(parser.isSet(QStringLiteral("db")) ? parser.value(QStringLiteral("db"))
                                                          : LibraryDatabase::defaultPath());
    if (!db.open()) {
        err() << "Cannot open catalog " << db.path() << "\n";
        return ExitSetup;
    }

    std::signal(SIGINT, interruptHandler);

    LocalFileOperations fileOps;
    AutoOrganizer organizer(db, *settings, fileOps);

    int rc = ExitUsage;
    if (command == QStringLiteral("organize"))
        rc = runOrganize(parser, organizer, *settings);
    else if (command == QStringLiteral("dupes"))
        rc = runDupes(parser, organizer, db);
    else if (command == QStringLiteral("undo"))
        rc = runUndo(organizer);
    else if (command == QStringLiteral("history"))
        rc = runHistory(parser, organizer);
    else
        err() << "Unknown command: " << command << "\n";

    out().flush();
    err().flush();
    db.close();
    AppLog::uninstall();
    return rc;
}
