#include "AutoOrganizer.h"
#include "../Settings.h"
#include "../organizer/FileOperations.h"

#include <QDebug>
#include <QElapsedTimer>

AutoOrganizer::AutoOrganizer(ITrackStore& store, Settings& settings, IFileOperations& fileOps)
    : m_store(store)
    , m_settings(settings)
    , m_fileOps(fileOps)
    , m_undoLog(settings.undoLogPath())
{
}

// ═══════════════════════════════════════════════════════════════════════
//  Configuration
// ═══════════════════════════════════════════════════════════════════════

TemplateRules AutoOrganizer::templateRules() const
{
    TemplateRules rules;
    rules.stripNames = m_settings.stripNames();
    rules.stripPromoParens = m_settings.stripPromoParens();
    rules.sanitizeForbiddenChars = m_settings.sanitizeForbidden();
    rules.fallbackToAlbumArtist = m_settings.fallbackToAlbumArtist();
    rules.compilationDetection = m_settings.compilationDetection();
    rules.compilationPattern = m_settings.compilationPattern();
    rules.substitute = m_settings.substitute();
    rules.maxSegmentLength = m_settings.maxSegmentLength();
    return rules;
}

DuplicateOptions AutoOrganizer::duplicateOptions() const
{
    DuplicateOptions options;
    options.useContentHash = m_settings.useContentHash();
    options.sampleSize = m_settings.hashSampleSize();
    options.durationTolerance = m_settings.durationTolerance();
    return options;
}

RetryPolicy AutoOrganizer::retryPolicy() const
{
    RetryPolicy policy;
    policy.maxRetries = m_settings.maxRetries();
    policy.retryDelayMs = m_settings.retryDelayMs();
    return policy;
}

std::optional<TemplatePlan> AutoOrganizer::compileTemplate(const QString& nameOrPattern,
                                                           TemplateError* error) const
{
    const QString name = nameOrPattern.isEmpty() ? m_settings.activeTemplate() : nameOrPattern;

    // A bare word that names no template is a typo, not a pattern
    if (!m_settings.hasTemplate(name) && !name.contains(QLatin1Char('{'))) {
        if (error) {
            error->kind = TemplateError::Kind::UnknownTemplate;
            error->position = -1;
            error->detail = name;
        }
        qWarning() << "[AutoOrganizer] No template named" << name;
        return std::nullopt;
    }

    const QString pattern = m_settings.templatePattern(name);
    auto plan = PathTemplate::compile(pattern, templateRules(), error);
    if (!plan)
        qWarning() << "[AutoOrganizer] Template" << name << "rejected:"
                   << (error ? error->message() : QString());
    return plan;
}

// ═══════════════════════════════════════════════════════════════════════
//  Duplicates
// ═══════════════════════════════════════════════════════════════════════

QVector<DuplicateGroup> AutoOrganizer::findDuplicates(const TrackFilter& filter,
                                                      std::optional<bool> useContentHash)
{
    DuplicateOptions options = duplicateOptions();
    if (useContentHash)
        options.useContentHash = *useContentHash;

    const QVector<Track> tracks = m_store.load(filter);
    QHash<QString, QByteArray> computed;
    QVector<DuplicateGroup> groups = DuplicateResolver::detect(tracks, options, &computed);

    // Cache new hashes so the next run does not read the files again
    for (auto it = computed.constBegin(); it != computed.constEnd(); ++it) {
        if (!m_store.updateContentHash(it.key(), it.value()))
            qWarning() << "[AutoOrganizer] Could not store content hash for" << it.key();
    }
    return groups;
}

// ═══════════════════════════════════════════════════════════════════════
//  preview / execute
// ═══════════════════════════════════════════════════════════════════════

std::optional<OrganizePlan> AutoOrganizer::preview(const OrganizeRequest& request, QString* error,
                                                   QVector<DuplicateGroup>* duplicates)
{
    TemplateError templateError;
    auto templatePlan = compileTemplate(request.templateName, &templateError);
    if (!templatePlan) {
        if (error)
            *error = templateError.message();
        return std::nullopt;
    }

    const QString root = request.destinationRoot.isEmpty() ? m_settings.destinationRoot()
                                                           : request.destinationRoot;
    if (root.isEmpty()) {
        if (error)
            *error = QStringLiteral("No destination root configured");
        return std::nullopt;
    }

    PlanOptions options;
    options.mode = request.mode;
    options.requireYear = m_settings.requireYear();
    options.maxDisambiguation = m_settings.maxDisambiguation();

    if (m_settings.albumMode() == QStringLiteral("release")) {
        options.requireReleaseId = true;
        if (m_settings.fallbackToTags()) {
            TemplateError fallbackError;
            options.fallbackTemplate = PathTemplate::compile(Settings::tagFallbackTemplate(),
                                                             templateRules(), &fallbackError);
        }
    }

    if (request.resolveDuplicates) {
        options.duplicates = findDuplicates(request.filter, request.useContentHash);
        options.duplicatePolicy = request.policy
            ? *request.policy
            : duplicatePolicyFromString(m_settings.duplicatePolicy());
        options.quarantineRoot = m_settings.quarantineDir();
        options.trashRoot = m_settings.trashDir();
        if (duplicates)
            *duplicates = options.duplicates;
    }

    // Reload after hashing so the plan sees the cached digests
    const QVector<Track> tracks = m_store.load(request.filter);
    OrganizePlanner planner(&m_fileOps);
    return planner.plan(tracks, *templatePlan, root, options);
}

ExecutionReport AutoOrganizer::execute(const OrganizePlan& plan, OrganizeMode mode)
{
    if (mode != OrganizeMode::Simulate) {
        QString error;
        if (!ensureUndoLogLoaded(&error)) {
            ExecutionReport report;
            report.mode = mode;
            report.setupError = error;
            qCritical() << "[AutoOrganizer]" << error;
            return report;
        }
    }

    OrganizeExecutor executor(m_fileOps, &m_store, &m_undoLog);
    executor.setRetryPolicy(retryPolicy());
    executor.setCancelFlag(m_cancel);
    return executor.execute(plan, mode);
}

OrganizeResult AutoOrganizer::organize(const OrganizeRequest& request)
{
    QElapsedTimer timer;
    timer.start();

    OrganizeResult result;
    auto plan = preview(request, &result.error, &result.duplicates);
    if (!plan) {
        qWarning() << "[AutoOrganizer] Nothing planned:" << result.error;
        return result;
    }
    result.plan = *plan;
    result.report = execute(result.plan, request.mode);

    qDebug() << "[AutoOrganizer]" << result.report.summary() << "total" << timer.elapsed() << "ms";
    return result;
}

// ═══════════════════════════════════════════════════════════════════════
//  undo
// ═══════════════════════════════════════════════════════════════════════

bool AutoOrganizer::ensureUndoLogLoaded(QString* error)
{
    if (m_undoLoaded)
        return true;
    m_undoLoaded = m_undoLog.load(error);
    return m_undoLoaded;
}

UndoReport AutoOrganizer::undo()
{
    QString error;
    if (!ensureUndoLogLoaded(&error)) {
        UndoReport report;
        report.error = error;
        return report;
    }
    return m_undoLog.undoLastBatch(m_fileOps, &m_store, retryPolicy());
}

QVector<UndoBatch> AutoOrganizer::history(bool includeUndone)
{
    if (!ensureUndoLogLoaded())
        return {};
    return m_undoLog.batches(includeUndone);
}
