#include "PathTemplate.h"

#include <QDebug>
#include <QHash>
#include <QRegularExpression>

const QString PathTemplate::kVariousArtists = QStringLiteral("Various Artists");

// ═══════════════════════════════════════════════════════════════════════
//  Errors
// ═══════════════════════════════════════════════════════════════════════

QString TemplateError::message() const
{
    switch (kind) {
    case Kind::None:
        return QString();
    case Kind::EmptyTemplate:
        return QStringLiteral("template is empty");
    case Kind::UnbalancedDelimiter:
        return QStringLiteral("unbalanced placeholder delimiter at %1").arg(position);
    case Kind::UnknownPlaceholder:
        return QStringLiteral("unknown placeholder '%1' at %2").arg(detail).arg(position);
    case Kind::EmptyPlaceholder:
        return QStringLiteral("placeholder without a field name at %1").arg(position);
    case Kind::UnknownTemplate:
        return QStringLiteral("no template named '%1'").arg(detail);
    }
    return QString();
}

QString RenderError::message() const
{
    if (kind == Kind::MissingField)
        return QStringLiteral("missing required field '%1'").arg(PathTemplate::fieldName(field));
    return QString();
}

bool TemplateSegment::containsField(TemplateField field) const
{
    for (const auto& token : tokens) {
        if (token.type == TemplateToken::Type::Group && token.fields.contains(field))
            return true;
    }
    return false;
}

// ═══════════════════════════════════════════════════════════════════════
//  Field names
// ═══════════════════════════════════════════════════════════════════════

QString PathTemplate::fieldName(TemplateField field)
{
    switch (field) {
    case TemplateField::Genre:       return QStringLiteral("genre");
    case TemplateField::Year:        return QStringLiteral("year");
    case TemplateField::Artist:      return QStringLiteral("artist");
    case TemplateField::AlbumArtist: return QStringLiteral("albumartist");
    case TemplateField::Album:       return QStringLiteral("album");
    case TemplateField::TrackNumber: return QStringLiteral("track");
    case TemplateField::Title:       return QStringLiteral("title");
    case TemplateField::Extension:   return QStringLiteral("ext");
    case TemplateField::ReleaseId:   return QStringLiteral("releaseid");
    }
    return QString();
}

std::optional<TemplateField> PathTemplate::fieldFromName(const QString& name)
{
    static const QHash<QString, TemplateField> kAliases = {
        { QStringLiteral("genre"),        TemplateField::Genre },
        { QStringLiteral("genero"),       TemplateField::Genre },
        { QStringLiteral("género"),       TemplateField::Genre },
        { QStringLiteral("year"),         TemplateField::Year },
        { QStringLiteral("año"),          TemplateField::Year },
        { QStringLiteral("ano"),          TemplateField::Year },
        { QStringLiteral("artist"),       TemplateField::Artist },
        { QStringLiteral("artista"),      TemplateField::Artist },
        { QStringLiteral("albumartist"),  TemplateField::AlbumArtist },
        { QStringLiteral("album_artist"), TemplateField::AlbumArtist },
        { QStringLiteral("artistaalbum"), TemplateField::AlbumArtist },
        { QStringLiteral("album"),        TemplateField::Album },
        { QStringLiteral("álbum"),        TemplateField::Album },
        { QStringLiteral("track"),        TemplateField::TrackNumber },
        { QStringLiteral("trackno"),      TemplateField::TrackNumber },
        { QStringLiteral("tracknumber"),  TemplateField::TrackNumber },
        { QStringLiteral("pista"),        TemplateField::TrackNumber },
        { QStringLiteral("title"),        TemplateField::Title },
        { QStringLiteral("título"),       TemplateField::Title },
        { QStringLiteral("titulo"),       TemplateField::Title },
        { QStringLiteral("ext"),          TemplateField::Extension },
        { QStringLiteral("extension"),    TemplateField::Extension },
        { QStringLiteral("releaseid"),    TemplateField::ReleaseId },
        { QStringLiteral("release_id"),   TemplateField::ReleaseId },
        { QStringLiteral("release"),      TemplateField::ReleaseId },
    };
    auto it = kAliases.constFind(name.toLower().normalized(QString::NormalizationForm_C));
    if (it == kAliases.constEnd())
        return std::nullopt;
    return it.value();
}

QString PathTemplate::sentinel(TemplateField field)
{
    switch (field) {
    case TemplateField::Genre:       return QStringLiteral("Unknown Genre");
    case TemplateField::Year:        return QStringLiteral("Unknown Year");
    case TemplateField::Artist:      return QStringLiteral("Unknown Artist");
    case TemplateField::AlbumArtist: return QStringLiteral("Unknown Artist");
    case TemplateField::Album:       return QStringLiteral("Unknown Album");
    case TemplateField::TrackNumber: return QStringLiteral("00");
    case TemplateField::ReleaseId:   return QStringLiteral("Unknown Release");
    case TemplateField::Title:
    case TemplateField::Extension:
        break;
    }
    return QString();
}

bool PathTemplate::isRequired(TemplateField field)
{
    return field == TemplateField::Title || field == TemplateField::Extension;
}

// ═══════════════════════════════════════════════════════════════════════
//  compile
// ═══════════════════════════════════════════════════════════════════════

static bool isWordChar(QChar c)
{
    return c.isLetterOrNumber() || c.isMark() || c == QLatin1Char('_');
}

// left(n) that never splits a surrogate pair
static QString leftCodePoints(const QString& s, int n)
{
    if (n <= 0)
        return QString();
    if (s.size() <= n)
        return s;
    if (s.at(n - 1).isHighSurrogate())
        --n;
    return s.left(n);
}

static void setError(TemplateError* error, TemplateError::Kind kind, int position,
                     const QString& detail = QString())
{
    if (!error)
        return;
    error->kind = kind;
    error->position = position;
    error->detail = detail;
}

static bool parseGroup(const QString& body, int bodyOffset, TemplateToken* token, TemplateError* error)
{
    token->type = TemplateToken::Type::Group;

    QString separator;
    int i = 0;
    while (i < body.size()) {
        if (!isWordChar(body.at(i))) {
            separator += body.at(i);
            ++i;
            continue;
        }
        int start = i;
        while (i < body.size() && isWordChar(body.at(i)))
            ++i;
        const QString word = body.mid(start, i - start);
        auto field = PathTemplate::fieldFromName(word);
        if (!field) {
            setError(error, TemplateError::Kind::UnknownPlaceholder, bodyOffset + start, word);
            return false;
        }
        token->separators.append(separator);
        token->fields.append(*field);
        separator.clear();
    }
    token->separators.append(separator);

    if (token->fields.isEmpty()) {
        setError(error, TemplateError::Kind::EmptyPlaceholder, bodyOffset - 1);
        return false;
    }
    return true;
}

static bool compileSegments(const QString& pattern, QVector<TemplateSegment>* segments,
                            TemplateError* error)
{
    TemplateSegment current;
    QString literal;

    auto flushLiteral = [&]() {
        if (literal.isEmpty())
            return;
        TemplateToken token;
        token.type = TemplateToken::Type::Literal;
        token.text = literal;
        current.tokens.append(token);
        literal.clear();
    };
    auto flushSegment = [&]() {
        flushLiteral();
        if (!current.tokens.isEmpty())
            segments->append(current);
        current = TemplateSegment();
    };

    for (int i = 0; i < pattern.size(); ++i) {
        const QChar c = pattern.at(i);
        if (c == QLatin1Char('{')) {
            int j = i + 1;
            while (j < pattern.size() && pattern.at(j) != QLatin1Char('}')) {
                if (pattern.at(j) == QLatin1Char('{')) {
                    setError(error, TemplateError::Kind::UnbalancedDelimiter, j);
                    return false;
                }
                if (pattern.at(j) == QLatin1Char('/') || pattern.at(j) == QLatin1Char('\\')) {
                    setError(error, TemplateError::Kind::UnbalancedDelimiter, j);
                    return false;
                }
                ++j;
            }
            if (j >= pattern.size()) {
                setError(error, TemplateError::Kind::UnbalancedDelimiter, i);
                return false;
            }
            flushLiteral();
            TemplateToken token;
            if (!parseGroup(pattern.mid(i + 1, j - i - 1), i + 1, &token, error))
                return false;
            current.tokens.append(token);
            i = j;
        } else if (c == QLatin1Char('}')) {
            setError(error, TemplateError::Kind::UnbalancedDelimiter, i);
            return false;
        } else if (c == QLatin1Char('/') || c == QLatin1Char('\\')) {
            flushSegment();
        } else {
            literal += c;
        }
    }
    flushSegment();

    if (segments->isEmpty()) {
        setError(error, TemplateError::Kind::EmptyTemplate, 0);
        return false;
    }
    return true;
}

std::optional<TemplatePlan> PathTemplate::compile(const QString& pattern,
                                                  const TemplateRules& rules,
                                                  TemplateError* error)
{
    if (pattern.trimmed().isEmpty()) {
        setError(error, TemplateError::Kind::EmptyTemplate, 0);
        return std::nullopt;
    }

    // Decomposed input ("A\u0301lbum") must match the composed aliases
    const QString normalized = pattern.normalized(QString::NormalizationForm_C);

    TemplatePlan plan;
    plan.pattern = normalized;
    plan.rules = rules;
    if (!compileSegments(normalized, &plan.segments, error)) {
        qWarning() << "[Template] Rejected pattern" << pattern
                   << (error ? error->message() : QString());
        return std::nullopt;
    }

    if (rules.compilationDetection && !rules.compilationPattern.trimmed().isEmpty()) {
        if (!compileSegments(rules.compilationPattern.normalized(QString::NormalizationForm_C),
                             &plan.compilationSegments, error)) {
            if (error)
                error->detail = QStringLiteral("compilation pattern: ") + error->detail;
            qWarning() << "[Template] Rejected compilation pattern" << rules.compilationPattern;
            return std::nullopt;
        }
    }

    return plan;
}

// ═══════════════════════════════════════════════════════════════════════
//  render
// ═══════════════════════════════════════════════════════════════════════

static std::optional<QString> fieldValue(TemplateField field, const Track& track,
                                         const TemplateRules& rules, bool variousArtists)
{
    QString value;
    switch (field) {
    case TemplateField::Genre:
        value = track.genre;
        break;
    case TemplateField::Year:
        if (track.year && *track.year > 0)
            value = QString::number(*track.year);
        break;
    case TemplateField::Artist:
        if (variousArtists)
            return PathTemplate::kVariousArtists;
        value = track.artist;
        if (value.trimmed().isEmpty() && rules.fallbackToAlbumArtist)
            value = track.albumArtist;
        break;
    case TemplateField::AlbumArtist:
        if (variousArtists)
            return PathTemplate::kVariousArtists;
        value = track.albumArtist.trimmed().isEmpty() ? track.artist : track.albumArtist;
        break;
    case TemplateField::Album:
        value = rules.stripPromoParens ? PathTemplate::stripPromoSuffix(track.album) : track.album;
        break;
    case TemplateField::TrackNumber:
        if (track.trackNumber && *track.trackNumber > 0)
            value = QStringLiteral("%1").arg(*track.trackNumber, 2, 10, QLatin1Char('0'));
        break;
    case TemplateField::Title:
        value = rules.stripPromoParens ? PathTemplate::stripPromoSuffix(track.title) : track.title;
        break;
    case TemplateField::Extension:
        value = track.extension();
        break;
    case TemplateField::ReleaseId:
        value = track.releaseId;
        break;
    }

    if (rules.stripNames)
        value = value.simplified();
    // A tag value never introduces a directory level
    value.replace(QLatin1Char('/'), rules.substitute);
    value.replace(QLatin1Char('\\'), rules.substitute);

    if (value.trimmed().isEmpty())
        return std::nullopt;
    return value;
}

static std::optional<QString> renderGroup(const TemplateToken& token, const Track& track,
                                          const TemplateRules& rules, bool variousArtists,
                                          RenderError* error)
{
    QString body;
    int lastPresent = -1;
    for (int k = 0; k < token.fields.size(); ++k) {
        const TemplateField field = token.fields.at(k);
        auto value = fieldValue(field, track, rules, variousArtists);
        if (!value) {
            if (PathTemplate::isRequired(field)) {
                if (error) {
                    error->kind = RenderError::Kind::MissingField;
                    error->field = field;
                }
                return std::nullopt;
            }
            continue;
        }
        if (lastPresent >= 0)
            body += token.separators.at(lastPresent + 1);
        body += *value;
        lastPresent = k;
    }

    if (lastPresent < 0)
        body = PathTemplate::sentinel(token.fields.first());

    return token.separators.first() + body + token.separators.last();
}

static std::optional<QString> renderSegment(const TemplateSegment& segment, const Track& track,
                                            const TemplateRules& rules, bool variousArtists,
                                            RenderError* error)
{
    QString text;
    for (const auto& token : segment.tokens) {
        if (token.type == TemplateToken::Type::Literal) {
            text += token.text;
            continue;
        }
        auto part = renderGroup(token, track, rules, variousArtists, error);
        if (!part)
            return std::nullopt;
        text += *part;
    }
    return text;
}

std::optional<QString> PathTemplate::render(const TemplatePlan& plan,
                                            const Track& track,
                                            const RenderContext& context,
                                            RenderError* error)
{
    const bool compilation = context.compilation && plan.rules.compilationDetection;
    const bool explicitPattern = compilation && !plan.compilationSegments.isEmpty();
    const QVector<TemplateSegment>& segments = explicitPattern ? plan.compilationSegments
                                                               : plan.segments;

    QStringList parts;
    for (int i = 0; i < segments.size(); ++i) {
        const bool last = (i == segments.size() - 1);
        // Derived compilation layout: directories file under "Various Artists",
        // the file name carries the per-track artist instead.
        const bool variousArtists = compilation && !explicitPattern && !last;

        auto text = renderSegment(segments.at(i), track, plan.rules, variousArtists, error);
        if (!text)
            return std::nullopt;

        if (last && compilation && !explicitPattern
            && !segments.at(i).containsField(TemplateField::Artist)) {
            auto artist = fieldValue(TemplateField::Artist, track, plan.rules, false);
            text->prepend(artist.value_or(sentinel(TemplateField::Artist)) + QStringLiteral(" - "));
        }

        parts.append(sanitizeSegment(*text, plan.rules));
    }

    return parts.join(QLatin1Char('/'));
}

// ═══════════════════════════════════════════════════════════════════════
//  Sanitization
// ═══════════════════════════════════════════════════════════════════════

QString PathTemplate::sanitizeSegment(const QString& segment, const TemplateRules& rules)
{
    static const QRegularExpression forbidden(QStringLiteral("[<>:\"|?*\\x00-\\x1F]"));
    const QString substitute = rules.substitute.isEmpty() ? QStringLiteral("_") : rules.substitute;

    QString result = segment.normalized(QString::NormalizationForm_C);
    result.replace(QLatin1Char('/'), substitute);
    result.replace(QLatin1Char('\\'), substitute);
    if (rules.sanitizeForbiddenChars)
        result.replace(forbidden, substitute);

    result = rules.stripNames ? result.simplified() : result.trimmed();

    // Trailing dots/spaces are not portable
    while (result.endsWith(QLatin1Char('.')) || result.endsWith(QLatin1Char(' ')))
        result.chop(1);

    if (rules.maxSegmentLength > 0 && result.size() > rules.maxSegmentLength) {
        int dot = result.lastIndexOf(QLatin1Char('.'));
        if (dot > 0 && result.size() - dot <= 6) {
            QString ext = result.mid(dot);
            result = leftCodePoints(result.left(dot), rules.maxSegmentLength - ext.size()).trimmed() + ext;
        } else {
            result = leftCodePoints(result, rules.maxSegmentLength).trimmed();
        }
    }

    if (result.isEmpty() || result == QStringLiteral(".") || result == QStringLiteral(".."))
        return substitute;
    return result;
}

QString PathTemplate::stripPromoSuffix(const QString& text)
{
    static const QRegularExpression promo(
        QStringLiteral("\\s*[\\(\\[][^\\(\\)\\[\\]]*\\b(remaster|remastered|deluxe|expanded|"
                       "anniversary|bonus|explicit|reissue|edition|digitally)\\b[^\\(\\)\\[\\]]*[\\)\\]]\\s*$"),
        QRegularExpression::CaseInsensitiveOption);

    QString result = text;
    for (;;) {
        QRegularExpressionMatch m = promo.match(result);
        if (!m.hasMatch())
            break;
        QString stripped = result.left(m.capturedStart());
        if (stripped.trimmed().isEmpty())
            break;
        result = stripped;
    }
    return result.trimmed();
}

// ═══════════════════════════════════════════════════════════════════════
//  Compilation detection
// ═══════════════════════════════════════════════════════════════════════

QString PathTemplate::albumKey(const Track& track)
{
    const QString release = track.releaseId.trimmed();
    if (!release.isEmpty())
        return QStringLiteral("release:") + release.toLower();

    const QString album = track.album.simplified().toLower();
    if (album.isEmpty())
        return QString();
    return QStringLiteral("album:%1|%2")
        .arg(album, track.year ? QString::number(*track.year) : QString());
}

static bool isVariousArtistsTag(const QString& albumArtist)
{
    const QString a = albumArtist.simplified().toLower();
    return a == QStringLiteral("various artists") || a == QStringLiteral("various")
        || a == QStringLiteral("va") || a == QStringLiteral("varios artistas");
}

QSet<QString> PathTemplate::compilationAlbums(const QVector<Track>& tracks)
{
    QHash<QString, QSet<QString>> artistsByAlbum;
    QSet<QString> result;

    for (const auto& t : tracks) {
        const QString key = albumKey(t);
        if (key.isEmpty())
            continue;
        if (isVariousArtistsTag(t.albumArtist))
            result.insert(key);
        // A consistent album artist outranks per-track credits (featured guests)
        const QString albumArtist = t.albumArtist.simplified();
        const QString artist = (albumArtist.isEmpty() || isVariousArtistsTag(albumArtist)
                                    ? t.artist.simplified()
                                    : albumArtist).toLower();
        if (!artist.isEmpty())
            artistsByAlbum[key].insert(artist);
    }

    for (auto it = artistsByAlbum.constBegin(); it != artistsByAlbum.constEnd(); ++it) {
        if (it.value().size() > 1)
            result.insert(it.key());
    }
    return result;
}
