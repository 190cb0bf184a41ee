#pragma once

#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

#include "../MusicData.h"

enum class TemplateField {
    Genre,
    Year,
    Artist,
    AlbumArtist,
    Album,
    TrackNumber,
    Title,
    Extension,
    ReleaseId
};

// Sanitization and fallback rules applied while rendering.
struct TemplateRules {
    bool stripNames = true;              // trim + collapse whitespace in names
    bool stripPromoParens = false;       // drop "(Remastered 2011)" style suffixes
    bool sanitizeForbiddenChars = true;
    bool fallbackToAlbumArtist = true;   // artist missing → album artist
    bool compilationDetection = true;
    QString compilationPattern;          // empty → derived from the main pattern
    QString substitute = QStringLiteral("_");
    int maxSegmentLength = 200;
};

struct TemplateError {
    enum class Kind { None, EmptyTemplate, UnbalancedDelimiter, UnknownPlaceholder, EmptyPlaceholder,
                      UnknownTemplate };

    Kind kind = Kind::None;
    int position = -1;   // offset into the pattern
    QString detail;

    QString message() const;
};

struct RenderError {
    enum class Kind { None, MissingField };

    Kind kind = Kind::None;
    TemplateField field = TemplateField::Title;

    QString message() const;
};

// A compiled piece of one path segment. Literal text, or a placeholder
// group such as {TrackNo - Título}: fields plus the text around them.
// separators has fields.size() + 1 entries; separators[0] leads,
// separators[i] sits between fields[i-1] and fields[i], the last trails.
struct TemplateToken {
    enum class Type { Literal, Group };

    Type type = Type::Literal;
    QString text;
    QVector<TemplateField> fields;
    QStringList separators;
};

struct TemplateSegment {
    QVector<TemplateToken> tokens;

    bool containsField(TemplateField field) const;
};

struct TemplatePlan {
    QString pattern;
    TemplateRules rules;
    QVector<TemplateSegment> segments;
    QVector<TemplateSegment> compilationSegments;  // empty → derive

    bool isValid() const { return !segments.isEmpty(); }
};

struct RenderContext {
    bool compilation = false;   // the track's album has several artists
};

// Template syntax: literal text with {Field} placeholders, '/' separating
// directories. A placeholder may hold several fields with separator text
// between them ("{TrackNo - Título}"); absent optional fields inside such a
// group are dropped together with the separator in front of them.
// Field names are case-insensitive and accept English or Spanish aliases.
class PathTemplate {
public:
    static std::optional<TemplatePlan> compile(const QString& pattern,
                                               const TemplateRules& rules = TemplateRules(),
                                               TemplateError* error = nullptr);

    // Relative path ('/' separated), or nullopt when a required field
    // (title, extension) is missing.
    static std::optional<QString> render(const TemplatePlan& plan,
                                         const Track& track,
                                         const RenderContext& context = RenderContext(),
                                         RenderError* error = nullptr);

    static QString sanitizeSegment(const QString& segment, const TemplateRules& rules);
    static QString stripPromoSuffix(const QString& text);

    // Albums (by albumKey) whose tracks carry more than one distinct artist.
    static QString albumKey(const Track& track);
    static QSet<QString> compilationAlbums(const QVector<Track>& tracks);

    static QString fieldName(TemplateField field);
    static std::optional<TemplateField> fieldFromName(const QString& name);
    static QString sentinel(TemplateField field);
    static bool isRequired(TemplateField field);

    static const QString kVariousArtists;
};
