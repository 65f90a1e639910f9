#ifndef EFFECTSANALYZER_H
#define EFFECTSANALYZER_H

#include <QDomElement>
#include <QString>
#include <QStringList>

#include "boundingBox.h"
#include "documentAdapter.h"
#include "traceSink.h"

namespace Effects {

// How far a filter may paint beyond its element. x and y are the left and top growth;
// width and height the total horizontal and vertical growth. Pixel-based values are
// user units, otherwise fractions of the element's own size.
struct FilterExpansion {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    bool isPixelBased = false;

    bool isZero() const { return x == 0.0 && y == 0.0 && width == 0.0 && height == 0.0; }

    // Pixel expansions grow with the element's scale; fractions are scale free.
    FilterExpansion scaled(double factor) const;
};

struct FilterEffect {
    bool hasFilter = false;
    QString value;          // raw filter property
    QString referenceId;    // set for url(#id) filters
    FilterExpansion expansion;
};

struct ElementEffects {
    FilterEffect filter;
    bool hasMask = false;
    bool hasClipPath = false;
    // Masks and clip paths are never intersected; the unclipped bounds are kept.
    bool preserveFullBounds = false;

    bool hasAnyEffects() const { return filter.hasFilter || hasMask || hasClipPath; }
};

class EffectsAnalyzer {
public:
    explicit EffectsAnalyzer(const Core::DocumentAdapter& adapter, Core::TraceSink* trace = nullptr);

    FilterEffect analyzeFilter(const QDomElement& element) const;
    FilterExpansion analyzeFilterDefinition(const QDomElement& filter) const;
    bool analyzeMask(const QDomElement& element) const;
    bool analyzeClipPath(const QDomElement& element) const;
    ElementEffects analyzeElementEffects(const QDomElement& element) const;

    // blur() and drop-shadow() of a CSS filter list, always pixel based.
    static FilterExpansion analyzeCssFilters(const QString& filter);

    static Geometry::BoundingBox applyFilterExpansion(const Geometry::BoundingBox& bounds,
                                                      const FilterExpansion& expansion);
    static Geometry::BoundingBox expandForEffects(const ElementEffects& effects, const Geometry::BoundingBox& bounds);

    // Argument text of every `name(...)` call in value; nested parentheses are kept.
    static QStringList cssFunctionArguments(const QString& value, const QString& name);
    // Whitespace separated tokens outside of any parentheses.
    static QStringList topLevelTokens(const QString& arguments);

private:
    QList<QDomElement> primitivesOf(const QDomElement& filter) const;

    const Core::DocumentAdapter& adapter_;
    Core::TraceSink* trace_;
};

} // namespace Effects

#endif // EFFECTSANALYZER_H
