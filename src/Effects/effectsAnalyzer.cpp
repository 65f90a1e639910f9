#include "effectsAnalyzer.h"
#include "valueParsing.h"

#include <QDebug>
#include <algorithm>
#include <cmath>

using Core::Parsing::parseLeadingNumber;
using Core::Parsing::parseNumberList;

namespace Effects {

namespace {

double maxOf(const QList<double>& values) {
    double result = 0.0;
    for (double value : values) {
        result = std::max(result, value);
    }
    return result;
}

// Region component as a fraction of the bounding box: "-10%" -> -0.1, "-0.1" -> -0.1.
double regionFraction(const QString& value, double fallback) {
    bool ok = false;
    double number = parseLeadingNumber(value, &ok);
    if (!ok) {
        return fallback;
    }
    return value.trimmed().endsWith(QLatin1Char('%')) ? number / 100.0 : number;
}

FilterExpansion fromSides(double left, double top, double right, double bottom, bool pixelBased) {
    FilterExpansion expansion;
    expansion.x = left;
    expansion.y = top;
    expansion.width = left + right;
    expansion.height = top + bottom;
    expansion.isPixelBased = pixelBased;
    return expansion;
}

} // namespace

FilterExpansion FilterExpansion::scaled(double factor) const {
    if (!isPixelBased) {
        return *this;
    }
    FilterExpansion result(*this);
    result.x *= factor;
    result.y *= factor;
    result.width *= factor;
    result.height *= factor;
    return result;
}

EffectsAnalyzer::EffectsAnalyzer(const Core::DocumentAdapter& adapter, Core::TraceSink* trace)
    : adapter_(adapter), trace_(trace) {
}

QStringList EffectsAnalyzer::cssFunctionArguments(const QString& value, const QString& name) {
    QStringList arguments;
    const QString opening = name + QLatin1Char('(');
    int position = 0;
    while ((position = value.indexOf(opening, position, Qt::CaseInsensitive)) >= 0) {
        if (position > 0) {
            QChar before = value.at(position - 1);
            if (before.isLetterOrNumber() || before == QLatin1Char('-')) {
                position += opening.size();
                continue;
            }
        }

        int depth = 0;
        int start = position + opening.size();
        int i = start;
        for (; i < value.size(); ++i) {
            QChar ch = value.at(i);
            if (ch == QLatin1Char('(')) {
                ++depth;
            } else if (ch == QLatin1Char(')')) {
                if (depth == 0) break;
                --depth;
            }
        }
        arguments.append(value.mid(start, i - start).trimmed());
        position = i;
    }
    return arguments;
}

QStringList EffectsAnalyzer::topLevelTokens(const QString& arguments) {
    QStringList tokens;
    QString current;
    int depth = 0;
    for (QChar ch : arguments) {
        if (ch == QLatin1Char('(')) {
            ++depth;
        } else if (ch == QLatin1Char(')')) {
            depth = std::max(0, depth - 1);
        }
        if (depth == 0 && (ch.isSpace() || ch == QLatin1Char(','))) {
            if (!current.isEmpty()) tokens.append(current);
            current.clear();
        } else {
            current.append(ch);
        }
    }
    if (!current.isEmpty()) tokens.append(current);
    return tokens;
}

FilterExpansion EffectsAnalyzer::analyzeCssFilters(const QString& filter) {
    double left = 0.0;
    double top = 0.0;
    double right = 0.0;
    double bottom = 0.0;

    const QStringList blurs = cssFunctionArguments(filter, "blur");
    for (const QString& arguments : blurs) {
        double extent = 3.0 * std::abs(parseLeadingNumber(arguments));
        left = std::max(left, extent);
        top = std::max(top, extent);
        right = std::max(right, extent);
        bottom = std::max(bottom, extent);
    }

    const QStringList shadows = cssFunctionArguments(filter, "drop-shadow");
    for (const QString& arguments : shadows) {
        // Colour may come first or last; the lengths are the numeric tokens in order.
        QList<double> lengths;
        const QStringList tokens = topLevelTokens(arguments);
        for (const QString& token : tokens) {
            bool ok = false;
            double value = parseLeadingNumber(token, &ok);
            if (ok) lengths.append(value);
        }
        double dx = lengths.value(0, 0.0);
        double dy = lengths.value(1, 0.0);
        double blur = 3.0 * std::abs(lengths.value(2, 0.0));

        left = std::max(left, std::max(0.0, -dx) + blur);
        right = std::max(right, std::max(0.0, dx) + blur);
        top = std::max(top, std::max(0.0, -dy) + blur);
        bottom = std::max(bottom, std::max(0.0, dy) + blur);
    }

    return fromSides(left, top, right, bottom, true);
}

QList<QDomElement> EffectsAnalyzer::primitivesOf(const QDomElement& filter) const {
    static const QStringList primitiveTags = { "feGaussianBlur", "feDropShadow", "feOffset", "feMorphology" };
    QList<QDomElement> primitives;
    const QList<QDomElement> children = adapter_.childElements(filter);
    for (const QDomElement& child : children) {
        if (primitiveTags.contains(Core::DocumentAdapter::localName(child))) {
            primitives.append(child);
        }
        primitives.append(primitivesOf(child));
    }
    return primitives;
}

FilterExpansion EffectsAnalyzer::analyzeFilterDefinition(const QDomElement& filter) const {
    const Core::AttributeMap attributes = adapter_.attributes(filter);

    double blur = 0.0;
    double offsetX = 0.0;
    double offsetY = 0.0;
    double dilate = 0.0;

    const QList<QDomElement> primitives = primitivesOf(filter);
    for (const QDomElement& primitive : primitives) {
        const QString tag = Core::DocumentAdapter::localName(primitive);
        const Core::AttributeMap values = adapter_.attributes(primitive);
        if (tag == "feGaussianBlur") {
            blur = std::max(blur, 3.0 * maxOf(parseNumberList(values.value("stdDeviation"))));
        } else if (tag == "feDropShadow") {
            offsetX += parseLeadingNumber(values.value("dx"));
            offsetY += parseLeadingNumber(values.value("dy"));
            blur = std::max(blur, 3.0 * maxOf(parseNumberList(values.value("stdDeviation"))));
        } else if (tag == "feOffset") {
            offsetX += parseLeadingNumber(values.value("dx"));
            offsetY += parseLeadingNumber(values.value("dy"));
        } else if (tag == "feMorphology" && values.value("operator").trimmed() == "dilate") {
            dilate = std::max(dilate, maxOf(parseNumberList(values.value("radius"))));
        }
    }

    double spread = blur + dilate;
    double left = std::max(0.0, -offsetX) + spread;
    double right = std::max(0.0, offsetX) + spread;
    double top = std::max(0.0, -offsetY) + spread;
    double bottom = std::max(0.0, offsetY) + spread;
    if (left > 0.0 || right > 0.0 || top > 0.0 || bottom > 0.0) {
        Core::emitTrace(trace_, "effects", QString("filter primitives: blur %1, offset (%2, %3), dilate %4")
                                               .arg(blur).arg(offsetX).arg(offsetY).arg(dilate));
        return fromSides(left, top, right, bottom, true);
    }

    if (attributes.value("filterUnits").trimmed() == "userSpaceOnUse") {
        Core::emitTrace(trace_, "effects", "userSpaceOnUse filter region ignored");
        return FilterExpansion();
    }

    double x = regionFraction(attributes.value("x", "-10%"), -0.1);
    double y = regionFraction(attributes.value("y", "-10%"), -0.1);
    double width = regionFraction(attributes.value("width", "120%"), 1.2);
    double height = regionFraction(attributes.value("height", "120%"), 1.2);

    Core::emitTrace(trace_, "effects", QString("filter region %1 %2 %3 %4").arg(x).arg(y).arg(width).arg(height));
    return fromSides(std::max(0.0, -x), std::max(0.0, -y),
                     std::max(0.0, x + width - 1.0), std::max(0.0, y + height - 1.0), false);
}

FilterEffect EffectsAnalyzer::analyzeFilter(const QDomElement& element) const {
    FilterEffect effect;
    const QString value = adapter_.computedStyleProperty(element, "filter").trimmed();
    if (value.isEmpty() || value == "none") {
        return effect;
    }
    effect.hasFilter = true;
    effect.value = value;

    const QString id = Core::Parsing::urlReference(value);
    if (id.isEmpty()) {
        effect.expansion = analyzeCssFilters(value);
        return effect;
    }

    effect.referenceId = id;
    QDomElement definition = adapter_.elementById(id);
    if (definition.isNull() || Core::DocumentAdapter::localName(definition) != "filter") {
        Core::emitTrace(trace_, "effects", QString("filter reference '%1' not found").arg(id));
        return effect;
    }
    effect.expansion = analyzeFilterDefinition(definition);
    return effect;
}

bool EffectsAnalyzer::analyzeMask(const QDomElement& element) const {
    const QString value = adapter_.computedStyleProperty(element, "mask").trimmed();
    return !value.isEmpty() && value != "none";
}

bool EffectsAnalyzer::analyzeClipPath(const QDomElement& element) const {
    const QString value = adapter_.computedStyleProperty(element, "clip-path").trimmed();
    return !value.isEmpty() && value != "none";
}

ElementEffects EffectsAnalyzer::analyzeElementEffects(const QDomElement& element) const {
    ElementEffects effects;
    effects.filter = analyzeFilter(element);
    effects.hasMask = analyzeMask(element);
    effects.hasClipPath = analyzeClipPath(element);
    effects.preserveFullBounds = effects.hasMask || effects.hasClipPath;

    if (effects.hasAnyEffects()) {
        Core::emitTrace(trace_, "effects", QString("filter=%1 mask=%2 clip-path=%3")
                                               .arg(effects.filter.hasFilter ? effects.filter.value : QString("none"))
                                               .arg(effects.hasMask).arg(effects.hasClipPath));
    }
    return effects;
}

Geometry::BoundingBox EffectsAnalyzer::applyFilterExpansion(const Geometry::BoundingBox& bounds,
                                                            const FilterExpansion& expansion) {
    if (expansion.isZero()) {
        return bounds;
    }
    // A coefficient of 1 or more can only be a length; treat the whole expansion as pixels.
    if (expansion.isPixelBased || expansion.x >= 1.0 || expansion.y >= 1.0
        || expansion.width >= 1.0 || expansion.height >= 1.0) {
        return Geometry::BoundingBox(bounds.x - expansion.x, bounds.y - expansion.y,
                                     bounds.width + expansion.width, bounds.height + expansion.height);
    }
    return Geometry::BoundingBox(bounds.x - bounds.width * expansion.x, bounds.y - bounds.height * expansion.y,
                                 bounds.width + bounds.width * expansion.width,
                                 bounds.height + bounds.height * expansion.height);
}

Geometry::BoundingBox EffectsAnalyzer::expandForEffects(const ElementEffects& effects,
                                                        const Geometry::BoundingBox& bounds) {
    if (!effects.filter.hasFilter) {
        return bounds;
    }
    return applyFilterExpansion(bounds, effects.filter.expansion);
}

} // namespace Effects
