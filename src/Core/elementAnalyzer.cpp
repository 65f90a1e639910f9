#include "elementAnalyzer.h"
#include "pathGeometry.h"
#include "transformParser.h"
#include "valueParsing.h"

#include <QDebug>
#include <QPointF>
#include <QRegularExpression>
#include <QStringList>
#include <algorithm>
#include <cmath>

using Core::Parsing::parseLeadingNumber;

namespace Core {

namespace {

const QSet<QString> kNonRenderingTags = {
    "defs", "symbol", "marker", "pattern", "clipPath", "mask", "filter",
    "linearGradient", "radialGradient", "style", "script", "title", "desc", "metadata",
    "animate", "animateTransform", "animateMotion", "set", "mpath"
};

const QStringList kMarkedTags = { "path", "line", "polyline", "polygon" };

const QString kFeaturePrefix = "http://www.w3.org/TR/SVG11/feature#";

} // namespace

ElementAnalyzer::ElementAnalyzer(const DocumentAdapter& adapter, const AnalyzerConfig& config, TraceSink* trace)
    : adapter_(adapter),
      config_(config),
      trace_(trace),
      smil_(adapter, config, trace),
      css_(trace),
      combiner_(trace),
      effects_(adapter, trace),
      visibility_(adapter, smil_) {
    const QStringList sheets = adapter_.styleSheetTexts();
    for (const QString& sheet : sheets) {
        css_.parseStylesheet(sheet);
    }
}

bool ElementAnalyzer::isNonRenderingTag(const QString& tag) {
    return kNonRenderingTags.contains(tag);
}

bool ElementAnalyzer::isContainerTag(const QString& tag) {
    return tag == "g" || tag == "a" || tag == "switch";
}

double ElementAnalyzer::numberAttribute(const QDomElement& element, const QString& name, double fallback) const {
    boost::optional<QString> value = adapter_.attribute(element, name);
    if (!value) {
        return fallback;
    }
    bool ok = false;
    double number = parseLeadingNumber(*value, &ok);
    return ok ? number : fallback;
}

QString ElementAnalyzer::inheritedProperty(const QDomElement& element, const QString& name) const {
    for (QDomElement current = element; !current.isNull(); current = adapter_.parentElement(current)) {
        QString value = adapter_.computedStyleProperty(current, name);
        if (!value.isEmpty() && value != "inherit") {
            return value;
        }
    }
    return QString();
}

bool ElementAnalyzer::passesConditionals(const QDomElement& element) const {
    boost::optional<QString> extensions = adapter_.attribute(element, "requiredExtensions");
    if (extensions && !extensions->trimmed().isEmpty()) {
        // No extension namespaces are supported
        return false;
    }

    boost::optional<QString> features = adapter_.attribute(element, "requiredFeatures");
    if (features) {
        const QStringList list = features->split(QRegularExpression("[\\s,]+"), Qt::SkipEmptyParts);
        for (const QString& feature : list) {
            if (!feature.startsWith(kFeaturePrefix) && !feature.startsWith("org.w3c.svg")
                && !feature.startsWith("org.w3c.dom.svg")) {
                return false;
            }
        }
    }

    boost::optional<QString> languages = adapter_.attribute(element, "systemLanguage");
    if (languages) {
        const QString user = config_.systemLanguage.trimmed().toLower();
        const QString userPrimary = user.section(QLatin1Char('-'), 0, 0);
        const QStringList list = languages->split(QLatin1Char(','), Qt::SkipEmptyParts);
        for (const QString& entry : list) {
            const QString language = entry.trimmed().toLower();
            if (language == user || language.section(QLatin1Char('-'), 0, 0) == userPrimary) {
                return true;
            }
        }
        return false;
    }
    return true;
}

QDomElement ElementAnalyzer::selectSwitchChild(const QDomElement& switchElement) const {
    const QList<QDomElement> children = adapter_.childElements(switchElement);
    for (const QDomElement& child : children) {
        if (isNonRenderingTag(DocumentAdapter::localName(child))) continue;
        if (passesConditionals(child)) {
            return child;
        }
    }
    return QDomElement();
}

Geometry::AffineTransform ElementAnalyzer::nestedViewportTransform(const QDomElement& svg) const {
    Geometry::AffineTransform placement = Geometry::AffineTransform::translate(numberAttribute(svg, "x", 0.0),
                                                                             numberAttribute(svg, "y", 0.0));
    Geometry::BoundingBox viewBox;
    boost::optional<QString> viewBoxText = adapter_.attribute(svg, "viewBox");
    if (!viewBoxText || !Geometry::TransformParser::parseViewBox(*viewBoxText, &viewBox)) {
        return placement;
    }
    double width = numberAttribute(svg, "width", viewBox.width);
    double height = numberAttribute(svg, "height", viewBox.height);
    QString preserveAspectRatio = adapter_.attribute(svg, "preserveAspectRatio").value_or("xMidYMid meet");
    return placement.multiply(Geometry::TransformParser::viewportTransform(viewBox, width, height, preserveAspectRatio));
}

Geometry::OptionalBounds ElementAnalyzer::childrenBounds(const QDomElement& element, const QSet<QString>& visited) const {
    Geometry::OptionalBounds bounds;
    if (DocumentAdapter::localName(element) == "switch") {
        QDomElement chosen = selectSwitchChild(element);
        return chosen.isNull() ? bounds : contentBounds(chosen, visited);
    }
    const QList<QDomElement> children = adapter_.childElements(element);
    for (const QDomElement& child : children) {
        bounds = Geometry::unite(bounds, contentBounds(child, visited));
    }
    return bounds;
}

Geometry::OptionalBounds ElementAnalyzer::contentBounds(const QDomElement& element, QSet<QString> visited) const {
    const QString tag = DocumentAdapter::localName(element);
    if (isNonRenderingTag(tag) || !passesConditionals(element)
        || adapter_.computedStyleProperty(element, "display") == "none") {
        return boost::none;
    }

    Geometry::AffineTransform local = Geometry::TransformParser::parse(adapter_.attribute(element, "transform").value_or(QString()));

    if (tag == "svg") {
        Geometry::OptionalBounds inner = childrenBounds(element, visited);
        if (!inner) return boost::none;
        return local.multiply(nestedViewportTransform(element)).transformBounds(*inner);
    }

    Geometry::BoundingBox base = baseBounds(element, visited);
    if (base.isDegenerate()) {
        return boost::none;
    }
    return local.transformBounds(base);
}

Geometry::OptionalBounds ElementAnalyzer::useElementBounds(const QDomElement& use, QSet<QString> visited) const {
    const QString id = Parsing::fragmentId(adapter_.attribute(use, "href").value_or(QString()));
    if (id.isEmpty()) {
        Core::emitTrace(trace_, "use", "use without a local href");
        return boost::none;
    }
    if (visited.contains(id)) {
        qWarning() << "Circular use reference through" << id;
        return boost::none;
    }
    visited.insert(id);

    QDomElement target = adapter_.elementById(id);
    if (target.isNull()) {
        qWarning() << "use references missing element" << id;
        return boost::none;
    }

    Geometry::AffineTransform placement = Geometry::AffineTransform::translate(numberAttribute(use, "x", 0.0),
                                                                             numberAttribute(use, "y", 0.0));

    if (DocumentAdapter::localName(target) != "symbol") {
        Geometry::OptionalBounds content = contentBounds(target, visited);
        if (!content) return boost::none;
        return placement.transformBounds(*content);
    }

    Geometry::OptionalBounds content = childrenBounds(target, visited);
    if (!content) {
        return boost::none;
    }

    Geometry::BoundingBox viewBox;
    boost::optional<QString> viewBoxText = adapter_.attribute(target, "viewBox");
    if (viewBoxText && Geometry::TransformParser::parseViewBox(*viewBoxText, &viewBox)) {
        double width = numberAttribute(use, "width", numberAttribute(target, "width", viewBox.width));
        double height = numberAttribute(use, "height", numberAttribute(target, "height", viewBox.height));
        QString preserveAspectRatio = adapter_.attribute(target, "preserveAspectRatio").value_or("xMidYMid meet");
        placement = placement.multiply(Geometry::TransformParser::viewportTransform(viewBox, width, height,
                                                                                  preserveAspectRatio));
    }
    Core::emitTrace(trace_, "use", QString("#%1 resolved through %2 level(s)").arg(id).arg(visited.size()));
    return placement.transformBounds(*content);
}

Geometry::OptionalBounds ElementAnalyzer::markerBounds(const QDomElement& element) const {
    if (!config_.includeMarkers || !kMarkedTags.contains(DocumentAdapter::localName(element))) {
        return boost::none;
    }

    const QString shorthand = adapter_.computedStyleProperty(element, "marker");
    QString start = adapter_.computedStyleProperty(element, "marker-start");
    QString mid = adapter_.computedStyleProperty(element, "marker-mid");
    QString end = adapter_.computedStyleProperty(element, "marker-end");
    if (start.isEmpty()) start = shorthand;
    if (mid.isEmpty()) mid = shorthand;
    if (end.isEmpty()) end = shorthand;
    if (Parsing::urlReference(start).isEmpty() && Parsing::urlReference(mid).isEmpty()
        && Parsing::urlReference(end).isEmpty()) {
        return boost::none;
    }

    const QString tag = DocumentAdapter::localName(element);
    QList<QPointF> vertices;
    if (tag == "path") {
        vertices = Geometry::PathGeometry::vertices(adapter_.attribute(element, "d").value_or(QString()));
    } else if (tag == "line") {
        vertices << QPointF(numberAttribute(element, "x1", 0.0), numberAttribute(element, "y1", 0.0))
                 << QPointF(numberAttribute(element, "x2", 0.0), numberAttribute(element, "y2", 0.0));
    } else {
        const QList<double> numbers = Parsing::parseNumberList(adapter_.attribute(element, "points").value_or(QString()));
        for (int i = 0; i + 1 < numbers.size(); i += 2) {
            vertices.append(QPointF(numbers.at(i), numbers.at(i + 1)));
        }
        if (tag == "polygon" && !vertices.isEmpty()) {
            vertices.append(vertices.first());
        }
    }
    if (vertices.isEmpty()) {
        return boost::none;
    }

    bool ok = false;
    double strokeWidth = parseLeadingNumber(inheritedProperty(element, "stroke-width"), &ok);
    if (!ok) strokeWidth = 1.0;

    Geometry::OptionalBounds bounds;
    auto addMarker = [&](const QString& reference, int from, int to) {
        const QString id = Parsing::urlReference(reference);
        if (id.isEmpty()) return;
        QDomElement marker = adapter_.elementById(id);
        if (marker.isNull() || DocumentAdapter::localName(marker) != "marker") {
            qWarning() << "Marker reference" << id << "does not resolve to a <marker>";
            return;
        }
        double width = numberAttribute(marker, "markerWidth", 3.0);
        double height = numberAttribute(marker, "markerHeight", 3.0);
        bool strokeUnits = adapter_.attribute(marker, "markerUnits").value_or("strokeWidth").trimmed() != "userSpaceOnUse";
        // Orientation is not modelled; the diagonal covers any rotation about the ref point
        double half = std::hypot(width, height) * (strokeUnits ? std::abs(strokeWidth) : 1.0);
        for (int i = from; i <= to && i < vertices.size(); ++i) {
            const QPointF& vertex = vertices.at(i);
            bounds = Geometry::unite(bounds, Geometry::BoundingBox(vertex.x() - half, vertex.y() - half, 2.0 * half, 2.0 * half));
        }
    };

    const int last = vertices.size() - 1;
    addMarker(start, 0, 0);
    if (last > 1) addMarker(mid, 1, last - 1);
    addMarker(end, last, last);
    return bounds;
}

Geometry::BoundsDelta ElementAnalyzer::patternOverflow(const QDomElement& element, const Geometry::BoundingBox& box,
                                                       QSet<QString> visited) const {
    Geometry::BoundsDelta delta;
    const QString id = Parsing::urlReference(inheritedProperty(element, "fill"));
    if (id.isEmpty() || visited.contains(id)) {
        return delta;
    }
    visited.insert(id);

    QDomElement pattern = adapter_.elementById(id);
    if (pattern.isNull() || DocumentAdapter::localName(pattern) != "pattern") {
        return delta;
    }

    // Tile content is laid out with the tile's corner at its origin.
    Geometry::OptionalBounds content;
    const QList<QDomElement> children = adapter_.childElements(pattern);
    for (const QDomElement& child : children) {
        Geometry::OptionalBounds childBounds = contentBounds(child, visited);
        if (childBounds && childBounds->width > 0.0 && childBounds->height > 0.0) {
            content = Geometry::unite(content, *childBounds);
        }
    }
    if (!content) {
        return delta;
    }
    if (adapter_.attribute(pattern, "patternContentUnits").value_or(QString()).trimmed() == "objectBoundingBox") {
        content = Geometry::AffineTransform::scale(box.width, box.height).transformBounds(*content);
    }

    const bool boxUnits =
        adapter_.attribute(pattern, "patternUnits").value_or("objectBoundingBox").trimmed() != "userSpaceOnUse";
    auto tileLength = [&](const QString& name, double extent) {
        const QString text = adapter_.attribute(pattern, name).value_or(QString()).trimmed();
        double length = parseLeadingNumber(text);
        if (text.endsWith(QLatin1Char('%'))) {
            return length / 100.0 * extent;
        }
        // objectBoundingBox lengths are fractions; anything larger was written in user units
        return (boxUnits && length <= 1.0) ? length * extent : length;
    };
    const double tileWidth = tileLength("width", box.width);
    const double tileHeight = tileLength("height", box.height);

    const double left = std::max(0.0, -content->x);
    const double top = std::max(0.0, -content->y);
    const double right = std::max(0.0, content->right() - tileWidth);
    const double bottom = std::max(0.0, content->bottom() - tileHeight);
    delta.x = -left;
    delta.y = -top;
    delta.width = left + right;
    delta.height = top + bottom;

    if (!delta.isZero()) {
        Core::emitTrace(trace_, "pattern", QString("#%1 overflows its %2x%3 tile by %4, %5, %6, %7")
                                               .arg(id).arg(tileWidth).arg(tileHeight)
                                               .arg(left).arg(top).arg(right).arg(bottom));
    }
    return delta;
}

Geometry::BoundingBox ElementAnalyzer::baseBounds(const QDomElement& element, QSet<QString> visited) const {
    const QString tag = DocumentAdapter::localName(element);

    if (tag == "use") {
        Geometry::OptionalBounds referenced = useElementBounds(element, visited);
        return referenced ? *referenced : adapter_.intrinsicBBox(element);
    }
    if (isContainerTag(tag)) {
        Geometry::OptionalBounds content = childrenBounds(element, visited);
        return content ? *content : Geometry::BoundingBox();
    }

    Geometry::BoundingBox base = adapter_.intrinsicBBox(element);
    if (!base.isDegenerate()) {
        base = base.withDelta(patternOverflow(element, base, visited));
    }
    Geometry::OptionalBounds markers = markerBounds(element);
    if (markers) {
        base = base.united(*markers);
    }
    return base;
}

QList<Animation::AnimationDescriptor> ElementAnalyzer::computeAnimations(const QDomElement& element) const {
    return computeAnimations(element, baseBounds(element));
}

QList<Animation::AnimationDescriptor> ElementAnalyzer::computeAnimations(const QDomElement& element,
                                                                         const Geometry::BoundingBox& baseBounds) const {
    QList<Animation::AnimationDescriptor> animations = smil_.computeAnimations(element);
    const QList<Animation::CssAnimation> cssAnimations = css_.analyzeElement(element, adapter_, baseBounds);
    for (const Animation::CssAnimation& animation : cssAnimations) {
        animations.append(animation);
    }
    return animations;
}

ElementBoundsResult ElementAnalyzer::analyzeElement(const QDomElement& element,
                                                    const Geometry::AffineTransform& ancestorTransform) const {
    ElementBoundsResult result;
    result.element = element;
    result.label = adapter_.attribute(element, "id").value_or(DocumentAdapter::localName(element));
    result.baseBounds = baseBounds(element);

    const Geometry::AffineTransform local =
        Geometry::TransformParser::parse(adapter_.attribute(element, "transform").value_or(QString()));
    const Geometry::AffineTransform cumulative = ancestorTransform.multiply(local);

    const QList<Animation::AnimationDescriptor> animations = computeAnimations(element, result.baseBounds);
    result.animationCount = animations.size();
    result.hasAnimations = !animations.isEmpty();

    const Effects::ElementEffects effects = effects_.analyzeElementEffects(element);
    result.hasEffects = effects.hasAnyEffects();
    result.preserveFullBounds = effects.preserveFullBounds;

    if (result.baseBounds.isDegenerate() && !result.hasAnimations && !result.hasEffects) {
        result.skipped = true;
        Core::emitTrace(trace_, "element", QString("%1 has no extent, skipped").arg(result.label));
        return result;
    }

    result.transformedBounds = cumulative.transformBounds(result.baseBounds);

    // combine() answers in the parent's user space
    Geometry::BoundingBox envelope = combiner_.combine(animations, result.baseBounds, local);
    result.animatedBounds = ancestorTransform.transformBounds(envelope);

    // Pixel expansions grow with the element's scale on their way to the root.
    Effects::ElementEffects rootEffects = effects;
    rootEffects.filter.expansion = effects.filter.expansion.scaled(cumulative.maxScaleFactor());
    result.effectExpandedBounds = Effects::EffectsAnalyzer::expandForEffects(rootEffects, result.animatedBounds);
    if (result.preserveFullBounds) {
        Core::emitTrace(trace_, "element", QString("%1: mask or clip-path not applied").arg(result.label));
    }

    Core::emitTrace(trace_, "element", QString("%1: base (%2, %3) %4x%5, %6 animation(s) -> (%7, %8) %9x%10")
                                           .arg(result.label)
                                           .arg(result.baseBounds.x).arg(result.baseBounds.y)
                                           .arg(result.baseBounds.width).arg(result.baseBounds.height)
                                           .arg(result.animationCount)
                                           .arg(result.effectExpandedBounds.x).arg(result.effectExpandedBounds.y)
                                           .arg(result.effectExpandedBounds.width).arg(result.effectExpandedBounds.height));
    return result;
}

} // namespace Core
