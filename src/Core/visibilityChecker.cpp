#include "visibilityChecker.h"
#include "valueParsing.h"

#include <QStringList>

namespace Core {

namespace {

const QStringList kDefinitionTags = { "defs", "symbol", "marker", "pattern", "clipPath", "mask", "filter" };

bool isTransparent(const QString& opacity) {
    bool ok = false;
    double value = Parsing::parseLeadingNumber(opacity, &ok);
    if (!ok) {
        return false;
    }
    if (opacity.trimmed().endsWith(QLatin1Char('%'))) {
        value /= 100.0;
    }
    return value <= 0.0;
}

} // namespace

VisibilityChecker::VisibilityChecker(const DocumentAdapter& adapter, const Animation::SmilAnalyzer& smil)
    : adapter_(adapter), smil_(smil) {
}

bool VisibilityChecker::isVisibilityAttribute(const QString& attributeName) {
    return attributeName == "display" || attributeName == "visibility" || attributeName == "opacity";
}

bool VisibilityChecker::isHidingValue(const QString& attributeName, const QString& value) {
    const QString trimmed = value.trimmed();
    if (attributeName == "display") return trimmed == "none";
    if (attributeName == "visibility") return trimmed == "hidden" || trimmed == "collapse";
    if (attributeName == "opacity") return isTransparent(trimmed);
    return false;
}

bool VisibilityChecker::isRevealingValue(const QString& attributeName, const QString& value) {
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty()) return false;
    if (attributeName == "display") return trimmed != "none";
    if (attributeName == "visibility") return trimmed == "visible";
    if (attributeName == "opacity") return !isTransparent(trimmed);
    return false;
}

bool VisibilityChecker::isInsideDefinition(const QDomElement& element) const {
    for (QDomElement ancestor = adapter_.parentElement(element); !ancestor.isNull();
         ancestor = adapter_.parentElement(ancestor)) {
        if (kDefinitionTags.contains(DocumentAdapter::localName(ancestor))) {
            return true;
        }
    }
    return false;
}

bool VisibilityChecker::isElementVisible(const QDomElement& element) const {
    // visibility inherits and a descendant may turn it back on; display and opacity do not
    bool visibilityResolved = false;
    for (QDomElement current = element; !current.isNull(); current = adapter_.parentElement(current)) {
        if (adapter_.computedStyleProperty(current, "display") == "none") {
            return false;
        }
        if (isTransparent(adapter_.computedStyleProperty(current, "opacity"))) {
            return false;
        }
        const QString visibility = adapter_.computedStyleProperty(current, "visibility");
        if (!visibilityResolved && !visibility.isEmpty() && visibility != "inherit") {
            if (isHidingValue("visibility", visibility)) {
                return false;
            }
            visibilityResolved = true;
        }
    }
    return true;
}

bool VisibilityChecker::revealsVisibility(const QDomElement& animation) const {
    const QString tag = DocumentAdapter::localName(animation);
    if (tag != "set" && tag != "animate") {
        return false;
    }
    const AttributeMap attributes = adapter_.attributes(animation);
    const QString name = attributes.value("attributeName").trimmed();
    if (!isVisibilityAttribute(name)) {
        return false;
    }

    QStringList candidates = attributes.value("values").split(QLatin1Char(';'), Qt::SkipEmptyParts);
    candidates << attributes.value("from") << attributes.value("to");
    for (const QString& candidate : candidates) {
        if (isRevealingValue(name, candidate)) {
            return true;
        }
    }
    // opacity by="0.5" raises it above zero
    return name == "opacity" && Parsing::parseLeadingNumber(attributes.value("by")) > 0.0;
}

bool VisibilityChecker::hasRevealingAnimation(const QDomElement& element) const {
    for (QDomElement current = element; !current.isNull(); current = adapter_.parentElement(current)) {
        const QList<QDomElement> animations = smil_.animationElementsFor(current);
        for (const QDomElement& animation : animations) {
            if (revealsVisibility(animation)) {
                return true;
            }
        }
    }
    return false;
}

bool VisibilityChecker::isHiddenFromStart(const QDomElement& element) const {
    bool hiddenAtZero = false;
    const QList<QDomElement> animations = smil_.animationElementsFor(element);
    for (const QDomElement& animation : animations) {
        if (DocumentAdapter::localName(animation) != "set") continue;
        const AttributeMap attributes = adapter_.attributes(animation);
        if (!isHidingValue(attributes.value("attributeName").trimmed(), attributes.value("to"))) continue;
        if (attributes.contains("dur") || attributes.contains("end")) continue;

        boost::optional<Animation::SetBegin> begin = Animation::SmilAnalyzer::parseSetBegin(attributes.value("begin"));
        if (begin && !begin->isEventBased && begin->timeMs == 0.0) {
            hiddenAtZero = true;
        }
    }
    return hiddenAtZero && !hasRevealingAnimation(element);
}

bool VisibilityChecker::shouldIncludeElement(const QDomElement& element) const {
    if (isInsideDefinition(element)) {
        return false;
    }
    if (!isElementVisible(element) && !hasRevealingAnimation(element)) {
        return false;
    }
    return !isHiddenFromStart(element);
}

} // namespace Core
