#ifndef VISIBILITYCHECKER_H
#define VISIBILITYCHECKER_H

#include <QDomElement>
#include <QString>

#include "documentAdapter.h"
#include "smilAnalyzer.h"

namespace Core {

// Decides whether an element takes part in the viewBox union at all.
class VisibilityChecker {
public:
    VisibilityChecker(const DocumentAdapter& adapter, const Animation::SmilAnalyzer& smil);

    // Under defs, symbol, marker, pattern, clipPath, mask or filter.
    bool isInsideDefinition(const QDomElement& element) const;

    // Static state only: display, visibility and opacity of the element and its ancestors.
    bool isElementVisible(const QDomElement& element) const;

    // A set/animate on the element or an ancestor that can make it visible.
    bool hasRevealingAnimation(const QDomElement& element) const;

    // A <set> hides the element at time zero for good and nothing brings it back.
    bool isHiddenFromStart(const QDomElement& element) const;

    bool shouldIncludeElement(const QDomElement& element) const;

    static bool isVisibilityAttribute(const QString& attributeName);
    static bool isHidingValue(const QString& attributeName, const QString& value);
    static bool isRevealingValue(const QString& attributeName, const QString& value);

private:
    bool revealsVisibility(const QDomElement& animation) const;

    const DocumentAdapter& adapter_;
    const Animation::SmilAnalyzer& smil_;
};

} // namespace Core

#endif // VISIBILITYCHECKER_H
