#ifndef CSSKEYFRAMEANALYZER_H
#define CSSKEYFRAMEANALYZER_H

#include <QDomElement>
#include <QHash>
#include <QList>
#include <QPointF>
#include <QString>
#include <QStringList>

#include "affineTransform.h"
#include "animationTypes.h"
#include "boundingBox.h"
#include "documentAdapter.h"
#include "traceSink.h"

namespace Animation {

struct CssKeyframe {
    double percentage = 0.0;
    QString transform;      // "none" when the keyframe does not touch transform
};

// Collects @keyframes rules from <style> text and turns the transform keyframes an
// element runs through into a bounds expansion relative to its base box.
class CssKeyframeAnalyzer {
public:
    explicit CssKeyframeAnalyzer(Core::TraceSink* trace = nullptr);

    // Adds every @keyframes / @-webkit-keyframes block of the stylesheet. A later
    // block with the same name replaces the earlier one.
    void parseStylesheet(const QString& css);

    bool hasKeyframes(const QString& name) const { return keyframes_.contains(name); }
    QList<CssKeyframe> keyframes(const QString& name) const { return keyframes_.value(name); }

    // One CssAnimation per resolved animation name on the element.
    QList<CssAnimation> analyzeElement(const QDomElement& element, const Core::DocumentAdapter& adapter,
                                       const Geometry::BoundingBox& baseBounds) const;

    // Envelope of the base box over every keyframe of `name`, as a delta on baseBounds.
    Geometry::BoundsDelta expansionFor(const QString& name, const QString& direction,
                                       const QString& transformOrigin, const Geometry::BoundingBox& baseBounds) const;

    // CSS transform list to a matrix. Percentages in translations resolve against
    // referenceBox.
    static Geometry::AffineTransform parseTransformFunctions(const QString& transform,
                                                             const Geometry::BoundingBox& referenceBox);
    // Absolute pivot point for a transform-origin value.
    static QPointF parseTransformOrigin(const QString& transformOrigin, const Geometry::BoundingBox& bounds);
    static QList<QPointF> transformedCorners(const Geometry::BoundingBox& bounds,
                                             const Geometry::AffineTransform& transform, const QPointF& origin);
    static QList<CssKeyframe> orderByDirection(const QList<CssKeyframe>& keyframes, const QString& direction);

private:
    void parseKeyframesBody(const QString& name, const QString& body);
    QStringList animationNames(const QDomElement& element, const Core::DocumentAdapter& adapter) const;
    QString animationDirection(const QDomElement& element, const Core::DocumentAdapter& adapter) const;

    QHash<QString, QList<CssKeyframe>> keyframes_;
    Core::TraceSink* trace_;
};

} // namespace Animation

#endif // CSSKEYFRAMEANALYZER_H
