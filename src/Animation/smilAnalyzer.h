#ifndef SMILANALYZER_H
#define SMILANALYZER_H

#include <QDomElement>
#include <QList>
#include <QString>
#include <boost/optional.hpp>

#include "animationTypes.h"
#include "analyzerConfig.h"
#include "documentAdapter.h"
#include "traceSink.h"

namespace Animation {

// Parsed begin of a <set>: a plain time, or a DOM event with an optional offset.
struct SetBegin {
    double timeMs = 0.0;
    bool isEventBased = false;
    QString eventName;
};

// Builds animation descriptors for the SMIL elements (animate, animateTransform,
// animateMotion, set) that target a given element.
class SmilAnalyzer {
public:
    SmilAnalyzer(const Core::DocumentAdapter& adapter, const Core::AnalyzerConfig& config,
                 Core::TraceSink* trace = nullptr);

    boost::optional<TransformAnimation> analyzeTransform(const QDomElement& animation) const;
    boost::optional<AttributeAnimation> analyzeAttribute(const QDomElement& animation) const;
    boost::optional<MotionAnimation> analyzeMotion(const QDomElement& animation) const;
    boost::optional<SetAnimation> analyzeSet(const QDomElement& animation) const;

    // Descriptors for every SMIL animation applying to the element, in document order.
    QList<AnimationDescriptor> computeAnimations(const QDomElement& element) const;

    // Animation elements that are children of the element, followed by those elsewhere
    // in the document that name it through href/xlink:href.
    QList<QDomElement> animationElementsFor(const QDomElement& element) const;

    static bool isAnimationElement(const QDomElement& element);
    static bool isSupportedSetAttribute(const QString& attributeName);
    static boost::optional<SetBegin> parseSetBegin(const QString& begin);
    static double rotationPad(const QString& rotate, double pad);

private:
    const Core::DocumentAdapter& adapter_;
    Core::AnalyzerConfig config_;
    Core::TraceSink* trace_;
};

} // namespace Animation

#endif // SMILANALYZER_H
