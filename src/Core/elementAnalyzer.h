#ifndef ELEMENTANALYZER_H
#define ELEMENTANALYZER_H

#include <QDomElement>
#include <QList>
#include <QSet>
#include <QString>

#include "affineTransform.h"
#include "analyzerConfig.h"
#include "animationCombiner.h"
#include "animationTypes.h"
#include "boundingBox.h"
#include "cssKeyframeAnalyzer.h"
#include "documentAdapter.h"
#include "effectsAnalyzer.h"
#include "smilAnalyzer.h"
#include "traceSink.h"
#include "visibilityChecker.h"

namespace Core {

// One element's bounds at each stage of the pipeline. Everything but baseBounds is in
// the root user space; effectExpandedBounds is what the viewBox union takes.
struct ElementBoundsResult {
    QDomElement element;
    QString label;                              // id, or the tag name when there is none
    Geometry::BoundingBox baseBounds;           // own user space, markers and pattern overflow included
    Geometry::BoundingBox transformedBounds;    // static geometry
    Geometry::BoundingBox animatedBounds;       // envelope over every animation
    Geometry::BoundingBox effectExpandedBounds; // animatedBounds grown by filters
    bool hasAnimations = false;
    int animationCount = 0;
    bool hasEffects = false;
    bool preserveFullBounds = false;            // masked or clipped, kept unclipped
    bool skipped = false;                       // empty geometry that nothing can grow
};

// Runs the whole per-element pipeline: base geometry, SMIL and CSS animations,
// the combiner, the ancestor transform and effect expansion.
class ElementAnalyzer {
public:
    ElementAnalyzer(const DocumentAdapter& adapter, const AnalyzerConfig& config, TraceSink* trace = nullptr);

    ElementBoundsResult analyzeElement(const QDomElement& element,
                                       const Geometry::AffineTransform& ancestorTransform) const;

    QList<Animation::AnimationDescriptor> computeAnimations(const QDomElement& element) const;
    QList<Animation::AnimationDescriptor> computeAnimations(const QDomElement& element,
                                                            const Geometry::BoundingBox& baseBounds) const;

    // Untransformed geometry: intrinsic box, use/symbol content or group content, plus markers.
    Geometry::BoundingBox baseBounds(const QDomElement& element, QSet<QString> visited = QSet<QString>()) const;

    // Conservative squares around every marked vertex, in the element's user space.
    Geometry::OptionalBounds markerBounds(const QDomElement& element) const;

    // How far the content of a fill pattern spills out of its tile, as growth of the
    // filled box. Zero without a pattern fill.
    Geometry::BoundsDelta patternOverflow(const QDomElement& element, const Geometry::BoundingBox& box,
                                          QSet<QString> visited = QSet<QString>()) const;

    // Content referenced by a <use>, in the use element's user space (x/y applied,
    // its transform attribute not). `visited` holds the ids already on this branch.
    Geometry::OptionalBounds useElementBounds(const QDomElement& use, QSet<QString> visited) const;

    // Static bounds of an element in its parent's user space.
    Geometry::OptionalBounds contentBounds(const QDomElement& element, QSet<QString> visited) const;

    // requiredFeatures, requiredExtensions and systemLanguage
    bool passesConditionals(const QDomElement& element) const;
    QDomElement selectSwitchChild(const QDomElement& switchElement) const;

    // translate(x,y) followed by the viewBox mapping of a nested <svg>.
    Geometry::AffineTransform nestedViewportTransform(const QDomElement& svg) const;

    static bool isNonRenderingTag(const QString& tag);
    static bool isContainerTag(const QString& tag);

    const VisibilityChecker& visibility() const { return visibility_; }
    const Effects::EffectsAnalyzer& effects() const { return effects_; }
    const DocumentAdapter& adapter() const { return adapter_; }

private:
    Geometry::OptionalBounds childrenBounds(const QDomElement& element, const QSet<QString>& visited) const;
    QString inheritedProperty(const QDomElement& element, const QString& name) const;
    double numberAttribute(const QDomElement& element, const QString& name, double fallback) const;

    const DocumentAdapter& adapter_;
    AnalyzerConfig config_;
    TraceSink* trace_;
    Animation::SmilAnalyzer smil_;
    Animation::CssKeyframeAnalyzer css_;
    Animation::AnimationCombiner combiner_;
    Effects::EffectsAnalyzer effects_;
    VisibilityChecker visibility_;
};

} // namespace Core

#endif // ELEMENTANALYZER_H
