#ifndef ANIMATIONCOMBINER_H
#define ANIMATIONCOMBINER_H

#include <QList>
#include <QString>

#include "affineTransform.h"
#include "animationTypes.h"
#include "boundingBox.h"
#include "traceSink.h"

namespace Animation {

enum class AnimationGroup { Geometric, Stroke, Other };

// Folds every animation on one element into a single conservative envelope.
//
// baseBounds is the element's untransformed geometry. elementTransform is its own
// transform attribute: non-additive animateTransform replaces it, additive ones are
// post-multiplied onto it, and every other contribution is mapped through it. The
// result is therefore in the coordinate system of the element's parent. With the
// default identity, an element without geometric animations gets baseBounds back.
class AnimationCombiner {
public:
    explicit AnimationCombiner(Core::TraceSink* trace = nullptr);

    Geometry::BoundingBox combine(const QList<AnimationDescriptor>& animations,
                                  const Geometry::BoundingBox& baseBounds,
                                  const Geometry::AffineTransform& elementTransform = Geometry::AffineTransform()) const;

    static AnimationGroup classify(const AnimationDescriptor& animation);

    static bool isGeometricAttribute(const QString& attributeName);
    static bool isCircleAttribute(const QString& attributeName);

    // Box the element occupies once a geometric attribute takes `value`.
    static Geometry::BoundingBox attributeBounds(const QString& attributeName, double value,
                                                 const Geometry::BoundingBox& base);

private:
    Core::TraceSink* trace_;
};

} // namespace Animation

#endif // ANIMATIONCOMBINER_H
