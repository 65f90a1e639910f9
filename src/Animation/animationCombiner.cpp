#include "animationCombiner.h"
#include "pathGeometry.h"
#include "transformParser.h"
#include "valueParsing.h"

#include <QMap>
#include <QSet>
#include <algorithm>
#include <cmath>
#include <limits>

namespace Animation {

namespace {

const double kTimeTolerance = 1e-9;

// Whether the element is ever seen with its un-animated geometry: before a late or
// event based begin, before a first keyframe after t=0, or after an animation that
// ends without freezing.
bool showsRestingState(const AnimationTiming& timing, bool startsAtZero) {
    if (!startsAtZero || timing.beginMs > kTimeTolerance || timing.isEventOrSyncbaseBased) {
        return true;
    }
    const bool runsForever = !timing.endMs && (timing.isIndefinite() || std::isinf(timing.repeatCount));
    return !timing.freeze && !runsForever;
}

class GroupClassifier : public boost::static_visitor<AnimationGroup> {
public:
    AnimationGroup operator()(const TransformAnimation&) const { return AnimationGroup::Geometric; }
    AnimationGroup operator()(const MotionAnimation&) const { return AnimationGroup::Geometric; }
    AnimationGroup operator()(const CssAnimation&) const { return AnimationGroup::Geometric; }
    AnimationGroup operator()(const AttributeAnimation& animation) const { return byName(animation.attributeName); }
    AnimationGroup operator()(const SetAnimation& animation) const { return byName(animation.attributeName); }

private:
    static AnimationGroup byName(const QString& name) {
        if (name == "stroke-width") return AnimationGroup::Stroke;
        if (AnimationCombiner::isGeometricAttribute(name)) return AnimationGroup::Geometric;
        return AnimationGroup::Other;
    }
};

// Accumulates one element's envelope while visiting its animations.
class EnvelopeBuilder : public boost::static_visitor<void> {
public:
    EnvelopeBuilder(const Geometry::BoundingBox& base, const Geometry::AffineTransform& elementTransform)
        : base_(base), elementTransform_(elementTransform), staticBounds_(elementTransform.transformBounds(base)) {}

    void operator()(const TransformAnimation& animation) {
        hasGeometric_ = true;
        if (animation.additive) {
            additive_.append(&animation);
            return;
        }
        bool startsAtZero = false;
        for (const TransformKeyframe& keyframe : animation.keyframes) {
            geometric_ = Geometry::unite(geometric_, keyframe.matrix.transformBounds(base_));
            startsAtZero = startsAtZero || keyframe.time <= kTimeTolerance;
        }
        if (showsRestingState(animation.timing, startsAtZero)) {
            geometric_ = Geometry::unite(geometric_, staticBounds_);
        }
    }

    void operator()(const AttributeAnimation& animation) {
        const QString& name = animation.attributeName;
        if (name == "stroke-width") {
            for (const TimedValue& value : animation.values) {
                if (const AttributeValue* attribute = boost::get<AttributeValue>(&value.value)) {
                    if (attribute->isNumeric) addStroke(attribute->number);
                }
            }
            return;
        }
        if (!AnimationCombiner::isGeometricAttribute(name)) {
            other_ = Geometry::unite(other_, staticBounds_);
            return;
        }

        hasGeometric_ = true;
        bool startsAtZero = false;
        for (const TimedValue& value : animation.values) {
            startsAtZero = startsAtZero || value.time <= kTimeTolerance;
            addValue(name, value.value);
        }
        if (showsRestingState(animation.timing, startsAtZero)) {
            geometric_ = Geometry::unite(geometric_, staticBounds_);
        }
    }

    void operator()(const MotionAnimation& animation) {
        hasGeometric_ = true;
        // Motion is a supplemental translation in the parent's user space.
        const Geometry::PathExtent& motion = animation.rotationExpandedBounds;
        Geometry::BoundingBox moved(staticBounds_.x + motion.minX, staticBounds_.y + motion.minY,
                                    staticBounds_.width + (motion.maxX - motion.minX),
                                    staticBounds_.height + (motion.maxY - motion.minY));
        geometric_ = Geometry::unite(geometric_, moved);
        // A path may start away from the origin; the offset is zero whenever the motion is not applied.
        if (showsRestingState(animation.timing, true)) {
            geometric_ = Geometry::unite(geometric_, staticBounds_);
        }
    }

    void operator()(const SetAnimation& animation) {
        const QString& name = animation.attributeName;
        bool ok = false;
        double number = Core::Parsing::parseLeadingNumber(animation.to, &ok);

        if (name == "stroke-width") {
            if (ok) addStroke(number);
            return;
        }
        if (!AnimationCombiner::isGeometricAttribute(name)) {
            other_ = Geometry::unite(other_, staticBounds_);
            return;
        }

        hasGeometric_ = true;
        // Before the set begins the element shows its base state.
        geometric_ = Geometry::unite(geometric_, staticBounds_);
        if (name == "transform") {
            geometric_ = Geometry::unite(geometric_, Geometry::TransformParser::parse(animation.to).transformBounds(base_));
        } else if (ok) {
            addNumber(name, number);
        }
    }

    void operator()(const CssAnimation& animation) {
        hasGeometric_ = true;
        geometric_ = Geometry::unite(geometric_, elementTransform_.transformBounds(base_.withDelta(animation.expansion)));
    }

    Geometry::BoundingBox finish(Core::TraceSink* trace) {
        combineAdditive(trace);
        combineCircle(trace);

        Geometry::BoundingBox envelope = (hasGeometric_ && geometric_) ? *geometric_ : staticBounds_;
        if (hasStroke_) {
            envelope = envelope.expanded(std::abs(maxStroke_) / 2.0);
            Core::emitTrace(trace, "combine", QString("stroke-width expansion %1").arg(std::abs(maxStroke_) / 2.0));
        }
        return *Geometry::unite(Geometry::OptionalBounds(envelope), other_);
    }

private:
    void addStroke(double value) {
        maxStroke_ = hasStroke_ ? std::max(maxStroke_, value) : value;
        hasStroke_ = true;
    }

    void addValue(const QString& name, const NormalizedValue& value) {
        if (const AttributeValue* attribute = boost::get<AttributeValue>(&value)) {
            if (name == "points") {
                Geometry::PathExtent extent = Geometry::PathGeometry::pointsBounds(attribute->text);
                geometric_ = Geometry::unite(geometric_, elementTransform_.transformBounds(Geometry::BoundingBox::fromExtent(extent)));
            } else if (attribute->isNumeric) {
                addNumber(name, attribute->number);
            }
        } else if (const PathDataValue* path = boost::get<PathDataValue>(&value)) {
            geometric_ = Geometry::unite(geometric_, elementTransform_.transformBounds(Geometry::BoundingBox::fromExtent(path->bounds)));
        }
    }

    void addNumber(const QString& name, double number) {
        if (AnimationCombiner::isCircleAttribute(name)) {
            circleValues_[name].append(number);
            return;
        }
        geometric_ = Geometry::unite(geometric_,
                                     elementTransform_.transformBounds(AnimationCombiner::attributeBounds(name, number, base_)));
    }

    // Additive transforms are sampled at the union of their keyframe times; at each
    // sample every animation contributes its exact, latest-earlier, or earliest keyframe.
    void combineAdditive(Core::TraceSink* trace) {
        if (additive_.isEmpty()) {
            return;
        }
        QList<double> times;
        bool resting = false;
        for (const TransformAnimation* animation : additive_) {
            bool hasZero = false;
            for (const TransformKeyframe& keyframe : animation->keyframes) {
                times.append(keyframe.time);
                hasZero = hasZero || keyframe.time <= kTimeTolerance;
            }
            resting = resting || showsRestingState(animation->timing, hasZero);
        }
        std::sort(times.begin(), times.end());
        times.erase(std::unique(times.begin(), times.end()), times.end());

        for (double time : times) {
            Geometry::AffineTransform combined;
            for (const TransformAnimation* animation : additive_) {
                combined = combined.multiply(pickKeyframe(*animation, time));
            }
            geometric_ = Geometry::unite(geometric_, elementTransform_.multiply(combined).transformBounds(base_));
        }
        if (resting) {
            geometric_ = Geometry::unite(geometric_, staticBounds_);
        }
        Core::emitTrace(trace, "combine", QString("%1 additive transforms sampled at %2 times")
                                              .arg(additive_.size()).arg(times.size()));
    }

    static Geometry::AffineTransform pickKeyframe(const TransformAnimation& animation, double time) {
        const TransformKeyframe* latestBefore = nullptr;
        const TransformKeyframe* earliest = nullptr;
        for (const TransformKeyframe& keyframe : animation.keyframes) {
            if (std::abs(keyframe.time - time) <= kTimeTolerance) {
                return keyframe.matrix;
            }
            if (keyframe.time < time && (!latestBefore || keyframe.time >= latestBefore->time)) {
                latestBefore = &keyframe;
            }
            if (!earliest || keyframe.time < earliest->time) {
                earliest = &keyframe;
            }
        }
        if (latestBefore) return latestBefore->matrix;
        if (earliest) return earliest->matrix;
        return Geometry::AffineTransform();
    }

    // Independent extremes of centre and radius; which cx pairs with which r at a given
    // instant is not tracked.
    void combineCircle(Core::TraceSink* trace) {
        if (circleValues_.isEmpty()) {
            return;
        }
        QList<double> cxValues = QList<double>() << base_.centerX();
        QList<double> cyValues = QList<double>() << base_.centerY();
        QList<double> rxValues = QList<double>() << base_.width / 2.0;
        QList<double> ryValues = QList<double>() << base_.height / 2.0;

        cxValues.append(circleValues_.value("cx"));
        cyValues.append(circleValues_.value("cy"));
        for (double r : circleValues_.value("r")) {
            rxValues.append(std::abs(r));
            ryValues.append(std::abs(r));
        }
        for (double rx : circleValues_.value("rx")) rxValues.append(std::abs(rx));
        for (double ry : circleValues_.value("ry")) ryValues.append(std::abs(ry));

        double maxRx = *std::max_element(rxValues.begin(), rxValues.end());
        double maxRy = *std::max_element(ryValues.begin(), ryValues.end());
        double minCx = *std::min_element(cxValues.begin(), cxValues.end());
        double maxCx = *std::max_element(cxValues.begin(), cxValues.end());
        double minCy = *std::min_element(cyValues.begin(), cyValues.end());
        double maxCy = *std::max_element(cyValues.begin(), cyValues.end());

        Geometry::BoundingBox envelope = Geometry::BoundingBox::fromCorners(minCx - maxRx, minCy - maxRy,
                                                                            maxCx + maxRx, maxCy + maxRy);
        geometric_ = Geometry::unite(geometric_, elementTransform_.transformBounds(envelope));
        Core::emitTrace(trace, "combine", QString("circle envelope cx [%1, %2] cy [%3, %4] radius (%5, %6)")
                                              .arg(minCx).arg(maxCx).arg(minCy).arg(maxCy).arg(maxRx).arg(maxRy));
    }

    const Geometry::BoundingBox base_;
    const Geometry::AffineTransform elementTransform_;
    const Geometry::BoundingBox staticBounds_;

    Geometry::OptionalBounds geometric_;
    Geometry::OptionalBounds other_;
    bool hasGeometric_ = false;
    bool hasStroke_ = false;
    double maxStroke_ = 0.0;
    QList<const TransformAnimation*> additive_;
    QMap<QString, QList<double>> circleValues_;
};

} // namespace

AnimationCombiner::AnimationCombiner(Core::TraceSink* trace) : trace_(trace) {
}

AnimationGroup AnimationCombiner::classify(const AnimationDescriptor& animation) {
    return boost::apply_visitor(GroupClassifier(), animation);
}

bool AnimationCombiner::isGeometricAttribute(const QString& attributeName) {
    static const QSet<QString> geometric = {
        "x", "y", "width", "height", "cx", "cy", "r", "rx", "ry",
        "x1", "y1", "x2", "y2", "d", "points", "transform"
    };
    return geometric.contains(attributeName);
}

bool AnimationCombiner::isCircleAttribute(const QString& attributeName) {
    return attributeName == "cx" || attributeName == "cy" || attributeName == "r"
        || attributeName == "rx" || attributeName == "ry";
}

Geometry::BoundingBox AnimationCombiner::attributeBounds(const QString& name, double value,
                                                         const Geometry::BoundingBox& base) {
    using Geometry::BoundingBox;
    if (name == "x") return BoundingBox(value, base.y, base.width, base.height);
    if (name == "y") return BoundingBox(base.x, value, base.width, base.height);
    if (name == "width") return BoundingBox::fromCorners(base.x, base.y, base.x + value, base.bottom());
    if (name == "height") return BoundingBox::fromCorners(base.x, base.y, base.right(), base.y + value);
    if (name == "cx") return BoundingBox(value - base.width / 2.0, base.y, base.width, base.height);
    if (name == "cy") return BoundingBox(base.x, value - base.height / 2.0, base.width, base.height);
    if (name == "r") {
        double r = std::abs(value);
        return BoundingBox(base.centerX() - r, base.centerY() - r, 2.0 * r, 2.0 * r);
    }
    if (name == "rx") {
        double rx = std::abs(value);
        return BoundingBox(base.centerX() - rx, base.y, 2.0 * rx, base.height);
    }
    if (name == "ry") {
        double ry = std::abs(value);
        return BoundingBox(base.x, base.centerY() - ry, base.width, 2.0 * ry);
    }
    if (name == "x1" || name == "x2") return base.united(BoundingBox(value, base.y, 0.0, base.height));
    if (name == "y1" || name == "y2") return base.united(BoundingBox(base.x, value, base.width, 0.0));
    // opacity, fill, stroke, display, visibility, ...: no geometric change
    return base;
}

Geometry::BoundingBox AnimationCombiner::combine(const QList<AnimationDescriptor>& animations,
                                                 const Geometry::BoundingBox& baseBounds,
                                                 const Geometry::AffineTransform& elementTransform) const {
    EnvelopeBuilder builder(baseBounds, elementTransform);
    for (const AnimationDescriptor& animation : animations) {
        boost::apply_visitor(builder, animation);
    }
    Geometry::BoundingBox envelope = builder.finish(trace_);
    Core::emitTrace(trace_, "combine", QString("%1 animations -> (%2, %3) %4x%5")
                                           .arg(animations.size()).arg(envelope.x).arg(envelope.y)
                                           .arg(envelope.width).arg(envelope.height));
    return envelope;
}

} // namespace Animation
