#include "smilAnalyzer.h"
#include "timingNormalizer.h"
#include "pathGeometry.h"
#include "valueParsing.h"

#include <QRegularExpression>
#include <QRegularExpressionMatch>
#include <QSet>
#include <QtMath>
#include <algorithm>
#include <cmath>

namespace Animation {

namespace {

const QStringList kAnimationTags = { "animate", "animateTransform", "animateMotion", "set" };

Geometry::PathExtent uniteExtents(const Geometry::PathExtent& a, const Geometry::PathExtent& b) {
    Geometry::PathExtent result;
    result.minX = std::min(a.minX, b.minX);
    result.maxX = std::max(a.maxX, b.maxX);
    result.minY = std::min(a.minY, b.minY);
    result.maxY = std::max(a.maxY, b.maxY);
    return result;
}

} // namespace

SmilAnalyzer::SmilAnalyzer(const Core::DocumentAdapter& adapter, const Core::AnalyzerConfig& config,
                           Core::TraceSink* trace)
    : adapter_(adapter), config_(config), trace_(trace) {
}

bool SmilAnalyzer::isAnimationElement(const QDomElement& element) {
    return kAnimationTags.contains(Core::DocumentAdapter::localName(element));
}

bool SmilAnalyzer::isSupportedSetAttribute(const QString& attributeName) {
    static const QSet<QString> supported = {
        "opacity", "display", "visibility", "x", "y", "width", "height", "cx", "cy", "r", "rx", "ry",
        "fill", "stroke", "stroke-width", "fill-opacity", "stroke-opacity", "transform"
    };
    return supported.contains(attributeName);
}

boost::optional<SetBegin> SmilAnalyzer::parseSetBegin(const QString& begin) {
    QString value = begin.trimmed();
    SetBegin parsed;
    if (value.isEmpty()) {
        return parsed;
    }

    static const QRegularExpression timeRe("^(\\d+(?:\\.\\d+)?)(s|ms)?$");
    QRegularExpressionMatch time = timeRe.match(value);
    if (time.hasMatch()) {
        double number = Core::Parsing::toDouble(time.captured(1));
        parsed.timeMs = time.captured(2) == "ms" ? number : number * 1000.0;
        return parsed;
    }

    static const QRegularExpression eventRe(
        "^(click|mouseover|mouseout|mouseenter|mouseleave|focus|blur)(?:\\s*\\+\\s*(\\d+(?:\\.\\d+)?)(s|ms)?)?$");
    QRegularExpressionMatch event = eventRe.match(value);
    if (event.hasMatch()) {
        parsed.isEventBased = true;
        parsed.eventName = event.captured(1);
        if (!event.captured(2).isEmpty()) {
            double offset = Core::Parsing::toDouble(event.captured(2));
            parsed.timeMs = event.captured(3) == "ms" ? offset : offset * 1000.0;
        }
        return parsed;
    }
    return boost::none;
}

double SmilAnalyzer::rotationPad(const QString& rotate, double pad) {
    QString value = rotate.trimmed();
    if (value.isEmpty() || value == "auto" || value == "auto-reverse") {
        // The element's own extent along the tangent is not modelled here.
        return 0.0;
    }
    bool ok = false;
    double angle = Core::Parsing::parseLeadingNumber(value, &ok);
    if (!ok || angle == 0.0) {
        return 0.0;
    }
    double radians = qDegreesToRadians(angle);
    return std::abs(std::sin(radians)) * pad + std::abs(std::cos(radians)) * pad;
}

boost::optional<TransformAnimation> SmilAnalyzer::analyzeTransform(const QDomElement& animation) const {
    Core::AttributeMap attributes = adapter_.attributes(animation);

    TransformAnimation result;
    if (!TimingNormalizer::parseTransformType(attributes.value("type"), &result.transformType)) {
        Core::emitTrace(trace_, "smil", QString("animateTransform with unsupported type '%1' ignored")
                                            .arg(attributes.value("type")));
        return boost::none;
    }

    const QList<Keyframe> keyframes = TimingNormalizer::normalizeKeyframes(AnimationKind::AnimateTransform, attributes);
    if (keyframes.isEmpty()) {
        Core::emitTrace(trace_, "smil", "animateTransform without values ignored");
        return boost::none;
    }

    result.additive = attributes.value("additive").trimmed() == "sum";
    result.timing = TimingNormalizer::parseTiming(attributes);
    for (const Keyframe& keyframe : keyframes) {
        TransformKeyframe transformKeyframe;
        transformKeyframe.time = keyframe.time;
        transformKeyframe.matrix = TimingNormalizer::toMatrix(keyframe.value);
        transformKeyframe.raw = keyframe.raw;
        result.keyframes.append(transformKeyframe);
    }

    Core::emitTrace(trace_, "smil", QString("animateTransform %1: %2 keyframes%3")
                                        .arg(attributes.value("type", "translate"))
                                        .arg(result.keyframes.size())
                                        .arg(result.additive ? " (additive)" : ""));
    return result;
}

boost::optional<AttributeAnimation> SmilAnalyzer::analyzeAttribute(const QDomElement& animation) const {
    Core::AttributeMap attributes = adapter_.attributes(animation);

    AttributeAnimation result;
    result.attributeName = attributes.value("attributeName").trimmed();
    if (result.attributeName.isEmpty()) {
        Core::emitTrace(trace_, "smil", "animate without attributeName ignored");
        return boost::none;
    }

    const QList<Keyframe> keyframes = TimingNormalizer::normalizeKeyframes(AnimationKind::Animate, attributes);
    if (keyframes.isEmpty()) {
        Core::emitTrace(trace_, "smil", QString("animate %1 without values ignored").arg(result.attributeName));
        return boost::none;
    }

    result.timing = TimingNormalizer::parseTiming(attributes);
    for (const Keyframe& keyframe : keyframes) {
        TimedValue value;
        value.time = keyframe.time;
        value.value = keyframe.value;
        result.values.append(value);
    }

    Core::emitTrace(trace_, "smil", QString("animate %1: %2 values").arg(result.attributeName).arg(result.values.size()));
    return result;
}

boost::optional<MotionAnimation> SmilAnalyzer::analyzeMotion(const QDomElement& animation) const {
    Core::AttributeMap attributes = adapter_.attributes(animation);

    boost::optional<Geometry::PathExtent> motion;
    QString path = attributes.value("path").trimmed();
    QString values = attributes.value("values").trimmed();

    if (!path.isEmpty()) {
        motion = Geometry::PathGeometry::bounds(path);
    } else if (!values.isEmpty()) {
        motion = Geometry::PathGeometry::motionValuesBounds(values);
    } else {
        const QList<QDomElement> children = adapter_.childElements(animation);
        for (const QDomElement& child : children) {
            if (Core::DocumentAdapter::localName(child) != "mpath") continue;
            QString targetId = Core::Parsing::fragmentId(adapter_.attribute(child, "href").value_or(QString()));
            QDomElement target = targetId.isEmpty() ? QDomElement() : adapter_.elementById(targetId);
            if (target.isNull() || Core::DocumentAdapter::localName(target) != "path") {
                Core::emitTrace(trace_, "smil", QString("mpath reference '%1' does not resolve to a path").arg(targetId));
                continue;
            }
            motion = Geometry::PathGeometry::bounds(adapter_.attribute(target, "d").value_or(QString()));
            break;
        }
    }

    if (!motion) {
        const QList<Keyframe> keyframes = TimingNormalizer::normalizeKeyframes(AnimationKind::AnimateMotion, attributes);
        for (const Keyframe& keyframe : keyframes) {
            if (const MotionValue* point = boost::get<MotionValue>(&keyframe.value)) {
                motion = motion ? uniteExtents(*motion, point->bounds) : point->bounds;
            }
        }
        // Without from, the motion starts at the element's own position.
        if (motion && !attributes.contains("from")) {
            motion = uniteExtents(*motion, Geometry::PathExtent());
        }
    }

    if (!motion) {
        Core::emitTrace(trace_, "smil", "animateMotion without path, values, mpath or from/to/by ignored");
        return boost::none;
    }

    MotionAnimation result;
    result.timing = TimingNormalizer::parseTiming(attributes);
    result.rotate = attributes.value("rotate", "0").trimmed();
    result.motionBounds = *motion;

    double pad = rotationPad(result.rotate, config_.motionRotationPad);
    result.rotationExpandedBounds.minX = motion->minX - pad;
    result.rotationExpandedBounds.maxX = motion->maxX + pad;
    result.rotationExpandedBounds.minY = motion->minY - pad;
    result.rotationExpandedBounds.maxY = motion->maxY + pad;

    Core::emitTrace(trace_, "smil", QString("animateMotion: (%1, %2) to (%3, %4), rotation pad %5")
                                        .arg(motion->minX).arg(motion->minY)
                                        .arg(motion->maxX).arg(motion->maxY).arg(pad));
    return result;
}

boost::optional<SetAnimation> SmilAnalyzer::analyzeSet(const QDomElement& animation) const {
    Core::AttributeMap attributes = adapter_.attributes(animation);

    SetAnimation result;
    result.attributeName = attributes.value("attributeName").trimmed();
    if (!isSupportedSetAttribute(result.attributeName)) {
        Core::emitTrace(trace_, "smil", QString("set on unsupported attribute '%1' ignored").arg(result.attributeName));
        return boost::none;
    }

    boost::optional<SetBegin> begin = parseSetBegin(attributes.value("begin"));
    if (!begin) {
        Core::emitTrace(trace_, "smil", QString("set with unsupported begin '%1' dropped").arg(attributes.value("begin")));
        return boost::none;
    }

    result.to = attributes.value("to").trimmed();
    result.beginTime = begin->timeMs;
    result.isEventBased = begin->isEventBased;
    return result;
}

QList<QDomElement> SmilAnalyzer::animationElementsFor(const QDomElement& element) const {
    QList<QDomElement> animations;
    QString id = adapter_.attribute(element, "id").value_or(QString());

    const QList<QDomElement> children = adapter_.childElements(element);
    for (const QDomElement& child : children) {
        if (!isAnimationElement(child)) continue;
        boost::optional<QString> href = adapter_.attribute(child, "href");
        if (href && !href->trimmed().isEmpty() && Core::Parsing::fragmentId(*href) != id) {
            continue; // targets some other element
        }
        animations.append(child);
    }

    if (!id.isEmpty()) {
        const QList<QDomElement> candidates = adapter_.elementsReferencing(id);
        for (const QDomElement& candidate : candidates) {
            if (!isAnimationElement(candidate) || adapter_.parentElement(candidate) == element) continue;
            animations.append(candidate);
        }
    }
    return animations;
}

QList<AnimationDescriptor> SmilAnalyzer::computeAnimations(const QDomElement& element) const {
    QList<AnimationDescriptor> descriptors;
    const QList<QDomElement> animations = animationElementsFor(element);
    for (const QDomElement& animation : animations) {
        QString tag = Core::DocumentAdapter::localName(animation);
        if (tag == "animateTransform") {
            if (boost::optional<TransformAnimation> transform = analyzeTransform(animation)) {
                descriptors.append(*transform);
            }
        } else if (tag == "animate") {
            if (boost::optional<AttributeAnimation> attribute = analyzeAttribute(animation)) {
                descriptors.append(*attribute);
            }
        } else if (tag == "animateMotion") {
            if (boost::optional<MotionAnimation> motion = analyzeMotion(animation)) {
                descriptors.append(*motion);
            }
        } else if (tag == "set") {
            if (boost::optional<SetAnimation> set = analyzeSet(animation)) {
                descriptors.append(*set);
            }
        }
    }
    return descriptors;
}

} // namespace Animation
