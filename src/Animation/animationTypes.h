#ifndef ANIMATIONTYPES_H
#define ANIMATIONTYPES_H

#include <QList>
#include <QString>
#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include <limits>

#include "affineTransform.h"
#include "boundingBox.h"

namespace Animation {

enum class AnimationKind { Animate, AnimateTransform, AnimateMotion, Set };
enum class CalcMode { Linear, Discrete, Paced, Spline };
enum class TransformType { Translate, Scale, Rotate, SkewX, SkewY, Matrix };

// Normalized animation values
struct TranslateValue { double x = 0.0; double y = 0.0; };
struct ScaleValue { double x = 1.0; double y = 1.0; };
struct RotateValue { double angle = 0.0; double cx = 0.0; double cy = 0.0; };
struct SkewXValue { double angle = 0.0; };
struct SkewYValue { double angle = 0.0; };
struct MatrixValue { double a = 1.0; double b = 0.0; double c = 0.0; double d = 1.0; double e = 0.0; double f = 0.0; };

struct AttributeValue {
    QString name;
    QString text;
    bool isNumeric = false;
    double number = 0.0;
};

struct PathDataValue {
    QString raw;
    Geometry::PathExtent bounds;
};

struct MotionValue {
    QString raw;
    Geometry::PathExtent bounds;
};

typedef boost::variant<TranslateValue, ScaleValue, RotateValue, SkewXValue, SkewYValue, MatrixValue,
                       AttributeValue, PathDataValue, MotionValue> NormalizedValue;

struct Keyframe {
    double time = 0.0;                  // in [0,1]
    NormalizedValue value;
    boost::optional<QString> spline;    // keySplines entry for the interval starting here
    CalcMode calcMode = CalcMode::Linear;
    QString raw;                        // source text, or a synthesized from+by expression
};

// Times are milliseconds; infinity stands for "indefinite".
struct AnimationTiming {
    double duration = std::numeric_limits<double>::infinity();
    double repeatCount = 1.0;
    double beginMs = 0.0;
    bool isEventOrSyncbaseBased = false; // diagnostic only, beginMs is already 0 then
    boost::optional<double> endMs;
    bool freeze = false;                 // fill="freeze": the last value outlives the animation

    bool isIndefinite() const { return duration == std::numeric_limits<double>::infinity(); }
};

struct TransformKeyframe {
    double time = 0.0;
    Geometry::AffineTransform matrix;
    QString raw;
};

struct TimedValue {
    double time = 0.0;
    NormalizedValue value;
};

// Animation descriptors
struct TransformAnimation {
    TransformType transformType = TransformType::Translate;
    bool additive = false;
    AnimationTiming timing;
    QList<TransformKeyframe> keyframes;
};

struct AttributeAnimation {
    QString attributeName;
    AnimationTiming timing;
    QList<TimedValue> values;
};

struct MotionAnimation {
    AnimationTiming timing;
    QString rotate;
    Geometry::PathExtent motionBounds;
    Geometry::PathExtent rotationExpandedBounds;
};

struct SetAnimation {
    QString attributeName;
    QString to;
    double beginTime = 0.0; // ms
    bool isEventBased = false;
};

struct CssAnimation {
    QString name;
    int keyframeCount = 0;
    Geometry::BoundsDelta expansion; // envelope relative to the base box
};

typedef boost::variant<TransformAnimation, AttributeAnimation, MotionAnimation,
                       SetAnimation, CssAnimation> AnimationDescriptor;

} // namespace Animation

#endif // ANIMATIONTYPES_H
