#ifndef TIMINGNORMALIZER_H
#define TIMINGNORMALIZER_H

#include <QList>
#include <QString>

#include "animationTypes.h"
#include "documentAdapter.h"

namespace Animation {

// Turns the raw attributes of a SMIL animation element into a normalized timeline.
// Everything here is pure: no document access, no errors (bad input degrades to
// defaults or is dropped).
class TimingNormalizer {
public:
    // SMIL clock value to milliseconds: "2s", "500ms", "1.5" (seconds), "1min", "1h",
    // "00:01:02.5", "01:30". Sets ok=false for anything else (event names, syncbase...).
    static double parseClockValue(const QString& text, bool* ok = nullptr);

    // dur/repeatCount/begin/end. "indefinite" maps to infinity; event and syncbase
    // begins are flagged and normalized to beginMs = 0.
    static AnimationTiming parseTiming(const Core::AttributeMap& attributes);

    static CalcMode parseCalcMode(const QString& text, AnimationKind kind);
    static bool parseTransformType(const QString& text, TransformType* type);

    // values > from/to > from/by > by > to. keyTimes win over even spacing i/(n-1);
    // paced timing falls back to even spacing.
    static QList<Keyframe> normalizeKeyframes(AnimationKind kind, const Core::AttributeMap& attributes);

    static NormalizedValue parseValue(AnimationKind kind, const Core::AttributeMap& attributes, const QString& text);
    static NormalizedValue parseTransformValue(TransformType type, const QString& text);

    // from + by, component-wise for values of the same variant.
    static NormalizedValue addValues(const NormalizedValue& from, const NormalizedValue& by);

    // Starting value of a by-only animation: zero for attributes, identity for transforms.
    static NormalizedValue neutralValue(AnimationKind kind, const Core::AttributeMap& attributes);

    // Identity for values that are not transforms.
    static Geometry::AffineTransform toMatrix(const NormalizedValue& value);
};

} // namespace Animation

#endif // TIMINGNORMALIZER_H
