#include "timingNormalizer.h"
#include "pathGeometry.h"
#include "valueParsing.h"

#include <QRegularExpression>
#include <QRegularExpressionMatch>
#include <QDebug>
#include <algorithm>
#include <limits>

using Core::Parsing::toDouble;

namespace Animation {

namespace {

const double kInfinity = std::numeric_limits<double>::infinity();

class MatrixBuilder : public boost::static_visitor<Geometry::AffineTransform> {
public:
    Geometry::AffineTransform operator()(const TranslateValue& v) const {
        return Geometry::AffineTransform::translate(v.x, v.y);
    }
    Geometry::AffineTransform operator()(const ScaleValue& v) const {
        return Geometry::AffineTransform::scale(v.x, v.y);
    }
    Geometry::AffineTransform operator()(const RotateValue& v) const {
        return Geometry::AffineTransform::rotate(v.angle, v.cx, v.cy);
    }
    Geometry::AffineTransform operator()(const SkewXValue& v) const {
        return Geometry::AffineTransform::skewX(v.angle);
    }
    Geometry::AffineTransform operator()(const SkewYValue& v) const {
        return Geometry::AffineTransform::skewY(v.angle);
    }
    Geometry::AffineTransform operator()(const MatrixValue& v) const {
        return Geometry::AffineTransform(v.a, v.b, v.c, v.d, v.e, v.f);
    }
    Geometry::AffineTransform operator()(const AttributeValue&) const { return Geometry::AffineTransform(); }
    Geometry::AffineTransform operator()(const PathDataValue&) const { return Geometry::AffineTransform(); }
    Geometry::AffineTransform operator()(const MotionValue&) const { return Geometry::AffineTransform(); }
};

QString attributeOf(const Core::AttributeMap& attributes, const QString& name) {
    return attributes.value(name).trimmed();
}

QStringList splitList(const QString& text) {
    QStringList items;
    const QStringList parts = text.split(';');
    for (const QString& part : parts) {
        QString trimmed = part.trimmed();
        if (!trimmed.isEmpty()) {
            items.append(trimmed);
        }
    }
    return items;
}

} // namespace

double TimingNormalizer::parseClockValue(const QString& text, bool* ok) {
    if (ok) *ok = false;
    QString value = text.trimmed();
    if (value.isEmpty()) {
        return 0.0;
    }

    static const QRegularExpression clockRe("^(?:(\\d+):)?(\\d+):(\\d+(?:\\.\\d+)?)$");
    QRegularExpressionMatch clock = clockRe.match(value);
    if (clock.hasMatch()) {
        double hours = clock.captured(1).isEmpty() ? 0.0 : toDouble(clock.captured(1));
        double minutes = toDouble(clock.captured(2));
        double seconds = toDouble(clock.captured(3));
        if (ok) *ok = true;
        return ((hours * 60.0 + minutes) * 60.0 + seconds) * 1000.0;
    }

    static const QRegularExpression countRe("^([+-]?(?:\\d+\\.?\\d*|\\.\\d+))\\s*(h|min|s|ms)?$");
    QRegularExpressionMatch count = countRe.match(value);
    if (!count.hasMatch()) {
        return 0.0;
    }
    double number = toDouble(count.captured(1));
    QString unit = count.captured(2);
    double factor = 1000.0; // bare numbers are seconds
    if (unit == "ms") factor = 1.0;
    else if (unit == "min") factor = 60000.0;
    else if (unit == "h") factor = 3600000.0;
    if (ok) *ok = true;
    return number * factor;
}

AnimationTiming TimingNormalizer::parseTiming(const Core::AttributeMap& attributes) {
    AnimationTiming timing;

    QString dur = attributeOf(attributes, "dur");
    if (!dur.isEmpty() && dur != "indefinite" && dur != "media") {
        bool ok = false;
        double ms = parseClockValue(dur, &ok);
        timing.duration = ok ? ms : kInfinity;
    }

    QString repeatCount = attributeOf(attributes, "repeatCount");
    if (repeatCount == "indefinite") {
        timing.repeatCount = kInfinity;
    } else if (!repeatCount.isEmpty()) {
        bool ok = false;
        double count = toDouble(repeatCount, &ok);
        if (ok) timing.repeatCount = count;
    }

    QString begin = attributeOf(attributes, "begin");
    if (!begin.isEmpty()) {
        bool anyClock = false;
        double earliest = kInfinity;
        const QStringList entries = splitList(begin);
        for (const QString& entry : entries) {
            bool ok = false;
            double ms = parseClockValue(entry, &ok);
            if (ok) {
                anyClock = true;
                earliest = std::min(earliest, ms);
            } else {
                timing.isEventOrSyncbaseBased = true;
            }
        }
        timing.beginMs = (timing.isEventOrSyncbaseBased || !anyClock) ? 0.0 : earliest;
        if (!anyClock) {
            timing.isEventOrSyncbaseBased = true;
        }
    }

    QString end = attributeOf(attributes, "end");
    if (!end.isEmpty()) {
        bool ok = false;
        double ms = parseClockValue(splitList(end).value(0), &ok);
        if (ok) timing.endMs = ms;
    }

    timing.freeze = attributeOf(attributes, "fill").trimmed() == "freeze";
    return timing;
}

CalcMode TimingNormalizer::parseCalcMode(const QString& text, AnimationKind kind) {
    QString mode = text.trimmed();
    if (mode == "discrete") return CalcMode::Discrete;
    if (mode == "paced") return CalcMode::Paced;
    if (mode == "spline") return CalcMode::Spline;
    if (mode == "linear") return CalcMode::Linear;
    return kind == AnimationKind::AnimateMotion ? CalcMode::Paced : CalcMode::Linear;
}

bool TimingNormalizer::parseTransformType(const QString& text, TransformType* type) {
    QString name = text.trimmed().toLower();
    TransformType parsed;
    if (name.isEmpty() || name == "translate") parsed = TransformType::Translate;
    else if (name == "scale") parsed = TransformType::Scale;
    else if (name == "rotate") parsed = TransformType::Rotate;
    else if (name == "skewx") parsed = TransformType::SkewX;
    else if (name == "skewy") parsed = TransformType::SkewY;
    else if (name == "matrix") parsed = TransformType::Matrix;
    else return false;
    if (type) *type = parsed;
    return true;
}

NormalizedValue TimingNormalizer::parseTransformValue(TransformType type, const QString& text) {
    QList<double> n = Core::Parsing::parseNumberList(text);
    switch (type) {
    case TransformType::Translate: {
        TranslateValue v;
        v.x = n.value(0, 0.0);
        v.y = n.value(1, 0.0);
        return v;
    }
    case TransformType::Scale: {
        ScaleValue v;
        v.x = n.value(0, 1.0);
        v.y = n.size() > 1 ? n[1] : v.x;
        return v;
    }
    case TransformType::Rotate: {
        RotateValue v;
        v.angle = n.value(0, 0.0);
        v.cx = n.value(1, 0.0);
        v.cy = n.value(2, 0.0);
        return v;
    }
    case TransformType::SkewX: {
        SkewXValue v;
        v.angle = n.value(0, 0.0);
        return v;
    }
    case TransformType::SkewY: {
        SkewYValue v;
        v.angle = n.value(0, 0.0);
        return v;
    }
    case TransformType::Matrix: {
        MatrixValue v;
        if (n.size() == 6) {
            v.a = n[0]; v.b = n[1]; v.c = n[2]; v.d = n[3]; v.e = n[4]; v.f = n[5];
        }
        return v;
    }
    }
    return MatrixValue();
}

NormalizedValue TimingNormalizer::parseValue(AnimationKind kind, const Core::AttributeMap& attributes,
                                             const QString& text) {
    if (kind == AnimationKind::AnimateTransform) {
        TransformType type = TransformType::Translate;
        if (!parseTransformType(attributes.value("type"), &type)) {
            qWarning() << "Unsupported animateTransform type:" << attributes.value("type");
            return MatrixValue();
        }
        return parseTransformValue(type, text);
    }

    if (kind == AnimationKind::AnimateMotion) {
        MotionValue motion;
        motion.raw = text;
        motion.bounds = Geometry::PathGeometry::motionValuesBounds(text);
        return motion;
    }

    QString name = attributeOf(attributes, "attributeName");
    if (name == "d") {
        PathDataValue path;
        path.raw = text;
        path.bounds = Geometry::PathGeometry::bounds(text);
        return path;
    }

    AttributeValue value;
    value.name = name;
    value.text = text;
    value.number = Core::Parsing::parseLeadingNumber(text, &value.isNumeric);
    return value;
}

NormalizedValue TimingNormalizer::addValues(const NormalizedValue& from, const NormalizedValue& by) {
    if (const TranslateValue* a = boost::get<TranslateValue>(&from)) {
        if (const TranslateValue* b = boost::get<TranslateValue>(&by)) {
            TranslateValue sum;
            sum.x = a->x + b->x;
            sum.y = a->y + b->y;
            return sum;
        }
    }
    if (const ScaleValue* a = boost::get<ScaleValue>(&from)) {
        if (const ScaleValue* b = boost::get<ScaleValue>(&by)) {
            ScaleValue sum;
            sum.x = a->x + b->x;
            sum.y = a->y + b->y;
            return sum;
        }
    }
    if (const RotateValue* a = boost::get<RotateValue>(&from)) {
        if (const RotateValue* b = boost::get<RotateValue>(&by)) {
            RotateValue sum;
            sum.angle = a->angle + b->angle;
            sum.cx = a->cx + b->cx;
            sum.cy = a->cy + b->cy;
            return sum;
        }
    }
    if (const SkewXValue* a = boost::get<SkewXValue>(&from)) {
        if (const SkewXValue* b = boost::get<SkewXValue>(&by)) {
            SkewXValue sum;
            sum.angle = a->angle + b->angle;
            return sum;
        }
    }
    if (const SkewYValue* a = boost::get<SkewYValue>(&from)) {
        if (const SkewYValue* b = boost::get<SkewYValue>(&by)) {
            SkewYValue sum;
            sum.angle = a->angle + b->angle;
            return sum;
        }
    }
    if (const AttributeValue* a = boost::get<AttributeValue>(&from)) {
        if (const AttributeValue* b = boost::get<AttributeValue>(&by)) {
            if (a->isNumeric && b->isNumeric) {
                AttributeValue sum = *a;
                sum.number = a->number + b->number;
                sum.text = QString::number(sum.number);
                return sum;
            }
        }
    }
    if (const MotionValue* a = boost::get<MotionValue>(&from)) {
        if (const MotionValue* b = boost::get<MotionValue>(&by)) {
            MotionValue sum;
            sum.bounds.minX = a->bounds.minX + b->bounds.minX;
            sum.bounds.maxX = a->bounds.maxX + b->bounds.maxX;
            sum.bounds.minY = a->bounds.minY + b->bounds.minY;
            sum.bounds.maxY = a->bounds.maxY + b->bounds.maxY;
            sum.raw = QString("%1,%2").arg(sum.bounds.minX).arg(sum.bounds.minY);
            return sum;
        }
    }
    // Matrices and path data have no meaningful sum; the "by" value stands in for the end value.
    return by;
}

NormalizedValue TimingNormalizer::neutralValue(AnimationKind kind, const Core::AttributeMap& attributes) {
    switch (kind) {
    case AnimationKind::AnimateTransform: {
        TransformType type = TransformType::Translate;
        parseTransformType(attributes.value("type"), &type);
        switch (type) {
        case TransformType::Translate: return TranslateValue();
        case TransformType::Scale: return ScaleValue();
        case TransformType::Rotate: return RotateValue();
        case TransformType::SkewX: return SkewXValue();
        case TransformType::SkewY: return SkewYValue();
        case TransformType::Matrix: return MatrixValue();
        }
        return MatrixValue();
    }
    case AnimationKind::AnimateMotion: {
        MotionValue origin;
        origin.raw = "0,0";
        return origin;
    }
    case AnimationKind::Animate:
    case AnimationKind::Set:
        break;
    }
    return parseValue(kind, attributes, "0");
}

QList<Keyframe> TimingNormalizer::normalizeKeyframes(AnimationKind kind, const Core::AttributeMap& attributes) {
    QList<NormalizedValue> values;
    QStringList rawValues;
    bool toOnly = false;

    QString valuesAttr = attributeOf(attributes, "values");
    QString from = attributeOf(attributes, "from");
    QString to = attributeOf(attributes, "to");
    QString by = attributeOf(attributes, "by");

    if (!valuesAttr.isEmpty()) {
        rawValues = splitList(valuesAttr);
        for (const QString& raw : rawValues) {
            values.append(parseValue(kind, attributes, raw));
        }
    } else if (!from.isEmpty() && !to.isEmpty()) {
        rawValues << from << to;
        values << parseValue(kind, attributes, from) << parseValue(kind, attributes, to);
    } else if (!from.isEmpty() && !by.isEmpty()) {
        NormalizedValue start = parseValue(kind, attributes, from);
        rawValues << from << QString("%1 + %2").arg(from, by);
        values << start << addValues(start, parseValue(kind, attributes, by));
    } else if (!by.isEmpty()) {
        NormalizedValue start = neutralValue(kind, attributes);
        rawValues << QString("0") << by;
        values << start << addValues(start, parseValue(kind, attributes, by));
    } else if (!to.isEmpty()) {
        // Interpolates from the underlying value, which the combiner accounts for.
        rawValues << to;
        values << parseValue(kind, attributes, to);
        toOnly = true;
    }

    QList<Keyframe> keyframes;
    const int count = values.size();
    if (count == 0) {
        return keyframes;
    }

    CalcMode mode = parseCalcMode(attributes.value("calcMode"), kind);

    QList<double> keyTimes;
    const QStringList keyTimeTexts = splitList(attributeOf(attributes, "keyTimes"));
    for (const QString& text : keyTimeTexts) {
        bool ok = false;
        double t = toDouble(text, &ok);
        if (!ok) {
            keyTimes.clear();
            break;
        }
        keyTimes.append(std::max(0.0, std::min(1.0, t)));
    }
    if (mode == CalcMode::Paced) {
        // Paced animations ignore keyTimes; evenly spaced samples cover the same values.
        keyTimes.clear();
    }
    if (!keyTimes.isEmpty() && keyTimes.size() != count) {
        qWarning() << "keyTimes count" << keyTimes.size() << "does not match" << count << "values, using even spacing";
        keyTimes.clear();
    }

    QStringList splines;
    if (mode == CalcMode::Spline) {
        splines = splitList(attributeOf(attributes, "keySplines"));
    }

    for (int i = 0; i < count; ++i) {
        Keyframe keyframe;
        if (!keyTimes.isEmpty()) {
            keyframe.time = keyTimes[i];
        } else if (count == 1) {
            keyframe.time = toOnly ? 1.0 : 0.0;
        } else {
            keyframe.time = static_cast<double>(i) / static_cast<double>(count - 1);
        }
        keyframe.value = values[i];
        keyframe.calcMode = mode;
        keyframe.raw = rawValues.value(i);
        if (i < splines.size() && i < count - 1) {
            keyframe.spline = splines[i];
        }
        keyframes.append(keyframe);
    }
    return keyframes;
}

Geometry::AffineTransform TimingNormalizer::toMatrix(const NormalizedValue& value) {
    return boost::apply_visitor(MatrixBuilder(), value);
}

} // namespace Animation
