#include "tst_Animation.h"

#include "analyzerConfig.h"
#include "animationCombiner.h"
#include "cssKeyframeAnalyzer.h"
#include "domDocumentAdapter.h"
#include "smilAnalyzer.h"
#include "timingNormalizer.h"

#include <QPointF>
#include <cmath>
#include <limits>

using namespace Animation;
using Geometry::AffineTransform;
using Geometry::BoundingBox;

namespace {

bool fuzzyEqual(double a, double b, double epsilon = 1e-6) {
    return std::abs(a - b) <= epsilon;
}

bool fuzzyEqual(const BoundingBox& a, const BoundingBox& b, double epsilon = 1e-6) {
    return fuzzyEqual(a.x, b.x, epsilon) && fuzzyEqual(a.y, b.y, epsilon)
        && fuzzyEqual(a.width, b.width, epsilon) && fuzzyEqual(a.height, b.height, epsilon);
}

bool contains(const BoundingBox& outer, const BoundingBox& inner) {
    const double epsilon = 1e-9;
    return outer.x <= inner.x + epsilon && outer.y <= inner.y + epsilon
        && outer.right() + epsilon >= inner.right() && outer.bottom() + epsilon >= inner.bottom();
}

QString describe(const BoundingBox& box) {
    return QString("(%1, %2) %3x%4").arg(box.x).arg(box.y).arg(box.width).arg(box.height);
}

TransformAnimation additiveTranslate(double x, double y) {
    TransformAnimation animation;
    animation.transformType = TransformType::Translate;
    animation.additive = true;
    TransformKeyframe keyframe;
    keyframe.time = 0.0;
    keyframe.matrix = AffineTransform::translate(x, y);
    animation.keyframes.append(keyframe);
    return animation;
}

AttributeAnimation numericAnimation(const QString& name, const QList<QPair<double, double>>& timedValues) {
    AttributeAnimation animation;
    animation.attributeName = name;
    for (const QPair<double, double>& timed : timedValues) {
        AttributeValue value;
        value.name = name;
        value.isNumeric = true;
        value.number = timed.second;
        value.text = QString::number(timed.second);
        TimedValue entry;
        entry.time = timed.first;
        entry.value = value;
        animation.values.append(entry);
    }
    return animation;
}

double attributeNumber(const Keyframe& keyframe) {
    const AttributeValue* value = boost::get<AttributeValue>(&keyframe.value);
    return value ? value->number : std::numeric_limits<double>::quiet_NaN();
}

} // namespace

// --- Clock values and timing ---
void TestAnimation::testClockValues_data() {
    QTest::addColumn<QString>("text");
    QTest::addColumn<bool>("valid");
    QTest::addColumn<double>("milliseconds");

    QTest::newRow("seconds") << "2s" << true << 2000.0;
    QTest::newRow("milliseconds") << "500ms" << true << 500.0;
    QTest::newRow("bare_number") << "1.5" << true << 1500.0;
    QTest::newRow("minutes") << "1min" << true << 60000.0;
    QTest::newRow("hours") << "0.5h" << true << 1800000.0;
    QTest::newRow("full_clock") << "00:01:02.5" << true << 62500.0;
    QTest::newRow("partial_clock") << "01:30" << true << 90000.0;
    QTest::newRow("event") << "click" << false << 0.0;
    QTest::newRow("syncbase") << "anim1.end" << false << 0.0;
}

void TestAnimation::testClockValues() {
    QFETCH(QString, text);
    QFETCH(bool, valid);
    QFETCH(double, milliseconds);

    bool ok = !valid;
    double value = TimingNormalizer::parseClockValue(text, &ok);
    QCOMPARE(ok, valid);
    if (valid) {
        QVERIFY(fuzzyEqual(value, milliseconds));
    }
}

void TestAnimation::testTiming() {
    Core::AttributeMap attributes;
    attributes.insert("dur", "indefinite");
    attributes.insert("repeatCount", "indefinite");
    attributes.insert("begin", "click; 2s");
    AnimationTiming timing = TimingNormalizer::parseTiming(attributes);
    QVERIFY(timing.isIndefinite());
    QVERIFY(std::isinf(timing.repeatCount));
    QVERIFY(timing.isEventOrSyncbaseBased);
    QCOMPARE(timing.beginMs, 0.0);
    QVERIFY(!timing.endMs);

    attributes.clear();
    attributes.insert("dur", "3s");
    attributes.insert("begin", "1s; 500ms");
    attributes.insert("end", "10s");
    timing = TimingNormalizer::parseTiming(attributes);
    QVERIFY(fuzzyEqual(timing.duration, 3000.0));
    QVERIFY(fuzzyEqual(timing.beginMs, 500.0));
    QVERIFY(!timing.isEventOrSyncbaseBased);
    QVERIFY(timing.endMs);
    QVERIFY(fuzzyEqual(*timing.endMs, 10000.0));
    QVERIFY(!timing.freeze);

    attributes.insert("fill", "freeze");
    QVERIFY(TimingNormalizer::parseTiming(attributes).freeze);
    attributes.insert("fill", "remove");
    QVERIFY(!TimingNormalizer::parseTiming(attributes).freeze);
}

// --- Keyframe normalization ---
void TestAnimation::testKeyframeTimes_data() {
    QTest::addColumn<QString>("values");
    QTest::addColumn<QString>("keyTimes");
    QTest::addColumn<QString>("calcMode");
    QTest::addColumn<QList<double>>("expectedTimes");

    QTest::newRow("even_spacing") << "0;50;100" << "" << "" << (QList<double>() << 0.0 << 0.5 << 1.0);
    QTest::newRow("explicit_key_times") << "0;50;100" << "0;0.2;1" << "" << (QList<double>() << 0.0 << 0.2 << 1.0);
    QTest::newRow("mismatched_key_times") << "0;10;20;30" << "0;1" << "" << (QList<double>() << 0.0 << (1.0 / 3.0) << (2.0 / 3.0) << 1.0);
    QTest::newRow("single_value") << "42" << "" << "" << (QList<double>() << 0.0);
    QTest::newRow("paced_even_spacing") << "0;50;100" << "0;0.2;1" << "paced" << (QList<double>() << 0.0 << 0.5 << 1.0);
}

void TestAnimation::testKeyframeTimes() {
    QFETCH(QString, values);
    QFETCH(QString, keyTimes);
    QFETCH(QString, calcMode);
    QFETCH(QList<double>, expectedTimes);

    Core::AttributeMap attributes;
    attributes.insert("attributeName", "x");
    attributes.insert("values", values);
    if (!keyTimes.isEmpty()) {
        attributes.insert("keyTimes", keyTimes);
    }
    if (!calcMode.isEmpty()) {
        attributes.insert("calcMode", calcMode);
    }

    const QList<Keyframe> keyframes = TimingNormalizer::normalizeKeyframes(AnimationKind::Animate, attributes);
    QCOMPARE(keyframes.size(), expectedTimes.size());
    for (int i = 0; i < keyframes.size(); ++i) {
        QVERIFY(fuzzyEqual(keyframes.at(i).time, expectedTimes.at(i)));
    }
}

void TestAnimation::testFromByAddsValues() {
    Core::AttributeMap attributes;
    attributes.insert("attributeName", "x");
    attributes.insert("from", "20");
    attributes.insert("by", "30");
    const QList<Keyframe> keyframes = TimingNormalizer::normalizeKeyframes(AnimationKind::Animate, attributes);
    QCOMPARE(keyframes.size(), 2);
    QVERIFY(fuzzyEqual(attributeNumber(keyframes.at(0)), 20.0));
    QVERIFY(fuzzyEqual(attributeNumber(keyframes.at(1)), 50.0));

    Core::AttributeMap transform;
    transform.insert("type", "translate");
    transform.insert("from", "10 5");
    transform.insert("by", "5 5");
    const QList<Keyframe> transformKeyframes =
        TimingNormalizer::normalizeKeyframes(AnimationKind::AnimateTransform, transform);
    QCOMPARE(transformKeyframes.size(), 2);
    QPointF end = TimingNormalizer::toMatrix(transformKeyframes.at(1).value).transformPoint(QPointF(0, 0));
    QCOMPARE(end, QPointF(15, 10));
}

void TestAnimation::testByOnlyStartsFromNeutral() {
    Core::AttributeMap attributes;
    attributes.insert("attributeName", "cx");
    attributes.insert("by", "100");
    const QList<Keyframe> keyframes = TimingNormalizer::normalizeKeyframes(AnimationKind::Animate, attributes);
    QCOMPARE(keyframes.size(), 2);
    QVERIFY(fuzzyEqual(keyframes.at(0).time, 0.0));
    QVERIFY(fuzzyEqual(attributeNumber(keyframes.at(0)), 0.0));
    QVERIFY(fuzzyEqual(attributeNumber(keyframes.at(1)), 100.0));

    Core::AttributeMap scale;
    scale.insert("type", "scale");
    scale.insert("by", "1");
    const QList<Keyframe> scaleKeyframes = TimingNormalizer::normalizeKeyframes(AnimationKind::AnimateTransform, scale);
    QCOMPARE(scaleKeyframes.size(), 2);
    QVERIFY(TimingNormalizer::toMatrix(scaleKeyframes.at(0).value).isIdentity());
    QCOMPARE(TimingNormalizer::toMatrix(scaleKeyframes.at(1).value).transformPoint(QPointF(1, 1)), QPointF(2, 2));

    Core::AttributeMap toOnly;
    toOnly.insert("attributeName", "y");
    toOnly.insert("to", "80");
    const QList<Keyframe> toKeyframes = TimingNormalizer::normalizeKeyframes(AnimationKind::Animate, toOnly);
    QCOMPARE(toKeyframes.size(), 1);
    QVERIFY(fuzzyEqual(toKeyframes.at(0).time, 1.0));
}

// --- set begin ---
void TestAnimation::testSetBegin_data() {
    QTest::addColumn<QString>("begin");
    QTest::addColumn<bool>("supported");
    QTest::addColumn<double>("timeMs");
    QTest::addColumn<bool>("eventBased");

    QTest::newRow("empty") << "" << true << 0.0 << false;
    QTest::newRow("seconds") << "2s" << true << 2000.0 << false;
    QTest::newRow("milliseconds") << "250ms" << true << 250.0 << false;
    QTest::newRow("click") << "click" << true << 0.0 << true;
    QTest::newRow("click_offset") << "click+1s" << true << 1000.0 << true;
    QTest::newRow("syncbase") << "other.end" << false << 0.0 << false;
}

void TestAnimation::testSetBegin() {
    QFETCH(QString, begin);
    QFETCH(bool, supported);
    QFETCH(double, timeMs);
    QFETCH(bool, eventBased);

    boost::optional<SetBegin> parsed = SmilAnalyzer::parseSetBegin(begin);
    QCOMPARE(static_cast<bool>(parsed), supported);
    if (parsed) {
        QVERIFY(fuzzyEqual(parsed->timeMs, timeMs));
        QCOMPARE(parsed->isEventBased, eventBased);
    }
}

// --- SMIL analysis over a document ---
void TestAnimation::testSmilAnalyzerCollectsAnimations() {
    const QString svg =
        "<svg xmlns='http://www.w3.org/2000/svg' xmlns:xlink='http://www.w3.org/1999/xlink' viewBox='0 0 100 100'>"
        "  <rect id='box' x='0' y='0' width='10' height='10'>"
        "    <animate attributeName='x' from='0' to='50' dur='1s'/>"
        "    <animateTransform attributeName='transform' type='rotate' from='0 5 5' to='90 5 5' dur='1s' additive='sum'/>"
        "    <animateTransform attributeName='transform' type='bounce' from='0' to='1' dur='1s'/>"
        "    <set attributeName='fill' to='red' begin='other.end'/>"
        "  </rect>"
        "  <animate xlink:href='#box' attributeName='y' values='0;20' dur='1s'/>"
        "</svg>";

    Core::DomDocumentAdapter document;
    QVERIFY(document.load(svg));
    QDomElement box = document.elementById("box");
    QVERIFY(!box.isNull());

    Core::AnalyzerConfig config;
    SmilAnalyzer analyzer(document, config);
    const QList<AnimationDescriptor> animations = analyzer.computeAnimations(box);

    // the unsupported type and the syncbase set are dropped
    QCOMPARE(animations.size(), 3);
    QVERIFY(boost::get<AttributeAnimation>(&animations.at(0)));
    const TransformAnimation* rotate = boost::get<TransformAnimation>(&animations.at(1));
    QVERIFY(rotate);
    QVERIFY(rotate->additive);
    QCOMPARE(rotate->transformType, TransformType::Rotate);
    const AttributeAnimation* external = boost::get<AttributeAnimation>(&animations.at(2));
    QVERIFY(external);
    QCOMPARE(external->attributeName, QString("y"));
}

void TestAnimation::testAnimateMotionValues() {
    const QString svg =
        "<svg xmlns='http://www.w3.org/2000/svg' viewBox='0 0 100 100'>"
        "  <path id='track' d='M0,0 L100,50'/>"
        "  <circle id='a' r='5'><animateMotion dur='2s' rotate='90' values='0,0; 30,40'/></circle>"
        "  <circle id='b' r='5'><animateMotion dur='2s'><mpath href='#track'/></animateMotion></circle>"
        "  <circle id='c' r='5'><animateMotion dur='2s' from='10,10' to='20,-10' rotate='auto'/></circle>"
        "  <circle id='d' r='5'><animateMotion dur='1s' to='100,0' fill='freeze'/></circle>"
        "</svg>";

    Core::DomDocumentAdapter document;
    QVERIFY(document.load(svg));
    Core::AnalyzerConfig config;
    SmilAnalyzer analyzer(document, config);

    boost::optional<MotionAnimation> fixedAngle = analyzer.analyzeMotion(document.elementById("a").firstChildElement());
    QVERIFY(fixedAngle);
    // |sin 90|*5 + |cos 90|*5 = 5
    QVERIFY(fuzzyEqual(fixedAngle->rotationExpandedBounds.minX, -5.0));
    QVERIFY(fuzzyEqual(fixedAngle->rotationExpandedBounds.maxY, 45.0));

    boost::optional<MotionAnimation> viaPath = analyzer.analyzeMotion(document.elementById("b").firstChildElement());
    QVERIFY(viaPath);
    QVERIFY(fuzzyEqual(viaPath->motionBounds.maxX, 100.0));
    QVERIFY(fuzzyEqual(viaPath->motionBounds.maxY, 50.0));

    boost::optional<MotionAnimation> fromTo = analyzer.analyzeMotion(document.elementById("c").firstChildElement());
    QVERIFY(fromTo);
    QVERIFY(fuzzyEqual(fromTo->motionBounds.minX, 10.0));
    QVERIFY(fuzzyEqual(fromTo->motionBounds.maxX, 20.0));
    QVERIFY(fuzzyEqual(fromTo->motionBounds.minY, -10.0));
    QVERIFY(fuzzyEqual(fromTo->rotationExpandedBounds.minY, -10.0));

    // to alone starts from the element's own position
    boost::optional<MotionAnimation> toOnly = analyzer.analyzeMotion(document.elementById("d").firstChildElement());
    QVERIFY(toOnly);
    QVERIFY(toOnly->timing.freeze);
    QVERIFY(fuzzyEqual(toOnly->motionBounds.minX, 0.0));
    QVERIFY(fuzzyEqual(toOnly->motionBounds.maxX, 100.0));

    AnimationCombiner combiner;
    QList<AnimationDescriptor> animations;
    animations << *toOnly;
    BoundingBox envelope = combiner.combine(animations, BoundingBox(-5, -5, 10, 10));
    QVERIFY2(fuzzyEqual(envelope, BoundingBox(-5, -5, 110, 10)), qPrintable(describe(envelope)));
}

// --- Combiner ---
void TestAnimation::testAdditiveTranslateComposes() {
    QList<AnimationDescriptor> animations;
    animations << additiveTranslate(10, 0) << additiveTranslate(0, 5);

    AnimationCombiner combiner;
    BoundingBox envelope = combiner.combine(animations, BoundingBox(0, 0, 10, 10));
    QVERIFY2(fuzzyEqual(envelope, BoundingBox(10, 5, 10, 10)), qPrintable(describe(envelope)));
}

void TestAnimation::testCombinerKeepsBase_data() {
    QTest::addColumn<QString>("scenario");

    QTest::newRow("no_animations") << "none";
    QTest::newRow("opacity_only") << "opacity";
    QTest::newRow("late_start") << "late";
    QTest::newRow("set_geometry") << "set";
    QTest::newRow("css_growth") << "css";
    QTest::newRow("ends_without_freeze") << "ends";
    QTest::newRow("motion_away_from_origin") << "motion";
    QTest::newRow("additive_ends_without_freeze") << "additive";
}

void TestAnimation::testCombinerKeepsBase() {
    QFETCH(QString, scenario);

    const BoundingBox base(20, 30, 40, 50);
    QList<AnimationDescriptor> animations;
    if (scenario == "opacity") {
        animations << numericAnimation("opacity", { qMakePair(0.0, 0.0), qMakePair(1.0, 1.0) });
    } else if (scenario == "late") {
        animations << numericAnimation("x", { qMakePair(0.5, 100.0), qMakePair(1.0, 150.0) });
    } else if (scenario == "set") {
        SetAnimation set;
        set.attributeName = "width";
        set.to = "5";
        animations << set;
    } else if (scenario == "css") {
        CssAnimation css;
        css.name = "grow";
        css.expansion.x = -5.0;
        css.expansion.width = 10.0;
        animations << css;
    } else if (scenario == "ends") {
        // x from=100 to=200 dur=1s: back at the base position afterwards
        AttributeAnimation moving = numericAnimation("x", { qMakePair(0.0, 100.0), qMakePair(1.0, 200.0) });
        moving.timing.duration = 1000.0;
        animations << moving;
    } else if (scenario == "motion") {
        MotionAnimation motion;
        motion.timing.duration = 2000.0;
        motion.motionBounds.minX = 100.0;
        motion.motionBounds.maxX = 200.0;
        motion.rotationExpandedBounds = motion.motionBounds;
        animations << motion;
    } else if (scenario == "additive") {
        TransformAnimation shift = additiveTranslate(100, 0);
        shift.timing.duration = 1000.0;
        animations << shift;
    }

    AnimationCombiner combiner;
    BoundingBox envelope = combiner.combine(animations, base);
    QVERIFY2(contains(envelope, base), qPrintable(describe(envelope)));
    if (scenario == "none" || scenario == "opacity") {
        QVERIFY(fuzzyEqual(envelope, base));
    }
}

void TestAnimation::testAttributeEnvelope() {
    QList<AnimationDescriptor> animations;
    animations << numericAnimation("x", { qMakePair(0.0, 50.0), qMakePair(1.0, 150.0) });

    AnimationCombiner combiner;
    BoundingBox envelope = combiner.combine(animations, BoundingBox(50, 50, 60, 60));
    QVERIFY2(fuzzyEqual(envelope, BoundingBox(50, 50, 160, 60)), qPrintable(describe(envelope)));

    // The element's own transform maps the envelope into the parent's space
    envelope = combiner.combine(animations, BoundingBox(50, 50, 60, 60), AffineTransform::translate(0, 100));
    QVERIFY2(fuzzyEqual(envelope, BoundingBox(50, 150, 160, 60)), qPrintable(describe(envelope)));

    QVERIFY(AnimationCombiner::isGeometricAttribute("points"));
    QVERIFY(!AnimationCombiner::isGeometricAttribute("fill"));
    QCOMPARE(AnimationCombiner::classify(animations.first()), AnimationGroup::Geometric);
    QVERIFY(fuzzyEqual(AnimationCombiner::attributeBounds("width", 10, BoundingBox(5, 5, 40, 40)),
                       BoundingBox(5, 5, 10, 40)));
    QVERIFY(fuzzyEqual(AnimationCombiner::attributeBounds("r", 20, BoundingBox(0, 0, 10, 10)),
                       BoundingBox(-15, -15, 40, 40)));
}

void TestAnimation::testCircleEnvelope() {
    // circle cx=100 cy=100 r=30, cx by 100 -> cx runs 0..100
    QList<AnimationDescriptor> animations;
    animations << numericAnimation("cx", { qMakePair(0.0, 0.0), qMakePair(1.0, 100.0) });
    animations << numericAnimation("r", { qMakePair(0.0, 30.0), qMakePair(1.0, 10.0) });

    AnimationCombiner combiner;
    BoundingBox envelope = combiner.combine(animations, BoundingBox(70, 70, 60, 60));
    QVERIFY2(fuzzyEqual(envelope, BoundingBox(-30, 70, 160, 60)), qPrintable(describe(envelope)));
}

void TestAnimation::testStrokeWidthExpansion() {
    QList<AnimationDescriptor> animations;
    animations << numericAnimation("stroke-width", { qMakePair(0.0, 2.0), qMakePair(1.0, 8.0) });

    AnimationCombiner combiner;
    BoundingBox envelope = combiner.combine(animations, BoundingBox(0, 0, 10, 10));
    QCOMPARE(AnimationCombiner::classify(animations.first()), AnimationGroup::Stroke);
    QVERIFY2(fuzzyEqual(envelope, BoundingBox(-4, -4, 18, 18)), qPrintable(describe(envelope)));
}

// --- CSS keyframes ---
void TestAnimation::testCssKeyframesParsing() {
    CssKeyframeAnalyzer analyzer;
    analyzer.parseStylesheet(
        "/* @keyframes ignored { from { transform: scale(9) } } */\n"
        ".spin { animation: spin 2s linear infinite; }\n"
        "@keyframes spin { from { transform: rotate(0deg); } to { transform: rotate(360deg); } }\n"
        "@-webkit-keyframes pulse { 0%, 100% { opacity: 1 } 50% { transform: scale(1.5) !important; } }\n");

    QVERIFY(analyzer.hasKeyframes("spin"));
    QVERIFY(analyzer.hasKeyframes("pulse"));
    QVERIFY(!analyzer.hasKeyframes("ignored"));

    const QList<CssKeyframe> spin = analyzer.keyframes("spin");
    QCOMPARE(spin.size(), 2);
    QCOMPARE(spin.at(1).percentage, 100.0);
    QCOMPARE(spin.at(1).transform, QString("rotate(360deg)"));

    const QList<CssKeyframe> pulse = analyzer.keyframes("pulse");
    QCOMPARE(pulse.size(), 3);
    QCOMPARE(pulse.at(1).percentage, 50.0);
    QCOMPARE(pulse.at(1).transform, QString("scale(1.5)"));
    QCOMPARE(pulse.at(0).transform, QString("none"));
}

void TestAnimation::testCssTransformFunctions_data() {
    QTest::addColumn<QString>("transform");
    QTest::addColumn<QPointF>("input");
    QTest::addColumn<QPointF>("expected");

    QTest::newRow("none") << "none" << QPointF(3, 4) << QPointF(3, 4);
    QTest::newRow("translate_then_scale") << "translate(10px, 20px) scale(2)" << QPointF(1, 1) << QPointF(12, 22);
    QTest::newRow("percent_translate") << "translate(50%, 25%)" << QPointF(0, 0) << QPointF(20, 5);
    QTest::newRow("translate_y") << "translateY(-7px)" << QPointF(0, 0) << QPointF(0, -7);
    QTest::newRow("rotate_turn") << "rotate(0.25turn)" << QPointF(1, 0) << QPointF(0, 1);
    QTest::newRow("rotate_rad") << "rotate(3.14159265358979rad)" << QPointF(1, 0) << QPointF(-1, 0);
    QTest::newRow("scale_x") << "scaleX(3)" << QPointF(2, 2) << QPointF(6, 2);
}

void TestAnimation::testCssTransformFunctions() {
    QFETCH(QString, transform);
    QFETCH(QPointF, input);
    QFETCH(QPointF, expected);

    AffineTransform matrix = CssKeyframeAnalyzer::parseTransformFunctions(transform, BoundingBox(0, 0, 40, 20));
    QPointF actual = matrix.transformPoint(input);
    QVERIFY2(fuzzyEqual(actual.x(), expected.x()) && fuzzyEqual(actual.y(), expected.y()),
             qPrintable(QString("got (%1, %2)").arg(actual.x()).arg(actual.y())));
}

void TestAnimation::testTransformOrigin_data() {
    QTest::addColumn<QString>("origin");
    QTest::addColumn<QPointF>("expected");

    // box (10, 20) 40x60
    QTest::newRow("default") << "" << QPointF(30, 50);
    QTest::newRow("center") << "center" << QPointF(30, 50);
    QTest::newRow("left_top") << "left top" << QPointF(10, 20);
    QTest::newRow("top_left_swapped") << "top left" << QPointF(10, 20);
    QTest::newRow("right_bottom") << "right bottom" << QPointF(50, 80);
    QTest::newRow("bottom_only") << "bottom" << QPointF(30, 80);
    QTest::newRow("left_only") << "left" << QPointF(10, 50);
    QTest::newRow("percentages") << "25% 75%" << QPointF(20, 65);
    QTest::newRow("px_zero_is_corner") << "0px 0px" << QPointF(10, 20);
    QTest::newRow("px_centre") << "30px 50px" << QPointF(30, 50);
    QTest::newRow("px_absolute") << "100px 0.5px" << QPointF(100, 0.5);
}

void TestAnimation::testTransformOrigin() {
    QFETCH(QString, origin);
    QFETCH(QPointF, expected);

    QPointF point = CssKeyframeAnalyzer::parseTransformOrigin(origin, BoundingBox(10, 20, 40, 60));
    QVERIFY2(fuzzyEqual(point.x(), expected.x()) && fuzzyEqual(point.y(), expected.y()),
             qPrintable(QString("got (%1, %2)").arg(point.x()).arg(point.y())));
}

void TestAnimation::testCssExpansion() {
    CssKeyframeAnalyzer analyzer;
    analyzer.parseStylesheet("@keyframes slide { from { transform: translateX(0) } to { transform: translateX(100px) } }"
                             "@keyframes turn { to { transform: rotate(90deg) } }");

    Geometry::BoundsDelta slide = analyzer.expansionFor("slide", "normal", "50% 50%", BoundingBox(0, 0, 10, 10));
    QVERIFY(fuzzyEqual(slide.x, 0.0));
    QVERIFY(fuzzyEqual(slide.y, 0.0));
    QVERIFY(fuzzyEqual(slide.width, 100.0));
    QVERIFY(fuzzyEqual(slide.height, 0.0));

    // 10x20 box turned about its centre becomes 20x10; the union with the base is 20x20
    Geometry::BoundsDelta turn = analyzer.expansionFor("turn", "alternate", "center", BoundingBox(0, 0, 10, 20));
    QVERIFY(fuzzyEqual(turn.x, -5.0));
    QVERIFY(fuzzyEqual(turn.y, 0.0));
    QVERIFY(fuzzyEqual(turn.width, 10.0));
    QVERIFY(fuzzyEqual(turn.height, 0.0));

    QList<CssKeyframe> frames = analyzer.keyframes("slide");
    QCOMPARE(CssKeyframeAnalyzer::orderByDirection(frames, "reverse").first().percentage, 100.0);
    QCOMPARE(CssKeyframeAnalyzer::orderByDirection(frames, "alternate").size(), 4);

    const QList<QPointF> corners = CssKeyframeAnalyzer::transformedCorners(
        BoundingBox(0, 0, 10, 10), AffineTransform::scale(2, 2), QPointF(5, 5));
    QCOMPARE(corners.size(), 4);
    QVERIFY(fuzzyEqual(corners.at(0).x(), -5.0));
    QVERIFY(fuzzyEqual(corners.at(2).y(), 15.0));
}

QTEST_GUILESS_MAIN(TestAnimation)
