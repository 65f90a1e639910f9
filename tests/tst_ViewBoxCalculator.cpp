#include "tst_ViewBoxCalculator.h"

#include "domDocumentAdapter.h"
#include "elementAnalyzer.h"
#include "smilAnalyzer.h"
#include "viewBoxCalculator.h"
#include "visibilityChecker.h"

#include <cmath>

using Core::AnalyzerConfig;
using Core::DomDocumentAdapter;
using Core::ViewBoxCalculator;
using Core::ViewBoxResult;
using Geometry::BoundingBox;

namespace {

QString svgDocument(const QString& body, const QString& viewBox = "0 0 200 200") {
    return QString("<svg xmlns='http://www.w3.org/2000/svg' xmlns:xlink='http://www.w3.org/1999/xlink' "
                   "viewBox='%1'>%2</svg>").arg(viewBox, body);
}

bool fuzzyEqual(double a, double b, double epsilon = 1e-6) {
    return std::abs(a - b) <= epsilon;
}

bool fuzzyEqual(const BoundingBox& a, const BoundingBox& b, double epsilon = 1e-6) {
    return fuzzyEqual(a.x, b.x, epsilon) && fuzzyEqual(a.y, b.y, epsilon)
        && fuzzyEqual(a.width, b.width, epsilon) && fuzzyEqual(a.height, b.height, epsilon);
}

ViewBoxResult calculate(const QString& svg, const AnalyzerConfig& config = AnalyzerConfig()) {
    DomDocumentAdapter document(config);
    if (!document.load(svg)) {
        return ViewBoxResult();
    }
    ViewBoxCalculator calculator(config);
    return calculator.calculate(document);
}

} // namespace

// --- Document adapter ---
void TestViewBoxCalculator::testDocumentLoading() {
    DomDocumentAdapter document;
    QString error;
    QVERIFY(!document.load("<svg><rect></svg>", &error));
    QVERIFY(!error.isEmpty());

    error.clear();
    QVERIFY(!document.load("<html><body/></html>", &error));
    QVERIFY(error.contains("svg"));

    QVERIFY(document.load(svgDocument("<g id='layer'><rect id='r' xlink:href='#x'/></g>")));
    QDomElement rect = document.elementById("r");
    QVERIFY(!rect.isNull());
    QVERIFY(document.parentElement(rect) == document.elementById("layer"));
    QCOMPARE(document.attribute(rect, "href").value_or(QString()), QString("#x"));
    QVERIFY(!document.attribute(rect, "width"));
    QCOMPARE(document.elementsByTagNames(QStringList() << "rect" << "g").size(), 2);

    QCOMPARE(document.elementsReferencing("x").size(), 1);
    QVERIFY(document.elementsReferencing("x").first() == rect);
    QVERIFY(document.elementsReferencing("layer").isEmpty());
}

void TestViewBoxCalculator::testStyleCascade() {
    const QString svg = svgDocument(
        "<style>/* sheet */ rect { fill: blue; opacity: 0.5 } .hot { fill: red } #special { fill: green }"
        " g rect.nested { stroke: black } @media print { rect { fill: gray } }</style>"
        "<rect id='plain' fill='yellow'/>"
        "<rect id='classy' class='warm hot'/>"
        "<rect id='special' class='hot' style='opacity: 1 !important'/>"
        "<g><rect id='inner' class='nested'/></g>");

    DomDocumentAdapter document;
    QVERIFY(document.load(svg));
    QCOMPARE(document.styleSheetTexts().size(), 1);

    // sheet rules beat presentation attributes
    QCOMPARE(document.computedStyleProperty(document.elementById("plain"), "fill"), QString("blue"));
    QCOMPARE(document.computedStyleProperty(document.elementById("classy"), "fill"), QString("red"));
    QCOMPARE(document.computedStyleProperty(document.elementById("special"), "fill"), QString("green"));
    QCOMPARE(document.computedStyleProperty(document.elementById("special"), "opacity"), QString("1"));
    QCOMPARE(document.computedStyleProperty(document.elementById("inner"), "stroke"), QString("black"));
    QCOMPARE(document.computedStyleProperty(document.elementById("plain"), "stroke"), QString());
}

void TestViewBoxCalculator::testIntrinsicBounds() {
    const QString svg = svgDocument(
        "<rect id='rect' x='5' y='6' width='7' height='8'/>"
        "<circle id='circle' cx='50' cy='40' r='10'/>"
        "<ellipse id='ellipse' cx='0' cy='0' rx='4' ry='2'/>"
        "<line id='line' x1='10' y1='50' x2='-10' y2='20'/>"
        "<polygon id='polygon' points='0,0 30,5 10,-20'/>"
        "<path id='path' d='M10 20 L50 60'/>"
        "<text id='text' x='100' y='50' font-size='10'>abcd</text>");

    DomDocumentAdapter document;
    QVERIFY(document.load(svg));

    QVERIFY(fuzzyEqual(document.intrinsicBBox(document.elementById("rect")), BoundingBox(5, 6, 7, 8)));
    QVERIFY(fuzzyEqual(document.intrinsicBBox(document.elementById("circle")), BoundingBox(40, 30, 20, 20)));
    QVERIFY(fuzzyEqual(document.intrinsicBBox(document.elementById("ellipse")), BoundingBox(-4, -2, 8, 4)));
    QVERIFY(fuzzyEqual(document.intrinsicBBox(document.elementById("line")), BoundingBox(-10, 20, 20, 30)));
    QVERIFY(fuzzyEqual(document.intrinsicBBox(document.elementById("polygon")), BoundingBox(0, -20, 30, 25)));
    QVERIFY(fuzzyEqual(document.intrinsicBBox(document.elementById("path")), BoundingBox(10, 20, 40, 40)));

    // 4 glyphs * 10 * 0.6 wide, one font size above the baseline
    BoundingBox text = document.intrinsicBBox(document.elementById("text"));
    QVERIFY(fuzzyEqual(text.x, 100.0));
    QVERIFY(fuzzyEqual(text.y, 40.0));
    QVERIFY(fuzzyEqual(text.width, 24.0));
}

// --- End to end ---
void TestViewBoxCalculator::testViewBox_data() {
    QTest::addColumn<QString>("body");
    QTest::addColumn<double>("buffer");
    QTest::addColumn<QString>("expected");

    QTest::newRow("animated_x")
        << "<rect x='50' y='50' width='60' height='60'>"
           "<animate attributeName='x' from='50' to='150' dur='2s' fill='freeze'/></rect>"
        << 10.0 << "40 40 180 80";
    QTest::newRow("circle_cx_by")
        << "<circle cx='100' cy='100' r='30'><animate attributeName='cx' by='100' dur='2s'/></circle>"
        << 10.0 << "-40 60 180 80";
    QTest::newRow("hidden_from_start_excluded")
        << "<rect x='500' y='500' width='60' height='60'><set attributeName='display' to='none' begin='0s'/></rect>"
           "<rect x='0' y='0' width='10' height='10'/>"
        << 10.0 << "-10 -10 30 30";
    QTest::newRow("hidden_later_kept")
        << "<rect x='100' y='0' width='10' height='10'><set attributeName='display' to='none' begin='2s'/></rect>"
           "<rect x='0' y='0' width='10' height='10'/>"
        << 0.0 << "0 0 110 10";
    QTest::newRow("defs_ignored")
        << "<defs><rect id='far' x='1000' y='1000' width='10' height='10'/></defs>"
           "<rect x='0' y='0' width='10' height='10'/>"
        << 0.0 << "0 0 10 10";
    QTest::newRow("group_transform")
        << "<g transform='translate(100,0)'><rect width='10' height='10'/><g transform='scale(2)'>"
           "<rect x='5' y='5' width='5' height='5'/></g></g>"
        << 0.0 << "100 0 20 20";
    QTest::newRow("animated_group")
        << "<g><animateTransform attributeName='transform' type='translate' from='0 0' to='50 0' dur='1s'/>"
           "<rect width='10' height='10'/></g>"
        << 0.0 << "0 0 60 10";
    QTest::newRow("additive_transforms")
        << "<rect width='10' height='10'>"
           "<animateTransform attributeName='transform' type='translate' values='10 0' additive='sum' dur='1s' fill='freeze'/>"
           "<animateTransform attributeName='transform' type='translate' values='0 5' additive='sum' dur='1s' fill='freeze'/></rect>"
        << 0.0 << "10 5 10 10";
    QTest::newRow("additive_transforms_not_frozen")
        << "<rect width='10' height='10'>"
           "<animateTransform attributeName='transform' type='translate' values='10 0' additive='sum' dur='1s'/>"
           "<animateTransform attributeName='transform' type='translate' values='0 5' additive='sum' dur='1s'/></rect>"
        << 0.0 << "0 0 20 15";
    QTest::newRow("animation_ends_without_freeze")
        << "<rect x='0' y='0' width='10' height='10'><animate attributeName='x' from='100' to='200' dur='1s'/></rect>"
        << 0.0 << "0 0 210 10";
    QTest::newRow("motion_to_only")
        << "<circle r='5'><animateMotion to='100,0' dur='1s'/></circle>"
        << 0.0 << "-5 -5 110 10";
    QTest::newRow("motion_to_only_frozen")
        << "<circle r='5'><animateMotion to='100,0' dur='1s' fill='freeze'/></circle>"
        << 0.0 << "-5 -5 110 10";
    QTest::newRow("href_targeted_animation")
        << "<rect id='target' width='10' height='10'/>"
           "<animate href='#target' attributeName='x' from='0' to='50' dur='1s'/>"
        << 0.0 << "0 0 60 10";
    QTest::newRow("motion_path")
        << "<circle cx='0' cy='0' r='5'><animateMotion path='M0,0 L100,0' dur='2s'/></circle>"
        << 0.0 << "-5 -5 110 10";
    QTest::newRow("use_symbol_cycle")
        << "<symbol id='s'><use xlink:href='#s'/><rect width='10' height='10'/></symbol>"
           "<use xlink:href='#s' x='100'/>"
        << 10.0 << "90 -10 30 30";
    QTest::newRow("use_symbol_viewbox")
        << "<symbol id='icon' viewBox='0 0 10 10'><rect width='10' height='10'/></symbol>"
           "<use href='#icon' x='20' y='20' width='40' height='40'/>"
        << 0.0 << "20 20 40 40";
    QTest::newRow("missing_use_target")
        << "<use href='#ghost' x='500'/><rect width='10' height='10'/>"
        << 0.0 << "0 0 10 10";
    QTest::newRow("nested_svg")
        << "<svg x='50' y='50' width='100' height='100' viewBox='0 0 10 10'><rect width='10' height='10'/></svg>"
        << 10.0 << "40 40 120 120";
    QTest::newRow("switch_first_match")
        << "<switch><rect systemLanguage='fr' x='500' width='10' height='10'/>"
           "<rect systemLanguage='en-US' width='10' height='10'/><rect x='-500' width='10' height='10'/></switch>"
        << 0.0 << "0 0 10 10";
    QTest::newRow("blur_filter")
        << "<filter id='b'><feGaussianBlur stdDeviation='2'/></filter>"
           "<rect width='10' height='10' filter='url(#b)'/>"
        << 0.0 << "-6 -6 22 22";
    QTest::newRow("group_blur_filter")
        << "<filter id='b'><feGaussianBlur stdDeviation='2'/></filter>"
           "<g filter='url(#b)'><rect width='10' height='10'/></g>"
        << 0.0 << "-6 -6 22 22";
    QTest::newRow("scaled_blur_filter")
        << "<filter id='b'><feGaussianBlur stdDeviation='2'/></filter>"
           "<g transform='scale(2)'><rect width='10' height='10' filter='url(#b)'/></g>"
        << 0.0 << "-12 -12 44 44";
    QTest::newRow("marker_end")
        << "<marker id='m' markerWidth='3' markerHeight='4'/>"
           "<line x1='0' y1='0' x2='100' y2='0' stroke-width='2' marker-end='url(#m)'/>"
        << 0.0 << "0 -10 110 20";
    QTest::newRow("css_keyframes")
        << "<style>@keyframes slide { from { transform: translateX(0) } to { transform: translateX(100px) } }"
           " .mover { animation: slide 2s infinite }</style>"
           "<rect class='mover' width='10' height='10'/>"
        << 0.0 << "0 0 110 10";
    // Tile content hanging out of a 20x20 tile by 10 on every side
    QTest::newRow("pattern_overflow")
        << "<defs><pattern id='p' patternUnits='userSpaceOnUse' width='20' height='20'>"
           "<circle cx='10' cy='10' r='20'/></pattern></defs>"
           "<rect x='100' y='100' width='50' height='50' fill='url(#p)'/>"
        << 0.0 << "90 90 70 70";
    QTest::newRow("pattern_overflow_right_bottom")
        << "<defs><pattern id='p' patternUnits='userSpaceOnUse' width='30' height='30'>"
           "<rect x='10' y='10' width='40' height='35'/></pattern></defs>"
           "<rect x='100' y='100' width='60' height='60' fill='url(#p)'/>"
        << 0.0 << "100 100 80 75";
    QTest::newRow("pattern_inside_tile")
        << "<defs><pattern id='p' patternUnits='userSpaceOnUse' width='20' height='20'>"
           "<circle cx='10' cy='10' r='5'/></pattern></defs>"
           "<rect x='100' y='100' width='50' height='50' fill='url(#p)'/>"
        << 0.0 << "100 100 50 50";
    QTest::newRow("pattern_bounding_box_units")
        << "<defs><pattern id='p' width='0.5' height='0.5'><circle cx='25' cy='25' r='30'/></pattern></defs>"
           "<rect width='100' height='100' fill='url(#p)'/>"
        << 0.0 << "-5 -5 110 110";
    QTest::newRow("pattern_fill_inherited")
        << "<defs><pattern id='p' patternUnits='userSpaceOnUse' width='20' height='20'>"
           "<circle cx='10' cy='10' r='20'/></pattern></defs>"
           "<g fill='url(#p)'><rect x='100' y='100' width='50' height='50'/></g>"
        << 0.0 << "90 90 70 70";
    QTest::newRow("pattern_filling_itself")
        << "<defs><pattern id='p' patternUnits='userSpaceOnUse' width='10' height='10'>"
           "<rect width='20' height='20' fill='url(#p)'/></pattern></defs>"
           "<rect width='10' height='10' fill='url(#p)'/>"
        << 0.0 << "0 0 20 20";
    QTest::newRow("zero_size_skipped")
        << "<rect x='-300' y='-300' width='0' height='0'/><rect width='10' height='10'/>"
        << 0.0 << "0 0 10 10";
}

void TestViewBoxCalculator::testViewBox() {
    QFETCH(QString, body);
    QFETCH(double, buffer);
    QFETCH(QString, expected);

    AnalyzerConfig config;
    config.buffer = buffer;
    ViewBoxResult result = calculate(svgDocument(body), config);
    QVERIFY2(result.valid, qPrintable(result.errorMessage));
    QCOMPARE(result.viewBoxText, expected);
}

void TestViewBoxCalculator::testElementStages() {
    const QString svg = svgDocument(
        "<filter id='b'><feGaussianBlur stdDeviation='1'/></filter>"
        "<g transform='translate(100,0)'>"
        "<rect id='r' width='10' height='10' filter='url(#b)' mask='url(#m)'>"
        "<animate attributeName='x' from='0' to='20' dur='1s' fill='freeze'/></rect></g>");

    DomDocumentAdapter document;
    QVERIFY(document.load(svg));
    AnalyzerConfig config;
    Core::ElementAnalyzer analyzer(document, config);

    Core::ElementBoundsResult result =
        analyzer.analyzeElement(document.elementById("r"), Geometry::AffineTransform::translate(100, 0));
    QVERIFY(!result.skipped);
    QCOMPARE(result.label, QString("r"));
    QVERIFY(fuzzyEqual(result.baseBounds, BoundingBox(0, 0, 10, 10)));
    QVERIFY(fuzzyEqual(result.transformedBounds, BoundingBox(100, 0, 10, 10)));
    QVERIFY(fuzzyEqual(result.animatedBounds, BoundingBox(100, 0, 30, 10)));
    QVERIFY2(fuzzyEqual(result.effectExpandedBounds, BoundingBox(97, -3, 36, 16)),
             qPrintable(QString("got %1 %2 %3 %4").arg(result.effectExpandedBounds.x).arg(result.effectExpandedBounds.y)
                            .arg(result.effectExpandedBounds.width).arg(result.effectExpandedBounds.height)));
    QVERIFY(result.hasAnimations);
    QCOMPARE(result.animationCount, 1);
    QVERIFY(result.hasEffects);
    // The mask is not applied; the full bounds are kept
    QVERIFY(result.preserveFullBounds);
}

void TestViewBoxCalculator::testPatternOverflow() {
    const QString svg = svgDocument(
        "<defs><pattern id='p' patternUnits='userSpaceOnUse' width='30' height='30'>"
        "<rect x='10' y='10' width='40' height='35'/></pattern>"
        "<pattern id='scaled' patternContentUnits='objectBoundingBox' width='1' height='1'>"
        "<rect x='-0.1' width='1' height='1'/></pattern></defs>"
        "<rect id='tiled' x='100' y='100' width='60' height='60' fill='url(#p)'/>"
        "<rect id='solid' width='60' height='60' fill='red'/>"
        "<rect id='scaledContent' width='50' height='20' fill='url(#scaled)'/>");

    DomDocumentAdapter document;
    QVERIFY(document.load(svg));
    AnalyzerConfig config;
    Core::ElementAnalyzer analyzer(document, config);

    QDomElement tiled = document.elementById("tiled");
    Geometry::BoundsDelta delta = analyzer.patternOverflow(tiled, BoundingBox(100, 100, 60, 60));
    QVERIFY(fuzzyEqual(delta.x, 0.0));
    QVERIFY(fuzzyEqual(delta.y, 0.0));
    QVERIFY(fuzzyEqual(delta.width, 20.0));
    QVERIFY(fuzzyEqual(delta.height, 15.0));
    QVERIFY(fuzzyEqual(analyzer.baseBounds(tiled), BoundingBox(100, 100, 80, 75)));

    QVERIFY(analyzer.patternOverflow(document.elementById("solid"), BoundingBox(0, 0, 60, 60)).isZero());

    // Content in box units is scaled by the filled box: x = -0.1 of 50 is 5 to the left
    Geometry::BoundsDelta scaled = analyzer.patternOverflow(document.elementById("scaledContent"), BoundingBox(0, 0, 50, 20));
    QVERIFY(fuzzyEqual(scaled.x, -5.0));
    QVERIFY(fuzzyEqual(scaled.width, 5.0));
    QVERIFY(fuzzyEqual(scaled.height, 0.0));
}

void TestViewBoxCalculator::testHiddenFromStartOnlyElement() {
    ViewBoxResult result = calculate(svgDocument(
        "<rect x='50' y='50' width='60' height='60'><set attributeName='display' to='none' begin='0s'/></rect>"));
    QVERIFY(!result.valid);
    QVERIFY(!result.contentBounds);
    QCOMPARE(result.elementCount, 0);
}

void TestViewBoxCalculator::testMissingViewBox() {
    DomDocumentAdapter document;
    QVERIFY(document.load("<svg xmlns='http://www.w3.org/2000/svg'><rect width='10' height='10'/></svg>"));

    ViewBoxCalculator calculator;
    ViewBoxResult result = calculator.calculate(document);
    QVERIFY(!result.valid);
    QCOMPARE(result.errorMessage, QString("No viewBox attribute found. Please add a viewBox to your SVG."));

    QVERIFY(document.load(svgDocument("<rect width='10' height='10'/>", "0 0 wide tall")));
    result = calculator.calculate(document);
    QVERIFY(!result.valid);
    QVERIFY(!result.errorMessage.isEmpty());
}

void TestViewBoxCalculator::testStatistics() {
    const QString svg = svgDocument(
        "<filter id='f'><feOffset dx='3' dy='3'/></filter>"
        "<rect width='50' height='50'><animate attributeName='width' values='50;100' dur='1s'/>"
        "<animate attributeName='opacity' values='1;0' dur='1s'/></rect>"
        "<circle cx='150' cy='150' r='10' filter='url(#f)'/>"
        "<rect x='20' y='20' width='10' height='10' style='display: none'/>",
        "0 0 400 400");

    ViewBoxResult result = calculate(svg);
    QVERIFY(result.valid);
    QCOMPARE(result.elementCount, 2);
    QCOMPARE(result.animationCount, 2);
    QCOMPARE(result.effectsCount, 1);
    QCOMPARE(result.originalViewBoxText, QString("0 0 400 400"));
    QVERIFY(result.contentBounds);
    QVERIFY(fuzzyEqual(*result.contentBounds, BoundingBox(0, 0, 163, 163)));
    // (400*400 - 183*183) / (400*400)
    QVERIFY(fuzzyEqual(result.savingsPercent, 79.069375, 1e-4));
    QCOMPARE(result.elements.size(), 2);
}

void TestViewBoxCalculator::testParallelMatchesSerial() {
    QString body;
    for (int i = 0; i < 40; ++i) {
        body += QString("<rect x='%1' y='%2' width='5' height='5'>"
                        "<animateTransform attributeName='transform' type='rotate' from='0 %3 %4' to='360 %3 %4' dur='3s'/>"
                        "</rect>").arg(i * 7).arg(i * 3).arg(i * 7 + 2.5).arg(i * 3 + 2.5);
    }
    const QString svg = svgDocument(body, "0 0 400 200");

    AnalyzerConfig serial;
    AnalyzerConfig parallel;
    parallel.parallel = true;

    ViewBoxResult serialResult = calculate(svg, serial);
    ViewBoxResult parallelResult = calculate(svg, parallel);
    QVERIFY(serialResult.valid);
    QVERIFY(parallelResult.valid);
    QCOMPARE(parallelResult.viewBoxText, serialResult.viewBoxText);
    QCOMPARE(parallelResult.elementCount, 40);
}

void TestViewBoxCalculator::testApplyToDocument() {
    AnalyzerConfig config;
    DomDocumentAdapter document(config);
    QVERIFY(document.load(svgDocument("<rect x='10' y='10' width='20' height='20'/>", "0 0 500 500")));

    ViewBoxCalculator calculator(config);
    ViewBoxResult result = calculator.calculate(document);
    QVERIFY(result.valid);
    QVERIFY(calculator.applyToDocument(document, result));
    QCOMPARE(document.rootElement().attribute("viewBox"), QString("0 0 40 40"));
    QVERIFY(document.toString().contains("viewBox=\"0 0 40 40\""));

    ViewBoxResult invalid;
    QVERIFY(!calculator.applyToDocument(document, invalid));

    AnalyzerConfig changed;
    changed.buffer = 2.5;
    calculator.setConfiguration(changed);
    QCOMPARE(calculator.configuration().buffer, 2.5);
    QCOMPARE(calculator.calculate(document).viewBoxText, QString("7.5 7.5 25 25"));
}

void TestViewBoxCalculator::testFormatViewBox_data() {
    QTest::addColumn<double>("x");
    QTest::addColumn<double>("y");
    QTest::addColumn<double>("width");
    QTest::addColumn<double>("height");
    QTest::addColumn<int>("decimals");
    QTest::addColumn<QString>("expected");

    QTest::newRow("integers") << 40.0 << 40.0 << 180.0 << 80.0 << 2 << "40 40 180 80";
    QTest::newRow("trimmed_fraction") << 1.5 << -2.25 << 10.10 << 3.14159 << 2 << "1.5 -2.25 10.1 3.14";
    QTest::newRow("negative_zero") << -0.0001 << 0.0 << 1.0 << 1.0 << 2 << "0 0 1 1";
    QTest::newRow("more_decimals") << 0.12345 << 0.0 << 1.0 << 1.0 << 4 << "0.1235 0 1 1";
}

void TestViewBoxCalculator::testFormatViewBox() {
    QFETCH(double, x);
    QFETCH(double, y);
    QFETCH(double, width);
    QFETCH(double, height);
    QFETCH(int, decimals);
    QFETCH(QString, expected);

    QCOMPARE(ViewBoxCalculator::formatViewBox(BoundingBox(x, y, width, height), decimals), expected);
}

void TestViewBoxCalculator::testSwitchSelection() {
    const QString svg = svgDocument(
        "<switch id='sw'>"
        "<rect id='ext' requiredExtensions='http://example.org/ext' width='1' height='1'/>"
        "<rect id='feature' requiredFeatures='http://www.w3.org/TR/SVG11/feature#Shape' systemLanguage='de, en' width='1' height='1'/>"
        "<rect id='fallback' width='1' height='1'/>"
        "</switch>");

    DomDocumentAdapter document;
    QVERIFY(document.load(svg));
    Core::ElementAnalyzer analyzer(document, AnalyzerConfig());

    QVERIFY(!analyzer.passesConditionals(document.elementById("ext")));
    QVERIFY(analyzer.passesConditionals(document.elementById("feature")));
    QVERIFY(analyzer.selectSwitchChild(document.elementById("sw")) == document.elementById("feature"));

    AnalyzerConfig french;
    french.systemLanguage = "fr-CA";
    Core::ElementAnalyzer frenchAnalyzer(document, french);
    QVERIFY(frenchAnalyzer.selectSwitchChild(document.elementById("sw")) == document.elementById("fallback"));
}

void TestViewBoxCalculator::testVisibilityRules() {
    const QString svg = svgDocument(
        "<g style='display:none'><rect id='underHidden' width='1' height='1'/></g>"
        "<g visibility='hidden'><rect id='shown' visibility='visible' width='1' height='1'/>"
        "<rect id='inheritsHidden' width='1' height='1'/></g>"
        "<rect id='transparent' opacity='0' width='1' height='1'>"
        "<animate attributeName='opacity' values='0;1' dur='1s'/></rect>"
        "<rect id='gone' width='1' height='1'><set attributeName='visibility' to='hidden'/></rect>"
        "<rect id='flash' width='1' height='1'><set attributeName='display' to='none'/>"
        "<set attributeName='display' to='inline' begin='click'/></rect>"
        "<pattern id='p'><rect id='inPattern' width='1' height='1'/></pattern>");

    DomDocumentAdapter document;
    QVERIFY(document.load(svg));
    AnalyzerConfig config;
    Animation::SmilAnalyzer smil(document, config);
    Core::VisibilityChecker checker(document, smil);

    QVERIFY(!checker.shouldIncludeElement(document.elementById("underHidden")));
    QVERIFY(checker.shouldIncludeElement(document.elementById("shown")));
    QVERIFY(!checker.shouldIncludeElement(document.elementById("inheritsHidden")));
    QVERIFY(!checker.isElementVisible(document.elementById("transparent")));
    QVERIFY(checker.shouldIncludeElement(document.elementById("transparent")));
    QVERIFY(checker.isHiddenFromStart(document.elementById("gone")));
    QVERIFY(!checker.shouldIncludeElement(document.elementById("gone")));
    QVERIFY(!checker.isHiddenFromStart(document.elementById("flash")));
    QVERIFY(checker.isInsideDefinition(document.elementById("inPattern")));
    QVERIFY(!checker.shouldIncludeElement(document.elementById("inPattern")));
}

QTEST_GUILESS_MAIN(TestViewBoxCalculator)
