#ifndef TST_VIEWBOXCALCULATOR_H
#define TST_VIEWBOXCALCULATOR_H

#include <QObject>
#include <QtTest/QtTest>

class TestViewBoxCalculator : public QObject {
    Q_OBJECT

private slots:
    void testDocumentLoading();
    void testStyleCascade();
    void testIntrinsicBounds();

    void testViewBox_data();
    void testViewBox();

    void testElementStages();
    void testPatternOverflow();

    void testHiddenFromStartOnlyElement();
    void testMissingViewBox();
    void testStatistics();
    void testParallelMatchesSerial();
    void testApplyToDocument();

    void testFormatViewBox_data();
    void testFormatViewBox();

    void testSwitchSelection();
    void testVisibilityRules();
};

#endif // TST_VIEWBOXCALCULATOR_H
