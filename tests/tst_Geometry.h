#ifndef TST_GEOMETRY_H
#define TST_GEOMETRY_H

#include <QObject>
#include <QtTest/QtTest>

class TestGeometry : public QObject {
    Q_OBJECT

private slots:
    void testIdentityTransform_data();
    void testIdentityTransform();

    void testMultiplyComposition_data();
    void testMultiplyComposition();

    void testTransformParser_data();
    void testTransformParser();

    void testPathBounds_data();
    void testPathBounds();

    void testQuadraticRisesAboveEndpoints();
    void testArcBounds();
    void testPathVertices();
    void testMotionValuesBounds();

    void testUniteOptional();

    void testViewportTransform_data();
    void testViewportTransform();

    void testParseViewBox_data();
    void testParseViewBox();
};

#endif // TST_GEOMETRY_H
