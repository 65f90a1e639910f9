#ifndef AFFINETRANSFORM_H
#define AFFINETRANSFORM_H

#include <QPointF>
#include <QTransform>

#include "boundingBox.h"

namespace Geometry {

// 2D affine matrix (a, b, c, d, e, f):
//   x' = a*x + c*y + e
//   y' = b*x + d*y + f
// Backed by QTransform (m11=a, m12=b, m21=c, m22=d, dx=e, dy=f). Values are immutable;
// every operation returns a new transform.
class AffineTransform {
public:
    AffineTransform(); // identity
    AffineTransform(double a, double b, double c, double d, double e, double f);
    explicit AffineTransform(const QTransform& transform);

    static AffineTransform identity();
    static AffineTransform translate(double tx, double ty);
    static AffineTransform scale(double sx, double sy);
    // Rotation about (cx, cy) = translate(cx,cy) * rotate(deg) * translate(-cx,-cy)
    static AffineTransform rotate(double degrees, double cx = 0.0, double cy = 0.0);
    static AffineTransform skewX(double degrees);
    static AffineTransform skewY(double degrees);

    // Result applies `other` first, then this transform. The cumulative matrix of a
    // node is parentCumulative.multiply(nodeLocal).
    AffineTransform multiply(const AffineTransform& other) const;

    QPointF transformPoint(double x, double y) const;
    QPointF transformPoint(const QPointF& point) const { return transformPoint(point.x(), point.y()); }

    // Maps all four corners and returns their axis-aligned bounds.
    BoundingBox transformBounds(const BoundingBox& box) const;

    bool isIdentity() const;

    // Largest length a unit vector can reach through the linear part.
    double maxScaleFactor() const;

    double a() const { return matrix_.m11(); }
    double b() const { return matrix_.m12(); }
    double c() const { return matrix_.m21(); }
    double d() const { return matrix_.m22(); }
    double e() const { return matrix_.dx(); }
    double f() const { return matrix_.dy(); }

    const QTransform& toQTransform() const { return matrix_; }

private:
    QTransform matrix_;
};

QDebug operator<<(QDebug debug, const AffineTransform& transform);

} // namespace Geometry

#endif // AFFINETRANSFORM_H
