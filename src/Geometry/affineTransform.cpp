#include "affineTransform.h"

#include <QtMath>
#include <algorithm>
#include <cmath>

namespace Geometry {

AffineTransform::AffineTransform() : matrix_() {
}

AffineTransform::AffineTransform(double a, double b, double c, double d, double e, double f)
    : matrix_(a, b, c, d, e, f) {
}

AffineTransform::AffineTransform(const QTransform& transform) : matrix_(transform) {
}

AffineTransform AffineTransform::identity() {
    return AffineTransform();
}

AffineTransform AffineTransform::translate(double tx, double ty) {
    return AffineTransform(1.0, 0.0, 0.0, 1.0, tx, ty);
}

AffineTransform AffineTransform::scale(double sx, double sy) {
    return AffineTransform(sx, 0.0, 0.0, sy, 0.0, 0.0);
}

AffineTransform AffineTransform::rotate(double degrees, double cx, double cy) {
    QTransform rotation;
    rotation.rotate(degrees);
    AffineTransform pure(rotation);
    if (cx == 0.0 && cy == 0.0) {
        return pure;
    }
    return translate(cx, cy).multiply(pure).multiply(translate(-cx, -cy));
}

AffineTransform AffineTransform::skewX(double degrees) {
    QTransform shear;
    shear.shear(qTan(qDegreesToRadians(degrees)), 0);
    return AffineTransform(shear);
}

AffineTransform AffineTransform::skewY(double degrees) {
    QTransform shear;
    shear.shear(0, qTan(qDegreesToRadians(degrees)));
    return AffineTransform(shear);
}

AffineTransform AffineTransform::multiply(const AffineTransform& other) const {
    // QTransform composes row vectors: (p * A) * B applies A first.
    return AffineTransform(other.matrix_ * matrix_);
}

QPointF AffineTransform::transformPoint(double x, double y) const {
    return QPointF(a() * x + c() * y + e(), b() * x + d() * y + f());
}

BoundingBox AffineTransform::transformBounds(const BoundingBox& box) const {
    const QPointF corners[4] = {
        transformPoint(box.x, box.y),
        transformPoint(box.right(), box.y),
        transformPoint(box.right(), box.bottom()),
        transformPoint(box.x, box.bottom())
    };

    double minX = corners[0].x();
    double maxX = corners[0].x();
    double minY = corners[0].y();
    double maxY = corners[0].y();
    for (int i = 1; i < 4; ++i) {
        minX = std::min(minX, corners[i].x());
        maxX = std::max(maxX, corners[i].x());
        minY = std::min(minY, corners[i].y());
        maxY = std::max(maxY, corners[i].y());
    }
    return BoundingBox(minX, minY, maxX - minX, maxY - minY);
}

bool AffineTransform::isIdentity() const {
    return matrix_.isIdentity();
}

double AffineTransform::maxScaleFactor() const {
    // Largest singular value of the 2x2 linear part.
    double sumSquares = a() * a() + b() * b() + c() * c() + d() * d();
    double determinant = a() * d() - b() * c();
    double root = std::sqrt(std::max(0.0, sumSquares * sumSquares - 4.0 * determinant * determinant));
    return std::sqrt((sumSquares + root) / 2.0);
}

QDebug operator<<(QDebug debug, const AffineTransform& transform) {
    QDebugStateSaver saver(debug);
    debug.nospace() << "matrix(" << transform.a() << ", " << transform.b() << ", " << transform.c() << ", "
                    << transform.d() << ", " << transform.e() << ", " << transform.f() << ")";
    return debug;
}

} // namespace Geometry
