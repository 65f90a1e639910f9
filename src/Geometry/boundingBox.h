#ifndef BOUNDINGBOX_H
#define BOUNDINGBOX_H

#include <QRectF>
#include <QDebug>
#include <boost/optional.hpp>

namespace Geometry {

// Axis-aligned extent as produced by the path folding code.
struct PathExtent {
    double minX = 0.0;
    double maxX = 0.0;
    double minY = 0.0;
    double maxY = 0.0;
};

// Per-side growth of a box, relative to the box itself:
// applying it yields {x + dx, y + dy, width + dwidth, height + dheight}.
struct BoundsDelta {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    bool isZero() const { return x == 0.0 && y == 0.0 && width == 0.0 && height == 0.0; }
};

struct BoundingBox {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    BoundingBox() = default;
    BoundingBox(double x_, double y_, double width_, double height_)
        : x(x_), y(y_), width(width_), height(height_) {}

    // Normalizes the corners so that width and height are never negative.
    static BoundingBox fromCorners(double x1, double y1, double x2, double y2);
    static BoundingBox fromExtent(const PathExtent& extent);
    static BoundingBox fromRect(const QRectF& rect);

    double right() const { return x + width; }
    double bottom() const { return y + height; }
    double centerX() const { return x + width / 2.0; }
    double centerY() const { return y + height / 2.0; }

    // Zero width and zero height.
    bool isDegenerate() const { return width == 0.0 && height == 0.0; }

    BoundingBox united(const BoundingBox& other) const;
    BoundingBox expanded(double left, double top, double right, double bottom) const;
    BoundingBox expanded(double amount) const { return expanded(amount, amount, amount, amount); }
    BoundingBox translated(double dx, double dy) const { return BoundingBox(x + dx, y + dy, width, height); }
    BoundingBox withDelta(const BoundsDelta& delta) const;

    QRectF toRect() const { return QRectF(x, y, width, height); }

    bool operator==(const BoundingBox& other) const;
    bool operator!=(const BoundingBox& other) const { return !(*this == other); }
};

// Absent means "no content yet"; this keeps a phantom origin box out of unions.
typedef boost::optional<BoundingBox> OptionalBounds;

OptionalBounds unite(const OptionalBounds& a, const OptionalBounds& b);
OptionalBounds unite(const OptionalBounds& a, const BoundingBox& b);

QDebug operator<<(QDebug debug, const BoundingBox& box);

} // namespace Geometry

#endif // BOUNDINGBOX_H
