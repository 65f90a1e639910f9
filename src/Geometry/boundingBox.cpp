#include "boundingBox.h"

#include <algorithm>

namespace Geometry {

BoundingBox BoundingBox::fromCorners(double x1, double y1, double x2, double y2) {
    double minX = std::min(x1, x2);
    double minY = std::min(y1, y2);
    return BoundingBox(minX, minY, std::max(x1, x2) - minX, std::max(y1, y2) - minY);
}

BoundingBox BoundingBox::fromExtent(const PathExtent& extent) {
    return fromCorners(extent.minX, extent.minY, extent.maxX, extent.maxY);
}

BoundingBox BoundingBox::fromRect(const QRectF& rect) {
    QRectF normalized = rect.normalized();
    return BoundingBox(normalized.x(), normalized.y(), normalized.width(), normalized.height());
}

BoundingBox BoundingBox::united(const BoundingBox& other) const {
    return fromCorners(std::min(x, other.x), std::min(y, other.y),
                       std::max(right(), other.right()), std::max(bottom(), other.bottom()));
}

BoundingBox BoundingBox::expanded(double left, double top, double rightAmount, double bottomAmount) const {
    return fromCorners(x - left, y - top, right() + rightAmount, bottom() + bottomAmount);
}

BoundingBox BoundingBox::withDelta(const BoundsDelta& delta) const {
    return fromCorners(x + delta.x, y + delta.y,
                       x + delta.x + width + delta.width, y + delta.y + height + delta.height);
}

bool BoundingBox::operator==(const BoundingBox& other) const {
    return x == other.x && y == other.y && width == other.width && height == other.height;
}

OptionalBounds unite(const OptionalBounds& a, const OptionalBounds& b) {
    if (!a) return b;
    if (!b) return a;
    return a->united(*b);
}

OptionalBounds unite(const OptionalBounds& a, const BoundingBox& b) {
    return unite(a, OptionalBounds(b));
}

QDebug operator<<(QDebug debug, const BoundingBox& box) {
    QDebugStateSaver saver(debug);
    debug.nospace() << "BoundingBox(" << box.x << ", " << box.y << ", " << box.width << "x" << box.height << ")";
    return debug;
}

} // namespace Geometry
