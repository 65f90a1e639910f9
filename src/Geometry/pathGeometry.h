#ifndef PATHGEOMETRY_H
#define PATHGEOMETRY_H

#include <QList>
#include <QPointF>
#include <QString>
#include <boost/variant.hpp>

#include "boundingBox.h"

namespace Geometry {

namespace Path {

struct MoveTo { double x; double y; bool relative; };
struct LineTo { double x; double y; bool relative; };
struct HLineTo { double x; bool relative; };
struct VLineTo { double y; bool relative; };
struct CubicBezier { double x1; double y1; double x2; double y2; double x; double y; bool relative; };
struct SmoothCubicBezier { double x2; double y2; double x; double y; bool relative; };
struct QuadraticBezier { double x1; double y1; double x; double y; bool relative; };
struct SmoothQuadraticBezier { double x; double y; bool relative; };
struct Arc { double rx; double ry; double rotation; bool largeArc; bool sweep; double x; double y; bool relative; };
struct ClosePath { bool relative; };

} // namespace Path

typedef boost::variant<Path::MoveTo, Path::LineTo, Path::HLineTo, Path::VLineTo,
                       Path::CubicBezier, Path::SmoothCubicBezier,
                       Path::QuadraticBezier, Path::SmoothQuadraticBezier,
                       Path::Arc, Path::ClosePath> PathCommand;

class PathGeometry {
public:
    // Tokenizes SVG path data. Repeated argument groups repeat the command (an extra
    // pair after M/m becomes L/l); incomplete trailing groups are dropped. Never fails:
    // malformed input just yields fewer (or no) commands.
    static QList<PathCommand> parse(const QString& pathData);

    // Bounds of the path including cubic/quadratic extrema. An arc is bounded by the whole
    // rotated ellipse through its endpoints (centre from the endpoint parameterisation, radii
    // scaled up when too small, extent sqrt(rx^2 cos^2 + ry^2 sin^2) per axis), not by the
    // swept part alone; this is wider than centre +/- (|rx|, |ry|) once the ellipse is rotated.
    // Empty input gives {0,0,0,0}.
    static PathExtent bounds(const QString& pathData);
    static PathExtent bounds(const QList<PathCommand>& commands);

    // Bounds of an animateMotion "x,y;x,y;..." list. Pairs with a non-numeric
    // coordinate are ignored.
    static PathExtent motionValuesBounds(const QString& values);

    // Bounds of a polyline/polygon "points" list.
    static PathExtent pointsBounds(const QString& points);

    // End point of every command, used for marker placement.
    static QList<QPointF> vertices(const QString& pathData);

    // Number of numeric arguments taken by a command letter.
    static int argumentCount(QChar command);
};

} // namespace Geometry

#endif // PATHGEOMETRY_H
