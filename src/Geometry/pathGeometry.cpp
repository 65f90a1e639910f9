#include "pathGeometry.h"
#include "valueParsing.h"

#include <QRegularExpression>
#include <QRegularExpressionMatch>
#include <QtMath>
#include <algorithm>
#include <cmath>

namespace Geometry {

namespace {

const double kEpsilon = 1e-12;

class ExtentAccumulator {
public:
    void add(double x, double y) {
        if (!hasPoints_) {
            extent_.minX = extent_.maxX = x;
            extent_.minY = extent_.maxY = y;
            hasPoints_ = true;
            return;
        }
        extent_.minX = std::min(extent_.minX, x);
        extent_.maxX = std::max(extent_.maxX, x);
        extent_.minY = std::min(extent_.minY, y);
        extent_.maxY = std::max(extent_.maxY, y);
    }
    void add(const QPointF& p) { add(p.x(), p.y()); }

    PathExtent extent() const { return hasPoints_ ? extent_ : PathExtent(); }

private:
    PathExtent extent_;
    bool hasPoints_ = false;
};

double cubicAt(double t, double p0, double p1, double p2, double p3) {
    double mt = 1.0 - t;
    return mt * mt * mt * p0 + 3.0 * mt * mt * t * p1 + 3.0 * mt * t * t * p2 + t * t * t * p3;
}

double quadraticAt(double t, double p0, double p1, double p2) {
    double mt = 1.0 - t;
    return mt * mt * p0 + 2.0 * mt * t * p1 + t * t * p2;
}

// Parameters in (0,1) where the derivative of one cubic coordinate vanishes.
QList<double> cubicExtremaParameters(double p0, double p1, double p2, double p3) {
    QList<double> params;
    double a = 3.0 * (-p0 + 3.0 * p1 - 3.0 * p2 + p3);
    double b = 6.0 * (p0 - 2.0 * p1 + p2);
    double c = 3.0 * (p1 - p0);

    if (std::abs(a) < kEpsilon) {
        // Derivative degenerates to b*t + c.
        if (std::abs(b) > kEpsilon) {
            double t = -c / b;
            if (t > 0.0 && t < 1.0) params.append(t);
        }
        return params;
    }

    double discriminant = b * b - 4.0 * a * c;
    if (discriminant < 0.0) {
        return params;
    }
    double root = std::sqrt(discriminant);
    double t1 = (-b + root) / (2.0 * a);
    double t2 = (-b - root) / (2.0 * a);
    if (t1 > 0.0 && t1 < 1.0) params.append(t1);
    if (t2 > 0.0 && t2 < 1.0) params.append(t2);
    return params;
}

class PathFolder : public boost::static_visitor<void> {
public:
    PathFolder(ExtentAccumulator& extent, QList<QPointF>* vertices)
        : extent_(extent), vertices_(vertices) {}

    void operator()(const Path::MoveTo& cmd) {
        current_ = resolve(cmd.x, cmd.y, cmd.relative);
        start_ = current_;
        addEndpoint(current_);
        resetControls();
    }

    void operator()(const Path::LineTo& cmd) {
        current_ = resolve(cmd.x, cmd.y, cmd.relative);
        addEndpoint(current_);
        resetControls();
    }

    void operator()(const Path::HLineTo& cmd) {
        current_.setX(cmd.relative ? current_.x() + cmd.x : cmd.x);
        addEndpoint(current_);
        resetControls();
    }

    void operator()(const Path::VLineTo& cmd) {
        current_.setY(cmd.relative ? current_.y() + cmd.y : cmd.y);
        addEndpoint(current_);
        resetControls();
    }

    void operator()(const Path::CubicBezier& cmd) {
        QPointF c1 = resolve(cmd.x1, cmd.y1, cmd.relative);
        QPointF c2 = resolve(cmd.x2, cmd.y2, cmd.relative);
        QPointF end = resolve(cmd.x, cmd.y, cmd.relative);
        addCubic(c1, c2, end);
    }

    void operator()(const Path::SmoothCubicBezier& cmd) {
        QPointF c1 = hasCubicControl_ ? reflect(lastCubicControl_) : current_;
        QPointF c2 = resolve(cmd.x2, cmd.y2, cmd.relative);
        QPointF end = resolve(cmd.x, cmd.y, cmd.relative);
        addCubic(c1, c2, end);
    }

    void operator()(const Path::QuadraticBezier& cmd) {
        QPointF control = resolve(cmd.x1, cmd.y1, cmd.relative);
        QPointF end = resolve(cmd.x, cmd.y, cmd.relative);
        addQuadratic(control, end);
    }

    void operator()(const Path::SmoothQuadraticBezier& cmd) {
        QPointF control = hasQuadraticControl_ ? reflect(lastQuadraticControl_) : current_;
        QPointF end = resolve(cmd.x, cmd.y, cmd.relative);
        addQuadratic(control, end);
    }

    void operator()(const Path::Arc& cmd) {
        QPointF end = resolve(cmd.x, cmd.y, cmd.relative);
        addArc(cmd, end);
        current_ = end;
        addEndpoint(end);
        resetControls();
    }

    void operator()(const Path::ClosePath&) {
        current_ = start_;
        addEndpoint(current_);
        resetControls();
    }

private:
    QPointF resolve(double x, double y, bool relative) const {
        return relative ? QPointF(current_.x() + x, current_.y() + y) : QPointF(x, y);
    }

    QPointF reflect(const QPointF& control) const {
        return QPointF(2.0 * current_.x() - control.x(), 2.0 * current_.y() - control.y());
    }

    void resetControls() {
        hasCubicControl_ = false;
        hasQuadraticControl_ = false;
    }

    void addEndpoint(const QPointF& p) {
        extent_.add(p);
        if (vertices_) {
            vertices_->append(p);
        }
    }

    void addCubic(const QPointF& c1, const QPointF& c2, const QPointF& end) {
        const QPointF p0 = current_;
        QList<double> params = cubicExtremaParameters(p0.x(), c1.x(), c2.x(), end.x());
        params.append(cubicExtremaParameters(p0.y(), c1.y(), c2.y(), end.y()));
        for (double t : params) {
            extent_.add(cubicAt(t, p0.x(), c1.x(), c2.x(), end.x()),
                        cubicAt(t, p0.y(), c1.y(), c2.y(), end.y()));
        }
        current_ = end;
        addEndpoint(end);
        hasQuadraticControl_ = false;
        hasCubicControl_ = true;
        lastCubicControl_ = c2;
    }

    void addQuadratic(const QPointF& control, const QPointF& end) {
        const QPointF p0 = current_;
        double denominators[2] = { p0.x() - 2.0 * control.x() + end.x(), p0.y() - 2.0 * control.y() + end.y() };
        double numerators[2] = { p0.x() - control.x(), p0.y() - control.y() };
        for (int axis = 0; axis < 2; ++axis) {
            if (std::abs(denominators[axis]) < kEpsilon) continue;
            double t = numerators[axis] / denominators[axis];
            if (t > 0.0 && t < 1.0) {
                extent_.add(quadraticAt(t, p0.x(), control.x(), end.x()),
                            quadraticAt(t, p0.y(), control.y(), end.y()));
            }
        }
        current_ = end;
        addEndpoint(end);
        hasCubicControl_ = false;
        hasQuadraticControl_ = true;
        lastQuadraticControl_ = control;
    }

    // Adds the bounding box of the whole ellipse the arc lies on. The centre comes from
    // the endpoint parameterization, with out-of-range radii scaled up as SVG requires.
    void addArc(const Path::Arc& cmd, const QPointF& end) {
        const QPointF start = current_;
        if (start == end) {
            return;
        }
        double rx = std::abs(cmd.rx);
        double ry = std::abs(cmd.ry);
        if (rx < kEpsilon || ry < kEpsilon) {
            return; // straight line, endpoint already covers it
        }

        double phi = qDegreesToRadians(cmd.rotation);
        double cosPhi = std::cos(phi);
        double sinPhi = std::sin(phi);
        double dx2 = (start.x() - end.x()) / 2.0;
        double dy2 = (start.y() - end.y()) / 2.0;
        double x1p = cosPhi * dx2 + sinPhi * dy2;
        double y1p = -sinPhi * dx2 + cosPhi * dy2;

        double lambda = (x1p * x1p) / (rx * rx) + (y1p * y1p) / (ry * ry);
        if (lambda > 1.0) {
            double scale = std::sqrt(lambda);
            rx *= scale;
            ry *= scale;
        }

        double numerator = rx * rx * ry * ry - rx * rx * y1p * y1p - ry * ry * x1p * x1p;
        double denominator = rx * rx * y1p * y1p + ry * ry * x1p * x1p;
        double coefficient = 0.0;
        if (denominator > kEpsilon) {
            coefficient = std::sqrt(std::max(0.0, numerator / denominator));
            if (cmd.largeArc == cmd.sweep) {
                coefficient = -coefficient;
            }
        }
        double cxp = coefficient * rx * y1p / ry;
        double cyp = -coefficient * ry * x1p / rx;
        double cx = cosPhi * cxp - sinPhi * cyp + (start.x() + end.x()) / 2.0;
        double cy = sinPhi * cxp + cosPhi * cyp + (start.y() + end.y()) / 2.0;

        double halfWidth = std::sqrt(rx * rx * cosPhi * cosPhi + ry * ry * sinPhi * sinPhi);
        double halfHeight = std::sqrt(rx * rx * sinPhi * sinPhi + ry * ry * cosPhi * cosPhi);
        extent_.add(cx - halfWidth, cy - halfHeight);
        extent_.add(cx + halfWidth, cy + halfHeight);
    }

    ExtentAccumulator& extent_;
    QList<QPointF>* vertices_;
    QPointF current_;
    QPointF start_;
    QPointF lastCubicControl_;
    QPointF lastQuadraticControl_;
    bool hasCubicControl_ = false;
    bool hasQuadraticControl_ = false;
};

PathCommand makeCommand(QChar letter, const QList<double>& a) {
    bool relative = letter.isLower();
    switch (letter.toUpper().toLatin1()) {
    case 'M': return Path::MoveTo{a[0], a[1], relative};
    case 'L': return Path::LineTo{a[0], a[1], relative};
    case 'H': return Path::HLineTo{a[0], relative};
    case 'V': return Path::VLineTo{a[0], relative};
    case 'C': return Path::CubicBezier{a[0], a[1], a[2], a[3], a[4], a[5], relative};
    case 'S': return Path::SmoothCubicBezier{a[0], a[1], a[2], a[3], relative};
    case 'Q': return Path::QuadraticBezier{a[0], a[1], a[2], a[3], relative};
    case 'T': return Path::SmoothQuadraticBezier{a[0], a[1], relative};
    case 'A': return Path::Arc{a[0], a[1], a[2], a[3] != 0.0, a[4] != 0.0, a[5], a[6], relative};
    default: return Path::ClosePath{relative};
    }
}

} // namespace

int PathGeometry::argumentCount(QChar command) {
    switch (command.toUpper().toLatin1()) {
    case 'M': case 'L': case 'T': return 2;
    case 'H': case 'V': return 1;
    case 'C': return 6;
    case 'S': case 'Q': return 4;
    case 'A': return 7;
    default: return 0;
    }
}

QList<PathCommand> PathGeometry::parse(const QString& pathData) {
    QList<PathCommand> commands;
    static const QRegularExpression tokenRe(
        "([MmLlHhVvCcSsQqTtAaZz])|([+-]?(?:\\d+\\.?\\d*|\\.\\d+)(?:[eE][+-]?\\d+)?)");

    QChar letter;
    QList<double> args;

    auto flush = [&commands](QChar command, const QList<double>& numbers) {
        if (command.isNull()) {
            return;
        }
        int count = argumentCount(command);
        if (count == 0) {
            commands.append(makeCommand(command, numbers));
            return;
        }
        QChar repeated = command;
        for (int i = 0; i + count <= numbers.size(); i += count) {
            commands.append(makeCommand(repeated, numbers.mid(i, count)));
            if (repeated == QLatin1Char('M')) repeated = QLatin1Char('L');
            else if (repeated == QLatin1Char('m')) repeated = QLatin1Char('l');
        }
    };

    QRegularExpressionMatchIterator it = tokenRe.globalMatch(pathData);
    while (it.hasNext()) {
        QRegularExpressionMatch match = it.next();
        if (!match.captured(1).isEmpty()) {
            flush(letter, args);
            letter = match.captured(1).at(0);
            args.clear();
        } else {
            args.append(Core::Parsing::toDouble(match.captured(2)));
        }
    }
    flush(letter, args);
    return commands;
}

PathExtent PathGeometry::bounds(const QList<PathCommand>& commands) {
    ExtentAccumulator extent;
    PathFolder folder(extent, nullptr);
    for (const PathCommand& command : commands) {
        boost::apply_visitor(folder, command);
    }
    return extent.extent();
}

PathExtent PathGeometry::bounds(const QString& pathData) {
    return bounds(parse(pathData));
}

PathExtent PathGeometry::motionValuesBounds(const QString& values) {
    ExtentAccumulator extent;
    const QStringList pairs = values.split(';', Qt::SkipEmptyParts);
    for (const QString& pair : pairs) {
        QStringList coords = pair.trimmed().split(QRegularExpression("[,\\s]+"), Qt::SkipEmptyParts);
        if (coords.size() < 2) continue;
        bool okX = false, okY = false;
        double x = Core::Parsing::toDouble(coords[0], &okX);
        double y = Core::Parsing::toDouble(coords[1], &okY);
        if (okX && okY && !std::isnan(x) && !std::isnan(y)) {
            extent.add(x, y);
        }
    }
    return extent.extent();
}

PathExtent PathGeometry::pointsBounds(const QString& points) {
    ExtentAccumulator extent;
    QList<double> numbers = Core::Parsing::parseNumberList(points);
    for (int i = 0; i + 1 < numbers.size(); i += 2) {
        extent.add(numbers[i], numbers[i + 1]);
    }
    return extent.extent();
}

QList<QPointF> PathGeometry::vertices(const QString& pathData) {
    ExtentAccumulator extent;
    QList<QPointF> points;
    PathFolder folder(extent, &points);
    const QList<PathCommand> commands = parse(pathData);
    for (const PathCommand& command : commands) {
        boost::apply_visitor(folder, command);
    }
    return points;
}

} // namespace Geometry
