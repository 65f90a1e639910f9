#include "transformParser.h"
#include "valueParsing.h"

#include <QRegularExpression>
#include <QRegularExpressionMatch>
#include <QStringList>
#include <QDebug>
#include <algorithm>

using Core::Parsing::toDouble;

namespace Geometry {

AffineTransform TransformParser::parse(const QString& transformString) {
    AffineTransform transform;
    if (transformString.trimmed().isEmpty()) {
        return transform;
    }

    QRegularExpression re("(\\w+)\\s*\\(([^)]*)\\)");
    QRegularExpressionMatchIterator it = re.globalMatch(transformString);

    while (it.hasNext()) {
        QRegularExpressionMatch match = it.next();
        QString type = match.captured(1).toLower();
        QList<double> params = Core::Parsing::parseNumberList(match.captured(2));

        if (type == "matrix" && params.size() == 6) {
            transform = transform.multiply(AffineTransform(params[0], params[1], params[2],
                                                           params[3], params[4], params[5]));
        } else if (type == "translate" && !params.isEmpty()) {
            double ty = (params.size() > 1) ? params[1] : 0.0;
            transform = transform.multiply(AffineTransform::translate(params[0], ty));
        } else if (type == "scale" && !params.isEmpty()) {
            double sy = (params.size() > 1) ? params[1] : params[0]; // sy defaults to sx
            transform = transform.multiply(AffineTransform::scale(params[0], sy));
        } else if (type == "rotate" && !params.isEmpty()) {
            double cx = (params.size() > 2) ? params[1] : 0.0;
            double cy = (params.size() > 2) ? params[2] : 0.0;
            transform = transform.multiply(AffineTransform::rotate(params[0], cx, cy));
        } else if (type == "skewx" && params.size() == 1) {
            transform = transform.multiply(AffineTransform::skewX(params[0]));
        } else if (type == "skewy" && params.size() == 1) {
            transform = transform.multiply(AffineTransform::skewY(params[0]));
        } else {
            qWarning() << "Unsupported or malformed transform function:" << type << params;
        }
    }
    return transform;
}

AffineTransform TransformParser::viewportTransform(const BoundingBox& viewBox, double viewportWidth,
                                                   double viewportHeight, const QString& preserveAspectRatio) {
    if (viewBox.width <= 0.0 || viewBox.height <= 0.0 || viewportWidth <= 0.0 || viewportHeight <= 0.0) {
        return AffineTransform();
    }

    double sx = viewportWidth / viewBox.width;
    double sy = viewportHeight / viewBox.height;

    QStringList parts = preserveAspectRatio.simplified().split(' ', Qt::SkipEmptyParts);
    if (!parts.isEmpty() && parts.first() == "defer") {
        parts.removeFirst();
    }
    QString align = parts.isEmpty() ? QString("xMidYMid") : parts.at(0);
    bool slice = parts.size() > 1 && parts.at(1) == "slice";

    if (align == "none") {
        return AffineTransform(sx, 0.0, 0.0, sy, -viewBox.x * sx, -viewBox.y * sy);
    }

    double scale = slice ? std::max(sx, sy) : std::min(sx, sy);
    double tx = -viewBox.x * scale;
    double ty = -viewBox.y * scale;
    double extraWidth = viewportWidth - viewBox.width * scale;
    double extraHeight = viewportHeight - viewBox.height * scale;

    if (align.contains("xMid")) {
        tx += extraWidth / 2.0;
    } else if (align.contains("xMax")) {
        tx += extraWidth;
    }
    if (align.contains("YMid")) {
        ty += extraHeight / 2.0;
    } else if (align.contains("YMax")) {
        ty += extraHeight;
    }
    return AffineTransform(scale, 0.0, 0.0, scale, tx, ty);
}

bool TransformParser::parseViewBox(const QString& viewBoxString, BoundingBox* viewBox) {
    QStringList values = viewBoxString.split(QRegularExpression("[\\s,]+"), Qt::SkipEmptyParts);
    if (values.size() != 4) {
        return false;
    }
    bool okX = false, okY = false, okW = false, okH = false;
    double x = toDouble(values[0], &okX);
    double y = toDouble(values[1], &okY);
    double w = toDouble(values[2], &okW);
    double h = toDouble(values[3], &okH);
    if (!okX || !okY || !okW || !okH || w < 0.0 || h < 0.0) {
        return false;
    }
    if (viewBox) {
        *viewBox = BoundingBox(x, y, w, h);
    }
    return true;
}

} // namespace Geometry
