#include "cssKeyframeAnalyzer.h"
#include "valueParsing.h"

#include <QDebug>
#include <QRegularExpression>
#include <QRegularExpressionMatch>
#include <algorithm>
#include <cmath>

using Core::Parsing::parseAngleDegrees;
using Core::Parsing::parseLeadingNumber;

namespace Animation {

namespace {

const QStringList kDirections = { "normal", "reverse", "alternate", "alternate-reverse" };

// Index of the '}' closing the '{' at `open`, or -1 when the block is unterminated.
int matchingBrace(const QString& text, int open) {
    int depth = 0;
    for (int i = open; i < text.size(); ++i) {
        if (text.at(i) == QLatin1Char('{')) {
            ++depth;
        } else if (text.at(i) == QLatin1Char('}')) {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return -1;
}

QString stripComments(const QString& css) {
    static const QRegularExpression commentRe("/\\*.*?\\*/", QRegularExpression::DotMatchesEverythingOption);
    QString text = css;
    text.remove(commentRe);
    return text;
}

// Splits a comma separated property value at top level only.
QStringList splitTopLevel(const QString& value) {
    QStringList parts;
    int depth = 0;
    int start = 0;
    for (int i = 0; i < value.size(); ++i) {
        QChar ch = value.at(i);
        if (ch == QLatin1Char('(')) {
            ++depth;
        } else if (ch == QLatin1Char(')')) {
            depth = std::max(0, depth - 1);
        } else if (ch == QLatin1Char(',') && depth == 0) {
            parts.append(value.mid(start, i - start).trimmed());
            start = i + 1;
        }
    }
    parts.append(value.mid(start).trimmed());
    return parts;
}

// Length with an optional % resolved against `reference`; other units are taken as px.
double resolveLength(const QString& token, double reference) {
    bool ok = false;
    double value = parseLeadingNumber(token, &ok);
    if (!ok) {
        return 0.0;
    }
    return token.trimmed().endsWith(QLatin1Char('%')) ? value / 100.0 * reference : value;
}

// Offset of one transform-origin component from the start of `dimension`.
double originOffset(const QString& token, double dimension) {
    if (token == "left" || token == "top") return 0.0;
    if (token == "right" || token == "bottom") return dimension;
    if (token == "center") return dimension / 2.0;
    bool ok = false;
    double value = parseLeadingNumber(token, &ok);
    if (!ok) {
        return dimension / 2.0;
    }
    return token.endsWith(QLatin1Char('%')) ? value / 100.0 * dimension : value;
}

bool near(double a, double b) {
    return std::abs(a - b) < 1.0;
}

} // namespace

CssKeyframeAnalyzer::CssKeyframeAnalyzer(Core::TraceSink* trace) : trace_(trace) {
}

void CssKeyframeAnalyzer::parseStylesheet(const QString& css) {
    const QString text = stripComments(css);
    static const QRegularExpression keyframesRe("@(?:-webkit-|-moz-)?keyframes\\s+([^\\s{]+)\\s*\\{");

    int position = 0;
    while (position < text.size()) {
        QRegularExpressionMatch match = keyframesRe.match(text, position);
        if (!match.hasMatch()) {
            break;
        }
        int open = match.capturedEnd(0) - 1;
        int close = matchingBrace(text, open);
        if (close < 0) {
            qWarning() << "Unterminated @keyframes block" << match.captured(1);
            break;
        }
        QString name = match.captured(1).trimmed();
        name.remove(QLatin1Char('"'));
        name.remove(QLatin1Char('\''));
        parseKeyframesBody(name, text.mid(open + 1, close - open - 1));
        position = close + 1;
    }
}

void CssKeyframeAnalyzer::parseKeyframesBody(const QString& name, const QString& body) {
    QList<CssKeyframe> frames;
    int position = 0;
    while (position < body.size()) {
        int open = body.indexOf(QLatin1Char('{'), position);
        if (open < 0) {
            break;
        }
        int close = matchingBrace(body, open);
        if (close < 0) {
            break;
        }
        const QString selector = body.mid(position, open - position).trimmed();
        const QString declarations = body.mid(open + 1, close - open - 1);
        position = close + 1;

        QString transform = "none";
        const QStringList parts = declarations.split(QLatin1Char(';'));
        for (const QString& declaration : parts) {
            int colon = declaration.indexOf(QLatin1Char(':'));
            if (colon < 0) continue;
            QString property = declaration.left(colon).trimmed().toLower();
            if (property == "transform" || property == "-webkit-transform") {
                transform = declaration.mid(colon + 1).trimmed();
                transform.remove(QRegularExpression("\\s*!important\\s*$"));
            }
        }

        const QStringList keys = selector.split(QLatin1Char(','));
        for (const QString& rawKey : keys) {
            QString key = rawKey.trimmed().toLower();
            CssKeyframe frame;
            frame.transform = transform;
            if (key == "from") {
                frame.percentage = 0.0;
            } else if (key == "to") {
                frame.percentage = 100.0;
            } else {
                bool ok = false;
                frame.percentage = parseLeadingNumber(key, &ok);
                if (!ok) {
                    qWarning() << "Ignoring keyframe selector" << key << "in" << name;
                    continue;
                }
            }
            frames.append(frame);
        }
    }

    std::stable_sort(frames.begin(), frames.end(), [](const CssKeyframe& a, const CssKeyframe& b) {
        return a.percentage < b.percentage;
    });
    keyframes_.insert(name, frames);
    Core::emitTrace(trace_, "css", QString("@keyframes %1: %2 keyframes").arg(name).arg(frames.size()));
}

Geometry::AffineTransform CssKeyframeAnalyzer::parseTransformFunctions(const QString& transform,
                                                                       const Geometry::BoundingBox& referenceBox) {
    Geometry::AffineTransform result;
    if (transform.trimmed().isEmpty() || transform.trimmed() == "none") {
        return result;
    }

    static const QRegularExpression functionRe("([\\w-]+)\\s*\\(([^)]*)\\)");
    QRegularExpressionMatchIterator it = functionRe.globalMatch(transform);
    while (it.hasNext()) {
        QRegularExpressionMatch match = it.next();
        const QString name = match.captured(1).toLower();
        const QStringList args = match.captured(2).split(QRegularExpression("[\\s,]+"), Qt::SkipEmptyParts);
        if (args.isEmpty()) {
            qWarning() << "CSS transform function without arguments:" << name;
            continue;
        }

        auto number = [&args](int index, double fallback) {
            bool ok = false;
            double value = index < args.size() ? parseLeadingNumber(args.at(index), &ok) : fallback;
            return ok ? value : fallback;
        };
        auto angle = [&args](int index) {
            bool ok = false;
            double value = index < args.size() ? parseAngleDegrees(args.at(index), &ok) : 0.0;
            return ok ? value : 0.0;
        };

        if (name == "translate") {
            double tx = resolveLength(args.at(0), referenceBox.width);
            double ty = args.size() > 1 ? resolveLength(args.at(1), referenceBox.height) : 0.0;
            result = result.multiply(Geometry::AffineTransform::translate(tx, ty));
        } else if (name == "translatex") {
            result = result.multiply(Geometry::AffineTransform::translate(resolveLength(args.at(0), referenceBox.width), 0.0));
        } else if (name == "translatey") {
            result = result.multiply(Geometry::AffineTransform::translate(0.0, resolveLength(args.at(0), referenceBox.height)));
        } else if (name == "scale") {
            double sx = number(0, 1.0);
            result = result.multiply(Geometry::AffineTransform::scale(sx, number(1, sx)));
        } else if (name == "scalex") {
            result = result.multiply(Geometry::AffineTransform::scale(number(0, 1.0), 1.0));
        } else if (name == "scaley") {
            result = result.multiply(Geometry::AffineTransform::scale(1.0, number(0, 1.0)));
        } else if (name == "rotate") {
            result = result.multiply(Geometry::AffineTransform::rotate(angle(0)));
        } else if (name == "skew") {
            result = result.multiply(Geometry::AffineTransform::skewX(angle(0)));
            if (args.size() > 1) {
                result = result.multiply(Geometry::AffineTransform::skewY(angle(1)));
            }
        } else if (name == "skewx") {
            result = result.multiply(Geometry::AffineTransform::skewX(angle(0)));
        } else if (name == "skewy") {
            result = result.multiply(Geometry::AffineTransform::skewY(angle(0)));
        } else if (name == "matrix" && args.size() == 6) {
            result = result.multiply(Geometry::AffineTransform(number(0, 1.0), number(1, 0.0), number(2, 0.0),
                                                               number(3, 1.0), number(4, 0.0), number(5, 0.0)));
        } else {
            qWarning() << "Unsupported CSS transform function:" << name << args;
        }
    }
    return result;
}

QPointF CssKeyframeAnalyzer::parseTransformOrigin(const QString& transformOrigin, const Geometry::BoundingBox& bounds) {
    QStringList parts = transformOrigin.simplified().toLower().split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (parts.isEmpty()) {
        return QPointF(bounds.centerX(), bounds.centerY());
    }

    // Computed styles report the origin in absolute px; recognise the values that
    // actually mean a corner or the centre of the box.
    if (parts.size() >= 2 && parts.at(0).endsWith("px") && parts.at(1).endsWith("px")) {
        double xPx = parseLeadingNumber(parts.at(0));
        double yPx = parseLeadingNumber(parts.at(1));
        if (xPx == 0.0 && yPx == 0.0) {
            return QPointF(bounds.x, bounds.y);
        }
        if ((near(xPx, bounds.centerX()) && near(yPx, bounds.centerY()))
            || (near(xPx, bounds.right()) && near(yPx, bounds.bottom()))
            || (near(xPx, bounds.right() + bounds.width / 2.0) && near(yPx, bounds.bottom() + bounds.height / 2.0))) {
            return QPointF(bounds.centerX(), bounds.centerY());
        }
        return QPointF(xPx, yPx);
    }

    if (parts.size() == 1) {
        // A single vertical keyword keeps x centred
        if (parts.at(0) == "top" || parts.at(0) == "bottom") {
            parts.prepend("center");
        } else {
            parts.append("center");
        }
    }
    if (parts.at(0) == "top" || parts.at(0) == "bottom" || parts.at(1) == "left" || parts.at(1) == "right") {
        parts.swapItemsAt(0, 1);
    }
    return QPointF(bounds.x + originOffset(parts.at(0), bounds.width),
                   bounds.y + originOffset(parts.at(1), bounds.height));
}

QList<QPointF> CssKeyframeAnalyzer::transformedCorners(const Geometry::BoundingBox& bounds,
                                                       const Geometry::AffineTransform& transform,
                                                       const QPointF& origin) {
    Geometry::AffineTransform pivoted = Geometry::AffineTransform::translate(origin.x(), origin.y())
                                            .multiply(transform)
                                            .multiply(Geometry::AffineTransform::translate(-origin.x(), -origin.y()));
    QList<QPointF> corners;
    corners << pivoted.transformPoint(QPointF(bounds.x, bounds.y))
            << pivoted.transformPoint(QPointF(bounds.right(), bounds.y))
            << pivoted.transformPoint(QPointF(bounds.right(), bounds.bottom()))
            << pivoted.transformPoint(QPointF(bounds.x, bounds.bottom()));
    return corners;
}

QList<CssKeyframe> CssKeyframeAnalyzer::orderByDirection(const QList<CssKeyframe>& keyframes, const QString& direction) {
    QList<CssKeyframe> reversed(keyframes);
    std::reverse(reversed.begin(), reversed.end());
    if (direction == "reverse") {
        return reversed;
    }
    if (direction == "alternate" || direction == "alternate-reverse") {
        return keyframes + reversed;
    }
    return keyframes;
}

Geometry::BoundsDelta CssKeyframeAnalyzer::expansionFor(const QString& name, const QString& direction,
                                                        const QString& transformOrigin,
                                                        const Geometry::BoundingBox& baseBounds) const {
    double minX = baseBounds.x;
    double minY = baseBounds.y;
    double maxX = baseBounds.right();
    double maxY = baseBounds.bottom();

    const QPointF origin = parseTransformOrigin(transformOrigin, baseBounds);
    const QList<CssKeyframe> frames = orderByDirection(keyframes_.value(name), direction);
    for (const CssKeyframe& frame : frames) {
        if (frame.transform.isEmpty() || frame.transform == "none") {
            continue;
        }
        Geometry::AffineTransform transform = parseTransformFunctions(frame.transform, baseBounds);
        const QList<QPointF> corners = transformedCorners(baseBounds, transform, origin);
        for (const QPointF& corner : corners) {
            minX = std::min(minX, corner.x());
            minY = std::min(minY, corner.y());
            maxX = std::max(maxX, corner.x());
            maxY = std::max(maxY, corner.y());
        }
    }

    double left = minX - baseBounds.x;
    double top = minY - baseBounds.y;
    double right = maxX - baseBounds.right();
    double bottom = maxY - baseBounds.bottom();

    Geometry::BoundsDelta delta;
    delta.x = left;
    delta.y = top;
    delta.width = right - left;
    delta.height = bottom - top;
    return delta;
}

QStringList CssKeyframeAnalyzer::animationNames(const QDomElement& element, const Core::DocumentAdapter& adapter) const {
    QStringList names;
    QString property = adapter.computedStyleProperty(element, "animation-name").trimmed();
    if (!property.isEmpty()) {
        const QStringList parts = splitTopLevel(property);
        for (const QString& part : parts) {
            if (!part.isEmpty() && part != "none") names.append(part);
        }
        return names;
    }

    // Shorthand: the name is whichever token matches a known @keyframes block.
    const QStringList animations = splitTopLevel(adapter.computedStyleProperty(element, "animation"));
    for (const QString& animation : animations) {
        const QStringList tokens = animation.split(QLatin1Char(' '), Qt::SkipEmptyParts);
        for (const QString& token : tokens) {
            if (keyframes_.contains(token)) {
                names.append(token);
                break;
            }
        }
    }
    return names;
}

QString CssKeyframeAnalyzer::animationDirection(const QDomElement& element, const Core::DocumentAdapter& adapter) const {
    QString direction = adapter.computedStyleProperty(element, "animation-direction").trimmed();
    if (!direction.isEmpty()) {
        return splitTopLevel(direction).first();
    }
    const QStringList tokens = adapter.computedStyleProperty(element, "animation").split(QRegularExpression("[\\s,]+"),
                                                                                          Qt::SkipEmptyParts);
    for (const QString& token : tokens) {
        if (kDirections.contains(token)) return token;
    }
    return "normal";
}

QList<CssAnimation> CssKeyframeAnalyzer::analyzeElement(const QDomElement& element, const Core::DocumentAdapter& adapter,
                                                        const Geometry::BoundingBox& baseBounds) const {
    QList<CssAnimation> animations;
    if (keyframes_.isEmpty()) {
        return animations;
    }

    const QStringList names = animationNames(element, adapter);
    if (names.isEmpty()) {
        return animations;
    }

    QString origin = adapter.computedStyleProperty(element, "transform-origin").trimmed();
    if (origin.isEmpty()) {
        origin = "50% 50%";
    }
    const QString direction = animationDirection(element, adapter);

    for (const QString& name : names) {
        if (!keyframes_.contains(name)) {
            Core::emitTrace(trace_, "css", QString("animation-name '%1' has no @keyframes").arg(name));
            continue;
        }
        CssAnimation animation;
        animation.name = name;
        animation.keyframeCount = keyframes_.value(name).size();
        animation.expansion = expansionFor(name, direction, origin, baseBounds);
        Core::emitTrace(trace_, "css", QString("%1 (%2): delta %3 %4 %5 %6")
                                           .arg(name, direction)
                                           .arg(animation.expansion.x).arg(animation.expansion.y)
                                           .arg(animation.expansion.width).arg(animation.expansion.height));
        animations.append(animation);
    }
    return animations;
}

} // namespace Animation
