#include "valueParsing.h"

#include <QLocale>
#include <QRegularExpression>
#include <QtMath>

namespace Core {
namespace Parsing {

double toDouble(const QString& str, bool* ok) {
    QLocale cLocale(QLocale::C);
    return cLocale.toDouble(str, ok);
}

double parseLeadingNumber(const QString& str, bool* ok) {
    static const QRegularExpression re("^\\s*([+-]?(?:\\d+\\.?\\d*|\\.\\d+)(?:[eE][+-]?\\d+)?)");
    QRegularExpressionMatch match = re.match(str);
    if (!match.hasMatch()) {
        if (ok) *ok = false;
        return 0.0;
    }
    return toDouble(match.captured(1), ok);
}

QList<double> parseNumberList(const QString& str) {
    QList<double> numbers;
    const QStringList tokens = str.split(QRegularExpression("[\\s,]+"), Qt::SkipEmptyParts);
    for (const QString& token : tokens) {
        bool ok = false;
        double value = parseLeadingNumber(token, &ok);
        if (ok) {
            numbers.append(value);
        }
    }
    return numbers;
}

QString urlReference(const QString& value) {
    static const QRegularExpression re("url\\(\\s*['\"]?#([^)'\"]+)['\"]?\\s*\\)");
    QRegularExpressionMatch match = re.match(value);
    return match.hasMatch() ? match.captured(1).trimmed() : QString();
}

QString fragmentId(const QString& href) {
    QString trimmed = href.trimmed();
    if (!trimmed.startsWith('#')) {
        return QString();
    }
    return trimmed.mid(1);
}

double parseAngleDegrees(const QString& str, bool* ok) {
    bool parsed = false;
    double value = parseLeadingNumber(str, &parsed);
    if (ok) *ok = parsed;
    if (!parsed) {
        return 0.0;
    }
    QString unit = str.trimmed().toLower();
    if (unit.endsWith("grad")) {
        return value * 0.9;
    }
    if (unit.endsWith("rad")) {
        return qRadiansToDegrees(value);
    }
    if (unit.endsWith("turn")) {
        return value * 360.0;
    }
    return value;
}

} // namespace Parsing
} // namespace Core
