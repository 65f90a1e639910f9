#ifndef VALUEPARSING_H
#define VALUEPARSING_H

#include <QString>
#include <QList>

namespace Core {
namespace Parsing {

// Locale independent number conversion (always the C locale, like SVG itself).
double toDouble(const QString& str, bool* ok = nullptr);

// Reads the longest numeric prefix of a value: "12.5px" -> 12.5, "-10%" -> -10.
// Returns 0.0 with ok=false when the text does not start with a number.
double parseLeadingNumber(const QString& str, bool* ok = nullptr);

// Splits on commas and/or whitespace; tokens without a leading number are dropped.
QList<double> parseNumberList(const QString& str);

// "url(#id)" -> "id", empty when the value is not a local url reference.
QString urlReference(const QString& value);

// "#id" -> "id", empty for external references.
QString fragmentId(const QString& href);

// Converts a CSS angle ("45deg", "1rad", "0.5turn", "100grad", "30") to degrees.
double parseAngleDegrees(const QString& str, bool* ok = nullptr);

} // namespace Parsing
} // namespace Core

#endif // VALUEPARSING_H
