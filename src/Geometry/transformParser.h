#ifndef TRANSFORMPARSER_H
#define TRANSFORMPARSER_H

#include <QString>

#include "affineTransform.h"
#include "boundingBox.h"

namespace Geometry {

class TransformParser {
public:
    // Parses an SVG transform list ("translate(10,20) rotate(45 5 5) ...").
    // Unknown or malformed functions are skipped with a warning.
    static AffineTransform parse(const QString& transformString);

    // Maps a viewBox onto a viewport of the given size (origin at 0,0) honouring
    // preserveAspectRatio ("none", "xMidYMid meet", "xMinYMax slice", ...).
    static AffineTransform viewportTransform(const BoundingBox& viewBox, double viewportWidth,
                                             double viewportHeight, const QString& preserveAspectRatio);

    // Parses "minX minY width height"; returns false for anything else.
    static bool parseViewBox(const QString& viewBoxString, BoundingBox* viewBox);
};

} // namespace Geometry

#endif // TRANSFORMPARSER_H
