#ifndef ANALYZERCONFIG_H
#define ANALYZERCONFIG_H

#include <QString>

namespace Core {

struct AnalyzerConfig {
    double buffer = 10.0;             // Padding added on every side of the final union
    double motionRotationPad = 5.0;   // animateMotion fixed-angle pad: |sin|*pad + |cos|*pad
    bool parallel = false;            // Analyze content elements with QtConcurrent
    bool includeMarkers = true;       // Add marker extents to path-like elements
    QString systemLanguage = "en";    // Used by <switch> systemLanguage tests
    double defaultFontSize = 16.0;    // Text bbox when no font-size resolves
    double textAdvanceRatio = 0.6;    // Average glyph advance, as a fraction of font size
    int decimals = 2;                 // Precision of the formatted viewBox
};

} // namespace Core

#endif // ANALYZERCONFIG_H
