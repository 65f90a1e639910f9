#ifndef VIEWBOXCALCULATOR_H
#define VIEWBOXCALCULATOR_H

#include <QDomElement>
#include <QList>
#include <QString>

#include "affineTransform.h"
#include "analyzerConfig.h"
#include "boundingBox.h"
#include "documentAdapter.h"
#include "elementAnalyzer.h"
#include "traceSink.h"

namespace Core {

class DomDocumentAdapter;

// A content element together with the transform of everything above it.
struct ContentItem {
    QDomElement element;
    Geometry::AffineTransform ancestorTransform;
};

struct ViewBoxResult {
    bool valid = false;
    QString errorMessage;

    Geometry::BoundingBox originalViewBox;
    QString originalViewBoxText;

    Geometry::OptionalBounds contentBounds;     // union of all element bounds, unpadded
    Geometry::BoundingBox viewBox;              // contentBounds grown by the buffer
    QString viewBoxText;

    int elementCount = 0;
    int animationCount = 0;
    int effectsCount = 0;
    double savingsPercent = 0.0;                // area saved relative to the original viewBox

    QList<ElementBoundsResult> elements;
};

class ViewBoxCalculator {
public:
    explicit ViewBoxCalculator(const AnalyzerConfig& config = AnalyzerConfig(), TraceSink* trace = nullptr);

    void setConfiguration(const AnalyzerConfig& config) { config_ = config; }
    const AnalyzerConfig& configuration() const { return config_; }

    ViewBoxResult calculate(const DocumentAdapter& adapter) const;

    // Writes result.viewBoxText into the root element. False when the result is not valid.
    bool applyToDocument(DomDocumentAdapter& document, const ViewBoxResult& result) const;

    // "minX minY width height" with at most `decimals` fraction digits and no trailing zeros.
    static QString formatViewBox(const Geometry::BoundingBox& box, int decimals = 2);

private:
    void collectContent(const ElementAnalyzer& analyzer, const QDomElement& parent,
                        const Geometry::AffineTransform& transform, QList<ContentItem>* items) const;

    AnalyzerConfig config_;
    TraceSink* trace_;
};

} // namespace Core

#endif // VIEWBOXCALCULATOR_H
