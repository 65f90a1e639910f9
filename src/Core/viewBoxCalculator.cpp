#include "viewBoxCalculator.h"
#include "domDocumentAdapter.h"
#include "transformParser.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QFuture>
#include <QStringList>
#include <QtConcurrent/QtConcurrent>
#include <functional>

namespace Core {

namespace {

const QString kMissingViewBox = "No viewBox attribute found. Please add a viewBox to your SVG.";
const QString kInvalidViewBox = "The viewBox attribute could not be parsed.";
const QString kNoContent = "No visible content found in the SVG.";

QString formatNumber(double value, int decimals) {
    QString text = QString::number(value, 'f', decimals);
    if (text.contains(QLatin1Char('.'))) {
        while (text.endsWith(QLatin1Char('0'))) {
            text.chop(1);
        }
        if (text.endsWith(QLatin1Char('.'))) {
            text.chop(1);
        }
    }
    if (text == "-0") {
        text = "0";
    }
    return text;
}

} // namespace

ViewBoxCalculator::ViewBoxCalculator(const AnalyzerConfig& config, TraceSink* trace)
    : config_(config), trace_(trace) {
}

QString ViewBoxCalculator::formatViewBox(const Geometry::BoundingBox& box, int decimals) {
    QStringList parts;
    parts << formatNumber(box.x, decimals) << formatNumber(box.y, decimals)
          << formatNumber(box.width, decimals) << formatNumber(box.height, decimals);
    return parts.join(QLatin1Char(' '));
}

void ViewBoxCalculator::collectContent(const ElementAnalyzer& analyzer, const QDomElement& parent,
                                       const Geometry::AffineTransform& transform,
                                       QList<ContentItem>* items) const {
    const DocumentAdapter& adapter = analyzer.adapter();
    QList<QDomElement> children = adapter.childElements(parent);
    if (DocumentAdapter::localName(parent) == "switch") {
        QDomElement chosen = analyzer.selectSwitchChild(parent);
        children.clear();
        if (!chosen.isNull()) {
            children.append(chosen);
        }
    }

    for (const QDomElement& child : children) {
        const QString tag = DocumentAdapter::localName(child);
        if (ElementAnalyzer::isNonRenderingTag(tag) || !analyzer.passesConditionals(child)) {
            continue;
        }

        const Geometry::AffineTransform local =
            Geometry::TransformParser::parse(adapter.attribute(child, "transform").value_or(QString()));

        if (tag == "svg") {
            collectContent(analyzer, child, transform.multiply(local).multiply(analyzer.nestedViewportTransform(child)), items);
            continue;
        }

        if (ElementAnalyzer::isContainerTag(tag)) {
            // A group that moves or carries a filter is analysed as a whole; the children
            // still contribute their own animations under the group's static transform.
            const bool wholeGroup = !analyzer.computeAnimations(child, Geometry::BoundingBox()).isEmpty()
                || analyzer.effects().analyzeElementEffects(child).hasAnyEffects();
            if (wholeGroup && analyzer.visibility().shouldIncludeElement(child)) {
                ContentItem item;
                item.element = child;
                item.ancestorTransform = transform;
                items->append(item);
            }
            collectContent(analyzer, child, transform.multiply(local), items);
            continue;
        }

        if (!analyzer.visibility().shouldIncludeElement(child)) {
            emitTrace(trace_, "walk", QString("%1 excluded as invisible").arg(adapter.attribute(child, "id").value_or(tag)));
            continue;
        }

        ContentItem item;
        item.element = child;
        item.ancestorTransform = transform;
        items->append(item);
    }
}

ViewBoxResult ViewBoxCalculator::calculate(const DocumentAdapter& adapter) const {
    ViewBoxResult result;
    QElapsedTimer timer;
    timer.start();

    QDomElement root = adapter.rootElement();
    boost::optional<QString> viewBoxText;
    if (!root.isNull()) {
        viewBoxText = adapter.attribute(root, "viewBox");
    }
    if (!viewBoxText || viewBoxText->trimmed().isEmpty()) {
        qWarning() << "ViewBoxCalculator:" << kMissingViewBox;
        result.errorMessage = kMissingViewBox;
        return result;
    }
    result.originalViewBoxText = viewBoxText->trimmed();
    if (!Geometry::TransformParser::parseViewBox(result.originalViewBoxText, &result.originalViewBox)) {
        qWarning() << "ViewBoxCalculator: invalid viewBox" << result.originalViewBoxText;
        result.errorMessage = kInvalidViewBox;
        return result;
    }

    ElementAnalyzer analyzer(adapter, config_, trace_);
    QList<ContentItem> items;
    collectContent(analyzer, root, Geometry::AffineTransform::identity(), &items);
    emitTrace(trace_, "walk", QString("%1 content element(s) collected").arg(items.size()));

    QList<ElementBoundsResult> analyzed;
    if (config_.parallel && items.size() > 1) {
        // The document is only read while the workers run.
        std::function<ElementBoundsResult(const ContentItem&)> mapFunction =
            [&analyzer](const ContentItem& item) {
                return analyzer.analyzeElement(item.element, item.ancestorTransform);
            };
        QFuture<ElementBoundsResult> future = QtConcurrent::mapped(items.begin(), items.end(), mapFunction);
        future.waitForFinished();
        analyzed = future.results();
    } else {
        for (const ContentItem& item : items) {
            analyzed.append(analyzer.analyzeElement(item.element, item.ancestorTransform));
        }
    }

    for (const ElementBoundsResult& element : analyzed) {
        if (element.skipped) {
            continue;
        }
        result.contentBounds = Geometry::unite(result.contentBounds, element.effectExpandedBounds);
        result.animationCount += element.animationCount;
        if (element.hasEffects) {
            ++result.effectsCount;
        }
        result.elements.append(element);
    }
    result.elementCount = result.elements.size();

    if (!result.contentBounds) {
        qWarning() << "ViewBoxCalculator:" << kNoContent;
        result.errorMessage = kNoContent;
        return result;
    }

    result.viewBox = result.contentBounds->expanded(config_.buffer);
    result.viewBoxText = formatViewBox(result.viewBox, config_.decimals);

    const double originalArea = result.originalViewBox.width * result.originalViewBox.height;
    if (originalArea > 0.0) {
        result.savingsPercent = (originalArea - result.viewBox.width * result.viewBox.height) / originalArea * 100.0;
    }
    result.valid = true;

    qDebug() << "ViewBoxCalculator:" << result.elementCount << "elements," << result.animationCount
             << "animations," << result.effectsCount << "with effects in" << timer.elapsed() << "ms";
    emitTrace(trace_, "viewBox", QString("%1 -> %2").arg(result.originalViewBoxText, result.viewBoxText));
    return result;
}

bool ViewBoxCalculator::applyToDocument(DomDocumentAdapter& document, const ViewBoxResult& result) const {
    if (!result.valid) {
        qWarning() << "ViewBoxCalculator: refusing to apply an invalid result:" << result.errorMessage;
        return false;
    }
    QDomElement root = document.document().documentElement();
    if (root.isNull()) {
        return false;
    }
    root.setAttribute("viewBox", result.viewBoxText);
    return true;
}

} // namespace Core
