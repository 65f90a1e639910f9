#include "domDocumentAdapter.h"
#include "pathGeometry.h"
#include "valueParsing.h"

#include <QDebug>
#include <QDomNamedNodeMap>
#include <QRegularExpression>
#include <QRegularExpressionMatch>
#include <algorithm>

using Core::Parsing::parseLeadingNumber;
using Core::Parsing::parseNumberList;

namespace Core {

namespace {

int matchingBrace(const QString& text, int open) {
    int depth = 0;
    for (int i = open; i < text.size(); ++i) {
        if (text.at(i) == QLatin1Char('{')) {
            ++depth;
        } else if (text.at(i) == QLatin1Char('}') && --depth == 0) {
            return i;
        }
    }
    return -1;
}

} // namespace

DomDocumentAdapter::DomDocumentAdapter(const AnalyzerConfig& config) : config_(config) {
}

bool DomDocumentAdapter::load(const QString& svgText, QString* errorMessage) {
    idIndex_.clear();
    hrefIndex_.clear();
    elementsInOrder_.clear();
    styleSheets_.clear();
    rules_.clear();

    QString parseError;
    int errorLine = 0;
    int errorColumn = 0;
    if (!doc_.setContent(svgText, &parseError, &errorLine, &errorColumn)) {
        QString message = QString("Failed to parse SVG content: %1 at line %2 column %3")
                              .arg(parseError).arg(errorLine).arg(errorColumn);
        qWarning().noquote() << message;
        if (errorMessage) *errorMessage = message;
        return false;
    }

    QDomElement root = doc_.documentElement();
    if (localName(root) != "svg") {
        QString message = QString("Root element is not <svg> but <%1>").arg(root.tagName());
        qWarning().noquote() << message;
        if (errorMessage) *errorMessage = message;
        return false;
    }

    indexElement(root);
    for (const QDomElement& element : elementsInOrder_) {
        if (localName(element) == "style") {
            const QString css = element.text();
            styleSheets_.append(css);
            parseStyleSheet(css);
        }
    }
    return true;
}

void DomDocumentAdapter::indexElement(const QDomElement& element) {
    elementsInOrder_.append(element);
    const QString id = element.attribute("id");
    if (!id.isEmpty() && !idIndex_.contains(id)) {
        idIndex_.insert(id, element);
    }
    boost::optional<QString> href = attribute(element, "href");
    if (href) {
        const QString target = Parsing::fragmentId(*href);
        if (!target.isEmpty()) {
            hrefIndex_[target].append(element);
        }
    }
    for (QDomElement child = element.firstChildElement(); !child.isNull(); child = child.nextSiblingElement()) {
        indexElement(child);
    }
}

QHash<QString, QString> DomDocumentAdapter::parseDeclarations(const QString& declarations) {
    static const QRegularExpression importantRe("\\s*!\\s*important\\s*$", QRegularExpression::CaseInsensitiveOption);
    QHash<QString, QString> result;
    const QStringList parts = declarations.split(QLatin1Char(';'), Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        int colon = part.indexOf(QLatin1Char(':'));
        if (colon <= 0) continue;
        QString name = part.left(colon).trimmed().toLower();
        QString value = part.mid(colon + 1).trimmed();
        value.remove(importantRe);
        if (!name.isEmpty()) result.insert(name, value);
    }
    return result;
}

void DomDocumentAdapter::parseStyleSheet(const QString& css) {
    static const QRegularExpression commentRe("/\\*.*?\\*/", QRegularExpression::DotMatchesEverythingOption);
    QString text = css;
    text.remove(commentRe);

    int order = rules_.size();
    int position = 0;
    while (position < text.size()) {
        while (position < text.size() && text.at(position).isSpace()) ++position;
        if (position >= text.size()) break;

        if (text.at(position) == QLatin1Char('@')) {
            // @keyframes, @media, @font-face and @import carry no element rules here
            int brace = text.indexOf(QLatin1Char('{'), position);
            int semicolon = text.indexOf(QLatin1Char(';'), position);
            if (semicolon >= 0 && (brace < 0 || semicolon < brace)) {
                position = semicolon + 1;
                continue;
            }
            int close = brace < 0 ? -1 : matchingBrace(text, brace);
            if (close < 0) break;
            position = close + 1;
            continue;
        }

        int open = text.indexOf(QLatin1Char('{'), position);
        int close = open < 0 ? -1 : text.indexOf(QLatin1Char('}'), open);
        if (close < 0) {
            qWarning() << "Unterminated style rule at offset" << position;
            break;
        }
        const QStringList selectors = text.mid(position, open - position).split(QLatin1Char(','));
        const QHash<QString, QString> declarations = parseDeclarations(text.mid(open + 1, close - open - 1));
        position = close + 1;

        for (const QString& selector : selectors) {
            StyleRule rule;
            if (!parseSelector(selector.trimmed(), &rule)) {
                qDebug() << "Skipping unsupported selector" << selector.trimmed();
                continue;
            }
            rule.order = order++;
            rule.declarations = declarations;
            rules_.append(rule);
        }
    }
}

bool DomDocumentAdapter::parseSelector(const QString& text, StyleRule* rule) {
    static const QRegularExpression compoundRe("^([A-Za-z][\\w-]*|\\*)?((?:[.#][\\w-]+)*)$");
    static const QRegularExpression partRe("([.#])([\\w-]+)");

    const QStringList compounds = text.split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
    if (compounds.isEmpty()) {
        return false;
    }
    for (const QString& compound : compounds) {
        QRegularExpressionMatch match = compoundRe.match(compound);
        if (!match.hasMatch()) {
            return false;
        }
        CompoundSelector selector;
        selector.tag = match.captured(1);
        if (!selector.tag.isEmpty() && selector.tag != "*") {
            rule->specificity += 1;
        }
        QRegularExpressionMatchIterator it = partRe.globalMatch(match.captured(2));
        while (it.hasNext()) {
            QRegularExpressionMatch part = it.next();
            if (part.captured(1) == "#") {
                selector.id = part.captured(2);
                rule->specificity += 100;
            } else {
                selector.classes.append(part.captured(2));
                rule->specificity += 10;
            }
        }
        rule->chain.append(selector);
    }
    return true;
}

bool DomDocumentAdapter::matchesCompound(const QDomElement& element, const CompoundSelector& selector) {
    if (!selector.tag.isEmpty() && selector.tag != "*" && localName(element) != selector.tag) {
        return false;
    }
    if (!selector.id.isEmpty() && element.attribute("id") != selector.id) {
        return false;
    }
    if (!selector.classes.isEmpty()) {
        const QStringList classes = element.attribute("class").split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
        for (const QString& name : selector.classes) {
            if (!classes.contains(name)) return false;
        }
    }
    return true;
}

bool DomDocumentAdapter::matchesRule(const QDomElement& element, const StyleRule& rule) const {
    if (rule.chain.isEmpty() || !matchesCompound(element, rule.chain.last())) {
        return false;
    }
    int index = rule.chain.size() - 2;
    for (QDomElement ancestor = parentElement(element); index >= 0 && !ancestor.isNull();
         ancestor = parentElement(ancestor)) {
        if (matchesCompound(ancestor, rule.chain.at(index))) {
            --index;
        }
    }
    return index < 0;
}

QDomElement DomDocumentAdapter::rootElement() const {
    return doc_.documentElement();
}

boost::optional<QString> DomDocumentAdapter::attribute(const QDomElement& element, const QString& name) const {
    if (element.hasAttribute(name)) {
        return element.attribute(name);
    }
    if (name == "href" && element.hasAttribute("xlink:href")) {
        return element.attribute("xlink:href");
    }
    return boost::none;
}

AttributeMap DomDocumentAdapter::attributes(const QDomElement& element) const {
    AttributeMap result;
    const QDomNamedNodeMap nodes = element.attributes();
    for (int i = 0; i < nodes.count(); ++i) {
        const QDomAttr attr = nodes.item(i).toAttr();
        result.insert(attr.name(), attr.value());
    }
    if (!result.contains("href") && result.contains("xlink:href")) {
        result.insert("href", result.value("xlink:href"));
    }
    return result;
}

QString DomDocumentAdapter::computedStyleProperty(const QDomElement& element, const QString& name) const {
    const QString key = name.toLower();
    const QHash<QString, QString> inlineStyle = parseDeclarations(element.attribute("style"));
    if (inlineStyle.contains(key)) {
        return inlineStyle.value(key);
    }

    const StyleRule* best = nullptr;
    for (const StyleRule& rule : rules_) {
        if (!rule.declarations.contains(key) || !matchesRule(element, rule)) continue;
        // rules_ is in source order, so ">=" lets the later rule win a tie
        if (!best || rule.specificity >= best->specificity) {
            best = &rule;
        }
    }
    if (best) {
        return best->declarations.value(key);
    }
    return element.hasAttribute(name) ? element.attribute(name).trimmed() : QString();
}

QString DomDocumentAdapter::inheritedStyleProperty(const QDomElement& element, const QString& name) const {
    for (QDomElement current = element; !current.isNull(); current = parentElement(current)) {
        QString value = computedStyleProperty(current, name);
        if (!value.isEmpty() && value != "inherit") {
            return value;
        }
    }
    return QString();
}

QDomElement DomDocumentAdapter::parentElement(const QDomElement& element) const {
    return element.parentNode().toElement();
}

QList<QDomElement> DomDocumentAdapter::childElements(const QDomElement& element) const {
    QList<QDomElement> children;
    for (QDomElement child = element.firstChildElement(); !child.isNull(); child = child.nextSiblingElement()) {
        children.append(child);
    }
    return children;
}

QDomElement DomDocumentAdapter::elementById(const QString& id) const {
    return idIndex_.value(id);
}

QList<QDomElement> DomDocumentAdapter::elementsReferencing(const QString& id) const {
    return hrefIndex_.value(id);
}

QList<QDomElement> DomDocumentAdapter::elementsByTagNames(const QStringList& tagNames) const {
    QList<QDomElement> matches;
    for (const QDomElement& element : elementsInOrder_) {
        if (tagNames.contains(localName(element))) {
            matches.append(element);
        }
    }
    return matches;
}

QStringList DomDocumentAdapter::styleSheetTexts() const {
    return styleSheets_;
}

double DomDocumentAdapter::number(const QDomElement& element, const QString& name, double fallback) const {
    if (!element.hasAttribute(name)) {
        return fallback;
    }
    bool ok = false;
    double value = parseLeadingNumber(element.attribute(name), &ok);
    return ok ? value : fallback;
}

Geometry::BoundingBox DomDocumentAdapter::intrinsicBBox(const QDomElement& element) const {
    const QString tag = localName(element);

    if (tag == "rect" || tag == "image" || tag == "foreignObject" || tag == "svg" || tag == "use") {
        return Geometry::BoundingBox(number(element, "x"), number(element, "y"),
                                     std::max(0.0, number(element, "width")),
                                     std::max(0.0, number(element, "height")));
    }
    if (tag == "circle") {
        double r = std::max(0.0, number(element, "r"));
        return Geometry::BoundingBox(number(element, "cx") - r, number(element, "cy") - r, 2.0 * r, 2.0 * r);
    }
    if (tag == "ellipse") {
        // A missing radius takes the other one ("auto")
        double rx = number(element, "rx", -1.0);
        double ry = number(element, "ry", -1.0);
        if (rx < 0.0) rx = std::max(0.0, ry);
        if (ry < 0.0) ry = rx;
        return Geometry::BoundingBox(number(element, "cx") - rx, number(element, "cy") - ry, 2.0 * rx, 2.0 * ry);
    }
    if (tag == "line") {
        return Geometry::BoundingBox::fromCorners(number(element, "x1"), number(element, "y1"),
                                                  number(element, "x2"), number(element, "y2"));
    }
    if (tag == "polyline" || tag == "polygon") {
        return Geometry::BoundingBox::fromExtent(Geometry::PathGeometry::pointsBounds(element.attribute("points")));
    }
    if (tag == "path") {
        return Geometry::BoundingBox::fromExtent(Geometry::PathGeometry::bounds(element.attribute("d")));
    }
    if (tag == "text" || tag == "tspan" || tag == "textPath") {
        return textBBox(element);
    }
    return Geometry::BoundingBox();
}

Geometry::BoundingBox DomDocumentAdapter::textBBox(const QDomElement& element) const {
    bool ok = false;
    const QString fontSizeText = inheritedStyleProperty(element, "font-size");
    double fontSize = parseLeadingNumber(fontSizeText, &ok);
    if (!ok || fontSize <= 0.0) {
        fontSize = config_.defaultFontSize;
    } else if (fontSizeText.endsWith("em")) {
        fontSize *= config_.defaultFontSize;
    }

    const QList<double> xs = parseNumberList(element.attribute("x"));
    const QList<double> ys = parseNumberList(element.attribute("y"));
    double x = xs.value(0, 0.0);
    double y = ys.value(0, 0.0);

    const QString content = element.text().simplified();
    double width = content.size() * fontSize * config_.textAdvanceRatio;

    const QString anchor = inheritedStyleProperty(element, "text-anchor");
    if (anchor == "middle") {
        x -= width / 2.0;
    } else if (anchor == "end") {
        x -= width;
    }
    // y is the baseline; allow a full em above it and a fifth below for descenders
    return Geometry::BoundingBox(x, y - fontSize, width, fontSize * 1.2);
}

} // namespace Core
