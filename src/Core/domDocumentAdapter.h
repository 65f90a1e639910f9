#ifndef DOMDOCUMENTADAPTER_H
#define DOMDOCUMENTADAPTER_H

#include <QDomDocument>
#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>

#include "analyzerConfig.h"
#include "documentAdapter.h"

namespace Core {

// DocumentAdapter over a QDomDocument, with a small CSS cascade for <style> sheets.
class DomDocumentAdapter : public DocumentAdapter {
public:
    explicit DomDocumentAdapter(const AnalyzerConfig& config = AnalyzerConfig());

    // Parses the SVG text and indexes ids and style rules. Fails on malformed XML or
    // when the root element is not <svg>; the reason goes to errorMessage.
    bool load(const QString& svgText, QString* errorMessage = nullptr);

    QDomDocument& document() { return doc_; }
    const QDomDocument& document() const { return doc_; }
    QString toString(int indent = 2) const { return doc_.toString(indent); }

    QDomElement rootElement() const override;
    boost::optional<QString> attribute(const QDomElement& element, const QString& name) const override;
    AttributeMap attributes(const QDomElement& element) const override;
    QString computedStyleProperty(const QDomElement& element, const QString& name) const override;
    QDomElement parentElement(const QDomElement& element) const override;
    QList<QDomElement> childElements(const QDomElement& element) const override;
    QDomElement elementById(const QString& id) const override;
    QList<QDomElement> elementsByTagNames(const QStringList& tagNames) const override;
    QList<QDomElement> elementsReferencing(const QString& id) const override;
    QStringList styleSheetTexts() const override;
    Geometry::BoundingBox intrinsicBBox(const QDomElement& element) const override;

    // Walks up the ancestors until some element sets the property.
    QString inheritedStyleProperty(const QDomElement& element, const QString& name) const;

    // "a: b; c: d" -> {a: b, c: d}; property names are lower-cased and !important dropped.
    static QHash<QString, QString> parseDeclarations(const QString& declarations);

private:
    struct CompoundSelector {
        QString tag;            // empty or "*" matches any element
        QString id;
        QStringList classes;
    };

    struct StyleRule {
        QList<CompoundSelector> chain;  // descendant combinators; the last entry is the subject
        int specificity = 0;
        int order = 0;
        QHash<QString, QString> declarations;
    };

    void indexElement(const QDomElement& element);
    void parseStyleSheet(const QString& css);
    static bool parseSelector(const QString& text, StyleRule* rule);
    static bool matchesCompound(const QDomElement& element, const CompoundSelector& selector);
    bool matchesRule(const QDomElement& element, const StyleRule& rule) const;
    Geometry::BoundingBox textBBox(const QDomElement& element) const;
    double number(const QDomElement& element, const QString& name, double fallback = 0.0) const;

    AnalyzerConfig config_;
    QDomDocument doc_;
    QHash<QString, QDomElement> idIndex_;
    QHash<QString, QList<QDomElement>> hrefIndex_;
    QList<QDomElement> elementsInOrder_;
    QStringList styleSheets_;
    QList<StyleRule> rules_;
};

} // namespace Core

#endif // DOMDOCUMENTADAPTER_H
