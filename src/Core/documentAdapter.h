#ifndef DOCUMENTADAPTER_H
#define DOCUMENTADAPTER_H

#include <QDomElement>
#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>
#include <boost/optional.hpp>

#include "boundingBox.h"

namespace Core {

typedef QHash<QString, QString> AttributeMap;

// Read-only view over a parsed SVG tree. The analyzers only ever reach the document
// through this interface.
class DocumentAdapter {
public:
    virtual ~DocumentAdapter() = default;

    virtual QDomElement rootElement() const = 0;

    // "href" also answers for "xlink:href".
    virtual boost::optional<QString> attribute(const QDomElement& element, const QString& name) const = 0;
    virtual AttributeMap attributes(const QDomElement& element) const = 0;

    // Cascaded value of a style property: inline style, then stylesheet rules, then the
    // presentation attribute. Empty when nothing sets it. Not inherited.
    virtual QString computedStyleProperty(const QDomElement& element, const QString& name) const = 0;

    virtual QDomElement parentElement(const QDomElement& element) const = 0;
    virtual QList<QDomElement> childElements(const QDomElement& element) const = 0;
    virtual QDomElement elementById(const QString& id) const = 0;
    virtual QList<QDomElement> elementsByTagNames(const QStringList& tagNames) const = 0;
    // Elements whose href names #id, in document order.
    virtual QList<QDomElement> elementsReferencing(const QString& id) const = 0;

    // Raw text of every <style> element, in document order.
    virtual QStringList styleSheetTexts() const = 0;

    // Untransformed geometry of a single primitive in its own user space.
    virtual Geometry::BoundingBox intrinsicBBox(const QDomElement& element) const = 0;

    // Tag name without namespace prefix ("svg:rect" -> "rect").
    static QString localName(const QDomElement& element) {
        QString tag = element.tagName();
        int colon = tag.indexOf(':');
        return colon >= 0 ? tag.mid(colon + 1) : tag;
    }
};

} // namespace Core

#endif // DOCUMENTADAPTER_H
