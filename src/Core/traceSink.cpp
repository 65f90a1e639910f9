#include "traceSink.h"

#include <QDebug>

namespace Core {

void NullTraceSink::trace(const QString& stage, const QString& message) {
    Q_UNUSED(stage);
    Q_UNUSED(message);
}

void DebugTraceSink::trace(const QString& stage, const QString& message) {
    qDebug().noquote() << QString("[%1]").arg(stage) << message;
}

} // namespace Core
