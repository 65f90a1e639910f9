#ifndef TRACESINK_H
#define TRACESINK_H

#include <QString>

namespace Core {

// Receives per-stage diagnostic messages. Analyzers take a non-owning pointer;
// nullptr means tracing is disabled.
class TraceSink {
public:
    virtual ~TraceSink() = default;
    virtual void trace(const QString& stage, const QString& message) = 0;
};

class NullTraceSink : public TraceSink {
public:
    void trace(const QString& stage, const QString& message) override;
};

// Forwards every message to qDebug().
class DebugTraceSink : public TraceSink {
public:
    void trace(const QString& stage, const QString& message) override;
};

inline void emitTrace(TraceSink* sink, const QString& stage, const QString& message) {
    if (sink) {
        sink->trace(stage, message);
    }
}

} // namespace Core

#endif // TRACESINK_H
