#pragma once
#include "message.h"
#include "failure.h"
#include <expected>

template<typename T>
using Result = std::expected<T, BridgeFailure>;

using VoidResult = std::expected<void, BridgeFailure>;

// Outgoing side of the backend stream. Implementations write whole frames.
class IMessageWriter {
public:
    virtual ~IMessageWriter() = default;
    virtual VoidResult write(const RpcMessage& message) = 0;
};

// Decides whether a backend notification signals "fully started".
class IReadinessProbe {
public:
    virtual ~IReadinessProbe() = default;
    virtual QString method() const = 0;
    virtual bool isReadySignal(const QString& method, const QJsonValue& params) const = 0;
};
