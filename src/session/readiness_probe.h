#pragma once
#include "protocol/ports.h"
#include <QJsonObject>

// Readiness is a notification of a configured method whose params contain
// every key/value of the match object. Keys may be dotted paths
// ("status.health"). An empty match accepts any notification of the method.
//
// rust-analyzer: experimental/serverStatus with {"quiescent": true}.
class NotificationReadinessProbe : public IReadinessProbe {
public:
    NotificationReadinessProbe(const QString& method, const QJsonObject& match);

    QString method() const override { return m_method; }
    bool isReadySignal(const QString& method, const QJsonValue& params) const override;

    const QJsonObject& match() const { return m_match; }

private:
    QString m_method;
    QJsonObject m_match;
};

// No readiness notification: the handshake response alone makes the session Ready.
class HandshakeOnlyProbe : public IReadinessProbe {
public:
    QString method() const override { return {}; }
    bool isReadySignal(const QString&, const QJsonValue&) const override { return false; }
};
