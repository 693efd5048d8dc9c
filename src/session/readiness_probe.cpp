#include "readiness_probe.h"

namespace {

QJsonValue lookupPath(const QJsonValue& root, const QString& dottedKey) {
    QJsonValue current = root;
    for (const QString& part : dottedKey.split(QLatin1Char('.'))) {
        if (!current.isObject())
            return QJsonValue(QJsonValue::Undefined);
        current = current.toObject().value(part);
    }
    return current;
}

} // namespace

NotificationReadinessProbe::NotificationReadinessProbe(const QString& method, const QJsonObject& match)
    : m_method(method)
    , m_match(match)
{
}

bool NotificationReadinessProbe::isReadySignal(const QString& method, const QJsonValue& params) const {
    if (method != m_method)
        return false;
    for (auto it = m_match.constBegin(); it != m_match.constEnd(); ++it) {
        if (lookupPath(params, it.key()) != it.value())
            return false;
    }
    return true;
}
