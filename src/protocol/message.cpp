#include "message.h"

namespace {

struct ToJsonVisitor {
    QJsonObject operator()(const RpcRequest& req) const {
        QJsonObject obj;
        obj["jsonrpc"] = QStringLiteral("2.0");
        obj["id"] = req.id;
        obj["method"] = req.method;
        if (!req.params.isUndefined())
            obj["params"] = req.params;
        return obj;
    }

    QJsonObject operator()(const RpcResponse& resp) const {
        QJsonObject obj;
        obj["jsonrpc"] = QStringLiteral("2.0");
        obj["id"] = resp.id.isUndefined() ? QJsonValue(QJsonValue::Null) : resp.id;
        if (resp.error) {
            QJsonObject err;
            err["code"] = resp.error->code;
            err["message"] = resp.error->message;
            if (!resp.error->data.isUndefined())
                err["data"] = resp.error->data;
            obj["error"] = err;
        } else {
            obj["result"] = resp.result.isUndefined() ? QJsonValue(QJsonValue::Null) : resp.result;
        }
        return obj;
    }

    QJsonObject operator()(const RpcNotification& note) const {
        QJsonObject obj;
        obj["jsonrpc"] = QStringLiteral("2.0");
        obj["method"] = note.method;
        if (!note.params.isUndefined())
            obj["params"] = note.params;
        return obj;
    }
};

}

QJsonObject messageToJson(const RpcMessage& message) {
    return std::visit(ToJsonVisitor{}, message);
}

QString messageMethod(const RpcMessage& message) {
    if (const auto* req = std::get_if<RpcRequest>(&message))
        return req->method;
    if (const auto* note = std::get_if<RpcNotification>(&message))
        return note->method;
    return {};
}
