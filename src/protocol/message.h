#pragma once
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <optional>
#include <variant>

struct RpcError {
    int code = 0;
    QString message;
    QJsonValue data;

    bool operator==(const RpcError&) const = default;
};

struct RpcRequest {
    QJsonValue id;
    QString method;
    QJsonValue params;

    bool operator==(const RpcRequest&) const = default;
};

struct RpcResponse {
    QJsonValue id;
    QJsonValue result;
    std::optional<RpcError> error;

    bool isError() const { return error.has_value(); }
    bool operator==(const RpcResponse&) const = default;
};

struct RpcNotification {
    QString method;
    QJsonValue params;

    bool operator==(const RpcNotification&) const = default;
};

using RpcMessage = std::variant<RpcRequest, RpcResponse, RpcNotification>;

// JSON-RPC 2.0 error codes used on the backend side
enum class RpcErrorCode : int {
    ParseError       = -32700,
    InvalidRequest   = -32600,
    MethodNotFound   = -32601,
    InvalidParams    = -32602,
    InternalError    = -32603,
    RequestCancelled = -32800,
    ContentModified  = -32801
};

QJsonObject messageToJson(const RpcMessage& message);
QString messageMethod(const RpcMessage& message);
