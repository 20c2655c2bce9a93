#include "core/ipc/message.h"
#include "core/shared/logging.h"

#include <QJsonDocument>
#include <QtEndian>

namespace hr {

namespace {

QJsonObject envelope(const char* type, uint64_t id)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QLatin1String(type);
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    return json;
}

void setErrorText(QString* errorOut, const QString& text)
{
    if (errorOut) {
        *errorOut = text;
    }
}

} // namespace

QJsonObject IpcMessage::makeRequest(uint64_t id, const QString& method, const QJsonObject& params)
{
    QJsonObject json = envelope("request", id);
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

QJsonObject IpcMessage::makeResponse(uint64_t id, const QJsonObject& result)
{
    QJsonObject json = envelope("response", id);
    json[QStringLiteral("result")] = result;
    return json;
}

QJsonObject IpcMessage::makeError(uint64_t id, IpcErrorCode code, const QString& message)
{
    QJsonObject detail;
    detail[QStringLiteral("code")] = static_cast<int>(code);
    detail[QStringLiteral("codeString")] = ipcErrorCodeToString(code);
    detail[QStringLiteral("message")] = message;

    QJsonObject json = envelope("error", id);
    json[QStringLiteral("error")] = detail;
    return json;
}

QJsonObject IpcMessage::makeError(uint64_t id, const Error& error)
{
    return makeError(id, ipcErrorCodeFor(error.code), describeError(error));
}

uint64_t IpcMessage::requestId(const QJsonObject& message)
{
    const qint64 id = message.value(QStringLiteral("id")).toInteger(0);
    return id > 0 ? static_cast<uint64_t>(id) : 0;
}

std::optional<IpcRequest> IpcRequest::fromJson(const QJsonObject& json, QString* errorOut)
{
    if (json.value(QStringLiteral("type")).toString() != QLatin1String("request")) {
        setErrorText(errorOut, QStringLiteral("envelope type must be 'request'"));
        return std::nullopt;
    }

    IpcRequest request;
    request.id = IpcMessage::requestId(json);
    request.method = json.value(QStringLiteral("method")).toString().trimmed();
    if (request.method.isEmpty()) {
        setErrorText(errorOut, QStringLiteral("request has no method"));
        return std::nullopt;
    }

    const QJsonValue params = json.value(QStringLiteral("params"));
    if (!params.isUndefined() && !params.isNull() && !params.isObject()) {
        setErrorText(errorOut, QStringLiteral("params must be an object"));
        return std::nullopt;
    }
    request.params = params.toObject();
    return request;
}

QByteArray FrameCodec::encode(const QJsonObject& json)
{
    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);
    if (payload.size() > kMaxFrameSize) {
        LOG_WARN(hrIpc, "Refusing to frame %d byte payload (limit %d)",
                 static_cast<int>(payload.size()), kMaxFrameSize);
        return {};
    }

    QByteArray frame(kHeaderSize, Qt::Uninitialized);
    qToBigEndian(static_cast<quint32>(payload.size()), frame.data());
    frame.append(payload);
    return frame;
}

FrameCodec::Result FrameCodec::next(QJsonObject* out, QString* errorOut)
{
    if (m_buffer.size() < kHeaderSize) {
        return Result::NeedMore;
    }

    const quint32 length = qFromBigEndian<quint32>(m_buffer.constData());
    if (length > static_cast<quint32>(kMaxFrameSize)) {
        setErrorText(errorOut, QStringLiteral("frame length %1 exceeds limit").arg(length));
        return Result::BadLength;
    }
    const int frameSize = kHeaderSize + static_cast<int>(length);
    if (m_buffer.size() < frameSize) {
        return Result::NeedMore;
    }

    const QByteArray payload = m_buffer.mid(kHeaderSize, static_cast<int>(length));
    m_buffer.remove(0, frameSize);

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setErrorText(errorOut, parseError.errorString());
        return Result::BadPayload;
    }
    if (!doc.isObject()) {
        setErrorText(errorOut, QStringLiteral("payload is not a JSON object"));
        return Result::BadPayload;
    }

    if (out) {
        *out = doc.object();
    }
    return Result::Frame;
}

} // namespace hr
