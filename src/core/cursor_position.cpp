#include "core/cursor_position.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <cmath>
#include <limits>
#include <optional>

namespace caretsync {

namespace {

constexpr const char* kFileKey = "file";
constexpr const char* kLineKey = "line";
constexpr const char* kCharacterKey = "character";
constexpr const char* kSourceKey = "source";
constexpr const char* kTimestampKey = "timestamp";

// JSON numbers arrive as doubles; accept only whole values in range.
std::optional<int64_t> integral(const QJsonValue& value, int64_t min, int64_t max) {
    if (!value.isDouble()) {
        return std::nullopt;
    }
    const double d = value.toDouble();
    if (!std::isfinite(d) || std::floor(d) != d) {
        return std::nullopt;
    }
    if (d < static_cast<double>(min) || d > static_cast<double>(max)) {
        return std::nullopt;
    }
    return static_cast<int64_t>(d);
}

Result<CursorPosition, Error> malformed(const QString& why) {
    return Result<CursorPosition, Error>::err(
        Error{ErrorKind::MalformedMessage, why.toStdString()});
}

} // namespace

CursorPosition::CursorPosition(QString file, int line, int character, Origin origin,
                               Timestamp timestamp)
    : file_(std::move(file))
    , line_(line)
    , character_(character)
    , origin_(origin)
    , timestamp_(timestamp)
{
}

bool CursorPosition::samePlace(const CursorPosition& other) const {
    return line_ == other.line_ &&
           character_ == other.character_ &&
           file_ == other.file_;
}

QString CursorPosition::describe() const {
    return QStringLiteral("%1:%2:%3 (%4, ts=%5)")
        .arg(file_)
        .arg(line_)
        .arg(character_)
        .arg(origin_ == Origin::Local ? QStringLiteral("local") : QStringLiteral("remote"))
        .arg(timestamp_.millis());
}

QByteArray serialize_cursor_message(const CursorPosition& position,
                                    const SourceLabels& labels) {
    QJsonObject obj;
    obj.insert(QLatin1String(kFileKey), position.file());
    obj.insert(QLatin1String(kLineKey), position.line());
    obj.insert(QLatin1String(kCharacterKey), position.character());
    obj.insert(QLatin1String(kSourceKey),
               position.origin() == Origin::Local ? labels.local : labels.peer);
    obj.insert(QLatin1String(kTimestampKey),
               static_cast<qint64>(position.timestamp().millis()));
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

Result<CursorPosition, Error> parse_cursor_message(const QByteArray& payload,
                                                   const SourceLabels& labels) {
    if (payload.isEmpty()) {
        return malformed(QStringLiteral("empty message"));
    }

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(payload, &err);
    if (err.error != QJsonParseError::NoError) {
        return malformed(QStringLiteral("invalid json: %1").arg(err.errorString()));
    }
    if (!doc.isObject()) {
        return malformed(QStringLiteral("message is not an object"));
    }

    const auto obj = doc.object();

    const auto file = obj.value(QLatin1String(kFileKey));
    if (!file.isString() || file.toString().isEmpty()) {
        return malformed(QStringLiteral("missing or invalid 'file'"));
    }

    constexpr int64_t kIntMax = std::numeric_limits<int>::max();
    const auto line = integral(obj.value(QLatin1String(kLineKey)), 0, kIntMax);
    if (!line) {
        return malformed(QStringLiteral("missing or invalid 'line'"));
    }
    const auto character = integral(obj.value(QLatin1String(kCharacterKey)), 0, kIntMax);
    if (!character) {
        return malformed(QStringLiteral("missing or invalid 'character'"));
    }

    // 2^53 bounds the integers a JSON double holds exactly.
    constexpr int64_t kMaxExact = int64_t{1} << 53;
    const auto timestamp = integral(obj.value(QLatin1String(kTimestampKey)), -kMaxExact, kMaxExact);
    if (!timestamp) {
        return malformed(QStringLiteral("missing or invalid 'timestamp'"));
    }

    const auto source = obj.value(QLatin1String(kSourceKey));
    if (!source.isString()) {
        return malformed(QStringLiteral("missing or invalid 'source'"));
    }
    const auto label = source.toString();
    Origin origin;
    if (label == labels.peer) {
        origin = Origin::Remote;
    } else if (label == labels.local) {
        origin = Origin::Local;
    } else {
        return malformed(QStringLiteral("unknown source '%1'").arg(label));
    }

    return Result<CursorPosition, Error>::ok(CursorPosition(
        file.toString(),
        static_cast<int>(*line),
        static_cast<int>(*character),
        origin,
        Timestamp(*timestamp)));
}

} // namespace caretsync
