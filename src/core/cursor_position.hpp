#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <QByteArray>
#include <QString>

namespace caretsync {

/**
 * Which side produced a cursor update, from the point of view of the
 * process holding the value.
 */
enum class Origin {
    Local,
    Remote
};

/**
 * Wire labels for the `source` field. Each side writes its own label and
 * only accepts messages carrying the peer's label.
 */
struct SourceLabels {
    QString local;
    QString peer;
};

inline constexpr const char* kHostALabel = "host-a";
inline constexpr const char* kHostBLabel = "host-b";

/**
 * CursorPosition - One caret location in one document.
 *
 * Immutable once constructed. Coordinates are zero-based; the file is an
 * opaque key compared by exact equality.
 */
class CursorPosition {
public:
    CursorPosition(QString file, int line, int character, Origin origin,
                   Timestamp timestamp = Timestamp::now());

    [[nodiscard]] const QString& file() const { return file_; }
    [[nodiscard]] int line() const { return line_; }
    [[nodiscard]] int character() const { return character_; }
    [[nodiscard]] Origin origin() const { return origin_; }
    [[nodiscard]] Timestamp timestamp() const { return timestamp_; }

    // Same (file, line, character); origin and timestamp are ignored.
    [[nodiscard]] bool samePlace(const CursorPosition& other) const;

    [[nodiscard]] QString describe() const;

private:
    QString file_;
    int line_;
    int character_;
    Origin origin_;
    Timestamp timestamp_;
};

/**
 * Encode as the compact JSON record
 * {"file","line","character","source","timestamp"}.
 */
[[nodiscard]] QByteArray serialize_cursor_message(const CursorPosition& position,
                                                  const SourceLabels& labels);

/**
 * Decode a JSON record. Unknown fields are ignored; missing or mistyped
 * fields and unrecognized source labels fail with MalformedMessage.
 */
[[nodiscard]] Result<CursorPosition, Error> parse_cursor_message(const QByteArray& payload,
                                                                 const SourceLabels& labels);

} // namespace caretsync
