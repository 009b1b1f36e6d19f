#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <QJsonObject>
#include <QMetaType>
#include <QString>
#include <optional>

namespace rally {

/**
 * DeviceRole - what a device does at the tournament table.
 */
enum class DeviceRole {
    Referee,
    Organizer,
    Spectator
};

[[nodiscard]] QString roleName(DeviceRole role);
[[nodiscard]] std::optional<DeviceRole> parseRole(const QString& name);

/**
 * Priority used by the role-priority conflict strategy. Higher wins.
 */
[[nodiscard]] int rolePriority(DeviceRole role);

/**
 * DeviceInfo - a device as announced through signaling.
 */
struct DeviceInfo {
    Uuid id;
    QString name;
    DeviceRole role = DeviceRole::Spectator;

    [[nodiscard]] QJsonObject toJson() const;
    [[nodiscard]] static std::optional<DeviceInfo> fromJson(const QJsonObject& obj);

    bool operator==(const DeviceInfo& other) const {
        return id == other.id && name == other.name && role == other.role;
    }
};

[[nodiscard]] inline QString idString(const Uuid& id) {
    return QString::fromStdString(id.to_string());
}

[[nodiscard]] inline std::optional<Uuid> parseId(const QString& text) {
    return Uuid::parse(text.toStdString());
}

} // namespace rally

Q_DECLARE_METATYPE(rally::Uuid)
Q_DECLARE_METATYPE(rally::Error)
Q_DECLARE_METATYPE(rally::DeviceInfo)
