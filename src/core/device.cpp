#include "core/device.hpp"

namespace rally {

QString roleName(DeviceRole role) {
    switch (role) {
        case DeviceRole::Referee: return QStringLiteral("referee");
        case DeviceRole::Organizer: return QStringLiteral("organizer");
        case DeviceRole::Spectator: return QStringLiteral("spectator");
    }
    return QStringLiteral("spectator");
}

std::optional<DeviceRole> parseRole(const QString& name) {
    const auto n = name.trimmed().toLower();
    if (n == QStringLiteral("referee")) return DeviceRole::Referee;
    if (n == QStringLiteral("organizer")) return DeviceRole::Organizer;
    if (n == QStringLiteral("spectator")) return DeviceRole::Spectator;
    return std::nullopt;
}

int rolePriority(DeviceRole role) {
    switch (role) {
        case DeviceRole::Referee: return 3;
        case DeviceRole::Organizer: return 2;
        case DeviceRole::Spectator: return 1;
    }
    return 0;
}

QJsonObject DeviceInfo::toJson() const {
    QJsonObject obj;
    obj["id"] = idString(id);
    obj["name"] = name;
    obj["role"] = roleName(role);
    return obj;
}

std::optional<DeviceInfo> DeviceInfo::fromJson(const QJsonObject& obj) {
    const auto parsed = parseId(obj.value("id").toString());
    if (!parsed || parsed->is_nil()) {
        return std::nullopt;
    }
    DeviceInfo info;
    info.id = *parsed;
    info.name = obj.value("name").toString();
    info.role = parseRole(obj.value("role").toString()).value_or(DeviceRole::Spectator);
    return info;
}

} // namespace rally
