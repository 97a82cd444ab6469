#pragma once

#include <QHashFunctions>
#include <QString>
#include <QtGlobal>
#include <cstddef>
#include <functional>

namespace keyclash {

struct ResourceKey {
    quint32 typeId = 0;
    quint32 groupId = 0;
    quint64 instanceId = 0;

    constexpr ResourceKey() = default;
    constexpr ResourceKey(quint32 type, quint32 group, quint64 instance)
        : typeId(type), groupId(group), instanceId(instance) {}

    // All-zero keys are padding slots, never resources.
    constexpr bool isNull() const { return typeId == 0 && groupId == 0 && instanceId == 0; }

    QString typeHex() const;
    QString groupHex() const;
    QString instanceHex() const;
    QString toString() const;

    friend constexpr bool operator==(const ResourceKey& lhs, const ResourceKey& rhs) {
        return lhs.typeId == rhs.typeId && lhs.groupId == rhs.groupId &&
               lhs.instanceId == rhs.instanceId;
    }
    friend constexpr bool operator!=(const ResourceKey& lhs, const ResourceKey& rhs) {
        return !(lhs == rhs);
    }
    friend constexpr bool operator<(const ResourceKey& lhs, const ResourceKey& rhs) {
        if (lhs.typeId != rhs.typeId) {
            return lhs.typeId < rhs.typeId;
        }
        if (lhs.groupId != rhs.groupId) {
            return lhs.groupId < rhs.groupId;
        }
        return lhs.instanceId < rhs.instanceId;
    }
};

inline size_t qHash(const ResourceKey& key, size_t seed = 0) noexcept {
    return qHashMulti(seed, key.typeId, key.groupId, key.instanceId);
}

}  // namespace keyclash

template <>
struct std::hash<keyclash::ResourceKey> {
    std::size_t operator()(const keyclash::ResourceKey& key) const noexcept {
        return keyclash::qHash(key, 0);
    }
};
