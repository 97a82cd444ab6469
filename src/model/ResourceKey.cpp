#include "model/ResourceKey.h"

namespace keyclash {

namespace {
QString formatHex(quint64 value, int width) {
    return QStringLiteral("0x") +
           QString::number(value, 16).rightJustified(width, QLatin1Char('0')).toUpper();
}
}  // namespace

QString ResourceKey::typeHex() const { return formatHex(typeId, 8); }

QString ResourceKey::groupHex() const { return formatHex(groupId, 8); }

QString ResourceKey::instanceHex() const { return formatHex(instanceId, 16); }

QString ResourceKey::toString() const {
    return QStringLiteral("%1:%2:%3").arg(typeHex(), groupHex(), instanceHex());
}

}  // namespace keyclash
