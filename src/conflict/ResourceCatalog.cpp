#include "conflict/ResourceCatalog.h"

#include <algorithm>
#include <array>

namespace keyclash {

namespace {
struct TypeEntry {
    quint32 typeId;
    const char* category;
    const char* label;
};

constexpr std::array<TypeEntry, 16> kTypeTable{{
    {0x0166038CU, "Script", "Python Script"},
    {0x015A1849U, "Gameplay", "Object Definition"},
    {0x01B2D882U, "Gameplay", "Tuning"},
    {0x025C95B7U, "Gameplay", "Autonomy"},
    {0x00B2D882U, "Gameplay", "Tuning (Legacy)"},
    {0x0355E0A6U, "Build/Buy", "Object Catalog"},
    {0x319E4F1DU, "Texture", "Diffuse Map"},
    {0x0333406CU, "Texture", "Image Resource"},
    {0x034AEECBU, "CAS", "CAS Part"},
    {0x03555A5DU, "CAS", "CAS Part Thumbnail"},
    {0x545AC67AU, "Script", "Binary Script"},
    {0x0621661EU, "Audio", "Audio Stream"},
    {0x319E4F87U, "Texture", "Normal Map"},
    {0x34613C29U, "Texture", "Specular Map"},
    {0x5B4D8F8CU, "Gameplay", "Slot"},
    {0xE06C2907U, "Gameplay", "Animation Clip"},
}};

constexpr std::array<quint32, 5> kCriticalTypes{
    0x0166038CU, 0x015A1849U, 0x01B2D882U, 0x025C95B7U, 0x5B4D8F8CU};

constexpr std::array<quint32, 7> kHighImpactTypes{
    0x0333406CU, 0x034AEECBU, 0x0355E0A6U, 0x545AC67AU, 0x319E4F1DU, 0x319E4F87U, 0x34613C29U};

constexpr std::array<const char*, 7> kCategoryOrder{
    "Gameplay", "Script", "Build/Buy", "CAS", "Texture", "Audio", "Other"};

struct KeywordEntry {
    const char* needle;
    const char* tag;
};

constexpr std::array<KeywordEntry, 9> kKeywords{{
    {"wickedwhims", "WickedWhims"},
    {"basemental", "Basemental"},
    {"mccc", "MC Command Center"},
    {"slice of life", "Slice of Life"},
    {"wonderful whims", "WonderfulWhims"},
    {"turbodriver", "TURBODRIVER"},
    {"littlemssam", "LittleMsSam"},
    {"zerobroken", "Zero's Mods"},
    {"sacrificial", "Sacrificial"},
}};

template <std::size_t N>
bool containsType(const std::array<quint32, N>& table, quint32 typeId) {
    return std::find(table.begin(), table.end(), typeId) != table.end();
}
}  // namespace

std::optional<ResourceTypeInfo> ResourceCatalog::lookup(quint32 typeId) {
    for (const TypeEntry& entry : kTypeTable) {
        if (entry.typeId == typeId) {
            return ResourceTypeInfo{QString::fromLatin1(entry.category),
                                    QString::fromLatin1(entry.label)};
        }
    }
    return std::nullopt;
}

bool ResourceCatalog::isCriticalType(quint32 typeId) { return containsType(kCriticalTypes, typeId); }

bool ResourceCatalog::isHighImpactType(quint32 typeId) {
    return containsType(kHighImpactTypes, typeId);
}

quint8 ResourceCatalog::categoryRank(const QString& category) {
    for (std::size_t i = 0; i < kCategoryOrder.size(); ++i) {
        if (category == QLatin1String(kCategoryOrder[i])) {
            return static_cast<quint8>(i);
        }
    }
    return static_cast<quint8>(kCategoryOrder.size() - 1);
}

QStringList ResourceCatalog::keywordTagsForPath(const QString& path) {
    const QString lower = path.toLower();
    QStringList tags;
    for (const KeywordEntry& entry : kKeywords) {
        if (lower.contains(QLatin1String(entry.needle))) {
            const QString tag = QString::fromUtf8(entry.tag);
            if (!tags.contains(tag)) {
                tags.push_back(tag);
            }
        }
    }
    tags.sort(Qt::CaseInsensitive);
    return tags;
}

}  // namespace keyclash
