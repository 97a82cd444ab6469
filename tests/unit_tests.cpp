#include <QCoreApplication>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include <algorithm>
#include <atomic>
#include <optional>

#include "ContainerFixtures.h"
#include "cache/ParseCache.h"
#include "conflict/ConflictAccumulator.h"
#include "conflict/ConflictClassifier.h"
#include "conflict/ResourceCatalog.h"
#include "index/ResourceIndexReader.h"
#include "io/FileEnumerator.h"
#include "io/InventorySnapshot.h"
#include "model/ConflictTypes.h"
#include "model/ResourceKey.h"
#include "report/ConflictReport.h"

namespace {

using keyclash::ResourceKey;

int g_failures = 0;

void expectTrue(bool condition, const QString& message) {
    if (!condition) {
        qCritical().noquote() << QStringLiteral("FAIL: %1").arg(message);
        ++g_failures;
    }
}

void expectEqInt(qint64 actual, qint64 expected, const QString& message) {
    if (actual != expected) {
        qCritical().noquote()
            << QStringLiteral("FAIL: %1 (actual=%2 expected=%3)")
                   .arg(message)
                   .arg(actual)
                   .arg(expected);
        ++g_failures;
    }
}

void expectEqQString(const QString& actual, const QString& expected, const QString& message) {
    if (actual != expected) {
        qCritical().noquote()
            << QStringLiteral("FAIL: %1 (actual='%2' expected='%3')")
                   .arg(message)
                   .arg(actual)
                   .arg(expected);
        ++g_failures;
    }
}

void expectKeys(const QVector<ResourceKey>& actual, const QVector<ResourceKey>& expected,
                const QString& message) {
    if (actual != expected) {
        QStringList rendered;
        for (const ResourceKey& key : actual) {
            rendered.push_back(key.toString());
        }
        qCritical().noquote() << QStringLiteral("FAIL: %1 (actual=[%2] expected %3 keys)")
                                     .arg(message)
                                     .arg(rendered.join(QStringLiteral(", ")))
                                     .arg(expected.size());
        ++g_failures;
    }
}

QVector<ResourceKey> makeKeys(int count) {
    QVector<ResourceKey> keys;
    for (int i = 0; i < count; ++i) {
        const quint64 instance =
            (static_cast<quint64>(0xA0000000U + i) << 32) | static_cast<quint64>(0xB0000000U + i);
        keys.push_back(ResourceKey(0x10000000U + i, static_cast<quint32>(i + 1), instance));
    }
    return keys;
}

keyclash::ContributingFile makeFile(const QString& path, const QDateTime& modified,
                                    bool companion = false) {
    keyclash::ContributingFile file;
    file.path = path;
    file.modified = modified;
    file.size = 128;
    file.hasCompanionScript = companion;
    file.keywordTags = keyclash::ResourceCatalog::keywordTagsForPath(path);
    return file;
}

keyclash::ConflictRecord makeRecord(const ResourceKey& key,
                                    const QVector<keyclash::ContributingFile>& files,
                                    const QDateTime& now) {
    keyclash::ConflictRecord record;
    record.key = key;
    record.files = files;
    record.refreshMetadata(now);
    return record;
}

QDateTime fixedNow() { return QDateTime::fromSecsSinceEpoch(1717243200); }

void testResourceKeyFormatting() {
    const ResourceKey key(0x015A1849U, 1U, 0x1122334455667788ULL);
    expectEqQString(key.typeHex(), QStringLiteral("0x015A1849"), QStringLiteral("type hex width"));
    expectEqQString(key.groupHex(), QStringLiteral("0x00000001"),
                    QStringLiteral("group hex is zero padded"));
    expectEqQString(key.instanceHex(), QStringLiteral("0x1122334455667788"),
                    QStringLiteral("instance hex keeps all 64 bits"));
    expectEqQString(key.toString(), QStringLiteral("0x015A1849:0x00000001:0x1122334455667788"),
                    QStringLiteral("key string joins the three parts"));
    expectTrue(ResourceKey().isNull(), QStringLiteral("default key is the null padding key"));
    expectTrue(ResourceKey(1, 0, 0) < ResourceKey(1, 0, 1),
               QStringLiteral("key order falls through to instance"));
}

void testIndexTableWidths() {
    QTemporaryDir tempDir;
    expectTrue(tempDir.isValid(), QStringLiteral("index width temp dir should be valid"));
    if (!tempDir.isValid()) {
        return;
    }

    const QVector<ResourceKey> keys = makeKeys(8);
    for (const int width : {16, 32, 40}) {
        const QString path =
            tempDir.filePath(QStringLiteral("width%1.package").arg(width));
        expectTrue(fixtures::writeFile(path, fixtures::buildIndexedContainer(keys, width)),
                   QStringLiteral("write width %1 container").arg(width));

        const keyclash::IndexReadResult result =
            keyclash::ResourceIndexReader::read(path, keyclash::IndexReadOptions());
        expectTrue(result.status == keyclash::IndexReadStatus::Ok,
                   QStringLiteral("width %1 container should read ok").arg(width));
        expectTrue(!result.usedTailFallback,
                   QStringLiteral("width %1 container should not need the tail").arg(width));
        expectKeys(result.keys, keys, QStringLiteral("width %1 keys recovered in order").arg(width));
        expectEqInt(result.tableWidth, width, QStringLiteral("width %1 reported back").arg(width));
        expectKeys(keyclash::ResourceIndexReader::readKeys(path, keyclash::IndexReadOptions()), keys,
                   QStringLiteral("width %1 key-only read").arg(width));
    }
}

void testIndexTableCountHintZeroUsesWholeTable() {
    const QVector<ResourceKey> keys = makeKeys(5);
    QByteArray table;
    for (const ResourceKey& key : keys) {
        fixtures::appendKey(table, key);
    }

    int chosenWidth = 0;
    const QVector<ResourceKey> parsed =
        keyclash::ResourceIndexReader::parseIndexTable(table, 0, nullptr, &chosenWidth);
    expectEqInt(chosenWidth, 16, QStringLiteral("packed rows should choose width 16"));
    expectKeys(parsed, keys, QStringLiteral("count hint 0 should read every row that fits"));

    const QVector<ResourceKey> limited =
        keyclash::ResourceIndexReader::parseIndexTable(table, 2, nullptr, &chosenWidth);
    expectKeys(limited, keys.mid(0, 2), QStringLiteral("count hint should cap rows"));
}

void testIndexTableLegacyLayout() {
    QTemporaryDir tempDir;
    expectTrue(tempDir.isValid(), QStringLiteral("legacy temp dir should be valid"));
    if (!tempDir.isValid()) {
        return;
    }

    const QVector<ResourceKey> keys = makeKeys(4);
    const QString path = tempDir.filePath(QStringLiteral("legacy.package"));
    expectTrue(fixtures::writeFile(path, fixtures::buildIndexedContainer(
                                             keys, 16, fixtures::HeaderLayout::Legacy)),
               QStringLiteral("write legacy container"));

    const keyclash::IndexReadResult result =
        keyclash::ResourceIndexReader::read(path, keyclash::IndexReadOptions());
    expectTrue(result.status == keyclash::IndexReadStatus::Ok,
               QStringLiteral("legacy layout should read ok"));
    expectKeys(result.keys, keys, QStringLiteral("legacy layout keys"));
}

void testIndexTableTieFavoursEarlierWidth() {
    // Two 32-byte rows: widths 16, 24 and 32 all score two non-null rows.
    const QVector<ResourceKey> keys = makeKeys(2);
    QByteArray table;
    for (const ResourceKey& key : keys) {
        fixtures::appendKey(table, key);
        table.append(QByteArray(16, '\0'));
    }

    int chosenWidth = 0;
    const QVector<ResourceKey> parsed =
        keyclash::ResourceIndexReader::parseIndexTable(table, 0, nullptr, &chosenWidth);
    expectEqInt(chosenWidth, 16, QStringLiteral("tied widths should resolve to the earliest"));
    expectKeys(parsed, keys, QStringLiteral("tie at width 16 still skips padding rows"));

    expectTrue(keyclash::ResourceIndexReader::parseIndexTable(QByteArray(), 7).isEmpty(),
               QStringLiteral("empty table yields no keys"));
    expectTrue(keyclash::ResourceIndexReader::parseIndexTable(QByteArray(64, '\0'), 0).isEmpty(),
               QStringLiteral("all-zero table yields no keys"));
}

void testTailFallbackRecoversKeys() {
    QTemporaryDir tempDir;
    expectTrue(tempDir.isValid(), QStringLiteral("tail temp dir should be valid"));
    if (!tempDir.isValid()) {
        return;
    }

    const ResourceKey first(0x015A1849U, 1U, 0x1122334455667788ULL);
    const ResourceKey second(0x0355E0A6U, 2U, 0x5566778899AABBCCULL);
    const ResourceKey third(0x034AEECBU, 3U, 0x0102030405060708ULL);
    const QVector<fixtures::TailRecord> records{
        {first, 96, 16},
        {second, 112, 32},
        {first, 96, 16},
        {third, 0, 8},
    };
    const QString path = tempDir.filePath(QStringLiteral("broken.package"));
    expectTrue(fixtures::writeFile(path, fixtures::buildTailOnlyContainer(records)),
               QStringLiteral("write tail-only container"));

    const keyclash::IndexReadResult result =
        keyclash::ResourceIndexReader::read(path, keyclash::IndexReadOptions());
    expectTrue(result.status == keyclash::IndexReadStatus::Ok,
               QStringLiteral("tail fallback with keys should report ok"));
    expectTrue(result.usedTailFallback, QStringLiteral("broken header should use the tail"));
    expectEqInt(result.tableWidth, 0, QStringLiteral("no index table width without table rows"));
    expectKeys(result.keys, QVector<ResourceKey>{first, second, third},
               QStringLiteral("tail keys deduplicated in first-seen order"));

    keyclash::IndexReadOptions fast;
    fast.allowTailFallback = false;
    const keyclash::IndexReadResult fastResult = keyclash::ResourceIndexReader::read(path, fast);
    expectTrue(fastResult.keys.isEmpty(), QStringLiteral("fast mode should skip the tail scan"));
    expectTrue(!fastResult.usedTailFallback, QStringLiteral("fast mode never reports tail use"));
    expectTrue(fastResult.status == keyclash::IndexReadStatus::OutOfRangeIndex,
               QStringLiteral("fast mode reports the unusable index"));
}

void testTailWindowRejectsBadPayloads() {
    const quint64 fileSize = 1000;
    const QVector<fixtures::TailRecord> records{
        {ResourceKey(0x0166038CU, 1U, 0xA1A2A3A4B1B2B3B4ULL), 10, 0},
        {ResourceKey(0x0166038CU, 2U, 0xC1C2C3C4D1D2D3D4ULL), 990, 20},
        {ResourceKey(0x0166038CU, 3U, 0xE1E2E3E4F1F2F3F4ULL), 1000, 1},
        {ResourceKey(0x0166038CU, 4U, 0x9192939481828384ULL), 0, 1000},
    };
    QByteArray window;
    for (const fixtures::TailRecord& record : records) {
        fixtures::appendKey(window, record.key);
        fixtures::appendLeU32(window, record.payloadOffset);
        fixtures::appendLeU32(window, record.payloadSize);
    }

    const QVector<ResourceKey> keys =
        keyclash::ResourceIndexReader::scanTailWindow(window, fileSize);
    expectKeys(keys, QVector<ResourceKey>{records.at(3).key},
               QStringLiteral("only the record whose payload fits the file survives"));

    const std::atomic<bool> cancelled{true};
    expectTrue(keyclash::ResourceIndexReader::scanTailWindow(window, fileSize, &cancelled).isEmpty(),
               QStringLiteral("cancelled tail scan stops before the first record"));
}

void testInvalidContainers() {
    QTemporaryDir tempDir;
    expectTrue(tempDir.isValid(), QStringLiteral("invalid container temp dir should be valid"));
    if (!tempDir.isValid()) {
        return;
    }

    const QString emptyPath = tempDir.filePath(QStringLiteral("empty.package"));
    const QString magicOnlyPath = tempDir.filePath(QStringLiteral("magic.package"));
    const QString wrongMagicPath = tempDir.filePath(QStringLiteral("wrong.package"));
    expectTrue(fixtures::writeFile(emptyPath, QByteArray()), QStringLiteral("write empty file"));
    expectTrue(fixtures::writeFile(magicOnlyPath, QByteArray("DBPF")),
               QStringLiteral("write magic-only file"));
    QByteArray wrong = fixtures::buildIndexedContainer(makeKeys(2), 16);
    wrong.replace(0, 4, QByteArray("DBPX"));
    expectTrue(fixtures::writeFile(wrongMagicPath, wrong), QStringLiteral("write wrong magic file"));

    for (const QString& path : {emptyPath, magicOnlyPath, wrongMagicPath}) {
        const keyclash::IndexReadResult result =
            keyclash::ResourceIndexReader::read(path, keyclash::IndexReadOptions());
        expectTrue(result.status == keyclash::IndexReadStatus::InvalidContainer,
                   QStringLiteral("%1 should be an invalid container (got %2)")
                       .arg(QFileInfo(path).fileName(),
                            keyclash::indexReadStatusName(result.status)));
        expectTrue(result.keys.isEmpty(), QStringLiteral("invalid container yields no keys"));
    }

    const keyclash::IndexReadResult missing = keyclash::ResourceIndexReader::read(
        tempDir.filePath(QStringLiteral("missing.package")), keyclash::IndexReadOptions());
    expectTrue(missing.status == keyclash::IndexReadStatus::IoError,
               QStringLiteral("missing file is an io error"));

    const QString validPath = tempDir.filePath(QStringLiteral("valid.package"));
    expectTrue(fixtures::writeFile(validPath, fixtures::buildIndexedContainer(makeKeys(3), 16)),
               QStringLiteral("write valid container"));
    const std::atomic<bool> cancelFlag{true};
    const keyclash::IndexReadResult cancelled = keyclash::ResourceIndexReader::read(
        validPath, keyclash::IndexReadOptions(), &cancelFlag);
    expectTrue(cancelled.status == keyclash::IndexReadStatus::Cancelled,
               QStringLiteral("raised cancel flag stops the read"));
    expectTrue(cancelled.keys.isEmpty(), QStringLiteral("cancelled read yields no keys"));
}

void testClassifierSeverities() {
    const QDateTime now = fixedNow();
    const QDateTime old = now.addDays(-60);
    const QVector<keyclash::ContributingFile> twoOld{
        makeFile(QStringLiteral("/mods/a.package"), old),
        makeFile(QStringLiteral("/mods/b.package"), old)};

    const keyclash::ConflictRecord gameplay =
        makeRecord(ResourceKey(0x015A1849U, 1U, 7U), twoOld, now);
    expectTrue(gameplay.severity == keyclash::Severity::Critical,
               QStringLiteral("object definitions are critical"));
    expectEqQString(gameplay.category, QStringLiteral("Gameplay"),
                    QStringLiteral("object definition category"));
    expectEqQString(gameplay.label, QStringLiteral("Object Definition"),
                    QStringLiteral("object definition label"));

    QVector<keyclash::ContributingFile> withScript = twoOld;
    withScript[1].hasCompanionScript = true;
    const keyclash::ConflictRecord scripted =
        makeRecord(ResourceKey(0x0621661EU, 1U, 7U), withScript, now);
    expectTrue(scripted.severity == keyclash::Severity::High,
               QStringLiteral("companion script raises audio to high"));
    expectTrue(scripted.hasCompanionScript, QStringLiteral("record aggregates companion flag"));

    QVector<keyclash::ContributingFile> threeOld = twoOld;
    threeOld.push_back(makeFile(QStringLiteral("/mods/c.package"), old));
    const keyclash::ConflictRecord crowded =
        makeRecord(ResourceKey(0x0621661EU, 1U, 8U), threeOld, now);
    expectTrue(crowded.severity == keyclash::Severity::High,
               QStringLiteral("three contributing files are high"));

    const keyclash::ConflictRecord casPart =
        makeRecord(ResourceKey(0x034AEECBU, 1U, 7U), twoOld, now);
    expectTrue(casPart.severity == keyclash::Severity::High,
               QStringLiteral("high-impact CAS part is high"));

    const keyclash::ConflictRecord thumbnail =
        makeRecord(ResourceKey(0x03555A5DU, 1U, 7U), twoOld, now);
    expectTrue(thumbnail.severity == keyclash::Severity::Moderate,
               QStringLiteral("CAS thumbnail is moderate"));

    const keyclash::ConflictRecord audio =
        makeRecord(ResourceKey(0x0621661EU, 1U, 9U), twoOld, now);
    expectTrue(audio.severity == keyclash::Severity::Low, QStringLiteral("plain audio is low"));

    const keyclash::ConflictRecord unknown =
        makeRecord(ResourceKey(0x12345678U, 1U, 7U), twoOld, now);
    expectTrue(unknown.severity == keyclash::Severity::Low, QStringLiteral("unknown type is low"));
    expectEqQString(unknown.category, QStringLiteral("Other"),
                    QStringLiteral("unknown type category"));
    expectEqQString(unknown.label, QStringLiteral("Unknown resource"),
                    QStringLiteral("unknown type label"));
    expectEqInt(unknown.priority.categoryRank, 6, QStringLiteral("Other ranks last"));
    expectEqInt(unknown.priority.negFileCount, -2, QStringLiteral("priority carries -files"));
}

void testClassifierRecentChangeEscalation() {
    const QDateTime now = fixedNow();
    const ResourceKey unknownKey(0x12345678U, 1U, 7U);
    auto severityFor = [&](const QDateTime& newest) {
        const QVector<keyclash::ContributingFile> files{
            makeFile(QStringLiteral("/mods/a.package"), now.addDays(-90)),
            makeFile(QStringLiteral("/mods/b.package"), newest)};
        return makeRecord(unknownKey, files, now).severity;
    };

    expectTrue(severityFor(now.addDays(-3)) == keyclash::Severity::High,
               QStringLiteral("three-day-old change escalates"));
    expectTrue(severityFor(now.addDays(-14)) == keyclash::Severity::High,
               QStringLiteral("fourteen-day-old change still escalates"));
    expectTrue(severityFor(now.addDays(-15)) == keyclash::Severity::Low,
               QStringLiteral("fifteen-day-old change does not escalate"));
    expectTrue(severityFor(now.addDays(2)) == keyclash::Severity::High,
               QStringLiteral("future timestamps count as age zero"));
    expectTrue(severityFor(QDateTime()) == keyclash::Severity::Low,
               QStringLiteral("invalid timestamps are ignored"));

    const QVector<keyclash::ContributingFile> recent{
        makeFile(QStringLiteral("/mods/a.package"), now.addDays(-1)),
        makeFile(QStringLiteral("/mods/b.package"), now.addDays(-2))};
    const keyclash::ConflictRecord gameplay =
        makeRecord(ResourceKey(0x01B2D882U, 1U, 7U), recent, now);
    expectTrue(gameplay.severity == keyclash::Severity::Critical,
               QStringLiteral("critical never downgrades to high"));
    expectTrue(gameplay.latestModified == now.addDays(-1),
               QStringLiteral("latest modification is the newest file"));
}

void testConflictOrdering() {
    const QDateTime now = fixedNow();
    const QDateTime old = now.addDays(-60);
    auto files = [&](int count) {
        QVector<keyclash::ContributingFile> out;
        for (int i = 0; i < count; ++i) {
            out.push_back(makeFile(QStringLiteral("/mods/f%1.package").arg(i), old));
        }
        return out;
    };

    QVector<keyclash::ConflictRecord> records{
        makeRecord(ResourceKey(0x03555A5DU, 1U, 1U), files(2), now),   // Moderate CAS
        makeRecord(ResourceKey(0x0621661EU, 1U, 2U), files(3), now),   // High Audio, 3 files
        makeRecord(ResourceKey(0x0621661EU, 1U, 1U), files(4), now),   // High Audio, 4 files
        makeRecord(ResourceKey(0x034AEECBU, 1U, 1U), files(2), now),   // High CAS
        makeRecord(ResourceKey(0x015A1849U, 2U, 1U), files(2), now),   // Critical Gameplay
        makeRecord(ResourceKey(0x015A1849U, 1U, 1U), files(2), now),   // same priority, lower key
    };
    std::sort(records.begin(), records.end(), keyclash::conflictRecordLess);

    const QVector<ResourceKey> expected{
        ResourceKey(0x015A1849U, 1U, 1U), ResourceKey(0x015A1849U, 2U, 1U),
        ResourceKey(0x034AEECBU, 1U, 1U), ResourceKey(0x0621661EU, 1U, 1U),
        ResourceKey(0x0621661EU, 1U, 2U), ResourceKey(0x03555A5DU, 1U, 1U)};
    QVector<ResourceKey> actual;
    for (const keyclash::ConflictRecord& record : records) {
        actual.push_back(record.key);
    }
    expectKeys(actual, expected,
               QStringLiteral("records order by severity, category, file count, key"));
}

void testKeywordTags() {
    const QStringList tags = keyclash::ResourceCatalog::keywordTagsForPath(
        QStringLiteral("/Mods/WickedWhims/TURBODRIVER_WW_Basemental_patch.package"));
    expectEqQString(tags.join(QLatin1Char('|')),
                    QStringLiteral("Basemental|TURBODRIVER|WickedWhims"),
                    QStringLiteral("keyword tags are matched case-insensitively and sorted"));
    expectTrue(keyclash::ResourceCatalog::keywordTagsForPath(QStringLiteral("/mods/hair.package"))
                   .isEmpty(),
               QStringLiteral("paths without needles carry no tags"));
    expectEqInt(keyclash::ResourceCatalog::categoryRank(QStringLiteral("Gameplay")), 0,
                QStringLiteral("Gameplay ranks first"));
    expectEqInt(keyclash::ResourceCatalog::categoryRank(QStringLiteral("Nonsense")), 6,
                QStringLiteral("unknown categories rank with Other"));
}

void testAccumulatorKeepsOnlySharedKeys() {
    QTemporaryDir tempDir;
    expectTrue(tempDir.isValid(), QStringLiteral("accumulator temp dir should be valid"));
    if (!tempDir.isValid()) {
        return;
    }

    const QString onePath = tempDir.filePath(QStringLiteral("a/one.package"));
    const QString twoPath = tempDir.filePath(QStringLiteral("b/two.package"));
    const QString threePath = tempDir.filePath(QStringLiteral("b/three.package"));
    expectTrue(fixtures::writeFile(onePath, QByteArray("one")), QStringLiteral("write one"));
    expectTrue(fixtures::writeFile(twoPath, QByteArray("two")), QStringLiteral("write two"));
    expectTrue(fixtures::writeFile(threePath, QByteArray("three")), QStringLiteral("write three"));
    expectTrue(fixtures::writeFile(tempDir.filePath(QStringLiteral("b/Core.TS4SCRIPT")),
                                   QByteArray("zip")),
               QStringLiteral("write companion script"));

    const ResourceKey shared(0x015A1849U, 1U, 1U);
    const ResourceKey single(0x015A1849U, 1U, 2U);

    keyclash::ConflictAccumulator accumulator;
    expectTrue(accumulator.addFile(onePath, {shared, single, shared}),
               QStringLiteral("first file contributes"));
    expectTrue(accumulator.addFile(twoPath, {shared}), QStringLiteral("second file contributes"));
    expectTrue(!accumulator.addFile(threePath, {}), QStringLiteral("empty key list is skipped"));
    expectTrue(!accumulator.addFile(onePath, {single}), QStringLiteral("same path is added once"));
    expectTrue(!accumulator.addFile(tempDir.filePath(QStringLiteral("gone.package")), {shared}),
               QStringLiteral("vanished file is skipped"));
    expectEqInt(accumulator.distinctKeyCount(), 2, QStringLiteral("two distinct keys seen"));
    expectEqInt(accumulator.contributingFileCount(), 2, QStringLiteral("two files contributed"));

    const QVector<keyclash::ConflictRecord> conflicts = accumulator.takeConflicts();
    expectEqInt(conflicts.size(), 1, QStringLiteral("only the shared key conflicts"));
    if (conflicts.size() == 1) {
        const keyclash::ConflictRecord& record = conflicts.first();
        expectTrue(record.key == shared, QStringLiteral("conflict is on the shared key"));
        expectEqInt(record.files.size(), 2, QStringLiteral("duplicate key in one file counts once"));
        if (record.files.size() == 2) {
            expectEqQString(record.files.at(0).path, onePath,
                            QStringLiteral("files are sorted by path"));
            expectTrue(!record.files.at(0).hasCompanionScript,
                       QStringLiteral("folder without script has no companion"));
            expectTrue(record.files.at(1).hasCompanionScript,
                       QStringLiteral("companion suffix match ignores case"));
        }
    }
    expectEqInt(accumulator.distinctKeyCount(), 0, QStringLiteral("take leaves it empty"));
}

void testParseCachePersistence() {
    QTemporaryDir tempDir;
    expectTrue(tempDir.isValid(), QStringLiteral("cache temp dir should be valid"));
    if (!tempDir.isValid()) {
        return;
    }

    const QString cacheKey =
        keyclash::ParseCache::makeKey(QStringLiteral("/mods/a.package"), 10, 1700000000);
    expectEqQString(cacheKey, QStringLiteral("/mods/a.package|10|1700000000"),
                    QStringLiteral("cache key is path|size|mtime"));

    const ResourceKey wide(0xFFFFFFFFU, 0x80000000U, 0xFEDCBA9876543210ULL);
    keyclash::ParseCache cache;
    cache.insert(cacheKey, {wide});

    const QString cachePath = tempDir.filePath(QStringLiteral("nested/cache.json"));
    QString error;
    expectTrue(cache.save(cachePath, &error),
               QStringLiteral("cache save should succeed: %1").arg(error));

    const keyclash::ParseCacheLoadResult loaded = keyclash::ParseCache::load(cachePath);
    expectTrue(!loaded.corrupted, QStringLiteral("saved cache loads cleanly"));
    const auto keys = loaded.cache.lookup(cacheKey);
    expectTrue(keys.has_value() && keys->size() == 1 && keys->first() == wide,
               QStringLiteral("64-bit instance survives the JSON round trip"));

    int skipped = 0;
    const auto mixed = keyclash::ParseCache::fromJsonBytes(
        QByteArray(R"({"p|1|2":{"keys":[[1,2,3]]},"bad|1|2":{"keys":[[1,2]]},"x":5})"), &skipped);
    expectTrue(mixed.has_value(), QStringLiteral("object document parses"));
    if (mixed.has_value()) {
        expectEqInt(mixed->size(), 1, QStringLiteral("only well-formed entries are kept"));
        const auto numeric = mixed->lookup(QStringLiteral("p|1|2"));
        expectTrue(numeric.has_value() && numeric->first() == ResourceKey(1, 2, 3),
                   QStringLiteral("numeric instance is accepted"));
    }
    expectEqInt(skipped, 2, QStringLiteral("malformed entries are counted"));

    const QString corruptPath = tempDir.filePath(QStringLiteral("corrupt.json"));
    expectTrue(fixtures::writeFile(corruptPath, QByteArray("{not json")),
               QStringLiteral("write corrupt cache"));
    const keyclash::ParseCacheLoadResult corrupt = keyclash::ParseCache::load(corruptPath);
    expectTrue(corrupt.corrupted, QStringLiteral("corrupt cache is flagged"));
    expectTrue(corrupt.cache.isEmpty(), QStringLiteral("corrupt cache loads empty"));

    const keyclash::ParseCacheLoadResult absent =
        keyclash::ParseCache::load(tempDir.filePath(QStringLiteral("absent.json")));
    expectTrue(!absent.corrupted && absent.cache.isEmpty(),
               QStringLiteral("missing cache is simply empty"));
}

void testFileEnumerator() {
    QTemporaryDir tempDir;
    expectTrue(tempDir.isValid(), QStringLiteral("FileEnumerator temp dir should be valid"));
    if (!tempDir.isValid()) {
        return;
    }

    const QString lower = tempDir.filePath(QStringLiteral("a.package"));
    const QString upper = tempDir.filePath(QStringLiteral("B.PACKAGE"));
    const QString nested = tempDir.filePath(QStringLiteral("sub/c.package"));
    expectTrue(fixtures::writeFile(lower, QByteArray("a")), QStringLiteral("write a.package"));
    expectTrue(fixtures::writeFile(upper, QByteArray("b")), QStringLiteral("write B.PACKAGE"));
    expectTrue(fixtures::writeFile(nested, QByteArray("c")), QStringLiteral("write sub/c.package"));
    expectTrue(fixtures::writeFile(tempDir.filePath(QStringLiteral("readme.txt")), QByteArray("r")),
               QStringLiteral("write readme.txt"));

    const QVector<QString> recursive = keyclash::FileEnumerator::enumerateContainers(
        tempDir.path(), QStringLiteral(".package"), true);
    expectEqInt(recursive.size(), 3, QStringLiteral("recursive walk finds nested containers"));
    expectTrue(std::is_sorted(recursive.begin(), recursive.end()),
               QStringLiteral("enumeration is sorted"));

    const QVector<QString> flat = keyclash::FileEnumerator::enumerateContainers(
        tempDir.path(), QStringLiteral(".package"), false);
    expectEqInt(flat.size(), 2, QStringLiteral("flat walk stays at the top level"));
    expectTrue(flat.contains(QFileInfo(upper).absoluteFilePath()),
               QStringLiteral("suffix match ignores case"));
}

void testInventorySnapshot() {
    QTemporaryDir tempDir;
    expectTrue(tempDir.isValid(), QStringLiteral("inventory temp dir should be valid"));
    if (!tempDir.isValid()) {
        return;
    }

    expectTrue(fixtures::writeFile(tempDir.filePath(QStringLiteral("a.package")), QByteArray("a")),
               QStringLiteral("write a.package"));
    expectTrue(
        fixtures::writeFile(tempDir.filePath(QStringLiteral("sub/c.package")), QByteArray("c")),
        QStringLiteral("write sub/c.package"));

    QJsonObject root;
    root.insert(QStringLiteral("root"), tempDir.path() + QLatin1Char('/'));
    QJsonArray entries;
    auto entry = [](const QString& path, const QString& type) {
        QJsonObject object;
        object.insert(QStringLiteral("path"), path);
        object.insert(QStringLiteral("type"), type);
        object.insert(QStringLiteral("mtime"), 1700000000);
        object.insert(QStringLiteral("size"), 1);
        return object;
    };
    entries.append(entry(QStringLiteral("sub/c.package"), QStringLiteral("PACKAGE")));
    entries.append(entry(QStringLiteral("a.package"), QStringLiteral("package")));
    entries.append(entry(QStringLiteral("gone.package"), QStringLiteral("package")));
    entries.append(entry(QStringLiteral("script.ts4script"), QStringLiteral("ts4script")));
    root.insert(QStringLiteral("entries"), entries);

    const auto snapshot = keyclash::InventorySnapshot::fromJsonBytes(QJsonDocument(root).toJson());
    expectTrue(snapshot.has_value(), QStringLiteral("inventory snapshot parses"));
    if (!snapshot.has_value()) {
        return;
    }
    expectTrue(snapshot->isRootedAt(tempDir.path()),
               QStringLiteral("root comparison ignores a trailing separator"));

    const QVector<QString> paths = snapshot->containerPaths(tempDir.path());
    expectEqInt(paths.size(), 2, QStringLiteral("existing package entries only"));
    if (paths.size() == 2) {
        expectEqQString(paths.at(0), QDir(tempDir.path()).filePath(QStringLiteral("a.package")),
                        QStringLiteral("inventory paths are sorted"));
    }
    expectTrue(snapshot->containerPaths(QDir::tempPath() + QStringLiteral("/elsewhere")).isEmpty(),
               QStringLiteral("snapshot rooted elsewhere yields nothing"));

    expectTrue(!keyclash::InventorySnapshot::fromJsonBytes(QByteArray(R"({"entries":[]})"))
                    .has_value(),
               QStringLiteral("snapshot without root is rejected"));
}

void testConflictReportText() {
    const QDateTime now = fixedNow();
    keyclash::ScanReport report;
    report.records.push_back(makeRecord(
        ResourceKey(0x015A1849U, 1U, 0x1122334455667788ULL),
        {makeFile(QStringLiteral("/mods/mccc/a.package"), now.addDays(-30), true),
         makeFile(QStringLiteral("/mods/b.package"), now.addDays(-40))},
        now));
    report.stats.filesTotal = 2;
    report.stats.filesParsedWithEntries = 2;
    report.stats.totalEntriesFound = 2;

    const QString text = keyclash::ConflictReport::toText(report);
    expectTrue(text.contains(QStringLiteral(
                   "[Critical] 0x015A1849:0x00000001:0x1122334455667788  Gameplay / Object Definition")),
               QStringLiteral("report line leads with severity and key"));
    expectTrue(text.contains(QStringLiteral("keywords=MC Command Center")),
               QStringLiteral("report line lists keyword tags"));
    expectTrue(text.contains(QStringLiteral("a.package  (/mods/mccc)  +script")),
               QStringLiteral("file line marks companion scripts"));
    expectTrue(text.contains(QStringLiteral("1 conflicting resources")),
               QStringLiteral("report counts records"));

    const QJsonObject json = QJsonDocument::fromJson(keyclash::ConflictReport::toJson(report)).object();
    const QJsonArray records = json.value(QStringLiteral("records")).toArray();
    expectEqInt(records.size(), 1, QStringLiteral("json report carries one record"));
    if (records.size() == 1) {
        const QJsonObject record = records.at(0).toObject();
        expectEqQString(record.value(QStringLiteral("instance")).toString(),
                        QStringLiteral("0x1122334455667788"),
                        QStringLiteral("json instance is hex"));
        expectEqInt(record.value(QStringLiteral("fileCount")).toInt(), 2,
                    QStringLiteral("json file count"));
    }
}

void testLoadOrderSuggestion() {
    const QDateTime now = fixedNow();
    const QDateTime old = now.addDays(-30);
    const keyclash::ConflictRecord audio =
        makeRecord(ResourceKey(0x0621661EU, 5U, 0x0000000100000002ULL),
                   {makeFile(QStringLiteral("/mods/audio/x.package"), old),
                    makeFile(QStringLiteral("/mods/shared/y.package"), old)},
                   now);
    const keyclash::ConflictRecord objectDef =
        makeRecord(ResourceKey(0x015A1849U, 1U, 0x1122334455667788ULL),
                   {makeFile(QStringLiteral("/mods/mccc/a.package"), old),
                    makeFile(QStringLiteral("/mods/shared/b.package"), old)},
                   now);
    const keyclash::ConflictRecord tuning =
        makeRecord(ResourceKey(0x01B2D882U, 2U, 0x0000000300000004ULL),
                   {makeFile(QStringLiteral("/mods/zz/c.package"), old),
                    makeFile(QStringLiteral("/mods/mccc/d.package"), old)},
                   now);

    // Folders are taken in record order, then ordered by priority; equal
    // priorities keep that first-seen order.
    const QJsonObject suggestion = keyclash::ConflictReport::loadOrderSuggestion(
        {audio, objectDef, tuning}, QStringLiteral("/mods"), now);
    expectEqQString(suggestion.value(QStringLiteral("mods_root")).toString(),
                    QStringLiteral("/mods"), QStringLiteral("suggestion names the mods root"));
    expectEqQString(suggestion.value(QStringLiteral("generated_at")).toString(),
                    now.toString(Qt::ISODate), QStringLiteral("suggestion carries its timestamp"));

    const QJsonArray entries = suggestion.value(QStringLiteral("entries")).toArray();
    QStringList folders;
    for (const QJsonValue& value : entries) {
        folders.push_back(value.toObject().value(QStringLiteral("folder")).toString());
    }
    expectEqQString(folders.join(QLatin1Char(',')),
                    QStringLiteral("/mods/mccc,/mods/zz,/mods/audio,/mods/shared"),
                    QStringLiteral("one entry per folder, most urgent first"));
    if (entries.size() == 4) {
        const QJsonObject first = entries.at(0).toObject();
        expectEqQString(first.value(QStringLiteral("severity")).toString(),
                        QStringLiteral("Critical"), QStringLiteral("entry severity"));
        expectEqQString(first.value(QStringLiteral("category")).toString(),
                        QStringLiteral("Gameplay"), QStringLiteral("entry category"));
        const QJsonArray priority = first.value(QStringLiteral("priority")).toArray();
        expectEqInt(priority.size(), 3, QStringLiteral("priority is a three-part tuple"));
        expectEqInt(priority.at(0).toInt(), 0, QStringLiteral("priority severity rank"));
        expectEqInt(priority.at(2).toInt(), -2, QStringLiteral("priority negated file count"));
        expectEqQString(first.value(QStringLiteral("keywords")).toArray().at(0).toString(),
                        QStringLiteral("MC Command Center"),
                        QStringLiteral("entry keywords come from the folder's file"));

        const QJsonObject last = entries.at(3).toObject();
        expectEqQString(last.value(QStringLiteral("severity")).toString(), QStringLiteral("Low"),
                        QStringLiteral("shared folder inherits the first record it appeared in"));
        expectEqInt(last.value(QStringLiteral("keywords")).toArray().size(), 0,
                    QStringLiteral("untagged folder has no keywords"));
    }

    expectEqInt(keyclash::ConflictReport::loadOrderSuggestion({}, QStringLiteral("/mods"), now)
                    .value(QStringLiteral("entries"))
                    .toArray()
                    .size(),
                0, QStringLiteral("no conflicts means no entries"));

    QTemporaryDir tempDir;
    expectTrue(tempDir.isValid(), QStringLiteral("suggestion temp dir should be valid"));
    if (!tempDir.isValid()) {
        return;
    }
    const QString savedPath = tempDir.filePath(QStringLiteral("out/load_order_suggestion.json"));
    QString error;
    expectTrue(keyclash::ConflictReport::saveLoadOrderSuggestion({objectDef}, QStringLiteral("/mods"),
                                                                 savedPath, &error),
               QStringLiteral("suggestion saves (%1)").arg(error));
    QFile saved(savedPath);
    expectTrue(saved.open(QIODevice::ReadOnly), QStringLiteral("saved suggestion is readable"));
    const QJsonObject reloaded = QJsonDocument::fromJson(saved.readAll()).object();
    expectEqInt(reloaded.value(QStringLiteral("entries")).toArray().size(), 2,
                QStringLiteral("saved suggestion lists both folders"));

    const QString blocker = tempDir.filePath(QStringLiteral("blocker"));
    expectTrue(fixtures::writeFile(blocker, QByteArray("x")), QStringLiteral("write blocker file"));
    error.clear();
    expectTrue(!keyclash::ConflictReport::saveLoadOrderSuggestion(
                   {objectDef}, QStringLiteral("/mods"), QDir(blocker).filePath(QStringLiteral("s.json")),
                   &error),
               QStringLiteral("suggestion under a regular file fails"));
    expectTrue(!error.isEmpty(), QStringLiteral("failed save explains why"));
}

}  // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    testResourceKeyFormatting();
    testIndexTableWidths();
    testIndexTableCountHintZeroUsesWholeTable();
    testIndexTableLegacyLayout();
    testIndexTableTieFavoursEarlierWidth();
    testTailFallbackRecoversKeys();
    testTailWindowRejectsBadPayloads();
    testInvalidContainers();
    testClassifierSeverities();
    testClassifierRecentChangeEscalation();
    testConflictOrdering();
    testKeywordTags();
    testAccumulatorKeepsOnlySharedKeys();
    testParseCachePersistence();
    testFileEnumerator();
    testInventorySnapshot();
    testConflictReportText();
    testLoadOrderSuggestion();

    if (g_failures == 0) {
        qInfo() << "All unit tests passed";
        return 0;
    }

    qCritical() << g_failures << "unit test(s) failed";
    return 1;
}
