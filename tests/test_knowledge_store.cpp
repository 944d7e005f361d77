#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>

#include "knowledge/knowledge_store.hpp"
#include "utils/logging.hpp"

class KnowledgeStoreTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void init();
    void testLookupFallback();
    void testAddOverwrites();
    void testEmptyStringsAllowed();
    void testSaveLoadRoundTrip();
    void testLoadIdempotent();
    void testLoadMergesAndOverwrites();
    void testLoadMissingFile();
    void testLoadNonStringValue();
    void testLoadNonObject();
    void testLoadInvalidJson();
    void testLoadDirectory();
    void testLoadSymlinkLoop();
    void testMissingFileNoticeShownAtWarnLevel();
    void testSavePrettyPrinted();
    void testSaveFailureKeepsMemory();
    void testSaveWithInvalidUtf8KeepsOtherEntries();
    void testBackingPath();
    void testAllSnapshot();

private:
    QTemporaryDir m_tempDir;
    std::ostringstream m_notices;

    std::string path(const char *name) const;
    static void writeFile(const std::string &path, const std::string &content);
    static std::string readFile(const std::string &path);
};

void KnowledgeStoreTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
}

void KnowledgeStoreTests::init()
{
    m_notices.str({});
    m_notices.clear();
}

std::string KnowledgeStoreTests::path(const char *name) const
{
    return m_tempDir.filePath(QString::fromUtf8(name)).toStdString();
}

void KnowledgeStoreTests::writeFile(const std::string &path, const std::string &content)
{
    std::ofstream output(path, std::ios::trunc);
    output << content;
}

std::string KnowledgeStoreTests::readFile(const std::string &path)
{
    std::ifstream input(path);
    std::stringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

void KnowledgeStoreTests::testLookupFallback()
{
    minigpt::utils::Logger logger(minigpt::utils::LogConfig{}, m_notices);
    minigpt::knowledge::KnowledgeStore store(path("unused.json"), logger);

    QCOMPARE(QString::fromStdString(store.Lookup("anything")),
             QStringLiteral("Sorry, I don't understand that."));
    QCOMPARE(QString::fromStdString(store.Lookup("")), QString::fromUtf8(minigpt::knowledge::kFallbackResponse));
    QCOMPARE(static_cast<int>(store.Size()), 0);
}

void KnowledgeStoreTests::testAddOverwrites()
{
    minigpt::utils::Logger logger(minigpt::utils::LogConfig{}, m_notices);
    minigpt::knowledge::KnowledgeStore store(path("unused.json"), logger);

    store.Add("k", "r1");
    store.Add("k", "r2");

    QCOMPARE(static_cast<int>(store.Size()), 1);
    QCOMPARE(QString::fromStdString(store.Lookup("k")), QStringLiteral("r2"));
}

void KnowledgeStoreTests::testEmptyStringsAllowed()
{
    minigpt::utils::Logger logger(minigpt::utils::LogConfig{}, m_notices);
    minigpt::knowledge::KnowledgeStore store(path("unused.json"), logger);

    store.Add("", "");
    QVERIFY(store.Contains(""));
    QVERIFY(store.Lookup("").empty());
}

void KnowledgeStoreTests::testSaveLoadRoundTrip()
{
    const auto file = path("roundtrip.json");
    const std::map<std::string, std::string> expected = {
        {"hello", "hi there"},
        {"how are you?", "Fine, \"thanks\"\nand you?"},
        {"unicode", "caf\xc3\xa9 \xe2\x9c\x93"},
        {"empty", ""}
    };

    minigpt::utils::Logger logger(minigpt::utils::LogConfig{}, m_notices);
    {
        minigpt::knowledge::KnowledgeStore store(file, logger);
        for (const auto &[key, response] : expected) {
            store.Add(key, response);
        }
        QVERIFY(store.Save(file));
    }

    minigpt::knowledge::KnowledgeStore fresh(path("other.json"), logger);
    QVERIFY(fresh.Load(file) == minigpt::knowledge::LoadResult::kLoaded);
    QCOMPARE(static_cast<int>(fresh.Size()), static_cast<int>(expected.size()));
    for (const auto &[key, response] : expected) {
        QVERIFY(fresh.Contains(key));
        QCOMPARE(QString::fromStdString(fresh.Lookup(key)), QString::fromStdString(response));
    }
}

void KnowledgeStoreTests::testLoadIdempotent()
{
    const auto file = path("idempotent.json");
    writeFile(file, R"({"a": "1", "b": "2"})");

    minigpt::utils::Logger logger(minigpt::utils::LogConfig{}, m_notices);
    minigpt::knowledge::KnowledgeStore once(file, logger);
    minigpt::knowledge::KnowledgeStore twice(file, logger);
    once.Add("c", "3");
    twice.Add("c", "3");

    QVERIFY(once.Load() == minigpt::knowledge::LoadResult::kLoaded);
    QVERIFY(twice.Load() == minigpt::knowledge::LoadResult::kLoaded);
    QVERIFY(twice.Load() == minigpt::knowledge::LoadResult::kLoaded);

    const auto a = once.All();
    const auto b = twice.All();
    QCOMPARE(static_cast<int>(a.size()), 3);
    QCOMPARE(static_cast<int>(b.size()), 3);
    for (std::size_t i = 0; i < a.size(); ++i) {
        QCOMPARE(QString::fromStdString(a[i].key), QString::fromStdString(b[i].key));
        QCOMPARE(QString::fromStdString(a[i].response), QString::fromStdString(b[i].response));
    }
}

void KnowledgeStoreTests::testLoadMergesAndOverwrites()
{
    const auto file = path("patch.json");
    writeFile(file, R"({"hello": "patched", "new": "entry"})");

    minigpt::utils::Logger logger(minigpt::utils::LogConfig{}, m_notices);
    minigpt::knowledge::KnowledgeStore store(file, logger);
    store.Add("hello", "original");
    store.Add("kept", "still here");

    QVERIFY(store.Load(file) == minigpt::knowledge::LoadResult::kLoaded);
    QCOMPARE(static_cast<int>(store.Size()), 3);
    QCOMPARE(QString::fromStdString(store.Lookup("hello")), QStringLiteral("patched"));
    QCOMPARE(QString::fromStdString(store.Lookup("new")), QStringLiteral("entry"));
    QCOMPARE(QString::fromStdString(store.Lookup("kept")), QStringLiteral("still here"));
    QVERIFY(m_notices.str().find("[knowledge] Knowledge base loaded") != std::string::npos);
}

void KnowledgeStoreTests::testLoadMissingFile()
{
    minigpt::utils::Logger logger(minigpt::utils::LogConfig{}, m_notices);
    minigpt::knowledge::KnowledgeStore store(path("missing.json"), logger);
    store.Add("kept", "value");

    QVERIFY(store.Load(path("missing.json")) == minigpt::knowledge::LoadResult::kNotFound);
    QCOMPARE(static_cast<int>(store.Size()), 1);
    QCOMPARE(QString::fromStdString(store.Lookup("kept")), QStringLiteral("value"));
    QVERIFY(m_notices.str().find("not found") != std::string::npos);
}

void KnowledgeStoreTests::testLoadNonStringValue()
{
    const auto file = path("non_string.json");
    writeFile(file, R"({"a": 1})");

    minigpt::utils::Logger logger(minigpt::utils::LogConfig{}, m_notices);
    minigpt::knowledge::KnowledgeStore store(file, logger);
    store.Add("kept", "value");

    QVERIFY(store.Load(file) == minigpt::knowledge::LoadResult::kMalformed);
    QCOMPARE(static_cast<int>(store.Size()), 1);
    QVERIFY(!store.Contains("a"));
}

void KnowledgeStoreTests::testLoadNonObject()
{
    const auto file = path("array.json");
    writeFile(file, "[1, 2]");

    minigpt::utils::Logger logger(minigpt::utils::LogConfig{}, m_notices);
    minigpt::knowledge::KnowledgeStore store(file, logger);

    QVERIFY(store.Load(file) == minigpt::knowledge::LoadResult::kMalformed);
    QCOMPARE(static_cast<int>(store.Size()), 0);
}

void KnowledgeStoreTests::testLoadInvalidJson()
{
    const auto file = path("broken.json");
    writeFile(file, R"({"a": "1", "b": )");

    minigpt::utils::Logger logger(minigpt::utils::LogConfig{}, m_notices);
    minigpt::knowledge::KnowledgeStore store(file, logger);
    store.Add("kept", "value");

    QVERIFY(store.Load(file) == minigpt::knowledge::LoadResult::kMalformed);
    QCOMPARE(static_cast<int>(store.Size()), 1);
    QVERIFY(!store.Contains("a"));
    QVERIFY(m_notices.str().find("Error decoding JSON") != std::string::npos);

    writeFile(file, "");
    QVERIFY(store.Load(file) == minigpt::knowledge::LoadResult::kMalformed);
}

void KnowledgeStoreTests::testLoadDirectory()
{
    minigpt::utils::Logger logger(minigpt::utils::LogConfig{}, m_notices);
    minigpt::knowledge::KnowledgeStore store(path("unused.json"), logger);

    QVERIFY(store.Load(m_tempDir.path().toStdString()) == minigpt::knowledge::LoadResult::kUnreadable);
    QCOMPARE(static_cast<int>(store.Size()), 0);
}

void KnowledgeStoreTests::testLoadSymlinkLoop()
{
    const auto link = path("loop.json");
    std::error_code error;
    std::filesystem::remove(link, error);
    std::filesystem::create_symlink("loop.json", link, error);
    QVERIFY(!error);

    minigpt::utils::Logger logger(minigpt::utils::LogConfig{}, m_notices);
    minigpt::knowledge::KnowledgeStore store(link, logger);
    store.Add("kept", "value");

    QVERIFY(store.Load() == minigpt::knowledge::LoadResult::kUnreadable);
    QCOMPARE(static_cast<int>(store.Size()), 1);
    QVERIFY(m_notices.str().find("Cannot access knowledge file") != std::string::npos);
    QVERIFY(m_notices.str().find("not found") == std::string::npos);
}

void KnowledgeStoreTests::testMissingFileNoticeShownAtWarnLevel()
{
    minigpt::utils::Logger logger(minigpt::utils::LogConfig{minigpt::utils::LogLevel::kWarn}, m_notices);
    minigpt::knowledge::KnowledgeStore store(path("absent.json"), logger);

    QVERIFY(store.Load() == minigpt::knowledge::LoadResult::kNotFound);
    QVERIFY(m_notices.str().find("[knowledge] Knowledge file") != std::string::npos);
}

void KnowledgeStoreTests::testSavePrettyPrinted()
{
    const auto file = path("pretty.json");
    minigpt::utils::Logger logger(minigpt::utils::LogConfig{}, m_notices);
    minigpt::knowledge::KnowledgeStore store(file, logger);
    store.Add("b", "2");
    store.Add("a", "1");

    QVERIFY(store.Save());
    QCOMPARE(QString::fromStdString(readFile(file)),
             QStringLiteral("{\n    \"a\": \"1\",\n    \"b\": \"2\"\n}\n"));
}

void KnowledgeStoreTests::testSaveFailureKeepsMemory()
{
    const auto file = path("no_such_dir/knowledge.json");
    minigpt::utils::Logger logger(minigpt::utils::LogConfig{}, m_notices);
    minigpt::knowledge::KnowledgeStore store(file, logger);
    store.Add("hello", "hi there");

    QVERIFY(!store.Save(file));
    QCOMPARE(static_cast<int>(store.Size()), 1);
    QCOMPARE(QString::fromStdString(store.Lookup("hello")), QStringLiteral("hi there"));
    QVERIFY(m_notices.str().find("Error saving knowledge") != std::string::npos);
}

void KnowledgeStoreTests::testSaveWithInvalidUtf8KeepsOtherEntries()
{
    const auto file = path("invalid_utf8.json");
    minigpt::utils::Logger logger(minigpt::utils::LogConfig{}, m_notices);
    minigpt::knowledge::KnowledgeStore store(file, logger);
    store.Add("bad\xff", "x");
    store.Add("good", "y");

    QVERIFY(store.Save());
    QVERIFY(store.Save());
    QCOMPARE(static_cast<int>(store.Size()), 2);
    QVERIFY(m_notices.str().find("Invalid UTF-8") != std::string::npos);

    minigpt::knowledge::KnowledgeStore reloaded(file, logger);
    QVERIFY(reloaded.Load() == minigpt::knowledge::LoadResult::kLoaded);
    QCOMPARE(static_cast<int>(reloaded.Size()), 2);
    QCOMPARE(QString::fromStdString(reloaded.Lookup("good")), QStringLiteral("y"));
    QVERIFY(reloaded.Contains("bad\xef\xbf\xbd"));
}

void KnowledgeStoreTests::testBackingPath()
{
    const auto file = path("backing.json");
    minigpt::utils::Logger logger(minigpt::utils::LogConfig{}, m_notices);
    minigpt::knowledge::KnowledgeStore store(file, logger);
    QCOMPARE(QString::fromStdString(store.BackingPath()), QString::fromStdString(file));

    store.Add("hello", "hi there");
    QVERIFY(store.Save());

    minigpt::knowledge::KnowledgeStore reloaded(file, logger);
    QVERIFY(reloaded.Load() == minigpt::knowledge::LoadResult::kLoaded);
    QCOMPARE(QString::fromStdString(reloaded.Lookup("hello")), QStringLiteral("hi there"));
}

void KnowledgeStoreTests::testAllSnapshot()
{
    minigpt::utils::Logger logger(minigpt::utils::LogConfig{}, m_notices);
    minigpt::knowledge::KnowledgeStore store(path("unused.json"), logger);
    store.Add("zeta", "z");
    store.Add("alpha", "a");

    auto entries = store.All();
    QCOMPARE(static_cast<int>(entries.size()), 2);
    QCOMPARE(QString::fromStdString(entries[0].key), QStringLiteral("alpha"));
    QCOMPARE(QString::fromStdString(entries[1].key), QStringLiteral("zeta"));

    entries[0].response = "changed";
    QCOMPARE(QString::fromStdString(store.Lookup("alpha")), QStringLiteral("a"));
}

QTEST_MAIN(KnowledgeStoreTests)
#include "test_knowledge_store.moc"
