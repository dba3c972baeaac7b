#include <QtTest/QtTest>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include "JsonFileStorage.hpp"

// Load/save behaviour of the JSON file store: bootstrap from nothing,
// reject corrupt content, survive a full save/load cycle.

class TestJsonFileStorage : public QObject {
    Q_OBJECT

private:
    static void writeFile(const QString &path, const QByteArray &content)
    {
        QFile f(path);
        QVERIFY(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
        f.write(content);
    }

private slots:
    void initTestCase();
    void testMissingFileLoadsEmptyList();
    void testEmptyFileLoadsEmptyList();
    void testMalformedJsonIsError();
    void testNonArrayDocumentIsError();
    void testCorruptEntryIsError();
    void testDirectoryPathIsError();
    void testSaveThenLoadRoundTrip();
    void testSaveOverwritesPreviousContent();
    void testSaveLeavesNoTempFiles();
    void testSaveIntoMissingDirectoryFails();
};

void TestJsonFileStorage::initTestCase()
{
    QLoggingCategory::setFilterRules(QStringLiteral("todoserver.*=false"));
}

void TestJsonFileStorage::testMissingFileLoadsEmptyList()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    JsonFileStorage storage(dir.filePath("todo.json"));
    QString error;
    const auto list = storage.load(&error);

    QVERIFY2(list.has_value(), qPrintable(error));
    QVERIFY(list->isEmpty());
    // loading must not create the file
    QVERIFY(!QFile::exists(dir.filePath("todo.json")));
}

void TestJsonFileStorage::testEmptyFileLoadsEmptyList()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    const QString path = dir.filePath("todo.json");
    writeFile(path, QByteArray());

    JsonFileStorage storage(path);
    const auto list = storage.load();
    QVERIFY(list.has_value());
    QVERIFY(list->isEmpty());

    writeFile(path, "  \n");
    QVERIFY(storage.load().has_value());
}

void TestJsonFileStorage::testMalformedJsonIsError()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    const QString path = dir.filePath("todo.json");
    writeFile(path, "[{\"task\": \"half");

    JsonFileStorage storage(path);
    QString error;
    QVERIFY(!storage.load(&error).has_value());
    QVERIFY(error.contains("Malformed JSON"));
}

void TestJsonFileStorage::testNonArrayDocumentIsError()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    const QString path = dir.filePath("todo.json");
    writeFile(path, "{\"task\": \"not a list\"}");

    JsonFileStorage storage(path);
    QString error;
    QVERIFY(!storage.load(&error).has_value());
    QVERIFY(!error.isEmpty());
}

void TestJsonFileStorage::testCorruptEntryIsError()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    const QString path = dir.filePath("todo.json");
    writeFile(path, "[{\"task\": \"ok\"}, 42]");

    JsonFileStorage storage(path);
    QString error;
    QVERIFY(!storage.load(&error).has_value());
    QVERIFY(error.contains("Corrupt"));
}

void TestJsonFileStorage::testDirectoryPathIsError()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(QDir(dir.path()).mkdir("todo.json"));

    JsonFileStorage storage(dir.filePath("todo.json"));
    QString error;
    QVERIFY(!storage.load(&error).has_value());
    QVERIFY(!error.isEmpty());
}

void TestJsonFileStorage::testSaveThenLoadRoundTrip()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    TaskList list;
    list.add(QStringLiteral("Task Number 1."));
    list.add(QStringLiteral("Task Number 2."));
    list.add(QStringLiteral("Tâche numéro 3 ✓"));
    QVERIFY(list.complete(2));

    JsonFileStorage storage(dir.filePath("todo.json"));
    QString error;
    QVERIFY2(storage.save(list, &error), qPrintable(error));

    const auto loaded = storage.load(&error);
    QVERIFY2(loaded.has_value(), qPrintable(error));
    QCOMPARE(loaded->size(), 3);
    for (int i = 0; i < list.size(); ++i) {
        QCOMPARE(loaded->all().at(i).task, list.all().at(i).task);
        QCOMPARE(loaded->all().at(i).done, list.all().at(i).done);
        QCOMPARE(loaded->all().at(i).position, i + 1);
    }
    QVERIFY(loaded->all().at(1).completedAt.isValid());
}

void TestJsonFileStorage::testSaveOverwritesPreviousContent()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    JsonFileStorage storage(dir.filePath("todo.json"));

    TaskList three;
    three.add("a");
    three.add("b");
    three.add("c");
    QVERIFY(storage.save(three));

    TaskList one;
    one.add("only");
    QVERIFY(storage.save(one));

    const auto loaded = storage.load();
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->size(), 1);
    QCOMPARE(loaded->all().at(0).task, QStringLiteral("only"));
}

void TestJsonFileStorage::testSaveLeavesNoTempFiles()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    TaskList list;
    list.add("a");

    JsonFileStorage storage(dir.filePath("todo.json"));
    QVERIFY(storage.save(list));
    QVERIFY(storage.save(list));

    const QStringList entries = QDir(dir.path()).entryList(QDir::Files | QDir::Hidden);
    QCOMPARE(entries, QStringList{QStringLiteral("todo.json")});

    QFile f(dir.filePath("todo.json"));
    QVERIFY(f.open(QIODevice::ReadOnly));
    QVERIFY(QJsonDocument::fromJson(f.readAll()).isArray());
}

void TestJsonFileStorage::testSaveIntoMissingDirectoryFails()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    TaskList list;
    list.add("a");

    JsonFileStorage storage(dir.filePath("no/such/dir/todo.json"));
    QString error;
    QVERIFY(!storage.save(list, &error));
    QVERIFY(!error.isEmpty());
}

QTEST_GUILESS_MAIN(TestJsonFileStorage)
#include "tst_jsonfilestorage.moc"
