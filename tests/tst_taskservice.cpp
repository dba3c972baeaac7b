#include <QtTest/QtTest>
#include <QTemporaryDir>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "JsonFileStorage.hpp"
#include "TaskServiceImpl.hpp"

namespace {

// Loads whatever it was given and refuses every save.
class ReadOnlyStorage : public IStorage {
public:
    std::optional<TaskList> load(QString *) const override { return list; }

    bool save(const TaskList &, QString *outError) override {
        ++saveAttempts;
        if (outError) {
            *outError = QStringLiteral("disk full");
        }
        return false;
    }

    TaskList list;
    int saveAttempts = 0;
};

} // namespace

class TestTaskService : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_dir;
    std::shared_ptr<JsonFileStorage> m_storage;
    std::unique_ptr<TaskServiceImpl> m_service;

private slots:
    void initTestCase()
    {
        QLoggingCategory::setFilterRules(QStringLiteral("todoserver.*=false"));
        QVERIFY(m_dir.isValid());
    }

    void init()
    {
        QFile::remove(m_dir.filePath("todo.json"));
        m_storage = std::make_shared<JsonFileStorage>(m_dir.filePath("todo.json"));
        m_service = std::make_unique<TaskServiceImpl>(m_storage);
    }

    void testAddPersistsImmediately()
    {
        Task created;
        QCOMPARE(m_service->addTask("Task Number 1.", created), TaskOutcome::Ok);
        QCOMPARE(created.position, 1);

        const auto onDisk = m_storage->load();
        QVERIFY(onDisk.has_value());
        QCOMPARE(onDisk->size(), 1);
        QCOMPARE(onDisk->all().at(0).task, QStringLiteral("Task Number 1."));
    }

    void testAddEmptyIsInvalidAndWritesNothing()
    {
        Task created;
        QString error;
        QCOMPARE(m_service->addTask("", created, &error), TaskOutcome::InvalidInput);
        QVERIFY(!error.isEmpty());
        QVERIFY(!QFile::exists(m_dir.filePath("todo.json")));
    }

    void testAddWhitespaceOnlyIsStored()
    {
        Task created;
        QCOMPARE(m_service->addTask("  ", created), TaskOutcome::Ok);
        QCOMPARE(created.position, 1);

        const auto onDisk = m_storage->load();
        QVERIFY(onDisk.has_value());
        QCOMPARE(onDisk->size(), 1);
        QCOMPARE(onDisk->all().at(0).task, QStringLiteral("  "));
    }

    void testGetAllOnFirstRunIsEmpty()
    {
        QVector<Task> tasks;
        QCOMPARE(m_service->getAllTasks(tasks), TaskOutcome::Ok);
        QVERIFY(tasks.isEmpty());
    }

    void testGetTask()
    {
        Task created;
        QCOMPARE(m_service->addTask("first", created), TaskOutcome::Ok);
        QCOMPARE(m_service->addTask("second", created), TaskOutcome::Ok);

        Task found;
        QCOMPARE(m_service->getTask(2, found), TaskOutcome::Ok);
        QCOMPARE(found.task, QStringLiteral("second"));
        QCOMPARE(found.position, 2);

        QString error;
        QCOMPARE(m_service->getTask(500, found, &error), TaskOutcome::NotFound);
        QVERIFY(error.contains("500"));
    }

    void testCompleteAndDelete()
    {
        Task created;
        for (const char *text : {"a", "b", "c"}) {
            QCOMPARE(m_service->addTask(text, created), TaskOutcome::Ok);
        }

        QCOMPARE(m_service->completeTask(3), TaskOutcome::Ok);
        QCOMPARE(m_service->deleteTask(1), TaskOutcome::Ok);

        QVector<Task> tasks;
        QCOMPARE(m_service->getAllTasks(tasks), TaskOutcome::Ok);
        QCOMPARE(tasks.size(), 2);
        QCOMPARE(tasks.at(0).task, QStringLiteral("b"));
        QCOMPARE(tasks.at(0).position, 1);
        QVERIFY(!tasks.at(0).done);
        QCOMPARE(tasks.at(1).task, QStringLiteral("c"));
        QCOMPARE(tasks.at(1).position, 2);
        QVERIFY(tasks.at(1).done);

        QCOMPARE(m_service->completeTask(3), TaskOutcome::NotFound);
        QCOMPARE(m_service->deleteTask(0), TaskOutcome::NotFound);
    }

    void testCorruptFileIsStorageFailure()
    {
        QFile f(m_dir.filePath("todo.json"));
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("not json");
        f.close();

        QVector<Task> tasks;
        QString error;
        QCOMPARE(m_service->getAllTasks(tasks, &error), TaskOutcome::StorageFailure);
        QVERIFY(!error.isEmpty());

        Task created;
        QCOMPARE(m_service->addTask("x", created), TaskOutcome::StorageFailure);
    }

    void testFailedSaveIsNotReportedAsSuccess()
    {
        auto storage = std::make_shared<ReadOnlyStorage>();
        storage->list.add("existing");
        TaskServiceImpl service(storage);

        Task created;
        QString error;
        QCOMPARE(service.addTask("new", created, &error), TaskOutcome::StorageFailure);
        QCOMPARE(error, QStringLiteral("disk full"));
        QCOMPARE(service.completeTask(1), TaskOutcome::StorageFailure);
        QCOMPARE(service.deleteTask(1), TaskOutcome::StorageFailure);
        QCOMPARE(storage->saveAttempts, 3);

        // not-found is decided before any save is attempted
        QCOMPARE(service.deleteTask(9), TaskOutcome::NotFound);
        QCOMPARE(storage->saveAttempts, 3);
    }

    void testConcurrentAddsLoseNothing()
    {
        constexpr int kThreads = 8;
        constexpr int kPerThread = 15;

        std::vector<std::thread> workers;
        std::atomic<int> failures{0};
        for (int t = 0; t < kThreads; ++t) {
            workers.emplace_back([this, t, &failures]() {
                for (int i = 0; i < kPerThread; ++i) {
                    Task created;
                    if (m_service->addTask(QString("t%1-%2").arg(t).arg(i), created)
                        != TaskOutcome::Ok) {
                        ++failures;
                    }
                }
            });
        }
        for (auto &worker : workers) {
            worker.join();
        }

        QCOMPARE(failures.load(), 0);

        QVector<Task> tasks;
        QCOMPARE(m_service->getAllTasks(tasks), TaskOutcome::Ok);
        QCOMPARE(tasks.size(), kThreads * kPerThread);
        for (int i = 0; i < tasks.size(); ++i) {
            QCOMPARE(tasks.at(i).position, i + 1);
        }
    }
};

QTEST_GUILESS_MAIN(TestTaskService)
#include "tst_taskservice.moc"
