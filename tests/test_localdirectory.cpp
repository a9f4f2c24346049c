/**
 * @file test_localdirectory.cpp
 * @brief Unit tests for LocalDirectory listing and error propagation.
 */

#include <QtTest/QtTest>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#ifdef Q_OS_UNIX
#include <unistd.h>
#endif

#include "services/localdirectory.h"

class TestLocalDirectory : public QObject
{
    Q_OBJECT

private slots:
    void testListsDirectoriesFirstCaseInsensitive();
    void testIncludesHiddenEntries();
    void testEmptyDirectory();
    void testMissingDirectoryIsError();
    void testFileIsNotADirectory();
    void testUnreadableDirectoryIsError();
    void testParentDirectory();

private:
    static void touch(const QString &path);
};

void TestLocalDirectory::touch(const QString &path)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
}

void TestLocalDirectory::testListsDirectoriesFirstCaseInsensitive()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    touch(dir.filePath("zeta.txt"));
    touch(dir.filePath("Alpha.txt"));
    QVERIFY(QDir(dir.path()).mkdir("src"));
    QVERIFY(QDir(dir.path()).mkdir("Build"));

    QString error;
    auto entries = LocalDirectory::listLocal(dir.path(), &error);
    QVERIFY2(entries.has_value(), qPrintable(error));

    QStringList names;
    for (const FileEntry &entry : *entries) {
        names << entry.name;
    }
    QCOMPARE(names, QStringList({"Build", "src", "Alpha.txt", "zeta.txt"}));
    QVERIFY(entries->at(0).isDirectory);
    QVERIFY(!entries->at(3).isDirectory);
}

void TestLocalDirectory::testIncludesHiddenEntries()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    touch(dir.filePath(".bashrc"));

    auto entries = LocalDirectory::listLocal(dir.path());
    QVERIFY(entries.has_value());
    QCOMPARE(entries->size(), 1);
    QCOMPARE(entries->first().name, QString(".bashrc"));
}

void TestLocalDirectory::testEmptyDirectory()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    auto entries = LocalDirectory::listLocal(dir.path());
    QVERIFY(entries.has_value());
    QVERIFY(entries->isEmpty());
}

void TestLocalDirectory::testMissingDirectoryIsError()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    QString error;
    auto entries = LocalDirectory::listLocal(dir.filePath("nope"), &error);
    QVERIFY(!entries.has_value());
    QVERIFY(error.contains("No such file or directory"));
}

void TestLocalDirectory::testFileIsNotADirectory()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    touch(dir.filePath("plain.txt"));

    QString error;
    QVERIFY(!LocalDirectory::listLocal(dir.filePath("plain.txt"), &error).has_value());
    QVERIFY(error.contains("Not a directory"));
}

void TestLocalDirectory::testUnreadableDirectoryIsError()
{
#ifdef Q_OS_UNIX
    if (geteuid() == 0) {
        QSKIP("Permission checks do not apply to root");
    }
#endif
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString locked = dir.filePath("locked");
    QVERIFY(QDir(dir.path()).mkdir("locked"));
    QVERIFY(QFile::setPermissions(locked, QFileDevice::WriteOwner));

    QString error;
    auto entries = LocalDirectory::listLocal(locked, &error);

    // Restore so QTemporaryDir can clean up
    QFile::setPermissions(locked, QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);

    QVERIFY(!entries.has_value());
    QVERIFY(error.contains("Permission denied"));
}

void TestLocalDirectory::testParentDirectory()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(QDir(dir.path()).mkdir("child"));

    QCOMPARE(LocalDirectory::parentDirectory(dir.filePath("child")), QDir(dir.path()).absolutePath());
    QVERIFY(LocalDirectory::parentDirectory(QDir::rootPath()).isEmpty());
}

QTEST_MAIN(TestLocalDirectory)
#include "test_localdirectory.moc"
