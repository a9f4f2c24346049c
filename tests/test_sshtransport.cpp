/**
 * @file test_sshtransport.cpp
 * @brief Unit tests for ssh/scp command construction.
 *
 * Only argument building is tested here; nothing is executed against a
 * real host.
 */

#include <QtTest/QtTest>

#include "services/sshtransport.h"

class TestSshTransport : public QObject
{
    Q_OBJECT

private slots:
    void testSshArgumentsMinimal();
    void testSshArgumentsWithIdentityAndJump();
    void testScpArgumentsUsesUppercasePort();
    void testRemoteSpecEscapesPath();
    void testListCommand();
    void testStatCommandHasFallback();
    void testMkdirCommand();
    void testDescribeTarget();
    void testMissingProgramReportsStartFailure();
};

void TestSshTransport::testSshArgumentsMinimal()
{
    SshTarget target;
    target.host = "example.org";
    SshTransport transport(target);

    const QStringList args = transport.sshArguments("pwd");
    QCOMPARE(args, QStringList({"-p", "22", "-o", "BatchMode=yes", "root@example.org", "pwd"}));
}

void TestSshTransport::testSshArgumentsWithIdentityAndJump()
{
    SshTarget target;
    target.host = "10.0.0.5";
    target.port = 2222;
    target.user = "deploy";
    target.identityFile = "/home/me/.ssh/id_ed25519";
    target.proxyJump = "bastion:22";
    SshTransport transport(target);

    const QStringList args = transport.sshArguments("ls");
    QCOMPARE(args, QStringList({"-p", "2222",
                                "-i", "/home/me/.ssh/id_ed25519",
                                "-J", "bastion:22",
                                "-o", "BatchMode=yes",
                                "deploy@10.0.0.5", "ls"}));
}

void TestSshTransport::testScpArgumentsUsesUppercasePort()
{
    SshTarget target;
    target.host = "example.org";
    target.port = 2200;
    SshTransport transport(target);

    const QStringList args = transport.scpArguments("/tmp/a", "root@example.org:'/srv/a'");
    QCOMPARE(args, QStringList({"-q", "-O", "-P", "2200", "-o", "BatchMode=yes",
                                "/tmp/a", "root@example.org:'/srv/a'"}));
}

void TestSshTransport::testRemoteSpecEscapesPath()
{
    SshTarget target;
    target.host = "h";
    target.user = "u";
    SshTransport transport(target);

    QCOMPARE(transport.remoteSpec("/srv/my file's.txt"), QString("u@h:'/srv/my file'\\''s.txt'"));
}

void TestSshTransport::testListCommand()
{
    QCOMPARE(SshTransport::listCommand("/var/log"), QString("LC_ALL=C ls -p -1 -- '/var/log'"));
}

void TestSshTransport::testStatCommandHasFallback()
{
    const QString command = SshTransport::statCommand("/a b");
    QVERIFY(command.contains("stat -c %s -- '/a b'"));
    QVERIFY(command.contains("|| stat -f %z -- '/a b'"));
}

void TestSshTransport::testMkdirCommand()
{
    QCOMPARE(SshTransport::mkdirCommand("/srv/new dir"), QString("mkdir -p -- '/srv/new dir'"));
}

void TestSshTransport::testDescribeTarget()
{
    SshTarget target;
    target.host = "example.org";
    target.port = 2022;
    target.user = "alice";
    SshTransport transport(target);

    QCOMPARE(transport.describeTarget(), QString("alice@example.org:2022"));
}

void TestSshTransport::testMissingProgramReportsStartFailure()
{
    SshTarget target;
    target.host = "example.org";
    SshTransport transport(target, "/nonexistent/ssh-binary", "/nonexistent/scp-binary");

    CommandResult result = transport.list("/");
    QVERIFY(!result.isSuccess());
    QVERIFY(!result.errorString.isEmpty());
    QCOMPARE(result.exitCode, -1);
}

QTEST_MAIN(TestSshTransport)
#include "test_sshtransport.moc"
