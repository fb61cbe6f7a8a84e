#include "soberlauncher/processsupervisor.hpp"
#include "soberlauncher/profilecatalog.hpp"

#include <QFile>
#include <QTemporaryDir>
#include <QtTest/QtTest>

#include <cerrno>
#include <csignal>
#include <string>

namespace {

sl_mgmt::launch_target
sleeper()
{
    return {{"sleep", "30"}, "org.example.Sleeper", {"true"}};
}

// Writes "$HOME" (or $0, the appended argument) into path
sl_mgmt::launch_target
writer(const QString &what, const QString &path)
{
    return {{"sh", "-c", "printf '%s' \"" + what.toStdString() + "\" > '" + path.toStdString() + "'"},
            "org.example.Writer", {}};
}

QString
read_file(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return QString();
    return QString::fromUtf8(file.readAll());
}

bool
process_gone(pid_t pid)
{
    return ::kill(pid, 0) != 0 && errno == ESRCH;
}

} // namespace

class ProcessSupervisorTest : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir tmp;

    std::string root() const { return tmp.path().toStdString(); }

private slots:
    void initTestCase()
    {
        QVERIFY(tmp.isValid());
    }

    void soberTarget()
    {
        sl_mgmt::launch_target t = sl_mgmt::launch_target::sober();
        std::vector<std::string> command = {"flatpak", "run", "org.vinegarhq.Sober"};
        std::vector<std::string> kill = {"flatpak", "kill", "org.vinegarhq.Sober"};
        QCOMPARE(t.command, command);
        QCOMPARE(QString::fromStdString(t.identity), QString("org.vinegarhq.Sober"));
        QCOMPARE(t.kill_command, kill);
    }

    void invocationPerProfile()
    {
        sl_mgmt::process_supervisor sup(root());

        sl_mgmt::invocation main_inv = sup.build_invocation(sl_mgmt::main_profile);
        QVERIFY(main_inv.home.empty());
        QCOMPARE(main_inv.argv.size(), size_t(3));

        sl_mgmt::launch_options options;
        options.argument = "roblox://experience?placeId=1";
        sl_mgmt::invocation alt = sup.build_invocation("Alt", options);
        QCOMPARE(QString::fromStdString(alt.home), tmp.path() + "/Alt");
        QCOMPARE(alt.argv.size(), size_t(4));
        QCOMPARE(QString::fromStdString(alt.argv.back()), QString("roblox://experience?placeId=1"));
    }

    void shellCommandLine()
    {
        sl_mgmt::process_supervisor sup(root());

        QCOMPARE(QString::fromStdString(sup.shell_command_line(sl_mgmt::main_profile)),
                 QString("flatpak run org.vinegarhq.Sober"));
        QCOMPARE(QString::fromStdString(sup.shell_command_line("Alt", "roblox://x")),
                 QString("env HOME=\"%1/Alt\" flatpak run org.vinegarhq.Sober \"roblox://x\"").arg(tmp.path()));
    }

    void launchTwiceKeepsOneProcess()
    {
        sl_mgmt::process_supervisor sup(root(), sleeper());

        sl_mgmt::launch_result first = sup.launch("Alt");
        QCOMPARE(first.status, sl_mgmt::launch_status::launched);
        QVERIFY(first.pid > 0);
        QVERIFY(sup.is_live("Alt"));
        QVERIFY(sup.any_live());

        sl_mgmt::launch_result second = sup.launch("Alt");
        QCOMPARE(second.status, sl_mgmt::launch_status::already_running);
        QCOMPARE(second.pid, first.pid);
        QCOMPARE(sup.live_profiles(), profile_set{"Alt"});

        sup.terminate_all();
    }

    void exitIsSeenOnPoll()
    {
        sl_mgmt::process_supervisor sup(root(), sleeper());

        sl_mgmt::launch_result r = sup.launch("Alt");
        QVERIFY(r.ok());
        QCOMPARE(::kill(r.pid, SIGKILL), 0);

        // Until the next poll the mapping still has it
        QVERIFY(sup.is_live("Alt"));

        profile_set exited;
        QTRY_VERIFY_WITH_TIMEOUT((exited = sup.poll()).count("Alt") == 1, 5000);
        QVERIFY(!sup.is_live("Alt"));
        QVERIFY(sup.poll().empty());
    }

    void relaunchAfterExit()
    {
        sl_mgmt::process_supervisor sup(root(), sleeper());

        sl_mgmt::launch_result first = sup.launch("Alt");
        QVERIFY(first.ok());
        QCOMPARE(::kill(first.pid, SIGKILL), 0);

        // launch() looks at the process itself instead of the last poll
        sl_mgmt::launch_result second;
        QTRY_VERIFY_WITH_TIMEOUT((second = sup.launch("Alt")).status == sl_mgmt::launch_status::launched, 5000);
        QVERIFY(second.pid != first.pid);
        QVERIFY(sup.is_live("Alt"));

        sup.terminate_all();
    }

    void missingBinaryFails()
    {
        sl_mgmt::process_supervisor sup(root(), {{"/nonexistent/soberlauncher-test-binary"}, "org.example.None", {}});

        sl_mgmt::launch_result r = sup.launch("Alt");
        QCOMPARE(r.status, sl_mgmt::launch_status::spawn_failed);
        QVERIFY(!r.ok());
        QVERIFY(!r.error.empty());
        QVERIFY(!sup.is_live("Alt"));
        QVERIFY(!sup.any_live());
    }

    void profileGetsItsOwnHome()
    {
        const QString out = tmp.path() + "/home-alt.txt";
        sl_mgmt::process_supervisor sup(root(), writer("$HOME", out));

        QVERIFY(sup.launch("Alt").ok());
        QTRY_VERIFY_WITH_TIMEOUT(sup.poll().count("Alt") == 1, 5000);
        QCOMPARE(read_file(out), tmp.path() + "/Alt");
    }

    void mainProfileKeepsRealHome()
    {
        const QString out = tmp.path() + "/home-main.txt";
        sl_mgmt::process_supervisor sup(root(), writer("$HOME", out));

        QVERIFY(sup.launch(sl_mgmt::main_profile).ok());
        QTRY_VERIFY_WITH_TIMEOUT(sup.poll().count(sl_mgmt::main_profile) == 1, 5000);
        QCOMPARE(read_file(out), QString::fromLocal8Bit(qgetenv("HOME")));
    }

    void terminateAllClearsEverything()
    {
        sl_mgmt::process_supervisor sup(root(), sleeper());

        sl_mgmt::launch_result a = sup.launch("A");
        sl_mgmt::launch_result b = sup.launch("B");
        QVERIFY(a.ok() && b.ok());

        sup.terminate_all();
        QVERIFY(!sup.any_live());
        QVERIFY(sup.live_profiles().empty());
        QVERIFY(process_gone(a.pid));
        QVERIFY(process_gone(b.pid));
    }

    void forgetStopsOneProfile()
    {
        sl_mgmt::process_supervisor sup(root(), sleeper());

        sl_mgmt::launch_result a = sup.launch("A");
        sl_mgmt::launch_result b = sup.launch("B");
        QVERIFY(a.ok() && b.ok());

        QVERIFY(sup.forget("A"));
        QVERIFY(!sup.forget("A"));
        QVERIFY(process_gone(a.pid));
        QCOMPARE(sup.live_profiles(), profile_set{"B"});

        sup.terminate_all();
    }

    void detachedSpawnIsNotTracked()
    {
        const QString out = tmp.path() + "/detached.txt";
        sl_mgmt::process_supervisor sup(root(), writer("$0", out));

        sl_mgmt::launch_result r = sup.spawn_detached("hello");
        QVERIFY(r.ok());
        QCOMPARE(r.pid, pid_t(0));
        QVERIFY(!sup.any_live());
        QTRY_COMPARE_WITH_TIMEOUT(read_file(out), QString("hello"), 5000);
    }

    void detachedProfileLaunchUsesProfileHome()
    {
        const QString out = tmp.path() + "/detached-home.txt";
        sl_mgmt::process_supervisor sup(root(), writer("$HOME", out));

        QVERIFY(sup.launch_detached("Alt").ok());
        QVERIFY(!sup.any_live());
        QTRY_COMPARE_WITH_TIMEOUT(read_file(out), tmp.path() + "/Alt", 5000);
    }

    void detachedMissingBinaryFails()
    {
        sl_mgmt::process_supervisor sup(root(), {{"/nonexistent/soberlauncher-test-binary"}, "org.example.None", {}});
        sl_mgmt::launch_result r = sup.spawn_detached("x");
        QVERIFY(!r.ok());
        QVERIFY(!r.error.empty());
    }
};

QTEST_GUILESS_MAIN(ProcessSupervisorTest)
#include "processsupervisortest.moc"
