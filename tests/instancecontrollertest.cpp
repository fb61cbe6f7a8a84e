#include "soberlauncher/instancecontroller.hpp"
#include "soberlauncher/profiledata.hpp"

#include <QDir>
#include <QTemporaryDir>
#include <QtTest/QtTest>

#include <csignal>
#include <memory>
#include <string>

namespace {

sl_mgmt::launch_target
sleeper()
{
    return {{"sleep", "30"}, "org.example.Sleeper", {"true"}};
}

// A probe that reports whatever *seen says
std::vector<sl_mgmt::instance_probe>
switchable_probe(std::shared_ptr<bool> seen)
{
    return {{"fake", [] { return true; }, [seen] { return *seen; }}};
}

} // namespace

class InstanceControllerTest : public QObject
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

    void emptySelection()
    {
        sl_mgmt::settings_record settings;
        sl_mgmt::instance_controller ctl(settings, root(), sleeper(), {});

        sl_mgmt::launch_report r = ctl.launch({});
        QCOMPARE(r.status, sl_mgmt::request_status::no_selection);
        QVERIFY(r.launched.empty());
        QVERIFY(!ctl.supervisor().any_live());
    }

    void singleInstanceRules()
    {
        sl_mgmt::settings_record settings;
        auto seen = std::make_shared<bool>(false);
        sl_mgmt::instance_controller ctl(settings, root(), sleeper(), switchable_probe(seen));

        // two at once is never allowed
        QCOMPARE(ctl.launch({"A", "B"}).status, sl_mgmt::request_status::rejected_by_policy);
        QVERIFY(!ctl.supervisor().any_live());

        // something outside the launcher already runs
        *seen = true;
        QCOMPARE(ctl.launch({"A"}).status, sl_mgmt::request_status::rejected_by_policy);

        *seen = false;
        sl_mgmt::launch_report r = ctl.launch({"A"});
        QVERIFY(r.ok());
        QCOMPARE(r.launched, profile_list{"A"});

        // our own tracked instance blocks the next one too
        QCOMPARE(ctl.launch({"B"}).status, sl_mgmt::request_status::rejected_by_policy);
        QVERIFY(!ctl.is_live("B"));

        ctl.exit_all();
    }

    void multiInstanceLaunchesAll()
    {
        sl_mgmt::settings_record settings;
        settings.allow_multi_instance = true;
        auto seen = std::make_shared<bool>(true);
        sl_mgmt::instance_controller ctl(settings, root(), sleeper(), switchable_probe(seen));

        sl_mgmt::launch_report r = ctl.launch({"A", "B"});
        QVERIFY(r.ok());
        profile_list both = {"A", "B"};
        QCOMPARE(r.launched, both);
        QCOMPARE(ctl.launched_profiles(), both);

        // second request: nothing new spawned
        r = ctl.launch({"A", "C"});
        QVERIFY(r.ok());
        QCOMPARE(r.already_running, profile_list{"A"});
        QCOMPARE(r.launched, profile_list{"C"});

        ctl.exit_all();
        QVERIFY(ctl.live_profiles().empty());
        QVERIFY(ctl.launched_profiles().empty());
        QVERIFY(ctl.missing().empty());
    }

    void settingsFlagIsReadPerRequest()
    {
        sl_mgmt::settings_record settings;
        sl_mgmt::instance_controller ctl(settings, root(), sleeper(), {});

        QCOMPARE(ctl.launch({"A", "B"}).status, sl_mgmt::request_status::rejected_by_policy);

        settings.allow_multi_instance = true;
        QVERIFY(ctl.launch({"A", "B"}).ok());

        ctl.exit_all();
    }

    void invalidLinkLaunchesNothing()
    {
        sl_mgmt::settings_record settings;
        settings.allow_multi_instance = true;
        sl_mgmt::instance_controller ctl(settings, root(), sleeper(), {});

        sl_mgmt::launch_report r = ctl.launch_with_link({"A"}, "https://www.roblox.com/home");
        QCOMPARE(r.status, sl_mgmt::request_status::invalid_link);
        QVERIFY(!ctl.supervisor().any_live());
        QVERIFY(ctl.launched_profiles().empty());
    }

    void spawnFailuresAreReported()
    {
        sl_mgmt::settings_record settings;
        settings.allow_multi_instance = true;
        sl_mgmt::instance_controller ctl(settings, root(),
                                         {{"/nonexistent/soberlauncher-test-binary"}, "org.example.None", {}},
                                         {});

        sl_mgmt::launch_report r = ctl.launch({"A"});
        QCOMPARE(r.status, sl_mgmt::request_status::spawn_failures);
        QCOMPARE(r.failures.size(), size_t(1));
        QVERIFY(r.failures.count("A") == 1);
        QVERIFY(ctl.launched_profiles().empty());
    }

    void missingAndRunMissing()
    {
        sl_mgmt::settings_record settings;
        settings.allow_multi_instance = true;
        sl_mgmt::instance_controller ctl(settings, root(), sleeper(), {});

        QCOMPARE(ctl.run_missing().status, sl_mgmt::request_status::nothing_missing);

        QVERIFY(ctl.launch({"A", "B"}).ok());
        // launching a live profile hands back its pid
        QCOMPARE(::kill(ctl.supervisor().launch("B").pid, SIGKILL), 0);

        sl_mgmt::tick_report tick;
        QTRY_VERIFY_WITH_TIMEOUT((tick = ctl.tick()).exited.count("B") == 1, 5000);
        QCOMPARE(tick.missing, profile_list{"B"});
        QCOMPARE(ctl.missing(), profile_list{"B"});

        // still missing on the next tick; nothing forgets it
        QCOMPARE(ctl.tick().missing, profile_list{"B"});

        sl_mgmt::launch_report r = ctl.run_missing();
        QVERIFY(r.ok());
        QCOMPARE(r.launched, profile_list{"B"});
        QVERIFY(ctl.missing().empty());

        QCOMPARE(ctl.run_missing_with_link("not a link").status, sl_mgmt::request_status::invalid_link);

        ctl.exit_all();
    }

    void runMissingNeedsMultiInstance()
    {
        sl_mgmt::settings_record settings;
        sl_mgmt::instance_controller ctl(settings, root(), sleeper(), {});

        QCOMPARE(ctl.run_missing().status, sl_mgmt::request_status::multi_instance_disabled);
        QCOMPARE(ctl.run_missing_with_link("https://www.roblox.com/games/1/x").status,
                 sl_mgmt::request_status::multi_instance_disabled);
    }

    void removeProfileStopsAndForgets()
    {
        sl_mgmt::settings_record settings;
        settings.allow_multi_instance = true;
        sl_mgmt::instance_controller ctl(settings, root(), sleeper(), {});

        std::string error;
        QVERIFY(sl_mgmt::profiles::create_profile(root(), "Doomed", error));
        QVERIFY(ctl.launch({"Doomed"}).ok());

        QVERIFY(ctl.remove_profile("Doomed", error));
        QVERIFY(!QDir(tmp.path() + "/Doomed").exists());
        QVERIFY(!ctl.is_live("Doomed"));
        QVERIFY(ctl.launched_profiles().empty());
        QVERIFY(ctl.missing().empty());

        QVERIFY(!ctl.remove_profile(sl_mgmt::main_profile, error));
        QVERIFY(!error.empty());
    }

    void describeEveryFailure()
    {
        using sl_mgmt::request_status;
        for (request_status s : {request_status::no_selection, request_status::rejected_by_policy,
                                 request_status::invalid_link, request_status::multi_instance_disabled,
                                 request_status::nothing_missing, request_status::spawn_failures}) {
            QVERIFY(!sl_mgmt::describe(s).empty());
        }
    }
};

QTEST_GUILESS_MAIN(InstanceControllerTest)
#include "instancecontrollertest.moc"
