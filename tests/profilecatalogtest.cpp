#include "soberlauncher/profilecatalog.hpp"
#include "soberlauncher/profiledata.hpp"

#include <QDir>
#include <QFile>
#include <QFileDevice>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QtTest/QtTest>

#include <string>
#include <vector>

class ProfileCatalogTest : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir tmp;

    std::string root() const { return tmp.path().toStdString(); }

    void make_profile(const QString &name)
    {
        QVERIFY(QDir(tmp.path()).mkpath(name + "/.local"));
    }

private slots:
    void init()
    {
        QVERIFY(tmp.isValid());
        QDir(tmp.path()).removeRecursively();
        QDir().mkpath(tmp.path());
    }

    void naturalOrder()
    {
        using sl_mgmt::profiles::natural_less;
        QVERIFY(natural_less("Profile 2", "Profile 10"));
        QVERIFY(!natural_less("Profile 10", "Profile 2"));
        QVERIFY(natural_less("alpha", "Beta"));
        QVERIFY(natural_less("a", "a1"));
        QVERIFY(!natural_less("same", "same"));
        // equal keys still get a total order
        QVERIFY(natural_less("a01", "a1") != natural_less("a1", "a01"));
    }

    void orderPutsMainFirstOnce()
    {
        profile_list ordered = sl_mgmt::profiles::order({"b10", sl_mgmt::main_profile, "b2", "a"});
        profile_list expected = {sl_mgmt::main_profile, "a", "b2", "b10"};
        QCOMPARE(ordered, expected);

        QCOMPARE(sl_mgmt::profiles::order({}), profile_list{sl_mgmt::main_profile});
    }

    void listRequiresMarker()
    {
        make_profile("Profile 10");
        make_profile("Profile 2");
        QVERIFY(QDir(tmp.path()).mkpath("NoMarker"));

        QFile stray(tmp.path() + "/stray.txt");
        QVERIFY(stray.open(QIODevice::WriteOnly));
        stray.close();

        profile_list expected = {sl_mgmt::main_profile, "Profile 2", "Profile 10"};
        QCOMPARE(sl_mgmt::profiles::list(root()), expected);
    }

    void missingRootGivesMainOnly()
    {
        profile_list listed = sl_mgmt::profiles::list(root() + "/does-not-exist");
        QCOMPARE(listed, profile_list{sl_mgmt::main_profile});
    }

    void homeOverride()
    {
        QVERIFY(sl_mgmt::profiles::home_for(root(), sl_mgmt::main_profile).empty());
        QCOMPARE(QString::fromStdString(sl_mgmt::profiles::home_for(root(), "Alt")),
                 tmp.path() + "/Alt");
    }

    void validateName_data()
    {
        QTest::addColumn<QString>("name");
        QTest::addColumn<bool>("valid");

        QTest::newRow("plain") << "Alt 1" << true;
        QTest::newRow("empty") << "" << false;
        QTest::newRow("blank") << "   " << false;
        QTest::newRow("main") << QString::fromStdString(sl_mgmt::main_profile) << false;
        QTest::newRow("slash") << "a/b" << false;
        QTest::newRow("dotdot") << ".." << false;
    }

    void validateName()
    {
        QFETCH(QString, name);
        QFETCH(bool, valid);

        std::string error;
        QCOMPARE(sl_mgmt::profiles::validate_name(name.toStdString(), error), valid);
        QCOMPARE(error.empty(), valid);
    }

    void createAndRemove()
    {
        std::string error;
        QVERIFY(sl_mgmt::profiles::create_profile(root(), "Alt", error));
        QVERIFY(QDir(tmp.path() + "/Alt/.local").exists());
        QCOMPARE(sl_mgmt::profiles::list(root()).size(), size_t(2));

        QVERIFY(sl_mgmt::profiles::remove_profile(root(), "Alt", error));
        QVERIFY(!QDir(tmp.path() + "/Alt").exists());

        QVERIFY(!sl_mgmt::profiles::remove_profile(root(), "Alt", error));
        QVERIFY(!error.empty());
    }

    void mainProfileCannotBeRemoved()
    {
        std::string error;
        QVERIFY(!sl_mgmt::profiles::remove_profile(root(), sl_mgmt::main_profile, error));
        QVERIFY(!error.empty());
    }

    void fixDeletesLocalFiles()
    {
        const std::string identity = "org.example.App";
        make_profile("Alt");
        QString app = QString::fromStdString(sl_mgmt::profiles::app_data_dir(root(), "Alt", identity));
        QCOMPARE(app, tmp.path() + "/Alt/.var/app/org.example.App");

        QDir().mkpath(app + "/.local/share");
        QDir().mkpath(app + "/cache/x");
        QDir().mkpath(app + "/data/keep");
        QVERIFY(QFile::link(app + "/data", app + "/.ld.so"));

        std::vector<std::string> errors;
        QVERIFY(sl_mgmt::profiles::fix_profile(root(), "Alt", identity, errors));
        QVERIFY(errors.empty());

        QVERIFY(!QFileInfo::exists(app + "/.local"));
        QVERIFY(!QFileInfo::exists(app + "/cache"));
        QVERIFY(!QFileInfo(app + "/.ld.so").isSymLink());
        // the link went, not its target
        QVERIFY(QDir(app + "/data/keep").exists());

        // nothing left to delete is still a success
        QVERIFY(sl_mgmt::profiles::fix_profile(root(), "Alt", identity, errors));
    }

    void copyMainProfileData()
    {
        QString src = tmp.path() + "/home/.var/app/org.example.App";
        QDir().mkpath(src + "/config");
        QDir().mkpath(src + "/data/sober/appData/session");
        QFile cfg(src + "/config/settings.json");
        QVERIFY(cfg.open(QIODevice::WriteOnly));
        cfg.write("{}");
        cfg.close();

        make_profile("Alt");
        std::string error;
        QVERIFY(sl_mgmt::profiles::copy_main_profile_data(src.toStdString(), root() + "/Alt", error));

        QString dst = tmp.path() + "/Alt/.var/app/org.example.App";
        QVERIFY(QFile::exists(dst + "/config/settings.json"));
        QVERIFY(!QDir(dst + "/data/sober/appData").exists());

        QVERIFY(!sl_mgmt::profiles::copy_main_profile_data(root() + "/nope", root() + "/Alt", error));
        QVERIFY(!error.empty());
    }

    void desktopEntry()
    {
        std::string written, error;
        QVERIFY(sl_mgmt::profiles::write_desktop_entry("Alt", root() + "/Desktop",
                                                       "soberlauncherctl launch \"Alt\"",
                                                       "org.example.Icon", written, error));
        QCOMPARE(QString::fromStdString(written), tmp.path() + "/Desktop/Alt.desktop");

        QFile entry(QString::fromStdString(written));
        QVERIFY(entry.open(QIODevice::ReadOnly));
        const QString text = QString::fromUtf8(entry.readAll());
        QVERIFY(text.startsWith("[Desktop Entry]\n"));
        QVERIFY(text.contains("Name=Alt\n"));
        QVERIFY(text.contains("Exec=soberlauncherctl launch \"Alt\"\n"));
        QVERIFY(text.contains("Icon=org.example.Icon\n"));

        QFileDevice::Permissions perms = entry.permissions();
        QVERIFY(perms & QFileDevice::ExeOwner);
        QVERIFY(perms & QFileDevice::ExeOther);
        QVERIFY(!(perms & QFileDevice::WriteOther));
    }
};

QTEST_GUILESS_MAIN(ProfileCatalogTest)
#include "profilecatalogtest.moc"
