#include "soberlauncher/settings.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include <QtTest/QtTest>

#include <string>

namespace {

std::string
read_all(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return {};
    return file.readAll().toStdString();
}

} // namespace

class SettingsTest : public QObject
{
    Q_OBJECT

private slots:
    void defaultsFromEmptyObject()
    {
        bool ok = false;
        std::string warning;
        sl_mgmt::settings_record rec = sl_mgmt::settings::parse("{}", ok, warning);

        QVERIFY(ok);
        QVERIFY(warning.empty());
        QCOMPARE(rec.version, 1);
        QCOMPARE(QString::fromStdString(rec.display_name), QString("[Name]"));
        QVERIFY(rec.private_servers.empty());
        QVERIFY(!rec.roblox_player_enabled);
        QVERIFY(!rec.allow_multi_instance);
        QCOMPARE(rec.poll_interval_ms, 2000);
    }

    void fullDocument()
    {
        const std::string json = R"({
            "Version": 1,
            "Name": "Builder",
            "PrivateServers": [
                {"name": "Home", "parameter": "roblox://experience?placeId=1"},
                ["Pair", "roblox://experience?placeId=2"]
            ],
            "roblox_player_enabled": true,
            "AllowMultiInstance": true,
            "PollIntervalMs": 500
        })";

        bool ok = false;
        std::string warning;
        sl_mgmt::settings_record rec = sl_mgmt::settings::parse(json, ok, warning);

        QVERIFY(ok);
        QCOMPARE(QString::fromStdString(rec.display_name), QString("Builder"));
        QVERIFY(rec.roblox_player_enabled);
        QVERIFY(rec.allow_multi_instance);
        QCOMPARE(rec.poll_interval_ms, 500);
        QCOMPARE(rec.private_servers.size(), size_t(2));
        QCOMPARE(QString::fromStdString(rec.private_servers[0].name), QString("Home"));
        QCOMPARE(QString::fromStdString(rec.private_servers[1].name), QString("Pair"));
        QCOMPARE(QString::fromStdString(rec.private_servers[1].parameter),
                 QString("roblox://experience?placeId=2"));
    }

    void wrongTypesKeepDefaults()
    {
        const std::string json = R"({
            "Name": 12,
            "AllowMultiInstance": "yes",
            "roblox_player_enabled": 1,
            "PollIntervalMs": "fast",
            "PrivateServers": {"Home": "x"}
        })";

        bool ok = false;
        std::string warning;
        sl_mgmt::settings_record rec = sl_mgmt::settings::parse(json, ok, warning);

        QVERIFY(ok);
        QCOMPARE(QString::fromStdString(rec.display_name), QString("[Name]"));
        QVERIFY(!rec.allow_multi_instance);
        QVERIFY(!rec.roblox_player_enabled);
        QCOMPARE(rec.poll_interval_ms, 2000);
        QVERIFY(rec.private_servers.empty());
    }

    void malformedServersDropped()
    {
        const std::string json = R"({"PrivateServers": [
            ["only-name"],
            {"name": "", "parameter": "x"},
            {"name": "NoParam"},
            42,
            ["Good", "p1"],
            {"name": "Good", "parameter": "p2"}
        ]})";

        bool ok = false;
        std::string warning;
        sl_mgmt::settings_record rec = sl_mgmt::settings::parse(json, ok, warning);

        QVERIFY(ok);
        QCOMPARE(rec.private_servers.size(), size_t(1));
        QCOMPARE(QString::fromStdString(rec.private_servers[0].parameter), QString("p1"));
    }

    void pollIntervalClamped()
    {
        bool ok = false;
        std::string warning;
        QCOMPARE(sl_mgmt::settings::parse(R"({"PollIntervalMs": 10})", ok, warning).poll_interval_ms, 250);
        QCOMPARE(sl_mgmt::settings::parse(R"({"PollIntervalMs": 999999})", ok, warning).poll_interval_ms, 60000);
    }

    void malformedTextGivesDefaults()
    {
        bool ok = true;
        std::string warning;
        sl_mgmt::settings_record rec = sl_mgmt::settings::parse("{ not json", ok, warning);
        QVERIFY(!ok);
        QVERIFY(!warning.empty());
        QVERIFY(!rec.allow_multi_instance);

        rec = sl_mgmt::settings::parse("[1, 2]", ok, warning);
        QVERIFY(!ok);
        QVERIFY(!warning.empty());
    }

    void serializeWritesEveryKey()
    {
        sl_mgmt::settings_record rec;
        rec.display_name = "Me";
        rec.allow_multi_instance = true;
        rec.private_servers.push_back({"Home", "p"});

        QJsonObject obj = QJsonDocument::fromJson(QByteArray::fromStdString(sl_mgmt::settings::serialize(rec))).object();
        QCOMPARE(obj.value("Version").toInt(), 1);
        QCOMPARE(obj.value("Name").toString(), QString("Me"));
        QCOMPARE(obj.value("AllowMultiInstance").toBool(), true);
        QCOMPARE(obj.value("roblox_player_enabled").toBool(), false);
        QCOMPARE(obj.value("PollIntervalMs").toInt(), 2000);
        QJsonArray servers = obj.value("PrivateServers").toArray();
        QCOMPARE(servers.size(), 1);
        QCOMPARE(servers.at(0).toObject().value("name").toString(), QString("Home"));
    }

    void loadCreatesMissingFile()
    {
        QTemporaryDir tmp;
        QVERIFY(tmp.isValid());
        const QString path = tmp.path() + "/SL_Settings.json";

        sl_mgmt::settings_record rec = sl_mgmt::settings::load(path.toStdString());
        QVERIFY(!rec.allow_multi_instance);
        QVERIFY(QFile::exists(path));

        bool ok = false;
        std::string warning;
        sl_mgmt::settings::parse(read_all(path), ok, warning);
        QVERIFY(ok);
    }

    void loadLeavesBrokenFileAlone()
    {
        QTemporaryDir tmp;
        QVERIFY(tmp.isValid());
        const QString path = tmp.path() + "/SL_Settings.json";

        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{\"AllowMultiInstance\": tru");
        file.close();

        sl_mgmt::settings_record rec = sl_mgmt::settings::load(path.toStdString());
        QVERIFY(!rec.allow_multi_instance);
        QCOMPARE(QString::fromStdString(read_all(path)), QString("{\"AllowMultiInstance\": tru"));
    }

    void saveThenLoad()
    {
        QTemporaryDir tmp;
        QVERIFY(tmp.isValid());
        const std::string path = (tmp.path() + "/SL_Settings.json").toStdString();

        sl_mgmt::settings_record rec;
        rec.display_name = "Saved";
        rec.allow_multi_instance = true;
        rec.poll_interval_ms = 750;
        rec.private_servers.push_back({"A", "pa"});
        rec.private_servers.push_back({"B", "pb"});

        std::string error;
        QVERIFY(sl_mgmt::settings::save(rec, path, error));

        sl_mgmt::settings_record back = sl_mgmt::settings::load(path);
        QCOMPARE(QString::fromStdString(back.display_name), QString("Saved"));
        QVERIFY(back.allow_multi_instance);
        QCOMPARE(back.poll_interval_ms, 750);
        QCOMPARE(back.private_servers.size(), size_t(2));
        QCOMPARE(QString::fromStdString(back.private_servers[1].parameter), QString("pb"));
    }

    void saveToMissingDirectoryFails()
    {
        QTemporaryDir tmp;
        QVERIFY(tmp.isValid());
        std::string error;
        QVERIFY(!sl_mgmt::settings::save({}, (tmp.path() + "/no/such/dir/s.json").toStdString(), error));
        QVERIFY(!error.empty());
    }

    void privateServerEditing()
    {
        sl_mgmt::settings_record rec;
        QVERIFY(sl_mgmt::settings::add_private_server(rec, "A", "pa"));
        QVERIFY(sl_mgmt::settings::add_private_server(rec, "B", "pb"));
        QVERIFY(!sl_mgmt::settings::add_private_server(rec, "A", "other"));
        QVERIFY(!sl_mgmt::settings::add_private_server(rec, "  ", "blank"));

        QVERIFY(!sl_mgmt::settings::edit_private_server(rec, "A", "B", "clash"));
        QVERIFY(!sl_mgmt::settings::edit_private_server(rec, "Nope", "C", "x"));
        QVERIFY(sl_mgmt::settings::edit_private_server(rec, "A", "C", "pc"));
        QCOMPARE(QString::fromStdString(rec.private_servers[0].name), QString("C"));
        QCOMPARE(QString::fromStdString(rec.private_servers[0].parameter), QString("pc"));

        QVERIFY(sl_mgmt::settings::remove_private_server(rec, "C"));
        QVERIFY(!sl_mgmt::settings::remove_private_server(rec, "C"));
        QCOMPARE(rec.private_servers.size(), size_t(1));
        QCOMPARE(QString::fromStdString(rec.private_servers[0].name), QString("B"));
    }
};

QTEST_GUILESS_MAIN(SettingsTest)
#include "settingstest.moc"
