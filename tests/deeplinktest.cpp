#include "soberlauncher/deeplink.hpp"

#include <QtTest/QtTest>

class DeepLinkTest : public QObject
{
    Q_OBJECT

private slots:
    void fromGameLink_data()
    {
        QTest::addColumn<QString>("url");
        QTest::addColumn<bool>("valid");
        QTest::addColumn<QString>("expected");

        QTest::newRow("full") << "https://www.roblox.com/games/606849621/Jailbreak"
                              << true << "roblox://experience?placeId=606849621";
        QTest::newRow("no-name") << "https://www.roblox.com/games/123"
                                 << true << "roblox://experience?placeId=123";
        QTest::newRow("locale") << "https://www.roblox.com/es/games/42/x?privateServerLinkCode=9"
                                << true << "roblox://experience?placeId=42";
        QTest::newRow("whitespace") << "  https://www.roblox.com/games/7/y \n"
                                    << true << "roblox://experience?placeId=7";
        QTest::newRow("no-id") << "https://www.roblox.com/games/abc" << false << "";
        QTest::newRow("profile") << "https://www.roblox.com/users/1/profile" << false << "";
        QTest::newRow("empty") << "" << false << "";
    }

    void fromGameLink()
    {
        QFETCH(QString, url);
        QFETCH(bool, valid);
        QFETCH(QString, expected);

        std::string link = "untouched";
        QCOMPARE(sl_mgmt::deeplink::from_game_link(url.toStdString(), link), valid);
        if (valid)
            QCOMPARE(QString::fromStdString(link), expected);
        else
            QCOMPARE(QString::fromStdString(link), QString("untouched"));
    }

    void build()
    {
        QCOMPARE(QString::fromStdString(sl_mgmt::deeplink::build("1")),
                 QString("roblox://experience?placeId=1"));
    }
};

QTEST_GUILESS_MAIN(DeepLinkTest)
#include "deeplinktest.moc"
