#include <gtest/gtest.h>
#include <Services/Logger.h>
#include <Services/LogCategories.h>

#include <QFile>
#include <QTemporaryDir>

TEST(Logger, ParseLevel)
{
    bool ok = false;
    EXPECT_EQ(Logger::parseLevel("debug", &ok), LogLevel::Debug);
    EXPECT_TRUE(ok);
    EXPECT_EQ(Logger::parseLevel(" WARNING ", &ok), LogLevel::Warning);
    EXPECT_EQ(Logger::parseLevel("warn", &ok), LogLevel::Warning);
    EXPECT_EQ(Logger::parseLevel("CRITICAL", &ok), LogLevel::Critical);

    EXPECT_EQ(Logger::parseLevel("verbose", &ok), LogLevel::Info);
    EXPECT_FALSE(ok);
}

TEST(Logger, LineFormats)
{
    const QDateTime when(QDate(2024, 3, 5), QTime(14, 7, 9, 42));
    EXPECT_EQ(Logger::formatFileLine(when, "medview.ai", LogLevel::Warning, "model missing"),
        "2024-03-05 14:07:09,042 - medview.ai - WARNING - model missing");
    EXPECT_EQ(Logger::formatConsoleLine(LogLevel::Error, "boom"), "ERROR: boom");
    EXPECT_EQ(Logger::levelFor(QtCriticalMsg), LogLevel::Error);
}

TEST(Logger, RotateShiftsBackups)
{
    QTemporaryDir dir;
    const QString log = dir.filePath("app.log");
    for (const QString& p : { log, log + ".1", log + ".2" })
    {
        QFile f(p);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write(p.toUtf8());
    }

    ASSERT_TRUE(Logger::rotate(log, 2));
    EXPECT_FALSE(QFile::exists(log));

    QFile one(log + ".1");
    ASSERT_TRUE(one.open(QIODevice::ReadOnly));
    EXPECT_EQ(one.readAll(), log.toUtf8());

    QFile two(log + ".2");
    ASSERT_TRUE(two.open(QIODevice::ReadOnly));
    EXPECT_EQ(two.readAll(), (log + ".1").toUtf8());
    EXPECT_FALSE(QFile::exists(log + ".3"));
}

TEST(Logger, InstallWritesFilteredMessagesToFile)
{
    QTemporaryDir dir;
    LogSettings s;
    s.level = LogLevel::Warning;
    s.filePath = dir.filePath("logs/viewer.log");
    s.console = false;

    ASSERT_TRUE(Logger::install(s));
    EXPECT_TRUE(Logger::isInstalled());

    qCInfo(lcApp) << "hidden-info";
    qCWarning(lcApp) << "shown-warning";
    Logger::uninstall();
    EXPECT_FALSE(Logger::isInstalled());

    QFile f(s.filePath);
    ASSERT_TRUE(f.open(QIODevice::ReadOnly));
    const QByteArray text = f.readAll();
    EXPECT_FALSE(text.contains("hidden-info"));
    EXPECT_TRUE(text.contains("medview.app - WARNING - shown-warning"));
}
