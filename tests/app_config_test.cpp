#include <gtest/gtest.h>
#include "app/AppConfig.h"

#include <QTemporaryDir>
#include <QFile>

namespace {

// AppConfig is a singleton; every test starts from the defaults
class AppConfigTest : public ::testing::Test {
protected:
    void SetUp() override { AppConfig::instance().reset(); }
    void TearDown() override { AppConfig::instance().reset(); }

    QString writeConfig(const QByteArray &contents) {
        QString path = m_dir.filePath("app.yaml");
        QFile file(path);
        EXPECT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Text));
        file.write(contents);
        file.close();
        return path;
    }

    QTemporaryDir m_dir;
};

} // namespace

TEST_F(AppConfigTest, DefaultsMatchDevelopmentLaunch) {
    AppConfig &config = AppConfig::instance();
    EXPECT_TRUE(config.autostartBackend());
    EXPECT_EQ(config.backendBaseUrl(), QString("http://127.0.0.1:8000"));

    BackendCommand command = config.backendCommand();
    BackendCommand expected = BackendCommand::defaults();
    EXPECT_EQ(command.program, expected.program);
    EXPECT_EQ(command.arguments, expected.arguments);
    EXPECT_EQ(command.workingDirectory, expected.workingDirectory);
}

TEST_F(AppConfigTest, DefaultCommandLine) {
    BackendCommand command = BackendCommand::defaults();
    EXPECT_EQ(command.toString(),
              QString("python -m uvicorn app.main:app --port 8000 --host 127.0.0.1"));
    EXPECT_EQ(command.workingDirectory, QString("../backend"));
}

TEST_F(AppConfigTest, MissingFileKeepsDefaults) {
    AppConfig &config = AppConfig::instance();
    EXPECT_FALSE(config.load(m_dir.filePath("does-not-exist.yaml")));
    EXPECT_EQ(config.backendPort(), 8000);
    EXPECT_EQ(config.backendProgram(), QString("python"));
}

TEST_F(AppConfigTest, LoadsBackendSection) {
    QString path = writeConfig(
        "# comment\n"
        "backend:\n"
        "  program: \"python3\"\n"
        "  host: 0.0.0.0\n"
        "  port: 9001\n"
        "  working_dir: \"/srv/backend\"\n"
        "  autostart: false\n"
        "\n"
        "other:\n"
        "  port: 1\n");

    AppConfig &config = AppConfig::instance();
    ASSERT_TRUE(config.load(path));

    EXPECT_EQ(config.backendProgram(), QString("python3"));
    EXPECT_EQ(config.backendHost(), QString("0.0.0.0"));
    EXPECT_EQ(config.backendPort(), 9001);
    EXPECT_EQ(config.backendWorkingDir(), QString("/srv/backend"));
    EXPECT_FALSE(config.autostartBackend());
    EXPECT_EQ(config.backendBaseUrl(), QString("http://0.0.0.0:9001"));

    BackendCommand command = config.backendCommand();
    EXPECT_EQ(command.toString(),
              QString("python3 -m uvicorn app.main:app --port 9001 --host 0.0.0.0"));
    EXPECT_EQ(command.workingDirectory, QString("/srv/backend"));
}

TEST_F(AppConfigTest, ExplicitBaseUrlWins) {
    QString path = writeConfig(
        "backend:\n"
        "  port: 9001\n"
        "  base_url: \"http://localhost:7000\"\n");

    ASSERT_TRUE(AppConfig::instance().load(path));
    EXPECT_EQ(AppConfig::instance().backendBaseUrl(), QString("http://localhost:7000"));
}

TEST_F(AppConfigTest, InvalidPortIgnored) {
    QString path = writeConfig(
        "backend:\n"
        "  port: not-a-number\n");

    ASSERT_TRUE(AppConfig::instance().load(path));
    EXPECT_EQ(AppConfig::instance().backendPort(), 8000);
}
