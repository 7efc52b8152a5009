#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vector>

#include <gtest/gtest.h>

#include <gelfmover/config.hpp>
#include <gelfmover/errors.hpp>

using namespace gelfmover;


namespace {
    constexpr auto DSN = "https://key@o1.ingest.sentry.io/12";

    /**
     * Parse a command line (and whatever environment is set) into raw options, the same way the CLI does.
     */
    auto parse(std::vector<const char*> args) -> RawOptions {
        auto raw = RawOptions{};
        auto app = CLI::App("test");
        register_options(app, raw);
        args.insert(args.begin(), "gelfmover");
        app.parse(static_cast<int>(args.size()), args.data());
        return raw;
    }

    class ConfigTest : public testing::Test {
    protected:
        std::filesystem::path m_dsn_file = std::filesystem::temp_directory_path() / "gelfmover_test_dsn";

        auto SetUp() -> void override {
            for (const auto *name : {"SENTRY_DSN", "SENTRY_DSN_FILE", "UDP_ADDR", "QUEUE_SIZE"}) {
                unsetenv(name);
            }
        }

        auto TearDown() -> void override {
            SetUp();
            std::filesystem::remove(m_dsn_file);
        }
    };
}


TEST_F(ConfigTest, DefaultsApply) {
    const auto config = resolve_config(parse({"--dsn", DSN}));
    ASSERT_TRUE(config.dsn.has_value());
    EXPECT_EQ(*config.dsn, DSN);
    EXPECT_EQ(config.udp_addr.to_string(), "0.0.0.0:8080");
    EXPECT_EQ(config.tcp_addr.to_string(), "0.0.0.0:8081");
    EXPECT_EQ(config.system_name, "Gelf Mover");
    EXPECT_EQ(config.reader_threads, 1);
    EXPECT_EQ(config.max_parallel_chunks, 500);
    EXPECT_EQ(config.queue_size, 1024);
    EXPECT_EQ(config.chunk_ttl, std::chrono::milliseconds(5000));
    EXPECT_EQ(config.log_level, "info");
}


TEST_F(ConfigTest, EnvironmentIsUsed) {
    setenv("SENTRY_DSN", DSN, 1);
    setenv("UDP_ADDR", "127.0.0.1:12201", 1);
    setenv("QUEUE_SIZE", "64", 1);

    const auto config = resolve_config(parse({}));
    EXPECT_EQ(*config.dsn, DSN);
    EXPECT_EQ(config.udp_addr.port, 12201);
    EXPECT_EQ(config.queue_size, 64);
}


TEST_F(ConfigTest, BothDsnSourcesAreRejected) {
    EXPECT_THROW(static_cast<void>(resolve_config(parse({"--dsn", DSN, "--dsn-file", "/tmp/dsn"}))), ConfigError);
}


TEST_F(ConfigTest, MissingDsnIsRejected) {
    EXPECT_THROW(static_cast<void>(resolve_config(parse({}))), ConfigError);
}


TEST_F(ConfigTest, ConsoleNeedsNoDsn) {
    const auto config = resolve_config(parse({"--console"}));
    EXPECT_TRUE(config.console);
    EXPECT_FALSE(config.dsn.has_value());
}


TEST_F(ConfigTest, DsnIsReadFromFile) {
    {
        auto file = std::ofstream(m_dsn_file);
        file << DSN << "\n";
    }
    const auto config = resolve_config(parse({"--dsn-file", m_dsn_file.c_str()}));
    ASSERT_TRUE(config.dsn.has_value());
    EXPECT_EQ(*config.dsn, std::string(DSN) + "\n");
}


TEST_F(ConfigTest, MissingDsnFileIsRejected) {
    EXPECT_THROW(static_cast<void>(resolve_config(parse({"--dsn-file", "/nonexistent/gelfmover/dsn"}))), ConfigError);
}


TEST_F(ConfigTest, InvalidValuesAreRejected) {
    EXPECT_THROW(static_cast<void>(resolve_config(parse({"--dsn", DSN, "--udp-addr", "nowhere"}))), ConfigError);
    EXPECT_THROW(static_cast<void>(resolve_config(parse({"--dsn", DSN, "--reader-threads", "0"}))), ConfigError);
    EXPECT_THROW(static_cast<void>(resolve_config(parse({"--dsn", DSN, "--log-level", "loud"}))), ConfigError);
}
