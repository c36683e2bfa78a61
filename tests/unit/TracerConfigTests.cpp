#include <gtest/gtest.h>
#include <initializer_list>
#include "SimTrace/Config/TracerConfig.h"

using namespace simtrace;

namespace
{
    // Mutable argv as getopt expects it
    class CommandLine
    {
    public:
        CommandLine(std::initializer_list<const char*> arguments)
        {
            for (const char* argument : arguments)
            {
                storage.push_back(etl::string<64>(argument));
            }
            for (size_t i = 0; i < storage.size(); ++i)
            {
                pointers.push_back(storage[i].data());
            }
            pointers.push_back(nullptr);
        }

        CommandLine(const CommandLine&) = delete;
        CommandLine& operator=(const CommandLine&) = delete;

        int argc() const
        {
            return static_cast<int>(storage.size());
        }

        char* const* argv()
        {
            return pointers.data();
        }

    private:
        etl::vector<etl::string<64>, 16> storage;
        etl::vector<char*, 17> pointers;
    };

    etl::expected<TracerConfig, error::Error> parse(std::initializer_list<const char*> arguments)
    {
        CommandLine commandLine(arguments);
        return parseCommandLine(commandLine.argc(), commandLine.argv());
    }

    error::ConfigError configErrorOf(const etl::expected<TracerConfig, error::Error>& result)
    {
        EXPECT_FALSE(result.has_value());
        if (result.has_value() || !result.error().is<error::ConfigError>())
        {
            return error::ConfigError::Ok;
        }
        return result.error().get<error::ConfigError>();
    }
}

TEST(TracerConfigTests, UdpDefaults)
{
    auto config = parse({"simtrace", "gsmtap-udp"});
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->source, SourceKind::GsmtapUdp);
    EXPECT_STREQ(config->bindIp.c_str(), "127.0.0.1");
    EXPECT_EQ(config->bindPort, 4729);
    EXPECT_TRUE(config->options.suppressSelect);
    EXPECT_TRUE(config->options.suppressStatus);
    EXPECT_TRUE(config->options.combineGetResponse);
    EXPECT_FALSE(config->verbose);
}

TEST(TracerConfigTests, UdpBindAddress)
{
    auto config = parse({"simtrace", "gsmtap-udp", "-i", "0.0.0.0", "--bind-port", "5000"});
    ASSERT_TRUE(config.has_value());

    EXPECT_STREQ(config->bindIp.c_str(), "0.0.0.0");
    EXPECT_EQ(config->bindPort, 5000);
}

TEST(TracerConfigTests, GlobalFlags)
{
    auto config = parse({"simtrace", "--no-suppress-select", "--no-suppress-status",
                      "--no-combine-get-response", "-v", "hex-file", "-f", "trace.hex"});
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->source, SourceKind::HexFile);
    EXPECT_STREQ(config->file.c_str(), "trace.hex");
    EXPECT_FALSE(config->options.suppressSelect);
    EXPECT_FALSE(config->options.suppressStatus);
    EXPECT_FALSE(config->options.combineGetResponse);
    EXPECT_TRUE(config->verbose);
}

TEST(TracerConfigTests, PcapSource)
{
    auto config = parse({"simtrace", "gsmtap-pcap", "--file", "capture.pcap"});
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->source, SourceKind::GsmtapPcap);
    EXPECT_STREQ(config->file.c_str(), "capture.pcap");
}

TEST(TracerConfigTests, HelpRequested)
{
    EXPECT_EQ(configErrorOf(parse({"simtrace", "gsmtap-udp", "--help"})), error::ConfigError::HelpRequested);
}

TEST(TracerConfigTests, MissingSource)
{
    EXPECT_EQ(configErrorOf(parse({"simtrace", "--no-suppress-select"})), error::ConfigError::MissingSource);
}

TEST(TracerConfigTests, UnknownSource)
{
    EXPECT_EQ(configErrorOf(parse({"simtrace", "rspro"})), error::ConfigError::UnknownSource);
}

TEST(TracerConfigTests, OptionsMustMatchSource)
{
    EXPECT_EQ(configErrorOf(parse({"simtrace", "gsmtap-udp", "-f", "trace.hex"})), error::ConfigError::UnknownOption);

    EXPECT_EQ(configErrorOf(parse({"simtrace", "hex-file", "-p", "4729"})), error::ConfigError::UnknownOption);

    EXPECT_EQ(configErrorOf(parse({"simtrace", "-f", "trace.hex", "hex-file"})), error::ConfigError::UnknownOption);

    EXPECT_EQ(configErrorOf(parse({"simtrace", "gsmtap-udp", "--quiet"})), error::ConfigError::UnknownOption);

    EXPECT_EQ(configErrorOf(parse({"simtrace", "gsmtap-udp", "hex-file"})), error::ConfigError::UnknownOption);
}

TEST(TracerConfigTests, MissingValues)
{
    EXPECT_EQ(configErrorOf(parse({"simtrace", "gsmtap-udp", "-p"})), error::ConfigError::MissingArgument);

    EXPECT_EQ(configErrorOf(parse({"simtrace", "gsmtap-pcap"})), error::ConfigError::MissingArgument);
}

TEST(TracerConfigTests, InvalidPort)
{
    for (const char* port : {"0", "65536", "47x9", ""})
    {
        EXPECT_EQ(configErrorOf(parse({"simtrace", "gsmtap-udp", "-p", port})), error::ConfigError::InvalidValue) << port;
    }
}
