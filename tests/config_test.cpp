#include "fastxfer/config.hpp"
#include "fastxfer/errors.hpp"
#include "fastxfer/helpers.hpp"
#include "receiver.hpp"
#include "sender.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <functional>
#include <string>
#include <vector>

using namespace fastxfer;

namespace {

// argv built from string literals
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto &s : storage_) {
            argv_.push_back(s.data());
        }
    }

    int argc() const { return static_cast<int>(argv_.size()); }
    char **argv() { return argv_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char *> argv_;
};

ErrorKind kind_of(const std::function<void()> &fn) {
    try {
        fn();
    } catch (const TransferError &e) {
        return e.kind();
    }
    return ErrorKind::Advisory;
}

} // namespace

TEST(ParseSizeTest, AcceptsBinarySuffixes) {
    EXPECT_EQ(parse_size("1024"), 1024u);
    EXPECT_EQ(parse_size("1K"), 1024u);
    EXPECT_EQ(parse_size("500m"), 500ull * 1024 * 1024);
    EXPECT_EQ(parse_size(" 10G "), 10ull * 1024 * 1024 * 1024);
}

TEST(ParseSizeTest, RejectsInvalidInput) {
    EXPECT_EQ(kind_of([] { parse_size(""); }), ErrorKind::Setup);
    EXPECT_EQ(kind_of([] { parse_size("G"); }), ErrorKind::Setup);
    EXPECT_EQ(kind_of([] { parse_size("abc"); }), ErrorKind::Setup);
    EXPECT_EQ(kind_of([] { parse_size("-5"); }), ErrorKind::Setup);
    EXPECT_EQ(kind_of([] { parse_size("0"); }), ErrorKind::Setup);
    EXPECT_EQ(kind_of([] { parse_size("1.5G"); }), ErrorKind::Setup);
    EXPECT_EQ(kind_of([] { parse_size("99999999999999999999"); }), ErrorKind::Setup);
}

TEST(ConfigTest, ParsesSenderFlags) {
    Args args{"fastxfer-client", "--file", "/dev/zero", "--size", "2M", "--addr", "10.0.0.1:9000",
              "--sndbuf", "4194304", "--prewarm"};
    Config config = parse_args(args.argc(), args.argv(), Mode::Send);
    EXPECT_EQ(config.mode, Mode::Send);
    EXPECT_EQ(config.file, "/dev/zero");
    EXPECT_EQ(config.addr, "10.0.0.1:9000");
    EXPECT_EQ(config.sndbuf, 4194304);
    EXPECT_TRUE(config.prewarm);
    EXPECT_NO_THROW(validate_config(config));

    SendOptions opts = make_send_options(config);
    ASSERT_TRUE(opts.declared_size.has_value());
    EXPECT_EQ(*opts.declared_size, 2u * 1024 * 1024);
}

TEST(ConfigTest, ParsesReceiverFlags) {
    Args args{"fastxfer-server", "--dir", "/dev/null", "--no-splice", "--rcvbuf", "65536", "--odirect"};
    Config config = parse_args(args.argc(), args.argv(), Mode::Receive);
    EXPECT_NO_THROW(validate_config(config));

    ReceiveOptions opts = make_receive_options(config);
    EXPECT_EQ(opts.dir, "/dev/null");
    EXPECT_FALSE(opts.use_splice);
    EXPECT_EQ(opts.rcvbuf, 65536);
    EXPECT_TRUE(opts.direct_io);
    EXPECT_TRUE(is_discard_target(opts.dir));
}

TEST(ConfigTest, SyntheticSourceRequiresSize) {
    Args args{"fastxfer-client", "--file", "/dev/zero"};
    Config config = parse_args(args.argc(), args.argv(), Mode::Send);
    EXPECT_EQ(kind_of([&] { validate_config(config); }), ErrorKind::Setup);

    config.size = "12Q";
    EXPECT_EQ(kind_of([&] { validate_config(config); }), ErrorKind::Setup);
}

TEST(ConfigTest, RejectsBadFlags) {
    Args unknown{"fastxfer-client", "--bogus"};
    EXPECT_EQ(kind_of([&] { parse_args(unknown.argc(), unknown.argv(), Mode::Send); }), ErrorKind::Setup);

    Args missing_value{"fastxfer-client", "--file"};
    EXPECT_EQ(kind_of([&] { parse_args(missing_value.argc(), missing_value.argv(), Mode::Send); }), ErrorKind::Setup);

    Args negative{"fastxfer-server", "--rcvbuf", "-1"};
    EXPECT_EQ(kind_of([&] { parse_args(negative.argc(), negative.argv(), Mode::Receive); }), ErrorKind::Setup);

    Args wrong_mode{"fastxfer-server", "--mode", "send"};
    EXPECT_EQ(kind_of([&] { parse_args(wrong_mode.argc(), wrong_mode.argv(), Mode::Receive); }), ErrorKind::Setup);

    Args no_file{"fastxfer-client", "--addr", "localhost:1"};
    Config config = parse_args(no_file.argc(), no_file.argv(), Mode::Send);
    EXPECT_EQ(kind_of([&] { validate_config(config); }), ErrorKind::Setup);
}

TEST(ConfigTest, FlagsOverrideConfigFile) {
    test_support::TempDir dir("config");
    auto path = dir.path() / "fastxfer.json";
    {
        std::ofstream out(path);
        out << R"({"dir": "/srv/in", "addr": ":7000", "no_splice": true, "rcvbuf": 1024, "comment": "ignored"})";
    }

    std::string path_str = path.string();
    Args args{"fastxfer-server", "--config", path_str, "--addr", "127.0.0.1:7001"};
    Config config = parse_args(args.argc(), args.argv(), Mode::Receive);
    EXPECT_EQ(config.dir, "/srv/in");
    EXPECT_EQ(config.addr, "127.0.0.1:7001");
    EXPECT_TRUE(config.no_splice);
    EXPECT_EQ(config.rcvbuf, 1024);
}

TEST(ConfigTest, MalformedConfigFileIsSetupError) {
    test_support::TempDir dir("config_bad");
    auto wrong_type = dir.path() / "wrong_type.json";
    auto not_json = dir.path() / "not_json.json";
    {
        std::ofstream out(wrong_type);
        out << R"({"rcvbuf": "big"})";
    }
    {
        std::ofstream out(not_json);
        out << "dir = /tmp";
    }

    Config config;
    EXPECT_EQ(kind_of([&] { load_config_file(wrong_type.string(), config); }), ErrorKind::Setup);
    EXPECT_EQ(kind_of([&] { load_config_file(not_json.string(), config); }), ErrorKind::Setup);
    EXPECT_EQ(kind_of([&] { load_config_file((dir.path() / "missing.json").string(), config); }), ErrorKind::Setup);
}

TEST(HelpersTest, FormatsWithCommas) {
    EXPECT_EQ(format_with_commas(0), "0");
    EXPECT_EQ(format_with_commas(999), "999");
    EXPECT_EQ(format_with_commas(1000), "1,000");
    EXPECT_EQ(format_with_commas(1234567), "1,234,567");
    EXPECT_EQ(format_with_commas(100000), "100,000");
}

TEST(HostPortTest, ParsesAddresses) {
    HostPort hp;
    ASSERT_TRUE(parse_host_port("localhost:8080", hp));
    EXPECT_EQ(hp.host, "localhost");
    EXPECT_EQ(hp.port, 8080);

    ASSERT_TRUE(parse_host_port(":9000", hp));
    EXPECT_TRUE(hp.host.empty());

    ASSERT_TRUE(parse_host_port("[::1]:80", hp));
    EXPECT_EQ(hp.host, "::1");

    EXPECT_FALSE(parse_host_port("localhost", hp));
    EXPECT_FALSE(parse_host_port("localhost:", hp));
    EXPECT_FALSE(parse_host_port("localhost:70000", hp));
}
