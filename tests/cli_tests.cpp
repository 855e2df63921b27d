#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "dp/cli.hpp"

using namespace dp;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static ParseStatus parse(std::initializer_list<std::string> args, Options &opt, std::string &err)
{
    std::vector<std::string> storage{"dnsping"};
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char *> argv;
    for (auto &s : storage) argv.push_back(s.data());
    argv.push_back(nullptr);
    return parse_args(static_cast<int>(storage.size()), argv.data(), opt, err);
}

static void test_defaults()
{
    Options opt{};
    std::string err;
    assert_true(parse({"8.8.8.8"}, opt, err) == ParseStatus::Ok, "server only");
    assert_true(opt.server == "8.8.8.8", "server");
    assert_true(opt.host == "www.google.com", "default host");
    assert_true(opt.port == 53, "default port");
    assert_true(opt.count == 0 && opt.interval_ms == 1000 && opt.timeout_ms == 1000, "loop defaults");
    assert_true(!opt.iterate && !opt.ndjson && opt.proxy.empty(), "flags off");

    RunConfig cfg = make_run_config(opt);
    assert_true(cfg.count == 0 && !cfg.iterative, "run config");
    assert_true(!make_proxy(opt).has_value(), "no proxy");
}

static void test_all_options()
{
    Options opt{};
    std::string err;
    ParseStatus st = parse({"-H", "example.org", "--port=5353", "-i", "--type", "aaaa", "-s", "[::1]:9050",
                            "--user", "alice", "--password=secret", "-c", "5", "-I", "200", "--timeout", "0",
                            "--ndjson", "1.1.1.1"},
                           opt, err);
    assert_true(st == ParseStatus::Ok, "all options accepted");
    assert_true(opt.host == "example.org" && opt.port == 5353, "host and port");
    assert_true(opt.iterate && opt.qtype == QueryType::AAAA && opt.ndjson, "flags");
    assert_true(opt.proxy == "::1" && opt.proxy_port == 9050, "bracketed proxy");
    assert_true(opt.count == 5 && opt.interval_ms == 200 && opt.timeout_ms == 0, "loop numbers");

    Target t = make_target(opt);
    assert_true(t.server == "1.1.1.1" && t.host == "example.org" && t.port == 5353, "target");
    auto p = make_proxy(opt);
    assert_true(p && p->address == "::1" && p->port == 9050 && p->has_credentials(), "proxy config");
    assert_true(p->username == "alice" && p->password == "secret", "credentials");
    assert_true(make_run_config(opt).iterative, "iterative propagated");
}

static void test_help_and_version()
{
    Options opt{};
    std::string err;
    assert_true(parse({"-h"}, opt, err) == ParseStatus::Help, "help");
    assert_true(parse({"--version"}, opt, err) == ParseStatus::Version, "version");
    assert_true(usage_text("dnsping").find("--socks-proxy") != std::string::npos, "usage lists proxy");
}

static void test_errors()
{
    const std::vector<std::vector<std::string>> bad = {
        {},
        {"-p", "0", "8.8.8.8"},
        {"-p", "70000", "8.8.8.8"},
        {"-c", "abc", "8.8.8.8"},
        {"-c", "-1", "8.8.8.8"},
        {"--type", "MX", "8.8.8.8"},
        {"--user", "u", "-s", "p", "8.8.8.8"},
        {"--user", "u", "--password", "p", "8.8.8.8"},
        {"-s", "proxy:", "8.8.8.8"},
        {"--bogus", "8.8.8.8"},
        {"8.8.8.8", "9.9.9.9"},
        {"8.8.8.8", "-H"},
    };
    for (const auto &args : bad)
    {
        Options opt{};
        std::string err;
        std::vector<std::string> storage{"dnsping"};
        storage.insert(storage.end(), args.begin(), args.end());
        std::vector<char *> argv;
        for (auto &s : storage) argv.push_back(s.data());
        argv.push_back(nullptr);
        ParseStatus st = parse_args(static_cast<int>(storage.size()), argv.data(), opt, err);
        assert_true(st == ParseStatus::Error, "rejected argument list");
        assert_true(!err.empty(), "diagnostic provided");
    }
}

static void test_proxy_address_forms()
{
    std::string host;
    uint16_t port = 1080;

    assert_true(parse_proxy_address("proxy.example", host, port), "bare name");
    assert_true(host == "proxy.example" && port == 1080, "default port kept");

    assert_true(parse_proxy_address("10.0.0.1:1081", host, port), "v4 with port");
    assert_true(host == "10.0.0.1" && port == 1081, "v4 parsed");

    port = 1080;
    assert_true(parse_proxy_address("::1", host, port), "bare IPv6");
    assert_true(host == "::1" && port == 1080, "bare IPv6 has no port");

    assert_true(parse_proxy_address("[2001:db8::1]:9050", host, port), "bracketed IPv6");
    assert_true(host == "2001:db8::1" && port == 9050, "bracketed parsed");

    assert_true(!parse_proxy_address("", host, port), "empty");
    assert_true(!parse_proxy_address(":1080", host, port), "missing host");
    assert_true(!parse_proxy_address("host:0", host, port), "port zero");
    assert_true(!parse_proxy_address("host:x", host, port), "non-numeric port");
    assert_true(!parse_proxy_address("[::1", host, port), "unterminated bracket");
    assert_true(!parse_proxy_address("[::1]x", host, port), "junk after bracket");
}

int main()
{
    test_defaults();
    test_all_options();
    test_help_and_version();
    test_errors();
    test_proxy_address_forms();
    std::cout << "cli tests: OK" << std::endl;
    return 0;
}
