#include "dp/cli.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <string>
#include <string_view>

using namespace std::string_view_literals;

namespace dp {

std::string usage_text(const char *prog)
{
    std::ostringstream os;
    os << "Ping a DNS server with DNS queries\n";
    os << "Usage: " << prog << " [options] <server>\n";
    os << "Options:\n";
    os << "  -H, --host NAME          Name to query (default: www.google.com)\n";
    os << "  -p, --port N             Server port (default: 53)\n";
    os << "  -i, --iterate            Iterative query (clear Recursion Desired)\n";
    os << "      --type A|AAAA        Query type (default: A)\n";
    os << "  -s, --socks-proxy ADDR   SOCKS5 proxy as host[:port] or [v6]:port (port 1080)\n";
    os << "      --user NAME          SOCKS5 username\n";
    os << "      --password PW        SOCKS5 password\n";
    os << "  -c, --count N            Number of queries, 0 = until interrupted (default: 0)\n";
    os << "  -I, --interval MS        Wait between sending each query (default: 1000)\n";
    os << "  -w, --timeout MS         Timeout for each response, 0 = none (default: 1000)\n";
    os << "      --ndjson             Output each probe as a single JSON line (NDJSON)\n";
    os << "  -V, --version            Show version\n";
    os << "  -h, --help               Show this help\n";
    os << "\n";
    os << "Examples:\n";
    os << "  " << prog << " 8.8.8.8\n";
    os << "  " << prog << " -c 5 -H example.com -s 127.0.0.1:1080 1.1.1.1\n";
    return os.str();
}

// Matches "--name value", "--name=value" and, when short is given, "-x value".
static bool take_value(std::string_view a,
                       std::string_view name,
                       std::string_view short_name,
                       int &i,
                       int argc,
                       char **argv,
                       std::string &val,
                       bool &missing)
{
    missing = false;
    if (a == name || (!short_name.empty() && a == short_name))
    {
        if (i + 1 >= argc)
        {
            missing = true;
            return true;
        }
        val = argv[++i];
        return true;
    }
    if (a.size() > name.size() + 1 && a.substr(0, name.size()) == name && a[name.size()] == '=')
    {
        val = std::string(a.substr(name.size() + 1));
        return true;
    }
    return false;
}

static bool to_int(const std::string &val, int lo, int hi, int &out)
{
    try
    {
        size_t used = 0;
        int v = std::stoi(val, &used);
        if (used != val.size() || v < lo || v > hi) return false;
        out = v;
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

ParseStatus parse_args(int argc, char **argv, Options &opt, std::string &err)
{
    std::string val;
    bool missing = false;
    int n = 0;

    auto bad = [&](std::string msg)
    {
        err = std::move(msg);
        return ParseStatus::Error;
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        if (a == "-h"sv || a == "--help"sv) return ParseStatus::Help;
        if (a == "-V"sv || a == "--version"sv) return ParseStatus::Version;

        if (a == "-i"sv || a == "--iterate"sv)
        {
            opt.iterate = true;
        }
        else if (a == "--ndjson"sv)
        {
            opt.ndjson = true;
        }
        else if (take_value(a, "--host", "-H", i, argc, argv, val, missing))
        {
            if (missing) return bad("missing value for --host");
            opt.host = val;
        }
        else if (take_value(a, "--port", "-p", i, argc, argv, val, missing))
        {
            if (missing || !to_int(val, 1, 65535, n)) return bad("invalid --port value: " + val);
            opt.port = static_cast<uint16_t>(n);
        }
        else if (take_value(a, "--type", "", i, argc, argv, val, missing))
        {
            std::transform(val.begin(), val.end(), val.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            if (val == "A") opt.qtype = QueryType::A;
            else if (val == "AAAA") opt.qtype = QueryType::AAAA;
            else return bad("unsupported --type: " + val);
        }
        else if (take_value(a, "--socks-proxy", "-s", i, argc, argv, val, missing))
        {
            if (missing || !parse_proxy_address(val, opt.proxy, opt.proxy_port))
            {
                return bad("invalid --socks-proxy value: " + val);
            }
        }
        else if (take_value(a, "--user", "", i, argc, argv, val, missing))
        {
            if (missing) return bad("missing value for --user");
            opt.username = val;
        }
        else if (take_value(a, "--password", "", i, argc, argv, val, missing))
        {
            if (missing) return bad("missing value for --password");
            opt.password = val;
        }
        else if (take_value(a, "--count", "-c", i, argc, argv, val, missing))
        {
            if (missing || !to_int(val, 0, 1 << 30, opt.count)) return bad("invalid --count value: " + val);
        }
        else if (take_value(a, "--interval", "-I", i, argc, argv, val, missing))
        {
            if (missing || !to_int(val, 0, 1 << 30, opt.interval_ms))
            {
                return bad("invalid --interval value: " + val);
            }
        }
        else if (take_value(a, "--timeout", "-w", i, argc, argv, val, missing))
        {
            if (missing || !to_int(val, 0, 1 << 30, opt.timeout_ms))
            {
                return bad("invalid --timeout value: " + val);
            }
        }
        else if (!a.empty() && a[0] == '-')
        {
            return bad("unknown option: " + std::string(a));
        }
        else if (opt.server.empty())
        {
            opt.server = std::string(a);
        }
        else
        {
            return bad("unexpected argument: " + std::string(a));
        }
    }

    if (opt.server.empty()) return bad("missing server address");
    if (opt.username.empty() != opt.password.empty())
    {
        return bad("--user and --password must be given together");
    }
    if (!opt.username.empty() && opt.proxy.empty())
    {
        return bad("--user/--password require --socks-proxy");
    }
    return ParseStatus::Ok;
}

bool parse_proxy_address(const std::string &text, std::string &host, uint16_t &port)
{
    if (text.empty()) return false;

    std::string port_text;
    if (text.front() == '[')
    {
        const auto close = text.find(']');
        if (close == std::string::npos || close == 1) return false;
        host = text.substr(1, close - 1);
        if (close + 1 < text.size())
        {
            if (text[close + 1] != ':') return false;
            port_text = text.substr(close + 2);
        }
    }
    else if (std::count(text.begin(), text.end(), ':') == 1)
    {
        const auto colon = text.find(':');
        host = text.substr(0, colon);
        port_text = text.substr(colon + 1);
    }
    else
    {
        host = text; // name, IPv4, or bare IPv6
    }

    if (host.empty()) return false;
    if (port_text.empty()) return text.back() != ':';
    int n = 0;
    if (!to_int(port_text, 1, 65535, n)) return false;
    port = static_cast<uint16_t>(n);
    return true;
}

Target make_target(const Options &opt)
{
    Target t{};
    t.host = opt.host;
    t.server = opt.server;
    t.port = opt.port;
    t.qtype = opt.qtype;
    return t;
}

std::optional<ProxyConfig> make_proxy(const Options &opt)
{
    if (opt.proxy.empty()) return std::nullopt;
    ProxyConfig p{};
    p.address = opt.proxy;
    p.port = opt.proxy_port;
    p.username = opt.username;
    p.password = opt.password;
    return p;
}

RunConfig make_run_config(const Options &opt)
{
    RunConfig cfg{};
    cfg.count = opt.count;
    cfg.interval_ms = opt.interval_ms;
    cfg.timeout_ms = opt.timeout_ms;
    cfg.iterative = opt.iterate;
    return cfg;
}

} // namespace dp
