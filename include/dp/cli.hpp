#pragma once

#include <optional>
#include <string>

#include "dp/model.hpp"
#include "dp/options.hpp"

namespace dp
{
enum class ParseStatus { Ok, Help, Version, Error };

std::string usage_text(const char *prog);

// Fills opt from argv. Diagnostics for ParseStatus::Error go to err.
ParseStatus parse_args(int argc, char **argv, Options &opt, std::string &err);

// "host", "host:port", "[v6]:port" or a bare IPv6 literal
bool parse_proxy_address(const std::string &text, std::string &host, uint16_t &port);

Target make_target(const Options &opt);
std::optional<ProxyConfig> make_proxy(const Options &opt);
RunConfig make_run_config(const Options &opt);
} // namespace dp
