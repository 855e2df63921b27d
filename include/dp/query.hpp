#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "dp/errors.hpp"
#include "dp/options.hpp"

namespace dp
{
struct QueryBuildResult
{
    int rc{};                      // 0 on success, -1 on error
    ErrorKind kind{ErrorKind::None};
    std::string error;             // message when rc != 0
    std::vector<uint8_t> wire;     // header + one question
};

// Build a single-question query: ID = id, RD = !iterative, QDCOUNT = 1,
// QCLASS = IN. Names with a label over 63 bytes or an encoding over 255
// bytes fail with ErrorKind::InvalidName.
QueryBuildResult build_query(uint16_t id, const std::string &host, bool iterative);

QueryBuildResult build_query(uint16_t id,
                             const std::string &host,
                             bool iterative,
                             QueryType qtype);

struct ReplyInfo
{
    bool has_id{};       // false when the message is too short to carry an id
    uint16_t id{};
    bool valid{};        // parses as a DNS response (QR set)
    int rcode{};
    size_t answer_count{};
    std::string error;   // parse error when !valid
};

ReplyInfo inspect_reply(const std::vector<uint8_t> &wire);
} // namespace dp
