#include "dp/query.hpp"

#include <ldns/ldns.h>

namespace dp
{
static ldns_rr_type to_ldns_type(QueryType qtype)
{
    switch (qtype)
    {
        case QueryType::AAAA: return LDNS_RR_TYPE_AAAA;
        default: return LDNS_RR_TYPE_A;
    }
}

static const char *status_str(ldns_status st)
{
    const char *s = ldns_get_errorstr_by_id(st);
    return s ? s : "unknown ldns status";
}

static QueryBuildResult invalid_name(const std::string &host, const char *why)
{
    QueryBuildResult out{};
    out.rc = -1;
    out.kind = ErrorKind::InvalidName;
    out.error = "invalid name '" + host + "': " + why;
    return out;
}

QueryBuildResult build_query(uint16_t id, const std::string &host, bool iterative)
{
    return build_query(id, host, iterative, QueryType::A);
}

QueryBuildResult build_query(uint16_t id,
                             const std::string &host,
                             bool iterative,
                             QueryType qtype)
{
    if (host.empty()) return invalid_name(host, "empty name");
    if (host.find("..") != std::string::npos) return invalid_name(host, "empty label");

    ldns_rdf *name = nullptr;
    ldns_status st = ldns_str2rdf_dname(&name, host.c_str());
    if (st != LDNS_STATUS_OK || !name)
    {
        if (name) ldns_rdf_deep_free(name);
        return invalid_name(host, status_str(st));
    }
    if (ldns_rdf_size(name) > LDNS_MAX_DOMAINLEN)
    {
        ldns_rdf_deep_free(name);
        return invalid_name(host, "encoded name exceeds 255 bytes");
    }

    uint16_t qflags = 0;
    if (!iterative) qflags |= LDNS_RD;
    // the packet takes ownership of name
    ldns_pkt *pkt = ldns_pkt_query_new(name, to_ldns_type(qtype), LDNS_RR_CLASS_IN, qflags);
    if (!pkt)
    {
        QueryBuildResult out{};
        out.rc = -1;
        out.kind = ErrorKind::InvalidName;
        out.error = "ldns_pkt_query_new failed";
        return out;
    }
    ldns_pkt_set_id(pkt, id);

    uint8_t *wire = nullptr;
    size_t size = 0;
    st = ldns_pkt2wire(&wire, pkt, &size);
    ldns_pkt_free(pkt);
    if (st != LDNS_STATUS_OK || !wire)
    {
        if (wire) LDNS_FREE(wire);
        return invalid_name(host, status_str(st));
    }

    QueryBuildResult out{};
    out.wire.assign(wire, wire + size);
    LDNS_FREE(wire);
    return out;
}

ReplyInfo inspect_reply(const std::vector<uint8_t> &wire)
{
    ReplyInfo info{};
    if (wire.size() < 2) return info;
    info.has_id = true;
    info.id = static_cast<uint16_t>((wire[0] << 8) | wire[1]);

    if (wire.size() < LDNS_HEADER_SIZE)
    {
        info.error = "truncated header";
        return info;
    }

    ldns_pkt *pkt = nullptr;
    ldns_status st = ldns_wire2pkt(&pkt, wire.data(), wire.size());
    if (st != LDNS_STATUS_OK || !pkt)
    {
        info.error = status_str(st);
        if (pkt) ldns_pkt_free(pkt);
        return info;
    }
    if (!ldns_pkt_qr(pkt))
    {
        info.error = "QR bit not set";
        ldns_pkt_free(pkt);
        return info;
    }

    info.valid = true;
    info.rcode = static_cast<int>(ldns_pkt_get_rcode(pkt));
    info.answer_count = ldns_pkt_ancount(pkt);
    ldns_pkt_free(pkt);
    return info;
}
} // namespace dp
