/**
 * @file xid.cpp
 * @brief Xid text codec.
 */

#include "transaction/xid.hpp"
#include "core/hex.hpp"

#include <charconv>
#include <vector>

namespace cluster_exec {

namespace {

constexpr std::string_view kPrefix = "XID";
constexpr char kSeparator = '_';

/// Split on every separator, keeping empty tokens.
std::vector<std::string_view> split(std::string_view text) {
    std::vector<std::string_view> tokens;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(kSeparator, start);
        if (pos == std::string_view::npos) {
            tokens.push_back(text.substr(start));
            return tokens;
        }
        tokens.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

Error malformed(std::string_view text, std::string_view reason) {
    return Error{ErrorCode::MalformedXid,
                 "Wrong XID format: \"" + std::string{text} + "\" (" + std::string{reason} + ")"};
}

}  // namespace

std::string to_string(const Xid& xid) {
    std::string out{kPrefix};
    out += kSeparator;
    out += std::to_string(xid.format_id);
    out += kSeparator;
    out += hex::encode(xid.branch_qualifier);
    out += kSeparator;
    out += hex::encode(xid.global_transaction_id);
    return out;
}

Result<Xid> parse_xid(std::string_view text) {
    auto tokens = split(text);
    if (tokens.size() != 4) {
        return malformed(text, "expected 4 tokens, got " + std::to_string(tokens.size()));
    }
    if (tokens[0] != kPrefix) {
        return malformed(text, "bad prefix");
    }

    Xid xid;
    const auto& id = tokens[1];
    auto [end, ec] = std::from_chars(id.data(), id.data() + id.size(), xid.format_id);
    if (id.empty() || ec != std::errc{} || end != id.data() + id.size()) {
        return malformed(text, "format id is not a 32-bit integer");
    }

    auto branch = hex::decode(tokens[2]);
    if (!branch) return malformed(text, "branch qualifier: " + branch.error().message);
    auto global = hex::decode(tokens[3]);
    if (!global) return malformed(text, "global transaction id: " + global.error().message);

    xid.branch_qualifier = std::move(*branch);
    xid.global_transaction_id = std::move(*global);
    return xid;
}

}  // namespace cluster_exec
