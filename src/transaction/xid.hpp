/**
 * @file xid.hpp
 * @brief Global transaction identifiers and their textual encoding.
 *
 * Text format exchanged between nodes by the distributed transaction manager:
 *
 *   XID_<formatId>_<branchQualifierHex>_<globalTransactionIdHex>
 *
 * formatId is a signed 32-bit decimal; both byte sequences are hex encoded
 * (lowercase on output, either case accepted on input) and may be empty.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace cluster_exec {

struct Xid {
    int32_t format_id{0};
    Bytes branch_qualifier;
    Bytes global_transaction_id;

    bool operator==(const Xid&) const = default;
};

/**
 * @brief Encode @p xid in the XID_ text format.
 */
[[nodiscard]] std::string to_string(const Xid& xid);

/**
 * @brief Parse the XID_ text format.
 *
 * Every malformed input yields ErrorCode::MalformedXid with a message that
 * includes the offending text.
 */
[[nodiscard]] Result<Xid> parse_xid(std::string_view text);

}  // namespace cluster_exec
