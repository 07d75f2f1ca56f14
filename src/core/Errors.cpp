#include "sectionnode/Errors.hpp"

#include <utility>

namespace sectionnode {

namespace {

std::string format_message(const std::string& code, const std::string& message) {
    if (code.empty()) {
        return message;
    }
    return "[" + code + "] " + message;
}

}  // namespace

std::string_view error_kind_to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::RoleMismatch:
            return "role_mismatch";
        case ErrorKind::NotFound:
            return "not_found";
        case ErrorKind::Protocol:
            return "protocol";
        case ErrorKind::Collaborator:
            return "collaborator";
        case ErrorKind::Decode:
            return "decode";
    }
    return "unknown";
}

NodeError::NodeError(ErrorKind kind, std::string code, const std::string& message)
    : std::runtime_error(format_message(code, message)),
      kind_(kind),
      code_(std::move(code)) {}

namespace errors {

NodeError no_chunks() {
    return NodeError(ErrorKind::RoleMismatch, "E_NO_CHUNKS", "Chunk store is not active on this node");
}

NodeError no_metadata() {
    return NodeError(ErrorKind::RoleMismatch, "E_NO_METADATA", "Metadata is not active on this node");
}

NodeError no_transfers() {
    return NodeError(ErrorKind::RoleMismatch, "E_NO_TRANSFERS", "Transfer ledger is not active on this node");
}

NodeError no_section_funds() {
    return NodeError(ErrorKind::RoleMismatch, "E_NO_SECTION_FUNDS", "Section funds are not active on this node");
}

NodeError node_not_found_for_reward(const std::string& node) {
    return NodeError(ErrorKind::NotFound, "E_NODE_NOT_FOUND", "No section member " + node + " to register a reward wallet for");
}

NodeError invalid_churn_evidence(const std::string& detail) {
    return NodeError(ErrorKind::Protocol, "E_CHURN_EVIDENCE", detail);
}

NodeError collaborator(std::string code, const std::string& detail) {
    return NodeError(ErrorKind::Collaborator, std::move(code), detail);
}

NodeError decode(const std::string& detail) {
    return NodeError(ErrorKind::Decode, "E_DECODE", detail);
}

}  // namespace errors

}  // namespace sectionnode
