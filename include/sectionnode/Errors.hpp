#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace sectionnode {

enum class ErrorKind {
    RoleMismatch,
    NotFound,
    Protocol,
    Collaborator,
    Decode
};

std::string_view error_kind_to_string(ErrorKind kind) noexcept;

class NodeError : public std::runtime_error {
public:
    NodeError(ErrorKind kind, std::string code, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& code() const noexcept { return code_; }

private:
    ErrorKind kind_;
    std::string code_;
};

namespace errors {

// Role mismatch, one per optional subsystem.
NodeError no_chunks();
NodeError no_metadata();
NodeError no_transfers();
NodeError no_section_funds();

NodeError node_not_found_for_reward(const std::string& node);
NodeError invalid_churn_evidence(const std::string& detail);
NodeError collaborator(std::string code, const std::string& detail);
NodeError decode(const std::string& detail);

}  // namespace errors

}  // namespace sectionnode
