#include "octpkg/types.hpp"

namespace octpkg {

const char* constraint_op_to_string(ConstraintOp op) {
    switch (op) {
        case ConstraintOp::Any: return "";
        case ConstraintOp::Eq: return "==";
        case ConstraintOp::Ne: return "!=";
        case ConstraintOp::Lt: return "<";
        case ConstraintOp::Le: return "<=";
        case ConstraintOp::Gt: return ">";
        case ConstraintOp::Ge: return ">=";
        default: return "";
    }
}

std::optional<ConstraintOp> parse_constraint_op(const std::string& s) {
    if (s.empty()) return ConstraintOp::Any;
    if (s == "==" || s == "=") return ConstraintOp::Eq;
    if (s == "!=") return ConstraintOp::Ne;
    if (s == "<") return ConstraintOp::Lt;
    if (s == "<=") return ConstraintOp::Le;
    if (s == ">") return ConstraintOp::Gt;
    if (s == ">=") return ConstraintOp::Ge;
    return std::nullopt;
}

std::string Dependency::to_string() const {
    if (op == ConstraintOp::Any) return name;
    return name + " (" + constraint_op_to_string(op) + " " + version + ")";
}

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidVersion: return "InvalidVersion";
        case ErrorCode::CorruptRegistry: return "CorruptRegistry";
        case ErrorCode::CyclicDependency: return "CyclicDependency";
        case ErrorCode::UnsatisfiedDependency: return "UnsatisfiedDependency";
        case ErrorCode::UnresolvableRequest: return "UnresolvableRequest";
        case ErrorCode::BlockedBy: return "BlockedBy";
        case ErrorCode::FetchError: return "FetchError";
        case ErrorCode::BuildError: return "BuildError";
        case ErrorCode::NotFoundError: return "NotFoundError";
        case ErrorCode::InvalidDescription: return "InvalidDescription";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        default: return "Unknown";
    }
}

std::string join_names(const std::vector<std::string>& names, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += sep;
        out += names[i];
    }
    return out;
}

} // namespace octpkg
