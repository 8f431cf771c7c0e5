/**
 * @file aws_error.cpp
 * @brief Failure taxonomy of a signed call
 * @version 0.1.0
 */

#include "kcenon/aws_signer/core/aws_error.h"

namespace kcenon::aws_signer {

namespace {

// Helper for std::visit with several lambdas
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

auto aws_error::from_error(const error& err) -> aws_error {
    if (is_transport_error(err.code)) {
        return transport_failure{err.code, err.message};
    }
    return precondition_violation{err.code, err.message};
}

auto aws_error::kind() const -> failure_kind {
    return std::visit(overloaded{
        [](const authorization_failure&) { return failure_kind::authorization; },
        [](const service_failure&) { return failure_kind::service; },
        [](const transport_failure&) { return failure_kind::transport; },
        [](const precondition_violation&) { return failure_kind::precondition; },
    }, failure_);
}

auto aws_error::retriable() const -> bool {
    return std::visit(overloaded{
        [](const authorization_failure&) { return false; },
        [](const service_failure& f) { return f.retriable; },
        [](const transport_failure&) { return true; },
        [](const precondition_violation&) { return false; },
    }, failure_);
}

auto aws_error::type() const -> std::string {
    return std::visit(overloaded{
        [](const authorization_failure& f) { return f.type; },
        [](const service_failure& f) { return f.type; },
        [](const transport_failure&) { return std::string("TransportFailure"); },
        [](const precondition_violation&) { return std::string("PreconditionViolation"); },
    }, failure_);
}

auto aws_error::simple_type() const -> std::string {
    return std::string(aws_signer::simple_type(type()));
}

auto aws_error::message() const -> const std::string& {
    return std::visit([](const auto& f) -> const std::string& { return f.message; }, failure_);
}

auto aws_error::what() const -> std::string {
    return type() + ": " + message();
}

auto aws_error::code() const -> error_code {
    return std::visit(overloaded{
        [](const authorization_failure&) { return error_code::authorization_failed; },
        [](const service_failure&) { return error_code::service_error; },
        [](const transport_failure& f) { return f.code; },
        [](const precondition_violation& f) { return f.code; },
    }, failure_);
}

auto aws_error::http_status() const -> int {
    return std::visit(overloaded{
        [](const authorization_failure& f) { return f.http_status; },
        [](const service_failure& f) { return f.http_status; },
        [](const transport_failure&) { return 0; },
        [](const precondition_violation&) { return 0; },
    }, failure_);
}

}  // namespace kcenon::aws_signer
