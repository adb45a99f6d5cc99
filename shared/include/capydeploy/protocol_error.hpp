/**
 * CapyDeploy - Coded, wrappable error used for cross-process propagation.
 */
#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>

#include "capydeploy/error_codes.hpp"

namespace capydeploy
{

    // Carries {code, message, optional cause}. The cause stays local to the
    // process that raised it; only its text crosses the wire as `details`.
    class ProtocolError : public std::runtime_error
    {
    public:
        ProtocolError(ErrorCode code, std::string message, std::exception_ptr cause = nullptr);

        static ProtocolError from_code(ErrorCode code, std::exception_ptr cause = nullptr);

        ErrorCode code() const noexcept { return code_; }

        const std::string &message() const noexcept { return message_; }

        std::exception_ptr cause() const noexcept { return cause_; }

        // Text of the wrapped cause, empty when there is none.
        std::string details() const;

    private:
        ErrorCode code_;
        std::string message_;
        std::exception_ptr cause_;
    };

    ErrorCode classify_error_code(const std::error_code &ec, ErrorCode fallback) noexcept;

    // Converts an arbitrary in-flight exception into a ProtocolError. Existing
    // ProtocolErrors pass through unchanged; filesystem failures are classified
    // by errno; everything else is wrapped under `fallback`.
    ProtocolError to_protocol_error(std::exception_ptr error, ErrorCode fallback = ErrorCode::Unknown);

} // namespace capydeploy
