#include "capydeploy/protocol_error.hpp"

#include <cerrno>
#include <filesystem>

namespace capydeploy
{

    namespace
    {
        std::string compose_what(ErrorCode code, const std::string &message, const std::string &details)
        {
            std::string text(to_string(code));
            text += ": ";
            text += message;
            if (!details.empty())
            {
                text += " (" + details + ")";
            }
            return text;
        }

        std::string describe_cause(const std::exception_ptr &cause)
        {
            if (!cause)
            {
                return {};
            }
            try
            {
                std::rethrow_exception(cause);
            }
            catch (const std::exception &ex)
            {
                return ex.what();
            }
            catch (...)
            {
                return "non-standard exception";
            }
        }
    } // namespace

    ProtocolError::ProtocolError(ErrorCode code, std::string message, std::exception_ptr cause)
        : std::runtime_error(compose_what(code, message, describe_cause(cause))),
          code_(code),
          message_(std::move(message)),
          cause_(std::move(cause))
    {
    }

    ProtocolError ProtocolError::from_code(ErrorCode code, std::exception_ptr cause)
    {
        return ProtocolError(code, std::string(canonical_message(code)), std::move(cause));
    }

    std::string ProtocolError::details() const
    {
        return describe_cause(cause_);
    }

    ErrorCode classify_error_code(const std::error_code &ec, ErrorCode fallback) noexcept
    {
        if (ec.category() != std::generic_category() && ec.category() != std::system_category())
        {
            return fallback;
        }
        switch (ec.value())
        {
        case ENOSPC:
        case EDQUOT:
            return ErrorCode::DiskFull;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::PermissionDenied;
        case ETIMEDOUT:
            return ErrorCode::Timeout;
        default:
            return fallback;
        }
    }

    ProtocolError to_protocol_error(std::exception_ptr error, ErrorCode fallback)
    {
        if (!error)
        {
            return ProtocolError::from_code(fallback);
        }
        try
        {
            std::rethrow_exception(error);
        }
        catch (const ProtocolError &protocol_error)
        {
            return protocol_error;
        }
        catch (const std::system_error &system_error)
        {
            return ProtocolError::from_code(classify_error_code(system_error.code(), fallback), error);
        }
        catch (const std::exception &)
        {
            return ProtocolError::from_code(fallback, error);
        }
        catch (...)
        {
            return ProtocolError::from_code(ErrorCode::Unknown, error);
        }
    }

} // namespace capydeploy
