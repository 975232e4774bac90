#include "nascore/error_codes.hpp"

#include <array>

namespace nascore
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            int status;
        };

        constexpr std::array<ErrorCodeDescription, 15> kDescriptions{{
            {ErrorCode::Ok, "ok", 200},
            {ErrorCode::Traversal, "traversal", 403},
            {ErrorCode::NotFound, "not_found", 404},
            {ErrorCode::Expired, "expired", 404},
            {ErrorCode::Forbidden, "forbidden", 403},
            {ErrorCode::InvalidIndex, "invalid_index", 400},
            {ErrorCode::SizeMismatch, "size_mismatch", 400},
            {ErrorCode::ChecksumMismatch, "checksum_mismatch", 422},
            {ErrorCode::IncompleteUpload, "incomplete_upload", 409},
            {ErrorCode::RangeNotSatisfiable, "range_not_satisfiable", 416},
            {ErrorCode::ValidationFailed, "validation_failed", 400},
            {ErrorCode::PayloadTooLarge, "payload_too_large", 413},
            {ErrorCode::InvalidPayload, "invalid_payload", 400},
            {ErrorCode::InternalError, "internal_error", 500},
            {ErrorCode::HeaderTooLarge, "header_too_large", 431},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.description == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    int http_status(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.status;
            }
        }
        return 500;
    }

    OperationError::OperationError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

} // namespace nascore
