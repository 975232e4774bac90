/**
 * nascore - Error codes shared by the transfer core and the HTTP front end.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace nascore
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        Traversal = 1,
        NotFound = 2,
        Expired = 3,
        Forbidden = 4,
        InvalidIndex = 5,
        SizeMismatch = 6,
        ChecksumMismatch = 7,
        IncompleteUpload = 8,
        RangeNotSatisfiable = 9,
        ValidationFailed = 10,
        PayloadTooLarge = 11,
        InvalidPayload = 12,
        InternalError = 13,
        HeaderTooLarge = 14
    };

    std::string_view to_string(ErrorCode code) noexcept;

    ErrorCode error_code_from_string(std::string_view value) noexcept;

    /// HTTP status a caller at the network boundary should answer with.
    int http_status(ErrorCode code) noexcept;

    class OperationError : public std::runtime_error
    {
    public:
        OperationError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace nascore
