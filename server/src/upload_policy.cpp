#include "nascore/server/upload_policy.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

#include "nascore/error_codes.hpp"
#include "nascore/server/content_type.hpp"

namespace nascore::server
{

    namespace
    {

        std::string normalize_extension(std::string ext)
        {
            std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            if (!ext.empty() && ext.front() != '.')
            {
                ext.insert(ext.begin(), '.');
            }
            return ext;
        }

        bool extension_listed(const std::string &ext, const std::vector<std::string> &list)
        {
            return std::any_of(list.begin(), list.end(), [&](const std::string &entry)
                               { return normalize_extension(entry) == ext; });
        }

        bool type_listed(std::string_view type, const std::vector<std::string> &patterns)
        {
            return std::any_of(patterns.begin(), patterns.end(), [&](const std::string &pattern)
                               { return mime_matches(type, pattern); });
        }

    } // namespace

    void validate_upload(const std::string &filename, std::uint64_t size, const UploadPolicy &policy)
    {
        if (policy.max_file_size > 0 && size > policy.max_file_size)
        {
            throw OperationError(ErrorCode::PayloadTooLarge,
                                 "File size " + std::to_string(size) + " exceeds maximum allowed size " +
                                     std::to_string(policy.max_file_size));
        }

        const auto ext = extension_of(filename);
        if (extension_listed(ext, policy.denied_extensions))
        {
            throw OperationError(ErrorCode::ValidationFailed, "File extension " + ext + " is not allowed");
        }
        if (!policy.allowed_extensions.empty() && !extension_listed(ext, policy.allowed_extensions))
        {
            throw OperationError(ErrorCode::ValidationFailed, "File extension " + ext + " is not in the allowed list");
        }

        const auto content_type = content_type_for_name(filename);
        const auto base_type = base_mime_type(content_type);
        if (type_listed(base_type, policy.denied_types))
        {
            throw OperationError(ErrorCode::ValidationFailed, "File type " + std::string(base_type) + " is not allowed");
        }
        if (!policy.allowed_types.empty() && !type_listed(base_type, policy.allowed_types))
        {
            throw OperationError(ErrorCode::ValidationFailed,
                                 "File type " + std::string(base_type) + " is not in the allowed list");
        }
    }

    PolicyStore::PolicyStore(UploadPolicy initial)
        : policy_(std::make_shared<const UploadPolicy>(std::move(initial))) {}

    std::shared_ptr<const UploadPolicy> PolicyStore::current() const
    {
        std::shared_lock lock(mutex_);
        return policy_;
    }

    void PolicyStore::replace(UploadPolicy policy)
    {
        auto next = std::make_shared<const UploadPolicy>(std::move(policy));
        std::unique_lock lock(mutex_);
        policy_ = std::move(next);
    }

} // namespace nascore::server
