#pragma once

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace nascore::server
{

    struct UploadPolicy
    {
        std::uint64_t max_file_size{0}; // 0 = unlimited
        std::vector<std::string> allowed_types;
        std::vector<std::string> denied_types;
        std::vector<std::string> allowed_extensions;
        std::vector<std::string> denied_extensions;
    };

    /// Throws OperationError(PayloadTooLarge) or OperationError(ValidationFailed).
    /// Denials are checked before allow lists; a non-empty allow list is exclusive.
    void validate_upload(const std::string &filename, std::uint64_t size, const UploadPolicy &policy);

    /// Shared, hot-swappable policy. Readers get an immutable snapshot.
    class PolicyStore
    {
    public:
        explicit PolicyStore(UploadPolicy initial = {});

        std::shared_ptr<const UploadPolicy> current() const;

        void replace(UploadPolicy policy);

    private:
        mutable std::shared_mutex mutex_;
        std::shared_ptr<const UploadPolicy> policy_;
    };

} // namespace nascore::server
