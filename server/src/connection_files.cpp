#include "nascore/server/connection.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "connection_common.hpp"
#include "nascore/server/path_sandbox.hpp"
#include "nascore/server/range_server.hpp"

namespace nascore::server
{

    namespace
    {

        std::string_view or_dot(std::string_view path)
        {
            return path.empty() ? std::string_view{"."} : path;
        }

        std::size_t size_option(const http::Request &request, std::string_view key)
        {
            const auto value = http::query_param(request, key);
            if (!value || value->empty())
            {
                return 0;
            }
            const auto parsed = connection_common::parse_unsigned(*value);
            if (!parsed)
            {
                throw OperationError(ErrorCode::InvalidPayload, "Invalid " + std::string(key) + " parameter");
            }
            return static_cast<std::size_t>(*parsed);
        }

    } // namespace

    void Connection::handle_download(const http::Request &request, std::string_view path)
    {
        const auto file = PathSandbox::resolve(services_.root, or_dot(path));
        TransferOptions options;
        options.force_download = connection_common::parse_flag(http::query_param(request, "download"));
        const auto status = serve_file(request, file, options, *writer_);
        spdlog::debug("{} {} -> {}", request.method_string(), file.relative(), status);
    }

    void Connection::handle_list(const http::Request &request, std::string_view path)
    {
        const auto directory = PathSandbox::resolve(services_.root, or_dot(path));

        ListOptions options;
        options.limit = size_option(request, "limit");
        options.offset = size_option(request, "offset");
        const auto sort = sort_key_from_string(http::query_param(request, "sort").value_or(""));
        if (!sort)
        {
            throw OperationError(ErrorCode::InvalidPayload, "Unknown sort key");
        }
        options.sort_by = *sort;
        options.descending = connection_common::parse_flag(http::query_param(request, "desc"));
        const auto filter = type_filter_from_string(http::query_param(request, "type").value_or(""));
        if (!filter)
        {
            throw OperationError(ErrorCode::InvalidPayload, "Unknown type filter");
        }
        options.filter = *filter;

        const auto result = services_.file_tree.list_directory(directory, options);
        nlohmann::json payload = result;
        payload["path"] = directory.relative();
        send_json(200, payload);
    }

    void Connection::handle_stat(std::string_view path)
    {
        const auto target = PathSandbox::resolve(services_.root, or_dot(path));
        send_json(200, services_.file_tree.stat_path(target));
    }

    void Connection::handle_mkdir(std::string_view path)
    {
        const auto target = PathSandbox::resolve(services_.root, or_dot(path));
        services_.file_tree.create_directory(target);
        spdlog::info("Created directory {}", target.relative());
        send_json(201, services_.file_tree.stat_path(target));
    }

    void Connection::handle_delete(std::string_view path)
    {
        const auto target = PathSandbox::resolve(services_.root, or_dot(path));
        services_.file_tree.remove_path(target);
        spdlog::info("Deleted {}", target.relative());
        send_json(200, nlohmann::json{{"deleted", target.relative()}});
    }

    void Connection::handle_move(const http::Request &request)
    {
        const auto from = http::query_param(request, "from");
        const auto to = http::query_param(request, "to");
        if (!from || !to || from->empty() || to->empty())
        {
            throw OperationError(ErrorCode::InvalidPayload, "Both from and to are required");
        }
        const auto source = PathSandbox::resolve(services_.root, *from);
        const auto destination = PathSandbox::resolve(services_.root, *to);
        services_.file_tree.move_path(source, destination);
        spdlog::info("Moved {} to {}", source.relative(), destination.relative());
        send_json(200, nlohmann::json{{"from", source.relative()}, {"to", destination.relative()}});
    }

} // namespace nascore::server
