#include "nascore/http.hpp"

#include <array>
#include <cctype>
#include <ctime>
#include <sstream>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/write.hpp>

#include "nascore/error_codes.hpp"

namespace nascore::http
{

    namespace
    {
        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t' || value.back() == '\r'))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        int hex_value(char ch)
        {
            if (ch >= '0' && ch <= '9')
            {
                return ch - '0';
            }
            if (ch >= 'a' && ch <= 'f')
            {
                return ch - 'a' + 10;
            }
            if (ch >= 'A' && ch <= 'F')
            {
                return ch - 'A' + 10;
            }
            return -1;
        }

        ErrorCode code_for(const boost::beast::error_code &ec)
        {
            if (ec == beast_http::error::header_limit)
            {
                return ErrorCode::HeaderTooLarge;
            }
            if (ec == beast_http::error::body_limit)
            {
                return ErrorCode::PayloadTooLarge;
            }
            return ErrorCode::InvalidPayload;
        }

    } // namespace

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept
    {
        if (lhs.size() != rhs.size())
        {
            return false;
        }
        for (std::size_t i = 0; i < lhs.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i])))
            {
                return false;
            }
        }
        return true;
    }

    std::optional<std::string> header(const Request &request, std::string_view name)
    {
        const auto it = request.find(name);
        if (it == request.end())
        {
            return std::nullopt;
        }
        return std::string(it->value());
    }

    std::optional<std::string> request_path(const Request &request)
    {
        const std::string_view target = request.target();
        return percent_decode(target.substr(0, target.find('?')));
    }

    std::optional<std::string> query_param(const Request &request, std::string_view key)
    {
        const std::string_view target = request.target();
        const auto query_pos = target.find('?');
        if (query_pos == std::string_view::npos)
        {
            return std::nullopt;
        }
        std::string_view rest = target.substr(query_pos + 1);
        while (!rest.empty())
        {
            const auto amp = rest.find('&');
            const auto item = rest.substr(0, amp);
            rest = amp == std::string_view::npos ? std::string_view{} : rest.substr(amp + 1);

            const auto eq = item.find('=');
            const auto name = percent_decode(item.substr(0, eq), true);
            if (!name || *name != key)
            {
                continue;
            }
            if (eq == std::string_view::npos)
            {
                return std::string{};
            }
            return percent_decode(item.substr(eq + 1), true);
        }
        return std::nullopt;
    }

    std::optional<std::string> percent_decode(std::string_view input, bool plus_as_space)
    {
        std::string output;
        output.reserve(input.size());
        for (std::size_t i = 0; i < input.size(); ++i)
        {
            const char ch = input[i];
            if (ch == '%')
            {
                if (i + 2 >= input.size())
                {
                    return std::nullopt;
                }
                const int high = hex_value(input[i + 1]);
                const int low = hex_value(input[i + 2]);
                if (high < 0 || low < 0)
                {
                    return std::nullopt;
                }
                output.push_back(static_cast<char>((high << 4) | low));
                i += 2;
            }
            else if (ch == '+' && plus_as_space)
            {
                output.push_back(' ');
            }
            else
            {
                output.push_back(ch);
            }
        }
        return output;
    }

    std::string format_http_date(std::chrono::system_clock::time_point time)
    {
        const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        std::array<char, 64> buffer{};
        const auto written = std::strftime(buffer.data(), buffer.size(), "%a, %d %b %Y %H:%M:%S GMT", &utc);
        return std::string(buffer.data(), written);
    }

    std::optional<std::chrono::system_clock::time_point> parse_http_date(std::string_view value)
    {
        // IMF-fixdate, obsolete RFC 850 and asctime forms.
        static constexpr std::array<const char *, 3> kFormats{
            "%a, %d %b %Y %H:%M:%S GMT",
            "%A, %d-%b-%y %H:%M:%S GMT",
            "%a %b %e %H:%M:%S %Y",
        };
        const std::string text(trim(value));
        for (const auto *format : kFormats)
        {
            std::tm parsed{};
            const char *end = strptime(text.c_str(), format, &parsed);
            if (end == nullptr || *end != '\0')
            {
                continue;
            }
            const std::time_t seconds = timegm(&parsed);
            if (seconds == static_cast<std::time_t>(-1))
            {
                continue;
            }
            return std::chrono::system_clock::from_time_t(seconds);
        }
        return std::nullopt;
    }

    std::string serialize_head(const ResponseHead &head)
    {
        std::ostringstream out;
        out << head;
        return out.str();
    }

    RequestReader::RequestReader(std::uint32_t header_limit, std::uint64_t body_limit)
    {
        parser_.header_limit(header_limit);
        parser_.body_limit(body_limit);
    }

    std::size_t RequestReader::feed(std::string_view data)
    {
        std::size_t used = 0;
        while (used < data.size() && !parser_.is_done())
        {
            const bool had_header = parser_.is_header_done();
            boost::beast::error_code ec;
            const auto consumed = parser_.put(boost::asio::const_buffer(data.data() + used, data.size() - used), ec);
            used += consumed;
            if (ec == beast_http::error::need_more)
            {
                break;
            }
            if (ec)
            {
                throw OperationError(code_for(ec), ec.message());
            }
            if (!had_header && parser_.is_header_done())
            {
                // Hand the header back before any body byte is accepted.
                parser_.eager(true);
                break;
            }
            if (consumed == 0)
            {
                break;
            }
        }
        return used;
    }

    std::optional<std::uint64_t> RequestReader::content_length() const
    {
        if (const auto length = parser_.content_length())
        {
            return *length;
        }
        return std::nullopt;
    }

    void BufferedResponse::write_head(ResponseHead response_head)
    {
        status = static_cast<int>(response_head.result_int());
        head = std::move(response_head);
    }

    void BufferedResponse::write_body(std::string_view data)
    {
        body.append(data);
    }

    std::optional<std::string> BufferedResponse::header(std::string_view name) const
    {
        const auto it = head.find(name);
        if (it == head.end())
        {
            return std::nullopt;
        }
        return std::string(it->value());
    }

} // namespace nascore::http
