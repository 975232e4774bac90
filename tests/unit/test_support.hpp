#pragma once

#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>

#include "nascore/crypto.hpp"
#include "nascore/error_codes.hpp"

namespace nascore::test
{

    class TempDir
    {
    public:
        explicit TempDir(const std::string &label)
            : path_(std::filesystem::temp_directory_path() / ("nascore_" + label + "_" + crypto::random_hex(4)))
        {
            std::filesystem::create_directories(path_);
        }
        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    inline void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    inline std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    /// Deterministic, non-repeating-looking content of the given size.
    inline std::string pattern_bytes(std::size_t size, unsigned seed = 7)
    {
        std::string data(size, '\0');
        unsigned state = seed;
        for (auto &ch : data)
        {
            state = state * 1103515245u + 12345u;
            ch = static_cast<char>((state >> 16) & 0xFF);
        }
        return data;
    }

    /// True when `action` throws OperationError carrying `expected`.
    inline bool throws_code(ErrorCode expected, const std::function<void()> &action)
    {
        try
        {
            action();
        }
        catch (const OperationError &ex)
        {
            return ex.code() == expected;
        }
        return false;
    }

} // namespace nascore::test
