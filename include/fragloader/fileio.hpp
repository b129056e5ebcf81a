#ifndef FRAGLOADER_FILEIO_HPP
#define FRAGLOADER_FILEIO_HPP

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#ifndef _WIN32
#include <unistd.h>
#include <sys/types.h>
#else
#include <io.h>
#include <windows.h>
#endif


namespace fragloader
{
    namespace fs = std::filesystem;

    // Owning wrapper around a C stream. Everything that touches the output
    // or a fragment file goes through it so that durability (flush + sync)
    // is handled in one place.
    class FileIO
    {
    private:
        FILE* m_fs = nullptr;
        fs::path m_path;
        bool m_owned = true;

    public:
#ifdef _WIN32
        constexpr static wchar_t append_binary[] = L"ab";
        constexpr static wchar_t append_update_binary[] = L"ab+";
        constexpr static wchar_t write_update_binary[] = L"wb+";
        constexpr static wchar_t write_binary[] = L"wb";
        constexpr static wchar_t read_binary[] = L"rb";
#else
        constexpr static char append_binary[] = "ab";
        constexpr static char append_update_binary[] = "ab+";
        constexpr static char write_update_binary[] = "wb+";
        constexpr static char write_binary[] = "wb";
        constexpr static char read_binary[] = "rb";
#endif

        FileIO() = default;

#ifdef _WIN32
        inline explicit FileIO(const fs::path& file_path,
                               const wchar_t* mode,
                               std::error_code& ec) noexcept
            : m_path(file_path)
        {
            m_fs = ::_wfsopen(file_path.wstring().c_str(), mode, _SH_DENYNO);
            if (m_fs)
            {
                ec.clear();
            }
            else
            {
                ec.assign(GetLastError(), std::generic_category());
                spdlog::error("Could not open file {}: {}", file_path.string(), ec.message());
            }
        }
#else
        inline explicit FileIO(const fs::path& file_path,
                               const char* mode,
                               std::error_code& ec) noexcept
            : m_path(file_path)
        {
            m_fs = ::fopen(file_path.c_str(), mode);
            if (m_fs)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
                spdlog::error("Could not open file {}: {}", file_path.string(), ec.message());
            }
        }
#endif

        // Non-owning view on the process' standard output.
        static FileIO standard_output()
        {
            FileIO res;
            res.m_fs = stdout;
            res.m_path = "-";
            res.m_owned = false;
            return res;
        }

        FileIO(const FileIO&) = delete;
        FileIO& operator=(const FileIO&) = delete;

        FileIO(FileIO&& rhs) noexcept
            : m_fs(std::exchange(rhs.m_fs, nullptr))
            , m_path(std::move(rhs.m_path))
            , m_owned(rhs.m_owned)
        {
        }

        FileIO& operator=(FileIO&& rhs) noexcept
        {
            std::swap(m_fs, rhs.m_fs);
            std::swap(m_path, rhs.m_path);
            std::swap(m_owned, rhs.m_owned);
            return *this;
        }

        inline ~FileIO()
        {
            if (m_fs)
            {
                std::error_code ec;
                close(ec);
                if (ec)
                {
                    spdlog::error("Error closing {}: {}", m_path.string(), ec.message());
                }
            }
        }

        inline int fd() const noexcept
        {
#ifndef _WIN32
            return ::fileno(m_fs);
#else
            return ::_fileno(m_fs);
#endif
        }

        inline int seek(long long offset, int origin) const noexcept
        {
#ifdef _WIN32
            return ::_fseeki64(m_fs, offset, origin);
#else
            return ::fseeko(m_fs, static_cast<off_t>(offset), origin);
#endif
        }

        inline bool open() const noexcept
        {
            return m_fs != nullptr;
        }

        inline long long tell() const noexcept
        {
#ifdef _WIN32
            return ::_ftelli64(m_fs);
#else
            return static_cast<long long>(::ftello(m_fs));
#endif
        }

        inline std::size_t read(void* buffer,
                                std::size_t element_size,
                                std::size_t element_count) const noexcept
        {
            return ::fread(buffer, element_size, element_count, m_fs);
        }

        inline std::size_t write(const void* buffer,
                                 std::size_t element_size,
                                 std::size_t element_count) const noexcept
        {
            return ::fwrite(buffer, element_size, element_count, m_fs);
        }

        void truncate(long long length, std::error_code& ec) const noexcept
        {
#ifdef _WIN32
            fs::resize_file(m_path, length, ec);
#else
            ec.clear();
            if (::ftruncate(fd(), static_cast<off_t>(length)) != 0)
            {
                ec.assign(errno, std::generic_category());
            }
#endif
        }

        inline void flush(std::error_code& ec) const noexcept
        {
            ec.clear();
            if (::fflush(m_fs) != 0)
            {
                ec.assign(errno, std::generic_category());
            }
        }

        // Flushes the C buffers and asks the OS to persist the file content.
        // Only a synced write may be referenced by a resume checkpoint.
        void sync(std::error_code& ec) const noexcept
        {
            flush(ec);
            if (ec || !m_owned)
                return;
#ifdef _WIN32
            if (::_commit(fd()) != 0)
#else
            if (::fsync(fd()) != 0)
#endif
            {
                ec.assign(errno, std::generic_category());
            }
        }

        inline const fs::path& path() const
        {
            return m_path;
        }

        inline bool owned() const noexcept
        {
            return m_owned;
        }

        // Appends the whole content of `other` at the current position.
        // Returns the number of bytes written.
        std::uintmax_t copy_from(const FileIO& other, std::error_code& ec) const noexcept
        {
            constexpr std::size_t bufsize = 32768;
            char buf[bufsize];
            std::size_t size;
            std::uintmax_t total = 0;

            ec.clear();
            if (other.seek(0, SEEK_SET) != 0)
            {
                ec.assign(errno, std::generic_category());
                return total;
            }

            while ((size = other.read(buf, 1, bufsize)) > 0)
            {
                if (this->write(buf, 1, size) != size)
                {
                    ec.assign(errno ? errno : EIO, std::generic_category());
                    return total;
                }
                total += size;
            }
            if (::ferror(other.m_fs))
            {
                ec.assign(EIO, std::generic_category());
            }
            return total;
        }

        void close(std::error_code& ec) noexcept
        {
            ec.clear();
            if (!m_fs)
            {
                return;
            }
            if (!m_owned)
            {
                flush(ec);
                m_fs = nullptr;
                return;
            }
            if (::fclose(m_fs) != 0)
            {
                ec.assign(errno, std::generic_category());
            }
            m_fs = nullptr;
        }

        inline int error() const noexcept
        {
            return ::ferror(m_fs);
        }
    };
}

#endif
