#include "nb_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <stdexcept>
#include <system_error>

namespace nodebus::utils
{

FileSink::FileSink(const std::string &path) : m_path(path)
{
    if (m_path.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(m_path.parent_path(), ec);
        if (ec)
        {
            throw std::runtime_error(fmt::format("FileSink: cannot create directory '{}': {}",
                                                 m_path.parent_path().string(), ec.message()));
        }
    }
    m_file = std::fopen(m_path.string().c_str(), "a");
    if (m_file == nullptr)
    {
        throw std::runtime_error(
            fmt::format("FileSink: cannot open '{}' for appending", m_path.string()));
    }
}

FileSink::~FileSink()
{
    if (m_file != nullptr)
    {
        std::fflush(m_file);
        std::fclose(m_file);
    }
}

void FileSink::write(const LogMessage &msg)
{
    const std::string line = format_logmsg(msg);
    if (std::fwrite(line.data(), 1, line.size(), m_file) != line.size())
    {
        throw std::runtime_error(fmt::format("FileSink: short write to '{}'", m_path.string()));
    }
}

void FileSink::flush()
{
    std::fflush(m_file);
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace nodebus::utils
