#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <cstdio>
#include <filesystem>
#include <string>

namespace nodebus::utils
{

class FileSink : public Sink
{
  public:
    /// Opens `path` for appending, creating parent directories as needed.
    /// @throws std::runtime_error if the file cannot be opened.
    explicit FileSink(const std::string &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    std::filesystem::path m_path;
    std::FILE *m_file{nullptr};
};

} // namespace nodebus::utils
