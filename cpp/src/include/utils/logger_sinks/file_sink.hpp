#pragma once

#include <cstdio>
#include <filesystem>
#include <string>

#include "utils/logger_sinks/sink.hpp"

namespace lgtv::utils
{

// Appends to a file. Parent directories are created on open.
class FileSink : public Sink
{
  public:
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

} // namespace lgtv::utils
