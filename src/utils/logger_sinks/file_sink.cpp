#include "utils/logger_sinks/file_sink.hpp"

#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

namespace fspec::utils
{

FileSink::FileSink(const std::string &path, bool use_flock)
{
    try
    {
        open(path, use_flock);
    }
    catch (const std::system_error &e)
    {
        throw std::runtime_error(fmt::format("Failed to open log file '{}': {}", path, e.what()));
    }
}

FileSink::~FileSink() = default;

void FileSink::write(const LogMessage &msg, Sink::WRITE_MODE mode)
{
    BaseFileSink::fwrite(format_logmsg(msg, mode));
}

void FileSink::flush()
{
    BaseFileSink::fflush();
}

std::string FileSink::description() const
{
    return "File: " + path().string();
}

} // namespace fspec::utils
