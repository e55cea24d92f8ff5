#pragma once

#include "sink.hpp"

namespace fspec::utils
{

// Writes formatted records to stderr.
class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg, Sink::WRITE_MODE mode) override;
    void flush() override;
    std::string description() const override;
};

} // namespace fspec::utils
