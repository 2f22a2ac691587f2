#include "Output.hpp"

#include <fmt/core.h>
#include <stdexcept>

Output::Output(const std::string& filename) : filename(filename), stream(filename, std::ios::out | std::ios::trunc)
{
    if (!this->stream.is_open())
        throw std::runtime_error("Could not open output file: " + filename);
}

void Output::write(const std::string& content)
{
    this->stream << content << std::flush;
    if (!this->stream)
        throw std::runtime_error("Failed to write to output file: " + this->filename);
}

void Output::writeSeperator(char sep, size_t length)
{
    this->write(fmt::format("{}\n", std::string(length, sep)));
}

void Output::writeBanner(const std::string& title, size_t length)
{
    this->write(fmt::format("\n{0:-<{2}}\n{1:^{2}}\n{0:-<{2}}\n", "", title, length));
}
