#pragma once
#include <cstddef>
#include <fstream>
#include <string>

/**
 * @brief Report file shared by every stage of a run.
 *
 * The file is truncated on construction and kept open for the lifetime of the object. Every write is flushed, so the
 * report is complete up to the point where a calculation stops.
 */
class Output
{
  public:
    explicit Output(const std::string& filename);

    Output(const Output&)            = delete;
    Output& operator=(const Output&) = delete;

    void write(const std::string& content);
    void writeSeperator(char sep = '-', size_t length = 99);
    void writeBanner(const std::string& title, size_t length = 99);

    const std::string& getFilename() const { return filename; }

  private:
    std::string filename;
    std::ofstream stream;
};
