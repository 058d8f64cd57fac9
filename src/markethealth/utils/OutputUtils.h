#pragma once

#include <streambuf>
#include <ostream>
#include <fstream>
#include <memory>
#include <string>

namespace markethealth
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to copy console output into the --log file.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Open a file for writing, creating its parent directory if needed
 * @throws std::runtime_error if the file cannot be opened
 */
std::unique_ptr<std::ofstream> openOutputFile(const std::string& fileName);

/**
 * @brief Symbol implied by a data file name, e.g. "data/SPY.csv" -> "SPY"
 */
std::string symbolFromFileName(const std::string& fileName);

} // namespace utils
} // namespace markethealth
