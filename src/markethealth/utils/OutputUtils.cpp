#include "OutputUtils.h"
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>

namespace markethealth
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }

    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

std::unique_ptr<std::ofstream> openOutputFile(const std::string& fileName)
{
    boost::filesystem::path outputPath(fileName);
    if (outputPath.has_parent_path())
        boost::filesystem::create_directories(outputPath.parent_path());

    auto file = std::make_unique<std::ofstream>(fileName);
    if (!file->is_open())
        throw std::runtime_error("Cannot open output file " + fileName);

    return file;
}

std::string symbolFromFileName(const std::string& fileName)
{
    return boost::algorithm::to_upper_copy(boost::filesystem::path(fileName).stem().string());
}

} // namespace utils
} // namespace markethealth
