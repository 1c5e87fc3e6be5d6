#include "input_file.hpp"

#include <boost/iostreams/filter/gzip.hpp>
#include <gigmap/error.hpp>

namespace gigmap
{

bool is_gzip_path(const std::string& path)
{
    return path.size() > 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

InputFile::InputFile(const std::string& path) : path_(path)
{
    file_.open(path, std::ios::in | std::ios::binary);
    if (!file_.is_open())
    {
        throw DataError("cannot open file: " + path);
    }
    if (is_gzip_path(path))
    {
        in_.push(boost::iostreams::gzip_decompressor());
    }
    in_.push(file_);
}

InputFile::InputFile(std::istream& stream, std::string name) : path_(std::move(name))
{
    in_.push(stream);
}

bool InputFile::getline(std::string& line)
{
    if (!std::getline(in_, line))
    {
        // A failed decompression surfaces as badbit on the stream.
        if (in_.bad())
            throw DataError("cannot read " + path_ + ": corrupt or truncated input");
        return false;
    }
    // Strip trailing \r (Windows line endings)
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return true;
}

bool InputFile::get_record(std::string& record)
{
    if (!getline(record))
        return false;

    auto open_quotes = [](const std::string& s)
    {
        size_t quotes = 0;
        for (char c : s)
        {
            if (c == '"')
                ++quotes;
        }
        return quotes % 2 == 1;
    };

    std::string continuation;
    while (open_quotes(record) && getline(continuation))
    {
        record += '\n';
        record += continuation;
    }
    return true;
}

}   // namespace gigmap
