#pragma once

#include <boost/iostreams/filtering_stream.hpp>
#include <fstream>
#include <string>

namespace gigmap
{

// Text input that transparently gunzips paths ending in ".gz".
class InputFile
{
   public:
    // Throws DataError if the file cannot be opened.
    explicit InputFile(const std::string& path);

    // Reads an already open stream; `name` stands in for the path in errors.
    InputFile(std::istream& stream, std::string name);

    InputFile(const InputFile&)            = delete;
    InputFile& operator=(const InputFile&) = delete;

    const std::string& path() const { return path_; }

    // Next line without its trailing newline or carriage return.
    bool getline(std::string& line);

    // Next CSV record: lines are joined while a quoted field is still open.
    bool get_record(std::string& record);

   private:
    std::string                         path_;
    std::ifstream                       file_;
    boost::iostreams::filtering_istream in_;
};

bool is_gzip_path(const std::string& path);

}   // namespace gigmap
