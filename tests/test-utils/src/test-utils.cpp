#include "rangepart/test-utils/test-utils.h"

#include <boost/json/parse.hpp>
#include <boost/system/error_code.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

std::string
TestDataPath::get_path(const std::string& relative_path)
{
    boost::filesystem::path full_path =
        boost::filesystem::path(PROJECT_ROOT) / "tests" / relative_path;
    return full_path.string();
}

boost::json::value
load_json_from_file(const std::string& file_path)
{
    std::string json_str = read_file(file_path);

    boost::system::error_code ec;
    boost::json::value json = boost::json::parse(json_str, ec);
    if (ec)
    {
        throw std::runtime_error("Failed to parse JSON: " + ec.message());
    }

    return json;
}

TempDir::TempDir()
    : path_(
          boost::filesystem::temp_directory_path() /
          boost::filesystem::unique_path("rangepart-test-%%%%-%%%%-%%%%"))
{
    boost::filesystem::create_directories(path_);
}

TempDir::~TempDir()
{
    boost::system::error_code ec;
    boost::filesystem::remove_all(path_, ec);
}

boost::filesystem::path
TempDir::write_file(const std::string& relative_path, const std::string& content)
    const
{
    auto full_path = path_ / relative_path;
    boost::filesystem::create_directories(full_path.parent_path());

    std::ofstream out(full_path.string(), std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
        throw std::runtime_error("Could not create file: " + full_path.string());
    }
    out << content;
    return full_path;
}

std::string
read_file(const boost::filesystem::path& path)
{
    std::ifstream file(path.string(), std::ios::binary);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<std::string>
split_lines(const std::string& text)
{
    std::vector<std::string> lines;
    std::string::size_type begin = 0;
    while (begin < text.size())
    {
        auto end = text.find('\n', begin);
        if (end == std::string::npos)
        {
            lines.push_back(text.substr(begin));
            break;
        }
        lines.push_back(text.substr(begin, end - begin));
        begin = end + 1;
    }
    return lines;
}

std::string
make_records(const std::vector<std::string>& records, char terminator)
{
    std::string out;
    for (auto const& record : records)
    {
        out += record;
        out += terminator;
    }
    return out;
}
